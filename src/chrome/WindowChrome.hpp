#pragma once

#include "chrome/ChromeSettings.hpp"
#include "chrome/DragRegionController.hpp"
#include "chrome/MessageInterceptor.hpp"
#include "chrome/NativeWindow.hpp"
#include "chrome/SchedulerService.hpp"
#include "chrome/SystemMenuController.hpp"
#include "chrome/WindowStateTracker.hpp"

#include <memory>

namespace fk::chrome
{

// The custom chrome of one top-level window: borderless dragging, the
// replica window menu and state tracking, wired to the window's message
// hook. Construction fails with std::system_error when the hook cannot be
// installed.
class WindowChrome
{
  public:
    WindowChrome(std::unique_ptr<NativeWindow> window, Scheduler &scheduler,
                 std::unique_ptr<MenuSurface> menu,
                 ChromeSettings const &settings = {});

    WindowChrome(WindowChrome const &) = delete;
    WindowChrome &operator=(WindowChrome const &) = delete;

    WindowHandle handle() const noexcept
    {
        return window_->handle();
    }

    WindowState window_state() const
    {
        return tracker_.state();
    }
    void set_window_state(WindowState state)
    {
        tracker_.set_state(state);
    }
    RectInt restore_bounds() const noexcept
    {
        return tracker_.restore_bounds();
    }
    double scale_factor() const noexcept
    {
        return metrics_.scale_factor;
    }
    SizeInt min_track_size() const noexcept
    {
        return metrics_.min_track_size;
    }

    void set_window_drag_regions()
    {
        drag_regions_.set_window_drag_regions();
    }
    void clear_window_drag_regions()
    {
        drag_regions_.clear_window_drag_regions();
    }
    void set_content(UiElement *root) noexcept
    {
        drag_regions_.set_content(root);
    }
    void add_drag_region_event_handlers(UiElement &root)
    {
        drag_regions_.add_drag_region_event_handlers(root);
    }

    bool post_close_message()
    {
        return menu_.post_close();
    }

    NativeWindow &native_window() noexcept
    {
        return *window_;
    }
    SystemMenuController &system_menu() noexcept
    {
        return menu_;
    }
    DragRegionController &drag_regions() noexcept
    {
        return drag_regions_;
    }

  private:
    std::unique_ptr<NativeWindow> window_;
    WindowMetrics metrics_;
    WindowStateTracker tracker_;
    SystemMenuController menu_;
    DragRegionController drag_regions_;
    // Last, so the hook only sees fully constructed collaborators and is
    // removed before any of them goes away.
    MessageInterceptor interceptor_;
};

} // namespace fk::chrome
