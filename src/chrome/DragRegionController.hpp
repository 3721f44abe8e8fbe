#pragma once

#include "chrome/DebouncedTask.hpp"
#include "chrome/DragRegionComputer.hpp"
#include "chrome/NativeWindow.hpp"
#include "chrome/Region.hpp"
#include "chrome/SchedulerService.hpp"
#include "chrome/UiElement.hpp"

#include <chrono>

namespace fk::chrome
{

// Keeps the window's Caption/Passthrough rectangles in step with the UI.
// Layout changes request a debounced recompute; while any transient overlay
// is open the window is all passthrough so the overlay stays interactive.
//
// Handlers registered by add_drag_region_event_handlers() capture this
// controller; it must outlive the subscribed elements.
class DragRegionController
{
  public:
    DragRegionController(NativeWindow &window, WindowMetrics const &metrics,
                         Scheduler &scheduler,
                         std::chrono::milliseconds debounce_interval);

    void set_content(UiElement *root) noexcept
    {
        content_ = root;
    }

    // Debounced; a request inside the interval restarts it.
    void set_window_drag_regions();
    void clear_window_drag_regions();
    // Recompute and apply immediately. Failures are logged and ignored.
    void apply_now();

    void overlay_opened();
    void overlay_closed();
    bool overlay_open() const noexcept
    {
        return open_overlays_ > 0;
    }

    // The region apply_now() would install at this moment.
    Region compute() const;
    Region const &current_region() const noexcept
    {
        return current_;
    }
    bool recompute_pending() const noexcept
    {
        return debounce_.is_armed() && !debounce_.is_suppressed();
    }

    void add_drag_region_event_handlers(UiElement &root);

  private:
    void subscribe_subtree(UiElement &item);
    void install(Region region);

    NativeWindow &window_;
    WindowMetrics const &metrics_;
    DragRegionComputer computer_;
    DebouncedTask debounce_;
    UiElement *content_ = nullptr;
    Region current_;
    int open_overlays_ = 0;
};

} // namespace fk::chrome
