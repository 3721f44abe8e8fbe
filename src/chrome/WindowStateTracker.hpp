#pragma once

#include "chrome/Geometry.hpp"
#include "chrome/NativeWindow.hpp"

#include <functional>

namespace fk::chrome
{

// Normal/Minimized/Maximized as committed by the presenter, plus the bounds
// to restore to. Restore bounds only move while the window is Normal; size
// changes in any visible state are reported as layout changes.
class WindowStateTracker
{
  public:
    struct Callbacks
    {
        // The window size changed while not Minimized; layout may have
        // shifted.
        std::function<void()> layout_changed;
        // Presenter capabilities may differ; menu enablement is stale.
        std::function<void()> capabilities_changed;
    };

    WindowStateTracker(NativeWindow &window, Callbacks callbacks);

    WindowState state() const;
    // Non Overlapped presenters only accept Normal.
    void set_state(WindowState state);

    RectInt restore_bounds() const noexcept
    {
        return restore_bounds_;
    }

    void on_bounds_changed(bool position_changed, bool size_changed);
    void on_presenter_changed();

  private:
    NativeWindow &window_;
    Callbacks callbacks_;
    RectInt restore_bounds_;
    SizeInt laid_out_size_;
};

char const *to_string(WindowState state) noexcept;

} // namespace fk::chrome
