#include "chrome/WindowStateTracker.hpp"

#include "utils/Log.hpp"

#include <cassert>
#include <utility>

namespace fk::chrome
{

WindowStateTracker::WindowStateTracker(NativeWindow &window,
                                       Callbacks callbacks)
  : window_(window),
    callbacks_(std::move(callbacks)),
    laid_out_size_(window.bounds().size())
{
    if (state() == WindowState::Normal)
    {
        restore_bounds_ = window_.bounds();
    }
}

WindowState WindowStateTracker::state() const
{
    Presenter const &presenter = window_.presenter();
    if (presenter.kind() != PresenterKind::Overlapped)
    {
        return WindowState::Normal;
    }
    switch (presenter.state())
    {
    case PresenterState::Minimized:
        return WindowState::Minimized;
    case PresenterState::Maximized:
        return WindowState::Maximized;
    case PresenterState::Restored:
        break;
    }
    return WindowState::Normal;
}

void WindowStateTracker::set_state(WindowState state)
{
    Presenter &presenter = window_.presenter();
    if (presenter.kind() != PresenterKind::Overlapped)
    {
        if (state != WindowState::Normal)
        {
            FK_LOG_ERROR("window state {} requested from a presenter that "
                         "cannot change state",
                         to_string(state));
        }
        assert(state == WindowState::Normal);
        return;
    }

    switch (state)
    {
    case WindowState::Minimized:
        presenter.minimize();
        break;
    case WindowState::Maximized:
        presenter.maximize();
        break;
    case WindowState::Normal:
        presenter.restore();
        break;
    }
}

void WindowStateTracker::on_bounds_changed(bool position_changed,
                                           bool size_changed)
{
    WindowState const current = state();
    if (!(position_changed || size_changed) ||
        current == WindowState::Minimized)
    {
        return;
    }

    RectInt const bounds = window_.bounds();
    if (current == WindowState::Normal)
    {
        restore_bounds_ = bounds;
    }

    bool const resized = size_changed && bounds.size() != laid_out_size_;
    laid_out_size_ = bounds.size();

    if (resized && callbacks_.layout_changed)
    {
        callbacks_.layout_changed();
    }
}

void WindowStateTracker::on_presenter_changed()
{
    if (callbacks_.capabilities_changed)
    {
        callbacks_.capabilities_changed();
    }
}

char const *to_string(WindowState state) noexcept
{
    switch (state)
    {
    case WindowState::Minimized:
        return "minimized";
    case WindowState::Maximized:
        return "maximized";
    case WindowState::Normal:
        break;
    }
    return "normal";
}

} // namespace fk::chrome
