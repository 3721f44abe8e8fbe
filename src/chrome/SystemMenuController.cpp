#include "chrome/SystemMenuController.hpp"

#include "utils/Log.hpp"

#include <utility>

namespace fk::chrome
{

namespace
{
SystemCommand command_for(SystemMenuItem item) noexcept
{
    switch (item)
    {
    case SystemMenuItem::Restore:
        return SystemCommand::Restore;
    case SystemMenuItem::Move:
        return SystemCommand::Move;
    case SystemMenuItem::Size:
        return SystemCommand::Size;
    case SystemMenuItem::Minimize:
        return SystemCommand::Minimize;
    case SystemMenuItem::Maximize:
        return SystemCommand::Maximize;
    case SystemMenuItem::Close:
        break;
    }
    return SystemCommand::Close;
}
} // namespace

std::array<SystemMenuEntry, 6> const &system_menu_entries() noexcept
{
    static constexpr std::array<SystemMenuEntry, 6> kEntries{{
        {SystemMenuItem::Restore, "Restore", 'R'},
        {SystemMenuItem::Move, "Move", 'M'},
        {SystemMenuItem::Size, "Size", 'S'},
        {SystemMenuItem::Minimize, "Minimize", 'N'},
        {SystemMenuItem::Maximize, "Maximize", 'X'},
        {SystemMenuItem::Close, "Close", 'C', true},
    }};
    return kEntries;
}

SystemMenuController::SystemMenuController(NativeWindow &window,
                                           WindowStateTracker const &tracker,
                                           WindowMetrics const &metrics,
                                           std::unique_ptr<MenuSurface> surface,
                                           int keyboard_offset_x)
  : window_(window),
    tracker_(tracker),
    metrics_(metrics),
    surface_(std::move(surface)),
    keyboard_offset_x_(keyboard_offset_x)
{
}

void SystemMenuController::build()
{
    auto const &entries = system_menu_entries();
    surface_->build({entries.begin(), entries.end()},
                    [this](SystemMenuItem item) { select(item); });
    built_ = true;
}

void SystemMenuController::show(bool via_keyboard)
{
    if (!surface_)
    {
        return;
    }
    hide();
    if (!built_)
    {
        build();
    }
    update_enabled_state();
    surface_->show_at(menu_position(via_keyboard));
}

void SystemMenuController::hide()
{
    if (surface_ && surface_->is_open())
    {
        surface_->hide();
    }
}

bool SystemMenuController::is_open() const
{
    return surface_ && surface_->is_open();
}

PointF SystemMenuController::menu_position(bool via_keyboard) const
{
    PointInt device{keyboard_offset_x_, window_.title_bar_height()};
    if (!via_keyboard)
    {
        if (auto cursor = window_.cursor_client_position())
        {
            device = *cursor;
        }
    }
    double const scale = metrics_.scale_factor;
    return PointF{device.x / scale, device.y / scale};
}

void SystemMenuController::update_enabled_state()
{
    if (!built_)
    {
        return;
    }
    for (auto const &entry : system_menu_entries())
    {
        surface_->set_enabled(entry.item, is_enabled(entry.item));
    }
}

bool SystemMenuController::is_enabled(SystemMenuItem item) const
{
    Presenter const &presenter = window_.presenter();
    bool const overlapped = presenter.kind() == PresenterKind::Overlapped;
    bool const maximized = tracker_.state() == WindowState::Maximized;

    switch (item)
    {
    case SystemMenuItem::Restore:
        return maximized;
    case SystemMenuItem::Move:
        if (overlapped)
        {
            return !maximized;
        }
        return presenter.kind() == PresenterKind::CompactOverlay;
    case SystemMenuItem::Size:
        return overlapped && presenter.is_resizable() && !maximized;
    case SystemMenuItem::Minimize:
        return overlapped && presenter.is_minimizable();
    case SystemMenuItem::Maximize:
        return overlapped && presenter.is_maximizable() && !maximized;
    case SystemMenuItem::Close:
        break;
    }
    return true;
}

bool SystemMenuController::select(SystemMenuItem item)
{
    if (!is_enabled(item))
    {
        return false;
    }
    return post(command_for(item));
}

bool SystemMenuController::post_close()
{
    return post(SystemCommand::Close);
}

bool SystemMenuController::post(SystemCommand command)
{
    if (!window_.post_system_command(command))
    {
        FK_LOG_ERROR("failed to post system command {} to window {:#x}",
                     static_cast<int>(command), window_.handle());
        return false;
    }
    return true;
}

} // namespace fk::chrome
