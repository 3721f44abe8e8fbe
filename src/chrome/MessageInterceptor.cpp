#include "chrome/MessageInterceptor.hpp"

#include "utils/Log.hpp"

#include <system_error>
#include <utility>

namespace fk::chrome
{

MessageInterceptor::MessageInterceptor(NativeWindow &window,
                                       WindowMetrics &metrics,
                                       SizeF min_logical_size,
                                       Handlers handlers)
  : window_(window),
    metrics_(metrics),
    min_logical_size_(min_logical_size),
    handlers_(std::move(handlers))
{
    update_scale(window_.dpi());

    auto ec = window_.register_message_hook(
        [this](NativeMessage &message) { return dispatch(message); });
    if (ec)
    {
        FK_LOG_ERROR("failed to hook window {:#x}: {}", window_.handle(),
                     ec.message());
        throw std::system_error(ec, "register_message_hook");
    }
}

MessageInterceptor::~MessageInterceptor()
{
    window_.unregister_message_hook();
}

void MessageInterceptor::update_scale(unsigned dpi)
{
    metrics_.scale_factor = scale_factor_from_dpi(dpi);
    metrics_.min_track_size = {
        to_device_size(min_logical_size_.width, metrics_.scale_factor),
        to_device_size(min_logical_size_.height, metrics_.scale_factor)};
}

HookResult MessageInterceptor::dispatch(NativeMessage &message)
{
    switch (message.kind)
    {
    case MessageKind::SizeConstraintQuery:
        if (message.min_track_size != nullptr)
        {
            *message.min_track_size = metrics_.min_track_size;
        }
        break;

    case MessageKind::DpiChanged:
        update_scale(message.dpi);
        break;

    case MessageKind::SystemCommand:
        if (message.keyboard_menu_request &&
            window_.presenter().kind() != PresenterKind::FullScreen)
        {
            if (handlers_.hide_menu)
            {
                handlers_.hide_menu();
            }
            if (handlers_.show_menu)
            {
                handlers_.show_menu(true);
            }
            return HookResult::Handled;
        }
        break;

    case MessageKind::NonClientSecondaryButtonUp:
        if (message.hit == HitArea::Caption)
        {
            if (handlers_.hide_menu)
            {
                handlers_.hide_menu();
            }
            if (handlers_.show_menu)
            {
                handlers_.show_menu(false);
            }
            return HookResult::Handled;
        }
        break;

    case MessageKind::NonClientPrimaryButtonDown:
        // a stale menu must not sit over the drag that starts here
        if (message.hit == HitArea::Caption && handlers_.hide_menu)
        {
            handlers_.hide_menu();
        }
        break;

    case MessageKind::BoundsChanged:
        if (handlers_.bounds_changed)
        {
            handlers_.bounds_changed(message.position_changed,
                                     message.size_changed);
        }
        break;

    case MessageKind::PresenterChanged:
        if (handlers_.presenter_changed)
        {
            handlers_.presenter_changed();
        }
        break;

    case MessageKind::Other:
        break;
    }
    return HookResult::Unhandled;
}

} // namespace fk::chrome
