#pragma once

#include "chrome/Geometry.hpp"
#include "chrome/NativeWindow.hpp"

#include <functional>

namespace fk::chrome
{

// Owns the message hook of one native window and routes the handful of
// notifications the custom chrome needs. Anything it does not recognise is
// left to the default handler.
class MessageInterceptor
{
  public:
    struct Handlers
    {
        std::function<void(bool via_keyboard)> show_menu;
        std::function<void()> hide_menu;
        std::function<void(bool position_changed, bool size_changed)>
            bounds_changed;
        std::function<void()> presenter_changed;
    };

    // Throws std::system_error when the hook cannot be installed.
    MessageInterceptor(NativeWindow &window, WindowMetrics &metrics,
                       SizeF min_logical_size, Handlers handlers);
    ~MessageInterceptor();

    MessageInterceptor(MessageInterceptor const &) = delete;
    MessageInterceptor &operator=(MessageInterceptor const &) = delete;

    HookResult dispatch(NativeMessage &message);

  private:
    void update_scale(unsigned dpi);

    NativeWindow &window_;
    WindowMetrics &metrics_;
    SizeF min_logical_size_;
    Handlers handlers_;
};

} // namespace fk::chrome
