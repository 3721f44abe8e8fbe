#pragma once

#include "chrome/UiElement.hpp"

#include <memory>
#include <vector>

#include <windows.h>

namespace fk::win32
{

// A child window seen as a UI element. Child windows take their own input,
// so only controls whose background should stay draggable matter here; the
// category comes from the window class.
class Win32Element : public chrome::UiElement
{
  public:
    // `root` is the top-level window whose client area positions are
    // measured from.
    Win32Element(HWND hwnd, HWND root);

    chrome::ElementCategory category() const override
    {
        return category_;
    }
    // Throws TreeClosedError once the window is gone. Pointers stay valid
    // until the next call on this element.
    std::vector<chrome::UiElement *> children() const override;

    bool is_attached() const override;
    bool is_loaded() const override;

    chrome::PointF offset_from_root() const override;
    chrome::SizeF actual_size() const override;

    bool has_hyperlink() const override;
    bool vertical_scroll_bar_visible() const override;

    // Child windows raise no element events; layout changes reach the chrome
    // through the top-level window's bounds notifications.
    bool subscribe(chrome::UiEvent, std::function<void()>) override
    {
        return false;
    }

  private:
    double scale() const;

    HWND hwnd_;
    HWND root_;
    chrome::ElementCategory category_;
    mutable std::vector<std::unique_ptr<Win32Element>> children_;
};

} // namespace fk::win32
