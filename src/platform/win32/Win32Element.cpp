#include "platform/win32/Win32Element.hpp"

#include <cwchar>
#include <iterator>

#include <commctrl.h>

namespace fk::win32
{

namespace
{
chrome::ElementCategory category_of(HWND hwnd, HWND root)
{
    if (hwnd == root)
    {
        return chrome::ElementCategory::Panel;
    }

    wchar_t name[64]{};
    if (GetClassNameW(hwnd, name, static_cast<int>(std::size(name))) == 0)
    {
        return chrome::ElementCategory::Other;
    }

    struct Mapping
    {
        wchar_t const *class_name;
        chrome::ElementCategory category;
    };
    static constexpr Mapping kMappings[] = {
        {WC_LISTVIEWW, chrome::ElementCategory::SelectableGrid},
        {L"ListBox", chrome::ElementCategory::SelectableGrid},
        {WC_TREEVIEWW, chrome::ElementCategory::SelectableGrid},
        {TOOLBARCLASSNAMEW, chrome::ElementCategory::CommandBar},
        {L"ScrollBar", chrome::ElementCategory::ScrollBar},
        {L"Static", chrome::ElementCategory::TextBlock},
        {WC_LINK, chrome::ElementCategory::TextBlock},
        {L"RICHEDIT50W", chrome::ElementCategory::ScrollViewer},
        {L"#32770", chrome::ElementCategory::Panel},
    };
    for (auto const &mapping : kMappings)
    {
        if (_wcsicmp(name, mapping.class_name) == 0)
        {
            return mapping.category;
        }
    }
    return chrome::ElementCategory::Other;
}
} // namespace

Win32Element::Win32Element(HWND hwnd, HWND root)
  : hwnd_(hwnd),
    root_(root),
    category_(category_of(hwnd, root))
{
}

double Win32Element::scale() const
{
    return chrome::scale_factor_from_dpi(GetDpiForWindow(root_));
}

std::vector<chrome::UiElement *> Win32Element::children() const
{
    if (!IsWindow(hwnd_))
    {
        throw chrome::TreeClosedError("window destroyed");
    }

    children_.clear();
    for (HWND child = GetWindow(hwnd_, GW_CHILD); child != nullptr;
         child = GetWindow(child, GW_HWNDNEXT))
    {
        children_.push_back(std::make_unique<Win32Element>(child, root_));
    }

    std::vector<chrome::UiElement *> result;
    result.reserve(children_.size());
    for (auto const &child : children_)
    {
        result.push_back(child.get());
    }
    return result;
}

bool Win32Element::is_attached() const
{
    return IsWindow(hwnd_) && (hwnd_ == root_ || IsChild(root_, hwnd_));
}

bool Win32Element::is_loaded() const
{
    return IsWindowVisible(hwnd_) != FALSE;
}

chrome::PointF Win32Element::offset_from_root() const
{
    RECT rect{};
    if (!GetWindowRect(hwnd_, &rect))
    {
        throw chrome::TreeClosedError("window destroyed");
    }
    MapWindowPoints(HWND_DESKTOP, root_, reinterpret_cast<POINT *>(&rect), 2);
    double const s = scale();
    return {rect.left / s, rect.top / s};
}

chrome::SizeF Win32Element::actual_size() const
{
    RECT rect{};
    if (!GetWindowRect(hwnd_, &rect))
    {
        throw chrome::TreeClosedError("window destroyed");
    }
    double const s = scale();
    return {(rect.right - rect.left) / s, (rect.bottom - rect.top) / s};
}

bool Win32Element::has_hyperlink() const
{
    wchar_t name[32]{};
    GetClassNameW(hwnd_, name, static_cast<int>(std::size(name)));
    return _wcsicmp(name, WC_LINK) == 0;
}

bool Win32Element::vertical_scroll_bar_visible() const
{
    return (GetWindowLongPtrW(hwnd_, GWL_STYLE) & WS_VSCROLL) != 0;
}

} // namespace fk::win32
