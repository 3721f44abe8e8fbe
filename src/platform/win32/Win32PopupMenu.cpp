#include "platform/win32/Win32PopupMenu.hpp"

#include "platform/win32/StringUtil.hpp"
#include "utils/Log.hpp"

#include <cctype>
#include <utility>

namespace fk::win32
{

namespace
{
UINT command_id(chrome::SystemMenuItem item)
{
    return static_cast<UINT>(item) + 1;
}

// "Minimize" with key 'N' becomes "Mi&nimize".
std::wstring label_with_access_key(chrome::SystemMenuEntry const &entry)
{
    std::string text(entry.text);
    auto const key = std::tolower(static_cast<unsigned char>(entry.access_key));
    for (size_t i = 0; i < text.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(text[i])) == key)
        {
            text.insert(i, 1, '&');
            break;
        }
    }
    return widen(text);
}
} // namespace

Win32PopupMenu::~Win32PopupMenu()
{
    if (menu_)
    {
        DestroyMenu(menu_);
    }
}

void Win32PopupMenu::build(std::vector<chrome::SystemMenuEntry> const &entries,
                           SelectHandler on_select)
{
    if (menu_)
    {
        DestroyMenu(menu_);
    }
    on_select_ = std::move(on_select);
    menu_ = CreatePopupMenu();
    if (!menu_)
    {
        FK_LOG_ERROR("CreatePopupMenu failed: {}", GetLastError());
        return;
    }
    for (auto const &entry : entries)
    {
        if (entry.separator_before)
        {
            AppendMenuW(menu_, MF_SEPARATOR, 0, nullptr);
        }
        AppendMenuW(menu_, MF_STRING, command_id(entry.item),
                    label_with_access_key(entry).c_str());
    }
}

void Win32PopupMenu::set_enabled(chrome::SystemMenuItem item, bool enabled)
{
    if (menu_)
    {
        EnableMenuItem(menu_, command_id(item),
                       MF_BYCOMMAND | (enabled ? MF_ENABLED : MF_GRAYED));
    }
}

void Win32PopupMenu::show_at(chrome::PointF position)
{
    if (!menu_)
    {
        return;
    }
    double const scale =
        chrome::scale_factor_from_dpi(GetDpiForWindow(owner_));
    POINT pt{static_cast<LONG>(position.x * scale),
             static_cast<LONG>(position.y * scale)};
    ClientToScreen(owner_, &pt);

    open_ = true;
    UINT const cmd = static_cast<UINT>(
        TrackPopupMenu(menu_,
                       TPM_LEFTALIGN | TPM_TOPALIGN | TPM_RIGHTBUTTON |
                           TPM_RETURNCMD | TPM_NONOTIFY,
                       pt.x, pt.y, 0, owner_, nullptr));
    open_ = false;

    if (cmd != 0 && on_select_)
    {
        on_select_(static_cast<chrome::SystemMenuItem>(cmd - 1));
    }
}

void Win32PopupMenu::hide()
{
    if (open_)
    {
        EndMenu();
    }
}

} // namespace fk::win32
