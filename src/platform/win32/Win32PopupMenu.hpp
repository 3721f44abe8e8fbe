#pragma once

#include "chrome/SystemMenuController.hpp"

#include <windows.h>

namespace fk::win32
{

// The replica window menu as a native popup menu tracked modally over the
// owner window.
class Win32PopupMenu : public chrome::MenuSurface
{
  public:
    explicit Win32PopupMenu(HWND owner) : owner_(owner)
    {
    }
    ~Win32PopupMenu() override;

    Win32PopupMenu(Win32PopupMenu const &) = delete;
    Win32PopupMenu &operator=(Win32PopupMenu const &) = delete;

    void build(std::vector<chrome::SystemMenuEntry> const &entries,
               SelectHandler on_select) override;
    void set_enabled(chrome::SystemMenuItem item, bool enabled) override;
    void show_at(chrome::PointF position) override;
    void hide() override;
    bool is_open() const override
    {
        return open_;
    }

  private:
    HWND owner_;
    HMENU menu_ = nullptr;
    SelectHandler on_select_;
    bool open_ = false;
};

} // namespace fk::win32
