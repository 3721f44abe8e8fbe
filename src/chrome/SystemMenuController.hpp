#pragma once

#include "chrome/ChromeSettings.hpp"
#include "chrome/Geometry.hpp"
#include "chrome/NativeWindow.hpp"
#include "chrome/WindowStateTracker.hpp"

#include <array>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace fk::chrome
{

enum class SystemMenuItem
{
    Restore,
    Move,
    Size,
    Minimize,
    Maximize,
    Close,
};

struct SystemMenuEntry
{
    SystemMenuItem item;
    std::string_view text;
    char access_key;
    bool separator_before = false;
};

// The six replica entries in display order.
std::array<SystemMenuEntry, 6> const &system_menu_entries() noexcept;

// A menu presented by the UI layer in place of the native window menu.
class MenuSurface
{
  public:
    using SelectHandler = std::function<void(SystemMenuItem)>;

    virtual ~MenuSurface() = default;

    virtual void build(std::vector<SystemMenuEntry> const &entries,
                       SelectHandler on_select) = 0;
    virtual void set_enabled(SystemMenuItem item, bool enabled) = 0;
    // Position in logical units relative to the client area.
    virtual void show_at(PointF position) = 0;
    virtual void hide() = 0;
    virtual bool is_open() const = 0;
};

// Replica window menu. Selecting an entry posts the matching native system
// command; state changes then come back through the native notification
// path like any other.
class SystemMenuController
{
  public:
    SystemMenuController(NativeWindow &window,
                         WindowStateTracker const &tracker,
                         WindowMetrics const &metrics,
                         std::unique_ptr<MenuSurface> surface,
                         int keyboard_offset_x);

    void show(bool via_keyboard);
    void hide();
    bool is_open() const;

    void update_enabled_state();
    bool is_enabled(SystemMenuItem item) const;

    bool select(SystemMenuItem item);
    bool post_close();

  private:
    void build();
    PointF menu_position(bool via_keyboard) const;
    bool post(SystemCommand command);

    NativeWindow &window_;
    WindowStateTracker const &tracker_;
    WindowMetrics const &metrics_;
    std::unique_ptr<MenuSurface> surface_;
    int keyboard_offset_x_;
    bool built_ = false;
};

} // namespace fk::chrome
