#pragma once

#include "chrome/Geometry.hpp"
#include "chrome/Region.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <system_error>
#include <vector>

namespace fk::chrome
{

using WindowHandle = std::uintptr_t;

enum class WindowState
{
    Normal,
    Minimized,
    Maximized,
};

enum class SystemCommand
{
    Restore,
    Move,
    Size,
    Minimize,
    Maximize,
    Close,
};

enum class PresenterKind
{
    Overlapped,
    CompactOverlay,
    FullScreen,
    Other,
};

enum class PresenterState
{
    Restored,
    Minimized,
    Maximized,
};

// Host controller for state transitions and capability queries. Only
// Overlapped presenters can minimize, maximize or resize.
class Presenter
{
  public:
    virtual ~Presenter() = default;

    virtual PresenterKind kind() const = 0;
    virtual PresenterState state() const = 0;
    virtual bool is_resizable() const = 0;
    virtual bool is_minimizable() const = 0;
    virtual bool is_maximizable() const = 0;

    virtual void minimize() = 0;
    virtual void maximize() = 0;
    virtual void restore() = 0;
};

enum class MessageKind
{
    SizeConstraintQuery,
    DpiChanged,
    SystemCommand,
    NonClientSecondaryButtonUp,
    NonClientPrimaryButtonDown,
    BoundsChanged,
    PresenterChanged,
    Other,
};

enum class HitArea
{
    Caption,
    Other,
};

// A native notification translated by the platform layer. Only the fields
// belonging to `kind` are meaningful.
struct NativeMessage
{
    MessageKind kind = MessageKind::Other;

    // SizeConstraintQuery: the minimum trackable size, written in place.
    SizeInt *min_track_size = nullptr;
    // DpiChanged
    unsigned dpi = 0;
    // SystemCommand: the window menu was requested from the keyboard while
    // no native menu loop was running.
    bool keyboard_menu_request = false;
    // NonClient*
    HitArea hit = HitArea::Other;
    // BoundsChanged
    bool position_changed = false;
    bool size_changed = false;
};

enum class HookResult
{
    Handled,
    Unhandled,
};

using MessageHook = std::function<HookResult(NativeMessage &)>;

// One top-level native window. Unhandled messages go to the platform's
// default handler.
class NativeWindow
{
  public:
    virtual ~NativeWindow() = default;

    virtual WindowHandle handle() const noexcept = 0;

    virtual std::error_code register_message_hook(MessageHook hook) = 0;
    virtual void unregister_message_hook() noexcept = 0;

    virtual Presenter &presenter() = 0;
    virtual Presenter const &presenter() const = 0;

    virtual unsigned dpi() const = 0;
    // Outer bounds in screen device pixels.
    virtual RectInt bounds() const = 0;
    virtual SizeInt client_size() const = 0;
    virtual int title_bar_height() const = 0;
    virtual std::optional<PointInt> cursor_client_position() const = 0;

    virtual bool post_system_command(SystemCommand command) = 0;

    virtual bool supports_region_customization() const = 0;
    virtual void set_region_rects(RegionKind kind,
                                  std::vector<RectInt> const &rects) = 0;
    virtual void clear_region_rects(RegionKind kind) = 0;

    virtual void move_and_resize(RectInt const &bounds) = 0;
    virtual bool bring_to_front() = 0;
};

class DisplayProvider
{
  public:
    virtual ~DisplayProvider() = default;

    // Work area of the display nearest to `bounds`.
    virtual RectInt nearest_work_area(RectInt const &bounds) const = 0;
    virtual RectInt primary_work_area() const = 0;
};

// Per-window scale state. Only the DPI change path writes scale_factor.
struct WindowMetrics
{
    double scale_factor = 1.0;
    SizeInt min_track_size;
};

} // namespace fk::chrome
