#include "platform/win32/Win32Window.hpp"

#include "utils/Log.hpp"

#include <algorithm>

#include <commctrl.h>
#include <dwmapi.h>
#include <windowsx.h>

namespace fk::win32
{

namespace
{
constexpr UINT_PTR kSubclassId = 1;
constexpr double kTitleBarLogicalHeight = 32.0;

struct ResizeBorderThickness
{
    int x = 0;
    int y = 0;
};

ResizeBorderThickness get_resize_border_thickness(HWND hwnd)
{
    UINT dpi = GetDpiForWindow(hwnd);
    int padding = GetSystemMetricsForDpi(SM_CXPADDEDBORDER, dpi);
    int border_x = GetSystemMetricsForDpi(SM_CXSIZEFRAME, dpi) + padding;
    int border_y = GetSystemMetricsForDpi(SM_CYSIZEFRAME, dpi) + padding;
    int fallback_border = MulDiv(8, dpi, 96);
    return {std::max(border_x, fallback_border),
            std::max(border_y, fallback_border)};
}

std::optional<LRESULT> resize_edge_hit(HWND hwnd, POINT client_pt)
{
    if (IsZoomed(hwnd))
    {
        return std::nullopt;
    }
    RECT client{};
    GetClientRect(hwnd, &client);
    int w = std::max(0L, client.right - client.left);
    int h = std::max(0L, client.bottom - client.top);
    if (w <= 0 || h <= 0)
    {
        return std::nullopt;
    }
    ResizeBorderThickness const border = get_resize_border_thickness(hwnd);

    bool is_top = client_pt.y >= 0 && client_pt.y < border.y;
    bool is_bottom = client_pt.y >= h - border.y && client_pt.y < h;
    bool is_left = client_pt.x >= 0 && client_pt.x < border.x;
    bool is_right = client_pt.x >= w - border.x && client_pt.x < w;

    if (is_top && is_left)
        return HTTOPLEFT;
    if (is_top && is_right)
        return HTTOPRIGHT;
    if (is_bottom && is_left)
        return HTBOTTOMLEFT;
    if (is_bottom && is_right)
        return HTBOTTOMRIGHT;
    if (is_left)
        return HTLEFT;
    if (is_right)
        return HTRIGHT;
    if (is_top)
        return HTTOP;
    if (is_bottom)
        return HTBOTTOM;
    return std::nullopt;
}

bool any_contains(std::vector<chrome::RectInt> const &rects,
                  chrome::PointInt point)
{
    return std::any_of(rects.begin(), rects.end(),
                       [point](auto const &rect)
                       { return rect.contains(point); });
}

WPARAM to_native_command(chrome::SystemCommand command)
{
    switch (command)
    {
    case chrome::SystemCommand::Restore:
        return SC_RESTORE;
    case chrome::SystemCommand::Move:
        return SC_MOVE;
    case chrome::SystemCommand::Size:
        return SC_SIZE;
    case chrome::SystemCommand::Minimize:
        return SC_MINIMIZE;
    case chrome::SystemCommand::Maximize:
        return SC_MAXIMIZE;
    case chrome::SystemCommand::Close:
        break;
    }
    return SC_CLOSE;
}

bool register_window_class(HINSTANCE instance, wchar_t const *class_name,
                           WNDPROC proc)
{
    static bool registered = false;
    if (registered)
    {
        return true;
    }
    WNDCLASSEXW wc{sizeof(wc)};
    wc.lpfnWndProc = proc;
    wc.hInstance = instance;
    wc.hCursor = LoadCursor(nullptr, IDC_ARROW);
    wc.hbrBackground = reinterpret_cast<HBRUSH>(COLOR_WINDOW + 1);
    wc.lpszClassName = class_name;
    wc.style = CS_HREDRAW | CS_VREDRAW;
    if (!RegisterClassExW(&wc))
    {
        return false;
    }
    registered = true;
    return true;
}
} // namespace

bool Win32Presenter::has_style(LONG_PTR style) const
{
    return (GetWindowLongPtrW(hwnd_, GWL_STYLE) & style) != 0;
}

chrome::PresenterKind Win32Presenter::kind() const
{
    return chrome::PresenterKind::Overlapped;
}

chrome::PresenterState Win32Presenter::state() const
{
    if (IsIconic(hwnd_))
    {
        return chrome::PresenterState::Minimized;
    }
    if (IsZoomed(hwnd_))
    {
        return chrome::PresenterState::Maximized;
    }
    return chrome::PresenterState::Restored;
}

bool Win32Presenter::is_resizable() const
{
    return has_style(WS_THICKFRAME);
}

bool Win32Presenter::is_minimizable() const
{
    return has_style(WS_MINIMIZEBOX);
}

bool Win32Presenter::is_maximizable() const
{
    return has_style(WS_MAXIMIZEBOX);
}

void Win32Presenter::minimize()
{
    ShowWindow(hwnd_, SW_MINIMIZE);
}

void Win32Presenter::maximize()
{
    ShowWindow(hwnd_, SW_MAXIMIZE);
}

void Win32Presenter::restore()
{
    ShowWindow(hwnd_, SW_RESTORE);
}

std::unique_ptr<Win32Window> Win32Window::create(HINSTANCE instance,
                                                 std::wstring const &title)
{
    if (!register_window_class(instance, kClassName, &Win32Window::window_proc))
    {
        FK_LOG_ERROR("RegisterClassExW failed: {}", GetLastError());
        return nullptr;
    }

    HWND hwnd = CreateWindowExW(WS_EX_APPWINDOW, kClassName, title.c_str(),
                                WS_OVERLAPPEDWINDOW, CW_USEDEFAULT,
                                CW_USEDEFAULT, CW_USEDEFAULT, CW_USEDEFAULT,
                                nullptr, nullptr, instance, nullptr);
    if (!hwnd)
    {
        FK_LOG_ERROR("CreateWindowExW failed: {}", GetLastError());
        return nullptr;
    }

    // keep the DWM shadow once the frame is gone
    MARGINS margins{0, 0, 1, 0};
    if (FAILED(DwmExtendFrameIntoClientArea(hwnd, &margins)))
    {
        FK_LOG_WARN("DwmExtendFrameIntoClientArea failed");
    }
    SetWindowPos(hwnd, nullptr, 0, 0, 0, 0,
                 SWP_FRAMECHANGED | SWP_NOMOVE | SWP_NOSIZE | SWP_NOZORDER |
                     SWP_NOACTIVATE);

    return std::unique_ptr<Win32Window>(new Win32Window(hwnd));
}

Win32Window::Win32Window(HWND hwnd) : hwnd_(hwnd), presenter_(hwnd)
{
}

Win32Window::~Win32Window()
{
    unregister_message_hook();
    if (IsWindow(hwnd_))
    {
        DestroyWindow(hwnd_);
    }
}

chrome::WindowHandle Win32Window::handle() const noexcept
{
    return reinterpret_cast<chrome::WindowHandle>(hwnd_);
}

LRESULT CALLBACK Win32Window::window_proc(HWND hwnd, UINT msg, WPARAM wparam,
                                          LPARAM lparam)
{
    // frameless client: the client rectangle is the window rectangle
    if (msg == WM_NCCALCSIZE && wparam)
    {
        return 0;
    }
    return DefWindowProcW(hwnd, msg, wparam, lparam);
}

std::error_code
Win32Window::register_message_hook(chrome::MessageHook hook)
{
    if (hooked_)
    {
        return std::make_error_code(std::errc::device_or_resource_busy);
    }
    hook_ = std::move(hook);
    if (!SetWindowSubclass(hwnd_, &Win32Window::subclass_proc, kSubclassId,
                           reinterpret_cast<DWORD_PTR>(this)))
    {
        DWORD error = GetLastError();
        hook_ = nullptr;
        return {static_cast<int>(error ? error : ERROR_GEN_FAILURE),
                std::system_category()};
    }
    hooked_ = true;
    return {};
}

void Win32Window::unregister_message_hook() noexcept
{
    if (hooked_)
    {
        RemoveWindowSubclass(hwnd_, &Win32Window::subclass_proc, kSubclassId);
        hooked_ = false;
    }
    hook_ = nullptr;
}

LRESULT CALLBACK Win32Window::subclass_proc(HWND hwnd, UINT msg, WPARAM wparam,
                                            LPARAM lparam, UINT_PTR,
                                            DWORD_PTR ref_data)
{
    auto *self = reinterpret_cast<Win32Window *>(ref_data);
    if (msg == WM_NCDESTROY)
    {
        RemoveWindowSubclass(hwnd, &Win32Window::subclass_proc, kSubclassId);
        self->hooked_ = false;
        return DefSubclassProc(hwnd, msg, wparam, lparam);
    }
    return self->handle_message(msg, wparam, lparam);
}

chrome::HookResult Win32Window::forward(chrome::NativeMessage &message)
{
    return hook_ ? hook_(message) : chrome::HookResult::Unhandled;
}

LRESULT Win32Window::handle_message(UINT msg, WPARAM wparam, LPARAM lparam)
{
    chrome::NativeMessage message;

    switch (msg)
    {
    case WM_NCHITTEST:
        return hit_test(lparam);

    case WM_GETMINMAXINFO:
    {
        auto *mmi = reinterpret_cast<MINMAXINFO *>(lparam);
        if (!mmi)
        {
            return 0;
        }
        chrome::SizeInt min_track{mmi->ptMinTrackSize.x,
                                  mmi->ptMinTrackSize.y};
        message.kind = chrome::MessageKind::SizeConstraintQuery;
        message.min_track_size = &min_track;
        forward(message);
        mmi->ptMinTrackSize.x = min_track.width;
        mmi->ptMinTrackSize.y = min_track.height;

        // a maximized frameless window stops at the work area
        HMONITOR monitor = MonitorFromWindow(hwnd_, MONITOR_DEFAULTTONEAREST);
        MONITORINFO mi{};
        mi.cbSize = sizeof(mi);
        if (GetMonitorInfoW(monitor, &mi))
        {
            mmi->ptMaxPosition.x = mi.rcWork.left - mi.rcMonitor.left;
            mmi->ptMaxPosition.y = mi.rcWork.top - mi.rcMonitor.top;
            mmi->ptMaxSize.x = mi.rcWork.right - mi.rcWork.left;
            mmi->ptMaxSize.y = mi.rcWork.bottom - mi.rcWork.top;
        }
        return 0;
    }

    case WM_DPICHANGED:
    {
        message.kind = chrome::MessageKind::DpiChanged;
        message.dpi = HIWORD(wparam);
        forward(message);
        auto *suggested = reinterpret_cast<RECT *>(lparam);
        if (suggested)
        {
            SetWindowPos(hwnd_, nullptr, suggested->left, suggested->top,
                         suggested->right - suggested->left,
                         suggested->bottom - suggested->top,
                         SWP_NOZORDER | SWP_NOACTIVATE);
        }
        return 0;
    }

    case WM_ENTERMENULOOP:
        in_menu_loop_ = true;
        break;

    case WM_EXITMENULOOP:
        in_menu_loop_ = false;
        break;

    case WM_SYSCOMMAND:
        message.kind = chrome::MessageKind::SystemCommand;
        message.keyboard_menu_request = (wparam & 0xFFF0) == SC_KEYMENU &&
                                        lparam == VK_SPACE && !in_menu_loop_;
        if (forward(message) == chrome::HookResult::Handled)
        {
            return 0;
        }
        break;

    case WM_NCRBUTTONUP:
        message.kind = chrome::MessageKind::NonClientSecondaryButtonUp;
        message.hit =
            wparam == HTCAPTION ? chrome::HitArea::Caption : chrome::HitArea::Other;
        if (forward(message) == chrome::HookResult::Handled)
        {
            return 0;
        }
        break;

    case WM_NCLBUTTONDOWN:
        message.kind = chrome::MessageKind::NonClientPrimaryButtonDown;
        message.hit =
            wparam == HTCAPTION ? chrome::HitArea::Caption : chrome::HitArea::Other;
        forward(message);
        break;

    case WM_WINDOWPOSCHANGED:
    {
        auto const *pos = reinterpret_cast<WINDOWPOS const *>(lparam);
        if (pos)
        {
            message.kind = chrome::MessageKind::BoundsChanged;
            message.position_changed = (pos->flags & SWP_NOMOVE) == 0;
            message.size_changed = (pos->flags & SWP_NOSIZE) == 0;
            forward(message);
        }
        break;
    }

    case WM_STYLECHANGED:
        message.kind = chrome::MessageKind::PresenterChanged;
        forward(message);
        break;

    case WM_CLOSE:
        if (close_handler_)
        {
            close_handler_();
            return 0;
        }
        break;
    }

    return DefSubclassProc(hwnd_, msg, wparam, lparam);
}

LRESULT Win32Window::hit_test(LPARAM lparam)
{
    POINT pt{GET_X_LPARAM(lparam), GET_Y_LPARAM(lparam)};
    if (!ScreenToClient(hwnd_, &pt))
    {
        return HTNOWHERE;
    }
    if (auto edge = resize_edge_hit(hwnd_, pt))
    {
        return *edge;
    }

    chrome::PointInt const point{pt.x, pt.y};
    if (any_contains(passthrough_rects_, point))
    {
        return HTCLIENT;
    }
    if (any_contains(caption_rects_, point))
    {
        return HTCAPTION;
    }
    return HTCLIENT;
}

unsigned Win32Window::dpi() const
{
    return GetDpiForWindow(hwnd_);
}

chrome::RectInt Win32Window::bounds() const
{
    RECT rw{};
    GetWindowRect(hwnd_, &rw);
    return {rw.left, rw.top, rw.right - rw.left, rw.bottom - rw.top};
}

chrome::SizeInt Win32Window::client_size() const
{
    RECT client{};
    GetClientRect(hwnd_, &client);
    return {client.right - client.left, client.bottom - client.top};
}

int Win32Window::title_bar_height() const
{
    return chrome::to_device_size(kTitleBarLogicalHeight,
                                  chrome::scale_factor_from_dpi(dpi()));
}

std::optional<chrome::PointInt> Win32Window::cursor_client_position() const
{
    POINT pt{};
    if (!GetCursorPos(&pt) || !ScreenToClient(hwnd_, &pt))
    {
        return std::nullopt;
    }
    return chrome::PointInt{pt.x, pt.y};
}

bool Win32Window::post_system_command(chrome::SystemCommand command)
{
    return PostMessageW(hwnd_, WM_SYSCOMMAND, to_native_command(command), 0) !=
           FALSE;
}

void Win32Window::set_region_rects(chrome::RegionKind kind,
                                   std::vector<chrome::RectInt> const &rects)
{
    if (kind == chrome::RegionKind::Caption)
    {
        caption_rects_ = rects;
    }
    else
    {
        passthrough_rects_ = rects;
    }
}

void Win32Window::clear_region_rects(chrome::RegionKind kind)
{
    if (kind == chrome::RegionKind::Caption)
    {
        caption_rects_.clear();
    }
    else
    {
        passthrough_rects_.clear();
    }
}

void Win32Window::move_and_resize(chrome::RectInt const &bounds)
{
    SetWindowPos(hwnd_, nullptr, bounds.x, bounds.y, bounds.width,
                 bounds.height, SWP_NOZORDER | SWP_NOACTIVATE);
}

bool Win32Window::bring_to_front()
{
    ShowWindow(hwnd_, SW_SHOW);
    return SetForegroundWindow(hwnd_) != FALSE;
}

} // namespace fk::win32
