#pragma once

#include "chrome/NativeWindow.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <windows.h>

namespace fk::win32
{

class Win32Presenter : public chrome::Presenter
{
  public:
    explicit Win32Presenter(HWND hwnd) : hwnd_(hwnd)
    {
    }

    chrome::PresenterKind kind() const override;
    chrome::PresenterState state() const override;
    bool is_resizable() const override;
    bool is_minimizable() const override;
    bool is_maximizable() const override;

    void minimize() override;
    void maximize() override;
    void restore() override;

  private:
    bool has_style(LONG_PTR style) const;

    HWND hwnd_;
};

// Frameless top-level window: the client area covers the whole frame and
// hit testing answers from the applied Caption and Passthrough rectangles.
class Win32Window : public chrome::NativeWindow
{
  public:
    static constexpr wchar_t kClassName[] = L"FrameKitWindow";

    // Returns nullptr (after logging) when the window cannot be created.
    static std::unique_ptr<Win32Window> create(HINSTANCE instance,
                                               std::wstring const &title);
    ~Win32Window() override;

    Win32Window(Win32Window const &) = delete;
    Win32Window &operator=(Win32Window const &) = delete;

    HWND hwnd() const noexcept
    {
        return hwnd_;
    }
    // Invoked for WM_CLOSE instead of destroying the window.
    void set_close_handler(std::function<void()> handler)
    {
        close_handler_ = std::move(handler);
    }

    chrome::WindowHandle handle() const noexcept override;

    std::error_code register_message_hook(chrome::MessageHook hook) override;
    void unregister_message_hook() noexcept override;

    chrome::Presenter &presenter() override
    {
        return presenter_;
    }
    chrome::Presenter const &presenter() const override
    {
        return presenter_;
    }

    unsigned dpi() const override;
    chrome::RectInt bounds() const override;
    chrome::SizeInt client_size() const override;
    int title_bar_height() const override;
    std::optional<chrome::PointInt> cursor_client_position() const override;

    bool post_system_command(chrome::SystemCommand command) override;

    bool supports_region_customization() const override
    {
        return true;
    }
    void set_region_rects(chrome::RegionKind kind,
                          std::vector<chrome::RectInt> const &rects) override;
    void clear_region_rects(chrome::RegionKind kind) override;

    void move_and_resize(chrome::RectInt const &bounds) override;
    bool bring_to_front() override;

  private:
    explicit Win32Window(HWND hwnd);

    static LRESULT CALLBACK window_proc(HWND hwnd, UINT msg, WPARAM wparam,
                                        LPARAM lparam);
    static LRESULT CALLBACK subclass_proc(HWND hwnd, UINT msg, WPARAM wparam,
                                          LPARAM lparam, UINT_PTR id,
                                          DWORD_PTR ref_data);

    LRESULT handle_message(UINT msg, WPARAM wparam, LPARAM lparam);
    LRESULT hit_test(LPARAM lparam);
    chrome::HookResult forward(chrome::NativeMessage &message);

    HWND hwnd_;
    Win32Presenter presenter_;
    chrome::MessageHook hook_;
    bool hooked_ = false;
    bool in_menu_loop_ = false;
    std::vector<chrome::RectInt> caption_rects_;
    std::vector<chrome::RectInt> passthrough_rects_;
    std::function<void()> close_handler_;
};

} // namespace fk::win32
