#pragma once

#include "app/UiDispatcher.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <string>

#include <windows.h>

namespace fk::win32
{

// UI thread work queue behind a message-only window. The same window
// receives command lines forwarded by a second instance through
// WM_COPYDATA.
class Win32Dispatcher : public app::UiDispatcher
{
  public:
    static constexpr wchar_t kClassName[] = L"FrameKitDispatcher";
    static constexpr ULONG_PTR kCommandLineTag = 0x464b434c; // 'FKCL'

    using CommandLineHandler = std::function<void(std::string)>;

    explicit Win32Dispatcher(HINSTANCE instance);
    ~Win32Dispatcher() override;

    Win32Dispatcher(Win32Dispatcher const &) = delete;
    Win32Dispatcher &operator=(Win32Dispatcher const &) = delete;

    bool is_valid() const noexcept
    {
        return hwnd_ != nullptr;
    }
    void set_command_line_handler(CommandLineHandler handler)
    {
        command_line_handler_ = std::move(handler);
    }

    bool try_enqueue(std::function<void()> work) override;

    // Sends `command_line` to the dispatcher of the running instance.
    static bool forward_to_running_instance(std::string const &command_line);

  private:
    static LRESULT CALLBACK window_proc(HWND hwnd, UINT msg, WPARAM wparam,
                                        LPARAM lparam);
    void drain();

    HWND hwnd_ = nullptr;
    std::mutex mutex_;
    std::deque<std::function<void()>> queue_;
    CommandLineHandler command_line_handler_;
};

} // namespace fk::win32
