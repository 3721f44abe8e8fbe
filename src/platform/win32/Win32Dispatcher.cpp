#include "platform/win32/Win32Dispatcher.hpp"

#include "utils/Log.hpp"

#include <utility>

namespace fk::win32
{

namespace
{
constexpr UINT kDrainMessage = WM_APP + 1;
} // namespace

Win32Dispatcher::Win32Dispatcher(HINSTANCE instance)
{
    WNDCLASSEXW wc{sizeof(wc)};
    wc.lpfnWndProc = &Win32Dispatcher::window_proc;
    wc.hInstance = instance;
    wc.lpszClassName = kClassName;
    RegisterClassExW(&wc);

    hwnd_ = CreateWindowExW(0, kClassName, L"FrameKit", 0, 0, 0, 0, 0,
                            HWND_MESSAGE, nullptr, instance, nullptr);
    if (!hwnd_)
    {
        FK_LOG_ERROR("dispatcher window creation failed: {}", GetLastError());
        return;
    }
    SetWindowLongPtrW(hwnd_, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(this));
}

Win32Dispatcher::~Win32Dispatcher()
{
    if (hwnd_)
    {
        SetWindowLongPtrW(hwnd_, GWLP_USERDATA, 0);
        DestroyWindow(hwnd_);
    }
}

bool Win32Dispatcher::try_enqueue(std::function<void()> work)
{
    if (!hwnd_)
    {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(work));
    }
    return PostMessageW(hwnd_, kDrainMessage, 0, 0) != FALSE;
}

void Win32Dispatcher::drain()
{
    std::deque<std::function<void()>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(queue_);
    }
    for (auto &work : pending)
    {
        if (work)
        {
            work();
        }
    }
}

bool Win32Dispatcher::forward_to_running_instance(
    std::string const &command_line)
{
    HWND target = FindWindowExW(HWND_MESSAGE, nullptr, kClassName, nullptr);
    if (!target)
    {
        return false;
    }
    COPYDATASTRUCT data{};
    data.dwData = kCommandLineTag;
    data.cbData = static_cast<DWORD>(command_line.size());
    data.lpData = const_cast<char *>(command_line.data());
    AllowSetForegroundWindow(ASFW_ANY);
    return SendMessageW(target, WM_COPYDATA, 0,
                        reinterpret_cast<LPARAM>(&data)) != 0;
}

LRESULT CALLBACK Win32Dispatcher::window_proc(HWND hwnd, UINT msg,
                                              WPARAM wparam, LPARAM lparam)
{
    auto *self = reinterpret_cast<Win32Dispatcher *>(
        GetWindowLongPtrW(hwnd, GWLP_USERDATA));
    if (!self)
    {
        return DefWindowProcW(hwnd, msg, wparam, lparam);
    }

    switch (msg)
    {
    case kDrainMessage:
        self->drain();
        return 0;
    case WM_COPYDATA:
    {
        auto const *data = reinterpret_cast<COPYDATASTRUCT const *>(lparam);
        if (!data || data->dwData != kCommandLineTag ||
            !self->command_line_handler_)
        {
            return FALSE;
        }
        std::string command_line(static_cast<char const *>(data->lpData),
                                  data->cbData);
        self->command_line_handler_(std::move(command_line));
        return TRUE;
    }
    }
    return DefWindowProcW(hwnd, msg, wparam, lparam);
}

} // namespace fk::win32
