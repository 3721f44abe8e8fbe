#include "app/CommandLine.hpp"
#include "app/WindowRegistry.hpp"
#include "app/WindowSettingsStore.hpp"
#include "chrome/SchedulerService.hpp"
#include "chrome/WindowChrome.hpp"
#include "platform/win32/StringUtil.hpp"
#include "platform/win32/Win32DisplayProvider.hpp"
#include "platform/win32/Win32Dispatcher.hpp"
#include "platform/win32/Win32Element.hpp"
#include "platform/win32/Win32PopupMenu.hpp"
#include "platform/win32/Win32Window.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"
#include "utils/Version.hpp"

#include <chrono>
#include <memory>
#include <system_error>
#include <unordered_map>

#include <commctrl.h>
#include <windows.h>

namespace
{

using namespace fk;

wchar_t const kSingleInstanceMutex[] = L"FrameKit_SingleInstance_Mutex";

std::wstring window_title(std::optional<std::filesystem::path> const &document)
{
    std::wstring title = win32::widen(version::kDisplayVersion);
    if (document)
    {
        title = document->filename().wstring() + L" - " + title;
    }
    return title;
}

// Everything the host owns for its lifetime, in teardown order.
struct HostState
{
    HINSTANCE instance = nullptr;
    chrome::SchedulerService scheduler;
    win32::Win32DisplayProvider displays;
    std::unique_ptr<win32::Win32Dispatcher> dispatcher;
    std::unique_ptr<storage::Database> database;
    std::unique_ptr<app::WindowSettingsStore> settings;
    std::unordered_map<chrome::WindowHandle, std::unique_ptr<win32::Win32Element>>
        contents;
    std::unique_ptr<app::WindowRegistry> registry;
};

void close_window(HostState &host, chrome::WindowHandle handle)
{
    bool const last = host.registry->close_window(handle);
    host.contents.erase(handle);
    if (last)
    {
        PostQuitMessage(0);
    }
}

std::unique_ptr<chrome::WindowChrome>
make_window(HostState &host, std::optional<std::filesystem::path> const &document)
{
    auto native = win32::Win32Window::create(host.instance, window_title(document));
    if (!native)
    {
        return nullptr;
    }
    HWND hwnd = native->hwnd();
    auto const handle = native->handle();

    // WM_CLOSE arrives inside the window's own message handler; tear the
    // window down once that handler has returned.
    native->set_close_handler(
        [&host, handle]
        {
            if (!host.dispatcher->try_enqueue(
                    [&host, handle] { close_window(host, handle); }))
            {
                FK_LOG_ERROR("could not queue close of window {:#x}", handle);
            }
        });

    auto window = std::make_unique<chrome::WindowChrome>(
        std::move(native), host.scheduler,
        std::make_unique<win32::Win32PopupMenu>(hwnd));

    auto content = std::make_unique<win32::Win32Element>(hwnd, hwnd);
    window->add_drag_region_event_handlers(*content);
    host.contents[handle] = std::move(content);
    return window;
}

// Returns the WM_QUIT exit code.
int run_message_loop(HostState &host)
{
    MSG msg;
    for (;;)
    {
        auto const wait =
            host.scheduler.time_until_next_task(chrome::Scheduler::Clock::now());
        DWORD const timeout = host.scheduler.pending() == 0
                                  ? INFINITE
                                  : static_cast<DWORD>(wait.count());
        MsgWaitForMultipleObjects(0, nullptr, FALSE, timeout, QS_ALLINPUT);

        while (PeekMessageW(&msg, nullptr, 0, 0, PM_REMOVE))
        {
            if (msg.message == WM_QUIT)
            {
                return static_cast<int>(msg.wParam);
            }
            TranslateMessage(&msg);
            DispatchMessageW(&msg);
        }
        host.scheduler.tick();
    }
}

} // namespace

int WINAPI wWinMain(HINSTANCE hInstance, HINSTANCE, PWSTR, int)
{
    std::string const command_line = fk::win32::narrow(GetCommandLineW());

    // Single instance mutex
    HANDLE hMutex = CreateMutexW(nullptr, TRUE, kSingleInstanceMutex);
    if (GetLastError() == ERROR_ALREADY_EXISTS)
    {
        if (!fk::win32::Win32Dispatcher::forward_to_running_instance(
                command_line))
        {
            FK_LOG_WARN("running instance did not take the command line");
        }
        if (hMutex)
            CloseHandle(hMutex);
        return 0;
    }

    SetProcessDpiAwarenessContext(DPI_AWARENESS_CONTEXT_PER_MONITOR_AWARE_V2);
    INITCOMMONCONTROLSEX icc{sizeof(icc), ICC_STANDARD_CLASSES | ICC_LINK_CLASS};
    InitCommonControlsEx(&icc);

    FK_LOG_INFO("{} starting", fk::version::kDisplayVersion);

    HostState host;
    host.instance = hInstance;
    host.dispatcher = std::make_unique<fk::win32::Win32Dispatcher>(hInstance);
    host.database = std::make_unique<fk::storage::Database>(
        fk::utils::settings_database_path());
    host.settings =
        std::make_unique<fk::app::WindowSettingsStore>(host.database.get());

    fk::app::RegistrySettings registry_settings;
    host.registry = std::make_unique<fk::app::WindowRegistry>(
        host.displays, *host.dispatcher, host.settings.get(),
        fk::chrome::ChromeSettings{}, registry_settings,
        [&host](std::optional<std::filesystem::path> const &document)
        { return make_window(host, document); });

    host.registry->set_fatal_error_handler(
        [](std::system_error const &)
        {
            // same exit code as a failure while opening the first windows
            PostQuitMessage(1);
        });

    host.dispatcher->set_command_line_handler(
        [&host](std::string forwarded)
        {
            fk::app::ActivationRequest request;
            request.kind = fk::app::ActivationKind::Launch;
            request.arguments = std::move(forwarded);
            host.registry->on_redirected_activation(std::move(request));
        });

    int exit_code = 0;
    try
    {
        auto const documents = fk::app::collect_document_paths(
            fk::app::split_launch_command_line(command_line),
            registry_settings.document_extension);
        for (auto const &document : documents)
        {
            host.registry->create_window(document);
        }
        if (host.registry->size() == 0)
        {
            host.registry->create_window(std::nullopt);
        }

        if (host.registry->size() == 0)
        {
            FK_LOG_ERROR("no window could be created");
            exit_code = 1;
        }
        else
        {
            exit_code = run_message_loop(host);
        }
    }
    catch (std::system_error const &ex)
    {
        FK_LOG_ERROR("window chrome unavailable: {}", ex.what());
        exit_code = 1;
    }

    host.registry.reset();

    if (hMutex)
        CloseHandle(hMutex);

    FK_LOG_INFO("{} exiting", fk::version::kDisplayVersion);
    return exit_code;
}
