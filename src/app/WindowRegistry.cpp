#include "app/WindowRegistry.hpp"

#include "app/CommandLine.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <cassert>
#include <utility>

namespace fk::app
{

WindowRegistry::WindowRegistry(chrome::DisplayProvider const &displays,
                               UiDispatcher &dispatcher,
                               WindowSettingsStore *settings,
                               chrome::ChromeSettings chrome_settings,
                               RegistrySettings registry_settings,
                               WindowFactory factory)
  : displays_(displays),
    dispatcher_(dispatcher),
    settings_(settings),
    chrome_settings_(std::move(chrome_settings)),
    registry_settings_(std::move(registry_settings)),
    factory_(std::move(factory)),
    negotiator_(displays, chrome_settings_.footprint_logical_height)
{
}

std::vector<chrome::PlacedWindow> WindowRegistry::placed_windows() const
{
    std::vector<chrome::PlacedWindow> placed;
    placed.reserve(windows_.size());
    for (auto const &window : windows_)
    {
        placed.push_back({window->restore_bounds(), window->scale_factor()});
    }
    return placed;
}

chrome::WindowChrome *WindowRegistry::find(chrome::WindowHandle handle) const
{
    auto it = std::find_if(windows_.begin(), windows_.end(),
                           [handle](auto const &window) {
                               return window->handle() == handle;
                           });
    return it == windows_.end() ? nullptr : it->get();
}

chrome::RectInt
WindowRegistry::initial_bounds(chrome::WindowChrome const &window,
                               chrome::WindowChrome const *creator) const
{
    if (creator != nullptr)
    {
        return creator->restore_bounds();
    }
    if (settings_ != nullptr)
    {
        if (auto stored = settings_->load_restore_bounds())
        {
            return *stored;
        }
    }

    auto const work = displays_.primary_work_area();
    double const scale = window.scale_factor();
    int const width =
        chrome::to_device_size(chrome_settings_.initial_logical_size.width,
                               scale);
    int const height =
        chrome::to_device_size(chrome_settings_.initial_logical_size.height,
                               scale);
    return {work.x + (work.width - width) / 2,
            work.y + (work.height - height) / 2, width, height};
}

chrome::WindowChrome *
WindowRegistry::create_window(std::optional<std::filesystem::path> const &document,
                              chrome::WindowChrome const *creator)
{
    if (closing_)
    {
        return nullptr;
    }

    auto window = factory_(document);
    if (!window)
    {
        FK_LOG_ERROR("window factory produced no window");
        return nullptr;
    }

    auto const bounds =
        negotiator_.place(initial_bounds(*window, creator), placed_windows());
    window->native_window().move_and_resize(bounds);

    if (creator == nullptr && settings_ != nullptr &&
        window->native_window().presenter().kind() ==
            chrome::PresenterKind::Overlapped)
    {
        auto state = settings_->load_window_state().value_or(
            chrome::WindowState::Normal);
        // never start minimized
        if (state == chrome::WindowState::Maximized)
        {
            window->set_window_state(state);
        }
    }

    if (!window->native_window().bring_to_front())
    {
        FK_LOG_WARN("could not bring window {:#x} to the front",
                    window->handle());
    }

    FK_LOG_DEBUG("window {:#x} created at ({}, {}) {}x{}", window->handle(),
                 bounds.x, bounds.y, bounds.width, bounds.height);
    windows_.push_back(std::move(window));
    return windows_.back().get();
}

bool WindowRegistry::close_window(chrome::WindowHandle handle)
{
    auto it = std::find_if(windows_.begin(), windows_.end(),
                           [handle](auto const &window) {
                               return window->handle() == handle;
                           });
    if (it == windows_.end())
    {
        FK_LOG_ERROR("close of unregistered window {:#x}", handle);
        assert(false && "window closed twice or never registered");
        return false;
    }

    bool const last = windows_.size() == 1;
    if (last)
    {
        closing_ = true;
        persist(**it);
    }

    auto closed = std::move(*it);
    windows_.erase(it);
    closed.reset();
    return last;
}

void WindowRegistry::persist(chrome::WindowChrome const &window)
{
    if (settings_ == nullptr)
    {
        return;
    }
    if (!settings_->save_restore_bounds(window.restore_bounds()) ||
        !settings_->save_window_state(window.window_state()))
    {
        FK_LOG_WARN("window placement was not saved");
    }
}

bool WindowRegistry::move_window(chrome::WindowHandle handle,
                                 chrome::RectInt const &bounds)
{
    auto *window = find(handle);
    if (window == nullptr)
    {
        FK_LOG_WARN("move of unknown window {:#x}", handle);
        return false;
    }
    window->native_window().move_and_resize(
        negotiator_.clamp_to_display(bounds));
    return true;
}

bool WindowRegistry::try_switch_to_main_window()
{
    if (windows_.empty())
    {
        return false;
    }
    auto &main = *windows_.front();
    if (main.window_state() == chrome::WindowState::Minimized)
    {
        main.set_window_state(chrome::WindowState::Normal);
    }
    return main.native_window().bring_to_front();
}

void WindowRegistry::on_redirected_activation(ActivationRequest request)
{
    bool const queued = dispatcher_.try_enqueue(
        [this, request = std::move(request)] { handle_activation(request); });
    if (!queued)
    {
        FK_LOG_ERROR("redirected activation could not reach the UI thread");
    }
    assert(queued);
}

// Runs inside the UI thread's dispatcher; nothing may propagate past it.
void WindowRegistry::handle_activation(ActivationRequest const &request)
{
    if (closing_)
    {
        return;
    }

    try
    {
        open_activation_windows(request);
    }
    catch (std::system_error const &ex)
    {
        FK_LOG_ERROR("redirected activation failed: {}", ex.what());
        if (fatal_error_handler_)
        {
            fatal_error_handler_(ex);
        }
    }
}

void WindowRegistry::open_activation_windows(ActivationRequest const &request)
{
    if (request.kind == ActivationKind::File)
    {
        FK_LOG_INFO("redirected file activation with {} file(s)",
                    request.files.size());
        for (auto const &file : request.files)
        {
            create_window(file);
        }
        return;
    }

    FK_LOG_INFO("redirected launch activation");
    auto const documents = collect_document_paths(
        split_launch_command_line(request.arguments),
        registry_settings_.document_extension);
    for (auto const &document : documents)
    {
        create_window(document);
    }
    if (documents.empty() && !try_switch_to_main_window())
    {
        FK_LOG_WARN("no window to switch to");
    }
}

} // namespace fk::app
