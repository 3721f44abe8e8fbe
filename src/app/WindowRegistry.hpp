#pragma once

#include "app/UiDispatcher.hpp"
#include "app/WindowSettingsStore.hpp"
#include "chrome/ChromeSettings.hpp"
#include "chrome/PlacementNegotiator.hpp"
#include "chrome/WindowChrome.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fk::app
{

struct RegistrySettings
{
    // Document files picked out of a forwarded command line.
    std::string document_extension = ".sdku";
};

enum class ActivationKind
{
    Launch,
    File,
};

// An activation forwarded by a second instance of the process.
struct ActivationRequest
{
    ActivationKind kind = ActivationKind::Launch;
    std::vector<std::filesystem::path> files;
    // Launch only: the raw command line.
    std::string arguments;
};

// The live top-level windows in creation order. Windows are added once on
// creation and removed once on close. Everything except
// on_redirected_activation() is UI thread only.
class WindowRegistry
{
  public:
    // Creates the native window and its chrome, optionally for a document.
    // May throw std::system_error when the chrome cannot hook the window.
    using WindowFactory = std::function<std::unique_ptr<chrome::WindowChrome>(
        std::optional<std::filesystem::path> const &document)>;

    WindowRegistry(chrome::DisplayProvider const &displays,
                   UiDispatcher &dispatcher, WindowSettingsStore *settings,
                   chrome::ChromeSettings chrome_settings,
                   RegistrySettings registry_settings, WindowFactory factory);

    // Called on the UI thread when a redirected activation cannot create
    // its window; the host is expected to shut down.
    using FatalErrorHandler = std::function<void(std::system_error const &)>;

    WindowRegistry(WindowRegistry const &) = delete;
    WindowRegistry &operator=(WindowRegistry const &) = delete;

    // Returns nullptr once the registry is closing.
    chrome::WindowChrome *
    create_window(std::optional<std::filesystem::path> const &document,
                  chrome::WindowChrome const *creator = nullptr);

    // Returns true when the closed window was the last one.
    bool close_window(chrome::WindowHandle handle);

    // Programmatic move or resize, kept on the nearest display.
    bool move_window(chrome::WindowHandle handle, chrome::RectInt const &bounds);

    void on_redirected_activation(ActivationRequest request);
    void set_fatal_error_handler(FatalErrorHandler handler)
    {
        fatal_error_handler_ = std::move(handler);
    }
    bool try_switch_to_main_window();

    chrome::WindowChrome *find(chrome::WindowHandle handle) const;
    size_t size() const noexcept
    {
        return windows_.size();
    }
    bool is_closing() const noexcept
    {
        return closing_;
    }
    std::vector<chrome::PlacedWindow> placed_windows() const;

  private:
    void handle_activation(ActivationRequest const &request);
    void open_activation_windows(ActivationRequest const &request);
    chrome::RectInt initial_bounds(chrome::WindowChrome const &window,
                                   chrome::WindowChrome const *creator) const;
    void persist(chrome::WindowChrome const &window);

    chrome::DisplayProvider const &displays_;
    UiDispatcher &dispatcher_;
    WindowSettingsStore *settings_ = nullptr;
    chrome::ChromeSettings chrome_settings_;
    RegistrySettings registry_settings_;
    WindowFactory factory_;
    FatalErrorHandler fatal_error_handler_;
    chrome::PlacementNegotiator negotiator_;
    std::vector<std::unique_ptr<chrome::WindowChrome>> windows_;
    bool closing_ = false;
};

} // namespace fk::app
