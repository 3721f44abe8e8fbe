#pragma once

#include "chrome/Geometry.hpp"
#include "chrome/NativeWindow.hpp"

#include <optional>
#include <string_view>

namespace fk::storage
{
class Database;
}

namespace fk::app
{

std::optional<chrome::WindowState> parse_window_state(std::string_view text);

// Window placement remembered across runs: the restore bounds and state of
// the last window closed. A null or unopened database reads as empty and
// drops writes.
class WindowSettingsStore
{
  public:
    explicit WindowSettingsStore(storage::Database *database);

    std::optional<chrome::RectInt> load_restore_bounds() const;
    bool save_restore_bounds(chrome::RectInt const &bounds);

    std::optional<chrome::WindowState> load_window_state() const;
    bool save_window_state(chrome::WindowState state);

  private:
    bool usable() const noexcept;

    storage::Database *database_ = nullptr;
};

} // namespace fk::app
