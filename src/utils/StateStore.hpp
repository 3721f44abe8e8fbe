#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <sqlite3.h>

namespace fk::storage
{

// Settings file: one sqlite `settings` table of text values keyed by name.
// A database that failed to open stays usable as an empty, read-only store
// so the window chrome keeps working without persistence.
class Database
{
  public:
    explicit Database(std::filesystem::path path);
    ~Database();

    Database(Database const &) = delete;
    Database &operator=(Database const &) = delete;

    bool is_valid() const noexcept
    {
        return db_ != nullptr;
    }
    std::filesystem::path const &path() const noexcept
    {
        return path_;
    }

    std::optional<std::string> get_setting(std::string const &key) const;
    bool set_setting(std::string const &key, std::string const &value);
    bool remove_setting(std::string const &key);

  private:
    bool migrate();
    int user_version() const;

    std::filesystem::path path_;
    sqlite3 *db_ = nullptr;
};

} // namespace fk::storage
