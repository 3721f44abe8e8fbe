#include "utils/StateStore.hpp"

#include "utils/Log.hpp"

#include <system_error>
#include <utility>

namespace fk::storage
{

namespace
{
constexpr int kBusyTimeoutMs = 2000;
constexpr int kSchemaVersion = 1;

// Owns one prepared statement for the duration of a call.
class Statement
{
  public:
    Statement(sqlite3 *db, char const *sql)
    {
        if (db != nullptr &&
            sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK)
        {
            FK_LOG_WARN("sqlite prepare failed: {}", sqlite3_errmsg(db));
            stmt_ = nullptr;
        }
    }
    ~Statement()
    {
        sqlite3_finalize(stmt_);
    }

    Statement(Statement const &) = delete;
    Statement &operator=(Statement const &) = delete;

    explicit operator bool() const noexcept
    {
        return stmt_ != nullptr;
    }

    Statement &bind(int index, std::string const &text)
    {
        sqlite3_bind_text(stmt_, index, text.c_str(),
                          static_cast<int>(text.size()), SQLITE_TRANSIENT);
        return *this;
    }

    int step()
    {
        return sqlite3_step(stmt_);
    }

    std::optional<std::string> text_column(int column) const
    {
        auto *text = sqlite3_column_text(stmt_, column);
        if (text == nullptr)
        {
            return std::nullopt;
        }
        return std::string(reinterpret_cast<char const *>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
    }
    int int_column(int column) const
    {
        return sqlite3_column_int(stmt_, column);
    }

  private:
    sqlite3_stmt *stmt_ = nullptr;
};

bool run(sqlite3 *db, char const *sql)
{
    char *error = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &error);
    if (rc != SQLITE_OK)
    {
        FK_LOG_WARN("sqlite: {}", error != nullptr ? error : sqlite3_errstr(rc));
        sqlite3_free(error);
        return false;
    }
    return true;
}
} // namespace

Database::Database(std::filesystem::path path) : path_(std::move(path))
{
    if (path_.empty())
    {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);

    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                             nullptr);
    if (rc == SQLITE_OK)
    {
        sqlite3_busy_timeout(db_, kBusyTimeoutMs);
        if (migrate())
        {
            return;
        }
    }
    else
    {
        FK_LOG_WARN("cannot open settings {}: {}", path_.string(),
                    sqlite3_errstr(rc));
    }
    sqlite3_close(db_);
    db_ = nullptr;
}

Database::~Database()
{
    sqlite3_close(db_);
}

int Database::user_version() const
{
    Statement query(db_, "PRAGMA user_version;");
    if (!query || query.step() != SQLITE_ROW)
    {
        return -1;
    }
    return query.int_column(0);
}

bool Database::migrate()
{
    int const version = user_version();
    if (version < 0)
    {
        return false;
    }
    if (version >= kSchemaVersion)
    {
        return true;
    }

    bool const ok =
        run(db_, "BEGIN;") &&
        run(db_, "CREATE TABLE IF NOT EXISTS settings ("
                 "key TEXT PRIMARY KEY,"
                 "value TEXT NOT NULL,"
                 "updated_at INTEGER NOT NULL DEFAULT 0);") &&
        run(db_, "PRAGMA user_version = 1;") && run(db_, "COMMIT;");
    if (!ok)
    {
        run(db_, "ROLLBACK;");
        FK_LOG_ERROR("settings schema setup failed at version {}", version);
    }
    return ok;
}

std::optional<std::string> Database::get_setting(std::string const &key) const
{
    Statement query(db_, "SELECT value FROM settings WHERE key = ?;");
    if (!query)
    {
        return std::nullopt;
    }
    query.bind(1, key);
    if (query.step() != SQLITE_ROW)
    {
        return std::nullopt;
    }
    return query.text_column(0);
}

bool Database::set_setting(std::string const &key, std::string const &value)
{
    Statement upsert(db_,
                     "INSERT INTO settings (key, value, updated_at) "
                     "VALUES (?, ?, strftime('%s','now')) "
                     "ON CONFLICT(key) DO UPDATE SET value = excluded.value, "
                     "updated_at = excluded.updated_at;");
    if (!upsert)
    {
        return false;
    }
    upsert.bind(1, key).bind(2, value);
    return upsert.step() == SQLITE_DONE;
}

bool Database::remove_setting(std::string const &key)
{
    Statement erase(db_, "DELETE FROM settings WHERE key = ?;");
    if (!erase)
    {
        return false;
    }
    erase.bind(1, key);
    return erase.step() == SQLITE_DONE;
}

} // namespace fk::storage
