#include "utils/FS.hpp"

#include <cstdlib>
#include <system_error>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <Windows.h>
#include <ShlObj.h>
#endif

namespace fk::utils
{

namespace
{
constexpr char const *kLogFileName = "framekit.log";
constexpr char const *kDatabaseFileName = "framekit.db";

std::optional<std::filesystem::path> non_empty_env(char const *name)
{
    char const *value = std::getenv(name);
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::filesystem::path(value);
}

std::optional<std::filesystem::path> platform_directory()
{
#if defined(_WIN32)
    PWSTR folder = nullptr;
    HRESULT hr = SHGetKnownFolderPath(FOLDERID_LocalAppData, KF_FLAG_CREATE,
                                      nullptr, &folder);
    std::optional<std::filesystem::path> result;
    if (SUCCEEDED(hr) && folder != nullptr)
    {
        result = std::filesystem::path(folder) / L"FrameKit";
    }
    CoTaskMemFree(folder);
    return result;
#else
    if (auto config = non_empty_env("XDG_CONFIG_HOME"))
    {
        return *config / "framekit";
    }
    if (auto home = non_empty_env("HOME"))
    {
        return *home / ".config" / "framekit";
    }
    return std::nullopt;
#endif
}

std::filesystem::path file_in_settings_directory(char const *name)
{
    if (auto dir = settings_directory())
    {
        return *dir / name;
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(name) : cwd / name;
}
} // namespace

std::optional<std::filesystem::path> settings_directory()
{
    auto dir = non_empty_env("FRAMEKIT_DATA_DIR");
    if (!dir)
    {
        dir = platform_directory();
    }
    if (!dir)
    {
        return std::nullopt;
    }

    std::error_code ec;
    std::filesystem::create_directories(*dir, ec);
    if (ec && !std::filesystem::is_directory(*dir, ec))
    {
        return std::nullopt;
    }
    return dir;
}

std::filesystem::path log_file_path()
{
    return file_in_settings_directory(kLogFileName);
}

std::filesystem::path settings_database_path()
{
    return file_in_settings_directory(kDatabaseFileName);
}

} // namespace fk::utils
