#pragma once

#include <filesystem>
#include <optional>

namespace fk::utils
{

// Per-user directory holding the settings database and the log.
// FRAMEKIT_DATA_DIR overrides the platform location.
std::optional<std::filesystem::path> settings_directory();

// Falls back to the working directory when no per-user directory exists.
std::filesystem::path log_file_path();
std::filesystem::path settings_database_path();

} // namespace fk::utils
