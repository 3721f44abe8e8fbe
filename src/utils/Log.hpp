#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <format>
#include <string>
#include <string_view>

namespace fk::log
{

// Appends one already formatted line to the log file (defined in Log.cpp).
void append_log_line_to_file(std::string const &line);

// FK_ENABLE_LOGGING=1 wins over FK_BUILD_MINIMAL so a minimal build can
// still be diagnosed.
#if !defined(FK_BUILD_MINIMAL) ||                                              \
    (defined(FK_ENABLE_LOGGING) && (FK_ENABLE_LOGGING))
// "[L HH:MM:SS.mmm] " in local time.
inline std::string line_prefix(char level)
{
    using namespace std::chrono;
    auto const now = system_clock::now();
    auto const millis =
        duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    auto const time = system_clock::to_time_t(now);
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &time);
#else
    localtime_r(&time, &local);
#endif
    return std::format("[{} {:02}:{:02}:{:02}.{:03}] ", level, local.tm_hour,
                       local.tm_min, local.tm_sec, millis);
}

template <typename... Args>
inline void write_line(char level, std::string_view fmt, Args &&...args)
{
    std::string line = line_prefix(level);
    line += std::vformat(fmt, std::make_format_args(args...));
    std::fprintf(stderr, "%s\n", line.c_str());
    append_log_line_to_file(line);
}
#else
template <typename... Args>
inline void write_line(char, std::string_view, Args &&...) noexcept
{
}
#endif

} // namespace fk::log

#if !defined(FK_BUILD_MINIMAL) ||                                              \
    (defined(FK_ENABLE_LOGGING) && (FK_ENABLE_LOGGING))
#define FK_LOG_INFO(fmt, ...) fk::log::write_line('I', fmt, ##__VA_ARGS__)
#define FK_LOG_DEBUG(fmt, ...) fk::log::write_line('D', fmt, ##__VA_ARGS__)
#define FK_LOG_WARN(fmt, ...) fk::log::write_line('W', fmt, ##__VA_ARGS__)
#define FK_LOG_ERROR(fmt, ...) fk::log::write_line('E', fmt, ##__VA_ARGS__)
#else
#define FK_LOG_INFO(fmt, ...) (void)0
#define FK_LOG_DEBUG(fmt, ...) (void)0
#define FK_LOG_WARN(fmt, ...) (void)0
#define FK_LOG_ERROR(fmt, ...) (void)0
#endif
