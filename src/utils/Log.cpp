#include "utils/Log.hpp"
#include "utils/FS.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <system_error>

namespace fk::log
{

namespace
{
// A log larger than this at first write is moved aside to <name>.1.
constexpr std::uintmax_t kRotateBytes = 1024 * 1024;

class LogFile
{
  public:
    void append(std::string const &line)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!opened_)
        {
            open();
        }
        if (stream_)
        {
            stream_ << line << '\n';
            stream_.flush();
        }
    }

  private:
    void open()
    {
        opened_ = true;
        auto const path = utils::log_file_path();

        std::error_code ec;
        auto const size = std::filesystem::file_size(path, ec);
        if (!ec && size > kRotateBytes)
        {
            auto rotated = path;
            rotated += ".1";
            std::filesystem::rename(path, rotated, ec);
        }
        stream_.open(path, std::ios::out | std::ios::app);
    }

    std::mutex mutex_;
    std::ofstream stream_;
    bool opened_ = false;
};
} // namespace

void append_log_line_to_file(std::string const &line)
{
    static LogFile file;
    file.append(line);
}

} // namespace fk::log
