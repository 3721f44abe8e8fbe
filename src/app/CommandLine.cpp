#include "app/CommandLine.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace fk::app
{

namespace
{
bool equals_ignore_case(std::string_view lhs, std::string_view rhs)
{
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}
} // namespace

std::vector<std::string> split_launch_command_line(std::string_view text)
{
    std::vector<std::string> arguments;
    std::string current;
    bool inside_quotes = false;

    for (char letter : text)
    {
        if (letter == '"')
        {
            inside_quotes = !inside_quotes;
        }
        else if (inside_quotes || letter != ' ')
        {
            current.push_back(letter);
        }
        else if (!current.empty())
        {
            arguments.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty())
    {
        arguments.push_back(std::move(current));
    }
    return arguments;
}

std::vector<std::filesystem::path>
collect_document_paths(std::vector<std::string> const &args,
                       std::string_view extension)
{
    std::vector<std::filesystem::path> paths;
    for (size_t index = 1; index < args.size(); ++index)
    {
        if (args[index].empty())
        {
            continue;
        }
        std::filesystem::path path(args[index]);
        if (!equals_ignore_case(path.extension().string(), extension))
        {
            continue;
        }
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec))
        {
            paths.push_back(std::move(path));
        }
    }
    return paths;
}

} // namespace fk::app
