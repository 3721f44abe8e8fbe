#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fk::app
{

// Splits a forwarded launch command line on spaces. Double quotes group
// spaces into one argument and are dropped.
std::vector<std::string> split_launch_command_line(std::string_view text);

// Document paths named on a command line: args[0] is the program and is
// skipped; an argument counts when it names an existing file whose
// extension matches `extension` ignoring case.
std::vector<std::filesystem::path>
collect_document_paths(std::vector<std::string> const &args,
                       std::string_view extension);

} // namespace fk::app
