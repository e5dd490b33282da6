#pragma once

#include <string>
#include <vector>

namespace toolwire {

// Splits a command line into arguments using POSIX shell quoting rules
// (no expansion). Throws std::invalid_argument on an unterminated quote or
// a trailing backslash.
std::vector<std::string> split_command(const std::string & command);

// Replaces every character outside [A-Za-z0-9_] with '_'.
std::string sanitize_name(const std::string & name);

} // namespace toolwire
