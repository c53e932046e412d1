#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace deployer {

// Single-quotes `arg` for /bin/sh.
std::string ShellQuote(std::string_view arg);

// Runs `command` through the shell and captures stdout. A non-zero exit
// status fails with err = exit status; `out` still holds what was read.
Result RunCommandCapture(const std::string& command, std::string& out);

} // namespace deployer
