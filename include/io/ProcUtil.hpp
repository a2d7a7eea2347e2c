#pragma once
#include <string>

namespace procutil {

// Runs a command line through /bin/sh and returns its captured stdout.
// Returns "" when the command cannot be started or exits non-zero.
std::string run_capture_stdout(const std::string& cmdline);

// Runs a command line and returns its exit code (-1 when it cannot be started).
int run_wait_exitcode(const std::string& cmdline);

// Single-quotes `arg` for /bin/sh.
std::string shell_quote(const std::string& arg);

} // namespace procutil
