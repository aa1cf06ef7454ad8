#pragma once

#include <string>
#include <vector>

namespace storyforge {

// Quotes one argument for /bin/sh using single quotes.
std::string shell_quote(const std::string& arg);

// Joins argv into a shell command line, each argument quoted.
std::string command_line(const std::vector<std::string>& argv);

// Runs argv[0] with the given arguments and waits for it to exit.
// Returns combined stdout/stderr. Throws ExternalToolFailure when the
// command cannot be started or exits non-zero.
std::string run_command(const std::vector<std::string>& argv);

} // namespace storyforge
