#include "process.h"
#include "errors.h"

#include <array>
#include <cstdio>
#include <sys/wait.h>

namespace storyforge {

// Keeps error messages readable when a tool dumps a long log.
static constexpr size_t kMaxReportedOutput = 2000;

std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string command_line(const std::vector<std::string>& argv) {
    std::string cmd;
    for (const auto& arg : argv) {
        if (!cmd.empty()) cmd += ' ';
        cmd += shell_quote(arg);
    }
    return cmd;
}

std::string run_command(const std::vector<std::string>& argv) {
    const std::string tool = argv.empty() ? std::string("<empty command>") : argv.front();
    if (argv.empty()) {
        throw ExternalToolFailure(tool, -1, "");
    }

    const std::string cmd = command_line(argv) + " 2>&1";
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw ExternalToolFailure(tool, -1, "could not start process");
    }

    std::array<char, 4096> buf;
    std::string output;
    while (fgets(buf.data(), buf.size(), pipe)) {
        output += buf.data();
    }

    int status = pclose(pipe);
    int code = -1;
    if (status != -1 && WIFEXITED(status)) {
        code = WEXITSTATUS(status);
    }
    if (code != 0) {
        if (output.size() > kMaxReportedOutput) {
            output = "..." + output.substr(output.size() - kMaxReportedOutput);
        }
        while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
            output.pop_back();
        }
        throw ExternalToolFailure(tool, code, output);
    }
    return output;
}

} // namespace storyforge
