#include "util/process.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/wait.h>

namespace deployer {

std::string ShellQuote(std::string_view arg) {
    std::string out;
    out.reserve(arg.size() + 2);
    out.push_back('\'');
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

Result RunCommandCapture(const std::string& command, std::string& out) {
    out.clear();
    FILE* pipe = ::popen(command.c_str(), "r");
    if (!pipe) {
        const int err = errno;
        return Result::Fail(err, "popen failed: " + std::string(std::strerror(err)));
    }

    char buffer[4096];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        out.append(buffer, n);
    }

    const int status = ::pclose(pipe);
    if (status == -1) {
        const int err = errno;
        return Result::Fail(err, "pclose failed: " + std::string(std::strerror(err)));
    }
    if (!WIFEXITED(status)) {
        return Result::Fail(-1, "command terminated abnormally: " + command);
    }
    if (WEXITSTATUS(status) != 0) {
        return Result::Fail(WEXITSTATUS(status),
                            "command exited with status " + std::to_string(WEXITSTATUS(status)) + ": " + command);
    }
    return Result::Ok();
}

} // namespace deployer
