#include "System/ProcessRunner.hpp"
#include <array>
#include <cstdio>
#include <sys/wait.h>
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"

std::string ProcessRunner::quote(std::string_view arg) {
    std::string quoted{"'"};
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += '\'';
    return quoted;
}

std::string ProcessRunner::toShellCommand(const std::vector<std::string>& argv) {
    std::string cmd;
    for (const auto& arg : argv) {
        if (!cmd.empty()) cmd += ' ';
        cmd += quote(arg);
    }
    return cmd;
}

Result<CmdResult> ProcessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) return toolError("empty command line");

    const std::string cmd = toShellCommand(argv);
    VLOG_DEBUG("exec: {}", cmd);

    FILE* pipe = popen((cmd + " 2>&1").c_str(), "r");
    if (pipe == nullptr) {
        VLOG_ERROR("exec popen failed for `{}`", cmd);
        return toolError("popen failed for " + argv.front());
    }

    CmdResult result;
    std::array<char, 1024> buffer{};
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        result.output += buffer.data();
    }

    const int status = pclose(pipe);
    if (status == -1) return toolError("pclose failed for " + argv.front());
    result.code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return result;
}
