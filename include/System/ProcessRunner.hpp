#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "Core/interfaces/ICommandRunner.hpp"

/**
 * @brief Runs host commands through popen with stderr folded into stdout
 */
class ProcessRunner : public ICommandRunner {
public:
    [[nodiscard]] Result<CmdResult> run(const std::vector<std::string>& argv) override;

    // single-quotes each argument for /bin/sh
    [[nodiscard]] static std::string toShellCommand(const std::vector<std::string>& argv);
    [[nodiscard]] static std::string quote(std::string_view arg);
};
