#pragma once
#include <string>
#include <vector>
#include "Utils/Result.hpp"

struct CmdResult {
    std::string output;   // stdout and stderr combined
    int code{0};
};

class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    // error only when the process could not be launched; a non-zero exit is a CmdResult
    [[nodiscard]] virtual Result<CmdResult> run(const std::vector<std::string>& argv) = 0;
};
