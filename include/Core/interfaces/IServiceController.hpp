#pragma once
#include <string_view>
#include "Utils/Result.hpp"

class IServiceController {
public:
    virtual ~IServiceController() = default;

    [[nodiscard]] virtual Result<bool> isActive(std::string_view service) = 0;
    [[nodiscard]] virtual Result<bool> isEnabled(std::string_view service) = 0;

    [[nodiscard]] virtual Result<void> start(std::string_view service) = 0;
    [[nodiscard]] virtual Result<void> stop(std::string_view service) = 0;
    [[nodiscard]] virtual Result<void> restart(std::string_view service) = 0;
    [[nodiscard]] virtual Result<void> reload(std::string_view service) = 0;
};
