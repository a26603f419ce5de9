#pragma once
#include <memory>
#include <string_view>
#include "Core/interfaces/ICommandRunner.hpp"
#include "Core/interfaces/IServiceController.hpp"

class SystemdServiceController : public IServiceController {
public:
    explicit SystemdServiceController(std::shared_ptr<ICommandRunner> runner);

    [[nodiscard]] Result<bool> isActive(std::string_view service) override;
    [[nodiscard]] Result<bool> isEnabled(std::string_view service) override;

    [[nodiscard]] Result<void> start(std::string_view service) override;
    [[nodiscard]] Result<void> stop(std::string_view service) override;
    [[nodiscard]] Result<void> restart(std::string_view service) override;
    [[nodiscard]] Result<void> reload(std::string_view service) override;

private:
    [[nodiscard]] Result<void> control(std::string_view verb, std::string_view service);
    [[nodiscard]] Result<std::string> query(std::string_view verb, std::string_view service);

    std::shared_ptr<ICommandRunner> runner;
};
