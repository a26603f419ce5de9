#include "System/SystemdServiceController.hpp"
#include <format>
#include <string>
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"

namespace {

std::string trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

} // namespace

SystemdServiceController::SystemdServiceController(std::shared_ptr<ICommandRunner> runner)
    : runner(std::move(runner)) {}

Result<std::string> SystemdServiceController::query(std::string_view verb, std::string_view service) {
    auto res = runner->run({"systemctl", std::string(verb), std::string(service)});
    if (res.isErr()) return Failure<std::string>{res.error()};
    // is-active/is-enabled report "inactive"/"disabled" through a non-zero exit; the text is the answer
    return trim(res.value().output);
}

Result<bool> SystemdServiceController::isActive(std::string_view service) {
    auto state = query("is-active", service);
    if (state.isErr()) return Failure<std::string>{state.error()};
    return state.value() == "active";
}

Result<bool> SystemdServiceController::isEnabled(std::string_view service) {
    auto state = query("is-enabled", service);
    if (state.isErr()) return Failure<std::string>{state.error()};
    return state.value() == "enabled";
}

Result<void> SystemdServiceController::control(std::string_view verb, std::string_view service) {
    auto res = runner->run({"systemctl", std::string(verb), std::string(service)});
    if (res.isErr()) return Failure<std::string>{res.error()};

    const auto& out = res.value();
    if (out.code != 0) {
        return toolError(std::format("systemctl {} {} failed (exit {}): {}", verb, service, out.code, trim(out.output)));
    }
    VLOG_INFO("{} {} succeeded", service, verb);
    return {};
}

Result<void> SystemdServiceController::start(std::string_view service)   { return control("start", service); }
Result<void> SystemdServiceController::stop(std::string_view service)    { return control("stop", service); }
Result<void> SystemdServiceController::restart(std::string_view service) { return control("restart", service); }
Result<void> SystemdServiceController::reload(std::string_view service)  { return control("reload", service); }
