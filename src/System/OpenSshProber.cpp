#include "System/OpenSshProber.hpp"
#include <format>
#include <string>
#include <system_error>
#include "Utils/Exception.hpp"

OpenSshProber::OpenSshProber(std::shared_ptr<ICommandRunner> runner, std::filesystem::path knownHosts)
    : runner(std::move(runner)), knownHosts(std::move(knownHosts)) {}

Result<void> OpenSshProber::purgeHostKey(std::string_view host) {
    std::error_code ec;
    if (!std::filesystem::exists(knownHosts, ec)) {
        // nothing cached yet
        return {};
    }

    auto res = runner->run({"ssh-keygen", "-f", knownHosts.string(), "-R", std::string(host)});
    if (res.isErr()) return Failure<std::string>{res.error()};
    if (res.value().code != 0) {
        return toolError(std::format("ssh-keygen -R {} failed (exit {}): {}", host, res.value().code, res.value().output));
    }
    return {};
}

Result<void> OpenSshProber::probe(std::string_view user, std::string_view address, std::string_view keyPath) {
    auto res = runner->run({"ssh",
                            "-i", std::string(keyPath),
                            "-o", "StrictHostKeyChecking=no",
                            "-o", "BatchMode=yes",
                            "-o", "ConnectTimeout=10",
                            "-o", "UserKnownHostsFile=" + knownHosts.string(),
                            std::format("{}@{}", user, address),
                            "true"});
    if (res.isErr()) return Failure<std::string>{res.error()};
    if (res.value().code != 0) {
        return toolError(std::format("ssh {}@{} exited {}", user, address, res.value().code));
    }
    return {};
}
