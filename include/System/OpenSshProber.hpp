#pragma once
#include <filesystem>
#include <memory>
#include <string_view>
#include "Core/interfaces/ICommandRunner.hpp"
#include "Core/interfaces/ISshProber.hpp"

/**
 * @brief SSH reachability through the OpenSSH client tools
 *
 * Host keys are purged with `ssh-keygen -R`; the probe runs `true` on the
 * remote side in batch mode so that a missing key or password prompt fails
 * instead of blocking.
 */
class OpenSshProber : public ISshProber {
public:
    OpenSshProber(std::shared_ptr<ICommandRunner> runner, std::filesystem::path knownHosts);

    [[nodiscard]] Result<void> purgeHostKey(std::string_view host) override;
    [[nodiscard]] Result<void> probe(std::string_view user,
                                     std::string_view address,
                                     std::string_view keyPath) override;

private:
    std::shared_ptr<ICommandRunner> runner;
    std::filesystem::path knownHosts;
};
