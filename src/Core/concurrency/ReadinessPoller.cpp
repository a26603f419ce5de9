#include "Core/concurrency/ReadinessPoller.hpp"
#include <format>
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include "Utils/NetworkAddress.hpp"

namespace CONCURRENCY {

ReadinessPoller::ReadinessPoller(std::shared_ptr<IDomainBackend> domains,
                                 std::shared_ptr<ISshProber> ssh,
                                 std::shared_ptr<ISleeper> sleeper,
                                 RetryPolicy policy)
    : domains_(std::move(domains)),
      ssh_(std::move(ssh)),
      sleeper_(std::move(sleeper)),
      policy_(policy) {}

bool ReadinessPoller::exhausted(std::size_t attempts) const noexcept {
    return policy_.maxAttempts && attempts >= *policy_.maxAttempts;
}

std::optional<LeaseRecord> ReadinessPoller::selectLease(std::string_view vmName,
                                                        const std::vector<InterfaceAddresses>& interfaces) {
    for (const auto& iface : interfaces) {
        if (iface.hwaddr.empty()) continue;
        for (const auto& addr : iface.addresses) {
            if (addr.family == InterfaceIp::Family::IPv4 && NetworkAddress::isIpv4(addr.address)) {
                return LeaseRecord{std::string(vmName), iface.hwaddr, addr.address};
            }
        }
    }
    return std::nullopt;
}

Result<LeaseRecord> ReadinessPoller::waitForLease(std::string_view vmName) {
    VLOG_INFO("Waiting for {} to obtain an IP address", vmName);
    std::size_t attempts = 0;
    for (;;) {
        auto res = domains_->interfaceAddresses(vmName);
        ++attempts;
        if (res.isErr()) {
            return propagate(std::format("lease query for {}", vmName), res.error());
        }

        if (auto lease = selectLease(vmName, res.value())) {
            VLOG_INFO("Obtained IP {} (MAC {}) for VM {}", lease->ip, lease->mac, vmName);
            return *lease;
        }

        if (exhausted(attempts)) {
            return timeoutError(std::format("{} has no IPv4 lease after {} attempts", vmName, attempts));
        }
        VLOG_DEBUG("No lease for {} yet (attempt {})", vmName, attempts);
        sleeper_->sleepFor(policy_.interval);
    }
}

Result<void> ReadinessPoller::waitForPowerOff(std::string_view vmName) {
    VLOG_INFO("Waiting for {} to power off", vmName);
    std::size_t attempts = 0;
    for (;;) {
        auto active = domains_->isActive(vmName);
        ++attempts;
        if (active.isErr()) return propagate(std::format("state query for {}", vmName), active.error());
        if (!active.value()) {
            VLOG_INFO("VM {} is shut off", vmName);
            return {};
        }

        if (exhausted(attempts)) {
            return timeoutError(std::format("{} still running after {} attempts", vmName, attempts));
        }
        VLOG_DEBUG("{} still running (attempt {})", vmName, attempts);
        sleeper_->sleepFor(policy_.interval);
    }
}

Result<void> ReadinessPoller::waitForSsh(std::string_view ip,
                                         std::string_view hostname,
                                         std::string_view keyPath,
                                         std::string_view user) {
    for (std::string_view host : {ip, hostname}) {
        VLOG_INFO("Removing old SSH host key for {}", host);
        auto purged = ssh_->purgeHostKey(host);
        if (purged.isErr()) return purged;
    }

    std::size_t attempts = 0;
    for (;;) {
        VLOG_INFO("Trying to establish SSH connection to {} ({})", hostname, ip);
        auto res = ssh_->probe(user, ip, keyPath);
        ++attempts;
        if (res.isOk()) {
            VLOG_INFO("SSH access to {} established", ip);
            return {};
        }

        if (exhausted(attempts)) {
            return timeoutError(std::format("SSH to {}@{} not reachable after {} attempts: {}",
                                            user, ip, attempts, res.error()));
        }
        VLOG_DEBUG("SSH access not available yet, retrying: {}", res.error());
        sleeper_->sleepFor(policy_.interval);
    }
}

} // namespace CONCURRENCY
