#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>
#include "Cluster/NodeSpec.hpp"
#include "Core/concurrency/Sleeper.hpp"
#include "Core/interfaces/IDomainBackend.hpp"
#include "Core/interfaces/ISshProber.hpp"
#include "Utils/Result.hpp"

namespace CONCURRENCY {

struct RetryPolicy {
    std::chrono::milliseconds interval{std::chrono::seconds(5)};
    std::optional<std::size_t> maxAttempts;   // nullopt: wait forever
};

/**
 * @brief Fixed-delay readiness gates
 *
 * Both waits query first and sleep only between attempts, so N "not ready"
 * answers followed by success cost exactly N intervals. A hard error from the
 * lease query ends the wait immediately; only "not ready yet" is retried.
 */
class ReadinessPoller {
public:
    ReadinessPoller(std::shared_ptr<IDomainBackend> domains,
                    std::shared_ptr<ISshProber> ssh,
                    std::shared_ptr<ISleeper> sleeper,
                    RetryPolicy policy = {});

    [[nodiscard]] Result<LeaseRecord> waitForLease(std::string_view vmName);

    // until the domain is shut off, e.g. after its installer has powered it down
    [[nodiscard]] Result<void> waitForPowerOff(std::string_view vmName);

    [[nodiscard]] Result<void> waitForSsh(std::string_view ip,
                                          std::string_view hostname,
                                          std::string_view keyPath,
                                          std::string_view user);

    // first IPv4 address on an interface with a hardware address
    [[nodiscard]] static std::optional<LeaseRecord> selectLease(std::string_view vmName,
                                                                const std::vector<InterfaceAddresses>& interfaces);

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

private:
    [[nodiscard]] bool exhausted(std::size_t attempts) const noexcept;

    std::shared_ptr<IDomainBackend> domains_;
    std::shared_ptr<ISshProber> ssh_;
    std::shared_ptr<ISleeper> sleeper_;
    RetryPolicy policy_;
};

} // namespace CONCURRENCY
