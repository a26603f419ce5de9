#pragma once
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "Cluster/NodeSpec.hpp"
#include "Core/concurrency/Sleeper.hpp"
#include "Core/interfaces/IServiceController.hpp"
#include "Utils/Result.hpp"

struct ResolverSettings {
    std::filesystem::path hostsDir{"/etc"};
    std::filesystem::path dnsDir{"/etc/NetworkManager/dnsmasq.d"};
    std::string hypervisorNetworkService{"virtnetworkd"};
    std::chrono::milliseconds settleDelay{std::chrono::seconds(5)};
};

/**
 * @brief Keeps the host-side dnsmasq view of a cluster in step with its VMs
 *
 * Host mappings go to <hostsDir>/hosts.<cluster>, one line per published
 * node. The file is append-only: publishing the same host twice leaves two
 * lines. The dnsmasq fragment <dnsDir>/<cluster>.conf points dnsmasq at
 * that file and adds the wildcard apps record.
 */
class NameResolutionSynchronizer {
public:
    NameResolutionSynchronizer(ResolverSettings settings,
                               std::shared_ptr<IServiceController> services,
                               std::shared_ptr<CONCURRENCY::ISleeper> sleeper);

    [[nodiscard]] Result<void> publishHost(std::string_view clusterName,
                                           std::string_view ip,
                                           const std::vector<std::string>& hostnames);

    [[nodiscard]] Result<void> writeResolverFragment(std::string_view clusterName,
                                                     std::string_view baseDomain,
                                                     std::string_view appsAddress);

    // restart/reload the resolver, settle, then restart the hypervisor network daemon
    [[nodiscard]] Result<void> reloadResolver(std::string_view serviceName);
    [[nodiscard]] Result<void> reloadResolver();

    // removes hosts.<cluster> and <cluster>.conf; missing files are fine
    [[nodiscard]] Result<void> removeClusterRecords(std::string_view clusterName);

    [[nodiscard]] std::filesystem::path hostsFile(std::string_view clusterName) const;
    [[nodiscard]] std::filesystem::path fragmentFile(std::string_view clusterName) const;

    // "/etc/NetworkManager/dnsmasq.d" -> NetworkManager, anything else -> dnsmasq
    [[nodiscard]] static std::string resolverServiceFor(const std::filesystem::path& dnsDir);

    [[nodiscard]] static std::string formatHostsLine(const DnsEntry& entry);

private:
    ResolverSettings settings;
    std::shared_ptr<IServiceController> services;
    std::shared_ptr<CONCURRENCY::ISleeper> sleeper;
};
