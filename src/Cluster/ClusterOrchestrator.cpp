#include "Cluster/ClusterOrchestrator.hpp"
#include <format>
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include "Utils/NetworkAddress.hpp"

namespace {

ResolverSettings resolverSettings(const ClusterConfig& cfg) {
    return ResolverSettings{cfg.hostsDir, cfg.dnsDir, cfg.hypervisorNetworkService, cfg.settleDelay};
}

} // namespace

ClusterOrchestrator::ClusterOrchestrator(ClusterConfig cfg, OrchestratorBackends backends)
    : config(std::move(cfg)),
      backends(std::move(backends)),
      networks(this->backends.network),
      driver(this->backends.domains),
      dhcp(this->backends.network),
      dns(resolverSettings(config), this->backends.services, this->backends.sleeper),
      poller(this->backends.domains, this->backends.ssh, this->backends.sleeper,
             CONCURRENCY::RetryPolicy{config.pollInterval, config.maxPollAttempts}) {}

void ClusterOrchestrator::advance(ProvisionStage next) {
    VLOG_INFO("Cluster {}: {} -> {}", config.clusterName, toString(state_.stage), toString(next));
    state_.stage = next;
}

Result<void> ClusterOrchestrator::checkConfig() const {
    auto valid = config.validate();
    if (valid.isErr()) return propagate("invalid configuration", valid.error());
    return {};
}

std::optional<std::string> ClusterOrchestrator::configuredNetworkName() const {
    if (config.networkOctet && !config.networkOctet->empty()) {
        if (auto octet = NetworkAddress::parseOctet(*config.networkOctet)) {
            return VirtualNetworkManager::networkNameFor(*octet);
        }
        return std::nullopt;
    }
    if (config.networkName && !config.networkName->empty()) return config.networkName;
    return std::nullopt;
}

Result<VirtualNetwork> ClusterOrchestrator::ensureNetwork() {
    if (auto valid = checkConfig(); valid.isErr()) return Err(valid.error());

    auto net = networks.ensureNetwork(config.networkOctet, config.networkName);
    if (net.isErr()) return propagate("network setup", net.error());

    state_.network = net.value();
    advance(ProvisionStage::NetworkReady);
    return net;
}

Result<LeaseRecord> ClusterOrchestrator::address(const NodeSpec& spec, std::string_view network) {
    auto lease = poller.waitForLease(spec.name);
    if (lease.isErr()) return Err(lease.error());

    auto pinned = dhcp.reserve(network, lease.value());
    if (pinned.isErr()) return Err(pinned.error());

    auto published = dns.publishHost(config.clusterName, lease.value().ip, spec.hostnames);
    if (published.isErr()) return Err(published.error());
    return lease;
}

Result<void> ClusterOrchestrator::bootInstalled(const NodeSpec& spec) {
    auto installed = poller.waitForPowerOff(spec.name);
    if (installed.isErr()) return installed;
    return driver.start(spec.name);
}

Result<LeaseRecord> ClusterOrchestrator::provisionLoadBalancer(const VirtualNetwork& network) {
    if (auto valid = checkConfig(); valid.isErr()) return Err(valid.error());

    NodeSpecBuilder builder(config, network.name);
    const auto spec = builder.loadBalancer();
    VLOG_INFO("Provisioning load balancer {}", spec.name);

    if (spec.customization) {
        auto res = backends.customizer->customize(spec.disk.path, *spec.customization);
        if (res.isErr()) return propagate(std::format("image customization of {}", spec.name), res.error());
    }

    if (auto res = driver.create(spec); res.isErr()) {
        return propagate(std::format("{} stage, {}", toString(ProvisionStage::LBCreated), spec.name), res.error());
    }
    advance(ProvisionStage::LBCreated);

    auto lease = address(spec, network.name);
    if (lease.isErr()) {
        return propagate(std::format("{} stage, {}", toString(ProvisionStage::LBAddressed), spec.name), lease.error());
    }
    const auto& ip = lease.value().ip;

    if (auto res = dns.writeResolverFragment(config.clusterName, config.baseDomain, ip); res.isErr()) {
        return propagate(std::format("{} stage, resolver fragment", toString(ProvisionStage::LBAddressed)), res.error());
    }
    if (auto res = dns.reloadResolver(); res.isErr()) {
        return propagate(std::format("{} stage, resolver reload", toString(ProvisionStage::LBAddressed)), res.error());
    }
    state_.loadBalancer = ProvisionedNode{spec, lease.value()};
    advance(ProvisionStage::LBAddressed);

    auto reachable = poller.waitForSsh(ip, spec.primaryHostname(), config.sshKey, config.lbSshUser);
    if (reachable.isErr()) {
        return propagate(std::format("{} stage, {}", toString(ProvisionStage::LBReachable), spec.name), reachable.error());
    }
    advance(ProvisionStage::LBReachable);
    return lease;
}

Result<void> ClusterOrchestrator::provisionCohort(const VirtualNetwork& network, std::string_view installServer) {
    if (auto valid = checkConfig(); valid.isErr()) return valid;
    if (installServer.empty()) return configError("the cohort needs an install server address");

    NodeSpecBuilder builder(config, network.name);
    const auto nodes = builder.cohort(installServer);
    VLOG_INFO("Creating {} cluster nodes, installing from {}", nodes.size(), installServer);

    for (const auto& spec : nodes) {
        if (auto res = driver.create(spec); res.isErr()) {
            return propagate(std::format("{} stage, {}", toString(ProvisionStage::NodesCreated), spec.name), res.error());
        }
        state_.created.push_back(spec);
    }
    advance(ProvisionStage::NodesCreated);

    for (const auto& spec : nodes) {
        auto lease = address(spec, network.name);
        if (lease.isErr()) {
            return propagate(std::format("{} stage, {}", toString(ProvisionStage::NodesAddressed), spec.name), lease.error());
        }
        state_.addressed.push_back(ProvisionedNode{spec, lease.value()});
    }

    if (auto res = dns.reloadResolver(); res.isErr()) {
        return propagate(std::format("{} stage, resolver reload", toString(ProvisionStage::NodesAddressed)), res.error());
    }
    advance(ProvisionStage::NodesAddressed);

    for (const auto& spec : nodes) {
        if (auto res = bootInstalled(spec); res.isErr()) {
            return propagate(std::format("{} stage, {}", toString(ProvisionStage::BootstrapReachable), spec.name),
                             res.error());
        }
    }

    const auto& bootstrap = state_.addressed.front();
    auto reachable = poller.waitForSsh(bootstrap.lease.ip, bootstrap.spec.primaryHostname(),
                                       config.sshKey, config.nodeSshUser);
    if (reachable.isErr()) {
        return propagate(std::format("{} stage, {}", toString(ProvisionStage::BootstrapReachable), bootstrap.spec.name),
                         reachable.error());
    }
    advance(ProvisionStage::BootstrapReachable);
    return {};
}

Result<void> ClusterOrchestrator::provision() {
    auto network = ensureNetwork();
    if (network.isErr()) return Err(network.error());

    auto lb = provisionLoadBalancer(network.value());
    if (lb.isErr()) return Err(lb.error());

    return provisionCohort(network.value(), lb.value().ip);
}

Result<void> ClusterOrchestrator::teardown(bool removeStorage) {
    if (config.clusterName.empty()) return configError("cluster name must not be empty");

    const auto networkName = configuredNetworkName();
    NodeSpecBuilder builder(config, networkName.value_or(""));
    // install server only feeds kernel arguments, which teardown never uses
    const auto nodes = builder.allNodes("");
    VLOG_INFO("Destroying cluster {} ({} possible VMs)", config.clusterName, nodes.size());

    std::vector<std::string> names;
    for (const auto& spec : nodes) {
        names.push_back(spec.name);
        if (auto res = driver.destroy(spec.name); res.isErr()) return propagate("teardown", res.error());
        if (removeStorage) {
            if (auto res = driver.discardDisk(spec.disk); res.isErr()) return propagate("teardown", res.error());
        }
    }

    if (networkName) {
        auto found = backends.network->lookup(*networkName);
        if (found.isErr()) return propagate("teardown", found.error());
        if (found.value()) {
            auto released = dhcp.release(*networkName, names);
            if (released.isErr()) return propagate("teardown", released.error());
            VLOG_INFO("Removed {} DHCP reservations from {}", released.value(), *networkName);
        } else {
            VLOG_WARN("Network {} does not exist, no DHCP reservations to remove", *networkName);
        }
    }

    if (auto res = dns.removeClusterRecords(config.clusterName); res.isErr()) return propagate("teardown", res.error());
    if (auto res = dns.reloadResolver(); res.isErr()) return propagate("teardown", res.error());

    state_ = ClusterState{};
    VLOG_INFO("Cluster {} destroyed", config.clusterName);
    return {};
}
