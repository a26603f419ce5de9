#pragma once
#include <memory>
#include <string_view>
#include "Cluster/ClusterConfig.hpp"
#include "Cluster/ClusterState.hpp"
#include "Cluster/NodeSpecBuilder.hpp"
#include "Core/concurrency/ReadinessPoller.hpp"
#include "Core/concurrency/Sleeper.hpp"
#include "Core/interfaces/IDomainBackend.hpp"
#include "Core/interfaces/IImageCustomizer.hpp"
#include "Core/interfaces/INetworkBackend.hpp"
#include "Core/interfaces/IServiceController.hpp"
#include "Core/interfaces/ISshProber.hpp"
#include "System/NameResolutionSynchronizer.hpp"
#include "Utils/Result.hpp"
#include "Virtualization/network/DhcpPinner.hpp"
#include "Virtualization/network/VirtualNetworkManager.hpp"
#include "Virtualization/vmm/VirtualMachineDriver.hpp"

struct OrchestratorBackends {
    std::shared_ptr<INetworkBackend> network;
    std::shared_ptr<IDomainBackend> domains;
    std::shared_ptr<IServiceController> services;
    std::shared_ptr<ISshProber> ssh;
    std::shared_ptr<IImageCustomizer> customizer;
    std::shared_ptr<CONCURRENCY::ISleeper> sleeper;
};

/**
 * @brief Sequences cluster provisioning on a single thread
 *
 * Load balancer track: customize image, create, wait for lease, pin it,
 * publish names, write the resolver fragment, reload, wait for SSH.
 *
 * Cohort track: create bootstrap, masters and workers in that order, then
 * address each of them in the same order and reload the resolver once. Each
 * node then gets its installer run to the end (the guest powers off) and is
 * started from its disk; SSH on the bootstrap node ends the track.
 *
 * The first error aborts the run. Nothing already created is rolled back;
 * teardown() is the explicit cleanup.
 */
class ClusterOrchestrator {
public:
    ClusterOrchestrator(ClusterConfig config, OrchestratorBackends backends);

    [[nodiscard]] Result<VirtualNetwork> ensureNetwork();
    [[nodiscard]] Result<LeaseRecord> provisionLoadBalancer(const VirtualNetwork& network);
    [[nodiscard]] Result<void> provisionCohort(const VirtualNetwork& network, std::string_view installServer);

    // network, then the load balancer, then the cohort installed from the load balancer
    [[nodiscard]] Result<void> provision();

    [[nodiscard]] Result<void> teardown(bool removeStorage);

    [[nodiscard]] const ClusterState& state() const noexcept { return state_; }
    [[nodiscard]] ProvisionStage stage() const noexcept { return state_.stage; }

private:
    // lease, DHCP pin and hosts record for one node
    [[nodiscard]] Result<LeaseRecord> address(const NodeSpec& spec, std::string_view network);
    // waits for the installer to power the node off, then boots the installed system
    [[nodiscard]] Result<void> bootInstalled(const NodeSpec& spec);
    [[nodiscard]] Result<void> checkConfig() const;
    [[nodiscard]] std::optional<std::string> configuredNetworkName() const;
    void advance(ProvisionStage next);

    const ClusterConfig config;
    OrchestratorBackends backends;

    VirtualNetworkManager networks;
    VirtualMachineDriver driver;
    DhcpPinner dhcp;
    NameResolutionSynchronizer dns;
    CONCURRENCY::ReadinessPoller poller;

    ClusterState state_;
};
