#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Cluster/NodeSpec.hpp"
#include "Virtualization/network/VirtualNetworkManager.hpp"

// Forward-only; the load balancer and cohort tracks each advance through their own stages.
enum class ProvisionStage {
    Initial,
    NetworkReady,
    LBCreated,
    LBAddressed,
    LBReachable,
    NodesCreated,
    NodesAddressed,
    BootstrapReachable
};

[[nodiscard]] constexpr std::string_view toString(ProvisionStage stage) noexcept {
    switch (stage) {
        case ProvisionStage::Initial:            return "Initial";
        case ProvisionStage::NetworkReady:       return "NetworkReady";
        case ProvisionStage::LBCreated:          return "LBCreated";
        case ProvisionStage::LBAddressed:        return "LBAddressed";
        case ProvisionStage::LBReachable:        return "LBReachable";
        case ProvisionStage::NodesCreated:       return "NodesCreated";
        case ProvisionStage::NodesAddressed:     return "NodesAddressed";
        case ProvisionStage::BootstrapReachable: return "BootstrapReachable";
    }
    return "Unknown";
}

struct ProvisionedNode {
    NodeSpec spec;
    LeaseRecord lease;
};

// In-memory only; dropped when the process exits.
struct ClusterState {
    std::optional<VirtualNetwork> network;
    std::optional<ProvisionedNode> loadBalancer;
    std::vector<NodeSpec> created;            // cohort nodes defined so far, creation order
    std::vector<ProvisionedNode> addressed;   // cohort nodes with a pinned lease, addressing order
    ProvisionStage stage{ProvisionStage::Initial};
};
