#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "Cluster/ClusterConfig.hpp"
#include "Cluster/NodeSpec.hpp"

/**
 * @brief Derives per-node VM definitions from the cluster configuration
 *
 * Domain names are <cluster>-bootstrap, <cluster>-master-<i>,
 * <cluster>-worker-<i> and <cluster>-lb; each install-time node gets its
 * own <vmDir>/<domain>.qcow2 disk. installServer is the host that serves
 * the RHCOS image and the ignition files over HTTP (the load balancer).
 */
class NodeSpecBuilder {
public:
    NodeSpecBuilder(const ClusterConfig& config, std::string network);

    [[nodiscard]] NodeSpec bootstrap(std::string_view installServer) const;
    [[nodiscard]] NodeSpec master(unsigned index, std::string_view installServer) const;
    [[nodiscard]] NodeSpec worker(unsigned index, std::string_view installServer) const;
    [[nodiscard]] NodeSpec loadBalancer() const;

    // bootstrap, masters 1..N, workers 1..M
    [[nodiscard]] std::vector<NodeSpec> cohort(std::string_view installServer) const;

    // every domain this cluster may own, load balancer included
    [[nodiscard]] std::vector<NodeSpec> allNodes(std::string_view installServer) const;

    [[nodiscard]] static std::string domainName(std::string_view cluster, NodeRole role, unsigned index = 0);

    [[nodiscard]] std::string kernelArgs(std::string_view installServer, std::string_view ignitionFile) const;

private:
    [[nodiscard]] NodeSpec installNode(NodeRole role, unsigned index, const NodeResources& res,
                                       std::string_view installServer) const;
    [[nodiscard]] std::string fqdn(std::string_view host) const;

    const ClusterConfig& config;
    std::string network;
};
