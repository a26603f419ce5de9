#include "Cluster/NodeSpecBuilder.hpp"
#include <filesystem>
#include <format>

NodeSpecBuilder::NodeSpecBuilder(const ClusterConfig& config, std::string network)
    : config(config), network(std::move(network)) {}

std::string NodeSpecBuilder::domainName(std::string_view cluster, NodeRole role, unsigned index) {
    switch (role) {
        case NodeRole::Bootstrap:    return std::format("{}-bootstrap", cluster);
        case NodeRole::Master:       return std::format("{}-master-{}", cluster, index);
        case NodeRole::Worker:       return std::format("{}-worker-{}", cluster, index);
        case NodeRole::LoadBalancer: return std::format("{}-lb", cluster);
    }
    return std::string(cluster);
}

std::string NodeSpecBuilder::fqdn(std::string_view host) const {
    return std::format("{}.{}", host, config.clusterDomain());
}

std::string NodeSpecBuilder::kernelArgs(std::string_view installServer, std::string_view ignitionFile) const {
    return std::format("nomodeset rd.neednet=1 coreos.inst=yes coreos.inst.install_dev={} "
                       "{}=http://{}:{}/{} coreos.inst.ignition_url=http://{}:{}/{}",
                       config.installDevice,
                       config.rhcosKernelArg, installServer, config.webServerPort, config.rhcosImage,
                       installServer, config.webServerPort, ignitionFile);
}

NodeSpec NodeSpecBuilder::installNode(NodeRole role, unsigned index, const NodeResources& res,
                                      std::string_view installServer) const {
    NodeSpec spec;
    spec.role = role;
    spec.ordinal = index;
    spec.name = domainName(config.clusterName, role, index);
    spec.cpus = static_cast<unsigned>(res.cpus);
    spec.memoryMiB = static_cast<unsigned long>(res.memoryMiB);
    spec.network = network;

    spec.disk.path = (std::filesystem::path(config.vmDir) / (spec.name + ".qcow2")).string();
    spec.disk.sizeGiB = static_cast<unsigned>(config.diskSizeGiB);

    const auto install = config.installPath();
    spec.boot = BootSource{(install / config.kernelFile).string(),
                           (install / config.initrdFile).string(),
                           kernelArgs(installServer, std::format("{}.ign", toString(role)))};
    return spec;
}

NodeSpec NodeSpecBuilder::bootstrap(std::string_view installServer) const {
    auto spec = installNode(NodeRole::Bootstrap, 0, config.bootstrap, installServer);
    spec.hostnames = {fqdn("bootstrap")};
    return spec;
}

NodeSpec NodeSpecBuilder::master(unsigned index, std::string_view installServer) const {
    auto spec = installNode(NodeRole::Master, index, config.master, installServer);
    spec.hostnames = {fqdn(std::format("master-{}", index)), fqdn(std::format("etcd-{}", index - 1))};
    return spec;
}

NodeSpec NodeSpecBuilder::worker(unsigned index, std::string_view installServer) const {
    auto spec = installNode(NodeRole::Worker, index, config.worker, installServer);
    spec.hostnames = {fqdn(std::format("worker-{}", index))};
    return spec;
}

NodeSpec NodeSpecBuilder::loadBalancer() const {
    NodeSpec spec;
    spec.role = NodeRole::LoadBalancer;
    spec.name = domainName(config.clusterName, NodeRole::LoadBalancer);
    spec.hostnames = {fqdn("lb"), fqdn("api"), fqdn("api-int")};
    spec.cpus = static_cast<unsigned>(config.loadBalancer.cpus);
    spec.memoryMiB = static_cast<unsigned long>(config.loadBalancer.memoryMiB);
    spec.network = network;
    // pre-built cloud image, customized in place
    spec.disk.path = config.loadBalancerImage();

    auto customization = config.lbCustomization;
    customization.sshPubKeyFile = config.sshPubKey;
    spec.customization = std::move(customization);
    return spec;
}

std::vector<NodeSpec> NodeSpecBuilder::cohort(std::string_view installServer) const {
    std::vector<NodeSpec> nodes;
    nodes.reserve(1 + static_cast<std::size_t>(config.masters) + static_cast<std::size_t>(config.workers));
    nodes.push_back(bootstrap(installServer));
    for (int i = 1; i <= config.masters; ++i) nodes.push_back(master(static_cast<unsigned>(i), installServer));
    for (int i = 1; i <= config.workers; ++i) nodes.push_back(worker(static_cast<unsigned>(i), installServer));
    return nodes;
}

std::vector<NodeSpec> NodeSpecBuilder::allNodes(std::string_view installServer) const {
    auto nodes = cohort(installServer);
    nodes.push_back(loadBalancer());
    return nodes;
}
