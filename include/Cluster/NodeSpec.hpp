#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Virtualization/vm/VirtualMachineDisk.hpp"

enum class NodeRole { Bootstrap, Master, Worker, LoadBalancer };

[[nodiscard]] constexpr std::string_view toString(NodeRole role) noexcept {
    switch (role) {
        case NodeRole::Bootstrap:    return "bootstrap";
        case NodeRole::Master:       return "master";
        case NodeRole::Worker:       return "worker";
        case NodeRole::LoadBalancer: return "load-balancer";
    }
    return "unknown";
}

// Direct kernel boot used by install-time roles
struct BootSource {
    std::string kernel;
    std::string initrd;
    std::string kernelArgs;
};

// virt-customize directives; only the load balancer carries them
struct ImageCustomization {
    std::string sshPubKeyFile;
    std::vector<std::string> install;
    std::vector<std::string> uninstall;
    std::vector<std::string> copyIn;      // "source:destination"
    std::vector<std::string> runCommands;
    bool selinuxRelabel{false};
};

struct NodeSpec {
    NodeRole role{NodeRole::Worker};
    unsigned ordinal{0};                  // 1..N for master/worker, 0 otherwise
    std::string name;                     // libvirt domain name
    std::vector<std::string> hostnames;   // FQDNs published for the node, primary first
    unsigned cpus{0};
    unsigned long memoryMiB{0};
    VirtualMachineDisk disk;
    std::string network;
    std::optional<BootSource> boot;
    std::optional<ImageCustomization> customization;

    [[nodiscard]] const std::string& primaryHostname() const { return hostnames.front(); }
};

struct LeaseRecord {
    std::string vmName;
    std::string mac;
    std::string ip;
};

struct DnsEntry {
    std::string ip;
    std::vector<std::string> hostnames;
};
