#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include "Cluster/NodeSpec.hpp"
#include "Utils/Result.hpp"

struct NodeResources {
    int cpus{0};
    long memoryMiB{0};
};

/**
 * @brief Cluster-wide parameters, built once and passed by const reference
 *
 * Loads from JSON whose keys are the snake_case field names
 * (cluster_name, masters, bootstrap_memory_mib, ...). Unknown keys are
 * rejected so that typos do not silently fall back to defaults.
 */
struct ClusterConfig {
    // upper bound for the poll interval and the settle delay
    static constexpr std::chrono::seconds maxDelay{std::chrono::hours(24)};

    std::string clusterName{"ocp4"};
    std::string baseDomain{"local"};
    std::string libvirtUri{"qemu:///system"};

    // mutually exclusive
    std::optional<std::string> networkOctet;
    std::optional<std::string> networkName;

    int masters{3};
    int workers{2};

    NodeResources bootstrap{4, 16000};
    NodeResources master{4, 16000};
    NodeResources worker{2, 8000};
    NodeResources loadBalancer{4, 1536};

    int diskSizeGiB{50};
    std::string vmDir{"/var/lib/libvirt/images"};

    // installer kernel and initramfs, relative paths are taken under vmDir
    std::string installDir{"rhcos-install"};
    std::string kernelFile{"vmlinuz"};
    std::string initrdFile{"initramfs.img"};
    std::string rhcosImage{"rhcos-metal.raw.gz"};
    std::string rhcosKernelArg{"coreos.inst.image_url"};
    int webServerPort{1234};
    std::string installDevice{"vda"};

    std::string lbImage;               // empty: <vmDir>/<cluster>-lb.qcow2
    std::string sshPubKey{"sshkey.pub"};
    std::string sshKey{"sshkey"};
    std::string knownHosts;            // empty: $HOME/.ssh/known_hosts
    std::string lbSshUser{"root"};
    std::string nodeSshUser{"core"};

    std::string dnsDir{"/etc/NetworkManager/dnsmasq.d"};
    std::string hostsDir{"/etc"};
    std::string hypervisorNetworkService{"virtnetworkd"};

    std::chrono::milliseconds pollInterval{std::chrono::seconds(5)};
    std::optional<std::size_t> maxPollAttempts;
    std::chrono::milliseconds settleDelay{std::chrono::seconds(5)};

    ImageCustomization lbCustomization{
        "",
        {"haproxy", "bind-utils"},
        {"cloud-init"},
        {"haproxy.cfg:/etc/haproxy", "bootstrap.ign:/opt/"},
        {"systemctl daemon-reload", "systemctl enable haproxy"},
        true};

    std::string logLevel{"info"};
    std::string logFile{"logs/ocp-kvm.log"};

    // [Config] error describing the first violated constraint
    [[nodiscard]] Result<void> validate() const;

    // <cluster>.<domain>
    [[nodiscard]] std::string clusterDomain() const;
    [[nodiscard]] std::string loadBalancerImage() const;
    [[nodiscard]] std::filesystem::path installPath() const;
    [[nodiscard]] std::string knownHostsFile() const;

    [[nodiscard]] static std::expected<ClusterConfig, std::string> fromJson(std::string_view text);
    [[nodiscard]] static std::expected<ClusterConfig, std::string> fromFile(const std::filesystem::path& path);

    // applies the keys present in obj on top of this config
    [[nodiscard]] std::expected<void, std::string> merge(const nlohmann::json& obj);
};
