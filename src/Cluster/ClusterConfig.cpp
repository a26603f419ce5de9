#include "Cluster/ClusterConfig.hpp"
#include <cstdlib>
#include <format>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>
#include <stdexcept>
#include "spdlog/spdlog.h"
#include "Utils/Exception.hpp"
#include "Utils/NetworkAddress.hpp"

using nlohmann::json;

namespace {

using Setter = std::function<void(ClusterConfig&, const json&)>;

template <typename T>
Setter field(T ClusterConfig::*member) {
    return [member](ClusterConfig& cfg, const json& value) { cfg.*member = value.get<T>(); };
}

Setter resource(NodeResources ClusterConfig::*member, bool cpus) {
    return [member, cpus](ClusterConfig& cfg, const json& value) {
        if (cpus) (cfg.*member).cpus = value.get<int>();
        else (cfg.*member).memoryMiB = value.get<long>();
    };
}

std::chrono::seconds delaySeconds(const json& value) {
    const auto n = value.get<long long>();
    if (n < 0 || n > ClusterConfig::maxDelay.count()) {
        throw std::out_of_range(std::format("{} is outside 0..{} seconds", n, ClusterConfig::maxDelay.count()));
    }
    return std::chrono::seconds(n);
}

// octets are accepted as "100" or 100
std::string octetText(const json& value) {
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    return value.get<std::string>();
}

const std::map<std::string, Setter, std::less<>>& setters() {
    static const std::map<std::string, Setter, std::less<>> table{
        {"cluster_name", field(&ClusterConfig::clusterName)},
        {"base_domain", field(&ClusterConfig::baseDomain)},
        {"libvirt_uri", field(&ClusterConfig::libvirtUri)},
        {"network_octet", [](ClusterConfig& c, const json& v) { c.networkOctet = octetText(v); }},
        {"network_name", [](ClusterConfig& c, const json& v) { c.networkName = v.get<std::string>(); }},
        {"masters", field(&ClusterConfig::masters)},
        {"workers", field(&ClusterConfig::workers)},
        {"bootstrap_cpus", resource(&ClusterConfig::bootstrap, true)},
        {"bootstrap_memory_mib", resource(&ClusterConfig::bootstrap, false)},
        {"master_cpus", resource(&ClusterConfig::master, true)},
        {"master_memory_mib", resource(&ClusterConfig::master, false)},
        {"worker_cpus", resource(&ClusterConfig::worker, true)},
        {"worker_memory_mib", resource(&ClusterConfig::worker, false)},
        {"lb_cpus", resource(&ClusterConfig::loadBalancer, true)},
        {"lb_memory_mib", resource(&ClusterConfig::loadBalancer, false)},
        {"disk_size_gib", field(&ClusterConfig::diskSizeGiB)},
        {"vm_dir", field(&ClusterConfig::vmDir)},
        {"install_dir", field(&ClusterConfig::installDir)},
        {"kernel_file", field(&ClusterConfig::kernelFile)},
        {"initrd_file", field(&ClusterConfig::initrdFile)},
        {"rhcos_image", field(&ClusterConfig::rhcosImage)},
        {"rhcos_kernel_arg", field(&ClusterConfig::rhcosKernelArg)},
        {"web_server_port", field(&ClusterConfig::webServerPort)},
        {"install_device", field(&ClusterConfig::installDevice)},
        {"lb_image", field(&ClusterConfig::lbImage)},
        {"ssh_pub_key", field(&ClusterConfig::sshPubKey)},
        {"ssh_key", field(&ClusterConfig::sshKey)},
        {"known_hosts", field(&ClusterConfig::knownHosts)},
        {"lb_ssh_user", field(&ClusterConfig::lbSshUser)},
        {"node_ssh_user", field(&ClusterConfig::nodeSshUser)},
        {"dns_dir", field(&ClusterConfig::dnsDir)},
        {"hosts_dir", field(&ClusterConfig::hostsDir)},
        {"hypervisor_network_service", field(&ClusterConfig::hypervisorNetworkService)},
        {"poll_interval_seconds",
         [](ClusterConfig& c, const json& v) { c.pollInterval = delaySeconds(v); }},
        {"max_poll_attempts",
         [](ClusterConfig& c, const json& v) {
             if (v.is_null()) {
                 c.maxPollAttempts.reset();
                 return;
             }
             const auto n = v.get<long long>();
             if (n < 0) throw std::out_of_range(std::format("{} is negative", n));
             // 0 waits forever, as on the command line
             if (n == 0) c.maxPollAttempts.reset();
             else c.maxPollAttempts = static_cast<std::size_t>(n);
         }},
        {"settle_delay_seconds",
         [](ClusterConfig& c, const json& v) { c.settleDelay = delaySeconds(v); }},
        {"lb_install", [](ClusterConfig& c, const json& v) { c.lbCustomization.install = v.get<std::vector<std::string>>(); }},
        {"lb_uninstall", [](ClusterConfig& c, const json& v) { c.lbCustomization.uninstall = v.get<std::vector<std::string>>(); }},
        {"lb_copy_in", [](ClusterConfig& c, const json& v) { c.lbCustomization.copyIn = v.get<std::vector<std::string>>(); }},
        {"lb_run_commands", [](ClusterConfig& c, const json& v) { c.lbCustomization.runCommands = v.get<std::vector<std::string>>(); }},
        {"lb_selinux_relabel", [](ClusterConfig& c, const json& v) { c.lbCustomization.selinuxRelabel = v.get<bool>(); }},
        {"log_level", field(&ClusterConfig::logLevel)},
        {"log_file", field(&ClusterConfig::logFile)},
    };
    return table;
}

} // namespace

std::expected<void, std::string> ClusterConfig::merge(const json& obj) {
    if (!obj.is_object()) return std::unexpected(std::string("configuration must be a JSON object"));

    const auto& table = setters();
    for (const auto& [key, value] : obj.items()) {
        auto it = table.find(key);
        if (it == table.end()) return std::unexpected(std::format("unknown configuration key '{}'", key));
        try {
            it->second(*this, value);
        } catch (const json::exception& e) {
            return std::unexpected(std::format("bad value for '{}': {}", key, e.what()));
        } catch (const std::out_of_range& e) {
            return std::unexpected(std::format("bad value for '{}': {}", key, e.what()));
        }
    }
    return {};
}

std::expected<ClusterConfig, std::string> ClusterConfig::fromJson(std::string_view text) {
    json obj = json::parse(text.begin(), text.end(), nullptr, false);
    if (obj.is_discarded()) return std::unexpected(std::string("configuration is not valid JSON"));

    ClusterConfig cfg;
    if (auto merged = cfg.merge(obj); !merged) return std::unexpected(merged.error());
    return cfg;
}

std::expected<ClusterConfig, std::string> ClusterConfig::fromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) return std::unexpected(std::format("cannot open configuration file {}", path.string()));
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto cfg = fromJson(buffer.str());
    if (!cfg) return std::unexpected(std::format("{}: {}", path.string(), cfg.error()));
    return cfg;
}

Result<void> ClusterConfig::validate() const {
    if (clusterName.empty()) return configError("cluster name must not be empty");
    if (baseDomain.empty()) return configError("base domain must not be empty");
    if (masters < 1) return configError(std::format("at least one master is required, got {}", masters));
    if (workers < 0) return configError(std::format("worker count must not be negative, got {}", workers));

    const std::pair<std::string_view, const NodeResources*> roles[] = {
        {"bootstrap", &bootstrap}, {"master", &master}, {"worker", &worker}, {"load balancer", &loadBalancer}};
    for (const auto& [role, res] : roles) {
        if (res->cpus <= 0) return configError(std::format("{} vCPU count must be positive", role));
        if (res->memoryMiB <= 0) return configError(std::format("{} memory must be positive", role));
    }
    if (diskSizeGiB <= 0) return configError("disk size must be positive");

    const bool haveOctet = networkOctet && !networkOctet->empty();
    const bool haveName = networkName && !networkName->empty();
    if (haveOctet && haveName) {
        return configError("network octet and network name are mutually exclusive");
    }
    if (haveOctet && !NetworkAddress::parseOctet(*networkOctet)) {
        return configError(std::format("network octet '{}' is not a number in 0..255", *networkOctet));
    }
    if (pollInterval.count() <= 0) return configError("poll interval must be positive");
    if (pollInterval > maxDelay) return configError(std::format("poll interval is longer than {} s", maxDelay.count()));
    if (settleDelay.count() < 0 || settleDelay > maxDelay) {
        return configError(std::format("settle delay must be within 0..{} s", maxDelay.count()));
    }
    if (maxPollAttempts && *maxPollAttempts == 0) return configError("max poll attempts must be at least 1");
    // spdlog maps unknown names to "off"
    if (spdlog::level::from_str(logLevel) == spdlog::level::off && logLevel != "off") {
        return configError(std::format("unknown log level '{}'", logLevel));
    }
    if (webServerPort <= 0 || webServerPort > 65535) {
        return configError(std::format("web server port {} is out of range", webServerPort));
    }
    return {};
}

std::string ClusterConfig::clusterDomain() const {
    return std::format("{}.{}", clusterName, baseDomain);
}

std::string ClusterConfig::loadBalancerImage() const {
    if (!lbImage.empty()) return lbImage;
    return (std::filesystem::path(vmDir) / std::format("{}-lb.qcow2", clusterName)).string();
}

std::filesystem::path ClusterConfig::installPath() const {
    std::filesystem::path dir(installDir);
    return dir.is_absolute() ? dir : std::filesystem::path(vmDir) / dir;
}

std::string ClusterConfig::knownHostsFile() const {
    if (!knownHosts.empty()) return knownHosts;
    const char* home = std::getenv("HOME");
    return (std::filesystem::path(home ? home : "/root") / ".ssh" / "known_hosts").string();
}
