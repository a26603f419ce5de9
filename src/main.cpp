/*
 * ocp-kvm: provisions an OpenShift cluster on local libvirt/KVM
 */

#include <cstdlib>
#include <memory>
#include <string>
#include <gflags/gflags.h>
#include <nlohmann/json.hpp>
#include "Cluster/ClusterConfig.hpp"
#include "Cluster/ClusterOrchestrator.hpp"
#include "Core/concurrency/Sleeper.hpp"
#include "System/Logger.hpp"
#include "System/OpenSshProber.hpp"
#include "System/ProcessRunner.hpp"
#include "System/SystemdServiceController.hpp"
#include "System/VirtCustomize.hpp"
#include "Virtualization/network/LibvirtNetworkBackend.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include "Virtualization/vmm/LibvirtDomainBackend.hpp"

/*
 *    command line flags
 *
 *    flag names double as configuration file keys; a flag given on the
 *    command line wins over the file
 */
DEFINE_string(config, "", "JSON configuration file");

DEFINE_string(cluster_name, "ocp4", "OpenShift cluster name");
DEFINE_string(base_domain, "local", "cluster base domain");
DEFINE_string(libvirt_uri, "qemu:///system", "libvirt connection URI");
DEFINE_string(network_octet, "", "create or reuse network ocp-<octet> (192.168.<octet>.0/24)");
DEFINE_string(network_name, "", "use this existing libvirt network");

DEFINE_int32(masters, 3, "number of master nodes");
DEFINE_int32(workers, 2, "number of worker nodes");
DEFINE_int32(bootstrap_cpus, 4, "bootstrap vCPUs");
DEFINE_int64(bootstrap_memory_mib, 16000, "bootstrap memory in MiB");
DEFINE_int32(master_cpus, 4, "master vCPUs");
DEFINE_int64(master_memory_mib, 16000, "master memory in MiB");
DEFINE_int32(worker_cpus, 2, "worker vCPUs");
DEFINE_int64(worker_memory_mib, 8000, "worker memory in MiB");
DEFINE_int32(lb_cpus, 4, "load balancer vCPUs");
DEFINE_int64(lb_memory_mib, 1536, "load balancer memory in MiB");

DEFINE_int32(disk_size_gib, 50, "install disk size in GiB");
DEFINE_string(vm_dir, "/var/lib/libvirt/images", "directory of the VM disks (a libvirt pool target)");
DEFINE_string(install_dir, "rhcos-install", "directory holding the installer kernel and initramfs");
DEFINE_string(rhcos_image, "rhcos-metal.raw.gz", "RHCOS image served by the load balancer");
DEFINE_int32(web_server_port, 1234, "port of the load balancer web server");
DEFINE_string(lb_image, "", "load balancer disk image (default <vm_dir>/<cluster>-lb.qcow2)");

DEFINE_string(ssh_key, "sshkey", "SSH private key");
DEFINE_string(ssh_pub_key, "sshkey.pub", "SSH public key injected into the load balancer");
DEFINE_string(known_hosts, "", "known_hosts file (default ~/.ssh/known_hosts)");
DEFINE_string(dns_dir, "/etc/NetworkManager/dnsmasq.d", "dnsmasq configuration directory");
DEFINE_string(hosts_dir, "/etc", "directory of the per-cluster hosts file");

DEFINE_int64(poll_interval_seconds, 5, "delay between lease and SSH attempts");
DEFINE_uint64(max_poll_attempts, 0, "give up waiting after this many attempts (0 waits forever)");

DEFINE_string(log_level, "info", "console log level");
DEFINE_string(log_file, "logs/ocp-kvm.log", "rotating log file");

DEFINE_string(install_server, "", "create-nodes: host serving RHCOS and ignition (default lb.<cluster>.<domain>)");
DEFINE_bool(remove_storage, false, "destroy: also delete the VM disks");

namespace {

constexpr const char* kUsage =
    "usage: ocp-kvm <command> [flags]\n"
    "\n"
    "commands:\n"
    "  network       create or validate the cluster network\n"
    "  create-lb     provision the load balancer\n"
    "  create-nodes  provision bootstrap, masters and workers\n"
    "  provision     network, load balancer, then the cluster nodes\n"
    "  destroy       remove the cluster VMs, reservations and DNS records";

template <typename T>
void overlay(nlohmann::json& obj, const char* flag, const T& value) {
    if (!gflags::GetCommandLineFlagInfoOrDie(flag).is_default) obj[flag] = value;
}

nlohmann::json explicitFlags() {
    nlohmann::json obj = nlohmann::json::object();
    overlay(obj, "cluster_name", FLAGS_cluster_name);
    overlay(obj, "base_domain", FLAGS_base_domain);
    overlay(obj, "libvirt_uri", FLAGS_libvirt_uri);
    overlay(obj, "network_octet", FLAGS_network_octet);
    overlay(obj, "network_name", FLAGS_network_name);
    overlay(obj, "masters", FLAGS_masters);
    overlay(obj, "workers", FLAGS_workers);
    overlay(obj, "bootstrap_cpus", FLAGS_bootstrap_cpus);
    overlay(obj, "bootstrap_memory_mib", FLAGS_bootstrap_memory_mib);
    overlay(obj, "master_cpus", FLAGS_master_cpus);
    overlay(obj, "master_memory_mib", FLAGS_master_memory_mib);
    overlay(obj, "worker_cpus", FLAGS_worker_cpus);
    overlay(obj, "worker_memory_mib", FLAGS_worker_memory_mib);
    overlay(obj, "lb_cpus", FLAGS_lb_cpus);
    overlay(obj, "lb_memory_mib", FLAGS_lb_memory_mib);
    overlay(obj, "disk_size_gib", FLAGS_disk_size_gib);
    overlay(obj, "vm_dir", FLAGS_vm_dir);
    overlay(obj, "install_dir", FLAGS_install_dir);
    overlay(obj, "rhcos_image", FLAGS_rhcos_image);
    overlay(obj, "web_server_port", FLAGS_web_server_port);
    overlay(obj, "lb_image", FLAGS_lb_image);
    overlay(obj, "ssh_key", FLAGS_ssh_key);
    overlay(obj, "ssh_pub_key", FLAGS_ssh_pub_key);
    overlay(obj, "known_hosts", FLAGS_known_hosts);
    overlay(obj, "dns_dir", FLAGS_dns_dir);
    overlay(obj, "hosts_dir", FLAGS_hosts_dir);
    overlay(obj, "poll_interval_seconds", FLAGS_poll_interval_seconds);
    overlay(obj, "log_level", FLAGS_log_level);
    overlay(obj, "log_file", FLAGS_log_file);
    if (!gflags::GetCommandLineFlagInfoOrDie("max_poll_attempts").is_default) {
        obj["max_poll_attempts"] = FLAGS_max_poll_attempts == 0 ? nlohmann::json() : nlohmann::json(FLAGS_max_poll_attempts);
    }
    return obj;
}

std::expected<ClusterConfig, std::string> loadConfig() {
    ClusterConfig cfg;
    if (!FLAGS_config.empty()) {
        auto loaded = ClusterConfig::fromFile(FLAGS_config);
        if (!loaded) return std::unexpected(loaded.error());
        cfg = std::move(*loaded);
    }
    if (auto merged = cfg.merge(explicitFlags()); !merged) return std::unexpected(merged.error());

    if (cfg.networkOctet && cfg.networkOctet->empty()) cfg.networkOctet.reset();
    if (cfg.networkName && cfg.networkName->empty()) cfg.networkName.reset();
    if (!cfg.networkOctet && !cfg.networkName) cfg.networkName = "default";
    return cfg;
}

void initLogging(const ClusterConfig& cfg) {
    SafeLogger::Config logConfig;
    logConfig.console_level = spdlog::level::from_str(cfg.logLevel);
    logConfig.file_path = cfg.logFile;
    SafeLogger::reset();
    SafeLogger::initialize(logConfig);
}

int fail(std::string_view command, const std::string& error) {
    VLOG_CRITICAL("{} failed: {}", command, error);
    return EXIT_FAILURE;
}

} // namespace

int main(int argc, char** argv) {
    gflags::SetUsageMessage(kUsage);
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    if (argc != 2) {
        gflags::ShowUsageWithFlagsRestrict(argv[0], "main.cpp");
        return 2;
    }
    const std::string command = argv[1];

    auto cfg = loadConfig();
    if (!cfg) {
        SafeLogger::initialize();
        return fail(command, "[Config] " + cfg.error());
    }
    if (auto valid = cfg->validate(); valid.isErr()) {
        SafeLogger::initialize();
        return fail(command, valid.error());
    }
    initLogging(*cfg);

    auto conn = std::make_shared<HypervisorConnector>(cfg->libvirtUri);
    auto runner = std::make_shared<ProcessRunner>();
    OrchestratorBackends backends{
        std::make_shared<LibvirtNetworkBackend>(conn),
        std::make_shared<LibvirtDomainBackend>(conn),
        std::make_shared<SystemdServiceController>(runner),
        std::make_shared<OpenSshProber>(runner, cfg->knownHostsFile()),
        std::make_shared<VirtCustomize>(runner),
        std::make_shared<CONCURRENCY::AsioSleeper>()};
    ClusterOrchestrator orchestrator(*cfg, std::move(backends));

    VLOG_INFO("ocp-kvm {}: cluster {}, libvirt {}", command, cfg->clusterDomain(), cfg->libvirtUri);

    if (command == "network") {
        auto net = orchestrator.ensureNetwork();
        if (net.isErr()) return fail(command, net.error());
        VLOG_INFO("Network {} ready, bridge {}, gateway {}", net.value().name, net.value().bridge, net.value().gateway);
    } else if (command == "create-lb") {
        auto net = orchestrator.ensureNetwork();
        if (net.isErr()) return fail(command, net.error());
        auto lb = orchestrator.provisionLoadBalancer(net.value());
        if (lb.isErr()) return fail(command, lb.error());
        VLOG_INFO("Load balancer {} is up at {}", lb.value().vmName, lb.value().ip);
    } else if (command == "create-nodes") {
        auto net = orchestrator.ensureNetwork();
        if (net.isErr()) return fail(command, net.error());
        const std::string server = FLAGS_install_server.empty() ? "lb." + cfg->clusterDomain() : FLAGS_install_server;
        auto res = orchestrator.provisionCohort(net.value(), server);
        if (res.isErr()) return fail(command, res.error());
    } else if (command == "provision") {
        auto res = orchestrator.provision();
        if (res.isErr()) return fail(command, res.error());
    } else if (command == "destroy") {
        auto res = orchestrator.teardown(FLAGS_remove_storage);
        if (res.isErr()) return fail(command, res.error());
    } else {
        VLOG_ERROR("unknown command '{}'", command);
        gflags::ShowUsageWithFlagsRestrict(argv[0], "main.cpp");
        return 2;
    }

    VLOG_INFO("{} finished at stage {}", command, toString(orchestrator.stage()));
    gflags::ShutDownCommandLineFlags();
    return EXIT_SUCCESS;
}
