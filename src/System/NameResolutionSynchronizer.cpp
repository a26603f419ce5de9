#include "System/NameResolutionSynchronizer.hpp"
#include <format>
#include <fstream>
#include <system_error>
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"

namespace {
constexpr std::string_view kNetworkManager = "NetworkManager";
constexpr std::string_view kNetworkManagerDnsDir = "/etc/NetworkManager/dnsmasq.d";
}

NameResolutionSynchronizer::NameResolutionSynchronizer(ResolverSettings settings,
                                                       std::shared_ptr<IServiceController> services,
                                                       std::shared_ptr<CONCURRENCY::ISleeper> sleeper)
    : settings(std::move(settings)),
      services(std::move(services)),
      sleeper(std::move(sleeper)) {}

std::filesystem::path NameResolutionSynchronizer::hostsFile(std::string_view clusterName) const {
    return settings.hostsDir / std::format("hosts.{}", clusterName);
}

std::filesystem::path NameResolutionSynchronizer::fragmentFile(std::string_view clusterName) const {
    return settings.dnsDir / std::format("{}.conf", clusterName);
}

std::string NameResolutionSynchronizer::resolverServiceFor(const std::filesystem::path& dnsDir) {
    auto normal = dnsDir.lexically_normal();
    if (!normal.has_filename()) normal = normal.parent_path();
    if (normal == std::filesystem::path(kNetworkManagerDnsDir)) {
        return std::string(kNetworkManager);
    }
    return "dnsmasq";
}

std::string NameResolutionSynchronizer::formatHostsLine(const DnsEntry& entry) {
    std::string line = entry.ip;
    for (const auto& host : entry.hostnames) {
        line += ' ';
        line += host;
    }
    return line;
}

Result<void> NameResolutionSynchronizer::publishHost(std::string_view clusterName,
                                                     std::string_view ip,
                                                     const std::vector<std::string>& hostnames) {
    if (hostnames.empty()) return configError(std::format("no hostnames to publish for {}", ip));

    const auto path = hostsFile(clusterName);
    const auto line = formatHostsLine(DnsEntry{std::string(ip), hostnames});

    std::ofstream out(path, std::ios::app);
    if (!out) return ioError(std::format("failed to open hosts file {}", path.string()));
    out << line << '\n';
    out.flush();
    if (!out) return ioError(std::format("failed to write to hosts file {}", path.string()));

    VLOG_INFO("Published '{}' to {}", line, path.string());
    return {};
}

Result<void> NameResolutionSynchronizer::writeResolverFragment(std::string_view clusterName,
                                                               std::string_view baseDomain,
                                                               std::string_view appsAddress) {
    const auto path = fragmentFile(clusterName);
    std::ofstream out(path, std::ios::trunc);
    if (!out) return ioError(std::format("failed to open resolver fragment {}", path.string()));

    out << std::format("local=/{}.{}/\n", clusterName, baseDomain)
        << std::format("addn-hosts={}\n", hostsFile(clusterName).string())
        << std::format("address=/apps.{}.{}/{}\n", clusterName, baseDomain, appsAddress);
    out.flush();
    if (!out) return ioError(std::format("failed to write resolver fragment {}", path.string()));

    VLOG_INFO("Resolver fragment written to {}", path.string());
    return {};
}

Result<void> NameResolutionSynchronizer::reloadResolver(std::string_view serviceName) {
    auto res = serviceName == kNetworkManager ? services->reload(serviceName)
                                              : services->restart(serviceName);
    if (res.isErr()) {
        return propagate(std::format("failed to reload DNS service {}", serviceName), res.error());
    }

    sleeper->sleepFor(settings.settleDelay);

    res = services->restart(settings.hypervisorNetworkService);
    if (res.isErr()) {
        return propagate(std::format("failed to restart {}", settings.hypervisorNetworkService), res.error());
    }
    return {};
}

Result<void> NameResolutionSynchronizer::reloadResolver() {
    return reloadResolver(resolverServiceFor(settings.dnsDir));
}

Result<void> NameResolutionSynchronizer::removeClusterRecords(std::string_view clusterName) {
    for (const auto& path : {hostsFile(clusterName), fragmentFile(clusterName)}) {
        std::error_code ec;
        if (std::filesystem::remove(path, ec)) {
            VLOG_INFO("Removed {}", path.string());
        } else if (ec) {
            return ioError(std::format("failed to remove {}: {}", path.string(), ec.message()));
        }
    }
    return {};
}
