#include "Virtualization/network/DhcpPinner.hpp"
#include <algorithm>
#include <format>
#include <pugixml.hpp>
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include "Virtualization/builder/DhcpHostBuilder.hpp"

namespace {

std::string hostXml(const LeaseRecord& lease) {
    DhcpHostBuilder builder;
    builder.setMac(lease.mac).setIp(lease.ip).setName(lease.vmName);
    return builder.build();
}

} // namespace

DhcpPinner::DhcpPinner(std::shared_ptr<INetworkBackend> backend)
    : backend(std::move(backend)) {}

Result<void> DhcpPinner::reserve(std::string_view network, const LeaseRecord& lease) {
    auto res = backend->updateDhcpHost(network, DhcpHostUpdate::AddLast, hostXml(lease));
    if (res.isErr()) {
        return propagate(std::format("DHCP reservation of {} for MAC {} on {}", lease.ip, lease.mac, network),
                         res.error());
    }
    VLOG_INFO("DHCP reservation added on {}: {} -> {} ({})", network, lease.mac, lease.ip, lease.vmName);
    return {};
}

std::vector<LeaseRecord> DhcpPinner::parseReservations(std::string_view networkXml) {
    std::vector<LeaseRecord> result;
    pugi::xml_document doc;
    if (!doc.load_buffer(networkXml.data(), networkXml.size())) return result;

    for (auto ip : doc.child("network").children("ip")) {
        for (auto host : ip.child("dhcp").children("host")) {
            result.push_back(LeaseRecord{host.attribute("name").as_string(),
                                         host.attribute("mac").as_string(),
                                         host.attribute("ip").as_string()});
        }
    }
    return result;
}

Result<std::vector<LeaseRecord>> DhcpPinner::reservations(std::string_view network) {
    auto found = backend->lookup(network);
    if (found.isErr()) return propagate(std::format("lookup of network {}", network), found.error());
    if (!found.value()) return libvirtError(std::format("network {} doesn't exist", network));
    return parseReservations(found.value()->xml);
}

Result<std::size_t> DhcpPinner::release(std::string_view network, const std::vector<std::string>& vmNames) {
    auto current = reservations(network);
    if (current.isErr()) return Err(current.error());

    std::size_t removed = 0;
    for (const auto& lease : current.value()) {
        if (std::find(vmNames.begin(), vmNames.end(), lease.vmName) == vmNames.end()) continue;

        auto res = backend->updateDhcpHost(network, DhcpHostUpdate::Delete, hostXml(lease));
        if (res.isErr()) {
            return propagate(std::format("remove DHCP reservation of {} on {}", lease.vmName, network), res.error());
        }
        VLOG_INFO("DHCP reservation removed on {}: {} ({})", network, lease.ip, lease.vmName);
        ++removed;
    }
    return removed;
}
