#include "Virtualization/network/VirtualNetworkManager.hpp"
#include <format>
#include <pugixml.hpp>
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include "Utils/NetworkAddress.hpp"
#include "Virtualization/builder/VirtualNetworkBuilder.hpp"

VirtualNetworkManager::VirtualNetworkManager(std::shared_ptr<INetworkBackend> backend)
    : backend(std::move(backend)) {}

std::string VirtualNetworkManager::networkNameFor(unsigned octet) {
    return std::format("ocp-{}", octet);
}

std::optional<std::string> VirtualNetworkManager::gatewayFromXml(std::string_view xml) {
    pugi::xml_document doc;
    if (!doc.load_buffer(xml.data(), xml.size())) return std::nullopt;

    for (auto ip : doc.child("network").children("ip")) {
        std::string address = ip.attribute("address").as_string();
        if (NetworkAddress::isIpv4(address)) return address;
    }
    return std::nullopt;
}

Result<VirtualNetwork> VirtualNetworkManager::ensureNetwork(const std::optional<std::string>& octet,
                                                            const std::optional<std::string>& existingName) {
    const bool haveOctet = octet && !octet->empty();
    const bool haveName = existingName && !existingName->empty();
    if (haveOctet == haveName) {
        return configError("exactly one of a network octet or an existing network name must be given");
    }

    std::string name;
    if (haveOctet) {
        auto value = NetworkAddress::parseOctet(*octet);
        if (!value) return configError(std::format("invalid network octet '{}'", *octet));

        auto created = createOrReuse(*value);
        if (created.isErr()) return Err(created.error());
        name = created.unwrap();
    } else {
        auto found = backend->lookup(*existingName);
        if (found.isErr()) return propagate(std::format("lookup of network {}", *existingName), found.error());
        if (!found.value()) return libvirtError(std::format("libvirt network {} doesn't exist", *existingName));
        VLOG_INFO("Using existing libvirt network {}", *existingName);
        name = *existingName;
    }
    return describe(name);
}

Result<std::string> VirtualNetworkManager::createOrReuse(unsigned octet) {
    const auto name = networkNameFor(octet);

    auto found = backend->lookup(name);
    if (found.isErr()) return propagate(std::format("lookup of network {}", name), found.error());
    if (found.value()) {
        VLOG_INFO("Libvirt network {} already exists, reusing it", name);
        return name;
    }

    VLOG_INFO("Creating libvirt network {}", name);
    VirtualNetworkBuilder builder;
    builder.setName(name).setPrivateSubnet(octet);
    auto res = backend->defineAndStart(builder.build());
    if (res.isErr()) return propagate(std::format("create network {}", name), res.error());

    VLOG_INFO("Libvirt network {} created and started", name);
    return name;
}

Result<VirtualNetwork> VirtualNetworkManager::describe(std::string_view name) {
    auto found = backend->lookup(name);
    if (found.isErr()) return propagate(std::format("lookup of network {}", name), found.error());
    if (!found.value()) return libvirtError(std::format("network {} vanished", name));

    const auto& info = *found.value();
    if (!info.active) return libvirtError(std::format("network {} is defined but not running", name));
    if (info.bridge.empty()) return libvirtError(std::format("network {} has no bridge device", name));

    VirtualNetwork network{info.name, info.bridge, ""};
    if (auto gw = gatewayFromXml(info.xml)) {
        network.gateway = *gw;
    } else {
        VLOG_WARN("No gateway address found in the descriptor of network {}", name);
    }
    VLOG_INFO("Network {}: bridge {}, gateway {}", network.name, network.bridge,
              network.gateway.empty() ? "<none>" : network.gateway);
    return network;
}
