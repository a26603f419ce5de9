#include "Virtualization/network/LibvirtNetworkBackend.hpp"
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include "Virtualization/network/VirtualNetworkHandle.hpp"

LibvirtNetworkBackend::LibvirtNetworkBackend(std::shared_ptr<HypervisorConnector> conn)
    : connector(std::move(conn)) {}

Result<std::optional<NetworkInfo>> LibvirtNetworkBackend::lookup(std::string_view name) {
    try {
        auto net = VirtualNetworkHandle::find(connector, name);
        if (!net) return std::optional<NetworkInfo>{};

        NetworkInfo info;
        info.name = net->getName();
        info.active = net->isActive();
        // an inactive network has no bridge device yet
        if (info.active) info.bridge = net->bridgeName();
        info.xml = net->xmlDesc();
        return std::optional<NetworkInfo>{std::move(info)};
    } catch (const VmException& e) {
        return libvirtError(e.detail());
    }
}

Result<void> LibvirtNetworkBackend::defineAndStart(std::string_view xml) {
    try {
        auto net = VirtualNetworkHandle::define(connector, xml);
        net->setAutostart(true);
        net->start();
        VLOG_DEBUG("Network {} defined, autostarted and started", net->getName());
        return {};
    } catch (const VmException& e) {
        return libvirtError(e.detail());
    }
}

Result<void> LibvirtNetworkBackend::updateDhcpHost(std::string_view network,
                                                   DhcpHostUpdate command,
                                                   std::string_view hostXml) {
    try {
        auto net = VirtualNetworkHandle::find(connector, network);
        if (!net) return libvirtError("network " + std::string(network) + " not found");
        net->updateDhcpHost(command, hostXml);
        return {};
    } catch (const VmException& e) {
        return libvirtError(e.detail());
    }
}
