#include "Virtualization/network/VirtualNetworkHandle.hpp"
#include <cstdlib>
#include <format>
#include <libvirt/virterror.h>
#include "Utils/Exception.hpp"

VirtualNetworkHandle::VirtualNetworkHandle(std::shared_ptr<HypervisorConnector> conn, virNetworkPtr net)
    : connector(std::move(conn)), network(net) {
    const char* n = virNetworkGetName(network);
    name = n ? n : "";
}

VirtualNetworkHandle::~VirtualNetworkHandle() {
    if (network) virNetworkFree(network);
}

std::unique_ptr<VirtualNetworkHandle> VirtualNetworkHandle::find(std::shared_ptr<HypervisorConnector> conn,
                                                                 std::string_view name) {
    virNetworkPtr net = virNetworkLookupByName(conn->ensureConnected(), std::string(name).c_str());
    if (!net) {
        if (HypervisorConnector::lastErrorCode() == VIR_ERR_NO_NETWORK) {
            virResetLastError();
            return nullptr;
        }
        throw LibvirtException(std::format("lookup network {}: {}", name, HypervisorConnector::lastError()));
    }
    return std::make_unique<VirtualNetworkHandle>(std::move(conn), net);
}

std::unique_ptr<VirtualNetworkHandle> VirtualNetworkHandle::define(std::shared_ptr<HypervisorConnector> conn,
                                                                   std::string_view xml) {
    virNetworkPtr net = virNetworkDefineXML(conn->ensureConnected(), std::string(xml).c_str());
    if (!net) {
        throw LibvirtException("virNetworkDefineXML failed: " + HypervisorConnector::lastError());
    }
    return std::make_unique<VirtualNetworkHandle>(std::move(conn), net);
}

void VirtualNetworkHandle::setAutostart(bool enabled) {
    checkLibvirtError(virNetworkSetAutostart(network, enabled ? 1 : 0), "set autostart");
}

void VirtualNetworkHandle::start() {
    checkLibvirtError(virNetworkCreate(network), "start");
}

bool VirtualNetworkHandle::isActive() const {
    int active = virNetworkIsActive(network);
    checkLibvirtError(active, "query state");
    return active == 1;
}

std::string VirtualNetworkHandle::bridgeName() const {
    char* bridge = virNetworkGetBridgeName(network);
    if (!bridge) {
        throw LibvirtException(std::format("bridge name of {}: {}", name, HypervisorConnector::lastError()));
    }
    std::string result(bridge);
    free(bridge);
    return result;
}

std::string VirtualNetworkHandle::xmlDesc() const {
    char* xml = virNetworkGetXMLDesc(network, 0);
    if (!xml) {
        throw LibvirtException(std::format("XML description of {}: {}", name, HypervisorConnector::lastError()));
    }
    std::string result(xml);
    free(xml);
    return result;
}

const std::string& VirtualNetworkHandle::getName() const noexcept { return name; }

void VirtualNetworkHandle::updateDhcpHost(DhcpHostUpdate command, std::string_view hostXml) {
    const unsigned int cmd = command == DhcpHostUpdate::AddLast ? VIR_NETWORK_UPDATE_COMMAND_ADD_LAST
                                                                : VIR_NETWORK_UPDATE_COMMAND_DELETE;
    const unsigned int flags = VIR_NETWORK_UPDATE_AFFECT_LIVE | VIR_NETWORK_UPDATE_AFFECT_CONFIG;
    checkLibvirtError(virNetworkUpdate(network, cmd, VIR_NETWORK_SECTION_IP_DHCP_HOST, -1,
                                       std::string(hostXml).c_str(), flags),
                      "update DHCP host");
}

void VirtualNetworkHandle::checkLibvirtError(int result, std::string_view action) const {
    if (result < 0) {
        throw LibvirtException(std::format("{} of network {}: {}", action, name, HypervisorConnector::lastError()));
    }
}
