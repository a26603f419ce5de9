#include "Virtualization/vm/VirtualMachine.hpp"
#include <cstdlib>
#include <libvirt/libvirt.h>
#include <libvirt/virterror.h>

VirtualMachine::VirtualMachine(std::shared_ptr<HypervisorConnector> conn, virDomainPtr dom)
    : connector(std::move(conn)), domain(dom) {
    const char* n = virDomainGetName(domain);
    name = n ? n : "";
}

VirtualMachine::~VirtualMachine() {
    if (domain) virDomainFree(domain);
}

std::unique_ptr<VirtualMachine> VirtualMachine::find(std::shared_ptr<HypervisorConnector> conn,
                                                     std::string_view vmName) {
    virDomainPtr dom = virDomainLookupByName(conn->ensureConnected(), std::string(vmName).c_str());
    if (!dom) {
        if (HypervisorConnector::lastErrorCode() == VIR_ERR_NO_DOMAIN) {
            virResetLastError();
            return nullptr;
        }
        throw LibvirtException("lookup " + std::string(vmName) + ": " + HypervisorConnector::lastError());
    }
    return std::make_unique<VirtualMachine>(std::move(conn), dom);
}

std::unique_ptr<VirtualMachine> VirtualMachine::define(std::shared_ptr<HypervisorConnector> conn,
                                                       std::string_view xml) {
    virDomainPtr dom = virDomainDefineXML(conn->ensureConnected(), std::string(xml).c_str());
    if (!dom) {
        throw LibvirtException("virDomainDefineXML failed: " + HypervisorConnector::lastError());
    }
    return std::make_unique<VirtualMachine>(std::move(conn), dom);
}

void VirtualMachine::start() { checkLibvirtError(virDomainCreate(domain), "start " + name); }

void VirtualMachine::bootOnce(std::string_view transientXml) {
    virDomainPtr live = virDomainCreateXML(connector->ensureConnected(), std::string(transientXml).c_str(), 0);
    if (!live) {
        throw LibvirtException("boot " + name + " from install definition: " + HypervisorConnector::lastError());
    }
    virDomainFree(live);
}
void VirtualMachine::destroy() { checkLibvirtError(virDomainDestroy(domain), "destroy " + name); }
void VirtualMachine::undefine() { checkLibvirtError(virDomainUndefine(domain), "undefine " + name); }

std::vector<InterfaceAddresses> VirtualMachine::leaseAddresses() const {
    virDomainInterfacePtr* ifaces = nullptr;
    int count = virDomainInterfaceAddresses(domain, &ifaces, VIR_DOMAIN_INTERFACE_ADDRESSES_SRC_LEASE, 0);
    checkLibvirtError(count, "list interface addresses of " + name);

    std::vector<InterfaceAddresses> result;
    result.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        virDomainInterfacePtr iface = ifaces[i];
        InterfaceAddresses entry;
        entry.name = iface->name ? iface->name : "";
        entry.hwaddr = iface->hwaddr ? iface->hwaddr : "";
        for (unsigned int j = 0; j < iface->naddrs; ++j) {
            const auto& addr = iface->addrs[j];
            entry.addresses.push_back(InterfaceIp{
                addr.type == VIR_IP_ADDR_TYPE_IPV4 ? InterfaceIp::Family::IPv4 : InterfaceIp::Family::IPv6,
                addr.addr ? addr.addr : "",
                addr.prefix});
        }
        result.push_back(std::move(entry));
        virDomainInterfaceFree(iface);
    }
    free(ifaces);
    return result;
}

const std::string& VirtualMachine::getName() const noexcept { return name; }

bool VirtualMachine::isActive() const {
    int active = virDomainIsActive(domain);
    checkLibvirtError(active, "query state of " + name);
    return active == 1;
}

void VirtualMachine::checkLibvirtError(int result, const std::string& action) {
    if (result < 0) {
        throw LibvirtException(action + ": " + HypervisorConnector::lastError());
    }
}
