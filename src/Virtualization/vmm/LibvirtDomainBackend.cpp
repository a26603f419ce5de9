#include "Virtualization/vmm/LibvirtDomainBackend.hpp"
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include "Virtualization/vm/VirtualMachine.hpp"

namespace {

std::unique_ptr<VirtualMachine> require(const std::shared_ptr<HypervisorConnector>& conn, std::string_view name) {
    auto vm = VirtualMachine::find(conn, name);
    if (!vm) throw VmException("domain " + std::string(name) + " not found");
    return vm;
}

} // namespace

LibvirtDomainBackend::LibvirtDomainBackend(std::shared_ptr<HypervisorConnector> conn)
    : connector(conn), storage(conn) {}

Result<bool> LibvirtDomainBackend::exists(std::string_view name) {
    try {
        return VirtualMachine::find(connector, name) != nullptr;
    } catch (const VmException& e) {
        return libvirtError(e.detail());
    }
}

Result<bool> LibvirtDomainBackend::isActive(std::string_view name) {
    try {
        return require(connector, name)->isActive();
    } catch (const VmException& e) {
        return libvirtError(e.detail());
    }
}

Result<void> LibvirtDomainBackend::createVolume(const VirtualMachineDisk& disk) {
    try {
        storage.createVolume(disk);
        return {};
    } catch (const VmException& e) {
        return libvirtError(e.detail());
    }
}

Result<void> LibvirtDomainBackend::deleteVolume(std::string_view path) {
    try {
        storage.deleteVolume(path);
        return {};
    } catch (const VmException& e) {
        return libvirtError(e.detail());
    }
}

Result<void> LibvirtDomainBackend::defineAndStart(std::string_view xml) {
    try {
        auto vm = VirtualMachine::define(connector, xml);
        vm->start();
        VLOG_DEBUG("Domain {} defined and started", vm->getName());
        return {};
    } catch (const VmException& e) {
        return libvirtError(e.detail());
    }
}

Result<void> LibvirtDomainBackend::defineAndInstall(std::string_view xml, std::string_view installXml) {
    try {
        auto vm = VirtualMachine::define(connector, xml);
        vm->bootOnce(installXml);
        VLOG_DEBUG("Domain {} defined and booted into the installer", vm->getName());
        return {};
    } catch (const VmException& e) {
        return libvirtError(e.detail());
    }
}

Result<void> LibvirtDomainBackend::start(std::string_view name) {
    try {
        require(connector, name)->start();
        return {};
    } catch (const VmException& e) {
        return libvirtError(e.detail());
    }
}

Result<void> LibvirtDomainBackend::stop(std::string_view name) {
    try {
        require(connector, name)->destroy();
        return {};
    } catch (const VmException& e) {
        return libvirtError(e.detail());
    }
}

Result<void> LibvirtDomainBackend::undefine(std::string_view name) {
    try {
        require(connector, name)->undefine();
        return {};
    } catch (const VmException& e) {
        return libvirtError(e.detail());
    }
}

Result<std::vector<InterfaceAddresses>> LibvirtDomainBackend::interfaceAddresses(std::string_view name) {
    try {
        return require(connector, name)->leaseAddresses();
    } catch (const VmException& e) {
        return libvirtError(e.detail());
    }
}
