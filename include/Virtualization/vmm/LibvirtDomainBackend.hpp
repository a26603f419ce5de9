#pragma once
#include <memory>
#include "Core/interfaces/IDomainBackend.hpp"
#include "Virtualization/Storage/VirtualMachineStorageManager.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"

/**
 * @brief IDomainBackend over the libvirt domain and storage APIs
 *
 * Exceptions from the handle classes stop here and become [Libvirt] errors.
 */
class LibvirtDomainBackend : public IDomainBackend {
public:
    explicit LibvirtDomainBackend(std::shared_ptr<HypervisorConnector> conn);

    [[nodiscard]] Result<bool> exists(std::string_view name) override;
    [[nodiscard]] Result<bool> isActive(std::string_view name) override;

    [[nodiscard]] Result<void> createVolume(const VirtualMachineDisk& disk) override;
    [[nodiscard]] Result<void> deleteVolume(std::string_view path) override;

    [[nodiscard]] Result<void> defineAndStart(std::string_view xml) override;
    [[nodiscard]] Result<void> defineAndInstall(std::string_view xml, std::string_view installXml) override;
    [[nodiscard]] Result<void> start(std::string_view name) override;
    [[nodiscard]] Result<void> stop(std::string_view name) override;
    [[nodiscard]] Result<void> undefine(std::string_view name) override;

    [[nodiscard]] Result<std::vector<InterfaceAddresses>> interfaceAddresses(std::string_view name) override;

private:
    std::shared_ptr<HypervisorConnector> connector;
    VirtualMachineStorageManager storage;
};
