#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <libvirt/libvirt.h>
#include "Core/interfaces/IDomainBackend.hpp"
#include "Utils/Exception.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"

/**
 * @brief Owning handle to a libvirt domain
 *
 * All operations throw LibvirtException on failure.
 */
class VirtualMachine {
public:
    // takes ownership of dom
    VirtualMachine(std::shared_ptr<HypervisorConnector> conn, virDomainPtr dom);
    ~VirtualMachine();

    VirtualMachine(const VirtualMachine&) = delete;
    VirtualMachine& operator=(const VirtualMachine&) = delete;

    // nullptr when the domain does not exist; throws on any other lookup failure
    [[nodiscard]] static std::unique_ptr<VirtualMachine> find(std::shared_ptr<HypervisorConnector> conn,
                                                              std::string_view vmName);

    // persistent definition, not started
    static std::unique_ptr<VirtualMachine> define(std::shared_ptr<HypervisorConnector> conn,
                                                  std::string_view xml);

    void start();
    // boots the defined, inactive domain once from a transient definition with
    // the same name and UUID; the persistent definition applies again afterwards
    void bootOnce(std::string_view transientXml);
    void destroy();
    void undefine();

    [[nodiscard]] std::vector<InterfaceAddresses> leaseAddresses() const;

    [[nodiscard]] const std::string& getName() const noexcept;
    [[nodiscard]] bool isActive() const;

private:
    std::shared_ptr<HypervisorConnector> connector;
    virDomainPtr domain {nullptr};
    std::string name;

    static void checkLibvirtError(int result, const std::string& action);
};
