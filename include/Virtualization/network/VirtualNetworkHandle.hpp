#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <libvirt/libvirt.h>
#include "Core/interfaces/INetworkBackend.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"

/**
 * @brief Owning handle to a libvirt virtual network
 *
 * All operations throw LibvirtException on failure.
 */
class VirtualNetworkHandle {
public:
    // takes ownership of net
    VirtualNetworkHandle(std::shared_ptr<HypervisorConnector> conn, virNetworkPtr net);
    ~VirtualNetworkHandle();

    VirtualNetworkHandle(const VirtualNetworkHandle&) = delete;
    VirtualNetworkHandle& operator=(const VirtualNetworkHandle&) = delete;

    // nullptr when the network is not defined; throws on any other lookup failure
    [[nodiscard]] static std::unique_ptr<VirtualNetworkHandle> find(std::shared_ptr<HypervisorConnector> conn,
                                                                    std::string_view name);

    // persistent definition, not yet started
    static std::unique_ptr<VirtualNetworkHandle> define(std::shared_ptr<HypervisorConnector> conn,
                                                        std::string_view xml);

    void setAutostart(bool enabled);
    void start();

    [[nodiscard]] bool isActive() const;
    [[nodiscard]] std::string bridgeName() const;
    [[nodiscard]] std::string xmlDesc() const;
    [[nodiscard]] const std::string& getName() const noexcept;

    // live and persistent configuration in one call
    void updateDhcpHost(DhcpHostUpdate command, std::string_view hostXml);

private:
    std::shared_ptr<HypervisorConnector> connector;
    virNetworkPtr network{nullptr};
    std::string name;

    void checkLibvirtError(int result, std::string_view action) const;
};
