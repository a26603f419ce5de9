#pragma once
#include <memory>
#include "Core/interfaces/INetworkBackend.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"

// INetworkBackend over the libvirt network API
class LibvirtNetworkBackend : public INetworkBackend {
public:
    explicit LibvirtNetworkBackend(std::shared_ptr<HypervisorConnector> conn);

    [[nodiscard]] Result<std::optional<NetworkInfo>> lookup(std::string_view name) override;
    [[nodiscard]] Result<void> defineAndStart(std::string_view xml) override;
    [[nodiscard]] Result<void> updateDhcpHost(std::string_view network,
                                              DhcpHostUpdate command,
                                              std::string_view hostXml) override;

private:
    std::shared_ptr<HypervisorConnector> connector;
};
