#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "Utils/Result.hpp"

struct NetworkInfo {
    std::string name;
    bool active{false};
    std::string bridge;
    std::string xml;    // live descriptor (virNetworkGetXMLDesc)
};

enum class DhcpHostUpdate { AddLast, Delete };

/**
 * @brief Hypervisor virtual-network capability
 *
 * Narrow view of the libvirt network API used by the network manager and
 * the DHCP pinner.
 */
class INetworkBackend {
public:
    virtual ~INetworkBackend() = default;

    // nullopt when no network with that name is defined
    [[nodiscard]] virtual Result<std::optional<NetworkInfo>> lookup(std::string_view name) = 0;

    // define + autostart + start
    [[nodiscard]] virtual Result<void> defineAndStart(std::string_view xml) = 0;

    // applied to the live and the persistent configuration in one call
    [[nodiscard]] virtual Result<void> updateDhcpHost(std::string_view network,
                                                      DhcpHostUpdate command,
                                                      std::string_view hostXml) = 0;
};
