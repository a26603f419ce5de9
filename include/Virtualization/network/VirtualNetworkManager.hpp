#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "Core/interfaces/INetworkBackend.hpp"
#include "Utils/Result.hpp"

struct VirtualNetwork {
    std::string name;
    std::string bridge;
    std::string gateway;   // empty when the descriptor carries no IPv4 address
};

/**
 * @brief Resolves the virtual network a cluster is attached to
 *
 * Given an octet, the network ocp-<octet> is reused when defined and
 * otherwise created as 192.168.<octet>.0/24 with its DHCP pool at .2-.254.
 * Given a name, the network has to exist already. Either way it must be
 * running; a defined but stopped network is rejected.
 */
class VirtualNetworkManager {
public:
    explicit VirtualNetworkManager(std::shared_ptr<INetworkBackend> backend);

    // exactly one of octet and existingName; anything else fails before any hypervisor call
    [[nodiscard]] Result<VirtualNetwork> ensureNetwork(const std::optional<std::string>& octet,
                                                       const std::optional<std::string>& existingName);

    [[nodiscard]] static std::string networkNameFor(unsigned octet);

    // first IPv4 <ip address=...> of a network descriptor
    [[nodiscard]] static std::optional<std::string> gatewayFromXml(std::string_view xml);

private:
    [[nodiscard]] Result<std::string> createOrReuse(unsigned octet);
    [[nodiscard]] Result<VirtualNetwork> describe(std::string_view name);

    std::shared_ptr<INetworkBackend> backend;
};
