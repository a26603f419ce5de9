#pragma once
#include <memory>
#include <string_view>
#include <vector>
#include "Cluster/NodeSpec.hpp"
#include "Core/interfaces/INetworkBackend.hpp"
#include "Utils/Result.hpp"

/**
 * @brief Pins observed leases as static DHCP host entries
 *
 * Entries carry the VM name so they can be found again at teardown.
 * Duplicate reservations are left to libvirt to accept or refuse.
 */
class DhcpPinner {
public:
    explicit DhcpPinner(std::shared_ptr<INetworkBackend> backend);

    [[nodiscard]] Result<void> reserve(std::string_view network, const LeaseRecord& lease);

    // static host entries currently in the network descriptor
    [[nodiscard]] Result<std::vector<LeaseRecord>> reservations(std::string_view network);

    // drops every entry whose name is one of vmNames; returns how many were removed
    [[nodiscard]] Result<std::size_t> release(std::string_view network, const std::vector<std::string>& vmNames);

    [[nodiscard]] static std::vector<LeaseRecord> parseReservations(std::string_view networkXml);

private:
    std::shared_ptr<INetworkBackend> backend;
};
