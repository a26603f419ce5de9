#pragma once

#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"
#include <string>
#include <string_view>

/**
 * @brief <interface type='network'> device of a cluster node
 *
 * Not built on its own: the domain builder embeds it with appendTo().
 * Without a MAC address libvirt generates one, and that is the address the
 * lease query later reports for the node.
 */
class VirtualMachineNicBuilder : public IXmlBuilderBase {
    std::string networkName{"default"};
    std::string macAddress;
    std::string model{"virtio"};

    void buildDocument() override;

public:
    VirtualMachineNicBuilder() = default;
    ~VirtualMachineNicBuilder() override = default;

    VirtualMachineNicBuilder& setNetworkName(std::string_view network);
    VirtualMachineNicBuilder& setMacAddress(std::string_view mac);
    // "virtio" unless the guest lacks the driver
    VirtualMachineNicBuilder& setModel(std::string_view model);
};
