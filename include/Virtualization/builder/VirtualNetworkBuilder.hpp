#pragma once
#include <string>
#include <string_view>
#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"

/**
 * @brief Builder for libvirt NAT network definitions
 *
 * The bridge device is named after the network. The gateway takes the
 * first address of the subnet and the DHCP pool spans the rest of it.
 */
class VirtualNetworkBuilder : public IXmlBuilderBase {
    std::string name;
    std::string gateway;
    std::string netmask{"255.255.255.0"};
    std::string dhcpStart;
    std::string dhcpEnd;
    std::string forwardMode{"nat"};

    void buildDocument() override;

public:
    VirtualNetworkBuilder() = default;
    ~VirtualNetworkBuilder() override = default;

    VirtualNetworkBuilder& setName(std::string_view name);
    VirtualNetworkBuilder& setGateway(std::string_view address, std::string_view netmask = "255.255.255.0");
    VirtualNetworkBuilder& setDhcpRange(std::string_view start, std::string_view end);
    VirtualNetworkBuilder& setForwardMode(std::string_view mode);

    // 192.168.<octet>.0/24 with gateway .1 and pool .2-.254
    VirtualNetworkBuilder& setPrivateSubnet(unsigned octet);
};
