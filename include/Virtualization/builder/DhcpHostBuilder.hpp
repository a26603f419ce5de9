#pragma once
#include <string>
#include <string_view>
#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"

// <host mac='..' ip='..' name='..'/> for virNetworkUpdate on the ip-dhcp-host section
class DhcpHostBuilder : public IXmlBuilderBase {
    std::string mac;
    std::string ip;
    std::string name;

    void buildDocument() override;

public:
    DhcpHostBuilder() = default;
    ~DhcpHostBuilder() override = default;

    DhcpHostBuilder& setMac(std::string_view mac);
    DhcpHostBuilder& setIp(std::string_view ip);
    DhcpHostBuilder& setName(std::string_view name);
};
