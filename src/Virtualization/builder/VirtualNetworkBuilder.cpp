#include "Virtualization/builder/VirtualNetworkBuilder.hpp"
#include <pugixml.hpp>
#include "Utils/NetworkAddress.hpp"

void VirtualNetworkBuilder::buildDocument() {
    auto network = doc.append_child("network");
    network.append_child("name").text() = name.c_str();

    auto bridge = network.append_child("bridge");
    bridge.append_attribute("name") = name.c_str();
    bridge.append_attribute("stp") = "on";
    bridge.append_attribute("delay") = "0";

    network.append_child("forward").append_attribute("mode") = forwardMode.c_str();

    auto ip = network.append_child("ip");
    ip.append_attribute("address") = gateway.c_str();
    ip.append_attribute("netmask") = netmask.c_str();

    if (!dhcpStart.empty()) {
        auto range = ip.append_child("dhcp").append_child("range");
        range.append_attribute("start") = dhcpStart.c_str();
        range.append_attribute("end") = dhcpEnd.c_str();
    }
}

VirtualNetworkBuilder& VirtualNetworkBuilder::setName(std::string_view name) {
    this->name = name;
    return *this;
}

VirtualNetworkBuilder& VirtualNetworkBuilder::setGateway(std::string_view address, std::string_view netmask) {
    gateway = address;
    this->netmask = netmask;
    return *this;
}

VirtualNetworkBuilder& VirtualNetworkBuilder::setDhcpRange(std::string_view start, std::string_view end) {
    dhcpStart = start;
    dhcpEnd = end;
    return *this;
}

VirtualNetworkBuilder& VirtualNetworkBuilder::setForwardMode(std::string_view mode) {
    forwardMode = mode;
    return *this;
}

VirtualNetworkBuilder& VirtualNetworkBuilder::setPrivateSubnet(unsigned octet) {
    setGateway(NetworkAddress::privateHost(octet, 1));
    return setDhcpRange(NetworkAddress::privateHost(octet, 2), NetworkAddress::privateHost(octet, 254));
}
