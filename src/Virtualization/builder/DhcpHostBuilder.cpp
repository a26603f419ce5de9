#include "Virtualization/builder/DhcpHostBuilder.hpp"
#include <pugixml.hpp>

void DhcpHostBuilder::buildDocument() {
    auto host = doc.append_child("host");
    if (!mac.empty()) host.append_attribute("mac") = mac.c_str();
    if (!ip.empty()) host.append_attribute("ip") = ip.c_str();
    if (!name.empty()) host.append_attribute("name") = name.c_str();
}

DhcpHostBuilder& DhcpHostBuilder::setMac(std::string_view mac) {
    this->mac = mac;
    return *this;
}

DhcpHostBuilder& DhcpHostBuilder::setIp(std::string_view ip) {
    this->ip = ip;
    return *this;
}

DhcpHostBuilder& DhcpHostBuilder::setName(std::string_view name) {
    this->name = name;
    return *this;
}
