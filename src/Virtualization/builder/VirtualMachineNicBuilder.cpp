#include "Virtualization/builder/VirtualMachineNicBuilder.hpp"
#include <pugixml.hpp>

VirtualMachineNicBuilder& VirtualMachineNicBuilder::setNetworkName(std::string_view network) {
    networkName = network;
    return *this;
}

VirtualMachineNicBuilder& VirtualMachineNicBuilder::setMacAddress(std::string_view mac) {
    macAddress = mac;
    return *this;
}

VirtualMachineNicBuilder& VirtualMachineNicBuilder::setModel(std::string_view value) {
    model = value;
    return *this;
}

void VirtualMachineNicBuilder::buildDocument() {
    auto iface = doc.append_child("interface");
    iface.append_attribute("type") = "network";
    iface.append_child("source").append_attribute("network") = networkName.c_str();
    if (!macAddress.empty()) {
        iface.append_child("mac").append_attribute("address") = macAddress.c_str();
    }
    iface.append_child("model").append_attribute("type") = model.c_str();
}
