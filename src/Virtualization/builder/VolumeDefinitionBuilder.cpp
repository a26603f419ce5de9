#include "Virtualization/builder/VolumeDefinitionBuilder.hpp"
#include <pugixml.hpp>

void VolumeDefinitionBuilder::buildDocument() {
    auto volume = doc.append_child("volume");
    volume.append_child("name").text() = name.c_str();

    auto capacity = volume.append_child("capacity");
    capacity.append_attribute("unit") = "GiB";
    capacity.text() = capacityGiB;

    volume.append_child("target").append_child("format").append_attribute("type") = format.c_str();
}

VolumeDefinitionBuilder& VolumeDefinitionBuilder::setName(std::string_view name) {
    this->name = name;
    return *this;
}

VolumeDefinitionBuilder& VolumeDefinitionBuilder::setCapacityGiB(unsigned long capacity) {
    capacityGiB = capacity;
    return *this;
}

VolumeDefinitionBuilder& VolumeDefinitionBuilder::setFormat(std::string_view format) {
    this->format = format;
    return *this;
}
