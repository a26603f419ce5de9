#pragma once
#include <string>
#include <string_view>
#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"

/**
 * @brief Builder for storage volume XML (virStorageVolCreateXML)
 *
 *   <volume>
 *     <name>ocp4-master-1.qcow2</name>
 *     <capacity unit='GiB'>50</capacity>
 *     <target><format type='qcow2'/></target>
 *   </volume>
 */
class VolumeDefinitionBuilder : public IXmlBuilderBase {
    std::string name;
    unsigned long capacityGiB{0};
    std::string format{"qcow2"};

    void buildDocument() override;

public:
    VolumeDefinitionBuilder() = default;
    ~VolumeDefinitionBuilder() override = default;

    VolumeDefinitionBuilder& setName(std::string_view name);
    VolumeDefinitionBuilder& setCapacityGiB(unsigned long capacity);
    VolumeDefinitionBuilder& setFormat(std::string_view format = "qcow2");
};
