#pragma once
#include <optional>
#include <string>

struct VirtualMachineDisk {
    std::string path;
    std::string format{"qcow2"};
    // set when the volume has to be created before the domain; unset for pre-built images
    std::optional<unsigned> sizeGiB;
    std::string target{"vda"};
};
