#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "Utils/Result.hpp"
#include "Virtualization/vm/VirtualMachineDisk.hpp"

struct InterfaceIp {
    enum class Family { IPv4, IPv6 };
    Family family{Family::IPv4};
    std::string address;
    unsigned prefix{0};
};

struct InterfaceAddresses {
    std::string name;
    std::string hwaddr;
    std::vector<InterfaceIp> addresses;
};

/**
 * @brief Hypervisor domain and storage capability
 */
class IDomainBackend {
public:
    virtual ~IDomainBackend() = default;

    [[nodiscard]] virtual Result<bool> exists(std::string_view name) = 0;
    [[nodiscard]] virtual Result<bool> isActive(std::string_view name) = 0;

    // fails when a volume already exists at disk.path
    [[nodiscard]] virtual Result<void> createVolume(const VirtualMachineDisk& disk) = 0;
    [[nodiscard]] virtual Result<void> deleteVolume(std::string_view path) = 0;

    [[nodiscard]] virtual Result<void> defineAndStart(std::string_view xml) = 0;
    // defines xml, then boots installXml (same name and UUID) once; the domain
    // is left shut off with the xml definition when the installer powers it off
    [[nodiscard]] virtual Result<void> defineAndInstall(std::string_view xml, std::string_view installXml) = 0;
    [[nodiscard]] virtual Result<void> start(std::string_view name) = 0;
    [[nodiscard]] virtual Result<void> stop(std::string_view name) = 0;       // hard power-off
    [[nodiscard]] virtual Result<void> undefine(std::string_view name) = 0;

    // addresses as seen by the network's DHCP lease database
    [[nodiscard]] virtual Result<std::vector<InterfaceAddresses>> interfaceAddresses(std::string_view name) = 0;
};
