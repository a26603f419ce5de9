#pragma once
#include <optional>
#include <string>
#include "Cluster/NodeSpec.hpp"
#include "Utils/Result.hpp"

// persistent definition plus, for install-time roles, the one-shot installer boot
struct DomainDefinitions {
    std::string persistent;
    std::optional<std::string> install;
};

/**
 * @brief Turns a node definition into libvirt domain XML
 *
 * Pure function of the NodeSpec; no hypervisor access. Both definitions of a
 * node share UUID and MAC address, so the lease taken by the installer is the
 * one the installed system gets back. Only the installer definition carries
 * the kernel, initrd and command line, and it is destroyed instead of
 * restarted when the installer reboots.
 */
class VirtualMachineFactory
{
public:
    // [Config] error when the spec is incomplete
    [[nodiscard]] static Result<void> validate(const NodeSpec& spec);

    [[nodiscard]] static Result<DomainDefinitions> buildDefinitions(const NodeSpec& spec);
};
