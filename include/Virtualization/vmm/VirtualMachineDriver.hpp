#pragma once
#include <memory>
#include <string_view>
#include "Cluster/NodeSpec.hpp"
#include "Core/interfaces/IDomainBackend.hpp"
#include "Utils/Result.hpp"

/**
 * @brief VM lifecycle against the hypervisor
 *
 * create() never touches an existing domain or disk: either one already
 * being there is a hard error.
 */
class VirtualMachineDriver {
public:
    explicit VirtualMachineDriver(std::shared_ptr<IDomainBackend> domains);

    // volume (when sized) + define + start; install-time roles boot the
    // installer once and are left shut off when it finishes
    [[nodiscard]] Result<void> create(const NodeSpec& spec);
    [[nodiscard]] Result<void> start(std::string_view name);
    [[nodiscard]] Result<void> stop(std::string_view name);
    // power off when running, then undefine; a missing domain is not an error
    [[nodiscard]] Result<void> destroy(std::string_view name);
    [[nodiscard]] Result<void> discardDisk(const VirtualMachineDisk& disk);

private:
    std::shared_ptr<IDomainBackend> domains;
};
