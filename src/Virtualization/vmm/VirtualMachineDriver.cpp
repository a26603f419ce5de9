#include "Virtualization/vmm/VirtualMachineDriver.hpp"
#include <format>
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include "Virtualization/vmm/VirtualMachineFactory.hpp"

VirtualMachineDriver::VirtualMachineDriver(std::shared_ptr<IDomainBackend> domains)
    : domains(std::move(domains)) {}

Result<void> VirtualMachineDriver::create(const NodeSpec& spec) {
    auto defs = VirtualMachineFactory::buildDefinitions(spec);
    if (defs.isErr()) return Err(defs.error());
    const auto& def = defs.value();

    auto found = domains->exists(spec.name);
    if (found.isErr()) return propagate(std::format("lookup of {}", spec.name), found.error());
    if (found.value()) return libvirtError(std::format("domain {} already exists", spec.name));

    if (spec.disk.sizeGiB) {
        auto vol = domains->createVolume(spec.disk);
        if (vol.isErr()) return propagate(std::format("disk for {}", spec.name), vol.error());
    }

    auto res = def.install ? domains->defineAndInstall(def.persistent, *def.install)
                           : domains->defineAndStart(def.persistent);
    if (res.isErr()) return propagate(std::format("define and start {}", spec.name), res.error());

    VLOG_INFO("VM {} ({}) created: {} vCPU, {} MiB, disk {}",
              spec.name, toString(spec.role), spec.cpus, spec.memoryMiB, spec.disk.path);
    return {};
}

Result<void> VirtualMachineDriver::start(std::string_view name) {
    auto res = domains->start(name);
    if (res.isErr()) return propagate(std::format("start {}", name), res.error());
    VLOG_INFO("VM {} started", name);
    return {};
}

Result<void> VirtualMachineDriver::stop(std::string_view name) {
    auto res = domains->stop(name);
    if (res.isErr()) return propagate(std::format("stop {}", name), res.error());
    VLOG_INFO("VM {} stopped", name);
    return {};
}

Result<void> VirtualMachineDriver::destroy(std::string_view name) {
    auto found = domains->exists(name);
    if (found.isErr()) return propagate(std::format("lookup of {}", name), found.error());
    if (!found.value()) {
        VLOG_DEBUG("VM {} is not defined, nothing to destroy", name);
        return {};
    }

    auto active = domains->isActive(name);
    if (active.isErr()) return propagate(std::format("state of {}", name), active.error());
    if (active.value()) {
        auto res = stop(name);
        if (res.isErr()) return res;
    }

    auto res = domains->undefine(name);
    if (res.isErr()) return propagate(std::format("undefine {}", name), res.error());
    VLOG_INFO("VM {} undefined", name);
    return {};
}

Result<void> VirtualMachineDriver::discardDisk(const VirtualMachineDisk& disk) {
    auto res = domains->deleteVolume(disk.path);
    if (res.isErr()) return propagate(std::format("delete disk {}", disk.path), res.error());
    return {};
}
