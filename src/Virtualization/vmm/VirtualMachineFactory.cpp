#include "Virtualization/vmm/VirtualMachineFactory.hpp"
#include <format>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "Utils/Exception.hpp"
#include "Virtualization/builder/VirtualMachineBuilder.hpp"

Result<void> VirtualMachineFactory::validate(const NodeSpec& spec) {
    if (spec.name.empty()) return configError("node has no name");
    if (spec.cpus == 0 || spec.memoryMiB == 0) {
        return configError(std::format("{}: cpu count and memory must be positive", spec.name));
    }
    if (spec.disk.path.empty()) return configError(std::format("{}: no disk path", spec.name));
    if (spec.network.empty()) return configError(std::format("{}: no network", spec.name));
    if (spec.hostnames.empty()) return configError(std::format("{}: no hostnames", spec.name));
    if (spec.boot && (spec.boot->kernel.empty() || spec.boot->initrd.empty())) {
        return configError(std::format("{}: install boot needs both kernel and initrd", spec.name));
    }
    return {};
}

Result<DomainDefinitions> VirtualMachineFactory::buildDefinitions(const NodeSpec& spec) {
    auto valid = validate(spec);
    if (valid.isErr()) return Err(valid.error());

    const auto uuid = boost::uuids::random_generator()();
    // QEMU's locally administered 52:54:00 prefix, host part taken from the UUID
    const auto mac = std::format("52:54:00:{:02x}:{:02x}:{:02x}", static_cast<unsigned>(uuid.data[0]),
                                 static_cast<unsigned>(uuid.data[1]), static_cast<unsigned>(uuid.data[2]));

    VirtualMachineBuilder builder;
    builder.setName(spec.name)
        .setUuid(boost::uuids::to_string(uuid))
        .setMemoryMiB(spec.memoryMiB)
        .setCpuCount(spec.cpus)
        .setDisk(spec.disk)
        .setNetwork(spec.network)
        .setMacAddress(mac);

    DomainDefinitions defs;
    defs.persistent = builder.build();
    if (spec.boot) {
        builder.setDirectKernelBoot(spec.boot->kernel, spec.boot->initrd, spec.boot->kernelArgs)
            .setOnReboot("destroy");
        defs.install = builder.build();
    }
    return defs;
}
