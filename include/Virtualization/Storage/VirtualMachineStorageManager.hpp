#pragma once
#include <memory>
#include <string>
#include <string_view>
#include "Virtualization/vm/VirtualMachineDisk.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"

/**
 * @brief Volume management in the storage pool that backs a disk path
 *
 * The pool is the one whose target directory contains the disk. Throws
 * StorageException when the pool or the volume cannot be resolved and
 * LibvirtException when libvirt refuses an operation.
 */
class VirtualMachineStorageManager {
    std::shared_ptr<HypervisorConnector> connector;

public:
    explicit VirtualMachineStorageManager(std::shared_ptr<HypervisorConnector> conn);

    // fails when a volume already exists at disk.path
    void createVolume(const VirtualMachineDisk& disk);
    // no-op when nothing exists at path
    void deleteVolume(std::string_view path);
};
