#include "Virtualization/Storage/VirtualMachineStorageManager.hpp"
#include <filesystem>
#include <format>
#include <libvirt/libvirt.h>
#include <libvirt/virterror.h>
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include "Virtualization/builder/VolumeDefinitionBuilder.hpp"

namespace {

struct PoolDeleter {
    void operator()(virStoragePoolPtr p) const noexcept { virStoragePoolFree(p); }
};
struct VolDeleter {
    void operator()(virStorageVolPtr v) const noexcept { virStorageVolFree(v); }
};
using PoolPtr = std::unique_ptr<virStoragePool, PoolDeleter>;
using VolPtr = std::unique_ptr<virStorageVol, VolDeleter>;

PoolPtr poolFor(virConnectPtr conn, const std::filesystem::path& file) {
    const auto dir = file.parent_path().string();
    PoolPtr pool(virStoragePoolLookupByTargetPath(conn, dir.c_str()));
    if (!pool) {
        throw StorageException(std::format("no storage pool with target {}: {}", dir, HypervisorConnector::lastError()));
    }
    if (virStoragePoolRefresh(pool.get(), 0) < 0) {
        throw LibvirtException(std::format("refresh pool for {}: {}", dir, HypervisorConnector::lastError()));
    }
    return pool;
}

VolPtr lookupVolume(virConnectPtr conn, std::string_view path) {
    VolPtr vol(virStorageVolLookupByPath(conn, std::string(path).c_str()));
    if (!vol) {
        const int code = HypervisorConnector::lastErrorCode();
        if (code != VIR_ERR_NO_STORAGE_VOL) {
            throw LibvirtException(std::format("lookup volume {}: {}", path, HypervisorConnector::lastError()));
        }
        virResetLastError();
    }
    return vol;
}

} // namespace

VirtualMachineStorageManager::VirtualMachineStorageManager(std::shared_ptr<HypervisorConnector> conn)
    : connector(std::move(conn)) {}

void VirtualMachineStorageManager::createVolume(const VirtualMachineDisk& disk) {
    if (!disk.sizeGiB) throw StorageException("no size given for " + disk.path);

    auto* conn = connector->ensureConnected();
    const std::filesystem::path file(disk.path);
    auto pool = poolFor(conn, file);
    if (lookupVolume(conn, disk.path)) {
        throw StorageException("volume already exists: " + disk.path);
    }

    VolumeDefinitionBuilder builder;
    builder.setName(file.filename().string()).setCapacityGiB(*disk.sizeGiB).setFormat(disk.format);
    VolPtr vol(virStorageVolCreateXML(pool.get(), builder.build().c_str(), 0));
    if (!vol) {
        throw LibvirtException(std::format("create volume {}: {}", disk.path, HypervisorConnector::lastError()));
    }
    VLOG_INFO("Created {} GiB {} volume {}", *disk.sizeGiB, disk.format, disk.path);
}

void VirtualMachineStorageManager::deleteVolume(std::string_view path) {
    auto* conn = connector->ensureConnected();
    poolFor(conn, std::filesystem::path(path));
    auto vol = lookupVolume(conn, path);
    if (!vol) {
        VLOG_DEBUG("No volume at {}, nothing to delete", path);
        return;
    }
    if (virStorageVolDelete(vol.get(), 0) < 0) {
        throw LibvirtException(std::format("delete volume {}: {}", path, HypervisorConnector::lastError()));
    }
    VLOG_INFO("Deleted volume {}", path);
}
