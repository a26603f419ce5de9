#pragma once

#include <libvirt/libvirt.h>
#include <mutex>
#include <string>

/**
 * @brief Lazily opened libvirt connection shared by every handle
 *
 * The connection is opened on first use so that configuration errors are
 * reported before libvirt is contacted. libvirt's default error printer is
 * replaced by the process logger.
 */
class HypervisorConnector {
public:
    explicit HypervisorConnector(std::string uri);
    ~HypervisorConnector();

    HypervisorConnector(const HypervisorConnector&) = delete;
    HypervisorConnector& operator=(const HypervisorConnector&) = delete;

    // opens the connection on first call; throws LibvirtException when libvirt refuses
    [[nodiscard]] virConnectPtr ensureConnected();
    [[nodiscard]] bool isConnected() const noexcept;
    [[nodiscard]] const std::string& getUri() const noexcept;

    // message of the last libvirt error on this thread, or "unknown"
    [[nodiscard]] static std::string lastError();
    // libvirt error code of the last error on this thread (VIR_ERR_OK when none)
    [[nodiscard]] static int lastErrorCode() noexcept;

private:
    static void logLibvirtError(void* userData, virErrorPtr error);

    mutable std::mutex mutex_;
    virConnectPtr conn{nullptr};
    std::string uri;
};
