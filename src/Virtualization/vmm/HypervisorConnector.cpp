#include "Virtualization/vmm/HypervisorConnector.hpp"
#include <cstdlib>
#include <libvirt/virterror.h>
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"

HypervisorConnector::HypervisorConnector(std::string uri)
    : uri(std::move(uri)) {
    virSetErrorFunc(nullptr, &HypervisorConnector::logLibvirtError);
}

HypervisorConnector::~HypervisorConnector() {
    std::scoped_lock lock(mutex_);
    if (conn) {
        virConnectClose(conn);
        conn = nullptr;
    }
}

void HypervisorConnector::logLibvirtError(void*, virErrorPtr error) {
    // callers turn the error into an exception; the lookups that expect "not found" reset it
    if (error && error->message) VLOG_DEBUG("libvirt: {} (code {})", error->message, error->code);
}

virConnectPtr HypervisorConnector::ensureConnected() {
    std::scoped_lock lock(mutex_);
    if (conn) return conn;

    conn = virConnectOpen(uri.c_str());
    if (!conn) {
        throw LibvirtException("connect to " + uri + " failed: " + lastError());
    }

    char* host = virConnectGetHostname(conn);
    VLOG_INFO("Connected to {} on {}", uri, host ? host : "unknown host");
    free(host);
    return conn;
}

bool HypervisorConnector::isConnected() const noexcept {
    std::scoped_lock lock(mutex_);
    return conn != nullptr;
}

const std::string& HypervisorConnector::getUri() const noexcept {
    return uri;
}

std::string HypervisorConnector::lastError() {
    virErrorPtr e = virGetLastError();
    return (e && e->message) ? e->message : "unknown";
}

int HypervisorConnector::lastErrorCode() noexcept {
    virErrorPtr e = virGetLastError();
    return e ? e->code : VIR_ERR_OK;
}
