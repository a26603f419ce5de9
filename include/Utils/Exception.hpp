#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include "Utils/Result.hpp"

class VmException : public std::runtime_error {
    std::string detail_;

public:
    explicit VmException(const std::string& msg) : VmException("", msg) {}

    // message without the class prefixes
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

protected:
    VmException(std::string_view kind, const std::string& msg)
        : std::runtime_error("[VmException] " + std::string(kind) + msg), detail_(msg) {}
};

class LibvirtException : public VmException {
public:
    explicit LibvirtException(const std::string& msg) : VmException("[Libvirt] ", msg) {}
};

class StorageException : public VmException {
public:
    explicit StorageException(const std::string& msg) : VmException("[Storage] ", msg) {}
};

// Error categories carried on Result failures
namespace ErrorTag {
inline constexpr std::string_view Config  = "[Config] ";
inline constexpr std::string_view Libvirt = "[Libvirt] ";
inline constexpr std::string_view Timeout = "[Timeout] ";
inline constexpr std::string_view Tool    = "[Tool] ";
inline constexpr std::string_view Io      = "[Io] ";
} // namespace ErrorTag

[[nodiscard]] inline Failure<std::string> configError(std::string_view msg) {
    return Err(std::string(ErrorTag::Config) + std::string(msg));
}

[[nodiscard]] inline Failure<std::string> libvirtError(std::string_view msg) {
    return Err(std::string(ErrorTag::Libvirt) + std::string(msg));
}

[[nodiscard]] inline Failure<std::string> timeoutError(std::string_view msg) {
    return Err(std::string(ErrorTag::Timeout) + std::string(msg));
}

[[nodiscard]] inline Failure<std::string> toolError(std::string_view msg) {
    return Err(std::string(ErrorTag::Tool) + std::string(msg));
}

// local file that could not be read, written or removed
[[nodiscard]] inline Failure<std::string> ioError(std::string_view msg) {
    return Err(std::string(ErrorTag::Io) + std::string(msg));
}

// Re-wraps an error from a lower layer with the context of the caller.
[[nodiscard]] inline Failure<std::string> propagate(std::string_view context, const std::string& cause) {
    return Err(std::string(context) + ": " + cause);
}
