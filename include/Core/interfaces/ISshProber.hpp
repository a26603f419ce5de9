#pragma once
#include <string_view>
#include "Utils/Result.hpp"

class ISshProber {
public:
    virtual ~ISshProber() = default;

    // drops cached host keys for a hostname or literal IP
    [[nodiscard]] virtual Result<void> purgeHostKey(std::string_view host) = 0;

    // one non-interactive authenticated no-op; any failure means "not reachable yet"
    [[nodiscard]] virtual Result<void> probe(std::string_view user,
                                             std::string_view address,
                                             std::string_view keyPath) = 0;
};
