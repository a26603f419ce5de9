#pragma once
#include <string_view>
#include "Cluster/NodeSpec.hpp"
#include "Utils/Result.hpp"

class IImageCustomizer {
public:
    virtual ~IImageCustomizer() = default;

    // mutates the image in place
    [[nodiscard]] virtual Result<void> customize(std::string_view imagePath,
                                                 const ImageCustomization& directives) = 0;
};
