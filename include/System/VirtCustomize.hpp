#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "Core/interfaces/ICommandRunner.hpp"
#include "Core/interfaces/IImageCustomizer.hpp"

/**
 * @brief Image customization through virt-customize
 *
 * Runs with LIBGUESTFS_BACKEND=direct so libguestfs launches its appliance
 * without going through libvirt.
 */
class VirtCustomize : public IImageCustomizer {
public:
    explicit VirtCustomize(std::shared_ptr<ICommandRunner> runner);

    [[nodiscard]] Result<void> customize(std::string_view imagePath,
                                         const ImageCustomization& directives) override;

    [[nodiscard]] static std::vector<std::string> commandLine(std::string_view imagePath,
                                                              const ImageCustomization& directives);

private:
    std::shared_ptr<ICommandRunner> runner;
};
