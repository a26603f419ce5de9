#include "System/VirtCustomize.hpp"
#include <format>
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"

namespace {

std::string join(const std::vector<std::string>& items, char sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

} // namespace

VirtCustomize::VirtCustomize(std::shared_ptr<ICommandRunner> runner)
    : runner(std::move(runner)) {}

std::vector<std::string> VirtCustomize::commandLine(std::string_view imagePath,
                                                    const ImageCustomization& directives) {
    std::vector<std::string> argv{"env", "LIBGUESTFS_BACKEND=direct", "virt-customize",
                                  "-a", std::string(imagePath)};

    if (!directives.sshPubKeyFile.empty()) {
        argv.insert(argv.end(), {"--ssh-inject", "root:file:" + directives.sshPubKeyFile});
    }
    if (!directives.install.empty()) {
        argv.insert(argv.end(), {"--install", join(directives.install, ',')});
    }
    if (!directives.uninstall.empty()) {
        argv.insert(argv.end(), {"--uninstall", join(directives.uninstall, ',')});
    }
    for (const auto& file : directives.copyIn) {
        argv.insert(argv.end(), {"--copy-in", file});
    }
    if (directives.selinuxRelabel) {
        argv.emplace_back("--selinux-relabel");
    }
    for (const auto& cmd : directives.runCommands) {
        argv.insert(argv.end(), {"--run-command", cmd});
    }
    return argv;
}

Result<void> VirtCustomize::customize(std::string_view imagePath, const ImageCustomization& directives) {
    VLOG_INFO("Customizing VM image at {}", imagePath);

    auto res = runner->run(commandLine(imagePath, directives));
    if (res.isErr()) return Failure<std::string>{res.error()};
    if (res.value().code != 0) {
        return toolError(std::format("virt-customize failed (exit {})\nOutput: {}", res.value().code, res.value().output));
    }

    VLOG_INFO("VM customization of {} completed", imagePath);
    return {};
}
