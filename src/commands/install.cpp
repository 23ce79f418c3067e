/**
 * appdesk - install command
 *
 * Make sure the runtime package AppImages need (libfuse2) is present.
 */

#include "commands.hpp"

namespace appdesk::commands {

int cmd_install(CommandState& state) {
    const std::string& package = state.ctx.config.package;

    if (state.ctx.packages.is_installed(package)) {
        state.info(package + " already installed.");
        return 0;
    }

    state.info("Installing " + package + "...");
    auto installed = state.ctx.packages.install(package);
    if (installed.isErr()) {
        state.error("failed to install " + package + ": " + installed.error().message());
        return 1;
    }

    state.info(package + " installed.");
    return 0;
}

} // namespace appdesk::commands
