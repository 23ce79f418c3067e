/**
 * appdesk - remove command
 *
 * Delete the desktop entry for a short name.
 */

#include "commands.hpp"
#include "appdesk/descriptor_store.hpp"

namespace appdesk::commands {

int cmd_remove(CommandState& state, const std::string& name) {
    DescriptorStore store(state.ctx.config);

    auto removed = store.remove(name);
    if (removed.isErr()) {
        if (removed.error().code() == ErrorCode::NOT_FOUND) {
            state.warnings.emit(Warning::descriptor_not_found, removed.error().message());
            if (state.json) {
                state.output_json({{"ok", true}, {"removed", false}, {"name", name}});
            }
            return 0;
        }
        state.error(removed.error().message());
        return 1;
    }

    state.result.descriptors_removed = 1;
    state.info("Removed " + store.path_for(name));
    refresh_launcher(state);

    if (state.json) {
        state.output_json({{"ok", true}, {"removed", true}, {"name", name},
                           {"path", store.path_for(name)}});
    }
    return 0;
}

} // namespace appdesk::commands
