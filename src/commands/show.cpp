/**
 * appdesk - show command
 *
 * Print the descriptor for a short name.
 */

#include "commands.hpp"
#include "appdesk/descriptor_store.hpp"

namespace appdesk::commands {

int cmd_show(CommandState& state, const std::string& name) {
    DescriptorStore store(state.ctx.config);

    auto file = store.read(name);
    if (file.isErr()) {
        if (file.error().code() != ErrorCode::NOT_FOUND) {
            state.error(file.error().message());
            return 1;
        }
        state.warnings.emit(Warning::descriptor_not_found, file.error().message());
        if (state.json) {
            nlohmann::json j;
            j["ok"] = false;
            j["name"] = name;
            state.output_json(j);
        }
        return 1;
    }

    const auto& descriptor = file.value();
    if (state.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["name"] = name;
        j["identifier"] = descriptor.identifier;
        j["path"] = descriptor.path;
        j["content"] = descriptor.content;
        state.output_json(j);
    } else {
        state.ctx.out << descriptor.content;
        if (!descriptor.content.empty() && descriptor.content.back() != '\n') {
            state.ctx.out << std::endl;
        }
    }
    return 0;
}

} // namespace appdesk::commands
