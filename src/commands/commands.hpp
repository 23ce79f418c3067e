/**
 * appdesk - per-action command implementations
 *
 * Internal to the library; dispatch() is the only caller.
 */

#pragma once

#include "appdesk/dispatch.hpp"
#include "appdesk/warnings.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace appdesk::commands {

/**
 * State shared by the commands of one dispatch() call.
 */
struct CommandState {
    RunContext& ctx;
    WarningCollector& warnings;
    DispatchResult& result;
    bool json = false;
    bool quiet = false;

    // Informational line on stdout; suppressed in JSON and quiet mode
    void info(const std::string& msg) const {
        if (!json && !quiet) {
            ctx.out << msg << std::endl;
        }
    }

    // Fatal error: "Error: ..." on stderr, or a JSON error document
    void error(const std::string& msg) const {
        if (json) {
            nlohmann::json j;
            j["ok"] = false;
            j["error"] = msg;
            if (!warnings.empty()) {
                j["warnings"] = warnings.to_json();
            }
            ctx.out << j.dump(2) << std::endl;
        } else {
            ctx.err << "Error: " << msg << std::endl;
        }
    }

    // JSON document with collected warnings attached
    void output_json(nlohmann::json j) const {
        if (!warnings.empty() && !j.contains("warnings")) {
            j["warnings"] = warnings.to_json();
        }
        ctx.out << j.dump(2) << std::endl;
    }
};

int cmd_show(CommandState& state, const std::string& name);
int cmd_install(CommandState& state);
int cmd_list(CommandState& state);
int cmd_remove(CommandState& state, const std::string& name);
// Without create_descriptors only the executable bits are touched
int cmd_process(CommandState& state, const std::vector<std::string>& tokens,
                bool create_descriptors);

// Run the launcher index refresh once; failure is a warning
void refresh_launcher(CommandState& state);

} // namespace appdesk::commands
