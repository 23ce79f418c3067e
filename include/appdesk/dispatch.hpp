#pragma once

/**
 * @file dispatch.hpp
 * @brief Maps one parsed invocation to one action and runs it
 *
 * Every early exit (help, show, list, remove) is a value of Action rather
 * than a process exit, so the whole command surface can be driven from
 * tests with fake collaborators and string streams.
 */

#include "appdesk/config.hpp"
#include "appdesk/system.hpp"
#include "appdesk/warnings.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace appdesk {

/**
 * @brief Command-line request after argument parsing
 */
struct Invocation {
    bool help = false;                       // -h, --help
    std::optional<std::string> show_name;    // -s, --show-desktop NAME
    bool install_package = false;            // -i, --install-libfuse2
    bool list = false;                       // -l, --list
    std::optional<std::string> remove_name;  // -r, --remove-desktop NAME
    bool create = false;                     // -c, --create-desktop
    std::vector<std::string> bundles;        // positional bundle tokens

    bool json = false;
    bool quiet = false;
};

enum class Action {
    Help,
    Show,
    List,
    Remove,
    Process,  // make executable, then (with create) write descriptors
};

const char* action_to_string(Action action);

struct ActionPlan {
    Action action = Action::Help;
    bool install_first = false;       // run the package step before the action
    bool create_descriptors = false;  // Process writes descriptors, not just chmod
};

/**
 * @brief Select the action, first matching rule wins:
 *   help > show > list > remove > process.
 * An invocation with no flags and no bundles is a help request.
 * Install runs before list/remove/process; show ignores it. Install on its
 * own continues into Process without descriptor creation, so the bundle
 * directory is still made executable.
 */
ActionPlan plan_invocation(const Invocation& invocation);

/**
 * @brief Everything an action needs; owned by the caller
 */
struct RunContext {
    const Config& config;
    PackageManager& packages;
    LauncherIndex& launcher;
    std::ostream& out;
    std::ostream& err;
    std::string usage;  // help text printed for Action::Help
};

struct DispatchResult {
    Action action = Action::Help;
    int exit_code = 0;
    std::size_t processed = 0;         // bundles handled by Process
    std::size_t descriptors_written = 0;
    std::size_t descriptors_removed = 0;
    bool refreshed = false;            // launcher index refresh ran
    std::vector<WarningObject> warnings;
};

/**
 * @brief Run an invocation to completion
 *
 * Exit codes: 0 success (warnings allowed), 1 fatal error, nothing to
 * process, or show target not found.
 */
DispatchResult dispatch(const Invocation& invocation, RunContext& ctx);

} // namespace appdesk
