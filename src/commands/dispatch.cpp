#include "appdesk/dispatch.hpp"
#include "commands.hpp"

#include <spdlog/spdlog.h>

namespace appdesk {

const char* action_to_string(Action action) {
    switch (action) {
        case Action::Help: return "help";
        case Action::Show: return "show";
        case Action::List: return "list";
        case Action::Remove: return "remove";
        case Action::Process: return "process";
    }
    return "unknown";
}

ActionPlan plan_invocation(const Invocation& invocation) {
    ActionPlan plan;

    bool nothing_requested = !invocation.show_name && !invocation.install_package &&
                             !invocation.list && !invocation.remove_name &&
                             !invocation.create && invocation.bundles.empty();
    if (invocation.help || nothing_requested) {
        plan.action = Action::Help;
        return plan;
    }

    // Show exits before anything else runs, including the package step
    if (invocation.show_name) {
        plan.action = Action::Show;
        return plan;
    }

    plan.install_first = invocation.install_package;

    if (invocation.list) {
        plan.action = Action::List;
    } else if (invocation.remove_name) {
        plan.action = Action::Remove;
    } else {
        plan.action = Action::Process;
        plan.create_descriptors = invocation.create || !invocation.bundles.empty();
    }
    return plan;
}

DispatchResult dispatch(const Invocation& invocation, RunContext& ctx) {
    DispatchResult result;
    ActionPlan plan = plan_invocation(invocation);
    result.action = plan.action;

    spdlog::debug("Dispatching action '{}'{}", action_to_string(plan.action),
                  plan.install_first ? " after package check" : "");

    WarningCollector warnings(ctx.err, invocation.json, invocation.quiet);
    commands::CommandState state{ctx, warnings, result, invocation.json, invocation.quiet};

    for (const auto& message : ctx.config.warnings) {
        warnings.emit(Warning::config_ignored, message);
    }

    auto finish = [&](int code) {
        result.exit_code = code;
        result.warnings = warnings.get_warnings();
        return result;
    };

    if (plan.action == Action::Help) {
        ctx.out << ctx.usage;
        if (!ctx.usage.empty() && ctx.usage.back() != '\n') {
            ctx.out << std::endl;
        }
        return finish(0);
    }

    if (plan.action == Action::Show) {
        return finish(commands::cmd_show(state, *invocation.show_name));
    }

    if (plan.install_first) {
        int rc = commands::cmd_install(state);
        if (rc != 0) {
            return finish(rc);
        }
    }

    switch (plan.action) {
        case Action::List:
            return finish(commands::cmd_list(state));
        case Action::Remove:
            return finish(commands::cmd_remove(state, *invocation.remove_name));
        case Action::Process:
            return finish(commands::cmd_process(state, invocation.bundles,
                                                plan.create_descriptors));
        default:
            break;
    }
    return finish(0);
}

} // namespace appdesk
