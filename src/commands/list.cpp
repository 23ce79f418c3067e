/**
 * appdesk - list command
 *
 * Report which bundles have a desktop entry and which do not.
 */

#include "commands.hpp"
#include "appdesk/bundle_store.hpp"
#include "appdesk/descriptor_store.hpp"
#include "appdesk/reconcile.hpp"

namespace appdesk::commands {

int cmd_list(CommandState& state) {
    const Config& config = state.ctx.config;
    BundleStore bundles(config);
    DescriptorStore descriptors(config);

    auto report = build_report(bundles.directory(), descriptors.directory(), config.prefix,
                               bundles.enumerate(), descriptors.identifiers());

    if (state.json) {
        nlohmann::json j = report_to_json(report);
        j["ok"] = true;
        state.output_json(j);
        return 0;
    }

    auto& out = state.ctx.out;
    out << "Scanning " << report.bundle_dir << " for *" << config.bundle_extension << " ..." << std::endl;
    out << "Scanning " << report.descriptor_dir << " for " << config.prefix << "-*"
        << config.descriptor_extension << " ..." << std::endl;

    out << "=== AppImages with a matching .desktop entry ===" << std::endl;
    for (const auto& bundle : report.result.matched) {
        out << "  ✔ " << bundle.filename << std::endl;
    }

    out << std::endl;
    out << "=== AppImages missing a .desktop entry ===" << std::endl;
    for (const auto& bundle : report.result.unmatched) {
        out << "  ✘ " << bundle.filename << std::endl;
    }

    return 0;
}

} // namespace appdesk::commands
