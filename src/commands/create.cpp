/**
 * appdesk - create command
 *
 * Resolve bundle targets, make them executable and, when asked,
 * (re)generate their desktop entries. The launcher index is refreshed once
 * per batch.
 */

#include "commands.hpp"
#include "appdesk/bundle_store.hpp"
#include "appdesk/descriptor_store.hpp"
#include "appdesk/desktop_entry.hpp"
#include "appdesk/platform.hpp"

#include <spdlog/spdlog.h>

namespace appdesk::commands {

namespace {

std::vector<Bundle> resolve_targets(CommandState& state, const BundleStore& store,
                                    const std::vector<std::string>& tokens) {
    if (tokens.empty()) {
        // No explicit arguments: act on every bundle in the directory
        return store.enumerate();
    }

    std::vector<Bundle> targets;
    for (const auto& token : tokens) {
        auto matches = store.resolve(token);
        if (matches.empty()) {
            state.warnings.emit(Warning::no_bundle_match,
                                "No AppImage found for basename '" + token + "'");
            continue;
        }
        targets.insert(targets.end(), matches.begin(), matches.end());
    }
    return targets;
}

void mark_executable(CommandState& state, const std::string& path) {
    if (is_executable(path)) {
        state.info("✔ " + path + " already executable");
        return;
    }
    if (!make_executable(path)) {
        // The descriptor is still useful once the user fixes the mode
        state.warnings.emit(Warning::chmod_failed, "Cannot make " + path + " executable");
        return;
    }
    state.info("✔ Made " + path + " executable");
}

} // namespace

void refresh_launcher(CommandState& state) {
    const std::string& dir = state.ctx.config.descriptor_dir;
    state.info("Updating desktop database...");
    auto refreshed = state.ctx.launcher.refresh(dir);
    if (refreshed.isErr()) {
        state.warnings.emit(Warning::refresh_failed,
                            "desktop database refresh failed: " + refreshed.error().message());
        return;
    }
    state.result.refreshed = true;
}

int cmd_process(CommandState& state, const std::vector<std::string>& tokens,
                bool create_descriptors) {
    const Config& config = state.ctx.config;
    BundleStore bundles(config);
    DescriptorStore descriptors(config);
    DescriptorWriter writer(config, descriptors);

    auto targets = resolve_targets(state, bundles, tokens);
    if (targets.empty()) {
        state.warnings.emit(Warning::no_bundles_found, "No AppImage files found to process.");
        if (state.json) {
            state.output_json({{"ok", false}, {"processed", 0}});
        }
        return 1;
    }

    if (create_descriptors) {
        auto dir = descriptors.ensure_directory();
        if (dir.isErr()) {
            state.error(dir.error().message());
            return 1;
        }
    }

    nlohmann::json entries = nlohmann::json::array();
    bool fatal = false;

    for (const auto& target : targets) {
        std::string path = absolute_path(target.path);
        Bundle bundle = make_bundle(path);

        if (!bundles.exists(bundle)) {
            state.warnings.emit(Warning::bundle_missing, "Skipping non-existent file: " + path);
            continue;
        }

        mark_executable(state, path);
        state.result.processed++;

        if (!create_descriptors) {
            continue;
        }

        if (bundle.identifier().empty()) {
            state.warnings.emit(Warning::ambiguous_identifier,
                                "Cannot derive a name from '" + bundle.filename +
                                "', no desktop entry created");
            continue;
        }

        auto written = writer.write(path);
        if (written.isErr()) {
            state.error(written.error().message());
            fatal = true;
            break;
        }

        state.result.descriptors_written++;
        state.info("✔ Created desktop entry: " + written.value().descriptor_path);

        nlohmann::json entry;
        entry["bundle"] = path;
        entry["identifier"] = written.value().identifier;
        entry["descriptor"] = written.value().descriptor_path;
        entry["icon"] = written.value().icon_path ? nlohmann::json(*written.value().icon_path)
                                                  : nlohmann::json(nullptr);
        entries.push_back(entry);
    }

    // Refresh once, also after an abort, so entries already written show up
    if (state.result.descriptors_written > 0) {
        refresh_launcher(state);
        if (!fatal) {
            state.info("✅ Done.");
        }
    }
    if (fatal) {
        return 1;
    }

    int exit_code = 0;
    if (state.result.processed == 0) {
        state.warnings.emit(Warning::no_bundles_found, "No AppImage files found to process.");
        exit_code = 1;
    }

    spdlog::debug("Processed {} of {} target(s), wrote {} descriptor(s)",
                  state.result.processed, targets.size(), state.result.descriptors_written);

    if (state.json) {
        nlohmann::json j;
        j["ok"] = exit_code == 0;
        j["processed"] = state.result.processed;
        j["entries"] = entries;
        state.output_json(j);
    }

    return exit_code;
}

} // namespace appdesk::commands
