/**
 * appdesk CLI - Common utilities and types
 */

#pragma once

#include <appdesk/config.hpp>
#include <appdesk/dispatch.hpp>
#include <appdesk/platform.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

#ifndef APPDESK_VERSION
#define APPDESK_VERSION "0.0.0"
#endif

namespace appdesk::cli {

/**
 * Options that only shape the front-end (logging, configuration source).
 */
struct GlobalOptions {
    std::string config_file;   // --config
    std::string apps_dir;      // --apps-dir
    std::string desktop_dir;   // --desktop-dir
    std::string icon_dir;      // --icon-dir
    std::string prefix;        // --prefix
    bool verbose = false;      // -v, --verbose
};

inline std::optional<std::string> optional_value(const std::string& s) {
    return s.empty() ? std::nullopt : std::make_optional(s);
}

inline ConfigOverrides to_overrides(const GlobalOptions& opts) {
    ConfigOverrides overrides;
    overrides.config_file = optional_value(opts.config_file);
    overrides.bundle_dir = optional_value(opts.apps_dir);
    overrides.descriptor_dir = optional_value(opts.desktop_dir);
    overrides.icon_dir = optional_value(opts.icon_dir);
    overrides.prefix = optional_value(opts.prefix);
    return overrides;
}

/**
 * Diagnostics go to stderr; -v lowers the level to debug.
 */
inline void init_logging(bool verbose) {
    auto logger = spdlog::stderr_color_mt("appdesk");
    logger->set_pattern("[%l] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

// Error reported before dispatch() runs (configuration problems)
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline const char* usage_footer() {
    return "Bundles may be paths, globs (~/apps/*.AppImage) or short names (Foo).\n"
           "With no bundle arguments every *.AppImage in the apps directory is used.\n"
           "\n"
           "Examples:\n"
           "  appdesk -i -c ~/apps/*.AppImage\n"
           "  appdesk -l\n"
           "  appdesk -s Foo\n";
}

} // namespace appdesk::cli
