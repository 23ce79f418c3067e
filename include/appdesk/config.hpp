#pragma once

#include "appdesk/result.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace appdesk {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Directories and naming used by every component
 *
 * Defaults (DATA is $XDG_DATA_HOME, else $HOME/.local/share):
 *   bundle_dir      $HOME/apps
 *   descriptor_dir  DATA/applications
 *   icon_dir        DATA/icons/hicolor/256x256/apps
 *   prefix          appimage
 *   package         libfuse2
 */
struct Config {
    std::string bundle_dir;
    std::string descriptor_dir;
    std::string icon_dir;
    std::string prefix = "appimage";
    std::string package = "libfuse2";

    // Fixed by the desktop-entry and AppImage conventions
    std::string bundle_extension = ".AppImage";
    std::string descriptor_extension = ".desktop";

    // Config file the values were read from, empty if none
    std::string source_path;

    // Problems with the default config file; the file was skipped and these
    // are reported as warnings when a command runs
    std::vector<std::string> warnings;
};

/**
 * @brief Values given on the command line; they win over everything else
 */
struct ConfigOverrides {
    std::optional<std::string> config_file;
    std::optional<std::string> bundle_dir;
    std::optional<std::string> descriptor_dir;
    std::optional<std::string> icon_dir;
    std::optional<std::string> prefix;
};

using EnvReader = std::function<std::optional<std::string>(const std::string&)>;

// Build the default configuration from HOME / XDG_DATA_HOME
Config default_config(const EnvReader& env);

// Default config file location: $APPDESK_CONFIG, else
// $XDG_CONFIG_HOME/appdesk/config.json, else $HOME/.config/appdesk/config.json
std::string default_config_path(const EnvReader& env);

// Apply a JSON config document on top of `config`.
// Recognized string keys: apps_dir, desktop_dir, icon_dir, prefix, package.
Result<void> apply_config_json(Config& config, const std::string& json_str,
                               const std::string& source_path);

// Check invariants the stores rely on (non-empty directories, usable prefix)
Result<void> validate_config(const Config& config);

/**
 * @brief Resolve the effective configuration
 *
 * Precedence: overrides > APPDESK_* environment > config file > defaults.
 * An explicitly named config file (--config) must exist and parse. A file at
 * the default location is optional; when it cannot be read or parsed it is
 * skipped and the problem is recorded in Config::warnings.
 */
Result<Config> resolve_config(const ConfigOverrides& overrides, const EnvReader& env);

} // namespace appdesk
