#include "appdesk/config.hpp"
#include "appdesk/platform.hpp"

#include <cctype>
#include <optional>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace appdesk {

namespace {

constexpr const char* kConfigSchema = "appdesk.config.v1";

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<std::string> non_empty(const std::optional<std::string>& value) {
    if (value && !value->empty()) {
        return value;
    }
    return std::nullopt;
}

std::string home_directory(const EnvReader& env) {
    if (auto home = non_empty(env("HOME"))) {
        return *home;
    }
    return ".";
}

} // namespace

Config default_config(const EnvReader& env) {
    Config config;
    std::string home = home_directory(env);

    std::string data_home;
    if (auto xdg = non_empty(env("XDG_DATA_HOME"))) {
        data_home = *xdg;
    } else {
        data_home = home + "/.local/share";
    }

    config.bundle_dir = home + "/apps";
    config.descriptor_dir = data_home + "/applications";
    config.icon_dir = data_home + "/icons/hicolor/256x256/apps";
    return config;
}

std::string default_config_path(const EnvReader& env) {
    if (auto explicit_path = non_empty(env("APPDESK_CONFIG"))) {
        return *explicit_path;
    }
    if (auto xdg = non_empty(env("XDG_CONFIG_HOME"))) {
        return *xdg + "/appdesk/config.json";
    }
    return home_directory(env) + "/.config/appdesk/config.json";
}

Result<void> apply_config_json(Config& config, const std::string& json_str,
                               const std::string& source_path) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<void>::err(Error(ErrorCode::INVALID_CONFIGURATION,
                                       source_path + ": " + e.what()));
    }

    if (!j.is_object()) {
        return Result<void>::err(Error(ErrorCode::INVALID_CONFIGURATION,
                                       source_path + ": JSON must be an object"));
    }

    // $schema is optional, but must match when present
    if (auto schema = get_string(j, "$schema")) {
        if (trim(*schema) != kConfigSchema) {
            return Result<void>::err(Error(ErrorCode::INVALID_CONFIGURATION,
                source_path + ": $schema mismatch: expected " + kConfigSchema));
        }
    }

    for (const char* key : {"apps_dir", "desktop_dir", "icon_dir", "prefix", "package"}) {
        if (j.contains(key) && !j[key].is_string()) {
            return Result<void>::err(Error(ErrorCode::INVALID_CONFIGURATION,
                source_path + ": " + key + " must be a string"));
        }
    }

    if (auto v = get_string(j, "apps_dir")) config.bundle_dir = *v;
    if (auto v = get_string(j, "desktop_dir")) config.descriptor_dir = *v;
    if (auto v = get_string(j, "icon_dir")) config.icon_dir = *v;
    if (auto v = get_string(j, "prefix")) config.prefix = trim(*v);
    if (auto v = get_string(j, "package")) config.package = trim(*v);

    config.source_path = source_path;
    return Result<void>::ok();
}

Result<void> validate_config(const Config& config) {
    if (config.bundle_dir.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_CONFIGURATION, "apps directory is empty"));
    }
    if (config.descriptor_dir.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_CONFIGURATION, "desktop directory is empty"));
    }
    if (config.icon_dir.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_CONFIGURATION, "icon directory is empty"));
    }
    if (config.prefix.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_CONFIGURATION, "prefix is empty"));
    }
    if (config.prefix.find('/') != std::string::npos) {
        return Result<void>::err(Error(ErrorCode::INVALID_CONFIGURATION,
                                       "prefix must not contain '/': " + config.prefix));
    }
    if (config.package.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_CONFIGURATION, "package name is empty"));
    }
    return Result<void>::ok();
}

Result<Config> resolve_config(const ConfigOverrides& overrides, const EnvReader& env) {
    Config config = default_config(env);

    // 1. Config file
    bool explicit_file = overrides.config_file && !overrides.config_file->empty();
    std::string config_path = explicit_file ? *overrides.config_file : default_config_path(env);

    auto content = read_file(config_path);
    if (content) {
        Config from_file = config;
        auto applied = apply_config_json(from_file, *content, config_path);
        if (applied.isOk()) {
            config = std::move(from_file);
            spdlog::debug("Loaded configuration from {}", config_path);
        } else if (explicit_file) {
            return Result<Config>::err(applied.error());
        } else {
            config.warnings.push_back("Ignoring config file " + applied.error().message());
        }
    } else if (explicit_file) {
        return Result<Config>::err(Error(ErrorCode::INVALID_CONFIGURATION,
                                         "config file not found or unreadable: " + config_path));
    } else if (path_exists(config_path)) {
        config.warnings.push_back("Ignoring unreadable config file " + config_path);
    } else {
        spdlog::debug("No configuration file at {}, using defaults", config_path);
    }

    // 2. Environment
    if (auto v = non_empty(env("APPDESK_APPS_DIR"))) config.bundle_dir = *v;
    if (auto v = non_empty(env("APPDESK_DESKTOP_DIR"))) config.descriptor_dir = *v;
    if (auto v = non_empty(env("APPDESK_ICON_DIR"))) config.icon_dir = *v;
    if (auto v = non_empty(env("APPDESK_PREFIX"))) config.prefix = *v;

    // 3. Command line
    if (auto v = non_empty(overrides.bundle_dir)) config.bundle_dir = *v;
    if (auto v = non_empty(overrides.descriptor_dir)) config.descriptor_dir = *v;
    if (auto v = non_empty(overrides.icon_dir)) config.icon_dir = *v;
    if (auto v = non_empty(overrides.prefix)) config.prefix = *v;

    auto valid = validate_config(config);
    if (valid.isErr()) {
        return Result<Config>::err(valid.error());
    }

    return Result<Config>::ok(config);
}

} // namespace appdesk
