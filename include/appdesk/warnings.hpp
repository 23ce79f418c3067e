#pragma once

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace appdesk {

// ============================================================================
// Warning Keys
// ============================================================================

enum class Warning {
    no_bundle_match,        // bundle token resolved to nothing
    no_bundles_found,       // nothing at all to process
    bundle_missing,         // target vanished between resolution and processing
    ambiguous_identifier,   // filename starts with a separator
    descriptor_not_found,   // show / remove target absent
    refresh_failed,         // launcher index refresh failed
    chmod_failed,           // bundle could not be made executable
    config_ignored,         // default config file unreadable or malformed
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::no_bundle_match: return "no_bundle_match";
        case Warning::no_bundles_found: return "no_bundles_found";
        case Warning::bundle_missing: return "bundle_missing";
        case Warning::ambiguous_identifier: return "ambiguous_identifier";
        case Warning::descriptor_not_found: return "descriptor_not_found";
        case Warning::refresh_failed: return "refresh_failed";
        case Warning::chmod_failed: return "chmod_failed";
        case Warning::config_ignored: return "config_ignored";
    }
    return "unknown";
}

struct WarningObject {
    std::string key;
    std::string message;
};

// ============================================================================
// Warning Collector
// ============================================================================

/**
 * Collects warnings raised while a command runs.
 * In text mode, warnings are printed immediately as "Warning: <message>"
 * (unless quiet). In JSON mode, they are emitted with the command's document.
 * Warnings are always recorded, so exit-status decisions never depend on
 * the output mode.
 */
class WarningCollector {
public:
    explicit WarningCollector(std::ostream& err, bool json_mode = false, bool quiet = false)
        : err_(err), json_mode_(json_mode), quiet_(quiet) {}

    void emit(Warning warning, const std::string& message);

    const std::vector<WarningObject>& get_warnings() const { return warnings_; }
    bool empty() const { return warnings_.empty(); }

    nlohmann::json to_json() const;

private:
    std::ostream& err_;
    bool json_mode_;
    bool quiet_;
    std::vector<WarningObject> warnings_;
};

} // namespace appdesk
