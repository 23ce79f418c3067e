#pragma once

#include "appdesk/bundle_store.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace appdesk {

// ============================================================================
// Reconciliation
// ============================================================================

/**
 * @brief Partition of bundles by whether a descriptor exists for them
 *
 * matched and unmatched keep the input order, are disjoint, and together
 * contain every input bundle.
 */
struct Reconciliation {
    std::vector<Bundle> matched;
    std::vector<Bundle> unmatched;
};

/**
 * @brief Split bundles by membership of their identifier in `identifiers`
 *
 * The identifier set is built once; each bundle is a single lookup.
 * Duplicate identifiers in the input are not treated specially.
 */
Reconciliation reconcile(const std::vector<Bundle>& bundles,
                         const std::vector<std::string>& identifiers);

/**
 * @brief Status report shown by --list
 */
struct ReconcileReport {
    std::string bundle_dir;
    std::string descriptor_dir;
    std::string prefix;
    Reconciliation result;
    std::vector<std::string> orphaned;  // descriptor identifiers with no bundle
};

ReconcileReport build_report(const std::string& bundle_dir,
                             const std::string& descriptor_dir,
                             const std::string& prefix,
                             const std::vector<Bundle>& bundles,
                             const std::vector<std::string>& identifiers);

nlohmann::json report_to_json(const ReconcileReport& report);

} // namespace appdesk
