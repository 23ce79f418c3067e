#include "appdesk/reconcile.hpp"

#include <unordered_set>

namespace appdesk {

Reconciliation reconcile(const std::vector<Bundle>& bundles,
                         const std::vector<std::string>& identifiers) {
    std::unordered_set<std::string> has_descriptor(identifiers.begin(), identifiers.end());

    Reconciliation result;
    for (const auto& bundle : bundles) {
        if (has_descriptor.count(bundle.identifier()) > 0) {
            result.matched.push_back(bundle);
        } else {
            result.unmatched.push_back(bundle);
        }
    }
    return result;
}

ReconcileReport build_report(const std::string& bundle_dir,
                             const std::string& descriptor_dir,
                             const std::string& prefix,
                             const std::vector<Bundle>& bundles,
                             const std::vector<std::string>& identifiers) {
    ReconcileReport report;
    report.bundle_dir = bundle_dir;
    report.descriptor_dir = descriptor_dir;
    report.prefix = prefix;
    report.result = reconcile(bundles, identifiers);

    std::unordered_set<std::string> bundle_ids;
    for (const auto& bundle : bundles) {
        bundle_ids.insert(bundle.identifier());
    }
    for (const auto& id : identifiers) {
        if (bundle_ids.count(id) == 0) {
            report.orphaned.push_back(id);
        }
    }

    return report;
}

nlohmann::json report_to_json(const ReconcileReport& report) {
    auto bundle_list = [](const std::vector<Bundle>& bundles) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& b : bundles) {
            arr.push_back({{"file", b.filename}, {"identifier", b.identifier()}, {"path", b.path}});
        }
        return arr;
    };

    nlohmann::json j;
    j["bundle_dir"] = report.bundle_dir;
    j["descriptor_dir"] = report.descriptor_dir;
    j["prefix"] = report.prefix;
    j["matched"] = bundle_list(report.result.matched);
    j["unmatched"] = bundle_list(report.result.unmatched);
    j["orphaned"] = report.orphaned;
    return j;
}

} // namespace appdesk
