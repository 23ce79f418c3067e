#include "appdesk/warnings.hpp"

namespace appdesk {

void WarningCollector::emit(Warning warning, const std::string& message) {
    warnings_.push_back({warning_to_string(warning), message});

    if (!json_mode_ && !quiet_) {
        err_ << "Warning: " << message << std::endl;
    }
}

nlohmann::json WarningCollector::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& w : warnings_) {
        arr.push_back({{"key", w.key}, {"message", w.message}});
    }
    return arr;
}

} // namespace appdesk
