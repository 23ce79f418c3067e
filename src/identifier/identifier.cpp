#include "appdesk/identifier.hpp"

namespace appdesk {

namespace {

std::string filename_component(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

} // namespace

bool is_identifier_separator(char c) {
    return c == '-' || c == '_';
}

std::string strip_extension(const std::string& filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return filename;
    }
    return filename.substr(0, dot);
}

std::string full_base_name(const std::string& path_or_filename) {
    return strip_extension(filename_component(path_or_filename));
}

std::string derive_identifier(const std::string& path_or_filename) {
    std::string base = full_base_name(path_or_filename);
    for (size_t i = 0; i < base.size(); ++i) {
        if (is_identifier_separator(base[i])) {
            return base.substr(0, i);
        }
    }
    return base;
}

} // namespace appdesk
