#include "appdesk/bundle_store.hpp"
#include "appdesk/identifier.hpp"
#include "appdesk/platform.hpp"

#include <algorithm>
#include <cctype>

#include <fnmatch.h>
#include <glob.h>

#include <spdlog/spdlog.h>

namespace appdesk {

namespace {

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool equal_ignore_case(const std::string& a, size_t a_pos, const std::string& b) {
    for (size_t i = 0; i < b.size(); ++i) {
        if (lower(a[a_pos + i]) != lower(b[i])) {
            return false;
        }
    }
    return true;
}

// Expand ~ and glob patterns. GLOB_NOCHECK keeps an unmatched pattern as-is.
std::vector<std::string> expand_pattern(const std::string& pattern) {
    std::vector<std::string> paths;

    glob_t g{};
    int rc = glob(pattern.c_str(), GLOB_NOCHECK | GLOB_TILDE, nullptr, &g);
    if (rc == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i) {
            paths.emplace_back(g.gl_pathv[i]);
        }
    } else {
        paths.push_back(pattern);
    }
    globfree(&g);

    return paths;
}

} // namespace

bool ends_with_ignore_case(const std::string& s, const std::string& suffix) {
    if (s.size() < suffix.size()) return false;
    return equal_ignore_case(s, s.size() - suffix.size(), suffix);
}

std::string Bundle::full_base_name() const {
    return appdesk::full_base_name(filename);
}

std::string Bundle::identifier() const {
    return derive_identifier(filename);
}

Bundle make_bundle(const std::string& path) {
    Bundle bundle;
    bundle.path = path;
    bundle.filename = get_filename(path);
    return bundle;
}

std::vector<Bundle> BundleStore::enumerate() const {
    std::vector<Bundle> bundles;

    if (!is_directory(dir_)) {
        spdlog::debug("Bundle directory {} does not exist", dir_);
        return bundles;
    }

    for (const auto& name : list_directory(dir_)) {
        if (!ends_with_ignore_case(name, extension_)) continue;

        std::string path = join_path(absolute_path(dir_), name);
        if (!is_regular_file(path)) continue;

        bundles.push_back(make_bundle(path));
    }

    std::sort(bundles.begin(), bundles.end(),
              [](const Bundle& a, const Bundle& b) { return a.filename < b.filename; });
    return bundles;
}

bool BundleStore::is_path_token(const std::string& token) const {
    return token.find('/') != std::string::npos || ends_with_ignore_case(token, extension_);
}

std::vector<Bundle> BundleStore::resolve(const std::string& token) const {
    std::vector<Bundle> result;

    if (token.empty()) {
        return result;
    }

    if (is_path_token(token)) {
        for (const auto& path : expand_pattern(token)) {
            result.push_back(make_bundle(path));
        }
        spdlog::debug("Token '{}' expanded to {} path(s)", token, result.size());
        return result;
    }

    // Same as find -iname "token*": the token may carry glob characters
    std::string pattern = token + "*";
    for (auto& bundle : enumerate()) {
        if (fnmatch(pattern.c_str(), bundle.filename.c_str(), FNM_CASEFOLD) == 0) {
            result.push_back(std::move(bundle));
        }
    }
    spdlog::debug("Token '{}' matched {} bundle(s) in {}", token, result.size(), dir_);
    return result;
}

bool BundleStore::exists(const Bundle& bundle) const {
    return is_regular_file(bundle.path);
}

} // namespace appdesk
