#pragma once

#include "appdesk/config.hpp"

#include <string>
#include <vector>

namespace appdesk {

// ============================================================================
// Bundle
// ============================================================================

/**
 * @brief A bundle file on disk (e.g. ~/apps/Foo-1.2.AppImage)
 *
 * The short identifier is computed on demand, never stored.
 */
struct Bundle {
    std::string path;      // as resolved; absolute for enumerated bundles
    std::string filename;

    std::string full_base_name() const;
    std::string identifier() const;
};

// Bundle for a path; filename is taken from the last path component
Bundle make_bundle(const std::string& path);

// Case-insensitive suffix test ("foo.appimage" ends with ".AppImage")
bool ends_with_ignore_case(const std::string& s, const std::string& suffix);

// ============================================================================
// Bundle Store
// ============================================================================

/**
 * @brief Read-only view over the bundle directory
 *
 * A missing directory enumerates as empty; the directory may be created
 * later by the user.
 */
class BundleStore {
public:
    explicit BundleStore(const Config& config)
        : dir_(config.bundle_dir), extension_(config.bundle_extension) {}

    const std::string& directory() const { return dir_; }

    /// Regular files at the top level of the directory with the bundle
    /// extension (any case), sorted by filename.
    std::vector<Bundle> enumerate() const;

    /**
     * @brief Resolve a user-supplied token to bundles
     *
     * Tokens containing '/' or ending in the bundle extension are paths or
     * glob patterns; they are expanded, and a pattern with no match is kept
     * literally so the caller can report it missing. Any other token is a
     * short-name query: every enumerated bundle whose filename matches the
     * pattern "{token}*" (any case), so "Foo" and "F*Bar" both work.
     *
     * @return Matching bundles; empty when nothing matches
     */
    std::vector<Bundle> resolve(const std::string& token) const;

    /// True if the token would be treated as a path rather than a name
    bool is_path_token(const std::string& token) const;

    /// True if the bundle is still a regular file
    bool exists(const Bundle& bundle) const;

private:
    std::string dir_;
    std::string extension_;
};

} // namespace appdesk
