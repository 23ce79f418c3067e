#pragma once

#include "appdesk/config.hpp"
#include "appdesk/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace appdesk {

/**
 * @brief A descriptor file read back from the store
 */
struct DescriptorFile {
    std::string identifier;
    std::string filename;
    std::string path;
    std::string content;
};

// ============================================================================
// Descriptor Store
// ============================================================================

/**
 * @brief Directory of desktop entries named "{prefix}-{identifier}.desktop"
 *
 * Only files with that shape belong to the store; other entries in the
 * directory are never listed, read or removed.
 */
class DescriptorStore {
public:
    explicit DescriptorStore(const Config& config)
        : dir_(config.descriptor_dir),
          prefix_(config.prefix),
          extension_(config.descriptor_extension) {}

    const std::string& directory() const { return dir_; }

    /// "{prefix}-{identifier}.desktop"
    std::string filename_for(const std::string& identifier) const;

    /// Full path of the descriptor for an identifier
    std::string path_for(const std::string& identifier) const;

    /// Identifier encoded in a descriptor filename, or nullopt if the name
    /// does not have the store's prefix and extension
    std::optional<std::string> identifier_of(const std::string& filename) const;

    /// Sorted filenames of the store's descriptors; empty if the directory
    /// does not exist
    std::vector<std::string> enumerate() const;

    /// Identifiers of all descriptors, in filename order
    std::vector<std::string> identifiers() const;

    /// Create the directory (and parents) if absent
    Result<void> ensure_directory() const;

    /**
     * @brief Create or overwrite the descriptor for an identifier
     *
     * Creates the directory first, writes atomically, then marks the file
     * executable.
     * @return Path of the written descriptor
     */
    Result<std::string> write(const std::string& identifier, const std::string& content) const;

    /**
     * @brief Read a descriptor by name
     *
     * Exact identifier first, then the first descriptor (sorted) whose
     * filename matches "{prefix}-{name}*.desktop".
     */
    Result<DescriptorFile> read(const std::string& name) const;

    /**
     * @brief Delete the descriptor for an identifier
     * @return true if removed; NOT_FOUND error if there was none
     */
    Result<bool> remove(const std::string& identifier) const;

private:
    std::string dir_;
    std::string prefix_;
    std::string extension_;
};

} // namespace appdesk
