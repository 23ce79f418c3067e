#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace appdesk {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Create a directory and its parents (fsync on parent)
AtomicWriteResult atomic_create_directory(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Absolute, lexically normalized path. Symlinks are not resolved.
std::string absolute_path(const std::string& path);

// Check if a path exists
bool path_exists(const std::string& path);

// Check if a path is a directory
bool is_directory(const std::string& path);

// Check if a path is a regular file
bool is_regular_file(const std::string& path);

// List filenames (not full paths) of the entries of a directory.
// Returns an empty list for a missing or unreadable directory, and stops
// early if iteration fails part way.
std::vector<std::string> list_directory(const std::string& path);

// Read entire file contents as string; nullopt unless it is a readable regular file
std::optional<std::string> read_file(const std::string& path);

// Create parent directories recursively
bool create_directories(const std::string& path);

// Remove a file. Returns true only if a file was removed.
bool remove_file(const std::string& path);

// Copy a file, overwriting the destination
bool copy_file(const std::string& src, const std::string& dst);

// ============================================================================
// Permissions
// ============================================================================

// True if the owner execute bit is set
bool is_executable(const std::string& path);

// Add the owner, group and other execute bits
bool make_executable(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

} // namespace appdesk
