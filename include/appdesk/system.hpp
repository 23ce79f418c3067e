#pragma once

#include "appdesk/result.hpp"

#include <string>
#include <vector>

namespace appdesk {

// ============================================================================
// Process Execution
// ============================================================================

struct ExecResult {
    bool ok = false;        // process ran and was waited for
    int exit_code = -1;
    std::string error;
};

/**
 * Run argv[0] (looked up in PATH) with fork/exec and wait for it.
 * With discard_output, the child's stdout and stderr go to /dev/null.
 */
ExecResult run_command(const std::vector<std::string>& argv, bool discard_output = false);

// ============================================================================
// External Collaborators
// ============================================================================

/**
 * @brief OS package manager: query and install by package name
 */
class PackageManager {
public:
    virtual ~PackageManager() = default;

    virtual bool is_installed(const std::string& package) = 0;
    virtual Result<void> install(const std::string& package) = 0;
};

/**
 * @brief Refreshes the launcher's index of desktop entries
 */
class LauncherIndex {
public:
    virtual ~LauncherIndex() = default;

    virtual Result<void> refresh(const std::string& descriptor_dir) = 0;
};

/// dpkg for queries, "sudo apt-get" for installs
class AptPackageManager : public PackageManager {
public:
    bool is_installed(const std::string& package) override;
    Result<void> install(const std::string& package) override;
};

/// update-desktop-database
class DesktopDatabase : public LauncherIndex {
public:
    Result<void> refresh(const std::string& descriptor_dir) override;
};

} // namespace appdesk
