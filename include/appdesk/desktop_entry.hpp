#pragma once

#include "appdesk/config.hpp"
#include "appdesk/descriptor_store.hpp"
#include "appdesk/result.hpp"

#include <array>
#include <optional>
#include <string>

namespace appdesk {

// ============================================================================
// Desktop Entry Content
// ============================================================================

// Icon extensions probed next to a bundle, highest priority first
constexpr std::array<const char*, 4> kIconExtensions = {"png", "svg", "jpg", "jpeg"};

struct DesktopEntry {
    std::string name;                  // short identifier
    std::string exec_path;             // absolute bundle path
    std::optional<std::string> icon;   // icon name without extension
};

/**
 * @brief Escape a path for use inside a quoted Exec argument
 *
 * '"', '`', '$' and the backslash get a quoting backslash, and every
 * backslash is then escaped again for the string value, so a literal '$' is
 * written as "\\$" and a literal backslash as four backslashes. '%' is
 * doubled so it is not taken for a field code. Paths without these
 * characters are unchanged.
 */
std::string escape_exec_argument(const std::string& path);

/**
 * @brief Render a desktop entry
 *
 * Output is fixed apart from the three fields, so identical input always
 * produces identical bytes:
 *
 *   [Desktop Entry]
 *   Name=<name>
 *   Exec="<escaped exec_path>" %U
 *   Icon=<icon>            (or "# Icon= (no icon found)")
 *   Terminal=false
 *   Type=Application
 *   Categories=Utility;
 *   StartupNotify=true
 */
std::string render_desktop_entry(const DesktopEntry& entry);

/**
 * @brief First "{bundle dir}/{full base name}.{ext}" that exists, in
 *        kIconExtensions order
 */
std::optional<std::string> find_icon(const std::string& bundle_path);

// ============================================================================
// Descriptor Writer
// ============================================================================

struct WrittenDescriptor {
    std::string identifier;
    std::string descriptor_path;
    std::optional<std::string> icon_path;  // copy in the icon directory
};

/**
 * @brief Produces and persists the descriptor for one bundle
 *
 * Copies a colocated icon into the icon directory when one exists. Any
 * filesystem failure is returned as an error; nothing is retried.
 */
class DescriptorWriter {
public:
    DescriptorWriter(const Config& config, const DescriptorStore& store)
        : icon_dir_(config.icon_dir), store_(store) {}

    /// Build the entry for a bundle, copying its icon if present
    Result<DesktopEntry> prepare(const std::string& bundle_path,
                                 std::optional<std::string>* icon_copy = nullptr) const;

    /// Write the descriptor for an absolute bundle path
    Result<WrittenDescriptor> write(const std::string& bundle_path) const;

private:
    std::string icon_dir_;
    const DescriptorStore& store_;
};

} // namespace appdesk
