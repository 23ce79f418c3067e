#include "appdesk/desktop_entry.hpp"
#include "appdesk/identifier.hpp"
#include "appdesk/platform.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

namespace appdesk {

std::string escape_exec_argument(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        switch (c) {
            case '"':
            case '`':
            case '$':
                out += "\\\\";
                out += c;
                break;
            case '\\':
                out += "\\\\\\\\";
                break;
            case '%':
                out += "%%";
                break;
            default:
                out += c;
        }
    }
    return out;
}

std::string render_desktop_entry(const DesktopEntry& entry) {
    std::ostringstream os;
    os << "[Desktop Entry]\n";
    os << "Name=" << entry.name << "\n";
    os << "Exec=\"" << escape_exec_argument(entry.exec_path) << "\" %U\n";
    if (entry.icon) {
        os << "Icon=" << *entry.icon << "\n";
    } else {
        os << "# Icon= (no icon found)\n";
    }
    os << "Terminal=false\n";
    os << "Type=Application\n";
    os << "Categories=Utility;\n";
    os << "StartupNotify=true\n";
    return os.str();
}

std::optional<std::string> find_icon(const std::string& bundle_path) {
    std::string dir = get_parent_directory(bundle_path);
    std::string base = full_base_name(bundle_path);

    for (const char* ext : kIconExtensions) {
        std::string candidate = join_path(dir, base + "." + ext);
        if (is_regular_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

Result<DesktopEntry> DescriptorWriter::prepare(const std::string& bundle_path,
                                               std::optional<std::string>* icon_copy) const {
    DesktopEntry entry;
    entry.name = derive_identifier(bundle_path);
    entry.exec_path = bundle_path;

    std::string base = full_base_name(bundle_path);
    auto icon = find_icon(bundle_path);
    if (!icon) {
        spdlog::debug("No icon next to {}", bundle_path);
        return Result<DesktopEntry>::ok(entry);
    }

    if (!create_directories(icon_dir_)) {
        return Result<DesktopEntry>::err(Error(ErrorCode::IO_ERROR,
            "cannot create icon directory " + icon_dir_));
    }

    std::string ext = icon->substr(icon->rfind('.') + 1);
    std::string target = join_path(icon_dir_, base + "." + ext);
    if (!copy_file(*icon, target)) {
        return Result<DesktopEntry>::err(Error(ErrorCode::IO_ERROR,
            "cannot copy icon " + *icon + " to " + target));
    }
    spdlog::debug("Copied icon {} -> {}", *icon, target);

    entry.icon = base;
    if (icon_copy) {
        *icon_copy = target;
    }
    return Result<DesktopEntry>::ok(entry);
}

Result<WrittenDescriptor> DescriptorWriter::write(const std::string& bundle_path) const {
    WrittenDescriptor written;

    auto entry = prepare(bundle_path, &written.icon_path);
    if (entry.isErr()) {
        Error error = entry.error();
        return Result<WrittenDescriptor>::err(error.withContext(get_filename(bundle_path)));
    }

    written.identifier = entry.value().name;
    auto path = store_.write(written.identifier, render_desktop_entry(entry.value()));
    if (path.isErr()) {
        Error error = path.error();
        return Result<WrittenDescriptor>::err(error.withContext(get_filename(bundle_path)));
    }

    written.descriptor_path = path.value();
    return Result<WrittenDescriptor>::ok(written);
}

} // namespace appdesk
