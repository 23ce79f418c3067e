#include "appdesk/descriptor_store.hpp"
#include "appdesk/platform.hpp"

#include <algorithm>

#include <fnmatch.h>

#include <spdlog/spdlog.h>

namespace appdesk {

std::string DescriptorStore::filename_for(const std::string& identifier) const {
    return prefix_ + "-" + identifier + extension_;
}

std::string DescriptorStore::path_for(const std::string& identifier) const {
    return join_path(dir_, filename_for(identifier));
}

std::optional<std::string> DescriptorStore::identifier_of(const std::string& filename) const {
    std::string head = prefix_ + "-";
    if (filename.size() < head.size() + extension_.size()) {
        return std::nullopt;
    }
    if (filename.compare(0, head.size(), head) != 0) {
        return std::nullopt;
    }
    if (filename.compare(filename.size() - extension_.size(), extension_.size(), extension_) != 0) {
        return std::nullopt;
    }
    return filename.substr(head.size(), filename.size() - head.size() - extension_.size());
}

std::vector<std::string> DescriptorStore::enumerate() const {
    std::vector<std::string> names;

    for (const auto& name : list_directory(dir_)) {
        if (!identifier_of(name)) continue;
        if (!is_regular_file(join_path(dir_, name))) continue;
        names.push_back(name);
    }

    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> DescriptorStore::identifiers() const {
    std::vector<std::string> ids;
    for (const auto& name : enumerate()) {
        ids.push_back(*identifier_of(name));
    }
    return ids;
}

Result<void> DescriptorStore::ensure_directory() const {
    if (is_directory(dir_)) {
        return Result<void>::ok();
    }
    auto created = atomic_create_directory(dir_);
    if (!created.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
            "cannot create desktop directory " + dir_ + ": " + created.error));
    }
    spdlog::debug("Created desktop directory {}", dir_);
    return Result<void>::ok();
}

Result<std::string> DescriptorStore::write(const std::string& identifier,
                                           const std::string& content) const {
    auto dir = ensure_directory();
    if (dir.isErr()) {
        return Result<std::string>::err(dir.error());
    }

    std::string path = path_for(identifier);
    auto written = atomic_write_file(path, content);
    if (!written.ok) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR,
            "cannot write " + path + ": " + written.error));
    }

    if (!make_executable(path)) {
        return Result<std::string>::err(Error(ErrorCode::PERMISSION_DENIED,
            "cannot mark " + path + " executable"));
    }

    spdlog::debug("Wrote descriptor {} ({} bytes)", path, content.size());
    return Result<std::string>::ok(path);
}

Result<DescriptorFile> DescriptorStore::read(const std::string& name) const {
    std::string filename;

    if (!name.empty() && is_regular_file(path_for(name))) {
        filename = filename_for(name);
    } else {
        std::string pattern = prefix_ + "-" + name + "*" + extension_;
        for (const auto& candidate : enumerate()) {
            if (fnmatch(pattern.c_str(), candidate.c_str(), 0) == 0) {
                filename = candidate;
                break;
            }
        }
    }

    if (filename.empty()) {
        return Result<DescriptorFile>::err(Error(ErrorCode::NOT_FOUND,
            "No desktop file found for name '" + name + "'"));
    }

    DescriptorFile file;
    file.filename = filename;
    file.identifier = identifier_of(filename).value_or(name);
    file.path = join_path(dir_, filename);

    auto content = read_file(file.path);
    if (!content) {
        return Result<DescriptorFile>::err(Error(ErrorCode::IO_ERROR,
            "cannot read " + file.path));
    }
    file.content = std::move(*content);

    return Result<DescriptorFile>::ok(std::move(file));
}

Result<bool> DescriptorStore::remove(const std::string& identifier) const {
    std::string path = path_for(identifier);

    if (!is_regular_file(path)) {
        return Result<bool>::err(Error(ErrorCode::NOT_FOUND,
            "No desktop file called " + path));
    }

    if (!remove_file(path)) {
        return Result<bool>::err(Error(ErrorCode::IO_ERROR, "cannot remove " + path));
    }

    spdlog::debug("Removed descriptor {}", path);
    return Result<bool>::ok(true);
}

} // namespace appdesk
