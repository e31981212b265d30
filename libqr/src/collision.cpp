//
// Created by cv2 on 10/19/26.
//

#include "libqr/collision.h"

#include <algorithm>
#include <fnmatch.h>
#include <sstream>

namespace qr {

    const char* to_string(CollisionType type) {
        switch (type) {
            case CollisionType::OwnedByOther: return "owned by another package";
            case CollisionType::Orphaned: return "orphaned file";
            case CollisionType::TypeMismatch: return "file type mismatch";
            case CollisionType::SymlinkDiffers: return "symlink target differs";
        }
        return "unknown";
    }

    CollisionDetector::CollisionDetector(CollisionConfig config, std::filesystem::path root)
        : m_config(std::move(config)), m_root(std::move(root)) {}

    void CollisionDetector::register_files(const PackageId& pkg, const std::vector<std::string>& paths) {
        for (const auto& path : paths) {
            m_owners[path] = pkg;
        }
    }

    void CollisionDetector::unregister_files(const PackageId& pkg) {
        std::erase_if(m_owners, [&](const auto& entry) { return entry.second == pkg; });
    }

    void CollisionDetector::unregister_files(const PackageId& pkg, const std::vector<std::string>& paths) {
        for (const auto& path : paths) {
            auto it = m_owners.find(path);
            if (it != m_owners.end() && it->second == pkg) {
                m_owners.erase(it);
            }
        }
    }

    std::optional<PackageId> CollisionDetector::get_owner(const std::string& path) const {
        auto it = m_owners.find(path);
        if (it == m_owners.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::string> CollisionDetector::get_package_files(const PackageId& pkg) const {
        std::vector<std::string> files;
        for (const auto& [path, owner] : m_owners) {
            if (owner == pkg) files.push_back(path);
        }
        return files;
    }

    // A pattern with a leading '/' must match the whole path; any other
    // pattern may match from any path component onwards.
    static bool matches_pattern(const std::string& path, const std::string& pattern) {
        if (pattern.empty()) {
            return false;
        }
        if (pattern.front() == '/') {
            return fnmatch(pattern.c_str(), path.c_str(), 0) == 0;
        }
        for (size_t pos = 0; pos != std::string::npos; pos = path.find('/', pos + 1)) {
            const char* tail = path.c_str() + (path[pos] == '/' ? pos + 1 : pos);
            if (fnmatch(pattern.c_str(), tail, 0) == 0) {
                return true;
            }
        }
        return false;
    }

    bool CollisionDetector::should_ignore(const std::string& path) const {
        if (m_config.allow_doc_collisions && path.find("/usr/share/doc/") != std::string::npos) {
            return true;
        }
        if (m_config.allow_man_collisions && path.find("/usr/share/man/") != std::string::npos) {
            return true;
        }
        return std::any_of(m_config.ignore_patterns.begin(), m_config.ignore_patterns.end(),
                           [&](const std::string& pattern) { return matches_pattern(path, pattern); });
    }

    std::optional<FileCollision> CollisionDetector::classify(const PackageId& pkg, const InstalledFile& entry) const {
        const bool incoming_dir = entry.file_type == FileType::Directory;

        if (!incoming_dir) {
            auto owner = get_owner(entry.path);
            if (owner && *owner != pkg) {
                return FileCollision{entry.path, pkg, owner, CollisionType::OwnedByOther, false};
            }
            if (owner) {
                return std::nullopt; // reinstalling our own file
            }
        }

        std::error_code ec;
        const auto on_disk = m_root / std::filesystem::path(entry.path).relative_path();
        const auto status = std::filesystem::symlink_status(on_disk, ec);
        if (ec || !std::filesystem::exists(status)) {
            return std::nullopt;
        }

        const bool disk_dir = std::filesystem::is_directory(status);
        if (incoming_dir) {
            if (disk_dir) return std::nullopt;
            return FileCollision{entry.path, pkg, std::nullopt, CollisionType::TypeMismatch, false};
        }
        if (disk_dir) {
            return FileCollision{entry.path, pkg, std::nullopt, CollisionType::TypeMismatch, false};
        }

        if (entry.file_type == FileType::Symlink && std::filesystem::is_symlink(status)) {
            auto target = std::filesystem::read_symlink(on_disk, ec);
            if (ec || target.string() != entry.link_target) {
                return FileCollision{entry.path, pkg, std::nullopt, CollisionType::SymlinkDiffers, false};
            }
        }
        return FileCollision{entry.path, pkg, std::nullopt, CollisionType::Orphaned, true};
    }

    CollisionResult CollisionDetector::check_collisions(const PackageId& pkg, const std::vector<InstalledFile>& manifest,
                                                        bool force) const {
        CollisionResult result;
        for (const auto& entry : manifest) {
            if (should_ignore(entry.path)) {
                result.safe_files.push_back(entry.path);
                continue;
            }
            if (auto collision = classify(pkg, entry)) {
                result.collisions.push_back(std::move(*collision));
            } else {
                result.safe_files.push_back(entry.path);
            }
        }

        result.can_proceed = force || std::all_of(result.collisions.begin(), result.collisions.end(),
                                                  [](const FileCollision& c) { return c.acceptable; });
        return result;
    }

    CollisionResult CollisionDetector::check_collisions(const PackageId& pkg, const std::vector<std::string>& files,
                                                        bool force) const {
        std::vector<InstalledFile> manifest;
        manifest.reserve(files.size());
        for (const auto& path : files) {
            InstalledFile f;
            f.path = path;
            manifest.push_back(std::move(f));
        }
        return check_collisions(pkg, manifest, force);
    }

    std::vector<std::pair<FileCollision, CollisionAction>>
    CollisionDetector::resolve_collisions(const CollisionResult& result, bool force) const {
        std::vector<std::pair<FileCollision, CollisionAction>> actions;
        actions.reserve(result.collisions.size());
        for (const auto& collision : result.collisions) {
            CollisionAction action = CollisionAction::Skip;
            if (collision.type == CollisionType::Orphaned) {
                action = CollisionAction::Backup;
            } else if (force) {
                action = CollisionAction::Replace;
            }
            actions.emplace_back(collision, action);
        }
        return actions;
    }

    std::vector<std::string> parse_collision_ignore(const std::string& value) {
        std::vector<std::string> patterns;
        std::istringstream in(value);
        std::string token;
        while (in >> token) {
            patterns.push_back(token);
        }
        return patterns;
    }

    std::string format_collision_report(const CollisionResult& result) {
        if (result.collisions.empty()) {
            return "No file collisions detected.";
        }

        std::ostringstream report;
        report << "Detected " << result.collisions.size() << " file collision(s):\n";
        for (const auto& collision : result.collisions) {
            report << "  * " << collision.path << " (" << to_string(collision.type);
            if (collision.owner) {
                report << ": " << collision.owner->full_name();
            }
            report << ")\n";
        }
        if (!result.can_proceed) {
            report << "Installation cannot proceed; use --force to overwrite.";
        }
        return report.str();
    }

} // namespace qr
