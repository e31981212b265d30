//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "config.h"
#include "package.h"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace qr {

    enum class CollisionType {
        OwnedByOther,    // recorded owner is a different package
        Orphaned,        // exists on disk, no owner; may be overwritten
        TypeMismatch,    // directory where a file goes, or the reverse
        SymlinkDiffers   // unowned symlink pointing somewhere else
    };

    const char* to_string(CollisionType type);

    struct FileCollision {
        std::string path;
        PackageId installing;
        std::optional<PackageId> owner;
        CollisionType type;
        bool acceptable = false;
    };

    struct CollisionResult {
        std::vector<FileCollision> collisions;
        std::vector<std::string> safe_files;
        bool can_proceed = true;
    };

    enum class CollisionAction { Skip, Replace, Backup };

    // Path -> owner index over installed files. Directories are shared between
    // packages and are never recorded here.
    class CollisionDetector {
    public:
        explicit CollisionDetector(CollisionConfig config = {}, std::filesystem::path root = "/");

        void register_files(const PackageId& pkg, const std::vector<std::string>& paths);
        void unregister_files(const PackageId& pkg);
        void unregister_files(const PackageId& pkg, const std::vector<std::string>& paths);

        std::optional<PackageId> get_owner(const std::string& path) const;
        std::vector<std::string> get_package_files(const PackageId& pkg) const;
        size_t size() const { return m_owners.size(); }

        bool should_ignore(const std::string& path) const;

        // Every path is treated as an incoming regular file.
        CollisionResult check_collisions(const PackageId& pkg, const std::vector<std::string>& files,
                                         bool force = false) const;

        // Uses the manifest entry types to detect kind mismatches and differing symlinks.
        CollisionResult check_collisions(const PackageId& pkg, const std::vector<InstalledFile>& manifest,
                                         bool force = false) const;

        std::vector<std::pair<FileCollision, CollisionAction>> resolve_collisions(const CollisionResult& result,
                                                                                  bool force) const;

    private:
        std::optional<FileCollision> classify(const PackageId& pkg, const InstalledFile& entry) const;

        CollisionConfig m_config;
        std::filesystem::path m_root;
        std::map<std::string, PackageId> m_owners;
    };

    // Splits a whitespace separated COLLISION_IGNORE style value.
    std::vector<std::string> parse_collision_ignore(const std::string& value);

    std::string format_collision_report(const CollisionResult& result);

} // namespace qr
