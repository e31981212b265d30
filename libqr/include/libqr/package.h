//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "version.h"

#include <chrono>
#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace qr {

    struct PackageId {
        std::string category;
        std::string name;

        // "category/name"
        static Result<PackageId> parse(std::string_view text);

        std::string full_name() const { return category + "/" + name; }

        auto operator<=>(const PackageId&) const = default;
    };

    using UseFlagSet = std::set<std::string>;

    struct UseFlag {
        std::string name;
        bool default_enabled = false;
        std::string description;
    };

    // Gates whether a dependency edge is active for a given USE flag set.
    struct UseCondition {
        enum class Kind { Always, IfEnabled, IfDisabled, All, Any };

        Kind kind = Kind::Always;
        std::string flag;
        std::vector<UseCondition> children;

        static UseCondition always() { return {}; }
        static UseCondition if_enabled(std::string flag);
        static UseCondition if_disabled(std::string flag);
        static UseCondition all_of(std::vector<UseCondition> conditions);
        static UseCondition any_of(std::vector<UseCondition> conditions);

        // Reads the form to_string() writes: "", "flag?", "!flag?", "(a && b)", "(a || b)".
        static Result<UseCondition> parse(std::string_view text);

        bool evaluate(const UseFlagSet& enabled) const;
        bool is_conditional() const { return kind != Kind::Always; }
        std::string to_string() const;
    };

    struct Dependency {
        PackageId package;
        VersionSpec version;
        std::optional<std::string> slot;
        UseCondition use_condition;
        bool build_time = true;
        bool run_time = true;
        bool optional = false;

        bool is_active(const UseFlagSet& enabled) const { return use_condition.evaluate(enabled); }
        // Whether this dependency accepts the given version in the given slot.
        bool accepts(const Version& v, const std::string& candidate_slot) const;
        std::string to_string() const;
    };

    // One version of a package as published in the repository index.
    struct PackageInfo {
        PackageId id;
        Version version;
        std::string slot = "0";
        std::string description;
        std::vector<std::string> keywords;
        std::vector<UseFlag> use_flags;
        std::vector<Dependency> dependencies;
        std::vector<Dependency> build_dependencies;
        std::vector<Dependency> runtime_dependencies;
        std::vector<std::string> blockers;   // "!pkg", "!!pkg", "!<cat/pkg-1.0"
        std::string build_target;
        uint64_t size = 0;
        uint64_t installed_size = 0;

        // dependencies, build_dependencies and runtime_dependencies in that order.
        std::vector<const Dependency*> all_dependencies() const;
        std::string display_name() const { return id.full_name() + "-" + version.to_string(); }
    };

    enum class FileType { Regular, Directory, Symlink, Hardlink, Device, Fifo };

    const char* to_string(FileType type);

    struct InstalledFile {
        std::string path;          // absolute system path, e.g. "/usr/bin/foo"
        FileType file_type = FileType::Regular;
        uint32_t mode = 0;
        uint64_t size = 0;
        std::string hash;          // sha256 hex, regular files only
        int64_t mtime = 0;
        std::string link_target;   // symlinks only
    };

    // A package as recorded in the database after a successful install.
    struct InstalledPackage {
        PackageId id;
        Version version;
        std::string slot = "0";
        std::chrono::system_clock::time_point installed_at{};
        UseFlagSet use_flags;
        std::vector<InstalledFile> files;
        uint64_t size = 0;
        bool explicit_install = false;
        // Run-time dependencies at install time, used for reverse-dependency checks.
        std::vector<Dependency> dependencies;
        std::vector<std::string> blockers;

        std::string display_name() const { return id.full_name() + "-" + version.to_string(); }
    };

    using VersionIndex = std::map<PackageId, Version>;

    // Flags enabled for a package: its default-on flags, then the global list in
    // order, where "-flag" disables and "flag" enables.
    UseFlagSet effective_use_flags(const PackageInfo& pkg, const std::vector<std::string>& global_flags);

} // namespace qr
