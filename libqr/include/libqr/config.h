//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "error.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace qr {

    struct BacktrackConfig {
        uint32_t max_backtracks = 10;
        bool prefer_newer = true;
        bool allow_slot_conflicts = false;
        // Try the installed version of a package before the other candidates.
        bool prefer_installed = false;
    };

    struct CollisionConfig {
        std::vector<std::string> ignore_patterns{
            "/usr/share/info/dir",
            "*.pyc",
            "*.pyo",
            "__pycache__/*",
        };
        bool allow_doc_collisions = true;
        bool allow_man_collisions = true;
    };

    struct BuildConfig {
        // {target} and {output} are substituted before the command runs.
        std::string command = "buck2 build {target} --out {output}";
        unsigned jobs = 1;
        std::chrono::seconds timeout{3600};
    };

    struct InstallOptions {
        bool force = false;
        bool no_deps = false;
        bool oneshot = false;   // don't mark requested packages as explicit
        bool pretend = false;
        std::vector<std::string> use_flags;
        std::vector<std::string> accept_keywords;
        BacktrackConfig backtrack;
    };

    struct Config {
        std::filesystem::path root = "/";
        std::filesystem::path db_path;
        std::filesystem::path cache_dir;
        std::vector<std::filesystem::path> index_paths;

        BacktrackConfig backtrack;
        CollisionConfig collision;
        BuildConfig build;
        std::vector<std::string> use_flags;
        std::vector<std::string> accept_keywords;

        // Default layout below the given system root.
        static Config defaults(const std::filesystem::path& root);

        // Reads <root>/etc/quarry/quarry.yaml, or `config_file` when given.
        // A missing file yields the defaults.
        static Result<Config> load(const std::filesystem::path& root,
                                   const std::filesystem::path& config_file = {});

        // Options seeded from the configured resolver policy and flags.
        InstallOptions install_options() const;
    };

} // namespace qr
