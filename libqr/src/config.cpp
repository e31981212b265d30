//
// Created by cv2 on 10/19/26.
//

#include "libqr/config.h"
#include "libqr/collision.h"
#include "libqr/logging.h"

#include <yaml-cpp/yaml.h>

namespace qr {

    // Configured paths are absolute system paths; they always live below the root.
    static std::filesystem::path under_root(const std::filesystem::path& root, const std::string& path) {
        return root / std::filesystem::path(path).relative_path();
    }

    static std::vector<std::string> get_optional_sequence(const YAML::Node& node, const std::string& key) {
        std::vector<std::string> result;
        if (node[key] && node[key].IsSequence()) {
            for (const auto& item : node[key]) {
                result.push_back(item.as<std::string>());
            }
        } else if (node[key] && node[key].IsScalar()) {
            // "ssl -X11 gtk" is accepted as well as a YAML list
            std::string token;
            for (char c : node[key].as<std::string>() + " ") {
                if (c == ' ' || c == '\t') {
                    if (!token.empty()) result.push_back(token);
                    token.clear();
                } else {
                    token += c;
                }
            }
        }
        return result;
    }

    template<typename T>
    static void read_optional(const YAML::Node& node, const std::string& key, T& out) {
        if (node && node[key] && node[key].IsScalar()) {
            out = node[key].as<T>();
        }
    }

    Config Config::defaults(const std::filesystem::path& root) {
        Config config;
        config.root = root;
        config.db_path = root / "var" / "lib" / "quarry" / "quarry.db";
        config.cache_dir = root / "var" / "cache" / "quarry";
        config.index_paths = {root / "var" / "db" / "quarry" / "index.yaml"};
        return config;
    }

    Result<Config> Config::load(const std::filesystem::path& root, const std::filesystem::path& config_file) {
        Config config = defaults(root);
        const auto path = config_file.empty() ? root / "etc" / "quarry" / "quarry.yaml" : config_file;

        if (!std::filesystem::exists(path)) {
            if (!config_file.empty()) {
                return make_error(ErrorCode::ConfigError, "Configuration file not found: " + path.string());
            }
            log::debug("No configuration at " + path.string() + ", using defaults.");
            return config;
        }

        try {
            YAML::Node doc = YAML::LoadFile(path.string());
            if (doc.IsNull()) {
                return config;
            }
            if (!doc.IsMap()) {
                return make_error(ErrorCode::ConfigError, "Configuration root must be a mapping: " + path.string());
            }

            if (auto paths = doc["paths"]) {
                if (paths["database"]) config.db_path = under_root(root, paths["database"].as<std::string>());
                if (paths["cache"]) config.cache_dir = under_root(root, paths["cache"].as<std::string>());
                if (paths["index"]) {
                    config.index_paths.clear();
                    for (const auto& index : get_optional_sequence(paths, "index")) {
                        config.index_paths.push_back(under_root(root, index));
                    }
                }
            }

            if (auto resolver = doc["resolver"]) {
                read_optional(resolver, "max_backtracks", config.backtrack.max_backtracks);
                read_optional(resolver, "prefer_newer", config.backtrack.prefer_newer);
                read_optional(resolver, "allow_slot_conflicts", config.backtrack.allow_slot_conflicts);
                read_optional(resolver, "prefer_installed", config.backtrack.prefer_installed);
            }

            if (auto collision = doc["collision"]) {
                if (collision["ignore"] && collision["ignore"].IsScalar()) {
                    config.collision.ignore_patterns = parse_collision_ignore(collision["ignore"].as<std::string>());
                } else if (collision["ignore"]) {
                    config.collision.ignore_patterns = get_optional_sequence(collision, "ignore");
                }
                read_optional(collision, "allow_doc", config.collision.allow_doc_collisions);
                read_optional(collision, "allow_man", config.collision.allow_man_collisions);
            }

            if (auto build = doc["build"]) {
                read_optional(build, "command", config.build.command);
                read_optional(build, "jobs", config.build.jobs);
                if (build["timeout"]) {
                    config.build.timeout = std::chrono::seconds(build["timeout"].as<int64_t>());
                }
                if (config.build.jobs == 0) {
                    return make_error(ErrorCode::ConfigError, "build.jobs must be at least 1");
                }
            }

            config.use_flags = get_optional_sequence(doc, "use");
            config.accept_keywords = get_optional_sequence(doc, "accept_keywords");
        } catch (const YAML::Exception& e) {
            log::error("Failed to parse configuration " + path.string() + ": " + e.what());
            return make_error(ErrorCode::ConfigError, std::string("Invalid configuration: ") + e.what());
        }

        log::debug("Loaded configuration from " + path.string());
        return config;
    }

    InstallOptions Config::install_options() const {
        InstallOptions opts;
        opts.use_flags = use_flags;
        opts.accept_keywords = accept_keywords;
        opts.backtrack = backtrack;
        return opts;
    }

} // namespace qr
