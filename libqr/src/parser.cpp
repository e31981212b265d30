//
// Created by cv2 on 10/19/26.
//

#include "libqr/parser.h"
#include "libqr/logging.h"

#include <yaml-cpp/yaml.h>

namespace qr {

    static std::string get_optional_scalar(const YAML::Node& node, const std::string& key) {
        if (node[key] && node[key].IsScalar()) {
            return node[key].as<std::string>();
        }
        return "";
    }

    template<typename T>
    static Result<T> get_required_scalar(const YAML::Node& node, const std::string& key) {
        if (!node[key] || !node[key].IsScalar()) {
            log::error("Missing required field: '" + key + "'");
            return make_error(ErrorCode::ParseError, "Missing required field: '" + key + "'");
        }
        return node[key].as<T>();
    }

    static std::vector<std::string> get_optional_sequence(const YAML::Node& node, const std::string& key) {
        std::vector<std::string> result;
        if (node[key] && node[key].IsSequence()) {
            for (const auto& item : node[key]) {
                result.push_back(item.as<std::string>());
            }
        }
        return result;
    }

    static Result<UseCondition> parse_use_condition(const YAML::Node& node) {
        if (node.IsScalar()) {
            auto flag = node.as<std::string>();
            if (flag.empty()) {
                return UseCondition::always();
            }
            if (flag[0] == '!') {
                return UseCondition::if_disabled(flag.substr(1));
            }
            return UseCondition::if_enabled(flag);
        }

        if (node.IsMap() && (node["all"] || node["any"])) {
            const bool all = static_cast<bool>(node["all"]);
            const YAML::Node list = all ? node["all"] : node["any"];
            if (!list.IsSequence()) {
                return make_error(ErrorCode::ParseError, "USE condition 'all'/'any' must be a list");
            }
            std::vector<UseCondition> children;
            for (const auto& child : list) {
                auto parsed = parse_use_condition(child);
                if (!parsed) return parsed;
                children.push_back(std::move(*parsed));
            }
            return all ? UseCondition::all_of(std::move(children)) : UseCondition::any_of(std::move(children));
        }

        return make_error(ErrorCode::ParseError, "Unrecognised USE condition");
    }

    Result<Dependency> Parser::parse_dependency_string(const std::string& text) {
        auto space = text.find_first_of(" \t");
        auto atom = text.substr(0, space);
        Dependency dep;

        // "cat/name:slot"
        auto colon = atom.find(':');
        if (colon != std::string::npos) {
            dep.slot = atom.substr(colon + 1);
            atom = atom.substr(0, colon);
        }

        auto id = PackageId::parse(atom);
        if (!id) return std::unexpected(id.error());
        dep.package = *id;

        if (space != std::string::npos) {
            auto spec = VersionSpec::parse(text.substr(space + 1));
            if (!spec) return std::unexpected(spec.error());
            dep.version = *spec;
        }
        return dep;
    }

    static Result<Dependency> parse_dependency_node(const YAML::Node& node) {
        if (node.IsScalar()) {
            return Parser::parse_dependency_string(node.as<std::string>());
        }
        if (!node.IsMap()) {
            return make_error(ErrorCode::ParseError, "Dependency must be a string or a mapping");
        }

        auto package = get_required_scalar<std::string>(node, "package");
        if (!package) return std::unexpected(package.error());

        auto dep = Parser::parse_dependency_string(*package);
        if (!dep) return dep;

        if (node["version"]) {
            auto spec = VersionSpec::parse(node["version"].as<std::string>());
            if (!spec) return std::unexpected(spec.error());
            dep->version = *spec;
        }
        if (node["slot"]) {
            dep->slot = node["slot"].as<std::string>();
        }
        if (node["use"]) {
            auto condition = parse_use_condition(node["use"]);
            if (!condition) return std::unexpected(condition.error());
            dep->use_condition = std::move(*condition);
        }
        if (node["build_time"]) dep->build_time = node["build_time"].as<bool>();
        if (node["run_time"]) dep->run_time = node["run_time"].as<bool>();
        if (node["optional"]) dep->optional = node["optional"].as<bool>();
        return dep;
    }

    static Result<std::vector<Dependency>> parse_dependency_list(const YAML::Node& node, const std::string& key) {
        std::vector<Dependency> deps;
        if (!node[key]) {
            return deps;
        }
        if (!node[key].IsSequence()) {
            return make_error(ErrorCode::ParseError, "'" + key + "' must be a list");
        }
        for (const auto& item : node[key]) {
            auto dep = parse_dependency_node(item);
            if (!dep) return std::unexpected(dep.error());
            deps.push_back(std::move(*dep));
        }
        return deps;
    }

    static std::vector<UseFlag> parse_use_flags(const YAML::Node& node) {
        std::vector<UseFlag> flags;
        if (!node["use_flags"] || !node["use_flags"].IsSequence()) {
            return flags;
        }
        for (const auto& item : node["use_flags"]) {
            UseFlag flag;
            if (item.IsScalar()) {
                flag.name = item.as<std::string>();
                if (!flag.name.empty() && flag.name[0] == '+') {
                    flag.name.erase(0, 1);
                    flag.default_enabled = true;
                }
            } else if (item.IsMap()) {
                flag.name = get_optional_scalar(item, "name");
                flag.description = get_optional_scalar(item, "description");
                if (item["default"]) flag.default_enabled = item["default"].as<bool>();
            }
            if (!flag.name.empty()) {
                flags.push_back(std::move(flag));
            }
        }
        return flags;
    }

    static Result<PackageInfo> parse_package_node(const YAML::Node& node) {
        PackageInfo pkg;

        auto category = get_required_scalar<std::string>(node, "category");
        if (!category) return std::unexpected(category.error());
        auto name = get_required_scalar<std::string>(node, "name");
        if (!name) return std::unexpected(name.error());

        auto id = PackageId::parse(*category + "/" + *name);
        if (!id) return std::unexpected(id.error());
        pkg.id = *id;

        auto version_str = get_required_scalar<std::string>(node, "version");
        if (!version_str) return std::unexpected(version_str.error());
        auto version = Version::parse_lenient(*version_str);
        if (!version) return std::unexpected(version.error());
        pkg.version = *version;

        if (node["slot"]) pkg.slot = node["slot"].as<std::string>();
        pkg.description = get_optional_scalar(node, "description");
        pkg.keywords = get_optional_sequence(node, "keywords");
        pkg.use_flags = parse_use_flags(node);
        pkg.blockers = get_optional_sequence(node, "blockers");
        pkg.build_target = get_optional_scalar(node, "target");

        if (node["size"] && node["size"].IsScalar()) {
            pkg.size = node["size"].as<uint64_t>();
        }
        if (node["installed_size"] && node["installed_size"].IsScalar()) {
            pkg.installed_size = node["installed_size"].as<uint64_t>();
        }

        auto deps = parse_dependency_list(node, "dependencies");
        if (!deps) return std::unexpected(deps.error());
        pkg.dependencies = std::move(*deps);

        auto build_deps = parse_dependency_list(node, "build_dependencies");
        if (!build_deps) return std::unexpected(build_deps.error());
        pkg.build_dependencies = std::move(*build_deps);

        auto runtime_deps = parse_dependency_list(node, "runtime_dependencies");
        if (!runtime_deps) return std::unexpected(runtime_deps.error());
        pkg.runtime_dependencies = std::move(*runtime_deps);

        return pkg;
    }

    static Result<std::vector<PackageInfo>> parse_index_root(const YAML::Node& root, const std::string& origin) {
        if (!root.IsSequence()) {
            log::error("Repository index is not a valid YAML sequence: " + origin);
            return make_error(ErrorCode::ParseError, "Repository index is not a YAML sequence: " + origin);
        }

        std::vector<PackageInfo> packages;
        for (const auto& node : root) {
            try {
                auto pkg = parse_package_node(node);
                if (pkg) {
                    packages.push_back(std::move(*pkg));
                } else {
                    log::error("Skipping invalid package definition in " + origin + ": " + pkg.error().message);
                }
            } catch (const YAML::Exception& e) {
                log::error("Skipping invalid package definition in " + origin + ": " + e.what());
            }
        }
        return packages;
    }

    Result<std::vector<PackageInfo>> Parser::parse_repository_index(const std::filesystem::path& file_path) {
        if (!std::filesystem::exists(file_path)) {
            return make_error(ErrorCode::ParseError, "Repository index not found: " + file_path.string());
        }

        YAML::Node root;
        try {
            root = YAML::LoadFile(file_path.string());
        } catch (const YAML::Exception& e) {
            log::error("Failed to parse repo index " + file_path.string() + ": " + e.what());
            return make_error(ErrorCode::ParseError, std::string("Malformed repository index: ") + e.what());
        }
        return parse_index_root(root, file_path.string());
    }

    Result<std::vector<PackageInfo>> Parser::parse_index_from_string(const std::string& content) {
        try {
            return parse_index_root(YAML::Load(content), "<string>");
        } catch (const YAML::Exception& e) {
            log::error(std::string("Failed to parse YAML from string: ") + e.what());
            return make_error(ErrorCode::ParseError, std::string("Malformed repository index: ") + e.what());
        }
    }

} // namespace qr
