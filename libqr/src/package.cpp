//
// Created by cv2 on 10/19/26.
//

#include "libqr/package.h"

#include <algorithm>
#include <cctype>

namespace qr {

    const char* to_string(FileType type) {
        switch (type) {
            case FileType::Regular: return "file";
            case FileType::Directory: return "dir";
            case FileType::Symlink: return "symlink";
            case FileType::Hardlink: return "hardlink";
            case FileType::Device: return "device";
            case FileType::Fifo: return "fifo";
        }
        return "unknown";
    }

    static bool valid_atom_part(std::string_view part) {
        if (part.empty()) return false;
        return std::none_of(part.begin(), part.end(), [](char c) {
            return std::isspace(static_cast<unsigned char>(c)) || c == '/';
        });
    }

    Result<PackageId> PackageId::parse(std::string_view text) {
        auto slash = text.find('/');
        if (slash == std::string_view::npos) {
            return make_error(ErrorCode::InvalidAtom, "Package '" + std::string(text) + "' is not of the form category/name");
        }
        auto category = text.substr(0, slash);
        auto name = text.substr(slash + 1);
        if (!valid_atom_part(category) || !valid_atom_part(name)) {
            return make_error(ErrorCode::InvalidAtom, "Malformed package identifier '" + std::string(text) + "'");
        }
        return PackageId{std::string(category), std::string(name)};
    }

    // --- UseCondition ---

    UseCondition UseCondition::if_enabled(std::string flag) {
        UseCondition c;
        c.kind = Kind::IfEnabled;
        c.flag = std::move(flag);
        return c;
    }

    UseCondition UseCondition::if_disabled(std::string flag) {
        UseCondition c;
        c.kind = Kind::IfDisabled;
        c.flag = std::move(flag);
        return c;
    }

    UseCondition UseCondition::all_of(std::vector<UseCondition> conditions) {
        UseCondition c;
        c.kind = Kind::All;
        c.children = std::move(conditions);
        return c;
    }

    UseCondition UseCondition::any_of(std::vector<UseCondition> conditions) {
        UseCondition c;
        c.kind = Kind::Any;
        c.children = std::move(conditions);
        return c;
    }

    bool UseCondition::evaluate(const UseFlagSet& enabled) const {
        switch (kind) {
            case Kind::Always:
                return true;
            case Kind::IfEnabled:
                return enabled.contains(flag);
            case Kind::IfDisabled:
                return !enabled.contains(flag);
            case Kind::All:
                return std::all_of(children.begin(), children.end(),
                                   [&](const UseCondition& c) { return c.evaluate(enabled); });
            case Kind::Any:
                return std::any_of(children.begin(), children.end(),
                                   [&](const UseCondition& c) { return c.evaluate(enabled); });
        }
        return false;
    }

    static std::string_view skip_spaces(std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        return s;
    }

    static Result<UseCondition> parse_condition(std::string_view& text) {
        text = skip_spaces(text);
        if (text.starts_with('(')) {
            text.remove_prefix(1);
            std::vector<UseCondition> children;
            std::optional<UseCondition::Kind> kind;
            while (true) {
                auto child = parse_condition(text);
                if (!child) return child;
                children.push_back(std::move(*child));

                text = skip_spaces(text);
                if (text.starts_with(')')) {
                    text.remove_prefix(1);
                    break;
                }
                const auto op = text.substr(0, 2);
                const auto next = op == "&&" ? UseCondition::Kind::All
                                : op == "||" ? UseCondition::Kind::Any
                                : UseCondition::Kind::Always;
                if (next == UseCondition::Kind::Always || (kind && *kind != next)) {
                    return make_error(ErrorCode::ParseError, "Malformed USE condition near '" + std::string(text) + "'");
                }
                kind = next;
                text.remove_prefix(2);
            }
            return kind == UseCondition::Kind::Any ? UseCondition::any_of(std::move(children))
                                                   : UseCondition::all_of(std::move(children));
        }

        const bool negated = text.starts_with('!');
        if (negated) text.remove_prefix(1);
        const auto end = text.find('?');
        if (end == 0 || end == std::string_view::npos) {
            return make_error(ErrorCode::ParseError, "Malformed USE condition near '" + std::string(text) + "'");
        }
        std::string flag(text.substr(0, end));
        text.remove_prefix(end + 1);
        return negated ? UseCondition::if_disabled(std::move(flag)) : UseCondition::if_enabled(std::move(flag));
    }

    Result<UseCondition> UseCondition::parse(std::string_view text) {
        if (skip_spaces(text).empty()) {
            return always();
        }
        auto condition = parse_condition(text);
        if (condition && !skip_spaces(text).empty()) {
            return make_error(ErrorCode::ParseError, "Trailing text in USE condition: '" + std::string(text) + "'");
        }
        return condition;
    }

    std::string UseCondition::to_string() const {
        auto join = [this](const char* sep) {
            std::string out = "(";
            for (size_t i = 0; i < children.size(); ++i) {
                if (i > 0) out += sep;
                out += children[i].to_string();
            }
            return out + ")";
        };
        switch (kind) {
            case Kind::Always: return "";
            case Kind::IfEnabled: return flag + "?";
            case Kind::IfDisabled: return "!" + flag + "?";
            case Kind::All: return join(" && ");
            case Kind::Any: return join(" || ");
        }
        return "";
    }

    // --- Dependency / PackageInfo ---

    bool Dependency::accepts(const Version& v, const std::string& candidate_slot) const {
        if (slot && *slot != candidate_slot) {
            return false;
        }
        return version.matches(v);
    }

    std::string Dependency::to_string() const {
        std::string out = package.full_name();
        if (!version.is_any()) out += " " + version.to_string();
        if (slot) out += ":" + *slot;
        if (use_condition.is_conditional()) out += " [" + use_condition.to_string() + "]";
        return out;
    }

    std::vector<const Dependency*> PackageInfo::all_dependencies() const {
        std::vector<const Dependency*> out;
        out.reserve(dependencies.size() + build_dependencies.size() + runtime_dependencies.size());
        for (const auto& d : dependencies) out.push_back(&d);
        for (const auto& d : build_dependencies) out.push_back(&d);
        for (const auto& d : runtime_dependencies) out.push_back(&d);
        return out;
    }

    UseFlagSet effective_use_flags(const PackageInfo& pkg, const std::vector<std::string>& global_flags) {
        UseFlagSet enabled;
        for (const auto& flag : pkg.use_flags) {
            if (flag.default_enabled) {
                enabled.insert(flag.name);
            }
        }
        for (const auto& flag : global_flags) {
            if (flag.empty()) continue;
            if (flag[0] == '-') {
                enabled.erase(flag.substr(1));
            } else if (flag[0] == '+') {
                enabled.insert(flag.substr(1));
            } else {
                enabled.insert(flag);
            }
        }
        return enabled;
    }

} // namespace qr
