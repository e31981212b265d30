//
// Created by cv2 on 10/19/26.
//

#include "libqr/blocker.h"
#include "libqr/package_index.h"
#include "libqr/logging.h"

#include <algorithm>
#include <cctype>

namespace qr {

    static std::string_view trim(std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        return s;
    }

    bool is_blocker(std::string_view declaration) {
        return trim(declaration).starts_with('!');
    }

    bool is_hard_blocker(std::string_view declaration) {
        return trim(declaration).starts_with("!!");
    }

    std::string Blocker::to_string() const {
        std::string out = blocker_type == BlockerType::Hard ? "!!" : "!";
        out += blocked.full_name();
        if (!blocked_version.is_any()) {
            out += " " + blocked_version.to_string();
        }
        return out;
    }

    std::string BlockerResolution::describe() const {
        switch (action) {
            case Action::Remove:
                return "remove " + package.full_name();
            case Action::Upgrade:
                return "upgrade " + package.full_name() + " " + from->to_string() + " -> " + to->to_string();
            case Action::Downgrade:
                return "downgrade " + package.full_name() + " " + from->to_string() + " -> " + to->to_string();
            case Action::OrderedInstall:
                return "install " + first.full_name() + " before " + second.full_name();
        }
        return "";
    }

    Result<Blocker> BlockerResolver::parse_blocker(const PackageId& declarer, const Version& version,
                                                   std::string_view text) {
        const auto declaration = trim(text);
        const auto invalid = [&](const std::string& why) {
            return make_error(ErrorCode::InvalidBlocker,
                              "Invalid blocker '" + std::string(declaration) + "': " + why);
        };

        Blocker blocker;
        blocker.package = declarer;
        blocker.version = version;

        std::string_view rest;
        if (declaration.starts_with("!!")) {
            blocker.blocker_type = BlockerType::Hard;
            rest = declaration.substr(2);
        } else if (declaration.starts_with('!')) {
            blocker.blocker_type = BlockerType::Soft;
            rest = declaration.substr(1);
        } else {
            return invalid("must start with '!' or '!!'");
        }

        // Longest operators first.
        static constexpr std::string_view operators[] = {">=", "<=", ">", "<", "="};
        std::string_view op;
        for (auto candidate : operators) {
            if (rest.starts_with(candidate)) {
                op = candidate;
                rest.remove_prefix(candidate.size());
                break;
            }
        }

        std::string_view atom = rest;
        if (!op.empty()) {
            // The version starts after the last '-' that is followed by a digit.
            size_t split = std::string_view::npos;
            for (size_t i = 0; i + 1 < rest.size(); ++i) {
                if (rest[i] == '-' && std::isdigit(static_cast<unsigned char>(rest[i + 1]))) {
                    split = i;
                }
            }
            if (split == std::string_view::npos) {
                return invalid("operator '" + std::string(op) + "' without a version");
            }

            auto parsed = Version::parse_lenient(rest.substr(split + 1));
            if (!parsed) {
                return invalid(parsed.error().message);
            }
            atom = rest.substr(0, split);

            if (op == ">=") blocker.blocked_version = VersionSpec::greater_or_equal(*parsed);
            else if (op == "<=") blocker.blocked_version = VersionSpec::less_or_equal(*parsed);
            else if (op == ">") blocker.blocked_version = VersionSpec::greater_than(*parsed);
            else if (op == "<") blocker.blocked_version = VersionSpec::less_than(*parsed);
            else blocker.blocked_version = VersionSpec::exact(*parsed);
        }

        auto id = PackageId::parse(atom);
        if (!id) {
            return invalid(id.error().message);
        }
        blocker.blocked = *id;
        return blocker;
    }

    void BlockerResolver::register_blocker(Blocker blocker) {
        m_blockers.push_back(std::move(blocker));
    }

    void BlockerResolver::register_from_package(const PackageId& id, const Version& version,
                                                const std::vector<std::string>& declarations) {
        for (const auto& declaration : declarations) {
            auto blocker = parse_blocker(id, version, declaration);
            if (!blocker) {
                log::warn("Ignoring blocker of " + id.full_name() + ": " + blocker.error().message);
                continue;
            }
            register_blocker(std::move(*blocker));
        }
    }

    std::vector<Blocker> BlockerResolver::check_blockers(const VersionIndex& to_install,
                                                         const VersionIndex& installed) const {
        const auto present_matching = [](const VersionIndex& set, const PackageId& id, const VersionSpec& spec) {
            auto it = set.find(id);
            return it != set.end() && spec.matches(it->second);
        };

        std::vector<Blocker> active;
        for (const auto& blocker : m_blockers) {
            const bool declarer_present = to_install.contains(blocker.package) || installed.contains(blocker.package);
            if (!declarer_present) {
                continue;
            }
            // A package being installed replaces its installed version.
            const bool hit = to_install.contains(blocker.blocked)
                ? present_matching(to_install, blocker.blocked, blocker.blocked_version)
                : present_matching(installed, blocker.blocked, blocker.blocked_version);
            if (hit) {
                active.push_back(blocker);
            }
        }
        return active;
    }

    std::optional<BlockerResolution> BlockerResolver::try_resolve(const Blocker& blocker,
                                                                  const VersionIndex& to_install,
                                                                  const VersionIndex& installed,
                                                                  const PackageIndex& available) const {
        const bool declarer_installing = to_install.contains(blocker.package);
        const bool blocked_installing = to_install.contains(blocker.blocked);

        if (blocker.blocker_type == BlockerType::Soft && declarer_installing && blocked_installing) {
            BlockerResolution r{BlockerResolution::Action::OrderedInstall, blocker};
            r.first = blocker.package;
            r.second = blocker.blocked;
            return r;
        }

        // Current version of the blocked package: the one being installed wins.
        std::optional<Version> current;
        if (auto it = to_install.find(blocker.blocked); it != to_install.end()) {
            current = it->second;
        } else if (auto inst = installed.find(blocker.blocked); inst != installed.end()) {
            current = inst->second;
        }

        if (current) {
            std::optional<Version> newer;
            std::optional<Version> older;
            if (const auto* versions = available.find(blocker.blocked)) {
                for (const auto& candidate : *versions) {
                    if (blocker.blocked_version.matches(candidate.version)) continue;
                    if (candidate.version > *current) {
                        if (!newer || candidate.version > *newer) newer = candidate.version;
                    } else if (candidate.version < *current) {
                        if (!older || candidate.version > *older) older = candidate.version;
                    }
                }
            }

            if (newer || older) {
                const bool upgrade = newer.has_value();
                BlockerResolution r{upgrade ? BlockerResolution::Action::Upgrade
                                            : BlockerResolution::Action::Downgrade, blocker};
                r.package = blocker.blocked;
                r.from = current;
                r.to = upgrade ? newer : older;
                return r;
            }
        }

        if (blocker.blocker_type == BlockerType::Hard && !blocked_installing) {
            auto inst = installed.find(blocker.blocked);
            if (inst != installed.end() && blocker.blocked_version.matches(inst->second)) {
                BlockerResolution r{BlockerResolution::Action::Remove, blocker};
                r.package = blocker.blocked;
                return r;
            }
        }

        return std::nullopt;
    }

    BlockerResult BlockerResolver::resolve_blockers(const std::vector<Blocker>& blockers,
                                                    const VersionIndex& to_install,
                                                    const VersionIndex& installed,
                                                    const PackageIndex& available) const {
        BlockerResult result;
        for (const auto& blocker : blockers) {
            if (auto resolution = try_resolve(blocker, to_install, installed, available)) {
                log::debug("Blocker " + blocker.to_string() + " of " + blocker.package.full_name() +
                           " resolved: " + resolution->describe());
                result.resolved.push_back(std::move(*resolution));
                continue;
            }

            std::string reason = blocker.blocker_type == BlockerType::Hard
                ? "Hard blocker: " + blocker.package.full_name() + " cannot coexist with " + blocker.blocked.full_name()
                : "Soft blocker: " + blocker.package.full_name() + " conflicts with " + blocker.blocked.full_name() +
                  " during installation";
            result.unresolved.push_back({blocker, std::move(reason)});
        }
        return result;
    }

    std::vector<Blocker> extract_blockers_from_package(const PackageInfo& pkg) {
        BlockerResolver resolver;
        resolver.register_from_package(pkg.id, pkg.version, pkg.blockers);
        return resolver.blockers();
    }

} // namespace qr
