//
// Created by cv2 on 10/19/26.
//

#include "libqr/dependency_resolver.h"
#include "libqr/logging.h"

#include <algorithm>

namespace qr {

    DependencyResolver::DependencyResolver(const PackageIndex& available, const std::vector<InstalledPackage>& installed)
        : m_available(available), m_installed(installed) {
        // With several slots installed, the newest version stands for the package.
        for (const auto& pkg : m_installed) {
            auto it = m_installed_versions.find(pkg.id);
            if (it == m_installed_versions.end() || pkg.version > it->second) {
                m_installed_versions[pkg.id] = pkg.version;
            }
        }
    }

    Result<void> DependencyResolver::apply_blockers(Resolution& resolution, const InstallOptions& opts,
                                                    std::vector<std::pair<PackageId, PackageId>>& ordering,
                                                    std::vector<BlockerResolution>& replacements) const {
        BlockerResolver blockers;
        VersionIndex to_install;
        for (const auto& pkg : resolution.packages) {
            to_install[pkg.id] = pkg.version;
            blockers.register_from_package(pkg.id, pkg.version, pkg.blockers);
        }
        for (const auto& pkg : m_installed) {
            if (!to_install.contains(pkg.id)) {
                blockers.register_from_package(pkg.id, pkg.version, pkg.blockers);
            }
        }

        const auto active = blockers.check_blockers(to_install, m_installed_versions);
        if (active.empty()) {
            return {};
        }

        auto result = blockers.resolve_blockers(active, to_install, m_installed_versions, m_available);
        if (!result.all_resolved()) {
            std::string reasons;
            std::vector<std::string> involved;
            for (const auto& u : result.unresolved) {
                if (!reasons.empty()) reasons += "; ";
                reasons += u.reason;
                involved.push_back(u.blocker.package.full_name());
                involved.push_back(u.blocker.blocked.full_name());
            }
            if (!opts.force) {
                return std::unexpected(Error(ErrorCode::ResolutionFailed, "Unresolved blockers: " + reasons,
                                             std::move(involved)));
            }
            log::warn("Ignoring unresolved blockers (--force): " + reasons);
        }

        for (const auto& action : result.resolved) {
            switch (action.action) {
                case BlockerResolution::Action::OrderedInstall:
                    ordering.emplace_back(action.first, action.second);
                    break;
                case BlockerResolution::Action::Remove:
                    if (std::find(resolution.removals.begin(), resolution.removals.end(), action.package) ==
                        resolution.removals.end()) {
                        resolution.removals.push_back(action.package);
                    }
                    break;
                case BlockerResolution::Action::Upgrade:
                case BlockerResolution::Action::Downgrade:
                    replacements.push_back(action);
                    break;
            }
            log::info("Blocker " + action.blocker.to_string() + " (from " + action.blocker.package.full_name() +
                      "): " + action.describe());
            resolution.blocker_actions.push_back(action);
        }
        return {};
    }

    Result<Resolution> DependencyResolver::resolve(const std::vector<PackageId>& requested,
                                                   const InstallOptions& opts) const {
        std::vector<PackageId> wanted = requested;
        std::map<PackageId, Version> pins;
        std::vector<BlockerResolution> applied;
        Resolution resolution;
        std::vector<std::pair<PackageId, PackageId>> ordering;

        while (true) {
            BacktrackResolver solver(m_available, m_installed_versions, opts);
            for (const auto& [id, version] : pins) {
                solver.pin(id, version);
            }
            auto selection = solver.resolve(wanted);
            if (!selection) {
                log::error(selection.error().message);
                return std::unexpected(selection.error());
            }

            resolution = Resolution{};
            resolution.packages = std::move(selection->packages);
            resolution.decisions = std::move(selection->decisions);
            resolution.backtracks = selection->backtracks;
            ordering.clear();

            std::vector<BlockerResolution> replacements;
            if (auto blocked = apply_blockers(resolution, opts, ordering, replacements); !blocked) {
                return std::unexpected(blocked.error());
            }
            if (replacements.empty()) {
                break;
            }

            bool pinned_new = false;
            for (auto& action : replacements) {
                auto pinned = pins.find(action.package);
                if (pinned != pins.end() && pinned->second == *action.to) {
                    continue;
                }
                if (pinned != pins.end()) {
                    return std::unexpected(Error(ErrorCode::ResolutionFailed,
                                                 "Blocker " + action.blocker.to_string() + " (from " +
                                                 action.blocker.package.full_name() + ") needs " +
                                                 action.package.full_name() + "-" + action.to->to_string() +
                                                 " but " + pinned->second.to_string() + " was already chosen",
                                                 {action.blocker.package.full_name(), action.package.full_name()}));
                }
                pins.emplace(action.package, *action.to);
                pinned_new = true;
                if (std::find(wanted.begin(), wanted.end(), action.package) == wanted.end()) {
                    wanted.push_back(action.package);
                }
                applied.push_back(std::move(action));
            }
            if (!pinned_new) {
                return make_error(ErrorCode::ResolutionFailed, "Blocker resolution did not converge");
            }
            log::info("Resolving again with blocker replacements");
        }
        resolution.blocker_actions.insert(resolution.blocker_actions.begin(), applied.begin(), applied.end());

        for (const auto& pkg : resolution.packages) {
            resolution.use_flags[pkg.id] = effective_use_flags(pkg, opts.use_flags);
        }

        CircularDetector detector;
        detector.build_graph(resolution.packages, resolution.use_flags);
        for (const auto& [before, after] : ordering) {
            detector.add_ordering_constraint(before, after);
        }

        resolution.cycles = detector.detect_cycles();
        for (const auto& cycle : resolution.cycles) {
            log::warn(cycle.describe());
            if (cycle.breakable && cycle.strategy.kind == CycleBreakStrategy::Kind::DisableUseFlag) {
                resolution.disabled_use_flags[cycle.strategy.package].insert(cycle.strategy.flag);
                resolution.use_flags[cycle.strategy.package].erase(cycle.strategy.flag);
            }
        }

        auto order = detector.break_cycles_and_order(resolution.cycles);
        if (!order) {
            log::error(order.error().message);
            return std::unexpected(order.error());
        }

        std::map<PackageId, PackageInfo> by_id;
        for (auto& pkg : resolution.packages) {
            by_id.emplace(pkg.id, std::move(pkg));
        }
        resolution.packages.clear();
        for (const auto& id : *order) {
            resolution.packages.push_back(std::move(by_id.at(id)));
        }
        return resolution;
    }

} // namespace qr
