//
// Created by cv2 on 10/19/26.
//

#include "libqr/backtrack.h"
#include "libqr/blocker.h"
#include "libqr/logging.h"

#include <algorithm>

namespace qr {

    std::string ResolutionDecision::to_string() const {
        const auto atom = package.full_name() + "=" + version.to_string();
        if (kind == Kind::Backtracked) {
            return "Backtrack: trying " + atom + " (attempt " + std::to_string(attempt) + ")";
        }
        return "Selected " + atom;
    }

    BacktrackResolver::BacktrackResolver(const PackageIndex& available, VersionIndex installed, InstallOptions options)
        : m_available(available), m_installed(std::move(installed)), m_options(std::move(options)) {}

    UseFlagSet BacktrackResolver::use_flags_for(const PackageInfo& pkg) const {
        return effective_use_flags(pkg, m_options.use_flags);
    }

    std::vector<PackageInfo> BacktrackResolver::candidates(const PackageId& id) const {
        std::vector<PackageInfo> out;
        const auto* versions = m_available.find(id);
        if (!versions) {
            return out;
        }

        const auto pin = m_pins.find(id);
        const auto& accepted = m_options.accept_keywords;
        for (const auto& pkg : *versions) {
            if (pin != m_pins.end() && pkg.version != pin->second) continue;
            const bool keyword_ok = accepted.empty() || pkg.keywords.empty() ||
                std::any_of(pkg.keywords.begin(), pkg.keywords.end(), [&](const std::string& k) {
                    return std::find(accepted.begin(), accepted.end(), k) != accepted.end();
                });
            if (keyword_ok) out.push_back(pkg);
        }

        // stable_sort keeps load order among equal versions
        if (m_options.backtrack.prefer_newer) {
            std::stable_sort(out.begin(), out.end(),
                             [](const PackageInfo& a, const PackageInfo& b) { return a.version > b.version; });
        } else {
            std::stable_sort(out.begin(), out.end(),
                             [](const PackageInfo& a, const PackageInfo& b) { return a.version < b.version; });
        }

        if (m_options.backtrack.prefer_installed) {
            if (auto it = m_installed.find(id); it != m_installed.end()) {
                std::stable_partition(out.begin(), out.end(),
                                      [&](const PackageInfo& p) { return p.version == it->second; });
            }
        }
        return out;
    }

    // Malformed declarations are reported when the blockers are applied.
    static std::vector<Blocker> hard_blockers_of(const PackageInfo& pkg) {
        std::vector<Blocker> out;
        for (const auto& declaration : pkg.blockers) {
            if (!is_hard_blocker(declaration)) continue;
            if (auto blocker = BlockerResolver::parse_blocker(pkg.id, pkg.version, declaration)) {
                out.push_back(std::move(*blocker));
            }
        }
        return out;
    }

    std::optional<ResolutionConflict> BacktrackResolver::check_hard_blockers(const PackageInfo& candidate,
                                                                            const ResolutionState& state) const {
        const auto conflict = [](const PackageInfo& declarer, const Blocker& blocker, const PackageInfo& blocked) {
            return ResolutionConflict{"Hard blocker: " + declarer.display_name() + " blocks " +
                                      blocked.display_name() + " (" + blocker.to_string() + ")",
                                      {declarer.id.full_name(), blocked.id.full_name()}};
        };

        for (const auto& [id, pkg] : state.selected) {
            for (const auto& blocker : hard_blockers_of(pkg)) {
                if (blocker.blocked == candidate.id && blocker.blocked_version.matches(candidate.version)) {
                    return conflict(pkg, blocker, candidate);
                }
            }
        }

        for (const auto& blocker : hard_blockers_of(candidate)) {
            auto it = state.selected.find(blocker.blocked);
            if (it != state.selected.end() && blocker.blocked_version.matches(it->second.version)) {
                return conflict(candidate, blocker, it->second);
            }
        }
        return std::nullopt;
    }

    std::optional<ResolutionConflict> BacktrackResolver::check_constraints(const PackageInfo& candidate,
                                                                          const ResolutionState& state) const {
        // What the already selected packages require of the candidate.
        for (const auto& [id, pkg] : state.selected) {
            const auto flags = use_flags_for(pkg);
            for (const auto* dep : pkg.all_dependencies()) {
                if (dep->package != candidate.id || !dep->is_active(flags)) continue;
                if (!dep->accepts(candidate.version, candidate.slot)) {
                    return ResolutionConflict{pkg.display_name() + " requires " + dep->to_string() + " but got " +
                                              candidate.display_name() + ":" + candidate.slot,
                                              {id.full_name(), candidate.id.full_name()}};
                }
            }
        }

        // What the candidate requires of the already selected packages.
        const auto flags = use_flags_for(candidate);
        for (const auto* dep : candidate.all_dependencies()) {
            if (!dep->is_active(flags)) continue;
            auto it = state.selected.find(dep->package);
            if (it != state.selected.end() && !dep->accepts(it->second.version, it->second.slot)) {
                return ResolutionConflict{candidate.display_name() + " requires " + dep->to_string() + " but " +
                                          it->second.display_name() + ":" + it->second.slot + " is selected",
                                          {candidate.id.full_name(), it->first.full_name()}};
            }
        }

        // --force leaves hard blockers to the blocker pass, which only warns.
        if (!m_options.force) {
            if (auto blocked = check_hard_blockers(candidate, state)) {
                return blocked;
            }
        }

        if (!m_options.backtrack.allow_slot_conflicts) {
            for (const auto& [id, pkg] : state.selected) {
                if (id != candidate.id && id.name == candidate.id.name && pkg.slot == candidate.slot) {
                    return ResolutionConflict{"Slot conflict: " + id.full_name() + " and " +
                                              candidate.id.full_name() + " both use slot " + candidate.slot,
                                              {id.full_name(), candidate.id.full_name()}};
                }
            }
        }
        return std::nullopt;
    }

    void BacktrackResolver::select(const PackageInfo& pkg, ResolutionState& state, ResolutionDecision::Kind kind,
                                   uint32_t attempt) const {
        state.selected[pkg.id] = pkg;
        state.order.push_back(pkg.id);
        state.decisions.push_back({kind, pkg.id, pkg.version, attempt});
        log::debug(state.decisions.back().to_string());

        if (m_options.no_deps) {
            return;
        }

        const auto flags = use_flags_for(pkg);
        for (const auto* dep : pkg.all_dependencies()) {
            if (dep->optional || !dep->is_active(flags)) continue;
            if (state.selected.contains(dep->package)) continue;
            if (std::find(state.remaining.begin(), state.remaining.end(), dep->package) != state.remaining.end()) {
                continue;
            }
            state.remaining.push_back(dep->package);
        }
    }

    BacktrackResolver::Step BacktrackResolver::step(ResolutionState& state, ResolutionConflict& conflict) {
        if (state.remaining.empty()) {
            return Step::Done;
        }

        const PackageId id = state.remaining.front();
        state.remaining.pop_front();
        if (state.selected.contains(id)) {
            return Step::Continue;
        }

        auto all = candidates(id);
        if (all.empty()) {
            if (!m_available.find(id)) {
                conflict = {"Package not found: " + id.full_name(), {id.full_name()}};
            } else if (m_pins.contains(id)) {
                conflict = {"Version " + m_pins.at(id).to_string() + " of " + id.full_name() + " is not available",
                            {id.full_name()}};
            } else {
                conflict = {"No version of " + id.full_name() + " has an accepted keyword", {id.full_name()}};
            }
            return Step::Conflict;
        }

        std::vector<PackageInfo> viable;
        std::optional<ResolutionConflict> first_failure;
        for (auto& candidate : all) {
            if (auto reason = check_constraints(candidate, state)) {
                if (!first_failure) first_failure = std::move(reason);
                continue;
            }
            viable.push_back(std::move(candidate));
        }

        if (viable.empty()) {
            conflict = std::move(*first_failure);
            return Step::Conflict;
        }

        if (viable.size() > 1) {
            m_choice_points.push_back(ChoicePoint{id, viable, 1, state});
        }
        select(viable.front(), state, ResolutionDecision::Kind::Selected, 1);
        return Step::Continue;
    }

    bool BacktrackResolver::backtrack(ResolutionState& state) {
        if (m_backtracks >= m_options.backtrack.max_backtracks) {
            return false;
        }

        while (!m_choice_points.empty()) {
            auto& choice = m_choice_points.back();
            if (choice.next >= choice.viable.size()) {
                m_choice_points.pop_back();
                continue;
            }

            state = choice.state;
            ++m_backtracks;
            const auto attempt = static_cast<uint32_t>(choice.next + 1);
            const PackageInfo pkg = choice.viable[choice.next++];
            select(pkg, state, ResolutionDecision::Kind::Backtracked, attempt);
            return true;
        }
        return false;
    }

    Result<BacktrackResult> BacktrackResolver::resolve(const std::vector<PackageId>& requested) {
        m_choice_points.clear();
        m_backtracks = 0;

        ResolutionState state;
        for (const auto& id : requested) {
            if (std::find(state.remaining.begin(), state.remaining.end(), id) == state.remaining.end()) {
                state.remaining.push_back(id);
            }
        }

        ResolutionConflict conflict;
        while (true) {
            switch (step(state, conflict)) {
                case Step::Continue:
                    break;
                case Step::Done: {
                    BacktrackResult result;
                    result.backtracks = m_backtracks;
                    result.decisions = std::move(state.decisions);
                    for (const auto& id : state.order) {
                        result.packages.push_back(state.selected.at(id));
                    }
                    return result;
                }
                case Step::Conflict:
                    log::debug("Conflict: " + conflict.reason);
                    if (!backtrack(state)) {
                        return std::unexpected(Error(ErrorCode::ResolutionFailed,
                                                     "Could not resolve dependencies after " +
                                                     std::to_string(m_backtracks) + " backtracks: " + conflict.reason,
                                                     std::move(conflict.packages)));
                    }
                    break;
            }
        }
    }

} // namespace qr
