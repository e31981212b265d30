//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "config.h"
#include "package.h"
#include "package_index.h"

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace qr {

    struct ResolutionDecision {
        enum class Kind { Selected, Backtracked };

        Kind kind = Kind::Selected;
        PackageId package;
        Version version;
        uint32_t attempt = 1;   // 1-based position in the viable candidate list

        std::string to_string() const;
    };

    // Solver state. Copied whole into each choice point.
    struct ResolutionState {
        std::map<PackageId, PackageInfo> selected;
        std::deque<PackageId> remaining;
        std::vector<ResolutionDecision> decisions;
        std::vector<PackageId> order;   // selection order
    };

    // Why a candidate was rejected, and who took part.
    struct ResolutionConflict {
        std::string reason;
        std::vector<std::string> packages;
    };

    struct BacktrackResult {
        std::vector<PackageInfo> packages;   // in selection order
        uint32_t backtracks = 0;
        std::vector<ResolutionDecision> decisions;
    };

    class BacktrackResolver {
    public:
        BacktrackResolver(const PackageIndex& available, VersionIndex installed, InstallOptions options);

        Result<BacktrackResult> resolve(const std::vector<PackageId>& requested);

        // Restricts the candidates of `id` to exactly `version`.
        void pin(const PackageId& id, const Version& version) { m_pins[id] = version; }

        uint32_t backtracks() const { return m_backtracks; }

    private:
        struct ChoicePoint {
            PackageId package;
            std::vector<PackageInfo> viable;
            size_t next = 1;
            ResolutionState state;   // before `package` was selected
        };

        enum class Step { Continue, Done, Conflict };

        Step step(ResolutionState& state, ResolutionConflict& conflict);
        bool backtrack(ResolutionState& state);

        std::vector<PackageInfo> candidates(const PackageId& id) const;
        std::optional<ResolutionConflict> check_constraints(const PackageInfo& candidate,
                                                            const ResolutionState& state) const;
        std::optional<ResolutionConflict> check_hard_blockers(const PackageInfo& candidate,
                                                              const ResolutionState& state) const;
        void select(const PackageInfo& pkg, ResolutionState& state, ResolutionDecision::Kind kind,
                    uint32_t attempt) const;
        UseFlagSet use_flags_for(const PackageInfo& pkg) const;

        const PackageIndex& m_available;
        VersionIndex m_installed;
        InstallOptions m_options;
        std::map<PackageId, Version> m_pins;
        std::vector<ChoicePoint> m_choice_points;
        uint32_t m_backtracks = 0;
    };

} // namespace qr
