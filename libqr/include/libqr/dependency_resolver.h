//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "backtrack.h"
#include "blocker.h"
#include "circular.h"
#include "package.h"
#include "package_index.h"

#include <map>
#include <set>
#include <vector>

namespace qr {

    struct Resolution {
        std::vector<PackageInfo> packages;            // build order
        std::vector<ResolutionDecision> decisions;
        std::vector<BlockerResolution> blocker_actions;
        std::vector<PackageId> removals;              // installed packages a hard blocker forces out
        std::vector<CircularDependency> cycles;       // cycles that were broken
        std::map<PackageId, UseFlagSet> use_flags;    // effective flags after cycle breaking
        std::map<PackageId, std::set<std::string>> disabled_use_flags;
        uint32_t backtracks = 0;

        bool empty() const { return packages.empty() && removals.empty(); }
    };

    // Runs the backtracking solver, then applies blocker resolution, then
    // orders the selection with the cycle detector. A blocker resolved by
    // moving a package to another version pins that version and solves again,
    // so the replacement is checked and its dependencies are pulled in.
    class DependencyResolver {
    public:
        DependencyResolver(const PackageIndex& available, const std::vector<InstalledPackage>& installed);

        Result<Resolution> resolve(const std::vector<PackageId>& requested, const InstallOptions& opts) const;

    private:
        Result<void> apply_blockers(Resolution& resolution, const InstallOptions& opts,
                                    std::vector<std::pair<PackageId, PackageId>>& ordering,
                                    std::vector<BlockerResolution>& replacements) const;

        const PackageIndex& m_available;
        const std::vector<InstalledPackage>& m_installed;
        VersionIndex m_installed_versions;
    };

} // namespace qr
