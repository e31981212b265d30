//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "package.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qr {

    class PackageIndex;

    enum class BlockerType {
        Hard,   // "!!atom": the two packages may never coexist
        Soft    // "!atom": may not be present at the same time during installation
    };

    struct Blocker {
        PackageId package;          // declarer
        Version version;            // declarer's version
        PackageId blocked;
        VersionSpec blocked_version;
        BlockerType blocker_type = BlockerType::Soft;

        std::string to_string() const;
    };

    struct BlockerResolution {
        enum class Action { Remove, Upgrade, Downgrade, OrderedInstall };

        Action action;
        Blocker blocker;
        PackageId package;            // Remove, Upgrade, Downgrade
        std::optional<Version> from;  // Upgrade, Downgrade
        std::optional<Version> to;    // Upgrade, Downgrade
        PackageId first;              // OrderedInstall
        PackageId second;             // OrderedInstall

        std::string describe() const;
    };

    struct UnresolvedBlocker {
        Blocker blocker;
        std::string reason;
    };

    struct BlockerResult {
        std::vector<BlockerResolution> resolved;
        std::vector<UnresolvedBlocker> unresolved;

        bool all_resolved() const { return unresolved.empty(); }
    };

    class BlockerResolver {
    public:
        // "!!cat/name", "!cat/name" or with an operator, "!<cat/name-1.2"
        static Result<Blocker> parse_blocker(const PackageId& declarer, const Version& version, std::string_view text);

        void register_blocker(Blocker blocker);

        // Registers every well-formed blocker declared by the package; malformed
        // declarations are logged and skipped.
        void register_from_package(const PackageId& id, const Version& version,
                                   const std::vector<std::string>& declarations);

        const std::vector<Blocker>& blockers() const { return m_blockers; }

        // Blockers whose declarer is present and whose blocked target is
        // present at a matching version.
        std::vector<Blocker> check_blockers(const VersionIndex& to_install, const VersionIndex& installed) const;

        BlockerResult resolve_blockers(const std::vector<Blocker>& blockers,
                                       const VersionIndex& to_install,
                                       const VersionIndex& installed,
                                       const PackageIndex& available) const;

    private:
        std::optional<BlockerResolution> try_resolve(const Blocker& blocker,
                                                     const VersionIndex& to_install,
                                                     const VersionIndex& installed,
                                                     const PackageIndex& available) const;

        std::vector<Blocker> m_blockers;
    };

    bool is_blocker(std::string_view declaration);
    bool is_hard_blocker(std::string_view declaration);

    // Parses the blocker declarations of an index entry.
    std::vector<Blocker> extract_blockers_from_package(const PackageInfo& pkg);

} // namespace qr
