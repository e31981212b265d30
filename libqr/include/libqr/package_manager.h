//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "build.h"
#include "config.h"
#include "database.h"
#include "dependency_resolver.h"
#include "package_index.h"
#include "transaction.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace qr {

    // The complete plan of action for a system change.
    struct Plan {
        Resolution resolution;
        std::vector<Operation> operations;

        bool empty() const { return operations.empty(); }
    };

    struct VerifyResult {
        PackageId id;
        std::string slot;
        std::vector<std::string> missing;
        std::vector<std::string> modified;   // content hash or link target differs

        bool ok() const { return missing.empty() && modified.empty(); }
    };

    class PackageManager {
    public:
        // Without a backend, builds run through the configured command template.
        PackageManager(Config config, PackageIndex available, std::unique_ptr<BuildBackend> builder = nullptr);

        // Loads the repository index files named by the configuration.
        static Result<std::unique_ptr<PackageManager>> open(Config config,
                                                            std::unique_ptr<BuildBackend> builder = nullptr);

        // --- Planning ---
        Result<Plan> plan_install(const std::vector<std::string>& atoms, const InstallOptions& opts);
        Result<Plan> plan_remove(const std::vector<std::string>& atoms, const InstallOptions& opts);
        Result<Plan> plan_update(const InstallOptions& opts);
        Result<Plan> plan_depclean(const InstallOptions& opts);

        // Runs the plan as one transaction. Does nothing under `pretend`.
        Result<void> execute(const Plan& plan, const InstallOptions& opts);

        // Plan and execute in one step.
        Result<void> install(const std::vector<std::string>& atoms, const InstallOptions& opts);
        Result<void> remove(const std::vector<std::string>& atoms, const InstallOptions& opts);
        Result<void> update(const InstallOptions& opts);

        // --- Queries ---
        std::vector<InstalledPackage> list_installed() const;
        std::optional<PackageId> find_owner(const std::string& path) const;
        std::vector<VerifyResult> verify() const;

        // "cat/name" or a bare name that matches exactly one available package.
        Result<PackageId> resolve_name(const std::string& atom) const;

        const PackageIndex& available() const { return m_available; }
        const Config& config() const { return m_config; }
        Database& database() { return m_db; }

    private:
        Result<Plan> plan_from_resolution(Resolution resolution, const std::set<PackageId>& requested,
                                          const InstallOptions& opts);
        Result<std::vector<InstalledPackage>> resolve_installed(const std::string& atom) const;

        Config m_config;
        PackageIndex m_available;
        Database m_db;
        std::unique_ptr<BuildBackend> m_builder;
    };

} // namespace qr
