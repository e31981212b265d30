//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "package.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qr {

    // Installed-package database. Records are keyed by id and slot, so several
    // slots of one package may be installed side by side.
    class Database {
    public:
        explicit Database(const std::filesystem::path& db_path);
        ~Database();

        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        // --- Transactions ---
        // A single open transaction at a time; writes made in it become visible
        // to other handles only on commit.
        Result<void> begin_transaction();
        Result<void> commit();
        Result<void> rollback();
        bool in_transaction() const;

        // --- Installed packages ---
        // Replaces any record with the same id and slot, including its files.
        Result<void> add_installed_package(const InstalledPackage& pkg);
        Result<void> remove_installed_package(const PackageId& id, const std::string& slot);

        // Highest installed version across slots.
        std::optional<InstalledPackage> get_installed_package(const PackageId& id) const;
        std::optional<InstalledPackage> get_installed_package(const PackageId& id, const std::string& slot) const;
        std::vector<std::string> get_installed_slots(const PackageId& id) const;
        bool is_package_installed(const PackageId& id) const;
        std::vector<InstalledPackage> list_installed_packages() const;

        // Installed packages with a recorded dependency on `id` that the
        // installed `slot` satisfies.
        std::vector<InstalledPackage> get_reverse_dependencies(const PackageId& id, const std::string& slot) const;

        // --- File ownership ---
        // Directories are shared and never reported as owned.
        std::optional<PackageId> find_file_owner(const std::string& path) const;
        std::vector<std::pair<std::string, PackageId>> list_file_owners() const;
        // Drops the ownership record of a non-directory path, used when a forced
        // install takes a file over.
        Result<void> disown_file(const std::string& path);

    private:
        struct Impl;
        std::unique_ptr<Impl> pimpl;
    };

} // namespace qr
