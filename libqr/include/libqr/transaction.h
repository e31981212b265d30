//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "build.h"
#include "collision.h"
#include "config.h"
#include "database.h"
#include "package.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace qr {

    struct Operation {
        enum class Kind { Install, Remove, Upgrade };

        Kind kind = Kind::Install;
        std::optional<PackageInfo> package;          // Install, Upgrade: what gets built and installed
        std::optional<InstalledPackage> installed;   // Remove, Upgrade: the record that goes away
        bool explicit_install = false;
        UseFlagSet use_flags;

        static Operation install(PackageInfo pkg, UseFlagSet use_flags, bool explicit_install);
        static Operation remove(InstalledPackage pkg);
        static Operation upgrade(InstalledPackage from, PackageInfo to, UseFlagSet use_flags, bool explicit_install);

        const PackageId& id() const;
        std::string describe() const;
    };

    enum class TransactionState { Pending, Committed, RolledBack };

    struct TransactionOptions {
        std::filesystem::path root = "/";
        // Backups and staging live in <workspace>/tx/<id>.
        std::filesystem::path workspace;
        unsigned jobs = 1;
        bool force = false;
        CollisionConfig collision;
    };

    // Build target used for a package: its declared target, or "cat/name-version".
    std::string build_target_for(const PackageInfo& pkg);

    // Applies a set of operations all-or-nothing: removes first, then upgrades,
    // then installs, inside one database transaction. On any failure the
    // database is rolled back and every touched path is restored.
    class Transaction {
    public:
        Transaction(Database& db, BuildBackend& builder, TransactionOptions options);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void add(Operation op);
        void add_install(PackageInfo pkg, UseFlagSet use_flags = {}, bool explicit_install = true);
        void add_remove(InstalledPackage pkg);
        void add_upgrade(InstalledPackage from, PackageInfo to, UseFlagSet use_flags = {}, bool explicit_install = true);

        const std::vector<Operation>& operations() const { return m_operations; }
        bool empty() const { return m_operations.empty(); }
        TransactionState state() const { return m_state; }

        // Error is always TransactionRolledBack (cause set) once execution started.
        Result<void> execute();

    private:
        struct FileSystemJournal;

        std::filesystem::path system_path(const std::string& path) const;
        void execute_remove(const InstalledPackage& pkg, FileSystemJournal& journal, CollisionDetector& detector);
        InstalledPackage execute_install(const Operation& op, BuildPool& pool, FileSystemJournal& journal,
                                         CollisionDetector& detector);
        void backup_existing(const std::filesystem::path& path, const std::string& system_name,
                             FileSystemJournal& journal);
        void rollback_filesystem(const FileSystemJournal& journal);

        Database& m_db;
        BuildBackend& m_builder;
        TransactionOptions m_options;
        std::vector<Operation> m_operations;
        TransactionState m_state = TransactionState::Pending;
    };

} // namespace qr
