//
// Created by cv2 on 10/19/26.
//

#include "libqr/transaction.h"
#include "libqr/archive.h"
#include "libqr/crypto.h"
#include "libqr/logging.h"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <fstream>
#include <map>
#include <ranges>
#include <set>
#include <sys/acl.h>
#include <sys/stat.h>
#include <sys/xattr.h>
#include <unistd.h>

namespace qr {

    // Copies one filesystem object with its metadata: type, content or link
    // target, ownership, mode, extended attributes and access ACL.
    static bool replicate_object(const std::filesystem::path& from, const std::filesystem::path& to) {
        struct stat statbuf{};
        if (lstat(from.c_str(), &statbuf) != 0) {
            log::error("Failed to lstat source object: " + from.string());
            return false;
        }

        const auto kind = statbuf.st_mode & S_IFMT;
        switch (kind) {
            case S_IFLNK: {
                std::vector<char> buf(statbuf.st_size + 1);
                ssize_t len = readlink(from.c_str(), buf.data(), buf.size());
                if (len == -1) {
                    log::error("Failed to read symlink: " + from.string());
                    return false;
                }
                buf[len] = '\0';
                if (symlink(buf.data(), to.c_str()) != 0) {
                    log::error("Failed to create symlink: " + to.string());
                    return false;
                }
                break;
            }

            case S_IFREG: {
                std::ifstream in(from, std::ios::binary);
                if (!in) { log::error("Failed to open source file: " + from.string()); return false; }
                std::ofstream out(to, std::ios::binary | std::ios::trunc);
                if (!out) { log::error("Failed to create destination file: " + to.string()); return false; }
                out << in.rdbuf();
                if (!out) { log::error("Failed to write destination file: " + to.string()); return false; }
                break;
            }

            case S_IFCHR:
            case S_IFBLK: {
                if (mknod(to.c_str(), statbuf.st_mode, statbuf.st_rdev) != 0) {
                    log::error("Failed to create device node: " + to.string());
                    return false;
                }
                break;
            }

            case S_IFIFO: {
                if (mkfifo(to.c_str(), statbuf.st_mode & 07777) != 0) {
                    log::error("Failed to create fifo: " + to.string());
                    return false;
                }
                break;
            }

            case S_IFDIR: {
                if (mkdir(to.c_str(), statbuf.st_mode & 07777) != 0 && errno != EEXIST) {
                    log::error("Failed to create directory: " + to.string());
                    return false;
                }
                break;
            }

            default:
                log::error("Unsupported file type for replication: " + from.string());
                return false;
        }

        if ((kind == S_IFLNK) ?
             lchown(to.c_str(), statbuf.st_uid, statbuf.st_gid) != 0 :
             chown(to.c_str(), statbuf.st_uid, statbuf.st_gid) != 0) {
            log::warn("Failed to chown destination object: " + to.string());
        }

        if (kind != S_IFLNK) {
            if (chmod(to.c_str(), statbuf.st_mode & 07777) != 0) {
                log::warn("Failed to chmod destination object: " + to.string());
            }
        }

        ssize_t list_size = llistxattr(from.c_str(), nullptr, 0);
        if (list_size > 0) {
            std::vector<char> names(list_size);
            list_size = llistxattr(from.c_str(), names.data(), names.size());
            for (const char* name = names.data(); list_size > 0 && name < names.data() + list_size;
                 name += strlen(name) + 1) {
                ssize_t value_size = lgetxattr(from.c_str(), name, nullptr, 0);
                if (value_size < 0) continue;
                std::vector<char> value(value_size);
                if (lgetxattr(from.c_str(), name, value.data(), value.size()) < 0 ||
                    lsetxattr(to.c_str(), name, value.data(), value.size(), 0) != 0) {
                    log::debug(std::string("Could not copy xattr ") + name + " to " + to.string());
                }
            }
        }

        // ACLs cannot be set on symlinks.
        if (kind != S_IFLNK) {
            acl_t acl = acl_get_file(from.c_str(), ACL_TYPE_ACCESS);
            if (acl) {
                if (acl_set_file(to.c_str(), ACL_TYPE_ACCESS, acl) != 0) {
                    log::debug("Failed to set ACL on destination object: " + to.string());
                }
                acl_free(acl);
            }
        }

        return true;
    }

    // --- Operation ---

    Operation Operation::install(PackageInfo pkg, UseFlagSet use_flags, bool explicit_install) {
        Operation op;
        op.kind = Kind::Install;
        op.package = std::move(pkg);
        op.use_flags = std::move(use_flags);
        op.explicit_install = explicit_install;
        return op;
    }

    Operation Operation::remove(InstalledPackage pkg) {
        Operation op;
        op.kind = Kind::Remove;
        op.explicit_install = pkg.explicit_install;
        op.installed = std::move(pkg);
        return op;
    }

    Operation Operation::upgrade(InstalledPackage from, PackageInfo to, UseFlagSet use_flags, bool explicit_install) {
        Operation op;
        op.kind = Kind::Upgrade;
        op.installed = std::move(from);
        op.package = std::move(to);
        op.use_flags = std::move(use_flags);
        op.explicit_install = explicit_install;
        return op;
    }

    const PackageId& Operation::id() const {
        return package ? package->id : installed->id;
    }

    std::string Operation::describe() const {
        switch (kind) {
            case Kind::Install:
                return "install " + package->display_name() + ":" + package->slot;
            case Kind::Remove:
                return "remove " + installed->display_name() + ":" + installed->slot;
            case Kind::Upgrade: {
                const char* verb = package->version < installed->version ? "downgrade " : "upgrade ";
                if (package->version == installed->version) verb = "reinstall ";
                return verb + installed->display_name() + " -> " + package->version.to_string();
            }
        }
        return "";
    }

    std::string build_target_for(const PackageInfo& pkg) {
        if (!pkg.build_target.empty()) {
            return pkg.build_target;
        }
        return pkg.display_name();
    }

    // --- Transaction ---

    struct Transaction::FileSystemJournal {
        std::vector<std::filesystem::path> new_files_committed;
        std::map<std::filesystem::path, std::filesystem::path> old_files_backed_up;
        std::vector<std::filesystem::path> created_directories;
        std::filesystem::path backup_dir;
        std::filesystem::path staging_dir;
        // Directory -> packages that record it.
        std::map<std::string, std::set<PackageId>> directory_users;
    };

    Transaction::Transaction(Database& db, BuildBackend& builder, TransactionOptions options)
        : m_db(db), m_builder(builder), m_options(std::move(options)) {}

    Transaction::~Transaction() = default;

    void Transaction::add(Operation op) {
        m_operations.push_back(std::move(op));
    }

    void Transaction::add_install(PackageInfo pkg, UseFlagSet use_flags, bool explicit_install) {
        add(Operation::install(std::move(pkg), std::move(use_flags), explicit_install));
    }

    void Transaction::add_remove(InstalledPackage pkg) {
        add(Operation::remove(std::move(pkg)));
    }

    void Transaction::add_upgrade(InstalledPackage from, PackageInfo to, UseFlagSet use_flags, bool explicit_install) {
        add(Operation::upgrade(std::move(from), std::move(to), std::move(use_flags), explicit_install));
    }

    std::filesystem::path Transaction::system_path(const std::string& path) const {
        return m_options.root / std::filesystem::path(path).relative_path();
    }

    void Transaction::backup_existing(const std::filesystem::path& path, const std::string& system_name,
                                      FileSystemJournal& journal) {
        if (journal.old_files_backed_up.contains(path)) {
            return;
        }
        // Written earlier in this transaction: rollback deletes it, nothing to restore.
        if (std::find(journal.new_files_committed.begin(), journal.new_files_committed.end(), path) !=
            journal.new_files_committed.end()) {
            return;
        }
        const auto backup_path = journal.backup_dir / std::filesystem::path(system_name).relative_path();
        std::filesystem::create_directories(backup_path.parent_path());
        if (!replicate_object(path, backup_path)) {
            throw TransactionException(ErrorCode::FileSystemError, "Failed to back up " + system_name);
        }
        journal.old_files_backed_up[path] = backup_path;
    }

    void Transaction::execute_remove(const InstalledPackage& pkg, FileSystemJournal& journal,
                                     CollisionDetector& detector) {
        log::info("Removing " + pkg.display_name() + ":" + pkg.slot);

        auto files = pkg.files;
        std::sort(files.begin(), files.end(),
                  [](const InstalledFile& a, const InstalledFile& b) { return a.path < b.path; });

        // Back up everything first, parents before children.
        for (const auto& file : files) {
            const auto path = system_path(file.path);
            std::error_code ec;
            if (!std::filesystem::exists(std::filesystem::symlink_status(path, ec))) {
                continue;
            }
            backup_existing(path, file.path, journal);
        }

        // Then remove, children before parents.
        std::vector<std::string> owned;
        for (const auto& file : std::ranges::reverse_view(files)) {
            const auto path = system_path(file.path);
            std::error_code ec;
            const auto status = std::filesystem::symlink_status(path, ec);

            if (file.file_type == FileType::Directory) {
                auto& users = journal.directory_users[file.path];
                users.erase(pkg.id);
                if (users.empty() && std::filesystem::is_directory(status) && std::filesystem::is_empty(path)) {
                    std::filesystem::remove(path);
                }
                continue;
            }

            owned.push_back(file.path);
            if (std::filesystem::exists(status)) {
                std::filesystem::remove(path);
                log::debug("removed " + file.path);
            }
        }

        if (auto removed = m_db.remove_installed_package(pkg.id, pkg.slot); !removed) {
            throw TransactionException(ErrorCode::DatabaseError, removed.error().message);
        }
        detector.unregister_files(pkg.id, owned);
    }

    InstalledPackage Transaction::execute_install(const Operation& op, BuildPool& pool, FileSystemJournal& journal,
                                                  CollisionDetector& detector) {
        const auto& pkg = *op.package;
        log::info("Installing " + pkg.display_name() + ":" + pkg.slot);

        const auto target = build_target_for(pkg);
        const auto build = pool.wait(target);
        if (!build.success) {
            std::string detail = build.stderr_log;
            if (detail.size() > 512) detail = "..." + detail.substr(detail.size() - 512);
            throw TransactionException(ErrorCode::BuildFailed,
                                       "Build of " + pkg.display_name() + " (" + target + ") failed" +
                                       (detail.empty() ? "" : ": " + detail));
        }
        if (!build.output_path) {
            throw TransactionException(ErrorCode::BuildFailed,
                                       "Build of " + pkg.display_name() + " produced no output");
        }

        std::filesystem::path tree = *build.output_path;
        if (!std::filesystem::is_directory(tree)) {
            if (!is_archive(tree)) {
                throw TransactionException(ErrorCode::ExtractionFailed,
                                           "Artifact of " + pkg.display_name() + " is neither a directory nor an archive");
            }
            tree = journal.staging_dir / (pkg.id.category + "_" + pkg.id.name + "_" + pkg.slot);
            std::filesystem::remove_all(tree);
            auto extracted = extract(*build.output_path, tree);
            if (!extracted) {
                throw TransactionException(ErrorCode::ExtractionFailed, extracted.error().message);
            }
        }

        // Manifest of the artifact, sorted so directories precede their contents.
        std::vector<InstalledFile> manifest;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(tree)) {
            const auto status = entry.symlink_status();
            InstalledFile file;
            file.path = "/" + entry.path().lexically_relative(tree).generic_string();
            file.mode = static_cast<uint32_t>(status.permissions()) & 07777;

            switch (status.type()) {
                case std::filesystem::file_type::directory: file.file_type = FileType::Directory; break;
                case std::filesystem::file_type::symlink:
                    file.file_type = FileType::Symlink;
                    file.link_target = std::filesystem::read_symlink(entry.path()).string();
                    break;
                case std::filesystem::file_type::regular: file.file_type = FileType::Regular; break;
                case std::filesystem::file_type::block:
                case std::filesystem::file_type::character: file.file_type = FileType::Device; break;
                case std::filesystem::file_type::fifo: file.file_type = FileType::Fifo; break;
                default:
                    log::warn("Skipping unsupported entry " + file.path + " in " + pkg.display_name());
                    continue;
            }
            manifest.push_back(std::move(file));
        }
        std::sort(manifest.begin(), manifest.end(),
                  [](const InstalledFile& a, const InstalledFile& b) { return a.path < b.path; });

        auto collisions = detector.check_collisions(pkg.id, manifest, m_options.force);
        if (!collisions.can_proceed) {
            log::error(format_collision_report(collisions));
            throw TransactionException(ErrorCode::FileCollision,
                                       "File collisions installing " + pkg.display_name() + "\n" +
                                       format_collision_report(collisions));
        }
        std::set<std::string> kept_on_disk;
        for (const auto& [collision, action] : detector.resolve_collisions(collisions, m_options.force)) {
            switch (action) {
                case CollisionAction::Replace:
                    if (collision.owner) {
                        log::warn("Taking over " + collision.path + " from " + collision.owner->full_name());
                        if (auto disowned = m_db.disown_file(collision.path); !disowned) {
                            throw TransactionException(ErrorCode::DatabaseError, disowned.error().message);
                        }
                        detector.unregister_files(*collision.owner, {collision.path});
                    } else {
                        log::warn("Replacing " + collision.path + " (" + to_string(collision.type) + ")");
                    }
                    break;
                case CollisionAction::Backup:
                    log::debug(std::string(to_string(collision.type)) + ": " + collision.path);
                    backup_existing(system_path(collision.path), collision.path, journal);
                    break;
                case CollisionAction::Skip:
                    log::warn("Keeping existing " + collision.path);
                    kept_on_disk.insert(collision.path);
                    break;
            }
        }
        std::erase_if(manifest, [&](const InstalledFile& f) { return kept_on_disk.contains(f.path); });

        uint64_t total_size = 0;
        std::vector<std::string> owned;
        for (auto& file : manifest) {
            const auto source = tree / std::filesystem::path(file.path).relative_path();
            const auto dest = system_path(file.path);
            std::error_code ec;
            const auto dest_status = std::filesystem::symlink_status(dest, ec);

            if (file.file_type == FileType::Directory) {
                journal.directory_users[file.path].insert(pkg.id);
                if (std::filesystem::is_directory(dest_status)) {
                    continue;
                }
                if (std::filesystem::exists(dest_status)) {
                    backup_existing(dest, file.path, journal);
                    std::filesystem::remove(dest);
                }
                std::filesystem::create_directory(dest);
                std::filesystem::permissions(dest, static_cast<std::filesystem::perms>(file.mode));
                journal.created_directories.push_back(dest);
                continue;
            }

            if (std::filesystem::exists(dest_status)) {
                if (std::filesystem::is_directory(dest_status)) {
                    throw TransactionException(ErrorCode::FileCollision,
                                               "Refusing to replace directory " + file.path + " with a file");
                }
                backup_existing(dest, file.path, journal);
                std::filesystem::remove(dest);
            }

            switch (file.file_type) {
                case FileType::Regular:
                case FileType::Hardlink: {
                    std::filesystem::copy_file(source, dest, std::filesystem::copy_options::overwrite_existing);
                    std::filesystem::permissions(dest, static_cast<std::filesystem::perms>(file.mode));
                    auto hash = hash_file(dest);
                    if (!hash) {
                        throw TransactionException(ErrorCode::FileSystemError, hash.error().message);
                    }
                    file.hash = std::move(*hash);
                    file.size = std::filesystem::file_size(dest);
                    total_size += file.size;
                    break;
                }
                case FileType::Symlink:
                    std::filesystem::create_symlink(file.link_target, dest);
                    break;
                case FileType::Device:
                case FileType::Fifo:
                    if (!replicate_object(source, dest)) {
                        throw TransactionException(ErrorCode::FileSystemError, "Failed to create " + file.path);
                    }
                    break;
                case FileType::Directory:
                    break;
            }
            journal.new_files_committed.push_back(dest);

            struct stat sb{};
            if (lstat(dest.c_str(), &sb) == 0) {
                file.mtime = static_cast<int64_t>(sb.st_mtime);
            }
            owned.push_back(file.path);
            log::debug("installed " + file.path);
        }

        InstalledPackage record;
        record.id = pkg.id;
        record.version = pkg.version;
        record.slot = pkg.slot;
        record.installed_at = std::chrono::system_clock::now();
        record.use_flags = op.use_flags;
        record.files = std::move(manifest);
        record.size = total_size;
        record.explicit_install = op.explicit_install;
        record.dependencies = pkg.dependencies;
        record.dependencies.insert(record.dependencies.end(), pkg.runtime_dependencies.begin(),
                                   pkg.runtime_dependencies.end());
        record.blockers = pkg.blockers;

        if (auto added = m_db.add_installed_package(record); !added) {
            throw TransactionException(ErrorCode::DatabaseError, added.error().message);
        }
        detector.register_files(pkg.id, owned);

        std::error_code ec;
        if (tree != *build.output_path) {
            std::filesystem::remove_all(tree, ec);
        }
        return record;
    }

    void Transaction::rollback_filesystem(const FileSystemJournal& journal) {
        // 1. Undo new file installations by removing them.
        for (const auto& path : std::ranges::reverse_view(journal.new_files_committed)) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec) log::error("Rollback: cannot remove " + path.string() + ": " + ec.message());
        }

        // 2. Restore backups, parents before children.
        for (const auto& [original_path, backup_path] : journal.old_files_backed_up) {
            std::error_code ec;
            const auto backup_status = std::filesystem::symlink_status(backup_path, ec);
            if (!std::filesystem::exists(backup_status)) {
                continue;
            }

            if (std::filesystem::is_directory(backup_status)) {
                std::filesystem::create_directories(original_path, ec);
                std::filesystem::permissions(original_path, backup_status.permissions(), ec);
                continue;
            }

            std::filesystem::create_directories(original_path.parent_path(), ec);
            std::filesystem::remove(original_path, ec);
            std::filesystem::rename(backup_path, original_path, ec);
            if (ec && !replicate_object(backup_path, original_path)) {
                log::error("Rollback: failed to restore " + original_path.string());
                continue;
            }
            log::debug("restored " + original_path.string());
        }

        // 3. Directories this transaction created, deepest first.
        for (const auto& dir : std::ranges::reverse_view(journal.created_directories)) {
            std::error_code ec;
            if (std::filesystem::is_directory(std::filesystem::symlink_status(dir, ec)) &&
                std::filesystem::is_empty(dir, ec)) {
                std::filesystem::remove(dir, ec);
            }
        }
    }

    Result<void> Transaction::execute() {
        if (m_state != TransactionState::Pending) {
            return make_error(ErrorCode::TransactionFailed, "Transaction has already been executed");
        }
        if (m_operations.empty()) {
            m_state = TransactionState::Committed;
            return {};
        }

        const auto tx_id = std::to_string(std::chrono::system_clock::now().time_since_epoch().count());
        const auto tx_workspace = m_options.workspace / "tx" / tx_id;

        FileSystemJournal journal;
        journal.backup_dir = tx_workspace / "backup";
        journal.staging_dir = tx_workspace / "staging";
        {
            std::error_code ec;
            std::filesystem::create_directories(journal.backup_dir, ec);
            std::filesystem::create_directories(journal.staging_dir, ec);
            if (ec) {
                return make_error(ErrorCode::FileSystemError,
                                  "Cannot create transaction workspace " + tx_workspace.string() + ": " + ec.message());
            }
        }

        if (auto begun = m_db.begin_transaction(); !begun) {
            std::error_code ec;
            std::filesystem::remove_all(tx_workspace, ec);
            return make_error(ErrorCode::TransactionFailed, begun.error().message);
        }

        log::info("Executing transaction " + tx_id + " (" + std::to_string(m_operations.size()) + " operations)...");

        std::optional<Error> failure;
        try {
            CollisionDetector detector(m_options.collision, m_options.root);
            std::map<PackageId, std::vector<std::string>> owned;
            for (auto& [path, owner] : m_db.list_file_owners()) {
                owned[owner].push_back(std::move(path));
            }
            for (const auto& [owner, paths] : owned) {
                detector.register_files(owner, paths);
            }
            for (const auto& pkg : m_db.list_installed_packages()) {
                for (const auto& file : pkg.files) {
                    if (file.file_type == FileType::Directory) {
                        journal.directory_users[file.path].insert(pkg.id);
                    }
                }
            }

            BuildPool pool(m_builder, m_options.jobs);
            for (const auto& op : m_operations) {
                if (op.package) pool.submit(build_target_for(*op.package));
            }

            for (const auto& op : m_operations) {
                if (op.kind == Operation::Kind::Remove) execute_remove(*op.installed, journal, detector);
            }
            for (const auto& op : m_operations) {
                if (op.kind != Operation::Kind::Upgrade) continue;
                execute_remove(*op.installed, journal, detector);
                execute_install(op, pool, journal, detector);
            }
            for (const auto& op : m_operations) {
                if (op.kind == Operation::Kind::Install) execute_install(op, pool, journal, detector);
            }

            log::progress("Committing changes to database...");
            if (auto committed = m_db.commit(); !committed) {
                log::progress_ok();
                throw TransactionException(ErrorCode::DatabaseError, committed.error().message);
            }
            log::progress_ok();
        } catch (const TransactionException& e) {
            failure = Error(e.get_error(), e.what());
        } catch (const std::filesystem::filesystem_error& e) {
            failure = Error(ErrorCode::FileSystemError, e.what());
        } catch (const std::exception& e) {
            failure = Error(ErrorCode::TransactionFailed, e.what());
        }

        if (failure) {
            log::error("Transaction failed: " + failure->message + ". Rolling back...");
            if (m_db.in_transaction()) {
                if (auto rolled_back = m_db.rollback(); !rolled_back) {
                    log::error(rolled_back.error().message);
                }
            }
            rollback_filesystem(journal);
            std::error_code ec;
            std::filesystem::remove_all(tx_workspace, ec);
            m_state = TransactionState::RolledBack;
            log::ok("Rollback complete. System restored to original state.");

            Error error(ErrorCode::TransactionRolledBack, "Transaction rolled back: " + failure->message);
            error.cause = failure->code;
            return std::unexpected(std::move(error));
        }

        log::progress("Cleaning up transaction workspace...");
        std::error_code ec;
        std::filesystem::remove_all(tx_workspace, ec);
        log::progress_ok();

        m_state = TransactionState::Committed;
        log::ok("Transaction completed successfully.");
        return {};
    }

} // namespace qr
