//
// Created by cv2 on 10/19/26.
//

#include "libqr/package_manager.h"
#include "libqr/crypto.h"
#include "libqr/logging.h"

#include <algorithm>
#include <map>
#include <utility>

namespace qr {

    using SlotKey = std::pair<PackageId, std::string>;

    static SlotKey key_of(const InstalledPackage& pkg) {
        return {pkg.id, pkg.slot};
    }

    // The database opens its file directly, so the directory has to exist first.
    static std::filesystem::path prepare_db_path(const std::filesystem::path& db_path) {
        std::error_code ec;
        std::filesystem::create_directories(db_path.parent_path(), ec);
        if (ec) {
            log::warn("Cannot create database directory " + db_path.parent_path().string() + ": " + ec.message());
        }
        return db_path;
    }

    // Whether `dependent` records a dependency that the installed `pkg` satisfies.
    static bool is_required_by(const InstalledPackage& pkg, const InstalledPackage& dependent) {
        return std::any_of(dependent.dependencies.begin(), dependent.dependencies.end(), [&](const Dependency& dep) {
            return dep.package == pkg.id && dep.is_active(dependent.use_flags) && dep.accepts(pkg.version, pkg.slot);
        });
    }

    // "cat/name:slot" -> ("cat/name", "slot")
    static std::pair<std::string, std::optional<std::string>> split_slot(const std::string& atom) {
        const auto colon = atom.rfind(':');
        if (colon == std::string::npos) {
            return {atom, std::nullopt};
        }
        return {atom.substr(0, colon), atom.substr(colon + 1)};
    }

    PackageManager::PackageManager(Config config, PackageIndex available, std::unique_ptr<BuildBackend> builder)
        : m_config(std::move(config)),
          m_available(std::move(available)),
          m_db(prepare_db_path(m_config.db_path)),
          m_builder(std::move(builder)) {
        if (!m_builder) {
            m_builder = std::make_unique<CommandBuildBackend>(m_config.build, m_config.cache_dir / "build");
        }
    }

    Result<std::unique_ptr<PackageManager>> PackageManager::open(Config config, std::unique_ptr<BuildBackend> builder) {
        auto index = PackageIndex::load(config.index_paths);
        if (!index) {
            return std::unexpected(index.error());
        }
        log::debug("Loaded " + std::to_string(index->size()) + " package versions");
        return std::make_unique<PackageManager>(std::move(config), std::move(*index), std::move(builder));
    }

    Result<PackageId> PackageManager::resolve_name(const std::string& atom) const {
        if (atom.find('/') != std::string::npos) {
            auto id = PackageId::parse(atom);
            if (!id) {
                return std::unexpected(id.error());
            }
            if (!m_available.find(*id)) {
                return make_error(ErrorCode::PackageNotFound, "Package not found: " + atom);
            }
            return *id;
        }

        const auto matches = m_available.find_by_name(atom);
        if (matches.empty()) {
            return make_error(ErrorCode::PackageNotFound, "Package not found: " + atom);
        }
        if (matches.size() > 1) {
            std::vector<std::string> names;
            std::string listing;
            for (const auto& id : matches) {
                names.push_back(id.full_name());
                listing += (listing.empty() ? "" : ", ") + id.full_name();
            }
            return std::unexpected(Error(ErrorCode::AmbiguousPackage,
                                         "'" + atom + "' is ambiguous, candidates: " + listing, std::move(names)));
        }
        return matches.front();
    }

    Result<std::vector<InstalledPackage>> PackageManager::resolve_installed(const std::string& atom) const {
        const auto [name, slot] = split_slot(atom);
        const bool qualified = name.find('/') != std::string::npos;

        std::map<PackageId, std::vector<InstalledPackage>> matches;
        for (auto& pkg : m_db.list_installed_packages()) {
            const bool name_ok = qualified ? pkg.id.full_name() == name : pkg.id.name == name;
            if (name_ok && (!slot || pkg.slot == *slot)) {
                matches[pkg.id].push_back(std::move(pkg));
            }
        }

        if (matches.empty()) {
            return make_error(ErrorCode::PackageNotInstalled, "Package is not installed: " + atom);
        }
        if (matches.size() > 1) {
            std::vector<std::string> names;
            for (const auto& [id, _] : matches) names.push_back(id.full_name());
            return std::unexpected(Error(ErrorCode::AmbiguousPackage, "'" + atom + "' matches several installed packages",
                                         std::move(names)));
        }
        return std::move(matches.begin()->second);
    }

    Result<Plan> PackageManager::plan_from_resolution(Resolution resolution, const std::set<PackageId>& requested,
                                                      const InstallOptions& opts) {
        Plan plan;
        const auto installed = m_db.list_installed_packages();

        std::set<PackageId> removed;
        for (const auto& id : resolution.removals) {
            for (const auto& pkg : installed) {
                if (pkg.id != id) continue;
                log::info("Scheduling " + pkg.display_name() + " for removal (blocked)");
                plan.operations.push_back(Operation::remove(pkg));
                removed.insert(id);
            }
        }

        std::set<PackageId> replaced;
        for (const auto& pkg : resolution.packages) replaced.insert(pkg.id);

        for (const auto& pkg : resolution.packages) {
            const auto existing = std::find_if(installed.begin(), installed.end(), [&](const InstalledPackage& p) {
                return p.id == pkg.id && p.slot == pkg.slot;
            });
            const bool is_installed = existing != installed.end();
            const bool is_requested = requested.contains(pkg.id);

            if (is_installed && existing->version == pkg.version && !(opts.force && is_requested)) {
                log::debug(pkg.display_name() + ":" + pkg.slot + " is already installed");
                continue;
            }

            bool explicit_install = is_requested && !opts.oneshot;
            if (is_installed && existing->explicit_install) {
                explicit_install = true;
            }

            auto flags_it = resolution.use_flags.find(pkg.id);
            UseFlagSet flags = flags_it != resolution.use_flags.end() ? flags_it->second
                                                                      : effective_use_flags(pkg, opts.use_flags);

            if (!is_installed) {
                for (const auto& other : installed) {
                    if (other.id.name == pkg.id.name && other.id.category != pkg.id.category &&
                        other.slot == pkg.slot && !removed.contains(other.id)) {
                        if (!opts.force) {
                            return make_error(ErrorCode::SlotConflict,
                                              pkg.display_name() + " conflicts with installed " + other.display_name() +
                                              " in slot " + pkg.slot);
                        }
                        log::warn("Ignoring slot conflict with " + other.display_name() + " (--force)");
                    }
                }
                plan.operations.push_back(Operation::install(pkg, std::move(flags), explicit_install));
                continue;
            }

            // Installed packages that stay must still accept the version replacing theirs.
            for (const auto& other : installed) {
                if (other.id == pkg.id || removed.contains(other.id) || replaced.contains(other.id)) continue;
                for (const auto& dep : other.dependencies) {
                    if (dep.package != pkg.id || dep.optional || !dep.is_active(other.use_flags)) continue;
                    if (!dep.accepts(existing->version, existing->slot) || dep.accepts(pkg.version, pkg.slot)) continue;

                    const bool other_slot_ok = std::any_of(installed.begin(), installed.end(), [&](const InstalledPackage& p) {
                        return p.id == pkg.id && p.slot != pkg.slot && dep.accepts(p.version, p.slot);
                    });
                    if (other_slot_ok) continue;

                    if (!opts.force) {
                        return std::unexpected(Error(ErrorCode::VersionConflict,
                                                     other.display_name() + " requires " + dep.to_string() +
                                                     ", which " + pkg.display_name() + " does not satisfy",
                                                     {other.id.full_name(), pkg.id.full_name()}));
                    }
                    log::warn("Breaking dependency " + dep.to_string() + " of " + other.display_name() + " (--force)");
                }
            }
            plan.operations.push_back(Operation::upgrade(*existing, pkg, std::move(flags), explicit_install));
        }

        plan.resolution = std::move(resolution);
        return plan;
    }

    Result<Plan> PackageManager::plan_install(const std::vector<std::string>& atoms, const InstallOptions& opts) {
        log::info("Planning installation transaction...");

        std::vector<PackageId> ids;
        for (const auto& atom : atoms) {
            auto id = resolve_name(atom);
            if (!id) {
                log::error(id.error().message);
                return std::unexpected(id.error());
            }
            if (std::find(ids.begin(), ids.end(), *id) == ids.end()) {
                ids.push_back(*id);
            }
        }

        const auto installed = m_db.list_installed_packages();
        DependencyResolver resolver(m_available, installed);
        auto resolution = resolver.resolve(ids, opts);
        if (!resolution) {
            return std::unexpected(resolution.error());
        }

        const std::set<PackageId> requested(ids.begin(), ids.end());
        auto plan = plan_from_resolution(std::move(*resolution), requested, opts);
        if (plan) {
            log::ok("Transaction plan created: " + std::to_string(plan->operations.size()) + " operation(s).");
        }
        return plan;
    }

    Result<Plan> PackageManager::plan_remove(const std::vector<std::string>& atoms, const InstallOptions& opts) {
        log::info("Planning removal transaction...");
        Plan plan;

        std::vector<InstalledPackage> targets;
        std::set<SlotKey> removing;
        for (const auto& atom : atoms) {
            auto matches = resolve_installed(atom);
            if (!matches) {
                log::error(matches.error().message);
                return std::unexpected(matches.error());
            }
            for (auto& pkg : *matches) {
                if (removing.insert(key_of(pkg)).second) {
                    targets.push_back(std::move(pkg));
                }
            }
        }

        const auto installed = m_db.list_installed_packages();
        for (const auto& target : targets) {
            std::vector<std::string> broken;
            for (const auto& dependent : m_db.get_reverse_dependencies(target.id, target.slot)) {
                if (removing.contains(key_of(dependent))) continue;

                // Another slot that stays may still satisfy the dependent.
                const bool still_satisfied = std::all_of(
                    dependent.dependencies.begin(), dependent.dependencies.end(), [&](const Dependency& dep) {
                        if (dep.package != target.id || dep.optional || !dep.is_active(dependent.use_flags)) {
                            return true;
                        }
                        return std::any_of(installed.begin(), installed.end(), [&](const InstalledPackage& p) {
                            return p.id == target.id && !removing.contains(key_of(p)) && dep.accepts(p.version, p.slot);
                        });
                    });
                if (!still_satisfied) {
                    broken.push_back(dependent.id.full_name());
                }
            }

            if (!broken.empty()) {
                std::string listing;
                for (const auto& name : broken) listing += (listing.empty() ? "" : ", ") + name;
                if (!opts.force) {
                    log::error("Cannot remove '" + target.id.full_name() + "': required by " + listing);
                    return std::unexpected(Error(ErrorCode::HasDependents,
                                                 target.id.full_name() + " is required by " + listing,
                                                 std::move(broken)));
                }
                log::warn("Removing " + target.id.full_name() + " despite dependents: " + listing);
            }
            plan.operations.push_back(Operation::remove(target));
        }

        log::ok("Removal plan created successfully.");
        return plan;
    }

    Result<Plan> PackageManager::plan_update(const InstallOptions& opts) {
        log::info("Checking for updates...");

        const auto installed = m_db.list_installed_packages();
        std::vector<PackageId> outdated;
        for (const auto& pkg : installed) {
            auto latest = m_available.latest_in_slot(pkg.id, pkg.slot);
            if (!latest || !(latest->version > pkg.version)) continue;
            log::info(pkg.display_name() + " -> " + latest->version.to_string());
            if (std::find(outdated.begin(), outdated.end(), pkg.id) == outdated.end()) {
                outdated.push_back(pkg.id);
            }
        }

        if (outdated.empty()) {
            log::ok("System is up to date.");
            return Plan{};
        }

        InstallOptions update_opts = opts;
        update_opts.backtrack.prefer_newer = true;
        update_opts.backtrack.prefer_installed = false;

        DependencyResolver resolver(m_available, installed);
        auto resolution = resolver.resolve(outdated, update_opts);
        if (!resolution) {
            return std::unexpected(resolution.error());
        }
        // Updates never change which packages were explicitly requested.
        return plan_from_resolution(std::move(*resolution), {}, update_opts);
    }

    Result<Plan> PackageManager::plan_depclean(const InstallOptions&) {
        log::info("Looking for unneeded packages...");
        Plan plan;

        auto remaining = m_db.list_installed_packages();
        bool changed = true;
        while (changed) {
            changed = false;
            for (auto it = remaining.begin(); it != remaining.end(); ++it) {
                if (it->explicit_install) continue;
                const bool needed = std::any_of(remaining.begin(), remaining.end(), [&](const InstalledPackage& other) {
                    return key_of(other) != key_of(*it) && is_required_by(*it, other);
                });
                if (needed) continue;

                log::info("Unneeded: " + it->display_name() + ":" + it->slot);
                plan.operations.push_back(Operation::remove(*it));
                remaining.erase(it);
                changed = true;
                break;
            }
        }

        if (plan.empty()) {
            log::ok("Nothing to clean.");
        }
        return plan;
    }

    Result<void> PackageManager::execute(const Plan& plan, const InstallOptions& opts) {
        if (plan.empty()) {
            log::info("Nothing to do.");
            return {};
        }
        if (opts.pretend) {
            log::info("Pretend mode: no changes made.");
            return {};
        }

        TransactionOptions tx_options;
        tx_options.root = m_config.root;
        tx_options.workspace = m_config.cache_dir;
        tx_options.jobs = m_config.build.jobs;
        tx_options.force = opts.force;
        tx_options.collision = m_config.collision;

        Transaction transaction(m_db, *m_builder, tx_options);
        for (const auto& op : plan.operations) {
            transaction.add(op);
        }
        return transaction.execute();
    }

    Result<void> PackageManager::install(const std::vector<std::string>& atoms, const InstallOptions& opts) {
        auto plan = plan_install(atoms, opts);
        if (!plan) {
            return std::unexpected(plan.error());
        }
        return execute(*plan, opts);
    }

    Result<void> PackageManager::remove(const std::vector<std::string>& atoms, const InstallOptions& opts) {
        auto plan = plan_remove(atoms, opts);
        if (!plan) {
            return std::unexpected(plan.error());
        }
        return execute(*plan, opts);
    }

    Result<void> PackageManager::update(const InstallOptions& opts) {
        auto plan = plan_update(opts);
        if (!plan) {
            return std::unexpected(plan.error());
        }
        return execute(*plan, opts);
    }

    std::vector<InstalledPackage> PackageManager::list_installed() const {
        return m_db.list_installed_packages();
    }

    std::optional<PackageId> PackageManager::find_owner(const std::string& path) const {
        const auto normalized = std::filesystem::path(path).lexically_normal();
        return m_db.find_file_owner(normalized.is_absolute() ? normalized.string() : "/" + normalized.string());
    }

    std::vector<VerifyResult> PackageManager::verify() const {
        std::vector<VerifyResult> results;
        for (const auto& pkg : m_db.list_installed_packages()) {
            VerifyResult result;
            result.id = pkg.id;
            result.slot = pkg.slot;

            for (const auto& file : pkg.files) {
                const auto path = m_config.root / std::filesystem::path(file.path).relative_path();
                std::error_code ec;
                const auto status = std::filesystem::symlink_status(path, ec);
                if (!std::filesystem::exists(status)) {
                    result.missing.push_back(file.path);
                    continue;
                }

                switch (file.file_type) {
                    case FileType::Regular:
                    case FileType::Hardlink: {
                        if (!file.hash.empty() && !verify_file_checksum(path, file.hash)) {
                            result.modified.push_back(file.path);
                        }
                        break;
                    }
                    case FileType::Symlink: {
                        auto target = std::filesystem::read_symlink(path, ec);
                        if (ec || target.string() != file.link_target) result.modified.push_back(file.path);
                        break;
                    }
                    default:
                        break;
                }
            }

            if (!result.ok()) {
                log::warn(pkg.display_name() + ": " + std::to_string(result.missing.size()) + " missing, " +
                          std::to_string(result.modified.size()) + " modified");
            }
            results.push_back(std::move(result));
        }
        return results;
    }

} // namespace qr
