//
// Created by cv2 on 10/19/26.
//

#include "libqr/database.h"
#include "libqr/logging.h"

#include <algorithm>
#include <sstream>
#include <system_error>

#define SQLITE_ORM_OMITS_CODECVT
#include <sqlite_orm/sqlite_orm.h>

namespace qr {

    static std::string join(const std::vector<std::string>& vec, const char* delim = "\n") {
        std::stringstream ss;
        for (size_t i = 0; i < vec.size(); ++i) {
            ss << vec[i];
            if (i < vec.size() - 1) {
                ss << delim;
            }
        }
        return ss.str();
    }

    static std::vector<std::string> split(const std::string& str, char delim = '\n') {
        if (str.empty()) {
            return {};
        }
        std::vector<std::string> tokens;
        std::string token;
        std::istringstream tokenStream(str);
        while (std::getline(tokenStream, token, delim)) {
            tokens.push_back(token);
        }
        return tokens;
    }

    // "cat/name:slot"
    static std::string record_key(const PackageId& id, const std::string& slot) {
        return id.full_name() + ":" + slot;
    }

    static std::optional<PackageId> id_from_key(const std::string& key) {
        auto colon = key.rfind(':');
        auto id = PackageId::parse(std::string_view(key).substr(0, colon));
        if (!id) return std::nullopt;
        return *id;
    }

    namespace db_schema {
        struct PackageRow {
            std::string key;
            std::string category;
            std::string name;
            std::string version;
            std::string slot;
            int64_t installed_at = 0;
            std::string use_flags;      // newline separated
            int64_t size = 0;
            bool explicit_install = false;
            std::string dependencies;   // "cat/name|spec|slot" per line
            std::string blockers;       // newline separated
        };

        struct FileRow {
            std::string path;
            std::string package_key;
            int file_type = 0;
            int64_t mode = 0;
            int64_t size = 0;
            std::string hash;
            int64_t mtime = 0;
            std::string link_target;
        };
    }

    static auto create_storage(const std::filesystem::path& db_path) {
        using namespace sqlite_orm;
        return make_storage(db_path.string(),
            make_table("packages",
               make_column("key", &db_schema::PackageRow::key, primary_key()),
               make_column("category", &db_schema::PackageRow::category),
               make_column("name", &db_schema::PackageRow::name),
               make_column("version", &db_schema::PackageRow::version),
               make_column("slot", &db_schema::PackageRow::slot),
               make_column("installed_at", &db_schema::PackageRow::installed_at),
               make_column("use_flags", &db_schema::PackageRow::use_flags),
               make_column("size", &db_schema::PackageRow::size),
               make_column("explicit_install", &db_schema::PackageRow::explicit_install),
               make_column("dependencies", &db_schema::PackageRow::dependencies),
               make_column("blockers", &db_schema::PackageRow::blockers)
            ),
            make_table("files",
               make_column("path", &db_schema::FileRow::path),
               make_column("package_key", &db_schema::FileRow::package_key),
               make_column("file_type", &db_schema::FileRow::file_type),
               make_column("mode", &db_schema::FileRow::mode),
               make_column("size", &db_schema::FileRow::size),
               make_column("hash", &db_schema::FileRow::hash),
               make_column("mtime", &db_schema::FileRow::mtime),
               make_column("link_target", &db_schema::FileRow::link_target),
               primary_key(&db_schema::FileRow::path, &db_schema::FileRow::package_key)
            )
        );
    }

    struct Database::Impl {
        using Storage = decltype(create_storage(""));
        Storage storage;
        bool transaction_open = false;

        explicit Impl(const std::filesystem::path& db_path) : storage(create_storage(db_path)) {
            storage.open_forever();
            storage.sync_schema(true);
        }
    };

    // --- Conversion Functions ---

    // One line per dependency: "cat/name|spec|slot|flags|use", flags drawn from
    // 'b' (build time), 'r' (run time) and 'o' (optional).
    static std::string serialize_dependencies(const std::vector<Dependency>& deps) {
        std::vector<std::string> lines;
        lines.reserve(deps.size());
        for (const auto& dep : deps) {
            std::string flags;
            if (dep.build_time) flags += 'b';
            if (dep.run_time) flags += 'r';
            if (dep.optional) flags += 'o';
            lines.push_back(dep.package.full_name() + "|" + dep.version.to_string() + "|" + dep.slot.value_or("") +
                            "|" + flags + "|" + dep.use_condition.to_string());
        }
        return join(lines);
    }

    static std::vector<Dependency> deserialize_dependencies(const std::string& text) {
        std::vector<Dependency> deps;
        for (const auto& line : split(text)) {
            auto fields = split(line, '|');
            if (fields.empty()) continue;

            auto id = PackageId::parse(fields[0]);
            if (!id) {
                log::warn("Skipping malformed dependency record '" + line + "'");
                continue;
            }
            Dependency dep;
            dep.package = *id;
            if (fields.size() > 1) {
                if (auto spec = VersionSpec::parse(fields[1])) dep.version = *spec;
            }
            if (fields.size() > 2 && !fields[2].empty()) {
                dep.slot = fields[2];
            }
            if (fields.size() > 3) {
                dep.build_time = fields[3].find('b') != std::string::npos;
                dep.run_time = fields[3].find('r') != std::string::npos;
                dep.optional = fields[3].find('o') != std::string::npos;
            }
            if (fields.size() > 4) {
                // "||" inside the condition was split too.
                std::string use = fields[4];
                for (size_t i = 5; i < fields.size(); ++i) use += "|" + fields[i];
                auto condition = UseCondition::parse(use);
                if (!condition) {
                    log::warn("Skipping malformed dependency record '" + line + "': " + condition.error().message);
                    continue;
                }
                dep.use_condition = std::move(*condition);
            }
            deps.push_back(std::move(dep));
        }
        return deps;
    }

    static db_schema::PackageRow to_db(const InstalledPackage& pkg) {
        db_schema::PackageRow row;
        row.key = record_key(pkg.id, pkg.slot);
        row.category = pkg.id.category;
        row.name = pkg.id.name;
        row.version = pkg.version.to_string();
        row.slot = pkg.slot;
        row.installed_at = std::chrono::duration_cast<std::chrono::seconds>(pkg.installed_at.time_since_epoch()).count();
        row.use_flags = join(std::vector<std::string>(pkg.use_flags.begin(), pkg.use_flags.end()));
        row.size = static_cast<int64_t>(pkg.size);
        row.explicit_install = pkg.explicit_install;
        row.dependencies = serialize_dependencies(pkg.dependencies);
        row.blockers = join(pkg.blockers);
        return row;
    }

    static db_schema::FileRow to_db(const InstalledFile& file, const std::string& key) {
        return {file.path, key, static_cast<int>(file.file_type), static_cast<int64_t>(file.mode),
                static_cast<int64_t>(file.size), file.hash, file.mtime, file.link_target};
    }

    static InstalledFile from_db(const db_schema::FileRow& row) {
        InstalledFile file;
        file.path = row.path;
        file.file_type = static_cast<FileType>(row.file_type);
        file.mode = static_cast<uint32_t>(row.mode);
        file.size = static_cast<uint64_t>(row.size);
        file.hash = row.hash;
        file.mtime = row.mtime;
        file.link_target = row.link_target;
        return file;
    }

    template<typename Storage>
    static InstalledPackage from_db(Storage& storage, const db_schema::PackageRow& row) {
        using namespace sqlite_orm;

        InstalledPackage pkg;
        pkg.id = {row.category, row.name};
        if (auto version = Version::parse(row.version)) {
            pkg.version = *version;
        } else {
            log::warn("Corrupt version '" + row.version + "' recorded for " + row.key);
        }
        pkg.slot = row.slot;
        pkg.installed_at = std::chrono::system_clock::time_point(std::chrono::seconds(row.installed_at));
        for (auto& flag : split(row.use_flags)) {
            pkg.use_flags.insert(std::move(flag));
        }
        pkg.size = static_cast<uint64_t>(row.size);
        pkg.explicit_install = row.explicit_install;
        pkg.dependencies = deserialize_dependencies(row.dependencies);
        pkg.blockers = split(row.blockers);

        auto files = storage.template get_all<db_schema::FileRow>(
            where(c(&db_schema::FileRow::package_key) == row.key),
            order_by(&db_schema::FileRow::path));
        pkg.files.reserve(files.size());
        for (const auto& f : files) {
            pkg.files.push_back(from_db(f));
        }
        return pkg;
    }

    // --- Public Method Implementations ---

    Database::Database(const std::filesystem::path& db_path)
            : pimpl(std::make_unique<Impl>(db_path)) {}

    Database::~Database() {
        if (pimpl && pimpl->transaction_open) {
            try {
                pimpl->storage.rollback();
            } catch (const std::system_error& e) {
                log::error(std::string("Failed to roll back open transaction on close: ") + e.what());
            }
        }
    }

    Result<void> Database::begin_transaction() {
        if (pimpl->transaction_open) {
            return make_error(ErrorCode::DatabaseError, "A database transaction is already open");
        }
        try {
            pimpl->storage.begin_transaction();
        } catch (const std::system_error& e) {
            return make_error(ErrorCode::DatabaseError, std::string("Failed to begin transaction: ") + e.what());
        }
        pimpl->transaction_open = true;
        return {};
    }

    Result<void> Database::commit() {
        if (!pimpl->transaction_open) {
            return make_error(ErrorCode::DatabaseError, "No database transaction to commit");
        }
        try {
            pimpl->storage.commit();
        } catch (const std::system_error& e) {
            return make_error(ErrorCode::DatabaseError, std::string("Failed to commit transaction: ") + e.what());
        }
        pimpl->transaction_open = false;
        return {};
    }

    Result<void> Database::rollback() {
        if (!pimpl->transaction_open) {
            return make_error(ErrorCode::DatabaseError, "No database transaction to roll back");
        }
        pimpl->transaction_open = false;
        try {
            pimpl->storage.rollback();
        } catch (const std::system_error& e) {
            return make_error(ErrorCode::DatabaseError, std::string("Failed to roll back transaction: ") + e.what());
        }
        return {};
    }

    bool Database::in_transaction() const {
        return pimpl->transaction_open;
    }

    Result<void> Database::add_installed_package(const InstalledPackage& pkg) {
        using namespace sqlite_orm;
        auto& storage = pimpl->storage;
        const auto row = to_db(pkg);

        auto write = [&] {
            storage.remove_all<db_schema::FileRow>(where(c(&db_schema::FileRow::package_key) == row.key));
            storage.replace(row);
            for (const auto& file : pkg.files) {
                storage.replace(to_db(file, row.key));
            }
            return true;
        };

        try {
            if (pimpl->transaction_open) {
                write();
            } else {
                storage.transaction(write);
            }
        } catch (const std::system_error& e) {
            log::error("Failed to add installed package '" + pkg.display_name() + "': " + e.what());
            return make_error(ErrorCode::DatabaseError,
                              "Failed to record " + pkg.display_name() + ": " + e.what());
        }
        return {};
    }

    Result<void> Database::remove_installed_package(const PackageId& id, const std::string& slot) {
        using namespace sqlite_orm;
        auto& storage = pimpl->storage;
        const auto key = record_key(id, slot);

        auto erase = [&] {
            storage.remove_all<db_schema::FileRow>(where(c(&db_schema::FileRow::package_key) == key));
            storage.remove<db_schema::PackageRow>(key);
            return true;
        };

        try {
            if (pimpl->transaction_open) {
                erase();
            } else {
                storage.transaction(erase);
            }
        } catch (const std::system_error& e) {
            log::error("Failed to remove installed package '" + key + "': " + e.what());
            return make_error(ErrorCode::DatabaseError, "Failed to remove " + key + ": " + e.what());
        }
        return {};
    }

    std::optional<InstalledPackage> Database::get_installed_package(const PackageId& id,
                                                                    const std::string& slot) const {
        auto row = pimpl->storage.get_pointer<db_schema::PackageRow>(record_key(id, slot));
        if (row) {
            return from_db(pimpl->storage, *row);
        }
        return std::nullopt;
    }

    std::optional<InstalledPackage> Database::get_installed_package(const PackageId& id) const {
        std::optional<InstalledPackage> best;
        for (const auto& slot : get_installed_slots(id)) {
            auto pkg = get_installed_package(id, slot);
            if (pkg && (!best || pkg->version > best->version)) {
                best = std::move(pkg);
            }
        }
        return best;
    }

    std::vector<std::string> Database::get_installed_slots(const PackageId& id) const {
        using namespace sqlite_orm;
        return pimpl->storage.select(&db_schema::PackageRow::slot,
                                     where(c(&db_schema::PackageRow::category) == id.category &&
                                           c(&db_schema::PackageRow::name) == id.name),
                                     order_by(&db_schema::PackageRow::slot));
    }

    bool Database::is_package_installed(const PackageId& id) const {
        return !get_installed_slots(id).empty();
    }

    std::vector<InstalledPackage> Database::list_installed_packages() const {
        using namespace sqlite_orm;
        auto rows = pimpl->storage.get_all<db_schema::PackageRow>(order_by(&db_schema::PackageRow::key));
        std::vector<InstalledPackage> result;
        result.reserve(rows.size());
        for (const auto& row : rows) {
            result.push_back(from_db(pimpl->storage, row));
        }
        return result;
    }

    std::vector<InstalledPackage> Database::get_reverse_dependencies(const PackageId& id,
                                                                     const std::string& slot) const {
        std::vector<InstalledPackage> dependents;
        for (auto& pkg : list_installed_packages()) {
            if (pkg.id == id) continue;
            const bool depends = std::any_of(pkg.dependencies.begin(), pkg.dependencies.end(),
                                             [&](const Dependency& dep) {
                                                 return dep.package == id && (!dep.slot || *dep.slot == slot);
                                             });
            if (depends) dependents.push_back(std::move(pkg));
        }
        return dependents;
    }

    std::optional<PackageId> Database::find_file_owner(const std::string& path) const {
        using namespace sqlite_orm;
        auto keys = pimpl->storage.select(&db_schema::FileRow::package_key,
                                          where(c(&db_schema::FileRow::path) == path &&
                                                c(&db_schema::FileRow::file_type) !=
                                                static_cast<int>(FileType::Directory)));
        if (keys.empty()) {
            return std::nullopt;
        }
        return id_from_key(keys.front());
    }

    std::vector<std::pair<std::string, PackageId>> Database::list_file_owners() const {
        using namespace sqlite_orm;
        auto rows = pimpl->storage.get_all<db_schema::FileRow>(
            where(c(&db_schema::FileRow::file_type) != static_cast<int>(FileType::Directory)));
        std::vector<std::pair<std::string, PackageId>> owners;
        owners.reserve(rows.size());
        for (const auto& row : rows) {
            if (auto id = id_from_key(row.package_key)) {
                owners.emplace_back(row.path, *id);
            }
        }
        return owners;
    }

    Result<void> Database::disown_file(const std::string& path) {
        using namespace sqlite_orm;
        try {
            pimpl->storage.remove_all<db_schema::FileRow>(
                where(c(&db_schema::FileRow::path) == path &&
                      c(&db_schema::FileRow::file_type) != static_cast<int>(FileType::Directory)));
        } catch (const std::system_error& e) {
            return make_error(ErrorCode::DatabaseError, "Failed to disown " + path + ": " + e.what());
        }
        return {};
    }

} // namespace qr
