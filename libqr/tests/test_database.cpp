//
// Created by cv2 on 10/19/26.
//

#include "libqr/database.h"
#include "libqr/logging.h"
#include "test_helpers.h"
#include <algorithm>
#include <cassert>
#include <filesystem>

using qr::test::dep;
using qr::test::id;
using qr::test::ver;

const std::filesystem::path TEST_DB_PATH = "test_quarry.db";

qr::InstalledPackage create_sample_pkg(const std::string& atom, const std::string& version = "1.0.0",
                                       const std::string& slot = "0") {
    qr::InstalledPackage pkg;
    pkg.id = id(atom);
    pkg.version = ver(version);
    pkg.slot = slot;
    pkg.use_flags = {"ssl", "zstd"};
    pkg.size = 4096;
    pkg.explicit_install = true;
    pkg.installed_at = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

    qr::InstalledFile dir;
    dir.path = "/usr/bin";
    dir.file_type = qr::FileType::Directory;
    dir.mode = 0755;
    qr::InstalledFile bin;
    bin.path = "/usr/bin/" + pkg.id.name + (slot == "0" ? "" : slot);
    bin.mode = 0755;
    bin.size = 4096;
    bin.hash = std::string(64, 'a');
    pkg.files = {dir, bin};
    return pkg;
}

void test_add_and_get() {
    qr::log::info("Running test: Add and Get Package...");
    std::filesystem::remove(TEST_DB_PATH);
    qr::Database db(TEST_DB_PATH);
    auto pkg = create_sample_pkg("app-misc/hello");
    pkg.dependencies = {dep("sys-libs/glibc >=2.38"), dep("dev-lang/python:3.12")};
    pkg.blockers = {"!app-misc/goodbye"};

    assert(db.add_installed_package(pkg).has_value());

    auto retrieved_opt = db.get_installed_package(id("app-misc/hello"));
    assert(retrieved_opt.has_value());
    const auto& retrieved = *retrieved_opt;
    assert(retrieved.id == pkg.id);
    assert(retrieved.version == ver("1.0.0"));
    assert(retrieved.slot == "0");
    assert((retrieved.use_flags == qr::UseFlagSet{"ssl", "zstd"}));
    assert(retrieved.size == 4096);
    assert(retrieved.explicit_install);
    assert(retrieved.installed_at == pkg.installed_at);
    assert(retrieved.files.size() == 2);
    assert(retrieved.files[1].path == "/usr/bin/hello");
    assert(retrieved.files[1].hash == pkg.files[1].hash);
    assert(retrieved.files[0].file_type == qr::FileType::Directory);
    assert(retrieved.dependencies.size() == 2);
    assert(retrieved.dependencies[0].package == id("sys-libs/glibc"));
    assert(retrieved.dependencies[0].version.matches(ver("2.39")));
    assert(!retrieved.dependencies[0].version.matches(ver("2.37")));
    assert(retrieved.dependencies[1].slot == "3.12");
    assert(retrieved.blockers == std::vector<std::string>{"!app-misc/goodbye"});

    qr::log::ok("Test Passed: Add and Get Package");
}

void test_dependency_conditions_survive() {
    qr::log::info("Running test: Dependency USE conditions survive a reload...");
    std::filesystem::remove(TEST_DB_PATH);
    auto pkg = create_sample_pkg("media-video/player");

    auto gui = dep("x11-libs/gtk >=3.0");
    gui.use_condition = qr::UseCondition::if_enabled("gui");
    auto either = dep("media-libs/codec");
    either.use_condition = qr::UseCondition::any_of(
        {qr::UseCondition::if_disabled("minimal"),
         qr::UseCondition::all_of({qr::UseCondition::if_enabled("ffmpeg"), qr::UseCondition::if_enabled("x264")})});
    auto docs = dep("app-doc/manual");
    docs.optional = true;
    docs.run_time = false;
    pkg.dependencies = {gui, either, docs};

    {
        qr::Database db(TEST_DB_PATH);
        assert(db.add_installed_package(pkg).has_value());
    }

    qr::Database db(TEST_DB_PATH);
    auto retrieved = db.get_installed_package(id("media-video/player"));
    assert(retrieved.has_value());
    const auto& deps = retrieved->dependencies;
    assert(deps.size() == 3);
    assert(deps[0].use_condition.to_string() == "gui?");
    assert(!deps[0].is_active(retrieved->use_flags));
    assert(deps[0].version.matches(ver("3.24")));
    assert(deps[1].use_condition.to_string() == "(!minimal? || (ffmpeg? && x264?))");
    assert(deps[1].is_active({"minimal", "ffmpeg", "x264"}));
    assert(!deps[1].is_active({"minimal"}));
    assert(!deps[0].optional && deps[0].build_time && deps[0].run_time);
    assert(deps[2].optional);
    assert(deps[2].build_time && !deps[2].run_time);
    assert(!deps[2].use_condition.is_conditional());
    qr::log::ok("Test Passed: Dependency USE conditions survive a reload.");
}

void test_is_installed_and_remove() {
    qr::log::info("Running test: Is Installed and Remove...");
    std::filesystem::remove(TEST_DB_PATH);
    qr::Database db(TEST_DB_PATH);

    assert(!db.is_package_installed(id("app-misc/temp")));
    assert(db.add_installed_package(create_sample_pkg("app-misc/temp")).has_value());
    assert(db.is_package_installed(id("app-misc/temp")));
    assert(db.find_file_owner("/usr/bin/temp") == id("app-misc/temp"));

    assert(db.remove_installed_package(id("app-misc/temp"), "0").has_value());
    assert(!db.is_package_installed(id("app-misc/temp")));
    assert(!db.find_file_owner("/usr/bin/temp"));

    // Re-adding the same id and slot replaces the record and its files.
    auto first = create_sample_pkg("app-misc/temp", "1.0");
    auto second = create_sample_pkg("app-misc/temp", "1.1");
    second.files.pop_back();
    assert(db.add_installed_package(first).has_value());
    assert(db.add_installed_package(second).has_value());
    assert(db.list_installed_packages().size() == 1);
    assert(db.get_installed_package(id("app-misc/temp"))->version == ver("1.1"));
    assert(db.get_installed_package(id("app-misc/temp"))->files.size() == 1);
    qr::log::ok("Test Passed: Is Installed and Remove");
}

void test_slots() {
    qr::log::info("Running test: Slotted packages...");
    std::filesystem::remove(TEST_DB_PATH);
    qr::Database db(TEST_DB_PATH);
    assert(db.add_installed_package(create_sample_pkg("dev-lang/python", "3.11.9", "3.11")).has_value());
    assert(db.add_installed_package(create_sample_pkg("dev-lang/python", "3.12.4", "3.12")).has_value());

    assert((db.get_installed_slots(id("dev-lang/python")) == std::vector<std::string>{"3.11", "3.12"}));
    assert(db.get_installed_package(id("dev-lang/python"))->version == ver("3.12.4"));
    assert(db.get_installed_package(id("dev-lang/python"), "3.11")->version == ver("3.11.9"));
    assert(!db.get_installed_package(id("dev-lang/python"), "2.7"));

    assert(db.remove_installed_package(id("dev-lang/python"), "3.12").has_value());
    assert(db.is_package_installed(id("dev-lang/python")));
    assert(db.get_installed_package(id("dev-lang/python"))->slot == "3.11");
    qr::log::ok("Test Passed: Slotted packages");
}

void test_reverse_dependencies() {
    qr::log::info("Running test: Reverse dependencies...");
    std::filesystem::remove(TEST_DB_PATH);
    qr::Database db(TEST_DB_PATH);

    auto lib = create_sample_pkg("dev-lang/python", "3.12.4", "3.12");
    auto any_slot = create_sample_pkg("app-misc/script");
    any_slot.dependencies = {dep("dev-lang/python")};
    auto pinned = create_sample_pkg("app-misc/legacy");
    pinned.dependencies = {dep("dev-lang/python:3.11")};
    auto unrelated = create_sample_pkg("app-misc/other");

    for (const auto& p : {lib, any_slot, pinned, unrelated}) {
        assert(db.add_installed_package(p).has_value());
    }

    auto dependents = db.get_reverse_dependencies(id("dev-lang/python"), "3.12");
    assert(dependents.size() == 1);
    assert(dependents[0].id == id("app-misc/script"));

    auto old_slot = db.get_reverse_dependencies(id("dev-lang/python"), "3.11");
    assert(old_slot.size() == 2);
    assert(db.get_reverse_dependencies(id("app-misc/other"), "0").empty());
    qr::log::ok("Test Passed: Reverse dependencies");
}

void test_file_owners() {
    qr::log::info("Running test: File ownership...");
    std::filesystem::remove(TEST_DB_PATH);
    qr::Database db(TEST_DB_PATH);
    assert(db.add_installed_package(create_sample_pkg("app-misc/alpha")).has_value());
    assert(db.add_installed_package(create_sample_pkg("app-misc/beta")).has_value());

    // Shared directories belong to nobody.
    assert(!db.find_file_owner("/usr/bin"));
    auto owners = db.list_file_owners();
    assert(owners.size() == 2);
    assert(std::none_of(owners.begin(), owners.end(), [](const auto& o) { return o.first == "/usr/bin"; }));

    assert(db.disown_file("/usr/bin/alpha").has_value());
    assert(!db.find_file_owner("/usr/bin/alpha"));
    assert(db.find_file_owner("/usr/bin/beta") == id("app-misc/beta"));
    assert(db.get_installed_package(id("app-misc/alpha"))->files.size() == 1);
    qr::log::ok("Test Passed: File ownership");
}

void test_transactions() {
    qr::log::info("Running test: Commit and Rollback...");
    std::filesystem::remove(TEST_DB_PATH);
    {
        qr::Database db(TEST_DB_PATH);
        assert(!db.in_transaction());
        assert(!db.commit().has_value());

        assert(db.begin_transaction().has_value());
        assert(db.in_transaction());
        assert(db.begin_transaction().error().code == qr::ErrorCode::DatabaseError);
        assert(db.add_installed_package(create_sample_pkg("app-misc/kept")).has_value());
        assert(db.commit().has_value());
        assert(!db.in_transaction());

        assert(db.begin_transaction().has_value());
        assert(db.add_installed_package(create_sample_pkg("app-misc/dropped")).has_value());
        assert(db.remove_installed_package(id("app-misc/kept"), "0").has_value());
        assert(db.is_package_installed(id("app-misc/dropped")));
        assert(db.rollback().has_value());

        assert(!db.is_package_installed(id("app-misc/dropped")));
        assert(db.is_package_installed(id("app-misc/kept")));
        assert(db.find_file_owner("/usr/bin/kept") == id("app-misc/kept"));
    }

    // An open transaction is rolled back when the handle goes away.
    {
        qr::Database db(TEST_DB_PATH);
        assert(db.begin_transaction().has_value());
        assert(db.add_installed_package(create_sample_pkg("app-misc/abandoned")).has_value());
    }
    qr::Database reopened(TEST_DB_PATH);
    assert(!reopened.is_package_installed(id("app-misc/abandoned")));
    assert(reopened.is_package_installed(id("app-misc/kept")));
    qr::log::ok("Test Passed: Commit and Rollback");
}

int main() {
    try {
        test_add_and_get();
        test_dependency_conditions_survive();
        test_is_installed_and_remove();
        test_slots();
        test_reverse_dependencies();
        test_file_owners();
        test_transactions();
    } catch (const std::exception& e) {
        qr::log::error("A test failed with an exception: " + std::string(e.what()));
        std::filesystem::remove(TEST_DB_PATH);
        return 1;
    }

    std::filesystem::remove(TEST_DB_PATH);
    qr::log::ok("All database tests passed!");
    return 0;
}
