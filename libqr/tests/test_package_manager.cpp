//
// Created by cv2 on 10/19/26.
//

#include "libqr/package_manager.h"
#include "libqr/logging.h"
#include "test_helpers.h"
#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <memory>

using qr::test::id;
using qr::test::make_pkg;
using qr::test::read_file;
using qr::test::ver;

const std::string INDEX_YAML = R"(
- category: sys-libs
  name: glibc
  version: 2.38.0
- category: sys-libs
  name: glibc
  version: 2.39.0
- category: app-misc
  name: hello
  version: 1.0.0
  dependencies:
    - sys-libs/glibc >=2.38
- category: dev-util
  name: hello
  version: 1.0.0
)";

// A fake system root with an index on disk and a scripted build backend
// owned by the package manager.
struct PackageManagerTestFixture {
    const std::filesystem::path m_sys_root;
    const std::filesystem::path m_builds;
    qr::test::FakeBuildBackend* m_backend = nullptr;
    std::unique_ptr<qr::PackageManager> m_pm;

    PackageManagerTestFixture() :
            m_sys_root("/tmp/quarry_pm_sysroot"),
            m_builds("/tmp/quarry_pm_builds")
    {
        std::filesystem::remove_all(m_sys_root);
        std::filesystem::remove_all(m_builds);
        std::filesystem::create_directories(m_sys_root / "var" / "db" / "quarry");
        std::ofstream(m_sys_root / "var" / "db" / "quarry" / "index.yaml") << INDEX_YAML;

        auto config = qr::Config::load(m_sys_root);
        assert(config.has_value());
        auto pm = qr::PackageManager::open(*config, make_backend());
        assert(pm.has_value());
        m_pm = std::move(*pm);
    }

    ~PackageManagerTestFixture() {
        m_pm.reset();
        std::filesystem::remove_all(m_sys_root);
        std::filesystem::remove_all(m_builds);
    }

    std::unique_ptr<qr::BuildBackend> make_backend() {
        auto backend = std::make_unique<qr::test::FakeBuildBackend>(m_builds);
        backend->define("sys-libs/glibc-2.38.0", {{"/usr/lib/libc.so", "libc 2.38"}});
        backend->define("sys-libs/glibc-2.39.0", {{"/usr/lib/libc.so", "libc 2.39"}});
        backend->define("sys-libs/glibc-2.40.0", {{"/usr/lib/libc.so", "libc 2.40"}});
        backend->define("app-misc/hello-1.0.0", {{"/usr/bin/hello", "hello v1"}, {"/usr/bin/hi", "->hello"}});
        backend->define("app-misc/hello-2.0.0", {{"/usr/bin/hello", "hello v2"}});
        backend->define("app-misc/pinned-1.0.0", {{"/usr/bin/pinned", "pinned"}});
        backend->define("dev-util/hello-1.0.0", {{"/usr/libexec/hello", "dev hello"}});
        backend->define("app-misc/viewer-1.0.0", {{"/usr/bin/viewer", "viewer"}});
        m_backend = backend.get();
        return backend;
    }

    // Swaps in a manager over a different index, keeping the same system.
    void reopen(qr::PackageIndex index) {
        const auto config = m_pm->config();
        m_pm.reset();
        m_pm = std::make_unique<qr::PackageManager>(config, std::move(index), make_backend());
    }

    qr::PackageIndex index_with(const std::vector<qr::PackageInfo>& extra) const {
        qr::PackageIndex index = m_pm->available();
        for (const auto& pkg : extra) index.add(pkg);
        return index;
    }

    std::filesystem::path path(const std::string& system_path) const {
        return m_sys_root / std::filesystem::path(system_path).relative_path();
    }
};

void test_name_resolution() {
    qr::log::info("Running test: Package name resolution...");
    PackageManagerTestFixture fx;
    assert(fx.m_pm->available().size() == 4);
    assert(fx.m_pm->resolve_name("glibc") == id("sys-libs/glibc"));
    assert(fx.m_pm->resolve_name("app-misc/hello") == id("app-misc/hello"));

    auto ambiguous = fx.m_pm->resolve_name("hello");
    assert(!ambiguous);
    assert(ambiguous.error().code == qr::ErrorCode::AmbiguousPackage);
    assert((ambiguous.error().packages == std::vector<std::string>{"app-misc/hello", "dev-util/hello"}));

    assert(fx.m_pm->resolve_name("nothere").error().code == qr::ErrorCode::PackageNotFound);
    assert(fx.m_pm->resolve_name("app-misc/nothere").error().code == qr::ErrorCode::PackageNotFound);
    assert(fx.m_pm->plan_install({"hello"}, {}).error().code == qr::ErrorCode::AmbiguousPackage);
    qr::log::ok("Test Passed: Package name resolution.");
}

void test_install_flow() {
    qr::log::info("Running test: Plan, pretend and install...");
    PackageManagerTestFixture fx;

    auto plan = fx.m_pm->plan_install({"app-misc/hello"}, {});
    assert(plan.has_value());
    assert(plan->operations.size() == 2);
    assert(plan->operations[0].describe() == "install sys-libs/glibc-2.39.0:0");
    assert(plan->operations[1].describe() == "install app-misc/hello-1.0.0:0");
    assert(!plan->operations[0].explicit_install);
    assert(plan->operations[1].explicit_install);

    qr::InstallOptions pretend;
    pretend.pretend = true;
    assert(fx.m_pm->execute(*plan, pretend).has_value());
    assert(fx.m_pm->list_installed().empty());
    assert(fx.m_backend->built().empty());

    assert(fx.m_pm->execute(*plan, {}).has_value());
    assert(fx.m_pm->list_installed().size() == 2);
    assert(read_file(fx.path("/usr/bin/hello")) == "hello v1");
    assert(read_file(fx.path("/usr/lib/libc.so")) == "libc 2.39");

    // Nothing left to do for the same request.
    auto again = fx.m_pm->plan_install({"app-misc/hello"}, {});
    assert(again.has_value() && again->empty());
    assert(fx.m_pm->execute(*again, {}).has_value());

    // Forcing reinstalls the requested package only.
    qr::InstallOptions force;
    force.force = true;
    auto reinstall = fx.m_pm->plan_install({"app-misc/hello"}, force);
    assert(reinstall->operations.size() == 1);
    assert(reinstall->operations[0].describe() == "reinstall app-misc/hello-1.0.0 -> 1.0.0");

    // Another package with the same name cannot take the slot.
    auto clash = fx.m_pm->plan_install({"dev-util/hello"}, {});
    assert(!clash);
    assert(clash.error().code == qr::ErrorCode::SlotConflict);
    qr::log::ok("Test Passed: Plan, pretend and install.");
}

void test_oneshot() {
    qr::log::info("Running test: Oneshot installs are not explicit...");
    PackageManagerTestFixture fx;
    qr::InstallOptions oneshot;
    oneshot.oneshot = true;
    assert(fx.m_pm->install({"app-misc/hello"}, oneshot).has_value());
    assert(!fx.m_pm->database().get_installed_package(id("app-misc/hello"))->explicit_install);

    // Everything is unneeded now.
    auto clean = fx.m_pm->plan_depclean({});
    assert(clean.has_value());
    assert(clean->operations.size() == 2);
    assert(clean->operations[0].id() == id("app-misc/hello"));
    assert(clean->operations[1].id() == id("sys-libs/glibc"));
    qr::log::ok("Test Passed: Oneshot installs are not explicit.");
}

void test_remove_and_depclean() {
    qr::log::info("Running test: Remove and depclean...");
    PackageManagerTestFixture fx;
    assert(fx.m_pm->install({"app-misc/hello"}, {}).has_value());

    auto blocked = fx.m_pm->plan_remove({"glibc"}, {});
    assert(!blocked);
    assert(blocked.error().code == qr::ErrorCode::HasDependents);
    assert(blocked.error().packages == std::vector<std::string>{"app-misc/hello"});
    assert(blocked.error().message == "sys-libs/glibc is required by app-misc/hello");

    qr::InstallOptions force;
    force.force = true;
    assert(fx.m_pm->plan_remove({"glibc"}, force)->operations.size() == 1);
    // Removing both together is fine.
    assert(fx.m_pm->plan_remove({"glibc", "app-misc/hello"}, {})->operations.size() == 2);
    assert(fx.m_pm->plan_remove({"dev-util/hello"}, {}).error().code == qr::ErrorCode::PackageNotInstalled);

    assert(fx.m_pm->plan_depclean({})->empty());

    assert(fx.m_pm->remove({"hello"}, {}).has_value());
    assert(!std::filesystem::exists(fx.path("/usr/bin/hello")));

    auto clean = fx.m_pm->plan_depclean({});
    assert(clean->operations.size() == 1);
    assert(clean->operations[0].describe() == "remove sys-libs/glibc-2.39.0:0");
    assert(fx.m_pm->execute(*clean, {}).has_value());
    assert(fx.m_pm->list_installed().empty());
    assert(!std::filesystem::exists(fx.path("/usr/lib/libc.so")));
    qr::log::ok("Test Passed: Remove and depclean.");
}

void test_remove_ignores_disabled_dependencies() {
    qr::log::info("Running test: USE-disabled dependencies do not block removal...");
    PackageManagerTestFixture fx;
    auto viewer = make_pkg("app-misc/viewer", "1.0");
    viewer.use_flags.push_back({"gui", false, ""});
    auto gui_dep = qr::test::dep("sys-libs/glibc >=2.38");
    gui_dep.use_condition = qr::UseCondition::if_enabled("gui");
    viewer.dependencies.push_back(gui_dep);
    fx.reopen(fx.index_with({viewer}));

    assert(fx.m_pm->install({"sys-libs/glibc", "app-misc/viewer"}, {}).has_value());
    // Records are read back from disk by a fresh manager.
    fx.reopen(fx.index_with({viewer}));
    auto record = fx.m_pm->database().get_installed_package(id("app-misc/viewer"));
    assert(record.has_value());
    assert(record->dependencies.size() == 1);
    assert(record->dependencies[0].use_condition.is_conditional());

    auto plan = fx.m_pm->plan_remove({"glibc"}, {});
    assert(plan.has_value());
    assert(plan->operations.size() == 1);
    assert(fx.m_pm->execute(*plan, {}).has_value());
    assert(fx.m_pm->database().is_package_installed(id("app-misc/viewer")));

    // Rebuilt with the flag on, the same edge pulls glibc back and holds it.
    qr::InstallOptions gui;
    gui.use_flags = {"gui"};
    gui.force = true;
    assert(fx.m_pm->install({"app-misc/viewer"}, gui).has_value());
    assert(fx.m_pm->database().is_package_installed(id("sys-libs/glibc")));
    auto held = fx.m_pm->plan_remove({"glibc"}, {});
    assert(!held);
    assert(held.error().code == qr::ErrorCode::HasDependents);
    qr::log::ok("Test Passed: USE-disabled dependencies do not block removal.");
}

void test_update() {
    qr::log::info("Running test: Update to newer versions...");
    PackageManagerTestFixture fx;
    assert(fx.m_pm->install({"app-misc/hello"}, {}).has_value());
    assert(fx.m_pm->plan_update({})->empty());

    fx.reopen(fx.index_with({make_pkg("app-misc/hello", "2.0", {"sys-libs/glibc >=2.39"})}));
    auto plan = fx.m_pm->plan_update({});
    assert(plan.has_value());
    assert(plan->operations.size() == 1);
    assert(plan->operations[0].kind == qr::Operation::Kind::Upgrade);
    assert(plan->operations[0].explicit_install);

    assert(fx.m_pm->update({}).has_value());
    assert(read_file(fx.path("/usr/bin/hello")) == "hello v2");
    auto hello = fx.m_pm->database().get_installed_package(id("app-misc/hello"));
    assert(hello->version == ver("2.0"));
    assert(hello->explicit_install);
    assert(!fx.m_pm->database().get_installed_package(id("sys-libs/glibc"))->explicit_install);
    qr::log::ok("Test Passed: Update to newer versions.");
}

void test_version_conflict() {
    qr::log::info("Running test: Upgrades may not break installed dependents...");
    PackageManagerTestFixture fx;
    fx.reopen(fx.index_with({make_pkg("sys-libs/glibc", "2.40"),
                             make_pkg("app-misc/pinned", "1.0", {"sys-libs/glibc <=2.39"})}));
    assert(fx.m_pm->install({"sys-libs/glibc"}, {}).has_value());
    assert(fx.m_pm->database().get_installed_package(id("sys-libs/glibc"))->version == ver("2.40"));

    // pinned forces glibc back down.
    auto pinned = fx.m_pm->plan_install({"pinned"}, {});
    assert(pinned.has_value());
    assert(pinned->operations.size() == 2);
    assert(fx.m_pm->execute(*pinned, {}).has_value());
    assert(fx.m_pm->database().get_installed_package(id("sys-libs/glibc"))->version == ver("2.39"));

    auto upgrade = fx.m_pm->plan_install({"sys-libs/glibc"}, {});
    assert(!upgrade);
    assert(upgrade.error().code == qr::ErrorCode::VersionConflict);
    assert((upgrade.error().packages == std::vector<std::string>{"app-misc/pinned", "sys-libs/glibc"}));
    qr::log::ok("Test Passed: Upgrades may not break installed dependents.");
}

void test_queries() {
    qr::log::info("Running test: Owner lookup and verification...");
    PackageManagerTestFixture fx;
    assert(fx.m_pm->install({"app-misc/hello"}, {}).has_value());

    assert(fx.m_pm->find_owner("/usr/bin/hello") == id("app-misc/hello"));
    assert(fx.m_pm->find_owner("/usr/lib/../bin/hello") == id("app-misc/hello"));
    assert(fx.m_pm->find_owner("usr/lib/libc.so") == id("sys-libs/glibc"));
    assert(!fx.m_pm->find_owner("/usr/bin"));
    assert(!fx.m_pm->find_owner("/etc/passwd"));

    auto clean = fx.m_pm->verify();
    assert(clean.size() == 2);
    assert(std::all_of(clean.begin(), clean.end(), [](const qr::VerifyResult& r) { return r.ok(); }));

    std::ofstream(fx.path("/usr/bin/hello"), std::ios::trunc) << "tampered";
    std::filesystem::remove(fx.path("/usr/lib/libc.so"));
    std::filesystem::remove(fx.path("/usr/bin/hi"));
    std::filesystem::create_symlink("elsewhere", fx.path("/usr/bin/hi"));

    for (const auto& result : fx.m_pm->verify()) {
        if (result.id == id("app-misc/hello")) {
            assert((result.modified == std::vector<std::string>{"/usr/bin/hello", "/usr/bin/hi"}));
            assert(result.missing.empty());
        } else {
            assert(result.missing == std::vector<std::string>{"/usr/lib/libc.so"});
        }
    }
    qr::log::ok("Test Passed: Owner lookup and verification.");
}

void test_failed_install_leaves_system_untouched() {
    qr::log::info("Running test: A failed build leaves the system untouched...");
    PackageManagerTestFixture fx;
    fx.m_backend->fail("app-misc/hello-1.0.0");

    auto result = fx.m_pm->install({"app-misc/hello"}, {});
    assert(!result);
    assert(result.error().code == qr::ErrorCode::TransactionRolledBack);
    assert(result.error().cause == qr::ErrorCode::BuildFailed);
    assert(fx.m_pm->list_installed().empty());
    assert(!std::filesystem::exists(fx.path("/usr/lib/libc.so")));
    qr::log::ok("Test Passed: A failed build leaves the system untouched.");
}

int main() {
    try {
        test_name_resolution();
        test_install_flow();
        test_oneshot();
        test_remove_and_depclean();
        test_remove_ignores_disabled_dependencies();
        test_update();
        test_version_conflict();
        test_queries();
        test_failed_install_leaves_system_untouched();
    } catch (const std::exception& e) {
        qr::log::error("A test failed with an exception: " + std::string(e.what()));
        return 1;
    }

    qr::log::ok("All package manager tests passed!");
    return 0;
}
