//
// Created by cv2 on 10/19/26.
//

#include "libqr/collision.h"
#include "libqr/logging.h"
#include <cassert>
#include <filesystem>
#include <fstream>

struct CollisionTestFixture {
    const std::filesystem::path root = "/tmp/quarry_collision_test_root";
    const qr::PackageId pkg_a{"app-misc", "alpha"};
    const qr::PackageId pkg_b{"app-misc", "beta"};

    CollisionTestFixture() {
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root / "usr/bin");
        std::filesystem::create_directories(root / "etc/conf.d");
    }

    ~CollisionTestFixture() {
        std::filesystem::remove_all(root);
    }
};

void test_owned_by_other() {
    qr::log::info("Running test: Collision with a file owned by another package...");
    CollisionTestFixture fx;
    qr::CollisionDetector detector({}, fx.root);
    detector.register_files(fx.pkg_a, {"/usr/bin/tool"});

    auto result = detector.check_collisions(fx.pkg_b, std::vector<std::string>{"/usr/bin/tool"});
    assert(result.collisions.size() == 1);
    assert(result.collisions[0].type == qr::CollisionType::OwnedByOther);
    assert(result.collisions[0].owner == fx.pkg_a);
    assert(!result.collisions[0].acceptable);
    assert(!result.can_proceed);

    // force lets it through but still reports it
    auto forced = detector.check_collisions(fx.pkg_b, std::vector<std::string>{"/usr/bin/tool"}, true);
    assert(forced.collisions.size() == 1);
    assert(forced.can_proceed);

    // a package reinstalling its own file does not collide
    auto own = detector.check_collisions(fx.pkg_a, std::vector<std::string>{"/usr/bin/tool"});
    assert(own.collisions.empty());
    assert(own.safe_files.size() == 1);
    qr::log::ok("Test Passed: Collision with a file owned by another package.");
}

void test_orphaned_and_type_mismatch() {
    qr::log::info("Running test: Orphaned files and type mismatches...");
    CollisionTestFixture fx;
    std::ofstream(fx.root / "usr/bin/stray") << "left behind";
    std::filesystem::create_symlink("/usr/bin/other", fx.root / "usr/bin/link");
    qr::CollisionDetector detector({}, fx.root);

    std::vector<qr::InstalledFile> manifest(4);
    manifest[0].path = "/usr/bin/stray";
    manifest[1].path = "/etc/conf.d";              // a file where a directory exists
    manifest[2].path = "/usr/bin/link";
    manifest[2].file_type = qr::FileType::Symlink;
    manifest[2].link_target = "/usr/bin/mine";
    manifest[3].path = "/usr/bin";
    manifest[3].file_type = qr::FileType::Directory;

    auto result = detector.check_collisions(fx.pkg_a, manifest);
    assert(result.collisions.size() == 3);
    assert(result.collisions[0].type == qr::CollisionType::Orphaned);
    assert(result.collisions[0].acceptable);
    assert(result.collisions[1].type == qr::CollisionType::TypeMismatch);
    assert(result.collisions[2].type == qr::CollisionType::SymlinkDiffers);
    // the existing directory is shared, not a collision
    assert(result.safe_files == std::vector<std::string>{"/usr/bin"});
    assert(!result.can_proceed);

    auto actions = detector.resolve_collisions(result, false);
    assert(actions.size() == 3);
    assert(actions[0].second == qr::CollisionAction::Backup);
    assert(actions[1].second == qr::CollisionAction::Skip);
    auto forced = detector.resolve_collisions(result, true);
    assert(forced[2].second == qr::CollisionAction::Replace);

    // Only the orphan: acceptable, so the install may proceed.
    auto orphan_only = detector.check_collisions(fx.pkg_a, std::vector<std::string>{"/usr/bin/stray"});
    assert(orphan_only.can_proceed);
    qr::log::ok("Test Passed: Orphaned files and type mismatches.");
}

void test_ignore_patterns() {
    qr::log::info("Running test: Collision ignore patterns...");
    CollisionTestFixture fx;
    qr::CollisionDetector detector({}, fx.root);
    detector.register_files(fx.pkg_a, {
        "/usr/share/info/dir",
        "/usr/lib/python3/site-packages/mod.pyc",
        "/usr/lib/python3/site-packages/__pycache__/mod.cpython-312.pyc",
        "/usr/share/doc/alpha/README",
        "/usr/share/man/man1/alpha.1",
        "/usr/share/info/alpha.info",
    });

    assert(detector.should_ignore("/usr/share/info/dir"));
    assert(!detector.should_ignore("/opt/usr/share/info/dir"));
    assert(detector.should_ignore("/x/y.pyo"));

    auto result = detector.check_collisions(fx.pkg_b, detector.get_package_files(fx.pkg_a));
    assert(result.collisions.size() == 1);
    assert(result.collisions[0].path == "/usr/share/info/alpha.info");

    qr::CollisionConfig strict;
    strict.ignore_patterns.clear();
    strict.allow_doc_collisions = false;
    strict.allow_man_collisions = false;
    qr::CollisionDetector strict_detector(strict, fx.root);
    strict_detector.register_files(fx.pkg_a, {"/usr/share/doc/alpha/README"});
    assert(!strict_detector.should_ignore("/usr/share/doc/alpha/README"));
    assert(!strict_detector.check_collisions(fx.pkg_b, std::vector<std::string>{"/usr/share/doc/alpha/README"}).can_proceed);

    assert((qr::parse_collision_ignore("  *.la\t/etc/foo  ") == std::vector<std::string>{"*.la", "/etc/foo"}));
    qr::log::ok("Test Passed: Collision ignore patterns.");
}

void test_register_unregister() {
    qr::log::info("Running test: Ownership index maintenance...");
    CollisionTestFixture fx;
    qr::CollisionDetector detector({}, fx.root);
    detector.register_files(fx.pkg_a, {"/a", "/b", "/c"});
    detector.register_files(fx.pkg_b, {"/d"});
    assert(detector.size() == 4);

    detector.unregister_files(fx.pkg_a, {"/b", "/d"});   // "/d" belongs to beta and stays
    assert(detector.size() == 3);
    assert(!detector.get_owner("/b"));
    assert(detector.get_owner("/d") == fx.pkg_b);

    detector.unregister_files(fx.pkg_a);
    assert(detector.get_package_files(fx.pkg_a).empty());
    assert(detector.size() == 1);
    qr::log::ok("Test Passed: Ownership index maintenance.");
}

void test_report() {
    qr::log::info("Running test: Collision report...");
    CollisionTestFixture fx;
    qr::CollisionDetector detector({}, fx.root);
    assert(qr::format_collision_report(detector.check_collisions(fx.pkg_a, std::vector<std::string>{"/x"})) ==
           "No file collisions detected.");

    detector.register_files(fx.pkg_a, {"/usr/bin/tool"});
    auto report = qr::format_collision_report(
        detector.check_collisions(fx.pkg_b, std::vector<std::string>{"/usr/bin/tool"}));
    assert(report.find("Detected 1 file collision(s)") != std::string::npos);
    assert(report.find("/usr/bin/tool (owned by another package: app-misc/alpha)") != std::string::npos);
    assert(report.find("cannot proceed") != std::string::npos);
    qr::log::ok("Test Passed: Collision report.");
}

int main() {
    try {
        test_owned_by_other();
        test_orphaned_and_type_mismatch();
        test_ignore_patterns();
        test_register_unregister();
        test_report();
    } catch (const std::exception& e) {
        qr::log::error("A test failed with an exception: " + std::string(e.what()));
        return 1;
    }

    qr::log::ok("All collision tests passed!");
    return 0;
}
