//
// Created by cv2 on 10/19/26.
//

#include "libqr/dependency_resolver.h"
#include "libqr/logging.h"
#include "test_helpers.h"
#include <algorithm>
#include <cassert>

using qr::test::dep;
using qr::test::id;
using qr::test::make_pkg;
using qr::test::ver;

static size_t position(const qr::Resolution& resolution, const std::string& atom) {
    auto it = std::find_if(resolution.packages.begin(), resolution.packages.end(),
                           [&](const qr::PackageInfo& p) { return p.id == id(atom); });
    assert(it != resolution.packages.end());
    return static_cast<size_t>(it - resolution.packages.begin());
}

void test_build_order() {
    qr::log::info("Running test: Dependencies are built first...");
    qr::PackageIndex available;
    available.add(make_pkg("app/a", "1.0", {"lib/b"}));
    available.add(make_pkg("lib/b", "1.0", {"lib/c >=1.1"}));
    available.add(make_pkg("lib/c", "1.0"));
    available.add(make_pkg("lib/c", "1.2"));

    const std::vector<qr::InstalledPackage> installed;
    qr::DependencyResolver resolver(available, installed);
    auto resolution = resolver.resolve({id("app/a")}, {});
    assert(resolution.has_value());
    assert(resolution->packages.size() == 3);
    assert(position(*resolution, "lib/c") < position(*resolution, "lib/b"));
    assert(position(*resolution, "lib/b") < position(*resolution, "app/a"));
    assert(resolution->packages[position(*resolution, "lib/c")].version == ver("1.2"));
    assert(resolution->cycles.empty());
    assert(resolution->removals.empty());
    assert(resolution->decisions.size() == 3);
    qr::log::ok("Test Passed: Dependencies are built first.");
}

void test_hard_blocker_fails() {
    qr::log::info("Running test: Unresolvable hard blocker...");
    qr::PackageIndex available;
    auto a = make_pkg("app/a", "1.0");
    a.blockers = {"!!app/b"};
    available.add(a);
    available.add(make_pkg("app/b", "1.0"));

    const std::vector<qr::InstalledPackage> installed;
    qr::DependencyResolver resolver(available, installed);
    auto resolution = resolver.resolve({id("app/a"), id("app/b")}, {});
    assert(!resolution);
    assert(resolution.error().code == qr::ErrorCode::ResolutionFailed);
    assert(resolution.error().message.find("Hard blocker") != std::string::npos);
    assert((resolution.error().packages == std::vector<std::string>{"app/a", "app/b"}));

    qr::InstallOptions force;
    force.force = true;
    auto forced = resolver.resolve({id("app/a"), id("app/b")}, force);
    assert(forced.has_value());
    assert(forced->packages.size() == 2);
    qr::log::ok("Test Passed: Unresolvable hard blocker.");
}

void test_blocker_actions() {
    qr::log::info("Running test: Blocker actions flow into the resolution...");
    qr::PackageIndex available;
    auto fresh = make_pkg("app/new", "1.0");
    fresh.blockers = {"!!app/old"};
    available.add(fresh);
    auto first = make_pkg("app/first", "1.0");
    first.blockers = {"!app/second"};
    available.add(first);
    available.add(make_pkg("app/second", "1.0"));

    std::vector<qr::InstalledPackage> installed(1);
    installed[0].id = id("app/old");
    installed[0].version = ver("1.0");

    qr::DependencyResolver resolver(available, installed);
    auto removal = resolver.resolve({id("app/new")}, {});
    assert(removal.has_value());
    assert(removal->removals == std::vector<qr::PackageId>{id("app/old")});
    assert(removal->blocker_actions.size() == 1);
    assert(removal->blocker_actions[0].action == qr::BlockerResolution::Action::Remove);
    assert(!removal->empty());

    // Requested second first; the soft blocker still puts its declarer ahead.
    auto ordered = resolver.resolve({id("app/second"), id("app/first")}, {});
    assert(ordered.has_value());
    assert(ordered->blocker_actions.size() == 1);
    assert(ordered->blocker_actions[0].action == qr::BlockerResolution::Action::OrderedInstall);
    assert(position(*ordered, "app/first") < position(*ordered, "app/second"));
    qr::log::ok("Test Passed: Blocker actions flow into the resolution.");
}

// Every active dependency between selected packages holds.
static void assert_constraints_hold(const qr::Resolution& resolution) {
    for (const auto& pkg : resolution.packages) {
        const auto flags = qr::effective_use_flags(pkg, {});
        for (const auto* d : pkg.all_dependencies()) {
            if (!d->is_active(flags)) continue;
            for (const auto& other : resolution.packages) {
                if (other.id == d->package) {
                    assert(d->accepts(other.version, other.slot));
                }
            }
        }
    }
}

void test_blocked_version_is_skipped() {
    qr::log::info("Running test: A hard-blocked version is not selected...");
    qr::PackageIndex available;
    available.add(make_pkg("app/a", "1.0", {"lib/b <=2.5"}));
    available.add(make_pkg("lib/b", "1.0"));
    available.add(make_pkg("lib/b", "2.0"));
    available.add(make_pkg("lib/b", "3.0"));
    auto c = make_pkg("app/c", "1.0");
    c.blockers = {"!!=lib/b-2.0"};
    available.add(c);

    const std::vector<qr::InstalledPackage> installed;
    qr::DependencyResolver resolver(available, installed);
    auto resolution = resolver.resolve({id("app/a"), id("app/c")}, {});
    assert(resolution.has_value());
    assert(resolution->packages.size() == 3);
    assert(resolution->packages[position(*resolution, "lib/b")].version == ver("1.0"));
    assert(resolution->blocker_actions.empty());
    assert(resolution->backtracks == 0);
    assert_constraints_hold(*resolution);

    // The declarer comes after the blocked version was chosen: backtrack.
    qr::PackageIndex two;
    two.add(make_pkg("lib/b", "1.0"));
    two.add(make_pkg("lib/b", "2.0"));
    two.add(c);
    qr::DependencyResolver late_resolver(two, installed);
    auto late = late_resolver.resolve({id("lib/b"), id("app/c")}, {});
    assert(late.has_value());
    assert(late->packages[position(*late, "lib/b")].version == ver("1.0"));
    assert(late->backtracks == 1);

    // Nothing below 2.0 is allowed and 2.0 is blocked, so no plan exists.
    qr::PackageIndex narrow;
    narrow.add(make_pkg("app/e", "1.0", {"lib/b >=2.0"}));
    narrow.add(make_pkg("lib/b", "1.0"));
    narrow.add(make_pkg("lib/b", "2.0"));
    narrow.add(c);
    qr::DependencyResolver stuck(narrow, installed);
    auto failed = stuck.resolve({id("app/c"), id("app/e")}, {});
    assert(!failed);
    assert(failed.error().code == qr::ErrorCode::ResolutionFailed);
    qr::log::ok("Test Passed: A hard-blocked version is not selected.");
}

void test_blocker_replacement_is_resolved() {
    qr::log::info("Running test: A blocker upgrade brings its own dependencies...");
    qr::PackageIndex available;
    auto c = make_pkg("app/c", "1.0");
    c.blockers = {"!!=lib/b-2.0"};
    available.add(c);
    available.add(make_pkg("lib/b", "2.0"));
    available.add(make_pkg("lib/b", "3.0", {"lib/z >=1.0"}));
    available.add(make_pkg("lib/z", "1.0"));

    std::vector<qr::InstalledPackage> installed(1);
    installed[0].id = id("lib/b");
    installed[0].version = ver("2.0");

    qr::DependencyResolver resolver(available, installed);
    auto resolution = resolver.resolve({id("app/c")}, {});
    assert(resolution.has_value());
    assert(resolution->packages.size() == 3);
    assert(resolution->packages[position(*resolution, "lib/b")].version == ver("3.0"));
    assert(position(*resolution, "lib/z") < position(*resolution, "lib/b"));
    assert(resolution->blocker_actions.size() == 1);
    assert(resolution->blocker_actions[0].action == qr::BlockerResolution::Action::Upgrade);
    assert(resolution->blocker_actions[0].to == ver("3.0"));
    assert_constraints_hold(*resolution);

    // The requester's own bound and blocker leave 1.8, which replaces the installed 2.0.
    qr::PackageIndex older;
    auto d = make_pkg("app/d", "1.0", {"lib/b >=1.5"});
    d.blockers = {"!!>=lib/b-2.0"};
    older.add(d);
    older.add(make_pkg("lib/b", "1.0"));
    older.add(make_pkg("lib/b", "1.8"));
    older.add(make_pkg("lib/b", "2.0"));
    qr::DependencyResolver down(older, installed);
    auto settled = down.resolve({id("app/d")}, {});
    assert(settled.has_value());
    assert(settled->packages[position(*settled, "lib/b")].version == ver("1.8"));
    assert(settled->blocker_actions.empty());
    assert_constraints_hold(*settled);

    // The upgrade target cannot be resolved itself.
    qr::PackageIndex broken;
    broken.add(c);
    broken.add(make_pkg("lib/b", "2.0"));
    broken.add(make_pkg("lib/b", "3.0", {"lib/missing"}));
    qr::DependencyResolver unresolvable(broken, installed);
    auto failed = unresolvable.resolve({id("app/c")}, {});
    assert(!failed);
    assert(failed.error().code == qr::ErrorCode::ResolutionFailed);
    assert(failed.error().message.find("Package not found: lib/missing") != std::string::npos);
    qr::log::ok("Test Passed: A blocker upgrade brings its own dependencies.");
}

void test_use_flag_cycle() {
    qr::log::info("Running test: USE flag cycle is broken...");
    qr::PackageIndex available;
    available.add(make_pkg("media/a", "1.0", {"media/b"}));
    auto b = make_pkg("media/b", "1.0");
    b.use_flags.push_back({"gui", false, ""});
    auto back = dep("media/a");
    back.use_condition = qr::UseCondition::if_enabled("gui");
    b.dependencies.push_back(back);
    available.add(b);

    const std::vector<qr::InstalledPackage> installed;
    qr::DependencyResolver resolver(available, installed);

    qr::InstallOptions opts;
    opts.use_flags = {"gui"};
    auto resolution = resolver.resolve({id("media/a")}, opts);
    assert(resolution.has_value());
    assert(resolution->cycles.size() == 1);
    assert(resolution->cycles[0].strategy.kind == qr::CycleBreakStrategy::Kind::DisableUseFlag);
    assert(resolution->disabled_use_flags.at(id("media/b")).contains("gui"));
    assert(!resolution->use_flags.at(id("media/b")).contains("gui"));
    assert(position(*resolution, "media/b") < position(*resolution, "media/a"));

    // Without the flag there is no cycle at all.
    auto plain = resolver.resolve({id("media/a")}, {});
    assert(plain.has_value() && plain->cycles.empty());
    qr::log::ok("Test Passed: USE flag cycle is broken.");
}

void test_unbreakable_cycle() {
    qr::log::info("Running test: Unbreakable cycle...");
    qr::PackageIndex available;
    available.add(make_pkg("app/x", "1.0", {"app/y"}));
    available.add(make_pkg("app/y", "1.0", {"app/x"}));

    const std::vector<qr::InstalledPackage> installed;
    qr::DependencyResolver resolver(available, installed);
    auto resolution = resolver.resolve({id("app/x")}, {});
    assert(!resolution);
    assert(resolution.error().code == qr::ErrorCode::CircularDependency);
    qr::log::ok("Test Passed: Unbreakable cycle.");
}

int main() {
    try {
        test_build_order();
        test_hard_blocker_fails();
        test_blocker_actions();
        test_blocked_version_is_skipped();
        test_blocker_replacement_is_resolved();
        test_use_flag_cycle();
        test_unbreakable_cycle();
    } catch (const std::exception& e) {
        qr::log::error("A test failed with an exception: " + std::string(e.what()));
        return 1;
    }

    qr::log::ok("All dependency resolver tests passed!");
    return 0;
}
