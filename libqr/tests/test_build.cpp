//
// Created by cv2 on 10/19/26.
//

#include "libqr/build.h"
#include "libqr/logging.h"
#include "test_helpers.h"
#include <algorithm>
#include <cassert>
#include <filesystem>

const std::filesystem::path WORK_DIR = "/tmp/quarry_build_test";

static qr::BuildConfig shell_config(const std::string& command) {
    qr::BuildConfig config;
    config.command = command;
    config.timeout = std::chrono::seconds(10);
    return config;
}

void test_expand_command() {
    qr::log::info("Running test: Command template expansion...");
    assert(qr::CommandBuildBackend::expand_command("buck2 build {target} --out {output}", "//app:hello",
                                                   "/tmp/out") == "buck2 build //app:hello --out /tmp/out");
    assert(qr::CommandBuildBackend::expand_command("{target} {target} {output}", "t", "/o") == "t t /o");
    assert(qr::CommandBuildBackend::expand_command("make", "t", "/o") == "make");
    // A value containing the placeholder is not expanded again.
    assert(qr::CommandBuildBackend::expand_command("{target}", "{target}", "/o") == "{target}");
    qr::log::ok("Test Passed: Command template expansion.");
}

void test_successful_build() {
    qr::log::info("Running test: Successful shell build...");
    std::filesystem::remove_all(WORK_DIR);
    qr::CommandBuildBackend backend(
        shell_config("mkdir -p {output}/usr/bin && echo '{target}' > {output}/usr/bin/tool && echo built"),
        WORK_DIR);

    auto result = backend.build("app/tool-1.0.0");
    assert(result.success);
    assert(result.target == "app/tool-1.0.0");
    assert(result.output_path.has_value());
    assert(qr::test::read_file(*result.output_path / "usr/bin/tool") == "app/tool-1.0.0\n");
    assert(result.stdout_log == "built\n");
    assert(result.output_path->parent_path() == WORK_DIR / "app_tool-1.0.0");

    // Exiting cleanly without producing anything is not an artifact.
    qr::CommandBuildBackend empty(shell_config("true"), WORK_DIR);
    auto nothing = empty.build("app/empty");
    assert(nothing.success);
    assert(!nothing.output_path);
    qr::log::ok("Test Passed: Successful shell build.");
}

void test_failed_build() {
    qr::log::info("Running test: Failing and hanging builds...");
    std::filesystem::remove_all(WORK_DIR);
    qr::CommandBuildBackend failing(shell_config("echo 'no rule for {target}' >&2; exit 3"), WORK_DIR);
    auto result = failing.build("app/broken");
    assert(!result.success);
    assert(result.stderr_log.find("no rule for app/broken") != std::string::npos);

    qr::BuildConfig slow = shell_config("sleep 30");
    slow.timeout = std::chrono::seconds(1);
    qr::CommandBuildBackend hanging(slow, WORK_DIR);
    auto timed_out = hanging.build("app/slow");
    assert(!timed_out.success);
    assert(timed_out.stderr_log.find("timed out") != std::string::npos);
    assert(timed_out.duration < std::chrono::seconds(10));
    qr::log::ok("Test Passed: Failing and hanging builds.");
}

void test_build_pool() {
    qr::log::info("Running test: Build pool sharing...");
    std::filesystem::remove_all(WORK_DIR);
    qr::test::FakeBuildBackend backend(WORK_DIR);
    backend.define("app/a", {{"/usr/bin/a", "a"}});
    backend.define("app/b", {{"/usr/bin/b", "b"}});
    backend.fail("app/c");

    qr::BuildPool pool(backend, 2);
    auto first = pool.submit("app/a");
    auto again = pool.submit("app/a");
    pool.submit("app/b");

    auto a = pool.wait("app/a");
    assert(a.success);
    assert(first.get().output_path == again.get().output_path);
    assert(pool.wait("app/b").success);
    auto c = pool.wait("app/c");
    assert(!c.success);
    assert(c.stderr_log == "forced failure of app/c");

    auto built = backend.built();
    assert(std::count(built.begin(), built.end(), "app/a") == 1);
    assert(built.size() == 3);
    std::filesystem::remove_all(WORK_DIR);
    qr::log::ok("Test Passed: Build pool sharing.");
}

int main() {
    try {
        test_expand_command();
        test_successful_build();
        test_failed_build();
        test_build_pool();
    } catch (const std::exception& e) {
        qr::log::error("A test failed with an exception: " + std::string(e.what()));
        return 1;
    }

    qr::log::ok("All build tests passed!");
    return 0;
}
