//
// Created by cv2 on 10/19/26.
//

#include "libqr/build.h"
#include "libqr/logging.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace qr {

    static std::string read_log(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    // "dev-libs/foo:bar" -> "dev-libs_foo_bar"
    static std::string sanitize(const std::string& target) {
        std::string out = target;
        std::replace_if(out.begin(), out.end(), [](char c) {
            return !(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.' || c == '_');
        }, '_');
        return out.empty() ? "target" : out;
    }

    CommandBuildBackend::CommandBuildBackend(BuildConfig config, std::filesystem::path work_dir)
        : m_config(std::move(config)), m_work_dir(std::move(work_dir)) {}

    std::string CommandBuildBackend::expand_command(const std::string& command_template, const std::string& target,
                                                    const std::filesystem::path& output) {
        std::string cmd = command_template;
        const auto replace_all = [&cmd](const std::string& key, const std::string& value) {
            for (auto pos = cmd.find(key); pos != std::string::npos; pos = cmd.find(key, pos + value.size())) {
                cmd.replace(pos, key.size(), value);
            }
        };
        replace_all("{target}", target);
        replace_all("{output}", output.string());
        return cmd;
    }

    BuildResult CommandBuildBackend::build(const std::string& target) {
        BuildResult result;
        result.target = target;
        const auto started = std::chrono::steady_clock::now();
        const auto finish = [&]() -> BuildResult {
            result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            return result;
        };

        const auto dir = m_work_dir / sanitize(target);
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            result.stderr_log = "Cannot create build directory " + dir.string() + ": " + ec.message();
            return finish();
        }

        const auto output = dir / "out";
        const auto stdout_path = dir / "stdout.log";
        const auto stderr_path = dir / "stderr.log";
        const auto cmd = expand_command(m_config.command, target, output);
        log::debug("Building " + target + ": " + cmd);

        pid_t pid = fork();
        if (pid < 0) {
            result.stderr_log = std::string("fork failed: ") + std::strerror(errno);
            return finish();
        }

        if (pid == 0) {
            // Child process
            int out_fd = open(stdout_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
            int err_fd = open(stderr_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
            if (out_fd < 0 || err_fd < 0) {
                _exit(126);
            }
            dup2(out_fd, STDOUT_FILENO);
            dup2(err_fd, STDERR_FILENO);
            close(out_fd);
            close(err_fd);
            setpgid(0, 0);

            execl("/bin/sh", "sh", "-c", cmd.c_str(), nullptr);
            _exit(127);
        }

        // Parent process: poll so the timeout can be enforced.
        const auto deadline = started + m_config.timeout;
        int status = 0;
        bool timed_out = false;
        while (true) {
            pid_t done = waitpid(pid, &status, WNOHANG);
            if (done == pid) break;
            if (done < 0 && errno != EINTR) {
                result.stderr_log = std::string("waitpid failed: ") + std::strerror(errno);
                return finish();
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                kill(-pid, SIGKILL);
                kill(pid, SIGKILL);
                waitpid(pid, &status, 0);
                timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        result.stdout_log = read_log(stdout_path);
        result.stderr_log = read_log(stderr_path);

        if (timed_out) {
            result.stderr_log += "\nbuild of " + target + " timed out after " +
                                 std::to_string(m_config.timeout.count()) + "s";
            log::error("Build of " + target + " timed out");
            return finish();
        }

        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            log::error("Build of " + target + " failed with exit code " + std::to_string(code));
            return finish();
        }

        result.success = true;
        if (std::filesystem::exists(output, ec)) {
            result.output_path = output;
        }
        return finish();
    }

    // --- BuildPool ---

    namespace {
        // Returns the slot on every exit path of a build.
        struct SlotGuard {
            std::counting_semaphore<>& slots;
            explicit SlotGuard(std::counting_semaphore<>& s) : slots(s) { slots.acquire(); }
            ~SlotGuard() { slots.release(); }
        };
    }

    BuildPool::BuildPool(BuildBackend& backend, unsigned jobs)
        : m_backend(backend), m_slots(static_cast<std::ptrdiff_t>(std::max(jobs, 1u))) {}

    std::shared_future<BuildResult> BuildPool::submit(const std::string& target) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto it = m_builds.find(target); it != m_builds.end()) {
            return it->second;
        }

        auto future = std::async(std::launch::async, [this, target] {
            SlotGuard slot(m_slots);
            log::debug("Build started: " + target);
            auto result = m_backend.build(target);
            log::debug("Build finished: " + target + (result.success ? " (ok)" : " (failed)"));
            return result;
        }).share();
        m_builds.emplace(target, future);
        return future;
    }

    BuildResult BuildPool::wait(const std::string& target) {
        auto future = submit(target);
        try {
            return future.get();
        } catch (const std::exception& e) {
            BuildResult failed;
            failed.target = target;
            failed.stderr_log = e.what();
            return failed;
        }
    }

} // namespace qr
