//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "config.h"

#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <semaphore>
#include <string>

namespace qr {

    struct BuildResult {
        std::string target;
        bool success = false;
        // A directory tree or an archive; empty when the build produced nothing.
        std::optional<std::filesystem::path> output_path;
        std::chrono::milliseconds duration{0};
        std::string stdout_log;
        std::string stderr_log;
    };

    // Turns a build target into an artifact. Implementations must allow
    // concurrent calls for different targets.
    class BuildBackend {
    public:
        virtual ~BuildBackend() = default;
        virtual BuildResult build(const std::string& target) = 0;
    };

    // Runs the configured command template through /bin/sh.
    class CommandBuildBackend : public BuildBackend {
    public:
        CommandBuildBackend(BuildConfig config, std::filesystem::path work_dir);

        BuildResult build(const std::string& target) override;

        // {target} and {output} replaced, every occurrence.
        static std::string expand_command(const std::string& command_template, const std::string& target,
                                          const std::filesystem::path& output);

    private:
        BuildConfig m_config;
        std::filesystem::path m_work_dir;
    };

    // Asynchronous builds, at most `jobs` running at once. A target submitted
    // twice shares the first build.
    class BuildPool {
    public:
        BuildPool(BuildBackend& backend, unsigned jobs);
        ~BuildPool() = default;

        BuildPool(const BuildPool&) = delete;
        BuildPool& operator=(const BuildPool&) = delete;

        std::shared_future<BuildResult> submit(const std::string& target);

        // Blocks until the build of `target` finished, submitting it if needed.
        // An exception escaping the backend becomes a failed result.
        BuildResult wait(const std::string& target);

    private:
        BuildBackend& m_backend;
        std::counting_semaphore<> m_slots;
        std::mutex m_mutex;
        std::map<std::string, std::shared_future<BuildResult>> m_builds;
    };

} // namespace qr
