#pragma once

/// @file service_runner.hpp
/// @brief Process plumbing for the auth_service executable.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace cgauth::service {

/// Process-wide SIGINT/SIGTERM flag.
///
/// Create one per process. Destruction restores the default handlers, so a
/// second signal during shutdown kills the process.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Sleep in steps of @p tick until shutdown is requested, running
    /// @p onTick after every step.
    void waitForShutdown(std::chrono::milliseconds tick,
                         const std::function<void()>& onTick = {}) const;

    static void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Named teardown steps run once, in registration order.
///
/// A step that throws is logged; the remaining steps still run.
class GracefulShutdown {
public:
    void addHook(std::string name, std::function<void()> hook);

    /// @return Number of hooks that failed.
    std::size_t execute();

private:
    struct Hook {
        std::string name;
        std::function<void()> run;
    };
    std::vector<Hook> hooks_;
};

/// Pick the configuration file: `--config <path>` or `--config=<path>`,
/// then CGAUTH_CONFIG_PATH, then @p fallback.
[[nodiscard]] std::filesystem::path resolveConfigPath(int argc, const char* const argv[],
                                                      const std::filesystem::path& fallback);

}  // namespace cgauth::service
