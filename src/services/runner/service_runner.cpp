/// @file service_runner.cpp
/// @brief Signal flag, shutdown hooks and config path resolution.

#include "cgauth/service/service_runner.hpp"

#include "cgauth/foundation/auth_logger.hpp"

#include <csignal>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <thread>

namespace cgauth::service {

using cgauth::foundation::LogCategory;
using cgauth::foundation::LogContext;
using cgauth::foundation::LogLevel;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // Lock-free atomic store is async-signal-safe.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown(std::chrono::milliseconds tick,
                                    const std::function<void()>& onTick) const {
    while (!shutdownRequested()) {
        std::this_thread::sleep_for(tick);
        if (onTick) {
            onTick();
        }
    }
}

// -- GracefulShutdown --------------------------------------------------------

void GracefulShutdown::addHook(std::string name, std::function<void()> hook) {
    hooks_.push_back({std::move(name), std::move(hook)});
}

std::size_t GracefulShutdown::execute() {
    std::size_t failed = 0;
    auto hooks = std::move(hooks_);
    hooks_.clear();

    for (auto& hook : hooks) {
        LogContext ctx;
        ctx.extra["hook"] = hook.name;
        try {
            hook.run();
            CGAUTH_LOG_CTX(LogLevel::Debug, LogCategory::Core, "shutdown hook done", ctx);
        } catch (const std::exception& e) {
            ++failed;
            ctx.extra["what"] = e.what();
            CGAUTH_LOG_CTX(LogLevel::Error, LogCategory::Core, "shutdown hook failed", ctx);
        }
    }
    return failed;
}

// -- Config path --------------------------------------------------------------

std::filesystem::path resolveConfigPath(int argc, const char* const argv[],
                                        const std::filesystem::path& fallback) {
    constexpr std::string_view kFlag = "--config";

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == kFlag && i + 1 < argc) {
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
        if (arg.size() > kFlag.size() && arg.starts_with(kFlag) && arg[kFlag.size()] == '=') {
            return std::filesystem::path(arg.substr(kFlag.size() + 1));
        }
    }

    if (const char* env = std::getenv("CGAUTH_CONFIG_PATH"); env != nullptr && *env != '\0') {
        return env;
    }
    return fallback;
}

}  // namespace cgauth::service
