/// @file main.cpp
/// @brief Auth service entry point.
///
/// Builds an AuthService with in-memory storage backends from a YAML
/// configuration file and runs until SIGINT or SIGTERM.

#include "cgauth/foundation/auth_logger.hpp"
#include "cgauth/foundation/config_manager.hpp"
#include "cgauth/foundation/job_scheduler.hpp"
#include "cgauth/service/auth_config_loader.hpp"
#include "cgauth/service/auth_service.hpp"
#include "cgauth/service/http_breach_client.hpp"
#include "cgauth/service/service_runner.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>

namespace {

constexpr std::size_t kBackgroundThreads = 2;
constexpr auto kDrainTimeout = std::chrono::seconds(5);

}  // namespace

int main(int argc, char* argv[]) {
    using cgauth::foundation::LogCategory;

    cgauth::service::SignalHandler signals;

    cgauth::foundation::ConfigManager config;
    auto configPath =
        cgauth::service::resolveConfigPath(argc, argv, "/etc/cgauth/config.yaml");
    if (auto loadResult = config.load(configPath); !loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    if (auto levels = cgauth::service::applyLogLevels(config); !levels) {
        std::cerr << "Invalid logging config: " << levels.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto authConfig = cgauth::service::loadAuthConfig(config);
    if (!authConfig) {
        std::cerr << "Invalid auth config: " << authConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }
    if (auto valid = cgauth::service::AuthService::validateConfig(authConfig.value()); !valid) {
        std::cerr << "Invalid auth config: " << valid.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto scheduler = std::make_shared<cgauth::foundation::JobScheduler>(kBackgroundThreads);

    // In-memory backends for standalone development mode.
    auto backends = cgauth::service::AuthBackends::inMemory();
    backends.scheduler = scheduler;
    const auto& breach = authConfig.value().breach;
    if (breach.policy != cgauth::service::BreachPolicy::Disabled) {
        backends.breachClient =
            std::make_shared<cgauth::service::HttpBreachRangeClient>(breach.host, breach.port);
    }

    cgauth::service::AuthService service(authConfig.value(), std::move(backends));

    cgauth::service::GracefulShutdown shutdown;
    shutdown.addHook("drain", [&]() {
        if (!scheduler->drain(kDrainTimeout)) {
            CGAUTH_LOG_WARN(LogCategory::Core, "background jobs still running at shutdown");
        }
        scheduler->shutdown();
    });
    shutdown.addHook("flush", []() { cgauth::foundation::AuthLogger::instance().flush(); });

    CGAUTH_LOG_INFO(LogCategory::Core, "auth service started");
    std::cout << "Auth service started\n";

    auto cleanupInterval = authConfig.value().token.blacklistCleanupInterval;
    auto lastCleanup = std::chrono::steady_clock::now();
    signals.waitForShutdown(std::chrono::seconds(1), [&]() {
        auto now = std::chrono::steady_clock::now();
        if (now - lastCleanup >= cleanupInterval) {
            service.runMaintenance();
            lastCleanup = now;
        }
    });

    CGAUTH_LOG_INFO(LogCategory::Core, "auth service stopping");
    if (auto failed = shutdown.execute(); failed > 0) {
        std::cerr << failed << " shutdown hook(s) failed\n";
    }
    std::cout << "Auth service stopped\n";
    return EXIT_SUCCESS;
}
