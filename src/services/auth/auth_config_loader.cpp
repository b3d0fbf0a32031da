/// @file auth_config_loader.cpp
/// @brief loadAuthConfig() and applyLogLevels().

#include "cgauth/service/auth_config_loader.hpp"

#include "cgauth/foundation/auth_logger.hpp"

#include <cstdint>
#include <string>

namespace cgauth::service {

using cgauth::foundation::AuthError;
using cgauth::foundation::AuthResult;
using cgauth::foundation::ConfigManager;
using cgauth::foundation::ErrorCode;

namespace {

/// Call @p apply with the value at @p key if present.
template <typename T, typename Apply>
AuthResult<void> read(const ConfigManager& config, std::string_view key, Apply&& apply) {
    auto value = config.get<T>(key);
    if (value) {
        apply(std::move(value).value());
        return AuthResult<void>::ok();
    }
    if (value.error().code() == ErrorCode::ConfigKeyNotFound) {
        return AuthResult<void>::ok();
    }
    return AuthResult<void>::err(value.error());
}

AuthResult<void> readSeconds(const ConfigManager& config, std::string_view key,
                             std::chrono::seconds& out) {
    return read<int64_t>(config, key, [&](int64_t v) { out = std::chrono::seconds(v); });
}

AuthResult<void> readString(const ConfigManager& config, std::string_view key,
                            std::string& out) {
    return read<std::string>(config, key, [&](std::string v) { out = std::move(v); });
}

AuthError badValue(std::string_view key, std::string_view value) {
    return AuthError(ErrorCode::ConfigTypeMismatch,
                     "unsupported value '" + std::string(value) + "' for " + std::string(key));
}

}  // anonymous namespace

AuthResult<AuthConfig> loadAuthConfig(const ConfigManager& config) {
    AuthConfig cfg;
    std::string algorithm = "HS256";
    std::string breachPolicy = "disabled";
    int64_t breachTimeoutMs = cfg.breach.timeout.count();

    AuthResult<void> steps[] = {
        // -- auth --
        readString(config, "auth.jwt_algorithm", algorithm),
        readString(config, "auth.signing_key", cfg.token.signingKey),
        readString(config, "auth.rsa_private_key_pem", cfg.token.rsaPrivateKeyPem),
        readString(config, "auth.rsa_public_key_pem", cfg.token.rsaPublicKeyPem),
        readString(config, "auth.issuer", cfg.token.issuer),
        readSeconds(config, "auth.access_token_expiry_seconds", cfg.token.accessTokenTtl),
        readSeconds(config, "auth.refresh_token_expiry_seconds", cfg.token.refreshTokenTtl),
        readSeconds(config, "auth.second_factor_token_expiry_seconds",
                    cfg.token.secondFactorTokenTtl),
        readSeconds(config, "auth.blacklist_cleanup_interval_seconds",
                    cfg.token.blacklistCleanupInterval),
        read<uint32_t>(config, "auth.min_password_length",
                       [&](uint32_t v) { cfg.password.minPasswordLength = v; }),

        // -- wallet --
        readString(config, "wallet.app_name", cfg.wallet.appName),
        readSeconds(config, "wallet.challenge_ttl_seconds", cfg.wallet.challengeTtl),

        // -- second_factor --
        readString(config, "second_factor.issuer", cfg.secondFactor.issuer),
        readString(config, "second_factor.encryption_key", cfg.secondFactor.encryptionKey),
        read<std::size_t>(config, "second_factor.backup_code_count",
                          [&](std::size_t v) { cfg.secondFactor.backupCodeCount = v; }),
        read<int>(config, "second_factor.drift_steps",
                  [&](int v) { cfg.secondFactor.driftSteps = v; }),
        read<int>(config, "second_factor.max_write_retries",
                  [&](int v) { cfg.secondFactor.maxWriteRetries = v; }),
        read<uint32_t>(config, "second_factor.max_login_attempts",
                       [&](uint32_t v) { cfg.secondFactor.maxLoginAttempts = v; }),

        // -- session --
        readSeconds(config, "session.ttl_seconds", cfg.session.ttl),

        // -- breach_check --
        readString(config, "breach_check.policy", breachPolicy),
        read<uint64_t>(config, "breach_check.threshold",
                       [&](uint64_t v) { cfg.breach.threshold = v; }),
        readString(config, "breach_check.host", cfg.breach.host),
        readString(config, "breach_check.port", cfg.breach.port),
        read<int64_t>(config, "breach_check.timeout_ms",
                      [&](int64_t v) { breachTimeoutMs = v; }),
        readSeconds(config, "breach_check.finding_log_cooldown_seconds",
                    cfg.breach.findingLogCooldown),

        // -- password_reset --
        readSeconds(config, "password_reset.token_ttl_seconds", cfg.password.resetTokenTtl),
        readSeconds(config, "password_reset.resend_cooldown_seconds",
                    cfg.password.resetResendCooldown),
    };
    for (auto& step : steps) {
        if (!step) {
            return AuthResult<AuthConfig>::err(step.error());
        }
    }

    if (algorithm == "HS256") {
        cfg.token.algorithm = JwtAlgorithm::HS256;
    } else if (algorithm == "RS256") {
        cfg.token.algorithm = JwtAlgorithm::RS256;
    } else {
        return AuthResult<AuthConfig>::err(badValue("auth.jwt_algorithm", algorithm));
    }

    if (breachPolicy == "disabled") {
        cfg.breach.policy = BreachPolicy::Disabled;
    } else if (breachPolicy == "background") {
        cfg.breach.policy = BreachPolicy::Background;
    } else if (breachPolicy == "reject") {
        cfg.breach.policy = BreachPolicy::Reject;
    } else {
        return AuthResult<AuthConfig>::err(badValue("breach_check.policy", breachPolicy));
    }
    cfg.breach.timeout = std::chrono::milliseconds(breachTimeoutMs);

    return AuthResult<AuthConfig>::ok(std::move(cfg));
}

AuthResult<void> applyLogLevels(const ConfigManager& config) {
    using foundation::AuthLogger;
    using foundation::LogCategory;
    using foundation::LogLevel;

    auto& logger = AuthLogger::instance();

    auto apply = [&](std::string_view key, auto&& setter) -> AuthResult<void> {
        auto name = config.get<std::string>(key);
        if (!name) {
            if (name.error().code() == ErrorCode::ConfigKeyNotFound) {
                return AuthResult<void>::ok();
            }
            return AuthResult<void>::err(name.error());
        }
        auto level = foundation::parseLogLevel(name.value());
        if (!level) {
            return AuthResult<void>::err(badValue(key, name.value()));
        }
        setter(*level);
        return AuthResult<void>::ok();
    };

    auto defaults = apply("logging.default_level", [&](LogLevel level) {
        for (std::size_t i = 0; i < foundation::kLogCategoryCount; ++i) {
            logger.setCategoryLevel(static_cast<LogCategory>(i), level);
        }
    });
    if (!defaults) {
        return defaults;
    }

    for (std::size_t i = 0; i < foundation::kLogCategoryCount; ++i) {
        auto category = static_cast<LogCategory>(i);
        auto key = "logging.levels." + std::string(foundation::logCategoryName(category));
        auto applied = apply(key, [&](LogLevel level) { logger.setCategoryLevel(category, level); });
        if (!applied) {
            return applied;
        }
    }
    return AuthResult<void>::ok();
}

}  // namespace cgauth::service
