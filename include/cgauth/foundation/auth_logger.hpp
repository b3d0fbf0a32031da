#pragma once

/// @file auth_logger.hpp
/// @brief AuthLogger wrapping the kcenon logger registry for structured,
///        per-category logging of the authentication core.
///
/// Secrets, passwords, second-factor codes and raw tokens must never be
/// passed to any of these functions.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "cgauth/foundation/auth_result.hpp"
#include "cgauth/foundation/types.hpp"

namespace cgauth::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per component.
enum class LogCategory : uint8_t {
    Core         = 0, ///< Facade, startup, shutdown
    Password     = 1, ///< Registration, login, password reset
    Wallet       = 2, ///< Challenge issue and signature verification
    SecondFactor = 3, ///< TOTP and backup codes
    Token        = 4, ///< Token minting and refresh
    Session      = 5, ///< Session lifecycle
    Storage      = 6, ///< Credential store backends
    Breach       = 7  ///< Password breach checks
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Password", "Wallet", "SecondFactor",
        "Token", "Session", "Storage", "Breach"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as written in configuration ("info", "WARNING").
/// Returns std::nullopt for unrecognized names.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.userId = user.id;
///   ctx.extra["ip"] = session.ipAddress;
///   logger.logWithContext(LogLevel::Info, LogCategory::Session,
///                         "session created", ctx);
/// @endcode
struct LogContext {
    std::optional<UserId> userId;
    std::optional<SessionId> sessionId;
    std::optional<std::string> correlationId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-filtered logger on top of kcenon's GlobalLoggerRegistry.
///
/// Each category resolves a named logger "cgauth.<Category>" and falls
/// back to the registry's default logger. PIMPL keeps kcenon headers out
/// of the public API.
///
/// Default levels: Debug for Breach, Info for every other category.
class AuthLogger {
public:
    AuthLogger();
    ~AuthLogger();

    AuthLogger(const AuthLogger&) = delete;
    AuthLogger& operator=(const AuthLogger&) = delete;
    AuthLogger(AuthLogger&&) noexcept;
    AuthLogger& operator=(AuthLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with context appended as "{key=val, ...}".
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    AuthResult<void> flush();

    static AuthLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Record an infrastructure fault and build the opaque error returned to
/// the caller.
///
/// The detail is logged at Error level together with a freshly generated
/// correlation id; the returned AuthError has code InternalError and a
/// message that only mentions that id.
AuthError internalFault(LogCategory cat, std::string_view detail,
                        LogContext ctx = {});

} // namespace cgauth::foundation

/// @name CGAUTH_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define CGAUTH_MIN_LOG_LEVEL before including this header to drop calls
/// below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef CGAUTH_MIN_LOG_LEVEL
    #define CGAUTH_MIN_LOG_LEVEL 0
#endif

#define CGAUTH_LOG(level, cat, msg)                                                 \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= CGAUTH_MIN_LOG_LEVEL &&                      \
            ::cgauth::foundation::AuthLogger::instance().isEnabled((level), (cat)))  \
        {                                                                           \
            ::cgauth::foundation::AuthLogger::instance().log((level), (cat), (msg)); \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define CGAUTH_LOG_CTX(level, cat, msg, ctx)                                        \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= CGAUTH_MIN_LOG_LEVEL &&                      \
            ::cgauth::foundation::AuthLogger::instance().isEnabled((level), (cat)))  \
        {                                                                           \
            ::cgauth::foundation::AuthLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                      \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define CGAUTH_LOG_DEBUG(cat, msg) \
    CGAUTH_LOG(::cgauth::foundation::LogLevel::Debug, (cat), (msg))

#define CGAUTH_LOG_INFO(cat, msg) \
    CGAUTH_LOG(::cgauth::foundation::LogLevel::Info, (cat), (msg))

#define CGAUTH_LOG_WARN(cat, msg) \
    CGAUTH_LOG(::cgauth::foundation::LogLevel::Warning, (cat), (msg))

#define CGAUTH_LOG_ERROR(cat, msg) \
    CGAUTH_LOG(::cgauth::foundation::LogLevel::Error, (cat), (msg))

/// @}
