/// @file auth_logger.cpp
/// @brief AuthLogger implementation on top of kcenon's logger registry.

#include "cgauth/foundation/auth_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <random>
#include <sstream>
#include <string>

namespace cgauth::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "WARN") {
        return LogLevel::Warning;
    }
    for (uint8_t i = 0; i <= static_cast<uint8_t>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (logLevelName(level) == upper) {
            return level;
        }
    }
    return std::nullopt;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // Password
    LogLevel::Info,   // Wallet
    LogLevel::Info,   // SecondFactor
    LogLevel::Info,   // Token
    LogLevel::Info,   // Session
    LogLevel::Info,   // Storage
    LogLevel::Debug   // Breach
};

// ---------------------------------------------------------------------------
// Context serialization
// ---------------------------------------------------------------------------
static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.userId && ctx.userId->isValid()) {
        append("user_id", std::to_string(ctx.userId->value()));
    }
    if (ctx.sessionId && ctx.sessionId->isValid()) {
        append("session_id", std::to_string(ctx.sessionId->value()));
    }
    if (ctx.correlationId && !ctx.correlationId->empty()) {
        append("correlation_id", *ctx.correlationId);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct AuthLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("cgauth.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        // Unregistered names resolve to a NullLogger, which reports every
        // level as disabled; route those through the default logger.
        if (!logger->is_enabled(kci::log_level::off)) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              std::string_view ctxStr) const {
        // Format: [Category] message {key=val, ...}
        std::string formatted;
        formatted.reserve(msg.size() + ctxStr.size() + 24);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctxStr.empty()) {
            formatted += " {";
            formatted += ctxStr;
            formatted += '}';
        }
        // A failing sink must not turn into an auth failure.
        auto result = getLogger(cat)->log(mapLevel(level), formatted);
        if (result.is_err()) {
            std::fprintf(stderr, "%s\n", formatted.c_str());
        }
    }
};

AuthLogger::AuthLogger() : impl_(std::make_unique<Impl>()) {}

AuthLogger::~AuthLogger() = default;

AuthLogger::AuthLogger(AuthLogger&&) noexcept = default;
AuthLogger& AuthLogger::operator=(AuthLogger&&) noexcept = default;

void AuthLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, {});
}

void AuthLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, formatContext(ctx));
}

// ---------------------------------------------------------------------------
// Category level control
// ---------------------------------------------------------------------------
void AuthLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel AuthLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool AuthLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

AuthResult<void> AuthLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto result = registry.get_default_logger()->flush();
    if (result.is_err()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return AuthResult<void>::ok();
}

AuthLogger& AuthLogger::instance() {
    static AuthLogger inst;
    return inst;
}

// ---------------------------------------------------------------------------
// Internal faults
// ---------------------------------------------------------------------------
static std::string nextCorrelationId() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};
    static std::atomic<uint32_t> sequence{0};

    uint64_t bits = 0;
    {
        std::lock_guard lock(mutex);
        bits = engine();
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%012llx-%04x",
                  static_cast<unsigned long long>(bits & 0xFFFFFFFFFFFFULL),
                  sequence.fetch_add(1, std::memory_order_relaxed) & 0xFFFFU);
    return buf;
}

AuthError internalFault(LogCategory cat, std::string_view detail,
                        LogContext ctx) {
    auto id = nextCorrelationId();
    ctx.correlationId = id;
    AuthLogger::instance().logWithContext(LogLevel::Error, cat, detail, ctx);
    return AuthError(ErrorCode::InternalError,
                     "internal error (ref " + id + ")", id);
}

} // namespace cgauth::foundation
