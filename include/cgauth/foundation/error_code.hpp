#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the authentication core.

#include <cstdint>
#include <string_view>

namespace cgauth::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    InternalError = 0x0004,
    Unavailable = 0x0005,
    Timeout = 0x0006,

    // Auth (0x0100 - 0x01FF)
    InvalidCredentials = 0x0100,
    UserAlreadyExists = 0x0101,
    InvalidEmail = 0x0102,
    InvalidUsername = 0x0103,
    WeakPassword = 0x0104,
    BreachedPassword = 0x0105,
    AccountBanned = 0x0106,
    RateLimited = 0x0107,
    PasswordMismatch = 0x0108,
    SecondFactorRequired = 0x0109,

    // Wallet (0x0200 - 0x02FF)
    InvalidSignature = 0x0200,
    ChallengeNotFound = 0x0201,
    ChallengeExpired = 0x0202,

    // SecondFactor (0x0300 - 0x03FF)
    TotpNotEnabled = 0x0300,
    InvalidCode = 0x0301,
    AlreadyEnabled = 0x0302,
    NoBackupCodes = 0x0303,

    // Token (0x0400 - 0x04FF)
    TokenExpired = 0x0400,
    TokenWrongType = 0x0401,
    TokenMalformed = 0x0402,
    InvalidToken = 0x0403,
    TokenRevoked = 0x0404,

    // Session (0x0500 - 0x05FF)
    SessionNotFound = 0x0500,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,

    // Storage (0x0900 - 0x09FF)
    StoreConflict = 0x0900,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Auth";
        case 0x0200: return "Wallet";
        case 0x0300: return "SecondFactor";
        case 0x0400: return "Token";
        case 0x0500: return "Session";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        case 0x0900: return "Storage";
        default: return "Unknown";
    }
}

/// Stable snake_case identifier for an error code, used on the wire by
/// the transport layer that fronts this library.
constexpr std::string_view errorKind(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "success";
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::InternalError: return "internal_error";
        case ErrorCode::Unavailable: return "unavailable";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::InvalidCredentials: return "invalid_credentials";
        case ErrorCode::UserAlreadyExists: return "user_already_exists";
        case ErrorCode::InvalidEmail: return "invalid_email";
        case ErrorCode::InvalidUsername: return "invalid_username";
        case ErrorCode::WeakPassword: return "weak_password";
        case ErrorCode::BreachedPassword: return "breached_password";
        case ErrorCode::AccountBanned: return "account_banned";
        case ErrorCode::RateLimited: return "rate_limited";
        case ErrorCode::PasswordMismatch: return "password_mismatch";
        case ErrorCode::SecondFactorRequired: return "second_factor_required";
        case ErrorCode::InvalidSignature: return "invalid_signature";
        case ErrorCode::ChallengeNotFound: return "challenge_not_found";
        case ErrorCode::ChallengeExpired: return "challenge_expired";
        case ErrorCode::TotpNotEnabled: return "totp_not_enabled";
        case ErrorCode::InvalidCode: return "invalid_code";
        case ErrorCode::AlreadyEnabled: return "already_enabled";
        case ErrorCode::NoBackupCodes: return "no_backup_codes";
        case ErrorCode::TokenExpired: return "token_expired";
        case ErrorCode::TokenWrongType: return "token_wrong_type";
        case ErrorCode::TokenMalformed: return "token_malformed";
        case ErrorCode::InvalidToken: return "invalid_token";
        case ErrorCode::TokenRevoked: return "token_revoked";
        case ErrorCode::SessionNotFound: return "session_not_found";
        case ErrorCode::ConfigLoadFailed: return "config_load_failed";
        case ErrorCode::ConfigKeyNotFound: return "config_key_not_found";
        case ErrorCode::ConfigTypeMismatch: return "config_type_mismatch";
        case ErrorCode::ThreadError: return "thread_error";
        case ErrorCode::JobScheduleFailed: return "job_schedule_failed";
        case ErrorCode::JobNotFound: return "job_not_found";
        case ErrorCode::LoggerError: return "logger_error";
        case ErrorCode::LoggerFlushFailed: return "logger_flush_failed";
        case ErrorCode::StoreConflict: return "store_conflict";
    }
    return "unknown";
}

} // namespace cgauth::foundation
