/// @file session_registry.cpp
/// @brief SessionRegistry implementation.

#include "cgauth/service/session_registry.hpp"

#include "cgauth/foundation/auth_logger.hpp"
#include "cgauth/service/session_store.hpp"

#include "crypto_utils.hpp"

#include <algorithm>

namespace cgauth::service {

using cgauth::foundation::AuthError;
using cgauth::foundation::AuthResult;
using cgauth::foundation::ErrorCode;
using cgauth::foundation::LogCategory;
using cgauth::foundation::LogContext;
using cgauth::foundation::LogLevel;

namespace {

constexpr std::size_t kRawTokenBytes = 32;
constexpr std::size_t kMaxUserAgentLength = 512;

std::string_view trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

AuthError sessionNotFound() {
    return AuthError(ErrorCode::SessionNotFound, "session not found");
}

}  // anonymous namespace

SessionRegistry::SessionRegistry(SessionConfig config,
                                 std::shared_ptr<ISessionStore> store,
                                 foundation::Clock clock)
    : config_(config), store_(std::move(store)), clock_(std::move(clock)) {}

std::string SessionRegistry::clientIp(const SessionContext& context) {
    if (context.forwardedFor) {
        std::string_view header = *context.forwardedFor;
        auto first = trim(header.substr(0, header.find(',')));
        if (!first.empty()) {
            return std::string(first);
        }
    }
    if (context.remoteAddress && !trim(*context.remoteAddress).empty()) {
        return std::string(trim(*context.remoteAddress));
    }
    return "127.0.0.1";
}

AuthResult<IssuedSession> SessionRegistry::create(UserId userId,
                                                  const SessionContext& context) {
    auto raw = detail::secureRandomBytes(kRawTokenBytes);
    if (!raw) {
        return AuthResult<IssuedSession>::err(
            foundation::internalFault(LogCategory::Session, "CSPRNG unavailable for session token"));
    }
    auto rawToken = detail::base64urlEncode(raw->data(), raw->size());

    auto now = clock_();
    SessionRecord record;
    record.userId = userId;
    record.tokenHash = detail::hashToken(rawToken);
    record.userAgent = context.userAgent.substr(0, kMaxUserAgentLength);
    record.ipAddress = clientIp(context);
    record.createdAt = now;
    record.lastActiveAt = now;
    record.expiresAt = now + config_.ttl;

    IssuedSession issued;
    issued.session = store_->insert(std::move(record));
    issued.rawToken = std::move(rawToken);

    LogContext ctx;
    ctx.userId = userId;
    ctx.sessionId = issued.session.id;
    ctx.extra["ip"] = issued.session.ipAddress;
    CGAUTH_LOG_CTX(LogLevel::Info, LogCategory::Session, "session created", ctx);
    return AuthResult<IssuedSession>::ok(std::move(issued));
}

AuthResult<SessionRecord> SessionRegistry::resolve(std::string_view rawToken) {
    if (rawToken.empty()) {
        return AuthResult<SessionRecord>::err(sessionNotFound());
    }
    auto found = store_->findByTokenHash(detail::hashToken(rawToken));
    auto now = clock_();
    if (!found || !found->isActiveAt(now)) {
        return AuthResult<SessionRecord>::err(sessionNotFound());
    }
    if (store_->touch(found->id, now)) {
        found->lastActiveAt = now;
    }
    return AuthResult<SessionRecord>::ok(std::move(*found));
}

AuthResult<void> SessionRegistry::revoke(SessionId sessionId) {
    if (!store_->revoke(sessionId, clock_())) {
        return AuthResult<void>::err(sessionNotFound());
    }
    return AuthResult<void>::ok();
}

AuthResult<void> SessionRegistry::revokeForUser(UserId userId, SessionId sessionId) {
    auto found = store_->findById(sessionId);
    if (!found || found->userId != userId) {
        return AuthResult<void>::err(sessionNotFound());
    }
    return revoke(sessionId);
}

std::size_t SessionRegistry::revokeAll(UserId userId) {
    auto count = store_->revokeAllForUser(userId, clock_());
    LogContext ctx;
    ctx.userId = userId;
    ctx.extra["count"] = std::to_string(count);
    CGAUTH_LOG_CTX(LogLevel::Info, LogCategory::Session, "sessions revoked", ctx);
    return count;
}

std::vector<SessionRecord> SessionRegistry::listActive(UserId userId) const {
    auto now = clock_();
    auto sessions = store_->listForUser(userId);
    sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                  [&](const SessionRecord& s) { return !s.isActiveAt(now); }),
                   sessions.end());
    std::sort(sessions.begin(), sessions.end(),
              [](const SessionRecord& a, const SessionRecord& b) {
                  if (a.lastActiveAt != b.lastActiveAt) {
                      return a.lastActiveAt > b.lastActiveAt;
                  }
                  return a.id > b.id;
              });
    return sessions;
}

}  // namespace cgauth::service
