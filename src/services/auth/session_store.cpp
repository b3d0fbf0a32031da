/// @file session_store.cpp
/// @brief InMemorySessionStore implementation.

#include "cgauth/service/session_store.hpp"

namespace cgauth::service {

SessionRecord InMemorySessionStore::insert(SessionRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    record.id = SessionId(nextId_++);
    byTokenHash_[record.tokenHash] = record.id;
    sessions_.emplace(record.id, record);
    return record;
}

std::optional<SessionRecord> InMemorySessionStore::findByTokenHash(
    std::string_view tokenHash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idx = byTokenHash_.find(std::string(tokenHash));
    if (idx == byTokenHash_.end()) {
        return std::nullopt;
    }
    auto it = sessions_.find(idx->second);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<SessionRecord> InMemorySessionStore::findById(SessionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemorySessionStore::touch(SessionId id, Timestamp at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return false;
    }
    it->second.lastActiveAt = at;
    return true;
}

bool InMemorySessionStore::revoke(SessionId id, Timestamp at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return false;
    }
    if (!it->second.revokedAt) {
        it->second.revokedAt = at;
    }
    return true;
}

std::size_t InMemorySessionStore::revokeAllForUser(UserId userId, Timestamp at) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (auto& [id, session] : sessions_) {
        if (session.userId == userId && !session.revokedAt) {
            session.revokedAt = at;
            ++count;
        }
    }
    return count;
}

std::vector<SessionRecord> InMemorySessionStore::listForUser(UserId userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionRecord> out;
    for (const auto& [id, session] : sessions_) {
        if (session.userId == userId) {
            out.push_back(session);
        }
    }
    return out;
}

}  // namespace cgauth::service
