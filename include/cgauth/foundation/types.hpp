#pragma once

/// @file types.hpp
/// @brief Strong ID types and the injectable wall clock.

#include <chrono>
#include <cstdint>
#include <functional>

namespace cgauth::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Keeps user ids and session ids from being mixed up at compile time
/// while sharing the same underlying representation.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct UserIdTag {};
struct SessionIdTag {};

/// Identifier of a user account.
using UserId = StrongId<UserIdTag>;

/// Identifier of a persisted session.
using SessionId = StrongId<SessionIdTag>;

/// Wall-clock time point used for every persisted timestamp.
using Timestamp = std::chrono::system_clock::time_point;

/// Source of the current time. Components take one so tests can pin it.
using Clock = std::function<Timestamp()>;

/// Clock backed by std::chrono::system_clock.
inline Clock systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

/// Seconds since the Unix epoch.
inline int64_t toUnixSeconds(Timestamp tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(
        tp.time_since_epoch()).count();
}

} // namespace cgauth::foundation

template <typename Tag, typename T>
struct std::hash<cgauth::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const cgauth::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
