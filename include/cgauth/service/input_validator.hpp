#pragma once

/// @file input_validator.hpp
/// @brief Registration and password-reset input rules.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cgauth::service {

/// Outcome of one validation rule. The message is user facing.
struct ValidationResult {
    bool valid;
    std::string message;

    explicit operator bool() const noexcept { return valid; }

    static ValidationResult ok() { return {true, {}}; }
    static ValidationResult fail(std::string msg) { return {false, std::move(msg)}; }
};

/// Stateless account input rules shared by registration and reset.
class InputValidator {
public:
    static constexpr std::size_t kMaxEmailLength = 160;
    static constexpr std::size_t kMinUsernameLength = 3;
    static constexpr std::size_t kMaxUsernameLength = 30;
    /// Longer inputs are refused, not truncated.
    static constexpr std::size_t kMaxPasswordLength = 72;

    /// Characters that satisfy the special-character rule.
    static constexpr std::string_view kPasswordSpecials = "!@#$%^&*(),.?\":{}|<>";

    /// Trim surrounding whitespace and lowercase.
    [[nodiscard]] static std::string normalizeEmail(std::string_view email);

    /// Shape check only: no whitespace, something before an '@', and a
    /// dot after at least one domain character with something after it.
    /// At most kMaxEmailLength characters.
    [[nodiscard]] static ValidationResult validateEmail(std::string_view email);

    /// 3 to 30 characters from [A-Za-z0-9_].
    [[nodiscard]] static ValidationResult validateUsername(std::string_view username);

    /// Length within [minLength, kMaxPasswordLength] plus one lowercase
    /// letter, one uppercase letter, one digit and one of kPasswordSpecials.
    [[nodiscard]] static ValidationResult validatePassword(std::string_view password,
                                                           uint32_t minLength);
};

}  // namespace cgauth::service
