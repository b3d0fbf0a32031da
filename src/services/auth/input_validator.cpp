/// @file input_validator.cpp
/// @brief InputValidator rules.

#include "cgauth/service/input_validator.hpp"

#include <algorithm>
#include <cctype>

namespace cgauth::service {

namespace {

constexpr std::string_view kTrimmed = " \t\r\n";

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

template <typename Pred>
bool containsAny(std::string_view s, Pred pred) {
    return std::any_of(s.begin(), s.end(), pred);
}

}  // anonymous namespace

std::string InputValidator::normalizeEmail(std::string_view email) {
    auto first = email.find_first_not_of(kTrimmed);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = email.find_last_not_of(kTrimmed);
    std::string out(email.substr(first, last - first + 1));
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

ValidationResult InputValidator::validateEmail(std::string_view email) {
    if (email.size() > kMaxEmailLength) {
        return ValidationResult::fail("email must be at most " +
                                      std::to_string(kMaxEmailLength) + " characters");
    }
    if (containsAny(email, isSpace)) {
        return ValidationResult::fail("must be a valid email address");
    }

    // The earliest usable '@' and the latest usable '.' give the widest split.
    if (email.size() < 5) {
        return ValidationResult::fail("must be a valid email address");
    }
    auto at = email.find('@', 1);
    auto dot = email.rfind('.', email.size() - 2);
    if (at == std::string_view::npos || dot == std::string_view::npos || dot < at + 2) {
        return ValidationResult::fail("must be a valid email address");
    }
    return ValidationResult::ok();
}

ValidationResult InputValidator::validateUsername(std::string_view username) {
    if (username.size() < kMinUsernameLength || username.size() > kMaxUsernameLength) {
        return ValidationResult::fail("username must be between " +
                                      std::to_string(kMinUsernameLength) + " and " +
                                      std::to_string(kMaxUsernameLength) + " characters");
    }
    bool allowed = std::all_of(username.begin(), username.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    });
    if (!allowed) {
        return ValidationResult::fail("username may only contain letters, numbers and underscores");
    }
    return ValidationResult::ok();
}

ValidationResult InputValidator::validatePassword(std::string_view password,
                                                  uint32_t minLength) {
    if (password.size() < minLength) {
        return ValidationResult::fail("password must be at least " + std::to_string(minLength) +
                                      " characters");
    }
    if (password.size() > kMaxPasswordLength) {
        return ValidationResult::fail("password must be at most " +
                                      std::to_string(kMaxPasswordLength) + " characters");
    }

    if (!containsAny(password, [](char c) { return c >= 'a' && c <= 'z'; })) {
        return ValidationResult::fail("password must contain at least one lowercase letter");
    }
    if (!containsAny(password, [](char c) { return c >= 'A' && c <= 'Z'; })) {
        return ValidationResult::fail("password must contain at least one uppercase letter");
    }
    if (!containsAny(password, [](char c) { return c >= '0' && c <= '9'; })) {
        return ValidationResult::fail("password must contain at least one number");
    }
    if (!containsAny(password, [](char c) {
            return kPasswordSpecials.find(c) != std::string_view::npos;
        })) {
        return ValidationResult::fail("password must contain at least one special character");
    }
    return ValidationResult::ok();
}

}  // namespace cgauth::service
