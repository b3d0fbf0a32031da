#pragma once

/// @file breach_checker.hpp
/// @brief k-anonymity password breach lookup (SHA-1 range queries).
///
/// Only the first five hex characters of SHA-1(password) leave the process;
/// the range response ("SUFFIX:COUNT" lines) is matched locally.

#include "cgauth/foundation/auth_result.hpp"
#include "cgauth/service/auth_types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace cgauth::service {

/// Transport for range queries, e.g. an HTTP client for a
/// "range/<prefix>" endpoint. Implementations must honour @p timeout.
class IBreachRangeClient {
public:
    virtual ~IBreachRangeClient() = default;

    /// Fetch the body listing all known hash suffixes for @p prefix
    /// (five uppercase hex characters).
    virtual foundation::AuthResult<std::string> fetchRange(
        std::string_view prefix, std::chrono::milliseconds timeout) = 0;
};

/// Best-effort breach check. Unavailability never blocks the caller:
/// breachCount() simply returns std::nullopt.
class BreachChecker {
public:
    BreachChecker(BreachCheckConfig config, std::shared_ptr<IBreachRangeClient> client);

    /// Number of times @p password appears in the corpus, 0 if absent,
    /// or std::nullopt if the range service could not be reached.
    [[nodiscard]] std::optional<uint64_t> breachCount(std::string_view password) const;

    /// True if @p count meets the configured threshold.
    [[nodiscard]] bool exceedsThreshold(uint64_t count) const noexcept;

    [[nodiscard]] const BreachCheckConfig& config() const noexcept { return config_; }

    /// Uppercase hex SHA-1 of @p password.
    [[nodiscard]] static std::string sha1Hex(std::string_view password);

    /// Count for @p suffix in a range body; 0 if the suffix is not listed.
    /// Lines are "SUFFIX:COUNT" separated by CRLF or LF; suffix case is ignored.
    [[nodiscard]] static uint64_t findSuffixCount(std::string_view body,
                                                  std::string_view suffix);

private:
    BreachCheckConfig config_;
    std::shared_ptr<IBreachRangeClient> client_;
};

}  // namespace cgauth::service
