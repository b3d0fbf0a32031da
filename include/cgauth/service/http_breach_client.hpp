#pragma once

/// @file http_breach_client.hpp
/// @brief HTTPS range client for the breach corpus service.

#include "cgauth/foundation/auth_result.hpp"
#include "cgauth/service/breach_checker.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace cgauth::service {

/// IBreachRangeClient over HTTPS (Boost.Beast on Asio SSL).
///
/// Each call opens one TLS connection with certificate and host name
/// verification, sends GET /range/<prefix> with response padding on and
/// reads one response. Resolution, connect, handshake, write and read
/// together must finish within the timeout; anything else is Unavailable.
///
/// Example:
/// @code
///   auto client = std::make_shared<HttpBreachRangeClient>("api.pwnedpasswords.com");
///   auto body = client->fetchRange("21BD1", std::chrono::milliseconds{2000});
/// @endcode
class HttpBreachRangeClient : public IBreachRangeClient {
public:
    explicit HttpBreachRangeClient(std::string host, std::string port = "443");

    foundation::AuthResult<std::string> fetchRange(std::string_view prefix,
                                                   std::chrono::milliseconds timeout) override;

    /// Request target for @p prefix.
    [[nodiscard]] static std::string rangeTarget(std::string_view prefix);

    /// Five uppercase hex characters.
    [[nodiscard]] static bool isValidPrefix(std::string_view prefix) noexcept;

    /// Map an HTTP status and body to the fetch result.
    [[nodiscard]] static foundation::AuthResult<std::string> interpretResponse(
        unsigned status, std::string body);

    [[nodiscard]] const std::string& host() const noexcept { return host_; }

private:
    std::string host_;
    std::string port_;
};

}  // namespace cgauth::service
