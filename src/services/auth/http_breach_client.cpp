/// @file http_breach_client.cpp
/// @brief HttpBreachRangeClient on Boost.Beast with OpenSSL.

#include "cgauth/service/http_breach_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/ssl.h>

#include <cstdint>
#include <utility>

namespace cgauth::service {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

using cgauth::foundation::AuthResult;
using cgauth::foundation::ErrorCode;

namespace {

constexpr std::string_view kRangePath = "/range/";
constexpr std::size_t kPrefixLength = 5;
/// Padded range bodies stay well under this.
constexpr std::uint64_t kMaxBodyBytes = 2 * 1024 * 1024;

AuthResult<std::string> unavailable(std::string_view step, const beast::error_code& ec) {
    return foundation::fail<std::string>(
        ErrorCode::Unavailable, "breach range " + std::string(step) + " failed: " + ec.message());
}

}  // anonymous namespace

HttpBreachRangeClient::HttpBreachRangeClient(std::string host, std::string port)
    : host_(std::move(host)), port_(std::move(port)) {}

std::string HttpBreachRangeClient::rangeTarget(std::string_view prefix) {
    std::string target(kRangePath);
    target += prefix;
    return target;
}

bool HttpBreachRangeClient::isValidPrefix(std::string_view prefix) noexcept {
    if (prefix.size() != kPrefixLength) {
        return false;
    }
    for (char c : prefix) {
        if (!((c >= '0' && c <= '9') || (c >= 'A' && c <= 'F'))) {
            return false;
        }
    }
    return true;
}

AuthResult<std::string> HttpBreachRangeClient::interpretResponse(unsigned status,
                                                                 std::string body) {
    if (status == 200) {
        return AuthResult<std::string>::ok(std::move(body));
    }
    return foundation::fail<std::string>(
        ErrorCode::Unavailable, "breach range service returned HTTP " + std::to_string(status));
}

AuthResult<std::string> HttpBreachRangeClient::fetchRange(std::string_view prefix,
                                                          std::chrono::milliseconds timeout) {
    if (!isValidPrefix(prefix)) {
        return foundation::fail<std::string>(ErrorCode::InvalidArgument,
                                             "range prefix must be five uppercase hex digits");
    }

    net::io_context ioc;
    ssl::context tls(ssl::context::tls_client);
    beast::error_code ec;
    tls.set_default_verify_paths(ec);
    if (ec) {
        return unavailable("trust store", ec);
    }
    tls.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, tls);
    if (SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str()) != 1) {
        return foundation::fail<std::string>(ErrorCode::Unavailable,
                                             "breach range host name rejected for SNI");
    }
    stream.set_verify_callback(ssl::host_name_verification(host_));

    http::request<http::empty_body> request{http::verb::get, rangeTarget(prefix), 11};
    request.set(http::field::host, host_);
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set("Add-Padding", "true");

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxBodyBytes);

    tcp::resolver::results_type endpoints;
    std::string_view failedStep;
    beast::error_code failure;
    bool finished = false;
    auto finish = [&](std::string_view step, beast::error_code result) {
        failedStep = step;
        failure = result;
        finished = true;
    };

    // Socket operations time out on the stream; run_for also bounds resolution.
    beast::get_lowest_layer(stream).expires_after(timeout);
    resolver.async_resolve(host_, port_, [&](beast::error_code rc, tcp::resolver::results_type r) {
        if (rc) {
            return finish("resolve", rc);
        }
        endpoints = std::move(r);
        beast::get_lowest_layer(stream).async_connect(
            endpoints, [&](beast::error_code cc, const tcp::endpoint&) {
                if (cc) {
                    return finish("connect", cc);
                }
                stream.async_handshake(ssl::stream_base::client, [&](beast::error_code hc) {
                    if (hc) {
                        return finish("handshake", hc);
                    }
                    http::async_write(stream, request, [&](beast::error_code wc, std::size_t) {
                        if (wc) {
                            return finish("write", wc);
                        }
                        http::async_read(stream, buffer, parser,
                                         [&](beast::error_code rdc, std::size_t) {
                                             finish("read", rdc);
                                         });
                    });
                });
            });
    });
    ioc.run_for(timeout);

    if (!finished || failure == beast::error::timeout) {
        return foundation::fail<std::string>(
            ErrorCode::Timeout,
            "breach range request exceeded " + std::to_string(timeout.count()) + " ms");
    }
    if (failure) {
        return unavailable(failedStep, failure);
    }

    auto response = parser.release();
    return interpretResponse(response.result_int(), std::move(response.body()));
}

}  // namespace cgauth::service
