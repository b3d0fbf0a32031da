/// @file breach_checker.cpp
/// @brief BreachChecker implementation.

#include "cgauth/service/breach_checker.hpp"

#include "cgauth/foundation/auth_logger.hpp"

#include "crypto_utils.hpp"

#include <cctype>
#include <charconv>

namespace cgauth::service {

using cgauth::foundation::LogCategory;
using cgauth::foundation::LogContext;
using cgauth::foundation::LogLevel;

namespace {

constexpr std::size_t kPrefixLength = 5;

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // anonymous namespace

BreachChecker::BreachChecker(BreachCheckConfig config,
                             std::shared_ptr<IBreachRangeClient> client)
    : config_(config), client_(std::move(client)) {}

std::string BreachChecker::sha1Hex(std::string_view password) {
    auto digest = detail::sha1(password);
    return detail::toHex(digest, /*upper=*/true);
}

uint64_t BreachChecker::findSuffixCount(std::string_view body, std::string_view suffix) {
    std::size_t start = 0;
    while (start < body.size()) {
        auto end = body.find('\n', start);
        auto line = body.substr(start, end == std::string_view::npos ? std::string_view::npos
                                                                     : end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        auto colon = line.find(':');
        if (colon != std::string_view::npos && equalsIgnoreCase(line.substr(0, colon), suffix)) {
            auto countText = line.substr(colon + 1);
            uint64_t count = 0;
            auto [ptr, ec] = std::from_chars(countText.data(),
                                             countText.data() + countText.size(), count);
            return ec == std::errc{} ? count : 0;
        }

        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return 0;
}

std::optional<uint64_t> BreachChecker::breachCount(std::string_view password) const {
    if (!client_) {
        return std::nullopt;
    }
    auto hex = sha1Hex(password);
    auto prefix = hex.substr(0, kPrefixLength);
    auto suffix = std::string_view(hex).substr(kPrefixLength);

    auto body = client_->fetchRange(prefix, config_.timeout);
    if (!body) {
        LogContext ctx;
        ctx.extra["reason"] = std::string(body.error().message());
        CGAUTH_LOG_CTX(LogLevel::Warning, LogCategory::Breach,
                       "breach range service unavailable, skipping check", ctx);
        return std::nullopt;
    }
    return findSuffixCount(body.value(), suffix);
}

bool BreachChecker::exceedsThreshold(uint64_t count) const noexcept {
    return count > 0 && count >= config_.threshold;
}

}  // namespace cgauth::service
