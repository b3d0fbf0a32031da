#pragma once

/// @file result.hpp
/// @brief Result<T,E>: a value or an error, never both.

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace cgauth {

/// Outcome of a fallible operation.
///
/// The auth core reports every expected failure through this type; only
/// programming errors throw. The error type has no default so that each
/// layer names its own (see foundation::AuthResult).
///
/// Example:
/// @code
///   auto claims = issuer.verify(accessToken, TokenType::Access);
///   if (!claims) {
///       return Result<Principal, AuthError>::err(claims.error());
///   }
///   auto subject = claims.value().subject;
/// @endcode
template <typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Precondition: hasValue().
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Precondition: hasError().
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

    /// Transform the value, passing an error through untouched.
    template <typename F>
    auto map(F&& fn) && -> Result<std::invoke_result_t<F, T&&>, E> {
        using Next = Result<std::invoke_result_t<F, T&&>, E>;
        if (hasError()) {
            return Next::err(std::get<1>(std::move(data_)));
        }
        return Next::ok(std::forward<F>(fn)(std::get<0>(std::move(data_))));
    }

    /// Run a further fallible step on the value. @p fn returns a Result
    /// with the same error type; an error skips it.
    template <typename F>
    auto andThen(F&& fn) && -> std::invoke_result_t<F, T&&> {
        using Next = std::invoke_result_t<F, T&&>;
        if (hasError()) {
            return Next::err(std::get<1>(std::move(data_)));
        }
        return std::forward<F>(fn)(std::get<0>(std::move(data_)));
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

    // Indexed so that T and E may be the same type.
    std::variant<T, E> data_;
};

/// Success carries no value; only the error is stored.
template <typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool hasError() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Precondition: hasError().
    [[nodiscard]] const E& error() const& { return *error_; }
    [[nodiscard]] E& error() & { return *error_; }

private:
    Result() = default;
    explicit Result(E error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

}  // namespace cgauth
