#pragma once
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
namespace xkwire::protocol {

struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};

/// Thrown by Unwrap()/UnwrapErr() on the wrong alternative. Carries the
/// failure message when the error type has one.
class BadResultAccess : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

namespace detail {
    template<typename E, typename = void>
    struct HasMessage : std::false_type {};

    template<typename E>
    struct HasMessage<E, std::void_t<decltype(std::declval<const E&>().message)>> : std::true_type {};

    template<typename E>
    std::string DescribeError(const E& error) {
        if constexpr (HasMessage<E>::value) {
            return ": " + std::string(error.message);
        } else if constexpr (std::is_convertible_v<const E&, std::string>) {
            return ": " + std::string(error);
        } else {
            return {};
        }
    }
}

/**
 * @brief Value-or-error return type used by every fallible operation
 *
 * Callers check IsOk()/IsErr() explicitly and propagate errors by hand.
 * Unwrap() on an Err is a programming error and throws BadResultAccess.
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result() = default;

    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }
    static Result FromOptional(std::optional<T> opt, E error_if_none) {
        if (opt.has_value()) {
            return Ok(std::move(*opt));
        }
        return Err(std::move(error_if_none));
    }

    [[nodiscard]] bool IsOk() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return value_.index() == 1; }

    [[nodiscard]] T& Unwrap() & {
        EnsureOk();
        return std::get<0>(value_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        EnsureOk();
        return std::get<0>(value_);
    }
    [[nodiscard]] T&& Unwrap() && {
        EnsureOk();
        return std::get<0>(std::move(value_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        EnsureErr();
        return std::get<1>(value_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        EnsureErr();
        return std::get<1>(value_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        EnsureErr();
        return std::get<1>(std::move(value_));
    }

    [[nodiscard]] T UnwrapOr(T default_value) && {
        if (IsOk()) {
            return std::get<0>(std::move(value_));
        }
        return default_value;
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::invoke(std::forward<F>(func), std::get<0>(std::move(value_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(value_)));
    }

    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using U = std::invoke_result_t<F, E>;
        if (IsErr()) {
            return Result<T, U>::Err(std::invoke(std::forward<F>(func), std::get<1>(std::move(value_))));
        }
        return Result<T, U>::Ok(std::get<0>(std::move(value_)));
    }

    /// Chain a step that itself returns Result<U, E>.
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using ResultType = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename ResultType::error_type, E>,
                      "Bind function must return Result with same error type");
        if (IsOk()) {
            return std::invoke(std::forward<F>(func), std::get<0>(std::move(value_)));
        }
        return ResultType::Err(std::get<1>(std::move(value_)));
    }

    template<typename F>
    Result& InspectErr(F&& func) & {
        if (IsErr()) {
            std::invoke(std::forward<F>(func), std::as_const(std::get<1>(value_)));
        }
        return *this;
    }

private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : value_(idx, std::forward<Args>(args)...) {}

    void EnsureOk() const {
        if (IsErr()) {
            throw BadResultAccess("Called Unwrap() on an Err Result" +
                                  detail::DescribeError(std::get<1>(value_)));
        }
    }

    void EnsureErr() const {
        if (IsOk()) {
            throw BadResultAccess("Called UnwrapErr() on an Ok Result");
        }
    }

    std::variant<T, E> value_;
};

}
