#pragma once
#include <variant>
#include <utility>
#include <type_traits>
#include <stdexcept>
namespace shardvault {
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept = default;
};
inline constexpr Unit unit{};

/**
 * @brief Value-or-failure return type used by every fallible shardvault call.
 *
 * The active alternative of the variant is the state: index 0 holds the
 * value, index 1 the failure. T and E may be the same type.
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return value_.index() == 1; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<0>(value_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<0>(value_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<0>(std::move(value_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<1>(value_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<1>(value_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<1>(std::move(value_));
    }

    /// Translates the failure type, leaving an Ok value untouched
    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using Mapped = Result<T, std::invoke_result_t<F, E>>;
        if (IsErr()) {
            return Mapped::Err(std::forward<F>(func)(std::get<1>(std::move(value_))));
        }
        return Mapped::Ok(std::get<0>(std::move(value_)));
    }

private:
    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> idx, Arg&& arg)
        : value_(idx, std::forward<Arg>(arg)) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::logic_error("Unwrap() called on an Err result");
        }
    }
    void RequireErr() const {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() called on an Ok result");
        }
    }

    std::variant<T, E> value_;
};
}
