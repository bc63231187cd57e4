#pragma once
#include <cstddef>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace vortex::protocol {

/// Value of a Result that carries nothing on success.
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};

/**
 * @brief Success value or error, returned by every fallible operation
 *
 * Unwrap() and UnwrapErr() throw std::logic_error when called on the wrong
 * alternative; callers check IsOk()/IsErr() first. The rvalue overloads move
 * the payload out, which is how move-only key pairs leave a Result.
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) {
        return Result(std::in_place_index<kOk>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<kErr>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return value_.index() == kOk; }
    [[nodiscard]] bool IsErr() const noexcept { return value_.index() == kErr; }

    [[nodiscard]] T& Unwrap() & {
        Expect(kOk);
        return std::get<kOk>(value_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        Expect(kOk);
        return std::get<kOk>(value_);
    }
    [[nodiscard]] T&& Unwrap() && {
        Expect(kOk);
        return std::get<kOk>(std::move(value_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        Expect(kErr);
        return std::get<kErr>(value_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        Expect(kErr);
        return std::get<kErr>(value_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        Expect(kErr);
        return std::get<kErr>(std::move(value_));
    }

    /// Applies @p func to the success value; an error passes through untouched.
    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using Mapped = Result<std::invoke_result_t<F, T>, E>;
        if (IsErr()) {
            return Mapped::Err(std::get<kErr>(std::move(value_)));
        }
        return Mapped::Ok(std::forward<F>(func)(std::get<kOk>(std::move(value_))));
    }

private:
    static constexpr std::size_t kOk = 0;
    static constexpr std::size_t kErr = 1;

    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> index, Arg&& arg)
        : value_(index, std::forward<Arg>(arg)) {}

    void Expect(std::size_t alternative) const {
        if (value_.index() != alternative) {
            throw std::logic_error(alternative == kOk
                                       ? "Unwrap() called on an Err result"
                                       : "UnwrapErr() called on an Ok result");
        }
    }

    std::variant<T, E> value_;
};

}
