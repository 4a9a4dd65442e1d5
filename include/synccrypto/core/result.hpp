#pragma once
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
namespace synccrypto {
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
};
inline constexpr Unit unit{};
/**
 * @brief Value-or-failure return type used by every fallible operation
 *
 * Holds either a T (Ok) or an E (Err). Unwrapping the wrong side throws
 * std::logic_error; callers check IsOk()/IsErr() first.
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
    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == kOk; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == kErr; }
    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<kOk>(storage_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<kOk>(storage_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<kOk>(std::move(storage_));
    }
    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<kErr>(storage_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<kErr>(storage_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<kErr>(std::move(storage_));
    }
    // Re-labels the failure, leaves an Ok value untouched
    template<typename F>
    [[nodiscard]] auto MapErr(F&& relabel) && -> Result<T, std::invoke_result_t<F, E>> {
        using Mapped = Result<T, std::invoke_result_t<F, E>>;
        if (IsOk()) {
            return Mapped::Ok(std::get<kOk>(std::move(storage_)));
        }
        return Mapped::Err(std::forward<F>(relabel)(std::get<kErr>(std::move(storage_))));
    }
private:
    static constexpr std::size_t kOk = 0;
    static constexpr std::size_t kErr = 1;
    template<std::size_t Index, typename Arg>
    Result(std::in_place_index_t<Index> index, Arg&& arg)
        : storage_(index, std::forward<Arg>(arg)) {}
    void RequireOk() const {
        if (IsErr()) {
            throw std::logic_error("Result::Unwrap() called on a failure");
        }
    }
    void RequireErr() const {
        if (IsOk()) {
            throw std::logic_error("Result::UnwrapErr() called on a value");
        }
    }
    std::variant<T, E> storage_;
};
}
