#pragma once

#include <pformat/error.hpp>
#include <variant>
#include <utility>

namespace pformat {

template<typename T>
class Result {
    std::variant<T, PformatError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from PformatError so PFORMAT_TRY can return errors across Result<T> types
    Result(PformatError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(PformatError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<PformatError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    PformatError& error() & { return std::get<PformatError>(data_); }
    const PformatError& error() const& { return std::get<PformatError>(data_); }
    PformatError&& error() && { return std::get<PformatError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Chain a step that itself returns a Result; an error skips the step.
    template<typename F>
    auto and_then(F&& f) const& -> decltype(f(std::declval<const T&>())) {
        using Next = decltype(f(std::declval<const T&>()));
        if (is_err()) return Next(error());
        return f(value());
    }

    template<typename F>
    auto and_then(F&& f) && -> decltype(f(std::declval<T&&>())) {
        using Next = decltype(f(std::declval<T&&>()));
        if (is_err()) return Next(std::move(*this).error());
        return f(std::move(*this).value());
    }

    // Transform the value, keeping an error as is
    template<typename F>
    auto map(F&& f) const& -> Result<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (is_err()) return Result<U>(error());
        return Result<U>::ok(f(value()));
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define PFORMAT_TRY(expr) \
    do { \
        auto _pformat_result = (expr); \
        if (_pformat_result.is_err()) return std::move(_pformat_result).error(); \
    } while(0)

} // namespace pformat
