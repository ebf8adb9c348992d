#pragma once

#include <lox/error.hpp>
#include <variant>
#include <functional>

namespace lox {

template<typename T>
class Result {
    std::variant<T, ErrorState> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from ErrorState / LoxError so LOX_TRY can return errors across Result<T> types
    Result(ErrorState err) : data_(std::move(err)) {}
    Result(LoxError err) : data_(ErrorState(std::move(err))) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(ErrorState e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ErrorState>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    ErrorState& error() & { return std::get<ErrorState>(data_); }
    const ErrorState& error() const& { return std::get<ErrorState>(data_); }
    ErrorState&& error() && { return std::get<ErrorState>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return std::move(*this);
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define LOX_TRY(expr) \
    do { \
        auto&& _lox_result = (expr); \
        if (_lox_result.is_err()) return std::move(_lox_result).error(); \
    } while(0)

} // namespace lox
