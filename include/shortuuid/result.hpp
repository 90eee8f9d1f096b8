#pragma once

#include <shortuuid/error.hpp>
#include <variant>
#include <functional>

namespace shortuuid {

template<typename T>
class Result {
    std::variant<T, ShortUuidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit so SHORTUUID_TRY can hand an error to any Result<U>
    Result(ShortUuidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(ShortUuidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ShortUuidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    ShortUuidError& error() & { return std::get<ShortUuidError>(data_); }
    const ShortUuidError& error() const& { return std::get<ShortUuidError>(data_); }
    ShortUuidError&& error() && { return std::get<ShortUuidError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) const -> decltype(f(std::declval<const T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<const T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) const {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }

    // Value on success, fallback otherwise
    T value_or(T fallback) const {
        if (is_ok()) {
            return value();
        }
        return fallback;
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SHORTUUID_TRY(expr) \
    do { \
        auto _shortuuid_result = (expr); \
        if (_shortuuid_result.is_err()) return std::move(_shortuuid_result).error(); \
    } while(0)

} // namespace shortuuid
