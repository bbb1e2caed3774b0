#pragma once

#include <uidkit/error.hpp>
#include <utility>
#include <variant>

namespace uidkit {

// Either a value or the UidError explaining why there is none.
template<typename T>
class Result {
    std::variant<T, UidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit so a bare UidError can be returned from any Result<T> function
    Result(UidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(UidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<UidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
    }

    UidError& error() & { return std::get<UidError>(data_); }
    const UidError& error() const& { return std::get<UidError>(data_); }
    UidError&& error() && { return std::get<UidError>(std::move(data_)); }

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
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define UIDKIT_TRY(expr) \
    do { \
        auto _uidkit_result = (expr); \
        if (_uidkit_result.is_err()) return std::move(_uidkit_result).error(); \
    } while(0)

} // namespace uidkit
