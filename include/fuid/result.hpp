#pragma once

#include <fuid/error.hpp>
#include <variant>
#include <functional>

namespace fuid {

template<typename T>
class Result {
    std::variant<T, FuidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from FuidError so FUID_TRY can return errors across Result<T> types
    Result(FuidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(FuidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<FuidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    FuidError& error() & { return std::get<FuidError>(data_); }
    const FuidError& error() const& { return std::get<FuidError>(data_); }
    FuidError&& error() && { return std::get<FuidError>(std::move(data_)); }

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
            return *this;
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define FUID_TRY(expr) \
    do { \
        auto _fuid_result = (expr); \
        if (_fuid_result.is_err()) return std::move(_fuid_result).error(); \
    } while(0)

#define FUID_CONCAT_INNER(a, b) a##b
#define FUID_CONCAT(a, b) FUID_CONCAT_INNER(a, b)

// Declares `decl` from the value of a Result, or returns its error.
#define FUID_TRY_ASSIGN(decl, expr) \
    auto FUID_CONCAT(_fuid_tmp_, __LINE__) = (expr); \
    if (FUID_CONCAT(_fuid_tmp_, __LINE__).is_err()) \
        return std::move(FUID_CONCAT(_fuid_tmp_, __LINE__)).error(); \
    decl = std::move(FUID_CONCAT(_fuid_tmp_, __LINE__)).value()

} // namespace fuid
