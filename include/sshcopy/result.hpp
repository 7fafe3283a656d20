#pragma once

#include <sshcopy/error.hpp>
#include <variant>
#include <functional>

namespace sshcopy {

template<typename T>
class Result {
    std::variant<T, CopyError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from CopyError so SSHCOPY_TRY can return errors across Result<T> types
    Result(CopyError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(CopyError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<CopyError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    CopyError& error() & { return std::get<CopyError>(data_); }
    const CopyError& error() const& { return std::get<CopyError>(data_); }
    CopyError&& error() && { return std::get<CopyError>(std::move(data_)); }

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

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    // Prefix the error message with "<context>: ", keeping the code.
    Result with_context(const std::string& context) && {
        if (is_err()) {
            auto& e = std::get<CopyError>(data_);
            e.message = context + ": " + e.message;
        }
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SSHCOPY_TRY(expr) \
    do { \
        auto _sshcopy_result = (expr); \
        if (_sshcopy_result.is_err()) return std::move(_sshcopy_result).error(); \
    } while(0)

} // namespace sshcopy
