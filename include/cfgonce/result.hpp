#pragma once

#include <cfgonce/error.hpp>
#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace cfgonce {

// Either a value or a CfgError. Every fallible cfgonce operation returns
// one; nothing in the public API throws.
template<typename T>
class Result {
public:
    using value_type = T;

    // Implicit so `return CfgError{...};` works from any Result-returning function
    Result(CfgError err) : data_(std::in_place_index<1>, std::move(err)) {}

    static Result ok(T val) { return Result(std::in_place_index<0>, std::move(val)); }
    static Result err(CfgError e) { return Result(std::move(e)); }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    bool has_code(CfgError::Code c) const {
        const CfgError* e = std::get_if<1>(&data_);
        return e && e->code == c;
    }

    // Throws std::bad_variant_access on the wrong alternative
    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    CfgError& error() & { return std::get<1>(data_); }
    const CfgError& error() const& { return std::get<1>(data_); }
    CfgError&& error() && { return std::get<1>(std::move(data_)); }

    T value_or(T fallback) const& {
        if (const T* v = std::get_if<0>(&data_)) return *v;
        return fallback;
    }

    // Record which config file an error came from, unless one is already set
    Result with_file(const std::string& path) && {
        if (CfgError* e = std::get_if<1>(&data_)) {
            if (e->file.empty()) e->file = path;
        }
        return std::move(*this);
    }

    // f(T&) -> U, wrapped into Result<U>
    template<typename F>
    auto map(F&& f) & -> Result<std::decay_t<std::invoke_result_t<F, T&>>> {
        using U = std::decay_t<std::invoke_result_t<F, T&>>;
        if (is_err()) return error();
        return Result<U>::ok(f(value()));
    }

    template<typename F>
    auto map(F&& f) && -> Result<std::decay_t<std::invoke_result_t<F, T&&>>> {
        using U = std::decay_t<std::invoke_result_t<F, T&&>>;
        if (is_err()) return std::move(*this).error();
        return Result<U>::ok(f(std::move(*this).value()));
    }

    // f(T&) -> Result<U>
    template<typename F>
    auto and_then(F&& f) & -> std::invoke_result_t<F, T&> {
        if (is_err()) return error();
        return f(value());
    }

    template<typename F>
    auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
        if (is_err()) return std::move(*this).error();
        return f(std::move(*this).value());
    }

    // f(CfgError&) -> Result<T>, called only on failure
    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) return *this;
        return f(error());
    }

private:
    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

    std::variant<T, CfgError> data_;
};

using Status = Result<std::monostate>;

inline Status ok_status() { return Status::ok(std::monostate{}); }

#define CFGONCE_CONCAT_IMPL(a, b) a##b
#define CFGONCE_CONCAT(a, b) CFGONCE_CONCAT_IMPL(a, b)

// Return the error of a Result-valued expression from the enclosing function
#define CFGONCE_TRY(expr)                                               \
    do {                                                                \
        auto&& _cfgonce_try = (expr);                                   \
        if (_cfgonce_try.is_err()) return std::move(_cfgonce_try).error(); \
    } while (0)

// Declare `decl` from the value of a Result-valued expression, or return its
// error. Expands to several statements: not for use as an unbraced if-body.
#define CFGONCE_TRY_ASSIGN(decl, expr)                                  \
    auto&& CFGONCE_CONCAT(_cfgonce_tmp_, __LINE__) = (expr);            \
    if (CFGONCE_CONCAT(_cfgonce_tmp_, __LINE__).is_err())               \
        return std::move(CFGONCE_CONCAT(_cfgonce_tmp_, __LINE__)).error(); \
    decl = std::move(CFGONCE_CONCAT(_cfgonce_tmp_, __LINE__)).value()

} // namespace cfgonce
