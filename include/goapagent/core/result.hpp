#pragma once

#include "errors.hpp"

#include <stdexcept>
#include <string>
#include <optional>
#include <utility>
#include <variant>

namespace goapagent::core {

namespace detail {

inline void require_state(bool holds, const char* accessor) {
    if (!holds) {
        throw std::logic_error(std::string("Result::") + accessor + " called in the wrong state");
    }
}

}  // namespace detail

// Value or error from a fallible platform operation: deploy, lookup, kill,
// config loading
template<typename T, typename E = Error>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    static Result err(ErrorCode code, std::string message) {
        return Result(E{code, std::move(message)});
    }

    static Result err(ErrorCode code, std::string message, std::string context) {
        return Result(E{code, std::move(message), std::move(context)});
    }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return !is_ok(); }
    explicit operator bool() const { return is_ok(); }

    // Throws std::logic_error on an error result
    T& value() & {
        detail::require_state(is_ok(), "value()");
        return std::get<T>(data_);
    }

    const T& value() const& {
        detail::require_state(is_ok(), "value()");
        return std::get<T>(data_);
    }

    T&& value() && {
        detail::require_state(is_ok(), "value()");
        return std::get<T>(std::move(data_));
    }

    // Throws std::logic_error on an ok result
    const E& error() const {
        detail::require_state(is_err(), "error()");
        return std::get<E>(data_);
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

// Outcome of an operation with nothing to return
template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(const E& error) : error_(error) {}
    Result(E&& error) : error_(std::move(error)) {}

    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    static Result err(ErrorCode code, std::string message) {
        return Result(E{code, std::move(message)});
    }

    static Result err(ErrorCode code, std::string message, std::string context) {
        return Result(E{code, std::move(message), std::move(context)});
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    const E& error() const {
        detail::require_state(is_err(), "error()");
        return *error_;
    }

private:
    std::optional<E> error_;
};

}  // namespace goapagent::core
