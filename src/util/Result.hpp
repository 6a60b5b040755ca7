#pragma once
// Result.hpp - Lightweight success/error return type
// Errors carry a human readable message, nothing more

#include <optional>
#include <string>
#include <utility>

namespace babel {

struct Error {
    std::string message;
};

template <typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result err(std::string message) {
        Result r;
        r.error_ = Error{std::move(message)};
        return r;
    }

    bool isOk() const {
        return value_.has_value();
    }
    bool isErr() const {
        return !value_.has_value();
    }
    explicit operator bool() const {
        return isOk();
    }

    T& value() & {
        return *value_;
    }
    const T& value() const& {
        return *value_;
    }
    T&& value() && {
        return std::move(*value_);
    }

    T& operator*() & {
        return *value_;
    }
    const T& operator*() const& {
        return *value_;
    }
    T&& operator*() && {
        return std::move(*value_);
    }
    T* operator->() {
        return &*value_;
    }
    const T* operator->() const {
        return &*value_;
    }

    T valueOr(T fallback) const& {
        return value_ ? *value_ : std::move(fallback);
    }

    const Error& error() const {
        return error_;
    }

private:
    Result() = default;

    std::optional<T> value_;
    Error error_;
};

template <>
class Result<void> {
public:
    static Result ok() {
        return Result(true, {});
    }

    static Result err(std::string message) {
        return Result(false, Error{std::move(message)});
    }

    bool isOk() const {
        return ok_;
    }
    bool isErr() const {
        return !ok_;
    }
    explicit operator bool() const {
        return ok_;
    }

    const Error& error() const {
        return error_;
    }

private:
    Result(bool ok, Error error) : ok_(ok), error_(std::move(error)) {}

    bool ok_;
    Error error_;
};

} // namespace babel
