#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace scorch {

struct Error {
    std::string message;
    std::string source; ///< Script chunk or file the error came from, if any

    Error() = default;
    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(std::string msg, std::string src)
        : message(std::move(msg)), source(std::move(src)) {}

    /// "source: message", or just the message when there is no source.
    std::string describe() const {
        return source.empty() ? message : source + ": " + message;
    }
};

/// Holds either a value of type T or an Error.
/// Loaders return this instead of throwing; Result<void> covers
/// operations with no payload.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    T value_or(T fallback) const {
        return ok() ? std::get<T>(data_) : std::move(fallback);
    }

    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    Result() : err_(std::nullopt) {}
    Result(Error err) : err_(std::move(err)) {}

    bool ok() const { return !err_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return err_.value(); }

private:
    std::optional<Error> err_;
};

} // namespace scorch
