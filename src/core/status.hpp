#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace mirage {

/// Failure categories surfaced by the proxy core
enum class ErrorKind {
    BadRequest,       // missing/malformed target, unreadable body
    NotFound,         // repository lookup miss
    NoRecording,      // playback miss
    UpstreamFailure,  // network error reaching the real target
    StorageFailure,   // read/write/clear I/O error
    InvalidMode       // bad value passed to mode switch
};

/// Error value carried by Result
struct Error {
    ErrorKind kind;
    std::string message;

    [[nodiscard]] static Error bad_request(std::string msg) {
        return Error{ErrorKind::BadRequest, std::move(msg)};
    }
    [[nodiscard]] static Error not_found(std::string msg) {
        return Error{ErrorKind::NotFound, std::move(msg)};
    }
    [[nodiscard]] static Error no_recording(std::string msg) {
        return Error{ErrorKind::NoRecording, std::move(msg)};
    }
    [[nodiscard]] static Error upstream(std::string msg) {
        return Error{ErrorKind::UpstreamFailure, std::move(msg)};
    }
    [[nodiscard]] static Error storage(std::string msg) {
        return Error{ErrorKind::StorageFailure, std::move(msg)};
    }
    [[nodiscard]] static Error invalid_mode(std::string msg) {
        return Error{ErrorKind::InvalidMode, std::move(msg)};
    }
};

/// Human readable name of an error kind (for logs)
[[nodiscard]] inline const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::BadRequest: return "bad_request";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::NoRecording: return "no_recording";
        case ErrorKind::UpstreamFailure: return "upstream_failure";
        case ErrorKind::StorageFailure: return "storage_failure";
        case ErrorKind::InvalidMode: return "invalid_mode";
    }
    return "unknown";
}

/// Result monad for error handling without exceptions
/// Inspired by Rust's Result<T, E>
template <typename T, typename E = std::string>
class Result {
public:
    /// Create a successful result
    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    /// Create an error result
    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    /// Uses index-based check to handle T==E case
    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /// Get the value (throws if error)
    [[nodiscard]] const T& value() const& {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(data_);
    }

    /// Get the value (throws if error) - rvalue version
    [[nodiscard]] T value() && {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Get the error (throws if ok)
    [[nodiscard]] const E& error() const& {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /// Take the value (move semantics for move-only types)
    [[nodiscard]] T take_value() && {
        if (is_err()) {
            throw std::runtime_error("Called take_value() on error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Transform the value if Ok, preserve error if Err
    template <typename F>
    [[nodiscard]] auto map(F&& func) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::Ok(func(std::get<0>(data_)));
        }
        return Result<U, E>::Err(std::get<1>(data_));
    }

    /// Transform the error if Err, preserve value if Ok
    template <typename F>
    [[nodiscard]] auto map_error(F&& func) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using NewE = std::invoke_result_t<F, const E&>;
        if (is_err()) {
            return Result<T, NewE>::Err(func(std::get<1>(data_)));
        }
        return Result<T, NewE>::Ok(std::get<0>(data_));
    }

    /// Chain operations that may fail
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
        using ResultType = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return func(std::get<0>(data_));
        }
        return ResultType::Err(std::get<1>(data_));
    }

private:
    template <size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

/// Result for operations that produce no value
using Status = Result<std::monostate, Error>;

[[nodiscard]] inline Status ok_status() {
    return Status::Ok(std::monostate{});
}

}  // namespace mirage
