#pragma once

#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <crow.h>

namespace clanlookup {

// Error categories for classification and HTTP status mapping
enum class ErrorCategory {
    NotFound,          // Upstream reports no matching clan
    UpstreamRejected,  // Upstream answered with status != "ok"
    Transport,         // Connection error, timeout, non-2xx status
    MalformedPayload,  // Unexpected JSON shape (missing key, wrong type, invalid JSON)
    Validation,        // Invalid inbound path parameter
    Configuration      // Startup configuration problems
};

// Error details structure
struct Error {
    ErrorCategory category;
    std::string message;
    int http_status_code;

    static Error NotFound(const std::string& msg) {
        return Error{ErrorCategory::NotFound, msg, 404};
    }

    static Error UpstreamRejected(const std::string& msg) {
        return Error{ErrorCategory::UpstreamRejected, msg, 400};
    }

    static Error Transport(const std::string& msg) {
        return Error{ErrorCategory::Transport, msg, 400};
    }

    static Error MalformedPayload(const std::string& msg) {
        return Error{ErrorCategory::MalformedPayload, msg, 400};
    }

    static Error Validation(const std::string& msg) {
        return Error{ErrorCategory::Validation, msg, 422};
    }

    static Error Config(const std::string& msg) {
        return Error{ErrorCategory::Configuration, msg, 500};
    }

    // Convert error to HTTP response with a {"detail": message} body
    crow::response toHttpResponse() const;

    // Convert error to JSON representation ({"detail": message})
    crow::json::wvalue toJson() const;

    // Get category name as string
    std::string getCategoryName() const;
};

// Expected<T, E> is a sum type that can hold either a success value or an error
template<typename T, typename E = Error>
class Expected {
public:
    template<typename U,
             typename std::enable_if_t<!std::is_same_v<std::decay_t<U>, E> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>,
                                       int> = 0>
    Expected(U&& val) : has_value_(true) {
        new (&value_) T(std::forward<U>(val));
    }

    template<typename U,
             typename std::enable_if_t<std::is_same_v<std::decay_t<U>, E>,
                                       int> = 0>
    Expected(U&& err) : has_value_(false) {
        new (&error_) E(std::forward<U>(err));
    }

    Expected(const Expected&) = delete;
    Expected& operator=(const Expected&) = delete;

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            destroy();
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&value_) T(std::move(other.value_));
            } else {
                new (&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    ~Expected() {
        destroy();
    }

    bool has_value() const { return has_value_; }
    explicit operator bool() const { return has_value_; }

    T& value() {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected");
        return value_;
    }

    const T& value() const {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected");
        return value_;
    }

    E& error() {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    const E& error() const {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    void destroy() {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    union {
        T value_;
        E error_;
    };
    bool has_value_;
};

// Result<T> means Expected<T, Error>
template<typename T>
using Result = Expected<T, Error>;

} // namespace clanlookup
