#pragma once

#include "core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace promptguard {

/**
 * @brief Result type for pure operations that can fail
 *
 * Used by the extraction/repair helpers; the error side carries the
 * classified ErrorClass and a message free of user or provider content.
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorClass error_class, std::string message) {
        Result r;
        r.success_ = false;
        r.error_class_ = error_class;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorClass error_class() const { return error_class_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorClass error_class_ = ErrorClass::NON_RETRIABLE_TRANSPORT;
    std::string error_message_;
};

/**
 * @brief Classified invocation failure, thrown when fallback is disabled
 */
class InvocationError : public std::runtime_error {
public:
    InvocationError(ErrorClass error_class, const std::string& message)
        : std::runtime_error(message), error_class_(error_class) {}

    [[nodiscard]] ErrorClass error_class() const noexcept { return error_class_; }

private:
    ErrorClass error_class_;
};

} // namespace promptguard
