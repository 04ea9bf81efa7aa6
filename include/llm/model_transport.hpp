#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

struct ChatMessage {
    std::string role;       // "system", "user" or "assistant"
    std::string content;
};

/**
 * @brief One model call as produced by a prompt builder
 */
struct ModelRequest {
    std::vector<ChatMessage> messages;
    std::string model;              // empty = client default
    double temperature = 0.3;
    int max_tokens = 1024;
    bool expect_json = true;        // run JSON repair/parse on the extracted text
};

using Deadline = std::chrono::steady_clock::time_point;

// ============================================================================
// Transport failures
// ============================================================================

enum class TransportFailure : uint8_t {
    CONNECTION,
    TIMEOUT,
    CANCELLED,
    AUTHENTICATION,
    BAD_REQUEST,
    RATE_LIMITED,
    SERVER_ERROR,
    INVALID_RESPONSE,
    PROTOCOL
};

[[nodiscard]] inline const char* transport_failure_to_string(TransportFailure f) {
    switch (f) {
        case TransportFailure::CONNECTION:       return "connection";
        case TransportFailure::TIMEOUT:          return "timeout";
        case TransportFailure::CANCELLED:        return "cancelled";
        case TransportFailure::AUTHENTICATION:   return "authentication";
        case TransportFailure::BAD_REQUEST:      return "bad_request";
        case TransportFailure::RATE_LIMITED:     return "rate_limited";
        case TransportFailure::SERVER_ERROR:     return "server_error";
        case TransportFailure::INVALID_RESPONSE: return "invalid_response";
        case TransportFailure::PROTOCOL:         return "protocol";
        default:                                 return "unknown";
    }
}

/**
 * @brief Only plausibly transient failures are retriable
 */
[[nodiscard]] inline ErrorClass classify(TransportFailure f) {
    switch (f) {
        case TransportFailure::CONNECTION:
        case TransportFailure::TIMEOUT:
        case TransportFailure::CANCELLED:
            return ErrorClass::RETRIABLE_TRANSPORT;
        default:
            return ErrorClass::NON_RETRIABLE_TRANSPORT;
    }
}

/**
 * @brief Raised by transports; the message never carries request or
 * response content
 */
class TransportError : public std::runtime_error {
public:
    TransportError(TransportFailure failure, const std::string& message)
        : std::runtime_error(message), failure_(failure) {}

    [[nodiscard]] TransportFailure failure() const noexcept { return failure_; }
    [[nodiscard]] ErrorClass error_class() const noexcept { return classify(failure_); }

private:
    TransportFailure failure_;
};

// ============================================================================
// IModelTransport
// ============================================================================

/**
 * @brief One outbound call to a model provider
 *
 * Returns the provider's raw response JSON or throws TransportError.
 * Implementations must give up at @p deadline and abort when @p stop is
 * requested (TIMEOUT / CANCELLED respectively).
 */
class IModelTransport {
public:
    virtual ~IModelTransport() = default;

    [[nodiscard]] virtual nlohmann::json send(const ModelRequest& request,
                                              Deadline deadline,
                                              std::stop_token stop) = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace promptguard
