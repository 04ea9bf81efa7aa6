#pragma once

#include "llm/model_transport.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
enum class Error;
}

namespace promptguard {

enum class ModelProvider : uint8_t {
    GEMINI,
    OPENAI
};

[[nodiscard]] inline const char* model_provider_to_string(ModelProvider p) {
    switch (p) {
        case ModelProvider::GEMINI: return "gemini";
        case ModelProvider::OPENAI: return "openai";
        default:                    return "unknown";
    }
}

[[nodiscard]] std::optional<ModelProvider> parse_model_provider(std::string_view name);

/**
 * @brief cpp-httplib transport for Gemini generateContent and
 * OpenAI-compatible chat completions.
 *
 * Every call gets a fresh httplib::Client whose timeouts are the time left
 * until the deadline; a stop request on the caller's token aborts the
 * socket through Client::stop().
 */
class HttpModelTransport final : public IModelTransport {
public:
    struct Config {
        ModelProvider provider = ModelProvider::GEMINI;
        std::string endpoint = "https://generativelanguage.googleapis.com";
        std::string api_key;
        std::chrono::milliseconds connect_timeout{5000};
    };

    explicit HttpModelTransport(Config config);

    [[nodiscard]] nlohmann::json send(const ModelRequest& request,
                                      Deadline deadline,
                                      std::stop_token stop) override;

    [[nodiscard]] std::string_view name() const override {
        return model_provider_to_string(config_.provider);
    }

    // Request shaping (exposed for testing)
    [[nodiscard]] static nlohmann::json build_request_body(ModelProvider provider,
                                                           const ModelRequest& request);
    [[nodiscard]] static std::string request_path(ModelProvider provider, const std::string& model);

    /// std::nullopt for 2xx
    [[nodiscard]] static std::optional<TransportFailure> classify_status(int status);

    /// Failure class for a request that produced no HTTP response
    [[nodiscard]] static TransportFailure classify_error(httplib::Error err);

private:
    Config config_;
};

} // namespace promptguard
