#include "llm/http_transport.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <algorithm>
#include <format>
#include <stop_token>

namespace promptguard {

using json = nlohmann::json;

namespace {

std::string join_system_messages(const std::vector<ChatMessage>& messages) {
    std::string system;
    for (const auto& m : messages) {
        if (m.role != "system") continue;
        if (!system.empty()) system += "\n\n";
        system += m.content;
    }
    return system;
}

} // anonymous namespace

std::optional<ModelProvider> parse_model_provider(std::string_view name) {
    const auto lower = utils::to_lower(name);
    if (lower == "gemini") return ModelProvider::GEMINI;
    if (lower == "openai") return ModelProvider::OPENAI;
    return std::nullopt;
}

HttpModelTransport::HttpModelTransport(Config config)
    : config_(std::move(config)) {}

// ============================================================================
// Request shaping
// ============================================================================

json HttpModelTransport::build_request_body(ModelProvider provider, const ModelRequest& request) {
    if (provider == ModelProvider::OPENAI) {
        json messages = json::array();
        for (const auto& m : request.messages) {
            messages.push_back({{"role", m.role}, {"content", m.content}});
        }
        json body = {
            {"model", request.model},
            {"messages", std::move(messages)},
            {"temperature", request.temperature},
            {"max_tokens", request.max_tokens},
        };
        if (request.expect_json) {
            body["response_format"] = {{"type", "json_object"}};
        }
        return body;
    }

    // Gemini: system turns go to systemInstruction, assistant turns are "model"
    json contents = json::array();
    for (const auto& m : request.messages) {
        if (m.role == "system") continue;
        contents.push_back({
            {"role", m.role == "assistant" ? "model" : "user"},
            {"parts", json::array({{{"text", m.content}}})},
        });
    }

    json generation = {
        {"temperature", request.temperature},
        {"maxOutputTokens", request.max_tokens},
    };
    if (request.expect_json) {
        generation["responseMimeType"] = "application/json";
    }

    json body = {
        {"contents", std::move(contents)},
        {"generationConfig", std::move(generation)},
    };
    const auto system = join_system_messages(request.messages);
    if (!system.empty()) {
        body["systemInstruction"] = {{"parts", json::array({{{"text", system}}})}};
    }
    return body;
}

std::string HttpModelTransport::request_path(ModelProvider provider, const std::string& model) {
    if (provider == ModelProvider::OPENAI) {
        return "/v1/chat/completions";
    }
    return std::format("/v1beta/models/{}:generateContent", model);
}

std::optional<TransportFailure> HttpModelTransport::classify_status(int status) {
    if (status >= 200 && status < 300) return std::nullopt;

    switch (status) {
        case 401:
        case 403:
            return TransportFailure::AUTHENTICATION;
        case 408:
        case 504:
            return TransportFailure::TIMEOUT;
        case 429:
            return TransportFailure::RATE_LIMITED;
        default:
            break;
    }
    if (status >= 500) return TransportFailure::SERVER_ERROR;
    if (status >= 400) return TransportFailure::BAD_REQUEST;
    return TransportFailure::PROTOCOL;
}

TransportFailure HttpModelTransport::classify_error(httplib::Error err) {
    switch (err) {
        case httplib::Error::Connection:
            return TransportFailure::CONNECTION;
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
        case httplib::Error::Write:
            return TransportFailure::TIMEOUT;
        case httplib::Error::Canceled:
            return TransportFailure::CANCELLED;
        default:
            return TransportFailure::PROTOCOL;
    }
}

// ============================================================================
// Send
// ============================================================================

json HttpModelTransport::send(const ModelRequest& request, Deadline deadline, std::stop_token stop) {
    if (config_.api_key.empty()) {
        throw TransportError(TransportFailure::AUTHENTICATION, "no API key configured");
    }
    if (config_.endpoint.empty()) {
        throw TransportError(TransportFailure::BAD_REQUEST, "no endpoint configured");
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        throw TransportError(TransportFailure::TIMEOUT, "deadline already passed");
    }

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(std::min(config_.connect_timeout, remaining));
    cli.set_read_timeout(remaining);
    cli.set_write_timeout(remaining);

    std::stop_callback on_stop(stop, [&cli] { cli.stop(); });

    httplib::Headers headers;
    if (config_.provider == ModelProvider::OPENAI) {
        headers = {{"Authorization", "Bearer " + config_.api_key}};
    } else {
        headers = {{"x-goog-api-key", config_.api_key}};
    }

    const auto body = build_request_body(config_.provider, request)
        .dump(-1, ' ', false, json::error_handler_t::replace);
    const auto path = request_path(config_.provider, request.model);

    const auto res = cli.Post(path, headers, body, "application/json");

    if (!res) {
        if (stop.stop_requested()) {
            throw TransportError(TransportFailure::CANCELLED, "request cancelled");
        }
        const auto failure = classify_error(res.error());
        throw TransportError(failure, std::format("HTTP request failed: {}", httplib::to_string(res.error())));
    }

    if (const auto failure = classify_status(res->status)) {
        throw TransportError(*failure, std::format("API error: HTTP {}", res->status));
    }

    auto parsed = json::parse(res->body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        throw TransportError(TransportFailure::INVALID_RESPONSE,
                             std::format("non-JSON response body ({} bytes)", res->body.size()));
    }
    return parsed;
}

} // namespace promptguard
