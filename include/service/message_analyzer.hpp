#pragma once

#include "core/types.hpp"
#include "llm/invocation_outcome.hpp"
#include "llm/model_transport.hpp"
#include "llm/resilient_client.hpp"
#include "security/input_sanitizer.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

struct AnalyzeRequest {
    std::string message;
    std::optional<std::string> user_id;
    std::optional<std::string> channel_id;
};

struct AnalysisResult {
    nlohmann::json analysis;
    ModelDebug model_debug;
    bool sanitization_applied = false;
    std::optional<ThreatLevel> threat_level;    // unset when the pipeline itself failed
    bool llm_used = false;
    bool blocked = false;
    double processing_time_ms = 0.0;
};

void to_json(nlohmann::json& j, const AnalysisResult& r);

/// Turns the sanitized message into a model request
using PromptBuilder = std::function<ModelRequest(std::string_view sanitized_message,
                                                 const AnalyzeRequest& request)>;

/**
 * @brief End-to-end analysis: sanitize, build prompt, invoke the model
 *
 * The model only ever sees sanitized text. With block_level set, inputs
 * assessed at or above it are answered with a blocked result and never
 * reach the model.
 */
class MessageAnalyzer {
public:
    struct Config {
        SanitizeOptions sanitize{.strict = true, .preserve_formatting = false, .redact_pii = true};
        bool fallback_on_error = true;
        std::optional<ThreatLevel> block_level;
    };

    MessageAnalyzer(InputSanitizer sanitizer,
                    std::shared_ptr<ResilientClient> client,
                    Config config,
                    PromptBuilder prompt_builder = default_prompt_builder);

    /// @throws InvocationError when the model call fails and fallback is disabled
    [[nodiscard]] AnalysisResult analyze(const AnalyzeRequest& request) const;

    /// In order; a failing item becomes a fallback item instead of aborting the batch
    [[nodiscard]] std::vector<AnalysisResult> analyze_batch(const std::vector<AnalyzeRequest>& requests) const;

    [[nodiscard]] static ModelRequest default_prompt_builder(std::string_view sanitized_message,
                                                             const AnalyzeRequest& request);

    /// Required analysis fields are present with the right JSON types
    [[nodiscard]] static bool validate_analysis(const nlohmann::json& payload);

    [[nodiscard]] static nlohmann::json blocked_payload();

private:
    InputSanitizer sanitizer_;
    std::shared_ptr<ResilientClient> client_;
    Config config_;
    PromptBuilder prompt_builder_;
};

} // namespace promptguard
