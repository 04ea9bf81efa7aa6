#include "llm/fallback_synthesizer.hpp"
#include "core/utils.hpp"

namespace promptguard {

nlohmann::json FallbackSynthesizer::payload() {
    return {
        {"sentiment", "neutral"},
        {"emotion", "neutral"},
        {"stress_score", 5},
        {"category", "general"},
        {"key_phrases", nlohmann::json::array()},
        {"suggested_reply", "Thank you for your message. Let me review this and get back to you."},
        {"action_items", {"Review message", "Follow up with sender"}},
        {"confidence_scores", {
            {"sentiment", 0.5},
            {"emotion", 0.5},
            {"category", 0.5},
            {"stress", 0.5},
        }},
        {"urgency", false},
        {"schema_version", std::string(kSchemaVersion)},
    };
}

InvocationOutcome FallbackSynthesizer::synthesize(ErrorClass error,
                                                  double elapsed_ms,
                                                  uint32_t attempts) {
    InvocationOutcome outcome;
    outcome.success = true;
    outcome.payload = payload();
    outcome.model_debug.model_name = std::string(kModelName);
    outcome.model_debug.latency_ms = elapsed_ms;
    outcome.model_debug.fallback_used = true;
    outcome.model_debug.error_kind = error_class_to_string(error);
    outcome.model_debug.attempts = attempts;

    utils::log::info(std::format("Generated fallback result (error_kind={}, attempts={})",
                                 error_class_to_string(error), attempts));
    return outcome;
}

} // namespace promptguard
