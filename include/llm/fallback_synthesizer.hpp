#pragma once

#include "core/types.hpp"
#include "llm/invocation_outcome.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace promptguard {

/**
 * @brief Deterministic placeholder result for failed invocations
 *
 * The payload has the same shape as a real analysis so callers never need
 * a separate code path; only model_debug.fallback_used tells them apart.
 */
class FallbackSynthesizer {
public:
    static constexpr std::string_view kModelName = "fallback";
    static constexpr std::string_view kSchemaVersion = "1.0.0";

    [[nodiscard]] static nlohmann::json payload();

    [[nodiscard]] static InvocationOutcome synthesize(ErrorClass error,
                                                      double elapsed_ms,
                                                      uint32_t attempts);
};

} // namespace promptguard
