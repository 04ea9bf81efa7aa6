#pragma once

#include "core/types.hpp"
#include "llm/resilient_client.hpp"
#include "security/input_sanitizer.hpp"
#include "security/threat_assessor.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace promptguard {

// ============================================================================
// Configuration Types (mirror the TOML sections)
// ============================================================================

struct SanitizerConfig {
    SanitizerLimits limits;
    SanitizeOptions options;
};

struct LlmConfig {
    std::string provider = "gemini";
    std::string endpoint = "https://generativelanguage.googleapis.com";
    std::string api_key;
    std::string model = "gemini-1.5-flash";
    double temperature = 0.3;
    int max_tokens = 1024;
    bool fallback_on_error = true;
    uint32_t connect_timeout_ms = 5000;
};

struct LoggingConfig {
    std::string level = "info";
};

struct AppConfig {
    SanitizerConfig sanitizer;
    ThreatPolicy threat_policy;
    std::optional<ThreatLevel> block_level;     // unset = never block
    LlmConfig llm;
    RetryPolicy retry;
    LoggingConfig logging;
};

} // namespace promptguard
