#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace promptguard {

/**
 * @brief Invocation metadata; names, counts and durations only
 */
struct ModelDebug {
    std::string model_name;
    double latency_ms = 0.0;
    bool fallback_used = false;
    std::optional<std::string> error_kind;
    uint32_t attempts = 0;
};

struct InvocationOutcome {
    bool success = false;
    std::optional<nlohmann::json> payload;
    ModelDebug model_debug;
};

inline void to_json(nlohmann::json& j, const ModelDebug& d) {
    j = nlohmann::json{
        {"model_name", d.model_name},
        {"latency_ms", d.latency_ms},
        {"fallback_used", d.fallback_used},
        {"attempts", d.attempts},
    };
    j["error_kind"] = d.error_kind ? nlohmann::json(*d.error_kind) : nlohmann::json(nullptr);
}

inline void to_json(nlohmann::json& j, const InvocationOutcome& o) {
    j = nlohmann::json{
        {"success", o.success},
        {"payload", o.payload ? *o.payload : nlohmann::json(nullptr)},
        {"model_debug", o.model_debug},
    };
}

} // namespace promptguard
