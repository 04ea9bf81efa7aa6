#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace promptguard {

// ============================================================================
// Threat Level (ordered: NONE < LOW < MEDIUM < HIGH)
// ============================================================================

enum class ThreatLevel : uint8_t {
    NONE = 0,
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3
};

[[nodiscard]] inline const char* threat_level_to_string(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::NONE:   return "none";
        case ThreatLevel::LOW:    return "low";
        case ThreatLevel::MEDIUM: return "medium";
        case ThreatLevel::HIGH:   return "high";
        default:                  return "unknown";
    }
}

[[nodiscard]] inline std::optional<ThreatLevel> parse_threat_level(std::string_view s) {
    if (s == "none")   return ThreatLevel::NONE;
    if (s == "low")    return ThreatLevel::LOW;
    if (s == "medium") return ThreatLevel::MEDIUM;
    if (s == "high")   return ThreatLevel::HIGH;
    return std::nullopt;
}

// ============================================================================
// Threat Kind (sanitization-side signals, never exceptions)
// ============================================================================

enum class ThreatKind : uint8_t {
    PROMPT_INJECTION,
    CODE_INJECTION,
    EXCESSIVE_REPETITION,
    CONTROL_CHARACTERS,
    OVERSIZED_INPUT,
    PII_DETECTED
};

inline constexpr ThreatKind kAllThreatKinds[] = {
    ThreatKind::PROMPT_INJECTION,
    ThreatKind::CODE_INJECTION,
    ThreatKind::EXCESSIVE_REPETITION,
    ThreatKind::CONTROL_CHARACTERS,
    ThreatKind::OVERSIZED_INPUT,
    ThreatKind::PII_DETECTED,
};

[[nodiscard]] inline const char* threat_kind_to_string(ThreatKind kind) {
    switch (kind) {
        case ThreatKind::PROMPT_INJECTION:     return "prompt_injection";
        case ThreatKind::CODE_INJECTION:       return "code_injection";
        case ThreatKind::EXCESSIVE_REPETITION: return "excessive_repetition";
        case ThreatKind::CONTROL_CHARACTERS:   return "control_characters";
        case ThreatKind::OVERSIZED_INPUT:      return "oversized_input";
        case ThreatKind::PII_DETECTED:         return "pii_detected";
        default:                               return "unknown";
    }
}

[[nodiscard]] inline std::optional<ThreatKind> parse_threat_kind(std::string_view s) {
    for (const auto kind : kAllThreatKinds) {
        if (s == threat_kind_to_string(kind)) return kind;
    }
    return std::nullopt;
}

// ============================================================================
// PII Kind
// ============================================================================

enum class PiiKind : uint8_t {
    EMAIL,
    PHONE,
    CREDIT_CARD,
    SSN
};

[[nodiscard]] inline const char* pii_kind_to_string(PiiKind kind) {
    switch (kind) {
        case PiiKind::EMAIL:       return "email";
        case PiiKind::PHONE:       return "phone";
        case PiiKind::CREDIT_CARD: return "credit_card";
        case PiiKind::SSN:         return "ssn";
        default:                   return "unknown";
    }
}

// ============================================================================
// Invocation Error Class (drives retry and fallback decisions)
// ============================================================================

enum class ErrorClass : uint8_t {
    RETRIABLE_TRANSPORT,
    NON_RETRIABLE_TRANSPORT,
    EXTRACTION_FAILED,
    REPAIR_FAILED
};

[[nodiscard]] inline const char* error_class_to_string(ErrorClass ec) {
    switch (ec) {
        case ErrorClass::RETRIABLE_TRANSPORT:     return "retriable_transport";
        case ErrorClass::NON_RETRIABLE_TRANSPORT: return "non_retriable_transport";
        case ErrorClass::EXTRACTION_FAILED:       return "extraction_failed";
        case ErrorClass::REPAIR_FAILED:           return "repair_failed";
        default:                                  return "unknown";
    }
}

} // namespace promptguard
