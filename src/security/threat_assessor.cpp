#include "security/threat_assessor.hpp"

#include <algorithm>

namespace promptguard {

ThreatLevel ThreatAssessor::baseline_severity(ThreatKind kind) {
    switch (kind) {
        case ThreatKind::PROMPT_INJECTION:
        case ThreatKind::CODE_INJECTION:
            return ThreatLevel::MEDIUM;
        case ThreatKind::EXCESSIVE_REPETITION:
        case ThreatKind::CONTROL_CHARACTERS:
        case ThreatKind::OVERSIZED_INPUT:
        case ThreatKind::PII_DETECTED:
            return ThreatLevel::LOW;
        default:
            return ThreatLevel::NONE;
    }
}

ThreatLevel ThreatAssessor::assess(const std::set<ThreatKind>& threats,
                                   const ThreatPolicy& policy) {
    ThreatLevel level = ThreatLevel::NONE;
    for (const auto kind : threats) {
        level = std::max(level, baseline_severity(kind));
    }

    if (!policy.escalation_enabled || threats.size() < policy.min_distinct_kinds) {
        return level;
    }

    const bool triggered = std::any_of(
        policy.trigger_kinds.begin(), policy.trigger_kinds.end(),
        [&threats](ThreatKind k) { return threats.contains(k); });

    // Escalation never lowers the level
    if (triggered) {
        level = std::max(level, policy.escalated_level);
    }
    return level;
}

} // namespace promptguard
