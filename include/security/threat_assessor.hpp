#pragma once

#include "core/types.hpp"

#include <set>
#include <vector>

namespace promptguard {

/**
 * @brief Escalation policy applied on top of per-kind severities
 *
 * With the defaults, two or more distinct threat kinds where at least one
 * is prompt or code injection force the level to HIGH.
 */
struct ThreatPolicy {
    bool escalation_enabled = true;
    size_t min_distinct_kinds = 2;
    ThreatLevel escalated_level = ThreatLevel::HIGH;
    std::vector<ThreatKind> trigger_kinds = {
        ThreatKind::PROMPT_INJECTION,
        ThreatKind::CODE_INJECTION,
    };
};

/**
 * @brief Aggregates detected threat kinds into a single severity
 */
class ThreatAssessor {
public:
    [[nodiscard]] static ThreatLevel baseline_severity(ThreatKind kind);

    /**
     * @brief Maximum baseline severity, then escalation per @p policy
     * @return NONE for an empty set
     */
    [[nodiscard]] static ThreatLevel assess(const std::set<ThreatKind>& threats,
                                            const ThreatPolicy& policy = {});

    /// Safe iff the level is NONE or LOW
    [[nodiscard]] static bool is_safe(ThreatLevel level) {
        return level <= ThreatLevel::LOW;
    }
};

} // namespace promptguard
