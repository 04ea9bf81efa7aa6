#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

/**
 * @brief Typed PII span (byte offset/length into the scanned text)
 */
struct PiiMatch {
    PiiKind kind;
    size_t offset = 0;
    size_t length = 0;
};

/**
 * @brief PII detection and redaction for log-bound text
 *
 * Independent of the sanitization pipeline. All methods are pure, use only
 * the shared PatternTable and never throw: a regex failure is logged and
 * treated as "contains PII" (detection) or replaced wholesale by
 * kRedactionFailed (redaction).
 */
class PiiGuard {
public:
    static constexpr std::string_view kRedactionFailed = "[REDACTED]";

    /**
     * @brief All PII spans, non-overlapping and ordered by offset
     *
     * Overlaps resolve to the earliest start, then the longest span, then
     * kind priority (email, credit card, SSN, phone).
     */
    [[nodiscard]] static std::vector<PiiMatch> find_pii(std::string_view text);

    /// False if any PII pattern matches anywhere in @p text
    [[nodiscard]] static bool is_safe_for_logging(std::string_view text) noexcept;

    /// Replace every PII span with its placeholder; idempotent
    [[nodiscard]] static std::string redact_pii(std::string_view text) noexcept;

    [[nodiscard]] static std::string_view placeholder(PiiKind kind);
};

} // namespace promptguard
