#pragma once

#include "core/types.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

/**
 * @brief How much text a code-pattern hit removes
 */
enum class RemovalScope : uint8_t {
    SPAN,           // only the matched characters
    LINE,           // the whole line containing the match
    FENCED_BLOCK    // opening fence through closing fence (multi-line)
};

struct PatternEntry {
    std::string label;
    std::regex regex;
    RemovalScope scope = RemovalScope::SPAN;
};

struct PiiPattern {
    PiiKind kind;
    std::regex regex;
};

/**
 * @brief Process-wide table of precompiled detection patterns
 *
 * Built once on first access (function-local static, thread-safe init) and
 * never mutated afterwards; every accessor is const and safe to share
 * across any number of concurrent sanitizer calls.
 *
 * Families:
 * - Injection: instruction override, role injection, jailbreak phrasing,
 *   delimiter spoofing (case-insensitive, matched per line)
 * - Code: fenced blocks, inline code, script/frame tags, script URIs,
 *   inline event handlers, dynamic evaluation calls
 * - PII: email, phone, credit card, SSN (in overlap-priority order)
 */
class PatternTable {
public:
    [[nodiscard]] static const PatternTable& instance();

    [[nodiscard]] const std::vector<PatternEntry>& injection_patterns() const {
        return injection_;
    }

    [[nodiscard]] const std::vector<PatternEntry>& code_patterns() const {
        return code_;
    }

    /// Ordered by overlap priority: email, credit card, SSN, phone
    [[nodiscard]] const std::vector<PiiPattern>& pii_patterns() const {
        return pii_;
    }

    /// True if any injection pattern matches @p line (raw or canonical form)
    [[nodiscard]] bool matches_injection(std::string_view line) const;

    /// True if any code pattern matches @p text
    [[nodiscard]] bool matches_code(std::string_view text) const;

    /**
     * @brief Canonical form used for injection matching
     *
     * Applies NFC, folds confusable homoglyphs (Cyrillic/Greek lookalikes) to ASCII,
     * replaces ASCII punctuation with spaces, collapses whitespace and
     * lowercases. Only used for detection, never returned to callers.
     */
    [[nodiscard]] static std::string canonicalize(std::string_view text);

    PatternTable(const PatternTable&) = delete;
    PatternTable& operator=(const PatternTable&) = delete;

private:
    PatternTable();

    std::vector<PatternEntry> injection_;
    std::vector<PatternEntry> code_;
    std::vector<PiiPattern> pii_;
};

} // namespace promptguard
