#pragma once

#include "security/sanitization_result.hpp"
#include "security/sanitize_stages.hpp"
#include "security/threat_assessor.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace promptguard {

struct SanitizerLimits {
    /// Largest accepted max_input_length; regex stages scan whole texts
    static constexpr size_t kMaxInputLengthCeiling = 16384;

    size_t max_input_length = 5000;
    size_t max_line_length = 500;
    size_t max_char_repetition = 50;
    size_t max_word_repetition = 10;
};

struct SanitizeOptions {
    bool strict = true;                 // run code-injection removal
    bool preserve_formatting = false;   // only trim trailing whitespace per line
    bool redact_pii = false;            // replace PII spans with placeholders
};

/**
 * @brief Multi-stage sanitizer for untrusted text bound for a model prompt
 *
 * Stage order: truncate, UTF-8 repair, NFC normalization, invisible
 * characters, prompt injection, code injection (strict only), HTML escape,
 * whitespace, repetition, line length, control characters, PII, length
 * clamp, assessment.
 *
 * sanitize() is const, holds no per-call state and never throws. The
 * sanitized text never exceeds limits.max_input_length bytes.
 */
class InputSanitizer {
public:
    struct Config {
        SanitizerLimits limits;
        ThreatPolicy policy;
    };

    InputSanitizer() = default;
    explicit InputSanitizer(Config config) : config_(std::move(config)) {}

    [[nodiscard]] SanitizationResult sanitize(std::optional<std::string_view> text,
                                              const SanitizeOptions& options = {}) const noexcept;

    [[nodiscard]] const Config& config() const { return config_; }

    /// Ordered stage list for @p options (exposed for inspection in tests)
    [[nodiscard]] std::vector<SanitizeStagePtr> build_stages(const SanitizeOptions& options) const;

private:
    Config config_;
};

/**
 * @brief Sanitize with default limits and policy
 *
 * Empty or absent input yields a safe result with threat level NONE.
 */
[[nodiscard]] SanitizationResult sanitize(std::optional<std::string_view> text,
                                          bool strict = true,
                                          bool preserve_formatting = false) noexcept;

} // namespace promptguard
