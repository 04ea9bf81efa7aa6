#pragma once

#include "security/sanitization_result.hpp"
#include "security/threat_assessor.hpp"

#include <memory>
#include <string_view>

namespace promptguard {

/**
 * @brief One pure transform of the sanitization pipeline
 *
 * Stages never mutate their input; they return a derived result. A stage
 * that finds nothing to do returns its input unchanged (no modification
 * recorded).
 */
class ISanitizeStage {
public:
    virtual ~ISanitizeStage() = default;

    [[nodiscard]] virtual SanitizationResult apply(const SanitizationResult& in) const = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

using SanitizeStagePtr = std::unique_ptr<ISanitizeStage>;

// ============================================================================
// Input-shaping stages
// ============================================================================

class TruncateStage final : public ISanitizeStage {
public:
    explicit TruncateStage(size_t max_bytes) : max_bytes_(max_bytes) {}
    [[nodiscard]] SanitizationResult apply(const SanitizationResult& in) const override;
    [[nodiscard]] std::string_view name() const override { return "truncate"; }
private:
    size_t max_bytes_;
};

/// Replaces ill-formed UTF-8 bytes with U+FFFD
class Utf8RepairStage final : public ISanitizeStage {
public:
    [[nodiscard]] SanitizationResult apply(const SanitizationResult& in) const override;
    [[nodiscard]] std::string_view name() const override { return "utf8_repair"; }
};

/// Canonical composition (NFC)
class UnicodeNormalizationStage final : public ISanitizeStage {
public:
    [[nodiscard]] SanitizationResult apply(const SanitizationResult& in) const override;
    [[nodiscard]] std::string_view name() const override { return "unicode_normalization"; }
};

/// Zero-width characters, BOM and bidi overrides
class InvisibleCharacterStage final : public ISanitizeStage {
public:
    [[nodiscard]] SanitizationResult apply(const SanitizationResult& in) const override;
    [[nodiscard]] std::string_view name() const override { return "invisible_characters"; }
};

// ============================================================================
// Detection stages
// ============================================================================

/**
 * @brief Deletes every line matching an injection pattern
 *
 * With @p scan_removed_for_code, removed lines are also checked against the
 * code patterns so a line carrying both payloads still reports code_injection.
 */
class PromptInjectionStage final : public ISanitizeStage {
public:
    explicit PromptInjectionStage(bool scan_removed_for_code)
        : scan_removed_for_code_(scan_removed_for_code) {}
    [[nodiscard]] SanitizationResult apply(const SanitizationResult& in) const override;
    [[nodiscard]] std::string_view name() const override { return "prompt_injection"; }
private:
    bool scan_removed_for_code_;
};

class CodeInjectionStage final : public ISanitizeStage {
public:
    [[nodiscard]] SanitizationResult apply(const SanitizationResult& in) const override;
    [[nodiscard]] std::string_view name() const override { return "code_injection"; }
};

// ============================================================================
// Normalization stages
// ============================================================================

class HtmlEscapeStage final : public ISanitizeStage {
public:
    [[nodiscard]] SanitizationResult apply(const SanitizationResult& in) const override;
    [[nodiscard]] std::string_view name() const override { return "html_escape"; }
};

class WhitespaceStage final : public ISanitizeStage {
public:
    explicit WhitespaceStage(bool preserve_formatting) : preserve_formatting_(preserve_formatting) {}
    [[nodiscard]] SanitizationResult apply(const SanitizationResult& in) const override;
    [[nodiscard]] std::string_view name() const override { return "whitespace"; }
private:
    bool preserve_formatting_;
};

/**
 * @brief Caps runs of identical code points and identical tokens
 *
 * Excess repetitions are dropped (a dropped token takes its preceding
 * whitespace with it). Control code points stripped by the control stage
 * do not break a run, and tokens compare with them removed.
 */
class RepetitionStage final : public ISanitizeStage {
public:
    RepetitionStage(size_t max_char_run, size_t max_word_run)
        : max_char_run_(max_char_run), max_word_run_(max_word_run) {}
    [[nodiscard]] SanitizationResult apply(const SanitizationResult& in) const override;
    [[nodiscard]] std::string_view name() const override { return "repetition"; }

    [[nodiscard]] static std::string compress_char_runs(std::string_view text, size_t max_run);
    [[nodiscard]] static std::string compress_word_runs(std::string_view text, size_t max_run);
private:
    size_t max_char_run_;
    size_t max_word_run_;
};

class LineLengthStage final : public ISanitizeStage {
public:
    explicit LineLengthStage(size_t max_line_bytes) : max_line_bytes_(max_line_bytes) {}
    [[nodiscard]] SanitizationResult apply(const SanitizationResult& in) const override;
    [[nodiscard]] std::string_view name() const override { return "line_length"; }
private:
    size_t max_line_bytes_;
};

/// Strips C0/C1 controls and DEL; keeps tab, newline and carriage return
class ControlCharacterStage final : public ISanitizeStage {
public:
    [[nodiscard]] SanitizationResult apply(const SanitizationResult& in) const override;
    [[nodiscard]] std::string_view name() const override { return "control_characters"; }
};

/// Marks pii_detected; replaces spans with placeholders when @p redact
class PiiStage final : public ISanitizeStage {
public:
    explicit PiiStage(bool redact) : redact_(redact) {}
    [[nodiscard]] SanitizationResult apply(const SanitizationResult& in) const override;
    [[nodiscard]] std::string_view name() const override { return "pii"; }
private:
    bool redact_;
};

/// Re-applies the byte limit after escaping, on a UTF-8 and entity boundary
class LengthClampStage final : public ISanitizeStage {
public:
    explicit LengthClampStage(size_t max_bytes) : max_bytes_(max_bytes) {}
    [[nodiscard]] SanitizationResult apply(const SanitizationResult& in) const override;
    [[nodiscard]] std::string_view name() const override { return "length_clamp"; }
private:
    size_t max_bytes_;
};

// ============================================================================
// Assessment
// ============================================================================

class AssessmentStage final : public ISanitizeStage {
public:
    explicit AssessmentStage(ThreatPolicy policy) : policy_(std::move(policy)) {}
    [[nodiscard]] SanitizationResult apply(const SanitizationResult& in) const override;
    [[nodiscard]] std::string_view name() const override { return "assessment"; }
private:
    ThreatPolicy policy_;
};

/**
 * @brief Largest prefix of @p text no longer than @p max_bytes that splits
 * neither a UTF-8 sequence nor an HTML entity
 */
[[nodiscard]] size_t safe_cut_point(std::string_view text, size_t max_bytes);

} // namespace promptguard
