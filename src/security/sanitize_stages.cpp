#include "security/sanitize_stages.hpp"
#include "security/pattern_table.hpp"
#include "security/pii_guard.hpp"
#include "core/unicode.hpp"
#include "core/utils.hpp"

#include <regex>

namespace promptguard {

namespace {

// Longest entity the escape stage produces ("&gt;") plus headroom for
// user-supplied named entities.
constexpr size_t kMaxEntityLength = 8;

constexpr std::string_view kTruncationMarker = "...";

bool is_invisible(std::string_view s, size_t i) {
    if (i + 2 >= s.size()) return false;
    const auto b0 = static_cast<unsigned char>(s[i]);
    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    const auto b2 = static_cast<unsigned char>(s[i + 2]);
    if (b0 == 0xEF) return b1 == 0xBB && b2 == 0xBF;               // U+FEFF
    if (b0 != 0xE2) return false;
    if (b1 == 0x80) {
        return (b2 >= 0x8B && b2 <= 0x8D)                          // U+200B-U+200D
            || (b2 >= 0xAA && b2 <= 0xAE);                         // U+202A-U+202E
    }
    if (b1 == 0x81) {
        return b2 == 0xA0                                          // U+2060
            || (b2 >= 0xA6 && b2 <= 0xA9);                         // U+2066-U+2069
    }
    return false;
}

std::string remove_fenced_blocks(std::string_view text) {
    static constexpr std::string_view kFence = "```";
    std::string out;
    size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find(kFence, pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, open - pos));
        const auto close = text.find(kFence, open + kFence.size());
        if (close == std::string_view::npos) {
            // Unterminated fence swallows the rest of the input
            break;
        }
        pos = close + kFence.size();
    }
    return out;
}

std::string drop_matching_lines(const std::string& text, const std::regex& re) {
    auto lines = utils::split_lines(text);
    std::vector<std::string> kept;
    kept.reserve(lines.size());
    for (auto& line : lines) {
        if (!std::regex_search(line, re)) {
            kept.push_back(std::move(line));
        }
    }
    return utils::join_lines(kept);
}

bool is_stripped_control(unsigned char c) {
    if (c == '\t' || c == '\n' || c == '\r') return false;
    return c < 0x20 || c == 0x7F;
}

bool is_c1_control(unsigned char b0, unsigned char b1) {
    return b0 == 0xC2 && b1 >= 0x80 && b1 <= 0x9F;
}

// Code points ControlCharacterStage removes
bool is_control_code_point(std::string_view cp) {
    if (cp.size() == 1) return is_stripped_control(static_cast<unsigned char>(cp[0]));
    if (cp.size() == 2) {
        return is_c1_control(static_cast<unsigned char>(cp[0]), static_cast<unsigned char>(cp[1]));
    }
    return false;
}

std::string without_controls(std::string_view token) {
    std::string out;
    out.reserve(token.size());
    for (const auto cp : utils::utf8_code_points(token)) {
        if (!is_control_code_point(cp)) out.append(cp);
    }
    return out;
}

} // anonymous namespace

size_t safe_cut_point(std::string_view text, size_t max_bytes) {
    size_t cut = utils::utf8_safe_prefix(text, max_bytes);
    if (cut >= text.size() || cut == 0) return cut;

    const auto amp = text.rfind('&', cut - 1);
    if (amp == std::string_view::npos || cut - amp >= kMaxEntityLength) return cut;

    // '&' whose terminating ';' lies past the cut: back off to the '&'
    const auto semi = text.find(';', amp);
    if (semi != std::string_view::npos && semi >= cut && semi - amp < kMaxEntityLength) {
        cut = amp;
    }
    return cut;
}

// ============================================================================
// TruncateStage
// ============================================================================

SanitizationResult TruncateStage::apply(const SanitizationResult& in) const {
    const auto& text = in.sanitized_text();
    if (text.size() <= max_bytes_) return in;

    const size_t cut = utils::utf8_safe_prefix(text, max_bytes_);
    return in.with_text(text.substr(0, cut), "truncated")
             .with_threat(ThreatKind::OVERSIZED_INPUT);
}

// ============================================================================
// Utf8RepairStage
// ============================================================================

SanitizationResult Utf8RepairStage::apply(const SanitizationResult& in) const {
    const auto& text = in.sanitized_text();
    if (unicode::is_valid_utf8(text)) return in;
    return in.with_text(unicode::repair_utf8(text), "replaced_invalid_utf8");
}

// ============================================================================
// UnicodeNormalizationStage
// ============================================================================

SanitizationResult UnicodeNormalizationStage::apply(const SanitizationResult& in) const {
    const auto& text = in.sanitized_text();
    auto normalized = unicode::to_nfc(text);
    if (!normalized) {
        utils::log::warn(std::format("Unicode normalization failed, {} bytes left as-is", text.size()));
        return in;
    }
    if (*normalized == text) return in;
    return in.with_text(std::move(*normalized), "normalized_unicode");
}

// ============================================================================
// InvisibleCharacterStage
// ============================================================================

SanitizationResult InvisibleCharacterStage::apply(const SanitizationResult& in) const {
    const std::string_view text = in.sanitized_text();
    std::string out;
    out.reserve(text.size());

    bool removed = false;
    for (size_t i = 0; i < text.size();) {
        if (is_invisible(text, i)) {
            removed = true;
            i += 3;
            continue;
        }
        out += text[i++];
    }

    if (!removed) return in;
    return in.with_text(std::move(out), "removed_invisible_characters")
             .with_threat(ThreatKind::CONTROL_CHARACTERS);
}

// ============================================================================
// PromptInjectionStage
// ============================================================================

SanitizationResult PromptInjectionStage::apply(const SanitizationResult& in) const {
    const auto& patterns = PatternTable::instance();
    auto lines = utils::split_lines(in.sanitized_text());

    std::vector<std::string> kept;
    kept.reserve(lines.size());
    size_t removed = 0;
    bool code_in_removed = false;

    for (auto& line : lines) {
        if (patterns.matches_injection(line)) {
            ++removed;
            if (scan_removed_for_code_ && patterns.matches_code(line)) {
                code_in_removed = true;
            }
            continue;
        }
        kept.push_back(std::move(line));
    }

    if (removed == 0) return in;

    utils::log::debug(std::format("Removed {} injection line(s)", removed));
    auto out = in.with_text(utils::join_lines(kept), "removed_prompt_injection")
                 .with_threat(ThreatKind::PROMPT_INJECTION);
    if (code_in_removed) {
        out = out.with_threat(ThreatKind::CODE_INJECTION);
    }
    return out;
}

// ============================================================================
// CodeInjectionStage
// ============================================================================

SanitizationResult CodeInjectionStage::apply(const SanitizationResult& in) const {
    std::string text = in.sanitized_text();
    bool found = false;

    for (const auto& entry : PatternTable::instance().code_patterns()) {
        if (!std::regex_search(text, entry.regex)) continue;
        found = true;

        switch (entry.scope) {
            case RemovalScope::FENCED_BLOCK:
                text = remove_fenced_blocks(text);
                break;
            case RemovalScope::LINE:
                text = drop_matching_lines(text, entry.regex);
                break;
            case RemovalScope::SPAN:
                text = std::regex_replace(text, entry.regex, "");
                break;
        }
    }

    if (!found) return in;
    return in.with_text(std::move(text), "removed_code")
             .with_threat(ThreatKind::CODE_INJECTION);
}

// ============================================================================
// HtmlEscapeStage
// ============================================================================

SanitizationResult HtmlEscapeStage::apply(const SanitizationResult& in) const {
    const auto& text = in.sanitized_text();
    if (text.find_first_of("<>") == std::string::npos) return in;

    std::string out;
    out.reserve(text.size() + 16);
    for (const char c : text) {
        switch (c) {
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default:  out += c; break;
        }
    }
    return in.with_text(std::move(out), "html_escaped");
}

// ============================================================================
// WhitespaceStage
// ============================================================================

SanitizationResult WhitespaceStage::apply(const SanitizationResult& in) const {
    const auto& text = in.sanitized_text();
    std::string out;
    out.reserve(text.size());

    if (preserve_formatting_) {
        auto lines = utils::split_lines(text);
        for (auto& line : lines) {
            const auto end = line.find_last_not_of(" \t\r\f\v");
            line.erase(end == std::string::npos ? 0 : end + 1);
        }
        out = utils::join_lines(lines);
    } else {
        bool pending_space = false;
        for (const char c : text) {
            if (utils::is_space(c)) {
                pending_space = !out.empty();
                continue;
            }
            if (pending_space) {
                out += ' ';
                pending_space = false;
            }
            out += c;
        }
    }

    if (out == text) return in;
    return in.with_text(std::move(out), "normalized_whitespace");
}

// ============================================================================
// RepetitionStage
// ============================================================================

std::string RepetitionStage::compress_char_runs(std::string_view text, size_t max_run) {
    std::string out;
    out.reserve(text.size());

    std::string_view prev;
    size_t run = 0;
    for (const auto cp : utils::utf8_code_points(text)) {
        if (is_control_code_point(cp)) {
            out.append(cp);
            continue;
        }
        run = (cp == prev) ? run + 1 : 1;
        prev = cp;
        if (run <= max_run) {
            out.append(cp);
        }
    }
    return out;
}

std::string RepetitionStage::compress_word_runs(std::string_view text, size_t max_run) {
    std::string out;
    out.reserve(text.size());

    std::string prev_key;
    size_t run = 0;
    size_t i = 0;
    while (i < text.size()) {
        const size_t ws_start = i;
        while (i < text.size() && utils::is_space(text[i])) ++i;
        const auto whitespace = text.substr(ws_start, i - ws_start);

        const size_t tok_start = i;
        while (i < text.size() && !utils::is_space(text[i])) ++i;
        const auto token = text.substr(tok_start, i - tok_start);

        if (token.empty()) {
            out.append(whitespace);
            break;
        }

        auto key = without_controls(token);
        if (key.empty()) {
            out.append(whitespace);
            out.append(token);
            continue;
        }

        run = (key == prev_key) ? run + 1 : 1;
        prev_key = std::move(key);
        if (run <= max_run) {
            out.append(whitespace);
            out.append(token);
        }
    }
    return out;
}

SanitizationResult RepetitionStage::apply(const SanitizationResult& in) const {
    const auto& text = in.sanitized_text();
    // Second character pass catches whitespace runs left between control-only tokens
    auto out = compress_char_runs(
        compress_word_runs(compress_char_runs(text, max_char_run_), max_word_run_),
        max_char_run_);

    if (out == text) return in;
    return in.with_text(std::move(out), "compressed_repetition")
             .with_threat(ThreatKind::EXCESSIVE_REPETITION);
}

// ============================================================================
// LineLengthStage
// ============================================================================

SanitizationResult LineLengthStage::apply(const SanitizationResult& in) const {
    auto lines = utils::split_lines(in.sanitized_text());
    bool truncated = false;

    for (auto& line : lines) {
        if (line.size() <= max_line_bytes_) continue;
        line.resize(safe_cut_point(line, max_line_bytes_));
        line += kTruncationMarker;
        truncated = true;
    }

    if (!truncated) return in;
    return in.with_text(utils::join_lines(lines), "truncated_long_lines");
}

// ============================================================================
// ControlCharacterStage
// ============================================================================

SanitizationResult ControlCharacterStage::apply(const SanitizationResult& in) const {
    const std::string_view text = in.sanitized_text();
    std::string out;
    out.reserve(text.size());

    bool removed = false;
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (is_stripped_control(c)) {
            removed = true;
            continue;
        }
        // C1 controls U+0080-U+009F
        if (c == 0xC2 && i + 1 < text.size()) {
            if (is_c1_control(c, static_cast<unsigned char>(text[i + 1]))) {
                removed = true;
                ++i;
                continue;
            }
        }
        out += text[i];
    }

    if (!removed) return in;
    return in.with_text(std::move(out), "removed_control_characters")
             .with_threat(ThreatKind::CONTROL_CHARACTERS);
}

// ============================================================================
// PiiStage
// ============================================================================

SanitizationResult PiiStage::apply(const SanitizationResult& in) const {
    const auto& text = in.sanitized_text();
    const auto matches = PiiGuard::find_pii(text);
    if (matches.empty()) return in;

    auto out = in.with_threat(ThreatKind::PII_DETECTED);
    if (redact_) {
        out = out.with_text(PiiGuard::redact_pii(text), "redacted_pii");
    }
    return out;
}

// ============================================================================
// LengthClampStage
// ============================================================================

SanitizationResult LengthClampStage::apply(const SanitizationResult& in) const {
    const auto& text = in.sanitized_text();
    if (text.size() <= max_bytes_) return in;
    return in.with_text(text.substr(0, safe_cut_point(text, max_bytes_)), "clamped_length");
}

// ============================================================================
// AssessmentStage
// ============================================================================

SanitizationResult AssessmentStage::apply(const SanitizationResult& in) const {
    return in.with_assessment(ThreatAssessor::assess(in.detected_threats(), policy_));
}

} // namespace promptguard
