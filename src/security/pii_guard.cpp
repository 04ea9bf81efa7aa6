#include "security/pii_guard.hpp"
#include "security/pattern_table.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace promptguard {

namespace {

// Placeholders contain no digits and no '@', so they never match a PII pattern
constexpr int kMaxRedactionPasses = 4;

// std::regex recursion depth grows with the scanned length, so text is
// searched in bounded windows. Consecutive windows overlap, and a match
// that touches the end of a non-final window is rescanned by the next one.
constexpr size_t kScanWindow = 4096;
constexpr size_t kWindowOverlap = 256;

bool is_word_byte(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_';
}

// Moves a window start back to a token boundary when one lies within reach
size_t align_window_start(std::string_view text, size_t start, size_t floor) {
    size_t aligned = start;
    while (aligned > floor + 1 && start - aligned < kWindowOverlap && is_word_byte(text[aligned - 1])) {
        --aligned;
    }
    return is_word_byte(text[aligned - 1]) ? start : aligned;
}

size_t priority_of(PiiKind kind) {
    const auto& patterns = PatternTable::instance().pii_patterns();
    for (size_t i = 0; i < patterns.size(); ++i) {
        if (patterns[i].kind == kind) return i;
    }
    return patterns.size();
}

} // anonymous namespace

std::string_view PiiGuard::placeholder(PiiKind kind) {
    switch (kind) {
        case PiiKind::EMAIL:       return "[EMAIL_REDACTED]";
        case PiiKind::PHONE:       return "[PHONE_REDACTED]";
        case PiiKind::CREDIT_CARD: return "[CARD_REDACTED]";
        case PiiKind::SSN:         return "[SSN_REDACTED]";
        default:                   return kRedactionFailed;
    }
}

std::vector<PiiMatch> PiiGuard::find_pii(std::string_view text) {
    std::vector<PiiMatch> candidates;
    const auto& patterns = PatternTable::instance().pii_patterns();

    size_t start = 0;
    while (start < text.size()) {
        const size_t end = std::min(text.size(), start + kScanWindow);
        const bool last = end == text.size();
        size_t next = last ? end : end - kWindowOverlap;

        const char* window_begin = text.data() + start;
        const char* window_end = text.data() + end;
        for (const auto& pattern : patterns) {
            for (std::cregex_iterator it(window_begin, window_end, pattern.regex), stop; it != stop; ++it) {
                const auto& m = *it;
                if (m.length(0) == 0) continue;

                const size_t offset = start + static_cast<size_t>(m.position(0));
                const size_t length = static_cast<size_t>(m.length(0));
                if (!last && offset + length == end && offset > start) {
                    next = std::min(next, offset);
                    continue;
                }
                candidates.push_back({pattern.kind, offset, length});
            }
        }

        if (last) break;
        start = align_window_start(text, next, start);
    }

    std::sort(candidates.begin(), candidates.end(),
        [](const PiiMatch& a, const PiiMatch& b) {
            if (a.offset != b.offset) return a.offset < b.offset;
            if (a.length != b.length) return a.length > b.length;
            return priority_of(a.kind) < priority_of(b.kind);
        });

    std::vector<PiiMatch> selected;
    size_t covered_until = 0;
    for (const auto& c : candidates) {
        if (!selected.empty() && c.offset < covered_until) continue;
        selected.push_back(c);
        covered_until = c.offset + c.length;
    }
    return selected;
}

bool PiiGuard::is_safe_for_logging(std::string_view text) noexcept {
    if (text.empty()) return true;
    try {
        return find_pii(text).empty();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("PII detection failed ({}), treating text as unsafe", e.what()));
        return false;
    }
}

std::string PiiGuard::redact_pii(std::string_view text) noexcept {
    try {
        std::string current(text);
        for (int pass = 0; pass < kMaxRedactionPasses; ++pass) {
            const auto matches = find_pii(current);
            if (matches.empty()) return current;

            std::string out;
            out.reserve(current.size());
            size_t pos = 0;
            for (const auto& m : matches) {
                out.append(current, pos, m.offset - pos);
                out += placeholder(m.kind);
                pos = m.offset + m.length;
            }
            out.append(current, pos, std::string::npos);
            current = std::move(out);
        }
        // Still matching after the pass budget: fail closed
        if (!find_pii(current).empty()) {
            utils::log::warn("PII redaction did not converge, replacing text");
            return std::string(kRedactionFailed);
        }
        return current;
    } catch (const std::exception& e) {
        utils::log::warn(std::format("PII redaction failed ({}), replacing text", e.what()));
        return std::string(kRedactionFailed);
    }
}

} // namespace promptguard
