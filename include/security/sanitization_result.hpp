#pragma once

#include "core/types.hpp"
#include "security/threat_assessor.hpp"

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

/**
 * @brief Immutable outcome of one sanitization run
 *
 * No setters: each stage derives a new value through the with_* methods.
 * A fresh result is safe with ThreatLevel::NONE until assessed.
 */
class SanitizationResult {
public:
    SanitizationResult() = default;

    SanitizationResult(std::string text, size_t original_length)
        : text_(std::move(text)), original_length_(original_length) {}

    [[nodiscard]] const std::string& sanitized_text() const { return text_; }
    [[nodiscard]] bool is_safe() const { return is_safe_; }
    [[nodiscard]] ThreatLevel threat_level() const { return threat_level_; }
    [[nodiscard]] const std::set<ThreatKind>& detected_threats() const { return threats_; }
    [[nodiscard]] const std::vector<std::string>& modifications_made() const { return modifications_; }
    [[nodiscard]] size_t original_length() const { return original_length_; }

    [[nodiscard]] bool has_threat(ThreatKind kind) const {
        return threats_.contains(kind);
    }

    [[nodiscard]] bool was_modified(std::string_view modification) const {
        for (const auto& m : modifications_) {
            if (m == modification) return true;
        }
        return false;
    }

    /// New result carrying @p text, with @p modification appended to the audit trail
    [[nodiscard]] SanitizationResult with_text(std::string text, std::string_view modification) const {
        SanitizationResult next = *this;
        next.text_ = std::move(text);
        next.modifications_.emplace_back(modification);
        return next;
    }

    [[nodiscard]] SanitizationResult with_threat(ThreatKind kind) const {
        SanitizationResult next = *this;
        next.threats_.insert(kind);
        return next;
    }

    [[nodiscard]] SanitizationResult with_assessment(ThreatLevel level) const {
        SanitizationResult next = *this;
        next.threat_level_ = level;
        next.is_safe_ = ThreatAssessor::is_safe(level);
        return next;
    }

private:
    std::string text_;
    bool is_safe_ = true;
    ThreatLevel threat_level_ = ThreatLevel::NONE;
    std::set<ThreatKind> threats_;
    std::vector<std::string> modifications_;
    size_t original_length_ = 0;
};

} // namespace promptguard
