#include "security/input_sanitizer.hpp"
#include "core/utils.hpp"

#include <regex>

namespace promptguard {

namespace {

std::string describe_threats(const std::set<ThreatKind>& threats) {
    std::string out;
    for (const auto kind : threats) {
        if (!out.empty()) out += ',';
        out += threat_kind_to_string(kind);
    }
    return out;
}

} // anonymous namespace

std::vector<SanitizeStagePtr> InputSanitizer::build_stages(const SanitizeOptions& options) const {
    const auto& limits = config_.limits;

    std::vector<SanitizeStagePtr> stages;
    stages.push_back(std::make_unique<TruncateStage>(limits.max_input_length));
    stages.push_back(std::make_unique<Utf8RepairStage>());
    stages.push_back(std::make_unique<UnicodeNormalizationStage>());
    stages.push_back(std::make_unique<InvisibleCharacterStage>());
    stages.push_back(std::make_unique<PromptInjectionStage>(options.strict));
    if (options.strict) {
        stages.push_back(std::make_unique<CodeInjectionStage>());
    }
    stages.push_back(std::make_unique<HtmlEscapeStage>());
    stages.push_back(std::make_unique<WhitespaceStage>(options.preserve_formatting));
    stages.push_back(std::make_unique<RepetitionStage>(limits.max_char_repetition,
                                                       limits.max_word_repetition));
    stages.push_back(std::make_unique<LineLengthStage>(limits.max_line_length));
    stages.push_back(std::make_unique<ControlCharacterStage>());
    stages.push_back(std::make_unique<PiiStage>(options.redact_pii));
    stages.push_back(std::make_unique<LengthClampStage>(limits.max_input_length));
    stages.push_back(std::make_unique<AssessmentStage>(config_.policy));
    return stages;
}

SanitizationResult InputSanitizer::sanitize(std::optional<std::string_view> text,
                                            const SanitizeOptions& options) const noexcept {
    if (!text.has_value() || text->empty()) {
        return SanitizationResult{};
    }

    const size_t original_length = text->size();
    try {
        SanitizationResult current(std::string(*text), original_length);

        for (const auto& stage : build_stages(options)) {
            try {
                current = stage->apply(current);
            } catch (const std::regex_error& e) {
                // Leave the text as the previous stage produced it
                utils::log::warn(std::format("Sanitize stage '{}' skipped: regex error {}",
                                             stage->name(), static_cast<int>(e.code())));
            }
        }

        if (!current.detected_threats().empty()) {
            const auto msg = std::format(
                "Sanitized input: threats=[{}] level={} original_length={} sanitized_length={}",
                describe_threats(current.detected_threats()),
                threat_level_to_string(current.threat_level()),
                original_length, current.sanitized_text().size());
            if (current.is_safe()) {
                utils::log::info(msg);
            } else {
                utils::log::warn(msg);
            }
        }
        return current;
    } catch (const std::exception& e) {
        // Fail closed: nothing of the input survives
        utils::log::error(std::format("Sanitization failed ({}), input of {} bytes dropped",
                                      e.what(), original_length));
        return SanitizationResult(std::string{}, original_length)
            .with_text(std::string{}, "sanitization_failed")
            .with_assessment(ThreatLevel::HIGH);
    }
}

SanitizationResult sanitize(std::optional<std::string_view> text,
                            bool strict,
                            bool preserve_formatting) noexcept {
    static const InputSanitizer default_sanitizer;
    SanitizeOptions options;
    options.strict = strict;
    options.preserve_formatting = preserve_formatting;
    return default_sanitizer.sanitize(text, options);
}

} // namespace promptguard
