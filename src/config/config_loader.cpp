#include "config/config_loader.hpp"
#include "llm/http_transport.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace promptguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

/// Non-negative integer setting; negative values are a load error
uint64_t toml_unsigned(const toml::table& tbl, std::string_view section,
                       std::string_view key, uint64_t fallback) {
    const int64_t v = tbl[key].value_or(static_cast<int64_t>(fallback));
    if (v < 0) {
        throw std::runtime_error(std::format("{}.{} must not be negative, got {}", section, key, v));
    }
    return static_cast<uint64_t>(v);
}

ThreatLevel parse_level_setting(const std::string& value, std::string_view setting) {
    const auto level = parse_threat_level(utils::to_lower(value));
    if (!level) {
        throw std::runtime_error(std::format("{}: unknown threat level '{}'", setting, value));
    }
    return *level;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

SanitizerConfig ConfigLoader::extract_sanitizer(const toml::table& root) {
    SanitizerConfig cfg;
    const auto* sanitizer = root["sanitizer"].as_table();
    if (!sanitizer) return cfg;
    const auto& s = *sanitizer;

    auto& limits = cfg.limits;
    limits.max_input_length = toml_unsigned(s, "sanitizer", "max_input_length", limits.max_input_length);
    limits.max_line_length = toml_unsigned(s, "sanitizer", "max_line_length", limits.max_line_length);
    limits.max_char_repetition = toml_unsigned(s, "sanitizer", "max_char_repetition", limits.max_char_repetition);
    limits.max_word_repetition = toml_unsigned(s, "sanitizer", "max_word_repetition", limits.max_word_repetition);

    cfg.options.strict = s["strict"].value_or(cfg.options.strict);
    cfg.options.preserve_formatting = s["preserve_formatting"].value_or(cfg.options.preserve_formatting);
    cfg.options.redact_pii = s["redact_pii"].value_or(cfg.options.redact_pii);
    return cfg;
}

ThreatPolicy ConfigLoader::extract_threat_policy(const toml::table& root) {
    ThreatPolicy policy;
    const auto* section = root["threat_policy"].as_table();
    if (!section) return policy;
    const auto& t = *section;

    policy.escalation_enabled = t["escalation_enabled"].value_or(policy.escalation_enabled);
    policy.min_distinct_kinds = toml_unsigned(t, "threat_policy", "min_distinct_kinds",
                                              policy.min_distinct_kinds);

    if (const auto level = toml_optional_string(t, "escalated_level")) {
        policy.escalated_level = parse_level_setting(*level, "threat_policy.escalated_level");
    }

    if (t.contains("trigger_kinds")) {
        policy.trigger_kinds.clear();
        for (const auto& name : toml_string_array(t, "trigger_kinds")) {
            const auto kind = parse_threat_kind(utils::to_lower(name));
            if (!kind) {
                throw std::runtime_error(
                    std::format("threat_policy.trigger_kinds: unknown threat kind '{}'", name));
            }
            policy.trigger_kinds.push_back(*kind);
        }
    }
    return policy;
}

std::optional<ThreatLevel> ConfigLoader::extract_block_level(const toml::table& root) {
    const auto* section = root["threat_policy"].as_table();
    if (!section) return std::nullopt;

    const auto level = toml_optional_string(*section, "block_level");
    if (!level) return std::nullopt;
    return parse_level_setting(*level, "threat_policy.block_level");
}

LlmConfig ConfigLoader::extract_llm(const toml::table& root) {
    LlmConfig cfg;
    const auto* llm = root["llm"].as_table();
    if (!llm) return cfg;
    const auto& l = *llm;

    cfg.provider = l["provider"].value_or(cfg.provider);
    cfg.endpoint = l["endpoint"].value_or(cfg.endpoint);
    cfg.api_key = l["api_key"].value_or(""s);
    cfg.model = l["model"].value_or(cfg.model);
    cfg.temperature = l["temperature"].value_or(cfg.temperature);
    cfg.max_tokens = static_cast<int>(toml_unsigned(l, "llm", "max_tokens",
                                                    static_cast<uint64_t>(cfg.max_tokens)));
    cfg.fallback_on_error = l["fallback_on_error"].value_or(cfg.fallback_on_error);
    cfg.connect_timeout_ms = static_cast<uint32_t>(
        toml_unsigned(l, "llm", "connect_timeout_ms", cfg.connect_timeout_ms));
    return cfg;
}

RetryPolicy ConfigLoader::extract_retry(const toml::table& root) {
    RetryPolicy cfg;
    const auto* retry = root["retry"].as_table();
    if (!retry) return cfg;
    const auto& r = *retry;

    cfg.max_attempts = static_cast<uint32_t>(toml_unsigned(r, "retry", "max_attempts", cfg.max_attempts));
    cfg.base_backoff = std::chrono::milliseconds(
        toml_unsigned(r, "retry", "base_backoff_ms", static_cast<uint64_t>(cfg.base_backoff.count())));
    cfg.max_backoff = std::chrono::milliseconds(
        toml_unsigned(r, "retry", "max_backoff_ms", static_cast<uint64_t>(cfg.max_backoff.count())));
    cfg.jitter_ratio = r["jitter_ratio"].value_or(cfg.jitter_ratio);
    cfg.deadline = std::chrono::milliseconds(
        toml_unsigned(r, "retry", "deadline_ms", static_cast<uint64_t>(cfg.deadline.count())));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

// ---- Aggregation -----------------------------------------------------------

AppConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.sanitizer = extract_sanitizer(tbl);
    config.threat_policy = extract_threat_policy(tbl);
    config.block_level = extract_block_level(tbl);
    config.llm = extract_llm(tbl);
    config.retry = extract_retry(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    const auto& limits = config.sanitizer.limits;
    if (limits.max_input_length == 0) errors.emplace_back("sanitizer.max_input_length must be positive");
    if (limits.max_input_length > SanitizerLimits::kMaxInputLengthCeiling) {
        errors.push_back(std::format("sanitizer.max_input_length must be at most {}",
                                     SanitizerLimits::kMaxInputLengthCeiling));
    }
    if (limits.max_line_length == 0) errors.emplace_back("sanitizer.max_line_length must be positive");
    if (limits.max_char_repetition == 0) errors.emplace_back("sanitizer.max_char_repetition must be positive");
    if (limits.max_word_repetition == 0) errors.emplace_back("sanitizer.max_word_repetition must be positive");

    if (config.threat_policy.min_distinct_kinds == 0) {
        errors.emplace_back("threat_policy.min_distinct_kinds must be positive");
    }

    if (!parse_model_provider(config.llm.provider)) {
        errors.push_back(std::format("llm.provider must be 'gemini' or 'openai', got '{}'",
                                     config.llm.provider));
    }
    if (config.llm.endpoint.empty()) {
        errors.emplace_back("llm.endpoint must not be empty");
    }
    if (config.llm.model.empty()) {
        errors.emplace_back("llm.model must not be empty");
    }
    if (config.llm.temperature < 0.0 || config.llm.temperature > 2.0) {
        errors.push_back(std::format("llm.temperature must be 0.0-2.0, got {}", config.llm.temperature));
    }
    if (config.llm.max_tokens == 0) {
        errors.emplace_back("llm.max_tokens must be positive");
    }

    const auto& retry = config.retry;
    if (retry.max_attempts == 0) {
        errors.emplace_back("retry.max_attempts must be at least 1");
    }
    if (retry.max_backoff < retry.base_backoff) {
        errors.push_back(std::format("retry.max_backoff_ms ({}) < base_backoff_ms ({})",
                                     retry.max_backoff.count(), retry.base_backoff.count()));
    }
    if (retry.jitter_ratio < 0.0 || retry.jitter_ratio > 1.0) {
        errors.push_back(std::format("retry.jitter_ratio must be 0.0-1.0, got {}", retry.jitter_ratio));
    }
    if (retry.deadline.count() == 0) {
        errors.emplace_back("retry.deadline_ms must be positive");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
                                     config.logging.level));
    }

    return errors;
}

} // namespace promptguard
