#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace promptguard {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to promptguard.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Semantic checks; empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static SanitizerConfig extract_sanitizer(const toml::table& root);
    static ThreatPolicy extract_threat_policy(const toml::table& root);
    static std::optional<ThreatLevel> extract_block_level(const toml::table& root);
    static LlmConfig extract_llm(const toml::table& root);
    static RetryPolicy extract_retry(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static AppConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace promptguard
