#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "llm/http_transport.hpp"
#include "llm/resilient_client.hpp"
#include "security/input_sanitizer.hpp"
#include "service/message_analyzer.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

using namespace promptguard;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitAnalysisFailed = 2;

struct CliOptions {
    std::optional<std::string> config_file;
    bool lenient = false;
    bool preserve_formatting = false;
    bool redact_pii = false;
    bool analyze = false;
};

void print_usage() {
    std::cerr << "Usage: promptguard [--config FILE] [--lenient] [--preserve-formatting]"
                 " [--redact-pii] [--analyze]\n"
                 "Reads text from stdin and prints the result as JSON.\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if (arg == "--lenient") {
            opts.lenient = true;
        } else if (arg == "--preserve-formatting") {
            opts.preserve_formatting = true;
        } else if (arg == "--redact-pii") {
            opts.redact_pii = true;
        } else if (arg == "--analyze") {
            opts.analyze = true;
        } else {
            return std::nullopt;
        }
    }
    return opts;
}

nlohmann::json sanitization_to_json(const SanitizationResult& r) {
    nlohmann::json threats = nlohmann::json::array();
    for (const auto kind : r.detected_threats()) {
        threats.push_back(threat_kind_to_string(kind));
    }
    return {
        {"sanitized_text", r.sanitized_text()},
        {"is_safe", r.is_safe()},
        {"threat_level", threat_level_to_string(r.threat_level())},
        {"detected_threats", std::move(threats)},
        {"modifications_made", r.modifications_made()},
        {"original_length", r.original_length()},
    };
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto cli = parse_args(argc, argv);
    if (!cli) {
        print_usage();
        return kExitConfigError;
    }

    try {
        // Configuration
        AppConfig config;
        if (cli->config_file) {
            auto loaded = ConfigLoader::load_from_file(*cli->config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return kExitConfigError;
            }
            config = std::move(loaded.config);
        }
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        SanitizeOptions options = config.sanitizer.options;
        if (cli->lenient) options.strict = false;
        if (cli->preserve_formatting) options.preserve_formatting = true;
        if (cli->redact_pii) options.redact_pii = true;

        const std::string input{std::istreambuf_iterator<char>(std::cin),
                                std::istreambuf_iterator<char>()};

        InputSanitizer sanitizer(InputSanitizer::Config{config.sanitizer.limits, config.threat_policy});

        if (!cli->analyze) {
            const auto result = sanitizer.sanitize(input, options);
            std::cout << sanitization_to_json(result).dump(
                2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
            return kExitOk;
        }

        // Analysis against the configured provider
        HttpModelTransport::Config transport_config;
        transport_config.provider = parse_model_provider(config.llm.provider).value_or(ModelProvider::GEMINI);
        transport_config.endpoint = config.llm.endpoint;
        transport_config.api_key = config.llm.api_key;
        transport_config.connect_timeout = std::chrono::milliseconds(config.llm.connect_timeout_ms);

        ResilientClient::Config client_config;
        client_config.model_name = config.llm.model;
        client_config.retry = config.retry;

        auto client = std::make_shared<ResilientClient>(
            std::make_shared<HttpModelTransport>(std::move(transport_config)),
            std::move(client_config),
            &MessageAnalyzer::validate_analysis);

        MessageAnalyzer::Config analyzer_config;
        analyzer_config.sanitize = options;
        analyzer_config.fallback_on_error = config.llm.fallback_on_error;
        analyzer_config.block_level = config.block_level;

        const double temperature = config.llm.temperature;
        const int max_tokens = config.llm.max_tokens;
        MessageAnalyzer analyzer(
            std::move(sanitizer), client, analyzer_config,
            [temperature, max_tokens](std::string_view sanitized, const AnalyzeRequest& request) {
                auto req = MessageAnalyzer::default_prompt_builder(sanitized, request);
                req.temperature = temperature;
                req.max_tokens = max_tokens;
                return req;
            });

        try {
            const auto result = analyzer.analyze(AnalyzeRequest{input, std::nullopt, std::nullopt});
            std::cout << nlohmann::json(result).dump(
                2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        } catch (const InvocationError& e) {
            utils::log::error(std::format("Analysis failed: {}", error_class_to_string(e.error_class())));
            return kExitAnalysisFailed;
        }

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitConfigError;
    }

    return kExitOk;
}
