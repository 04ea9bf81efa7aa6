#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace promptguard {

/**
 * @brief Pulls the textual payload out of a provider response of unknown shape
 *
 * Strategies run in fixed priority; the first one yielding a non-blank
 * (trimmed) string wins:
 *  1. top-level "text" (or the response itself when it is a string)
 *  2. first candidate: candidates[0] / choices[0] and its output, text,
 *     content (string or parts[*].text) or message.content
 *  3. generic output_text / output / content (string or text blocks)
 */
class ResponseExtractor {
public:
    using Strategy = std::function<std::optional<std::string>(const nlohmann::json&)>;

    /// @return the payload text, or EXTRACTION_FAILED when every strategy comes up empty
    [[nodiscard]] static Result<std::string> extract(const nlohmann::json& response);

    [[nodiscard]] static std::optional<std::string> from_text_field(const nlohmann::json& response);
    [[nodiscard]] static std::optional<std::string> from_first_candidate(const nlohmann::json& response);
    [[nodiscard]] static std::optional<std::string> from_generic_output(const nlohmann::json& response);

    [[nodiscard]] static const std::vector<Strategy>& strategies();
};

} // namespace promptguard
