#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace promptguard {

/**
 * @brief Bounded repair of near-valid JSON objects from model output
 *
 * Repair never invents content: it cuts to the outermost object, drops
 * trailing commas outside string literals and closes at most
 * kMaxBraceRepair unclosed braces. Anything else fails with REPAIR_FAILED.
 */
class JsonRepair {
public:
    static constexpr int kMaxBraceRepair = 2;

    /// Remove a surrounding ```json ... ``` (or bare ```) fence
    [[nodiscard]] static std::string strip_code_fences(std::string_view text);

    /// Drop commas directly followed (modulo whitespace) by '}' or ']'
    [[nodiscard]] static std::string remove_trailing_commas(std::string_view text);

    [[nodiscard]] static Result<std::string> repair_json(std::string_view text);

    /**
     * @brief Strict parse first, repair and re-parse on failure
     * @return a JSON object, or REPAIR_FAILED
     */
    [[nodiscard]] static Result<nlohmann::json> parse_structured(std::string_view text);
};

} // namespace promptguard
