#include "llm/json_repair.hpp"
#include "core/utils.hpp"

namespace promptguard {

using json = nlohmann::json;

namespace {

constexpr std::string_view kFence = "```";

// Tracks whether a scan position is inside a JSON string literal
struct StringScanner {
    bool in_string = false;
    bool escaped = false;

    /// @return true if @p c is structural (outside any string literal)
    bool structural(char c) {
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            return false;
        }
        if (c == '"') {
            in_string = true;
            return false;
        }
        return true;
    }
};

} // anonymous namespace

std::string JsonRepair::strip_code_fences(std::string_view text) {
    std::string body = utils::trim(text);
    if (!body.starts_with(kFence)) return body;

    // Opening fence line may carry a language tag (```json)
    const auto nl = body.find('\n');
    body.erase(0, nl == std::string::npos ? kFence.size() : nl + 1);

    const auto close = body.rfind(kFence);
    if (close != std::string::npos) {
        body.erase(close);
    }
    return utils::trim(body);
}

std::string JsonRepair::remove_trailing_commas(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    StringScanner scanner;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (scanner.structural(c) && c == ',') {
            size_t j = i + 1;
            while (j < text.size() && utils::is_space(text[j])) ++j;
            if (j < text.size() && (text[j] == '}' || text[j] == ']')) {
                continue;
            }
        }
        out += c;
    }
    return out;
}

Result<std::string> JsonRepair::repair_json(std::string_view text) {
    const auto start = text.find('{');
    if (start == std::string_view::npos) {
        return Result<std::string>::error(ErrorClass::REPAIR_FAILED, "no JSON object in model output");
    }

    const auto end = text.rfind('}');
    const auto object = (end != std::string_view::npos && end > start)
        ? text.substr(start, end - start + 1)
        : text.substr(start);

    std::string repaired = remove_trailing_commas(object);

    int open = 0;
    int close = 0;
    StringScanner scanner;
    for (const char c : repaired) {
        if (!scanner.structural(c)) continue;
        if (c == '{') ++open;
        else if (c == '}') ++close;
    }

    if (scanner.in_string) {
        return Result<std::string>::error(ErrorClass::REPAIR_FAILED, "unterminated string literal");
    }

    const int missing = open - close;
    if (missing < 0 || missing > kMaxBraceRepair) {
        return Result<std::string>::error(ErrorClass::REPAIR_FAILED,
            std::format("brace imbalance {} exceeds repair bound", missing));
    }
    repaired.append(static_cast<size_t>(missing), '}');
    return Result<std::string>::ok(std::move(repaired));
}

Result<json> JsonRepair::parse_structured(std::string_view text) {
    const std::string body = strip_code_fences(text);

    auto parsed = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        return Result<json>::ok(std::move(parsed));
    }

    auto repaired = repair_json(body);
    if (repaired.is_error()) {
        return Result<json>::error(repaired.error_class(), repaired.error_message());
    }

    parsed = json::parse(repaired.value(), nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return Result<json>::error(ErrorClass::REPAIR_FAILED, "repaired text is not a JSON object");
    }

    utils::log::debug("Model output required JSON repair");
    return Result<json>::ok(std::move(parsed));
}

} // namespace promptguard
