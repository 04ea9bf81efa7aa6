#include "llm/response_extractor.hpp"
#include "core/utils.hpp"

#include <array>
#include <string_view>

namespace promptguard {

using json = nlohmann::json;

namespace {

std::optional<std::string> non_blank(const json& value) {
    if (!value.is_string()) return std::nullopt;
    auto text = utils::trim(value.get_ref<const std::string&>());
    if (text.empty()) return std::nullopt;
    return text;
}

// Concatenates [{ "text": ... }, ...] or ["...", ...] blocks
std::optional<std::string> from_blocks(const json& value) {
    if (!value.is_array()) return std::nullopt;
    std::string joined;
    for (const auto& block : value) {
        if (block.is_string()) {
            joined += block.get_ref<const std::string&>();
        } else if (block.is_object()) {
            const auto it = block.find("text");
            if (it != block.end() && it->is_string()) {
                joined += it->get_ref<const std::string&>();
            }
        }
    }
    return non_blank(json(joined));
}

std::optional<std::string> string_or_blocks(const json& value) {
    if (auto s = non_blank(value)) return s;
    return from_blocks(value);
}

const json* member(const json& obj, std::string_view key) {
    if (!obj.is_object()) return nullptr;
    const auto it = obj.find(std::string(key));
    return it == obj.end() ? nullptr : &*it;
}

std::optional<std::string> from_candidate(const json& candidate) {
    if (candidate.is_string()) return non_blank(candidate);
    if (!candidate.is_object()) return std::nullopt;

    for (const auto key : {"output", "text"}) {
        if (const auto* v = member(candidate, key)) {
            if (auto s = non_blank(*v)) return s;
        }
    }

    if (const auto* content = member(candidate, "content")) {
        if (auto s = string_or_blocks(*content)) return s;
        if (const auto* parts = member(*content, "parts")) {
            if (auto s = from_blocks(*parts)) return s;
        }
    }

    if (const auto* message = member(candidate, "message")) {
        if (const auto* content = member(*message, "content")) {
            if (auto s = string_or_blocks(*content)) return s;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

std::optional<std::string> ResponseExtractor::from_text_field(const json& response) {
    if (response.is_string()) return non_blank(response);
    if (const auto* text = member(response, "text")) {
        return non_blank(*text);
    }
    return std::nullopt;
}

std::optional<std::string> ResponseExtractor::from_first_candidate(const json& response) {
    for (const auto key : {"candidates", "choices"}) {
        const auto* list = member(response, key);
        if (!list || !list->is_array() || list->empty()) continue;
        if (auto s = from_candidate(list->front())) return s;
    }
    return std::nullopt;
}

std::optional<std::string> ResponseExtractor::from_generic_output(const json& response) {
    for (const auto key : {"output_text", "output", "content"}) {
        if (const auto* v = member(response, key)) {
            if (auto s = string_or_blocks(*v)) return s;
        }
    }
    return std::nullopt;
}

const std::vector<ResponseExtractor::Strategy>& ResponseExtractor::strategies() {
    static const std::vector<Strategy> ordered = {
        &ResponseExtractor::from_text_field,
        &ResponseExtractor::from_first_candidate,
        &ResponseExtractor::from_generic_output,
    };
    return ordered;
}

Result<std::string> ResponseExtractor::extract(const json& response) {
    for (const auto& strategy : strategies()) {
        if (auto text = strategy(response)) {
            return Result<std::string>::ok(std::move(*text));
        }
    }
    return Result<std::string>::error(ErrorClass::EXTRACTION_FAILED,
        std::format("no text payload in provider response (type={})", response.type_name()));
}

} // namespace promptguard
