#include "security/pattern_table.hpp"
#include "core/unicode.hpp"
#include "core/utils.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace promptguard {

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
constexpr auto kExact = std::regex::ECMAScript | std::regex::optimize;

// Lookalike code points (UTF-8) folded to their ASCII counterpart before
// injection matching.
struct Confusable {
    std::string_view utf8;
    char ascii;
};

constexpr std::array<Confusable, 17> kConfusables = {{
    {"\xD0\xBE", 'o'},  // Cyrillic small o
    {"\xD1\x96", 'i'},  // Cyrillic small byelorussian-ukrainian i
    {"\xCE\xBF", 'o'},  // Greek small omicron
    {"\xC4\xB1", 'i'},  // Latin small dotless i
    {"\xD0\xB0", 'a'},  // Cyrillic small a
    {"\xD0\xB5", 'e'},  // Cyrillic small ie
    {"\xD1\x81", 'c'},  // Cyrillic small es
    {"\xD1\x80", 'p'},  // Cyrillic small er
    {"\xD1\x85", 'x'},  // Cyrillic small ha
    {"\xD1\x83", 'y'},  // Cyrillic small u
    {"\xD2\xBB", 'h'},  // Cyrillic small shha
    {"\xD1\x95", 's'},  // Cyrillic small dze
    {"\xD1\x98", 'j'},  // Cyrillic small je
    {"\xCE\xB1", 'a'},  // Greek small alpha
    {"\xCE\xB5", 'e'},  // Greek small epsilon
    {"\xCE\xB9", 'i'},  // Greek small iota
    {"\xCF\x81", 'p'},  // Greek small rho
}};

bool search(std::string_view text, const std::regex& re) {
    return std::regex_search(text.begin(), text.end(), re);
}

} // anonymous namespace

const PatternTable& PatternTable::instance() {
    static const PatternTable table;
    return table;
}

PatternTable::PatternTable() {
    // ---- Prompt injection ---------------------------------------------------
    injection_ = {
        {"ignore_instructions", std::regex(
            R"(\bignore\s+(?:all\s+|any\s+|the\s+)?(?:previous|prior|above|earlier|preceding|all)\s+(?:instructions?|prompts?|commands?|rules?|directions?))",
            kIcase)},
        {"disregard_instructions", std::regex(
            R"(\bdisregard\s+(?:all\s+|any\s+|the\s+)?(?:previous|prior|above|earlier|preceding|all)\s+(?:instructions?|prompts?|commands?|rules?|directions?))",
            kIcase)},
        {"forget_instructions", std::regex(
            R"(\bforget\s+(?:all\s+|everything\s+)?(?:previous|prior|above|all|your)\s+(?:instructions?|prompts?|commands?|rules?|guidelines?))",
            kIcase)},
        {"override_instructions", std::regex(
            R"(\boverride\s+(?:the\s+|all\s+|your\s+)?(?:previous|default|system|safety)\b)",
            kIcase)},
        {"role_prefix", std::regex(
            R"(^\s*(?:system|assistant)\s*:)",
            kIcase)},
        {"system_persona", std::regex(
            R"(\bsystem\s*:?\s+you\s+are\s+(?:now\s+)?\w+)",
            kIcase)},
        {"chat_template_token", std::regex(
            R"re(<\|?\s*im_(?:start|end)\s*\|?>|<\|(?:system|assistant|user|endoftext)\|>|\bim_(?:start|end)\b)re",
            kIcase)},
        {"instruction_tag", std::regex(
            R"(\[/?INST\]|<</?SYS>>)",
            kIcase)},
        {"pretend_persona", std::regex(
            R"(\bpretend\s+(?:you\s+are|you're|to\s+be)\b)",
            kIcase)},
        {"act_as", std::regex(
            R"(\bact\s+as\s+(?:if|though|a|an)\b)",
            kIcase)},
        {"you_must_comply", std::regex(
            R"(\byou\s+must\s+(?:now|always|ignore|obey)\b)",
            kIcase)},
        {"from_now_on", std::regex(
            R"(\bfrom\s+now\s+on\s*,?\s+you\b)",
            kIcase)},
        {"new_instructions", std::regex(
            R"(\bnew\s+(?:instructions?|role|task|prompt|rules?)\s*[:\-]|\byour\s+new\s+(?:role|task|instructions?)\b)",
            kIcase)},
        {"jailbreak_keyword", std::regex(
            R"(\b(?:jailbreak|jailbroken|do\s+anything\s+now|dan\s+mode)\b)",
            kIcase)},
        {"privileged_mode", std::regex(
            R"(\b(?:developer|sudo|god|unrestricted)\s+mode\b)",
            kIcase)},
        {"reveal_system_prompt", std::regex(
            R"(\b(?:reveal|show|print|repeat|output|leak)\s+(?:me\s+)?(?:your|the)\s+(?:system\s+prompt|hidden\s+instructions|initial\s+instructions|original\s+prompt))",
            kIcase)},
        {"delimiter_spoof", std::regex(
            R"re((?:^|\s)(?:#{2,}|-{3,}|={3,})\s*(?:end\s+of\s+|begin\s+)?(?:system|instructions?|prompt)\b|<\s*/?\s*(?:system|instructions?)\s*>)re",
            kIcase)},
    };

    // ---- Code injection -----------------------------------------------------
    code_ = {
        {"fenced_code_block", std::regex(R"(```)", kExact), RemovalScope::FENCED_BLOCK},
        {"script_tag", std::regex(R"(<\s*/?\s*script\b[^>]*>?)", kIcase), RemovalScope::LINE},
        {"frame_tag", std::regex(R"(<\s*(?:iframe|object|embed)\b[^>]*>?)", kIcase), RemovalScope::LINE},
        {"inline_code_span", std::regex("`[^`\\n]+`", kExact), RemovalScope::SPAN},
        {"javascript_uri", std::regex(R"re(\bjavascript\s*:[^\s"'<>]*)re", kIcase), RemovalScope::SPAN},
        {"vbscript_uri", std::regex(R"re(\bvbscript\s*:[^\s"'<>]*)re", kIcase), RemovalScope::SPAN},
        {"html_data_uri", std::regex(R"re(\bdata\s*:\s*text/html[^\s"'<>]*)re", kIcase), RemovalScope::SPAN},
        // Named DOM handlers only, so prose like "online = true" survives
        {"event_handler", std::regex(
            R"re(\bon(?:abort|animation(?:end|iteration|start)|auxclick|beforeunload|blur|change|click|)re"
            R"re(contextmenu|copy|cut|dblclick|drag(?:end|enter|leave|over|start)?|drop|error|)re"
            R"re(focus(?:in|out)?|hashchange|input|invalid|key(?:down|press|up)|load|message|)re"
            R"re(mouse(?:down|enter|leave|move|out|over|up)|paste|pointer(?:down|enter|leave|move|out|over|up)|)re"
            R"re(popstate|reset|resize|scroll|select|submit|toggle|touch(?:cancel|end|move|start)|)re"
            R"re(transitionend|unload|wheel)\s*=\s*(?:"[^"]*"|'[^']*'|[^\s>]+))re", kIcase),
            RemovalScope::SPAN},
        {"eval_call", std::regex(R"(\b(?:eval|exec)\s*\([^)\n]*\)?)", kIcase), RemovalScope::SPAN},
        {"dunder_import", std::regex(R"(__import__\s*\([^)\n]*\)?)", kIcase), RemovalScope::SPAN},
        {"os_system_call", std::regex(R"(\bos\.system\s*\([^)\n]*\)?)", kIcase), RemovalScope::SPAN},
        {"subprocess_call", std::regex(R"(\bsubprocess\.\w+(?:\s*\([^)\n]*\)?)?)", kIcase), RemovalScope::SPAN},
    };

    // ---- PII (overlap priority order) ---------------------------------------
    pii_ = {
        {PiiKind::EMAIL, std::regex(
            R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)", kExact)},
        {PiiKind::CREDIT_CARD, std::regex(
            R"(\b(?:\d{4}[-\s]?){3}\d{4}\b|\b\d{4}[-\s]?\d{6}[-\s]?\d{5}\b)", kExact)},
        {PiiKind::SSN, std::regex(
            R"(\b\d{3}[-\s]?\d{2}[-\s]?\d{4}\b)", kExact)},
        {PiiKind::PHONE, std::regex(
            R"(\+\d{1,3}(?:[-.\s]?\d{2,4}){2,4}\b|(?:\b1[-.\s]?)?(?:\(\d{3}\)|\b\d{3})[-.\s]?\d{3}[-.\s]?\d{4}\b)", kExact)},
    };

    utils::log::debug(std::format("Pattern table built: {} injection, {} code, {} pii patterns",
                                  injection_.size(), code_.size(), pii_.size()));
}

std::string PatternTable::canonicalize(std::string_view input) {
    const auto nfc = unicode::to_nfc(input);
    const std::string_view text = nfc ? std::string_view(*nfc) : input;

    std::string folded;
    folded.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        bool replaced = false;
        for (const auto& c : kConfusables) {
            if (text.substr(i, c.utf8.size()) == c.utf8) {
                folded += c.ascii;
                i += c.utf8.size();
                replaced = true;
                break;
            }
        }
        if (replaced) continue;

        const auto uc = static_cast<unsigned char>(text[i]);
        if (uc < 0x80 && !std::isalnum(uc) && uc != '_' && !utils::is_space(text[i])) {
            folded += ' ';
        } else {
            folded += text[i];
        }
        ++i;
    }

    // Collapse whitespace and lowercase
    std::string canonical;
    canonical.reserve(folded.size());
    bool pending_space = false;
    for (const char ch : folded) {
        if (utils::is_space(ch)) {
            pending_space = !canonical.empty();
            continue;
        }
        if (pending_space) {
            canonical += ' ';
            pending_space = false;
        }
        canonical += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return canonical;
}

bool PatternTable::matches_injection(std::string_view line) const {
    for (const auto& entry : injection_) {
        if (search(line, entry.regex)) return true;
    }
    const std::string canonical = canonicalize(line);
    if (canonical == line) return false;
    for (const auto& entry : injection_) {
        if (search(canonical, entry.regex)) return true;
    }
    return false;
}

bool PatternTable::matches_code(std::string_view text) const {
    for (const auto& entry : code_) {
        if (search(text, entry.regex)) return true;
    }
    return false;
}

} // namespace promptguard
