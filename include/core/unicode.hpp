#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace promptguard::unicode {

/// U+FFFD REPLACEMENT CHARACTER
inline constexpr std::string_view kReplacementCharacter = "\xEF\xBF\xBD";

/**
 * @brief Length of the well-formed UTF-8 sequence starting at @p pos, or 0
 *
 * Follows the Unicode well-formed byte table: rejects overlong forms,
 * surrogates (U+D800-U+DFFF) and code points above U+10FFFF.
 */
[[nodiscard]] size_t valid_sequence_length(std::string_view s, size_t pos);

[[nodiscard]] bool is_valid_utf8(std::string_view s);

/// Replaces each ill-formed byte with U+FFFD; valid input is returned as-is
[[nodiscard]] std::string repair_utf8(std::string_view s);

/**
 * @brief Canonical composition (NFC) via ICU
 * @return std::nullopt if ICU reports an error
 */
[[nodiscard]] std::optional<std::string> to_nfc(std::string_view s);

} // namespace promptguard::unicode
