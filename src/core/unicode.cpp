#include "core/unicode.hpp"

#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

#include <cstdint>

namespace promptguard::unicode {

namespace {

bool in_range(unsigned char c, unsigned char lo, unsigned char hi) {
    return c >= lo && c <= hi;
}

} // anonymous namespace

size_t valid_sequence_length(std::string_view s, size_t pos) {
    if (pos >= s.size()) return 0;

    const auto b0 = static_cast<unsigned char>(s[pos]);
    if (b0 < 0x80) return 1;

    // Allowed range of the second byte depends on the lead byte
    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (in_range(b0, 0xC2, 0xDF)) {
        len = 2;
    } else if (b0 == 0xE0) {
        len = 3; lo = 0xA0;
    } else if (in_range(b0, 0xE1, 0xEC) || in_range(b0, 0xEE, 0xEF)) {
        len = 3;
    } else if (b0 == 0xED) {
        len = 3; hi = 0x9F;
    } else if (b0 == 0xF0) {
        len = 4; lo = 0x90;
    } else if (in_range(b0, 0xF1, 0xF3)) {
        len = 4;
    } else if (b0 == 0xF4) {
        len = 4; hi = 0x8F;
    } else {
        return 0;
    }

    if (pos + len > s.size()) return 0;
    if (!in_range(static_cast<unsigned char>(s[pos + 1]), lo, hi)) return 0;
    for (size_t i = 2; i < len; ++i) {
        if (!in_range(static_cast<unsigned char>(s[pos + i]), 0x80, 0xBF)) return 0;
    }
    return len;
}

bool is_valid_utf8(std::string_view s) {
    size_t pos = 0;
    while (pos < s.size()) {
        const size_t len = valid_sequence_length(s, pos);
        if (len == 0) return false;
        pos += len;
    }
    return true;
}

std::string repair_utf8(std::string_view s) {
    std::string out;
    out.reserve(s.size());

    size_t pos = 0;
    while (pos < s.size()) {
        const size_t len = valid_sequence_length(s, pos);
        if (len == 0) {
            out += kReplacementCharacter;
            ++pos;
            continue;
        }
        out.append(s.substr(pos, len));
        pos += len;
    }
    return out;
}

std::optional<std::string> to_nfc(std::string_view s) {
    if (s.size() > static_cast<size_t>(INT32_MAX)) return std::nullopt;

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status)) return std::nullopt;

    const auto source = icu::UnicodeString::fromUTF8(
        icu::StringPiece(s.data(), static_cast<int32_t>(s.size())));

    if (nfc->isNormalized(source, status) && U_SUCCESS(status)) {
        return std::string(s);
    }
    status = U_ZERO_ERROR;

    const icu::UnicodeString normalized = nfc->normalize(source, status);
    if (U_FAILURE(status)) return std::nullopt;

    std::string out;
    normalized.toUTF8String(out);
    return out;
}

} // namespace promptguard::unicode
