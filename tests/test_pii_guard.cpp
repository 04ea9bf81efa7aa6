#include <catch2/catch_test_macros.hpp>
#include "security/pii_guard.hpp"

#include <string>

using namespace promptguard;

TEST_CASE("PiiGuard: email", "[pii]") {
    const std::string text = "Contact me at user@example.com";
    CHECK_FALSE(PiiGuard::is_safe_for_logging(text));

    const auto redacted = PiiGuard::redact_pii(text);
    CHECK(redacted == "Contact me at [EMAIL_REDACTED]");
    CHECK(redacted.find("user@example.com") == std::string::npos);
    CHECK(PiiGuard::is_safe_for_logging(redacted));
}

TEST_CASE("PiiGuard: phone numbers", "[pii]") {
    SECTION("US format") {
        CHECK(PiiGuard::redact_pii("Call 555-123-4567 today") == "Call [PHONE_REDACTED] today");
        CHECK(PiiGuard::redact_pii("Call (555) 123-4567") == "Call [PHONE_REDACTED]");
    }

    SECTION("International format") {
        CHECK(PiiGuard::redact_pii("ring +44 20 7946 0958 please") == "ring [PHONE_REDACTED] please");
    }
}

TEST_CASE("PiiGuard: card numbers and SSN", "[pii]") {
    CHECK(PiiGuard::redact_pii("Card: 4111 1111 1111 1111") == "Card: [CARD_REDACTED]");
    CHECK(PiiGuard::redact_pii("Card: 4111-1111-1111-1111") == "Card: [CARD_REDACTED]");
    CHECK(PiiGuard::redact_pii("SSN 123-45-6789") == "SSN [SSN_REDACTED]");
}

TEST_CASE("PiiGuard: overlapping candidates resolve to one match", "[pii]") {
    const auto matches = PiiGuard::find_pii("4111-1111-1111-1111");
    REQUIRE(matches.size() == 1);
    CHECK(matches[0].kind == PiiKind::CREDIT_CARD);
    CHECK(matches[0].offset == 0);
    CHECK(matches[0].length == 19);
}

TEST_CASE("PiiGuard: match offsets are ordered", "[pii]") {
    const auto matches = PiiGuard::find_pii("a@b.co and 555-123-4567");
    REQUIRE(matches.size() == 2);
    CHECK(matches[0].kind == PiiKind::EMAIL);
    CHECK(matches[0].offset == 0);
    CHECK(matches[0].length == 6);
    CHECK(matches[1].kind == PiiKind::PHONE);
    CHECK(matches[1].offset == 11);
}

TEST_CASE("PiiGuard: several kinds in one text", "[pii]") {
    const auto redacted = PiiGuard::redact_pii(
        "Email jane.doe@corp.io, phone 555-123-4567, SSN 123-45-6789");
    CHECK(redacted == "Email [EMAIL_REDACTED], phone [PHONE_REDACTED], SSN [SSN_REDACTED]");
}

TEST_CASE("PiiGuard: redaction is idempotent", "[pii]") {
    const std::string inputs[] = {
        "Contact me at user@example.com",
        "Call 555-123-4567 or +1 555 123 4567",
        "Card 4111 1111 1111 1111 and SSN 123-45-6789",
        "nothing sensitive here",
        "",
    };
    for (const auto& input : inputs) {
        const auto once = PiiGuard::redact_pii(input);
        CHECK(PiiGuard::redact_pii(once) == once);
        CHECK(PiiGuard::is_safe_for_logging(once));
    }
}

TEST_CASE("PiiGuard: clean text", "[pii]") {
    CHECK(PiiGuard::is_safe_for_logging("Hello world"));
    CHECK(PiiGuard::is_safe_for_logging(""));
    CHECK(PiiGuard::find_pii("meeting at 3pm in room 12").empty());
    CHECK(PiiGuard::redact_pii("Hello world") == "Hello world");
}

TEST_CASE("PiiGuard: placeholders", "[pii]") {
    CHECK(PiiGuard::placeholder(PiiKind::EMAIL) == "[EMAIL_REDACTED]");
    CHECK(PiiGuard::placeholder(PiiKind::PHONE) == "[PHONE_REDACTED]");
    CHECK(PiiGuard::placeholder(PiiKind::CREDIT_CARD) == "[CARD_REDACTED]");
    CHECK(PiiGuard::placeholder(PiiKind::SSN) == "[SSN_REDACTED]");
}

TEST_CASE("PiiGuard: large log payloads", "[pii][large]") {
    SECTION("Long clean text") {
        const std::string text(200000, 'a');
        CHECK(PiiGuard::is_safe_for_logging(text));
        CHECK(PiiGuard::find_pii(text).empty());
        CHECK(PiiGuard::redact_pii(text) == text);
    }

    SECTION("PII after a long prefix") {
        const std::string text = std::string(200000, 'a') + " bob@example.com";
        CHECK_FALSE(PiiGuard::is_safe_for_logging(text));

        const auto redacted = PiiGuard::redact_pii(text);
        CHECK(redacted == std::string(200000, 'a') + " [EMAIL_REDACTED]");
    }

    SECTION("PII before a long digit run") {
        const std::string tail(150000, '7');
        const auto redacted = PiiGuard::redact_pii("contact user@example.com " + tail);
        CHECK(redacted == "contact [EMAIL_REDACTED] " + tail);
    }
}

TEST_CASE("PiiGuard: match spanning a scan window edge", "[pii][large]") {
    const std::string text = std::string(4090, 'x') + " 123-45-6789 tail";

    const auto matches = PiiGuard::find_pii(text);
    REQUIRE(matches.size() == 1);
    CHECK(matches[0].kind == PiiKind::SSN);
    CHECK(matches[0].offset == 4091);
    CHECK(matches[0].length == 11);

    CHECK(PiiGuard::redact_pii(text) == std::string(4090, 'x') + " [SSN_REDACTED] tail");
}
