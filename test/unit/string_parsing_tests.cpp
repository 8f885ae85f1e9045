// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license
// Unit tests for string parsing utilities

#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"

using namespace heartsock::util;

TEST_CASE("SafeParseInt - valid inputs", "[util][string_parsing]") {
    SECTION("Parse valid positive integer") {
        auto result = SafeParseInt("42", 0, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Parse valid negative integer") {
        auto result = SafeParseInt("-50", -100, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == -50);
    }

    SECTION("Parse at bounds") {
        REQUIRE(*SafeParseInt("0", 0, 255) == 0);
        REQUIRE(*SafeParseInt("255", 0, 255) == 255);
    }

    SECTION("Leading zeros and plus sign") {
        REQUIRE(*SafeParseInt("0042", 0, 100) == 42);
        REQUIRE(*SafeParseInt("+42", 0, 100) == 42);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    }

    SECTION("Non-numeric string") {
        REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
    }

    SECTION("Trailing characters") {
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
    }

    SECTION("Leading characters") {
        REQUIRE_FALSE(SafeParseInt("x42", 0, 100).has_value());
    }

    SECTION("Out of range") {
        REQUIRE_FALSE(SafeParseInt("-1", 0, 255).has_value());
        REQUIRE_FALSE(SafeParseInt("256", 0, 255).has_value());
    }

    SECTION("Overflow") {
        REQUIRE_FALSE(SafeParseInt("999999999999999999999", 0, 100).has_value());
    }

    SECTION("Whitespace") {
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("42 ", 0, 100).has_value());
    }

    SECTION("Floating point and notation") {
        REQUIRE_FALSE(SafeParseInt("42.5", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("0x10", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("1e2", 0, 1000).has_value());
        REQUIRE_FALSE(SafeParseInt("--42", -100, 100).has_value());
    }
}

TEST_CASE("SafeParsePort", "[util][string_parsing]") {
    SECTION("Valid ports") {
        REQUIRE(*SafeParsePort("1") == 1);
        REQUIRE(*SafeParsePort("9001") == 9001);
        REQUIRE(*SafeParsePort("65535") == 65535);
    }

    SECTION("Invalid ports") {
        REQUIRE_FALSE(SafeParsePort("0").has_value());
        REQUIRE_FALSE(SafeParsePort("-1").has_value());
        REQUIRE_FALSE(SafeParsePort("65536").has_value());
        REQUIRE_FALSE(SafeParsePort("").has_value());
        REQUIRE_FALSE(SafeParsePort("8080x").has_value());
    }
}

TEST_CASE("SafeParseUint64 - heartbeat sequence numbers", "[util][string_parsing]") {
    SECTION("Valid") {
        REQUIRE(*SafeParseUint64("0") == 0);
        REQUIRE(*SafeParseUint64("1") == 1);
        REQUIRE(*SafeParseUint64("18446744073709551615") == UINT64_MAX);
    }

    SECTION("Signs are rejected") {
        REQUIRE_FALSE(SafeParseUint64("-1").has_value());
        REQUIRE_FALSE(SafeParseUint64("+1").has_value());
    }

    SECTION("Overflow") {
        REQUIRE_FALSE(SafeParseUint64("18446744073709551616").has_value());
    }

    SECTION("Garbage") {
        REQUIRE_FALSE(SafeParseUint64("").has_value());
        REQUIRE_FALSE(SafeParseUint64(" 1").has_value());
        REQUIRE_FALSE(SafeParseUint64("12a").has_value());
    }
}

TEST_CASE("ToLower", "[util][string_parsing]") {
    REQUIRE(ToLower("PING") == "ping");
    REQUIRE(ToLower("Set BPM 80") == "set bpm 80");
    REQUIRE(ToLower("") == "");

    SECTION("Non-ASCII bytes are left alone") {
        const std::string heart = "\xE2\x9D\xA4";
        REQUIRE(ToLower(heart) == heart);
    }
}

TEST_CASE("SplitWhitespace", "[util][string_parsing]") {
    SECTION("Collapses runs of whitespace") {
        auto tokens = SplitWhitespace("  set\tbpm   80\n");
        REQUIRE(tokens.size() == 3);
        REQUIRE(tokens[0] == "set");
        REQUIRE(tokens[1] == "bpm");
        REQUIRE(tokens[2] == "80");
    }

    SECTION("Empty and blank input") {
        REQUIRE(SplitWhitespace("").empty());
        REQUIRE(SplitWhitespace(" \t ").empty());
    }
}

TEST_CASE("SplitList", "[util][string_parsing]") {
    SECTION("Comma separated") {
        auto items = SplitList("network,discovery,app");
        REQUIRE(items.size() == 3);
        REQUIRE(items[0] == "network");
        REQUIRE(items[2] == "app");
    }

    SECTION("Empty items are skipped") {
        auto items = SplitList(",network,,app,");
        REQUIRE(items.size() == 2);
        REQUIRE(items[0] == "network");
        REQUIRE(items[1] == "app");
    }

    SECTION("Custom delimiter") {
        auto items = SplitList("a:b", ':');
        REQUIRE(items.size() == 2);
    }

    SECTION("Empty input") {
        REQUIRE(SplitList("").empty());
    }
}
