// Unit tests for string parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <limits>

using namespace liveprobe::util;

TEST_CASE("SafeParseInt - bounds and trailing characters", "[util][string_parsing]") {
    SECTION("Valid values") {
        REQUIRE(SafeParseInt("42", 0, 100) == 42);
        REQUIRE(SafeParseInt("-50", -100, 100) == -50);
        REQUIRE(SafeParseInt("0", 0, 100) == 0);
        REQUIRE(SafeParseInt("100", 0, 100) == 100);
    }

    SECTION("Out of range") {
        REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
    }

    SECTION("Malformed") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
    }
}

TEST_CASE("SafeParseInt64 - large values", "[util][string_parsing]") {
    REQUIRE(SafeParseInt64("86400000", 0, std::numeric_limits<int64_t>::max()) == 86400000);
    REQUIRE_FALSE(SafeParseInt64("999999999999999999999", 0,
                                 std::numeric_limits<int64_t>::max()).has_value());
    REQUIRE_FALSE(SafeParseInt64("-1", 0, 1000).has_value());
}

TEST_CASE("SafeParseUInt64 - request ids", "[util][string_parsing]") {
    SECTION("Full range") {
        REQUIRE(SafeParseUInt64("0") == 0u);
        REQUIRE(SafeParseUInt64("7") == 7u);
        REQUIRE(SafeParseUInt64("18446744073709551615") ==
                std::numeric_limits<uint64_t>::max());
    }

    SECTION("Overflow") {
        REQUIRE_FALSE(SafeParseUInt64("18446744073709551616").has_value());
        REQUIRE_FALSE(SafeParseUInt64("99999999999999999999").has_value());
    }

    SECTION("Only decimal digits") {
        REQUIRE_FALSE(SafeParseUInt64("").has_value());
        REQUIRE_FALSE(SafeParseUInt64("+1").has_value());
        REQUIRE_FALSE(SafeParseUInt64("-1").has_value());
        REQUIRE_FALSE(SafeParseUInt64("0x10").has_value());
        REQUIRE_FALSE(SafeParseUInt64("1 ").has_value());
    }
}

TEST_CASE("SafeParsePortNumber - 16-bit decimal", "[util][string_parsing]") {
    SECTION("Accepted") {
        REQUIRE(SafeParsePortNumber("0") == 0);
        REQUIRE(SafeParsePortNumber("80") == 80);
        REQUIRE(SafeParsePortNumber("0080") == 80);
        REQUIRE(SafeParsePortNumber("65535") == 65535);
    }

    SECTION("Rejected") {
        REQUIRE_FALSE(SafeParsePortNumber("65536").has_value());
        REQUIRE_FALSE(SafeParsePortNumber("99999").has_value());
        REQUIRE_FALSE(SafeParsePortNumber("").has_value());
        REQUIRE_FALSE(SafeParsePortNumber("-1").has_value());
        REQUIRE_FALSE(SafeParsePortNumber("+80").has_value());
        REQUIRE_FALSE(SafeParsePortNumber("http").has_value());
        REQUIRE_FALSE(SafeParsePortNumber("80a").has_value());
    }
}
