// flash - address/amount helpers

#include <catch2/catch.hpp>
#include <flash/types.hpp>

using namespace flash;

TEST_CASE("Address hex parsing", "[types]") {
    SECTION("Full-width address") {
        Address a = addresses::from_hex("0x0000000000000000000000000000000000009014");
        REQUIRE(a == addresses::FLASH_MANAGER);
        REQUIRE(addresses::to_hex(a) == "0x0000000000000000000000000000000000009014");
    }

    SECTION("Short form is left-padded") {
        REQUIRE(addresses::from_hex("0xA01") == addresses::from_lp(0x0a01));
        REQUIRE(addresses::from_hex("9014") == addresses::FLASH_MANAGER);
    }

    SECTION("Malformed input") {
        REQUIRE_THROWS_AS(addresses::from_hex("0x"), std::invalid_argument);
        REQUIRE_THROWS_AS(addresses::from_hex("0xzz"), std::invalid_argument);
        REQUIRE_THROWS_AS(addresses::from_hex(std::string(41, '1')), std::invalid_argument);
    }
}

TEST_CASE("I128 decimal conversion", "[types]") {
    const I128 max = static_cast<I128>(~U128(0) >> 1);
    const I128 min = -max - 1;

    SECTION("Formatting") {
        REQUIRE(to_string(0) == "0");
        REQUIRE(to_string(-42) == "-42");
        REQUIRE(to_string(max) == "170141183460469231731687303715884105727");
        REQUIRE(to_string(min) == "-170141183460469231731687303715884105728");
    }

    SECTION("Parsing limits") {
        REQUIRE(parse_i128("170141183460469231731687303715884105727") == max);
        REQUIRE(parse_i128("-170141183460469231731687303715884105728") == min);
        REQUIRE(parse_i128("+7") == 7);
        REQUIRE_THROWS_AS(parse_i128("170141183460469231731687303715884105728"), std::out_of_range);
        REQUIRE_THROWS_AS(parse_i128("-"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_i128("1e3"), std::invalid_argument);
    }
}

TEST_CASE("Error codes carry names", "[types]") {
    UnsettledBalance e("open deltas");
    REQUIRE(e.code() == errors::UNSETTLED_BALANCE);
    REQUIRE(std::string(errors::name(e.code())) == "UnsettledBalance");
    REQUIRE(std::string(errors::name(12345)) == "Unknown");
}
