#include "util/utf8decode.hpp"

#include <doctest.h>

#include <string>

using namespace diffreview;

TEST_CASE("unicode") {
    SUBCASE("sequence_length") {
        CHECK(utf8_sequence_length('a') == 1);
        CHECK(utf8_sequence_length(0xC3) == 2);
        CHECK(utf8_sequence_length(0xE2) == 3);
        CHECK(utf8_sequence_length(0xF0) == 4);
        CHECK(utf8_sequence_length(0x80) == 1);
    }

    SUBCASE("next_skips_whole_sequence") {
        std::string s = "a€b";  // € is three bytes
        REQUIRE(utf8_next(s, 0) == 1);
        REQUIRE(utf8_next(s, 1) == 4);
        REQUIRE(utf8_next(s, 4) == 5);
        REQUIRE(utf8_next(s, 5) == 5);
    }

    SUBCASE("truncated_sequence") {
        // Lead byte of a three byte sequence followed by plain ascii.
        std::string s = "\xE2z";
        REQUIRE(utf8_next(s, 0) == 1);
        REQUIRE(utf8_next(s, 1) == 2);
    }

    SUBCASE("validity") {
        CHECK(utf8_is_valid(""));
        CHECK(utf8_is_valid("öl och bål €"));
        CHECK(utf8_is_valid("\xF0\x9F\x98\x80"));
        CHECK_FALSE(utf8_is_valid("caf\xE9.txt"));   // Latin-1
        CHECK_FALSE(utf8_is_valid("\xE2z"));         // truncated
        CHECK_FALSE(utf8_is_valid("\xE2\x82"));       // cut at the end
        CHECK_FALSE(utf8_is_valid("\xC0\xAF"));       // overlong
        CHECK_FALSE(utf8_is_valid("\xED\xA0\x80"));   // surrogate
        CHECK_FALSE(utf8_is_valid("\xF4\x90\x80\x80"));  // past U+10FFFF
        CHECK_FALSE(utf8_is_valid("\x80"));
    }
}

TEST_CASE("display_width") {
    SUBCASE("ascii") {
        CHECK(display_width("hello", 4) == 5);
    }

    SUBCASE("tabs") {
        CHECK(display_width("\tx", 4) == 5);
        CHECK(display_width("\t\t", 8) == 16);
    }

    SUBCASE("control_bytes_are_invisible") {
        CHECK(display_width(std::string("a\x01\x1b" "b\x7f"), 4) == 2);
    }

    SUBCASE("multibyte_counts_once") {
        CHECK(display_width("åäö", 4) == 3);
    }

    SUBCASE("range") {
        std::string s = "ab\tcd";
        CHECK(display_width(s, 2, 3, 4) == 4);
        CHECK(display_width(s, 3, 100, 4) == 2);
    }
}
