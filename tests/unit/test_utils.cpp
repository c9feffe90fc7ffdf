#include <catch2/catch_test_macros.hpp>
#include "Utils.hpp"
#include "TestHelpers.hpp"
#include <filesystem>

TEST_CASE("trim_copy strips surrounding whitespace only") {
    REQUIRE(Utils::trim_copy("  AIza key \t\r\n") == "AIza key");
    REQUIRE(Utils::trim_copy("") == "");
    REQUIRE(Utils::trim_copy(" \t ") == "");
}

TEST_CASE("truncate_utf8 cuts at code point boundaries") {
    REQUIRE(Utils::truncate_utf8("abcdef", 3) == "abc");
    REQUIRE(Utils::truncate_utf8("abc", 10) == "abc");
    REQUIRE(Utils::truncate_utf8("abc", 0) == "");
    // "h" + U+00E9 + U+4E16 + "!" : 4 code points, 7 bytes
    const std::string mixed = "h\xC3\xA9\xE4\xB8\x96!";
    REQUIRE(Utils::truncate_utf8(mixed, 2) == "h\xC3\xA9");
    REQUIRE(Utils::truncate_utf8(mixed, 3) == "h\xC3\xA9\xE4\xB8\x96");
    REQUIRE(Utils::truncate_utf8(mixed, 4) == mixed);
}

TEST_CASE("truncate_utf8 counts stray continuation bytes one by one") {
    REQUIRE(Utils::truncate_utf8(std::string(10, '\x80'), 4) == std::string(4, '\x80'));
    // A two-byte lead takes exactly one continuation byte.
    REQUIRE(Utils::truncate_utf8("\xC3\xA9\xA9\xA9", 2) == "\xC3\xA9\xA9");
    // A truncated sequence followed by ASCII does not swallow the ASCII.
    REQUIRE(Utils::truncate_utf8("\xE4\xB8" "ab", 2) == "\xE4\xB8" "a");
    REQUIRE(Utils::mask_key(std::string(20, '\xBF')) == std::string(6, '\xBF') + "...");
}

TEST_CASE("mask_key keeps only a short prefix") {
    REQUIRE(Utils::mask_key("AIzaSyABCDEFGHIJ") == "AIzaSy...");
    REQUIRE(Utils::mask_key("abc") == "abc...");
}

TEST_CASE("round_to_hundredths rounds half away from zero") {
    REQUIRE(Utils::round_to_hundredths(1.234) == 1.23);
    REQUIRE(Utils::round_to_hundredths(0.0) == 0.0);
    REQUIRE(Utils::round_to_hundredths(2.0) == 2.0);
}

TEST_CASE("utf8_to_path resolves files written through std::filesystem") {
    TempDir temp;
    const auto file = temp.path() / "cl\xC3\xA9s.txt";
    write_text_file(file, "AIza\n");

    const auto path = Utils::utf8_to_path(file.string());
    REQUIRE(std::filesystem::exists(path));
}
