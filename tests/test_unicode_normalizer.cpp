#include <catch2/catch_test_macros.hpp>
#include "text/UnicodeNormalizer.hpp"
#include <string>

using philoglot::text::is_valid_utf8;
using philoglot::text::to_nfc;

TEST_CASE("to_nfc - ASCII is returned unchanged", "[unicode]")
{
    REQUIRE(to_nfc("arma virumque cano") == "arma virumque cano");
}

TEST_CASE("to_nfc - handles empty string", "[unicode]")
{
    REQUIRE(to_nfc("") == "");
}

TEST_CASE("to_nfc - composes Latin combining accents", "[unicode]")
{
    // e + U+0301 -> U+00E9
    REQUIRE(to_nfc("r\x65\xCC\x81gis") == "r\xC3\xA9gis");
}

TEST_CASE("to_nfc - composes polytonic Greek", "[unicode]")
{
    // alpha + U+0313 + U+0301 -> U+1F04
    REQUIRE(to_nfc("\xCE\xB1\xCC\x93\xCC\x81") == "\xE1\xBC\x84");
}

TEST_CASE("to_nfc - composes IAST Sanskrit", "[unicode]")
{
    // a + U+0304 -> U+0101, s + U+0323 -> U+1E63
    REQUIRE(to_nfc("a\xCC\x84") == "\xC4\x81");
    REQUIRE(to_nfc("s\xCC\xA3") == "\xE1\xB9\xA3");
}

TEST_CASE("to_nfc - keeps compatibility characters", "[unicode]")
{
    // NFC, not NFKC: ligature fi (U+FB01) stays as is
    REQUIRE(to_nfc("\xEF\xAC\x81") == "\xEF\xAC\x81");
}

TEST_CASE("to_nfc - already composed text is stable", "[unicode]")
{
    const std::string composed = "λόγος ἀνήρ";
    REQUIRE(to_nfc(composed) == to_nfc(to_nfc(composed)));
}

TEST_CASE("to_nfc - invalid UTF-8 is returned unchanged", "[unicode]")
{
    const std::string broken = "abc\xC3";
    REQUIRE(to_nfc(broken) == broken);
}

TEST_CASE("is_valid_utf8 - validation", "[unicode]")
{
    REQUIRE(is_valid_utf8(""));
    REQUIRE(is_valid_utf8("plain"));
    REQUIRE(is_valid_utf8("ܐܠܗܐ"));
    REQUIRE_FALSE(is_valid_utf8("\xFF"));
    REQUIRE_FALSE(is_valid_utf8("abc\xC3"));
}
