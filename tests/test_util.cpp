/// @file test_util.cpp
/// Unit tests for util.hpp — trimming, case folding, UTF-8 length, UUID parsing.

#include "util.hpp"

#include <gtest/gtest.h>

using namespace coop_catalog;

// ============================================================================
// trim
// ============================================================================

TEST(Trim, RemovesSurroundingSpaces) {
    EXPECT_EQ(trim("  granos  "), "granos");
}

TEST(Trim, RemovesTabsAndNewlines) {
    EXPECT_EQ(trim("\t\nMiel de abeja\r\n"), "Miel de abeja");
}

TEST(Trim, KeepsInnerWhitespace) {
    EXPECT_EQ(trim(" a  b "), "a  b");
}

TEST(Trim, AllWhitespaceBecomesEmpty) {
    EXPECT_EQ(trim(" \t \n "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(Trim, RemovesUnicodeSpaces) {
    // U+00A0 NO-BREAK SPACE around "ab".
    EXPECT_EQ(trim("\xC2\xA0" "ab" "\xC2\xA0"), "ab");
    // U+3000 IDEOGRAPHIC SPACE and U+2003 EM SPACE.
    EXPECT_EQ(trim("\xE3\x80\x80Miel\xE2\x80\x83"), "Miel");
}

TEST(Trim, UnicodeSpacesOnlyBecomesEmpty) {
    EXPECT_EQ(trim("\xE3\x80\x80\xE3\x80\x80\xE3\x80\x80"), "");
    EXPECT_EQ(trim("\xC2\xA0 \xE2\x80\xA8"), "");
}

TEST(Trim, KeepsAccentedLettersAtTheEdges) {
    EXPECT_EQ(trim(" \xC3\xA1gil \xC3\xB1"), "\xC3\xA1gil \xC3\xB1");
}

TEST(Trim, StopsAtMalformedBytes) {
    EXPECT_EQ(trim(" \xFF "), "\xFF");
    EXPECT_EQ(trim("\xC2"), "\xC2");
}

// ============================================================================
// toLower
// ============================================================================

TEST(ToLower, FoldsAsciiLetters) {
    EXPECT_EQ(toLower("OFERTAS"), "ofertas");
    EXPECT_EQ(toLower("Organicos"), "organicos");
}

TEST(ToLower, LeavesDigitsAndPunctuationAlone) {
    EXPECT_EQ(toLower("a-1_B"), "a-1_b");
}

TEST(ToLower, FoldsAccentedLetters) {
    // "LÁCTEOS" -> "lácteos", "ÉL" -> "él", "ÑANDÚ" -> "ñandú".
    EXPECT_EQ(toLower("L\xC3\x81" "CTEOS"), "l\xC3\xA1" "cteos");
    EXPECT_EQ(toLower("\xC3\x89L"), "\xC3\xA9l");
    EXPECT_EQ(toLower("\xC3\x91" "AND\xC3\x9A"), "\xC3\xB1" "and\xC3\xBA");
}

// ============================================================================
// utf8Length
// ============================================================================

TEST(Utf8Length, AsciiCountsBytes) {
    EXPECT_EQ(utf8Length("abc"), 3u);
    EXPECT_EQ(utf8Length(""), 0u);
}

TEST(Utf8Length, MultiByteCharactersCountOnce) {
    // "Café" and "ñandú": accented letters are two bytes each.
    EXPECT_EQ(utf8Length("Caf\xC3\xA9"), 4u);
    EXPECT_EQ(utf8Length("\xC3\xB1" "and\xC3\xBA"), 5u);
}

// ============================================================================
// normalizeUuid
// ============================================================================

TEST(NormalizeUuid, CanonicalFormIsKept) {
    auto id = normalizeUuid("123e4567-e89b-42d3-a456-426614174000");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, "123e4567-e89b-42d3-a456-426614174000");
}

TEST(NormalizeUuid, UppercaseIsLowered) {
    auto id = normalizeUuid("123E4567-E89B-42D3-A456-426614174ABC");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, "123e4567-e89b-42d3-a456-426614174abc");
}

TEST(NormalizeUuid, BareHexGetsHyphens) {
    auto id = normalizeUuid("123e4567e89b42d3a456426614174000");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, "123e4567-e89b-42d3-a456-426614174000");
}

TEST(NormalizeUuid, RejectsWrongLength) {
    EXPECT_FALSE(normalizeUuid("").has_value());
    EXPECT_FALSE(normalizeUuid("123e4567-e89b-42d3-a456-42661417400").has_value());
    EXPECT_FALSE(normalizeUuid("123e4567-e89b-42d3-a456-4266141740000").has_value());
}

TEST(NormalizeUuid, RejectsMisplacedHyphens) {
    EXPECT_FALSE(normalizeUuid("123e4567e-89b-42d3-a456-426614174000").has_value());
}

TEST(NormalizeUuid, RejectsNonHexCharacters) {
    EXPECT_FALSE(normalizeUuid("123e4567-e89b-42d3-a456-42661417400g").has_value());
    EXPECT_FALSE(normalizeUuid("not-a-uuid").has_value());
}

TEST(NormalizeUuid, RejectsBracedForm) {
    EXPECT_FALSE(normalizeUuid("{123e4567-e89b-42d3-a456-426614174000}").has_value());
}
