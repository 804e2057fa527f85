/**
 * ============================================================================
 * NetGuard StringUtils Unit Tests
 * ============================================================================
 */

#include "../../../src/Utils/StringUtils.hpp"

#include <gtest/gtest.h>

using namespace NetGuard::Utils::StringUtils;

// ============================================================================
// CASE & TRIM
// ============================================================================

TEST(StringUtilsTest, CaseAndTrim) {
    EXPECT_EQ(ToLowerCopy("SLOT Gacor 88"), "slot gacor 88");
    EXPECT_EQ(ToLowerCopy("\xC3\x89T\xC3\x89"), "\xC3\x89t\xC3\x89");

    EXPECT_EQ(TrimCopy("  \t casino \r\n"), "casino");
    EXPECT_EQ(TrimCopy("   "), "");

    std::string s = "  left";
    TrimLeft(s);
    EXPECT_EQ(s, "left");
    s = "right \n";
    TrimRight(s);
    EXPECT_EQ(s, "right");
}

TEST(StringUtilsTest, PrefixSuffixAndCaseInsensitiveEquality) {
    EXPECT_TRUE(StartsWith("HTTP/1.1", "HTTP/1."));
    EXPECT_FALSE(StartsWith("HTTP", "HTTP/1."));
    EXPECT_TRUE(EndsWith("bet.example", ".example"));
    EXPECT_FALSE(EndsWith("example", "bet.example"));
    EXPECT_TRUE(IEquals("Content-Length", "content-length"));
    EXPECT_FALSE(IEquals("Content-Length", "Content-Type"));
    EXPECT_FALSE(IEquals("abc", "abcd"));
}

// ============================================================================
// SPLIT / JOIN / REPLACE
// ============================================================================

TEST(StringUtilsTest, SplitDropsEmptyFieldsByDefault) {
    EXPECT_EQ(Split("en,,id,", ','), (std::vector<std::string>{ "en", "id" }));
    EXPECT_EQ(Split("en,,id,", ',', true), (std::vector<std::string>{ "en", "", "id", "" }));
    EXPECT_TRUE(Split("", ',').empty());
    EXPECT_EQ(Join({ "a", "b", "c" }, ", "), "a, b, c");
    EXPECT_EQ(Join({}, ","), "");
}

TEST(StringUtilsTest, ReplaceAllDoesNotRescan) {
    std::string s = "aaa";
    ReplaceAll(s, "a", "aa");
    EXPECT_EQ(s, "aaaaaa");
    ReplaceAll(s, "", "x");
    EXPECT_EQ(s, "aaaaaa");
}

// ============================================================================
// HTML & UTF-8
// ============================================================================

TEST(StringUtilsTest, StripHtmlDropsScriptAndStyle) {
    const std::string html =
        "<html><head><style>.x{color:red}</style><SCRIPT>var jackpot=1;</SCRIPT></head>"
        "<body><p>Daftar&nbsp;slot</p></body></html>";
    const std::string text = StripHtmlTags(html);
    EXPECT_NE(text.find("Daftar"), std::string::npos);
    EXPECT_NE(text.find("slot"), std::string::npos);
    EXPECT_EQ(text.find("jackpot"), std::string::npos);
    EXPECT_EQ(text.find("color"), std::string::npos);
    EXPECT_EQ(text.find('<'), std::string::npos);
    EXPECT_EQ(text.find("nbsp"), std::string::npos);
}

TEST(StringUtilsTest, StripHtmlKeepsLooseAmpersand) {
    EXPECT_EQ(TrimCopy(StripHtmlTags("<b>Tom & Jerry</b>")), "Tom & Jerry");
    // unterminated tag ends the text
    EXPECT_EQ(TrimCopy(StripHtmlTags("before <broken")), "before");
}

TEST(StringUtilsTest, TruncateUtf8KeepsWholeSequences) {
    const std::string s = "ab\xE2\x82\xAC" "cd";   // ab€cd
    EXPECT_EQ(TruncateUtf8(s, 100), s);
    EXPECT_EQ(TruncateUtf8(s, 3), "ab");
    EXPECT_EQ(TruncateUtf8(s, 4), "ab");
    EXPECT_EQ(TruncateUtf8(s, 5), "ab\xE2\x82\xAC");
    EXPECT_EQ(TruncateUtf8(s, 0), "");
}

TEST(StringUtilsTest, StableHashIsFnv1a) {
    EXPECT_EQ(StableHash(""), 1469598103934665603ULL);
    EXPECT_EQ(StableHash("casino.example"), StableHash("casino.example"));
    EXPECT_NE(StableHash("casino.example"), StableHash("casino.exampla"));
}
