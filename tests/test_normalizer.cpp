#include <gtest/gtest.h>
#include <string>

#include "engine/normalizer.hpp"

using splice::engine::Normalizer;

TEST(Normalizer, StripsTrailingWhitespace) {
    Normalizer n;
    EXPECT_EQ(n.normalize("return x  \t\r").text, "return x");
}

TEST(Normalizer, ExpandsLeadingTabsToTabStops) {
    Normalizer n(4);
    EXPECT_EQ(n.normalize("\treturn x").text, "    return x");
    EXPECT_EQ(n.normalize("  \treturn x").text, "    return x");
    EXPECT_EQ(n.normalize("\t\tpass").text, "        pass");
    EXPECT_TRUE(n.fuzzy_equal("\tif x:", "    if x:"));
}

TEST(Normalizer, HonoursTabWidth) {
    Normalizer n(8);
    EXPECT_EQ(n.normalize("\tx").text, "        x");
    EXPECT_FALSE(n.fuzzy_equal("\tx", "    x"));
}

TEST(Normalizer, CollapsesInteriorWhitespace) {
    Normalizer n;
    EXPECT_EQ(n.normalize("x  =\t 1").text, "x = 1");
    EXPECT_TRUE(n.fuzzy_equal("    a   +  b", "    a + b"));
}

TEST(Normalizer, UnindentedDropsOnlyLeadingIndentation) {
    Normalizer n(4);
    EXPECT_EQ(n.normalize("  pass").unindented(), n.normalize("    pass").unindented());
    EXPECT_EQ(n.normalize("\treturn  1 ").unindented().text, "return 1");
    EXPECT_EQ(n.normalize("   ").unindented().text, "");
    // Full normalization keeps the depth for block detection.
    EXPECT_FALSE(n.fuzzy_equal("  pass", "    pass"));
}

TEST(Normalizer, BlankLinesNormalizeToEmpty) {
    Normalizer n;
    EXPECT_EQ(n.normalize("").text, "");
    EXPECT_EQ(n.normalize("    ").text, "");
    EXPECT_EQ(n.normalize(" \t \r").text, "");
    EXPECT_TRUE(n.fuzzy_equal("    ", ""));
}

TEST(Normalizer, FoldsTypographicPunctuation) {
    Normalizer n;
    EXPECT_EQ(n.normalize("a \xE2\x80\x94 b").text, "a - b");             // em dash
    EXPECT_EQ(n.normalize("\xE2\x80\x9Chi\xE2\x80\x9D").text, "\"hi\"");  // curly double quotes
    EXPECT_EQ(n.normalize("it\xE2\x80\x99s").text, "it's");              // right single quote
    EXPECT_EQ(n.normalize("a\xC2\xA0=\xC2\xA0" "1").text, "a = 1");        // no-break spaces
    EXPECT_EQ(n.normalize("x \xE2\x88\x92 1").text, "x - 1");              // minus sign
}

TEST(Normalizer, LeavesOtherUtf8Alone) {
    Normalizer n;
    EXPECT_EQ(n.normalize("name = \"caf\xC3\xA9\"").text, "name = \"caf\xC3\xA9\"");
}

TEST(Normalizer, IndentWidth) {
    Normalizer n(4);
    EXPECT_EQ(n.indent_width("class Car:"), 0u);
    EXPECT_EQ(n.indent_width("    def start(self):"), 4u);
    EXPECT_EQ(n.indent_width("\t\treturn"), 8u);
    EXPECT_EQ(n.indent_width("   "), std::string::npos);
}

TEST(Normalizer, NormalizeAllKeepsOrder) {
    Normalizer n;
    auto out = n.normalize_all({"a  ", "\tb", ""});
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].text, "a");
    EXPECT_EQ(out[1].text, "    b");
    EXPECT_EQ(out[2].text, "");
}
