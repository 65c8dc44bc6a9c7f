#include <string>
#include "gtest/gtest.h"

#include "text_normalizer.h"

using namespace std;

TEST(TextNormalizerTest, normalize_unicode)
{
    // combining acute composes, ligature and full width letters decompose
    EXPECT_EQ("Caf\xC3\xA9", normalize_unicode("Cafe\xCC\x81"));
    EXPECT_EQ("find", normalize_unicode("\xEF\xAC\x81nd"));
    EXPECT_EQ("AB", normalize_unicode("\xEF\xBC\xA1\xEF\xBC\xA2"));

    EXPECT_EQ("a -- b - c", normalize_unicode("a \xE2\x80\x94 b \xE2\x80\x93 c"));
    EXPECT_EQ("\"quoted\" it's", normalize_unicode("\xE2\x80\x9Cquoted\xE2\x80\x9D it\xE2\x80\x99s"));
    EXPECT_EQ("(C) 2024", normalize_unicode("\xC2\xA9 2024"));
    EXPECT_EQ("10 EUR", normalize_unicode("10 \xE2\x82\xAC"));
    EXPECT_EQ("a b", normalize_unicode("a\xC2\xA0" "b"));
    EXPECT_EQ("", normalize_unicode(""));
}

TEST(TextNormalizerTest, strip_control_chars)
{
    EXPECT_EQ("abc", strip_control_chars("a\x01" "b\xE2\x80\x8B" "c"));
    EXPECT_EQ("line\none\tcol", strip_control_chars("line\none\tcol"));
    EXPECT_EQ("x\xEF\xBF\xBDy", strip_control_chars("x\xFFy"));
    EXPECT_EQ("\xC3\xA9t\xC3\xA9", strip_control_chars("\xC3\xA9t\xC3\xA9"));
}

TEST(TextNormalizerTest, whitespace)
{
    EXPECT_EQ(" a b ", collapse_whitespace(" a \n\t b "));
    EXPECT_EQ("a b", normalize_whitespace(" a \n\t b "));
    EXPECT_EQ("", normalize_whitespace(" \r\n "));
    EXPECT_EQ("Caf\xC3\xA9 -- ok", normalize_text("  Cafe\xCC\x81 \xE2\x80\x94 ok\x01  "));
}

TEST(TextNormalizerTest, decode_html_entities)
{
    EXPECT_EQ("<b> &amp; AB", decode_html_entities("&lt;b&gt; &amp;amp; &#65;&#x42;"));
    EXPECT_EQ("&unknown; & alone", decode_html_entities("&unknown; & alone"));
    EXPECT_EQ("caf\xC3\xA9\xC2\xA0", decode_html_entities("caf&eacute;&nbsp;"));
    EXPECT_EQ("&#xD800;", decode_html_entities("&#xD800;"));
    EXPECT_EQ("plain", decode_html_entities("plain"));
}

TEST(TextNormalizerTest, count_sentences)
{
    EXPECT_EQ(2, count_sentences("Dr. Smith went home. He slept!"));
    EXPECT_EQ(1, count_sentences("Hello"));
    EXPECT_EQ(2, count_sentences("Really?! Yes."));
    EXPECT_EQ(0, count_sentences("..."));
    EXPECT_EQ(0, count_sentences(""));
}

TEST(TextNormalizerTest, count_words)
{
    EXPECT_EQ(3, count_words("  one two\tthree  "));
    EXPECT_EQ(1, count_words("word"));
    EXPECT_EQ(0, count_words(" \n "));
}

int main(int argc, char* argv[])
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
