#include <string>
#include <vector>
#include "gtest/gtest.h"

#include "config.h"
#include "content_scorer.h"
#include "dom_tree.h"
#include "html_parser.h"

using namespace std;

class ContentScorerTest : public ::testing::Test
{
protected:
    virtual void SetUp()
    {
        ASSERT_TRUE(this->scorer.init(this->config));
    }

    NodeId parse_first(const string& html, const char* tag)
    {
        bool success = parse_html(html, this->tree, NULL);
        EXPECT_TRUE(success);
        return success ? this->tree.find_first(this->tree.get_document(), tag) : INVALID_NODE;
    }

    Config config;
    ContentScorer scorer;
    DomTree tree;
};

TEST_F(ContentScorerTest, features)
{
    NodeId div = this->parse_first("<html><body><div id=\"x\"><h2>T</h2><p>Hello <a href=\"#\">world</a>.</p>"
            "<ul><li>a</li><li>b</li></ul><img src=\"i.png\"><figure><img src=\"f.png\"><figcaption>c</figcaption>"
            "</figure></div></body></html>", "div");
    ASSERT_NE(INVALID_NODE, div);

    vector<double> features;
    this->scorer.extract_features(this->tree, div, features);
    ASSERT_EQ(static_cast<size_t>(ContentScorer::FN_TOTAL_FEATURE_COUNT), features.size());
    EXPECT_DOUBLE_EQ(5, features[ContentScorer::FN_LINK_TEXT_LENGTH]);
    EXPECT_DOUBLE_EQ(1, features[ContentScorer::FN_PARAGRAPH_COUNT]);
    EXPECT_DOUBLE_EQ(1, features[ContentScorer::FN_HEADING_COUNT]);
    EXPECT_DOUBLE_EQ(2, features[ContentScorer::FN_LIST_ITEM_COUNT]);
    EXPECT_DOUBLE_EQ(2, features[ContentScorer::FN_IMAGE_COUNT]);
    EXPECT_DOUBLE_EQ(1, features[ContentScorer::FN_CHILD_PARAGRAPH_COUNT]);
    EXPECT_DOUBLE_EQ(1, features[ContentScorer::FN_CAPTIONED_FIGURE_COUNT]);
    EXPECT_DOUBLE_EQ(1, features[ContentScorer::FN_CONTENT_BOOST]);
    EXPECT_DOUBLE_EQ(10, features[ContentScorer::FN_TAG_BONUS]);
    EXPECT_DOUBLE_EQ(features[ContentScorer::FN_TEXT_LENGTH], this->tree.text(div).length());
}

TEST_F(ContentScorerTest, score_formula)
{
    NodeId div = this->parse_first("<html><body><div id=\"x\"><p>Hello world.</p></div></body></html>", "div");
    ASSERT_NE(INVALID_NODE, div);

    // text 12, html 37, one paragraph, one sentence, two words
    double density = 12.0 / 37 * 50 + 1.0 / 12 * 1000 * 20 + 1.0 / 12 * 1000 * 15 + 2.0 / 12 * 100 * 15;
    EXPECT_NEAR(density, this->scorer.content_density(this->tree, div), 1e-9);
    // tag bonus and one direct paragraph
    EXPECT_NEAR(density + 10 + 5, this->scorer.score(this->tree, div), 1e-9);
}

TEST_F(ContentScorerTest, empty_element)
{
    NodeId div = this->parse_first("<html><body><div></div></body></html>", "div");
    ASSERT_NE(INVALID_NODE, div);
    EXPECT_DOUBLE_EQ(0, this->scorer.content_density(this->tree, div));
    EXPECT_DOUBLE_EQ(10, this->scorer.score(this->tree, div));
    EXPECT_DOUBLE_EQ(0, this->scorer.link_density(this->tree, div));
}

TEST_F(ContentScorerTest, link_density)
{
    NodeId div = this->parse_first("<html><body><div><a href=\"#\">abc</a>def</div></body></html>", "div");
    ASSERT_NE(INVALID_NODE, div);
    EXPECT_DOUBLE_EQ(0.5, this->scorer.link_density(this->tree, div));
}

TEST_F(ContentScorerTest, content_boost)
{
    DomNode node(NT_ELEMENT, "div", "");
    EXPECT_DOUBLE_EQ(1, this->scorer.content_boost(node));

    node.set_attribute("class", "Post");
    EXPECT_DOUBLE_EQ(4, this->scorer.content_boost(node));

    node.set_attribute("id", "main-content");
    EXPECT_DOUBLE_EQ(9, this->scorer.content_boost(node));

    node.set_attribute("class", "sidebar");
    EXPECT_DOUBLE_EQ(3, this->scorer.content_boost(node));
}

TEST_F(ContentScorerTest, tag_bonus)
{
    EXPECT_DOUBLE_EQ(10, this->scorer.tag_bonus("article"));
    EXPECT_DOUBLE_EQ(5, this->scorer.tag_bonus("p"));
    EXPECT_DOUBLE_EQ(3, this->scorer.tag_bonus("li"));
    EXPECT_DOUBLE_EQ(-10, this->scorer.tag_bonus("nav"));
    EXPECT_DOUBLE_EQ(0, this->scorer.tag_bonus("span"));
}

TEST_F(ContentScorerTest, feature_names)
{
    EXPECT_STREQ("FN_TEXT_LENGTH", ContentScorer::feature_name(ContentScorer::FN_TEXT_LENGTH));
    EXPECT_STREQ("FN_TAG_BONUS", ContentScorer::feature_name(ContentScorer::FN_TAG_BONUS));
    EXPECT_STREQ("", ContentScorer::feature_name(ContentScorer::FN_TOTAL_FEATURE_COUNT));
}

TEST(ContentScorerConfigTest, init)
{
    Config config;
    ASSERT_TRUE(config.InitFromString("[contentScorer]\ntag_bonus_names = span\ntag_bonus_values = 7\n"
            "content_keywords = story\nid_boost = 2\n"));
    ContentScorer scorer;
    ASSERT_TRUE(scorer.init(config));
    EXPECT_DOUBLE_EQ(7, scorer.tag_bonus("span"));
    EXPECT_DOUBLE_EQ(0, scorer.tag_bonus("div"));
    EXPECT_DOUBLE_EQ(2, scorer.get_weights().id_boost);

    DomNode node(NT_ELEMENT, "div", "");
    node.set_attribute("id", "story");
    EXPECT_DOUBLE_EQ(3, scorer.content_boost(node));

    Config unpaired;
    ASSERT_TRUE(unpaired.InitFromString("[contentScorer]\ntag_bonus_names = span, div\ntag_bonus_values = 7\n"));
    ContentScorer other;
    EXPECT_FALSE(other.init(unpaired));
}

int main(int argc, char* argv[])
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
