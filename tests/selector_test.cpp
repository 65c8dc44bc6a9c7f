#include <string>
#include <vector>
#include "gtest/gtest.h"

#include "dom_tree.h"
#include "html_parser.h"
#include "selector.h"

using namespace std;

class SelectorTest : public ::testing::Test
{
protected:
    virtual void SetUp()
    {
        const char* html =
            "<html><body>"
            "<div id=\"main-content\" class=\"post entry\"><p class=\"lead\">A</p><p>B</p><ul><li>x</li></ul></div>"
            "<div class=\"sidebar\"><p>C</p></div>"
            "<article data-content-focus=\"true\"><p>D</p></article>"
            "</body></html>";
        ASSERT_TRUE(parse_html(html, this->tree, NULL));
    }

    string texts(const string& selector)
    {
        vector<NodeId> nodes;
        EXPECT_TRUE(select(this->tree, this->tree.get_document(), selector, nodes)) << selector;
        string result;
        for (size_t i = 0; i < nodes.size(); ++i)
        {
            if (i > 0)
            {
                result.append(",");
            }

            result.append(this->tree.text(nodes[i]));
        }

        return result;
    }

    size_t count(const string& selector)
    {
        vector<NodeId> nodes;
        EXPECT_TRUE(select(this->tree, this->tree.get_document(), selector, nodes)) << selector;
        return nodes.size();
    }

    DomTree tree;
};

TEST_F(SelectorTest, type_and_combinators)
{
    EXPECT_EQ("A,B,C,D", this->texts("p"));
    EXPECT_EQ("A,B,C", this->texts("div p"));
    EXPECT_EQ("A,B", this->texts("#main-content > p"));
    EXPECT_EQ("x", this->texts("div > ul > li"));
    EXPECT_EQ("", this->texts("body > p"));
    EXPECT_EQ(3u, this->count("body > *"));
}

TEST_F(SelectorTest, attributes)
{
    EXPECT_EQ(1u, this->count(".post"));
    EXPECT_EQ(1u, this->count("div.post.entry"));
    EXPECT_EQ(0u, this->count(".pos"));
    EXPECT_EQ(1u, this->count("[id*=content]"));
    EXPECT_EQ(1u, this->count("[id^=main]"));
    EXPECT_EQ(1u, this->count("[id$='content']"));
    EXPECT_EQ(1u, this->count("[class~=entry]"));
    EXPECT_EQ(1u, this->count("[class^=side]"));
    EXPECT_EQ(1u, this->count("[data-content-focus=true]"));
    EXPECT_EQ(1u, this->count("[data-content-focus]"));
    EXPECT_EQ(0u, this->count("[data-content-focus=\"false\"]"));
    EXPECT_EQ("A", this->texts("p.lead"));
}

TEST_F(SelectorTest, groups_in_document_order)
{
    EXPECT_EQ("C,D", this->texts("article, .sidebar"));

    // an element matching two groups is reported once
    vector<NodeId> nodes;
    ASSERT_TRUE(select(this->tree, this->tree.get_document(), "div, .post, [id*=main]", nodes));
    EXPECT_EQ(2u, nodes.size());
}

TEST_F(SelectorTest, root_included)
{
    vector<NodeId> divs;
    ASSERT_TRUE(select(this->tree, this->tree.get_document(), ".sidebar", divs));
    ASSERT_EQ(1u, divs.size());

    Selector selector;
    ASSERT_TRUE(selector.parse("div, p"));
    vector<NodeId> nodes;
    selector.select(this->tree, divs[0], nodes);
    ASSERT_EQ(2u, nodes.size());
    EXPECT_EQ(divs[0], nodes[0]);
    EXPECT_TRUE(selector.matches(this->tree, divs[0]));
    EXPECT_EQ("div, p", selector.get_text());
}

TEST_F(SelectorTest, syntax_errors)
{
    Selector selector;
    EXPECT_FALSE(selector.parse("div["));
    EXPECT_FALSE(selector.parse("[id%=x]"));
    EXPECT_FALSE(selector.parse("p,"));

    vector<NodeId> nodes;
    selector.select(this->tree, this->tree.get_document(), nodes);
    EXPECT_TRUE(nodes.empty());
    EXPECT_FALSE(select(this->tree, this->tree.get_document(), "..", nodes));
}

TEST_F(SelectorTest, plain_tags)
{
    Selector selector;
    vector<string> tags;
    ASSERT_TRUE(selector.parse("div, section"));
    ASSERT_TRUE(selector.get_plain_tags(tags));
    ASSERT_EQ(2u, tags.size());
    EXPECT_EQ("div", tags[0]);
    EXPECT_EQ("section", tags[1]);

    tags.clear();
    ASSERT_TRUE(selector.parse("div, p.lead"));
    EXPECT_FALSE(selector.get_plain_tags(tags));
    EXPECT_TRUE(tags.empty());
}

int main(int argc, char* argv[])
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
