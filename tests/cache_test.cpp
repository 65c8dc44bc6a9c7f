#include <memory>
#include <string>
#include "gtest/gtest.h"

#include "cache_service.h"
#include "config.h"
#include "dom_tree.h"
#include "html_parser.h"

using namespace std;

class CacheServiceTest : public ::testing::Test
{
protected:
    virtual void SetUp()
    {
        this->options.cleanup_interval_ms = 0;
    }

    CacheOptions options;
};

TEST_F(CacheServiceTest, documents)
{
    CacheService cache(this->options);
    string html = "<html><body><p>cached</p></body></html>";
    shared_ptr<DomTree> parsed(new DomTree());
    ASSERT_TRUE(parse_html(html, *parsed, NULL));

    shared_ptr<const DomTree> found;
    EXPECT_FALSE(cache.get_document(html, found));
    cache.set_document(html, parsed);
    ASSERT_TRUE(cache.get_document(html, found));
    EXPECT_EQ(parsed.get(), found.get());
    EXPECT_FALSE(cache.get_document(html + " ", found));

    CacheStats stats = cache.document_stats();
    EXPECT_EQ(1, stats.hits);
    EXPECT_EQ(2, stats.misses);
}

TEST_F(CacheServiceTest, document_key_uses_prefix_and_length)
{
    string prefix(2000, 'x');
    // same prefix and length share a key
    EXPECT_EQ(CacheService::document_key(prefix + "a"), CacheService::document_key(prefix + "b"));
    EXPECT_NE(CacheService::document_key(prefix + "a"), CacheService::document_key(prefix + "ab"));
    EXPECT_NE(CacheService::document_key("a"), CacheService::document_key("b"));
}

TEST_F(CacheServiceTest, content_nodes)
{
    CacheService cache(this->options);
    DomTree tree;
    ASSERT_TRUE(parse_html("<html><head><title>T</title></head><body><article><p>x</p></article></body></html>", tree, NULL));
    NodeId article = tree.find_first(tree.get_document(), "article");

    NodeId node;
    EXPECT_FALSE(cache.get_content_node(tree, node));
    cache.set_content_node(tree, article);
    ASSERT_TRUE(cache.get_content_node(tree, node));
    EXPECT_EQ(article, node);

    // an equal copy finds the same entry
    DomTree copy(tree);
    ASSERT_TRUE(cache.get_content_node(copy, node));
    EXPECT_EQ(article, node);
}

TEST_F(CacheServiceTest, stale_content_node_is_ignored)
{
    CacheService cache(this->options);
    DomTree tree;
    ASSERT_TRUE(parse_html("<html><body><article><p>x</p></article></body></html>", tree, NULL));
    NodeId article = tree.find_first(tree.get_document(), "article");
    NodeId text = tree.get_node(tree.find_first(article, "p")).get_children()[0];

    // a text node is never a valid content node
    cache.set_content_node(tree, text);
    NodeId node;
    EXPECT_FALSE(cache.get_content_node(tree, node));

    // nor is one outside the tree
    cache.set_content_node(tree, static_cast<NodeId>(tree.size() + 10));
    EXPECT_FALSE(cache.get_content_node(tree, node));
}

TEST_F(CacheServiceTest, scores)
{
    CacheService cache(this->options);
    DomTree tree;
    ASSERT_TRUE(parse_html("<html><body><div class=\"a\">same</div><div class=\"b\">same</div></body></html>", tree, NULL));
    vector<NodeId> divs;
    tree.find_tags(tree.get_document(), "div", divs);
    ASSERT_EQ(2u, divs.size());

    double score;
    cache.set_score(tree, divs[0], 12.5);
    ASSERT_TRUE(cache.get_score(tree, divs[0], score));
    EXPECT_DOUBLE_EQ(12.5, score);
    EXPECT_FALSE(cache.get_score(tree, divs[1], score));
    EXPECT_NE(CacheService::score_key(tree, divs[0]), CacheService::score_key(tree, divs[1]));

    cache.clear();
    EXPECT_FALSE(cache.get_score(tree, divs[0], score));
    EXPECT_EQ(0u, cache.score_stats().size);
}

TEST_F(CacheServiceTest, nested_wrappers_have_distinct_score_keys)
{
    DomTree tree;
    ASSERT_TRUE(parse_html("<html><body><div class=\"content\"><div class=\"content\"><p>same</p></div></div>"
            "</body></html>", tree, NULL));
    vector<NodeId> divs;
    tree.find_tags(tree.get_document(), "div", divs);
    ASSERT_EQ(2u, divs.size());
    EXPECT_EQ(tree.text(divs[0]), tree.text(divs[1]));
    EXPECT_NE(CacheService::score_key(tree, divs[0]), CacheService::score_key(tree, divs[1]));
}

TEST_F(CacheServiceTest, disabled)
{
    this->options.enabled = false;
    CacheService cache(this->options);
    EXPECT_FALSE(cache.enabled());

    DomTree tree;
    ASSERT_TRUE(parse_html("<html><body><p>x</p></body></html>", tree, NULL));
    cache.set_score(tree, tree.get_body(), 1.0);
    double score;
    EXPECT_FALSE(cache.get_score(tree, tree.get_body(), score));
    EXPECT_EQ(0u, cache.score_stats().size);
}

TEST(CacheOptionsTest, load)
{
    Config config;
    ASSERT_TRUE(config.InitFromString("[cache]\nenabled = no\nnode_capacity = 3\nexpiration_ms = 1000\n"));
    CacheOptions options;
    options.load(config);
    EXPECT_FALSE(options.enabled);
    EXPECT_EQ(3u, options.node_capacity);
    EXPECT_EQ(100u, options.document_capacity);
    EXPECT_EQ(1000, options.expiration_ms);
}

int main(int argc, char* argv[])
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
