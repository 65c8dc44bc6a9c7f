#include <string>
#include <vector>
#include "gtest/gtest.h"

#include "cache_service.h"
#include "config.h"
#include "content_locator.h"
#include "dom_tree.h"
#include "html_parser.h"

using namespace std;

static const char* c_prose =
    "Readers come back for long form writing. This paragraph is long enough to count as real content, "
    "and it keeps going for a while so the fallback scan picks it up.";

class ContentLocatorTest : public ::testing::Test
{
protected:
    virtual void SetUp()
    {
        Config config;
        ASSERT_TRUE(this->locator.init(config));
    }

    NodeId locate(const string& body)
    {
        EXPECT_TRUE(parse_html("<html><head><title>t</title></head><body>" + body + "</body></html>", this->tree, NULL));
        return this->locator.locate(this->tree);
    }

    string tag_of(NodeId node)
    {
        return node == INVALID_NODE ? "" : this->tree.get_node(node).get_tag();
    }

    ContentLocator locator;
    DomTree tree;
};

TEST_F(ContentLocatorTest, candidates)
{
    ASSERT_TRUE(parse_html("<html><body><div id=\"main-content\" class=\"post\"><p>a</p></div><main><p>b</p></main>"
            "<div class=\"sidebar\"><p>c</p></div><span data-content-focus=\"true\">d</span></body></html>", this->tree, NULL));

    vector<NodeId> candidates;
    this->locator.find_candidates(this->tree, candidates);
    // the first div matches three groups but is listed once
    ASSERT_EQ(3u, candidates.size());
    EXPECT_EQ("div", this->tag_of(candidates[0]));
    EXPECT_EQ("main", this->tag_of(candidates[1]));
    EXPECT_EQ("span", this->tag_of(candidates[2]));
}

TEST_F(ContentLocatorTest, best_candidate)
{
    NodeId node = this->locate("<div class=\"sidebar\"><p>Side.</p></div>"
            "<article><p>First paragraph of the story.</p><p>Second one.</p></article>");
    EXPECT_EQ("article", this->tag_of(node));
}

TEST_F(ContentLocatorTest, first_candidate_wins_ties)
{
    NodeId node = this->locate("<article id=\"one\"><p>Same text.</p></article><article id=\"two\"><p>Same text.</p></article>");
    ASSERT_EQ("article", this->tag_of(node));
    EXPECT_STREQ("one", this->tree.get_node(node).get_attribute("id"));
}

TEST_F(ContentLocatorTest, forced_focus)
{
    NodeId node = this->locate(string("<div><p>") + c_prose + "</p></div><section data-content-focus=\"true\"><p>Pinned.</p></section>");
    EXPECT_EQ("section", this->tag_of(node));
}

TEST_F(ContentLocatorTest, fallback_to_prose_block)
{
    NodeId node = this->locate(string("<div id=\"a\"><p>short</p></div><section><p>") + c_prose + "</p></section>");
    EXPECT_EQ("section", this->tag_of(node));
}

TEST_F(ContentLocatorTest, non_positive_candidates_fall_through)
{
    // the nav matches [class*=main] but scores below zero
    NodeId node = this->locate(string("<nav class=\"main-menu\"></nav><div>") + c_prose + "</div>");
    EXPECT_EQ("div", this->tag_of(node));
}

TEST_F(ContentLocatorTest, fallback_to_body)
{
    NodeId node = this->locate("<p>tiny</p>");
    EXPECT_EQ(this->tree.get_body(), node);
}

TEST_F(ContentLocatorTest, parallel_scoring_matches_sequential)
{
    string body;
    for (int i = 0; i < 30; ++i)
    {
        body += "<div class=\"entry\"><p>Entry text.</p></div>";
    }

    body += string("<div class=\"entry\"><p>") + c_prose + "</p><p>More.</p></div>";

    ParallelOptions sequential;
    sequential.enabled = false;
    this->locator.set_parallel_options(sequential);
    NodeId expected = this->locate(body);

    ParallelOptions parallel;
    parallel.enabled = true;
    parallel.max_parallelism = 4;
    parallel.min_parallel_nodes = 2;
    parallel.queue_threshold = 8;
    this->locator.set_parallel_options(parallel);
    EXPECT_EQ(expected, this->locator.locate(this->tree));

    // the short entries all score alike and outrank the long one
    vector<NodeId> candidates;
    this->locator.find_candidates(this->tree, candidates);
    ASSERT_EQ(31u, candidates.size());
    EXPECT_EQ(candidates.front(), expected);
}

TEST_F(ContentLocatorTest, cached_scores)
{
    CacheOptions options;
    options.cleanup_interval_ms = 0;
    CacheService cache(options);
    this->locator.set_cache(&cache);

    NodeId first = this->locate("<article><p>Cached story.</p></article>");
    EXPECT_EQ(1, cache.score_stats().misses);
    EXPECT_EQ(1u, cache.score_stats().size);

    EXPECT_EQ(first, this->locator.locate(this->tree));
    EXPECT_EQ(1, cache.score_stats().hits);
    this->locator.set_cache(NULL);
}

TEST_F(ContentLocatorTest, cache_keeps_nested_wrappers_apart)
{
    NodeId uncached = this->locate("<div class=\"post\"><div class=\"post\"><p>Shared story text.</p>"
            "<p>More of it.</p></div></div>");

    CacheOptions options;
    options.cleanup_interval_ms = 0;
    CacheService cache(options);
    this->locator.set_cache(&cache);
    EXPECT_EQ(uncached, this->locator.locate(this->tree));
    EXPECT_EQ(2u, cache.score_stats().size);

    // a second pass is answered from the cache with the same result
    EXPECT_EQ(uncached, this->locator.locate(this->tree));
    this->locator.set_cache(NULL);
}

TEST(ContentLocatorConfigTest, custom_settings)
{
    Config config;
    ASSERT_TRUE(config.InitFromString("[contentLocator]\nfocus_attribute = data-pin\ncandidate_selectors = .story; #body\n"
            "min_fallback_text_length = 5\n"));
    ContentLocator locator;
    ASSERT_TRUE(locator.init(config));
    EXPECT_EQ("data-pin", locator.get_focus_attribute());

    DomTree tree;
    ASSERT_TRUE(parse_html("<html><body><article><p>ignored</p></article><div class=\"story\"><p>Kept.</p></div>"
            "<p data-pin=\"true\">x</p></body></html>", tree, NULL));
    vector<NodeId> candidates;
    locator.find_candidates(tree, candidates);
    ASSERT_EQ(2u, candidates.size());
    EXPECT_EQ("div", tree.get_node(candidates[0]).get_tag());
    EXPECT_EQ("p", tree.get_node(candidates[1]).get_tag());

    vector<NodeId> fallback;
    locator.find_fallback_candidates(tree, fallback);
    ASSERT_EQ(1u, fallback.size());
    EXPECT_EQ(candidates[0], fallback[0]);

    Config bad;
    ASSERT_TRUE(bad.InitFromString("[contentLocator]\nfallback_selector = div[\n"));
    ContentLocator other;
    EXPECT_FALSE(other.init(bad));
}

int main(int argc, char* argv[])
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
