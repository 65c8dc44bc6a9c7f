#include <map>
#include <string>
#include <vector>
#include "gtest/gtest.h"

#include "dom_tree.h"
#include "html_parser.h"
#include "node_processing.h"

using namespace std;

class NodeProcessingTest : public ::testing::Test
{
protected:
    virtual void SetUp()
    {
        string html = "<html><body>";
        for (int i = 0; i < 50; ++i)
        {
            html += "<div class=\"item\"><p>" + to_string(i) + "</p></div>";
        }

        html += "</body></html>";
        ASSERT_TRUE(parse_html(html, this->tree, NULL));
        this->tree.find_tags(this->tree.get_document(), "p", this->nodes);
        ASSERT_EQ(50u, this->nodes.size());
    }

    void test_matches_sequential(const ParallelOptions& options)
    {
        const DomTree& tree = this->tree;
        function<string(NodeId)> processor = [&tree](NodeId node)
        {
            return tree.text(node);
        };

        vector<string> results;
        parallel_process_nodes<string>(this->nodes, processor, options, results);
        ASSERT_EQ(this->nodes.size(), results.size());
        for (size_t i = 0; i < results.size(); ++i)
        {
            EXPECT_EQ(to_string(i), results[i]);
        }
    }

    DomTree tree;
    vector<NodeId> nodes;
};

TEST_F(NodeProcessingTest, sequential)
{
    ParallelOptions options;
    options.enabled = false;
    this->test_matches_sequential(options);
}

TEST_F(NodeProcessingTest, fixed_batches)
{
    ParallelOptions options;
    options.queue_threshold = 1000;
    for (int workers = 1; workers <= 8; ++workers)
    {
        options.max_parallelism = workers;
        this->test_matches_sequential(options);
    }
}

TEST_F(NodeProcessingTest, job_queue)
{
    ParallelOptions options;
    options.queue_threshold = 10;
    options.max_parallelism = 3;
    this->test_matches_sequential(options);
    options.max_parallelism = 64;
    this->test_matches_sequential(options);
}

TEST_F(NodeProcessingTest, bool_results)
{
    ParallelOptions options;
    options.max_parallelism = 4;
    const DomTree& tree = this->tree;
    function<bool(NodeId)> processor = [&tree](NodeId node)
    {
        return tree.text(node).length() == 1;
    };

    vector<bool> results;
    parallel_process_nodes<bool>(this->nodes, processor, options, results);
    ASSERT_EQ(50u, results.size());
    EXPECT_TRUE(results[9]);
    EXPECT_FALSE(results[10]);
}

TEST_F(NodeProcessingTest, empty_input)
{
    ParallelOptions options;
    function<int(NodeId)> processor = [](NodeId node)
    {
        return node;
    };

    vector<int> results(3, 0);
    parallel_process_nodes<int>(vector<NodeId>(), processor, options, results);
    EXPECT_TRUE(results.empty());
}

TEST_F(NodeProcessingTest, batch_process_selections)
{
    vector<NodeId> divs;
    vector<NodeId> paragraphs;
    vector<NodeId> items;
    map<string, NodeAction> operations;
    operations["div"] = [&divs](NodeId node) { divs.push_back(node); };
    operations["p"] = [&paragraphs](NodeId node) { paragraphs.push_back(node); };
    operations["body > .item"] = [&items](NodeId node) { items.push_back(node); };

    ASSERT_TRUE(batch_process_selections(this->tree, operations));
    EXPECT_EQ(50u, divs.size());
    EXPECT_EQ(this->nodes, paragraphs);
    EXPECT_EQ(divs, items);

    map<string, NodeAction> bad;
    bad["div["] = [](NodeId node) {};
    EXPECT_FALSE(batch_process_selections(this->tree, bad));
}

TEST(ParallelOptionsTest, load)
{
    Config config;
    ASSERT_TRUE(config.InitFromString("[parallel]\nenabled = false\nmax_parallelism = 2\nmin_parallel_nodes = 5\n"));
    ParallelOptions options;
    options.load(config);
    EXPECT_FALSE(options.enabled);
    EXPECT_EQ(2, options.max_parallelism);
    EXPECT_EQ(5u, options.min_parallel_nodes);
    EXPECT_EQ(20u, options.queue_threshold);
}

int main(int argc, char* argv[])
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
