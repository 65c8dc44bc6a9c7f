#include <string>
#include <vector>
#include "gtest/gtest.h"

#include "dom_tree.h"
#include "html_parser.h"
#include "html_serializer.h"

using namespace std;

class RemoveTagVisitor : public DomTreeVisitor
{
public:
    RemoveTagVisitor(DomTree& tree, const char* tag) :
        _tree(tree), _tag(tag), _visited(0)
    {
    }

    virtual bool visit(NodeId node)
    {
        ++this->_visited;
        if (this->_tree.is_element(node, this->_tag))
        {
            this->_tree.remove(node);
            return false;
        }

        return true;
    }

    int get_visited() const
    {
        return this->_visited;
    }

private:
    DomTree& _tree;
    const char* _tag;
    int _visited;
};

class DomTreeTest : public ::testing::Test
{
protected:
    virtual void SetUp()
    {
        // html > body > div#main > (p "One", p "Two")
        this->html = this->tree.create_element("html");
        this->body = this->tree.create_element("body");
        this->div = this->tree.create_element("div");
        this->first = this->tree.create_element("p");
        this->second = this->tree.create_element("p");
        this->tree.get_node(this->div).set_attribute("id", "main");

        this->tree.append_child(this->tree.get_document(), this->html);
        this->tree.append_child(this->html, this->body);
        this->tree.append_child(this->body, this->div);
        this->tree.append_child(this->div, this->first);
        this->tree.append_child(this->div, this->second);
        this->tree.append_child(this->first, this->tree.create_text("One"));
        this->tree.append_child(this->second, this->tree.create_text("Two"));
    }

    DomTree tree;
    NodeId html;
    NodeId body;
    NodeId div;
    NodeId first;
    NodeId second;
};

TEST_F(DomTreeTest, structure)
{
    EXPECT_EQ(this->html, this->tree.get_document_element());
    EXPECT_EQ(this->body, this->tree.get_body());
    EXPECT_EQ(INVALID_NODE, this->tree.get_head());
    EXPECT_EQ("OneTwo", this->tree.text(this->div));
    EXPECT_EQ(this->div, this->tree.get_node(this->first).get_parent());
    EXPECT_EQ(this->second, this->tree.next_sibling(this->first));
    EXPECT_EQ(this->first, this->tree.previous_sibling(this->second));
    EXPECT_EQ(INVALID_NODE, this->tree.next_sibling(this->second));
    EXPECT_EQ(1, this->tree.child_index(this->second));
    EXPECT_EQ(this->div, this->tree.nearest_ancestor(this->first, "div"));
    EXPECT_EQ(INVALID_NODE, this->tree.nearest_ancestor(this->first, "p"));
    EXPECT_TRUE(this->tree.is_ancestor(this->html, this->first));
    EXPECT_EQ(2u, this->tree.count_tags(this->html, "p"));
    EXPECT_EQ("<div id=\"main\"><p>One</p><p>Two</p></div>", outer_html(this->tree, this->div));
    EXPECT_EQ("<p>One</p><p>Two</p>", inner_html(this->tree, this->div));
}

TEST_F(DomTreeTest, remove)
{
    this->tree.remove(this->second);
    EXPECT_FALSE(this->tree.is_attached(this->second));
    EXPECT_TRUE(this->tree.is_attached(this->first));
    EXPECT_EQ("<body><div id=\"main\"><p>One</p></div></body>", outer_html(this->tree, this->body));
}

TEST_F(DomTreeTest, unwrap)
{
    this->tree.unwrap(this->div);
    EXPECT_FALSE(this->tree.is_attached(this->div));
    EXPECT_EQ(this->body, this->tree.get_node(this->first).get_parent());
    EXPECT_EQ("<body><p>One</p><p>Two</p></body>", outer_html(this->tree, this->body));
}

TEST_F(DomTreeTest, fragment_edits)
{
    EXPECT_TRUE(this->tree.insert_before(this->second, "<h2>Title</h2>"));
    EXPECT_EQ("<div id=\"main\"><p>One</p><h2>Title</h2><p>Two</p></div>", outer_html(this->tree, this->div));

    EXPECT_TRUE(this->tree.insert_after(this->first, "<span>a</span>b"));
    EXPECT_EQ("<div id=\"main\"><p>One</p><span>a</span>b<h2>Title</h2><p>Two</p></div>", outer_html(this->tree, this->div));

    EXPECT_TRUE(this->tree.replace_with(this->second, "<h1>New</h1>"));
    EXPECT_FALSE(this->tree.is_attached(this->second));
    EXPECT_EQ("<div id=\"main\"><p>One</p><span>a</span>b<h2>Title</h2><h1>New</h1></div>", outer_html(this->tree, this->div));

    // a detached node has no place to insert at
    EXPECT_FALSE(this->tree.insert_before(this->second, "<p>x</p>"));
}

TEST_F(DomTreeTest, node_edits)
{
    NodeId heading = this->tree.create_element("h1");
    this->tree.insert_before(this->first, heading);
    this->tree.append_child(heading, this->tree.create_text("H"));
    NodeId rule = this->tree.create_element("hr");
    this->tree.insert_after(this->first, rule);
    EXPECT_EQ("<div id=\"main\"><h1>H</h1><p>One</p><hr/><p>Two</p></div>", outer_html(this->tree, this->div));

    NodeId text = this->tree.create_text("plain");
    this->tree.replace_node(rule, text);
    EXPECT_EQ("<div id=\"main\"><h1>H</h1><p>One</p>plain<p>Two</p></div>", outer_html(this->tree, this->div));

    // moving an attached node detaches it from its old place
    this->tree.append_child(this->div, this->first);
    EXPECT_EQ("<div id=\"main\"><h1>H</h1>plain<p>Two</p><p>One</p></div>", outer_html(this->tree, this->div));
}

TEST_F(DomTreeTest, clone_and_import)
{
    NodeId shallow = this->tree.clone_node(this->div, false);
    EXPECT_EQ("<div id=\"main\"></div>", outer_html(this->tree, shallow));
    EXPECT_FALSE(this->tree.is_attached(shallow));

    NodeId deep = this->tree.clone_node(this->div, true);
    this->tree.get_node(deep).set_attribute("id", "copy");
    EXPECT_EQ("<div id=\"copy\"><p>One</p><p>Two</p></div>", outer_html(this->tree, deep));
    EXPECT_EQ("main", string(this->tree.get_node(this->div).get_attribute("id")));

    DomTree other;
    NodeId imported = other.import_node(this->tree, this->div);
    other.append_child(other.get_document(), imported);
    EXPECT_EQ("<div id=\"main\"><p>One</p><p>Two</p></div>", outer_html(other, other.get_document()));

    DomTree copy(this->tree);
    copy.remove(this->first);
    EXPECT_TRUE(this->tree.is_attached(this->first));
}

TEST_F(DomTreeTest, attributes)
{
    DomNode& node = this->tree.get_node(this->first);
    node.set_attribute("title", "a\"b&c");
    node.set_attribute("class", "lead");
    EXPECT_TRUE(node.has_attribute("class"));
    EXPECT_TRUE(node.get_attribute("missing") == NULL);
    EXPECT_EQ("<p class=\"lead\" title=\"a&quot;b&amp;c\">One</p>", outer_html(this->tree, this->first));

    EXPECT_TRUE(node.remove_attribute("class"));
    EXPECT_FALSE(node.remove_attribute("class"));
    node.clear_attributes();
    EXPECT_EQ("<p>One</p>", outer_html(this->tree, this->first));
}

TEST_F(DomTreeTest, traverse_with_removal)
{
    RemoveTagVisitor visitor(this->tree, "p");
    this->tree.preorder_traverse(this->tree.get_document(), visitor);
    // document, html, body, div, both paragraphs
    EXPECT_EQ(6, visitor.get_visited());
    EXPECT_EQ("<div id=\"main\"></div>", outer_html(this->tree, this->div));
}

TEST_F(DomTreeTest, postorder_traverse_with_removal)
{
    RemoveTagVisitor visitor(this->tree, "p");
    this->tree.postorder_traverse(this->tree.get_document(), visitor);
    // the text of each paragraph is visited before it goes
    EXPECT_EQ(8, visitor.get_visited());
    EXPECT_EQ("<div id=\"main\"></div>", outer_html(this->tree, this->div));
    EXPECT_FALSE(this->tree.is_attached(this->second));
}

TEST(HtmlParserTest, parse_document)
{
    DomTree tree;
    Error error;
    const char* html = "<html><head><title>T</title></head><body><DIV ID=\"X\">a &amp; b<br>c</DIV></body></html>";
    ASSERT_TRUE(parse_html(html, tree, &error));
    EXPECT_TRUE(error.ok());

    NodeId head = tree.get_head();
    ASSERT_NE(INVALID_NODE, head);
    EXPECT_EQ("T", tree.text(head));

    NodeId body = tree.get_body();
    ASSERT_NE(INVALID_NODE, body);
    EXPECT_EQ("<body><div id=\"X\">a &amp; b<br/>c</div></body>", outer_html(tree, body));
    EXPECT_EQ("a & bc", tree.text(body));
}

TEST(HtmlParserTest, repairs_broken_markup)
{
    DomTree tree;
    ASSERT_TRUE(parse_html("<p>one<p>two", tree, NULL));
    NodeId body = tree.get_body();
    ASSERT_NE(INVALID_NODE, body);
    EXPECT_EQ("<body><p>one</p><p>two</p></body>", outer_html(tree, body));
}

TEST(HtmlParserTest, empty_input)
{
    DomTree tree;
    Error error;
    EXPECT_FALSE(parse_html("", tree, &error));
    EXPECT_EQ(EC_PARSE_ERROR, error.code());
    EXPECT_EQ(INVALID_NODE, tree.get_document_element());
}

TEST(HtmlParserTest, parse_fragment)
{
    DomTree tree;
    vector<NodeId> nodes;
    ASSERT_TRUE(parse_fragment("<b>x</b> tail", tree, nodes, NULL));
    ASSERT_EQ(2u, nodes.size());
    EXPECT_EQ("<b>x</b>", outer_html(tree, nodes[0]));
    EXPECT_EQ(" tail", tree.get_node(nodes[1]).get_text());
    EXPECT_FALSE(tree.is_attached(nodes[0]));
}

TEST(HtmlSerializerTest, escaping)
{
    EXPECT_EQ("a &lt;b&gt; &amp; \"c\"", escape_text("a <b> & \"c\""));
    EXPECT_EQ("a &quot;b&quot; &amp; <c>", escape_attribute("a \"b\" & <c>"));
    EXPECT_TRUE(is_void_element("br"));
    EXPECT_TRUE(is_void_element("img"));
    EXPECT_FALSE(is_void_element("p"));
}

int main(int argc, char* argv[])
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
