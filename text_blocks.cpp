#include "text_blocks.h"

#include "text_normalizer.h"
#include "utils.h"

using namespace std;

static const char* _block_elements[] = {"p", "li", "h1", "h2", "h3", "h4", "h5", "h6", "pre", "blockquote",
    "td", "th", "dt", "dd", "figcaption", "caption"};

static const vector<string> c_block_elements(_block_elements,
        _block_elements + sizeof(_block_elements) / sizeof(_block_elements[0]));

static void add_block(const DomTree& tree, NodeId node, const string& text, vector<TextBlock>& blocks)
{
    if (text.empty())
    {
        return;
    }

    const char* index = tree.get_node(node).get_attribute("data-node-index");
    blocks.push_back(TextBlock(text, index != NULL ? index : ""));
}

static void add_list(const DomTree& tree, NodeId list, vector<TextBlock>& blocks)
{
    vector<NodeId> items;
    tree.find_tags(list, "li", items);
    vector<string> segments;
    for (size_t i = 0; i < items.size(); ++i)
    {
        string text = normalize_text(tree.text(items[i]));
        if (!text.empty())
        {
            segments.push_back("* " + text);
        }
    }

    add_block(tree, list, join(segments, ", "), blocks);
}

static void collect_blocks(const DomTree& tree, NodeId node, vector<TextBlock>& blocks)
{
    const DomNode& element = tree.get_node(node);
    if (!element.is_element())
    {
        return;
    }

    const string& tag = element.get_tag();
    if (tag == "ul" || tag == "ol")
    {
        add_list(tree, node, blocks);
        return;
    }

    if (match_list(tag.c_str(), c_block_elements, 1) != -1)
    {
        add_block(tree, node, normalize_text(tree.text(node)), blocks);
        return;
    }

    for (size_t i = 0; i < element.get_children().size(); ++i)
    {
        collect_blocks(tree, element.get_children()[i], blocks);
    }
}

void extract_text_blocks(const DomTree& tree, vector<TextBlock>& blocks)
{
    blocks.clear();
    NodeId body = tree.get_body();
    if (body != INVALID_NODE)
    {
        collect_blocks(tree, body, blocks);
    }
}

string text_blocks_to_string(const vector<TextBlock>& blocks)
{
    string output;
    for (size_t i = 0; i < blocks.size(); ++i)
    {
        if (i > 0)
        {
            output.append("\n\n");
        }

        output.append(blocks[i].text);
    }

    return output;
}
