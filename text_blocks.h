#ifndef _TEXT_BLOCKS_H_
#define _TEXT_BLOCKS_H_

#include <string>
#include <vector>

#include "dom_tree.h"

struct TextBlock
{
    TextBlock()
    {
    }

    TextBlock(const std::string& text, const std::string& node_index) :
        text(text), node_index(node_index)
    {
    }

    std::string text;
    // data-node-index of the source element, empty when not annotated
    std::string node_index;
};

// One block per paragraph level element under body, in document order. A
// ul or ol becomes a single "* first, * second" block.
void extract_text_blocks(const DomTree& tree, std::vector<TextBlock>& blocks);

// blocks joined by blank lines
std::string text_blocks_to_string(const std::vector<TextBlock>& blocks);

#endif
