#include "html_simplifier.h"

#include <set>

#include "text_normalizer.h"
#include "utils.h"

using namespace std;

// moves the children of node into before and after around point. every
// element on the path down to point is shallow copied on both sides.
void HtmlSimplifier::split_contents(DomTree& tree, NodeId node, NodeId point, NodeId before, NodeId after) const
{
    const vector<NodeId> children = tree.get_node(node).get_children();
    bool passed = false;
    for (size_t i = 0; i < children.size(); ++i)
    {
        NodeId child = children[i];
        if (passed)
        {
            tree.append_child(after, child);
            continue;
        }

        if (child == point)
        {
            passed = true;
            continue;
        }

        if (tree.is_ancestor(child, point))
        {
            NodeId left = tree.clone_node(child, false);
            NodeId right = tree.clone_node(child, false);
            tree.append_child(before, left);
            tree.append_child(after, right);
            this->split_contents(tree, child, point, left, right);
            if (tree.get_node(left).get_children().empty())
            {
                tree.remove(left);
            }

            if (tree.get_node(right).get_children().empty())
            {
                tree.remove(right);
            }

            passed = true;
            continue;
        }

        tree.append_child(before, child);
    }
}

bool HtmlSimplifier::split_paragraph(DomTree& tree, NodeId paragraph, NodeId point, bool keep_point, bool keep_empty) const
{
    NodeId before = tree.clone_node(paragraph, false);
    NodeId after = tree.clone_node(paragraph, false);
    this->split_contents(tree, paragraph, point, before, after);

    tree.insert_before(paragraph, before);
    if (keep_point)
    {
        tree.insert_before(paragraph, point);
    }

    tree.insert_before(paragraph, after);
    tree.remove(paragraph);

    bool before_blank = HtmlSimplifier::is_blank(tree, before);
    bool after_blank = HtmlSimplifier::is_blank(tree, after);
    if (before_blank && after_blank)
    {
        tree.remove(after);
        if (!keep_empty)
        {
            tree.remove(before);
        }

        return false;
    }

    if (before_blank)
    {
        tree.remove(before);
    }

    if (after_blank)
    {
        tree.remove(after);
    }

    return true;
}

static NodeId find_nested(const DomTree& tree, const string& tag)
{
    vector<NodeId> elements;
    tree.find_tags(tree.get_document(), tag.c_str(), elements);
    for (size_t i = 0; i < elements.size(); ++i)
    {
        if (tree.nearest_ancestor(elements[i], "p") != INVALID_NODE)
        {
            return elements[i];
        }
    }

    return INVALID_NODE;
}

void HtmlSimplifier::unnest_paragraphs(DomTree& tree) const
{
    const vector<string>& illegal = HtmlSimplifier::paragraph_illegal_elements();
    for (size_t i = 0; i < illegal.size(); ++i)
    {
        NodeId element = find_nested(tree, illegal[i]);
        while (element != INVALID_NODE)
        {
            NodeId paragraph = tree.nearest_ancestor(element, "p");
            this->split_paragraph(tree, paragraph, element, true, false);
            element = find_nested(tree, illegal[i]);
        }
    }
}

static bool is_whitespace_text(const DomTree& tree, NodeId node)
{
    const DomNode& current = tree.get_node(node);
    return current.is_text() && normalize_text(current.get_text()).empty();
}

void HtmlSimplifier::insert_paragraph_breaks(DomTree& tree) const
{
    // a single br reads as a space, a run of them becomes an hr split point
    vector<NodeId> breaks;
    tree.find_tags(tree.get_document(), "br", breaks);
    set<NodeId> consumed;
    for (size_t i = 0; i < breaks.size(); ++i)
    {
        NodeId first = breaks[i];
        if (consumed.count(first) > 0 || !tree.is_attached(first))
        {
            continue;
        }

        vector<NodeId> run(1, first);
        vector<NodeId> gaps;
        vector<NodeId> pending;
        NodeId next = tree.next_sibling(first);
        while (next != INVALID_NODE)
        {
            if (tree.is_element(next, "br"))
            {
                run.push_back(next);
                gaps.insert(gaps.end(), pending.begin(), pending.end());
                pending.clear();
            }
            else if (is_whitespace_text(tree, next))
            {
                pending.push_back(next);
            }
            else
            {
                break;
            }

            next = tree.next_sibling(next);
        }

        consumed.insert(run.begin(), run.end());
        if (run.size() == 1)
        {
            NodeId space = tree.create_text(" ");
            tree.replace_node(first, space);
            continue;
        }

        NodeId marker = tree.create_element("hr");
        tree.insert_before(first, marker);
        for (size_t j = 0; j < run.size(); ++j)
        {
            tree.remove(run[j]);
        }

        for (size_t j = 0; j < gaps.size(); ++j)
        {
            tree.remove(gaps[j]);
        }
    }

    vector<NodeId> markers;
    tree.find_tags(tree.get_document(), "hr", markers);
    for (size_t i = 0; i < markers.size(); ++i)
    {
        NodeId marker = markers[i];
        if (!tree.is_attached(marker))
        {
            continue;
        }

        NodeId paragraph = tree.nearest_ancestor(marker, "p");
        if (paragraph != INVALID_NODE)
        {
            this->split_paragraph(tree, paragraph, marker, false, !this->_options.remove_empty);
        }
        else
        {
            NodeId space = tree.create_text(" ");
            tree.replace_node(marker, space);
        }
    }
}

static bool is_phrasing_content(const DomTree& tree, NodeId node)
{
    const DomNode& current = tree.get_node(node);
    if (current.is_text())
    {
        return true;
    }

    if (!current.is_element())
    {
        return false;
    }

    const char* tag = current.get_tag().c_str();
    return current.get_tag() == "br"
        || match_list(tag, HtmlSimplifier::elements_to_unwrap(), 1) != -1
        || match_list(tag, HtmlSimplifier::special_elements(), 1) != -1;
}

void HtmlSimplifier::wrap_bare_text(DomTree& tree) const
{
    vector<NodeId> containers;
    tree.find_tags(tree.get_document(), HtmlSimplifier::bare_text_containers(), containers);
    for (size_t i = 0; i < containers.size(); ++i)
    {
        if (!tree.is_attached(containers[i]))
        {
            continue;
        }

        const vector<NodeId> children = tree.get_node(containers[i]).get_children();
        size_t start = 0;
        while (start < children.size())
        {
            if (!is_phrasing_content(tree, children[start]))
            {
                ++start;
                continue;
            }

            size_t end = start;
            string text;
            while (end < children.size() && is_phrasing_content(tree, children[end]))
            {
                text.append(tree.text(children[end]));
                ++end;
            }

            if (!normalize_text(text).empty())
            {
                NodeId paragraph = tree.create_element("p");
                tree.insert_before(children[start], paragraph);
                for (size_t j = start; j < end; ++j)
                {
                    tree.append_child(paragraph, children[j]);
                }
            }

            start = end;
        }
    }

    // a paragraph alone in a list item, cell or heading adds nothing
    vector<NodeId> paragraphs;
    tree.find_tags(tree.get_document(), "p", paragraphs);
    for (size_t i = 0; i < paragraphs.size(); ++i)
    {
        NodeId parent = tree.get_node(paragraphs[i]).get_parent();
        if (parent == INVALID_NODE || !tree.get_node(parent).is_element())
        {
            continue;
        }

        const char* tag = tree.get_node(parent).get_tag().c_str();
        if (match_list(tag, HtmlSimplifier::block_whitelist(), 1) == -1
            || match_list(tag, HtmlSimplifier::bare_text_containers(), 1) != -1
            || tree.get_node(parent).get_tag() == "p")
        {
            continue;
        }

        if (tree.get_node(parent).get_children().size() == 1)
        {
            tree.unwrap(paragraphs[i]);
        }
    }
}
