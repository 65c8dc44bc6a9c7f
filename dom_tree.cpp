#include "dom_tree.h"

#include <assert.h>
#include <algorithm>

#include "html_parser.h"
#include "utils.h"

using namespace std;

const char* DomNode::get_attribute(const char* name) const
{
    map<string, string>::const_iterator iter = this->m_attributes.find(string(name));
    if (iter != this->m_attributes.end())
    {
        return iter->second.c_str();
    }
    else
    {
        return NULL;
    }
}

DomTree::DomTree()
{
    this->m_nodes.push_back(DomNode(NT_DOCUMENT, "", ""));
}

bool DomTree::is_element(NodeId id, const char* tag_name) const
{
    const DomNode& node = this->m_nodes[id];
    return node.m_type == NT_ELEMENT && node.m_tag.compare(tag_name) == 0;
}

NodeId DomTree::create_node(NodeType type, const string& tag, const string& text)
{
    this->m_nodes.push_back(DomNode(type, tag, text));
    return static_cast<NodeId>(this->m_nodes.size() - 1);
}

NodeId DomTree::create_element(const string& tag)
{
    return this->create_node(NT_ELEMENT, tag, "");
}

NodeId DomTree::create_text(const string& text)
{
    return this->create_node(NT_TEXT, "", text);
}

NodeId DomTree::create_comment(const string& text)
{
    return this->create_node(NT_COMMENT, "", text);
}

NodeId DomTree::create_doctype(const string& name)
{
    return this->create_node(NT_DOCTYPE, name, "");
}

void DomTree::detach(NodeId node)
{
    NodeId parent = this->m_nodes[node].m_parent;
    if (parent == INVALID_NODE)
    {
        return;
    }

    vector<NodeId>& siblings = this->m_nodes[parent].m_children;
    vector<NodeId>::iterator iter = find(siblings.begin(), siblings.end(), node);
    if (iter != siblings.end())
    {
        siblings.erase(iter);
    }

    this->m_nodes[node].m_parent = INVALID_NODE;
}

void DomTree::append_child(NodeId parent, NodeId child)
{
    this->insert_child(parent, this->m_nodes[parent].m_children.size(), child);
}

void DomTree::insert_child(NodeId parent, size_t index, NodeId child)
{
    assert(parent != child);
    this->detach(child);
    vector<NodeId>& children = this->m_nodes[parent].m_children;
    if (index > children.size())
    {
        index = children.size();
    }

    children.insert(children.begin() + index, child);
    this->m_nodes[child].m_parent = parent;
}

void DomTree::insert_before(NodeId reference, NodeId node)
{
    NodeId parent = this->m_nodes[reference].m_parent;
    if (parent == INVALID_NODE || reference == node)
    {
        return;
    }

    this->detach(node);
    this->insert_child(parent, this->child_index(reference), node);
}

void DomTree::insert_after(NodeId reference, NodeId node)
{
    NodeId parent = this->m_nodes[reference].m_parent;
    if (parent == INVALID_NODE || reference == node)
    {
        return;
    }

    this->detach(node);
    this->insert_child(parent, this->child_index(reference) + 1, node);
}

void DomTree::replace_node(NodeId old_node, NodeId new_node)
{
    if (old_node == new_node)
    {
        return;
    }

    this->insert_before(old_node, new_node);
    this->detach(old_node);
}

void DomTree::remove(NodeId node)
{
    this->detach(node);
}

void DomTree::unwrap(NodeId node)
{
    NodeId parent = this->m_nodes[node].m_parent;
    if (parent == INVALID_NODE)
    {
        return;
    }

    size_t index = this->child_index(node);
    vector<NodeId> children;
    children.swap(this->m_nodes[node].m_children);
    vector<NodeId>& siblings = this->m_nodes[parent].m_children;
    siblings.erase(siblings.begin() + index);
    siblings.insert(siblings.begin() + index, children.begin(), children.end());
    for (size_t i = 0; i < children.size(); ++i)
    {
        this->m_nodes[children[i]].m_parent = parent;
    }

    this->m_nodes[node].m_parent = INVALID_NODE;
}

bool DomTree::insert_fragment(NodeId reference, const string& html_fragment, bool after)
{
    if (this->m_nodes[reference].m_parent == INVALID_NODE)
    {
        return false;
    }

    vector<NodeId> nodes;
    if (!parse_fragment(html_fragment, *this, nodes, NULL))
    {
        return false;
    }

    NodeId anchor = reference;
    for (size_t i = 0; i < nodes.size(); ++i)
    {
        if (after)
        {
            this->insert_after(anchor, nodes[i]);
            anchor = nodes[i];
        }
        else
        {
            this->insert_before(reference, nodes[i]);
        }
    }

    return true;
}

bool DomTree::insert_before(NodeId reference, const string& html_fragment)
{
    return this->insert_fragment(reference, html_fragment, false);
}

bool DomTree::insert_after(NodeId reference, const string& html_fragment)
{
    return this->insert_fragment(reference, html_fragment, true);
}

bool DomTree::replace_with(NodeId node, const string& html_fragment)
{
    if (!this->insert_fragment(node, html_fragment, false))
    {
        return false;
    }

    this->detach(node);
    return true;
}

NodeId DomTree::clone_node(NodeId node, bool deep)
{
    DomNode copy(this->m_nodes[node].m_type, this->m_nodes[node].m_tag, this->m_nodes[node].m_text);
    copy.m_attributes = this->m_nodes[node].m_attributes;
    this->m_nodes.push_back(copy);
    NodeId result = static_cast<NodeId>(this->m_nodes.size() - 1);
    if (deep)
    {
        vector<NodeId> children = this->m_nodes[node].m_children;
        for (size_t i = 0; i < children.size(); ++i)
        {
            NodeId child = this->clone_node(children[i], true);
            this->append_child(result, child);
        }
    }

    return result;
}

NodeId DomTree::import_node(const DomTree& other, NodeId node)
{
    const DomNode& source = other.m_nodes[node];
    DomNode copy(source.m_type, source.m_tag, source.m_text);
    copy.m_attributes = source.m_attributes;
    this->m_nodes.push_back(copy);
    NodeId result = static_cast<NodeId>(this->m_nodes.size() - 1);
    for (size_t i = 0; i < source.m_children.size(); ++i)
    {
        NodeId child = this->import_node(other, source.m_children[i]);
        this->append_child(result, child);
    }

    return result;
}

int DomTree::child_index(NodeId node) const
{
    NodeId parent = this->m_nodes[node].m_parent;
    if (parent == INVALID_NODE)
    {
        return -1;
    }

    const vector<NodeId>& siblings = this->m_nodes[parent].m_children;
    for (size_t i = 0; i < siblings.size(); ++i)
    {
        if (siblings[i] == node)
        {
            return static_cast<int>(i);
        }
    }

    return -1;
}

NodeId DomTree::previous_sibling(NodeId node) const
{
    int index = this->child_index(node);
    if (index <= 0)
    {
        return INVALID_NODE;
    }

    return this->m_nodes[this->m_nodes[node].m_parent].m_children[index - 1];
}

NodeId DomTree::next_sibling(NodeId node) const
{
    int index = this->child_index(node);
    if (index < 0)
    {
        return INVALID_NODE;
    }

    const vector<NodeId>& siblings = this->m_nodes[this->m_nodes[node].m_parent].m_children;
    if (static_cast<size_t>(index + 1) >= siblings.size())
    {
        return INVALID_NODE;
    }

    return siblings[index + 1];
}

NodeId DomTree::nearest_ancestor(NodeId node, const char* tag_name) const
{
    NodeId current = this->m_nodes[node].m_parent;
    while (current != INVALID_NODE)
    {
        if (this->is_element(current, tag_name))
        {
            return current;
        }

        current = this->m_nodes[current].m_parent;
    }

    return INVALID_NODE;
}

bool DomTree::is_ancestor(NodeId ancestor, NodeId node) const
{
    NodeId current = this->m_nodes[node].m_parent;
    while (current != INVALID_NODE)
    {
        if (current == ancestor)
        {
            return true;
        }

        current = this->m_nodes[current].m_parent;
    }

    return false;
}

bool DomTree::is_attached(NodeId node) const
{
    return node == this->get_document() || this->is_ancestor(this->get_document(), node);
}

NodeId DomTree::get_document_element() const
{
    const vector<NodeId>& children = this->m_nodes[0].m_children;
    for (size_t i = 0; i < children.size(); ++i)
    {
        if (this->m_nodes[children[i]].m_type == NT_ELEMENT)
        {
            return children[i];
        }
    }

    return INVALID_NODE;
}

NodeId DomTree::get_head() const
{
    NodeId html = this->get_document_element();
    if (html == INVALID_NODE)
    {
        return INVALID_NODE;
    }

    return this->find_first(html, "head");
}

NodeId DomTree::get_body() const
{
    NodeId html = this->get_document_element();
    if (html == INVALID_NODE)
    {
        return INVALID_NODE;
    }

    return this->find_first(html, "body");
}

NodeId DomTree::find_first(NodeId root, const char* tag_name) const
{
    if (this->is_element(root, tag_name))
    {
        return root;
    }

    const vector<NodeId>& children = this->m_nodes[root].m_children;
    for (size_t i = 0; i < children.size(); ++i)
    {
        NodeId found = this->find_first(children[i], tag_name);
        if (found != INVALID_NODE)
        {
            return found;
        }
    }

    return INVALID_NODE;
}

void DomTree::find_tags(NodeId root, const char* tag_name, vector<NodeId>& results) const
{
    if (this->is_element(root, tag_name))
    {
        results.push_back(root);
    }

    const vector<NodeId>& children = this->m_nodes[root].m_children;
    for (size_t i = 0; i < children.size(); ++i)
    {
        this->find_tags(children[i], tag_name, results);
    }
}

void DomTree::find_tags(NodeId root, const vector<string>& tag_names, vector<NodeId>& results) const
{
    const DomNode& node = this->m_nodes[root];
    if (node.m_type == NT_ELEMENT && match_list(node.m_tag.c_str(), tag_names, 1) != -1)
    {
        results.push_back(root);
    }

    for (size_t i = 0; i < node.m_children.size(); ++i)
    {
        this->find_tags(node.m_children[i], tag_names, results);
    }
}

size_t DomTree::count_tags(NodeId root, const char* tag_name) const
{
    vector<NodeId> results;
    this->find_tags(root, tag_name, results);
    return results.size();
}

string DomTree::text(NodeId node) const
{
    string output;
    this->append_text(node, output);
    return output;
}

void DomTree::append_text(NodeId node, string& output) const
{
    const DomNode& current = this->m_nodes[node];
    if (current.m_type == NT_TEXT)
    {
        output.append(current.m_text);
        return;
    }

    if (current.m_type != NT_ELEMENT && current.m_type != NT_DOCUMENT)
    {
        return;
    }

    for (size_t i = 0; i < current.m_children.size(); ++i)
    {
        this->append_text(current.m_children[i], output);
    }
}

bool DomTree::preorder_traverse(NodeId node, DomTreeVisitor& visitor)
{
    bool success = visitor.preprocess(node);
    if (!success)
    {
        return false;
    }

    success = visitor.visit(node);
    if (!success)
    {
        return false;
    }

    for (size_t i = 0; i < this->m_nodes[node].m_children.size(); ++i)
    {
        NodeId child = this->m_nodes[node].m_children[i];
        this->preorder_traverse(child, visitor);
        // the visitor may have removed or unwrapped the child, whatever took
        // its place is visited next
        const vector<NodeId>& children = this->m_nodes[node].m_children;
        if (i >= children.size() || children[i] != child)
        {
            --i;
        }
    }

    visitor.postprocess(node);
    return true;
}

bool DomTree::postorder_traverse(NodeId node, DomTreeVisitor& visitor)
{
    bool success = visitor.preprocess(node);
    if (!success)
    {
        return false;
    }

    for (size_t i = 0; i < this->m_nodes[node].m_children.size(); ++i)
    {
        NodeId child = this->m_nodes[node].m_children[i];
        this->postorder_traverse(child, visitor);
        const vector<NodeId>& children = this->m_nodes[node].m_children;
        if (i >= children.size() || children[i] != child)
        {
            --i;
        }
    }

    success = visitor.visit(node);
    if (!success)
    {
        return false;
    }

    visitor.postprocess(node);
    return true;
}
