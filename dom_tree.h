#ifndef _DOM_TREE_H_
#define _DOM_TREE_H_

#include <vector>
#include <string>
#include <map>
#include <cstdio>

enum NodeType
{
    NT_DOCUMENT = 0,
    NT_ELEMENT,
    NT_TEXT,
    NT_COMMENT,
    NT_DOCTYPE,
};

typedef int NodeId;

const NodeId INVALID_NODE = -1;

class DomTreeVisitor
{
public:
    virtual bool preprocess(NodeId node)
    {
        return true;
    }

    // returning false skips the children of node, the node itself may have
    // been removed or replaced by the visitor
    virtual bool visit(NodeId node)
    {
        return true;
    }

    virtual bool postprocess(NodeId node)
    {
        return true;
    }

    virtual ~DomTreeVisitor()
    {
    }
};

class DomNode
{
public:
    DomNode(NodeType type, const std::string& tag, const std::string& text) :
        m_type(type), m_tag(tag), m_text(text), m_parent(INVALID_NODE), m_children()
    {
    }

    NodeType get_type() const
    {
        return this->m_type;
    }

    bool is_element() const
    {
        return this->m_type == NT_ELEMENT;
    }

    bool is_text() const
    {
        return this->m_type == NT_TEXT;
    }

    // element tag name, or doctype name
    const std::string& get_tag() const
    {
        return this->m_tag;
    }

    void set_tag(const std::string& tag_name)
    {
        this->m_tag = tag_name;
    }

    // text or comment content
    const std::string& get_text() const
    {
        return this->m_text;
    }

    void set_text(const std::string& text)
    {
        this->m_text = text;
    }

    void append_text(const std::string& text)
    {
        this->m_text.append(text);
    }

    NodeId get_parent() const
    {
        return this->m_parent;
    }

    const std::vector<NodeId>& get_children() const
    {
        return this->m_children;
    }

    const char* get_attribute(const char* name) const;

    bool has_attribute(const char* name) const
    {
        return this->get_attribute(name) != NULL;
    }

    void set_attribute(const std::string& name, const std::string& value)
    {
        this->m_attributes[name] = value;
    }

    bool remove_attribute(const std::string& name)
    {
        return this->m_attributes.erase(name) > 0;
    }

    void clear_attributes()
    {
        this->m_attributes.clear();
    }

    const std::map<std::string, std::string>& get_attributes() const
    {
        return this->m_attributes;
    }

private:
    friend class DomTree;

    NodeType m_type;
    std::string m_tag;
    std::string m_text;
    NodeId m_parent;
    std::vector<NodeId> m_children;
    std::map<std::string, std::string> m_attributes;
};

// All nodes of one document live in an arena and are addressed by NodeId.
// Node 0 is the document node. Removed nodes keep their slot but are no
// longer reachable from the document. Copying a DomTree copies the document.
//
// References returned by get_node() are invalidated by any create_* call.
class DomTree
{
public:
    DomTree();

    NodeId get_document() const
    {
        return 0;
    }

    size_t size() const
    {
        return this->m_nodes.size();
    }

    DomNode& get_node(NodeId id)
    {
        return this->m_nodes[id];
    }

    const DomNode& get_node(NodeId id) const
    {
        return this->m_nodes[id];
    }

    bool is_element(NodeId id, const char* tag_name) const;

    NodeId create_element(const std::string& tag);
    NodeId create_text(const std::string& text);
    NodeId create_comment(const std::string& text);
    NodeId create_doctype(const std::string& name);

    // node level edits, the inserted node is detached from its old parent first
    void append_child(NodeId parent, NodeId child);
    void insert_child(NodeId parent, size_t index, NodeId child);
    void insert_before(NodeId reference, NodeId node);
    void insert_after(NodeId reference, NodeId node);
    void replace_node(NodeId old_node, NodeId new_node);
    void remove(NodeId node);
    // splices the children into the parent and drops node
    void unwrap(NodeId node);

    // html fragment edits, fragments are parsed in the context of a body
    bool insert_before(NodeId reference, const std::string& html_fragment);
    bool insert_after(NodeId reference, const std::string& html_fragment);
    bool replace_with(NodeId node, const std::string& html_fragment);

    NodeId clone_node(NodeId node, bool deep);
    // deep copies a subtree of another tree, the copy is detached
    NodeId import_node(const DomTree& other, NodeId node);

    int child_index(NodeId node) const;
    NodeId previous_sibling(NodeId node) const;
    NodeId next_sibling(NodeId node) const;
    NodeId nearest_ancestor(NodeId node, const char* tag_name) const;
    bool is_ancestor(NodeId ancestor, NodeId node) const;
    bool is_attached(NodeId node) const;

    NodeId get_document_element() const;
    NodeId get_head() const;
    NodeId get_body() const;
    NodeId find_first(NodeId root, const char* tag_name) const;

    void find_tags(NodeId root, const char* tag_name, std::vector<NodeId>& results) const;
    void find_tags(NodeId root, const std::vector<std::string>& tag_names, std::vector<NodeId>& results) const;
    size_t count_tags(NodeId root, const char* tag_name) const;

    // concatenated descendant text
    std::string text(NodeId node) const;
    void append_text(NodeId node, std::string& output) const;

    bool preorder_traverse(NodeId node, DomTreeVisitor& visitor);
    bool postorder_traverse(NodeId node, DomTreeVisitor& visitor);

private:
    NodeId create_node(NodeType type, const std::string& tag, const std::string& text);
    void detach(NodeId node);
    bool insert_fragment(NodeId reference, const std::string& html_fragment, bool after);

    std::vector<DomNode> m_nodes;
};

#endif
