#include "cache_service.h"

#include <sstream>

#include "content_digest.h"
#include "html_serializer.h"

using namespace std;

static const char* c_section_name = "cache";

static const size_t DOCUMENT_SIGNATURE_LENGTH = 1024;
static const size_t BODY_SIGNATURE_LENGTH = 512;
static const size_t SCORE_SIGNATURE_LENGTH = 256;

CacheOptions::CacheOptions() :
    enabled(true),
    document_capacity(100),
    node_capacity(500),
    score_capacity(1000),
    expiration_ms(10 * 60 * 1000),
    cleanup_interval_ms(30 * 1000)
{
}

void CacheOptions::load(const Config& config)
{
    this->enabled = config.GetBoolValue(c_section_name, "enabled", this->enabled);
    this->document_capacity = config.GetIntValue(c_section_name, "document_capacity", static_cast<int>(this->document_capacity));
    this->node_capacity = config.GetIntValue(c_section_name, "node_capacity", static_cast<int>(this->node_capacity));
    this->score_capacity = config.GetIntValue(c_section_name, "score_capacity", static_cast<int>(this->score_capacity));
    this->expiration_ms = config.GetIntValue(c_section_name, "expiration_ms", static_cast<int>(this->expiration_ms));
    this->cleanup_interval_ms = config.GetIntValue(c_section_name, "cleanup_interval_ms", static_cast<int>(this->cleanup_interval_ms));
}

CacheService::CacheService(const CacheOptions& options) :
    m_options(options),
    m_documents(options.enabled ? options.document_capacity : 0, options.expiration_ms, options.enabled ? options.cleanup_interval_ms : 0),
    m_content_nodes(options.enabled ? options.node_capacity : 0, options.expiration_ms, options.enabled ? options.cleanup_interval_ms : 0),
    m_scores(options.enabled ? options.score_capacity : 0, options.expiration_ms, options.enabled ? options.cleanup_interval_ms : 0)
{
}

string CacheService::document_key(const string& html)
{
    ostringstream signature;
    signature << html.substr(0, DOCUMENT_SIGNATURE_LENGTH) << ":" << html.length();
    return "doc:" + md5_hex(signature.str());
}

string CacheService::node_key(const DomTree& tree)
{
    ostringstream signature;
    NodeId head = tree.get_head();
    if (head != INVALID_NODE)
    {
        NodeId title = tree.find_first(head, "title");
        if (title != INVALID_NODE)
        {
            signature << tree.text(title);
        }
    }

    signature << "|";
    NodeId body = tree.get_body();
    if (body != INVALID_NODE)
    {
        signature << outer_html(tree, body).substr(0, BODY_SIGNATURE_LENGTH);
    }

    signature << "|" << tree.text(tree.get_document()).length();
    return "node:" + md5_hex(signature.str());
}

string CacheService::score_key(const DomTree& tree, NodeId node)
{
    const DomNode& element = tree.get_node(node);
    const char* id = element.get_attribute("id");
    const char* klass = element.get_attribute("class");
    string text = tree.text(node);

    // nested wrappers can share attributes and text, but not markup size or depth
    size_t element_children = 0;
    const vector<NodeId>& children = element.get_children();
    for (size_t i = 0; i < children.size(); ++i)
    {
        if (tree.get_node(children[i]).is_element())
        {
            ++element_children;
        }
    }

    int depth = 0;
    for (NodeId parent = element.get_parent(); parent != INVALID_NODE; parent = tree.get_node(parent).get_parent())
    {
        ++depth;
    }

    ostringstream signature;
    signature << (id == NULL ? "" : id) << "|" << (klass == NULL ? "" : klass) << "|" << element.get_tag()
        << "|" << text.substr(0, SCORE_SIGNATURE_LENGTH) << "|" << text.length()
        << "|" << outer_html(tree, node).length() << "|" << element_children << "|" << depth;
    return "score:" + md5_hex(signature.str());
}

bool CacheService::get_document(const string& html, shared_ptr<const DomTree>& tree)
{
    if (!this->m_options.enabled)
    {
        return false;
    }

    return this->m_documents.get(CacheService::document_key(html), tree);
}

void CacheService::set_document(const string& html, const shared_ptr<const DomTree>& tree)
{
    if (this->m_options.enabled)
    {
        this->m_documents.set(CacheService::document_key(html), tree);
    }
}

bool CacheService::get_content_node(const DomTree& tree, NodeId& node)
{
    if (!this->m_options.enabled)
    {
        return false;
    }

    NodeId cached;
    if (!this->m_content_nodes.get(CacheService::node_key(tree), cached))
    {
        return false;
    }

    // a fingerprint collision may hand back a node of another document
    if (cached < 0 || static_cast<size_t>(cached) >= tree.size() || !tree.is_attached(cached))
    {
        return false;
    }

    NodeType type = tree.get_node(cached).get_type();
    if (type != NT_ELEMENT && type != NT_DOCUMENT)
    {
        return false;
    }

    node = cached;
    return true;
}

void CacheService::set_content_node(const DomTree& tree, NodeId node)
{
    if (this->m_options.enabled)
    {
        this->m_content_nodes.set(CacheService::node_key(tree), node);
    }
}

bool CacheService::get_score(const DomTree& tree, NodeId node, double& score)
{
    if (!this->m_options.enabled)
    {
        return false;
    }

    return this->m_scores.get(CacheService::score_key(tree, node), score);
}

void CacheService::set_score(const DomTree& tree, NodeId node, double score)
{
    if (this->m_options.enabled)
    {
        this->m_scores.set(CacheService::score_key(tree, node), score);
    }
}

void CacheService::clear()
{
    this->m_documents.clear();
    this->m_content_nodes.clear();
    this->m_scores.clear();
}
