#include "html_simplifier.h"

#include <iostream>
#include <sstream>

#include "content_digest.h"
#include "html_parser.h"
#include "html_serializer.h"
#include "text_normalizer.h"
#include "utils.h"

using namespace std;

static const char* c_section_name = "htmlSimplifier";

#define ARRAY_END(a) ((a) + sizeof(a) / sizeof((a)[0]))

static const char* _elements_to_delete[] = {
    // forms
    "button", "datalist", "fieldset", "form", "input", "label", "legend", "meter", "optgroup", "option",
    "output", "progress", "select", "textarea",
    // images
    "area", "img", "map", "picture", "source",
    // media
    "audio", "track", "video",
    // embedded
    "embed", "iframe", "math", "object", "param", "svg",
    // interactive
    "details", "dialog", "summary",
    // scripting
    "canvas", "noscript", "script", "template",
    // data
    "data", "link",
    "style",
    "nav"};

static const char* _elements_to_unwrap[] = {"a", "abbr", "address", "b", "bdi", "bdo", "center", "cite",
    "code", "del", "dfn", "em", "i", "ins", "kbd", "mark", "rb", "ruby", "rp", "rt", "rtc", "s", "samp",
    "small", "span", "strong", "time", "u", "var", "wbr"};

// removed along with the blacklist, still known to the vocabulary
static const char* _page_chrome_elements[] = {"header", "footer", "aside"};

static const char* _special_elements[] = {"q", "sub", "sup"};

static const char* _block_whitelist[] = {"article", "aside", "blockquote", "caption", "colgroup", "col",
    "div", "dl", "dt", "dd", "figure", "figcaption", "footer", "h1", "h2", "h3", "h4", "h5", "h6",
    "header", "li", "main", "ol", "p", "pre", "section", "table", "tbody", "thead", "tfoot", "tr",
    "td", "th", "ul"};

static const char* _structural_elements[] = {"html", "head", "body"};
static const char* _metadata_elements[] = {"meta", "link", "base", "title"};
static const char* _linebreak_elements[] = {"br", "hr"};

static const char* _paragraph_illegal_elements[] = {"address", "article", "aside", "blockquote", "canvas",
    "dd", "div", "dl", "dt", "fieldset", "figcaption", "figure", "footer", "form", "h1", "h2", "h3", "h4",
    "h5", "h6", "header", "hr", "li", "main", "nav", "noscript", "ol", "p", "pre", "section", "table",
    "tfoot", "ul", "video"};

static const char* _bare_text_containers[] = {"body", "div", "article", "section", "main", "aside",
    "header", "footer", "blockquote"};

static const char* _default_allowed_attributes[] = {"colspan", "rowspan", "headers", "scope"};

static const vector<string> c_elements_to_delete(_elements_to_delete, ARRAY_END(_elements_to_delete));
static const vector<string> c_elements_to_unwrap(_elements_to_unwrap, ARRAY_END(_elements_to_unwrap));
static const vector<string> c_page_chrome_elements(_page_chrome_elements, ARRAY_END(_page_chrome_elements));
static const vector<string> c_special_elements(_special_elements, ARRAY_END(_special_elements));
static const vector<string> c_block_whitelist(_block_whitelist, ARRAY_END(_block_whitelist));
static const vector<string> c_structural_elements(_structural_elements, ARRAY_END(_structural_elements));
static const vector<string> c_paragraph_illegal_elements(_paragraph_illegal_elements, ARRAY_END(_paragraph_illegal_elements));
static const vector<string> c_bare_text_containers(_bare_text_containers, ARRAY_END(_bare_text_containers));

static vector<string> build_known_elements()
{
    vector<string> known(c_structural_elements);
    known.insert(known.end(), _metadata_elements, ARRAY_END(_metadata_elements));
    known.insert(known.end(), _linebreak_elements, ARRAY_END(_linebreak_elements));
    known.insert(known.end(), c_elements_to_delete.begin(), c_elements_to_delete.end());
    known.insert(known.end(), c_elements_to_unwrap.begin(), c_elements_to_unwrap.end());
    known.insert(known.end(), c_special_elements.begin(), c_special_elements.end());
    known.insert(known.end(), c_block_whitelist.begin(), c_block_whitelist.end());
    return known;
}

static const vector<string> c_known_elements = build_known_elements();

SimplifyOptions::SimplifyOptions() :
    add_content_digests(false),
    add_node_indexes(false),
    remove_blacklist(true),
    unwrap_elements(true),
    process_special(true),
    consolidate_text(true),
    remove_empty(true),
    unnest_paragraphs(true),
    insert_breaks(true),
    wrap_bare_text(true)
{
}

SimplifyOptions SimplifyOptions::all()
{
    SimplifyOptions options;
    options.add_content_digests = true;
    options.add_node_indexes = true;
    return options;
}

void SimplifyOptions::load(const Config& config)
{
    this->add_content_digests = config.GetBoolValue(c_section_name, "add_content_digests", this->add_content_digests);
    this->add_node_indexes = config.GetBoolValue(c_section_name, "add_node_indexes", this->add_node_indexes);
    this->remove_blacklist = config.GetBoolValue(c_section_name, "remove_blacklist", this->remove_blacklist);
    this->unwrap_elements = config.GetBoolValue(c_section_name, "unwrap_elements", this->unwrap_elements);
    this->process_special = config.GetBoolValue(c_section_name, "process_special", this->process_special);
    this->consolidate_text = config.GetBoolValue(c_section_name, "consolidate_text", this->consolidate_text);
    this->remove_empty = config.GetBoolValue(c_section_name, "remove_empty", this->remove_empty);
    this->unnest_paragraphs = config.GetBoolValue(c_section_name, "unnest_paragraphs", this->unnest_paragraphs);
    this->insert_breaks = config.GetBoolValue(c_section_name, "insert_breaks", this->insert_breaks);
    this->wrap_bare_text = config.GetBoolValue(c_section_name, "wrap_bare_text", this->wrap_bare_text);
}

const vector<string>& HtmlSimplifier::elements_to_delete()
{
    return c_elements_to_delete;
}

const vector<string>& HtmlSimplifier::elements_to_unwrap()
{
    return c_elements_to_unwrap;
}

const vector<string>& HtmlSimplifier::special_elements()
{
    return c_special_elements;
}

const vector<string>& HtmlSimplifier::block_whitelist()
{
    return c_block_whitelist;
}

const vector<string>& HtmlSimplifier::known_elements()
{
    return c_known_elements;
}

const vector<string>& HtmlSimplifier::paragraph_illegal_elements()
{
    return c_paragraph_illegal_elements;
}

const vector<string>& HtmlSimplifier::bare_text_containers()
{
    return c_bare_text_containers;
}

HtmlSimplifier::HtmlSimplifier() :
    _allowed_attributes(_default_allowed_attributes, ARRAY_END(_default_allowed_attributes)),
    _link_density_threshold(0.5)
{
}

HtmlSimplifier::HtmlSimplifier(const SimplifyOptions& options) :
    _options(options),
    _allowed_attributes(_default_allowed_attributes, ARRAY_END(_default_allowed_attributes)),
    _link_density_threshold(0.5)
{
}

bool HtmlSimplifier::init(const Config& config)
{
    this->_options.load(config);
    if (config.HasKey(c_section_name, "allowed_attributes"))
    {
        this->_allowed_attributes = config.GetStringList(c_section_name, "allowed_attributes");
    }

    this->_link_density_threshold = config.GetDoubleValue(c_section_name, "link_density_threshold", this->_link_density_threshold);
    if (this->_link_density_threshold < 0.0)
    {
        cerr << "link density threshold should not be negative" << endl;
        return false;
    }

    return true;
}

void HtmlSimplifier::collect_elements(const DomTree& tree, NodeId node, vector<NodeId>& elements)
{
    const DomNode& current = tree.get_node(node);
    if (current.is_element())
    {
        elements.push_back(node);
    }

    for (size_t i = 0; i < current.get_children().size(); ++i)
    {
        HtmlSimplifier::collect_elements(tree, current.get_children()[i], elements);
    }
}

bool HtmlSimplifier::is_inline_element(const DomTree& tree, NodeId node)
{
    const DomNode& current = tree.get_node(node);
    if (!current.is_element())
    {
        return false;
    }

    const char* tag = current.get_tag().c_str();
    return match_list(tag, c_elements_to_unwrap, 1) != -1 || match_list(tag, c_special_elements, 1) != -1;
}

bool HtmlSimplifier::is_blank(const DomTree& tree, NodeId node)
{
    return normalize_text(tree.text(node)).empty();
}

void HtmlSimplifier::simplify(DomTree& tree) const
{
    this->remove_metadata(tree);
    this->strip_attributes(tree);
    if (this->_options.remove_blacklist)
    {
        this->remove_blacklist(tree);
    }

    if (this->_options.unwrap_elements)
    {
        this->unwrap_elements(tree);
    }

    if (this->_options.process_special)
    {
        this->process_special_elements(tree);
    }

    this->unwrap_unknown_elements(tree);
    if (this->_options.consolidate_text)
    {
        this->consolidate_text(tree);
    }

    if (this->_options.remove_empty)
    {
        this->remove_empty(tree);
    }

    if (this->_options.unnest_paragraphs)
    {
        this->unnest_paragraphs(tree);
    }

    if (this->_options.insert_breaks)
    {
        this->insert_paragraph_breaks(tree);
    }

    if (this->_options.wrap_bare_text)
    {
        this->wrap_bare_text(tree);
    }

    this->normalize_text_nodes(tree);
    if (this->_options.remove_empty)
    {
        // spacers left by single breaks are blank only after normalization
        this->remove_empty(tree);
        this->normalize_text_nodes(tree);
    }

    if (this->_options.add_content_digests)
    {
        this->add_content_digests(tree);
    }

    if (this->_options.add_node_indexes)
    {
        this->add_node_indexes(tree);
    }
}

class MetadataRemover : public DomTreeVisitor
{
public:
    explicit MetadataRemover(DomTree& tree) :
        _tree(tree)
    {
    }

    virtual bool visit(NodeId node)
    {
        NodeType type = this->_tree.get_node(node).get_type();
        if (type == NT_COMMENT || type == NT_DOCTYPE)
        {
            this->_tree.remove(node);
            return false;
        }

        return true;
    }

private:
    DomTree& _tree;
};

void HtmlSimplifier::remove_metadata(DomTree& tree) const
{
    MetadataRemover remover(tree);
    tree.preorder_traverse(tree.get_document(), remover);
}

void HtmlSimplifier::strip_attributes(DomTree& tree) const
{
    vector<NodeId> elements;
    HtmlSimplifier::collect_elements(tree, tree.get_document(), elements);
    for (size_t i = 0; i < elements.size(); ++i)
    {
        DomNode& element = tree.get_node(elements[i]);
        map<string, string> attributes = element.get_attributes();
        for (map<string, string>::const_iterator iter = attributes.begin(); iter != attributes.end(); ++iter)
        {
            if (match_list(iter->first.c_str(), this->_allowed_attributes, 1) == -1)
            {
                element.remove_attribute(iter->first);
            }
        }
    }
}

class LinkDensityRemover : public DomTreeVisitor
{
public:
    LinkDensityRemover(DomTree& tree, const ContentScorer& scorer, double threshold) :
        _tree(tree), _scorer(scorer), _threshold(threshold)
    {
    }

    virtual bool visit(NodeId node)
    {
        const DomNode& element = this->_tree.get_node(node);
        if (!element.is_element())
        {
            return true;
        }

        const string& tag = element.get_tag();
        if (tag == "html" || tag == "head" || tag == "body")
        {
            return true;
        }

        if (this->_scorer.link_density(this->_tree, node) > this->_threshold)
        {
            this->_tree.remove(node);
            return false;
        }

        return true;
    }

private:
    DomTree& _tree;
    const ContentScorer& _scorer;
    double _threshold;
};

void HtmlSimplifier::remove_blacklist(DomTree& tree) const
{
    vector<NodeId> elements;
    tree.find_tags(tree.get_document(), c_elements_to_delete, elements);
    tree.find_tags(tree.get_document(), c_page_chrome_elements, elements);
    for (size_t i = 0; i < elements.size(); ++i)
    {
        tree.remove(elements[i]);
    }

    LinkDensityRemover remover(tree, this->_scorer, this->_link_density_threshold);
    tree.preorder_traverse(tree.get_document(), remover);
}

void HtmlSimplifier::unwrap_elements(DomTree& tree) const
{
    vector<NodeId> elements;
    tree.find_tags(tree.get_document(), c_elements_to_unwrap, elements);
    for (size_t i = 0; i < elements.size(); ++i)
    {
        tree.unwrap(elements[i]);
    }
}

void HtmlSimplifier::process_special_elements(DomTree& tree) const
{
    vector<NodeId> elements;
    tree.find_tags(tree.get_document(), c_special_elements, elements);
    for (size_t i = 0; i < elements.size(); ++i)
    {
        NodeId element = elements[i];
        const string tag = tree.get_node(element).get_tag();
        if (tag == "q")
        {
            NodeId open = tree.create_text("\"");
            NodeId close = tree.create_text("\"");
            tree.insert_child(element, 0, open);
            tree.append_child(element, close);
        }
        else
        {
            NodeId prefix = tree.create_text(tag == "sub" ? "_" : "^");
            tree.insert_child(element, 0, prefix);
        }

        tree.unwrap(element);
    }
}

void HtmlSimplifier::unwrap_unknown_elements(DomTree& tree) const
{
    vector<NodeId> elements;
    HtmlSimplifier::collect_elements(tree, tree.get_document(), elements);
    for (size_t i = 0; i < elements.size(); ++i)
    {
        if (match_list(tree.get_node(elements[i]).get_tag().c_str(), c_known_elements, 1) == -1)
        {
            tree.unwrap(elements[i]);
        }
    }
}

static void merge_text_children(DomTree& tree, NodeId node)
{
    const vector<NodeId> children = tree.get_node(node).get_children();
    NodeId previous = INVALID_NODE;
    for (size_t i = 0; i < children.size(); ++i)
    {
        NodeId child = children[i];
        if (tree.get_node(child).is_text())
        {
            if (previous != INVALID_NODE)
            {
                tree.get_node(previous).append_text(tree.get_node(child).get_text());
                tree.remove(child);
            }
            else
            {
                previous = child;
            }
        }
        else
        {
            previous = INVALID_NODE;
            merge_text_children(tree, child);
        }
    }
}

void HtmlSimplifier::consolidate_text(DomTree& tree) const
{
    merge_text_children(tree, tree.get_document());
}

static bool has_element_children(const DomTree& tree, NodeId node)
{
    const vector<NodeId>& children = tree.get_node(node).get_children();
    for (size_t i = 0; i < children.size(); ++i)
    {
        if (tree.get_node(children[i]).is_element())
        {
            return true;
        }
    }

    return false;
}

// children are visited first, so a parent emptied by their removal goes in
// the same pass
class EmptyNodeRemover : public DomTreeVisitor
{
public:
    explicit EmptyNodeRemover(DomTree& tree) :
        _tree(tree),
        _removed(false)
    {
    }

    virtual bool visit(NodeId node)
    {
        const DomNode& current = this->_tree.get_node(node);
        if (current.is_text())
        {
            if (normalize_text(current.get_text()).empty())
            {
                this->_tree.remove(node);
                this->_removed = true;
            }

            return true;
        }

        if (!current.is_element())
        {
            return true;
        }

        const string& tag = current.get_tag();
        if (tag == "html" || tag == "head" || tag == "body" || tag == "br" || tag == "hr")
        {
            return true;
        }

        if (!has_element_children(this->_tree, node) && normalize_text(this->_tree.text(node)).empty())
        {
            this->_tree.remove(node);
            this->_removed = true;
        }

        return true;
    }

    bool removed() const
    {
        return this->_removed;
    }

private:
    DomTree& _tree;
    bool _removed;
};

void HtmlSimplifier::remove_empty(DomTree& tree) const
{
    bool removed = true;
    while (removed)
    {
        EmptyNodeRemover remover(tree);
        tree.postorder_traverse(tree.get_document(), remover);
        removed = remover.removed();
    }
}

// runs of adjacent text siblings are normalized as one string. whitespace is
// trimmed where a run meets a block boundary and kept as a single space next
// to inline elements.
void HtmlSimplifier::normalize_children(DomTree& tree, NodeId node) const
{
    const vector<NodeId> children = tree.get_node(node).get_children();
    size_t i = 0;
    while (i < children.size())
    {
        if (!tree.get_node(children[i]).is_text())
        {
            this->normalize_children(tree, children[i]);
            ++i;
            continue;
        }

        size_t end = i;
        string joined;
        while (end < children.size() && tree.get_node(children[end]).is_text())
        {
            joined.append(tree.get_node(children[end]).get_text());
            ++end;
        }

        string text = collapse_whitespace(strip_control_chars(normalize_unicode(joined)));
        bool trim_left = i == 0 || !HtmlSimplifier::is_inline_element(tree, children[i - 1]);
        bool trim_right = end == children.size() || !HtmlSimplifier::is_inline_element(tree, children[end]);
        if (trim_left && !text.empty() && text[0] == ' ')
        {
            text.erase(0, 1);
        }

        if (trim_right && !text.empty() && text[text.length() - 1] == ' ')
        {
            text.erase(text.length() - 1);
        }

        if (text.empty())
        {
            for (size_t j = i; j < end; ++j)
            {
                tree.remove(children[j]);
            }
        }
        else
        {
            tree.get_node(children[i]).set_text(text);
            for (size_t j = i + 1; j < end; ++j)
            {
                tree.remove(children[j]);
            }
        }

        i = end;
    }
}

void HtmlSimplifier::normalize_text_nodes(DomTree& tree) const
{
    this->normalize_children(tree, tree.get_document());

    NodeId html = tree.get_document_element();
    if (html != INVALID_NODE && tree.is_element(html, "html"))
    {
        const vector<NodeId>& children = tree.get_node(html).get_children();
        bool has_head = false;
        for (size_t i = 0; i < children.size(); ++i)
        {
            if (tree.is_element(children[i], "head"))
            {
                has_head = true;
                break;
            }
        }

        if (!has_head)
        {
            NodeId head = tree.create_element("head");
            tree.insert_child(html, 0, head);
        }
    }
}

string HtmlSimplifier::stamp_digest(DomTree& tree, NodeId node) const
{
    string combined;
    const vector<NodeId> children = tree.get_node(node).get_children();
    for (size_t i = 0; i < children.size(); ++i)
    {
        if (tree.get_node(children[i]).is_element())
        {
            combined.append(this->stamp_digest(tree, children[i]));
        }
    }

    string digest;
    if (is_digest_leaf(tree, node))
    {
        string text = normalize_text(tree.text(node));
        if (!text.empty())
        {
            digest = sha256_hex(text);
        }
    }
    else if (!combined.empty())
    {
        digest = sha256_hex(combined);
    }

    if (!digest.empty())
    {
        tree.get_node(node).set_attribute("data-content-digest", digest);
    }

    return digest;
}

void HtmlSimplifier::add_content_digests(DomTree& tree) const
{
    NodeId body = tree.get_body();
    if (body != INVALID_NODE)
    {
        this->stamp_digest(tree, body);
    }
}

void HtmlSimplifier::stamp_index(DomTree& tree, NodeId node, const string& index) const
{
    tree.get_node(node).set_attribute("data-node-index", index);
    const vector<NodeId> children = tree.get_node(node).get_children();
    int position = 0;
    for (size_t i = 0; i < children.size(); ++i)
    {
        if (tree.get_node(children[i]).is_element())
        {
            ++position;
            ostringstream child_index;
            child_index << index << "." << position;
            this->stamp_index(tree, children[i], child_index.str());
        }
    }
}

void HtmlSimplifier::add_node_indexes(DomTree& tree) const
{
    NodeId body = tree.get_body();
    if (body != INVALID_NODE)
    {
        this->stamp_index(tree, body, "0");
    }
}

bool simplify_html(const string& html, const SimplifyOptions& options, string& output, Error* error)
{
    DomTree tree;
    if (!parse_html(html, tree, error))
    {
        return false;
    }

    if (tree.get_body() == INVALID_NODE)
    {
        return set_error(error, EC_STRUCTURE_ERROR, "document has no body element");
    }

    HtmlSimplifier simplifier(options);
    simplifier.simplify(tree);
    output = outer_html(tree, tree.get_document_element());
    return true;
}
