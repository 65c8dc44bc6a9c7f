#ifndef _HTML_SIMPLIFIER_H_
#define _HTML_SIMPLIFIER_H_

#include <string>
#include <vector>

#include "config.h"
#include "content_scorer.h"
#include "dom_tree.h"
#include "errors.h"

struct SimplifyOptions
{
    // every stage on, annotations off
    SimplifyOptions();

    // every stage and both annotations on
    static SimplifyOptions all();

    // reads the [htmlSimplifier] section
    void load(const Config& config);

    bool add_content_digests;
    bool add_node_indexes;
    bool remove_blacklist;
    bool unwrap_elements;
    bool process_special;
    bool consolidate_text;
    bool remove_empty;
    bool unnest_paragraphs;
    bool insert_breaks;
    bool wrap_bare_text;
};

// Rewrites a document into a small fixed tag vocabulary. The stages run in
// a fixed order, each one relying on what the previous ones left behind:
//
//   1  drop comments and doctypes
//   2  drop attributes outside the allow list
//   3  drop blacklisted elements and link heavy subtrees
//   4  unwrap inline formatting elements
//   5  rewrite q, sub and sup as plain text
//   6  unwrap unknown elements
//   7  merge adjacent text nodes
//   8  drop empty text and elements until nothing changes
//   9  lift block elements out of paragraphs
//   10 turn br runs and hr into paragraph splits
//   11 wrap bare text in paragraphs
//   12 normalize text
//   13 stamp data-content-digest
//   14 stamp data-node-index
//
// Stages 1, 2, 6 and 12 always run, the others follow the options.
class HtmlSimplifier
{
public:
    HtmlSimplifier();
    explicit HtmlSimplifier(const SimplifyOptions& options);

    // reads [htmlSimplifier]
    bool init(const Config& config);

    void set_options(const SimplifyOptions& options)
    {
        this->_options = options;
    }

    const SimplifyOptions& get_options() const
    {
        return this->_options;
    }

    void simplify(DomTree& tree) const;

    static const std::vector<std::string>& elements_to_delete();
    static const std::vector<std::string>& elements_to_unwrap();
    static const std::vector<std::string>& special_elements();
    static const std::vector<std::string>& block_whitelist();
    static const std::vector<std::string>& known_elements();
    static const std::vector<std::string>& paragraph_illegal_elements();
    static const std::vector<std::string>& bare_text_containers();

private:
    friend class HtmlSimplifierTest;

    void remove_metadata(DomTree& tree) const;
    void strip_attributes(DomTree& tree) const;
    void remove_blacklist(DomTree& tree) const;
    void unwrap_elements(DomTree& tree) const;
    void process_special_elements(DomTree& tree) const;
    void unwrap_unknown_elements(DomTree& tree) const;
    void consolidate_text(DomTree& tree) const;
    void remove_empty(DomTree& tree) const;
    void unnest_paragraphs(DomTree& tree) const;
    void insert_paragraph_breaks(DomTree& tree) const;
    void wrap_bare_text(DomTree& tree) const;
    void normalize_text_nodes(DomTree& tree) const;
    void add_content_digests(DomTree& tree) const;
    void add_node_indexes(DomTree& tree) const;

    // splits paragraph around point, a descendant of it. the content before
    // and after point moves into copies of paragraph placed around it, the
    // copies that end up without text are dropped. returns false when both
    // copies were empty.
    bool split_paragraph(DomTree& tree, NodeId paragraph, NodeId point, bool keep_point, bool keep_empty) const;
    void split_contents(DomTree& tree, NodeId node, NodeId point, NodeId before, NodeId after) const;
    void normalize_children(DomTree& tree, NodeId node) const;
    std::string stamp_digest(DomTree& tree, NodeId node) const;
    void stamp_index(DomTree& tree, NodeId node, const std::string& index) const;

    static bool is_inline_element(const DomTree& tree, NodeId node);
    static bool is_blank(const DomTree& tree, NodeId node);
    static void collect_elements(const DomTree& tree, NodeId node, std::vector<NodeId>& elements);

    SimplifyOptions _options;
    std::vector<std::string> _allowed_attributes;
    double _link_density_threshold;
    ContentScorer _scorer;
};

// parse, check for a body, simplify, serialize the document element
bool simplify_html(const std::string& html, const SimplifyOptions& options, std::string& output, Error* error);

#endif
