#ifndef _SELECTOR_H_
#define _SELECTOR_H_

#include <string>
#include <vector>

#include "dom_tree.h"

// A small css selector subset: type and universal selectors, #id, .class,
// [attr], [attr=v], [attr*=v], [attr^=v], [attr$=v], [attr~=v], compound
// selectors, the descendant and child combinators and comma separated groups.
class Selector
{
public:
    Selector()
    {
    }

    // returns false on a syntax error, the selector then matches nothing
    bool parse(const std::string& text);

    bool matches(const DomTree& tree, NodeId node) const;

    // matching elements under root, root included, in document order
    void select(const DomTree& tree, NodeId root, std::vector<NodeId>& results) const;

    const std::string& get_text() const
    {
        return this->m_text;
    }

    // the tag when every group is a bare type selector, used for fast paths
    bool get_plain_tags(std::vector<std::string>& tags) const;

private:
    struct AttributeCondition
    {
        std::string name;
        // 0: exists, otherwise one of = * ^ $ ~
        char op;
        std::string value;
    };

    struct Compound
    {
        Compound() :
            combinator(' ')
        {
        }

        // empty for the universal selector
        std::string tag;
        std::vector<AttributeCondition> conditions;
        // combinator to the compound on the left
        char combinator;
    };

    typedef std::vector<Compound> Complex;

    bool parse_complex(const std::string& text, size_t& pos, Complex& complex) const;
    bool parse_compound(const std::string& text, size_t& pos, Compound& compound) const;
    bool parse_attribute(const std::string& text, size_t& pos, AttributeCondition& condition) const;
    bool match_compound(const DomTree& tree, NodeId node, const Compound& compound) const;
    bool match_complex(const DomTree& tree, NodeId node, const Complex& complex, int index) const;
    void collect(const DomTree& tree, NodeId node, std::vector<NodeId>& results) const;

    std::string m_text;
    std::vector<Complex> m_groups;
};

bool select(const DomTree& tree, NodeId root, const std::string& selector, std::vector<NodeId>& results);

#endif
