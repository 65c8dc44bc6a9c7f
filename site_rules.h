#ifndef _SITE_RULES_H_
#define _SITE_RULES_H_

#include <string>
#include <vector>

#include "dom_tree.h"

// Per site cleanup run on the parsed document before the content is located.
class SitePreprocessor
{
public:
    virtual ~SitePreprocessor()
    {
    }

    // returns true when the document was changed for hostname
    virtual bool process(DomTree& tree, const std::string& hostname) const = 0;
};

struct SiteRule
{
    // a rule applies when the hostname contains any of these
    std::vector<std::string> hosts;
    // comma separated selector groups
    std::string remove_selector;
    std::string focus_selector;
};

// Table driven preprocessor. The first rule whose host matches removes its
// elements and marks its focus elements with the focus attribute, which the
// content locator treats as a candidate.
class SiteRuleTable : public SitePreprocessor
{
public:
    explicit SiteRuleTable(const std::string& focus_attribute = "data-content-focus");

    // github, medium, wikipedia, nytimes and bbc
    void load_default_rules();

    void add_rule(const SiteRule& rule)
    {
        this->m_rules.push_back(rule);
    }

    const std::vector<SiteRule>& get_rules() const
    {
        return this->m_rules;
    }

    // NULL when no rule matches
    const SiteRule* find_rule(const std::string& hostname) const;

    virtual bool process(DomTree& tree, const std::string& hostname) const;

private:
    std::string m_focus_attribute;
    std::vector<SiteRule> m_rules;
};

#endif
