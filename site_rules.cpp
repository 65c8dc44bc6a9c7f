#include "site_rules.h"

#include "selector.h"
#include "utils.h"

using namespace std;

static SiteRule make_rule(const char* hosts, const char* remove_selector, const char* focus_selector)
{
    SiteRule rule;
    split(hosts, ",", rule.hosts);
    rule.remove_selector = remove_selector;
    rule.focus_selector = focus_selector;
    return rule;
}

SiteRuleTable::SiteRuleTable(const string& focus_attribute) :
    m_focus_attribute(focus_attribute)
{
}

void SiteRuleTable::load_default_rules()
{
    this->add_rule(make_rule("github.com",
            "header, footer, .sidebar, .js-header-wrapper, .js-site-header, .site-header, .js-site-footer, .site-footer",
            "#readme"));
    this->add_rule(make_rule("medium.com",
            "nav, header, footer, .sidebar, [data-test-id=post-sidebar], [data-test-id=post-footer], [data-test-id=post-header]",
            "article"));
    this->add_rule(make_rule("wikipedia.org",
            "#mw-navigation, #mw-panel, .mw-editsection, #footer, #siteSub, #contentSub, #jump-to-nav, .printfooter, #catlinks",
            "#content"));
    this->add_rule(make_rule("nytimes.com",
            "header, footer, nav, .ad, #commentsContainer, .NYT_BELOW_MAIN_CONTENT, .NYT_ABOVE_MAIN_CONTENT, .newsletter-signup, .comments-button",
            "article, .article, .story, .story-body"));
    this->add_rule(make_rule("bbc.com,bbc.co.uk",
            "header, footer, nav, .bbccom_slot, .related-content, .share, .share-tools, .comments_module, .correspondent-image",
            "article, .story-body, .story-body__inner"));
}

// the rule host itself or any subdomain of it
static bool host_matches(const string& host, const string& rule_host)
{
    return host == rule_host || ends_with(host, "." + rule_host);
}

const SiteRule* SiteRuleTable::find_rule(const string& hostname) const
{
    if (hostname.empty())
    {
        return NULL;
    }

    string host = to_lower(hostname);
    for (size_t i = 0; i < this->m_rules.size(); ++i)
    {
        const vector<string>& hosts = this->m_rules[i].hosts;
        for (size_t j = 0; j < hosts.size(); ++j)
        {
            if (host_matches(host, hosts[j]))
            {
                return &this->m_rules[i];
            }
        }
    }

    return NULL;
}

bool SiteRuleTable::process(DomTree& tree, const string& hostname) const
{
    const SiteRule* rule = this->find_rule(hostname);
    if (rule == NULL)
    {
        return false;
    }

    vector<NodeId> nodes;
    if (!rule->remove_selector.empty() && select(tree, tree.get_document(), rule->remove_selector, nodes))
    {
        for (size_t i = 0; i < nodes.size(); ++i)
        {
            tree.remove(nodes[i]);
        }
    }

    nodes.clear();
    if (!rule->focus_selector.empty() && select(tree, tree.get_document(), rule->focus_selector, nodes))
    {
        for (size_t i = 0; i < nodes.size(); ++i)
        {
            if (tree.is_attached(nodes[i]))
            {
                tree.get_node(nodes[i]).set_attribute(this->m_focus_attribute, "true");
            }
        }
    }

    return true;
}
