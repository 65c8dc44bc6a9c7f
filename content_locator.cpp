#include "content_locator.h"

#include <iostream>
#include <map>

#include "utils.h"

using namespace std;

static const char* c_section_name = "contentLocator";

static const char* _candidate_keywords[] = {"content", "article", "main", "body", "entry"};
static const char* _candidate_selectors[] = {"article", "main", ".post", ".hentry"};

ContentLocator::ContentLocator() :
    _fallback_selector("div, section"),
    _focus_attribute("data-content-focus"),
    _min_fallback_text_length(100),
    _cache(NULL)
{
    vector<string> selectors;
    this->build_candidate_selector(selectors);
}

bool ContentLocator::build_candidate_selector(const vector<string>& selectors)
{
    vector<string> groups;
    if (selectors.empty())
    {
        const char* attributes[] = {"id", "class"};
        for (size_t i = 0; i < 2; ++i)
        {
            for (size_t j = 0; j < sizeof(_candidate_keywords) / sizeof(_candidate_keywords[0]); ++j)
            {
                groups.push_back(string("[") + attributes[i] + "*=" + _candidate_keywords[j] + "]");
            }
        }

        for (size_t i = 0; i < sizeof(_candidate_selectors) / sizeof(_candidate_selectors[0]); ++i)
        {
            groups.push_back(_candidate_selectors[i]);
        }
    }
    else
    {
        groups = selectors;
    }

    groups.push_back("[" + this->_focus_attribute + "=true]");
    return this->_candidate_selector.parse(join(groups, ", "));
}

bool ContentLocator::init(const Config& config)
{
    bool success = this->_scorer.init(config);
    if (!success)
    {
        cerr << "init content scorer failed" << endl;
        return false;
    }

    this->_focus_attribute = config.GetValue(c_section_name, "focus_attribute", this->_focus_attribute);
    this->_fallback_selector = config.GetValue(c_section_name, "fallback_selector", this->_fallback_selector);
    this->_min_fallback_text_length = config.GetIntValue(c_section_name, "min_fallback_text_length",
            static_cast<int>(this->_min_fallback_text_length));

    vector<string> selectors;
    config.GetStringList(c_section_name, "candidate_selectors", selectors, ";");
    success = this->build_candidate_selector(selectors);
    if (!success)
    {
        cerr << "bad candidate selectors" << endl;
        return false;
    }

    Selector fallback;
    if (!fallback.parse(this->_fallback_selector))
    {
        cerr << "bad fallback selector: " << this->_fallback_selector << endl;
        return false;
    }

    this->_parallel.load(config);
    return true;
}

void ContentLocator::find_candidates(const DomTree& tree, vector<NodeId>& candidates) const
{
    // select() visits each element once, so matches are already unique
    this->_candidate_selector.select(tree, tree.get_document(), candidates);
}

void ContentLocator::find_fallback_candidates(const DomTree& tree, vector<NodeId>& candidates) const
{
    size_t min_length = this->_min_fallback_text_length;
    map<string, NodeAction> operations;
    operations[this->_fallback_selector] = [&tree, &candidates, min_length](NodeId node)
    {
        if (tree.text(node).length() >= min_length)
        {
            candidates.push_back(node);
        }
    };

    batch_process_selections(tree, operations);
}

double ContentLocator::score_node(const DomTree& tree, NodeId node) const
{
    double score;
    if (this->_cache != NULL && this->_cache->get_score(tree, node, score))
    {
        return score;
    }

    score = this->_scorer.score(tree, node);
    if (this->_cache != NULL)
    {
        this->_cache->set_score(tree, node, score);
    }

    return score;
}

void ContentLocator::score_candidates(const DomTree& tree, const vector<NodeId>& nodes, vector<Candidate>& candidates) const
{
    function<double(NodeId)> processor = [this, &tree](NodeId node)
    {
        return this->score_node(tree, node);
    };

    vector<double> scores;
    parallel_process_nodes<double>(nodes, processor, this->_parallel, scores);
    for (size_t i = 0; i < nodes.size(); ++i)
    {
        candidates.push_back(Candidate(nodes[i], scores[i]));
    }
}

ContentLocator::Candidate ContentLocator::select_best(const vector<Candidate>& candidates)
{
    Candidate best;
    for (size_t i = 0; i < candidates.size(); ++i)
    {
        if (best.get_node() == INVALID_NODE || candidates[i].get_score() > best.get_score())
        {
            best = candidates[i];
        }
    }

    return best;
}

NodeId ContentLocator::locate(const DomTree& tree) const
{
    vector<NodeId> nodes;
    this->find_candidates(tree, nodes);
    if (!nodes.empty())
    {
        vector<Candidate> candidates;
        this->score_candidates(tree, nodes, candidates);
        Candidate best = ContentLocator::select_best(candidates);
        if (best.get_node() != INVALID_NODE && best.get_score() > 0.0)
        {
            return best.get_node();
        }
    }

    nodes.clear();
    this->find_fallback_candidates(tree, nodes);
    if (!nodes.empty())
    {
        vector<Candidate> candidates;
        this->score_candidates(tree, nodes, candidates);
        Candidate best = ContentLocator::select_best(candidates);
        if (best.get_node() != INVALID_NODE)
        {
            return best.get_node();
        }
    }

    NodeId body = tree.get_body();
    if (body != INVALID_NODE)
    {
        return body;
    }

    NodeId html = tree.get_document_element();
    return html != INVALID_NODE ? html : tree.get_document();
}
