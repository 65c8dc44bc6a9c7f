#ifndef _CONTENT_LOCATOR_H_
#define _CONTENT_LOCATOR_H_

#include <string>
#include <vector>

#include "cache_service.h"
#include "config.h"
#include "content_scorer.h"
#include "dom_tree.h"
#include "node_processing.h"
#include "selector.h"

// Finds the element holding the main content of a document in three tiers:
// the best scoring element among id/class/tag based candidates when its
// score is positive, else the best div or section with enough text, else
// the body.
class ContentLocator
{
public:
    class Candidate
    {
    public:
        Candidate() :
            _node(INVALID_NODE), _score(0.0)
        {
        }

        Candidate(NodeId node, double score) :
            _node(node), _score(score)
        {
        }

        NodeId get_node() const
        {
            return this->_node;
        }

        double get_score() const
        {
            return this->_score;
        }

        NodeId _node;
        double _score;
    };

    ContentLocator();

    // reads [contentLocator] and [contentScorer]
    bool init(const Config& config);

    // optional, the cache must outlive the locator
    void set_cache(CacheService* cache)
    {
        this->_cache = cache;
    }

    void set_parallel_options(const ParallelOptions& options)
    {
        this->_parallel = options;
    }

    NodeId locate(const DomTree& tree) const;

    // tier one candidates in document order, each node once
    void find_candidates(const DomTree& tree, std::vector<NodeId>& candidates) const;

    // tier two candidates: div and section elements with enough text
    void find_fallback_candidates(const DomTree& tree, std::vector<NodeId>& candidates) const;

    void score_candidates(const DomTree& tree, const std::vector<NodeId>& nodes, std::vector<Candidate>& candidates) const;

    const ContentScorer& get_scorer() const
    {
        return this->_scorer;
    }

    const std::string& get_focus_attribute() const
    {
        return this->_focus_attribute;
    }

private:
    bool build_candidate_selector(const std::vector<std::string>& selectors);
    double score_node(const DomTree& tree, NodeId node) const;
    // first strict maximum, INVALID_NODE for an empty list
    static Candidate select_best(const std::vector<Candidate>& candidates);

    ContentScorer _scorer;
    Selector _candidate_selector;
    std::string _fallback_selector;
    std::string _focus_attribute;
    size_t _min_fallback_text_length;
    CacheService* _cache;
    ParallelOptions _parallel;
};

#endif
