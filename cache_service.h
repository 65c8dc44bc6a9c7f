#ifndef _CACHE_SERVICE_H_
#define _CACHE_SERVICE_H_

#include <memory>
#include <string>

#include "config.h"
#include "dom_tree.h"
#include "lru_cache.h"

struct CacheOptions
{
    CacheOptions();

    // reads the [cache] section
    void load(const Config& config);

    bool enabled;
    size_t document_capacity;
    size_t node_capacity;
    size_t score_capacity;
    long expiration_ms;
    long cleanup_interval_ms;
};

// Caches shared by extraction calls: parsed documents, located content nodes
// and candidate scores. Construct one per process and pass it by reference.
//
// Keys are md5 fingerprints of a bounded prefix of the input plus its length,
// not of the whole input. Two different documents with the same fingerprint
// share a slot; that is an accepted approximation. Cached content nodes are
// validated against the tree they are applied to.
class CacheService
{
public:
    explicit CacheService(const CacheOptions& options);

    bool enabled() const
    {
        return this->m_options.enabled;
    }

    bool get_document(const std::string& html, std::shared_ptr<const DomTree>& tree);
    void set_document(const std::string& html, const std::shared_ptr<const DomTree>& tree);

    bool get_content_node(const DomTree& tree, NodeId& node);
    void set_content_node(const DomTree& tree, NodeId node);

    bool get_score(const DomTree& tree, NodeId node, double& score);
    void set_score(const DomTree& tree, NodeId node, double score);

    CacheStats document_stats() const
    {
        return this->m_documents.stats();
    }

    CacheStats node_stats() const
    {
        return this->m_content_nodes.stats();
    }

    CacheStats score_stats() const
    {
        return this->m_scores.stats();
    }

    void clear();

    static std::string document_key(const std::string& html);
    static std::string node_key(const DomTree& tree);
    static std::string score_key(const DomTree& tree, NodeId node);

private:
    CacheOptions m_options;
    LruCache<std::shared_ptr<const DomTree> > m_documents;
    LruCache<NodeId> m_content_nodes;
    LruCache<double> m_scores;
};

#endif
