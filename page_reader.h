#ifndef _PAGE_READER_H_
#define _PAGE_READER_H_

#include <memory>
#include <string>
#include <vector>

#include "cache_service.h"
#include "config.h"
#include "content_locator.h"
#include "dom_tree.h"
#include "errors.h"
#include "html_simplifier.h"
#include "resilience.h"
#include "site_rules.h"
#include "text_blocks.h"

struct Article
{
    // simplified html of the main content
    std::string content;
    std::vector<TextBlock> plain_text;
};

// Extracts the readable part of a page: parse, site cleanup, locate the main
// content, copy it into a fresh document and simplify that.
//
// A PageReader owns its caches and may be shared by threads once init()
// returned, extract() does not change the reader.
class PageReader
{
public:
    PageReader();

    // built in defaults
    bool init();
    bool init(const char* config_file_path);
    bool init(const Config& config);

    // replaces the built in site rules, NULL disables the pre-pass. call it
    // after init(), the preprocessor must outlive the reader.
    void set_site_preprocessor(const SitePreprocessor* preprocessor)
    {
        this->_site_preprocessor = preprocessor;
    }

    void set_simplify_options(const SimplifyOptions& options)
    {
        this->_simplifier.set_options(options);
    }

    const SimplifyOptions& get_simplify_options() const
    {
        return this->_simplifier.get_options();
    }

    const ResilienceOptions& get_resilience_options() const
    {
        return this->_resilience;
    }

    // NULL when caching is disabled
    CacheService* get_cache() const
    {
        return this->_cache.get();
    }

    // url is optional and only selects site rules. On EC_EXHAUSTED_FALLBACK
    // article.content still holds an empty document.
    bool extract(const std::string& html, const std::string& url, Article& article, Error& error) const;

    // the parse step of extract(): timeout, retries on timeout and the repair
    // fallback for unparsable input
    bool parse_document(const std::string& html, std::shared_ptr<DomTree>& tree, Error& error) const;

private:
    friend class PageReaderTest;

    NodeId locate_content(const DomTree& tree) const;
    // html > head + body, body holding a copy of content
    void build_article_tree(const DomTree& source, NodeId content, DomTree& article) const;
    bool report(const Error& error) const;

    bool _initialized;
    ResilienceOptions _resilience;
    std::unique_ptr<CacheService> _cache;
    ContentLocator _locator;
    HtmlSimplifier _simplifier;
    SiteRuleTable _site_rules;
    const SitePreprocessor* _site_preprocessor;
};

#endif
