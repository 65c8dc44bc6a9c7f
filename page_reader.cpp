#include "page_reader.h"

#include <assert.h>
#include <functional>
#include <iostream>

#include "html_parser.h"
#include "html_serializer.h"
#include "utils.h"

using namespace std;

typedef shared_ptr<DomTree> DocumentPtr;
typedef function<bool(DocumentPtr&, Error&)> ParseFunction;

static bool is_timeout(const Error& error)
{
    return error.code() == EC_TIMEOUT;
}

static DocumentPtr create_empty_document()
{
    DocumentPtr document(new DomTree());
    NodeId html = document->create_element("html");
    NodeId head = document->create_element("head");
    NodeId body = document->create_element("body");
    document->append_child(document->get_document(), html);
    document->append_child(html, head);
    document->append_child(html, body);
    return document;
}

static ParseFunction make_parser(const string& html)
{
    return [html](DocumentPtr& result, Error& error)
    {
        DocumentPtr document(new DomTree());
        if (!parse_html(html, *document, &error))
        {
            return false;
        }

        result = document;
        return true;
    };
}

PageReader::PageReader() :
    _initialized(false),
    _site_preprocessor(NULL)
{
}

bool PageReader::init()
{
    Config config;
    return this->init(config);
}

bool PageReader::init(const char* config_file_path)
{
    assert(config_file_path != NULL);
    Config config;
    if (!config.Init(config_file_path))
    {
        cerr << "init config failed: " << config_file_path << endl;
        return false;
    }

    return this->init(config);
}

bool PageReader::init(const Config& config)
{
    assert(!this->_initialized);
    this->_resilience.load(config);
    if (this->_resilience.timeout_ms <= 0 || this->_resilience.max_retries < 0 || this->_resilience.backoff_ms < 0)
    {
        cerr << "bad resilience settings" << endl;
        return false;
    }

    bool success = this->_locator.init(config);
    if (!success)
    {
        cerr << "init content locator failed" << endl;
        return false;
    }

    success = this->_simplifier.init(config);
    if (!success)
    {
        cerr << "init html simplifier failed" << endl;
        return false;
    }

    CacheOptions cache_options;
    cache_options.load(config);
    if (cache_options.enabled)
    {
        this->_cache.reset(new CacheService(cache_options));
        this->_locator.set_cache(this->_cache.get());
    }

    this->_site_rules = SiteRuleTable(this->_locator.get_focus_attribute());
    this->_site_rules.load_default_rules();
    this->_site_preprocessor = &this->_site_rules;

    this->_initialized = true;
    return true;
}

bool PageReader::report(const Error& error) const
{
    if (this->_resilience.log_errors)
    {
        cerr << "extract failed: " << error.to_string() << endl;
    }

    return false;
}

bool PageReader::parse_document(const string& html, DocumentPtr& tree, Error& error) const
{
    long timeout_ms = this->_resilience.timeout_ms;
    ParseFunction parser = make_parser(html);
    ParseFunction parse_once = [timeout_ms, parser](DocumentPtr& result, Error& failure)
    {
        return with_timeout<DocumentPtr>(timeout_ms, parser, result, &failure);
    };

    Error failure;
    if (with_retry<DocumentPtr>(this->_resilience.max_retries, this->_resilience.backoff_ms, parse_once, tree,
            &failure, is_timeout))
    {
        return true;
    }

    if (!this->_resilience.enable_fallback || failure.code() != EC_PARSE_ERROR)
    {
        error = failure;
        return false;
    }

    // the repair wraps the input in a minimal document and parses it once more
    ParseFunction repair = make_parser("<html><head></head><body>" + html + "</body></html>");
    function<void(DocumentPtr&)> empty_document = [](DocumentPtr& result)
    {
        result = create_empty_document();
    };

    Error repair_failure;
    if (with_fallback<DocumentPtr>(repair, empty_document, tree, &repair_failure))
    {
        if (this->_resilience.log_errors)
        {
            cerr << "parse repaired: " << failure.message() << endl;
        }

        return true;
    }

    error = Error(EC_EXHAUSTED_FALLBACK, failure.message() + ", repair: " + repair_failure.message());
    return false;
}

NodeId PageReader::locate_content(const DomTree& tree) const
{
    NodeId content;
    if (this->_cache.get() != NULL && this->_cache->get_content_node(tree, content))
    {
        return content;
    }

    content = this->_locator.locate(tree);
    if (this->_cache.get() != NULL)
    {
        this->_cache->set_content_node(tree, content);
    }

    return content;
}

void PageReader::build_article_tree(const DomTree& source, NodeId content, DomTree& article) const
{
    NodeId html = article.create_element("html");
    NodeId head = article.create_element("head");
    NodeId body = article.create_element("body");
    article.append_child(article.get_document(), html);
    article.append_child(html, head);
    article.append_child(html, body);

    const DomNode& node = source.get_node(content);
    if (node.is_element() && node.get_tag() != "body" && node.get_tag() != "html")
    {
        NodeId copy = article.import_node(source, content);
        article.append_child(body, copy);
        return;
    }

    // the whole page was selected, its body content becomes ours
    NodeId source_body = source.get_body();
    const vector<NodeId>& children = source.get_node(source_body).get_children();
    for (size_t i = 0; i < children.size(); ++i)
    {
        NodeId copy = article.import_node(source, children[i]);
        article.append_child(body, copy);
    }
}

bool PageReader::extract(const string& html, const string& url, Article& article, Error& error) const
{
    assert(this->_initialized);
    article.content.clear();
    article.plain_text.clear();
    error.clear();

    DomTree tree;
    shared_ptr<const DomTree> cached;
    if (this->_cache.get() != NULL && this->_cache->get_document(html, cached))
    {
        tree = *cached;
    }
    else
    {
        DocumentPtr parsed;
        if (!this->parse_document(html, parsed, error))
        {
            if (error.code() == EC_EXHAUSTED_FALLBACK && parsed.get() != NULL)
            {
                article.content = outer_html(*parsed, parsed->get_document_element());
            }

            return this->report(error);
        }

        if (this->_cache.get() != NULL)
        {
            this->_cache->set_document(html, parsed);
        }

        tree = *parsed;
    }

    if (tree.get_body() == INVALID_NODE)
    {
        error = Error(EC_STRUCTURE_ERROR, "document has no body element");
        return this->report(error);
    }

    if (this->_site_preprocessor != NULL && !url.empty())
    {
        ParseResult parts = urlparse(url);
        this->_site_preprocessor->process(tree, parts.host);
    }

    NodeId content = this->locate_content(tree);

    DomTree article_tree;
    this->build_article_tree(tree, content, article_tree);
    this->_simplifier.simplify(article_tree);

    article.content = outer_html(article_tree, article_tree.get_document_element());
    extract_text_blocks(article_tree, article.plain_text);
    return true;
}
