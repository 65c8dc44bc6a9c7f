#include "element_extractor.h"

#include <algorithm>

#include "dom_tree.h"
#include "html_parser.h"
#include "selector.h"
#include "text_normalizer.h"

using namespace std;

bool extract_element(const string& html, const vector<SelectorScore>& selectors,
        const ExtractedElementsProcessor& post_process, ExtractedElements& results, Error* error)
{
    results.clear();
    DomTree tree;
    if (!parse_html(html, tree, error))
    {
        return false;
    }

    for (size_t i = 0; i < selectors.size(); ++i)
    {
        const SelectorScore& selector = selectors[i];
        vector<NodeId> nodes;
        if (!select(tree, tree.get_document(), selector.selector, nodes))
        {
            continue;
        }

        for (size_t j = 0; j < nodes.size(); ++j)
        {
            string value;
            if (selector.attribute.empty())
            {
                value = normalize_whitespace(tree.text(nodes[j]));
            }
            else
            {
                const char* attribute = tree.get_node(nodes[j]).get_attribute(selector.attribute.c_str());
                if (attribute == NULL)
                {
                    continue;
                }

                value = normalize_whitespace(decode_html_entities(attribute));
            }

            if (value.empty())
            {
                continue;
            }

            ExtractedElement& element = results[value];
            element.score += selector.score;
            element.selectors.push_back(selector.selector);
            sort(element.selectors.begin(), element.selectors.end());
        }
    }

    if (post_process)
    {
        post_process(results);
    }

    return true;
}

bool best_extracted_element(const ExtractedElements& results, string& value)
{
    const ExtractedElement* best = NULL;
    for (ExtractedElements::const_iterator iter = results.begin(); iter != results.end(); ++iter)
    {
        if (best == NULL || iter->second.score > best->score)
        {
            best = &iter->second;
            value = iter->first;
        }
    }

    return best != NULL;
}
