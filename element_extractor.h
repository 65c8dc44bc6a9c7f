#ifndef _ELEMENT_EXTRACTOR_H_
#define _ELEMENT_EXTRACTOR_H_

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "errors.h"

struct SelectorScore
{
    SelectorScore() :
        score(0)
    {
    }

    SelectorScore(const std::string& selector, int score, const std::string& attribute = "") :
        selector(selector), score(score), attribute(attribute)
    {
    }

    std::string selector;
    int score;
    // read this attribute instead of the element text when not empty
    std::string attribute;
};

struct ExtractedElement
{
    ExtractedElement() :
        score(0)
    {
    }

    // sum of the scores of every selector that produced the value
    int score;
    // sorted, a selector appears once per match
    std::vector<std::string> selectors;
};

typedef std::map<std::string, ExtractedElement> ExtractedElements;
typedef std::function<void(ExtractedElements&)> ExtractedElementsProcessor;

// Runs every selector over the document and groups the matched values. Text
// values are whitespace normalized, attribute values entity decoded as well.
// Empty values are skipped. post_process, when set, may rewrite the results.
// Fails only when the html cannot be parsed.
bool extract_element(const std::string& html, const std::vector<SelectorScore>& selectors,
        const ExtractedElementsProcessor& post_process, ExtractedElements& results, Error* error);

// the value with the highest score, first in key order on ties
bool best_extracted_element(const ExtractedElements& results, std::string& value);

#endif
