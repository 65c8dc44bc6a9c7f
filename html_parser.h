#ifndef _HTML_PARSER_H_
#define _HTML_PARSER_H_

#include <string>
#include <vector>

#include "dom_tree.h"
#include "errors.h"

// Parses a whole document with the lenient libxml2 html parser. Broken
// nesting is repaired by the parser, only input that yields no document at
// all fails with EC_PARSE_ERROR. The tree should be freshly constructed.
bool parse_html(const std::string& html, DomTree& tree, Error* error);

// Parses a fragment as body content and creates the resulting top level
// nodes, detached, in tree.
bool parse_fragment(const std::string& fragment, DomTree& tree, std::vector<NodeId>& nodes, Error* error);

#endif
