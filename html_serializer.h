#ifndef _HTML_SERIALIZER_H_
#define _HTML_SERIALIZER_H_

#include <string>

#include "dom_tree.h"

// Serialization writes no whitespace of its own between tags. Text escapes
// '&', '<' and '>', attribute values escape '&' and '"', attributes are
// written in name order and void elements as <br/>.
std::string outer_html(const DomTree& tree, NodeId node);
std::string inner_html(const DomTree& tree, NodeId node);
void write_html(const DomTree& tree, NodeId node, std::string& output);

std::string escape_text(const std::string& text);
std::string escape_attribute(const std::string& value);
bool is_void_element(const std::string& tag);

#endif
