#ifndef _CONTENT_DIGEST_H_
#define _CONTENT_DIGEST_H_

#include <string>

#include "dom_tree.h"

// lower case hex digests
std::string sha256_hex(const std::string& data);
std::string md5_hex(const std::string& data);

bool is_digest_leaf(const DomTree& tree, NodeId node);

// p and li hash their normalized text, other elements hash the concatenated
// digests of their element children. empty when there is nothing to hash.
std::string calculate_content_digest(const DomTree& tree, NodeId node);

#endif
