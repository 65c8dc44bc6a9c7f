#include "content_digest.h"

#include <iostream>
#include <vector>

#include <openssl/evp.h>

#include "text_normalizer.h"

using namespace std;

static string hex_digest(const EVP_MD* md, const string& data)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &length, md, NULL) != 1)
    {
        cerr << "digest failed" << endl;
        return "";
    }

    static const char HEX[] = "0123456789abcdef";
    string result;
    result.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i)
    {
        result.push_back(HEX[digest[i] >> 4]);
        result.push_back(HEX[digest[i] & 0x0f]);
    }

    return result;
}

string sha256_hex(const string& data)
{
    return hex_digest(EVP_sha256(), data);
}

string md5_hex(const string& data)
{
    return hex_digest(EVP_md5(), data);
}

bool is_digest_leaf(const DomTree& tree, NodeId node)
{
    return tree.is_element(node, "p") || tree.is_element(node, "li");
}

string calculate_content_digest(const DomTree& tree, NodeId node)
{
    const DomNode& element = tree.get_node(node);
    if (!element.is_element())
    {
        return "";
    }

    if (is_digest_leaf(tree, node))
    {
        string text = normalize_text(tree.text(node));
        if (text.empty())
        {
            return "";
        }

        return sha256_hex(text);
    }

    string combined;
    const vector<NodeId>& children = element.get_children();
    for (size_t i = 0; i < children.size(); ++i)
    {
        combined.append(calculate_content_digest(tree, children[i]));
    }

    if (combined.empty())
    {
        return "";
    }

    return sha256_hex(combined);
}
