#include "html_serializer.h"

#include <vector>

#include "utils.h"

using namespace std;

static const char* VOID_ELEMENTS[] = {"area", "base", "br", "col", "embed", "hr", "img", "input",
    "link", "meta", "param", "source", "track", "wbr"};

static const vector<string> g_void_elements(VOID_ELEMENTS, VOID_ELEMENTS + sizeof(VOID_ELEMENTS) / sizeof(VOID_ELEMENTS[0]));

bool is_void_element(const string& tag)
{
    return match_list(tag.c_str(), g_void_elements, 1) != -1;
}

static bool is_raw_text_element(const string& tag)
{
    return tag == "script" || tag == "style";
}

string escape_text(const string& text)
{
    string result;
    result.reserve(text.length());
    for (size_t i = 0; i < text.length(); ++i)
    {
        switch (text[i])
        {
        case '&':
            result.append("&amp;");
            break;
        case '<':
            result.append("&lt;");
            break;
        case '>':
            result.append("&gt;");
            break;
        default:
            result.push_back(text[i]);
        }
    }

    return result;
}

string escape_attribute(const string& value)
{
    string result;
    result.reserve(value.length());
    for (size_t i = 0; i < value.length(); ++i)
    {
        switch (value[i])
        {
        case '&':
            result.append("&amp;");
            break;
        case '"':
            result.append("&quot;");
            break;
        default:
            result.push_back(value[i]);
        }
    }

    return result;
}

void write_html(const DomTree& tree, NodeId node, string& output)
{
    const DomNode& current = tree.get_node(node);
    switch (current.get_type())
    {
    case NT_DOCUMENT:
        for (size_t i = 0; i < current.get_children().size(); ++i)
        {
            write_html(tree, current.get_children()[i], output);
        }

        break;
    case NT_DOCTYPE:
        output.append("<!DOCTYPE ");
        output.append(current.get_tag());
        output.append(">");
        break;
    case NT_COMMENT:
        output.append("<!--");
        output.append(current.get_text());
        output.append("-->");
        break;
    case NT_TEXT:
    {
        NodeId parent = current.get_parent();
        if (parent != INVALID_NODE && tree.get_node(parent).is_element() && is_raw_text_element(tree.get_node(parent).get_tag()))
        {
            output.append(current.get_text());
        }
        else
        {
            output.append(escape_text(current.get_text()));
        }

        break;
    }
    case NT_ELEMENT:
    {
        output.push_back('<');
        output.append(current.get_tag());
        const map<string, string>& attributes = current.get_attributes();
        for (map<string, string>::const_iterator iter = attributes.begin(); iter != attributes.end(); ++iter)
        {
            output.push_back(' ');
            output.append(iter->first);
            output.append("=\"");
            output.append(escape_attribute(iter->second));
            output.push_back('"');
        }

        if (is_void_element(current.get_tag()))
        {
            output.append("/>");
            break;
        }

        output.push_back('>');
        for (size_t i = 0; i < current.get_children().size(); ++i)
        {
            write_html(tree, current.get_children()[i], output);
        }

        output.append("</");
        output.append(current.get_tag());
        output.push_back('>');
        break;
    }
    }
}

string outer_html(const DomTree& tree, NodeId node)
{
    string output;
    write_html(tree, node, output);
    return output;
}

string inner_html(const DomTree& tree, NodeId node)
{
    string output;
    const vector<NodeId>& children = tree.get_node(node).get_children();
    for (size_t i = 0; i < children.size(); ++i)
    {
        write_html(tree, children[i], output);
    }

    return output;
}
