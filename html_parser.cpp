#include "html_parser.h"

#include <mutex>

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

using namespace std;

static once_flag g_libxml_once;

static void init_libxml()
{
    xmlInitParser();
}

static const int PARSE_OPTIONS = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET;

static NodeId convert_node(xmlNode* source, DomTree& tree)
{
    switch (source->type)
    {
    case XML_ELEMENT_NODE:
    {
        NodeId element = tree.create_element(reinterpret_cast<const char*>(source->name));
        for (xmlAttr* attr = source->properties; attr != NULL; attr = attr->next)
        {
            string value;
            xmlChar* content = xmlNodeListGetString(source->doc, attr->children, 1);
            if (content != NULL)
            {
                value = reinterpret_cast<const char*>(content);
                xmlFree(content);
            }

            tree.get_node(element).set_attribute(reinterpret_cast<const char*>(attr->name), value);
        }

        for (xmlNode* child = source->children; child != NULL; child = child->next)
        {
            NodeId converted = convert_node(child, tree);
            if (converted != INVALID_NODE)
            {
                tree.append_child(element, converted);
            }
        }

        return element;
    }
    case XML_TEXT_NODE:
    case XML_CDATA_SECTION_NODE:
        if (source->content == NULL)
        {
            return INVALID_NODE;
        }

        return tree.create_text(reinterpret_cast<const char*>(source->content));
    case XML_COMMENT_NODE:
        return tree.create_comment(source->content == NULL ? "" : reinterpret_cast<const char*>(source->content));
    case XML_DTD_NODE:
        return tree.create_doctype(source->name == NULL ? "html" : reinterpret_cast<const char*>(source->name));
    default:
        return INVALID_NODE;
    }
}

static htmlDocPtr read_document(const string& html)
{
    call_once(g_libxml_once, init_libxml);
    if (html.empty())
    {
        return NULL;
    }

    return htmlReadMemory(html.data(), static_cast<int>(html.size()), NULL, "UTF-8", PARSE_OPTIONS);
}

bool parse_html(const string& html, DomTree& tree, Error* error)
{
    htmlDocPtr doc = read_document(html);
    if (doc == NULL)
    {
        return set_error(error, EC_PARSE_ERROR, "no document could be parsed from input");
    }

    if (xmlDocGetRootElement(doc) == NULL)
    {
        xmlFreeDoc(doc);
        return set_error(error, EC_PARSE_ERROR, "parsed document has no root element");
    }

    for (xmlNode* child = doc->children; child != NULL; child = child->next)
    {
        NodeId converted = convert_node(child, tree);
        if (converted != INVALID_NODE)
        {
            tree.append_child(tree.get_document(), converted);
        }
    }

    xmlFreeDoc(doc);
    return true;
}

bool parse_fragment(const string& fragment, DomTree& tree, vector<NodeId>& nodes, Error* error)
{
    if (fragment.empty())
    {
        return true;
    }

    htmlDocPtr doc = read_document("<html><body>" + fragment + "</body></html>");
    if (doc == NULL)
    {
        return set_error(error, EC_PARSE_ERROR, "fragment could not be parsed");
    }

    xmlNode* body = NULL;
    xmlNode* root = xmlDocGetRootElement(doc);
    for (xmlNode* child = root == NULL ? NULL : root->children; child != NULL; child = child->next)
    {
        if (child->type == XML_ELEMENT_NODE && xmlStrEqual(child->name, BAD_CAST "body"))
        {
            body = child;
            break;
        }
    }

    if (body == NULL)
    {
        xmlFreeDoc(doc);
        return set_error(error, EC_PARSE_ERROR, "fragment has no body content");
    }

    for (xmlNode* child = body->children; child != NULL; child = child->next)
    {
        NodeId converted = convert_node(child, tree);
        if (converted != INVALID_NODE)
        {
            nodes.push_back(converted);
        }
    }

    xmlFreeDoc(doc);
    return true;
}
