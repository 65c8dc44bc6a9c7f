#include "selector.h"

#include <cstring>
#include <iostream>

#include "utils.h"

using namespace std;

static bool is_name_char(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
        || c == '-' || c == '_' || (static_cast<unsigned char>(c) >= 0x80);
}

static void skip_spaces(const string& text, size_t& pos)
{
    while (pos < text.length() && is_space(text[pos]))
    {
        ++pos;
    }
}

static string read_name(const string& text, size_t& pos)
{
    size_t begin = pos;
    while (pos < text.length() && is_name_char(text[pos]))
    {
        ++pos;
    }

    return text.substr(begin, pos - begin);
}

bool Selector::parse(const string& text)
{
    this->m_text = text;
    this->m_groups.clear();

    size_t pos = 0;
    while (true)
    {
        Complex complex;
        if (!this->parse_complex(text, pos, complex))
        {
            this->m_groups.clear();
            return false;
        }

        this->m_groups.push_back(complex);
        skip_spaces(text, pos);
        if (pos >= text.length())
        {
            break;
        }

        if (text[pos] != ',')
        {
            this->m_groups.clear();
            return false;
        }

        ++pos;
    }

    return true;
}

bool Selector::parse_complex(const string& text, size_t& pos, Complex& complex) const
{
    skip_spaces(text, pos);
    char combinator = ' ';
    while (true)
    {
        Compound compound;
        if (!this->parse_compound(text, pos, compound))
        {
            return false;
        }

        compound.combinator = combinator;
        complex.push_back(compound);

        size_t before = pos;
        skip_spaces(text, pos);
        if (pos >= text.length() || text[pos] == ',')
        {
            return true;
        }

        if (text[pos] == '>')
        {
            combinator = '>';
            ++pos;
            skip_spaces(text, pos);
        }
        else if (pos > before)
        {
            combinator = ' ';
        }
        else
        {
            return false;
        }
    }
}

bool Selector::parse_compound(const string& text, size_t& pos, Compound& compound) const
{
    size_t begin = pos;
    if (pos < text.length() && text[pos] == '*')
    {
        ++pos;
    }
    else if (pos < text.length() && is_name_char(text[pos]))
    {
        compound.tag = to_lower(read_name(text, pos));
    }

    while (pos < text.length())
    {
        char c = text[pos];
        if (c == '#' || c == '.')
        {
            ++pos;
            AttributeCondition condition;
            condition.name = c == '#' ? "id" : "class";
            condition.op = c == '#' ? '=' : '~';
            condition.value = read_name(text, pos);
            if (condition.value.empty())
            {
                return false;
            }

            compound.conditions.push_back(condition);
        }
        else if (c == '[')
        {
            AttributeCondition condition;
            if (!this->parse_attribute(text, pos, condition))
            {
                return false;
            }

            compound.conditions.push_back(condition);
        }
        else
        {
            break;
        }
    }

    return pos > begin;
}

bool Selector::parse_attribute(const string& text, size_t& pos, AttributeCondition& condition) const
{
    // at '['
    ++pos;
    skip_spaces(text, pos);
    condition.name = to_lower(read_name(text, pos));
    if (condition.name.empty())
    {
        return false;
    }

    skip_spaces(text, pos);
    condition.op = 0;
    if (pos < text.length() && text[pos] == ']')
    {
        ++pos;
        return true;
    }

    if (pos < text.length() && text[pos] == '=')
    {
        condition.op = '=';
        ++pos;
    }
    else if (pos + 1 < text.length() && text[pos + 1] == '=' && strchr("*^$~", text[pos]) != NULL)
    {
        condition.op = text[pos];
        pos += 2;
    }
    else
    {
        return false;
    }

    skip_spaces(text, pos);
    if (pos < text.length() && (text[pos] == '\'' || text[pos] == '"'))
    {
        char quote = text[pos];
        size_t end = text.find(quote, pos + 1);
        if (end == string::npos)
        {
            return false;
        }

        condition.value = text.substr(pos + 1, end - pos - 1);
        pos = end + 1;
    }
    else
    {
        condition.value = read_name(text, pos);
    }

    skip_spaces(text, pos);
    if (pos >= text.length() || text[pos] != ']')
    {
        return false;
    }

    ++pos;
    return true;
}

static bool contains_word(const string& value, const string& word)
{
    if (word.empty())
    {
        return false;
    }

    size_t pos = 0;
    while (pos < value.length())
    {
        while (pos < value.length() && is_space(value[pos]))
        {
            ++pos;
        }

        size_t end = pos;
        while (end < value.length() && !is_space(value[end]))
        {
            ++end;
        }

        if (end > pos && value.compare(pos, end - pos, word) == 0 && end - pos == word.length())
        {
            return true;
        }

        pos = end;
    }

    return false;
}

bool Selector::match_compound(const DomTree& tree, NodeId node, const Compound& compound) const
{
    const DomNode& element = tree.get_node(node);
    if (!element.is_element())
    {
        return false;
    }

    if (!compound.tag.empty() && element.get_tag() != compound.tag)
    {
        return false;
    }

    for (size_t i = 0; i < compound.conditions.size(); ++i)
    {
        const AttributeCondition& condition = compound.conditions[i];
        const char* value = element.get_attribute(condition.name.c_str());
        if (value == NULL)
        {
            return false;
        }

        string attribute(value);
        switch (condition.op)
        {
        case 0:
            break;
        case '=':
            if (attribute != condition.value)
            {
                return false;
            }

            break;
        case '*':
            if (condition.value.empty() || attribute.find(condition.value) == string::npos)
            {
                return false;
            }

            break;
        case '^':
            if (condition.value.empty() || !starts_with(attribute, condition.value))
            {
                return false;
            }

            break;
        case '$':
            if (condition.value.empty() || !ends_with(attribute, condition.value))
            {
                return false;
            }

            break;
        case '~':
            if (!contains_word(attribute, condition.value))
            {
                return false;
            }

            break;
        default:
            return false;
        }
    }

    return true;
}

bool Selector::match_complex(const DomTree& tree, NodeId node, const Complex& complex, int index) const
{
    if (!this->match_compound(tree, node, complex[index]))
    {
        return false;
    }

    if (index == 0)
    {
        return true;
    }

    NodeId parent = tree.get_node(node).get_parent();
    if (complex[index].combinator == '>')
    {
        return parent != INVALID_NODE && this->match_complex(tree, parent, complex, index - 1);
    }

    for (NodeId ancestor = parent; ancestor != INVALID_NODE; ancestor = tree.get_node(ancestor).get_parent())
    {
        if (this->match_complex(tree, ancestor, complex, index - 1))
        {
            return true;
        }
    }

    return false;
}

bool Selector::matches(const DomTree& tree, NodeId node) const
{
    for (size_t i = 0; i < this->m_groups.size(); ++i)
    {
        const Complex& complex = this->m_groups[i];
        if (this->match_complex(tree, node, complex, static_cast<int>(complex.size()) - 1))
        {
            return true;
        }
    }

    return false;
}

void Selector::collect(const DomTree& tree, NodeId node, vector<NodeId>& results) const
{
    const DomNode& current = tree.get_node(node);
    if (current.is_element() && this->matches(tree, node))
    {
        results.push_back(node);
    }

    for (size_t i = 0; i < current.get_children().size(); ++i)
    {
        this->collect(tree, current.get_children()[i], results);
    }
}

void Selector::select(const DomTree& tree, NodeId root, vector<NodeId>& results) const
{
    if (this->m_groups.empty())
    {
        return;
    }

    this->collect(tree, root, results);
}

bool Selector::get_plain_tags(vector<string>& tags) const
{
    vector<string> result;
    for (size_t i = 0; i < this->m_groups.size(); ++i)
    {
        const Complex& complex = this->m_groups[i];
        if (complex.size() != 1 || complex[0].tag.empty() || !complex[0].conditions.empty())
        {
            return false;
        }

        result.push_back(complex[0].tag);
    }

    tags.insert(tags.end(), result.begin(), result.end());
    return !result.empty();
}

bool select(const DomTree& tree, NodeId root, const string& selector, vector<NodeId>& results)
{
    Selector parsed;
    if (!parsed.parse(selector))
    {
        cerr << "bad selector: " << selector << endl;
        return false;
    }

    parsed.select(tree, root, results);
    return true;
}
