#include "utils.h"

#include <cstring>
#include <algorithm>
#include <vector>

using namespace std;

ParseResult urlparse(const string& url)
{
    ParseResult result;
    size_t host_begin = 0;
    size_t prot_end = url.find("://");
    if (prot_end != string::npos)
    {
        result.protocol = to_lower(url.substr(0, prot_end));
        host_begin = prot_end + 3;
    }

    size_t host_end = url.find_first_of("/?#", host_begin);
    if (host_end == string::npos)
    {
        host_end = url.length();
    }

    string host = url.substr(host_begin, host_end - host_begin);
    size_t at = host.rfind('@');
    if (at != string::npos)
    {
        host = host.substr(at + 1);
    }

    size_t colon = host.find(':');
    if (colon != string::npos)
    {
        host = host.substr(0, colon);
    }

    result.host = to_lower(host);

    size_t fragment_begin = url.find('#', host_end);
    if (fragment_begin == string::npos)
    {
        fragment_begin = url.length();
    }

    size_t query_begin = url.find('?', host_end);
    if (query_begin == string::npos || query_begin > fragment_begin)
    {
        query_begin = fragment_begin;
    }

    result.path = url.substr(host_end, query_begin - host_end);
    if (query_begin < fragment_begin)
    {
        result.query = url.substr(query_begin + 1, fragment_begin - query_begin - 1);
    }

    return result;
}

void split(const string& str, const char* delimeter, vector<string>& segments)
{
    char* buffer = new char[str.length() + 1];
    strncpy(buffer, str.c_str(), str.length());
    buffer[str.length()] = '\0';
    char* ptr = buffer;
    char* saveptr;
    char* token;
    while ((token = strtok_r(ptr, delimeter, &saveptr)) != NULL)
    {
        segments.push_back(string(token));
        ptr = NULL;
    }

    delete[] buffer;
}

int match_list(const char* str, const vector<string>& string_list, int pattern)
{
    size_t len = strlen(str);
    for (int i = 0; i < static_cast<int>(string_list.size()); ++i)
    {
        const string& item = string_list[i];
        switch (pattern)
        {
        case 0:
            if (strncmp(str, item.c_str(), item.length()) == 0)
            {
                return i;
            }

            break;
        case 1:
            if (len == item.length() && strncmp(str, item.c_str(), item.length()) == 0)
            {
                return i;
            }

            break;
        case 2:
            if (strstr(str, item.c_str()) != NULL)
            {
                return i;
            }

            break;
        case 3:
            if (len >= item.length() && strncmp(str + len - item.length(), item.c_str(), item.length()) == 0)
            {
                return i;
            }

            break;
        default:
            return -1;
        }
    }

    return -1;
}

string to_lower(const string& str)
{
    string result(str);
    for (size_t i = 0; i < result.length(); ++i)
    {
        if (result[i] >= 'A' && result[i] <= 'Z')
        {
            result[i] = result[i] - 'A' + 'a';
        }
    }

    return result;
}

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

string trim(const string& str)
{
    size_t begin = 0;
    while (begin < str.length() && is_space(str[begin]))
    {
        ++begin;
    }

    size_t end = str.length();
    while (end > begin && is_space(str[end - 1]))
    {
        --end;
    }

    return str.substr(begin, end - begin);
}

bool starts_with(const string& str, const string& prefix)
{
    return str.length() >= prefix.length() && str.compare(0, prefix.length(), prefix) == 0;
}

bool ends_with(const string& str, const string& suffix)
{
    return str.length() >= suffix.length() && str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

string join(const vector<string>& segments, const string& delimeter)
{
    string result;
    for (size_t i = 0; i < segments.size(); ++i)
    {
        if (i > 0)
        {
            result.append(delimeter);
        }

        result.append(segments[i]);
    }

    return result;
}
