#ifndef _UTILS_H_
#define _UTILS_H_
#include <string>
#include <vector>

struct ParseResult
{
public:
    ParseResult()
    {
    }

    ParseResult(const char* protocol, const char* host, const char* path, const char* query) :
        protocol(protocol), host(host), path(path), query(query)
    {
    }

    std::string protocol, host, path, query;
};

// host is lower-cased with any port and userinfo removed
ParseResult urlparse(const std::string& url);
void split(const std::string& str, const char* delimeter, std::vector<std::string>& segments);

// pattern: 0: str startswith any
// pattern: 1: str full matches any
// pattern: 2: str contains any
// pattern: 3: str endswith any
int match_list(const char* str, const std::vector<std::string>& string_list, int pattern = 0);

std::string to_lower(const std::string& str);
std::string trim(const std::string& str);
bool is_space(char c);
bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);
std::string join(const std::vector<std::string>& segments, const std::string& delimeter);
#endif
