#include "config.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

#include "utils.h"

using namespace std;

static const vector<string> g_empty_string_list;
static const vector<double> g_empty_double_list;

Config::Config() :
    mWrite(false), mDirty(false)
{
}

Config::~Config()
{
    if (this->mWrite && this->mDirty)
    {
        if (!this->Save())
        {
            cerr << "save config failed: " << this->mPath << endl;
        }
    }
}

bool Config::Init(const char* conf_path, bool write)
{
    if (conf_path == NULL)
    {
        return false;
    }

    this->mPath = conf_path;
    this->mWrite = write;

    ifstream input(conf_path);
    if (!input)
    {
        if (write)
        {
            // created on save
            return true;
        }

        cerr << "open config failed: " << conf_path << endl;
        return false;
    }

    stringstream buffer;
    buffer << input.rdbuf();
    return this->Parse(buffer.str());
}

bool Config::InitFromString(const string& content)
{
    return this->Parse(content);
}

bool Config::Parse(const string& content)
{
    this->mConfig.clear();
    this->ClearCaches();

    istringstream input(content);
    string line;
    string section;
    int line_number = 0;
    while (getline(input, line))
    {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';')
        {
            continue;
        }

        if (line[0] == '[')
        {
            if (line[line.length() - 1] != ']')
            {
                cerr << "bad section at line " << line_number << ": " << line << endl;
                return false;
            }

            section = trim(line.substr(1, line.length() - 2));
            this->mConfig[section];
            continue;
        }

        size_t pos = line.find('=');
        if (pos == string::npos)
        {
            cerr << "bad config line " << line_number << ": " << line << endl;
            return false;
        }

        string key = trim(line.substr(0, pos));
        if (key.empty())
        {
            cerr << "empty key at line " << line_number << endl;
            return false;
        }

        this->mConfig[section][key] = trim(line.substr(pos + 1));
    }

    return true;
}

bool Config::Save() const
{
    ofstream output(this->mPath.c_str());
    if (!output)
    {
        return false;
    }

    for (map<string, map<string, string> >::const_iterator section = this->mConfig.begin(); section != this->mConfig.end(); ++section)
    {
        output << "[" << section->first << "]" << endl;
        for (map<string, string>::const_iterator iter = section->second.begin(); iter != section->second.end(); ++iter)
        {
            output << iter->first << " = " << iter->second << endl;
        }

        output << endl;
    }

    return output.good();
}

bool Config::HasKey(const string& section, const string& key) const
{
    map<string, map<string, string> >::const_iterator iter = this->mConfig.find(section);
    if (iter == this->mConfig.end())
    {
        return false;
    }

    return iter->second.find(key) != iter->second.end();
}

string Config::GetValue(const string& section, const string& key) const
{
    return this->GetValue(section, key, "");
}

string Config::GetValue(const string& section, const string& key, const string& default_value) const
{
    map<string, map<string, string> >::const_iterator iter = this->mConfig.find(section);
    if (iter == this->mConfig.end())
    {
        return default_value;
    }

    map<string, string>::const_iterator value = iter->second.find(key);
    if (value == iter->second.end())
    {
        return default_value;
    }

    return value->second;
}

int Config::GetIntValue(const string& section, const string& key) const
{
    return this->GetIntValue(section, key, 0);
}

int Config::GetIntValue(const string& section, const string& key, int default_value) const
{
    string unique_key = Config::GenUniqueKey(section, key);
    map<string, int>::const_iterator iter = this->m_int_values.find(unique_key);
    if (iter != this->m_int_values.end())
    {
        return iter->second;
    }

    int result = default_value;
    if (this->HasKey(section, key))
    {
        string value = this->GetValue(section, key);
        char* end = NULL;
        long parsed = strtol(value.c_str(), &end, 10);
        if (end != value.c_str() && *end == '\0')
        {
            result = static_cast<int>(parsed);
        }
        else
        {
            cerr << "bad int value " << section << "." << key << ": " << value << endl;
        }

        this->m_int_values[unique_key] = result;
    }

    return result;
}

double Config::GetDoubleValue(const string& section, const string& key) const
{
    return this->GetDoubleValue(section, key, 0.0);
}

double Config::GetDoubleValue(const string& section, const string& key, double default_value) const
{
    string unique_key = Config::GenUniqueKey(section, key);
    map<string, double>::const_iterator iter = this->m_double_values.find(unique_key);
    if (iter != this->m_double_values.end())
    {
        return iter->second;
    }

    double result = default_value;
    if (this->HasKey(section, key))
    {
        string value = this->GetValue(section, key);
        char* end = NULL;
        double parsed = strtod(value.c_str(), &end);
        if (end != value.c_str() && *end == '\0')
        {
            result = parsed;
        }
        else
        {
            cerr << "bad double value " << section << "." << key << ": " << value << endl;
        }

        this->m_double_values[unique_key] = result;
    }

    return result;
}

bool Config::GetBoolValue(const string& section, const string& key) const
{
    return this->GetBoolValue(section, key, false);
}

bool Config::GetBoolValue(const string& section, const string& key, bool default_value) const
{
    string unique_key = Config::GenUniqueKey(section, key);
    map<string, bool>::const_iterator iter = this->m_bool_values.find(unique_key);
    if (iter != this->m_bool_values.end())
    {
        return iter->second;
    }

    bool result = default_value;
    if (this->HasKey(section, key))
    {
        string value = to_lower(this->GetValue(section, key));
        if (value == "true" || value == "yes" || value == "on" || value == "1")
        {
            result = true;
        }
        else if (value == "false" || value == "no" || value == "off" || value == "0")
        {
            result = false;
        }
        else
        {
            cerr << "bad bool value " << section << "." << key << ": " << value << endl;
        }

        this->m_bool_values[unique_key] = result;
    }

    return result;
}

string Config::GetStringValue(const string& section, const string& key) const
{
    return this->GetValue(section, key);
}

bool Config::GetStringList(const string& section, const string& key, vector<string>& list, const char* delimeter) const
{
    if (!this->HasKey(section, key))
    {
        return false;
    }

    const char* delim = (delimeter == NULL || delimeter[0] == '\0') ? "," : delimeter;
    vector<string> segments;
    split(this->GetValue(section, key), delim, segments);
    for (size_t i = 0; i < segments.size(); ++i)
    {
        string item = trim(segments[i]);
        if (!item.empty())
        {
            list.push_back(item);
        }
    }

    return true;
}

const vector<string>& Config::GetStringList(const string& section, const string& key, const char* delimeter) const
{
    string unique_key = Config::GenUniqueKey(section, key) + "\t" + (delimeter == NULL ? "" : delimeter);
    map<string, vector<string> >::const_iterator iter = this->m_string_lists.find(unique_key);
    if (iter != this->m_string_lists.end())
    {
        return iter->second;
    }

    if (!this->HasKey(section, key))
    {
        return g_empty_string_list;
    }

    vector<string>& list = this->m_string_lists[unique_key];
    this->GetStringList(section, key, list, delimeter);
    return list;
}

const vector<double>& Config::GetDoubleList(const string& section, const string& key, const char* delimeter) const
{
    string unique_key = Config::GenUniqueKey(section, key) + "\t" + (delimeter == NULL ? "" : delimeter);
    map<string, vector<double> >::const_iterator iter = this->m_double_lists.find(unique_key);
    if (iter != this->m_double_lists.end())
    {
        return iter->second;
    }

    if (!this->HasKey(section, key))
    {
        return g_empty_double_list;
    }

    const vector<string>& items = this->GetStringList(section, key, delimeter);
    vector<double>& list = this->m_double_lists[unique_key];
    for (size_t i = 0; i < items.size(); ++i)
    {
        list.push_back(strtod(items[i].c_str(), NULL));
    }

    return list;
}

void Config::Set(const string& section, const string& key, const string& value)
{
    this->mConfig[section][key] = value;
    this->mDirty = true;
    this->ClearCaches();
}

string Config::GenUniqueKey(const string& section, const string& key)
{
    return section + "." + key;
}

void Config::ClearCaches()
{
    this->m_int_values.clear();
    this->m_double_values.clear();
    this->m_bool_values.clear();
    this->m_string_lists.clear();
    this->m_double_lists.clear();
}
