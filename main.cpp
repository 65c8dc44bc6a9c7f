#include <unistd.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "page_reader.h"

using namespace std;

static void usage(const char* program)
{
    cerr << "usage: " << program << " [-c config] [-u url] [-f html|text] [-d] [-i] [-o output] [-s] [input|-]" << endl
         << "  -c  config file" << endl
         << "  -u  page url, selects site rules" << endl
         << "  -f  output format, html (default) or text" << endl
         << "  -d  add data-content-digest attributes" << endl
         << "  -i  add data-node-index attributes" << endl
         << "  -o  output file, stdout by default" << endl
         << "  -s  print cache statistics to stderr" << endl;
}

static bool read_input(const string& path, string& content)
{
    stringstream buffer;
    if (path.empty() || path == "-")
    {
        buffer << cin.rdbuf();
    }
    else
    {
        ifstream input(path.c_str(), ios::in | ios::binary);
        if (!input)
        {
            cerr << "open input failed: " << path << endl;
            return false;
        }

        buffer << input.rdbuf();
    }

    content = buffer.str();
    return true;
}

static void print_stats(const char* name, const CacheStats& stats)
{
    cerr << name << " cache: size " << stats.size << ", hits " << stats.hits << ", misses " << stats.misses
         << ", hit ratio " << stats.hit_ratio << endl;
}

static string format_text(const Article& article)
{
    string output = text_blocks_to_string(article.plain_text);
    if (!output.empty())
    {
        output.append("\n");
    }

    return output;
}

int main(int argc, char* argv[])
{
    const char* config_path = NULL;
    string url;
    string format = "html";
    string output_path;
    bool digests = false;
    bool indexes = false;
    bool stats = false;

    int option;
    while ((option = getopt(argc, argv, "c:u:f:o:dish")) != -1)
    {
        switch (option)
        {
        case 'c':
            config_path = optarg;
            break;
        case 'u':
            url = optarg;
            break;
        case 'f':
            format = optarg;
            break;
        case 'o':
            output_path = optarg;
            break;
        case 'd':
            digests = true;
            break;
        case 'i':
            indexes = true;
            break;
        case 's':
            stats = true;
            break;
        case 'h':
            usage(argv[0]);
            return 0;
        default:
            usage(argv[0]);
            return 2;
        }
    }

    if (format != "html" && format != "text")
    {
        cerr << "unknown format: " << format << endl;
        usage(argv[0]);
        return 2;
    }

    if (argc - optind > 1)
    {
        usage(argv[0]);
        return 2;
    }

    string input_path = optind < argc ? argv[optind] : "-";

    PageReader reader;
    bool success = config_path != NULL ? reader.init(config_path) : reader.init();
    if (!success)
    {
        Error error(EC_CONFIG_ERROR, config_path != NULL ? config_path : "built in defaults");
        cerr << error.to_string() << endl;
        return 1;
    }

    SimplifyOptions options = reader.get_simplify_options();
    options.add_content_digests = options.add_content_digests || digests;
    options.add_node_indexes = options.add_node_indexes || indexes;
    reader.set_simplify_options(options);

    string html;
    if (!read_input(input_path, html))
    {
        return 1;
    }

    Article article;
    Error error;
    success = reader.extract(html, url, article, error);
    if (!success)
    {
        cerr << error.to_string() << endl;
        return 1;
    }

    string output = format == "text" ? format_text(article) : article.content + "\n";
    if (output_path.empty())
    {
        cout << output;
    }
    else
    {
        ofstream file(output_path.c_str(), ios::out | ios::binary);
        if (!file)
        {
            cerr << "open output failed: " << output_path << endl;
            return 1;
        }

        file << output;
    }

    if (stats && reader.get_cache() != NULL)
    {
        print_stats("document", reader.get_cache()->document_stats());
        print_stats("content node", reader.get_cache()->node_stats());
        print_stats("score", reader.get_cache()->score_stats());
    }

    return 0;
}
