#include "text_normalizer.h"

#include <cstdlib>
#include <cstring>

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include "utils.h"

using namespace std;

struct Replacement
{
    const char* from;
    const char* to;
};

static const Replacement UNICODE_REPLACEMENTS[] = {
    {"\xE2\x80\x93", "-"},          // en dash
    {"\xE2\x80\x94", "--"},         // em dash
    {"\xE2\x80\x98", "'"},
    {"\xE2\x80\x99", "'"},
    {"\xE2\x80\x9C", "\""},
    {"\xE2\x80\x9D", "\""},
    {"\xE2\x80\xA6", "..."},
    {"\xC2\xA0", " "},
    {"\xC2\xAD", ""},               // soft hyphen
    {"\xE2\x80\xA2", "*"},          // bullets
    {"\xE2\x80\xA3", "*"},
    {"\xE2\x81\x83", "*"},
    {"\xE2\x88\x92", "-"},          // minus
    {"\xC2\xB7", "*"},
    {"\xC2\xB0", "degrees"},
    {"\xC2\xAE", "(R)"},
    {"\xC2\xA9", "(C)"},
    {"\xE2\x84\xA2", "(TM)"},
    {"\xC2\xA2", "c"},
    {"\xC2\xA3", "GBP"},
    {"\xC2\xA5", "JPY"},
    {"\xE2\x82\xAC", "EUR"},
    {"\xC3\xB7", "/"},
    {"\xC3\x97", "x"},
};

static const Replacement HTML_ENTITIES[] = {
    {"nbsp", "\xC2\xA0"}, {"lt", "<"}, {"gt", ">"}, {"amp", "&"}, {"quot", "\""}, {"apos", "'"},
    {"cent", "\xC2\xA2"}, {"pound", "\xC2\xA3"}, {"yen", "\xC2\xA5"}, {"euro", "\xE2\x82\xAC"},
    {"copy", "\xC2\xA9"}, {"reg", "\xC2\xAE"}, {"trade", "\xE2\x84\xA2"},
    {"mdash", "\xE2\x80\x94"}, {"ndash", "\xE2\x80\x93"}, {"hellip", "\xE2\x80\xA6"},
    {"lsquo", "'"}, {"rsquo", "'"}, {"ldquo", "\""}, {"rdquo", "\""},
    {"bull", "\xE2\x80\xA2"}, {"middot", "\xC2\xB7"}, {"plusmn", "\xC2\xB1"},
    {"times", "\xC3\x97"}, {"divide", "\xC3\xB7"}, {"not", "\xC2\xAC"}, {"micro", "\xC2\xB5"},
    {"para", "\xC2\xB6"}, {"deg", "\xC2\xB0"}, {"degree", "\xC2\xB0"},
    {"frac14", "\xC2\xBC"}, {"frac12", "\xC2\xBD"}, {"frac34", "\xC2\xBE"},
    {"iquest", "\xC2\xBF"}, {"iexcl", "\xC2\xA1"}, {"szlig", "\xC3\x9F"},
    {"agrave", "\xC3\xA0"}, {"aacute", "\xC3\xA1"}, {"acirc", "\xC3\xA2"}, {"atilde", "\xC3\xA3"},
    {"auml", "\xC3\xA4"}, {"aring", "\xC3\xA5"}, {"aelig", "\xC3\xA6"}, {"ccedil", "\xC3\xA7"},
    {"egrave", "\xC3\xA8"}, {"eacute", "\xC3\xA9"}, {"ecirc", "\xC3\xAA"}, {"euml", "\xC3\xAB"},
    {"igrave", "\xC3\xAC"}, {"iacute", "\xC3\xAD"}, {"icirc", "\xC3\xAE"}, {"iuml", "\xC3\xAF"},
    {"eth", "\xC3\xB0"}, {"ntilde", "\xC3\xB1"}, {"ograve", "\xC3\xB2"}, {"oacute", "\xC3\xB3"},
    {"ocirc", "\xC3\xB4"}, {"otilde", "\xC3\xB5"}, {"ouml", "\xC3\xB6"}, {"oslash", "\xC3\xB8"},
    {"ugrave", "\xC3\xB9"}, {"uacute", "\xC3\xBA"}, {"ucirc", "\xC3\xBB"}, {"uuml", "\xC3\xBC"},
    {"yacute", "\xC3\xBD"}, {"thorn", "\xC3\xBE"}, {"yuml", "\xC3\xBF"},
};

static const char* ABBREVIATIONS[] = {"Dr.", "Mr.", "Mrs.", "Ms.", "Prof.", "St.", "Jr.", "Sr."};

#define ARRAY_SIZE(a) (sizeof(a) / sizeof((a)[0]))

static void append_code_point(UChar32 c, string& output)
{
    uint8_t buffer[U8_MAX_LENGTH];
    int32_t length = 0;
    UBool error = false;
    U8_APPEND(buffer, length, U8_MAX_LENGTH, c, error);
    if (!error)
    {
        output.append(reinterpret_cast<const char*>(buffer), length);
    }
}

string normalize_unicode(const string& text)
{
    if (text.empty())
    {
        return text;
    }

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkc = icu::Normalizer2::getNFKCInstance(status);
    string result;
    if (U_SUCCESS(status))
    {
        icu::UnicodeString normalized = nfkc->normalize(icu::UnicodeString::fromUTF8(text), status);
        if (U_SUCCESS(status))
        {
            normalized.toUTF8String(result);
        }
    }

    if (U_FAILURE(status))
    {
        // keep the input rather than drop text
        icu::UnicodeString::fromUTF8(text).toUTF8String(result);
    }

    for (size_t i = 0; i < ARRAY_SIZE(UNICODE_REPLACEMENTS); ++i)
    {
        const string from(UNICODE_REPLACEMENTS[i].from);
        size_t pos = result.find(from);
        while (pos != string::npos)
        {
            result.replace(pos, from.length(), UNICODE_REPLACEMENTS[i].to);
            pos = result.find(from, pos + strlen(UNICODE_REPLACEMENTS[i].to));
        }
    }

    return result;
}

string strip_control_chars(const string& text)
{
    const uint32_t printable = U_GC_L_MASK | U_GC_M_MASK | U_GC_N_MASK | U_GC_P_MASK | U_GC_S_MASK;
    string result;
    result.reserve(text.length());
    const uint8_t* data = reinterpret_cast<const uint8_t*>(text.data());
    int32_t length = static_cast<int32_t>(text.length());
    int32_t i = 0;
    while (i < length)
    {
        UChar32 c;
        U8_NEXT(data, i, length, c);
        if (c < 0)
        {
            append_code_point(0xFFFD, result);
            continue;
        }

        if (c == ' ' || c == '\n' || c == '\t' || c == '\r' || c == '\f' || (U_GET_GC_MASK(c) & printable) != 0)
        {
            append_code_point(c, result);
        }
    }

    return result;
}

string collapse_whitespace(const string& text)
{
    string result;
    result.reserve(text.length());
    bool in_space = false;
    for (size_t i = 0; i < text.length(); ++i)
    {
        if (is_space(text[i]))
        {
            if (!in_space)
            {
                result.push_back(' ');
                in_space = true;
            }
        }
        else
        {
            result.push_back(text[i]);
            in_space = false;
        }
    }

    return result;
}

string normalize_whitespace(const string& text)
{
    return trim(collapse_whitespace(text));
}

string normalize_text(const string& text)
{
    return normalize_whitespace(strip_control_chars(normalize_unicode(text)));
}

static bool decode_numeric_entity(const string& name, string& output)
{
    // name starts with '#'
    if (name.length() < 2)
    {
        return false;
    }

    const char* digits = name.c_str() + 1;
    int base = 10;
    if (digits[0] == 'x' || digits[0] == 'X')
    {
        base = 16;
        ++digits;
    }

    if (*digits == '\0')
    {
        return false;
    }

    char* end = NULL;
    long value = strtol(digits, &end, base);
    if (*end != '\0' || value <= 0 || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF))
    {
        return false;
    }

    append_code_point(static_cast<UChar32>(value), output);
    return true;
}

string decode_html_entities(const string& text)
{
    if (text.find('&') == string::npos)
    {
        return text;
    }

    string result;
    result.reserve(text.length());
    size_t i = 0;
    while (i < text.length())
    {
        size_t amp = text.find('&', i);
        if (amp == string::npos)
        {
            result.append(text, i, string::npos);
            break;
        }

        result.append(text, i, amp - i);
        size_t semicolon = text.find(';', amp + 1);
        // entity names are short, anything longer is literal text
        if (semicolon == string::npos || semicolon - amp > 12)
        {
            result.push_back('&');
            i = amp + 1;
            continue;
        }

        string name = text.substr(amp + 1, semicolon - amp - 1);
        bool decoded = false;
        if (!name.empty() && name[0] == '#')
        {
            decoded = decode_numeric_entity(name, result);
        }
        else
        {
            for (size_t j = 0; j < ARRAY_SIZE(HTML_ENTITIES); ++j)
            {
                if (name == HTML_ENTITIES[j].from)
                {
                    result.append(HTML_ENTITIES[j].to);
                    decoded = true;
                    break;
                }
            }
        }

        if (decoded)
        {
            i = semicolon + 1;
        }
        else
        {
            result.push_back('&');
            i = amp + 1;
        }
    }

    return result;
}

int count_sentences(const string& text)
{
    string stripped(text);
    for (size_t i = 0; i < ARRAY_SIZE(ABBREVIATIONS); ++i)
    {
        const string abbreviation(ABBREVIATIONS[i]);
        const string replacement = abbreviation.substr(0, abbreviation.length() - 1);
        size_t pos = stripped.find(abbreviation);
        while (pos != string::npos)
        {
            stripped.replace(pos, abbreviation.length(), replacement);
            pos = stripped.find(abbreviation, pos + replacement.length());
        }
    }

    int count = 0;
    bool in_sentence = false;
    const uint8_t* data = reinterpret_cast<const uint8_t*>(stripped.data());
    int32_t length = static_cast<int32_t>(stripped.length());
    int32_t i = 0;
    while (i < length)
    {
        UChar32 c;
        U8_NEXT(data, i, length, c);
        if (c < 0)
        {
            continue;
        }

        if ((U_GET_GC_MASK(c) & (U_GC_L_MASK | U_GC_N_MASK)) != 0)
        {
            in_sentence = true;
        }
        else if (in_sentence && (c == '.' || c == '!' || c == '?'))
        {
            ++count;
            in_sentence = false;
        }
    }

    if (in_sentence)
    {
        ++count;
    }

    return count;
}

int count_words(const string& text)
{
    int count = 0;
    bool in_word = false;
    const uint8_t* data = reinterpret_cast<const uint8_t*>(text.data());
    int32_t length = static_cast<int32_t>(text.length());
    int32_t i = 0;
    while (i < length)
    {
        UChar32 c;
        U8_NEXT(data, i, length, c);
        if (c >= 0 && u_isUWhiteSpace(c))
        {
            in_word = false;
        }
        else if (!in_word)
        {
            ++count;
            in_word = true;
        }
    }

    return count;
}
