#ifndef _TEXT_NORMALIZER_H_
#define _TEXT_NORMALIZER_H_

#include <string>

// All functions take and return utf-8. Invalid sequences become U+FFFD.

// NFKC, then typographic symbols folded to ascii (U+2014 -> "--", ...)
std::string normalize_unicode(const std::string& text);

// drops every code point that is not a letter, mark, number, punctuation,
// symbol or ascii space, except '\n', '\t', '\r' and '\f'
std::string strip_control_chars(const std::string& text);

// whitespace runs become one space, nothing is trimmed
std::string collapse_whitespace(const std::string& text);

// collapse_whitespace plus trimming
std::string normalize_whitespace(const std::string& text);

// normalize_unicode, strip_control_chars, normalize_whitespace
std::string normalize_text(const std::string& text);

// named entities from a fixed table and numeric references, unknown
// entities are kept as they are
std::string decode_html_entities(const std::string& text);

// a sentence is a run of letters or digits closed by '.', '!' or '?', or
// the unterminated tail. common abbreviations do not close a sentence.
int count_sentences(const std::string& text);

int count_words(const std::string& text);

#endif
