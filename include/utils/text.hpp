#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace NewsCube {

// Byte-level string helpers shared by the normalizer, matchers and loaders.
// ASCII case folding only; bytes >= 0x80 (UTF-8 sequences) pass through and
// count as word characters.

std::string to_lower(std::string_view s);

std::string trim(std::string_view s);

// Trim only the given characters from the right.
std::string rtrim_chars(std::string_view s, std::string_view chars);

// Split on any of the delimiter characters, trimming each piece and dropping empties.
std::vector<std::string> split_any(std::string_view s, std::string_view delimiters);

// Split on runs of ASCII whitespace.
std::vector<std::string> split_whitespace(std::string_view s);

std::string join(const std::vector<std::string>& parts, std::string_view sep);

bool starts_with(std::string_view s, std::string_view prefix);
bool ends_with(std::string_view s, std::string_view suffix);
bool contains(std::string_view haystack, std::string_view needle);

inline bool is_space_byte(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Word character in the regex sense, extended to non-ASCII bytes.
inline bool is_word_byte(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return u >= 0x80 || (u >= '0' && u <= '9') || (u >= 'a' && u <= 'z') ||
           (u >= 'A' && u <= 'Z') || u == '_';
}

inline bool is_ascii_upper(char c) { return c >= 'A' && c <= 'Z'; }

bool is_all_digits(std::string_view s);
bool has_alnum(std::string_view s);

// Escape every ECMAScript regex metacharacter.
std::string regex_escape(std::string_view s);

// First letter of every word upper-cased, the rest lower-cased. A word is an
// alphabetic run; an apostrophe inside it does not end it.
std::string title_case(std::string_view s);

// Round half away from zero to two decimals.
double round2(double value);

// Shortest fixed-point rendering with at most `max_decimals` decimals and at
// least one ("0.9", "1.0", "0.75").
std::string format_decimal(double value, int max_decimals = 2);

} // namespace NewsCube
