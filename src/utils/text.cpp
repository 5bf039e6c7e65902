#include <utils/text.hpp>

#include <cctype>
#include <cmath>
#include <cstdio>

namespace NewsCube {

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

std::string trim(std::string_view s) {
    size_t first = 0;
    while (first < s.size() && is_space_byte(s[first])) ++first;
    size_t last = s.size();
    while (last > first && is_space_byte(s[last - 1])) --last;
    return std::string(s.substr(first, last - first));
}

std::string rtrim_chars(std::string_view s, std::string_view chars) {
    size_t last = s.size();
    while (last > 0 && chars.find(s[last - 1]) != std::string_view::npos) --last;
    return std::string(s.substr(0, last));
}

std::vector<std::string> split_any(std::string_view s, std::string_view delimiters) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (size_t i = 0; i <= s.size(); ++i) {
        if (i == s.size() || delimiters.find(s[i]) != std::string_view::npos) {
            std::string piece = trim(s.substr(start, i - start));
            if (!piece.empty()) parts.push_back(std::move(piece));
            start = i + 1;
        }
    }
    return parts;
}

std::vector<std::string> split_whitespace(std::string_view s) {
    std::vector<std::string> parts;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_space_byte(s[i])) ++i;
        size_t start = i;
        while (i < s.size() && !is_space_byte(s[i])) ++i;
        if (i > start) parts.emplace_back(s.substr(start, i - start));
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out.append(sep);
        out.append(parts[i]);
    }
    return out;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

bool is_all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool has_alnum(std::string_view s) {
    for (char c : s) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u >= 0x80 || std::isalnum(u)) return true;
    }
    return false;
}

std::string regex_escape(std::string_view s) {
    static const std::string_view meta = "\\^$.|?*+()[]{}";
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s) {
        if (meta.find(c) != std::string_view::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string title_case(std::string_view s) {
    std::string out(s);
    bool in_word = false;
    for (char& c : out) {
        bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        if (alpha) {
            c = in_word ? static_cast<char>(std::tolower(static_cast<unsigned char>(c)))
                        : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        // An apostrophe does not start a new word ("astrazeneca's")
        in_word = alpha || (in_word && c == '\'');
    }
    return out;
}

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::string format_decimal(double value, int max_decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", max_decimals, value);
    std::string out(buf);
    size_t dot = out.find('.');
    if (dot == std::string::npos) return out + ".0";
    while (out.size() > dot + 2 && out.back() == '0') out.pop_back();
    return out;
}

} // namespace NewsCube
