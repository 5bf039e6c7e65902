/**
 * @file text_normalizer.cpp
 * @brief Text normalization implementation
 */

#include <transform/text_normalizer.hpp>
#include <utils/text.hpp>

#include <algorithm>

namespace NewsCube {

namespace {

bool keep_char(char c) {
    return is_word_byte(c) || is_space_byte(c) || c == '\'' || c == '-';
}

bool starts_with_at(const std::string& s, size_t pos, const std::string& prefix) {
    return s.compare(pos, prefix.size(), prefix) == 0;
}

// True when the phrase starts at `start` and every part ends before `dot`,
// the first period at or after `start`.
bool phrase_matches_at(const std::string& lower, size_t start, size_t dot,
                       const std::vector<std::vector<std::string>>& parts) {
    for (const auto& lead : parts.front()) {
        if (!starts_with_at(lower, start, lead) || start + lead.size() > dot) continue;

        size_t cursor = start + lead.size();
        bool all = true;
        for (size_t p = 1; p < parts.size() && all; ++p) {
            size_t best = std::string::npos;
            size_t best_end = 0;
            for (const auto& alt : parts[p]) {
                size_t at = lower.find(alt, cursor);
                if (at == std::string::npos || at + alt.size() > dot) continue;
                if (at < best) {
                    best = at;
                    best_end = at + alt.size();
                }
            }
            if (best == std::string::npos) all = false;
            else cursor = best_end;
        }
        if (all) return true;
    }
    return false;
}

// Collapse runs of two or more periods into one.
std::string collapse_periods(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '.' && !out.empty() && out.back() == '.') continue;
        out.push_back(c);
    }
    return out;
}

// Runs of at least `min_run` whitespace bytes become one space.
std::string collapse_whitespace(const std::string& s, size_t min_run) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (!is_space_byte(s[i])) {
            out.push_back(s[i++]);
            continue;
        }
        size_t start = i;
        while (i < s.size() && is_space_byte(s[i])) ++i;
        if (i - start >= min_run) out.push_back(' ');
        else out.append(s, start, i - start);
    }
    return out;
}

// Offset inside a whitespace-free token where a URL begins, or npos.
size_t url_start(std::string_view token) {
    size_t best = std::string_view::npos;
    for (std::string_view scheme : {std::string_view("http://"), std::string_view("https://"),
                                    std::string_view("www.")}) {
        size_t at = token.find(scheme);
        if (at != std::string_view::npos && at + scheme.size() < token.size() && at < best) best = at;
    }
    return best;
}

bool is_email_token(std::string_view token) {
    if (token.size() < 3) return false;
    return token.find('@', 1) < token.size() - 1;
}

// Apply `cut` to every whitespace-delimited token; whitespace is kept as is.
template <typename Cut>
std::string cut_tokens(const std::string& s, Cut cut) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (is_space_byte(s[i])) {
            out.push_back(s[i++]);
            continue;
        }
        size_t start = i;
        while (i < s.size() && !is_space_byte(s[i])) ++i;
        std::string_view token(s.data() + start, i - start);
        size_t keep = cut(token);
        out.append(token.substr(0, keep == std::string_view::npos ? token.size() : keep));
    }
    return out;
}

// Drop word runs made of exactly one code point.
std::string drop_single_char_words(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (!is_word_byte(s[i])) {
            out.push_back(s[i++]);
            continue;
        }
        size_t start = i;
        size_t code_points = 0;
        while (i < s.size() && is_word_byte(s[i])) {
            if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) ++code_points;
            ++i;
        }
        if (code_points != 1) out.append(s, start, i - start);
    }
    return out;
}

} // namespace

TextNormalizer::TextNormalizer()
    : boilerplate_{
          // Subscription prompts
          {{{"to read the rest of this story subscribe to"}}},
          {{{"to read the full article", "to read the full story"}, {"subscribe"}}},
          {{{"to read the full article", "to read the full story"}, {"sign up", "sign in"}}},
          {{{"subscribe to"}, {"stat+"}}},
          {{{"subscribe to"}, {"stat"}}},
          {{{"subscribe to"}, {"premium"}}},
          // Newsletter prompts
          {{{"sign up for"}, {"newsletter"}}},
          {{{"subscribe to"}, {"newsletter"}}},
          // Correction requests
          {{{"to submit a correction request"}}},
          {{{"to submit a correction"}}},
          // Generic prompts
          {{{"for more information"}}},
          {{{"read more at"}}},
      },
      ending_markers_{"to read the rest", "to read the full", "subscribe",
                      "to submit a correction", "contact us", "for more information"} {}

std::string TextNormalizer::remove_boilerplate(std::string_view raw) const {
    std::string text(raw);
    if (text.empty()) return text;

    for (const auto& phrase : boilerplate_) {
        const std::string lower = to_lower(text);
        std::string out;
        out.reserve(text.size());

        size_t copied = 0;
        size_t cursor = 0;
        while (cursor < lower.size()) {
            size_t start = std::string::npos;
            for (const auto& lead : phrase.parts.front()) {
                start = std::min(start, lower.find(lead, cursor));
            }
            if (start == std::string::npos) break;

            size_t dot = lower.find('.', start);
            if (dot != std::string::npos && phrase_matches_at(lower, start, dot, phrase.parts)) {
                out.append(text, copied, start - copied);
                copied = dot + 1;
                cursor = dot + 1;
            } else {
                cursor = start + 1;
            }
        }
        out.append(text, copied, std::string::npos);
        text = std::move(out);
    }

    // Everything after "<period> <marker>" is trailer text
    for (const auto& marker : ending_markers_) {
        const std::string lower = to_lower(text);
        for (size_t at = lower.find(marker); at != std::string::npos; at = lower.find(marker, at + 1)) {
            size_t j = at;
            while (j > 0 && is_space_byte(lower[j - 1])) --j;
            if (j > 0 && lower[j - 1] == '.') {
                text.erase(j);
                break;
            }
        }
    }

    text = collapse_periods(text);
    text = collapse_whitespace(text, 3);
    return trim(text);
}

std::string TextNormalizer::normalize_text(std::string_view raw) const {
    std::string text = trim(raw);
    if (text.empty()) return text;

    text = remove_boilerplate(text);
    text = to_lower(text);

    text = cut_tokens(text, url_start);
    text = cut_tokens(text, [](std::string_view token) {
        return is_email_token(token) ? size_t{0} : std::string_view::npos;
    });

    for (char& c : text) {
        if (!keep_char(c)) c = ' ';
    }

    text = collapse_whitespace(text, 1);
    text = drop_single_char_words(text);
    return trim(text);
}

NormalizedText TextNormalizer::normalize(const DocumentRecord& doc) const {
    NormalizedText out;
    out.headline = normalize_text(doc.headline);
    out.body = normalize_text(doc.body);
    out.consolidated = normalize_text(doc.consolidated);

    std::vector<std::string> parts;
    if (!out.headline.empty()) parts.push_back(out.headline);
    if (!out.body.empty()) parts.push_back(out.body);
    if (!out.consolidated.empty() && out.consolidated != out.body) parts.push_back(out.consolidated);
    out.combined = join(parts, " ");

    return out;
}

std::vector<NormalizedText> TextNormalizer::normalize_batch(const std::vector<DocumentRecord>& docs) const {
    std::vector<NormalizedText> out;
    out.reserve(docs.size());
    for (const auto& doc : docs) out.push_back(normalize(doc));
    return out;
}

} // namespace NewsCube
