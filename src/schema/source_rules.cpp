/**
 * @file source_rules.cpp
 * @brief Source-name rules
 */

#include <schema/source_rules.hpp>
#include <utils/text.hpp>
#include <initializer_list>

namespace NewsCube {

namespace {

bool contains_any(const std::string& text, std::initializer_list<const char*> terms) {
    for (const char* t : terms) {
        if (contains(text, t)) return true;
    }
    return false;
}

} // namespace

bool is_valid_source_name(std::string_view name) {
    if (name.size() < 2 || name.size() > 100) return false;
    if (is_all_digits(name)) return false;
    return has_alnum(name);
}

std::string classify_source_type(std::string_view name) {
    const std::string lower = to_lower(name);

    if (contains_any(lower, {"news", "times", "post", "journal", "report"})) return "News";
    if (contains_any(lower, {"fda", "ema", "who", "nih", "gov"})) return "Government";
    if (contains_any(lower, {"university", "college", "institute"})) return "Academic";
    if (contains_any(lower, {"biotech", "pharma", "medical", "health"})) return "Industry";
    return "Other";
}

} // namespace NewsCube
