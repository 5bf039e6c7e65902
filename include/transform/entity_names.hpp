/**
 * @file entity_names.hpp
 * @brief Organization-name identity rules shared by extraction and resolution
 *
 * Two surface names denote the same entity iff normalize_entity_name()
 * maps them to the same string:
 *   "AstraZeneca" = "Astra Zeneca" = "AstraZeneca Inc" → "astrazeneca"
 *   "Johnson & Johnson" = "Johnson and Johnson"        → "johnsonandjohnson"
 */

#pragma once

#include <model/document.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace NewsCube {

/**
 * @brief Corporate suffixes, longest first (ties alphabetical).
 */
const std::vector<std::string>& company_suffixes();

/**
 * @brief Medical/clinical vocabulary that disqualifies a candidate name.
 */
const std::vector<std::string>& entity_filter_words();

/**
 * @brief Identity key: lowercase, conjunctions folded, one trailing
 * corporate suffix per suffix spelling removed, whitespace and punctuation
 * dropped, outer non-alphanumerics trimmed. Idempotent.
 */
std::string normalize_entity_name(std::string_view name);

/**
 * @brief True if the lowercase text contains any filter word as a substring.
 */
bool contains_filter_word(std::string_view lower_text);

/**
 * @brief Heuristic: does a hint token look like an organization name?
 *
 * @param known_companies lowercase registry strings; any substring hit accepts
 */
bool is_likely_company_name(std::string_view text, const std::vector<std::string>& known_companies);

/**
 * @brief "Organization" for regulators, universities, institutes and hospitals,
 * otherwise "Company".
 */
std::string classify_entity_type(std::string_view name);

/**
 * @brief First word of a name, lowercased, outer quotes and punctuation removed.
 * Empty when the name has no word.
 */
std::string entity_core_word(std::string_view name);

/**
 * @brief Strict preference between two candidates for the same identity.
 *
 * Higher confidence wins, then the longer display name, then the
 * lexicographically smaller name, then the smaller type, so the merged
 * result does not depend on the order candidates arrive in.
 */
bool is_better_candidate(const EntityCandidate& a, const EntityCandidate& b);

} // namespace NewsCube
