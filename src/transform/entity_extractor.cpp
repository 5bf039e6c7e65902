/**
 * @file entity_extractor.cpp
 * @brief Entity extraction strategies and batch aggregation
 */

#include <transform/entity_extractor.hpp>
#include <transform/entity_names.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>

namespace NewsCube {

namespace {

// Suffixes that may trail a counted mention
const char* const kMentionSuffixes =
    "inc|incorporated|corp|corporation|ltd|limited|llc|pharmaceuticals|pharma|"
    "biotech|biotechnology|therapeutics|biosciences";

// Suffixes preferred when locating a known company in text
const char* const kScanSuffixes =
    "inc|incorporated|corp|corporation|ltd|limited|llc|pharmaceuticals|pharma|"
    "biotech|biotechnology|therapeutics";

constexpr size_t CONTEXT_WINDOW = 20;

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::optimize;

} // namespace

EntityExtractor::EntityExtractor(const CompanyList& registry) {
    std::set<std::string> known;
    size_t accepted = 0;

    for (const auto& rec : registry) {
        std::string name = trim(rec.name);
        std::string lower = to_lower(name);
        if (name.empty() || lower == "nan" || lower == "none") continue;

        std::string key = normalize_entity_name(name);
        if (key.empty()) continue;
        ++accepted;

        std::string type = trim(rec.entity_type);
        if (type.empty()) type = "Company";

        auto it = canonical_.find(key);
        if (it == canonical_.end()) {
            canonical_.emplace(key, Canonical{name, type});
        } else {
            const std::string& existing = it->second.name;
            bool longer = name.size() > existing.size();
            bool more_readable = name.size() == existing.size() &&
                                 name.find(' ') != std::string::npos &&
                                 existing.find(' ') == std::string::npos;
            if (longer || more_readable) it->second = Canonical{name, type};
        }

        known.insert(key);
        known.insert(lower);
    }

    known_companies_.assign(known.begin(), known.end());

    if (!registry.empty()) {
        Logger::info("Entity registry: " + std::to_string(canonical_.size()) + " unique companies (" +
                     std::to_string(accepted - canonical_.size()) + " variants merged)");
    }
}

// =============================================================================
// Strategies
// =============================================================================

bool EntityExtractor::attested_with_suffix(const std::string& token, const std::string& full_text) {
    if (full_text.empty() || !is_ascii_upper(token[0])) return false;
    if (split_whitespace(token).size() != 1) return false;

    std::regex pattern("\\b" + regex_escape(to_lower(token)) + "\\s+(?:" + kMentionSuffixes + ")\\b",
                       kRegexFlags);
    return std::regex_search(full_text, pattern);
}

void EntityExtractor::from_hints(const DocumentRecord& doc, const std::string& full_text,
                                 std::vector<Found>& out, std::vector<std::string>* rejected) const {
    auto reject = [rejected](const std::string& token) {
        if (rejected) rejected->push_back(token);
    };

    for (const auto& token : split_any(doc.keyword_hints, ";,|")) {
        if (token.size() < 2) continue;

        if (contains_filter_word(to_lower(token))) {
            reject(token);
            continue;
        }

        if (!is_likely_company_name(token, known_companies_) && !attested_with_suffix(token, full_text)) {
            reject(token);
            continue;
        }

        std::string key = normalize_entity_name(token);
        if (key.size() <= 1) {
            reject(token);
            continue;
        }

        out.push_back({key, EntityCandidate{token, "", HINT_CONFIDENCE, 0}});
    }
}

void EntityExtractor::from_known_companies(const std::string& combined, std::vector<Found>& out) const {
    for (const auto& known : known_companies_) {
        if (known.empty() || !contains(combined, known)) continue;

        const std::string escaped = regex_escape(known);
        const std::regex patterns[] = {
            std::regex("\\b" + escaped + "\\s+(?:" + kScanSuffixes + ")\\b", kRegexFlags),
            std::regex("\\b" + escaped + "\\b", kRegexFlags),
        };
        const std::regex full_name("\\b" + escaped + "[^\\s,\\.;:]*", kRegexFlags);

        for (const auto& pattern : patterns) {
            std::smatch hit;
            if (!std::regex_search(combined, hit, pattern)) continue;

            size_t pos = static_cast<size_t>(hit.position(0));
            size_t start = pos >= CONTEXT_WINDOW ? pos - CONTEXT_WINDOW : 0;
            size_t end = std::min(combined.size(), pos + static_cast<size_t>(hit.length(0)) + CONTEXT_WINDOW);
            std::string context = combined.substr(start, end - start);

            std::smatch surface;
            if (!std::regex_search(context, surface, full_name)) continue;

            std::string display = title_case(trim(surface.str()));
            std::string key = normalize_entity_name(display);
            if (key.empty()) continue;

            out.push_back({key, EntityCandidate{display, "", TEXT_SCAN_CONFIDENCE, 0}});
            break;
        }
    }
}

// =============================================================================
// Per-document extraction
// =============================================================================

std::vector<EntityCandidate> EntityExtractor::extract(const DocumentRecord& doc, const NormalizedText& text,
                                                      std::vector<std::string>* rejected) const {
    const std::string full_text = to_lower(doc.headline + " " + doc.body);

    std::vector<Found> found;
    from_hints(doc, full_text, found, rejected);
    if (!text.combined.empty()) from_known_companies(text.combined, found);

    std::vector<std::string> order;
    std::map<std::string, EntityCandidate> by_key;

    for (auto& f : found) {
        EntityCandidate& c = f.candidate;
        c.mention_count = count_mentions(c.name, full_text);

        auto it = by_key.find(f.key);
        if (it == by_key.end()) {
            c.type = classify_entity_type(c.name);
            by_key.emplace(f.key, c);
            order.push_back(f.key);
        } else if (c.confidence > it->second.confidence) {
            c.type = classify_entity_type(c.name);
            it->second = c;
        } else {
            it->second.mention_count = std::max(it->second.mention_count, c.mention_count);
        }
    }

    // Registry override keeps the computed mention count
    for (const auto& key : order) {
        auto reg = canonical_.find(key);
        if (reg == canonical_.end()) continue;
        EntityCandidate& c = by_key[key];
        c.name = reg->second.name;
        c.type = reg->second.type;
        c.confidence = REGISTRY_CONFIDENCE;
    }

    std::vector<EntityCandidate> result;
    result.reserve(order.size());
    for (const auto& key : order) result.push_back(by_key[key]);
    return result;
}

int EntityExtractor::count_mentions(const std::string& name, const std::string& text) {
    std::string lower = to_lower(trim(name));
    if (lower.empty() || text.empty()) return 0;

    std::regex pattern("\\b" + regex_escape(lower) + "(?:\\s+(?:" + kMentionSuffixes + "))?\\b", kRegexFlags);
    return static_cast<int>(std::distance(std::sregex_iterator(text.begin(), text.end(), pattern),
                                          std::sregex_iterator()));
}

// =============================================================================
// Batch aggregation
// =============================================================================

void EntityExtractor::merge_candidate(std::map<std::string, EntityCandidate>& into,
                                      const EntityCandidate& candidate) {
    std::string key = normalize_entity_name(candidate.name);
    if (key.empty()) return;

    EntityCandidate entry = candidate;
    entry.mention_count = 0;

    auto it = into.find(key);
    if (it == into.end()) {
        into.emplace(std::move(key), std::move(entry));
    } else if (is_better_candidate(entry, it->second)) {
        it->second = std::move(entry);
    }
}

BatchExtraction EntityExtractor::batch_extract(const std::vector<DocumentRecord>& docs,
                                               const std::vector<NormalizedText>& texts) const {
    if (docs.size() != texts.size()) {
        throw std::invalid_argument("batch_extract: " + std::to_string(docs.size()) + " documents but " +
                                    std::to_string(texts.size()) + " normalized texts");
    }

    BatchExtraction out;
    out.per_document.reserve(docs.size());

    std::vector<std::string> rejected;
    for (size_t i = 0; i < docs.size(); ++i) {
        std::vector<EntityCandidate> entities = extract(docs[i], texts[i], &rejected);
        for (const auto& e : entities) merge_candidate(out.dimension, e);
        out.per_document.push_back(std::move(entities));
    }

    for (const auto& r : rejected) {
        std::string name = trim(r);
        if (!name.empty()) ++out.rejected[name];
    }

    return out;
}

std::vector<RejectedEntity> EntityExtractor::rejected_table(const std::map<std::string, size_t>& counts) {
    std::vector<RejectedEntity> table;
    table.reserve(counts.size());
    for (const auto& [name, count] : counts) {
        table.push_back({name, count, REJECT_REASON});
    }
    std::stable_sort(table.begin(), table.end(), [](const RejectedEntity& a, const RejectedEntity& b) {
        return a.occurrences > b.occurrences;
    });
    return table;
}

} // namespace NewsCube
