/**
 * @file entity_resolver.cpp
 * @brief Tiered entity key resolution
 */

#include <schema/entity_resolver.hpp>
#include <transform/entity_names.hpp>
#include <utils/text.hpp>
#include <algorithm>

namespace NewsCube {

EntityResolver::EntityResolver(const std::vector<EntityRow>& dimension) {
    std::vector<EntityRow> rows = dimension;
    std::sort(rows.begin(), rows.end(), [](const EntityRow& a, const EntityRow& b) {
        return a.entity_key < b.entity_key;
    });

    // Lowest key wins on collisions
    for (const auto& row : rows) {
        std::string name = trim(row.name);
        exact_.emplace(name, row.entity_key);

        std::string normalized = normalize_entity_name(name);
        if (!normalized.empty()) normalized_.emplace(normalized, row.entity_key);

        std::string core = entity_core_word(name);
        if (!core.empty()) core_[core].emplace_back(row.entity_key, name);
    }

    tiers_ = {
        [this](const std::string& n) { return by_exact_name(n); },
        [this](const std::string& n) { return by_normalized_name(n); },
        [this](const std::string& n) { return by_core_word(n); },
    };
}

std::optional<int> EntityResolver::resolve(const std::string& name) const {
    std::string trimmed = trim(name);
    if (trimmed.empty()) return std::nullopt;

    for (const auto& tier : tiers_) {
        if (auto key = tier(trimmed)) return key;
    }
    return std::nullopt;
}

std::optional<int> EntityResolver::by_exact_name(const std::string& name) const {
    auto it = exact_.find(name);
    if (it == exact_.end()) return std::nullopt;
    return it->second;
}

std::optional<int> EntityResolver::by_normalized_name(const std::string& name) const {
    std::string normalized = normalize_entity_name(name);
    if (normalized.empty()) return std::nullopt;

    auto it = normalized_.find(normalized);
    if (it == normalized_.end()) return std::nullopt;
    return it->second;
}

std::optional<int> EntityResolver::by_core_word(const std::string& name) const {
    std::string core = entity_core_word(name);
    if (core.empty()) return std::nullopt;

    auto it = core_.find(core);
    if (it == core_.end()) return std::nullopt;

    const auto& candidates = it->second;
    if (candidates.size() == 1) return candidates.front().first;

    const bool single_word = split_whitespace(rtrim_chars(trim(name), "'\".,;: ")).size() == 1;
    if (!single_word) return candidates.front().first;

    // Shortest full name; first by key on ties
    auto best = std::min_element(candidates.begin(), candidates.end(),
                                 [](const auto& a, const auto& b) { return a.second.size() < b.second.size(); });
    return best->first;
}

} // namespace NewsCube
