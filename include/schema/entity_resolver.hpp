/**
 * @file entity_resolver.hpp
 * @brief Document entity name → Dim_Entity key, first matching tier wins
 *
 *   1. exact display name
 *   2. normalized identity (normalize_entity_name on both sides)
 *   3. core word: the first word of the name; a unique holder resolves,
 *      a single-word query on a shared core word takes the shortest name
 */

#pragma once

#include <schema/star_schema.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace NewsCube {

class EntityResolver {
public:
    using Tier = std::function<std::optional<int>(const std::string&)>;

    explicit EntityResolver(const std::vector<EntityRow>& dimension);

    // Tiers capture `this`
    EntityResolver(const EntityResolver&) = delete;
    EntityResolver& operator=(const EntityResolver&) = delete;

    std::optional<int> resolve(const std::string& name) const;

    std::optional<int> by_exact_name(const std::string& name) const;
    std::optional<int> by_normalized_name(const std::string& name) const;
    std::optional<int> by_core_word(const std::string& name) const;

private:
    std::unordered_map<std::string, int> exact_;
    std::unordered_map<std::string, int> normalized_;
    std::map<std::string, std::vector<std::pair<int, std::string>>> core_;   // core word → (key, name) by key
    std::vector<Tier> tiers_;
};

} // namespace NewsCube
