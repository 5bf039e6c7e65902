/**
 * @file dimension_accumulator.cpp
 * @brief Dimension candidate accumulation
 */

#include <schema/dimension_accumulator.hpp>
#include <schema/date_dimension.hpp>
#include <schema/source_rules.hpp>
#include <transform/entity_extractor.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <tuple>

namespace NewsCube {

void DimensionAccumulator::add_date(std::string_view raw) {
    auto parsed = parse_date(raw);
    TimeRow row = parsed ? make_time_row(*parsed) : unknown_time_row();
    dates_.emplace(row.date_key, std::move(row));
}

bool DimensionAccumulator::add_source(std::string_view raw) {
    std::string name = trim(raw);
    if (!is_valid_source_name(name)) return false;
    if (sources_.find(name) == sources_.end()) {
        std::string type = classify_source_type(name);
        sources_.emplace(std::move(name), std::move(type));
    }
    return true;
}

void DimensionAccumulator::add_entity(const EntityCandidate& candidate) {
    EntityExtractor::merge_candidate(entities_, candidate);
}

void DimensionAccumulator::add_document(const EnrichedDocument& doc) {
    add_date(doc.record.date);
    add_source(doc.record.source);
    for (const auto& e : doc.entities) add_entity(e);
}

std::vector<TimeRow> DimensionAccumulator::time_rows() const {
    std::vector<TimeRow> rows;
    rows.reserve(dates_.size());
    for (const auto& entry : dates_) rows.push_back(entry.second);
    return rows;
}

std::vector<SourceRow> DimensionAccumulator::source_rows() const {
    std::vector<SourceRow> rows;
    rows.reserve(sources_.size());
    int key = SOURCE_KEY_BASE;
    for (const auto& [name, type] : sources_) {
        rows.push_back({key++, name, type});
    }
    return rows;
}

std::vector<EntityRow> DimensionAccumulator::entity_rows() const {
    std::vector<EntityRow> rows;
    rows.reserve(entities_.size());
    for (const auto& entry : entities_) {
        rows.push_back({0, entry.second.name, entry.second.type, EntityExtractor::ENTITY_DOMAIN});
    }

    std::sort(rows.begin(), rows.end(), [](const EntityRow& a, const EntityRow& b) {
        return std::tie(a.name, a.type) < std::tie(b.name, b.type);
    });

    int key = ENTITY_KEY_BASE;
    for (auto& row : rows) row.entity_key = key++;
    return rows;
}

} // namespace NewsCube
