/**
 * @file star_schema.hpp
 * @brief Row types of the seven star-schema tables
 *
 *                  Dim_Time   Dim_Source
 *                       \       /
 *   Bridge_Fact_Tag -- Fact_Document -- Bridge_Fact_Entity
 *          |                                   |
 *       Dim_Tag                            Dim_Entity
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace NewsCube {

struct TimeRow {
    int date_key = 0;               // YYYYMMDD
    int year = 0;
    std::string quarter;            // "Q1".."Q4"
    std::string month;              // English month name
    int month_number = 0;
    int day = 0;
    std::string day_of_week;
    int week_of_year = 0;           // ISO-8601
    std::string date_string;        // YYYY-MM-DD
};

struct SourceRow {
    int source_key = 0;
    std::string name;
    std::string type;               // News / Government / Academic / Industry / Other
};

struct TagRow {
    int tag_key = 0;
    std::string name;
    std::string category;
    std::string domain;
};

struct EntityRow {
    int entity_key = 0;
    std::string name;
    std::string type;
    std::string domain;
};

struct FactRow {
    int fact_id = 0;
    std::string document_id;
    int date_key = 0;
    int source_key = 0;

    // Denormalized snapshot of the referenced dimension rows
    int year = 0;
    std::string quarter;
    std::string month;
    std::string date_string;
    std::string source_name;
    std::string source_type;

    std::string headline;
    std::string body_text;
    std::string news_link;
    std::string cleaned_text;
    std::string consolidated_text;
    std::string matched_keywords;
    std::string sentiment_score;    // blank when absent or non-numeric
    std::string qc_status;
    std::string content_hash;

    // Measures
    int document_count = 1;
    int tag_count = 0;
    std::string has_key_event = "No";
};

struct BridgeTagRow {
    int fact_id = 0;
    int tag_key = 0;
    double confidence = 0.0;
};

struct BridgeEntityRow {
    int fact_id = 0;
    int entity_key = 0;
    int mention_count = 0;
};

/**
 * @brief Links dropped during fact/bridge construction.
 */
struct ResolutionReport {
    size_t unresolved_entities = 0;             // distinct names
    std::vector<std::string> unresolved_sample; // first names, sorted
    size_t unresolved_tags = 0;                 // distinct tag names
    size_t default_source_facts = 0;            // facts that fell back to the default source key
};

struct StarSchema {
    std::vector<FactRow> facts;
    std::vector<TimeRow> time;
    std::vector<SourceRow> sources;
    std::vector<TagRow> tags;
    std::vector<EntityRow> entities;
    std::vector<BridgeTagRow> fact_tags;
    std::vector<BridgeEntityRow> fact_entities;

    ResolutionReport resolution;
};

} // namespace NewsCube
