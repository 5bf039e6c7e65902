/**
 * @file table_layout.cpp
 * @brief Star schema → TableData
 */

#include <output/table_layout.hpp>
#include <utils/text.hpp>

namespace NewsCube {

namespace {

const char* const INT = "INTEGER";
const char* const REAL = "DOUBLE PRECISION";
const char* const TEXT = "TEXT";

std::string str(int v) { return std::to_string(v); }

} // namespace

std::vector<std::string> TableData::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& c : columns) names.push_back(c.name);
    return names;
}

std::vector<TableData> tabulate(const StarSchema& schema) {
    std::vector<TableData> tables;

    // -------------------------------------------------------------------------
    TableData fact;
    fact.name = "Fact_Document";
    fact.columns = {
        {"Fact_ID", INT}, {"Document_ID", TEXT}, {"Date_Key", INT}, {"Source_Key", INT},
        {"Year", INT}, {"Quarter", TEXT}, {"Month", TEXT}, {"Date_String", TEXT},
        {"Source_Name", TEXT}, {"Source_Type", TEXT}, {"Headline", TEXT}, {"Body_Text", TEXT},
        {"News_Link", TEXT}, {"Cleaned_Text", TEXT}, {"Consolidated_Text", TEXT},
        {"Matched_Keywords", TEXT}, {"Sentiment_Score", REAL}, {"QC_Status", TEXT},
        {"Content_Hash", TEXT}, {"Document_Count", INT}, {"Tag_Count", INT}, {"Has_Key_Event", TEXT}};
    fact.primary_key = {"Fact_ID"};
    fact.rows.reserve(schema.facts.size());
    for (const auto& f : schema.facts) {
        fact.rows.push_back({str(f.fact_id), f.document_id, str(f.date_key), str(f.source_key),
                             str(f.year), f.quarter, f.month, f.date_string,
                             f.source_name, f.source_type, f.headline, f.body_text,
                             f.news_link, f.cleaned_text, f.consolidated_text,
                             f.matched_keywords, f.sentiment_score, f.qc_status,
                             f.content_hash, str(f.document_count), str(f.tag_count), f.has_key_event});
    }
    tables.push_back(std::move(fact));

    // -------------------------------------------------------------------------
    TableData time;
    time.name = "Dim_Time";
    time.columns = {{"Date_Key", INT}, {"Year", INT}, {"Quarter", TEXT}, {"Month", TEXT},
                    {"Month_Number", INT}, {"Day", INT}, {"Day_of_Week", TEXT},
                    {"Week_of_Year", INT}, {"Date_String", TEXT}};
    time.primary_key = {"Date_Key"};
    for (const auto& t : schema.time) {
        time.rows.push_back({str(t.date_key), str(t.year), t.quarter, t.month, str(t.month_number),
                             str(t.day), t.day_of_week, str(t.week_of_year), t.date_string});
    }
    tables.push_back(std::move(time));

    // -------------------------------------------------------------------------
    TableData source;
    source.name = "Dim_Source";
    source.columns = {{"Source_Key", INT}, {"Source_Name", TEXT}, {"Source_Type", TEXT}};
    source.primary_key = {"Source_Key"};
    for (const auto& s : schema.sources) {
        source.rows.push_back({str(s.source_key), s.name, s.type});
    }
    tables.push_back(std::move(source));

    // -------------------------------------------------------------------------
    TableData tag;
    tag.name = "Dim_Tag";
    tag.columns = {{"Tag_Key", INT}, {"Tag_Name", TEXT}, {"Tag_Category", TEXT}, {"Tag_Domain", TEXT}};
    tag.primary_key = {"Tag_Key"};
    for (const auto& t : schema.tags) {
        tag.rows.push_back({str(t.tag_key), t.name, t.category, t.domain});
    }
    tables.push_back(std::move(tag));

    // -------------------------------------------------------------------------
    TableData entity;
    entity.name = "Dim_Entity";
    entity.columns = {{"Entity_Key", INT}, {"Entity_Name", TEXT}, {"Entity_Type", TEXT}, {"Entity_Domain", TEXT}};
    entity.primary_key = {"Entity_Key"};
    for (const auto& e : schema.entities) {
        entity.rows.push_back({str(e.entity_key), e.name, e.type, e.domain});
    }
    tables.push_back(std::move(entity));

    // -------------------------------------------------------------------------
    TableData fact_tag;
    fact_tag.name = "Bridge_Fact_Tag";
    fact_tag.columns = {{"Fact_ID", INT}, {"Tag_Key", INT}, {"Confidence_Score", REAL}};
    fact_tag.primary_key = {"Fact_ID", "Tag_Key"};
    for (const auto& b : schema.fact_tags) {
        fact_tag.rows.push_back({str(b.fact_id), str(b.tag_key), format_decimal(b.confidence)});
    }
    tables.push_back(std::move(fact_tag));

    // -------------------------------------------------------------------------
    TableData fact_entity;
    fact_entity.name = "Bridge_Fact_Entity";
    fact_entity.columns = {{"Fact_ID", INT}, {"Entity_Key", INT}, {"Mention_Count", INT}};
    fact_entity.primary_key = {"Fact_ID", "Entity_Key"};
    for (const auto& b : schema.fact_entities) {
        fact_entity.rows.push_back({str(b.fact_id), str(b.entity_key), str(b.mention_count)});
    }
    tables.push_back(std::move(fact_entity));

    return tables;
}

TableData tabulate_rejected(const std::vector<RejectedEntity>& rejected) {
    TableData table;
    table.name = "rejected_entities";
    table.columns = {{"Rejected_Entity", TEXT}, {"Occurrence_Count", INT}, {"Reason", TEXT}};
    table.primary_key = {"Rejected_Entity"};
    for (const auto& r : rejected) {
        table.rows.push_back({r.name, std::to_string(r.occurrences), r.reason});
    }
    return table;
}

} // namespace NewsCube
