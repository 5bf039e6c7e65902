/**
 * @file record_source.cpp
 * @brief Record source implementations
 */

#include <ingestion/record_source.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <initializer_list>
#include <stdexcept>

namespace NewsCube {

// =============================================================================
// MemoryRecordSource
// =============================================================================

MemoryRecordSource::MemoryRecordSource(std::vector<DocumentRecord> records)
    : records_(std::move(records)) {}

bool MemoryRecordSource::read_batch(size_t max_rows, std::vector<DocumentRecord>& out) {
    out.clear();
    if (max_rows == 0) throw std::invalid_argument("read_batch: max_rows must be > 0");

    while (pos_ < records_.size() && out.size() < max_rows) {
        out.push_back(records_[pos_++]);
    }
    return !out.empty();
}

// =============================================================================
// CsvRecordSource
// =============================================================================

namespace {

// First header (case-insensitive, trimmed) matching one of the aliases
int find_column(const std::vector<std::string>& header, std::initializer_list<const char*> aliases) {
    for (const char* alias : aliases) {
        std::string wanted = to_lower(alias);
        for (size_t i = 0; i < header.size(); ++i) {
            if (to_lower(trim(header[i])) == wanted) return static_cast<int>(i);
        }
    }
    return -1;
}

bool is_blank_row(const std::vector<std::string>& fields) {
    for (const auto& f : fields) {
        if (!trim(f).empty()) return false;
    }
    return true;
}

} // namespace

CsvRecordSource::CsvRecordSource(const std::string& path) : reader_(path) {
    read_header();
}

CsvRecordSource::CsvRecordSource(std::istream& in) : reader_(in) {
    read_header();
}

void CsvRecordSource::read_header() {
    if (!reader_.next(header_) || is_blank_row(header_)) {
        throw std::runtime_error("Input CSV has no header row");
    }
    if (reader_.unterminated_quote()) {
        throw SchemaError("Input CSV header has an unterminated quoted field");
    }

    columns_.document_id = find_column(header_, {"Amethos Id", "Document_ID", "id"});
    columns_.date = find_column(header_, {"Date"});
    columns_.source = find_column(header_, {"Source"});
    columns_.headline = find_column(header_, {"Headline"});
    columns_.body = find_column(header_, {"Body/abstract/extract", "Body"});
    columns_.consolidated = find_column(header_, {"Consolidated_Text"});
    columns_.keyword_hints = find_column(header_, {"matched_keywords"});
    columns_.news_link = find_column(header_, {"News link", "News_Link"});
    columns_.cleaned_text = find_column(header_, {"Cleaned_Text_G", "Cleaned_Text"});
    columns_.sentiment_score = find_column(header_, {"sentiment_score"});
    columns_.qc_status = find_column(header_, {"QC_H", "QC_Status"});

    if (columns_.date < 0) throw SchemaError("Input CSV is missing required column 'Date'");
    if (columns_.source < 0) throw SchemaError("Input CSV is missing required column 'Source'");
    if (columns_.headline < 0 && columns_.body < 0 && columns_.consolidated < 0) {
        throw SchemaError("Input CSV has no text column (Headline, Body/abstract/extract, Consolidated_Text)");
    }

    if (columns_.document_id < 0) {
        Logger::warn("Input CSV has no document id column; ids will be generated");
    }
    if (columns_.keyword_hints < 0) {
        Logger::debug("Input CSV has no matched_keywords column; hint strategies disabled");
    }
}

DocumentRecord CsvRecordSource::to_record(const std::vector<std::string>& fields) {
    auto get = [&fields](int idx) -> std::string {
        return idx >= 0 ? fields[static_cast<size_t>(idx)] : std::string();
    };

    DocumentRecord r;
    r.document_id = trim(get(columns_.document_id));
    r.date = trim(get(columns_.date));
    r.source = get(columns_.source);
    r.headline = get(columns_.headline);
    r.body = get(columns_.body);
    r.consolidated = get(columns_.consolidated);
    r.keyword_hints = get(columns_.keyword_hints);
    r.news_link = trim(get(columns_.news_link));
    r.cleaned_text = get(columns_.cleaned_text);
    r.sentiment_score = trim(get(columns_.sentiment_score));
    r.qc_status = trim(get(columns_.qc_status));

    if (r.document_id.empty()) r.document_id = "doc_" + std::to_string(ordinal_);
    ++ordinal_;
    return r;
}

bool CsvRecordSource::read_batch(size_t max_rows, std::vector<DocumentRecord>& out) {
    out.clear();
    if (max_rows == 0) throw std::invalid_argument("read_batch: max_rows must be > 0");
    if (exhausted_) return false;

    std::vector<std::string> fields;
    while (out.size() < max_rows) {
        if (!reader_.next(fields)) {
            exhausted_ = true;
            break;
        }
        if (reader_.unterminated_quote()) {
            ++malformed_;
            Logger::warn("Unterminated quoted field starting at line " + std::to_string(reader_.line_number()) +
                         "; dropped the rest of the input as one malformed row");
            continue;
        }
        if (fields.size() == 1 && fields[0].empty()) continue; // blank line

        if (fields.size() != header_.size()) {
            ++malformed_;
            Logger::debug("Skipping malformed row at line " + std::to_string(reader_.line_number()) +
                          " (" + std::to_string(fields.size()) + " fields, expected " +
                          std::to_string(header_.size()) + ")");
            continue;
        }
        out.push_back(to_record(fields));
    }
    return !out.empty();
}

} // namespace NewsCube
