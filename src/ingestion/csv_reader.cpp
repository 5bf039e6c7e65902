/**
 * @file csv_reader.cpp
 * @brief CSV reader implementation
 */

#include <ingestion/csv_reader.hpp>
#include <sstream>
#include <stdexcept>

namespace NewsCube {

CsvReader::CsvReader(const std::string& path)
    : owned_(std::make_unique<std::ifstream>(path, std::ios::binary)), in_(owned_.get()) {
    if (!*owned_) {
        throw std::runtime_error("Cannot open CSV file: " + path);
    }
}

CsvReader::CsvReader(std::istream& in) : in_(&in) {}

bool CsvReader::next(std::vector<std::string>& fields) {
    fields.clear();
    unterminated_ = false;

    std::string line;
    if (!std::getline(*in_, line)) return false;
    ++line_;
    record_line_ = line_;

    if (first_) {
        first_ = false;
        if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
    }

    std::string field;
    bool in_quotes = false;
    bool quoted_field = false;

    for (;;) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (in_quotes) {
                if (c == '"') {
                    if (i + 1 < line.size() && line[i + 1] == '"') {
                        field.push_back('"');
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    field.push_back(c);
                }
            } else if (c == '"' && field.empty() && !quoted_field) {
                in_quotes = true;
                quoted_field = true;
            } else if (c == ',') {
                fields.push_back(std::move(field));
                field.clear();
                quoted_field = false;
            } else {
                field.push_back(c);
            }
        }

        if (!in_quotes) break;

        // Quoted field continues on the next physical line
        if (!std::getline(*in_, line)) {
            unterminated_ = true;
            break;
        }
        ++line_;
        field.push_back('\n');
    }

    fields.push_back(std::move(field));
    return true;
}

std::vector<std::string> CsvReader::parse_line(const std::string& line) {
    std::istringstream in(line);
    CsvReader reader(in);
    std::vector<std::string> fields;
    reader.next(fields);
    return fields;
}

} // namespace NewsCube
