/**
 * @file bulk_copy.cpp
 * @brief COPY FROM STDIN streaming
 */

#include <database/bulk_copy.hpp>
#include <utils/logger.hpp>
#include <stdexcept>

namespace NewsCube {

BulkCopy::BulkCopy(DatabaseConnection& db, size_t flush_rows) : db_(db), flush_rows_(flush_rows) {
    if (flush_rows_ == 0) throw std::invalid_argument("BulkCopy flush size must be at least 1 row");
}

std::string BulkCopy::quote_identifier(const std::string& id) {
    std::string out;
    out.reserve(id.size() + 2);
    out.push_back('"');
    for (char c : id) {
        if (c == '"') out.append("\"\"");
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string BulkCopy::qualified_name(const std::string& table_name) {
    auto dot_pos = table_name.find('.');
    if (dot_pos == std::string::npos) {
        return quote_identifier(table_name);
    }
    return quote_identifier(table_name.substr(0, dot_pos)) + "." + quote_identifier(table_name.substr(dot_pos + 1));
}

std::string BulkCopy::escape_copy_text(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\0': break;
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

std::string BulkCopy::copy_sql(const std::string& target, const std::vector<std::string>& columns) {
    std::string sql = "COPY " + qualified_name(target) + " (";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i) sql += ", ";
        sql += quote_identifier(columns[i]);
    }
    sql += ") FROM STDIN";
    return sql;
}

void BulkCopy::append_row(const std::vector<std::string>& values, size_t ncols) {
    for (size_t i = 0; i < ncols; ++i) {
        if (i) buffer_ += '\t';
        if (i < values.size() && !values[i].empty()) {
            buffer_ += escape_copy_text(values[i]);
        } else {
            buffer_ += "\\N";
        }
    }
    buffer_ += '\n';
}

void BulkCopy::send_buffer() {
    if (buffer_.empty()) return;
    db_.copy_data(buffer_);
    buffer_.clear();
}

size_t BulkCopy::copy_table(const std::string& target, const TableData& table) {
    if (table.columns.empty()) {
        throw std::runtime_error("BulkCopy: table " + table.name + " has no columns");
    }

    buffer_.clear();
    db_.execute(copy_sql(target, table.column_names()));

    size_t sent = 0;
    try {
        for (const auto& row : table.rows) {
            if (row.size() > table.columns.size()) {
                throw std::runtime_error("BulkCopy: row " + std::to_string(sent + 1) + " of " + table.name +
                                         " has " + std::to_string(row.size()) + " cells for " +
                                         std::to_string(table.columns.size()) + " columns");
            }
            append_row(row, table.columns.size());
            ++sent;
            if (sent % flush_rows_ == 0 || buffer_.size() >= FLUSH_BYTES) send_buffer();
        }
        send_buffer();
    } catch (const std::exception& e) {
        buffer_.clear();
        try {
            db_.copy_end(e.what());
        } catch (const std::exception& abort_error) {
            Logger::warn(std::string("Aborting COPY failed: ") + abort_error.what());
        }
        throw;
    }

    db_.copy_end(nullptr);
    return sent;
}

} // namespace NewsCube
