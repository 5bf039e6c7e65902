/**
 * @file database_connection.cpp
 * @brief Transaction guard
 */

#include <database/database_connection.hpp>
#include <utils/logger.hpp>
#include <stdexcept>

namespace NewsCube {

Transaction::Transaction(DatabaseConnection& db) : db_(db) {
    db_.execute("BEGIN");
}

Transaction::~Transaction() {
    if (committed_) return;
    try {
        db_.execute("ROLLBACK");
    } catch (const std::exception& e) {
        Logger::warn(std::string("Rollback failed: ") + e.what());
    }
}

void Transaction::commit() {
    db_.execute("COMMIT");
    committed_ = true;
}

} // namespace NewsCube
