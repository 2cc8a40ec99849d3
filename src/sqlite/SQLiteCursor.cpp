/**
 * @file SQLiteCursor.cpp
 * @brief Implementation of the row-buffering cursor.
 */

#include "SQLiteCursor.hpp"
#include <spdlog/spdlog.h>

namespace sqlstep {

// ============================================================================
// Construction
// ============================================================================

SQLiteCursor::SQLiteCursor(SQLiteStatement& statement) : m_statement(&statement) {}

SQLiteCursor::SQLiteCursor(SQLiteStatement&& statement)
    : m_owned(std::make_unique<SQLiteStatement>(std::move(statement)))
    , m_statement(m_owned.get()) {}

// ============================================================================
// Binding
// ============================================================================

SQLiteCursor& SQLiteCursor::bind(const std::vector<Value>& values) {
    reset();
    m_statement->bind(values);
    return *this;
}

SQLiteCursor& SQLiteCursor::bind(const std::vector<std::pair<std::string, Value>>& values) {
    reset();
    m_statement->bind(values);
    return *this;
}

SQLiteCursor& SQLiteCursor::reset() {
    m_state.reset();
    m_statement->reset();
    spdlog::debug("Cursor reset: {}", m_statement->sql());
    return *this;
}

// ============================================================================
// Row Iteration
// ============================================================================

const std::vector<Value>* SQLiteCursor::tryNext() {
    if (m_state == State::Done) {
        return nullptr;
    }
    m_state = m_statement->next();
    if (m_state == State::Done) {
        return nullptr;
    }

    // Column count is fixed for the statement, so the buffer is reused as is
    size_t count = static_cast<size_t>(m_statement->columnCount());
    m_values.resize(count);
    for (size_t i = 0; i < count; ++i) {
        m_values[i] = m_statement->read<Value>(static_cast<int>(i));
    }
    return &m_values;
}

std::optional<SQLiteRow> SQLiteCursor::next() {
    std::shared_ptr<const ColumnMap> names = columns();
    const std::vector<Value>* values = tryNext();
    if (!values) {
        return std::nullopt;
    }
    return SQLiteRow(*values, std::move(names));
}

std::shared_ptr<const ColumnMap> SQLiteCursor::columns() {
    if (!m_columns) {
        m_columns = makeColumnMap(m_statement->columnNames());
    }
    return m_columns;
}

// ============================================================================
// Iterator
// ============================================================================

SQLiteCursor::iterator::iterator(SQLiteCursor* cursor) : m_cursor(cursor) {
    m_row = m_cursor->next();
}

SQLiteCursor::iterator& SQLiteCursor::iterator::operator++() {
    m_row = m_cursor->next();
    return *this;
}

}  // namespace sqlstep
