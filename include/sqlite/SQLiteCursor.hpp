#pragma once

/**
 * @file SQLiteCursor.hpp
 * @brief Row-buffering iterator over an SQLite prepared statement.
 *
 * The cursor drives a statement's step/read protocol internally and hands
 * out whole rows, so callers never sequence next() and per-column reads
 * themselves.
 */

#include "SQLiteRow.hpp"
#include "SQLiteStatement.hpp"
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sqlstep {

/**
 * @class SQLiteCursor
 * @brief Forward-only sequence of rows produced by one statement.
 *
 * A cursor either borrows a statement (the statement must outlive the
 * cursor and can be reused afterwards) or takes ownership of it (the
 * statement is finalized with the cursor). Both modes share the same
 * iteration logic.
 *
 * Iteration Contract:
 * - tryNext() steps the statement once; on a row it refills a value buffer
 *   sized to the column count and returns it, on completion it returns
 *   nullptr.
 * - After completion every further call returns nullptr until bind() or
 *   reset() restarts the sequence.
 * - next() and the range-for iterator return independent SQLiteRow
 *   snapshots that share one column-name index.
 * - Stepping errors propagate as SQLiteException.
 *
 * Usage:
 * @code
 *   SQLiteCursor cursor(conn.prepare("SELECT id, name FROM users WHERE age > ?"));
 *   for (const SQLiteRow& row : cursor.bind({Value(40.0)})) {
 *       int64_t id = row.read<int64_t>("id");
 *       // Process row...
 *   }
 * @endcode
 *
 * Thread Safety:
 * - Not thread-safe; each thread should have its own cursor.
 */
class SQLiteCursor {
public:
    /**
     * @brief Iterate a statement owned by the caller.
     */
    explicit SQLiteCursor(SQLiteStatement& statement);

    /**
     * @brief Iterate a statement and take ownership of it.
     */
    explicit SQLiteCursor(SQLiteStatement&& statement);

    // Non-copyable
    SQLiteCursor(const SQLiteCursor&) = delete;
    SQLiteCursor& operator=(const SQLiteCursor&) = delete;

    // Movable
    SQLiteCursor(SQLiteCursor&&) noexcept = default;
    SQLiteCursor& operator=(SQLiteCursor&&) noexcept = default;

    /**
     * @brief Reset the statement and bind values by position.
     * @return *this, so binding can be chained into iteration.
     */
    SQLiteCursor& bind(const std::vector<Value>& values);

    /**
     * @brief Reset the statement and bind (name, value) pairs.
     * @throws SQLiteException if a name is not a parameter of the statement.
     */
    SQLiteCursor& bind(const std::vector<std::pair<std::string, Value>>& values);

    /**
     * @brief Reset the statement and bind a single parameter.
     */
    template<typename T>
    SQLiteCursor& bind(int index, const T& value) {
        reset();
        m_statement->bind(index, value);
        return *this;
    }

    template<typename T>
    SQLiteCursor& bind(const std::string& name, const T& value) {
        reset();
        m_statement->bind(name, value);
        return *this;
    }

    /**
     * @brief Restart the sequence; bindings are kept.
     */
    SQLiteCursor& reset();

    int columnCount() const { return m_statement->columnCount(); }
    std::vector<std::string> columnNames() const { return m_statement->columnNames(); }

    /**
     * @brief Advance to the next row and read all columns.
     * @return The row's values (valid until the next call), or nullptr when done.
     */
    const std::vector<Value>* tryNext();

    /**
     * @brief Advance to the next row and return it as a snapshot.
     * @return The row, or std::nullopt when done.
     */
    std::optional<SQLiteRow> next();

    /**
     * @brief Get the wrapped statement.
     */
    SQLiteStatement& statement() { return *m_statement; }

    /**
     * @brief Get the shared column-name index, building it on first use.
     */
    std::shared_ptr<const ColumnMap> columns();

    /**
     * @class iterator
     * @brief Single-pass input iterator yielding SQLiteRow snapshots.
     */
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = SQLiteRow;
        using difference_type = std::ptrdiff_t;
        using pointer = const SQLiteRow*;
        using reference = const SQLiteRow&;

        iterator() = default;
        explicit iterator(SQLiteCursor* cursor);

        reference operator*() const { return *m_row; }
        pointer operator->() const { return &*m_row; }
        iterator& operator++();

        friend bool operator==(const iterator& lhs, const iterator& rhs) {
            return !lhs.m_row.has_value() && !rhs.m_row.has_value();
        }
        friend bool operator!=(const iterator& lhs, const iterator& rhs) { return !(lhs == rhs); }

    private:
        SQLiteCursor* m_cursor = nullptr;
        std::optional<SQLiteRow> m_row;
    };

    /**
     * @brief Fetch the first remaining row; does not restart the sequence.
     */
    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    std::unique_ptr<SQLiteStatement> m_owned;      ///< Set when the cursor owns the statement
    SQLiteStatement* m_statement = nullptr;        ///< Statement being iterated
    std::optional<State> m_state;                  ///< Last observed state, empty when unstarted
    std::vector<Value> m_values;                   ///< Scratch buffer for the current row
    std::shared_ptr<const ColumnMap> m_columns;    ///< Built once from the column names
};

}  // namespace sqlstep
