#pragma once

/**
 * @file SQLiteStatement.hpp
 * @brief RAII wrapper for an SQLite prepared statement.
 *
 * This file provides the low-level, position-based interface to a compiled
 * statement: binding parameters, stepping through the execution state
 * machine, and reading typed column values. The underlying sqlite3_stmt is
 * finalized when the wrapper is destroyed.
 */

#include "SQLiteTraits.hpp"
#include "Value.hpp"
#include <sqlite3.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sqlstep {

class SQLiteCursor;

/**
 * @enum State
 * @brief Outcome of one step of a prepared statement.
 */
enum class State {
    Row,   ///< A result row is available for reading
    Done   ///< The statement has been entirely evaluated
};

/**
 * @class SQLiteStatement
 * @brief Exclusive owner of one compiled sqlite3_stmt handle.
 *
 * SQLiteStatement keeps a non-owning pointer to the connection that compiled
 * it, which is used to enrich errors with the engine's message. The
 * connection must outlive every statement prepared from it.
 *
 * Execution Model:
 * A freshly compiled or reset statement is unstarted. Each call to next()
 * runs the program until it produces a row (State::Row) or completes
 * (State::Done). Column types are only meaningful while a row is available;
 * before the first step and after completion every column reports Null.
 * Column names and count never change for the lifetime of the handle.
 *
 * Usage:
 * @code
 *   SQLiteStatement stmt = conn.prepare("SELECT id, name FROM users WHERE age > ?");
 *   stmt.bind(1, 40.0);
 *   while (stmt.next() == State::Row) {
 *       int64_t id = stmt.read<int64_t>(0);
 *       std::optional<std::string> name = stmt.read<std::optional<std::string>>("name");
 *       // Process row...
 *   }
 *   stmt.reset();  // bindings are kept
 * @endcode
 *
 * Thread Safety:
 * - Not thread-safe; a statement must be driven by one thread at a time.
 */
class SQLiteStatement {
public:
    /**
     * @brief Compile a single SQL statement.
     * @param db Connection handle (not owned).
     * @param sql SQL text; only the first statement is compiled.
     * @throws SQLiteException if the engine rejects the SQL.
     */
    SQLiteStatement(sqlite3* db, const std::string& sql);

    /**
     * @brief Destructor - finalizes the statement if still owned.
     */
    ~SQLiteStatement();

    // Non-copyable
    SQLiteStatement(const SQLiteStatement&) = delete;
    SQLiteStatement& operator=(const SQLiteStatement&) = delete;

    // Movable
    SQLiteStatement(SQLiteStatement&& other) noexcept;
    SQLiteStatement& operator=(SQLiteStatement&& other) noexcept;

    /**
     * @brief Get the underlying sqlite3_stmt handle.
     * @return Raw sqlite3_stmt* pointer (still owned by this object).
     */
    sqlite3_stmt* get() const { return m_stmt; }

    /**
     * @brief Get the connection handle the statement was compiled against.
     */
    sqlite3* database() const { return m_db; }

    /**
     * @brief Get the SQL text of the compiled statement.
     */
    std::string sql() const;

    // ----- Binding -----

    /**
     * @brief Bind a value to a parameter by position.
     * @param index 1-based parameter position.
     * @param value Any type with a Bindable specialization.
     * @return *this, for chaining.
     * @throws SQLiteException if index < 1 or the engine rejects the bind.
     *
     * Binding does not change the execution state; call reset() first if the
     * statement has already been stepped.
     */
    template<typename T>
    SQLiteStatement& bind(int index, const T& value) {
        Bindable<std::decay_t<T>>::bind(*this, index, value);
        return *this;
    }

    /**
     * @brief Bind a value to a named parameter (e.g. ":name", "@id", "$x").
     * @throws SQLiteException "the index is out of range (<name>)" if the
     *         statement has no such parameter.
     */
    template<typename T>
    SQLiteStatement& bind(const std::string& name, const T& value) {
        return bind(requireParameterIndex(name), value);
    }

    /**
     * @brief Bind values by position; values[i] goes to parameter i + 1.
     */
    SQLiteStatement& bind(const std::vector<Value>& values);

    /**
     * @brief Bind (position, value) pairs.
     */
    SQLiteStatement& bind(const std::vector<std::pair<int, Value>>& values);

    /**
     * @brief Bind (name, value) pairs; every name must exist in the statement.
     */
    SQLiteStatement& bind(const std::vector<std::pair<std::string, Value>>& values);

    /**
     * @brief Resolve a named parameter to its 1-based position.
     * @return Position, or std::nullopt if the statement has no such name.
     */
    std::optional<int> parameterIndex(const std::string& name) const;

    /**
     * @brief Get the number of parameters (largest parameter index).
     */
    int parameterCount() const;

    /**
     * @brief Set every parameter back to NULL.
     *
     * reset() keeps bindings; this is the only way to drop them.
     */
    void clearBindings();

    // ----- Execution -----

    /**
     * @brief Advance to the next state.
     * @return State::Row if a row is available, State::Done when complete.
     * @throws SQLiteException with the engine's code and message on failure.
     *
     * Once State::Done has been returned, further calls keep returning
     * State::Done until reset().
     */
    State next();

    /**
     * @brief Reset the statement for re-execution.
     *
     * Returns to the unstarted state. The compiled program, the column
     * metadata and the bound parameter values are retained.
     */
    void reset();

    /**
     * @brief Finalize the statement and release resources.
     *
     * After calling finalize(), the statement cannot be used.
     * This is called automatically by the destructor.
     */
    void finalize();

    // ----- Column metadata -----

    /**
     * @brief Get the number of columns in the result.
     */
    int columnCount() const;

    /**
     * @brief Get a column name by index.
     * @param index Zero-based column index.
     * @throws SQLiteException if the index is out of range.
     */
    std::string columnName(int index) const;

    /**
     * @brief Get all column names in order.
     */
    std::vector<std::string> columnNames() const;

    /**
     * @brief Find the position of a column by name.
     * @return Zero-based index of the first column with that name, or std::nullopt.
     */
    std::optional<int> columnIndex(const std::string& name) const;

    /**
     * @brief Get the type of a column in the current row.
     * @param index Zero-based column index.
     * @return Column type; Type::Null when no row is available.
     * @throws SQLiteException if the index is out of range.
     */
    Type columnType(int index) const;

    // ----- Reading -----

    /**
     * @brief Read a column of the current row.
     * @param index Zero-based column index.
     * @tparam T Blob, double, int64_t, std::string, Value, or std::optional of those.
     * @throws SQLiteException if the index is out of range or the column's
     *         type does not match T.
     */
    template<typename T>
    T read(int index) const {
        checkColumnIndex(index);
        return Readable<T>::read(*this, index);
    }

    /**
     * @brief Read a column of the current row by name.
     */
    template<typename T>
    T read(const std::string& name) const {
        return Readable<T>::read(*this, requireColumnIndex(name));
    }

    /**
     * @brief Read a column, returning std::nullopt instead of throwing.
     *
     * Only a missing column or a type mismatch yields std::nullopt; engine
     * failures (out of memory, a finalized statement) still throw.
     */
    template<typename T>
    std::optional<T> tryRead(int index) const {
        try {
            return read<T>(index);
        } catch (const SQLiteException& e) {
            if (!isReadFailure(e)) {
                throw;
            }
            return std::nullopt;
        }
    }

    template<typename T>
    std::optional<T> tryRead(const std::string& name) const {
        try {
            return read<T>(name);
        } catch (const SQLiteException& e) {
            if (!isReadFailure(e)) {
                throw;
            }
            return std::nullopt;
        }
    }

    /**
     * @brief Wrap this statement in a cursor that borrows it.
     *
     * The statement must outlive the returned cursor. Include
     * SQLiteCursor.hpp to use the result.
     */
    SQLiteCursor cursor();

    /**
     * @brief Throw unless index is a valid 1-based parameter position.
     */
    void checkParameterIndex(int index) const;

    /**
     * @brief Throw unless index is a valid 0-based column position.
     */
    void checkColumnIndex(int index) const;

private:
    int requireParameterIndex(const std::string& name) const;
    int requireColumnIndex(const std::string& name) const;

    // Range and conversion errors, as opposed to engine failures
    static bool isReadFailure(const SQLiteException& e) {
        return !e.errorCode() || *e.errorCode() == SQLITE_RANGE;
    }

    sqlite3* m_db = nullptr;          ///< Owning connection (not owned)
    sqlite3_stmt* m_stmt = nullptr;   ///< Compiled statement handle (owned)
    bool m_done = false;              ///< Set once State::Done is observed
};

}  // namespace sqlstep
