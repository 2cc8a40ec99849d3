#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief RAII wrapper for an SQLite database connection.
 *
 * This class provides a safe wrapper for SQLite database connections,
 * handling automatic cleanup when the connection goes out of scope.
 * It is the boundary through which statements are compiled; the typed
 * binding and reading layer lives in SQLiteStatement and SQLiteCursor.
 */

#include "Config.hpp"
#include "SQLiteStatement.hpp"
#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sqlstep {

/**
 * @class OpenFlags
 * @brief Builder for the flags passed to sqlite3_open_v2.
 *
 * Defaults to read-write with creation, leaving the threading mode to the
 * library's compile-time default.
 */
class OpenFlags {
public:
    OpenFlags() = default;

    OpenFlags& setCreate(bool create = true);
    OpenFlags& setReadOnly();
    OpenFlags& setReadWrite();
    OpenFlags& setFullMutex();
    OpenFlags& setNoMutex();

    int bits() const { return m_bits; }

private:
    int m_bits = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
};

/// One row passed to SQLiteConnection::iterate(): (column name, text or NULL).
using TextRow = std::vector<std::pair<std::string, std::optional<std::string>>>;

/**
 * @class SQLiteConnection
 * @brief RAII wrapper for an SQLite database file connection.
 *
 * SQLiteConnection manages a connection to an SQLite database file or an
 * in-memory database. The connection is closed when the object is destroyed;
 * every statement prepared from it must be destroyed first.
 *
 * Usage:
 * @code
 *   SQLiteConnection conn = SQLiteConnection::open("/path/to/database.db");
 *   conn.execute("CREATE TABLE IF NOT EXISTS test (id INTEGER)");
 *   SQLiteStatement stmt = conn.prepare("INSERT INTO test VALUES (?)");
 *   stmt.bind(1, 42);
 *   stmt.next();
 * @endcode
 *
 * Thread Safety:
 * - A connection opened with setFullMutex() (serialized mode) may be shared
 *   between threads; otherwise each thread needs its own connection.
 */
class SQLiteConnection {
public:
    /**
     * @brief Open a connection to an SQLite database file.
     * @param dbPath Path to the database file, or ":memory:".
     * @param flags Open mode; read-write with creation by default.
     * @throws SQLiteException if the database cannot be opened.
     */
    explicit SQLiteConnection(const std::string& dbPath, const OpenFlags& flags = OpenFlags());

    /**
     * @brief Destructor - closes the database connection.
     */
    ~SQLiteConnection();

    // Non-copyable
    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    // Movable
    SQLiteConnection(SQLiteConnection&& other) noexcept;
    SQLiteConnection& operator=(SQLiteConnection&& other) noexcept;

    static SQLiteConnection open(const std::string& dbPath);
    static SQLiteConnection open(const std::string& dbPath, const OpenFlags& flags);

    /**
     * @brief Open in serialized mode so the connection can be shared by threads.
     */
    static SQLiteConnection openWithFullMutex(const std::string& dbPath);

    /**
     * @brief Open according to a configuration section.
     *
     * Applies the path, open flags, busy timeout and, when busy_retries is
     * positive, a busy handler that retries that many times.
     */
    static SQLiteConnection open(const ConnectionConfig& config);

    /**
     * @brief Get the underlying sqlite3 handle.
     * @return Raw sqlite3* pointer (still owned by this object).
     */
    sqlite3* get() const { return m_db; }

    const std::string& path() const { return m_path; }

    /**
     * @brief Execute one or more SQL statements without returning results.
     * @throws SQLiteException with the engine message on failure.
     */
    void execute(const std::string& sql);

    /**
     * @brief Execute SQL and pass each result row as text to a callback.
     *
     * Returning false from the callback stops the iteration without error.
     * An exception thrown by the callback aborts the statement and is
     * rethrown to the caller.
     */
    void iterate(const std::string& sql, const std::function<bool(const TextRow&)>& callback);

    /**
     * @brief Compile a single SQL statement.
     * @throws SQLiteException if the SQL cannot be compiled.
     */
    SQLiteStatement prepare(const std::string& sql) const;

    /**
     * @brief Rows inserted, updated or deleted by the most recent statement.
     */
    int64_t changeCount() const;

    /**
     * @brief Rows changed by all statements since the connection was opened.
     */
    int64_t totalChangeCount() const;

    /**
     * @brief Get the rowid of the last inserted row.
     * @return Last insert rowid, or 0 if no inserts performed.
     */
    int64_t lastInsertRowId() const;

    /**
     * @brief Sleep-and-retry on locked tables for up to the given time.
     *
     * Replaces any busy handler installed with setBusyHandler().
     */
    void setBusyTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief Install a busy handler.
     * @param handler Receives the number of prior invocations for the same
     *        lock event; returns true to retry or false to give up with
     *        SQLITE_BUSY.
     */
    void setBusyHandler(std::function<bool(int)> handler);
    void removeBusyHandler();

    /**
     * @brief Get the last SQLite error message.
     */
    std::string error() const;

    /**
     * @brief Get the last SQLite error code.
     */
    int errorCode() const;

private:
    void close();

    sqlite3* m_db = nullptr;  ///< SQLite database handle
    std::string m_path;       ///< Path to database file
    std::unique_ptr<std::function<bool(int)>> m_busyHandler;  ///< Stable address for the C callback
};

/**
 * @brief Version of the linked SQLite library as a number (e.g. 3045001).
 */
int engineVersion();

/**
 * @brief Version of the linked SQLite library as text (e.g. "3.45.1").
 */
std::string engineVersionString();

}  // namespace sqlstep
