/**
 * @file SQLiteStatement.cpp
 * @brief Implementation of the RAII SQLite prepared statement wrapper.
 *
 * Implements compilation, parameter binding, the step state machine and
 * column access, together with the primitive bind/read calls behind the
 * Bindable and Readable traits.
 */

#include "SQLiteStatement.hpp"
#include "SQLiteCursor.hpp"
#include <spdlog/spdlog.h>

namespace sqlstep {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteStatement::SQLiteStatement(sqlite3* db, const std::string& sql) : m_db(db) {
    if (!m_db) {
        throw SQLiteException(SQLITE_MISUSE, "no connection");
    }
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), static_cast<int>(sql.size()), &m_stmt, nullptr);
    if (rc != SQLITE_OK) {
        SQLiteException error(m_db, rc);
        std::string context = ErrorContext::current();
        spdlog::error("{}SQLite prepare failed: {}", context.empty() ? "" : context + ": ",
                      error.what());
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
        throw error;
    }
    if (!m_stmt) {
        // Empty SQL text or a comment compiles to no program
        throw SQLiteException(SQLITE_MISUSE, "no statement to prepare");
    }
    spdlog::debug("Prepared statement: {}", sql);
}

SQLiteStatement::~SQLiteStatement() {
    finalize();
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteStatement::SQLiteStatement(SQLiteStatement&& other) noexcept
    : m_db(other.m_db), m_stmt(other.m_stmt), m_done(other.m_done) {
    other.m_stmt = nullptr;
}

SQLiteStatement& SQLiteStatement::operator=(SQLiteStatement&& other) noexcept {
    if (this != &other) {
        finalize();
        m_db = other.m_db;
        m_stmt = other.m_stmt;
        m_done = other.m_done;
        other.m_stmt = nullptr;
    }
    return *this;
}

std::string SQLiteStatement::sql() const {
    if (!m_stmt) return "";
    const char* text = sqlite3_sql(m_stmt);
    return text ? text : "";
}

// ============================================================================
// Binding
// ============================================================================

SQLiteStatement& SQLiteStatement::bind(const std::vector<Value>& values) {
    for (size_t i = 0; i < values.size(); ++i) {
        bind(static_cast<int>(i + 1), values[i]);
    }
    return *this;
}

SQLiteStatement& SQLiteStatement::bind(const std::vector<std::pair<int, Value>>& values) {
    for (const auto& [index, value] : values) {
        bind(index, value);
    }
    return *this;
}

SQLiteStatement& SQLiteStatement::bind(const std::vector<std::pair<std::string, Value>>& values) {
    for (const auto& [name, value] : values) {
        bind(requireParameterIndex(name), value);
    }
    return *this;
}

std::optional<int> SQLiteStatement::parameterIndex(const std::string& name) const {
    if (!m_stmt) return std::nullopt;
    int index = sqlite3_bind_parameter_index(m_stmt, name.c_str());
    if (index == 0) {
        return std::nullopt;
    }
    return index;
}

int SQLiteStatement::parameterCount() const {
    return m_stmt ? sqlite3_bind_parameter_count(m_stmt) : 0;
}

void SQLiteStatement::clearBindings() {
    if (m_stmt) {
        sqlite3_clear_bindings(m_stmt);
    }
}

int SQLiteStatement::requireParameterIndex(const std::string& name) const {
    std::optional<int> index = parameterIndex(name);
    if (!index) {
        throw SQLiteException::outOfRange(name);
    }
    return *index;
}

void SQLiteStatement::checkParameterIndex(int index) const {
    if (!m_stmt) {
        throw SQLiteException(SQLITE_MISUSE, "the statement has been finalized");
    }
    if (index < 1) {
        throw SQLiteException::outOfRange(std::to_string(index));
    }
}

// ============================================================================
// Execution
// ============================================================================

State SQLiteStatement::next() {
    if (!m_stmt) {
        throw SQLiteException(SQLITE_MISUSE, "the statement has been finalized");
    }
    // Stepping a completed statement would silently restart it
    if (m_done) {
        return State::Done;
    }
    int rc = sqlite3_step(m_stmt);
    switch (rc) {
        case SQLITE_ROW:
            return State::Row;
        case SQLITE_DONE:
            m_done = true;
            return State::Done;
        default:
            if (ErrorHandler::isRetryable(rc)) {
                spdlog::warn("SQLite step reported {}: {}", ErrorHandler::resultCodeName(rc),
                             ErrorHandler::getErrorMessage(m_db, rc));
            }
            throw SQLiteException(m_db, rc);
    }
}

void SQLiteStatement::reset() {
    if (!m_stmt) return;
    m_done = false;
    // The return value repeats the last step error, which was already reported
    sqlite3_reset(m_stmt);
}

void SQLiteStatement::finalize() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
    }
}

// ============================================================================
// Column Metadata
// ============================================================================

int SQLiteStatement::columnCount() const {
    return m_stmt ? sqlite3_column_count(m_stmt) : 0;
}

std::string SQLiteStatement::columnName(int index) const {
    checkColumnIndex(index);
    const char* name = sqlite3_column_name(m_stmt, index);
    if (!name) {
        throw SQLiteException(SQLITE_NOMEM, "failed to read the name of column " + std::to_string(index));
    }
    return name;
}

std::vector<std::string> SQLiteStatement::columnNames() const {
    std::vector<std::string> names;
    int count = columnCount();
    names.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        names.push_back(columnName(i));
    }
    return names;
}

std::optional<int> SQLiteStatement::columnIndex(const std::string& name) const {
    int count = columnCount();
    for (int i = 0; i < count; ++i) {
        const char* column = sqlite3_column_name(m_stmt, i);
        if (column && name == column) {
            return i;
        }
    }
    return std::nullopt;
}

int SQLiteStatement::requireColumnIndex(const std::string& name) const {
    if (!m_stmt) {
        throw SQLiteException(SQLITE_MISUSE, "the statement has been finalized");
    }
    std::optional<int> index = columnIndex(name);
    if (!index) {
        throw SQLiteException::outOfRange(name);
    }
    return *index;
}

void SQLiteStatement::checkColumnIndex(int index) const {
    if (!m_stmt) {
        throw SQLiteException(SQLITE_MISUSE, "the statement has been finalized");
    }
    if (index < 0 || index >= columnCount()) {
        throw SQLiteException::outOfRange(std::to_string(index));
    }
}

Type SQLiteStatement::columnType(int index) const {
    checkColumnIndex(index);
    switch (sqlite3_column_type(m_stmt, index)) {
        case SQLITE_BLOB: return Type::Binary;
        case SQLITE_FLOAT: return Type::Float;
        case SQLITE_INTEGER: return Type::Integer;
        case SQLITE_TEXT: return Type::String;
        default: return Type::Null;
    }
}

SQLiteCursor SQLiteStatement::cursor() {
    return SQLiteCursor(*this);
}

// ============================================================================
// Primitive Bind and Read Calls
// ============================================================================

namespace detail {

namespace {

void checkBind(SQLiteStatement& statement, int rc) {
    if (rc != SQLITE_OK) {
        throw SQLiteException(statement.database(), rc);
    }
}

[[noreturn]] void throwUnreadable(int index, Type actual) {
    throw SQLiteException("column " + std::to_string(index) + " could not be read as it holds " +
                          typeName(actual));
}

}  // namespace

void bindBlob(SQLiteStatement& statement, int index, const uint8_t* data, size_t size) {
    statement.checkParameterIndex(index);
    if (size == 0) {
        // A null data pointer would bind NULL instead of an empty blob
        checkBind(statement, sqlite3_bind_zeroblob(statement.get(), index, 0));
        return;
    }
    // SQLITE_TRANSIENT: the engine takes its own copy before returning
    checkBind(statement, sqlite3_bind_blob64(statement.get(), index, data,
                                             static_cast<sqlite3_uint64>(size), SQLITE_TRANSIENT));
}

void bindDouble(SQLiteStatement& statement, int index, double value) {
    statement.checkParameterIndex(index);
    checkBind(statement, sqlite3_bind_double(statement.get(), index, value));
}

void bindInt64(SQLiteStatement& statement, int index, int64_t value) {
    statement.checkParameterIndex(index);
    checkBind(statement, sqlite3_bind_int64(statement.get(), index, static_cast<sqlite3_int64>(value)));
}

void bindText(SQLiteStatement& statement, int index, std::string_view value) {
    statement.checkParameterIndex(index);
    const char* data = value.data() ? value.data() : "";
    checkBind(statement, sqlite3_bind_text64(statement.get(), index, data,
                                             static_cast<sqlite3_uint64>(value.size()),
                                             SQLITE_TRANSIENT, SQLITE_UTF8));
}

void bindNull(SQLiteStatement& statement, int index) {
    statement.checkParameterIndex(index);
    checkBind(statement, sqlite3_bind_null(statement.get(), index));
}

Blob readBlob(const SQLiteStatement& statement, int index) {
    Type actual = statement.columnType(index);
    if (actual != Type::Binary) {
        throwUnreadable(index, actual);
    }
    const void* data = sqlite3_column_blob(statement.get(), index);
    // Length must be fetched after the pointer
    int size = sqlite3_column_bytes(statement.get(), index);
    if (!data || size <= 0) {
        return Blob();
    }
    const auto* bytes = static_cast<const uint8_t*>(data);
    return Blob(bytes, bytes + size);
}

double readDouble(const SQLiteStatement& statement, int index) {
    Type actual = statement.columnType(index);
    if (actual != Type::Float) {
        throwUnreadable(index, actual);
    }
    return sqlite3_column_double(statement.get(), index);
}

int64_t readInt64(const SQLiteStatement& statement, int index) {
    Type actual = statement.columnType(index);
    if (actual != Type::Integer) {
        throwUnreadable(index, actual);
    }
    return static_cast<int64_t>(sqlite3_column_int64(statement.get(), index));
}

std::string readText(const SQLiteStatement& statement, int index) {
    Type actual = statement.columnType(index);
    if (actual != Type::String) {
        throwUnreadable(index, actual);
    }
    const unsigned char* text = sqlite3_column_text(statement.get(), index);
    int size = sqlite3_column_bytes(statement.get(), index);
    if (!text) {
        // A TEXT column only yields no pointer when the engine is out of memory
        throw SQLiteException(SQLITE_NOMEM, "column " + std::to_string(index) + " could not be read");
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

Value readValue(const SQLiteStatement& statement, int index) {
    switch (statement.columnType(index)) {
        case Type::Binary: return Value(readBlob(statement, index));
        case Type::Float: return Value(readDouble(statement, index));
        case Type::Integer: return Value(readInt64(statement, index));
        case Type::String: return Value(readText(statement, index));
        case Type::Null: break;
    }
    return Value();
}

bool isNullColumn(const SQLiteStatement& statement, int index) {
    return statement.columnType(index) == Type::Null;
}

}  // namespace detail

}  // namespace sqlstep
