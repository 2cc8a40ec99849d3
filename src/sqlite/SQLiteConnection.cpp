/**
 * @file SQLiteConnection.cpp
 * @brief Implementation of RAII SQLite connection wrapper.
 *
 * Implements the SQLiteConnection class which provides a safe wrapper around
 * sqlite3 database handles with automatic resource management.
 */

#include "SQLiteConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace sqlstep {

// ============================================================================
// Open Flags
// ============================================================================

OpenFlags& OpenFlags::setCreate(bool create) {
    if (create) {
        m_bits |= SQLITE_OPEN_CREATE;
    } else {
        m_bits &= ~SQLITE_OPEN_CREATE;
    }
    return *this;
}

OpenFlags& OpenFlags::setReadOnly() {
    // Creation is not allowed together with read-only
    m_bits &= ~(SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    m_bits |= SQLITE_OPEN_READONLY;
    return *this;
}

OpenFlags& OpenFlags::setReadWrite() {
    m_bits &= ~SQLITE_OPEN_READONLY;
    m_bits |= SQLITE_OPEN_READWRITE;
    return *this;
}

OpenFlags& OpenFlags::setFullMutex() {
    m_bits &= ~SQLITE_OPEN_NOMUTEX;
    m_bits |= SQLITE_OPEN_FULLMUTEX;
    return *this;
}

OpenFlags& OpenFlags::setNoMutex() {
    m_bits &= ~SQLITE_OPEN_FULLMUTEX;
    m_bits |= SQLITE_OPEN_NOMUTEX;
    return *this;
}

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(const std::string& dbPath, const OpenFlags& flags) : m_path(dbPath) {
    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db, flags.bits(), nullptr);
    if (rc != SQLITE_OK) {
        // The message lives in the handle, so capture it before closing
        SQLiteException error = m_db ? SQLiteException(m_db, rc)
                                     : SQLiteException(rc, ErrorHandler::getErrorMessage(rc));
        spdlog::error("Failed to open SQLite database '{}': {}", dbPath, error.what());
        close();
        throw error;
    }
    spdlog::debug("Opened SQLite database '{}'", dbPath);
}

SQLiteConnection::~SQLiteConnection() {
    close();
}

void SQLiteConnection::close() {
    if (!m_db) {
        return;
    }
    // Statements may outlive the connection; they must not reach a freed handler
    if (m_busyHandler) {
        sqlite3_busy_handler(m_db, nullptr, nullptr);
    }
    // With statements still open the handle lingers until the last one is finalized
    int rc = sqlite3_close_v2(m_db);
    if (rc != SQLITE_OK) {
        spdlog::warn("Failed to close SQLite database '{}': {}", m_path, ErrorHandler::getErrorMessage(m_db, rc));
    }
    m_db = nullptr;
}

SQLiteConnection SQLiteConnection::open(const std::string& dbPath) {
    return SQLiteConnection(dbPath);
}

SQLiteConnection SQLiteConnection::open(const std::string& dbPath, const OpenFlags& flags) {
    return SQLiteConnection(dbPath, flags);
}

SQLiteConnection SQLiteConnection::openWithFullMutex(const std::string& dbPath) {
    return SQLiteConnection(dbPath, OpenFlags().setFullMutex());
}

SQLiteConnection SQLiteConnection::open(const ConnectionConfig& config) {
    OpenFlags flags;
    if (config.read_only) {
        flags.setReadOnly();
    } else {
        flags.setCreate(config.create);
    }
    if (config.threading == "full_mutex") {
        flags.setFullMutex();
    } else if (config.threading == "no_mutex") {
        flags.setNoMutex();
    }

    SQLiteConnection conn(config.path, flags);
    if (config.busy_timeout.count() > 0) {
        conn.setBusyTimeout(config.busy_timeout);
    }
    if (config.busy_retries > 0) {
        int retries = config.busy_retries;
        conn.setBusyHandler([retries](int attempts) { return attempts < retries; });
    }
    return conn;
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteConnection::SQLiteConnection(SQLiteConnection&& other) noexcept
    : m_db(other.m_db), m_path(std::move(other.m_path)), m_busyHandler(std::move(other.m_busyHandler)) {
    other.m_db = nullptr;
}

SQLiteConnection& SQLiteConnection::operator=(SQLiteConnection&& other) noexcept {
    if (this != &other) {
        close();
        m_db = other.m_db;
        m_path = std::move(other.m_path);
        m_busyHandler = std::move(other.m_busyHandler);
        other.m_db = nullptr;
    }
    return *this;
}

// ============================================================================
// Query Execution
// ============================================================================

void SQLiteConnection::execute(const std::string& sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string message = errMsg ? errMsg : ErrorHandler::getErrorMessage(m_db, rc);
        if (errMsg) sqlite3_free(errMsg);
        std::string context = ErrorContext::current();
        spdlog::error("{}SQLite exec failed: {}", context.empty() ? "" : context + ": ", message);
        throw SQLiteException(rc, message);
    }
}

namespace {

struct IterateState {
    const std::function<bool(const TextRow&)>* callback;
    TextRow row;
    bool stopped = false;
    std::exception_ptr failure;
};

int iterateTrampoline(void* data, int count, char** values, char** names) {
    auto* state = static_cast<IterateState*>(data);
    state->row.clear();
    state->row.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        std::optional<std::string> value;
        if (values[i]) {
            value = values[i];
        }
        state->row.emplace_back(names[i] ? names[i] : "", std::move(value));
    }
    // Exceptions must not unwind through the engine's C frames
    try {
        if (!(*state->callback)(state->row)) {
            state->stopped = true;
            return 1;
        }
    } catch (...) {
        state->failure = std::current_exception();
        return 1;
    }
    return 0;
}

int busyTrampoline(void* data, int attempts) {
    auto* handler = static_cast<std::function<bool(int)>*>(data);
    try {
        bool retry = (*handler)(attempts);
        if (retry) {
            spdlog::warn("Database is busy, retry {}", attempts + 1);
        }
        return retry ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::error("Busy handler failed: {}", e.what());
        return 0;
    }
}

}  // namespace

void SQLiteConnection::iterate(const std::string& sql, const std::function<bool(const TextRow&)>& callback) {
    IterateState state{&callback, {}, false, nullptr};
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), iterateTrampoline, &state, &errMsg);
    std::string message = errMsg ? errMsg : "";
    if (errMsg) sqlite3_free(errMsg);

    if (state.failure) {
        std::rethrow_exception(state.failure);
    }
    if (rc == SQLITE_ABORT && state.stopped) {
        return;
    }
    if (rc != SQLITE_OK) {
        if (message.empty()) {
            message = ErrorHandler::getErrorMessage(m_db, rc);
        }
        spdlog::error("SQLite exec failed: {}", message);
        throw SQLiteException(rc, message);
    }
}

SQLiteStatement SQLiteConnection::prepare(const std::string& sql) const {
    return SQLiteStatement(m_db, sql);
}

// ============================================================================
// Busy Handling
// ============================================================================

void SQLiteConnection::setBusyTimeout(std::chrono::milliseconds timeout) {
    int rc = sqlite3_busy_timeout(m_db, static_cast<int>(timeout.count()));
    if (rc != SQLITE_OK) {
        throw SQLiteException(m_db, rc);
    }
    // The engine replaced any custom handler
    m_busyHandler.reset();
}

void SQLiteConnection::setBusyHandler(std::function<bool(int)> handler) {
    auto stored = std::make_unique<std::function<bool(int)>>(std::move(handler));
    int rc = sqlite3_busy_handler(m_db, busyTrampoline, stored.get());
    if (rc != SQLITE_OK) {
        throw SQLiteException(m_db, rc);
    }
    m_busyHandler = std::move(stored);
}

void SQLiteConnection::removeBusyHandler() {
    int rc = sqlite3_busy_handler(m_db, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        throw SQLiteException(m_db, rc);
    }
    m_busyHandler.reset();
}

// ============================================================================
// Error and Status Information
// ============================================================================

std::string SQLiteConnection::error() const {
    return m_db ? sqlite3_errmsg(m_db) : "no connection";
}

int SQLiteConnection::errorCode() const {
    return m_db ? sqlite3_errcode(m_db) : SQLITE_ERROR;
}

int64_t SQLiteConnection::lastInsertRowId() const {
    return m_db ? sqlite3_last_insert_rowid(m_db) : 0;
}

int64_t SQLiteConnection::changeCount() const {
    return m_db ? sqlite3_changes(m_db) : 0;
}

int64_t SQLiteConnection::totalChangeCount() const {
    return m_db ? sqlite3_total_changes(m_db) : 0;
}

// ============================================================================
// Engine Version
// ============================================================================

int engineVersion() {
    return sqlite3_libversion_number();
}

std::string engineVersionString() {
    return sqlite3_libversion();
}

}  // namespace sqlstep
