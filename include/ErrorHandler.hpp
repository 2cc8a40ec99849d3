#pragma once

#include <sqlite3.h>
#include <algorithm>
#include <string>
#include <optional>
#include <stdexcept>
#include <thread>
#include <chrono>
#include <cerrno>

namespace sqlstep {

// SQLite result codes to messages, errno values and retry decisions
class ErrorHandler {
public:
    // Convert an SQLite result code (primary or extended) to errno
    static int toErrno(int resultCode);

    // Check if the operation may succeed when repeated (BUSY, LOCKED)
    static bool isRetryable(int resultCode);

    // Check if the error is a constraint violation (UNIQUE, NOT NULL, ...)
    static bool isConstraintViolation(int resultCode);

    // Symbolic name of the primary result code, e.g. "SQLITE_BUSY"
    static std::string resultCodeName(int resultCode);

    // Get human-readable error message
    static std::string getErrorMessage(int resultCode);
    static std::string getErrorMessage(sqlite3* db, int resultCode);

    // Execute with retry logic; the operation returns an SQLite result code
    template<typename Func>
    static int executeWithRetry(Func&& operation, int maxRetries = 3,
                                std::chrono::milliseconds baseDelay = std::chrono::milliseconds(50)) {
        int retries = 0;
        int result = SQLITE_OK;

        while (retries < maxRetries) {
            result = operation();
            if (result == SQLITE_OK || result == SQLITE_ROW || result == SQLITE_DONE) {
                return result;
            }

            if (!isRetryable(result)) {
                return result;
            }

            retries++;
            if (retries < maxRetries) {
                // Exponential backoff: base, 2*base, 4*base... capped at 1024*base
                int shift = std::min(retries - 1, MAX_BACKOFF_SHIFT);
                std::this_thread::sleep_for(baseDelay * (1 << shift));
            }
        }

        return result;
    }

    static constexpr int MAX_BACKOFF_SHIFT = 10;

    // Message used when neither the engine nor the code can describe a failure
    static constexpr const char* GENERIC_MESSAGE = "an SQL engine error";
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

// Exception for engine, conversion and contract errors
class SQLiteException : public std::runtime_error {
public:
    // An error without an engine code (conversion failures)
    explicit SQLiteException(const std::string& message);
    SQLiteException(int errorCode, const std::string& message);

    // Enrich a non-OK status with the connection's last error message
    SQLiteException(sqlite3* db, int errorCode);

    // Contract violation: bad parameter/column index or unknown name
    static SQLiteException outOfRange(const std::string& detail);

    std::optional<int> errorCode() const { return m_errorCode; }
    int posixError() const { return m_errorCode ? ErrorHandler::toErrno(*m_errorCode) : EIO; }

private:
    std::optional<int> m_errorCode;
};

}  // namespace sqlstep
