#include "ErrorHandler.hpp"
#include <cerrno>

namespace sqlstep {

thread_local std::string ErrorContext::s_currentContext;

int ErrorHandler::toErrno(int resultCode) {
    switch (resultCode & 0xff) {
        // Success
        case SQLITE_OK:
        case SQLITE_ROW:
        case SQLITE_DONE:
            return 0;

        // Lock/busy errors
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return EBUSY;

        // Permission errors
        case SQLITE_PERM:
        case SQLITE_AUTH:
            return EACCES;

        // Read-only errors
        case SQLITE_READONLY:
            return EROFS;

        // Disk/space errors
        case SQLITE_FULL:
            return ENOSPC;

        // Not found errors
        case SQLITE_CANTOPEN:
        case SQLITE_NOTFOUND:
            return ENOENT;

        // Invalid input errors
        case SQLITE_CONSTRAINT:
        case SQLITE_MISMATCH:
        case SQLITE_RANGE:
        case SQLITE_TOOBIG:
        case SQLITE_MISUSE:
            return EINVAL;

        case SQLITE_NOMEM:
            return ENOMEM;

        case SQLITE_INTERRUPT:
        case SQLITE_ABORT:
            return EINTR;

        case SQLITE_NOLFS:
            return EFBIG;

        // Default to I/O error (IOERR, CORRUPT, NOTADB, PROTOCOL, ...)
        default:
            return EIO;
    }
}

bool ErrorHandler::isRetryable(int resultCode) {
    switch (resultCode & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return true;
        default:
            return false;
    }
}

bool ErrorHandler::isConstraintViolation(int resultCode) {
    return (resultCode & 0xff) == SQLITE_CONSTRAINT;
}

std::string ErrorHandler::resultCodeName(int resultCode) {
    switch (resultCode & 0xff) {
        case SQLITE_OK: return "SQLITE_OK";
        case SQLITE_ERROR: return "SQLITE_ERROR";
        case SQLITE_INTERNAL: return "SQLITE_INTERNAL";
        case SQLITE_PERM: return "SQLITE_PERM";
        case SQLITE_ABORT: return "SQLITE_ABORT";
        case SQLITE_BUSY: return "SQLITE_BUSY";
        case SQLITE_LOCKED: return "SQLITE_LOCKED";
        case SQLITE_NOMEM: return "SQLITE_NOMEM";
        case SQLITE_READONLY: return "SQLITE_READONLY";
        case SQLITE_INTERRUPT: return "SQLITE_INTERRUPT";
        case SQLITE_IOERR: return "SQLITE_IOERR";
        case SQLITE_CORRUPT: return "SQLITE_CORRUPT";
        case SQLITE_NOTFOUND: return "SQLITE_NOTFOUND";
        case SQLITE_FULL: return "SQLITE_FULL";
        case SQLITE_CANTOPEN: return "SQLITE_CANTOPEN";
        case SQLITE_PROTOCOL: return "SQLITE_PROTOCOL";
        case SQLITE_EMPTY: return "SQLITE_EMPTY";
        case SQLITE_SCHEMA: return "SQLITE_SCHEMA";
        case SQLITE_TOOBIG: return "SQLITE_TOOBIG";
        case SQLITE_CONSTRAINT: return "SQLITE_CONSTRAINT";
        case SQLITE_MISMATCH: return "SQLITE_MISMATCH";
        case SQLITE_MISUSE: return "SQLITE_MISUSE";
        case SQLITE_NOLFS: return "SQLITE_NOLFS";
        case SQLITE_AUTH: return "SQLITE_AUTH";
        case SQLITE_FORMAT: return "SQLITE_FORMAT";
        case SQLITE_RANGE: return "SQLITE_RANGE";
        case SQLITE_NOTADB: return "SQLITE_NOTADB";
        case SQLITE_NOTICE: return "SQLITE_NOTICE";
        case SQLITE_WARNING: return "SQLITE_WARNING";
        case SQLITE_ROW: return "SQLITE_ROW";
        case SQLITE_DONE: return "SQLITE_DONE";
        default: return "SQLITE_UNKNOWN";
    }
}

std::string ErrorHandler::getErrorMessage(int resultCode) {
    const char* text = sqlite3_errstr(resultCode);
    if (text && *text) {
        return std::string(text);
    }
    return GENERIC_MESSAGE;
}

std::string ErrorHandler::getErrorMessage(sqlite3* db, int resultCode) {
    // The connection only describes the failure while its error code is set
    if (db && sqlite3_errcode(db) != SQLITE_OK) {
        const char* err = sqlite3_errmsg(db);
        if (err && *err) {
            return std::string(err);
        }
    }
    if (resultCode != SQLITE_OK) {
        return getErrorMessage(resultCode);
    }
    return GENERIC_MESSAGE;
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

SQLiteException::SQLiteException(const std::string& message)
    : std::runtime_error(message.empty() ? ErrorHandler::GENERIC_MESSAGE : message) {
}

SQLiteException::SQLiteException(int errorCode, const std::string& message)
    : std::runtime_error(message.empty() ? ErrorHandler::getErrorMessage(errorCode) : message)
    , m_errorCode(errorCode) {
}

SQLiteException::SQLiteException(sqlite3* db, int errorCode)
    : std::runtime_error(ErrorHandler::getErrorMessage(db, errorCode))
    , m_errorCode(errorCode) {
}

SQLiteException SQLiteException::outOfRange(const std::string& detail) {
    return SQLiteException(SQLITE_RANGE, "the index is out of range (" + detail + ")");
}

}  // namespace sqlstep
