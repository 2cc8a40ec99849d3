#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"
#include <sqlite3.h>
#include <cerrno>

using namespace sqlstep;
using ::testing::HasSubstr;

class ErrorHandlerTest : public ::testing::Test {
};

// Result code to errno mapping tests
TEST_F(ErrorHandlerTest, SuccessReturnsZero) {
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_OK), 0);
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_ROW), 0);
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_DONE), 0);
}

TEST_F(ErrorHandlerTest, LockErrorsMapToEBUSY) {
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_BUSY), EBUSY);
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_LOCKED), EBUSY);
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_BUSY_SNAPSHOT), EBUSY);
}

TEST_F(ErrorHandlerTest, PermissionErrorsMapToEACCES) {
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_PERM), EACCES);
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_AUTH), EACCES);
}

TEST_F(ErrorHandlerTest, ReadOnlyErrorsMapToEROFS) {
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_READONLY), EROFS);
}

TEST_F(ErrorHandlerTest, InvalidInputErrorsMapToEINVAL) {
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_CONSTRAINT), EINVAL);
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_CONSTRAINT_UNIQUE), EINVAL);
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_MISMATCH), EINVAL);
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_RANGE), EINVAL);
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_MISUSE), EINVAL);
}

TEST_F(ErrorHandlerTest, ResourceErrorsMapToMatchingErrno) {
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_FULL), ENOSPC);
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_NOMEM), ENOMEM);
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_CANTOPEN), ENOENT);
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_INTERRUPT), EINTR);
}

TEST_F(ErrorHandlerTest, UnknownErrorsMapToEIO) {
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_ERROR), EIO);
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_CORRUPT), EIO);
    EXPECT_EQ(ErrorHandler::toErrno(SQLITE_IOERR), EIO);
}

// Classification tests
TEST_F(ErrorHandlerTest, IsRetryable) {
    EXPECT_TRUE(ErrorHandler::isRetryable(SQLITE_BUSY));
    EXPECT_TRUE(ErrorHandler::isRetryable(SQLITE_LOCKED));
    EXPECT_TRUE(ErrorHandler::isRetryable(SQLITE_BUSY_RECOVERY));

    EXPECT_FALSE(ErrorHandler::isRetryable(SQLITE_OK));
    EXPECT_FALSE(ErrorHandler::isRetryable(SQLITE_ERROR));
    EXPECT_FALSE(ErrorHandler::isRetryable(SQLITE_CONSTRAINT));
}

TEST_F(ErrorHandlerTest, IsConstraintViolation) {
    EXPECT_TRUE(ErrorHandler::isConstraintViolation(SQLITE_CONSTRAINT));
    EXPECT_TRUE(ErrorHandler::isConstraintViolation(SQLITE_CONSTRAINT_PRIMARYKEY));
    EXPECT_FALSE(ErrorHandler::isConstraintViolation(SQLITE_BUSY));
}

TEST_F(ErrorHandlerTest, ResultCodeName) {
    EXPECT_EQ(ErrorHandler::resultCodeName(SQLITE_OK), "SQLITE_OK");
    EXPECT_EQ(ErrorHandler::resultCodeName(SQLITE_BUSY), "SQLITE_BUSY");
    EXPECT_EQ(ErrorHandler::resultCodeName(SQLITE_RANGE), "SQLITE_RANGE");
    EXPECT_EQ(ErrorHandler::resultCodeName(SQLITE_DONE), "SQLITE_DONE");
}

// Message tests
TEST_F(ErrorHandlerTest, GetErrorMessageFromCode) {
    EXPECT_EQ(ErrorHandler::getErrorMessage(SQLITE_RANGE), sqlite3_errstr(SQLITE_RANGE));
    EXPECT_FALSE(ErrorHandler::getErrorMessage(SQLITE_BUSY).empty());
}

TEST_F(ErrorHandlerTest, GetErrorMessageFromConnection) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(":memory:", &db), SQLITE_OK);

    int rc = sqlite3_exec(db, "SELECT * FROM missing", nullptr, nullptr, nullptr);
    EXPECT_EQ(rc, SQLITE_ERROR);
    EXPECT_THAT(ErrorHandler::getErrorMessage(db, rc), HasSubstr("no such table: missing"));

    sqlite3_close(db);
}

// Exception tests
TEST_F(ErrorHandlerTest, ExceptionWithoutCode) {
    SQLiteException e("column 0 could not be read as it holds NULL");

    EXPECT_FALSE(e.errorCode().has_value());
    EXPECT_STREQ(e.what(), "column 0 could not be read as it holds NULL");
    EXPECT_EQ(e.posixError(), EIO);
}

TEST_F(ErrorHandlerTest, ExceptionWithCode) {
    SQLiteException e(SQLITE_BUSY, "database is locked");

    EXPECT_EQ(e.errorCode(), SQLITE_BUSY);
    EXPECT_EQ(e.posixError(), EBUSY);
}

TEST_F(ErrorHandlerTest, EmptyMessageFallsBack) {
    SQLiteException e("");
    EXPECT_STREQ(e.what(), ErrorHandler::GENERIC_MESSAGE);
}

TEST_F(ErrorHandlerTest, OutOfRange) {
    SQLiteException e = SQLiteException::outOfRange(":missing");

    EXPECT_EQ(e.errorCode(), SQLITE_RANGE);
    EXPECT_STREQ(e.what(), "the index is out of range (:missing)");
}

// Retry tests
TEST_F(ErrorHandlerTest, ExecuteWithRetrySucceedsFirstTry) {
    int attempts = 0;
    int rc = ErrorHandler::executeWithRetry([&attempts]() {
        ++attempts;
        return SQLITE_OK;
    });

    EXPECT_EQ(rc, SQLITE_OK);
    EXPECT_EQ(attempts, 1);
}

TEST_F(ErrorHandlerTest, ExecuteWithRetryRetriesBusy) {
    int attempts = 0;
    int rc = ErrorHandler::executeWithRetry([&attempts]() {
        ++attempts;
        return attempts < 3 ? SQLITE_BUSY : SQLITE_DONE;
    }, 3, std::chrono::milliseconds(1));

    EXPECT_EQ(rc, SQLITE_DONE);
    EXPECT_EQ(attempts, 3);
}

TEST_F(ErrorHandlerTest, ExecuteWithRetryGivesUp) {
    int attempts = 0;
    int rc = ErrorHandler::executeWithRetry([&attempts]() {
        ++attempts;
        return SQLITE_BUSY;
    }, 2, std::chrono::milliseconds(1));

    EXPECT_EQ(rc, SQLITE_BUSY);
    EXPECT_EQ(attempts, 2);
}

TEST_F(ErrorHandlerTest, ExecuteWithRetryStopsOnHardError) {
    int attempts = 0;
    int rc = ErrorHandler::executeWithRetry([&attempts]() {
        ++attempts;
        return SQLITE_CONSTRAINT;
    }, 5, std::chrono::milliseconds(1));

    EXPECT_EQ(rc, SQLITE_CONSTRAINT);
    EXPECT_EQ(attempts, 1);
}

TEST_F(ErrorHandlerTest, ExecuteWithRetryManyAttempts) {
    int attempts = 0;
    int rc = ErrorHandler::executeWithRetry([&attempts]() {
        ++attempts;
        return SQLITE_LOCKED;
    }, 40, std::chrono::milliseconds(0));

    // The backoff shift stays bounded past 32 attempts
    EXPECT_EQ(rc, SQLITE_LOCKED);
    EXPECT_EQ(attempts, 40);
}

// Error context tests
TEST_F(ErrorHandlerTest, ErrorContextNests) {
    EXPECT_EQ(ErrorContext::current(), "");
    {
        ErrorContext outer("outer");
        EXPECT_EQ(ErrorContext::current(), "outer");
        {
            ErrorContext inner("inner");
            EXPECT_EQ(ErrorContext::current(), "outer > inner");
        }
        EXPECT_EQ(ErrorContext::current(), "outer");
    }
    EXPECT_EQ(ErrorContext::current(), "");
}
