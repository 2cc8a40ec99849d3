#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "SQLiteConnection.hpp"
#include "fixtures.hpp"
#include <atomic>
#include <cerrno>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace sqlstep;
using namespace std::chrono_literals;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Pair;

class ConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for database files
        tempDir_ = std::filesystem::temp_directory_path() / "sqlstep_connection_test";
        std::filesystem::remove_all(tempDir_);
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::string dbPath(const std::string& name) const {
        return (tempDir_ / name).string();
    }

    std::filesystem::path tempDir_;
};

TEST_F(ConnectionTest, ChangeCount) {
    SQLiteConnection conn = fixtures::setupUsers();
    EXPECT_EQ(conn.changeCount(), 1);
    EXPECT_EQ(conn.totalChangeCount(), 1);

    conn.execute("INSERT INTO users VALUES (2, 'Bob', NULL, NULL, NULL)");
    EXPECT_EQ(conn.changeCount(), 1);
    EXPECT_EQ(conn.totalChangeCount(), 2);
    EXPECT_EQ(conn.lastInsertRowId(), 2);

    conn.execute("UPDATE users SET name = 'Bob' WHERE id = 1");
    EXPECT_EQ(conn.changeCount(), 1);
    EXPECT_EQ(conn.totalChangeCount(), 3);

    conn.execute("DELETE FROM users");
    EXPECT_EQ(conn.changeCount(), 2);
    EXPECT_EQ(conn.totalChangeCount(), 5);
}

TEST_F(ConnectionTest, ExecuteReportsEngineMessage) {
    SQLiteConnection conn = fixtures::setupUsers();

    try {
        conn.execute(":)");
        FAIL() << "expected a syntax error";
    } catch (const SQLiteException& e) {
        EXPECT_STREQ(e.what(), "unrecognized token: \":\"");
        EXPECT_EQ(e.errorCode(), SQLITE_ERROR);
    }
    EXPECT_EQ(conn.errorCode(), SQLITE_ERROR);
    EXPECT_THAT(conn.error(), HasSubstr("unrecognized token"));
}

TEST_F(ConnectionTest, Iterate) {
    SQLiteConnection conn = fixtures::setupUsers();

    bool done = false;
    conn.iterate("SELECT * FROM users", [&done](const TextRow& row) {
        EXPECT_THAT(row, ElementsAre(Pair("id", std::optional<std::string>("1")),
                                     Pair("name", std::optional<std::string>("Alice")),
                                     Pair("age", std::optional<std::string>("42.69")),
                                     Pair("photo", std::optional<std::string>("\x42\x69")),
                                     Pair("email", std::optional<std::string>())));
        done = true;
        return true;
    });
    EXPECT_TRUE(done);
}

TEST_F(ConnectionTest, IterateStopsWhenCallbackDeclines) {
    SQLiteConnection english = fixtures::setupEnglish();

    int calls = 0;
    EXPECT_NO_THROW(english.iterate("SELECT value FROM english", [&calls](const TextRow&) {
        ++calls;
        return calls < 2;
    }));
    EXPECT_EQ(calls, 2);
}

TEST_F(ConnectionTest, IterateRethrowsCallbackException) {
    SQLiteConnection english = fixtures::setupEnglish();

    EXPECT_THROW(english.iterate("SELECT value FROM english", [](const TextRow&) -> bool {
        throw std::runtime_error("stop");
    }), std::runtime_error);
}

TEST_F(ConnectionTest, OpenReadOnly) {
    std::string path = dbPath("database.sqlite3");
    fixtures::setupUsers(path);

    SQLiteConnection conn = SQLiteConnection::open(path, OpenFlags().setReadOnly());
    try {
        conn.execute("INSERT INTO users VALUES (2, 'Bob', NULL, NULL, NULL)");
        FAIL() << "expected a read-only error";
    } catch (const SQLiteException& e) {
        EXPECT_EQ(e.errorCode(), SQLITE_READONLY);
        EXPECT_EQ(e.posixError(), EROFS);
    }
}

TEST_F(ConnectionTest, OpenWithoutCreateFails) {
    std::string path = dbPath("absent.sqlite3");

    EXPECT_THROW(SQLiteConnection::open(path, OpenFlags().setCreate(false)), SQLiteException);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(ConnectionTest, OpenFromConfig) {
    ConnectionConfig config;
    config.path = dbPath("config.sqlite3");
    config.threading = "full_mutex";
    config.busy_timeout = 100ms;

    {
        SQLiteConnection conn = SQLiteConnection::open(config);
        conn.execute("CREATE TABLE t (x INTEGER)");
        EXPECT_EQ(conn.path(), config.path);
    }

    config.read_only = true;
    SQLiteConnection conn = SQLiteConnection::open(config);
    EXPECT_THROW(conn.execute("INSERT INTO t VALUES (1)"), SQLiteException);
}

TEST_F(ConnectionTest, MoveTransfersHandle) {
    SQLiteConnection first(":memory:");
    sqlite3* handle = first.get();

    SQLiteConnection second = std::move(first);
    EXPECT_EQ(second.get(), handle);
    EXPECT_EQ(first.get(), nullptr);
    EXPECT_NO_THROW(second.execute("SELECT 1"));
}

TEST_F(ConnectionTest, FullMutexSharedAcrossThreads) {
    SQLiteConnection conn = SQLiteConnection::openWithFullMutex(":memory:");
    conn.execute("CREATE TABLE numbers (n INTEGER)");

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&conn, t]() {
            SQLiteStatement stmt = conn.prepare("INSERT INTO numbers VALUES (?)");
            for (int i = 0; i < 25; ++i) {
                stmt.reset();
                stmt.bind(1, t * 100 + i);
                stmt.next();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    SQLiteStatement count = conn.prepare("SELECT count(*) FROM numbers");
    ASSERT_EQ(count.next(), State::Row);
    EXPECT_EQ(count.read<int64_t>(0), 100);
}

TEST_F(ConnectionTest, BusyHandlerRetriesConcurrentWriters) {
    std::string path = dbPath("busy.sqlite3");
    fixtures::setupUsers(path);

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 10; ++t) {
        threads.emplace_back([&path, &failures, t]() {
            try {
                SQLiteConnection conn(path);
                conn.setBusyHandler([](int attempts) {
                    std::this_thread::sleep_for(1ms);
                    return attempts < 1000;
                });
                SQLiteStatement stmt = conn.prepare("INSERT INTO users (id, name) VALUES (?, ?)");
                stmt.bind(1, t + 2).bind(2, "user " + std::to_string(t));
                stmt.next();
            } catch (const SQLiteException&) {
                ++failures;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    SQLiteConnection conn(path);
    SQLiteStatement count = conn.prepare("SELECT count(*) FROM users");
    ASSERT_EQ(count.next(), State::Row);
    EXPECT_EQ(count.read<int64_t>(0), 11);
}

TEST_F(ConnectionTest, BusyHandlerGivesUp) {
    std::string path = dbPath("locked.sqlite3");
    fixtures::setupUsers(path);

    SQLiteConnection writer(path);
    writer.execute("BEGIN EXCLUSIVE");

    SQLiteConnection reader(path);
    int calls = 0;
    reader.setBusyHandler([&calls](int attempts) {
        ++calls;
        return attempts < 2;
    });

    try {
        reader.execute("SELECT * FROM users");
        FAIL() << "expected the database to be busy";
    } catch (const SQLiteException& e) {
        EXPECT_EQ(e.errorCode(), SQLITE_BUSY);
    }
    EXPECT_EQ(calls, 3);

    reader.removeBusyHandler();
    writer.execute("COMMIT");
    EXPECT_NO_THROW(reader.execute("SELECT * FROM users"));
}

TEST_F(ConnectionTest, StatementOutlivesConnection) {
    std::string path = dbPath("outlive.sqlite3");
    fixtures::setupUsers(path);

    std::optional<SQLiteStatement> stmt;
    {
        SQLiteConnection conn(path);
        conn.setBusyHandler([](int attempts) { return attempts < 3; });
        stmt.emplace(conn.prepare("SELECT count(*) FROM users"));
    }
    // The handle is released once the last statement is finalized
    EXPECT_NO_THROW(stmt = std::nullopt);

    SQLiteConnection conn(path);
    EXPECT_NO_THROW(conn.execute("INSERT INTO users (id) VALUES (2)"));
}

TEST_F(ConnectionTest, EngineVersion) {
    EXPECT_EQ(engineVersionString(), sqlite3_libversion());
    EXPECT_GE(engineVersion(), 3000000);
}
