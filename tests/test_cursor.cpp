#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "SQLiteCursor.hpp"
#include "SQLiteConnection.hpp"
#include "fixtures.hpp"

using namespace sqlstep;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class CursorTest : public ::testing::Test {
protected:
    SQLiteConnection conn_ = fixtures::setupUsers();
};

TEST_F(CursorTest, BindByName) {
    SQLiteStatement stmt = conn_.prepare("INSERT INTO users VALUES (:id, :name, :age, :photo, :email)");
    SQLiteCursor cursor = stmt.cursor();

    cursor.bind(std::vector<std::pair<std::string, Value>>{
        {":id", Value(2)},
        {":name", Value("Bob")},
        {":age", Value(69.42)},
        {":photo", Value(Blob{0x69, 0x42})},
        {":email", Value()},
    });
    EXPECT_EQ(cursor.tryNext(), nullptr);

    // Unknown names are rejected
    EXPECT_THROW(cursor.bind(std::vector<std::pair<std::string, Value>>{{":missing", Value(1)}}),
                 SQLiteException);
}

TEST_F(CursorTest, Read) {
    conn_.execute("INSERT INTO users VALUES (2, 'Bob', NULL, NULL, 'bob@example.com')");
    SQLiteCursor cursor(conn_.prepare("SELECT id, name, email FROM users ORDER BY id"));

    std::vector<std::vector<Value>> rows;
    while (const std::vector<Value>* values = cursor.tryNext()) {
        rows.push_back(*values);
    }

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_THAT(rows[0], ElementsAre(Value(1), Value("Alice"), Value()));
    EXPECT_THAT(rows[1], ElementsAre(Value(2), Value("Bob"), Value("bob@example.com")));
}

TEST_F(CursorTest, Wildcard) {
    SQLiteConnection english = fixtures::setupEnglish();
    SQLiteCursor cursor(english.prepare("SELECT value FROM english WHERE value LIKE ?"));

    size_t count = 0;
    for (const SQLiteRow& row : cursor.bind(std::vector<Value>{Value("%type")})) {
        EXPECT_THAT(row.read<std::string>("value"), HasSubstr("type"));
        ++count;
    }
    EXPECT_EQ(count, 6u);
}

TEST_F(CursorTest, DoneIsSticky) {
    SQLiteCursor cursor(conn_.prepare("SELECT id FROM users"));

    ASSERT_NE(cursor.tryNext(), nullptr);
    EXPECT_EQ(cursor.tryNext(), nullptr);
    EXPECT_EQ(cursor.tryNext(), nullptr);
    EXPECT_FALSE(cursor.next().has_value());

    cursor.reset();
    EXPECT_NE(cursor.tryNext(), nullptr);
}

TEST_F(CursorTest, NextReturnsIndependentRows) {
    conn_.execute("INSERT INTO users (id, name) VALUES (2, 'Bob')");
    SQLiteCursor cursor(conn_.prepare("SELECT id, name FROM users ORDER BY id"));

    std::optional<SQLiteRow> first = cursor.next();
    std::optional<SQLiteRow> second = cursor.next();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_FALSE(cursor.next().has_value());

    // Rows stay valid after the cursor moved on
    EXPECT_EQ(first->read<std::string>("name"), "Alice");
    EXPECT_EQ(second->read<std::string>("name"), "Bob");
    EXPECT_THAT(first->columnNames(), ElementsAre("id", "name"));
}

TEST_F(CursorTest, ColumnMetadata) {
    SQLiteCursor cursor(conn_.prepare("SELECT id, name AS user_name FROM users"));

    EXPECT_EQ(cursor.columnCount(), 2);
    EXPECT_THAT(cursor.columnNames(), ElementsAre("id", "user_name"));
}

TEST_F(CursorTest, BindSingleParameter) {
    SQLiteCursor cursor(conn_.prepare("SELECT name FROM users WHERE id = :id"));

    std::optional<SQLiteRow> row = cursor.bind(":id", 1).next();
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->read<std::string>(0), "Alice");

    EXPECT_FALSE(cursor.bind(1, 99).next().has_value());
}

TEST_F(CursorTest, BorrowedStatementOutlivesCursor) {
    SQLiteStatement stmt = conn_.prepare("SELECT count(*) FROM users");
    {
        SQLiteCursor cursor(stmt);
        std::optional<SQLiteRow> row = cursor.next();
        ASSERT_TRUE(row.has_value());
        EXPECT_EQ(row->read<int64_t>(0), 1);
        EXPECT_EQ(&cursor.statement(), &stmt);
    }

    stmt.reset();
    ASSERT_EQ(stmt.next(), State::Row);
    EXPECT_EQ(stmt.read<int64_t>(0), 1);
}

TEST_F(CursorTest, Workflow) {
    SQLiteStatement selectStmt = conn_.prepare("SELECT id, name FROM users WHERE id = ?");
    SQLiteStatement insertStmt = conn_.prepare("INSERT INTO users (id, name) VALUES (?, ?)");
    SQLiteCursor select = selectStmt.cursor();
    SQLiteCursor insert = insertStmt.cursor();

    for (int64_t id = 2; id < 7; ++id) {
        std::optional<SQLiteRow> row = select.bind(std::vector<Value>{Value(id - 1)}).next();
        ASSERT_TRUE(row.has_value());
        EXPECT_EQ(row->read<int64_t>("id"), id - 1);
        EXPECT_FALSE(select.next().has_value());

        insert.bind(std::vector<Value>{Value(id), Value("user " + std::to_string(id))});
        EXPECT_EQ(insert.tryNext(), nullptr);
    }

    SQLiteCursor count(conn_.prepare("SELECT count(*) FROM users"));
    std::optional<SQLiteRow> total = count.next();
    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(total->read<int64_t>(0), 6);
}

TEST_F(CursorTest, StepErrorPropagates) {
    conn_.execute("CREATE TABLE unique_ids (id INTEGER UNIQUE)");
    SQLiteCursor cursor(conn_.prepare("INSERT INTO unique_ids VALUES (?)"));

    EXPECT_EQ(cursor.bind(1, 1).tryNext(), nullptr);
    EXPECT_THROW(cursor.bind(1, 1).tryNext(), SQLiteException);
}
