#pragma once

#include "SQLiteConnection.hpp"
#include <string>

namespace sqlstep::fixtures {

// Seven words, six of which end in "type"
inline SQLiteConnection setupEnglish(const std::string& path = ":memory:") {
    SQLiteConnection conn(path);
    conn.execute(R"(
        CREATE TABLE english (value TEXT);
        INSERT INTO english VALUES ('cerotype');
        INSERT INTO english VALUES ('metatype');
        INSERT INTO english VALUES ('ozotype');
        INSERT INTO english VALUES ('phenotype');
        INSERT INTO english VALUES ('plastotype');
        INSERT INTO english VALUES ('undertype');
        INSERT INTO english VALUES ('nonsence');
    )");
    return conn;
}

// One row covering every storage class
inline SQLiteConnection setupUsers(const std::string& path = ":memory:") {
    SQLiteConnection conn(path);
    conn.execute(R"(
        CREATE TABLE users (id INTEGER, name TEXT, age REAL, photo BLOB, email TEXT);
        INSERT INTO users VALUES (1, 'Alice', 42.69, X'4269', NULL);
    )");
    return conn;
}

}  // namespace sqlstep::fixtures
