#pragma once

#include "Value.hpp"
#include "SQLiteRow.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sqlstep {

using json = nlohmann::json;

// Options structs declared outside the class to avoid default argument issues
struct CSVOptions {
    char delimiter = ',';
    char quote = '"';
    std::string lineEnding = "\n";
    bool includeHeader = true;
    bool quoteAll = false;
};

struct JSONOptions {
    bool pretty = true;
    int indent = 2;
    bool includeNull = true;
    bool arrayFormat = true;  // true = array of objects, false = object with rows array
};

// Renders query results as text and parses typed parameter literals
class FormatConverter {
public:
    // Rows to CSV; the header comes from the column names
    static std::string toCSV(const std::vector<std::string>& columns,
                             const std::vector<SQLiteRow>& rows,
                             const CSVOptions& options = CSVOptions{});

    // Rows to a JSON array of objects keyed by column name
    static std::string toJSON(const std::vector<SQLiteRow>& rows,
                              const JSONOptions& options = JSONOptions{});

    static std::string rowToJSON(const SQLiteRow& row, const JSONOptions& options = JSONOptions{});

    // Blobs become lowercase hex strings, Null becomes JSON null
    static json valueToJSON(const Value& value);

    // Plain text for one CSV field; Null is the empty string
    static std::string valueToText(const Value& value);

    static std::string toHex(const Blob& blob);

    // CSV utility functions
    static std::string escapeCSVField(const std::string& field,
                                      const CSVOptions& options = CSVOptions{});

    // Typed literal: integer, decimal, NULL, x'hex' or plain text
    static Value parseLiteral(const std::string& text);

private:
    static json rowObject(const SQLiteRow& row, const JSONOptions& options);

    // Invalid UTF-8 in text is replaced with U+FFFD rather than thrown
    static std::string dump(const json& value, const JSONOptions& options);
};

}  // namespace sqlstep
