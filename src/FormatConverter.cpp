#include "FormatConverter.hpp"
#include <sstream>
#include <iomanip>
#include <limits>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <unordered_map>

namespace sqlstep {

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isInteger(const std::string& text) {
    size_t start = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    if (start == text.size()) return false;
    for (size_t i = start; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    }
    return true;
}

bool looksDecimal(const std::string& text) {
    bool digit = false;
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digit = true;
        } else if (c != '.' && c != '-' && c != '+' && c != 'e' && c != 'E') {
            return false;
        }
    }
    return digit;
}

}  // namespace

std::string FormatConverter::toCSV(const std::vector<std::string>& columns,
                                   const std::vector<SQLiteRow>& rows,
                                   const CSVOptions& options) {
    std::ostringstream out;

    // Header
    if (options.includeHeader) {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << escapeCSVField(columns[i], options);
        }
        out << options.lineEnding;
    }

    // Rows
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out << options.delimiter;

            if (!row[i].isNull()) {
                out << escapeCSVField(valueToText(row[i]), options);
            }
        }
        out << options.lineEnding;
    }

    return out.str();
}

std::string FormatConverter::toJSON(const std::vector<SQLiteRow>& rows, const JSONOptions& options) {
    json arr = json::array();

    for (const auto& row : rows) {
        arr.push_back(rowObject(row, options));
    }

    if (options.arrayFormat) {
        return dump(arr, options);
    } else {
        json wrapper = json::object();
        wrapper["rows"] = std::move(arr);
        return dump(wrapper, options);
    }
}

std::string FormatConverter::rowToJSON(const SQLiteRow& row, const JSONOptions& options) {
    return dump(rowObject(row, options), options);
}

json FormatConverter::rowObject(const SQLiteRow& row, const JSONOptions& options) {
    json obj = json::object();
    std::unordered_map<std::string, int> seen;

    for (const auto& [name, value] : row.entries()) {
        // Repeated names are labelled "name:1", "name:2"... as SQLite does
        std::string key = name;
        int occurrence = seen[name]++;
        if (occurrence > 0) {
            key += ":" + std::to_string(occurrence);
        }

        if (!value.isNull()) {
            obj[key] = valueToJSON(value);
        } else if (options.includeNull) {
            obj[key] = nullptr;
        }
    }

    return obj;
}

std::string FormatConverter::dump(const json& value, const JSONOptions& options) {
    // TEXT columns are not guaranteed to hold valid UTF-8
    return value.dump(options.pretty ? options.indent : -1, ' ', false,
                      json::error_handler_t::replace);
}

json FormatConverter::valueToJSON(const Value& value) {
    switch (value.kind()) {
        case Type::Binary: return toHex(*value.asBinary());
        case Type::Float: return *value.asFloat();
        case Type::Integer: return *value.asInteger();
        case Type::String: return *value.asString();
        case Type::Null: break;
    }
    return nullptr;
}

std::string FormatConverter::valueToText(const Value& value) {
    switch (value.kind()) {
        case Type::Binary:
            return toHex(*value.asBinary());
        case Type::Float: {
            std::ostringstream out;
            out << std::setprecision(std::numeric_limits<double>::digits10) << *value.asFloat();
            return out.str();
        }
        case Type::Integer:
            return std::to_string(*value.asInteger());
        case Type::String:
            return *value.asString();
        case Type::Null:
            break;
    }
    return "";
}

std::string FormatConverter::toHex(const Blob& blob) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(blob.size() * 2);
    for (uint8_t byte : blob) {
        result += digits[byte >> 4];
        result += digits[byte & 0x0f];
    }
    return result;
}

std::string FormatConverter::escapeCSVField(const std::string& field,
                                            const CSVOptions& options) {
    bool needs_quoting = options.quoteAll;

    if (!needs_quoting) {
        for (char c : field) {
            if (c == options.delimiter || c == options.quote ||
                c == '\n' || c == '\r') {
                needs_quoting = true;
                break;
            }
        }
    }

    if (!needs_quoting) {
        return field;
    }

    std::string result;
    result.reserve(field.size() + 2);
    result += options.quote;

    for (char c : field) {
        if (c == options.quote) {
            result += options.quote;  // Double the quote
        }
        result += c;
    }

    result += options.quote;
    return result;
}

Value FormatConverter::parseLiteral(const std::string& text) {
    if (text.empty()) {
        return Value(text);
    }

    std::string upper;
    for (char c : text) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "NULL") {
        return Value();
    }

    // x'0a1b' blob literal
    if (text.size() >= 3 && (text[0] == 'x' || text[0] == 'X') && text[1] == '\'' && text.back() == '\'') {
        std::string hex = text.substr(2, text.size() - 3);
        if (hex.size() % 2 == 0) {
            Blob blob;
            blob.reserve(hex.size() / 2);
            bool valid = true;
            for (size_t i = 0; i < hex.size(); i += 2) {
                int high = hexDigit(hex[i]);
                int low = hexDigit(hex[i + 1]);
                if (high < 0 || low < 0) {
                    valid = false;
                    break;
                }
                blob.push_back(static_cast<uint8_t>((high << 4) | low));
            }
            if (valid) {
                return Value(std::move(blob));
            }
        }
        return Value(text);
    }

    if (isInteger(text)) {
        errno = 0;
        char* end = nullptr;
        long long number = std::strtoll(text.c_str(), &end, 10);
        if (errno != ERANGE && end == text.c_str() + text.size()) {
            return Value(static_cast<int64_t>(number));
        }
    }

    if (looksDecimal(text)) {
        errno = 0;
        char* end = nullptr;
        double number = std::strtod(text.c_str(), &end);
        if (errno != ERANGE && end == text.c_str() + text.size()) {
            return Value(number);
        }
    }

    return Value(text);
}

}  // namespace sqlstep
