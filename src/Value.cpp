/**
 * @file Value.cpp
 * @brief Type projection and diagnostic rendering of SQL values.
 */

#include "Value.hpp"
#include <iomanip>
#include <limits>
#include <sstream>

namespace sqlstep {

const char* typeName(Type type) {
    switch (type) {
        case Type::Binary: return "BLOB";
        case Type::Float: return "FLOAT";
        case Type::Integer: return "INTEGER";
        case Type::String: return "TEXT";
        case Type::Null: return "NULL";
    }
    return "UNKNOWN";
}

Type Value::kind() const {
    switch (m_data.index()) {
        case 0: return Type::Binary;
        case 1: return Type::Float;
        case 2: return Type::Integer;
        case 3: return Type::String;
        default: return Type::Null;
    }
}

bool operator<(const Value& lhs, const Value& rhs) {
    // std::nullptr_t has no relational operators, so the variant's own < is unusable
    if (lhs.m_data.index() != rhs.m_data.index()) {
        return lhs.m_data.index() < rhs.m_data.index();
    }
    switch (lhs.kind()) {
        case Type::Binary: return *lhs.asBinary() < *rhs.asBinary();
        case Type::Float: return *lhs.asFloat() < *rhs.asFloat();
        case Type::Integer: return *lhs.asInteger() < *rhs.asInteger();
        case Type::String: return *lhs.asString() < *rhs.asString();
        case Type::Null: break;
    }
    return false;
}

std::string to_string(const Value& value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

std::ostream& operator<<(std::ostream& out, const Value& value) {
    if (const Blob* blob = value.asBinary()) {
        std::ostringstream hex;
        hex << std::hex << std::setfill('0');
        for (uint8_t byte : *blob) {
            hex << std::setw(2) << static_cast<int>(byte);
        }
        return out << "x'" << hex.str() << "'";
    }
    if (const double* real = value.asFloat()) {
        std::ostringstream text;
        text << std::setprecision(std::numeric_limits<double>::digits10) << *real;
        return out << text.str();
    }
    if (const int64_t* integer = value.asInteger()) {
        return out << *integer;
    }
    if (const std::string* text = value.asString()) {
        return out << std::quoted(*text, '\'', '\'');
    }
    return out << "NULL";
}

std::ostream& operator<<(std::ostream& out, Type type) {
    return out << typeName(type);
}

}  // namespace sqlstep
