#pragma once

/**
 * @file SQLiteTraits.hpp
 * @brief Conversions between host types and prepared-statement slots.
 *
 * Bindable<T> writes a host value into a 1-based parameter slot; Readable<T>
 * reads a 0-based result column into a host value. Both are specialized once
 * per primitive host type, and once more for std::optional<T>, which maps
 * std::nullopt to SQL NULL on the way in and a NULL column to std::nullopt
 * on the way out.
 */

#include "Value.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace sqlstep {

class SQLiteStatement;

namespace detail {

// Primitive bind calls; each throws SQLiteException when the engine rejects it
void bindBlob(SQLiteStatement& statement, int index, const uint8_t* data, size_t size);
void bindDouble(SQLiteStatement& statement, int index, double value);
void bindInt64(SQLiteStatement& statement, int index, int64_t value);
void bindText(SQLiteStatement& statement, int index, std::string_view value);
void bindNull(SQLiteStatement& statement, int index);

// Primitive column reads; each throws SQLiteException on a type mismatch
Blob readBlob(const SQLiteStatement& statement, int index);
double readDouble(const SQLiteStatement& statement, int index);
int64_t readInt64(const SQLiteStatement& statement, int index);
std::string readText(const SQLiteStatement& statement, int index);
Value readValue(const SQLiteStatement& statement, int index);
bool isNullColumn(const SQLiteStatement& statement, int index);

}  // namespace detail

/**
 * @brief A type suitable for binding to a prepared statement.
 *
 * Specializations provide
 * `static void bind(SQLiteStatement&, int index, const T& value)`.
 * The leftmost parameter has the index 1.
 */
template<typename T, typename Enable = void>
struct Bindable;

template<>
struct Bindable<Blob> {
    static void bind(SQLiteStatement& statement, int index, const Blob& value) {
        detail::bindBlob(statement, index, value.data(), value.size());
    }
};

template<>
struct Bindable<double> {
    static void bind(SQLiteStatement& statement, int index, double value) {
        detail::bindDouble(statement, index, value);
    }
};

template<>
struct Bindable<float> {
    static void bind(SQLiteStatement& statement, int index, float value) {
        detail::bindDouble(statement, index, static_cast<double>(value));
    }
};

// Every integral type except bool binds as a 64-bit integer; unsigned
// values past INT64_MAX are rejected
template<typename T>
struct Bindable<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static void bind(SQLiteStatement& statement, int index, T value) {
        detail::bindInt64(statement, index, detail::toInt64(value));
    }
};

template<>
struct Bindable<std::string> {
    static void bind(SQLiteStatement& statement, int index, const std::string& value) {
        detail::bindText(statement, index, value);
    }
};

template<>
struct Bindable<std::string_view> {
    static void bind(SQLiteStatement& statement, int index, std::string_view value) {
        detail::bindText(statement, index, value);
    }
};

template<>
struct Bindable<const char*> {
    static void bind(SQLiteStatement& statement, int index, const char* value) {
        if (value) {
            detail::bindText(statement, index, value);
        } else {
            detail::bindNull(statement, index);
        }
    }
};

template<>
struct Bindable<char*> : Bindable<const char*> {};

template<>
struct Bindable<std::nullptr_t> {
    static void bind(SQLiteStatement& statement, int index, std::nullptr_t) {
        detail::bindNull(statement, index);
    }
};

template<>
struct Bindable<Value> {
    static void bind(SQLiteStatement& statement, int index, const Value& value) {
        switch (value.kind()) {
            case Type::Binary:
                Bindable<Blob>::bind(statement, index, *value.asBinary());
                break;
            case Type::Float:
                Bindable<double>::bind(statement, index, *value.asFloat());
                break;
            case Type::Integer:
                Bindable<int64_t>::bind(statement, index, *value.asInteger());
                break;
            case Type::String:
                Bindable<std::string>::bind(statement, index, *value.asString());
                break;
            case Type::Null:
                Bindable<std::nullptr_t>::bind(statement, index, nullptr);
                break;
        }
    }
};

template<typename T>
struct Bindable<std::optional<T>> {
    static void bind(SQLiteStatement& statement, int index, const std::optional<T>& value) {
        if (value) {
            Bindable<T>::bind(statement, index, *value);
        } else {
            detail::bindNull(statement, index);
        }
    }
};

/**
 * @brief A type suitable for reading from a prepared statement.
 *
 * Specializations provide `static T read(const SQLiteStatement&, int index)`.
 * The leftmost column has the index 0. Only Value accepts every column type.
 */
template<typename T>
struct Readable;

template<>
struct Readable<Blob> {
    static Blob read(const SQLiteStatement& statement, int index) {
        return detail::readBlob(statement, index);
    }
};

template<>
struct Readable<double> {
    static double read(const SQLiteStatement& statement, int index) {
        return detail::readDouble(statement, index);
    }
};

template<>
struct Readable<int64_t> {
    static int64_t read(const SQLiteStatement& statement, int index) {
        return detail::readInt64(statement, index);
    }
};

template<>
struct Readable<std::string> {
    static std::string read(const SQLiteStatement& statement, int index) {
        return detail::readText(statement, index);
    }
};

template<>
struct Readable<Value> {
    static Value read(const SQLiteStatement& statement, int index) {
        return detail::readValue(statement, index);
    }
};

template<typename T>
struct Readable<std::optional<T>> {
    static std::optional<T> read(const SQLiteStatement& statement, int index) {
        if (detail::isNullColumn(statement, index)) {
            return std::nullopt;
        }
        return Readable<T>::read(statement, index);
    }
};

}  // namespace sqlstep
