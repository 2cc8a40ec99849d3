#pragma once

/**
 * @file Value.hpp
 * @brief Dynamically typed SQL datum and its conversions to host types.
 *
 * A Value holds exactly one of the five storage classes an SQLite column or
 * parameter can carry. It never changes variant after construction; reading
 * it as a host type either matches the variant exactly or fails.
 */

#include "ErrorHandler.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace sqlstep {

/// Binary payload of a BLOB value.
using Blob = std::vector<uint8_t>;

/**
 * @enum Type
 * @brief Discriminant of a Value; mirrors SQLite's fundamental datatypes.
 */
enum class Type {
    Binary,
    Float,
    Integer,
    String,
    Null
};

/// Name of a type as used in diagnostics ("BLOB", "FLOAT", ...).
const char* typeName(Type type);

namespace detail {

/**
 * @brief Convert an integral host value to the Integer storage class.
 * @throws SQLiteException (SQLITE_RANGE) if an unsigned value exceeds INT64_MAX.
 */
template<typename T>
int64_t toInt64(T value) {
    if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
        if (value > static_cast<T>(std::numeric_limits<int64_t>::max())) {
            throw SQLiteException(SQLITE_RANGE, "integer " + std::to_string(value) +
                                                " does not fit into a 64-bit signed integer");
        }
    }
    return static_cast<int64_t>(value);
}

}  // namespace detail

/**
 * @class Value
 * @brief Closed tagged union of Binary, Float, Integer, String and Null.
 *
 * Construction from host types is total: integral types become Integer,
 * floating-point types become Float, text becomes String, a byte vector
 * becomes Binary and nullptr (or an empty std::optional) becomes Null.
 * No coercion between variants ever happens implicitly.
 *
 * Usage:
 * @code
 *   Value id = 42;
 *   Value name = "Alice";
 *   Value photo = Blob{0x42, 0x69};
 *   Value email = nullptr;
 *
 *   if (const int64_t* n = id.asInteger()) {
 *       // *n == 42
 *   }
 *   std::string s = name.tryInto<std::string>();  // throws on mismatch
 * @endcode
 */
class Value {
public:
    using Variant = std::variant<Blob, double, int64_t, std::string, std::nullptr_t>;

    Value() : m_data(nullptr) {}
    Value(std::nullptr_t) : m_data(nullptr) {}
    Value(Blob value) : m_data(std::move(value)) {}
    Value(double value) : m_data(value) {}
    Value(std::string value) : m_data(std::move(value)) {}
    Value(const char* value) : m_data(std::string(value)) {}
    Value(std::string_view value) : m_data(std::string(value)) {}

    template<typename T,
             std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T value) : m_data(detail::toInt64(value)) {}

    template<typename T,
             std::enable_if_t<std::is_floating_point_v<T> && !std::is_same_v<T, double>, int> = 0>
    Value(T value) : m_data(static_cast<double>(value)) {}

    template<typename T>
    Value(const std::optional<T>& value) : m_data(nullptr) {
        if (value) {
            *this = Value(*value);
        }
    }

    // A bool has no storage class of its own; bind 0/1 explicitly
    Value(bool) = delete;

    /// Return the type of the held variant.
    Type kind() const;

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(m_data); }

    /// @name Typed access
    /// Return a pointer to the held value, or nullptr if the variant differs.
    /// @{
    const Blob* asBinary() const { return std::get_if<Blob>(&m_data); }
    const double* asFloat() const { return std::get_if<double>(&m_data); }
    const int64_t* asInteger() const { return std::get_if<int64_t>(&m_data); }
    const std::string* asString() const { return std::get_if<std::string>(&m_data); }
    /// @}

    /**
     * @brief Convert to a host type.
     * @tparam T Blob, double, int64_t, std::string, std::nullptr_t, Value or
     *           std::optional of one of those.
     * @throws SQLiteException ("failed to convert") if the variant does not match.
     */
    template<typename T>
    T tryInto() const;

    const Variant& data() const { return m_data; }

    friend bool operator==(const Value& lhs, const Value& rhs) { return lhs.m_data == rhs.m_data; }
    friend bool operator!=(const Value& lhs, const Value& rhs) { return lhs.m_data != rhs.m_data; }
    /// Orders by type (Binary, Float, Integer, String, Null), then by value.
    friend bool operator<(const Value& lhs, const Value& rhs);

private:
    Variant m_data;
};

/// Render a value for diagnostics: blobs as x'hex', strings quoted, NULL bare.
std::string to_string(const Value& value);
std::ostream& operator<<(std::ostream& out, const Value& value);
std::ostream& operator<<(std::ostream& out, Type type);

/**
 * @brief Conversion from a Value to a host type.
 *
 * Each specialization provides `static std::optional<T> from(const Value&)`
 * which yields std::nullopt when the variant does not match T. The
 * std::optional<T> specialization maps Null to an engaged, empty optional.
 */
template<typename T>
struct ValueInto;

template<>
struct ValueInto<int64_t> {
    static std::optional<int64_t> from(const Value& value) {
        if (const int64_t* v = value.asInteger()) return *v;
        return std::nullopt;
    }
};

template<>
struct ValueInto<double> {
    static std::optional<double> from(const Value& value) {
        if (const double* v = value.asFloat()) return *v;
        return std::nullopt;
    }
};

template<>
struct ValueInto<std::string> {
    static std::optional<std::string> from(const Value& value) {
        if (const std::string* v = value.asString()) return *v;
        return std::nullopt;
    }
};

template<>
struct ValueInto<Blob> {
    static std::optional<Blob> from(const Value& value) {
        if (const Blob* v = value.asBinary()) return *v;
        return std::nullopt;
    }
};

template<>
struct ValueInto<std::nullptr_t> {
    static std::optional<std::nullptr_t> from(const Value& value) {
        if (value.isNull()) return nullptr;
        return std::nullopt;
    }
};

template<>
struct ValueInto<Value> {
    static std::optional<Value> from(const Value& value) { return value; }
};

template<typename T>
struct ValueInto<std::optional<T>> {
    static std::optional<std::optional<T>> from(const Value& value) {
        if (value.isNull()) {
            return std::optional<std::optional<T>>(std::in_place);
        }
        std::optional<T> inner = ValueInto<T>::from(value);
        if (!inner) {
            return std::nullopt;
        }
        return std::optional<std::optional<T>>(std::in_place, std::move(*inner));
    }
};

template<typename T>
T Value::tryInto() const {
    std::optional<T> converted = ValueInto<T>::from(*this);
    if (!converted) {
        throw SQLiteException(std::string("failed to convert ") + typeName(kind()));
    }
    return std::move(*converted);
}

}  // namespace sqlstep
