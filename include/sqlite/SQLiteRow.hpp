#pragma once

/**
 * @file SQLiteRow.hpp
 * @brief Immutable snapshot of one result row.
 */

#include "Value.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sqlstep {

/**
 * @struct ColumnMap
 * @brief Column names of a result, shared by every row of one cursor.
 *
 * names keeps every column in position order, repeats included; index maps
 * a name to the first position carrying it.
 */
struct ColumnMap {
    std::vector<std::string> names;
    std::unordered_map<std::string, size_t> index;
};

/**
 * @class SQLiteRow
 * @brief Materialized values of one row plus the shared column-name index.
 *
 * A row is pure data: it does not refer back to the cursor or statement
 * that produced it and stays valid after they move on or are destroyed.
 * Columns are addressed by 0-based position or by name.
 *
 * Access comes in two flavours that share one conversion:
 * - read<T>() throws SQLiteException when the column does not exist or
 *   cannot be converted to T;
 * - tryRead<T>() returns std::nullopt in the same situations.
 *
 * Two rows compare equal when their value sequences are equal; the column
 * names are not part of a row's identity.
 */
class SQLiteRow {
public:
    SQLiteRow(std::vector<Value> values, std::shared_ptr<const ColumnMap> columns);

    size_t size() const { return m_values.size(); }
    bool empty() const { return m_values.empty(); }

    /**
     * @brief Get a column's value by position or name.
     * @throws SQLiteException if the column does not exist.
     */
    const Value& operator[](size_t index) const;
    const Value& operator[](const std::string& name) const;

    /**
     * @brief Read a column as T.
     * @throws SQLiteException if the column does not exist or holds another type.
     */
    template<typename T>
    T read(size_t index) const {
        return convert<T>((*this)[index], std::to_string(index));
    }

    template<typename T>
    T read(const std::string& name) const {
        return convert<T>((*this)[name], "'" + name + "'");
    }

    /**
     * @brief Read a column as T, or std::nullopt if that is not possible.
     */
    template<typename T>
    std::optional<T> tryRead(size_t index) const {
        if (index >= m_values.size()) {
            return std::nullopt;
        }
        return ValueInto<T>::from(m_values[index]);
    }

    template<typename T>
    std::optional<T> tryRead(const std::string& name) const {
        std::optional<size_t> index = find(name);
        if (!index) {
            return std::nullopt;
        }
        return ValueInto<T>::from(m_values[*index]);
    }

    /**
     * @brief Move a column's value out, leaving Null in its place.
     *
     * Taking the same column twice yields Null the second time.
     */
    Value take(size_t index);
    Value take(const std::string& name);

    /**
     * @brief Find the position of a named column.
     */
    std::optional<size_t> find(const std::string& name) const;

    /**
     * @brief Column names ordered by position.
     */
    std::vector<std::string> columnNames() const;

    /**
     * @brief (name, value) pairs ordered by position.
     */
    std::vector<std::pair<std::string, Value>> entries() const;

    const std::vector<Value>& values() const { return m_values; }
    std::vector<Value>::const_iterator begin() const { return m_values.begin(); }
    std::vector<Value>::const_iterator end() const { return m_values.end(); }

    friend bool operator==(const SQLiteRow& lhs, const SQLiteRow& rhs) { return lhs.m_values == rhs.m_values; }
    friend bool operator!=(const SQLiteRow& lhs, const SQLiteRow& rhs) { return lhs.m_values != rhs.m_values; }
    friend bool operator<(const SQLiteRow& lhs, const SQLiteRow& rhs) { return lhs.m_values < rhs.m_values; }

private:
    template<typename T>
    static T convert(const Value& value, const std::string& column) {
        std::optional<T> converted = ValueInto<T>::from(value);
        if (!converted) {
            throw SQLiteException("column " + column + " could not be read as it holds " +
                                  typeName(value.kind()));
        }
        return std::move(*converted);
    }

    size_t resolve(const std::string& name) const;

    std::vector<Value> m_values;
    std::shared_ptr<const ColumnMap> m_columns;
};

/**
 * @brief Build the name index for a list of column names.
 *
 * When a name repeats, the first position wins.
 */
std::shared_ptr<const ColumnMap> makeColumnMap(const std::vector<std::string>& names);

}  // namespace sqlstep
