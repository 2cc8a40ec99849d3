/**
 * @file SQLiteRow.cpp
 * @brief Implementation of the materialized result row.
 */

#include "SQLiteRow.hpp"

namespace sqlstep {

SQLiteRow::SQLiteRow(std::vector<Value> values, std::shared_ptr<const ColumnMap> columns)
    : m_values(std::move(values))
    , m_columns(columns ? std::move(columns) : std::make_shared<const ColumnMap>()) {
}

const Value& SQLiteRow::operator[](size_t index) const {
    if (index >= m_values.size()) {
        throw SQLiteException::outOfRange(std::to_string(index));
    }
    return m_values[index];
}

const Value& SQLiteRow::operator[](const std::string& name) const {
    return m_values[resolve(name)];
}

Value SQLiteRow::take(size_t index) {
    if (index >= m_values.size()) {
        throw SQLiteException::outOfRange(std::to_string(index));
    }
    Value taken = std::move(m_values[index]);
    m_values[index] = Value();
    return taken;
}

Value SQLiteRow::take(const std::string& name) {
    return take(resolve(name));
}

std::optional<size_t> SQLiteRow::find(const std::string& name) const {
    auto it = m_columns->index.find(name);
    if (it == m_columns->index.end() || it->second >= m_values.size()) {
        return std::nullopt;
    }
    return it->second;
}

size_t SQLiteRow::resolve(const std::string& name) const {
    std::optional<size_t> index = find(name);
    if (!index) {
        throw SQLiteException::outOfRange(name);
    }
    return *index;
}

std::vector<std::string> SQLiteRow::columnNames() const {
    std::vector<std::string> names(m_values.size());
    for (size_t i = 0; i < names.size() && i < m_columns->names.size(); ++i) {
        names[i] = m_columns->names[i];
    }
    return names;
}

std::vector<std::pair<std::string, Value>> SQLiteRow::entries() const {
    std::vector<std::string> names = columnNames();
    std::vector<std::pair<std::string, Value>> result;
    result.reserve(m_values.size());
    for (size_t i = 0; i < m_values.size(); ++i) {
        result.emplace_back(std::move(names[i]), m_values[i]);
    }
    return result;
}

std::shared_ptr<const ColumnMap> makeColumnMap(const std::vector<std::string>& names) {
    auto columns = std::make_shared<ColumnMap>();
    columns->names = names;
    columns->index.reserve(names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        // emplace keeps the first position of a repeated name
        columns->index.emplace(names[i], i);
    }
    return columns;
}

}  // namespace sqlstep
