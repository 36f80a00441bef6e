#include "schema/schema_model.hpp"

#include <algorithm>
#include <unordered_map>

namespace ormaudit {

ColumnType column_type_from_builder(std::string_view name) {
    static const std::unordered_map<std::string_view, ColumnType> lookup = {
        {"text",            ColumnType::TEXT},
        {"varchar",         ColumnType::VARCHAR},
        {"char",            ColumnType::CHAR},
        {"integer",         ColumnType::INTEGER},
        {"smallint",        ColumnType::SMALLINT},
        {"bigint",          ColumnType::BIGINT},
        {"serial",          ColumnType::SERIAL},
        {"smallserial",     ColumnType::SMALLSERIAL},
        {"bigserial",       ColumnType::BIGSERIAL},
        {"boolean",         ColumnType::BOOLEAN},
        {"timestamp",       ColumnType::TIMESTAMP},
        {"date",            ColumnType::DATE},
        {"time",            ColumnType::TIME},
        {"json",            ColumnType::JSON},
        {"jsonb",           ColumnType::JSONB},
        {"uuid",            ColumnType::UUID},
        {"real",            ColumnType::REAL},
        {"doublePrecision", ColumnType::DOUBLE_PRECISION},
        {"numeric",         ColumnType::NUMERIC},
        {"enum",            ColumnType::ENUM},
    };

    const auto it = lookup.find(name);
    return it != lookup.end() ? it->second : ColumnType::UNKNOWN;
}

const Column* Table::find_column(std::string_view column_name) const {
    const auto it = std::ranges::find_if(columns,
        [&](const Column& c) { return c.name == column_name; });
    return it != columns.end() ? &*it : nullptr;
}

std::vector<const Column*> Table::required_columns() const {
    std::vector<const Column*> result;
    for (const auto& c : columns) {
        if (c.is_required) result.push_back(&c);
    }
    return result;
}

const Table* SchemaModel::find_table(std::string_view table_name) const {
    const auto it = std::ranges::find_if(tables,
        [&](const Table& t) { return t.name == table_name; });
    return it != tables.end() ? &*it : nullptr;
}

const Enum* SchemaModel::find_enum(std::string_view enum_name) const {
    const auto it = std::ranges::find_if(enums,
        [&](const Enum& e) { return e.name == enum_name; });
    return it != enums.end() ? &*it : nullptr;
}

std::string SchemaModel::table_sql_name(std::string_view table_name) const {
    if (const auto* t = find_table(table_name)) return t->sql_name;
    return std::string(table_name);
}

} // namespace ormaudit
