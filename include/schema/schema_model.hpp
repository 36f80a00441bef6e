#pragma once

#include "core/column_type.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ormaudit {

// ============================================================================
// Schema Model - tables, columns and enums declared in a schema file
// ============================================================================

struct Column {
    std::string name;                       // Property key in the table literal
    std::string sql_name;                   // First builder argument, else name
    ColumnType type = ColumnType::UNKNOWN;
    std::optional<std::string> enum_ref;    // Enum variable name for ENUM columns
    bool not_null = false;
    bool has_default = false;
    bool is_auto_generated = false;
    bool is_required = false;               // not_null && !has_default && !is_auto_generated

    [[nodiscard]] bool is_numeric() const { return is_numeric_type(type); }
    [[nodiscard]] bool is_enum() const { return type == ColumnType::ENUM && enum_ref.has_value(); }
};

struct Table {
    std::string name;                       // Exported variable name
    std::string sql_name;
    std::vector<Column> columns;

    [[nodiscard]] const Column* find_column(std::string_view column_name) const;

    /**
     * @brief Columns an insert must provide, in declaration order
     */
    [[nodiscard]] std::vector<const Column*> required_columns() const;
};

struct Enum {
    std::string name;
    std::string sql_name;
    std::vector<std::string> values;
};

/**
 * @brief Normalized schema, built once per run and read-only afterwards
 *
 * Shared by const reference between SQL synthesis and persistence
 * validation, including across worker threads.
 */
struct SchemaModel {
    std::string path;
    std::vector<Table> tables;
    std::vector<Enum> enums;

    [[nodiscard]] const Table* find_table(std::string_view table_name) const;
    [[nodiscard]] const Enum* find_enum(std::string_view enum_name) const;

    /**
     * @brief Declared SQL name of a table, or the name itself when unknown
     */
    [[nodiscard]] std::string table_sql_name(std::string_view table_name) const;
};

} // namespace ormaudit
