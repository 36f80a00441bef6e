#pragma once

#include <cstdint>
#include <string_view>

namespace ormaudit {

/**
 * @brief Column type as declared in a schema file
 *
 * Each value corresponds to one column builder function
 * (`integer('age')`, `doublePrecision('score')`, ...).
 */
enum class ColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    SMALLINT,
    INTEGER,
    BIGINT,
    SMALLSERIAL,
    SERIAL,
    BIGSERIAL,

    // Floating point
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,

    // String family
    TEXT,
    VARCHAR,
    CHAR,

    // Boolean
    BOOLEAN,

    // Date/Time
    DATE,
    TIME,
    TIMESTAMP,

    // JSON
    JSON,
    JSONB,

    // UUID
    UUID,

    // Declared enum (see Column::enum_ref)
    ENUM,
};

/**
 * @brief Builder-function spelling, also used in reports ("integer", "doublePrecision")
 */
[[nodiscard]] inline const char* column_type_to_string(ColumnType type) {
    switch (type) {
        case ColumnType::UNKNOWN: return "unknown";
        case ColumnType::SMALLINT: return "smallint";
        case ColumnType::INTEGER: return "integer";
        case ColumnType::BIGINT: return "bigint";
        case ColumnType::SMALLSERIAL: return "smallserial";
        case ColumnType::SERIAL: return "serial";
        case ColumnType::BIGSERIAL: return "bigserial";
        case ColumnType::REAL: return "real";
        case ColumnType::DOUBLE_PRECISION: return "doublePrecision";
        case ColumnType::NUMERIC: return "numeric";
        case ColumnType::TEXT: return "text";
        case ColumnType::VARCHAR: return "varchar";
        case ColumnType::CHAR: return "char";
        case ColumnType::BOOLEAN: return "boolean";
        case ColumnType::DATE: return "date";
        case ColumnType::TIME: return "time";
        case ColumnType::TIMESTAMP: return "timestamp";
        case ColumnType::JSON: return "json";
        case ColumnType::JSONB: return "jsonb";
        case ColumnType::UUID: return "uuid";
        case ColumnType::ENUM: return "enum";
        default: return "unknown";
    }
}

[[nodiscard]] ColumnType column_type_from_builder(std::string_view name);

[[nodiscard]] inline bool is_serial_type(ColumnType type) {
    return type == ColumnType::SMALLSERIAL || type == ColumnType::SERIAL ||
           type == ColumnType::BIGSERIAL;
}

[[nodiscard]] inline bool is_numeric_type(ColumnType type) {
    switch (type) {
        case ColumnType::SMALLINT:
        case ColumnType::INTEGER:
        case ColumnType::BIGINT:
        case ColumnType::SMALLSERIAL:
        case ColumnType::SERIAL:
        case ColumnType::BIGSERIAL:
        case ColumnType::REAL:
        case ColumnType::DOUBLE_PRECISION:
        case ColumnType::NUMERIC:
            return true;
        default:
            return false;
    }
}

} // namespace ormaudit
