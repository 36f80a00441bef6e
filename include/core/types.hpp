#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ormaudit {

// ============================================================================
// Basic Enums
// ============================================================================

enum class StatementType {
    SELECT,
    INSERT,
    UPDATE,
    DELETE
};

[[nodiscard]] inline const char* statement_type_to_string(StatementType type) {
    switch (type) {
        case StatementType::SELECT: return "SELECT";
        case StatementType::INSERT: return "INSERT";
        case StatementType::UPDATE: return "UPDATE";
        case StatementType::DELETE: return "DELETE";
    }
    return "UNKNOWN";
}

enum class Severity {
    ERROR,
    WARNING
};

[[nodiscard]] inline const char* severity_to_string(Severity severity) {
    return severity == Severity::ERROR ? "error" : "warning";
}

/**
 * @brief Runtime type a value is known to have at a database write
 */
enum class ScalarType {
    STRING,
    NUMBER,
    BOOLEAN,
    NULL_VALUE,
    UNKNOWN
};

[[nodiscard]] inline const char* scalar_type_to_string(ScalarType type) {
    switch (type) {
        case ScalarType::STRING: return "string";
        case ScalarType::NUMBER: return "number";
        case ScalarType::BOOLEAN: return "boolean";
        case ScalarType::NULL_VALUE: return "null";
        case ScalarType::UNKNOWN: return "unknown";
    }
    return "unknown";
}

// ============================================================================
// Source Positions
// ============================================================================

/**
 * @brief 1-based position of a construct in a source file
 */
struct SourceLocation {
    std::string file;
    uint32_t line = 0;
    uint32_t column = 0;

    bool operator==(const SourceLocation&) const = default;
};

/**
 * @brief Byte range of a sub-expression, plus its display position
 *
 * start/end are 0-based byte offsets (end exclusive); line/column are 1-based.
 */
struct SourceSpan {
    std::string file;
    uint32_t start = 0;
    uint32_t end = 0;
    uint32_t line = 0;
    uint32_t column = 0;

    bool operator==(const SourceSpan&) const = default;
};

// ============================================================================
// Issues
// ============================================================================

inline constexpr const char* kPersistenceCategory = "persistence";

struct Issue {
    std::string category = kPersistenceCategory;
    Severity severity = Severity::ERROR;
    std::string message;
    SourceLocation location;
    std::string code;           // Offending source shape
    std::string suggestion;
};

} // namespace ormaudit
