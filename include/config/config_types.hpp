#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ormaudit {

// ============================================================================
// Configuration Types
// ============================================================================

struct ProjectConfig {
    std::string root = ".";
    std::vector<std::string> files;   // Empty = every route file under route_dirs
};

struct SchemaConfig {
    std::optional<std::string> path;  // Discovered under project.root when absent
    std::vector<std::string> table_functions{"pgTable", "mysqlTable", "sqliteTable"};
    std::vector<std::string> enum_functions{"pgEnum", "mysqlEnum"};
};

struct AnalysisConfig {
    std::vector<std::string> db_handles{"db"};

    // `const f = await request.formData()` -> f.get() is an external field
    std::vector<std::string> request_accessors{"formData"};

    // `const body = await request.json()` -> body.x is request body data
    std::vector<std::string> body_accessors{"json"};

    std::vector<std::string> validation_methods{"parse", "safeParse", "parseAsync", "safeParseAsync"};

    std::unordered_map<std::string, ScalarType> coercions{
        {"Number", ScalarType::NUMBER},
        {"parseInt", ScalarType::NUMBER},
        {"parseFloat", ScalarType::NUMBER},
        {"Boolean", ScalarType::BOOLEAN},
    };

    std::vector<std::string> route_dirs{"app/routes"};
    std::vector<std::string> extensions{".ts", ".tsx"};
    size_t workers = 1;
};

enum class OutputFormat {
    TEXT,
    JSON
};

struct OutputConfig {
    OutputFormat format = OutputFormat::TEXT;
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Complete parsed ormaudit.toml
 */
struct AnalyzerConfig {
    ProjectConfig project;
    SchemaConfig schema;
    AnalysisConfig analysis;
    OutputConfig output;
    LoggingConfig logging;
};

} // namespace ormaudit
