#pragma once

#include "analyzer/chain_analyzer.hpp"
#include "analyzer/data_source_classifier.hpp"
#include "config/config_types.hpp"
#include "core/types.hpp"
#include "parser/source_file.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ormaudit {

/**
 * @brief A column written by an insert/update and where its value came from
 */
struct DbColumnValue {
    std::string column_name;
    DataSource data_source;
    SourceSpan span;

    bool operator==(const DbColumnValue&) const = default;
};

/**
 * @brief Write operation (insert/update/delete) found in a file
 */
struct DbOperation {
    StatementType type = StatementType::INSERT;
    std::string table_name;                 // Declared table name, aliases resolved
    std::string handle;                     // "db", "tx", ...
    std::vector<DbColumnValue> column_values;
    bool has_payload = false;               // .values({...}) / .set({...}) was an object literal
    bool has_where = false;
    SourceLocation location;
    SourceSpan span;

    bool operator==(const DbOperation&) const = default;
};

/**
 * @brief Build a DbOperation from an analyzed chain
 * @return std::nullopt for select chains
 */
[[nodiscard]] std::optional<DbOperation> to_db_operation(const ChainInfo& chain, const SourceFile& file);

/**
 * @brief Every insert/update/delete in a parsed file, in source order
 */
[[nodiscard]] std::vector<DbOperation> extract_operations(const SourceFile& file,
                                                          const AnalysisConfig& config);

/**
 * @brief Read, parse and extract; an unreadable file yields no operations
 */
[[nodiscard]] std::vector<DbOperation> extract_operations(const std::string& path,
                                                          const AnalysisConfig& config);

} // namespace ormaudit
