#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include "sql/query_extractor.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace ormaudit {

// ============================================================================
// Report formatting (pure, no I/O)
// ============================================================================

/**
 * @brief Human-readable query listing
 *
 *   Found 2 SQL queries:
 *
 *   File: app/routes/users.tsx:12:9
 *     SELECT * FROM users WHERE id = $1
 *     Parameters:
 *       $1: params.id (serial)
 *
 * Paths are printed relative to root.
 */
[[nodiscard]] std::string format_sql_results_text(const std::vector<SqlExtractionResult>& results,
                                                  const std::string& root);

/**
 * @brief {"totalQueries": N, "queries": [...]} with root-relative file paths
 */
[[nodiscard]] nlohmann::json format_sql_results_json(const std::vector<SqlExtractionResult>& results,
                                                     const std::string& root);

/**
 * @brief Render query results in the requested format (JSON pretty-printed)
 */
[[nodiscard]] std::string synthesize_sql(const std::vector<SqlExtractionResult>& results,
                                         const std::string& root, OutputFormat format);

[[nodiscard]] nlohmann::json issue_to_json(const Issue& issue, const std::string& root);

/**
 * @brief Render issues, one `file:line:col [severity] message` block each
 */
[[nodiscard]] std::string format_issues(const std::vector<Issue>& issues, const std::string& root,
                                        OutputFormat format);

/**
 * @brief Path relative to root, or unchanged when it cannot be made relative
 */
[[nodiscard]] std::string relative_path(const std::string& path, const std::string& root);

} // namespace ormaudit
