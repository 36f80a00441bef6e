#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include "parser/source_file.hpp"
#include "schema/schema_model.hpp"
#include "sql/sql_synthesizer.hpp"

#include <string>
#include <vector>

namespace ormaudit {

/**
 * @brief One synthesized statement and where it was written
 */
struct ExtractedQuery {
    StatementType type = StatementType::SELECT;
    std::string sql;
    std::vector<std::string> tables;
    SourceLocation location;            // Start of the outermost chain call
    std::string code;                   // Chain text, whitespace collapsed
    std::vector<QueryParameter> parameters;

    bool operator==(const ExtractedQuery&) const = default;
};

/**
 * @brief Per-file query extraction against a loaded schema
 *
 * Holds references only; the schema and config must outlive the extractor.
 * extract_queries() is const and safe to call from several threads.
 */
class QueryExtractor {
public:
    QueryExtractor(const SchemaModel& schema, const AnalysisConfig& config)
        : schema_(schema), config_(config) {}

    /**
     * @brief Every query in a parsed file, in source order
     */
    [[nodiscard]] std::vector<ExtractedQuery> extract_queries(const SourceFile& file) const;

    /**
     * @brief Read, parse and extract; an unreadable file yields no queries
     */
    [[nodiscard]] std::vector<ExtractedQuery> extract_queries(const std::string& path) const;

private:
    const SchemaModel& schema_;
    const AnalysisConfig& config_;
};

// ============================================================================
// Project-level extraction
// ============================================================================

struct SqlExtractionOptions {
    std::string root = ".";
    std::vector<std::string> files;     // Empty = route files under analysis.route_dirs
    const SchemaModel* schema = nullptr;
    AnalysisConfig analysis;
};

struct SqlExtractionResult {
    std::string file;                   // Absolute or root-joined path
    std::vector<ExtractedQuery> queries;
};

/**
 * @brief Extract queries from every requested file
 *
 * Relative paths resolve against the root. Missing files are skipped, and
 * only files with at least one query are reported. Files are spread over
 * analysis.workers threads; results keep input order.
 */
[[nodiscard]] std::vector<SqlExtractionResult> extract_sql_queries(const SqlExtractionOptions& options);

/**
 * @brief Direct children of each route directory with a configured extension, sorted
 */
[[nodiscard]] std::vector<std::string> find_route_files(const std::string& root,
                                                        const AnalysisConfig& config);

/**
 * @brief Resolve a file argument against the project root
 */
[[nodiscard]] std::string resolve_project_path(const std::string& root, const std::string& file);

} // namespace ormaudit
