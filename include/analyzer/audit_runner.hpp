#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "schema/schema_model.hpp"
#include "sql/query_extractor.hpp"

#include <string>
#include <vector>

namespace ormaudit {

/**
 * @brief Everything one audit run found
 */
struct AuditReport {
    std::string schema_path;
    std::vector<SqlExtractionResult> queries;
    std::vector<Issue> issues;
};

/**
 * @brief Runs SQL extraction and persistence checks for one configured project
 *
 * Schema problems are fatal and come back as SCHEMA_ERROR; per-file
 * problems only shrink the report.
 */
class AuditRunner {
public:
    explicit AuditRunner(AnalyzerConfig config);

    /**
     * @brief Configured schema path (relative to project.root) or the discovered one
     */
    [[nodiscard]] Result<std::string> resolve_schema_path() const;

    [[nodiscard]] Result<SchemaModel> load_schema() const;

    /**
     * @brief project.files resolved against the root, or every route file
     */
    [[nodiscard]] std::vector<std::string> target_files() const;

    [[nodiscard]] Result<AuditReport> run() const;

    /**
     * @brief Text: query listing then issue listing. JSON: {"sql": ..., "persistence": ...}
     */
    [[nodiscard]] std::string render(const AuditReport& report) const;

    [[nodiscard]] const AnalyzerConfig& config() const { return config_; }

private:
    AnalyzerConfig config_;
};

} // namespace ormaudit
