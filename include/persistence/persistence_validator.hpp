#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include "persistence/operation_extractor.hpp"
#include "schema/schema_model.hpp"

#include <string>
#include <vector>

namespace ormaudit {

/**
 * @brief Checks write operations against the schema
 *
 * Rules, applied per operation whose table the schema knows:
 *   - insert without a required column (one issue per column)
 *   - enum column fed unvalidated request data
 *   - numeric/boolean column fed a raw request string
 *
 * Columns the schema does not declare are skipped. Issues are never
 * auto-fixable.
 */
class PersistenceValidator {
public:
    [[nodiscard]] static std::vector<Issue> validate(const std::vector<DbOperation>& operations,
                                                     const SchemaModel& schema);

    [[nodiscard]] static std::vector<Issue> validate_operation(const DbOperation& operation,
                                                               const SchemaModel& schema);
};

/**
 * @brief Extract and validate every file; unreadable files are skipped
 *
 * Runs on config.workers threads; issues keep file order.
 */
[[nodiscard]] std::vector<Issue> check_persistence(const std::vector<std::string>& files,
                                                   const SchemaModel& schema,
                                                   const AnalysisConfig& config);

} // namespace ormaudit
