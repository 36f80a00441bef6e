#pragma once

#include "analyzer/chain_analyzer.hpp"
#include "core/types.hpp"
#include "schema/schema_model.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ormaudit {

/**
 * @brief A `$n` placeholder of synthesized SQL
 */
struct QueryParameter {
    int position = 0;                           // 1-based
    std::string source;                         // Source expression text
    std::optional<std::string> column_type;     // Schema type of the target column

    bool operator==(const QueryParameter&) const = default;
};

struct GeneratedSql {
    StatementType type = StatementType::SELECT;
    std::string sql;
    std::vector<std::string> tables;            // Main table first, then join targets
    std::vector<QueryParameter> parameters;
};

/**
 * @brief Renders a ChainInfo as SQL
 *
 * Clause order is fixed whatever order the chain called them in:
 *
 *   SELECT cols|* FROM t [KIND JOIN t2 ON a.x = b.y]* [WHERE ...]
 *       [GROUP BY t.c, ...] [ORDER BY c ASC|DESC, ...] [LIMIT n] [OFFSET n]
 *   INSERT INTO t (c, ...) VALUES (v, ...)
 *   UPDATE t SET c = v, ... [WHERE ...]
 *   DELETE FROM t [WHERE ...]
 *
 * Table and column names use their declared SQL names when the schema
 * knows them. String literals are quoted, null is NULL, numbers and
 * booleans are inlined; every other value becomes `$n`, numbered in order
 * of appearance.
 */
class SqlSynthesizer {
public:
    /**
     * @return std::nullopt for an insert/update without an extractable payload
     */
    [[nodiscard]] static std::optional<GeneratedSql> generate(
        const ChainInfo& chain, const SchemaModel& schema);
};

} // namespace ormaudit
