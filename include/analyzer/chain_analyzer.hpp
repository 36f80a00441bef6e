#pragma once

#include "analyzer/chain_collector.hpp"
#include "analyzer/data_source_classifier.hpp"
#include "analyzer/file_context.hpp"
#include "config/config_types.hpp"
#include "core/types.hpp"
#include "parser/source_file.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ormaudit {

// ============================================================================
// Chain IR
// ============================================================================

enum class ValueKind {
    LITERAL,
    PARAMETER,
    VARIABLE
};

/**
 * @brief A value as it will appear in SQL
 *
 * LITERAL values carry their text in `value` (cooked string, or number /
 * boolean as written). PARAMETER and VARIABLE values carry the source
 * expression in `source`.
 */
struct ValueInfo {
    ValueKind kind = ValueKind::PARAMETER;
    std::optional<std::string> value;
    std::optional<std::string> source;
    ScalarType data_type = ScalarType::UNKNOWN;
};

/**
 * @brief One `column: value` entry of a .values({...}) / .set({...}) payload
 */
struct ColumnValue {
    std::string column;
    ValueInfo value;
    DataSource data_source;
    ast::Span span;             // Value expression (key for shorthand)
};

struct WhereCondition {
    std::string column;
    std::string op;             // "=", "LIKE", "IS NULL", "IN", ...
    ValueInfo value;
};

enum class JoinKind {
    INNER,
    LEFT,
    RIGHT,
    FULL
};

[[nodiscard]] inline const char* join_kind_to_string(JoinKind kind) {
    switch (kind) {
        case JoinKind::INNER: return "INNER";
        case JoinKind::LEFT:  return "LEFT";
        case JoinKind::RIGHT: return "RIGHT";
        case JoinKind::FULL:  return "FULL";
    }
    return "INNER";
}

struct JoinOnCondition {
    std::string left_table;
    std::string left_column;
    std::string op;
    std::string right_table;
    std::string right_column;
};

struct JoinInfo {
    JoinKind kind = JoinKind::INNER;
    std::string table;
    std::vector<JoinOnCondition> on_conditions;
};

struct ColumnRef {
    std::string table;
    std::string column;
};

enum class SortDirection {
    ASC,
    DESC
};

/** @brief Sort key; table is empty when the key is a bare identifier */
struct OrderByItem {
    ColumnRef column;
    SortDirection direction = SortDirection::ASC;
};

/**
 * @brief Interpreted database call chain
 *
 * Built per chain and discarded after synthesis / validation. Table names
 * are source identifiers until resolve_aliases() maps renamed imports back
 * to their declared names.
 */
struct ChainInfo {
    StatementType operation = StatementType::SELECT;
    std::string table_name;
    std::string handle;                                 // Receiver of the anchor call

    std::optional<std::vector<std::string>> select_columns;
    std::optional<std::vector<ColumnValue>> insert_values;
    std::optional<std::vector<ColumnValue>> set_values;
    std::vector<WhereCondition> where_conditions;
    bool has_where = false;                             // Any .where(...) link, extractable or not
    std::vector<JoinInfo> joins;
    std::vector<ColumnRef> group_by;
    std::vector<OrderByItem> order_by;
    std::optional<double> limit;
    std::optional<double> offset;

    ast::Span span;                                     // Outermost call of the chain
};

// ============================================================================
// ChainAnalyzer
// ============================================================================

/**
 * @brief Interprets collected chains of one file
 *
 * Holds references to the file and its precomputed context; an instance is
 * cheap and lives for one file.
 */
class ChainAnalyzer {
public:
    ChainAnalyzer(const SourceFile& file, const FileContext& context,
                  const DataSourceClassifier& classifier)
        : file_(file), context_(context), classifier_(classifier) {}

    /**
     * @brief Interpret a segment list
     * @return std::nullopt when no select/insert/update/delete is applied to a
     *         database handle, or the target table cannot be named
     */
    [[nodiscard]] std::optional<ChainInfo> analyze(const std::vector<ChainSegment>& segments) const;

    /**
     * @brief Analyze the chain containing any call of it
     *
     * The terminal call, the anchor call and the payload call of one chain
     * all produce the same ChainInfo.
     */
    [[nodiscard]] std::optional<ChainInfo> analyze_call(
        const ast::Expr& call_expr, const ast::ParentMap& parents) const;

    /**
     * @brief Value of an expression for SQL rendering
     */
    [[nodiscard]] ValueInfo analyze_value(const ast::Expr& expr) const;

private:
    [[nodiscard]] std::vector<ColumnValue> extract_column_values(const ast::Expr& arg) const;
    [[nodiscard]] std::vector<WhereCondition> extract_where(const ast::Expr& expr) const;

    const SourceFile& file_;
    const FileContext& context_;
    const DataSourceClassifier& classifier_;
};

/**
 * @brief Map renamed-import table names back to their declared names
 *
 * Applies to the main table, join targets, join ON tables and GROUP BY
 * tables. Names without an alias are kept.
 */
[[nodiscard]] ChainInfo resolve_aliases(ChainInfo chain,
                                        const std::unordered_map<std::string, std::string>& aliases);

/**
 * @brief Every database chain in a file, aliases resolved
 *
 * One entry per outermost chain call, in source order, deduplicated by
 * line and column.
 */
[[nodiscard]] std::vector<ChainInfo> analyze_file_chains(const SourceFile& file,
                                                         const AnalysisConfig& config);

} // namespace ormaudit
