#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include "parser/ast.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ormaudit {

// ============================================================================
// Data Source - where a value written to a column came from
// ============================================================================

enum class DataOrigin {
    LITERAL,
    EXTERNAL_FIELD,     // formData.get('x')
    ROUTE_PARAM,        // params.id
    REQUEST_BODY,       // body.x where body = await request.json()
    VARIABLE,
    UNKNOWN
};

[[nodiscard]] inline const char* data_origin_to_string(DataOrigin origin) {
    switch (origin) {
        case DataOrigin::LITERAL: return "literal";
        case DataOrigin::EXTERNAL_FIELD: return "formData";
        case DataOrigin::ROUTE_PARAM: return "params";
        case DataOrigin::REQUEST_BODY: return "body";
        case DataOrigin::VARIABLE: return "variable";
        case DataOrigin::UNKNOWN: return "unknown";
    }
    return "unknown";
}

/**
 * @brief Untrusted request data: form fields, route params, request body
 */
[[nodiscard]] inline bool is_external_origin(DataOrigin origin) {
    return origin == DataOrigin::EXTERNAL_FIELD || origin == DataOrigin::ROUTE_PARAM ||
           origin == DataOrigin::REQUEST_BODY;
}

struct DataSource {
    DataOrigin origin = DataOrigin::UNKNOWN;
    ScalarType scalar_type = ScalarType::UNKNOWN;
    std::optional<std::string> literal_value;
    std::optional<std::string> field_name;
    bool validated = false;

    bool operator==(const DataSource&) const = default;
};

// ============================================================================
// Data-flow passes
//
// Each pass is a pure function of the statements (and earlier pass
// results). analyze_data_flow() runs them in their required order:
//   1. request variables  (formData / json accessors)
//   2. validated set      (schema.parse(...) results)
//   3. source map         (declaration -> DataSource)
// ============================================================================

struct RequestVariables {
    std::unordered_set<std::string> form_data;     // const f = await request.formData()
    std::unordered_set<std::string> body;          // const b = await request.json()
};

using ValidatedSet = std::unordered_set<std::string>;
using SourceMap = std::unordered_map<std::string, DataSource>;

[[nodiscard]] RequestVariables collect_request_variables(
    const std::vector<ast::StmtPtr>& statements, const AnalysisConfig& config);

[[nodiscard]] ValidatedSet collect_validated_variables(
    const std::vector<ast::StmtPtr>& statements, const AnalysisConfig& config);

[[nodiscard]] SourceMap build_source_map(
    const std::vector<ast::StmtPtr>& statements,
    const RequestVariables& request_vars,
    const ValidatedSet& validated,
    const AnalysisConfig& config);

/**
 * @brief Facts of one file, fully populated before any value is classified
 */
struct DataFlowFacts {
    RequestVariables request_vars;
    ValidatedSet validated;
    SourceMap sources;
};

[[nodiscard]] DataFlowFacts analyze_data_flow(
    const std::vector<ast::StmtPtr>& statements, const AnalysisConfig& config);

// ============================================================================
// DataSourceClassifier
// ============================================================================

/**
 * @brief Classifies value expressions against one file's data-flow facts
 *
 * Rules, first match wins:
 *   1. <form>.get('f') / <form>.getAll('f')       -> EXTERNAL_FIELD, string
 *   2. params.x / params['x'] / params.get('x')   -> ROUTE_PARAM, string
 *      <body>.x                                   -> REQUEST_BODY, unknown
 *   3. string / number / boolean / null literal   -> LITERAL
 *   4. Number(e), parseInt(e), Boolean(e), ...    -> classify(e), type overridden
 *   5. identifier                                 -> validated / source map / VARIABLE
 *   6. <validated>.x                              -> VARIABLE, validated
 * Anything else is UNKNOWN.
 */
class DataSourceClassifier {
public:
    DataSourceClassifier(const DataFlowFacts& facts, const AnalysisConfig& config)
        : facts_(facts), config_(config) {}

    [[nodiscard]] DataSource classify(const ast::Expr& expr) const;

    /**
     * @brief Source of a variable by name (rule 5)
     */
    [[nodiscard]] DataSource classify_identifier(const std::string& name) const;

    /**
     * @brief Target type when expr is a call to a configured coercion wrapper
     */
    [[nodiscard]] std::optional<ScalarType> coercion_target(const ast::Expr& expr) const;

private:
    const DataFlowFacts& facts_;
    const AnalysisConfig& config_;
};

} // namespace ormaudit
