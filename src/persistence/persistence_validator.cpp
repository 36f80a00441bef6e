#include "persistence/persistence_validator.hpp"
#include "core/parallel.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <iterator>
#include <system_error>
#include <unordered_set>

namespace ormaudit {

namespace {

Issue make_issue(const DbOperation& op, std::string message, std::string code, std::string suggestion) {
    Issue issue;
    issue.category = kPersistenceCategory;
    issue.severity = Severity::ERROR;
    issue.message = std::move(message);
    issue.location = op.location;
    issue.code = std::move(code);
    issue.suggestion = std::move(suggestion);
    return issue;
}

std::string value_code(const DbColumnValue& cv) {
    const auto& src = cv.data_source;
    return std::format("{}: {}.get('{}')", cv.column_name, data_origin_to_string(src.origin),
                       src.field_name.value_or(cv.column_name));
}

void check_missing_required(const DbOperation& op, const Table& table, std::vector<Issue>& out) {
    // Without an object-literal payload the written columns are unknown
    if (!op.has_payload) return;

    std::unordered_set<std::string> provided;
    for (const auto& cv : op.column_values) {
        provided.insert(cv.column_name);
    }

    for (const Column* col : table.required_columns()) {
        if (provided.contains(col->name)) continue;
        out.push_back(make_issue(op,
            std::format("{}.insert({}) missing required column '{}'", op.handle, op.table_name, col->name),
            std::format("{}.insert({}).values({{...}})", op.handle, op.table_name),
            std::format("Add '{}' to the values object", col->name)));
    }
}

void check_enum_input(const DbOperation& op, const DbColumnValue& cv, const Column& column,
                      const SchemaModel& schema, std::vector<Issue>& out) {
    const auto& src = cv.data_source;
    if (src.validated || !is_external_origin(src.origin)) return;

    std::string allowed;
    if (const auto* e = schema.find_enum(*column.enum_ref)) {
        for (const auto& v : e->values) {
            if (!allowed.empty()) allowed += ", ";
            allowed += std::format("'{}'", v);
        }
    }
    if (allowed.empty()) allowed = "enum values";

    out.push_back(make_issue(op,
        std::format("Enum column '{}' receives unvalidated external input", column.name),
        value_code(cv),
        std::format("Validate with zod schema or check against allowed values: {}", allowed)));
}

void check_type_mismatch(const DbOperation& op, const DbColumnValue& cv, const Column& column,
                         std::vector<Issue>& out) {
    const auto& src = cv.data_source;
    if (src.validated || src.scalar_type != ScalarType::STRING) return;
    if (src.origin != DataOrigin::EXTERNAL_FIELD && src.origin != DataOrigin::ROUTE_PARAM) return;

    const char* origin = data_origin_to_string(src.origin);
    const std::string& name = cv.column_name;

    if (column.is_numeric()) {
        out.push_back(make_issue(op,
            std::format("Column '{}' expects {} but receives string from {}.get()",
                        column.name, column_type_to_string(column.type), origin),
            value_code(cv),
            std::format("Convert with parseInt({}, 10) or Number({})", name, name)));
    } else if (column.type == ColumnType::BOOLEAN) {
        out.push_back(make_issue(op,
            std::format("Column '{}' expects boolean but receives string from {}.get()", column.name, origin),
            value_code(cv),
            std::format("Convert with Boolean({}) or {} === 'true'", name, name)));
    }
}

} // anonymous namespace

// ============================================================================
// PersistenceValidator
// ============================================================================

std::vector<Issue> PersistenceValidator::validate_operation(const DbOperation& operation,
                                                            const SchemaModel& schema) {
    std::vector<Issue> issues;

    const Table* table = schema.find_table(operation.table_name);
    if (!table) return issues;

    if (operation.type == StatementType::INSERT) {
        check_missing_required(operation, *table, issues);
    }

    for (const auto& cv : operation.column_values) {
        const Column* column = table->find_column(cv.column_name);
        if (!column) continue;

        if (column->is_enum()) {
            check_enum_input(operation, cv, *column, schema, issues);
        }
        check_type_mismatch(operation, cv, *column, issues);
    }

    return issues;
}

std::vector<Issue> PersistenceValidator::validate(const std::vector<DbOperation>& operations,
                                                  const SchemaModel& schema) {
    std::vector<Issue> issues;
    for (const auto& op : operations) {
        auto op_issues = validate_operation(op, schema);
        issues.insert(issues.end(), std::make_move_iterator(op_issues.begin()),
                      std::make_move_iterator(op_issues.end()));
    }
    return issues;
}

std::vector<Issue> check_persistence(const std::vector<std::string>& files, const SchemaModel& schema,
                                     const AnalysisConfig& config) {
    auto per_file = parallel_map_ordered(files, config.workers, [&](const std::string& path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            utils::log::warn(std::format("Skipping {}: file not found", path));
            return std::vector<Issue>{};
        }
        return PersistenceValidator::validate(extract_operations(path, config), schema);
    });

    std::vector<Issue> issues;
    for (auto& file_issues : per_file) {
        issues.insert(issues.end(), std::make_move_iterator(file_issues.begin()),
                      std::make_move_iterator(file_issues.end()));
    }
    return issues;
}

} // namespace ormaudit
