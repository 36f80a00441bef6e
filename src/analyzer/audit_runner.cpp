#include "analyzer/audit_runner.hpp"
#include "core/utils.hpp"
#include "persistence/persistence_validator.hpp"
#include "schema/schema_loader.hpp"
#include "sql/report_formatter.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace ormaudit {

AuditRunner::AuditRunner(AnalyzerConfig config) : config_(std::move(config)) {
    if (const auto level = utils::log::parse_level(config_.logging.level)) {
        utils::log::set_level(*level);
    } else {
        utils::log::warn(std::format("Unknown log level '{}', using info", config_.logging.level));
    }
}

Result<std::string> AuditRunner::resolve_schema_path() const {
    if (config_.schema.path) {
        return Result<std::string>::ok(resolve_project_path(config_.project.root, *config_.schema.path));
    }
    if (auto discovered = SchemaLoader::discover_schema_path(config_.project.root)) {
        utils::log::info(std::format("Discovered schema at {}", *discovered));
        return Result<std::string>::ok(std::move(*discovered));
    }
    return Result<std::string>::error(ErrorCategory::SCHEMA_ERROR,
        std::format("No Drizzle schema found under {}", config_.project.root));
}

Result<SchemaModel> AuditRunner::load_schema() const {
    auto path = resolve_schema_path();
    if (path.is_error()) {
        utils::log::error(path.error_message());
        return Result<SchemaModel>::propagate(path);
    }

    auto schema = SchemaLoader::load_schema(path.value(), config_.schema);
    if (schema.is_error()) {
        utils::log::error(schema.error_message());
    }
    return schema;
}

std::vector<std::string> AuditRunner::target_files() const {
    if (config_.project.files.empty()) {
        return find_route_files(config_.project.root, config_.analysis);
    }

    std::vector<std::string> files;
    files.reserve(config_.project.files.size());
    for (const auto& f : config_.project.files) {
        files.push_back(resolve_project_path(config_.project.root, f));
    }
    return files;
}

Result<AuditReport> AuditRunner::run() const {
    auto schema = load_schema();
    if (schema.is_error()) {
        return Result<AuditReport>::propagate(schema);
    }

    AuditReport report;
    report.schema_path = schema.value().path;

    const auto files = target_files();
    utils::log::info(std::format("Auditing {} files with {} worker(s)", files.size(), config_.analysis.workers));

    SqlExtractionOptions options;
    options.root = config_.project.root;
    options.files = files;
    options.schema = &schema.value();
    options.analysis = config_.analysis;
    report.queries = extract_sql_queries(options);

    report.issues = check_persistence(files, schema.value(), config_.analysis);
    if (!report.issues.empty()) {
        utils::log::warn(std::format("{} persistence issue(s) found", report.issues.size()));
    }

    return Result<AuditReport>::ok(std::move(report));
}

std::string AuditRunner::render(const AuditReport& report) const {
    const auto& root = config_.project.root;

    if (config_.output.format == OutputFormat::JSON) {
        nlohmann::json issues = nlohmann::json::array();
        for (const auto& issue : report.issues) {
            issues.push_back(issue_to_json(issue, root));
        }
        const nlohmann::json doc = {
            {"schema", relative_path(report.schema_path, root)},
            {"sql", format_sql_results_json(report.queries, root)},
            {"persistence", {{"totalIssues", report.issues.size()}, {"issues", std::move(issues)}}},
        };
        return doc.dump(2);
    }

    return std::format("{}\n\n{}", format_sql_results_text(report.queries, root),
                       format_issues(report.issues, root, OutputFormat::TEXT));
}

} // namespace ormaudit
