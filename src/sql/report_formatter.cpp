#include "sql/report_formatter.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace ormaudit {

std::string relative_path(const std::string& path, const std::string& root) {
    std::error_code ec;
    const fs::path base = fs::absolute(root, ec);
    if (ec) return path;
    const fs::path target = fs::absolute(path, ec);
    if (ec) return path;

    const fs::path rel = target.lexically_normal().lexically_relative(base.lexically_normal());
    if (rel.empty()) return path;
    return rel.generic_string();
}

// ============================================================================
// SQL query reports
// ============================================================================

std::string format_sql_results_text(const std::vector<SqlExtractionResult>& results, const std::string& root) {
    size_t total = 0;
    for (const auto& r : results) total += r.queries.size();
    if (total == 0) {
        return "No SQL queries found.";
    }

    std::vector<std::string> lines;
    lines.push_back(std::format("Found {} SQL {}:\n", total, total == 1 ? "query" : "queries"));

    for (const auto& result : results) {
        const std::string rel = relative_path(result.file, root);
        for (const auto& q : result.queries) {
            lines.push_back(std::format("File: {}:{}:{}", rel, q.location.line, q.location.column));
            lines.push_back(std::format("  {}", q.sql));

            if (!q.parameters.empty()) {
                lines.emplace_back("  Parameters:");
                for (const auto& p : q.parameters) {
                    const std::string type_info = p.column_type ? std::format(" ({})", *p.column_type) : "";
                    lines.push_back(std::format("    ${}: {}{}", p.position, p.source, type_info));
                }
            }
            lines.emplace_back();
        }
    }

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

nlohmann::json format_sql_results_json(const std::vector<SqlExtractionResult>& results, const std::string& root) {
    nlohmann::json queries = nlohmann::json::array();

    for (const auto& result : results) {
        for (const auto& q : result.queries) {
            nlohmann::json params = nlohmann::json::array();
            for (const auto& p : q.parameters) {
                nlohmann::json jp = {{"position", p.position}, {"source", p.source}};
                if (p.column_type) jp["columnType"] = *p.column_type;
                params.push_back(std::move(jp));
            }

            queries.push_back({
                {"type", utils::to_lower(statement_type_to_string(q.type))},
                {"sql", q.sql},
                {"tables", q.tables},
                {"location", {
                    {"file", relative_path(q.location.file, root)},
                    {"line", q.location.line},
                    {"column", q.location.column},
                }},
                {"code", q.code},
                {"parameters", std::move(params)},
            });
        }
    }

    return {{"totalQueries", queries.size()}, {"queries", std::move(queries)}};
}

std::string synthesize_sql(const std::vector<SqlExtractionResult>& results, const std::string& root,
                           OutputFormat format) {
    if (format == OutputFormat::JSON) {
        return format_sql_results_json(results, root).dump(2);
    }
    return format_sql_results_text(results, root);
}

// ============================================================================
// Issue reports
// ============================================================================

nlohmann::json issue_to_json(const Issue& issue, const std::string& root) {
    return {
        {"category", issue.category},
        {"severity", severity_to_string(issue.severity)},
        {"message", issue.message},
        {"location", {
            {"file", relative_path(issue.location.file, root)},
            {"line", issue.location.line},
            {"column", issue.location.column},
        }},
        {"code", issue.code},
        {"suggestion", issue.suggestion},
    };
}

std::string format_issues(const std::vector<Issue>& issues, const std::string& root, OutputFormat format) {
    if (format == OutputFormat::JSON) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& issue : issues) {
            arr.push_back(issue_to_json(issue, root));
        }
        return nlohmann::json{{"totalIssues", issues.size()}, {"issues", std::move(arr)}}.dump(2);
    }

    if (issues.empty()) {
        return "No persistence issues found.";
    }

    std::string out;
    for (const auto& issue : issues) {
        out += std::format("{}:{}:{} [{}] {}\n", relative_path(issue.location.file, root),
                           issue.location.line, issue.location.column,
                           severity_to_string(issue.severity), issue.message);
        if (!issue.code.empty()) out += std::format("  code: {}\n", issue.code);
        if (!issue.suggestion.empty()) out += std::format("  suggestion: {}\n", issue.suggestion);
    }
    return out;
}

} // namespace ormaudit
