#include "sql/query_extractor.hpp"
#include "analyzer/chain_analyzer.hpp"
#include "core/parallel.hpp"
#include "core/utils.hpp"
#include "parser/ts_parser.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace ormaudit {

std::vector<ExtractedQuery> QueryExtractor::extract_queries(const SourceFile& file) const {
    std::vector<ExtractedQuery> queries;

    for (const auto& chain : analyze_file_chains(file, config_)) {
        auto generated = SqlSynthesizer::generate(chain, schema_);
        if (!generated) continue;

        ExtractedQuery q;
        q.type = generated->type;
        q.sql = std::move(generated->sql);
        q.tables = std::move(generated->tables);
        q.parameters = std::move(generated->parameters);
        q.location = file.location(chain.span.start);
        q.code = file.snippet(chain.span);
        queries.push_back(std::move(q));
    }

    return queries;
}

std::vector<ExtractedQuery> QueryExtractor::extract_queries(const std::string& path) const {
    auto parsed = TsParser::parse_file(path);
    if (parsed.is_error()) {
        utils::log::warn(std::format("Skipping {}: {}", path, parsed.error_message()));
        return {};
    }
    return extract_queries(parsed.value());
}

std::string resolve_project_path(const std::string& root, const std::string& file) {
    const fs::path p(file);
    if (p.is_absolute()) return p.string();
    return (fs::path(root) / p).string();
}

std::vector<std::string> find_route_files(const std::string& root, const AnalysisConfig& config) {
    std::vector<std::string> files;

    for (const auto& dir : config.route_dirs) {
        const fs::path routes = fs::path(root) / dir;
        std::error_code ec;
        if (!fs::is_directory(routes, ec)) continue;

        for (const auto& entry : fs::directory_iterator(routes, ec)) {
            if (!entry.is_regular_file(ec)) continue;
            const std::string name = entry.path().filename().string();
            const bool matches = std::ranges::any_of(config.extensions, [&](const std::string& ext) {
                return utils::ends_with(name, ext);
            });
            if (matches) files.push_back(entry.path().string());
        }
        if (ec) {
            utils::log::warn(std::format("Cannot list {}: {}", routes.string(), ec.message()));
        }
    }

    std::ranges::sort(files);
    return files;
}

std::vector<SqlExtractionResult> extract_sql_queries(const SqlExtractionOptions& options) {
    if (!options.schema) {
        utils::log::error("SQL extraction requires a loaded schema");
        return {};
    }

    std::vector<std::string> paths;
    if (options.files.empty()) {
        paths = find_route_files(options.root, options.analysis);
    } else {
        for (const auto& f : options.files) {
            paths.push_back(resolve_project_path(options.root, f));
        }
    }

    const QueryExtractor extractor(*options.schema, options.analysis);
    auto per_file = parallel_map_ordered(paths, options.analysis.workers,
        [&](const std::string& path) {
            std::error_code ec;
            if (!fs::exists(path, ec)) {
                utils::log::warn(std::format("Skipping {}: file not found", path));
                return std::vector<ExtractedQuery>{};
            }
            return extractor.extract_queries(path);
        });

    std::vector<SqlExtractionResult> results;
    for (size_t i = 0; i < paths.size(); ++i) {
        if (per_file[i].empty()) continue;
        results.push_back(SqlExtractionResult{paths[i], std::move(per_file[i])});
    }

    utils::log::info(std::format("Extracted SQL from {} of {} files", results.size(), paths.size()));
    return results;
}

} // namespace ormaudit
