#include "persistence/operation_extractor.hpp"
#include "core/utils.hpp"
#include "parser/ts_parser.hpp"

#include <format>

namespace ormaudit {

std::optional<DbOperation> to_db_operation(const ChainInfo& chain, const SourceFile& file) {
    if (chain.operation == StatementType::SELECT) return std::nullopt;

    DbOperation op;
    op.type = chain.operation;
    op.table_name = chain.table_name;
    op.handle = chain.handle;
    op.has_where = chain.has_where;
    op.location = file.location(chain.span.start);
    op.span = file.source_span(chain.span);

    const auto& payload = chain.operation == StatementType::INSERT ? chain.insert_values : chain.set_values;
    if (payload) {
        op.has_payload = true;
        op.column_values.reserve(payload->size());
        for (const auto& cv : *payload) {
            op.column_values.push_back(DbColumnValue{cv.column, cv.data_source, file.source_span(cv.span)});
        }
    }
    return op;
}

std::vector<DbOperation> extract_operations(const SourceFile& file, const AnalysisConfig& config) {
    std::vector<DbOperation> operations;
    for (const auto& chain : analyze_file_chains(file, config)) {
        if (auto op = to_db_operation(chain, file)) {
            operations.push_back(std::move(*op));
        }
    }
    return operations;
}

std::vector<DbOperation> extract_operations(const std::string& path, const AnalysisConfig& config) {
    auto parsed = TsParser::parse_file(path);
    if (parsed.is_error()) {
        utils::log::warn(std::format("Skipping {}: {}", path, parsed.error_message()));
        return {};
    }
    return extract_operations(parsed.value(), config);
}

} // namespace ormaudit
