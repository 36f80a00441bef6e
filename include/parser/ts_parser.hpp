#pragma once

#include "core/error.hpp"
#include "parser/ast.hpp"
#include "parser/source_file.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

extern "C" {
#include <tree_sitter/api.h>
}

namespace ormaudit {

/**
 * @brief Grammar used for a source file
 *
 * .ts/.mts/.cts files use the TypeScript grammar; everything else (.tsx,
 * .js, .jsx) uses TSX so JSX in JavaScript route files parses too.
 */
enum class SourceDialect {
    TYPESCRIPT,
    TSX
};

[[nodiscard]] SourceDialect dialect_for_path(std::string_view path);

/**
 * @brief TypeScript/TSX front end on tree-sitter
 *
 * Parses with tree-sitter-typescript and lowers the concrete syntax tree
 * into the analyzer's AST: declarations, imports and expression statements.
 * Statements nested in blocks, control flow and function bodies are kept in
 * the enclosing statement list so call chains anywhere in a file are found.
 * Syntax errors are recovered by tree-sitter; the regions it cannot make
 * sense of are lowered like any other unmodeled construct.
 *
 * A file nested deeper than kMaxNestingDepth syntax levels is rejected with
 * PARSE_ERROR before lowering, so the run skips it instead of exhausting
 * the stack.
 *
 * Thread-safety: one instance per thread; distinct instances are
 * independent.
 */
class TsParser {
public:
    static constexpr uint32_t kMaxNestingDepth = 1024;

    explicit TsParser(SourceDialect dialect);

    TsParser(const TsParser&) = delete;
    TsParser& operator=(const TsParser&) = delete;

    /**
     * @brief Parse text into a SourceFile
     * @return PARSE_ERROR when tree-sitter produces no tree or the nesting
     *         limit is exceeded, INTERNAL_ERROR when the grammar cannot be
     *         loaded
     */
    [[nodiscard]] Result<SourceFile> parse(std::string path, std::string content);

    /**
     * @brief Parse in-memory text with the dialect of its path
     */
    [[nodiscard]] static Result<SourceFile> parse_source(std::string path, std::string content);

    /**
     * @brief Read and parse a file
     * @return IO_ERROR when the file cannot be read, otherwise as parse()
     */
    [[nodiscard]] static Result<SourceFile> parse_file(const std::string& path);

private:
    std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser_;
    SourceDialect dialect_;
    bool language_loaded_ = false;
};

} // namespace ormaudit
