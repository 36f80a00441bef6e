#pragma once

#include "core/types.hpp"
#include "parser/ast.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ormaudit {

/**
 * @brief A parsed TypeScript/JavaScript file: text, statements, line index
 *
 * Owns the source buffer; every ast::Span refers into it.
 */
class SourceFile {
public:
    SourceFile(std::string path, std::string content);

    SourceFile(SourceFile&&) noexcept = default;
    SourceFile& operator=(SourceFile&&) noexcept = default;
    SourceFile(const SourceFile&) = delete;
    SourceFile& operator=(const SourceFile&) = delete;

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] const std::string& content() const { return content_; }
    [[nodiscard]] const std::vector<ast::StmtPtr>& statements() const { return statements_; }

    void set_statements(std::vector<ast::StmtPtr> statements) {
        statements_ = std::move(statements);
    }

    /**
     * @brief Raw text of a span
     */
    [[nodiscard]] std::string_view text(ast::Span span) const;

    /**
     * @brief Span text with whitespace runs collapsed (report snippets)
     */
    [[nodiscard]] std::string snippet(ast::Span span) const;

    /**
     * @brief 1-based line/column of a byte offset
     */
    [[nodiscard]] SourceLocation location(uint32_t offset) const;

    [[nodiscard]] SourceSpan source_span(ast::Span span) const;

private:
    std::string path_;
    std::string content_;
    std::vector<uint32_t> line_starts_;
    std::vector<ast::StmtPtr> statements_;
};

} // namespace ormaudit
