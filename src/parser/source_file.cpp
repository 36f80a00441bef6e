#include "parser/source_file.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace ormaudit {

SourceFile::SourceFile(std::string path, std::string content)
    : path_(std::move(path)), content_(std::move(content)) {
    line_starts_.push_back(0);
    for (size_t i = 0; i < content_.size(); ++i) {
        if (content_[i] == '\n') {
            line_starts_.push_back(static_cast<uint32_t>(i + 1));
        }
    }
}

std::string_view SourceFile::text(ast::Span span) const {
    const size_t start = std::min<size_t>(span.start, content_.size());
    const size_t end = std::clamp<size_t>(span.end, start, content_.size());
    return std::string_view(content_).substr(start, end - start);
}

std::string SourceFile::snippet(ast::Span span) const {
    return utils::collapse_whitespace(text(span));
}

SourceLocation SourceFile::location(uint32_t offset) const {
    const auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    const auto line_index = static_cast<uint32_t>(std::distance(line_starts_.begin(), it) - 1);

    SourceLocation loc;
    loc.file = path_;
    loc.line = line_index + 1;
    loc.column = offset - line_starts_[line_index] + 1;
    return loc;
}

SourceSpan SourceFile::source_span(ast::Span span) const {
    const SourceLocation loc = location(span.start);
    SourceSpan out;
    out.file = path_;
    out.start = span.start;
    out.end = span.end;
    out.line = loc.line;
    out.column = loc.column;
    return out;
}

} // namespace ormaudit
