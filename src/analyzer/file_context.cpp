#include "analyzer/file_context.hpp"
#include "parser/ast_helpers.hpp"
#include "parser/ast_walker.hpp"

#include <algorithm>

namespace ormaudit {

using namespace ast;

FileContext FileContext::build(const SourceFile& file, const AnalysisConfig& config) {
    FileContext ctx;
    ctx.handles.insert(config.db_handles.begin(), config.db_handles.end());

    const auto is_configured_handle = [&](const std::string& name) {
        return std::ranges::find(config.db_handles, name) != config.db_handles.end();
    };

    Visitor imports;
    imports.on_import = [&](const ImportDeclaration& decl) {
        for (const auto& spec : decl.named) {
            if (is_configured_handle(spec.imported) || is_configured_handle(spec.local)) {
                ctx.handles.insert(spec.local);
            }
            if (spec.renamed) {
                ctx.import_aliases.insert_or_assign(spec.local, spec.imported);
            }
        }
    };
    walk(file.statements(), imports);

    // <handle>.transaction(async (tx) => ...) makes tx a handle, and so does
    // a function expression callback. Repeat for nested transactions until
    // nothing new turns up.
    bool changed = true;
    while (changed) {
        changed = false;
        Visitor transactions;
        transactions.on_expression = [&](const Expr& expr, const Expr*) {
            const auto* call = expr.as<Call>();
            if (!call || call->args.empty()) return;
            const auto* access = method_callee(*call);
            if (!access || access->name != "transaction") return;
            const auto* receiver = identifier_name(*access->object);
            if (!receiver || !ctx.handles.contains(*receiver)) return;

            const auto* callback = call->args.front()->as<Function>();
            if (!callback || callback->params.empty() || callback->params.front().empty()) return;
            if (ctx.handles.insert(callback->params.front()).second) {
                changed = true;
            }
        };
        walk(file.statements(), transactions);
    }

    return ctx;
}

} // namespace ormaudit
