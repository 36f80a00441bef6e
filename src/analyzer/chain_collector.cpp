#include "analyzer/chain_collector.hpp"
#include "parser/ast_helpers.hpp"

#include <algorithm>

namespace ormaudit {

using namespace ast;

std::vector<ChainSegment> ChainCollector::collect(const Expr& call_expr) {
    std::vector<ChainSegment> chain;

    const Expr* current = &call_expr;
    while (const auto* call = current->as<Call>()) {
        const auto* access = method_callee(*call);
        if (!access) break;

        ChainSegment seg;
        seg.receiver = access->object.get();
        seg.method = access->name;
        seg.args = &call->args;
        seg.call = current;
        chain.push_back(std::move(seg));

        current = access->object.get();
    }

    std::ranges::reverse(chain);
    return chain;
}

const Expr& ChainCollector::outermost_call(const Expr& call_expr, const ParentMap& parents) {
    const Expr* current = &call_expr;
    while (true) {
        const Expr* parent = parents.parent_of(*current);
        if (!parent) break;
        const auto* access = parent->as<PropertyAccess>();
        if (!access || access->object.get() != current) break;

        const Expr* grandparent = parents.parent_of(*parent);
        if (!grandparent) break;
        const auto* call = grandparent->as<Call>();
        if (!call || call->callee.get() != parent) break;

        current = grandparent;
    }
    return *current;
}

} // namespace ormaudit
