#include "parser/ast_walker.hpp"

namespace ormaudit::ast {

namespace {

template<class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };

void walk_statement(const Stmt& stmt, const Visitor& visitor) {
    std::visit(Overloaded{
        [&](const VariableDeclaration& decl) {
            for (const auto& d : decl.declarators) {
                if (visitor.on_declarator) visitor.on_declarator(d);
                if (d.init) walk_expression(*d.init, visitor);
            }
        },
        [&](const ImportDeclaration& decl) {
            if (visitor.on_import) visitor.on_import(decl);
        },
        [&](const ExpressionStatement& es) {
            if (es.expr) walk_expression(*es.expr, visitor);
        },
    }, stmt.node);
}

} // anonymous namespace

void walk(const std::vector<StmtPtr>& statements, const Visitor& visitor) {
    for (const auto& stmt : statements) {
        if (stmt) walk_statement(*stmt, visitor);
    }
}

void for_each_child(const Expr& expr, const std::function<void(const Expr&)>& fn) {
    const auto visit_ptr = [&](const ExprPtr& p) {
        if (p) fn(*p);
    };

    std::visit(Overloaded{
        [&](const Call& n) {
            visit_ptr(n.callee);
            for (const auto& a : n.args) visit_ptr(a);
        },
        [&](const PropertyAccess& n) { visit_ptr(n.object); },
        [&](const ElementAccess& n) {
            visit_ptr(n.object);
            visit_ptr(n.index);
        },
        [&](const ObjectLiteral& n) {
            for (const auto& p : n.properties) visit_ptr(p.value);
        },
        [&](const ArrayLiteral& n) {
            for (const auto& e : n.elements) visit_ptr(e);
        },
        [&](const Await& n) { visit_ptr(n.operand); },
        [&](const Function& n) { visit_ptr(n.expression_body); },
        [&](const Opaque& n) {
            for (const auto& c : n.children) visit_ptr(c);
        },
        [](const auto&) {},
    }, expr.node);
}

void walk_expression(const Expr& expr, const Visitor& visitor, const Expr* parent) {
    if (visitor.on_expression) visitor.on_expression(expr, parent);

    for_each_child(expr, [&](const Expr& child) {
        walk_expression(child, visitor, &expr);
    });

    // Statement bodies come after the child expressions
    if (const auto* fn = expr.as<Function>()) {
        walk(fn->body, visitor);
    } else if (const auto* opaque = expr.as<Opaque>()) {
        walk(opaque->body, visitor);
    }
}

// ============================================================================
// ParentMap
// ============================================================================

ParentMap::ParentMap(const std::vector<StmtPtr>& statements) {
    Visitor visitor;
    visitor.on_expression = [this](const Expr& expr, const Expr* parent) {
        if (parent) parents_.emplace(&expr, parent);
    };
    walk(statements, visitor);
}

const Expr* ParentMap::parent_of(const Expr& expr) const {
    const auto it = parents_.find(&expr);
    return it != parents_.end() ? it->second : nullptr;
}

} // namespace ormaudit::ast
