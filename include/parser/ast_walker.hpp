#pragma once

#include "parser/ast.hpp"

#include <functional>
#include <unordered_map>
#include <vector>

namespace ormaudit::ast {

/**
 * @brief Callbacks for a depth-first, pre-order walk
 *
 * Any callback may be left empty. Function bodies are walked
 * like top-level code.
 */
struct Visitor {
    std::function<void(const Expr& expr, const Expr* parent)> on_expression;
    std::function<void(const VariableDeclarator& decl)> on_declarator;
    std::function<void(const ImportDeclaration& decl)> on_import;
};

void walk(const std::vector<StmtPtr>& statements, const Visitor& visitor);

void walk_expression(const Expr& expr, const Visitor& visitor, const Expr* parent = nullptr);

/**
 * @brief Invoke fn on every direct child expression of expr, in source order
 *
 * Nested function bodies are not children.
 */
void for_each_child(const Expr& expr, const std::function<void(const Expr&)>& fn);

/**
 * @brief Child-to-parent index over every expression in a statement list
 *
 * Expressions directly under a statement have no parent.
 */
class ParentMap {
public:
    explicit ParentMap(const std::vector<StmtPtr>& statements);

    [[nodiscard]] const Expr* parent_of(const Expr& expr) const;

    [[nodiscard]] size_t size() const { return parents_.size(); }

private:
    std::unordered_map<const Expr*, const Expr*> parents_;
};

} // namespace ormaudit::ast
