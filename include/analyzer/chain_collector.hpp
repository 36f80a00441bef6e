#pragma once

#include "parser/ast.hpp"
#include "parser/ast_walker.hpp"

#include <string>
#include <vector>

namespace ormaudit {

/**
 * @brief One `receiver.method(args)` link of a method chain
 */
struct ChainSegment {
    const ast::Expr* receiver = nullptr;            // Object the method is called on
    std::string method;
    const std::vector<ast::ExprPtr>* args = nullptr;
    const ast::Expr* call = nullptr;                // The call expression itself
};

/**
 * @brief Collects method chains such as
 *
 *   db.select().from(users).where(eq(users.id, 1)).limit(10)
 *
 * into segments ordered from the innermost receiver outward, so segment 0
 * is the first method applied (`select` on `db` above).
 */
class ChainCollector {
public:
    /**
     * @brief Segments of the chain ending at call_expr, unwinding receivers
     *
     * Stops at the first receiver that is not itself `x.method(...)`.
     * Empty when call_expr is not a method call.
     */
    [[nodiscard]] static std::vector<ChainSegment> collect(const ast::Expr& call_expr);

    /**
     * @brief The last call of the chain call_expr belongs to
     *
     * Climbs while the expression is the receiver of a further method call,
     * so `db.insert(t)` inside `db.insert(t).values({...}).returning()`
     * yields the `returning()` call.
     */
    [[nodiscard]] static const ast::Expr& outermost_call(
        const ast::Expr& call_expr, const ast::ParentMap& parents);

    /**
     * @brief True when call_expr is the last call of its chain
     */
    [[nodiscard]] static bool is_outermost(const ast::Expr& call_expr, const ast::ParentMap& parents) {
        return &outermost_call(call_expr, parents) == &call_expr;
    }
};

} // namespace ormaudit
