#pragma once

#include "parser/ast.hpp"

#include <optional>
#include <string>

namespace ormaudit::ast {

/**
 * @brief Strip `await`, `as T`, `satisfies T` and `x!` around an expression
 */
[[nodiscard]] inline const Expr& strip_wrappers(const Expr& expr) {
    const Expr* current = &expr;
    while (true) {
        if (const auto* aw = current->as<Await>(); aw && aw->operand) {
            current = aw->operand.get();
            continue;
        }
        if (const auto* op = current->as<Opaque>();
            op && op->kind == OpaqueKind::TYPE_ASSERTION && !op->children.empty()) {
            current = op->children.front().get();
            continue;
        }
        return *current;
    }
}

[[nodiscard]] inline const std::string* identifier_name(const Expr& expr) {
    const auto* id = expr.as<Identifier>();
    return id ? &id->name : nullptr;
}

/**
 * @brief `receiver.method(...)`: the property access in callee position
 */
[[nodiscard]] inline const PropertyAccess* method_callee(const Call& call) {
    return call.callee ? call.callee->as<PropertyAccess>() : nullptr;
}

/**
 * @brief Cooked text of the first argument when it is a string literal
 */
[[nodiscard]] inline std::optional<std::string> first_string_argument(const Call& call) {
    if (call.args.empty()) return std::nullopt;
    if (const auto* s = call.args.front()->as<StringLiteral>()) return s->value;
    return std::nullopt;
}

} // namespace ormaudit::ast
