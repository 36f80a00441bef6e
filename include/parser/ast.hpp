#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace ormaudit::ast {

/**
 * @brief Byte range [start, end) in the owning SourceFile
 */
struct Span {
    uint32_t start = 0;
    uint32_t end = 0;
};

struct Expr;
struct Stmt;
using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;

// ============================================================================
// Expression node shapes
// ============================================================================

struct Identifier {
    std::string name;
};

/**
 * @brief '...' / "..." literal, or a template literal without substitutions
 */
struct StringLiteral {
    std::string value;          // Cooked text
    bool is_template = false;
};

struct NumberLiteral {
    double value = 0.0;
    std::string raw;
};

struct BooleanLiteral {
    bool value = false;
};

struct NullLiteral {};

struct Call {
    ExprPtr callee;
    std::vector<ExprPtr> args;
};

struct PropertyAccess {
    ExprPtr object;
    std::string name;
    Span name_span;
    bool optional = false;      // a?.b
};

struct ElementAccess {
    ExprPtr object;
    ExprPtr index;
};

enum class PropertyKind {
    KEY_VALUE,      // key: value
    SHORTHAND,      // key        (value is an Identifier spanning the key)
    SPREAD,         // ...value
    METHOD          // key() { }  (value is a Function)
};

struct Property {
    PropertyKind kind = PropertyKind::KEY_VALUE;
    std::string key;            // Empty for spread and computed keys
    bool computed = false;
    Span key_span;
    ExprPtr value;
};

struct ObjectLiteral {
    std::vector<Property> properties;
};

struct ArrayLiteral {
    std::vector<ExprPtr> elements;
};

struct Await {
    ExprPtr operand;
};

/**
 * @brief Arrow function, function expression, declaration or method
 *
 * A parameter bound by a pattern has an empty name.
 */
struct Function {
    std::vector<std::string> params;    // Top-level parameter names in order
    std::vector<StmtPtr> body;          // Block body
    ExprPtr expression_body;            // Concise arrow body (null for block body)
    bool arrow = false;
};

enum class OpaqueKind {
    BINARY,
    UNARY,
    CONDITIONAL,
    ASSIGNMENT,
    TYPE_ASSERTION,     // x as T, x satisfies T, x!
    NEW,
    TEMPLATE,           // Template literal with substitutions
    REGEX,
    SPREAD,
    KEYWORD,            // this, super, new.target
    OTHER               // JSX, classes, yield and anything else
};

/**
 * @brief Any construct the analysis does not interpret
 *
 * Keeps its sub-expressions and nested statement bodies so that walks
 * still reach call chains inside it.
 */
struct Opaque {
    OpaqueKind kind = OpaqueKind::BINARY;
    std::vector<ExprPtr> children;
    std::vector<StmtPtr> body;
};

using ExprNode = std::variant<
    Identifier,
    StringLiteral,
    NumberLiteral,
    BooleanLiteral,
    NullLiteral,
    Call,
    PropertyAccess,
    ElementAccess,
    ObjectLiteral,
    ArrayLiteral,
    Await,
    Function,
    Opaque>;

struct Expr {
    Span span;
    ExprNode node;

    template<typename T>
    [[nodiscard]] const T* as() const { return std::get_if<T>(&node); }

    template<typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(node); }
};

template<typename T>
[[nodiscard]] ExprPtr make_expr(Span span, T node) {
    auto e = std::make_unique<Expr>();
    e->span = span;
    e->node = std::move(node);
    return e;
}

// ============================================================================
// Binding patterns
// ============================================================================

struct IdentifierBinding {
    std::string name;
};

/**
 * @brief One local introduced by an object pattern
 *
 * `{ a, b: c, d: { e } }` yields (a,a,0) (b,c,0) (e,e,1).
 */
struct ObjectPatternElement {
    std::string property;
    std::string local;
    uint32_t depth = 0;
    Span span;
};

struct ObjectPattern {
    std::vector<ObjectPatternElement> elements;
};

struct ArrayPattern {
    std::vector<std::string> locals;
};

using Binding = std::variant<IdentifierBinding, ObjectPattern, ArrayPattern>;

// ============================================================================
// Statements
// ============================================================================

struct VariableDeclarator {
    Binding binding;
    ExprPtr init;
    Span span;
};

struct VariableDeclaration {
    std::string keyword;        // const / let / var
    std::vector<VariableDeclarator> declarators;
};

struct ImportSpecifier {
    std::string imported;
    std::string local;
    bool renamed = false;       // { imported as local }
};

struct ImportDeclaration {
    std::string module;
    std::vector<ImportSpecifier> named;
    std::string default_local;
    std::string namespace_local;
    bool type_only = false;
};

struct ExpressionStatement {
    ExprPtr expr;
};

using StmtNode = std::variant<VariableDeclaration, ImportDeclaration, ExpressionStatement>;

struct Stmt {
    Span span;
    StmtNode node;

    template<typename T>
    [[nodiscard]] const T* as() const { return std::get_if<T>(&node); }
};

} // namespace ormaudit::ast
