#include "parser/ts_parser.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <format>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

extern "C" {
const TSLanguage* tree_sitter_typescript(void);
const TSLanguage* tree_sitter_tsx(void);
}

namespace ormaudit {

using namespace ast;

namespace {

// ============================================================================
// Node type tables
// ============================================================================

// Node types lowered as expressions; jsx_* nodes are expressions as well
const std::unordered_set<std::string_view> kExpressionTypes = {
    "identifier", "undefined", "import", "this", "super", "meta_property",
    "true", "false", "null", "number", "string", "template_string", "regex",
    "call_expression", "member_expression", "subscript_expression",
    "object", "array", "await_expression", "arrow_function",
    "function_expression", "function", "generator_function",
    "parenthesized_expression", "binary_expression", "unary_expression",
    "update_expression", "ternary_expression", "assignment_expression",
    "augmented_assignment_expression", "as_expression", "satisfies_expression",
    "non_null_expression", "type_assertion", "new_expression",
    "sequence_expression", "spread_element", "yield_expression", "class",
    "instantiation_expression"
};

const std::unordered_map<std::string_view, OpaqueKind> kOpaqueKinds = {
    {"binary_expression", OpaqueKind::BINARY},
    {"sequence_expression", OpaqueKind::BINARY},
    {"unary_expression", OpaqueKind::UNARY},
    {"update_expression", OpaqueKind::UNARY},
    {"ternary_expression", OpaqueKind::CONDITIONAL},
    {"assignment_expression", OpaqueKind::ASSIGNMENT},
    {"augmented_assignment_expression", OpaqueKind::ASSIGNMENT},
    {"as_expression", OpaqueKind::TYPE_ASSERTION},
    {"satisfies_expression", OpaqueKind::TYPE_ASSERTION},
    {"non_null_expression", OpaqueKind::TYPE_ASSERTION},
    {"type_assertion", OpaqueKind::TYPE_ASSERTION},
    {"new_expression", OpaqueKind::NEW},
    {"regex", OpaqueKind::REGEX},
    {"spread_element", OpaqueKind::SPREAD},
    {"this", OpaqueKind::KEYWORD},
    {"super", OpaqueKind::KEYWORD},
    {"meta_property", OpaqueKind::KEYWORD},
};

// Type-level syntax and trivia: never lowered
const std::unordered_set<std::string_view> kSkippedTypes = {
    "comment", "type_annotation", "type_arguments", "type_parameters",
    "type_identifier", "nested_type_identifier", "predefined_type", "type_query",
    "type_predicate_annotation", "asserts_annotation", "opting_type_annotation",
    "omitting_type_annotation", "adding_type_annotation",
    "interface_declaration", "type_alias_declaration", "ambient_declaration",
    "abstract_method_signature", "method_signature", "index_signature",
    "accessibility_modifier", "override_modifier", "hash_bang_line"
};

bool is_skipped(std::string_view type) {
    return kSkippedTypes.contains(type) || utils::ends_with(type, "_type");
}

bool is_expression(std::string_view type) {
    return kExpressionTypes.contains(type) || type.starts_with("jsx_");
}

// ============================================================================
// Literal decoding
// ============================================================================

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Reads up to max_digits hex digits at body[i]; advances i past them
std::optional<uint32_t> read_hex(std::string_view body, size_t& i, size_t max_digits) {
    uint32_t cp = 0;
    size_t n = 0;
    while (n < max_digits && i + n < body.size() && hex_value(body[i + n]) >= 0) {
        cp = cp * 16 + static_cast<uint32_t>(hex_value(body[i + n]));
        ++n;
    }
    if (n == 0) return std::nullopt;
    i += n;
    return cp;
}

/**
 * @brief Decode escape sequences of a string or template body
 *
 * Unknown escapes keep the escaped character, as JavaScript does.
 */
std::string cook(std::string_view body) {
    std::string out;
    out.reserve(body.size());
    size_t i = 0;
    while (i < body.size()) {
        if (body[i] != '\\' || i + 1 >= body.size()) {
            out += body[i++];
            continue;
        }
        const char c = body[i + 1];
        i += 2;
        switch (c) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'v': out += '\v'; break;
            case '0': out += '\0'; break;
            case '\r':
                if (i < body.size() && body[i] == '\n') ++i;
                break;
            case '\n':
                break;  // Line continuation
            case 'x': {
                size_t j = i;
                const auto cp = read_hex(body, j, 2);
                if (cp && j == i + 2) {
                    append_utf8(out, *cp);
                    i = j;
                } else {
                    out += 'x';
                }
                break;
            }
            case 'u': {
                if (i < body.size() && body[i] == '{') {
                    size_t j = i + 1;
                    const auto cp = read_hex(body, j, 6);
                    if (cp && j < body.size() && body[j] == '}') {
                        append_utf8(out, *cp);
                        i = j + 1;
                        break;
                    }
                } else {
                    size_t j = i;
                    const auto cp = read_hex(body, j, 4);
                    if (cp && j == i + 4) {
                        append_utf8(out, *cp);
                        i = j;
                        break;
                    }
                }
                out += 'u';
                break;
            }
            default:
                out += c;
                break;
        }
    }
    return out;
}

// Text between the delimiters of a quoted literal
std::string_view unquote(std::string_view raw) {
    return raw.size() >= 2 ? raw.substr(1, raw.size() - 2) : std::string_view{};
}

double parse_number(std::string_view raw) {
    std::string digits;
    digits.reserve(raw.size());
    for (const char c : raw) {
        if (c != '_') digits += c;
    }
    if (!digits.empty() && digits.back() == 'n') digits.pop_back();

    int base = 10;
    if (digits.size() > 2 && digits[0] == '0') {
        const char p = static_cast<char>(std::tolower(static_cast<unsigned char>(digits[1])));
        if (p == 'x') base = 16;
        else if (p == 'o') base = 8;
        else if (p == 'b') base = 2;
    }

    if (base != 10) {
        uint64_t v = 0;
        std::from_chars(digits.data() + 2, digits.data() + digits.size(), v, base);
        return static_cast<double>(v);
    }
    double v = 0.0;
    std::from_chars(digits.data(), digits.data() + digits.size(), v);
    return v;
}

// ============================================================================
// tree-sitter access
// ============================================================================

std::string_view node_type(TSNode node) {
    return ts_node_type(node);
}

Span span_of(TSNode node) {
    return Span{ts_node_start_byte(node), ts_node_end_byte(node)};
}

TSNode field(TSNode node, const char* name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
}

/**
 * @brief Named children in source order, comments dropped
 *
 * Iterates with a cursor: ts_node_child(i) is linear in i.
 */
std::vector<TSNode> named_children(TSNode node) {
    std::vector<TSNode> out;
    TSTreeCursor cursor = ts_tree_cursor_new(node);
    if (ts_tree_cursor_goto_first_child(&cursor)) {
        do {
            const TSNode child = ts_tree_cursor_current_node(&cursor);
            if (ts_node_is_named(child) && node_type(child) != "comment") {
                out.push_back(child);
            }
        } while (ts_tree_cursor_goto_next_sibling(&cursor));
    }
    ts_tree_cursor_delete(&cursor);
    return out;
}

bool has_child_of_type(TSNode node, std::string_view type) {
    bool found = false;
    TSTreeCursor cursor = ts_tree_cursor_new(node);
    if (ts_tree_cursor_goto_first_child(&cursor)) {
        do {
            if (node_type(ts_tree_cursor_current_node(&cursor)) == type) {
                found = true;
                break;
            }
        } while (ts_tree_cursor_goto_next_sibling(&cursor));
    }
    ts_tree_cursor_delete(&cursor);
    return found;
}

/**
 * @brief Depth of the deepest node, stopping early once limit is passed
 *
 * Iterative so arbitrarily deep trees are measured safely.
 */
uint32_t nesting_depth(TSNode root, uint32_t limit) {
    TSTreeCursor cursor = ts_tree_cursor_new(root);
    uint32_t depth = 0;
    uint32_t deepest = 0;
    while (deepest <= limit) {
        if (ts_tree_cursor_goto_first_child(&cursor)) {
            deepest = std::max(deepest, ++depth);
            continue;
        }
        bool advanced = false;
        while (!advanced) {
            if (ts_tree_cursor_goto_next_sibling(&cursor)) {
                advanced = true;
            } else if (ts_tree_cursor_goto_parent(&cursor)) {
                --depth;
            } else {
                ts_tree_cursor_delete(&cursor);
                return deepest;
            }
        }
    }
    ts_tree_cursor_delete(&cursor);
    return deepest;
}

// ============================================================================
// Lowering: concrete syntax tree -> ast
// ============================================================================

struct PropertyKey {
    std::string name;
    bool computed = false;
};

class SyntaxLowering {
public:
    explicit SyntaxLowering(std::string_view source) : source_(source) {}

    std::vector<StmtPtr> program(TSNode root) {
        std::vector<StmtPtr> out;
        for (const TSNode child : named_children(root)) {
            collect_statements(child, out);
        }
        return out;
    }

private:
    std::string_view text(TSNode node) const {
        const uint32_t start = std::min<uint32_t>(ts_node_start_byte(node), source_.size());
        const uint32_t end = std::clamp<uint32_t>(ts_node_end_byte(node), start, source_.size());
        return source_.substr(start, end - start);
    }

    // ---- Statements --------------------------------------------------------

    void collect_statements(TSNode node, std::vector<StmtPtr>& out) {
        const auto type = node_type(node);
        if (is_skipped(type)) return;

        if (type == "import_statement") {
            if (auto stmt = import_statement(node)) out.push_back(std::move(stmt));
            return;
        }
        if (type == "lexical_declaration" || type == "variable_declaration") {
            out.push_back(declaration(node));
            return;
        }
        if (type == "function_declaration" || type == "generator_function_declaration" ||
            type == "method_definition") {
            push_expression(function(node, false), out);
            return;
        }
        if (is_expression(type)) {
            push_expression(expression(node), out);
            return;
        }
        // Blocks, control flow, exports, classes, error regions
        for (const TSNode child : named_children(node)) {
            collect_statements(child, out);
        }
    }

    static void push_expression(ExprPtr expr, std::vector<StmtPtr>& out) {
        auto stmt = std::make_unique<Stmt>();
        stmt->span = expr->span;
        stmt->node = ExpressionStatement{std::move(expr)};
        out.push_back(std::move(stmt));
    }

    StmtPtr import_statement(TSNode node) {
        const TSNode source = field(node, "source");
        if (ts_node_is_null(source)) return nullptr;   // import x = require('y')

        ImportDeclaration decl;
        decl.module = cook(unquote(text(source)));

        TSTreeCursor cursor = ts_tree_cursor_new(node);
        if (ts_tree_cursor_goto_first_child(&cursor)) {
            do {
                const TSNode child = ts_tree_cursor_current_node(&cursor);
                if (!ts_node_is_named(child) && node_type(child) == "type") {
                    decl.type_only = true;
                } else if (node_type(child) == "import_clause") {
                    import_clause(child, decl);
                }
            } while (ts_tree_cursor_goto_next_sibling(&cursor));
        }
        ts_tree_cursor_delete(&cursor);

        auto stmt = std::make_unique<Stmt>();
        stmt->span = span_of(node);
        stmt->node = std::move(decl);
        return stmt;
    }

    void import_clause(TSNode clause, ImportDeclaration& decl) {
        for (const TSNode child : named_children(clause)) {
            const auto type = node_type(child);
            if (type == "identifier") {
                decl.default_local = std::string(text(child));
            } else if (type == "namespace_import") {
                for (const TSNode id : named_children(child)) {
                    if (node_type(id) == "identifier") decl.namespace_local = std::string(text(id));
                }
            } else if (type == "named_imports") {
                for (const TSNode spec : named_children(child)) {
                    if (node_type(spec) != "import_specifier") continue;
                    const TSNode name = field(spec, "name");
                    if (ts_node_is_null(name)) continue;

                    ImportSpecifier s;
                    s.imported = node_type(name) == "string" ? cook(unquote(text(name)))
                                                             : std::string(text(name));
                    const TSNode alias = field(spec, "alias");
                    s.renamed = !ts_node_is_null(alias);
                    s.local = s.renamed ? std::string(text(alias)) : s.imported;
                    decl.named.push_back(std::move(s));
                }
            }
        }
    }

    StmtPtr declaration(TSNode node) {
        VariableDeclaration decl;
        const TSNode kind = field(node, "kind");
        decl.keyword = ts_node_is_null(kind) ? "var" : std::string(text(kind));

        for (const TSNode child : named_children(node)) {
            if (node_type(child) != "variable_declarator") continue;
            auto binding = this->binding(field(child, "name"));
            if (!binding) continue;

            VariableDeclarator d;
            d.binding = std::move(*binding);
            d.span = span_of(child);
            const TSNode value = field(child, "value");
            if (!ts_node_is_null(value)) d.init = expression(value);
            decl.declarators.push_back(std::move(d));
        }

        auto stmt = std::make_unique<Stmt>();
        stmt->span = span_of(node);
        stmt->node = std::move(decl);
        return stmt;
    }

    // ---- Binding patterns --------------------------------------------------

    std::optional<Binding> binding(TSNode node) {
        if (ts_node_is_null(node)) return std::nullopt;
        const auto type = node_type(node);
        if (type == "identifier") {
            return IdentifierBinding{std::string(text(node))};
        }
        if (type == "object_pattern") {
            ObjectPattern pattern;
            object_pattern(node, 0, pattern.elements);
            return pattern;
        }
        if (type == "array_pattern") {
            ArrayPattern pattern;
            array_pattern(node, 0, pattern.locals, nullptr);
            return pattern;
        }
        return std::nullopt;
    }

    // `x = default` binds x
    static TSNode without_default(TSNode node) {
        const auto type = node_type(node);
        if (type == "assignment_pattern" || type == "object_assignment_pattern") {
            return field(node, "left");
        }
        return node;
    }

    void object_pattern(TSNode node, uint32_t depth, std::vector<ObjectPatternElement>& out) {
        for (const TSNode raw : named_children(node)) {
            const TSNode elem = without_default(raw);
            if (ts_node_is_null(elem)) continue;
            const auto type = node_type(elem);

            if (type == "shorthand_property_identifier_pattern") {
                const std::string name(text(elem));
                out.push_back({name, name, depth, span_of(raw)});
            } else if (type == "rest_pattern") {
                for (const TSNode id : named_children(elem)) {
                    if (node_type(id) == "identifier") {
                        out.push_back({"", std::string(text(id)), depth, span_of(raw)});
                    }
                }
            } else if (type == "pair_pattern") {
                const auto key = property_key(field(elem, "key"));
                const TSNode value = without_default(field(elem, "value"));
                if (ts_node_is_null(value)) continue;
                const auto value_type = node_type(value);
                if (value_type == "identifier") {
                    out.push_back({key.name, std::string(text(value)), depth, span_of(raw)});
                } else if (value_type == "object_pattern") {
                    object_pattern(value, depth + 1, out);
                } else if (value_type == "array_pattern") {
                    std::vector<std::string> ignored;
                    array_pattern(value, depth + 1, ignored, &out);
                }
            }
        }
    }

    void array_pattern(TSNode node, uint32_t depth, std::vector<std::string>& locals,
                       std::vector<ObjectPatternElement>* flattened) {
        for (const TSNode raw : named_children(node)) {
            TSNode elem = without_default(raw);
            if (!ts_node_is_null(elem) && node_type(elem) == "rest_pattern") {
                const auto inner = named_children(elem);
                elem = inner.empty() ? TSNode{} : inner.front();
            }
            if (ts_node_is_null(elem)) continue;
            const auto type = node_type(elem);

            if (type == "identifier") {
                std::string local(text(elem));
                if (flattened) flattened->push_back({"", local, depth, span_of(raw)});
                locals.push_back(std::move(local));
            } else if (type == "object_pattern") {
                std::vector<ObjectPatternElement> nested;
                object_pattern(elem, depth + 1, nested);
                for (auto& e : nested) {
                    locals.push_back(e.local);
                    if (flattened) flattened->push_back(std::move(e));
                }
            } else if (type == "array_pattern") {
                array_pattern(elem, depth + 1, locals, flattened);
            }
        }
    }

    PropertyKey property_key(TSNode key) {
        if (ts_node_is_null(key)) return {};
        const auto type = node_type(key);
        if (type == "computed_property_name") return {"", true};
        if (type == "string") return {cook(unquote(text(key))), false};
        return {std::string(text(key)), false};
    }

    // ---- Expressions -------------------------------------------------------

    ExprPtr expression(TSNode node) {
        const auto type = node_type(node);
        const Span span = span_of(node);

        if (type == "identifier" || type == "undefined" || type == "import" ||
            type == "shorthand_property_identifier") {
            return make_expr(span, Identifier{std::string(text(node))});
        }
        if (type == "true" || type == "false") {
            return make_expr(span, BooleanLiteral{type == "true"});
        }
        if (type == "null") {
            return make_expr(span, NullLiteral{});
        }
        if (type == "number") {
            NumberLiteral lit;
            lit.raw = std::string(text(node));
            lit.value = parse_number(lit.raw);
            return make_expr(span, std::move(lit));
        }
        if (type == "string") {
            return make_expr(span, StringLiteral{cook(unquote(text(node))), false});
        }
        if (type == "template_string") return template_string(node, nullptr);
        if (type == "call_expression") return call(node);
        if (type == "member_expression") return member(node);
        if (type == "subscript_expression") return subscript(node);
        if (type == "object") return object(node);
        if (type == "array") return array(node);
        if (type == "arrow_function") return function(node, true);
        if (type == "function_expression" || type == "function" || type == "generator_function") {
            return function(node, false);
        }
        if (type == "await_expression") {
            const auto children = named_children(node);
            if (children.empty()) return opaque(node, OpaqueKind::OTHER);
            return make_expr(span, Await{expression(children.front())});
        }
        if (type == "parenthesized_expression") {
            for (const TSNode child : named_children(node)) {
                if (!is_expression(node_type(child))) continue;
                auto inner = expression(child);
                inner->span = span;
                return inner;
            }
            return opaque(node, OpaqueKind::OTHER);
        }
        if (type == "instantiation_expression") {
            const TSNode fn = field(node, "function");
            if (!ts_node_is_null(fn)) return expression(fn);
        }

        const auto it = kOpaqueKinds.find(type);
        return opaque(node, it != kOpaqueKinds.end() ? it->second : OpaqueKind::OTHER);
    }

    /**
     * @brief Unmodeled construct: expression children kept, statements in body
     */
    ExprPtr opaque(TSNode node, OpaqueKind kind) {
        Opaque op;
        op.kind = kind;
        for (const TSNode child : named_children(node)) {
            const auto type = node_type(child);
            if (is_skipped(type)) continue;
            if (type == "arguments") {
                for (const TSNode arg : named_children(child)) {
                    op.children.push_back(expression(arg));
                }
            } else if (is_expression(type)) {
                op.children.push_back(expression(child));
            } else {
                collect_statements(child, op.body);
            }
        }
        return make_expr(span_of(node), std::move(op));
    }

    ExprPtr call(TSNode node) {
        const TSNode callee = field(node, "function");
        const TSNode args = field(node, "arguments");
        if (ts_node_is_null(callee)) return opaque(node, OpaqueKind::OTHER);

        // tag`...`
        if (!ts_node_is_null(args) && node_type(args) == "template_string") {
            return template_string(args, &node);
        }

        Call c;
        c.callee = expression(callee);
        if (!ts_node_is_null(args)) {
            for (const TSNode arg : named_children(args)) {
                c.args.push_back(expression(arg));
            }
        }
        return make_expr(span_of(node), std::move(c));
    }

    ExprPtr member(TSNode node) {
        const TSNode object = field(node, "object");
        const TSNode property = field(node, "property");
        if (ts_node_is_null(object) || ts_node_is_null(property)) {
            return opaque(node, OpaqueKind::OTHER);
        }

        PropertyAccess access;
        access.object = expression(object);
        access.name = std::string(text(property));
        access.name_span = span_of(property);
        access.optional = has_child_of_type(node, "optional_chain") || has_child_of_type(node, "?.");
        return make_expr(span_of(node), std::move(access));
    }

    ExprPtr subscript(TSNode node) {
        const TSNode object = field(node, "object");
        const TSNode index = field(node, "index");
        if (ts_node_is_null(object) || ts_node_is_null(index)) {
            return opaque(node, OpaqueKind::OTHER);
        }
        return make_expr(span_of(node), ElementAccess{expression(object), expression(index)});
    }

    /**
     * @brief Template literal; a tagged template when tag_call is set
     *
     * Without substitutions (and untagged) it is a plain string literal.
     */
    ExprPtr template_string(TSNode node, const TSNode* tag_call) {
        std::vector<ExprPtr> substitutions;
        for (const TSNode child : named_children(node)) {
            if (node_type(child) != "template_substitution") continue;
            for (const TSNode inner : named_children(child)) {
                if (is_expression(node_type(inner))) substitutions.push_back(expression(inner));
            }
        }
        const bool has_substitution = has_child_of_type(node, "template_substitution");

        if (!tag_call && !has_substitution) {
            return make_expr(span_of(node), StringLiteral{cook(unquote(text(node))), true});
        }

        Opaque op;
        op.kind = OpaqueKind::TEMPLATE;
        if (tag_call) {
            op.children.push_back(expression(field(*tag_call, "function")));
        }
        for (auto& s : substitutions) op.children.push_back(std::move(s));
        return make_expr(span_of(tag_call ? *tag_call : node), std::move(op));
    }

    ExprPtr object(TSNode node) {
        ObjectLiteral obj;
        for (const TSNode child : named_children(node)) {
            const auto type = node_type(child);
            Property prop;

            if (type == "pair") {
                const TSNode key = field(child, "key");
                const TSNode value = field(child, "value");
                if (ts_node_is_null(key) || ts_node_is_null(value)) continue;
                const auto k = property_key(key);
                prop.kind = PropertyKind::KEY_VALUE;
                prop.key = k.name;
                prop.computed = k.computed;
                prop.key_span = span_of(key);
                prop.value = expression(value);
            } else if (type == "shorthand_property_identifier") {
                prop.kind = PropertyKind::SHORTHAND;
                prop.key = std::string(text(child));
                prop.key_span = span_of(child);
                prop.value = make_expr(prop.key_span, Identifier{prop.key});
            } else if (type == "spread_element") {
                const auto inner = named_children(child);
                if (inner.empty()) continue;
                prop.kind = PropertyKind::SPREAD;
                prop.value = expression(inner.front());
            } else if (type == "method_definition") {
                const TSNode name = field(child, "name");
                if (ts_node_is_null(name)) continue;
                const auto k = property_key(name);
                prop.kind = PropertyKind::METHOD;
                prop.key = k.name;
                prop.computed = k.computed;
                prop.key_span = span_of(name);
                prop.value = function(child, false);
            } else {
                continue;
            }
            obj.properties.push_back(std::move(prop));
        }
        return make_expr(span_of(node), std::move(obj));
    }

    ExprPtr array(TSNode node) {
        ArrayLiteral arr;
        for (const TSNode child : named_children(node)) {
            arr.elements.push_back(expression(child));
        }
        return make_expr(span_of(node), std::move(arr));
    }

    ExprPtr function(TSNode node, bool arrow) {
        Function fn;
        fn.arrow = arrow;

        const TSNode single = field(node, "parameter");     // x => ...
        if (!ts_node_is_null(single)) {
            fn.params.emplace_back(text(single));
        } else if (const TSNode params = field(node, "parameters"); !ts_node_is_null(params)) {
            fn.params = parameter_names(params);
        }

        const TSNode body = field(node, "body");
        if (!ts_node_is_null(body)) {
            if (node_type(body) == "statement_block") {
                for (const TSNode child : named_children(body)) {
                    collect_statements(child, fn.body);
                }
            } else if (is_expression(node_type(body))) {
                fn.expression_body = expression(body);
            }
        }
        return make_expr(span_of(node), std::move(fn));
    }

    std::vector<std::string> parameter_names(TSNode params) {
        std::vector<std::string> names;
        for (const TSNode param : named_children(params)) {
            const auto type = node_type(param);
            if (type == "decorator") continue;

            TSNode pattern = param;
            if (type == "required_parameter" || type == "optional_parameter") {
                pattern = field(param, "pattern");
            }
            if (!ts_node_is_null(pattern)) pattern = without_default(pattern);
            if (!ts_node_is_null(pattern) && node_type(pattern) == "rest_pattern") {
                const auto inner = named_children(pattern);
                pattern = inner.empty() ? TSNode{} : inner.front();
            }

            if (!ts_node_is_null(pattern) && node_type(pattern) == "identifier") {
                names.emplace_back(text(pattern));
            } else {
                names.emplace_back();
            }
        }
        return names;
    }

    std::string_view source_;
};

} // anonymous namespace

// ============================================================================
// TsParser
// ============================================================================

SourceDialect dialect_for_path(std::string_view path) {
    const std::string ext = utils::to_lower(std::filesystem::path(path).extension().string());
    if (ext == ".ts" || ext == ".mts" || ext == ".cts") {
        return SourceDialect::TYPESCRIPT;
    }
    return SourceDialect::TSX;
}

TsParser::TsParser(SourceDialect dialect)
    : parser_(ts_parser_new(), ts_parser_delete), dialect_(dialect) {
    const TSLanguage* language = dialect_ == SourceDialect::TYPESCRIPT
        ? tree_sitter_typescript()
        : tree_sitter_tsx();
    language_loaded_ = parser_ && ts_parser_set_language(parser_.get(), language);
}

Result<SourceFile> TsParser::parse(std::string path, std::string content) {
    if (!language_loaded_) {
        return Result<SourceFile>::error(ErrorCategory::INTERNAL_ERROR,
            "tree-sitter rejected the TypeScript grammar (ABI version mismatch)");
    }

    SourceFile file(std::move(path), std::move(content));
    const std::string& text = file.content();

    std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree(
        ts_parser_parse_string(parser_.get(), nullptr, text.data(),
                               static_cast<uint32_t>(text.size())),
        ts_tree_delete);
    if (!tree) {
        return Result<SourceFile>::error(ErrorCategory::PARSE_ERROR,
            std::format("tree-sitter produced no syntax tree for {}", file.path()));
    }

    const TSNode root = ts_tree_root_node(tree.get());
    if (nesting_depth(root, kMaxNestingDepth) > kMaxNestingDepth) {
        return Result<SourceFile>::error(ErrorCategory::PARSE_ERROR,
            std::format("{} nests deeper than {} syntax levels", file.path(), kMaxNestingDepth));
    }

    SyntaxLowering lowering(text);
    file.set_statements(lowering.program(root));
    return Result<SourceFile>::ok(std::move(file));
}

Result<SourceFile> TsParser::parse_source(std::string path, std::string content) {
    TsParser parser(dialect_for_path(path));
    return parser.parse(std::move(path), std::move(content));
}

Result<SourceFile> TsParser::parse_file(const std::string& path) {
    auto content = utils::read_file(path);
    if (!content) {
        return Result<SourceFile>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot read source file: {}", path));
    }
    return parse_source(path, std::move(*content));
}

} // namespace ormaudit
