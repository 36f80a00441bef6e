#include "analyzer/data_source_classifier.hpp"
#include "parser/ast_helpers.hpp"
#include "parser/ast_walker.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace ormaudit {

using namespace ast;

namespace {

constexpr std::string_view kRouteParams = "params";

bool contains(const std::vector<std::string>& names, std::string_view name) {
    return std::ranges::find(names, name) != names.end();
}

/**
 * @brief Method name when expr is `(await) x.method(...)`
 */
const std::string* called_method(const Expr& expr) {
    const auto* call = strip_wrappers(expr).as<Call>();
    if (!call) return nullptr;
    const auto* access = method_callee(*call);
    return access ? &access->name : nullptr;
}

DataSource make_source(DataOrigin origin, ScalarType type) {
    DataSource ds;
    ds.origin = origin;
    ds.scalar_type = type;
    return ds;
}

DataSource route_param(std::optional<std::string> field) {
    auto ds = make_source(DataOrigin::ROUTE_PARAM, ScalarType::STRING);
    ds.field_name = std::move(field);
    return ds;
}

DataSource request_body(std::optional<std::string> field) {
    auto ds = make_source(DataOrigin::REQUEST_BODY, ScalarType::UNKNOWN);
    ds.field_name = std::move(field);
    return ds;
}

} // anonymous namespace

// ============================================================================
// Pass 1: request accessor variables
// ============================================================================

RequestVariables collect_request_variables(const std::vector<StmtPtr>& statements,
                                           const AnalysisConfig& config) {
    RequestVariables vars;
    Visitor visitor;
    visitor.on_declarator = [&](const VariableDeclarator& decl) {
        const auto* id = std::get_if<IdentifierBinding>(&decl.binding);
        if (!id || !decl.init) return;
        const auto* method = called_method(*decl.init);
        if (!method) return;
        if (contains(config.request_accessors, *method)) {
            vars.form_data.insert(id->name);
        } else if (contains(config.body_accessors, *method)) {
            vars.body.insert(id->name);
        }
    };
    walk(statements, visitor);
    return vars;
}

// ============================================================================
// Pass 2: validated variables
// ============================================================================

ValidatedSet collect_validated_variables(const std::vector<StmtPtr>& statements,
                                         const AnalysisConfig& config) {
    ValidatedSet validated;
    Visitor visitor;
    visitor.on_declarator = [&](const VariableDeclarator& decl) {
        if (!decl.init) return;
        const auto* method = called_method(*decl.init);
        if (!method || !contains(config.validation_methods, *method)) return;

        if (const auto* id = std::get_if<IdentifierBinding>(&decl.binding)) {
            validated.insert(id->name);
        } else if (const auto* pattern = std::get_if<ObjectPattern>(&decl.binding)) {
            for (const auto& elem : pattern->elements) {
                if (elem.depth == 0) validated.insert(elem.local);
            }
        }
    };
    walk(statements, visitor);
    return validated;
}

// ============================================================================
// Pass 3: source map
// ============================================================================

SourceMap build_source_map(const std::vector<StmtPtr>& statements,
                           const RequestVariables& request_vars,
                           const ValidatedSet& validated,
                           const AnalysisConfig& config) {
    // Later declarations may copy earlier ones (`const b = a`), so the
    // classifier reads the map while it is being filled.
    DataFlowFacts partial{request_vars, validated, {}};
    const DataSourceClassifier classifier(partial, config);

    Visitor visitor;
    visitor.on_declarator = [&](const VariableDeclarator& decl) {
        if (!decl.init) return;

        if (const auto* id = std::get_if<IdentifierBinding>(&decl.binding)) {
            auto source = classifier.classify(*decl.init);
            if (source.origin != DataOrigin::UNKNOWN) {
                partial.sources.insert_or_assign(id->name, std::move(source));
            }
            return;
        }

        // const { id, slug: s } = params / body / validatedData
        const auto* pattern = std::get_if<ObjectPattern>(&decl.binding);
        if (!pattern) return;
        const auto* from = identifier_name(strip_wrappers(*decl.init));
        if (!from) return;

        for (const auto& elem : pattern->elements) {
            if (elem.depth != 0 || elem.property.empty()) continue;
            if (*from == kRouteParams) {
                partial.sources.insert_or_assign(elem.local, route_param(elem.property));
            } else if (request_vars.body.contains(*from)) {
                partial.sources.insert_or_assign(elem.local, request_body(elem.property));
            } else if (validated.contains(*from)) {
                auto ds = make_source(DataOrigin::VARIABLE, ScalarType::UNKNOWN);
                ds.validated = true;
                partial.sources.insert_or_assign(elem.local, std::move(ds));
            }
        }
    };
    walk(statements, visitor);
    return std::move(partial.sources);
}

DataFlowFacts analyze_data_flow(const std::vector<StmtPtr>& statements,
                                const AnalysisConfig& config) {
    DataFlowFacts facts;
    facts.request_vars = collect_request_variables(statements, config);
    facts.validated = collect_validated_variables(statements, config);
    facts.sources = build_source_map(statements, facts.request_vars, facts.validated, config);
    return facts;
}

// ============================================================================
// DataSourceClassifier
// ============================================================================

std::optional<ScalarType> DataSourceClassifier::coercion_target(const Expr& expr) const {
    const auto* call = strip_wrappers(expr).as<Call>();
    if (!call || !call->callee) return std::nullopt;
    const auto* fn = identifier_name(*call->callee);
    if (!fn) return std::nullopt;
    const auto it = config_.coercions.find(*fn);
    if (it == config_.coercions.end()) return std::nullopt;
    return it->second;
}

DataSource DataSourceClassifier::classify_identifier(const std::string& name) const {
    if (facts_.validated.contains(name)) {
        auto ds = make_source(DataOrigin::VARIABLE, ScalarType::UNKNOWN);
        ds.validated = true;
        return ds;
    }
    const auto it = facts_.sources.find(name);
    if (it != facts_.sources.end()) {
        return it->second;
    }
    return make_source(DataOrigin::VARIABLE, ScalarType::UNKNOWN);
}

DataSource DataSourceClassifier::classify(const Expr& raw) const {
    const Expr& expr = strip_wrappers(raw);

    // ---- 1 & 2: request accessor calls ------------------------------------
    if (const auto* call = expr.as<Call>()) {
        if (const auto* access = method_callee(*call)) {
            if (const auto* receiver = identifier_name(*access->object)) {
                if ((access->name == "get" || access->name == "getAll") &&
                    facts_.request_vars.form_data.contains(*receiver)) {
                    auto ds = make_source(DataOrigin::EXTERNAL_FIELD, ScalarType::STRING);
                    ds.field_name = first_string_argument(*call);
                    return ds;
                }
                if (*receiver == kRouteParams) {
                    if (access->name == "get") return route_param(first_string_argument(*call));
                    return route_param(access->name);
                }
            }
        }
    }

    // ---- 2: params.x / body.x / params['x'] --------------------------------
    if (const auto* access = expr.as<PropertyAccess>()) {
        if (const auto* object = identifier_name(*access->object)) {
            if (*object == kRouteParams) return route_param(access->name);
            if (facts_.request_vars.body.contains(*object)) return request_body(access->name);
        }
    }
    if (const auto* element = expr.as<ElementAccess>()) {
        if (const auto* object = identifier_name(*element->object)) {
            std::optional<std::string> field;
            if (const auto* key = element->index->as<StringLiteral>()) field = key->value;
            if (*object == kRouteParams) return route_param(std::move(field));
            if (facts_.request_vars.body.contains(*object)) return request_body(std::move(field));
        }
    }

    // ---- 3: literals --------------------------------------------------------
    if (const auto* s = expr.as<StringLiteral>()) {
        auto ds = make_source(DataOrigin::LITERAL, ScalarType::STRING);
        ds.literal_value = s->value;
        return ds;
    }
    if (const auto* n = expr.as<NumberLiteral>()) {
        auto ds = make_source(DataOrigin::LITERAL, ScalarType::NUMBER);
        ds.literal_value = utils::format_number(n->value);
        return ds;
    }
    if (const auto* b = expr.as<BooleanLiteral>()) {
        auto ds = make_source(DataOrigin::LITERAL, ScalarType::BOOLEAN);
        ds.literal_value = b->value ? "true" : "false";
        return ds;
    }
    if (expr.is<NullLiteral>()) {
        return make_source(DataOrigin::LITERAL, ScalarType::NULL_VALUE);
    }

    // ---- 4: coercion wrappers ----------------------------------------------
    if (const auto target = coercion_target(expr)) {
        const auto& call = *expr.as<Call>();
        if (call.args.empty()) {
            return make_source(DataOrigin::UNKNOWN, *target);
        }
        auto inner = classify(*call.args.front());
        inner.scalar_type = *target;
        return inner;
    }

    // ---- 5: variables -------------------------------------------------------
    if (const auto* name = identifier_name(expr)) {
        return classify_identifier(*name);
    }

    // ---- 6: fields of validated objects ------------------------------------
    if (const auto* access = expr.as<PropertyAccess>()) {
        const auto* object = identifier_name(*access->object);
        if (object && facts_.validated.contains(*object)) {
            auto ds = make_source(DataOrigin::VARIABLE, ScalarType::UNKNOWN);
            ds.validated = true;
            return ds;
        }
    }

    return make_source(DataOrigin::UNKNOWN, ScalarType::UNKNOWN);
}

} // namespace ormaudit
