#include "analyzer/chain_analyzer.hpp"
#include "parser/ast_helpers.hpp"
#include "core/utils.hpp"

#include <format>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace ormaudit {

using namespace ast;

namespace {

const std::unordered_map<std::string_view, StatementType> kAnchorMethods = {
    {"select", StatementType::SELECT},
    {"insert", StatementType::INSERT},
    {"update", StatementType::UPDATE},
    {"delete", StatementType::DELETE},
};

const std::unordered_map<std::string_view, std::string_view> kComparisonOperators = {
    {"eq", "="}, {"ne", "!="}, {"lt", "<"}, {"lte", "<="}, {"gt", ">"}, {"gte", ">="},
};

const std::unordered_map<std::string_view, std::string_view> kWhereOperators = {
    {"eq", "="}, {"ne", "!="}, {"lt", "<"}, {"lte", "<="}, {"gt", ">"}, {"gte", ">="},
    {"like", "LIKE"}, {"ilike", "ILIKE"},
    {"isNull", "IS NULL"}, {"isNotNull", "IS NOT NULL"},
    {"inArray", "IN"}, {"notInArray", "NOT IN"},
};

const std::unordered_map<std::string_view, JoinKind> kJoinMethods = {
    {"innerJoin", JoinKind::INNER},
    {"leftJoin", JoinKind::LEFT},
    {"rightJoin", JoinKind::RIGHT},
    {"fullJoin", JoinKind::FULL},
};

/**
 * @brief `users` -> users, `schema.users` -> users
 */
std::string table_name_from(const Expr& expr) {
    if (const auto* name = identifier_name(expr)) return *name;
    if (const auto* access = expr.as<PropertyAccess>()) return access->name;
    return {};
}

/**
 * @brief `users.email` -> {users, email}; nothing for other shapes
 */
std::optional<ColumnRef> column_ref_from(const Expr& expr) {
    const auto* access = expr.as<PropertyAccess>();
    if (!access) return std::nullopt;
    std::string table = table_name_from(*access->object);
    if (table.empty()) return std::nullopt;
    return ColumnRef{std::move(table), access->name};
}

/**
 * @brief Callee name when expr is `fn(...)` with a plain identifier callee
 */
const std::string* function_name(const Expr& expr, const Call** call_out) {
    const auto* call = expr.as<Call>();
    if (!call || !call->callee) return nullptr;
    *call_out = call;
    return identifier_name(*call->callee);
}

ValueInfo literal_value(std::string text, ScalarType type) {
    ValueInfo v;
    v.kind = ValueKind::LITERAL;
    v.value = std::move(text);
    v.data_type = type;
    return v;
}

std::vector<JoinOnCondition> extract_join_on(const Expr& expr) {
    std::vector<JoinOnCondition> conditions;
    const Call* call = nullptr;
    const auto* fn = function_name(expr, &call);
    if (!fn) return conditions;

    if (const auto it = kComparisonOperators.find(*fn);
        it != kComparisonOperators.end() && call->args.size() >= 2) {
        auto left = column_ref_from(*call->args[0]);
        auto right = column_ref_from(*call->args[1]);
        if (left && right) {
            conditions.push_back({std::move(left->table), std::move(left->column),
                                  std::string(it->second),
                                  std::move(right->table), std::move(right->column)});
        }
    }

    // or() is flattened like and(); the ON clause joins everything with AND
    if (*fn == "and" || *fn == "or") {
        for (const auto& arg : call->args) {
            auto nested = extract_join_on(*arg);
            conditions.insert(conditions.end(),
                std::make_move_iterator(nested.begin()), std::make_move_iterator(nested.end()));
        }
    }
    return conditions;
}

std::vector<ColumnRef> extract_group_by(const std::vector<ExprPtr>& args) {
    std::vector<ColumnRef> columns;
    for (const auto& arg : args) {
        if (auto ref = column_ref_from(*arg)) columns.push_back(std::move(*ref));
    }
    return columns;
}

std::optional<double> numeric_argument(const std::vector<ExprPtr>& args) {
    if (args.empty()) return std::nullopt;
    if (const auto* n = args.front()->as<NumberLiteral>()) return n->value;
    return std::nullopt;
}

/**
 * @brief The `<form>.get('x')` call inside expr, looking through coercions
 */
const Call* find_form_accessor_call(const Expr& expr, const DataSourceClassifier& classifier) {
    const Expr& stripped = strip_wrappers(expr);
    const auto* call = stripped.as<Call>();
    if (!call) return nullptr;
    if (classifier.coercion_target(stripped) && !call->args.empty()) {
        return find_form_accessor_call(*call->args.front(), classifier);
    }
    const auto* access = method_callee(*call);
    if (access && access->object->is<Identifier>() &&
        (access->name == "get" || access->name == "getAll")) {
        return call;
    }
    return nullptr;
}

} // anonymous namespace

// ============================================================================
// Values
// ============================================================================

ValueInfo ChainAnalyzer::analyze_value(const Expr& expr) const {
    if (const auto* s = expr.as<StringLiteral>()) {
        return literal_value(s->value, ScalarType::STRING);
    }
    if (const auto* n = expr.as<NumberLiteral>()) {
        return literal_value(utils::format_number(n->value), ScalarType::NUMBER);
    }
    if (const auto* b = expr.as<BooleanLiteral>()) {
        return literal_value(b->value ? "true" : "false", ScalarType::BOOLEAN);
    }
    if (expr.is<NullLiteral>()) {
        return literal_value("NULL", ScalarType::NULL_VALUE);
    }

    ValueInfo v;
    if (const auto* name = identifier_name(expr)) {
        v.kind = ValueKind::VARIABLE;
        v.source = *name;
        return v;
    }

    const auto source = classifier_.classify(expr);
    v.kind = ValueKind::PARAMETER;
    v.data_type = source.scalar_type;

    if (source.origin == DataOrigin::EXTERNAL_FIELD) {
        if (const auto* call = find_form_accessor_call(expr, classifier_)) {
            const auto* access = method_callee(*call);
            v.source = std::format("{}.{}('{}')", *identifier_name(*access->object),
                access->name, source.field_name.value_or("unknown"));
            return v;
        }
    }

    v.source = file_.snippet(expr.span);
    return v;
}

std::vector<ColumnValue> ChainAnalyzer::extract_column_values(const Expr& arg) const {
    std::vector<ColumnValue> values;
    const auto* object = arg.as<ObjectLiteral>();
    if (!object) return values;

    const auto upsert = [&](ColumnValue cv) {
        for (auto& existing : values) {
            if (existing.column == cv.column) {
                existing = std::move(cv);
                return;
            }
        }
        values.push_back(std::move(cv));
    };

    for (const auto& prop : object->properties) {
        if (!prop.value || prop.computed) continue;

        if (prop.kind == PropertyKind::KEY_VALUE) {
            ColumnValue cv;
            cv.column = prop.key;
            cv.value = analyze_value(*prop.value);
            cv.data_source = classifier_.classify(*prop.value);
            cv.span = prop.value->span;
            upsert(std::move(cv));
        } else if (prop.kind == PropertyKind::SHORTHAND) {
            ColumnValue cv;
            cv.column = prop.key;
            cv.value.kind = ValueKind::VARIABLE;
            cv.value.source = prop.key;
            cv.data_source = classifier_.classify_identifier(prop.key);
            cv.span = prop.key_span;
            upsert(std::move(cv));
        }
    }
    return values;
}

// ============================================================================
// WHERE
// ============================================================================

std::vector<WhereCondition> ChainAnalyzer::extract_where(const Expr& expr) const {
    std::vector<WhereCondition> conditions;
    const Call* call = nullptr;
    const auto* fn = function_name(expr, &call);
    if (!fn) return conditions;

    const auto column_name = [&](const Expr& e) -> std::string {
        if (const auto* access = e.as<PropertyAccess>()) return access->name;
        if (const auto* name = identifier_name(e)) return *name;
        return std::string(file_.text(e.span));
    };

    if (const auto it = kWhereOperators.find(*fn);
        it != kWhereOperators.end() && !call->args.empty()) {
        const std::string op(it->second);
        if (*fn == "isNull" || *fn == "isNotNull") {
            conditions.push_back({column_name(*call->args[0]), op,
                                  literal_value("", ScalarType::UNKNOWN)});
        } else if (call->args.size() >= 2) {
            conditions.push_back({column_name(*call->args[0]), op,
                                  analyze_value(*call->args[1])});
        }
    }

    // or() is flattened like and(): conditions end up AND-joined
    if (*fn == "and" || *fn == "or") {
        for (const auto& arg : call->args) {
            auto nested = extract_where(*arg);
            conditions.insert(conditions.end(),
                std::make_move_iterator(nested.begin()), std::make_move_iterator(nested.end()));
        }
    }
    return conditions;
}

// ============================================================================
// Chain interpretation
// ============================================================================

std::optional<ChainInfo> ChainAnalyzer::analyze(const std::vector<ChainSegment>& segments) const {
    if (segments.empty()) return std::nullopt;

    // ---- Anchor: select/insert/update/delete on a database handle ----------
    const ChainSegment* anchor = nullptr;
    std::string table_name;
    for (const auto& seg : segments) {
        const auto* receiver = identifier_name(*seg.receiver);
        if (!receiver || !context_.is_handle(*receiver)) continue;
        const auto op = kAnchorMethods.find(seg.method);
        if (op == kAnchorMethods.end()) continue;

        if (op->second == StatementType::SELECT) {
            for (const auto& other : segments) {
                if (other.method == "from" && !other.args->empty()) {
                    table_name = table_name_from(*other.args->front());
                    break;
                }
            }
        } else if (!seg.args->empty()) {
            table_name = table_name_from(*seg.args->front());
        }

        if (!table_name.empty() || op->second == StatementType::SELECT) {
            anchor = &seg;
            break;
        }
    }
    if (!anchor) return std::nullopt;

    ChainInfo info;
    info.operation = kAnchorMethods.at(anchor->method);
    info.table_name = table_name;
    info.handle = *identifier_name(*anchor->receiver);
    info.span = segments.back().call->span;

    // ---- Clauses, in call order --------------------------------------------
    for (const auto& seg : segments) {
        const auto& args = *seg.args;
        const auto& method = seg.method;

        if (method == "select") {
            if (!args.empty()) {
                if (const auto* object = args.front()->as<ObjectLiteral>()) {
                    std::vector<std::string> columns;
                    for (const auto& prop : object->properties) {
                        if (prop.computed) continue;
                        if (prop.kind == PropertyKind::KEY_VALUE || prop.kind == PropertyKind::SHORTHAND) {
                            columns.push_back(prop.key);
                        }
                    }
                    info.select_columns = std::move(columns);
                }
            }
        } else if (method == "from") {
            if (!args.empty() && info.table_name.empty()) {
                info.table_name = table_name_from(*args.front());
            }
        } else if (method == "values") {
            if (!args.empty() && args.front()->is<ObjectLiteral>()) {
                info.insert_values = extract_column_values(*args.front());
            }
        } else if (method == "set") {
            if (!args.empty() && args.front()->is<ObjectLiteral>()) {
                info.set_values = extract_column_values(*args.front());
            }
        } else if (method == "where") {
            info.has_where = true;
            if (!args.empty()) {
                auto conditions = extract_where(*args.front());
                info.where_conditions.insert(info.where_conditions.end(),
                    std::make_move_iterator(conditions.begin()),
                    std::make_move_iterator(conditions.end()));
            }
        } else if (const auto join = kJoinMethods.find(method); join != kJoinMethods.end()) {
            if (args.size() >= 2) {
                JoinInfo j;
                j.kind = join->second;
                j.table = table_name_from(*args[0]);
                j.on_conditions = extract_join_on(*args[1]);
                info.joins.push_back(std::move(j));
            }
        } else if (method == "groupBy") {
            if (!args.empty()) info.group_by = extract_group_by(args);
        } else if (method == "orderBy") {
            if (!args.empty()) {
                std::vector<OrderByItem> order;
                for (const auto& arg : args) {
                    const Call* call = nullptr;
                    if (arg->is<Call>()) {
                        const auto* fn = function_name(*arg, &call);
                        if (!fn || call->args.empty()) continue;
                        const Expr& key = *call->args.front();
                        const auto direction = *fn == "desc" ? SortDirection::DESC : SortDirection::ASC;
                        if (auto ref = column_ref_from(key)) {
                            order.push_back({std::move(*ref), direction});
                        } else if (const auto* access = key.as<PropertyAccess>()) {
                            order.push_back({{"", access->name}, direction});
                        } else if (const auto* name = identifier_name(key)) {
                            order.push_back({{"", *name}, direction});
                        } else {
                            order.push_back({{"", std::string(file_.text(key.span))}, direction});
                        }
                    } else if (auto ref = column_ref_from(*arg)) {
                        order.push_back({std::move(*ref), SortDirection::ASC});
                    } else if (const auto* access = arg->as<PropertyAccess>()) {
                        order.push_back({{"", access->name}, SortDirection::ASC});
                    } else if (const auto* name = identifier_name(*arg)) {
                        order.push_back({{"", *name}, SortDirection::ASC});
                    }
                }
                info.order_by = std::move(order);
            }
        } else if (method == "limit") {
            if (auto n = numeric_argument(args)) info.limit = *n;
        } else if (method == "offset") {
            if (auto n = numeric_argument(args)) info.offset = *n;
        }
    }

    // A chain whose table cannot be named contributes nothing
    if (info.table_name.empty()) return std::nullopt;
    return info;
}

std::optional<ChainInfo> ChainAnalyzer::analyze_call(const Expr& call_expr,
                                                     const ParentMap& parents) const {
    const Expr& outermost = ChainCollector::outermost_call(call_expr, parents);
    return analyze(ChainCollector::collect(outermost));
}

// ============================================================================
// Alias resolution
// ============================================================================

ChainInfo resolve_aliases(ChainInfo chain,
                          const std::unordered_map<std::string, std::string>& aliases) {
    const auto resolve = [&](std::string& name) {
        const auto it = aliases.find(name);
        if (it != aliases.end()) name = it->second;
    };

    resolve(chain.table_name);
    for (auto& join : chain.joins) {
        resolve(join.table);
        for (auto& cond : join.on_conditions) {
            resolve(cond.left_table);
            resolve(cond.right_table);
        }
    }
    for (auto& col : chain.group_by) {
        resolve(col.table);
    }
    for (auto& item : chain.order_by) {
        if (!item.column.table.empty()) resolve(item.column.table);
    }
    return chain;
}

// ============================================================================
// File level
// ============================================================================

std::vector<ChainInfo> analyze_file_chains(const SourceFile& file, const AnalysisConfig& config) {
    const auto context = FileContext::build(file, config);
    const auto facts = analyze_data_flow(file.statements(), config);
    const DataSourceClassifier classifier(facts, config);
    const ChainAnalyzer analyzer(file, context, classifier);
    const ParentMap parents(file.statements());

    std::vector<ChainInfo> chains;
    std::set<std::pair<uint32_t, uint32_t>> seen;

    Visitor visitor;
    visitor.on_expression = [&](const Expr& expr, const Expr*) {
        if (!expr.is<Call>() || !ChainCollector::is_outermost(expr, parents)) return;

        auto info = analyzer.analyze(ChainCollector::collect(expr));
        if (!info) return;

        const auto loc = file.location(info->span.start);
        if (!seen.emplace(loc.line, loc.column).second) return;
        chains.push_back(resolve_aliases(std::move(*info), context.import_aliases));
    };
    walk(file.statements(), visitor);

    return chains;
}

} // namespace ormaudit
