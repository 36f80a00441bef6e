#include "schema/schema_loader.hpp"
#include "parser/ast_walker.hpp"
#include "parser/ts_parser.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <unordered_map>
#include <unordered_set>

namespace ormaudit {

using namespace ast;

namespace {

const std::vector<std::string_view> kDiscoveryPaths = {
    "src/db/schema.ts",
    "db/schema.ts",
    "lib/db/schema.ts",
    "src/schema.ts",
    "app/db/schema.ts",
    "server/db/schema.ts",
};

const std::vector<std::string_view> kDrizzleConfigFiles = {
    "drizzle.config.ts",
    "drizzle.config.js",
};

// Modifiers that let the database fill the column on insert
const std::unordered_set<std::string_view> kAutoGeneratedModifiers = {
    "$defaultFn", "$default", "generatedAlwaysAsIdentity", "generatedByDefaultAsIdentity"
};

const std::unordered_set<std::string_view> kDefaultModifiers = {
    "default", "defaultNow", "defaultRandom"
};

bool contains(const std::vector<std::string>& names, std::string_view name) {
    return std::ranges::find(names, name) != names.end();
}

/**
 * @brief `fn('sql_name', second)` where fn is one of names; returns the call
 */
const Call* declaration_call(const Expr& init, const std::vector<std::string>& names) {
    const auto* call = init.as<Call>();
    if (!call || call->args.size() < 2) return nullptr;
    const auto* callee = call->callee->as<Identifier>();
    if (!callee || !contains(names, callee->name)) return nullptr;
    if (!call->args[0]->is<StringLiteral>()) return nullptr;
    return call;
}

std::optional<Enum> parse_enum(const std::string& var_name, const Expr& init,
                               const SchemaConfig& config) {
    const auto* call = declaration_call(init, config.enum_functions);
    if (!call) return std::nullopt;

    const auto* values = call->args[1]->as<ArrayLiteral>();
    if (!values) return std::nullopt;

    Enum e;
    e.name = var_name;
    e.sql_name = call->args[0]->as<StringLiteral>()->value;
    for (const auto& elem : values->elements) {
        if (const auto* s = elem->as<StringLiteral>()) {
            e.values.push_back(s->value);
        }
    }
    return e;
}

/**
 * @brief Method names applied on top of the base builder call
 *
 * text('name').notNull().default('x') -> {notNull, default}
 */
std::unordered_set<std::string> collect_modifiers(const Expr& expr) {
    std::unordered_set<std::string> modifiers;
    const Expr* current = &expr;
    while (const auto* call = current->as<Call>()) {
        const auto* access = call->callee->as<PropertyAccess>();
        if (!access) break;
        modifiers.insert(access->name);
        current = access->object.get();
    }
    return modifiers;
}

/**
 * @brief The innermost builder call: text('name') in text('name').notNull()
 */
const Call* base_builder_call(const Expr& expr) {
    const Expr* current = &expr;
    while (const auto* call = current->as<Call>()) {
        if (const auto* access = call->callee->as<PropertyAccess>()) {
            current = access->object.get();
            continue;
        }
        if (call->callee->is<Identifier>() || call->callee->is<Call>()) {
            return call;
        }
        break;
    }
    return expr.as<Call>();
}

std::optional<Column> parse_column(const std::string& column_name, const Expr& init,
                                   const std::unordered_set<std::string>& enum_names) {
    const auto* base = base_builder_call(init);
    if (!base) return std::nullopt;

    Column col;
    col.name = column_name;
    col.sql_name = column_name;

    if (const auto* fn = base->callee->as<Identifier>()) {
        if (enum_names.contains(fn->name)) {
            col.type = ColumnType::ENUM;
            col.enum_ref = fn->name;
        } else {
            col.type = column_type_from_builder(fn->name);
        }
    } else if (const auto* inner = base->callee->as<Call>()) {
        // statusEnum()('status')
        const auto* fn_name = inner->callee->as<Identifier>();
        if (fn_name && enum_names.contains(fn_name->name)) {
            col.type = ColumnType::ENUM;
            col.enum_ref = fn_name->name;
        }
    }

    if (!base->args.empty()) {
        if (const auto* s = base->args[0]->as<StringLiteral>()) {
            col.sql_name = s->value;
        }
    }

    const auto modifiers = collect_modifiers(init);
    const auto has_any = [&](const std::unordered_set<std::string_view>& names) {
        return std::ranges::any_of(modifiers,
            [&](const std::string& m) { return names.contains(m); });
    };

    col.not_null = modifiers.contains("notNull");
    col.has_default = has_any(kDefaultModifiers);
    col.is_auto_generated = is_serial_type(col.type) || has_any(kAutoGeneratedModifiers);
    col.is_required = col.not_null && !col.has_default && !col.is_auto_generated;
    return col;
}

std::optional<Table> parse_table(const std::string& var_name, const Expr& init,
                                 const SchemaConfig& config,
                                 const std::unordered_set<std::string>& enum_names) {
    const auto* call = declaration_call(init, config.table_functions);
    if (!call) return std::nullopt;

    const auto* columns = call->args[1]->as<ObjectLiteral>();
    if (!columns) return std::nullopt;

    Table table;
    table.name = var_name;
    table.sql_name = call->args[0]->as<StringLiteral>()->value;

    for (const auto& prop : columns->properties) {
        if (prop.kind != PropertyKind::KEY_VALUE || prop.computed || !prop.value) continue;
        if (auto col = parse_column(prop.key, *prop.value, enum_names)) {
            table.columns.push_back(std::move(*col));
        }
    }
    return table;
}

/**
 * @brief Resolve the `schema:` property of a drizzle config file
 */
std::optional<std::string> schema_path_from_config(const std::string& config_path,
                                                   const std::filesystem::path& root) {
    auto parsed = TsParser::parse_file(config_path);
    if (parsed.is_error()) {
        utils::log::warn(parsed.error_message());
        return std::nullopt;
    }

    std::optional<std::string> relative;
    Visitor visitor;
    visitor.on_expression = [&](const Expr& expr, const Expr*) {
        const auto* object = expr.as<ObjectLiteral>();
        if (!object) return;
        for (const auto& prop : object->properties) {
            if (prop.kind != PropertyKind::KEY_VALUE || prop.key != "schema" || !prop.value) continue;
            if (const auto* s = prop.value->as<StringLiteral>()) {
                relative = s->value;
            } else if (const auto* arr = prop.value->as<ArrayLiteral>()) {
                if (!arr->elements.empty()) {
                    if (const auto* first = arr->elements.front()->as<StringLiteral>()) {
                        relative = first->value;
                    }
                }
            }
        }
    };
    walk(parsed.value().statements(), visitor);

    if (!relative) return std::nullopt;
    return (root / *relative).lexically_normal().string();
}

} // anonymous namespace

// ============================================================================
// SchemaLoader
// ============================================================================

SchemaModel SchemaLoader::parse_schema(const SourceFile& file, const SchemaConfig& config) {
    SchemaModel model;
    model.path = file.path();

    // Enums first: table columns refer to them by variable name
    Visitor enum_pass;
    enum_pass.on_declarator = [&](const VariableDeclarator& decl) {
        const auto* id = std::get_if<IdentifierBinding>(&decl.binding);
        if (!id || !decl.init) return;
        if (auto e = parse_enum(id->name, *decl.init, config)) {
            model.enums.push_back(std::move(*e));
        }
    };
    walk(file.statements(), enum_pass);

    std::unordered_set<std::string> enum_names;
    for (const auto& e : model.enums) enum_names.insert(e.name);

    Visitor table_pass;
    table_pass.on_declarator = [&](const VariableDeclarator& decl) {
        const auto* id = std::get_if<IdentifierBinding>(&decl.binding);
        if (!id || !decl.init) return;
        if (auto t = parse_table(id->name, *decl.init, config, enum_names)) {
            model.tables.push_back(std::move(*t));
        }
    };
    walk(file.statements(), table_pass);

    return model;
}

Result<SchemaModel> SchemaLoader::load_schema(const std::string& path, const SchemaConfig& config) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result<SchemaModel>::error(ErrorCategory::SCHEMA_ERROR,
            std::format("Schema file not found: {}", path));
    }

    auto parsed = TsParser::parse_file(path);
    if (parsed.is_error()) {
        return Result<SchemaModel>::propagate(parsed);
    }

    auto model = parse_schema(parsed.value(), config);
    utils::log::info(std::format("Loaded schema {}: {} tables, {} enums",
        path, model.tables.size(), model.enums.size()));
    return Result<SchemaModel>::ok(std::move(model));
}

std::optional<std::string> SchemaLoader::discover_schema_path(const std::string& root) {
    namespace fs = std::filesystem;
    const fs::path base(root);
    std::error_code ec;

    for (const auto& candidate : kDiscoveryPaths) {
        const fs::path full = base / candidate;
        if (fs::exists(full, ec)) {
            return full.string();
        }
    }

    for (const auto& config_name : kDrizzleConfigFiles) {
        const fs::path config_path = base / config_name;
        if (!fs::exists(config_path, ec)) continue;

        auto schema_path = schema_path_from_config(config_path.string(), base);
        if (schema_path && fs::exists(*schema_path, ec)) {
            return schema_path;
        }
    }
    return std::nullopt;
}

} // namespace ormaudit
