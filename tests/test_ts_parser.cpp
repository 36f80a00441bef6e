#include <catch2/catch_test_macros.hpp>
#include "parser/ast_walker.hpp"
#include "parser/ts_parser.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <vector>

using namespace ormaudit;
using namespace ormaudit::test_support;
using namespace ormaudit::ast;

namespace {

// name -> initializer of every identifier-bound declarator, bodies included
std::map<std::string, const Expr*> declarators(const SourceFile& file) {
    std::map<std::string, const Expr*> out;
    Visitor visitor;
    visitor.on_declarator = [&](const VariableDeclarator& decl) {
        if (const auto* id = std::get_if<IdentifierBinding>(&decl.binding)) {
            out[id->name] = decl.init.get();
        }
    };
    walk(file.statements(), visitor);
    return out;
}

std::vector<std::string> called_methods(const SourceFile& file) {
    std::vector<std::string> out;
    Visitor visitor;
    visitor.on_expression = [&](const Expr& expr, const Expr*) {
        const auto* call = expr.as<Call>();
        if (!call) return;
        if (const auto* access = call->callee->as<PropertyAccess>()) {
            out.push_back(access->name);
        }
    };
    walk(file.statements(), visitor);
    return out;
}

} // namespace

TEST_CASE("TsParser import declarations", "[parser]") {

    SECTION("named, renamed and type-only imports") {
        auto file = parse_ts("a.ts",
            "import { users as usersTable, orders } from '~/db/schema';\n"
            "import type { User } from './types';\n");
        REQUIRE(file.statements().size() == 2);

        const auto* first = file.statements()[0]->as<ImportDeclaration>();
        REQUIRE(first != nullptr);
        CHECK(first->module == "~/db/schema");
        REQUIRE(first->named.size() == 2);
        CHECK(first->named[0].imported == "users");
        CHECK(first->named[0].local == "usersTable");
        CHECK(first->named[0].renamed);
        CHECK(first->named[1].local == "orders");
        CHECK_FALSE(first->named[1].renamed);

        const auto* second = file.statements()[1]->as<ImportDeclaration>();
        REQUIRE(second != nullptr);
        CHECK(second->type_only);
    }

    SECTION("default and namespace imports") {
        auto file = parse_ts("a.ts", "import db, * as schema from './db';");
        REQUIRE(file.statements().size() == 1);
        const auto* decl = file.statements()[0]->as<ImportDeclaration>();
        REQUIRE(decl != nullptr);
        CHECK(decl->default_local == "db");
        CHECK(decl->namespace_local == "schema");
        CHECK(decl->module == "./db");
    }
}

TEST_CASE("TsParser binding patterns", "[parser]") {

    SECTION("object pattern with rename and nesting") {
        auto file = parse_ts("a.ts",
            "const { id, slug: s, nested: { deep } } = params;");
        REQUIRE(file.statements().size() == 1);
        const auto* decl = file.statements()[0]->as<VariableDeclaration>();
        REQUIRE(decl != nullptr);
        CHECK(decl->keyword == "const");
        REQUIRE(decl->declarators.size() == 1);

        const auto* pattern = std::get_if<ObjectPattern>(&decl->declarators[0].binding);
        REQUIRE(pattern != nullptr);
        REQUIRE(pattern->elements.size() == 3);
        CHECK(pattern->elements[0].property == "id");
        CHECK(pattern->elements[0].local == "id");
        CHECK(pattern->elements[0].depth == 0);
        CHECK(pattern->elements[1].property == "slug");
        CHECK(pattern->elements[1].local == "s");
        CHECK(pattern->elements[2].local == "deep");
        CHECK(pattern->elements[2].depth == 1);
    }

    SECTION("array pattern with holes") {
        auto file = parse_ts("a.ts", "let [a, , b] = list;");
        const auto* decl = file.statements()[0]->as<VariableDeclaration>();
        REQUIRE(decl != nullptr);
        const auto* pattern = std::get_if<ArrayPattern>(&decl->declarators[0].binding);
        REQUIRE(pattern != nullptr);
        CHECK(pattern->locals == std::vector<std::string>{"a", "b"});
    }

    SECTION("several declarators with type annotations") {
        auto file = parse_ts("a.ts", "var n: number = 5, m: Array<string> = [];");
        const auto* decl = file.statements()[0]->as<VariableDeclaration>();
        REQUIRE(decl != nullptr);
        REQUIRE(decl->declarators.size() == 2);
        REQUIRE(decl->declarators[0].init != nullptr);
        CHECK(decl->declarators[0].init->is<NumberLiteral>());
        CHECK(decl->declarators[1].init->is<ArrayLiteral>());
    }
}

TEST_CASE("TsParser expressions", "[parser]") {
    auto file = parse_ts("a.ts", R"(
const hex = 0x1F;
const big = 1_000;
const label = `plain`;
const cast = value as string;
const nonNull = user!.name;
const optional = user?.name;
const typed = useLoaderData<typeof loader>();
const obj = { a: 1, b, ...rest, m() { return 1; } };
const arrow = async ({ request }: Args) => request.url;
const fn = function named(x) { return x; };
const created = new Date();
)");
    const auto decls = declarators(file);

    SECTION("literals") {
        REQUIRE(decls.at("hex")->as<NumberLiteral>() != nullptr);
        CHECK(decls.at("hex")->as<NumberLiteral>()->value == 31);
        CHECK(decls.at("big")->as<NumberLiteral>()->value == 1000);

        const auto* label = decls.at("label")->as<StringLiteral>();
        REQUIRE(label != nullptr);
        CHECK(label->value == "plain");
        CHECK(label->is_template);
    }

    SECTION("type assertions are opaque wrappers") {
        const auto* cast = decls.at("cast")->as<Opaque>();
        REQUIRE(cast != nullptr);
        CHECK(cast->kind == OpaqueKind::TYPE_ASSERTION);
        REQUIRE(cast->children.size() == 1);
        CHECK(cast->children[0]->is<Identifier>());

        const auto* access = decls.at("nonNull")->as<PropertyAccess>();
        REQUIRE(access != nullptr);
        CHECK(access->name == "name");
        const auto* inner = access->object->as<Opaque>();
        REQUIRE(inner != nullptr);
        CHECK(inner->kind == OpaqueKind::TYPE_ASSERTION);
    }

    SECTION("optional chaining") {
        const auto* access = decls.at("optional")->as<PropertyAccess>();
        REQUIRE(access != nullptr);
        CHECK(access->optional);
    }

    SECTION("explicit type arguments are dropped") {
        const auto* call = decls.at("typed")->as<Call>();
        REQUIRE(call != nullptr);
        REQUIRE(call->callee->as<Identifier>() != nullptr);
        CHECK(call->callee->as<Identifier>()->name == "useLoaderData");
        CHECK(call->args.empty());
    }

    SECTION("object literal property kinds") {
        const auto* obj = decls.at("obj")->as<ObjectLiteral>();
        REQUIRE(obj != nullptr);
        REQUIRE(obj->properties.size() == 4);
        CHECK(obj->properties[0].kind == PropertyKind::KEY_VALUE);
        CHECK(obj->properties[0].key == "a");
        CHECK(obj->properties[1].kind == PropertyKind::SHORTHAND);
        CHECK(obj->properties[1].value->as<Identifier>()->name == "b");
        CHECK(obj->properties[2].kind == PropertyKind::SPREAD);
        CHECK(obj->properties[3].kind == PropertyKind::METHOD);
        CHECK(obj->properties[3].key == "m");
    }

    SECTION("arrows and functions") {
        const auto* arrow = decls.at("arrow")->as<Function>();
        REQUIRE(arrow != nullptr);
        CHECK(arrow->arrow);
        REQUIRE(arrow->params.size() == 1);
        CHECK(arrow->params[0].empty());   // Destructured parameter has no single name
        REQUIRE(arrow->expression_body != nullptr);
        CHECK(arrow->expression_body->is<PropertyAccess>());

        const auto* fn = decls.at("fn")->as<Function>();
        REQUIRE(fn != nullptr);
        CHECK_FALSE(fn->arrow);
        CHECK(fn->params == std::vector<std::string>{"x"});
        CHECK(fn->body.size() == 1);

        const auto* created = decls.at("created")->as<Opaque>();
        REQUIRE(created != nullptr);
        CHECK(created->kind == OpaqueKind::NEW);
    }
}

TEST_CASE("TsParser finds chains inside function bodies and callbacks", "[parser]") {
    auto file = parse_ts("route.tsx", R"(
export async function action({ request }: ActionFunctionArgs) {
  const formData = await request.formData();
  if (!formData.get('name')) {
    return json({ error: 'missing' }, { status: 400 });
  }
  await db.transaction(async (tx) => {
    await tx.insert(users).values({ name: 'x' });
  });
  return redirect('/users');
}
)");
    const auto decls = declarators(file);
    CHECK(decls.contains("formData"));

    const auto methods = called_methods(file);
    CHECK(std::ranges::find(methods, "formData") != methods.end());
    CHECK(std::ranges::find(methods, "transaction") != methods.end());
    CHECK(std::ranges::find(methods, "insert") != methods.end());
    CHECK(std::ranges::find(methods, "values") != methods.end());
}

TEST_CASE("TsParser recovers from unsupported syntax", "[parser]") {
    auto file = parse_ts("page.tsx", R"(
interface Props {
  title: string;
  count?: number;
}

type Row = { id: number };

export default function Page() {
  return <div className="card">{user.name}</div>;
}

class Repo extends Base {
  private items: string[] = [];
}

const after = 1;
)");
    const auto decls = declarators(file);
    REQUIRE(decls.contains("after"));
    REQUIRE(decls.at("after") != nullptr);
    CHECK(decls.at("after")->is<NumberLiteral>());
}

TEST_CASE("TsParser spans and locations", "[parser]") {
    auto file = parse_ts("a.ts", "const x = 1;\n  const rows = db.select();\n");
    const auto decls = declarators(file);
    const Expr* call = decls.at("rows");
    REQUIRE(call != nullptr);
    CHECK(file.text(call->span) == "db.select()");

    const auto loc = file.location(call->span.start);
    CHECK(loc.file == "a.ts");
    CHECK(loc.line == 2);
    CHECK(loc.column == 16);
}

TEST_CASE("TsParser parameter names", "[parser]") {
    auto file = parse_ts("a.ts", R"(
const a = (tx, { id }, [first], ...rest) => tx;
const b = function (tx: Transaction, limit = 10) { return tx; };
const c = tx => tx;
)");
    const auto decls = declarators(file);

    const auto* a = decls.at("a")->as<Function>();
    REQUIRE(a != nullptr);
    CHECK(a->params == std::vector<std::string>{"tx", "", "", "rest"});

    const auto* b = decls.at("b")->as<Function>();
    REQUIRE(b != nullptr);
    CHECK(b->params == std::vector<std::string>{"tx", "limit"});

    const auto* c = decls.at("c")->as<Function>();
    REQUIRE(c != nullptr);
    CHECK(c->params == std::vector<std::string>{"tx"});
}

TEST_CASE("TsParser string literals and comments", "[parser]") {
    auto file = parse_ts("a.ts", R"(
const escaped = 'it\'s\n\u0041\x42';
const call = fn(/* first */ 1, // second
  2);
const tagged = sql`select ${id}`;
)");
    const auto decls = declarators(file);

    const auto* escaped = decls.at("escaped")->as<StringLiteral>();
    REQUIRE(escaped != nullptr);
    CHECK(escaped->value == "it's\nAB");
    CHECK_FALSE(escaped->is_template);

    const auto* call = decls.at("call")->as<Call>();
    REQUIRE(call != nullptr);
    CHECK(call->args.size() == 2);

    const auto* tagged = decls.at("tagged")->as<Opaque>();
    REQUIRE(tagged != nullptr);
    CHECK(tagged->kind == OpaqueKind::TEMPLATE);
    REQUIRE(tagged->children.size() == 2);
    CHECK(tagged->children[0]->as<Identifier>()->name == "sql");
}

TEST_CASE("TsParser dialect follows the file extension", "[parser]") {
    CHECK(dialect_for_path("app/db/schema.ts") == SourceDialect::TYPESCRIPT);
    CHECK(dialect_for_path("lib/x.MTS") == SourceDialect::TYPESCRIPT);
    CHECK(dialect_for_path("app/routes/users.tsx") == SourceDialect::TSX);
    CHECK(dialect_for_path("app/routes/legacy.jsx") == SourceDialect::TSX);
    CHECK(dialect_for_path("app/routes/plain.js") == SourceDialect::TSX);

    // <T>x is only a type assertion outside TSX
    const auto file = parse_ts("a.ts", "const v = <number>raw;");
    const auto* cast = declarators(file).at("v")->as<Opaque>();
    REQUIRE(cast != nullptr);
    CHECK(cast->kind == OpaqueKind::TYPE_ASSERTION);
    REQUIRE(cast->children.size() == 1);
    CHECK(cast->children[0]->as<Identifier>()->name == "raw");
}

TEST_CASE("TsParser keeps statements after a syntax error", "[parser]") {
    auto file = parse_ts("a.ts", R"(
const broken = (1 + ;
const rows = db.select().from(users);
)");
    const auto methods = called_methods(file);
    CHECK(std::ranges::find(methods, "from") != methods.end());
}

TEST_CASE("TsParser rejects input nested past the limit", "[parser]") {
    const auto nested = [](size_t depth) {
        std::string source = "const x = ";
        source.append(depth, '[');
        source += '1';
        source.append(depth, ']');
        source += ";\nconst rows = db.select();\n";
        return source;
    };

    SECTION("moderate nesting parses") {
        const auto file = parse_ts("a.ts", nested(200));
        CHECK(declarators(file).contains("rows"));
    }

    SECTION("pathological nesting is a parse error, not a crash") {
        const auto result = TsParser::parse_source("a.ts", nested(100000));
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::PARSE_ERROR);
        CHECK(result.error_message().find("nests deeper") != std::string::npos);
    }
}

TEST_CASE("TsParser parse_file reports unreadable files", "[parser]") {
    auto result = TsParser::parse_file("/nonexistent/ormaudit/route.ts");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::IO_ERROR);
    CHECK(result.error_message().find("route.ts") != std::string::npos);
}

TEST_CASE("ParentMap links children to parents", "[parser]") {
    auto file = parse_ts("a.ts", "db.select().from(users);");
    ParentMap parents(file.statements());

    const auto* stmt = file.statements()[0]->as<ExpressionStatement>();
    REQUIRE(stmt != nullptr);
    const Expr& outer = *stmt->expr;
    CHECK(parents.parent_of(outer) == nullptr);

    const auto* from_call = outer.as<Call>();
    REQUIRE(from_call != nullptr);
    const Expr& from_access = *from_call->callee;
    CHECK(parents.parent_of(from_access) == &outer);
    CHECK(parents.parent_of(*from_call->args[0]) == &outer);
    CHECK(parents.size() > 4);
}
