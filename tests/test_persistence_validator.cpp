#include <catch2/catch_test_macros.hpp>
#include "persistence/persistence_validator.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

using namespace ormaudit;
using namespace ormaudit::test_support;

namespace {

std::vector<Issue> audit(const std::string& source) {
    static const SchemaModel schema = fixture_schema();
    const auto file = parse_ts("app/routes/users.new.tsx", source);
    return PersistenceValidator::validate(extract_operations(file, AnalysisConfig{}), schema);
}

std::string action(const std::string& body) {
    return "export async function action({ request, params }) {\n"
           "  const formData = await request.formData();\n" + body + "\n}\n";
}

} // namespace

TEST_CASE("Operation extraction", "[persistence]") {
    const auto file = parse_ts("route.tsx", action(R"(
  const rows = await db.select().from(users);
  await db.insert(users).values({ name: formData.get('name'), age: 3 });
  await db.update(users).set({ status: 'banned' }).where(eq(users.id, params.id));
  await db.delete(orders);
  await db.insert(orders).values(payload);)"));

    const auto ops = extract_operations(file, AnalysisConfig{});
    REQUIRE(ops.size() == 4);

    CHECK(ops[0].type == StatementType::INSERT);
    CHECK(ops[0].table_name == "users");
    CHECK(ops[0].handle == "db");
    CHECK(ops[0].has_payload);
    REQUIRE(ops[0].column_values.size() == 2);
    CHECK(ops[0].column_values[0].column_name == "name");
    CHECK(ops[0].column_values[0].data_source.origin == DataOrigin::EXTERNAL_FIELD);
    CHECK(ops[0].location.line == 5);
    CHECK(ops[0].location.column == 9);

    CHECK(ops[1].type == StatementType::UPDATE);
    CHECK(ops[1].has_where);

    CHECK(ops[2].type == StatementType::DELETE);
    CHECK_FALSE(ops[2].has_where);
    CHECK_FALSE(ops[2].has_payload);

    CHECK(ops[3].type == StatementType::INSERT);
    CHECK_FALSE(ops[3].has_payload);
}

TEST_CASE("Operation extraction from unchanged source is identical", "[persistence]") {
    TmpDir dir("operations_twice");
    const auto path = dir.file("app/routes/users.new.tsx", action(R"(
  await db.insert(users).values({ name: formData.get('name'), status: 'active', age: 3 });
  await db.update(users).set({ status: formData.get('status') }).where(eq(users.id, params.id));)"));

    const auto first = extract_operations(path, AnalysisConfig{});
    const auto second = extract_operations(path, AnalysisConfig{});
    REQUIRE(first.size() == 2);
    REQUIRE(second.size() == first.size());

    for (size_t i = 0; i < first.size(); ++i) {
        CHECK(second[i].type == first[i].type);
        CHECK(second[i].table_name == first[i].table_name);
        CHECK(second[i].location == first[i].location);
        CHECK(second[i].span == first[i].span);
        REQUIRE(second[i].column_values.size() == first[i].column_values.size());
        for (size_t c = 0; c < first[i].column_values.size(); ++c) {
            CHECK(second[i].column_values[c].column_name == first[i].column_values[c].column_name);
            CHECK(second[i].column_values[c].data_source == first[i].column_values[c].data_source);
            CHECK(second[i].column_values[c].span == first[i].column_values[c].span);
        }
    }
    CHECK(first == second);
}

TEST_CASE("Operation extraction skips files nested past the parser limit", "[persistence]") {
    TmpDir dir("operations_deep");
    std::string deep = "const x = ";
    deep.append(100000, '[');
    deep += '1';
    deep.append(100000, ']');
    deep += ";\nawait db.insert(users).values({ name: 'a' });\n";
    const auto deep_path = dir.file("app/routes/deep.tsx", deep);
    const auto plain_path = dir.file("app/routes/plain.tsx",
                                     "await db.insert(users).values({ name: 'a' });\n");

    CHECK(extract_operations(deep_path, AnalysisConfig{}).empty());
    CHECK(extract_operations(plain_path, AnalysisConfig{}).size() == 1);
}

TEST_CASE("Operation extraction inside a function expression transaction", "[persistence]") {
    const auto file = parse_ts("route.tsx", R"(
export async function action() {
  await db.transaction(async function (tx) {
    await tx.insert(users).values({ name: 'a' });
  });
}
)");
    const auto ops = extract_operations(file, AnalysisConfig{});
    REQUIRE(ops.size() == 1);
    CHECK(ops[0].handle == "tx");
    CHECK(ops[0].table_name == "users");
}

TEST_CASE("PersistenceValidator missing required columns", "[persistence]") {

    SECTION("one issue per missing column") {
        const auto issues = audit(action(
            "  await db.insert(users).values({ name: 'n', email: 'e' });"));
        REQUIRE(issues.size() == 1);
        const auto& issue = issues.front();
        CHECK(issue.category == "persistence");
        CHECK(issue.severity == Severity::ERROR);
        CHECK(issue.message == "db.insert(users) missing required column 'status'");
        CHECK(issue.code == "db.insert(users).values({...})");
        CHECK(issue.suggestion == "Add 'status' to the values object");
        CHECK(issue.location.file == "app/routes/users.new.tsx");
        CHECK(issue.location.line == 3);
    }

    SECTION("defaults and generated columns are not required") {
        CHECK(audit(action(
            "  await db.insert(users).values({ name: 'n', email: 'e', status: 'active' });")).empty());
    }

    SECTION("shorthand properties count as provided") {
        CHECK(audit(action(
            "  const name = 'n';\n  const email = 'e';\n  const status = 'active';\n"
            "  await db.insert(users).values({ name, email, status });")).empty());
    }

    SECTION("transaction handle appears in the message") {
        const auto issues = audit(action(
            "  await db.transaction(async (tx) => {\n"
            "    await tx.insert(orders).values({ userId: 1 });\n"
            "  });"));
        REQUIRE(issues.size() == 1);
        CHECK(issues[0].message == "tx.insert(orders) missing required column 'total'");
        CHECK(issues[0].code == "tx.insert(orders).values({...})");
    }

    SECTION("updates and non-literal payloads are not checked") {
        CHECK(audit(action("  await db.update(users).set({ name: 'x' }).where(eq(users.id, 1));")).empty());
        CHECK(audit(action("  await db.insert(users).values(data);")).empty());
    }
}

TEST_CASE("PersistenceValidator enum columns", "[persistence]") {

    SECTION("raw form field into an enum column") {
        const auto issues = audit(action(
            "  await db.update(users).set({ status: formData.get('status') }).where(eq(users.id, 1));"));
        REQUIRE(issues.size() == 1);
        CHECK(issues[0].message == "Enum column 'status' receives unvalidated external input");
        CHECK(issues[0].code == "status: formData.get('status')");
        CHECK(issues[0].suggestion ==
              "Validate with zod schema or check against allowed values: 'active', 'inactive', 'banned'");
    }

    SECTION("route params and request body are external too") {
        CHECK(audit(action(
            "  await db.update(users).set({ status: params.status }).where(eq(users.id, 1));")).size() == 1);
        CHECK(audit(action(
            "  const body = await request.json();\n"
            "  await db.update(users).set({ status: body.status }).where(eq(users.id, 1));")).size() == 1);
    }

    SECTION("validated input is accepted") {
        CHECK(audit(action(
            "  const status = StatusSchema.parse(formData.get('status'));\n"
            "  await db.update(users).set({ status }).where(eq(users.id, 1));")).empty());
        CHECK(audit(action(
            "  const data = UserSchema.parse(Object.fromEntries(formData));\n"
            "  await db.update(users).set({ status: data.status }).where(eq(users.id, 1));")).empty());
    }

    SECTION("literals are accepted") {
        CHECK(audit(action(
            "  await db.update(users).set({ status: 'banned' }).where(eq(users.id, 1));")).empty());
    }
}

TEST_CASE("PersistenceValidator type mismatches", "[persistence]") {

    SECTION("string form field into an integer column") {
        const auto issues = audit(action(
            "  await db.update(users).set({ age: formData.get('age') }).where(eq(users.id, 1));"));
        REQUIRE(issues.size() == 1);
        CHECK(issues[0].message == "Column 'age' expects integer but receives string from formData.get()");
        CHECK(issues[0].code == "age: formData.get('age')");
        CHECK(issues[0].suggestion == "Convert with parseInt(age, 10) or Number(age)");
    }

    SECTION("coerced values are accepted") {
        CHECK(audit(action(
            "  await db.update(users).set({ age: Number(formData.get('age')) }).where(eq(users.id, 1));")).empty());
        CHECK(audit(action(
            "  await db.update(users).set({ age: parseInt(formData.get('age'), 10) }).where(eq(users.id, 1));")).empty());
    }

    SECTION("route param into a boolean column") {
        const auto issues = audit(action(
            "  await db.update(users).set({ isAdmin: params.admin }).where(eq(users.id, 1));"));
        REQUIRE(issues.size() == 1);
        CHECK(issues[0].message == "Column 'isAdmin' expects boolean but receives string from params.get()");
        CHECK(issues[0].code == "isAdmin: params.get('admin')");
        CHECK(issues[0].suggestion == "Convert with Boolean(isAdmin) or isAdmin === 'true'");
    }

    SECTION("request body has no known type") {
        CHECK(audit(action(
            "  const body = await request.json();\n"
            "  await db.update(users).set({ age: body.age }).where(eq(users.id, 1));")).empty());
    }

    SECTION("text columns accept strings") {
        CHECK(audit(action(
            "  await db.update(users).set({ name: formData.get('name') }).where(eq(users.id, 1));")).empty());
    }
}

TEST_CASE("PersistenceValidator skips what the schema does not know", "[persistence]") {
    CHECK(audit(action("  await db.insert(sessions).values({ token: formData.get('t') });")).empty());
    CHECK(audit(action(
        "  await db.update(users).set({ nickname: formData.get('nick') }).where(eq(users.id, 1));")).empty());
}

TEST_CASE("check_persistence reads files in order", "[persistence]") {
    TmpDir dir("check_persistence");
    const auto a = dir.file("app/routes/a.tsx", action(
        "  await db.insert(users).values({ name: 'n', email: 'e' });"));
    const auto b = dir.file("app/routes/b.tsx", action(
        "  await db.insert(orders).values({ total: 1 });"));
    const auto schema = fixture_schema();

    AnalysisConfig config;
    config.workers = 2;
    const auto issues = check_persistence({a, b, dir.root() + "/missing.tsx"}, schema, config);
    REQUIRE(issues.size() == 2);
    CHECK(issues[0].location.file == a);
    CHECK(issues[0].message.find("'status'") != std::string::npos);
    CHECK(issues[1].location.file == b);
    CHECK(issues[1].message.find("'userId'") != std::string::npos);
}
