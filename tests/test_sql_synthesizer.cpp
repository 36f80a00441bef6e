#include <catch2/catch_test_macros.hpp>
#include "sql/sql_synthesizer.hpp"
#include "test_support.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace ormaudit;
using namespace ormaudit::test_support;

namespace {

std::optional<GeneratedSql> synthesize_one(const std::string& source) {
    static const SchemaModel schema = fixture_schema();
    const auto file = parse_ts("route.tsx", source);
    const auto chains = analyze_file_chains(file, AnalysisConfig{});
    REQUIRE(chains.size() == 1);
    return SqlSynthesizer::generate(chains.front(), schema);
}

} // namespace

TEST_CASE("SqlSynthesizer select", "[sql]") {

    SECTION("clauses render in fixed order whatever the call order") {
        const auto sql = synthesize_one(R"(
const rows = await db.select()
  .limit(10)
  .orderBy(desc(users.createdAt))
  .where(eq(users.status, 'active'))
  .offset(20)
  .groupBy(users.status)
  .innerJoin(orders, eq(users.id, orders.userId))
  .from(users);
)");
        REQUIRE(sql.has_value());
        CHECK(sql->type == StatementType::SELECT);
        CHECK(sql->sql ==
              "SELECT * FROM users INNER JOIN orders ON users.id = orders.user_id "
              "WHERE status = 'active' GROUP BY users.status ORDER BY created_at DESC "
              "LIMIT 10 OFFSET 20");
        CHECK(sql->tables == std::vector<std::string>{"users", "orders"});
        CHECK(sql->parameters.empty());
    }

    SECTION("order keys on a joined table are qualified") {
        const auto sql = synthesize_one(R"(
db.select().from(users).innerJoin(orders, eq(users.id, orders.userId))
  .orderBy(desc(orders.userId), asc(users.createdAt));
)");
        REQUIRE(sql.has_value());
        CHECK(sql->sql ==
              "SELECT * FROM users INNER JOIN orders ON users.id = orders.user_id "
              "ORDER BY orders.user_id DESC, created_at ASC");
    }

    SECTION("selected columns use declared names") {
        const auto sql = synthesize_one(
            "db.select({ id: users.id, isAdmin: users.isAdmin }).from(users);");
        REQUIRE(sql.has_value());
        CHECK(sql->sql == "SELECT id, is_admin FROM users");
    }

    SECTION("renamed table import") {
        const auto sql = synthesize_one(R"(
import { users as u } from '~/db/schema';
db.select().from(u).where(eq(u.isAdmin, true));
)");
        REQUIRE(sql.has_value());
        CHECK(sql->sql == "SELECT * FROM users WHERE is_admin = true");
        CHECK(sql->tables == std::vector<std::string>{"users"});
    }

    SECTION("unknown tables pass through unchanged") {
        const auto sql = synthesize_one("db.select().from(auditLog).where(eq(auditLog.actorId, 5));");
        REQUIRE(sql.has_value());
        CHECK(sql->sql == "SELECT * FROM auditLog WHERE actorId = 5");
    }

    SECTION("non-literal values become numbered parameters") {
        const auto sql = synthesize_one(R"(
export async function loader({ params }) {
  return db.select().from(users).where(and(eq(users.id, params.id), like(users.name, pattern)));
}
)");
        REQUIRE(sql.has_value());
        CHECK(sql->sql == "SELECT * FROM users WHERE id = $1 AND name LIKE $2");
        REQUIRE(sql->parameters.size() == 2);
        CHECK(sql->parameters[0].position == 1);
        CHECK(sql->parameters[0].source == "params.id");
        CHECK(sql->parameters[0].column_type == "serial");
        CHECK(sql->parameters[1].position == 2);
        CHECK(sql->parameters[1].source == "pattern");
        CHECK(sql->parameters[1].column_type == "text");
    }
}

TEST_CASE("SqlSynthesizer insert", "[sql]") {

    SECTION("literals inline, form fields parameterized") {
        const auto sql = synthesize_one(R"(
export async function action({ request }) {
  const formData = await request.formData();
  await db.insert(users).values({
    name: formData.get('name'),
    email: "o'brien@x.io",
    age: 30,
    isAdmin: true,
  });
}
)");
        REQUIRE(sql.has_value());
        CHECK(sql->type == StatementType::INSERT);
        CHECK(sql->sql ==
              "INSERT INTO users (name, email, age, is_admin) VALUES ($1, 'o''brien@x.io', 30, true)");
        REQUIRE(sql->parameters.size() == 1);
        CHECK(sql->parameters[0].source == "formData.get('name')");
        CHECK(sql->parameters[0].column_type == "text");
    }

    SECTION("null literal") {
        const auto sql = synthesize_one("db.insert(orders).values({ userId: 1, total: 2, note: null });");
        REQUIRE(sql.has_value());
        CHECK(sql->sql == "INSERT INTO orders (user_id, total, note) VALUES (1, 2, NULL)");
    }

    SECTION("no extractable payload") {
        CHECK_FALSE(synthesize_one("db.insert(users).values(data);").has_value());
        CHECK_FALSE(synthesize_one("db.insert(users).values({});").has_value());
    }
}

TEST_CASE("SqlSynthesizer update and delete", "[sql]") {

    SECTION("update with where") {
        const auto sql = synthesize_one(R"(
export async function action({ params }) {
  await db.update(users).set({ status: 'banned' }).where(eq(users.id, params.id));
}
)");
        REQUIRE(sql.has_value());
        CHECK(sql->type == StatementType::UPDATE);
        CHECK(sql->sql == "UPDATE users SET status = 'banned' WHERE id = $1");
        REQUIRE(sql->parameters.size() == 1);
        CHECK(sql->parameters[0].source == "params.id");
        CHECK(sql->parameters[0].column_type == "serial");
    }

    SECTION("update without set") {
        CHECK_FALSE(synthesize_one("db.update(users).where(eq(users.id, 1));").has_value());
    }

    SECTION("delete with and and isNull") {
        const auto sql = synthesize_one(
            "await db.delete(orders).where(and(eq(orders.userId, userId), isNull(orders.note)));");
        REQUIRE(sql.has_value());
        CHECK(sql->type == StatementType::DELETE);
        CHECK(sql->sql == "DELETE FROM orders WHERE user_id = $1 AND note IS NULL");
        REQUIRE(sql->parameters.size() == 1);
        CHECK(sql->parameters[0].source == "userId");
        CHECK(sql->parameters[0].column_type == "integer");
    }

    SECTION("delete without where") {
        const auto sql = synthesize_one("db.delete(orders);");
        REQUIRE(sql.has_value());
        CHECK(sql->sql == "DELETE FROM orders");
    }
}
