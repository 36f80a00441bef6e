#include <catch2/catch_test_macros.hpp>
#include "analyzer/audit_runner.hpp"
#include "core/parallel.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ormaudit;
using namespace ormaudit::test_support;

namespace {

constexpr const char* kNewUserRoute = R"(import { db } from '~/db';
import { users } from '~/db/schema';

export async function action({ request }) {
  const formData = await request.formData();
  await db.insert(users).values({
    name: formData.get('name'),
    email: formData.get('email'),
    age: formData.get('age'),
  });
}
)";

constexpr const char* kListRoute = R"(
export async function loader() {
  return db.select().from(users).orderBy(asc(users.name));
}
)";

AnalyzerConfig project_config(const TmpDir& dir) {
    AnalyzerConfig config;
    config.project.root = dir.root();
    config.logging.level = "error";
    return config;
}

} // namespace

TEST_CASE("parallel_map_ordered keeps input order", "[parallel]") {
    std::vector<int> inputs;
    for (int i = 0; i < 37; ++i) inputs.push_back(i);

    for (size_t workers : {0, 1, 3, 8, 100}) {
        const auto out = parallel_map_ordered(inputs, workers, [](int x) { return x * x; });
        REQUIRE(out.size() == inputs.size());
        for (size_t i = 0; i < out.size(); ++i) {
            CHECK(out[i] == static_cast<int>(i * i));
        }
    }

    const std::vector<int> none;
    CHECK(parallel_map_ordered(none, 4, [](int x) { return x; }).empty());
}

TEST_CASE("parallel_map_ordered rethrows a worker failure after joining", "[parallel]") {
    std::vector<int> inputs;
    for (int i = 0; i < 40; ++i) inputs.push_back(i);

    std::atomic<int> completed{0};
    const auto fail_at = [&](int x) {
        if (x == 5) throw std::runtime_error("item 5");
        if (x == 25) throw std::runtime_error("item 25");
        ++completed;
        return x;
    };

    // Four ranges of ten; the first two failures stop their ranges
    CHECK_THROWS_WITH(parallel_map_ordered(inputs, 4, fail_at), "item 5");
    CHECK(completed.load() == 30);

    completed = 0;
    CHECK_THROWS_AS(parallel_map_ordered(inputs, 1, fail_at), std::runtime_error);
    CHECK(completed.load() == 5);
}

TEST_CASE("AuditRunner schema resolution", "[runner]") {

    SECTION("configured path resolves against the root") {
        TmpDir dir("runner_schema_configured");
        const auto path = dir.file("lib/tables.ts", kSchemaSource);
        auto config = project_config(dir);
        config.schema.path = "lib/tables.ts";

        const AuditRunner runner(config);
        const auto resolved = runner.resolve_schema_path();
        REQUIRE(resolved.is_ok());
        CHECK(std::filesystem::equivalent(resolved.value(), path));
        REQUIRE(runner.load_schema().is_ok());
        CHECK(runner.load_schema().value().tables.size() == 2);
    }

    SECTION("discovered path") {
        TmpDir dir("runner_schema_discovered");
        dir.file("app/db/schema.ts", kSchemaSource);
        const AuditRunner runner(project_config(dir));
        REQUIRE(runner.resolve_schema_path().is_ok());
    }

    SECTION("no schema anywhere") {
        TmpDir dir("runner_schema_none");
        const AuditRunner runner(project_config(dir));
        const auto report = runner.run();
        REQUIRE(report.is_error());
        CHECK(report.error_category() == ErrorCategory::SCHEMA_ERROR);
        CHECK(report.error_message().find("No Drizzle schema found") != std::string::npos);
    }

    SECTION("configured path that does not exist") {
        TmpDir dir("runner_schema_missing");
        auto config = project_config(dir);
        config.schema.path = "src/db/schema.ts";
        const auto report = AuditRunner(config).run();
        REQUIRE(report.is_error());
        CHECK(report.error_category() == ErrorCategory::SCHEMA_ERROR);
    }
}

TEST_CASE("AuditRunner end to end", "[runner]") {
    TmpDir dir("runner_end_to_end");
    dir.file("src/db/schema.ts", kSchemaSource);
    dir.file("app/routes/users.new.tsx", kNewUserRoute);
    dir.file("app/routes/users._index.tsx", kListRoute);
    auto config = project_config(dir);
    config.analysis.workers = 2;

    const AuditRunner runner(config);
    CHECK(runner.target_files().size() == 2);

    const auto result = runner.run();
    REQUIRE(result.is_ok());
    const auto& report = result.value();

    REQUIRE(report.queries.size() == 2);
    CHECK(report.queries[0].queries[0].sql == "SELECT * FROM users ORDER BY name ASC");
    CHECK(report.queries[1].queries[0].sql ==
          "INSERT INTO users (name, email, age) VALUES ($1, $2, $3)");

    // Missing status plus a string into the integer age column
    REQUIRE(report.issues.size() == 2);
    CHECK(report.issues[0].message == "db.insert(users) missing required column 'status'");
    CHECK(report.issues[1].message ==
          "Column 'age' expects integer but receives string from formData.get()");

    SECTION("text rendering") {
        const auto text = runner.render(report);
        CHECK(text.starts_with("Found 2 SQL queries:\n"));
        CHECK(text.find("app/routes/users.new.tsx:6:9 [error]") != std::string::npos);
    }

    SECTION("json rendering") {
        config.output.format = OutputFormat::JSON;
        const auto doc = nlohmann::json::parse(AuditRunner(config).render(report));
        CHECK(doc["schema"] == "src/db/schema.ts");
        CHECK(doc["sql"]["totalQueries"] == 2);
        CHECK(doc["persistence"]["totalIssues"] == 2);
        CHECK(doc["persistence"]["issues"][0]["location"]["file"] == "app/routes/users.new.tsx");
    }

    SECTION("explicit file list") {
        config.project.files = {"app/routes/users._index.tsx"};
        const auto only_list = AuditRunner(config).run();
        REQUIRE(only_list.is_ok());
        CHECK(only_list.value().queries.size() == 1);
        CHECK(only_list.value().issues.empty());
    }
}
