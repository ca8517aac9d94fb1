#include "pesadb/shell/shell_engine.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using pesadb::shell::CommandMetrics;
using pesadb::shell::ShellEngine;
namespace storage = pesadb::storage;

namespace {

std::filesystem::path make_unique_shell_path()
{
    const auto base = std::filesystem::temp_directory_path();
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return base / ("pesadb_shell_engine_" + std::to_string(stamp));
}

struct TempShellDirectory final {
    TempShellDirectory()
        : path{make_unique_shell_path()}
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    ~TempShellDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path path;
};

ShellEngine::Config make_config(storage::Catalog& catalog)
{
    ShellEngine::Config config{};
    config.catalog = &catalog;
    return config;
}

struct ShellHarness final {
    ShellHarness()
        : engine{make_config(catalog)}
    {
        for (const auto* sql : {"CREATE DATABASE shop;",
                                "USE shop;",
                                "CREATE TABLE items (id INT PRIMARY KEY, name STRING, price FLOAT);"}) {
            const auto metrics = engine.execute_sql(sql);
            REQUIRE(metrics.success);
        }
    }

    storage::Catalog catalog{};
    ShellEngine engine;
};

}  // namespace

TEST_CASE("format_table aligns columns", "[shell][format]")
{
    const auto lines = pesadb::shell::format_table({"id", "name"}, {{"1", "apple"}, {"10", "kiwi"}});
    REQUIRE(lines.size() == 4U);
    CHECK(lines[0] == "id | name");
    CHECK(lines[1] == "---+------");
    CHECK(lines[2] == "1  | apple");
    CHECK(lines[3] == "10 | kiwi");

    const auto empty = pesadb::shell::format_table({"database"}, {});
    CHECK(empty == std::vector<std::string>{"database", "--------", "(no rows)"});
}

TEST_CASE("ShellEngine requires a catalog", "[shell]")
{
    CHECK_THROWS_AS(ShellEngine{ShellEngine::Config{}}, std::invalid_argument);
}

TEST_CASE("ShellEngine treats blank input as an empty command", "[shell]")
{
    storage::Catalog catalog;
    ShellEngine engine{make_config(catalog)};

    for (const auto* input : {"", "   \n", " ; ;"}) {
        const auto metrics = engine.execute_sql(input);
        CHECK(metrics.success);
        CHECK(metrics.summary == "Empty command.");
        CHECK(metrics.statements_executed == 0U);
    }
}

TEST_CASE("ShellEngine summarises statements", "[shell]")
{
    ShellHarness harness;

    const auto insert = harness.engine.execute_sql("INSERT INTO items VALUES (1, 'apple', 2)");
    REQUIRE(insert.success);
    CHECK(insert.summary == "1 row inserted into 'items'");
    CHECK(insert.command_category == "dml");
    CHECK(insert.rows_touched == 1U);
    CHECK(insert.statements_executed == 1U);
    CHECK(insert.diagnostics.empty());

    const auto query = harness.engine.execute_sql("SELECT id, name, price FROM items;");
    REQUIRE(query.success);
    CHECK(query.summary == "1 row returned");
    CHECK(query.command_category == "query");
    CHECK(query.rows_touched == 1U);
    CHECK(query.detail_lines == std::vector<std::string>{"id | name  | price", "---+-------+------", "1  | apple | 2.0"});

    const auto nothing = harness.engine.execute_sql("SELECT name FROM items WHERE price > 10.0");
    REQUIRE(nothing.success);
    CHECK(nothing.summary == "0 rows returned");
    CHECK(nothing.detail_lines.back() == "(no rows)");

    const auto listing = harness.engine.execute_sql("SHOW DATABASES");
    CHECK(listing.summary == "Listed 1 database");
    CHECK(listing.command_category == "introspection");
}

TEST_CASE("ShellEngine runs scripts and stops at the first failure", "[shell][script]")
{
    ShellHarness harness;

    const auto script = harness.engine.execute_sql(
        "INSERT INTO items VALUES (1, 'apple', 1.5); INSERT INTO items VALUES (2, 'pear', 0.5); SELECT * FROM items");
    REQUIRE(script.success);
    CHECK(script.statements_executed == 3U);
    CHECK(script.summary == "Executed 3 statements (3 succeeded)");
    CHECK(script.command_category == "script");
    REQUIRE_FALSE(script.detail_lines.empty());
    CHECK(script.detail_lines.front() == "1 row inserted into 'items'");
    CHECK_THAT(script.detail_lines.back(), ContainsSubstring("pear"));

    const auto failing = harness.engine.execute_sql(
        "INSERT INTO items VALUES (3, 'fig', 1.0); INSERT INTO items VALUES (3, 'dup', 1.0); DELETE FROM items");
    CHECK_FALSE(failing.success);
    CHECK(failing.statements_executed == 2U);
    CHECK(failing.summary == "Executed 2 statements (1 succeeded)");
    CHECK(failing.command_category == "dml");
    REQUIRE(failing.diagnostics.size() == 1U);
    CHECK(failing.diagnostics.front().kind == "ConstraintViolation");
    CHECK(failing.diagnostics.front().statement == "INSERT INTO items VALUES (3, 'dup', 1.0)");
    CHECK(harness.catalog.database("shop").table("items").row_count() == 3U);
}

TEST_CASE("ShellEngine accepts a whole script file body", "[shell][script]")
{
    ShellHarness harness;

    const auto script = harness.engine.execute_sql("-- seed data\n"
                                                   "INSERT INTO items VALUES (1, 'apple', 1.5);\n"
                                                   "\n"
                                                   "INSERT INTO items\n"
                                                   "  VALUES (2, 'it''s; fine', 0.5); -- trailing\n"
                                                   "SELECT name FROM items WHERE id = 2;\n");
    REQUIRE(script.success);
    CHECK(script.statements_executed == 3U);
    CHECK(script.detail_lines.back() == "  it's; fine");
    CHECK(harness.catalog.database("shop").table("items").row_count() == 2U);
}

TEST_CASE("ShellEngine reports errors with diagnostics and hints", "[shell][errors]")
{
    storage::Catalog catalog;
    ShellEngine engine{make_config(catalog)};

    const auto unselected = engine.execute_sql("SHOW TABLES");
    REQUIRE_FALSE(unselected.success);
    CHECK(unselected.summary == "NoDatabaseSelected: No database selected; run USE <database> first");
    REQUIRE(unselected.diagnostics.size() == 1U);
    CHECK(unselected.diagnostics.front().remediation_hints ==
          std::vector<std::string>{"Run USE <database>; or start the shell with --database."});

    const auto syntax = engine.execute_sql("SELECT FROM items");
    REQUIRE_FALSE(syntax.success);
    REQUIRE(syntax.diagnostics.size() == 1U);
    const auto& diagnostic = syntax.diagnostics.front();
    CHECK(diagnostic.kind == "SyntaxError");
    CHECK(diagnostic.position == std::optional<std::size_t>{7U});
    CHECK(diagnostic.message == "Expected column name but found keyword FROM at position 7");
    CHECK_FALSE(diagnostic.remediation_hints.empty());
}

TEST_CASE("ShellEngine translates meta commands", "[shell][meta]")
{
    ShellHarness harness;

    const auto databases = harness.engine.execute_sql("\\l");
    REQUIRE(databases.success);
    CHECK(databases.command_category == "meta");
    CHECK(databases.summary == "Listed 1 database");
    CHECK(databases.detail_lines == std::vector<std::string>{"database", "--------", "shop"});

    const auto tables = harness.engine.execute_sql("  \\dt  ");
    REQUIRE(tables.success);
    CHECK(tables.summary == "Listed 1 table in 'shop'");

    const auto columns = harness.engine.execute_sql("\\d items");
    REQUIRE(columns.success);
    CHECK(columns.summary == "Table 'items' has 3 columns");
    REQUIRE(columns.detail_lines.size() == 5U);
    CHECK(columns.detail_lines[0] == "column | type   | constraints");
    CHECK(columns.detail_lines[2] == "id     | INT    | PRIMARY KEY");
    CHECK(columns.detail_lines[3] == "name   | STRING | -");

    const auto missing = harness.engine.execute_sql("\\d nope");
    CHECK_FALSE(missing.success);
    REQUIRE(missing.diagnostics.size() == 1U);
    CHECK(missing.diagnostics.front().kind == "TableNotFound");

    const auto unknown = harness.engine.execute_sql("\\x");
    CHECK_FALSE(unknown.success);
    CHECK(unknown.summary == "Unsupported meta command.");
    REQUIRE(unknown.diagnostics.size() == 1U);
    CHECK(unknown.diagnostics.front().kind == "ShellError");
}

TEST_CASE("ShellEngine assigns correlation ids and invokes the logger", "[shell][logging]")
{
    storage::Catalog catalog;
    std::vector<CommandMetrics> logged;

    auto config = make_config(catalog);
    config.command_logger = [&logged](const CommandMetrics& metrics) { logged.push_back(metrics); };
    ShellEngine engine{config};

    const auto first = engine.execute_sql("CREATE DATABASE a");
    const auto second = engine.execute_sql("\\l");
    static_cast<void>(engine.execute_sql("   "));

    CHECK(first.correlation_id == "cmd-1");
    CHECK(second.correlation_id == "cmd-2");
    REQUIRE(logged.size() == 2U);
    CHECK(logged[0].command_text == "CREATE DATABASE a");
    CHECK(logged[1].command_text == "\\l");
    CHECK(logged[0].started_at <= logged[0].finished_at);
    CHECK(logged[0].duration_ms >= 0.0);
}

TEST_CASE("ShellEngine keeps data across restarts of a persistent catalog", "[shell][persistence]")
{
    TempShellDirectory temp;

    {
        storage::Catalog catalog{storage::Catalog::Config{temp.path}};
        REQUIRE_FALSE(catalog.open());
        ShellEngine engine{make_config(catalog)};
        REQUIRE(engine.execute_sql("CREATE DATABASE shop; USE shop; CREATE TABLE t (id INT PRIMARY KEY, v STRING);")
                    .success);
        REQUIRE(engine.execute_sql("INSERT INTO t VALUES (1, 'kept')").success);
        CHECK(engine.telemetry().snapshot().flushes_succeeded == 3U);
    }

    storage::Catalog catalog{storage::Catalog::Config{temp.path}};
    REQUIRE_FALSE(catalog.open());
    ShellEngine engine{make_config(catalog)};
    REQUIRE(engine.execute_sql("USE shop").success);
    CHECK(engine.session().current_database == std::optional<std::string>{"shop"});

    const auto query = engine.execute_sql("SELECT v FROM t");
    REQUIRE(query.success);
    CHECK(query.detail_lines.back() == "kept");
}
