#include "pesadb/common/sql_errors.hpp"
#include "pesadb/executor/executor.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <variant>
#include <vector>

using pesadb::SqlErrc;
using pesadb::executor::Executor;
using pesadb::executor::ExecutorTelemetry;
using pesadb::executor::MutationResult;
using pesadb::executor::QueryResult;
using pesadb::executor::Session;
using pesadb::executor::StatementResult;
namespace storage = pesadb::storage;

namespace {

struct ShopFixture {
    ShopFixture()
    {
        for (const auto* sql : {"CREATE DATABASE shop",
                                "USE shop",
                                "CREATE TABLE users (id INT PRIMARY KEY, name STRING, age INT, email STRING UNIQUE)",
                                "CREATE TABLE orders (id INT PRIMARY KEY, user_id INT REFERENCES users(id), total FLOAT)"}) {
            const auto result = executor.execute(session, sql);
            REQUIRE(result.success());
        }
    }

    StatementResult run(const std::string& sql) { return executor.execute(session, sql); }

    MutationResult mutate(const std::string& sql)
    {
        auto result = run(sql);
        CAPTURE(sql);
        CAPTURE(result.message);
        REQUIRE(result.success());
        return std::get<MutationResult>(result.payload);
    }

    std::vector<storage::Row> rows_of(const std::string& sql)
    {
        auto result = run(sql);
        CAPTURE(sql);
        CAPTURE(result.message);
        REQUIRE(result.success());
        return std::get<QueryResult>(result.payload).rows;
    }

    storage::Table& users() { return catalog.database("shop").table("users"); }

    storage::Catalog catalog{};
    ExecutorTelemetry telemetry{};
    Executor executor{catalog, Executor::Config{true, &telemetry}};
    Session session{};
};

}  // namespace

TEST_CASE("INSERT stores one row and reports it", "[executor][dml][insert]")
{
    ShopFixture shop;
    const auto inserted = shop.mutate("INSERT INTO users (id, name, age, email) VALUES (1, 'Ann', 30, 'ann@x')");
    CHECK(inserted.affected_rows == 1U);
    CHECK(inserted.message == "1 row inserted into 'users'");

    shop.mutate("INSERT INTO users VALUES (2, 'Bob', NULL, NULL)");
    shop.mutate("INSERT INTO users (email, id) VALUES ('cid@x', 3)");

    const auto rows = shop.rows_of("SELECT id, name, age, email FROM users WHERE id = 3");
    REQUIRE(rows.size() == 1U);
    CHECK(storage::is_null(rows[0][1]));
    CHECK(storage::is_null(rows[0][2]));
    CHECK(std::get<std::string>(rows[0][3]) == "cid@x");

    const auto snapshot = shop.telemetry.snapshot();
    CHECK(snapshot.insert_rows_attempted == 3U);
    CHECK(snapshot.insert_rows_succeeded == 3U);
}

TEST_CASE("INSERT widens integers into FLOAT columns", "[executor][dml][insert]")
{
    ShopFixture shop;
    shop.mutate("INSERT INTO users (id) VALUES (1)");
    shop.mutate("INSERT INTO orders VALUES (10, 1, 12)");
    const auto rows = shop.rows_of("SELECT total FROM orders");
    REQUIRE(rows.size() == 1U);
    CHECK(std::get<double>(rows[0][0]) == 12.0);
}

TEST_CASE("INSERT rejects invalid rows without side effects", "[executor][dml][insert][errors]")
{
    ShopFixture shop;
    shop.mutate("INSERT INTO users VALUES (1, 'Ann', 30, 'ann@x')");

    const auto duplicate = shop.run("INSERT INTO users VALUES (1, 'Again', 31, 'again@x')");
    CHECK(duplicate.error == SqlErrc::ConstraintViolation);
    CHECK(duplicate.message == "Duplicate value 1 for PRIMARY KEY column 'id' of table 'users'");

    CHECK(shop.run("INSERT INTO users VALUES (2, 'Bob', 20, 'ann@x')").error == SqlErrc::ConstraintViolation);
    CHECK(shop.run("INSERT INTO users (name) VALUES ('NoKey')").error == SqlErrc::ConstraintViolation);
    CHECK(shop.run("INSERT INTO users VALUES ('x', 'Bob', 20, NULL)").error == SqlErrc::TypeMismatch);
    CHECK(shop.run("INSERT INTO users VALUES (2, 'Bob')").error == SqlErrc::TypeMismatch);
    CHECK(shop.run("INSERT INTO users (nickname) VALUES ('b')").error == SqlErrc::ColumnNotFound);
    CHECK(shop.run("INSERT INTO missing VALUES (1)").error == SqlErrc::TableNotFound);

    const auto mismatch = shop.run("INSERT INTO users (id, name) VALUES (2)");
    CHECK(mismatch.error == SqlErrc::TypeMismatch);
    CHECK(mismatch.message == "INSERT lists 2 columns but 1 values");

    const auto listed_twice = shop.run("INSERT INTO users (id, id) VALUES (2, 3)");
    CHECK(listed_twice.error == SqlErrc::SyntaxError);
    CHECK(listed_twice.message == "Column 'id' is listed twice");

    CHECK(shop.users().row_count() == 1U);
    CHECK(shop.telemetry.snapshot().insert_rows_succeeded == 1U);
}

TEST_CASE("UPDATE changes matching rows", "[executor][dml][update]")
{
    ShopFixture shop;
    shop.mutate("INSERT INTO users VALUES (1, 'Ann', 30, 'ann@x')");
    shop.mutate("INSERT INTO users VALUES (2, 'Bob', 25, 'bob@x')");
    shop.mutate("INSERT INTO users VALUES (3, 'Cid', 30, NULL)");

    const auto updated = shop.mutate("UPDATE users SET age = 31, name = 'Thirty' WHERE age = 30");
    CHECK(updated.affected_rows == 2U);
    CHECK(updated.message == "2 rows updated in 'users'");

    const auto single = shop.mutate("UPDATE users SET email = 'bobby@x' WHERE id = 2");
    CHECK(single.message == "1 row updated in 'users'");

    const auto none = shop.mutate("UPDATE users SET age = 1 WHERE age > 100");
    CHECK(none.affected_rows == 0U);
    CHECK(none.message == "0 rows updated in 'users'");

    const auto rows = shop.rows_of("SELECT name, age FROM users WHERE age = 31");
    CHECK(rows.size() == 2U);
    CHECK(std::get<std::string>(rows[0][0]) == "Thirty");

    CHECK(shop.run("UPDATE users SET nickname = 'x'").error == SqlErrc::ColumnNotFound);
    CHECK(shop.run("UPDATE users SET age = 1, age = 2").error == SqlErrc::SyntaxError);
    CHECK(shop.run("UPDATE users SET age = 'old'").error == SqlErrc::TypeMismatch);
    CHECK(shop.run("UPDATE users SET age = 1 WHERE missing = 1").error == SqlErrc::ColumnNotFound);
}

TEST_CASE("UPDATE is all-or-nothing across the matched rows", "[executor][dml][update][constraints]")
{
    ShopFixture shop;
    shop.mutate("INSERT INTO users VALUES (1, 'Ann', 30, 'ann@x')");
    shop.mutate("INSERT INTO users VALUES (2, 'Bob', 25, 'bob@x')");

    const auto result = shop.run("UPDATE users SET email = 'same@x'");
    CHECK(result.error == SqlErrc::ConstraintViolation);

    const auto rows = shop.rows_of("SELECT email FROM users");
    REQUIRE(rows.size() == 2U);
    CHECK(std::get<std::string>(rows[0][0]) == "ann@x");
    CHECK(std::get<std::string>(rows[1][0]) == "bob@x");

    CHECK(shop.run("UPDATE users SET id = 2 WHERE id = 1").error == SqlErrc::ConstraintViolation);
    CHECK(shop.run("UPDATE users SET id = NULL WHERE id = 1").error == SqlErrc::ConstraintViolation);
    CHECK(shop.mutate("UPDATE users SET email = NULL").affected_rows == 2U);
}

TEST_CASE("DELETE removes matching rows", "[executor][dml][delete]")
{
    ShopFixture shop;
    shop.mutate("INSERT INTO users VALUES (1, 'Ann', 30, 'ann@x')");
    shop.mutate("INSERT INTO users VALUES (2, 'Bob', 25, 'bob@x')");
    shop.mutate("INSERT INTO users VALUES (3, 'Cid', NULL, NULL)");

    const auto one = shop.mutate("DELETE FROM users WHERE age < 28");
    CHECK(one.affected_rows == 1U);
    CHECK(one.message == "1 row deleted from 'users'");

    CHECK(shop.mutate("DELETE FROM users WHERE age IS NULL").affected_rows == 1U);
    const auto all = shop.mutate("DELETE FROM users");
    CHECK(all.message == "1 row deleted from 'users'");
    CHECK(shop.mutate("DELETE FROM users").message == "0 rows deleted from 'users'");

    const auto snapshot = shop.telemetry.snapshot();
    CHECK(snapshot.delete_rows_succeeded == 3U);
}

TEST_CASE("referenced rows cannot be deleted or re-keyed", "[executor][dml][references]")
{
    ShopFixture shop;
    shop.mutate("INSERT INTO users VALUES (1, 'Ann', 30, 'ann@x')");
    shop.mutate("INSERT INTO users VALUES (2, 'Bob', 25, 'bob@x')");
    shop.mutate("INSERT INTO orders VALUES (10, 1, 9.5)");

    const auto blocked = shop.run("DELETE FROM users WHERE id = 1");
    CHECK(blocked.error == SqlErrc::ConstraintViolation);
    CHECK(blocked.message == "Cannot delete from 'users': value 1 is still referenced by 'orders.user_id'");

    CHECK(shop.run("DELETE FROM users").error == SqlErrc::ConstraintViolation);
    CHECK(shop.users().row_count() == 2U);

    CHECK(shop.run("UPDATE users SET id = 5 WHERE id = 1").error == SqlErrc::ConstraintViolation);
    CHECK(shop.mutate("UPDATE users SET name = 'Anne' WHERE id = 1").affected_rows == 1U);

    CHECK(shop.mutate("DELETE FROM orders WHERE user_id = 1").affected_rows == 1U);
    CHECK(shop.mutate("DELETE FROM users WHERE id = 1").affected_rows == 1U);
}

TEST_CASE("rows can reference values that do not exist", "[executor][dml][references]")
{
    ShopFixture shop;
    CHECK(shop.mutate("INSERT INTO orders VALUES (10, 99, 1.0)").affected_rows == 1U);
    CHECK(shop.mutate("INSERT INTO orders VALUES (11, NULL, 2.0)").affected_rows == 1U);
}
