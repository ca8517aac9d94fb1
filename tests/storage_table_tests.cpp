#include "pesadb/common/sql_errors.hpp"
#include "pesadb/storage/table.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using pesadb::SqlErrc;
using pesadb::SqlError;
using pesadb::storage::ColumnDefinition;
using pesadb::storage::ColumnType;
using pesadb::storage::Row;
using pesadb::storage::RowId;
using pesadb::storage::RowUpdate;
using pesadb::storage::Table;
using pesadb::storage::Value;

namespace {

ColumnDefinition column(std::string name, ColumnType type, bool primary_key = false, bool unique = false)
{
    ColumnDefinition definition{};
    definition.name = std::move(name);
    definition.type = type;
    definition.primary_key = primary_key;
    definition.unique = unique;
    return definition;
}

Table make_users()
{
    return Table{"users",
                 {column("id", ColumnType::Int, true),
                  column("email", ColumnType::String, false, true),
                  column("score", ColumnType::Float)}};
}

Row user(std::int64_t id, Value email, Value score = Value{})
{
    return Row{Value{id}, std::move(email), std::move(score)};
}

SqlErrc error_of(const auto& action)
{
    try {
        action();
    } catch (const SqlError& error) {
        return error.errc();
    }
    return SqlErrc::Success;
}

}  // namespace

TEST_CASE("Table validates its schema", "[storage][table]")
{
    CHECK(error_of([] { Table{"t", {}}; }) == SqlErrc::InvalidSchema);
    CHECK(error_of([] { Table{"t", {column("a", ColumnType::Int)}}; }) == SqlErrc::InvalidSchema);
    CHECK(error_of([] {
              Table{"t", {column("a", ColumnType::Int, true), column("b", ColumnType::Int, true)}};
          }) == SqlErrc::InvalidSchema);
    CHECK(error_of([] {
              Table{"t", {column("a", ColumnType::Int, true), column("a", ColumnType::String)}};
          }) == SqlErrc::InvalidSchema);

    const auto table = make_users();
    CHECK(table.primary_key_ordinal() == 0U);
    CHECK(table.column_index("email") == std::optional<std::size_t>{1U});
    CHECK_FALSE(table.column_index("missing").has_value());
    REQUIRE(table.indexes().size() == 2U);
    CHECK(table.index_for(0U) != nullptr);
    CHECK(table.index_for(1U) != nullptr);
    CHECK(table.index_for(2U) == nullptr);
}

TEST_CASE("Table insert assigns row ids and widens integers", "[storage][table]")
{
    auto table = make_users();
    const auto first = table.insert(user(1, Value{std::string{"a@x"}}, Value{std::int64_t{7}}));
    const auto second = table.insert(user(2, Value{std::string{"b@x"}}));
    CHECK(first == 1U);
    CHECK(second == 2U);
    CHECK(table.row_count() == 2U);

    const auto* row = table.find_row(first);
    REQUIRE(row != nullptr);
    CHECK(std::get<double>((*row)[2]) == 7.0);
    CHECK(table.index_for(0U)->lookup(Value{std::int64_t{2}}).size() == 1U);
}

TEST_CASE("Table insert enforces types and keys without partial effects", "[storage][table][constraints]")
{
    auto table = make_users();
    table.insert(user(1, Value{std::string{"a@x"}}));

    CHECK(error_of([&] { table.insert(user(1, Value{std::string{"other@x"}})); }) == SqlErrc::ConstraintViolation);
    CHECK(error_of([&] { table.insert(user(2, Value{std::string{"a@x"}})); }) == SqlErrc::ConstraintViolation);
    CHECK(error_of([&] { table.insert(Row{Value{}, Value{std::string{"n@x"}}, Value{}}); }) ==
          SqlErrc::ConstraintViolation);
    CHECK(error_of([&] { table.insert(user(3, Value{std::int64_t{5}})); }) == SqlErrc::TypeMismatch);
    CHECK(error_of([&] { table.insert(Row{Value{std::int64_t{4}}}); }) == SqlErrc::TypeMismatch);

    CHECK(table.row_count() == 1U);
    CHECK(table.index_for(0U)->entry_count() == 1U);
    CHECK(table.index_for(1U)->entry_count() == 1U);
}

TEST_CASE("Table reports the duplicate key and column", "[storage][table][constraints]")
{
    auto table = make_users();
    table.insert(user(1, Value{std::string{"a@x"}}));
    try {
        table.insert(user(1, Value{std::string{"b@x"}}));
        FAIL("expected a constraint violation");
    } catch (const SqlError& error) {
        CHECK(error.detail() == "Duplicate value 1 for PRIMARY KEY column 'id' of table 'users'");
    }
}

TEST_CASE("UNIQUE columns accept several NULLs", "[storage][table][null]")
{
    auto table = make_users();
    table.insert(user(1, Value{}));
    table.insert(user(2, Value{}));
    CHECK(table.row_count() == 2U);
    CHECK(table.index_for(1U)->lookup(Value{}).size() == 2U);
}

TEST_CASE("Table update is validated as a whole", "[storage][table][update]")
{
    auto table = make_users();
    const auto first = table.insert(user(1, Value{std::string{"a@x"}}));
    const auto second = table.insert(user(2, Value{std::string{"b@x"}}));
    const auto third = table.insert(user(3, Value{std::string{"c@x"}}));

    SECTION("swapping unique values between updated rows succeeds")
    {
        table.update({RowUpdate{first, user(1, Value{std::string{"b@x"}})},
                      RowUpdate{second, user(2, Value{std::string{"a@x"}})}});
        CHECK(std::get<std::string>((*table.find_row(first))[1]) == "b@x");
        CHECK(table.index_for(1U)->lookup(Value{std::string{"a@x"}}).front() == second);
    }

    SECTION("two rows receiving the same key are rejected")
    {
        CHECK(error_of([&] {
                  table.update({RowUpdate{first, user(1, Value{std::string{"z@x"}})},
                                RowUpdate{second, user(2, Value{std::string{"z@x"}})}});
              }) == SqlErrc::ConstraintViolation);
        CHECK(std::get<std::string>((*table.find_row(first))[1]) == "a@x");
    }

    SECTION("a key held by a row outside the batch is rejected")
    {
        CHECK(error_of([&] { table.update({RowUpdate{first, user(1, Value{std::string{"c@x"}})}}); }) ==
              SqlErrc::ConstraintViolation);
        CHECK(table.index_for(1U)->lookup(Value{std::string{"c@x"}}).front() == third);
    }

    SECTION("an invalid value leaves every row untouched")
    {
        CHECK(error_of([&] {
                  table.update({RowUpdate{first, user(1, Value{std::string{"q@x"}}, Value{1.5})},
                                RowUpdate{second, user(2, Value{true})}});
              }) == SqlErrc::TypeMismatch);
        CHECK(pesadb::storage::is_null((*table.find_row(first))[2]));
    }
}

TEST_CASE("Table erase removes rows and index entries", "[storage][table]")
{
    auto table = make_users();
    const auto first = table.insert(user(1, Value{std::string{"a@x"}}));
    table.insert(user(2, Value{std::string{"b@x"}}));

    CHECK(table.erase({first, RowId{99}}) == 1U);
    CHECK(table.row_count() == 1U);
    CHECK(table.find_row(first) == nullptr);
    CHECK(table.index_for(0U)->lookup(Value{std::int64_t{1}}).empty());

    const auto reused = table.insert(user(1, Value{std::string{"a@x"}}));
    CHECK(reused == 3U);
}
