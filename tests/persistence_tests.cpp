#include "pesadb/common/sql_errors.hpp"
#include "pesadb/storage/catalog.hpp"
#include "pesadb/storage/checksum.hpp"
#include "pesadb/storage/persistence.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace storage = pesadb::storage;
using storage::ColumnDefinition;
using storage::ColumnType;
using storage::Row;
using storage::Value;

namespace {

std::filesystem::path make_unique_data_path()
{
    const auto base = std::filesystem::temp_directory_path();
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return base / ("pesadb_persistence_" + std::to_string(stamp));
}

struct TempDataDirectory final {
    TempDataDirectory()
        : path{make_unique_data_path()}
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    ~TempDataDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path path;
};

ColumnDefinition column(std::string name, ColumnType type)
{
    ColumnDefinition definition{};
    definition.name = std::move(name);
    definition.type = type;
    return definition;
}

void populate_shop(storage::Database& database)
{
    auto id = column("id", ColumnType::Int);
    id.primary_key = true;
    auto email = column("email", ColumnType::String);
    email.unique = true;
    auto& users = database.create_table("users", {id, email, column("score", ColumnType::Float), column("vip", ColumnType::Bool)});
    users.insert(Row{Value{std::int64_t{1}}, Value{std::string{"ann@x"}}, Value{1.5}, Value{true}});
    users.insert(Row{Value{std::int64_t{2}}, Value{}, Value{}, Value{false}});
    users.insert(Row{Value{std::int64_t{3}}, Value{std::string{"it's"}}, Value{-2.0}, Value{}});

    auto user_id = column("user_id", ColumnType::Int);
    user_id.references = storage::ForeignKeyReference{"users", "id"};
    auto& orders = database.create_table("orders", {id, user_id});
    orders.insert(Row{Value{std::int64_t{10}}, Value{std::int64_t{1}}});
}

void write_bytes(const std::filesystem::path& path, std::string_view bytes)
{
    std::ofstream stream{path, std::ios::binary | std::ios::trunc};
    stream.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

}  // namespace

TEST_CASE("crc32c matches the Castagnoli check value", "[persistence][checksum]")
{
    const std::string_view text = "123456789";
    const auto bytes = std::as_bytes(std::span<const char>{text.data(), text.size()});
    CHECK(storage::crc32c(bytes) == 0xE3069283U);
    CHECK(storage::crc32c({}) == 0U);
}

TEST_CASE("encoded documents rebuild schema, rows and indexes", "[persistence]")
{
    storage::Database source{"shop"};
    populate_shop(source);

    const auto document = storage::encode_database(source);
    REQUIRE(document.size() > 24U);
    CHECK(std::string(reinterpret_cast<const char*>(document.data()), 8U) == "PESADB01");

    std::unique_ptr<storage::Database> decoded;
    REQUIRE_FALSE(storage::decode_database(document, decoded));
    REQUIRE(decoded != nullptr);
    CHECK(decoded->name() == "shop");
    CHECK(decoded->table_names() == std::vector<std::string>{"users", "orders"});

    const auto& users = decoded->table("users");
    REQUIRE(users.row_count() == 3U);
    CHECK(users.columns()[1].unique);
    CHECK(users.columns()[0].primary_key);
    std::vector<Row> rows;
    for (const auto& [row_id, row] : users.rows()) {
        rows.push_back(row);
    }
    CHECK(rows[0] == Row{Value{std::int64_t{1}}, Value{std::string{"ann@x"}}, Value{1.5}, Value{true}});
    CHECK(rows[1] == Row{Value{std::int64_t{2}}, Value{}, Value{}, Value{false}});
    CHECK(std::get<std::string>(rows[2][1]) == "it's");
    CHECK(users.index_for(1U)->lookup(Value{std::string{"ann@x"}}).size() == 1U);

    const auto& orders = decoded->table("orders");
    REQUIRE(orders.columns()[1].references.has_value());
    CHECK(orders.columns()[1].references->table == "users");
    CHECK(decoded->referencing_columns(users, 0U).size() == 1U);
}

TEST_CASE("tampered or truncated documents are rejected", "[persistence][errors]")
{
    storage::Database source{"shop"};
    populate_shop(source);
    auto document = storage::encode_database(source);
    std::unique_ptr<storage::Database> decoded;

    SECTION("payload bit flip")
    {
        document.back() ^= std::byte{0x01};
        const auto ec = storage::decode_database(document, decoded);
        CHECK(ec == std::errc::illegal_byte_sequence);
        CHECK(decoded == nullptr);
    }

    SECTION("truncated payload")
    {
        document.resize(document.size() - 3U);
        CHECK(storage::decode_database(document, decoded) == std::errc::illegal_byte_sequence);
    }

    SECTION("short header")
    {
        document.resize(10U);
        CHECK(storage::decode_database(document, decoded) == std::errc::illegal_byte_sequence);
    }

    SECTION("wrong magic")
    {
        document.front() = std::byte{'X'};
        CHECK(storage::decode_database(document, decoded) == std::errc::illegal_byte_sequence);
    }
}

TEST_CASE("save_database replaces the document atomically", "[persistence][files]")
{
    TempDataDirectory temp_dir;
    const auto path = temp_dir.path / "nested" / "shop.pdb";

    storage::Database database{"shop"};
    populate_shop(database);
    REQUIRE_FALSE(storage::save_database(database, path));
    CHECK(std::filesystem::exists(path));
    CHECK_FALSE(std::filesystem::exists(temp_dir.path / "nested" / "shop.pdb.tmp"));

    database.table("users").insert(Row{Value{std::int64_t{4}}, Value{}, Value{}, Value{}});
    REQUIRE_FALSE(storage::save_database(database, path));

    std::unique_ptr<storage::Database> loaded;
    REQUIRE_FALSE(storage::load_database(path, loaded));
    CHECK(loaded->table("users").row_count() == 4U);

    std::unique_ptr<storage::Database> missing;
    CHECK(storage::load_database(temp_dir.path / "absent.pdb", missing) == std::errc::no_such_file_or_directory);
}

TEST_CASE("Catalog reloads databases and skips unreadable documents", "[persistence][catalog]")
{
    TempDataDirectory temp_dir;

    {
        storage::Catalog catalog{storage::Catalog::Config{temp_dir.path}};
        REQUIRE_FALSE(catalog.open());
        CHECK(catalog.persistent());
        populate_shop(catalog.create_database("shop"));
        catalog.create_database("archive");
        REQUIRE_FALSE(catalog.flush("shop"));
        REQUIRE_FALSE(catalog.flush("archive"));
        CHECK(catalog.document_path("shop") == temp_dir.path / "shop.pdb");
    }

    write_bytes(temp_dir.path / "broken.pdb", "not a database");
    write_bytes(temp_dir.path / "notes.txt", "ignored");
    std::filesystem::copy_file(temp_dir.path / "archive.pdb", temp_dir.path / "renamed.pdb");

    storage::Catalog reopened{storage::Catalog::Config{temp_dir.path}};
    REQUIRE_FALSE(reopened.open());
    CHECK(reopened.database_names() == std::vector<std::string>{"archive", "shop"});
    CHECK(reopened.database("shop").table("users").row_count() == 3U);
    CHECK(reopened.load_warnings().size() == 2U);

    reopened.drop_database("archive");
    CHECK_FALSE(std::filesystem::exists(temp_dir.path / "archive.pdb"));
    CHECK(reopened.find_database("archive") == nullptr);
}

TEST_CASE("in-memory catalogs never touch the filesystem", "[persistence][catalog]")
{
    storage::Catalog catalog;
    REQUIRE_FALSE(catalog.open());
    CHECK_FALSE(catalog.persistent());
    catalog.create_database("scratch");
    CHECK_FALSE(catalog.flush("scratch"));

    try {
        catalog.create_database("scratch");
        FAIL("expected a duplicate database error");
    } catch (const pesadb::SqlError& error) {
        CHECK(error.errc() == pesadb::SqlErrc::DatabaseAlreadyExists);
    }
}
