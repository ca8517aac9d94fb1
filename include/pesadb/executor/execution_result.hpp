#pragma once

#include "pesadb/parser/ast.hpp"
#include "pesadb/storage/row.hpp"
#include "pesadb/storage/table.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace pesadb::executor {

// Replaces a process-wide "current database"; threaded through every call.
struct Session final {
    std::optional<std::string> current_database{};
};

struct QueryResult final {
    std::vector<std::string> columns{};
    std::vector<storage::Row> rows{};
};

struct MutationResult final {
    std::uint64_t affected_rows = 0U;
    std::string message{};
};

struct SchemaDescriptor final {
    enum class Kind : std::uint8_t {
        Databases = 0,
        Tables,
        Columns
    };

    Kind kind = Kind::Databases;
    // Owning database for Tables, table name for Columns.
    std::string subject{};
    std::vector<std::string> names{};
    std::vector<storage::ColumnDefinition> columns{};
};

using StatementPayload = std::variant<std::monostate, QueryResult, MutationResult, SchemaDescriptor>;

struct StatementResult final {
    std::string statement{};
    std::optional<parser::CommandCategory> category{};
    std::error_code error{};
    std::string message{};
    std::optional<std::size_t> position{};
    StatementPayload payload{};
    std::chrono::nanoseconds duration{0};

    [[nodiscard]] bool success() const noexcept { return !error; }
};

}  // namespace pesadb::executor
