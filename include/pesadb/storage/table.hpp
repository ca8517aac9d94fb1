#pragma once

#include "pesadb/storage/hash_index.hpp"
#include "pesadb/storage/row.hpp"
#include "pesadb/storage/value.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pesadb::storage {

struct ForeignKeyReference final {
    std::string table{};
    std::string column{};
};

struct ColumnDefinition final {
    std::string name{};
    ColumnType type = ColumnType::Int;
    bool primary_key = false;
    bool unique = false;
    std::optional<ForeignKeyReference> references{};
};

struct RowUpdate final {
    RowId row_id = 0U;
    Row values{};
};

class Table final {
public:
    // Throws SqlError(InvalidSchema) unless there is at least one column, names are unique and
    // exactly one column is the primary key.
    Table(std::string name, std::vector<ColumnDefinition> columns);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<ColumnDefinition>& columns() const noexcept { return columns_; }
    [[nodiscard]] std::size_t column_count() const noexcept { return columns_.size(); }
    [[nodiscard]] std::optional<std::size_t> column_index(std::string_view column_name) const noexcept;
    [[nodiscard]] std::size_t primary_key_ordinal() const noexcept { return primary_key_ordinal_; }

    [[nodiscard]] const std::map<RowId, Row>& rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }
    [[nodiscard]] const Row* find_row(RowId row_id) const;

    [[nodiscard]] const std::vector<HashIndex>& indexes() const noexcept { return indexes_; }
    [[nodiscard]] const HashIndex* index_for(std::size_t column_ordinal) const noexcept;

    // Checks arity and types, widens INT to FLOAT and rejects a NULL primary key.
    [[nodiscard]] Row conform_row(Row values) const;

    // All-or-nothing: on SqlError neither rows nor indexes change.
    RowId insert(Row values);
    void update(std::vector<RowUpdate> updates);
    std::size_t erase(const std::vector<RowId>& row_ids);

private:
    [[nodiscard]] HashIndex* mutable_index_for(std::size_t column_ordinal) noexcept;
    [[noreturn]] void throw_duplicate(const HashIndex& index, const Value& key) const;

    std::string name_;
    std::vector<ColumnDefinition> columns_;
    std::size_t primary_key_ordinal_ = 0U;
    std::map<RowId, Row> rows_{};
    RowId next_row_id_ = 1U;
    std::vector<HashIndex> indexes_{};
    std::vector<std::optional<std::size_t>> index_slots_{};
};

}  // namespace pesadb::storage
