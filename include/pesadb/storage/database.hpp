#pragma once

#include "pesadb/storage/table.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pesadb::storage {

struct ReferencingColumn final {
    const Table* table = nullptr;
    std::size_t column_ordinal = 0U;
};

class Database final {
public:
    explicit Database(std::string name);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    // Validates REFERENCES targets (existing table and column of the same type) before adding.
    Table& create_table(std::string table_name, std::vector<ColumnDefinition> columns);
    // Rejected while another table still references it.
    void drop_table(std::string_view table_name);

    [[nodiscard]] Table* find_table(std::string_view table_name) noexcept;
    [[nodiscard]] const Table* find_table(std::string_view table_name) const noexcept;
    [[nodiscard]] Table& table(std::string_view table_name);
    [[nodiscard]] const Table& table(std::string_view table_name) const;

    // Creation order.
    [[nodiscard]] std::vector<std::string> table_names() const;
    [[nodiscard]] const std::vector<std::unique_ptr<Table>>& tables() const noexcept { return tables_; }

    [[nodiscard]] std::vector<ReferencingColumn> referencing_columns(const Table& target,
                                                                     std::size_t column_ordinal) const;

    // Referential checks run before the table is touched; no cascading.
    std::size_t delete_rows(Table& table, const std::vector<RowId>& row_ids);
    void update_rows(Table& table, std::vector<RowUpdate> updates);

private:
    void check_not_referenced(const Table& table,
                              std::size_t column_ordinal,
                              const Value& value,
                              RowId row_id,
                              std::string_view action) const;

    std::string name_;
    std::vector<std::unique_ptr<Table>> tables_{};
};

}  // namespace pesadb::storage
