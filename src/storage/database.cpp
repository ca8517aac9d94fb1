#include "pesadb/storage/database.hpp"

#include "pesadb/common/sql_errors.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace pesadb::storage {

namespace {

[[nodiscard]] std::string quote_name(std::string_view text)
{
    return "'" + std::string{text} + "'";
}

// Referencing rows of the same table that are part of the mutation do not block it.
[[nodiscard]] bool blocks(const Table& referencing,
                          const Table& target,
                          std::span<const RowId> holders,
                          const std::unordered_set<RowId>& affected)
{
    if (&referencing != &target) {
        return !holders.empty();
    }
    return std::any_of(holders.begin(), holders.end(), [&](RowId holder) {
        return affected.find(holder) == affected.end();
    });
}

}  // namespace

Database::Database(std::string name)
    : name_{std::move(name)}
{}

Table& Database::create_table(std::string table_name, std::vector<ColumnDefinition> columns)
{
    if (find_table(table_name) != nullptr) {
        throw SqlError{SqlErrc::TableAlreadyExists,
                       "Table " + quote_name(table_name) + " already exists in database " + quote_name(name_)};
    }

    auto table = std::make_unique<Table>(std::move(table_name), std::move(columns));
    for (const auto& column : table->columns()) {
        if (!column.references) {
            continue;
        }

        const auto& reference = *column.references;
        const Table* target = reference.table == table->name() ? table.get() : find_table(reference.table);
        if (target == nullptr) {
            throw SqlError{SqlErrc::InvalidSchema,
                           "Column " + quote_name(column.name) + " references unknown table " + quote_name(reference.table)};
        }
        const auto target_ordinal = target->column_index(reference.column);
        if (!target_ordinal) {
            throw SqlError{SqlErrc::InvalidSchema,
                           "Column " + quote_name(column.name) + " references unknown column " +
                               quote_name(reference.table + "." + reference.column)};
        }
        const auto target_type = target->columns()[*target_ordinal].type;
        if (target_type != column.type) {
            throw SqlError{SqlErrc::InvalidSchema,
                           "Column " + quote_name(column.name) + " of type " + std::string{column_type_name(column.type)} +
                               " cannot reference " + quote_name(reference.table + "." + reference.column) + " of type " +
                               std::string{column_type_name(target_type)}};
        }
    }

    tables_.push_back(std::move(table));
    return *tables_.back();
}

void Database::drop_table(std::string_view table_name)
{
    const auto it = std::find_if(tables_.begin(), tables_.end(), [&](const std::unique_ptr<Table>& table) {
        return table->name() == table_name;
    });
    if (it == tables_.end()) {
        throw SqlError{SqlErrc::TableNotFound,
                       "Table " + quote_name(table_name) + " does not exist in database " + quote_name(name_)};
    }

    for (const auto& other : tables_) {
        if (other->name() == table_name) {
            continue;
        }
        for (const auto& column : other->columns()) {
            if (column.references && column.references->table == table_name) {
                throw SqlError{SqlErrc::ConstraintViolation,
                               "Cannot drop table " + quote_name(table_name) + ": column " +
                                   quote_name(other->name() + "." + column.name) + " references it"};
            }
        }
    }

    tables_.erase(it);
}

Table* Database::find_table(std::string_view table_name) noexcept
{
    for (const auto& table : tables_) {
        if (table->name() == table_name) {
            return table.get();
        }
    }
    return nullptr;
}

const Table* Database::find_table(std::string_view table_name) const noexcept
{
    for (const auto& table : tables_) {
        if (table->name() == table_name) {
            return table.get();
        }
    }
    return nullptr;
}

Table& Database::table(std::string_view table_name)
{
    if (auto* found = find_table(table_name)) {
        return *found;
    }
    throw SqlError{SqlErrc::TableNotFound,
                   "Table " + quote_name(table_name) + " does not exist in database " + quote_name(name_)};
}

const Table& Database::table(std::string_view table_name) const
{
    if (const auto* found = find_table(table_name)) {
        return *found;
    }
    throw SqlError{SqlErrc::TableNotFound,
                   "Table " + quote_name(table_name) + " does not exist in database " + quote_name(name_)};
}

std::vector<std::string> Database::table_names() const
{
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (const auto& table : tables_) {
        names.push_back(table->name());
    }
    return names;
}

std::vector<ReferencingColumn> Database::referencing_columns(const Table& target, std::size_t column_ordinal) const
{
    std::vector<ReferencingColumn> result;
    const auto& target_column = target.columns().at(column_ordinal).name;
    for (const auto& table : tables_) {
        const auto& columns = table->columns();
        for (std::size_t ordinal = 0U; ordinal < columns.size(); ++ordinal) {
            const auto& reference = columns[ordinal].references;
            if (reference && reference->table == target.name() && reference->column == target_column) {
                result.push_back(ReferencingColumn{table.get(), ordinal});
            }
        }
    }
    return result;
}

void Database::check_not_referenced(const Table& table,
                                    std::size_t column_ordinal,
                                    const Value& value,
                                    RowId row_id,
                                    std::string_view action) const
{
    const std::unordered_set<RowId> affected{row_id};
    for (const auto& referencing : referencing_columns(table, column_ordinal)) {
        const auto* index = referencing.table->index_for(referencing.column_ordinal);
        if (index == nullptr) {
            continue;
        }
        if (blocks(*referencing.table, table, index->lookup(value), affected)) {
            throw SqlError{SqlErrc::ConstraintViolation,
                           "Cannot " + std::string{action} + " row of " + quote_name(table.name()) + ": value " +
                               format_literal(value) + " is referenced by " +
                               quote_name(referencing.table->name() + "." +
                                      referencing.table->columns()[referencing.column_ordinal].name)};
        }
    }
}

std::size_t Database::delete_rows(Table& table, const std::vector<RowId>& row_ids)
{
    const std::unordered_set<RowId> affected{row_ids.begin(), row_ids.end()};
    for (std::size_t ordinal = 0U; ordinal < table.column_count(); ++ordinal) {
        const auto referencing_list = referencing_columns(table, ordinal);
        if (referencing_list.empty()) {
            continue;
        }

        for (const auto row_id : row_ids) {
            const auto* row = table.find_row(row_id);
            if (row == nullptr || is_null((*row)[ordinal])) {
                continue;
            }
            const auto& value = (*row)[ordinal];
            for (const auto& referencing : referencing_list) {
                const auto* index = referencing.table->index_for(referencing.column_ordinal);
                if (index == nullptr) {
                    continue;
                }
                if (blocks(*referencing.table, table, index->lookup(value), affected)) {
                    throw SqlError{SqlErrc::ConstraintViolation,
                                   "Cannot delete from " + quote_name(table.name()) + ": value " + format_literal(value) +
                                       " is still referenced by " +
                                       quote_name(referencing.table->name() + "." +
                                              referencing.table->columns()[referencing.column_ordinal].name)};
                }
            }
        }
    }

    return table.erase(row_ids);
}

void Database::update_rows(Table& table, std::vector<RowUpdate> updates)
{
    for (const auto& update : updates) {
        const auto* row = table.find_row(update.row_id);
        if (row == nullptr) {
            continue;
        }
        const auto limit = std::min(update.values.size(), row->size());
        for (std::size_t ordinal = 0U; ordinal < limit; ++ordinal) {
            const auto& current = (*row)[ordinal];
            if (is_null(current) || values_equal(current, update.values[ordinal])) {
                continue;
            }
            check_not_referenced(table, ordinal, current, update.row_id, "update");
        }
    }

    table.update(std::move(updates));
}

}  // namespace pesadb::storage
