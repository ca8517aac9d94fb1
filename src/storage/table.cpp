#include "pesadb/storage/table.hpp"

#include "pesadb/common/sql_errors.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>

namespace pesadb::storage {

namespace {

[[nodiscard]] std::string quote_name(std::string_view text)
{
    std::string result;
    result.reserve(text.size() + 2U);
    result.push_back('\'');
    result.append(text);
    result.push_back('\'');
    return result;
}

[[nodiscard]] std::optional<IndexKind> index_kind_for(const ColumnDefinition& column) noexcept
{
    if (column.primary_key) {
        return IndexKind::PrimaryKey;
    }
    if (column.unique) {
        return IndexKind::Unique;
    }
    if (column.references) {
        return IndexKind::ForeignKey;
    }
    return std::nullopt;
}

}  // namespace

Table::Table(std::string name, std::vector<ColumnDefinition> columns)
    : name_{std::move(name)}
    , columns_{std::move(columns)}
{
    if (columns_.empty()) {
        throw SqlError{SqlErrc::InvalidSchema, "Table " + quote_name(name_) + " must define at least one column"};
    }

    std::unordered_set<std::string> seen;
    std::size_t primary_keys = 0U;
    for (std::size_t ordinal = 0U; ordinal < columns_.size(); ++ordinal) {
        const auto& column = columns_[ordinal];
        if (!seen.insert(column.name).second) {
            throw SqlError{SqlErrc::InvalidSchema,
                           "Duplicate column " + quote_name(column.name) + " in table " + quote_name(name_)};
        }
        if (column.primary_key) {
            ++primary_keys;
            primary_key_ordinal_ = ordinal;
        }
    }

    if (primary_keys != 1U) {
        throw SqlError{SqlErrc::InvalidSchema,
                       "Table " + quote_name(name_) + " must have exactly one PRIMARY KEY column (found " +
                           std::to_string(primary_keys) + ")"};
    }

    index_slots_.resize(columns_.size());
    for (std::size_t ordinal = 0U; ordinal < columns_.size(); ++ordinal) {
        if (const auto kind = index_kind_for(columns_[ordinal])) {
            index_slots_[ordinal] = indexes_.size();
            indexes_.emplace_back(columns_[ordinal].name, ordinal, *kind);
        }
    }
}

std::optional<std::size_t> Table::column_index(std::string_view column_name) const noexcept
{
    for (std::size_t ordinal = 0U; ordinal < columns_.size(); ++ordinal) {
        if (columns_[ordinal].name == column_name) {
            return ordinal;
        }
    }
    return std::nullopt;
}

const Row* Table::find_row(RowId row_id) const
{
    const auto it = rows_.find(row_id);
    return it == rows_.end() ? nullptr : &it->second;
}

const HashIndex* Table::index_for(std::size_t column_ordinal) const noexcept
{
    if (column_ordinal >= index_slots_.size() || !index_slots_[column_ordinal]) {
        return nullptr;
    }
    return &indexes_[*index_slots_[column_ordinal]];
}

HashIndex* Table::mutable_index_for(std::size_t column_ordinal) noexcept
{
    if (column_ordinal >= index_slots_.size() || !index_slots_[column_ordinal]) {
        return nullptr;
    }
    return &indexes_[*index_slots_[column_ordinal]];
}

Row Table::conform_row(Row values) const
{
    if (values.size() != columns_.size()) {
        throw SqlError{SqlErrc::TypeMismatch,
                       "Table " + quote_name(name_) + " expects " + std::to_string(columns_.size()) +
                           " values but received " + std::to_string(values.size())};
    }

    for (std::size_t ordinal = 0U; ordinal < columns_.size(); ++ordinal) {
        const auto& column = columns_[ordinal];
        auto coerced = coerce_to_column(values[ordinal], column.type);
        if (!coerced) {
            throw SqlError{SqlErrc::TypeMismatch,
                           "Column " + quote_name(column.name) + " expects " + std::string{column_type_name(column.type)} +
                               " but received " + std::string{value_kind_name(value_kind(values[ordinal]))} + " " +
                               format_literal(values[ordinal])};
        }
        values[ordinal] = std::move(*coerced);
    }

    if (is_null(values[primary_key_ordinal_])) {
        throw SqlError{SqlErrc::ConstraintViolation,
                       "PRIMARY KEY column " + quote_name(columns_[primary_key_ordinal_].name) + " of table " + quote_name(name_) +
                           " cannot be NULL"};
    }
    return values;
}

void Table::throw_duplicate(const HashIndex& index, const Value& key) const
{
    throw SqlError{SqlErrc::ConstraintViolation,
                   "Duplicate value " + format_literal(key) + " for " + index_kind_name(index.kind()) + " column " +
                       quote_name(index.column_name()) + " of table " + quote_name(name_)};
}

RowId Table::insert(Row values)
{
    auto row = conform_row(std::move(values));

    for (const auto& index : indexes_) {
        const auto& key = row[index.column_ordinal()];
        if (index.conflicts(key)) {
            throw_duplicate(index, key);
        }
    }

    const auto row_id = next_row_id_;
    for (auto& index : indexes_) {
        index.insert(row[index.column_ordinal()], row_id);
    }
    rows_.emplace(row_id, std::move(row));
    ++next_row_id_;
    return row_id;
}

void Table::update(std::vector<RowUpdate> updates)
{
    std::unordered_set<RowId> updated_ids;
    for (auto& update : updates) {
        if (rows_.find(update.row_id) == rows_.end()) {
            throw SqlError{SqlErrc::ExecutionFailed,
                           "Row " + std::to_string(update.row_id) + " does not exist in table " + quote_name(name_)};
        }
        update.values = conform_row(std::move(update.values));
        updated_ids.insert(update.row_id);
    }

    for (const auto& index : indexes_) {
        if (!index.unique()) {
            continue;
        }

        const auto ordinal = index.column_ordinal();
        std::unordered_set<Value, ValueHash> final_keys;
        for (const auto& update : updates) {
            const auto& key = update.values[ordinal];
            if (is_null(key)) {
                continue;
            }
            if (!final_keys.insert(key).second) {
                throw_duplicate(index, key);
            }

            const auto& current = rows_.at(update.row_id)[ordinal];
            if (current == key) {
                continue;
            }
            const auto holders = index.lookup(key);
            const auto clash = std::any_of(holders.begin(), holders.end(), [&](RowId holder) {
                return updated_ids.find(holder) == updated_ids.end();
            });
            if (clash) {
                throw_duplicate(index, key);
            }
        }
    }

    for (auto& update : updates) {
        auto& row = rows_.at(update.row_id);
        for (auto& index : indexes_) {
            const auto ordinal = index.column_ordinal();
            if (row[ordinal] != update.values[ordinal]) {
                index.erase(row[ordinal], update.row_id);
                index.insert(update.values[ordinal], update.row_id);
            }
        }
        row = std::move(update.values);
    }
}

std::size_t Table::erase(const std::vector<RowId>& row_ids)
{
    std::size_t erased = 0U;
    for (const auto row_id : row_ids) {
        const auto it = rows_.find(row_id);
        if (it == rows_.end()) {
            continue;
        }
        for (auto& index : indexes_) {
            index.erase(it->second[index.column_ordinal()], row_id);
        }
        rows_.erase(it);
        ++erased;
    }
    return erased;
}

}  // namespace pesadb::storage
