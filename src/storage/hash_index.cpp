#include "pesadb/storage/hash_index.hpp"

#include <algorithm>
#include <utility>

namespace pesadb::storage {

HashIndex::HashIndex(std::string column_name, std::size_t column_ordinal, IndexKind kind)
    : column_name_{std::move(column_name)}
    , column_ordinal_{column_ordinal}
    , kind_{kind}
{}

std::span<const RowId> HashIndex::lookup(const Value& key) const
{
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return {};
    }
    return {it->second.data(), it->second.size()};
}

bool HashIndex::conflicts(const Value& key, std::optional<RowId> ignore) const
{
    if (!unique() || is_null(key)) {
        return false;
    }

    const auto rows = lookup(key);
    return std::any_of(rows.begin(), rows.end(), [&](RowId row_id) {
        return !ignore || row_id != *ignore;
    });
}

void HashIndex::insert(const Value& key, RowId row_id)
{
    entries_[key].push_back(row_id);
    ++entry_count_;
}

void HashIndex::erase(const Value& key, RowId row_id)
{
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }

    auto& rows = it->second;
    const auto position = std::find(rows.begin(), rows.end(), row_id);
    if (position == rows.end()) {
        return;
    }
    rows.erase(position);
    --entry_count_;
    if (rows.empty()) {
        entries_.erase(it);
    }
}

void HashIndex::clear() noexcept
{
    entries_.clear();
    entry_count_ = 0U;
}

const char* index_kind_name(IndexKind kind) noexcept
{
    switch (kind) {
    case IndexKind::PrimaryKey:
        return "PRIMARY KEY";
    case IndexKind::Unique:
        return "UNIQUE";
    case IndexKind::ForeignKey:
    default:
        return "REFERENCES";
    }
}

}  // namespace pesadb::storage
