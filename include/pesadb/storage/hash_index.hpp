#pragma once

#include "pesadb/storage/row.hpp"
#include "pesadb/storage/value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace pesadb::storage {

enum class IndexKind : std::uint8_t {
    PrimaryKey = 0,
    Unique,
    ForeignKey
};

class HashIndex final {
public:
    HashIndex(std::string column_name, std::size_t column_ordinal, IndexKind kind);

    [[nodiscard]] const std::string& column_name() const noexcept { return column_name_; }
    [[nodiscard]] std::size_t column_ordinal() const noexcept { return column_ordinal_; }
    [[nodiscard]] IndexKind kind() const noexcept { return kind_; }
    [[nodiscard]] bool unique() const noexcept { return kind_ != IndexKind::ForeignKey; }

    [[nodiscard]] std::span<const RowId> lookup(const Value& key) const;

    // True when a unique index already maps a non-NULL key to a row other than `ignore`.
    [[nodiscard]] bool conflicts(const Value& key, std::optional<RowId> ignore = std::nullopt) const;

    void insert(const Value& key, RowId row_id);
    void erase(const Value& key, RowId row_id);
    void clear() noexcept;

    [[nodiscard]] std::size_t key_count() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t entry_count() const noexcept { return entry_count_; }

private:
    std::string column_name_;
    std::size_t column_ordinal_ = 0U;
    IndexKind kind_ = IndexKind::PrimaryKey;
    std::unordered_map<Value, std::vector<RowId>, ValueHash> entries_{};
    std::size_t entry_count_ = 0U;
};

[[nodiscard]] const char* index_kind_name(IndexKind kind) noexcept;

}  // namespace pesadb::storage
