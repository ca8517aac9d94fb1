#pragma once

#include "pesadb/storage/value.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pesadb::storage {

using RowId = std::uint64_t;

// Values aligned 1:1 with the owning table's column list.
using Row = std::vector<Value>;

// Keys for grouping and DISTINCT; NULL equals NULL here.
struct RowHash final {
    [[nodiscard]] std::size_t operator()(const Row& row) const noexcept
    {
        std::size_t seed = row.size();
        for (const auto& value : row) {
            seed ^= ValueHash{}(value) + 0x9e3779b97f4a7c15ULL + (seed << 6U) + (seed >> 2U);
        }
        return seed;
    }
};

}  // namespace pesadb::storage
