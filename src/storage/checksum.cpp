#include "pesadb/storage/checksum.hpp"

#include <array>

namespace pesadb::storage {

namespace {

// Castagnoli polynomial, reflected.
constexpr std::array<std::uint32_t, 256> make_crc32c_table()
{
    std::array<std::uint32_t, 256> table{};
    constexpr std::uint32_t poly = 0x82F63B78u;
    for (std::uint32_t i = 0; i < table.size(); ++i) {
        std::uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            const bool lsb = (crc & 1u) != 0u;
            crc >>= 1;
            if (lsb) {
                crc ^= poly;
            }
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto kCrc32cTable = make_crc32c_table();

}  // namespace

std::uint32_t crc32c_extend(std::uint32_t state, std::span<const std::byte> data)
{
    for (auto byte : data) {
        const auto value = std::to_integer<std::uint8_t>(byte);
        const auto index = static_cast<std::uint8_t>((state ^ value) & 0xFFu);
        state = (state >> 8U) ^ kCrc32cTable[index];
    }
    return state;
}

}  // namespace pesadb::storage
