#pragma once

#include "pesadb/storage/database.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

namespace pesadb::storage {

inline constexpr std::string_view kDocumentExtension = ".pdb";
inline constexpr std::string_view kDocumentTempExtension = ".pdb.tmp";
inline constexpr std::uint16_t kDocumentFormatVersion = 1U;

// Header (magic, version, payload length, CRC32C) followed by the schema and row payload.
[[nodiscard]] std::vector<std::byte> encode_database(const Database& database);

// Rebuilds every table and re-inserts rows through the index path. Malformed or tampered
// documents report std::errc::illegal_byte_sequence.
std::error_code decode_database(std::span<const std::byte> document, std::unique_ptr<Database>& out);

// Writes `<path>.tmp` then renames it over `path`.
std::error_code save_database(const Database& database, const std::filesystem::path& path);
std::error_code load_database(const std::filesystem::path& path, std::unique_ptr<Database>& out);

}  // namespace pesadb::storage
