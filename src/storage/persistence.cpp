#include "pesadb/storage/persistence.hpp"

#include "pesadb/common/sql_errors.hpp"
#include "pesadb/storage/checksum.hpp"

#include <array>
#include <cstring>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace pesadb::storage {

namespace {

constexpr std::array<char, 8> kDocumentMagic{'P', 'E', 'S', 'A', 'D', 'B', '0', '1'};

constexpr std::uint8_t kColumnPrimaryKeyFlag = 0x1U;
constexpr std::uint8_t kColumnUniqueFlag = 0x2U;
constexpr std::uint8_t kColumnReferencesFlag = 0x4U;

struct alignas(8) DocumentHeader final {
    std::array<char, 8> magic = kDocumentMagic;
    std::uint16_t version = kDocumentFormatVersion;
    std::uint16_t reserved = 0U;
    std::uint32_t checksum = 0U;
    std::uint64_t payload_length = 0U;
};

static_assert(sizeof(DocumentHeader) == 24U, "DocumentHeader expected to be 24 bytes");

class DocumentWriter final {
public:
    template <typename T>
    void write_scalar(T value)
    {
        const auto offset = buffer_.size();
        buffer_.resize(offset + sizeof(T));
        std::memcpy(buffer_.data() + offset, &value, sizeof(T));
    }

    void write_string(std::string_view text)
    {
        write_scalar(static_cast<std::uint32_t>(text.size()));
        const auto offset = buffer_.size();
        buffer_.resize(offset + text.size());
        if (!text.empty()) {
            std::memcpy(buffer_.data() + offset, text.data(), text.size());
        }
    }

    void write_value(const Value& value)
    {
        write_scalar(static_cast<std::uint8_t>(value_kind(value)));
        switch (value_kind(value)) {
        case ValueKind::Null:
            break;
        case ValueKind::Int:
            write_scalar(std::get<std::int64_t>(value));
            break;
        case ValueKind::Float:
            write_scalar(std::get<double>(value));
            break;
        case ValueKind::String:
            write_string(std::get<std::string>(value));
            break;
        case ValueKind::Bool:
            write_scalar(static_cast<std::uint8_t>(std::get<bool>(value) ? 1U : 0U));
            break;
        }
    }

    [[nodiscard]] std::vector<std::byte> release() noexcept { return std::move(buffer_); }

private:
    std::vector<std::byte> buffer_{};
};

class DocumentReader final {
public:
    explicit DocumentReader(std::span<const std::byte> payload) noexcept
        : payload_{payload}
    {}

    template <typename T>
    [[nodiscard]] std::optional<T> read_scalar() noexcept
    {
        if (payload_.size() - offset_ < sizeof(T)) {
            return std::nullopt;
        }
        T value{};
        std::memcpy(&value, payload_.data() + offset_, sizeof(T));
        offset_ += sizeof(T);
        return value;
    }

    [[nodiscard]] std::optional<std::string> read_string()
    {
        const auto length = read_scalar<std::uint32_t>();
        if (!length || payload_.size() - offset_ < *length) {
            return std::nullopt;
        }
        std::string text(*length, '\0');
        if (*length != 0U) {
            std::memcpy(text.data(), payload_.data() + offset_, *length);
        }
        offset_ += *length;
        return text;
    }

    [[nodiscard]] std::optional<Value> read_value()
    {
        const auto tag = read_scalar<std::uint8_t>();
        if (!tag) {
            return std::nullopt;
        }
        switch (static_cast<ValueKind>(*tag)) {
        case ValueKind::Null:
            return Value{};
        case ValueKind::Int:
            if (const auto integer = read_scalar<std::int64_t>()) {
                return Value{*integer};
            }
            return std::nullopt;
        case ValueKind::Float:
            if (const auto real = read_scalar<double>()) {
                return Value{*real};
            }
            return std::nullopt;
        case ValueKind::String:
            if (auto text = read_string()) {
                return Value{std::move(*text)};
            }
            return std::nullopt;
        case ValueKind::Bool:
            if (const auto flag = read_scalar<std::uint8_t>(); flag && *flag <= 1U) {
                return Value{*flag == 1U};
            }
            return std::nullopt;
        }
        return std::nullopt;
    }

    [[nodiscard]] bool exhausted() const noexcept { return offset_ == payload_.size(); }

private:
    std::span<const std::byte> payload_;
    std::size_t offset_ = 0U;
};

[[nodiscard]] std::error_code corrupt() noexcept
{
    return std::make_error_code(std::errc::illegal_byte_sequence);
}

[[nodiscard]] std::optional<ColumnDefinition> read_column(DocumentReader& reader)
{
    auto name = reader.read_string();
    const auto type = reader.read_scalar<std::uint8_t>();
    const auto flags = reader.read_scalar<std::uint8_t>();
    if (!name || !type || !flags || *type > static_cast<std::uint8_t>(ColumnType::Bool)) {
        return std::nullopt;
    }

    ColumnDefinition column{};
    column.name = std::move(*name);
    column.type = static_cast<ColumnType>(*type);
    column.primary_key = (*flags & kColumnPrimaryKeyFlag) != 0U;
    column.unique = (*flags & kColumnUniqueFlag) != 0U;
    if ((*flags & kColumnReferencesFlag) != 0U) {
        auto table = reader.read_string();
        auto target = reader.read_string();
        if (!table || !target) {
            return std::nullopt;
        }
        column.references = ForeignKeyReference{std::move(*table), std::move(*target)};
    }
    return column;
}

std::error_code decode_payload(DocumentReader& reader, std::unique_ptr<Database>& out)
{
    auto name = reader.read_string();
    const auto table_count = reader.read_scalar<std::uint32_t>();
    if (!name || !table_count) {
        return corrupt();
    }

    auto database = std::make_unique<Database>(std::move(*name));
    for (std::uint32_t table_index = 0U; table_index < *table_count; ++table_index) {
        auto table_name = reader.read_string();
        const auto column_count = reader.read_scalar<std::uint16_t>();
        if (!table_name || !column_count) {
            return corrupt();
        }

        std::vector<ColumnDefinition> columns;
        columns.reserve(*column_count);
        for (std::uint16_t column_index = 0U; column_index < *column_count; ++column_index) {
            auto column = read_column(reader);
            if (!column) {
                return corrupt();
            }
            columns.push_back(std::move(*column));
        }

        auto& table = database->create_table(std::move(*table_name), std::move(columns));

        const auto row_count = reader.read_scalar<std::uint64_t>();
        if (!row_count) {
            return corrupt();
        }
        for (std::uint64_t row_index = 0U; row_index < *row_count; ++row_index) {
            Row row;
            row.reserve(table.column_count());
            for (std::size_t ordinal = 0U; ordinal < table.column_count(); ++ordinal) {
                auto value = reader.read_value();
                if (!value) {
                    return corrupt();
                }
                row.push_back(std::move(*value));
            }
            table.insert(std::move(row));
        }
    }

    if (!reader.exhausted()) {
        return corrupt();
    }

    out = std::move(database);
    return {};
}

}  // namespace

std::vector<std::byte> encode_database(const Database& database)
{
    DocumentWriter writer;
    writer.write_string(database.name());
    writer.write_scalar(static_cast<std::uint32_t>(database.tables().size()));
    for (const auto& table : database.tables()) {
        writer.write_string(table->name());
        writer.write_scalar(static_cast<std::uint16_t>(table->column_count()));
        for (const auto& column : table->columns()) {
            std::uint8_t flags = 0U;
            flags |= column.primary_key ? kColumnPrimaryKeyFlag : 0U;
            flags |= column.unique ? kColumnUniqueFlag : 0U;
            flags |= column.references ? kColumnReferencesFlag : 0U;

            writer.write_string(column.name);
            writer.write_scalar(static_cast<std::uint8_t>(column.type));
            writer.write_scalar(flags);
            if (column.references) {
                writer.write_string(column.references->table);
                writer.write_string(column.references->column);
            }
        }

        writer.write_scalar(static_cast<std::uint64_t>(table->row_count()));
        for (const auto& [row_id, row] : table->rows()) {
            for (const auto& value : row) {
                writer.write_value(value);
            }
        }
    }

    const auto payload = writer.release();
    DocumentHeader header{};
    header.payload_length = payload.size();
    header.checksum = crc32c(payload);

    std::vector<std::byte> document(sizeof(DocumentHeader) + payload.size());
    std::memcpy(document.data(), &header, sizeof(header));
    if (!payload.empty()) {
        std::memcpy(document.data() + sizeof(header), payload.data(), payload.size());
    }
    return document;
}

std::error_code decode_database(std::span<const std::byte> document, std::unique_ptr<Database>& out)
{
    out.reset();

    if (document.size() < sizeof(DocumentHeader)) {
        return corrupt();
    }

    DocumentHeader header{};
    std::memcpy(&header, document.data(), sizeof(header));
    if (header.magic != kDocumentMagic || header.version != kDocumentFormatVersion) {
        return corrupt();
    }

    const auto payload = document.subspan(sizeof(DocumentHeader));
    if (header.payload_length != payload.size() || header.checksum != crc32c(payload)) {
        return corrupt();
    }

    DocumentReader reader{payload};
    try {
        return decode_payload(reader, out);
    } catch (const SqlError&) {
        // Schema or row rejected by the table invariants.
        return corrupt();
    }
}

std::error_code save_database(const Database& database, const std::filesystem::path& path)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return ec;
        }
    }

    const auto document = encode_database(database);
    auto temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream stream{temp_path, std::ios::binary | std::ios::trunc};
        if (!stream) {
            return std::make_error_code(std::errc::io_error);
        }
        stream.write(reinterpret_cast<const char*>(document.data()), static_cast<std::streamsize>(document.size()));
        stream.flush();
        if (!stream) {
            return std::make_error_code(std::errc::io_error);
        }
    }

    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        return ec;
    }
    return {};
}

std::error_code load_database(const std::filesystem::path& path, std::unique_ptr<Database>& out)
{
    out.reset();

    std::ifstream stream{path, std::ios::binary};
    if (!stream) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }

    std::vector<char> bytes{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
    if (stream.bad()) {
        return std::make_error_code(std::errc::io_error);
    }

    const auto document = std::as_bytes(std::span<const char>{bytes.data(), bytes.size()});
    return decode_database(document, out);
}

}  // namespace pesadb::storage
