#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace pesadb::storage {

enum class ColumnType : std::uint8_t {
    Int = 0,
    Float,
    String,
    Bool
};

enum class ValueKind : std::uint8_t {
    Null = 0,
    Int,
    Float,
    String,
    Bool
};

// Alternative order matches ValueKind.
using Value = std::variant<std::monostate, std::int64_t, double, std::string, bool>;

[[nodiscard]] inline ValueKind value_kind(const Value& value) noexcept
{
    return static_cast<ValueKind>(value.index());
}

[[nodiscard]] inline bool is_null(const Value& value) noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

[[nodiscard]] inline bool is_numeric(const Value& value) noexcept
{
    return std::holds_alternative<std::int64_t>(value) || std::holds_alternative<double>(value);
}

[[nodiscard]] std::string_view column_type_name(ColumnType type) noexcept;
[[nodiscard]] std::string_view value_kind_name(ValueKind kind) noexcept;
[[nodiscard]] std::optional<ColumnType> parse_column_type(std::string_view text);

// NULL conforms to every column type.
[[nodiscard]] bool conforms(const Value& value, ColumnType type) noexcept;

// Returns the value converted to the column's representation, widening INT to FLOAT.
[[nodiscard]] std::optional<Value> coerce_to_column(const Value& value, ColumnType type);

[[nodiscard]] double numeric_value(const Value& value) noexcept;

// Total order for non-NULL values of comparable kinds: numbers cross-coerce, strings are
// lexicographic, false < true. Throws SqlError(TypeMismatch) for other pairs.
[[nodiscard]] int compare_values(const Value& lhs, const Value& rhs);

// Equality used by comparisons and IN lists: numbers cross-coerce, other kinds must match.
[[nodiscard]] bool values_equal(const Value& lhs, const Value& rhs) noexcept;

[[nodiscard]] std::string format_value(const Value& value);
[[nodiscard]] std::string format_literal(const Value& value);

struct ValueHash final {
    [[nodiscard]] std::size_t operator()(const Value& value) const noexcept;
};

}  // namespace pesadb::storage
