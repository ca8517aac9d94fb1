#include "pesadb/storage/value.hpp"

#include "pesadb/common/sql_errors.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <functional>
#include <system_error>

namespace pesadb::storage {

namespace {

[[nodiscard]] std::string uppercase(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (const unsigned char ch : text) {
        result.push_back(static_cast<char>(std::toupper(ch)));
    }
    return result;
}

[[nodiscard]] std::string format_double(double value)
{
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value < 0.0 ? "-Infinity" : "Infinity";
    }

    std::array<char, 64> buffer{};
    const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }

    std::string text{buffer.data(), end};
    if (text.find_first_of(".e") == std::string::npos) {
        text.append(".0");
    }
    return text;
}

template <typename T>
[[nodiscard]] int three_way(const T& lhs, const T& rhs) noexcept
{
    if (lhs < rhs) {
        return -1;
    }
    if (rhs < lhs) {
        return 1;
    }
    return 0;
}

}  // namespace

std::string_view column_type_name(ColumnType type) noexcept
{
    switch (type) {
    case ColumnType::Int:
        return "INT";
    case ColumnType::Float:
        return "FLOAT";
    case ColumnType::String:
        return "STRING";
    case ColumnType::Bool:
        return "BOOL";
    }
    return "UNKNOWN";
}

std::string_view value_kind_name(ValueKind kind) noexcept
{
    switch (kind) {
    case ValueKind::Null:
        return "NULL";
    case ValueKind::Int:
        return "INT";
    case ValueKind::Float:
        return "FLOAT";
    case ValueKind::String:
        return "STRING";
    case ValueKind::Bool:
        return "BOOL";
    }
    return "UNKNOWN";
}

std::optional<ColumnType> parse_column_type(std::string_view text)
{
    const auto upper = uppercase(text);
    if (upper == "INT") {
        return ColumnType::Int;
    }
    if (upper == "FLOAT") {
        return ColumnType::Float;
    }
    if (upper == "STRING") {
        return ColumnType::String;
    }
    if (upper == "BOOL") {
        return ColumnType::Bool;
    }
    return std::nullopt;
}

bool conforms(const Value& value, ColumnType type) noexcept
{
    switch (value_kind(value)) {
    case ValueKind::Null:
        return true;
    case ValueKind::Int:
        return type == ColumnType::Int;
    case ValueKind::Float:
        return type == ColumnType::Float;
    case ValueKind::String:
        return type == ColumnType::String;
    case ValueKind::Bool:
        return type == ColumnType::Bool;
    }
    return false;
}

std::optional<Value> coerce_to_column(const Value& value, ColumnType type)
{
    if (conforms(value, type)) {
        return value;
    }
    if (type == ColumnType::Float) {
        if (const auto* integer = std::get_if<std::int64_t>(&value)) {
            return Value{static_cast<double>(*integer)};
        }
    }
    return std::nullopt;
}

double numeric_value(const Value& value) noexcept
{
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*integer);
    }
    if (const auto* real = std::get_if<double>(&value)) {
        return *real;
    }
    return 0.0;
}

int compare_values(const Value& lhs, const Value& rhs)
{
    if (is_numeric(lhs) && is_numeric(rhs)) {
        const auto* left_int = std::get_if<std::int64_t>(&lhs);
        const auto* right_int = std::get_if<std::int64_t>(&rhs);
        if (left_int != nullptr && right_int != nullptr) {
            return three_way(*left_int, *right_int);
        }
        return three_way(numeric_value(lhs), numeric_value(rhs));
    }

    const auto left_kind = value_kind(lhs);
    const auto right_kind = value_kind(rhs);
    if (left_kind == right_kind) {
        if (left_kind == ValueKind::String) {
            return three_way(std::get<std::string>(lhs), std::get<std::string>(rhs));
        }
        if (left_kind == ValueKind::Bool) {
            return three_way(std::get<bool>(lhs), std::get<bool>(rhs));
        }
    }

    throw SqlError{SqlErrc::TypeMismatch,
                   "Cannot compare " + std::string{value_kind_name(left_kind)} + " with " +
                       std::string{value_kind_name(right_kind)}};
}

bool values_equal(const Value& lhs, const Value& rhs) noexcept
{
    if (is_numeric(lhs) && is_numeric(rhs)) {
        const auto* left_int = std::get_if<std::int64_t>(&lhs);
        const auto* right_int = std::get_if<std::int64_t>(&rhs);
        if (left_int != nullptr && right_int != nullptr) {
            return *left_int == *right_int;
        }
        return numeric_value(lhs) == numeric_value(rhs);
    }
    return lhs == rhs;
}

std::string format_value(const Value& value)
{
    switch (value_kind(value)) {
    case ValueKind::Null:
        return "NULL";
    case ValueKind::Int:
        return std::to_string(std::get<std::int64_t>(value));
    case ValueKind::Float:
        return format_double(std::get<double>(value));
    case ValueKind::String:
        return std::get<std::string>(value);
    case ValueKind::Bool:
        return std::get<bool>(value) ? "TRUE" : "FALSE";
    }
    return {};
}

std::string format_literal(const Value& value)
{
    if (const auto* text = std::get_if<std::string>(&value)) {
        std::string quoted;
        quoted.reserve(text->size() + 2U);
        quoted.push_back('\'');
        for (const char ch : *text) {
            if (ch == '\'') {
                quoted.push_back('\'');
            }
            quoted.push_back(ch);
        }
        quoted.push_back('\'');
        return quoted;
    }
    return format_value(value);
}

std::size_t ValueHash::operator()(const Value& value) const noexcept
{
    const auto seed = std::hash<std::size_t>{}(value.index());
    std::size_t hashed = 0U;
    switch (value_kind(value)) {
    case ValueKind::Null:
        break;
    case ValueKind::Int:
        hashed = std::hash<std::int64_t>{}(std::get<std::int64_t>(value));
        break;
    case ValueKind::Float: {
        auto real = std::get<double>(value);
        if (real == 0.0) {
            real = 0.0;
        }
        hashed = std::hash<double>{}(real);
        break;
    }
    case ValueKind::String:
        hashed = std::hash<std::string>{}(std::get<std::string>(value));
        break;
    case ValueKind::Bool:
        hashed = std::hash<bool>{}(std::get<bool>(value));
        break;
    }
    return seed ^ (hashed + 0x9e3779b97f4a7c15ULL + (seed << 6U) + (seed >> 2U));
}

}  // namespace pesadb::storage
