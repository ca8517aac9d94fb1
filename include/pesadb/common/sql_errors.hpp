#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <system_error>

namespace pesadb {

enum class SqlErrc {
    Success = 0,
    SyntaxError,
    DatabaseNotFound,
    TableNotFound,
    ColumnNotFound,
    TypeMismatch,
    ConstraintViolation,
    AmbiguousAggregation,
    UnsupportedFeature,
    DatabaseAlreadyExists,
    TableAlreadyExists,
    NoDatabaseSelected,
    InvalidSchema,
    PersistenceFailed,
    ExecutionFailed
};

const std::error_category& sql_error_category() noexcept;
std::error_code make_error_code(SqlErrc value) noexcept;

// Stable kind name used in rendered diagnostics ("ConstraintViolation").
[[nodiscard]] const char* sql_error_kind(SqlErrc value) noexcept;
[[nodiscard]] const char* sql_error_kind(const std::error_code& code) noexcept;

class SqlError final : public std::system_error {
public:
    SqlError(SqlErrc code, const std::string& message, std::optional<std::size_t> position = std::nullopt);

    [[nodiscard]] SqlErrc errc() const noexcept { return static_cast<SqlErrc>(code().value()); }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }
    [[nodiscard]] std::optional<std::size_t> position() const noexcept { return position_; }

private:
    std::string detail_;
    std::optional<std::size_t> position_;
};

}  // namespace pesadb

namespace std {

template <>
struct is_error_code_enum<pesadb::SqlErrc> : true_type {
};

}  // namespace std
