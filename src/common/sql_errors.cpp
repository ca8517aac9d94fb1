#include "pesadb/common/sql_errors.hpp"

namespace pesadb {

namespace {

class SqlErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "pesadb.sql";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<SqlErrc>(condition)) {
        case SqlErrc::Success:
            return "success";
        case SqlErrc::SyntaxError:
            return "syntax error";
        case SqlErrc::DatabaseNotFound:
            return "database not found";
        case SqlErrc::TableNotFound:
            return "table not found";
        case SqlErrc::ColumnNotFound:
            return "column not found";
        case SqlErrc::TypeMismatch:
            return "type mismatch";
        case SqlErrc::ConstraintViolation:
            return "constraint violation";
        case SqlErrc::AmbiguousAggregation:
            return "ambiguous aggregation";
        case SqlErrc::UnsupportedFeature:
            return "unsupported feature";
        case SqlErrc::DatabaseAlreadyExists:
            return "database already exists";
        case SqlErrc::TableAlreadyExists:
            return "table already exists";
        case SqlErrc::NoDatabaseSelected:
            return "no database selected";
        case SqlErrc::InvalidSchema:
            return "invalid schema";
        case SqlErrc::PersistenceFailed:
            return "persistence failed";
        case SqlErrc::ExecutionFailed:
            return "execution failed";
        default:
            return "unknown sql error";
        }
    }
};

const SqlErrorCategory kCategory{};

}  // namespace

const std::error_category& sql_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(SqlErrc value) noexcept
{
    return {static_cast<int>(value), sql_error_category()};
}

const char* sql_error_kind(SqlErrc value) noexcept
{
    switch (value) {
    case SqlErrc::Success:
        return "Success";
    case SqlErrc::SyntaxError:
        return "SyntaxError";
    case SqlErrc::DatabaseNotFound:
        return "DatabaseNotFoundError";
    case SqlErrc::TableNotFound:
        return "TableNotFoundError";
    case SqlErrc::ColumnNotFound:
        return "ColumnNotFoundError";
    case SqlErrc::TypeMismatch:
        return "TypeMismatchError";
    case SqlErrc::ConstraintViolation:
        return "ConstraintViolation";
    case SqlErrc::AmbiguousAggregation:
        return "AmbiguousAggregationError";
    case SqlErrc::UnsupportedFeature:
        return "UnsupportedFeatureError";
    case SqlErrc::DatabaseAlreadyExists:
        return "DatabaseAlreadyExistsError";
    case SqlErrc::TableAlreadyExists:
        return "TableAlreadyExistsError";
    case SqlErrc::NoDatabaseSelected:
        return "NoDatabaseSelectedError";
    case SqlErrc::InvalidSchema:
        return "InvalidSchemaError";
    case SqlErrc::PersistenceFailed:
        return "PersistenceError";
    case SqlErrc::ExecutionFailed:
    default:
        return "ExecutionError";
    }
}

const char* sql_error_kind(const std::error_code& code) noexcept
{
    if (code.category() != sql_error_category()) {
        return "ExecutionError";
    }
    return sql_error_kind(static_cast<SqlErrc>(code.value()));
}

SqlError::SqlError(SqlErrc code, const std::string& message, std::optional<std::size_t> position)
    : std::system_error{make_error_code(code), message}
    , detail_{message}
    , position_{position}
{}

}  // namespace pesadb
