#pragma once

#include "pesadb/parser/ast.hpp"
#include "pesadb/storage/value.hpp"

#include <cstdint>
#include <string_view>

namespace pesadb::executor {

enum class Logic : std::uint8_t {
    False = 0,
    True,
    Unknown
};

[[nodiscard]] Logic logic_not(Logic value) noexcept;
[[nodiscard]] Logic logic_from_bool(bool value) noexcept;
[[nodiscard]] const char* logic_name(Logic value) noexcept;

// Supplies column values (and aggregate results in group context) to the evaluator.
class ValueResolver {
public:
    virtual ~ValueResolver() = default;

    [[nodiscard]] virtual storage::Value resolve_column(const parser::ColumnReference& reference) const = 0;
    // Default rejects aggregates outside of grouped evaluation.
    [[nodiscard]] virtual storage::Value resolve_aggregate(const parser::AggregateExpression& aggregate) const;
};

// Unknown must be treated as false by row filters.
[[nodiscard]] Logic evaluate_predicate(const parser::Expression& expression, const ValueResolver& resolver);
// Predicate nodes yield BOOL, or NULL for Unknown.
[[nodiscard]] storage::Value evaluate_scalar(const parser::Expression& expression, const ValueResolver& resolver);

[[nodiscard]] Logic compare(parser::ComparisonOperator op, const storage::Value& lhs, const storage::Value& rhs);

// `%` matches any run, `_` one character; anchored and ASCII case-insensitive.
[[nodiscard]] bool like_match(std::string_view text, std::string_view pattern) noexcept;

}  // namespace pesadb::executor
