#include "pesadb/executor/expression_evaluator.hpp"

#include "pesadb/common/sql_errors.hpp"

#include <cctype>
#include <string>

namespace pesadb::executor {

namespace {

using parser::ComparisonOperator;
using storage::Value;

[[nodiscard]] Logic to_logic(const Value& value, std::size_t position)
{
    if (storage::is_null(value)) {
        return Logic::Unknown;
    }
    if (const auto* flag = std::get_if<bool>(&value)) {
        return logic_from_bool(*flag);
    }
    throw SqlError{SqlErrc::TypeMismatch,
                   "Expected a BOOL condition but found " +
                       std::string{storage::value_kind_name(storage::value_kind(value))} + " " +
                       storage::format_literal(value),
                   position};
}

[[nodiscard]] Value to_value(Logic logic)
{
    switch (logic) {
    case Logic::True:
        return Value{true};
    case Logic::False:
        return Value{false};
    case Logic::Unknown:
    default:
        return Value{};
    }
}

[[nodiscard]] char fold(char ch) noexcept
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}

[[nodiscard]] std::string like_text(const Value& value)
{
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    return storage::format_value(value);
}

[[nodiscard]] Logic evaluate_node(const parser::Expression& expression, const ValueResolver& resolver);

[[nodiscard]] Logic evaluate_child(const parser::ExpressionPtr& child, const ValueResolver& resolver)
{
    return evaluate_node(*child, resolver);
}

[[nodiscard]] Logic evaluate_node(const parser::Expression& expression, const ValueResolver& resolver)
{
    return std::visit(
        parser::Overloaded{
            [&](const parser::LiteralExpression& node) { return to_logic(node.value, expression.position); },
            [&](const parser::ColumnExpression& node) {
                return to_logic(resolver.resolve_column(node.reference), expression.position);
            },
            [&](const parser::AggregateExpression& node) {
                return to_logic(resolver.resolve_aggregate(node), expression.position);
            },
            [&](const parser::ComparisonExpression& node) {
                const auto left = evaluate_scalar(*node.left, resolver);
                const auto right = evaluate_scalar(*node.right, resolver);
                try {
                    return compare(node.op, left, right);
                } catch (const SqlError& error) {
                    throw SqlError{error.errc(),
                                   error.detail() + " in '" + parser::format_expression(expression) + "'",
                                   expression.position};
                }
            },
            [&](const parser::AndExpression& node) {
                const auto left = evaluate_child(node.left, resolver);
                if (left == Logic::False) {
                    return Logic::False;
                }
                const auto right = evaluate_child(node.right, resolver);
                if (right == Logic::False) {
                    return Logic::False;
                }
                return left == Logic::True && right == Logic::True ? Logic::True : Logic::Unknown;
            },
            [&](const parser::OrExpression& node) {
                const auto left = evaluate_child(node.left, resolver);
                if (left == Logic::True) {
                    return Logic::True;
                }
                const auto right = evaluate_child(node.right, resolver);
                if (right == Logic::True) {
                    return Logic::True;
                }
                return left == Logic::False && right == Logic::False ? Logic::False : Logic::Unknown;
            },
            [&](const parser::NotExpression& node) { return logic_not(evaluate_child(node.operand, resolver)); },
            [&](const parser::IsNullExpression& node) {
                const auto null = storage::is_null(evaluate_scalar(*node.operand, resolver));
                return logic_from_bool(node.negated ? !null : null);
            },
            [&](const parser::BetweenExpression& node) {
                const auto value = evaluate_scalar(*node.operand, resolver);
                const auto low = evaluate_scalar(*node.low, resolver);
                const auto high = evaluate_scalar(*node.high, resolver);
                const auto lower = compare(ComparisonOperator::GreaterOrEqual, value, low);
                const auto upper = compare(ComparisonOperator::LessOrEqual, value, high);
                Logic result = Logic::Unknown;
                if (lower == Logic::False || upper == Logic::False) {
                    result = Logic::False;
                } else if (lower == Logic::True && upper == Logic::True) {
                    result = Logic::True;
                }
                return node.negated ? logic_not(result) : result;
            },
            [&](const parser::InListExpression& node) {
                const auto value = evaluate_scalar(*node.operand, resolver);
                if (storage::is_null(value)) {
                    return Logic::Unknown;
                }
                bool found = false;
                for (const auto& candidate : node.values) {
                    if (!storage::is_null(candidate) && storage::values_equal(value, candidate)) {
                        found = true;
                        break;
                    }
                }
                return logic_from_bool(node.negated ? !found : found);
            },
            [&](const parser::LikeExpression& node) {
                const auto value = evaluate_scalar(*node.operand, resolver);
                const auto pattern = evaluate_scalar(*node.pattern, resolver);
                if (storage::is_null(value) || storage::is_null(pattern)) {
                    return Logic::Unknown;
                }
                const auto matched = like_match(like_text(value), like_text(pattern));
                return logic_from_bool(node.negated ? !matched : matched);
            }},
        expression.node);
}

}  // namespace

Logic logic_not(Logic value) noexcept
{
    switch (value) {
    case Logic::True:
        return Logic::False;
    case Logic::False:
        return Logic::True;
    case Logic::Unknown:
    default:
        return Logic::Unknown;
    }
}

Logic logic_from_bool(bool value) noexcept
{
    return value ? Logic::True : Logic::False;
}

const char* logic_name(Logic value) noexcept
{
    switch (value) {
    case Logic::True:
        return "TRUE";
    case Logic::False:
        return "FALSE";
    case Logic::Unknown:
    default:
        return "UNKNOWN";
    }
}

Value ValueResolver::resolve_aggregate(const parser::AggregateExpression& aggregate) const
{
    throw SqlError{SqlErrc::AmbiguousAggregation,
                   "Aggregate " + parser::format_aggregate(aggregate) +
                       " is only allowed in the select list, HAVING or ORDER BY of a grouped query"};
}

Logic evaluate_predicate(const parser::Expression& expression, const ValueResolver& resolver)
{
    return evaluate_node(expression, resolver);
}

Value evaluate_scalar(const parser::Expression& expression, const ValueResolver& resolver)
{
    if (const auto* literal = std::get_if<parser::LiteralExpression>(&expression.node)) {
        return literal->value;
    }
    if (const auto* column = std::get_if<parser::ColumnExpression>(&expression.node)) {
        return resolver.resolve_column(column->reference);
    }
    if (const auto* aggregate = std::get_if<parser::AggregateExpression>(&expression.node)) {
        return resolver.resolve_aggregate(*aggregate);
    }
    return to_value(evaluate_node(expression, resolver));
}

Logic compare(ComparisonOperator op, const Value& lhs, const Value& rhs)
{
    if (storage::is_null(lhs) || storage::is_null(rhs)) {
        return Logic::Unknown;
    }

    if (op == ComparisonOperator::Equal) {
        return logic_from_bool(storage::values_equal(lhs, rhs));
    }
    if (op == ComparisonOperator::NotEqual) {
        return logic_from_bool(!storage::values_equal(lhs, rhs));
    }

    const auto order = storage::compare_values(lhs, rhs);
    switch (op) {
    case ComparisonOperator::Less:
        return logic_from_bool(order < 0);
    case ComparisonOperator::LessOrEqual:
        return logic_from_bool(order <= 0);
    case ComparisonOperator::Greater:
        return logic_from_bool(order > 0);
    case ComparisonOperator::GreaterOrEqual:
    default:
        return logic_from_bool(order >= 0);
    }
}

bool like_match(std::string_view text, std::string_view pattern) noexcept
{
    std::size_t t = 0U;
    std::size_t p = 0U;
    std::size_t star = std::string_view::npos;
    std::size_t resume = 0U;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '_' || fold(pattern[p]) == fold(text[t])) && pattern[p] != '%') {
            ++t;
            ++p;
        } else if (p < pattern.size() && pattern[p] == '%') {
            star = p++;
            resume = t;
        } else if (star != std::string_view::npos) {
            p = star + 1U;
            t = ++resume;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '%') {
        ++p;
    }
    return p == pattern.size();
}

}  // namespace pesadb::executor
