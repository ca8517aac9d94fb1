#pragma once

#include "pesadb/storage/table.hpp"
#include "pesadb/storage/value.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pesadb::parser {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

struct Expression;
using ExpressionPtr = std::unique_ptr<Expression>;

enum class ComparisonOperator : std::uint8_t {
    Equal = 0,
    NotEqual,
    Less,
    LessOrEqual,
    Greater,
    GreaterOrEqual
};

enum class AggregateFunction : std::uint8_t {
    Count = 0,
    Sum,
    Avg,
    Min,
    Max
};

enum class SortDirection : std::uint8_t {
    Ascending = 0,
    Descending
};

struct ColumnReference final {
    std::optional<std::string> table{};
    std::string column{};
    std::size_t position = 0U;
};

struct LiteralExpression final {
    storage::Value value{};
};

struct ColumnExpression final {
    ColumnReference reference{};
};

// COUNT(*) leaves the argument empty.
struct AggregateExpression final {
    AggregateFunction function = AggregateFunction::Count;
    std::optional<ColumnReference> argument{};
};

struct ComparisonExpression final {
    ComparisonOperator op = ComparisonOperator::Equal;
    ExpressionPtr left{};
    ExpressionPtr right{};
};

struct AndExpression final {
    ExpressionPtr left{};
    ExpressionPtr right{};
};

struct OrExpression final {
    ExpressionPtr left{};
    ExpressionPtr right{};
};

struct NotExpression final {
    ExpressionPtr operand{};
};

struct IsNullExpression final {
    ExpressionPtr operand{};
    bool negated = false;
};

struct BetweenExpression final {
    ExpressionPtr operand{};
    ExpressionPtr low{};
    ExpressionPtr high{};
    bool negated = false;
};

struct InListExpression final {
    ExpressionPtr operand{};
    std::vector<storage::Value> values{};
    bool negated = false;
};

struct LikeExpression final {
    ExpressionPtr operand{};
    ExpressionPtr pattern{};
    bool negated = false;
};

using ExpressionNode = std::variant<LiteralExpression,
                                    ColumnExpression,
                                    AggregateExpression,
                                    ComparisonExpression,
                                    AndExpression,
                                    OrExpression,
                                    NotExpression,
                                    IsNullExpression,
                                    BetweenExpression,
                                    InListExpression,
                                    LikeExpression>;

struct Expression final {
    ExpressionNode node;
    std::size_t position = 0U;
};

template <typename Node>
[[nodiscard]] ExpressionPtr make_expression(Node node, std::size_t position)
{
    return std::make_unique<Expression>(Expression{ExpressionNode{std::move(node)}, position});
}

struct CreateDatabaseCommand final {
    std::string name{};
};

struct DropDatabaseCommand final {
    std::string name{};
};

struct UseDatabaseCommand final {
    std::string name{};
};

struct CreateTableCommand final {
    std::string name{};
    std::vector<storage::ColumnDefinition> columns{};
};

struct DropTableCommand final {
    std::string name{};
};

struct ShowDatabasesCommand final {
};

struct ShowTablesCommand final {
};

struct DescribeTableCommand final {
    std::string name{};
};

struct InsertCommand final {
    std::string table{};
    // Empty means every column in declaration order.
    std::vector<std::string> columns{};
    std::vector<storage::Value> values{};
};

struct Assignment final {
    std::string column{};
    storage::Value value{};
    std::size_t position = 0U;
};

struct UpdateCommand final {
    std::string table{};
    std::vector<Assignment> assignments{};
    ExpressionPtr where{};
};

struct DeleteCommand final {
    std::string table{};
    ExpressionPtr where{};
};

// The expression is a ColumnExpression or an AggregateExpression.
struct SelectItem final {
    ExpressionPtr expression{};
    std::optional<std::string> alias{};
};

struct JoinClause final {
    std::string table{};
    ExpressionPtr condition{};
    std::size_t position = 0U;
};

struct OrderByItem final {
    ExpressionPtr expression{};
    SortDirection direction = SortDirection::Ascending;
};

struct SelectCommand final {
    bool distinct = false;
    bool select_all = false;
    std::vector<SelectItem> items{};
    std::string from{};
    std::optional<JoinClause> join{};
    ExpressionPtr where{};
    std::vector<ColumnReference> group_by{};
    ExpressionPtr having{};
    std::vector<OrderByItem> order_by{};
    std::optional<std::uint64_t> limit{};
    std::optional<std::uint64_t> offset{};
};

using Command = std::variant<CreateDatabaseCommand,
                             DropDatabaseCommand,
                             UseDatabaseCommand,
                             CreateTableCommand,
                             DropTableCommand,
                             ShowDatabasesCommand,
                             ShowTablesCommand,
                             DescribeTableCommand,
                             InsertCommand,
                             UpdateCommand,
                             DeleteCommand,
                             SelectCommand>;

enum class CommandCategory : std::uint8_t {
    Ddl = 0,
    Dml,
    Query,
    Introspection
};

[[nodiscard]] CommandCategory command_category(const Command& command) noexcept;
[[nodiscard]] const char* command_category_name(CommandCategory category) noexcept;
[[nodiscard]] const char* command_name(const Command& command) noexcept;
// True when a successful run changes the catalog and needs a flush.
[[nodiscard]] bool is_mutating(const Command& command) noexcept;

[[nodiscard]] const char* aggregate_function_name(AggregateFunction function) noexcept;
[[nodiscard]] const char* comparison_operator_text(ComparisonOperator op) noexcept;

// `users.id` or `id`, as written.
[[nodiscard]] std::string format_column_reference(const ColumnReference& reference);
// Canonical output key: COUNT(*), SUM(age), MAX(users.age).
[[nodiscard]] std::string format_aggregate(const AggregateExpression& aggregate);
[[nodiscard]] std::string format_expression(const Expression& expression);

}  // namespace pesadb::parser
