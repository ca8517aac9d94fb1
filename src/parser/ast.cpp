#include "pesadb/parser/ast.hpp"

#include <sstream>

namespace pesadb::parser {

namespace {

void append_expression(std::ostringstream& stream, const Expression& expression);

void append_child(std::ostringstream& stream, const ExpressionPtr& child)
{
    if (child) {
        append_expression(stream, *child);
    }
}

void append_expression(std::ostringstream& stream, const Expression& expression)
{
    std::visit(Overloaded{
                   [&](const LiteralExpression& node) { stream << storage::format_literal(node.value); },
                   [&](const ColumnExpression& node) { stream << format_column_reference(node.reference); },
                   [&](const AggregateExpression& node) { stream << format_aggregate(node); },
                   [&](const ComparisonExpression& node) {
                       append_child(stream, node.left);
                       stream << ' ' << comparison_operator_text(node.op) << ' ';
                       append_child(stream, node.right);
                   },
                   [&](const AndExpression& node) {
                       stream << '(';
                       append_child(stream, node.left);
                       stream << " AND ";
                       append_child(stream, node.right);
                       stream << ')';
                   },
                   [&](const OrExpression& node) {
                       stream << '(';
                       append_child(stream, node.left);
                       stream << " OR ";
                       append_child(stream, node.right);
                       stream << ')';
                   },
                   [&](const NotExpression& node) {
                       stream << "NOT ";
                       append_child(stream, node.operand);
                   },
                   [&](const IsNullExpression& node) {
                       append_child(stream, node.operand);
                       stream << (node.negated ? " IS NOT NULL" : " IS NULL");
                   },
                   [&](const BetweenExpression& node) {
                       append_child(stream, node.operand);
                       stream << (node.negated ? " NOT BETWEEN " : " BETWEEN ");
                       append_child(stream, node.low);
                       stream << " AND ";
                       append_child(stream, node.high);
                   },
                   [&](const InListExpression& node) {
                       append_child(stream, node.operand);
                       stream << (node.negated ? " NOT IN (" : " IN (");
                       for (std::size_t index = 0U; index < node.values.size(); ++index) {
                           if (index != 0U) {
                               stream << ", ";
                           }
                           stream << storage::format_literal(node.values[index]);
                       }
                       stream << ')';
                   },
                   [&](const LikeExpression& node) {
                       append_child(stream, node.operand);
                       stream << (node.negated ? " NOT LIKE " : " LIKE ");
                       append_child(stream, node.pattern);
                   }},
               expression.node);
}

}  // namespace

CommandCategory command_category(const Command& command) noexcept
{
    return std::visit(Overloaded{
                          [](const CreateDatabaseCommand&) { return CommandCategory::Ddl; },
                          [](const DropDatabaseCommand&) { return CommandCategory::Ddl; },
                          [](const UseDatabaseCommand&) { return CommandCategory::Ddl; },
                          [](const CreateTableCommand&) { return CommandCategory::Ddl; },
                          [](const DropTableCommand&) { return CommandCategory::Ddl; },
                          [](const ShowDatabasesCommand&) { return CommandCategory::Introspection; },
                          [](const ShowTablesCommand&) { return CommandCategory::Introspection; },
                          [](const DescribeTableCommand&) { return CommandCategory::Introspection; },
                          [](const InsertCommand&) { return CommandCategory::Dml; },
                          [](const UpdateCommand&) { return CommandCategory::Dml; },
                          [](const DeleteCommand&) { return CommandCategory::Dml; },
                          [](const SelectCommand&) { return CommandCategory::Query; }},
                      command);
}

const char* command_category_name(CommandCategory category) noexcept
{
    switch (category) {
    case CommandCategory::Ddl:
        return "ddl";
    case CommandCategory::Dml:
        return "dml";
    case CommandCategory::Query:
        return "query";
    case CommandCategory::Introspection:
    default:
        return "introspection";
    }
}

const char* command_name(const Command& command) noexcept
{
    return std::visit(Overloaded{
                          [](const CreateDatabaseCommand&) { return "CREATE DATABASE"; },
                          [](const DropDatabaseCommand&) { return "DROP DATABASE"; },
                          [](const UseDatabaseCommand&) { return "USE"; },
                          [](const CreateTableCommand&) { return "CREATE TABLE"; },
                          [](const DropTableCommand&) { return "DROP TABLE"; },
                          [](const ShowDatabasesCommand&) { return "SHOW DATABASES"; },
                          [](const ShowTablesCommand&) { return "SHOW TABLES"; },
                          [](const DescribeTableCommand&) { return "DESCRIBE"; },
                          [](const InsertCommand&) { return "INSERT"; },
                          [](const UpdateCommand&) { return "UPDATE"; },
                          [](const DeleteCommand&) { return "DELETE"; },
                          [](const SelectCommand&) { return "SELECT"; }},
                      command);
}

bool is_mutating(const Command& command) noexcept
{
    return std::holds_alternative<CreateDatabaseCommand>(command) || std::holds_alternative<CreateTableCommand>(command) ||
           std::holds_alternative<DropTableCommand>(command) || std::holds_alternative<InsertCommand>(command) ||
           std::holds_alternative<UpdateCommand>(command) || std::holds_alternative<DeleteCommand>(command);
}

const char* aggregate_function_name(AggregateFunction function) noexcept
{
    switch (function) {
    case AggregateFunction::Count:
        return "COUNT";
    case AggregateFunction::Sum:
        return "SUM";
    case AggregateFunction::Avg:
        return "AVG";
    case AggregateFunction::Min:
        return "MIN";
    case AggregateFunction::Max:
    default:
        return "MAX";
    }
}

const char* comparison_operator_text(ComparisonOperator op) noexcept
{
    switch (op) {
    case ComparisonOperator::Equal:
        return "=";
    case ComparisonOperator::NotEqual:
        return "!=";
    case ComparisonOperator::Less:
        return "<";
    case ComparisonOperator::LessOrEqual:
        return "<=";
    case ComparisonOperator::Greater:
        return ">";
    case ComparisonOperator::GreaterOrEqual:
    default:
        return ">=";
    }
}

std::string format_column_reference(const ColumnReference& reference)
{
    if (reference.table) {
        return *reference.table + "." + reference.column;
    }
    return reference.column;
}

std::string format_aggregate(const AggregateExpression& aggregate)
{
    std::string text = aggregate_function_name(aggregate.function);
    text.push_back('(');
    text.append(aggregate.argument ? format_column_reference(*aggregate.argument) : std::string{"*"});
    text.push_back(')');
    return text;
}

std::string format_expression(const Expression& expression)
{
    std::ostringstream stream;
    append_expression(stream, expression);
    return stream.str();
}

}  // namespace pesadb::parser
