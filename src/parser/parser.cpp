#include "pesadb/parser/parser.hpp"

#include "pesadb/common/sql_errors.hpp"

#include <cctype>
#include <charconv>
#include <system_error>
#include <utility>

namespace pesadb::parser {

namespace {

[[nodiscard]] std::string describe(const Token& token)
{
    switch (token.kind) {
    case TokenKind::End:
        return "end of input";
    case TokenKind::Keyword:
        return "keyword " + token.lexeme;
    case TokenKind::Identifier:
        return "identifier '" + token.lexeme + "'";
    case TokenKind::String:
        return "string '" + token.lexeme + "'";
    case TokenKind::Number:
        return "number " + token.lexeme;
    default:
        return "'" + token.lexeme + "'";
    }
}

[[nodiscard]] std::optional<AggregateFunction> aggregate_function(std::string_view name) noexcept
{
    std::string upper;
    for (const unsigned char ch : name) {
        upper.push_back(static_cast<char>(std::toupper(ch)));
    }
    if (upper == "COUNT") {
        return AggregateFunction::Count;
    }
    if (upper == "SUM") {
        return AggregateFunction::Sum;
    }
    if (upper == "AVG") {
        return AggregateFunction::Avg;
    }
    if (upper == "MIN") {
        return AggregateFunction::Min;
    }
    if (upper == "MAX") {
        return AggregateFunction::Max;
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<ComparisonOperator> comparison_operator(std::string_view lexeme) noexcept
{
    if (lexeme == "=") {
        return ComparisonOperator::Equal;
    }
    if (lexeme == "!=" || lexeme == "<>") {
        return ComparisonOperator::NotEqual;
    }
    if (lexeme == "<") {
        return ComparisonOperator::Less;
    }
    if (lexeme == "<=") {
        return ComparisonOperator::LessOrEqual;
    }
    if (lexeme == ">") {
        return ComparisonOperator::Greater;
    }
    if (lexeme == ">=") {
        return ComparisonOperator::GreaterOrEqual;
    }
    return std::nullopt;
}

}  // namespace

Parser::Parser(std::string_view sql)
    : sql_{sql}
    , tokens_{tokenize(sql)}
{}

std::size_t Parser::position() const noexcept
{
    return peek().position;
}

bool Parser::at_end()
{
    while (match(TokenKind::Semicolon)) {
    }
    return check(TokenKind::End);
}

std::optional<ParsedStatement> Parser::next()
{
    if (at_end()) {
        return std::nullopt;
    }

    const auto start = position();
    auto command = parse_statement();
    const auto finish = position();

    if (!match(TokenKind::Semicolon) && !check(TokenKind::End)) {
        fail("';' or end of input");
    }

    auto text = sql_.substr(start, finish - start);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.pop_back();
    }
    return ParsedStatement{std::move(command), std::move(text), start};
}

const Token& Parser::peek(std::size_t ahead) const noexcept
{
    const auto index = cursor_ + ahead;
    return index < tokens_.size() ? tokens_[index] : tokens_.back();
}

const Token& Parser::advance() noexcept
{
    const auto& token = peek();
    if (cursor_ + 1U < tokens_.size()) {
        ++cursor_;
    }
    return token;
}

bool Parser::check(TokenKind kind) const noexcept
{
    return peek().kind == kind;
}

bool Parser::check_keyword(std::string_view keyword) const noexcept
{
    return peek().kind == TokenKind::Keyword && peek().lexeme == keyword;
}

bool Parser::match(TokenKind kind) noexcept
{
    if (!check(kind)) {
        return false;
    }
    advance();
    return true;
}

bool Parser::match_keyword(std::string_view keyword) noexcept
{
    if (!check_keyword(keyword)) {
        return false;
    }
    advance();
    return true;
}

const Token& Parser::expect(TokenKind kind, const char* expected)
{
    if (!check(kind)) {
        fail(expected);
    }
    return advance();
}

void Parser::expect_keyword(std::string_view keyword)
{
    if (!match_keyword(keyword)) {
        fail(std::string{keyword});
    }
}

void Parser::fail(const std::string& expected) const
{
    const auto& token = peek();
    throw SqlError{SqlErrc::SyntaxError,
                   "Expected " + expected + " but found " + describe(token) + " at position " +
                       std::to_string(token.position),
                   token.position};
}

void Parser::unsupported(const std::string& message, std::size_t position) const
{
    throw SqlError{SqlErrc::UnsupportedFeature, message + " (at position " + std::to_string(position) + ")", position};
}

std::string Parser::parse_identifier(const char* what)
{
    if (!check(TokenKind::Identifier)) {
        fail(what);
    }
    const auto& token = advance();
    if (token.lexeme.size() > kMaxIdentifierLength) {
        throw SqlError{SqlErrc::SyntaxError,
                       "Identifier '" + token.lexeme.substr(0U, 16U) + "...' exceeds " +
                           std::to_string(kMaxIdentifierLength) + " characters",
                       token.position};
    }
    return token.lexeme;
}

Command Parser::parse_statement()
{
    if (check_keyword("CREATE")) {
        return parse_create();
    }
    if (check_keyword("DROP")) {
        return parse_drop();
    }
    if (match_keyword("USE")) {
        return UseDatabaseCommand{parse_identifier("database name")};
    }
    if (check_keyword("SHOW")) {
        return parse_show();
    }
    if (match_keyword("DESCRIBE")) {
        return DescribeTableCommand{parse_identifier("table name")};
    }
    if (check_keyword("INSERT")) {
        return parse_insert();
    }
    if (check_keyword("UPDATE")) {
        return parse_update();
    }
    if (check_keyword("DELETE")) {
        return parse_delete();
    }
    if (check_keyword("SELECT")) {
        return parse_select();
    }
    fail("a statement (CREATE, DROP, USE, SHOW, DESCRIBE, INSERT, UPDATE, DELETE or SELECT)");
}

Command Parser::parse_create()
{
    expect_keyword("CREATE");
    if (match_keyword("DATABASE")) {
        return CreateDatabaseCommand{parse_identifier("database name")};
    }
    if (check_keyword("TABLE")) {
        return parse_create_table();
    }
    fail("DATABASE or TABLE");
}

Command Parser::parse_drop()
{
    expect_keyword("DROP");
    if (match_keyword("DATABASE")) {
        return DropDatabaseCommand{parse_identifier("database name")};
    }
    if (match_keyword("TABLE")) {
        return DropTableCommand{parse_identifier("table name")};
    }
    fail("DATABASE or TABLE");
}

Command Parser::parse_show()
{
    expect_keyword("SHOW");
    if (match_keyword("DATABASES")) {
        return ShowDatabasesCommand{};
    }
    if (match_keyword("TABLES")) {
        return ShowTablesCommand{};
    }
    fail("DATABASES or TABLES");
}

CreateTableCommand Parser::parse_create_table()
{
    expect_keyword("TABLE");
    CreateTableCommand command{};
    command.name = parse_identifier("table name");
    expect(TokenKind::LeftParen, "'('");
    do {
        command.columns.push_back(parse_column_definition());
    } while (match(TokenKind::Comma));
    expect(TokenKind::RightParen, "',' or ')'");
    return command;
}

storage::ColumnDefinition Parser::parse_column_definition()
{
    storage::ColumnDefinition column{};
    column.name = parse_identifier("column name");

    const auto& type_token = peek();
    const auto type = type_token.kind == TokenKind::Keyword ? storage::parse_column_type(type_token.lexeme) : std::nullopt;
    if (!type) {
        fail("column type (INT, FLOAT, STRING or BOOL)");
    }
    advance();
    column.type = *type;

    for (;;) {
        if (match_keyword("PRIMARY")) {
            expect_keyword("KEY");
            column.primary_key = true;
        } else if (match_keyword("UNIQUE")) {
            column.unique = true;
        } else if (match_keyword("REFERENCES")) {
            storage::ForeignKeyReference reference{};
            reference.table = parse_identifier("referenced table name");
            expect(TokenKind::LeftParen, "'('");
            reference.column = parse_identifier("referenced column name");
            expect(TokenKind::RightParen, "')'");
            column.references = std::move(reference);
        } else {
            break;
        }
    }
    return column;
}

InsertCommand Parser::parse_insert()
{
    expect_keyword("INSERT");
    expect_keyword("INTO");

    InsertCommand command{};
    command.table = parse_identifier("table name");
    if (match(TokenKind::LeftParen)) {
        do {
            command.columns.push_back(parse_identifier("column name"));
        } while (match(TokenKind::Comma));
        expect(TokenKind::RightParen, "',' or ')'");
    }

    expect_keyword("VALUES");
    expect(TokenKind::LeftParen, "'('");
    do {
        command.values.push_back(parse_literal());
    } while (match(TokenKind::Comma));
    expect(TokenKind::RightParen, "',' or ')'");

    if (check(TokenKind::Comma) && peek(1U).kind == TokenKind::LeftParen) {
        unsupported("Multi-row VALUES is not supported; insert one row per statement", peek().position);
    }
    return command;
}

UpdateCommand Parser::parse_update()
{
    expect_keyword("UPDATE");

    UpdateCommand command{};
    command.table = parse_identifier("table name");
    expect_keyword("SET");
    do {
        Assignment assignment{};
        assignment.position = position();
        assignment.column = parse_identifier("column name");
        expect(TokenKind::Equals, "'='");
        assignment.value = parse_literal();
        if (check(TokenKind::Arithmetic) || check(TokenKind::Star)) {
            unsupported("Arithmetic expressions are not supported", position());
        }
        command.assignments.push_back(std::move(assignment));
    } while (match(TokenKind::Comma));

    if (match_keyword("WHERE")) {
        command.where = parse_expression();
    }
    return command;
}

DeleteCommand Parser::parse_delete()
{
    expect_keyword("DELETE");
    expect_keyword("FROM");

    DeleteCommand command{};
    command.table = parse_identifier("table name");
    if (match_keyword("WHERE")) {
        command.where = parse_expression();
    }
    return command;
}

SelectCommand Parser::parse_select()
{
    expect_keyword("SELECT");

    SelectCommand command{};
    command.distinct = match_keyword("DISTINCT");
    if (match(TokenKind::Star)) {
        command.select_all = true;
    } else {
        do {
            command.items.push_back(parse_select_item());
        } while (match(TokenKind::Comma));
    }

    expect_keyword("FROM");
    command.from = parse_identifier("table name");

    parse_join(command);

    if (match_keyword("WHERE")) {
        command.where = parse_expression();
    }
    if (match_keyword("GROUP")) {
        expect_keyword("BY");
        do {
            command.group_by.push_back(parse_column_reference());
        } while (match(TokenKind::Comma));
    }
    if (match_keyword("HAVING")) {
        command.having = parse_expression();
    }
    if (match_keyword("ORDER")) {
        expect_keyword("BY");
        do {
            command.order_by.push_back(parse_order_item());
        } while (match(TokenKind::Comma));
    }
    parse_row_window(command);
    return command;
}

void Parser::parse_join(SelectCommand& select)
{
    for (;;) {
        const auto join_position = position();
        for (const auto* kind : {"LEFT", "RIGHT", "FULL", "CROSS"}) {
            if (check_keyword(kind)) {
                unsupported(std::string{kind} + " JOIN is not supported; only INNER JOIN is available", join_position);
            }
        }

        const bool inner = match_keyword("INNER");
        if (!inner && !check_keyword("JOIN")) {
            return;
        }
        expect_keyword("JOIN");
        if (select.join) {
            unsupported("Only one JOIN per query is supported", join_position);
        }

        JoinClause join{};
        join.table = parse_identifier("table name");
        expect_keyword("ON");
        join.condition = parse_expression();
        join.position = join_position;
        select.join = std::move(join);
    }
}

void Parser::parse_row_window(SelectCommand& select)
{
    if (match_keyword("LIMIT")) {
        select.limit = parse_row_count("LIMIT");
        if (match_keyword("OFFSET")) {
            select.offset = parse_row_count("OFFSET");
        }
    } else if (match_keyword("OFFSET")) {
        select.offset = parse_row_count("OFFSET");
        if (match_keyword("LIMIT")) {
            select.limit = parse_row_count("LIMIT");
        }
    }
}

std::uint64_t Parser::parse_row_count(const char* clause)
{
    const auto& token = peek();
    const auto& lexeme = token.lexeme;
    std::uint64_t count = 0U;
    const auto [end, ec] = std::from_chars(lexeme.data(), lexeme.data() + lexeme.size(), count);
    if (token.kind != TokenKind::Number || ec != std::errc{} || end != lexeme.data() + lexeme.size() ||
        count > kMaxRowWindow) {
        throw SqlError{SqlErrc::SyntaxError,
                       std::string{clause} + " expects an integer between 0 and " + std::to_string(kMaxRowWindow) +
                           " but found " + describe(token) + " at position " + std::to_string(token.position),
                       token.position};
    }
    advance();
    return count;
}

SelectItem Parser::parse_select_item()
{
    SelectItem item{};
    if (at_aggregate()) {
        item.expression = parse_aggregate();
    } else {
        const auto start = position();
        item.expression = make_expression(ColumnExpression{parse_column_reference()}, start);
    }
    reject_arithmetic();
    if (match_keyword("AS")) {
        item.alias = parse_identifier("alias");
    }
    return item;
}

OrderByItem Parser::parse_order_item()
{
    OrderByItem item{};
    if (at_aggregate()) {
        item.expression = parse_aggregate();
    } else {
        const auto start = position();
        item.expression = make_expression(ColumnExpression{parse_column_reference()}, start);
    }
    reject_arithmetic();
    if (match_keyword("DESC")) {
        item.direction = SortDirection::Descending;
    } else {
        match_keyword("ASC");
    }
    return item;
}

bool Parser::at_aggregate() const noexcept
{
    return check(TokenKind::Identifier) && peek(1U).kind == TokenKind::LeftParen &&
           aggregate_function(peek().lexeme).has_value();
}

ExpressionPtr Parser::parse_aggregate()
{
    const auto& name = advance();
    const auto start = name.position;
    AggregateExpression aggregate{};
    aggregate.function = *aggregate_function(name.lexeme);
    expect(TokenKind::LeftParen, "'('");

    if (check_keyword("DISTINCT")) {
        unsupported(std::string{aggregate_function_name(aggregate.function)} + "(DISTINCT ...) is not supported",
                    position());
    }

    if (aggregate.function == AggregateFunction::Count && match(TokenKind::Star)) {
        if (!check(TokenKind::RightParen)) {
            unsupported("Arithmetic inside aggregate arguments is not supported", position());
        }
    } else {
        if (!check(TokenKind::Identifier)) {
            fail(aggregate.function == AggregateFunction::Count ? "'*' or column name" : "column name");
        }
        aggregate.argument = parse_column_reference();
    }

    if (check(TokenKind::Arithmetic) || check(TokenKind::Star)) {
        unsupported("Arithmetic inside aggregate arguments is not supported", position());
    }
    expect(TokenKind::RightParen, "')'");
    return make_expression(std::move(aggregate), start);
}

ColumnReference Parser::parse_column_reference()
{
    ColumnReference reference{};
    reference.position = position();
    auto first = parse_identifier("column name");
    if (match(TokenKind::Dot)) {
        reference.table = std::move(first);
        reference.column = parse_identifier("column name");
    } else {
        reference.column = std::move(first);
    }
    return reference;
}

ExpressionPtr Parser::parse_expression()
{
    return parse_or();
}

ExpressionPtr Parser::parse_or()
{
    auto left = parse_and();
    while (check_keyword("OR")) {
        const auto start = advance().position;
        auto right = parse_and();
        left = make_expression(OrExpression{std::move(left), std::move(right)}, start);
    }
    return left;
}

ExpressionPtr Parser::parse_and()
{
    auto left = parse_not();
    while (check_keyword("AND")) {
        const auto start = advance().position;
        auto right = parse_not();
        left = make_expression(AndExpression{std::move(left), std::move(right)}, start);
    }
    return left;
}

ExpressionPtr Parser::parse_not()
{
    if (check_keyword("NOT")) {
        const auto start = advance().position;
        return make_expression(NotExpression{parse_not()}, start);
    }
    return parse_predicate();
}

ExpressionPtr Parser::parse_predicate()
{
    if (check(TokenKind::LeftParen)) {
        advance();
        auto inner = parse_expression();
        expect(TokenKind::RightParen, "')'");
        return inner;
    }

    const auto start = position();
    auto operand = parse_operand();
    reject_arithmetic();

    if (check(TokenKind::Comparison) || check(TokenKind::Equals)) {
        const auto op = comparison_operator(advance().lexeme);
        auto right = parse_operand();
        reject_arithmetic();
        return make_expression(ComparisonExpression{*op, std::move(operand), std::move(right)}, start);
    }

    if (match_keyword("IS")) {
        const bool negated = match_keyword("NOT");
        expect_keyword("NULL");
        return make_expression(IsNullExpression{std::move(operand), negated}, start);
    }

    bool negated = false;
    if (check_keyword("NOT") && peek(1U).kind == TokenKind::Keyword &&
        (peek(1U).lexeme == "BETWEEN" || peek(1U).lexeme == "IN" || peek(1U).lexeme == "LIKE")) {
        advance();
        negated = true;
    }

    if (match_keyword("BETWEEN")) {
        auto low = parse_operand();
        expect_keyword("AND");
        auto high = parse_operand();
        return make_expression(BetweenExpression{std::move(operand), std::move(low), std::move(high), negated}, start);
    }

    if (match_keyword("IN")) {
        expect(TokenKind::LeftParen, "'('");
        InListExpression in_list{};
        in_list.operand = std::move(operand);
        in_list.negated = negated;
        do {
            in_list.values.push_back(parse_literal());
        } while (match(TokenKind::Comma));
        expect(TokenKind::RightParen, "',' or ')'");
        return make_expression(std::move(in_list), start);
    }

    if (match_keyword("LIKE")) {
        auto pattern = parse_operand();
        return make_expression(LikeExpression{std::move(operand), std::move(pattern), negated}, start);
    }

    if (negated) {
        fail("BETWEEN, IN or LIKE");
    }
    return operand;
}

ExpressionPtr Parser::parse_operand()
{
    const auto start = position();
    if (at_literal()) {
        return make_expression(LiteralExpression{parse_literal()}, start);
    }
    if (at_aggregate()) {
        return parse_aggregate();
    }
    if (check(TokenKind::Identifier)) {
        return make_expression(ColumnExpression{parse_column_reference()}, start);
    }
    fail("literal, column or aggregate");
}

bool Parser::at_literal() const noexcept
{
    return check(TokenKind::Number) || check(TokenKind::String) || check_keyword("TRUE") || check_keyword("FALSE") ||
           check_keyword("NULL");
}

void Parser::reject_arithmetic() const
{
    if (check(TokenKind::Arithmetic) || check(TokenKind::Star)) {
        unsupported("Arithmetic expressions are not supported", position());
    }
}

storage::Value Parser::parse_literal()
{
    const auto& token = peek();
    switch (token.kind) {
    case TokenKind::Number: {
        advance();
        const auto& lexeme = token.lexeme;
        const auto* first = lexeme.data();
        const auto* last = lexeme.data() + lexeme.size();
        if (lexeme.find('.') == std::string::npos) {
            std::int64_t integer = 0;
            const auto [end, ec] = std::from_chars(first, last, integer);
            if (ec != std::errc{} || end != last) {
                throw SqlError{SqlErrc::SyntaxError,
                               "Integer literal " + lexeme + " is out of range at position " +
                                   std::to_string(token.position),
                               token.position};
            }
            return storage::Value{integer};
        }
        double real = 0.0;
        const auto [end, ec] = std::from_chars(first, last, real);
        if (ec != std::errc{} || end != last) {
            throw SqlError{SqlErrc::SyntaxError,
                           "Invalid numeric literal " + lexeme + " at position " + std::to_string(token.position),
                           token.position};
        }
        return storage::Value{real};
    }
    case TokenKind::String:
        return storage::Value{advance().lexeme};
    case TokenKind::Keyword:
        if (token.lexeme == "TRUE") {
            advance();
            return storage::Value{true};
        }
        if (token.lexeme == "FALSE") {
            advance();
            return storage::Value{false};
        }
        if (token.lexeme == "NULL") {
            advance();
            return storage::Value{};
        }
        break;
    default:
        break;
    }
    fail("literal value");
}

Command parse_command(std::string_view sql)
{
    Parser parser{sql};
    auto statement = parser.next();
    if (!statement) {
        throw SqlError{SqlErrc::SyntaxError, "Expected a statement but found end of input", sql.size()};
    }
    if (!parser.at_end()) {
        throw SqlError{SqlErrc::SyntaxError,
                       "Expected end of input after a single statement at position " +
                           std::to_string(parser.position()),
                       parser.position()};
    }
    return std::move(statement->command);
}

std::vector<ParsedStatement> parse_script(std::string_view sql)
{
    std::vector<ParsedStatement> statements;
    Parser parser{sql};
    while (auto statement = parser.next()) {
        statements.push_back(std::move(*statement));
    }
    return statements;
}

}  // namespace pesadb::parser
