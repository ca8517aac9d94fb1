#pragma once

#include "pesadb/parser/ast.hpp"
#include "pesadb/parser/tokenizer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pesadb::parser {

inline constexpr std::size_t kMaxIdentifierLength = 64U;
inline constexpr std::uint64_t kMaxRowWindow = 1'000'000U;

struct ParsedStatement final {
    Command command;
    // Source text of the statement without its terminating semicolon.
    std::string text{};
    std::size_t position = 0U;
};

// Recursive descent over the token stream, one statement at a time. Every failure is thrown as
// SqlError (SyntaxError or UnsupportedFeature) carrying the offending byte position.
class Parser final {
public:
    explicit Parser(std::string_view sql);

    // Skips empty statements; nullopt once only the end of input remains.
    [[nodiscard]] std::optional<ParsedStatement> next();
    [[nodiscard]] bool at_end();
    [[nodiscard]] std::size_t position() const noexcept;

private:
    [[nodiscard]] Command parse_statement();
    [[nodiscard]] Command parse_create();
    [[nodiscard]] Command parse_drop();
    [[nodiscard]] Command parse_show();
    [[nodiscard]] CreateTableCommand parse_create_table();
    [[nodiscard]] storage::ColumnDefinition parse_column_definition();
    [[nodiscard]] InsertCommand parse_insert();
    [[nodiscard]] UpdateCommand parse_update();
    [[nodiscard]] DeleteCommand parse_delete();
    [[nodiscard]] SelectCommand parse_select();
    void parse_join(SelectCommand& select);
    void parse_row_window(SelectCommand& select);
    [[nodiscard]] std::uint64_t parse_row_count(const char* clause);

    [[nodiscard]] SelectItem parse_select_item();
    [[nodiscard]] OrderByItem parse_order_item();
    [[nodiscard]] bool at_aggregate() const noexcept;
    [[nodiscard]] ExpressionPtr parse_aggregate();
    [[nodiscard]] ColumnReference parse_column_reference();

    [[nodiscard]] ExpressionPtr parse_expression();
    [[nodiscard]] ExpressionPtr parse_or();
    [[nodiscard]] ExpressionPtr parse_and();
    [[nodiscard]] ExpressionPtr parse_not();
    [[nodiscard]] ExpressionPtr parse_predicate();
    [[nodiscard]] ExpressionPtr parse_operand();
    [[nodiscard]] storage::Value parse_literal();
    [[nodiscard]] bool at_literal() const noexcept;
    void reject_arithmetic() const;

    [[nodiscard]] std::string parse_identifier(const char* what);

    [[nodiscard]] const Token& peek(std::size_t ahead = 0U) const noexcept;
    const Token& advance() noexcept;
    [[nodiscard]] bool check(TokenKind kind) const noexcept;
    [[nodiscard]] bool check_keyword(std::string_view keyword) const noexcept;
    bool match(TokenKind kind) noexcept;
    bool match_keyword(std::string_view keyword) noexcept;
    const Token& expect(TokenKind kind, const char* expected);
    void expect_keyword(std::string_view keyword);
    [[noreturn]] void fail(const std::string& expected) const;
    [[noreturn]] void unsupported(const std::string& message, std::size_t position) const;

    std::string sql_;
    std::vector<Token> tokens_;
    std::size_t cursor_ = 0U;
};

// Exactly one statement, optionally followed by a semicolon.
[[nodiscard]] Command parse_command(std::string_view sql);
[[nodiscard]] std::vector<ParsedStatement> parse_script(std::string_view sql);

}  // namespace pesadb::parser
