#include "pesadb/common/sql_errors.hpp"
#include "pesadb/parser/tokenizer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using pesadb::SqlErrc;
using pesadb::SqlError;
using pesadb::parser::Token;
using pesadb::parser::TokenKind;
using pesadb::parser::tokenize;

namespace {

std::vector<TokenKind> kinds_of(const std::vector<Token>& tokens)
{
    std::vector<TokenKind> kinds;
    kinds.reserve(tokens.size());
    for (const auto& token : tokens) {
        kinds.push_back(token.kind);
    }
    return kinds;
}

}  // namespace

TEST_CASE("tokenize classifies a simple select", "[tokenizer]")
{
    const auto tokens = tokenize("select id, name from users where age >= 18;");
    REQUIRE(kinds_of(tokens) == std::vector<TokenKind>{TokenKind::Keyword,
                                                       TokenKind::Identifier,
                                                       TokenKind::Comma,
                                                       TokenKind::Identifier,
                                                       TokenKind::Keyword,
                                                       TokenKind::Identifier,
                                                       TokenKind::Keyword,
                                                       TokenKind::Identifier,
                                                       TokenKind::Comparison,
                                                       TokenKind::Number,
                                                       TokenKind::Semicolon,
                                                       TokenKind::End});

    CHECK(tokens[0].lexeme == "SELECT");
    CHECK(tokens[1].lexeme == "id");
    CHECK(tokens[4].lexeme == "FROM");
    CHECK(tokens[8].lexeme == ">=");
    CHECK(tokens[9].lexeme == "18");
}

TEST_CASE("tokenize records byte positions", "[tokenizer]")
{
    const std::string sql = "SELECT  a FROM t";
    const auto tokens = tokenize(sql);
    REQUIRE(tokens.size() == 5U);
    CHECK(tokens[0].position == 0U);
    CHECK(tokens[1].position == 8U);
    CHECK(tokens[2].position == 10U);
    CHECK(tokens[3].position == 15U);
    CHECK(tokens.back().kind == TokenKind::End);
    CHECK(tokens.back().position == sql.size());
}

TEST_CASE("tokenize unescapes doubled quotes in strings", "[tokenizer]")
{
    const auto tokens = tokenize("'it''s' ''");
    REQUIRE(tokens.size() == 3U);
    CHECK(tokens[0].kind == TokenKind::String);
    CHECK(tokens[0].lexeme == "it's");
    CHECK(tokens[1].kind == TokenKind::String);
    CHECK(tokens[1].lexeme.empty());
}

TEST_CASE("tokenize reads negative and fractional numbers", "[tokenizer]")
{
    const auto tokens = tokenize("-42 3.25 7");
    REQUIRE(tokens.size() == 4U);
    CHECK(tokens[0].kind == TokenKind::Number);
    CHECK(tokens[0].lexeme == "-42");
    CHECK(tokens[1].lexeme == "3.25");
    CHECK(tokens[2].lexeme == "7");
}

TEST_CASE("tokenize distinguishes comparison operators from equals", "[tokenizer]")
{
    const auto tokens = tokenize("= != <> < <= > >=");
    REQUIRE(tokens.size() == 8U);
    CHECK(tokens[0].kind == TokenKind::Equals);
    for (std::size_t index = 1U; index < 7U; ++index) {
        CAPTURE(index);
        CHECK(tokens[index].kind == TokenKind::Comparison);
    }
    CHECK(tokens[2].lexeme == "<>");
    CHECK(tokens[4].lexeme == "<=");
}

TEST_CASE("tokenize skips line comments and whitespace", "[tokenizer]")
{
    const auto tokens = tokenize("-- leading comment\nSHOW TABLES -- trailing\n");
    REQUIRE(tokens.size() == 3U);
    CHECK(tokens[0].lexeme == "SHOW");
    CHECK(tokens[1].lexeme == "TABLES");
    CHECK(tokens[2].kind == TokenKind::End);
}

TEST_CASE("tokenize keeps aggregate names as identifiers", "[tokenizer]")
{
    const auto tokens = tokenize("COUNT(*) users.id");
    REQUIRE(tokens.size() == 8U);
    CHECK(tokens[0].kind == TokenKind::Identifier);
    CHECK(tokens[1].kind == TokenKind::LeftParen);
    CHECK(tokens[2].kind == TokenKind::Star);
    CHECK(tokens[3].kind == TokenKind::RightParen);
    CHECK(tokens[4].kind == TokenKind::Identifier);
    CHECK(tokens[5].kind == TokenKind::Dot);
    CHECK(tokens[6].kind == TokenKind::Identifier);
}

TEST_CASE("tokenize emits arithmetic tokens", "[tokenizer]")
{
    const auto tokens = tokenize("a + b / c");
    REQUIRE(tokens.size() == 6U);
    CHECK(tokens[1].kind == TokenKind::Arithmetic);
    CHECK(tokens[3].kind == TokenKind::Arithmetic);
}

TEST_CASE("tokenize reports unexpected characters with position", "[tokenizer][errors]")
{
    try {
        static_cast<void>(tokenize("SELECT # FROM t"));
        FAIL("expected a syntax error");
    } catch (const SqlError& error) {
        CHECK(error.errc() == SqlErrc::SyntaxError);
        REQUIRE(error.position().has_value());
        CHECK(*error.position() == 7U);
        CHECK(error.detail() == "Unexpected character '#' at position 7");
    }
}

TEST_CASE("tokenize reports unterminated strings", "[tokenizer][errors]")
{
    try {
        static_cast<void>(tokenize("INSERT INTO t VALUES ('abc"));
        FAIL("expected a syntax error");
    } catch (const SqlError& error) {
        CHECK(error.errc() == SqlErrc::SyntaxError);
        REQUIRE(error.position().has_value());
        CHECK(*error.position() == 22U);
        CHECK(error.detail() == "Unterminated string literal starting at position 22");
    }
}

TEST_CASE("is_keyword matches the reserved set", "[tokenizer]")
{
    CHECK(pesadb::parser::is_keyword("SELECT"));
    CHECK(pesadb::parser::is_keyword("REFERENCES"));
    CHECK(pesadb::parser::is_keyword("BOOL"));
    CHECK_FALSE(pesadb::parser::is_keyword("COUNT"));
    CHECK_FALSE(pesadb::parser::is_keyword("select"));
}
