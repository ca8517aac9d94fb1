#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pesadb::parser {

enum class TokenKind : std::uint8_t {
    Number = 0,
    String,
    Keyword,
    Identifier,
    Comparison,
    Equals,
    Comma,
    LeftParen,
    RightParen,
    Semicolon,
    Star,
    Dot,
    Arithmetic,
    End
};

struct Token final {
    TokenKind kind = TokenKind::End;
    // Keywords are upper-cased; strings hold the unescaped text.
    std::string lexeme{};
    std::size_t position = 0U;
};

[[nodiscard]] const char* token_kind_name(TokenKind kind) noexcept;
[[nodiscard]] bool is_keyword(std::string_view upper_case_word) noexcept;

// Always terminated by an End token positioned at the input length. Throws
// SqlError(SyntaxError) at the first character no token rule accepts.
[[nodiscard]] std::vector<Token> tokenize(std::string_view sql);

}  // namespace pesadb::parser
