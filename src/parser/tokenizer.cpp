#include "pesadb/parser/tokenizer.hpp"

#include "pesadb/common/sql_errors.hpp"

#include <tao/pegtl.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace pesadb::parser {

namespace {

namespace pegtl = tao::pegtl;

constexpr std::array<std::string_view, 54> kKeywords{
    "CREATE", "DROP",   "DATABASE", "DATABASES", "TABLE",   "TABLES", "USE",    "SHOW",       "DESCRIBE", "INSERT",
    "INTO",   "VALUES", "SELECT",   "DISTINCT",  "FROM",    "WHERE",  "UPDATE", "SET",        "DELETE",   "INNER",
    "LEFT",   "RIGHT",  "FULL",     "OUTER",     "CROSS",   "JOIN",   "ON",     "AS",         "GROUP",    "BY",
    "HAVING", "ORDER",  "ASC",      "DESC",      "LIMIT",   "OFFSET", "AND",    "OR",         "NOT",      "IS",
    "NULL",   "IN",     "BETWEEN",  "LIKE",      "PRIMARY", "KEY",    "UNIQUE", "REFERENCES", "INT",      "FLOAT",
    "STRING", "BOOL",   "TRUE",     "FALSE"};

struct line_comment : pegtl::seq<pegtl::two<'-'>, pegtl::until<pegtl::eolf>> {
};

struct skip : pegtl::sor<pegtl::plus<pegtl::space>, line_comment> {
};

struct fractional_part : pegtl::seq<pegtl::one<'.'>, pegtl::plus<pegtl::digit>> {
};

struct number_token : pegtl::seq<pegtl::opt<pegtl::one<'-'>>, pegtl::plus<pegtl::digit>, pegtl::opt<fractional_part>> {
};

struct string_literal_char : pegtl::sor<pegtl::seq<pegtl::one<'\''>, pegtl::one<'\''>>, pegtl::not_one<'\''>> {
};

struct string_token : pegtl::seq<pegtl::one<'\''>, pegtl::star<string_literal_char>, pegtl::one<'\''>> {
};

struct word_token : pegtl::identifier {
};

struct comparison_token : pegtl::sor<pegtl::string<'!', '='>,
                                     pegtl::string<'<', '>'>,
                                     pegtl::string<'<', '='>,
                                     pegtl::string<'>', '='>,
                                     pegtl::one<'<'>,
                                     pegtl::one<'>'>> {
};

struct equals_token : pegtl::one<'='> {
};
struct comma_token : pegtl::one<','> {
};
struct left_paren_token : pegtl::one<'('> {
};
struct right_paren_token : pegtl::one<')'> {
};
struct semicolon_token : pegtl::one<';'> {
};
struct star_token : pegtl::one<'*'> {
};
struct dot_token : pegtl::one<'.'> {
};
struct arithmetic_token : pegtl::one<'+', '-', '/', '%'> {
};

struct token : pegtl::sor<number_token,
                          string_token,
                          word_token,
                          comparison_token,
                          equals_token,
                          comma_token,
                          left_paren_token,
                          right_paren_token,
                          semicolon_token,
                          star_token,
                          dot_token,
                          arithmetic_token> {
};

struct token_stream : pegtl::seq<pegtl::star<pegtl::sor<skip, token>>, pegtl::must<pegtl::eof>> {
};

[[nodiscard]] std::string uppercase(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (const unsigned char ch : text) {
        result.push_back(static_cast<char>(std::toupper(ch)));
    }
    return result;
}

template <typename Input>
void push(std::vector<Token>& tokens, TokenKind kind, const Input& in)
{
    tokens.push_back(Token{kind, in.string(), static_cast<std::size_t>(in.position().byte)});
}

template <typename Rule>
struct token_action : pegtl::nothing<Rule> {
};

template <>
struct token_action<number_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        push(tokens, TokenKind::Number, in);
    }
};

template <>
struct token_action<string_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        const auto raw = in.string();
        std::string text;
        text.reserve(raw.size());
        for (std::size_t offset = 1U; offset + 1U < raw.size(); ++offset) {
            text.push_back(raw[offset]);
            if (raw[offset] == '\'') {
                ++offset;
            }
        }
        tokens.push_back(Token{TokenKind::String, std::move(text), static_cast<std::size_t>(in.position().byte)});
    }
};

template <>
struct token_action<word_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        auto upper = uppercase(in.string());
        if (is_keyword(upper)) {
            tokens.push_back(Token{TokenKind::Keyword, std::move(upper), static_cast<std::size_t>(in.position().byte)});
            return;
        }
        push(tokens, TokenKind::Identifier, in);
    }
};

template <>
struct token_action<comparison_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        push(tokens, TokenKind::Comparison, in);
    }
};

template <>
struct token_action<equals_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        push(tokens, TokenKind::Equals, in);
    }
};

template <>
struct token_action<comma_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        push(tokens, TokenKind::Comma, in);
    }
};

template <>
struct token_action<left_paren_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        push(tokens, TokenKind::LeftParen, in);
    }
};

template <>
struct token_action<right_paren_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        push(tokens, TokenKind::RightParen, in);
    }
};

template <>
struct token_action<semicolon_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        push(tokens, TokenKind::Semicolon, in);
    }
};

template <>
struct token_action<star_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        push(tokens, TokenKind::Star, in);
    }
};

template <>
struct token_action<dot_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        push(tokens, TokenKind::Dot, in);
    }
};

template <>
struct token_action<arithmetic_token> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        push(tokens, TokenKind::Arithmetic, in);
    }
};

[[nodiscard]] std::string describe_character(char ch)
{
    if (std::isprint(static_cast<unsigned char>(ch)) != 0) {
        return std::string{"'"} + ch + "'";
    }
    return "byte " + std::to_string(static_cast<unsigned>(static_cast<unsigned char>(ch)));
}

}  // namespace

const char* token_kind_name(TokenKind kind) noexcept
{
    switch (kind) {
    case TokenKind::Number:
        return "NUMBER";
    case TokenKind::String:
        return "STRING";
    case TokenKind::Keyword:
        return "KEYWORD";
    case TokenKind::Identifier:
        return "IDENTIFIER";
    case TokenKind::Comparison:
        return "COMPARISON";
    case TokenKind::Equals:
        return "EQUALS";
    case TokenKind::Comma:
        return "COMMA";
    case TokenKind::LeftParen:
        return "LPAREN";
    case TokenKind::RightParen:
        return "RPAREN";
    case TokenKind::Semicolon:
        return "SEMICOLON";
    case TokenKind::Star:
        return "STAR";
    case TokenKind::Dot:
        return "DOT";
    case TokenKind::Arithmetic:
        return "ARITHMETIC";
    case TokenKind::End:
    default:
        return "END";
    }
}

bool is_keyword(std::string_view upper_case_word) noexcept
{
    return std::find(kKeywords.begin(), kKeywords.end(), upper_case_word) != kKeywords.end();
}

std::vector<Token> tokenize(std::string_view sql)
{
    std::vector<Token> tokens;
    pegtl::memory_input in(sql.data(), sql.size(), "sql");
    try {
        pegtl::parse<token_stream, token_action>(in, tokens);
    } catch (const pegtl::parse_error& error) {
        std::size_t position = sql.size();
        if (!error.positions().empty()) {
            position = static_cast<std::size_t>(error.positions().front().byte);
        }
        if (position < sql.size() && sql[position] == '\'') {
            throw SqlError{SqlErrc::SyntaxError,
                           "Unterminated string literal starting at position " + std::to_string(position),
                           position};
        }
        const auto offending = position < sql.size() ? describe_character(sql[position]) : std::string{"end of input"};
        throw SqlError{SqlErrc::SyntaxError,
                       "Unexpected character " + offending + " at position " + std::to_string(position),
                       position};
    }

    tokens.push_back(Token{TokenKind::End, {}, sql.size()});
    return tokens;
}

}  // namespace pesadb::parser
