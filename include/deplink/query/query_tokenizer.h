#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace deplink::query {

/**
 * @brief Token types shared by the SQL-like and GraphQL-like parsers
 */
enum class TokenType {
    Identifier,   // Keywords, field names, node types
    String,       // 'single' or "double" quoted
    Number,       // 42, -1, 3.5
    Comma,        // ,
    LeftParen,    // (
    RightParen,   // )
    LeftBrace,    // {
    RightBrace,   // }
    LeftBracket,  // [
    RightBracket, // ]
    Colon,        // :
    Star,         // *
    Equal,        // =
    NotEqual,     // != or <>
    Less,         // <
    LessEqual,    // <=
    Greater,      // >
    GreaterEqual, // >=
    EndOfInput
};

/**
 * @brief Token structure
 */
struct Token {
    TokenType type;
    std::string value;
    size_t position; // Position in original query string
    size_t length;   // Length of token

    Token(TokenType t, std::string v, size_t pos, size_t len)
        : type(t), value(std::move(v)), position(pos), length(len) {}

    bool isComparison() const {
        return type == TokenType::Equal || type == TokenType::NotEqual ||
               type == TokenType::Less || type == TokenType::LessEqual ||
               type == TokenType::Greater || type == TokenType::GreaterEqual;
    }

    // Case-insensitive keyword match; only identifiers can be keywords.
    bool isKeyword(std::string_view keyword) const;
};

/**
 * @brief Breaks query text into tokens
 */
class QueryTokenizer {
public:
    std::vector<Token> tokenize(const std::string& query);

private:
    std::string query_;
    size_t position_ = 0;

    char peek() const;
    char peekNext() const;
    char advance();
    bool isAtEnd() const;
    void skipWhitespace();

    Token readQuotedString(char quote);
    Token readNumber();
    Token readIdentifier();

    static bool isIdentifierStart(char c);
    static bool isIdentifierChar(char c);
};

/**
 * @brief Tokenizer exception
 */
class TokenizerException : public std::runtime_error {
public:
    TokenizerException(const std::string& message, size_t position)
        : std::runtime_error(message), position_(position) {}

    size_t getPosition() const { return position_; }

private:
    size_t position_;
};

} // namespace deplink::query
