#include <algorithm>
#include <cctype>
#include <deplink/query/query_tokenizer.h>

namespace deplink::query {

bool Token::isKeyword(std::string_view keyword) const {
    if (type != TokenType::Identifier || value.size() != keyword.size())
        return false;
    return std::equal(value.begin(), value.end(), keyword.begin(), [](char a, char b) {
        return std::toupper(static_cast<unsigned char>(a)) ==
               std::toupper(static_cast<unsigned char>(b));
    });
}

std::vector<Token> QueryTokenizer::tokenize(const std::string& query) {
    query_ = query;
    position_ = 0;
    std::vector<Token> tokens;

    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd())
            break;

        size_t startPos = position_;
        char c = peek();

        if (c == '\'' || c == '"') {
            tokens.push_back(readQuotedString(c));
        } else if (c == ',') {
            advance();
            tokens.emplace_back(TokenType::Comma, ",", startPos, 1);
        } else if (c == '(') {
            advance();
            tokens.emplace_back(TokenType::LeftParen, "(", startPos, 1);
        } else if (c == ')') {
            advance();
            tokens.emplace_back(TokenType::RightParen, ")", startPos, 1);
        } else if (c == '{') {
            advance();
            tokens.emplace_back(TokenType::LeftBrace, "{", startPos, 1);
        } else if (c == '}') {
            advance();
            tokens.emplace_back(TokenType::RightBrace, "}", startPos, 1);
        } else if (c == '[') {
            advance();
            tokens.emplace_back(TokenType::LeftBracket, "[", startPos, 1);
        } else if (c == ']') {
            advance();
            tokens.emplace_back(TokenType::RightBracket, "]", startPos, 1);
        } else if (c == ':') {
            advance();
            tokens.emplace_back(TokenType::Colon, ":", startPos, 1);
        } else if (c == '*') {
            advance();
            tokens.emplace_back(TokenType::Star, "*", startPos, 1);
        } else if (c == '=') {
            advance();
            if (peek() == '=')
                advance();
            tokens.emplace_back(TokenType::Equal, "=", startPos, position_ - startPos);
        } else if (c == '!') {
            advance();
            if (peek() != '=')
                throw TokenizerException("Expected '=' after '!'", startPos);
            advance();
            tokens.emplace_back(TokenType::NotEqual, "!=", startPos, 2);
        } else if (c == '<') {
            advance();
            if (peek() == '=') {
                advance();
                tokens.emplace_back(TokenType::LessEqual, "<=", startPos, 2);
            } else if (peek() == '>') {
                advance();
                tokens.emplace_back(TokenType::NotEqual, "<>", startPos, 2);
            } else {
                tokens.emplace_back(TokenType::Less, "<", startPos, 1);
            }
        } else if (c == '>') {
            advance();
            if (peek() == '=') {
                advance();
                tokens.emplace_back(TokenType::GreaterEqual, ">=", startPos, 2);
            } else {
                tokens.emplace_back(TokenType::Greater, ">", startPos, 1);
            }
        } else if (std::isdigit(static_cast<unsigned char>(c)) ||
                   (c == '-' && std::isdigit(static_cast<unsigned char>(peekNext())))) {
            tokens.push_back(readNumber());
        } else if (isIdentifierStart(c)) {
            tokens.push_back(readIdentifier());
        } else {
            throw TokenizerException(std::string("Unexpected character '") + c + "'", startPos);
        }
    }

    tokens.emplace_back(TokenType::EndOfInput, "", query_.length(), 0);
    return tokens;
}

char QueryTokenizer::peek() const {
    if (isAtEnd())
        return '\0';
    return query_[position_];
}

char QueryTokenizer::peekNext() const {
    if (position_ + 1 >= query_.length())
        return '\0';
    return query_[position_ + 1];
}

char QueryTokenizer::advance() {
    if (isAtEnd())
        return '\0';
    return query_[position_++];
}

bool QueryTokenizer::isAtEnd() const {
    return position_ >= query_.length();
}

void QueryTokenizer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

Token QueryTokenizer::readQuotedString(char quote) {
    size_t startPos = position_;
    advance(); // Skip opening quote

    std::string value;
    while (!isAtEnd() && peek() != quote) {
        if (peek() == '\\' && (peekNext() == quote || peekNext() == '\\')) {
            advance();
            value += advance();
        } else {
            value += advance();
        }
    }

    if (isAtEnd()) {
        throw TokenizerException("Unterminated quoted string", startPos);
    }

    advance(); // Skip closing quote
    return Token(TokenType::String, value, startPos, position_ - startPos);
}

Token QueryTokenizer::readNumber() {
    size_t startPos = position_;
    std::string value;
    if (peek() == '-')
        value += advance();
    bool seenDot = false;
    while (!isAtEnd()) {
        char c = peek();
        if (std::isdigit(static_cast<unsigned char>(c))) {
            value += advance();
        } else if (c == '.' && !seenDot && std::isdigit(static_cast<unsigned char>(peekNext()))) {
            seenDot = true;
            value += advance();
        } else {
            break;
        }
    }
    return Token(TokenType::Number, value, startPos, position_ - startPos);
}

Token QueryTokenizer::readIdentifier() {
    size_t startPos = position_;
    std::string value;
    while (!isAtEnd() && isIdentifierChar(peek())) {
        value += advance();
    }
    return Token(TokenType::Identifier, value, startPos, position_ - startPos);
}

bool QueryTokenizer::isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool QueryTokenizer::isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-' ||
           c == '$';
}

} // namespace deplink::query
