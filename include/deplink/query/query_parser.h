#pragma once

#include <deplink/core/types.h>
#include <deplink/query/query_plan.h>
#include <deplink/query/query_tokenizer.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace deplink::query {

/**
 * @brief Raised inside the parsers; converted to QuerySyntaxError before
 * leaving parse().
 */
class QuerySyntaxException : public std::runtime_error {
public:
    QuerySyntaxException(const std::string& message, size_t position)
        : std::runtime_error(message), position_(position) {}

    size_t getPosition() const { return position_; }

private:
    size_t position_;
};

/**
 * @brief Token navigation shared by the token-based parsers
 */
class TokenParserBase {
protected:
    std::vector<Token> tokens_;
    size_t currentToken_ = 0;

    void reset(const std::string& text);

    const Token& current() const;
    const Token& peek() const;
    bool advance();
    bool check(TokenType type) const;
    bool match(TokenType type);
    bool checkKeyword(std::string_view keyword) const;
    bool matchKeyword(std::string_view keyword);
    const Token& expect(TokenType type, const std::string& what);
    void expectKeyword(std::string_view keyword);
    bool isAtEnd() const;

    int expectInteger(const std::string& what, int minimum);

    [[noreturn]] void throwError(const std::string& message) const;
};

/**
 * @brief SQL-like surface syntax
 *
 * SELECT fields FROM source [WHERE cond {AND|OR cond}]
 *   [TRAVERSE [TRANSITIVE|INHERITED] edge [IN|OUT] FROM 'address' [DEPTH n]]
 *   [ORDER BY field [ASC|DESC]] [LIMIT n [OFFSET m]]
 *
 * MATCH source ... is the same query with every field selected.
 */
class SqlQueryParser : private TokenParserBase {
public:
    Result<QueryPlan> parse(const std::string& text);

private:
    QueryPlan plan_;

    void parseStatement();
    void parseSelectList();
    void parseSource();
    void parseWhere();
    Condition parseCondition();
    nlohmann::json parseLiteral();
    nlohmann::json parseLiteralList();
    void parseTraverse();
    void parseOrderBy();
    void parseLimit();
    std::string parseFieldName();
    bool atClauseKeyword() const;
};

/**
 * @brief GraphQL-like surface syntax
 *
 * [query [Name]] { nodes(arg: value, ...) { field alias: field ... } }
 */
class GraphQLQueryParser : private TokenParserBase {
public:
    Result<QueryPlan> parse(const std::string& text);

private:
    QueryPlan plan_;
    Traversal traversal_;
    bool hasFrom_ = false;
    bool hasEdge_ = false;
    bool hasTraversalOption_ = false;
    std::optional<bool> descending_;
    std::vector<std::string> seenArguments_;

    void parseDocument();
    void parseArguments();
    void applyArgument(const std::string& name, const nlohmann::json& value, size_t position);
    void finishArguments();
    void parseSelectionSet();
    nlohmann::json parseValue();
};

/**
 * @brief Intent classification for plain-English questions
 *
 * Recognizes node-type words, a fixed set of relation phrases
 * ("called by X", "subclasses of X", ...), "within depth N" and "in file P".
 */
class NaturalLanguageParser {
public:
    Result<QueryPlan> parse(const std::string& text);
};

// Dispatches to the parser for the dialect.
Result<QueryPlan> parseQuery(QueryDialect dialect, const std::string& text);

// Resolves a node-type word such as "Function", "functions" or "classes".
std::optional<std::string> resolveNodeTypeWord(std::string_view word);

} // namespace deplink::query
