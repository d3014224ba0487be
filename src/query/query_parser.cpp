#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <regex>
#include <deplink/graph/address.h>
#include <deplink/query/query_parser.h>

namespace deplink::query {

using graph::AddressCodec;
using graph::EdgeDirection;
using graph::NodeType;

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool endsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

// Throws std::out_of_range for literals the JSON number types cannot hold.
nlohmann::json numberLiteral(const std::string& text) {
    if (text.find('.') != std::string::npos)
        return std::stod(text);
    return std::stoll(text);
}

Error syntaxError(const char* dialect, const std::string& message, size_t position) {
    return Error{ErrorCode::QuerySyntaxError,
                 std::string(dialect) + " syntax error at position " + std::to_string(position) +
                     ": " + message};
}

bool isRelationalKind(NodeType type) {
    switch (type) {
        case NodeType::ParsedBy:
        case NodeType::DefinedIn:
        case NodeType::Extends:
        case NodeType::Implements:
        case NodeType::UsedBy:
        case NodeType::Unknown:
            return true;
        default:
            return false;
    }
}

} // namespace

std::optional<std::string> resolveNodeTypeWord(std::string_view word) {
    auto lower = toLower(word);
    std::vector<std::string> candidates{lower};
    if (endsWith(lower, "ies"))
        candidates.push_back(lower.substr(0, lower.size() - 3) + "y");
    if (endsWith(lower, "sses") || endsWith(lower, "ches") || endsWith(lower, "xes"))
        candidates.push_back(lower.substr(0, lower.size() - 2));
    if (endsWith(lower, "s"))
        candidates.push_back(lower.substr(0, lower.size() - 1));

    for (const auto& candidate : candidates) {
        if (auto type = graph::nodeTypeFromString(candidate))
            return std::string(graph::nodeTypeToString(*type));
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// TokenParserBase
// ---------------------------------------------------------------------------

void TokenParserBase::reset(const std::string& text) {
    QueryTokenizer tokenizer;
    tokens_ = tokenizer.tokenize(text);
    currentToken_ = 0;
}

const Token& TokenParserBase::current() const {
    return tokens_[std::min(currentToken_, tokens_.size() - 1)];
}

const Token& TokenParserBase::peek() const {
    return tokens_[std::min(currentToken_ + 1, tokens_.size() - 1)];
}

bool TokenParserBase::advance() {
    if (isAtEnd())
        return false;
    ++currentToken_;
    return true;
}

bool TokenParserBase::check(TokenType type) const {
    return current().type == type;
}

bool TokenParserBase::match(TokenType type) {
    if (!check(type))
        return false;
    advance();
    return true;
}

bool TokenParserBase::checkKeyword(std::string_view keyword) const {
    return current().isKeyword(keyword);
}

bool TokenParserBase::matchKeyword(std::string_view keyword) {
    if (!checkKeyword(keyword))
        return false;
    advance();
    return true;
}

const Token& TokenParserBase::expect(TokenType type, const std::string& what) {
    if (!check(type))
        throwError("Expected " + what);
    const Token& token = current();
    advance();
    return token;
}

void TokenParserBase::expectKeyword(std::string_view keyword) {
    if (!matchKeyword(keyword))
        throwError("Expected " + std::string(keyword));
}

bool TokenParserBase::isAtEnd() const {
    return current().type == TokenType::EndOfInput;
}

int TokenParserBase::expectInteger(const std::string& what, int minimum) {
    const Token& token = current();
    if (token.type != TokenType::Number || token.value.find('.') != std::string::npos)
        throwError("Expected an integer " + what);
    long long value = 0;
    try {
        value = std::stoll(token.value);
    } catch (const std::out_of_range&) {
        throwError("Integer out of range for " + what);
    }
    if (value < minimum || value > std::numeric_limits<int>::max())
        throwError(what + " must be >= " + std::to_string(minimum));
    advance();
    return static_cast<int>(value);
}

void TokenParserBase::throwError(const std::string& message) const {
    const Token& token = current();
    std::string where = token.type == TokenType::EndOfInput ? " at end of query"
                                                             : " near '" + token.value + "'";
    throw QuerySyntaxException(message + where, token.position);
}

// ---------------------------------------------------------------------------
// SqlQueryParser
// ---------------------------------------------------------------------------

Result<QueryPlan> SqlQueryParser::parse(const std::string& text) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos)
        return Error{ErrorCode::QuerySyntaxError, "Empty query string"};

    try {
        reset(text);
        plan_ = QueryPlan{};
        plan_.dialect = QueryDialect::SQL;
        parseStatement();
        return plan_;
    } catch (const TokenizerException& e) {
        return syntaxError("SQL", e.what(), e.getPosition());
    } catch (const QuerySyntaxException& e) {
        return syntaxError("SQL", e.what(), e.getPosition());
    }
}

void SqlQueryParser::parseStatement() {
    if (matchKeyword("SELECT")) {
        parseSelectList();
        expectKeyword("FROM");
        parseSource();
    } else if (matchKeyword("MATCH")) {
        parseSource();
    } else {
        throwError("Expected SELECT or MATCH");
    }

    bool seenWhere = false;
    bool seenTraverse = false;
    bool seenOrder = false;
    bool seenLimit = false;
    while (!isAtEnd()) {
        if (checkKeyword("WHERE") && !seenWhere) {
            advance();
            parseWhere();
            seenWhere = true;
        } else if (checkKeyword("TRAVERSE") && !seenTraverse) {
            advance();
            parseTraverse();
            seenTraverse = true;
        } else if (checkKeyword("ORDER") && !seenOrder) {
            advance();
            parseOrderBy();
            seenOrder = true;
        } else if (checkKeyword("LIMIT") && !seenLimit) {
            advance();
            parseLimit();
            seenLimit = true;
        } else {
            throwError("Unexpected token");
        }
    }
}

bool SqlQueryParser::atClauseKeyword() const {
    static constexpr std::string_view keywords[] = {"FROM",  "WHERE", "TRAVERSE", "ORDER",
                                                    "LIMIT", "OFFSET", "AND",     "OR"};
    return std::any_of(std::begin(keywords), std::end(keywords),
                       [this](std::string_view k) { return checkKeyword(k); });
}

std::string SqlQueryParser::parseFieldName() {
    if (check(TokenType::Identifier) && !atClauseKeyword()) {
        std::string name = current().value;
        advance();
        return name;
    }
    if (check(TokenType::String)) {
        std::string name = current().value;
        advance();
        return name;
    }
    throwError("Expected field name");
}

void SqlQueryParser::parseSelectList() {
    if (match(TokenType::Star))
        return;
    do {
        Projection projection;
        projection.field = parseFieldName();
        if (matchKeyword("AS"))
            projection.alias = expect(TokenType::Identifier, "alias after AS").value;
        plan_.projections.push_back(std::move(projection));
    } while (match(TokenType::Comma));
}

void SqlQueryParser::parseSource() {
    if (match(TokenType::Star) || matchKeyword("NODES"))
        return;
    do {
        if (!check(TokenType::Identifier) && !check(TokenType::String))
            throwError("Expected node type");
        auto type = resolveNodeTypeWord(current().value);
        if (!type)
            throwError("Unknown node type");
        if (std::find(plan_.nodeTypes.begin(), plan_.nodeTypes.end(), *type) ==
            plan_.nodeTypes.end())
            plan_.nodeTypes.push_back(*type);
        advance();
    } while (match(TokenType::Comma));
}

void SqlQueryParser::parseWhere() {
    ConditionGroup group;
    group.push_back(parseCondition());
    for (;;) {
        if (matchKeyword("AND")) {
            group.push_back(parseCondition());
        } else if (matchKeyword("OR")) {
            plan_.conditions.push_back(std::move(group));
            group = ConditionGroup{};
            group.push_back(parseCondition());
        } else {
            break;
        }
    }
    plan_.conditions.push_back(std::move(group));
}

Condition SqlQueryParser::parseCondition() {
    Condition condition;
    if (matchKeyword("EXISTS")) {
        condition.field = parseFieldName();
        condition.op = ConditionOp::Exists;
        return condition;
    }
    if (checkKeyword("NOT") && peek().isKeyword("EXISTS")) {
        advance();
        advance();
        condition.field = parseFieldName();
        condition.op = ConditionOp::NotExists;
        return condition;
    }

    condition.field = parseFieldName();
    if (matchKeyword("LIKE")) {
        condition.op = ConditionOp::Like;
        condition.value = parseLiteral();
        if (!condition.value.is_string())
            throwError("LIKE expects a quoted pattern");
    } else if (matchKeyword("IN")) {
        condition.op = ConditionOp::In;
        condition.value = parseLiteralList();
    } else if (matchKeyword("NOT")) {
        if (matchKeyword("IN")) {
            condition.op = ConditionOp::NotIn;
            condition.value = parseLiteralList();
        } else if (matchKeyword("EXISTS")) {
            condition.op = ConditionOp::NotExists;
        } else {
            throwError("Expected IN or EXISTS after NOT");
        }
    } else if (matchKeyword("EXISTS")) {
        condition.op = ConditionOp::Exists;
    } else if (current().isComparison()) {
        switch (current().type) {
            case TokenType::Equal:
                condition.op = ConditionOp::Equal;
                break;
            case TokenType::NotEqual:
                condition.op = ConditionOp::NotEqual;
                break;
            case TokenType::Less:
                condition.op = ConditionOp::Less;
                break;
            case TokenType::LessEqual:
                condition.op = ConditionOp::LessEqual;
                break;
            case TokenType::Greater:
                condition.op = ConditionOp::Greater;
                break;
            default:
                condition.op = ConditionOp::GreaterEqual;
                break;
        }
        advance();
        condition.value = parseLiteral();
    } else {
        throwError("Expected operator after '" + condition.field + "'");
    }
    return condition;
}

nlohmann::json SqlQueryParser::parseLiteral() {
    const Token& token = current();
    nlohmann::json value;
    if (token.type == TokenType::String) {
        value = token.value;
    } else if (token.type == TokenType::Number) {
        try {
            value = numberLiteral(token.value);
        } catch (const std::out_of_range&) {
            throwError("Number out of range");
        }
    } else if (token.isKeyword("TRUE")) {
        value = true;
    } else if (token.isKeyword("FALSE")) {
        value = false;
    } else if (token.isKeyword("NULL")) {
        value = nullptr;
    } else {
        throwError("Expected a value");
    }
    advance();
    return value;
}

nlohmann::json SqlQueryParser::parseLiteralList() {
    expect(TokenType::LeftParen, "'(' to open value list");
    auto values = nlohmann::json::array();
    if (match(TokenType::RightParen))
        return values;
    do {
        values.push_back(parseLiteral());
    } while (match(TokenType::Comma));
    expect(TokenType::RightParen, "')' to close value list");
    return values;
}

void SqlQueryParser::parseTraverse() {
    Traversal traversal;
    if (matchKeyword("TRANSITIVE"))
        traversal.mode = TraversalMode::Transitive;
    else if (matchKeyword("INHERITED"))
        traversal.mode = TraversalMode::Inherited;

    if ((!check(TokenType::Identifier) && !check(TokenType::String)) || checkKeyword("FROM"))
        throwError("Expected edge type after TRAVERSE");
    traversal.edgeType = current().value;
    advance();

    if (matchKeyword("IN"))
        traversal.direction = EdgeDirection::In;
    else if (matchKeyword("OUT"))
        traversal.direction = EdgeDirection::Out;

    expectKeyword("FROM");
    if (!check(TokenType::String))
        throwError("Expected quoted root address after FROM");
    if (!AddressCodec::validate(current().value).isValid)
        throwError("Invalid traversal root address");
    traversal.from = current().value;
    advance();

    if (matchKeyword("DEPTH"))
        traversal.depth = expectInteger("DEPTH", 1);
    plan_.traversal = std::move(traversal);
}

void SqlQueryParser::parseOrderBy() {
    expectKeyword("BY");
    OrderBy order;
    order.field = parseFieldName();
    if (matchKeyword("DESC"))
        order.descending = true;
    else
        matchKeyword("ASC");
    plan_.orderBy = std::move(order);
}

void SqlQueryParser::parseLimit() {
    plan_.limit = static_cast<std::size_t>(expectInteger("LIMIT", 0));
    if (matchKeyword("OFFSET"))
        plan_.offset = static_cast<std::size_t>(expectInteger("OFFSET", 0));
}

// ---------------------------------------------------------------------------
// GraphQLQueryParser
// ---------------------------------------------------------------------------

Result<QueryPlan> GraphQLQueryParser::parse(const std::string& text) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos)
        return Error{ErrorCode::QuerySyntaxError, "Empty query string"};

    try {
        reset(text);
        plan_ = QueryPlan{};
        plan_.dialect = QueryDialect::GraphQL;
        traversal_ = Traversal{};
        hasFrom_ = hasEdge_ = hasTraversalOption_ = false;
        descending_.reset();
        seenArguments_.clear();
        parseDocument();
        return plan_;
    } catch (const TokenizerException& e) {
        return syntaxError("GraphQL", e.what(), e.getPosition());
    } catch (const QuerySyntaxException& e) {
        return syntaxError("GraphQL", e.what(), e.getPosition());
    }
}

void GraphQLQueryParser::parseDocument() {
    if (matchKeyword("query")) {
        if (check(TokenType::Identifier))
            advance();
    }
    expect(TokenType::LeftBrace, "'{'");

    const Token& root = current();
    if (root.type != TokenType::Identifier)
        throwError("Expected root field");
    if (root.value != "nodes")
        throw QuerySyntaxException("Unknown root field '" + root.value + "'", root.position);
    advance();

    if (match(TokenType::LeftParen))
        parseArguments();
    finishArguments();

    if (check(TokenType::LeftBrace))
        parseSelectionSet();

    expect(TokenType::RightBrace, "'}' to close the query");
    if (!isAtEnd())
        throwError("Unexpected token after query");
}

void GraphQLQueryParser::parseArguments() {
    while (!check(TokenType::RightParen)) {
        const Token& name = expect(TokenType::Identifier, "argument name");
        expect(TokenType::Colon, "':' after argument name");
        auto value = parseValue();
        applyArgument(name.value, value, name.position);
        match(TokenType::Comma);
    }
    expect(TokenType::RightParen, "')' to close arguments");
}

void GraphQLQueryParser::applyArgument(const std::string& name, const nlohmann::json& value,
                                       size_t position) {
    auto fail = [&](const std::string& message) {
        throw QuerySyntaxException(message, position);
    };
    auto requireString = [&]() -> std::string {
        if (!value.is_string())
            fail("Argument '" + name + "' expects a string");
        return value.get<std::string>();
    };
    auto requireInteger = [&](int minimum) -> int {
        if (!value.is_number_integer())
            fail("Argument '" + name + "' expects an integer");
        auto n = value.get<long long>();
        if (n < minimum || n > std::numeric_limits<int>::max())
            fail("Argument '" + name + "' must be >= " + std::to_string(minimum));
        return static_cast<int>(n);
    };

    if (std::find(seenArguments_.begin(), seenArguments_.end(), name) != seenArguments_.end())
        fail("Duplicate argument '" + name + "'");
    seenArguments_.push_back(name);

    if (name == "type") {
        std::vector<nlohmann::json> words;
        if (value.is_array())
            words.assign(value.begin(), value.end());
        else
            words.push_back(value);
        for (const auto& word : words) {
            if (!word.is_string())
                fail("Argument 'type' expects a string or a list of strings");
            auto type = resolveNodeTypeWord(word.get<std::string>());
            if (!type)
                fail("Unknown node type '" + word.get<std::string>() + "'");
            if (std::find(plan_.nodeTypes.begin(), plan_.nodeTypes.end(), *type) ==
                plan_.nodeTypes.end())
                plan_.nodeTypes.push_back(*type);
        }
    } else if (name == "from") {
        auto address = requireString();
        if (!AddressCodec::validate(address).isValid)
            fail("Invalid traversal root address '" + address + "'");
        traversal_.from = address;
        hasFrom_ = true;
    } else if (name == "edge") {
        traversal_.edgeType = requireString();
        if (traversal_.edgeType.empty())
            fail("Argument 'edge' must not be empty");
        hasEdge_ = true;
    } else if (name == "direction") {
        auto direction = toLower(requireString());
        if (direction == "in")
            traversal_.direction = EdgeDirection::In;
        else if (direction == "out")
            traversal_.direction = EdgeDirection::Out;
        else
            fail("Argument 'direction' must be \"in\" or \"out\"");
        hasTraversalOption_ = true;
    } else if (name == "depth") {
        traversal_.depth = requireInteger(1);
        hasTraversalOption_ = true;
    } else if (name == "mode") {
        auto mode = toLower(requireString());
        if (mode == "direct")
            traversal_.mode = TraversalMode::Direct;
        else if (mode == "transitive")
            traversal_.mode = TraversalMode::Transitive;
        else if (mode == "inherited")
            traversal_.mode = TraversalMode::Inherited;
        else
            fail("Argument 'mode' must be direct, transitive or inherited");
        hasTraversalOption_ = true;
    } else if (name == "where") {
        if (!value.is_object())
            fail("Argument 'where' expects an object");
        ConditionGroup group;
        for (auto it = value.begin(); it != value.end(); ++it) {
            Condition condition;
            condition.field = it.key();
            if (it.value().is_object())
                fail("Filter '" + it.key() + "' must be a scalar or a list");
            condition.op = it.value().is_array() ? ConditionOp::In : ConditionOp::Equal;
            condition.value = it.value();
            group.push_back(std::move(condition));
        }
        if (!group.empty())
            plan_.conditions.push_back(std::move(group));
    } else if (name == "limit") {
        plan_.limit = static_cast<std::size_t>(requireInteger(0));
    } else if (name == "offset") {
        plan_.offset = static_cast<std::size_t>(requireInteger(0));
    } else if (name == "orderBy") {
        plan_.orderBy = OrderBy{requireString(), false};
    } else if (name == "order") {
        auto order = toLower(requireString());
        if (order != "asc" && order != "desc")
            fail("Argument 'order' must be \"asc\" or \"desc\"");
        descending_ = order == "desc";
    } else {
        fail("Unknown argument '" + name + "'");
    }
}

void GraphQLQueryParser::finishArguments() {
    if (descending_) {
        if (!plan_.orderBy)
            throwError("Argument 'order' requires 'orderBy'");
        plan_.orderBy->descending = *descending_;
    }
    if (hasFrom_ != hasEdge_)
        throwError("Arguments 'from' and 'edge' must be given together");
    if (hasTraversalOption_ && !hasFrom_)
        throwError("Traversal options require 'from' and 'edge'");
    if (hasFrom_)
        plan_.traversal = traversal_;
}

void GraphQLQueryParser::parseSelectionSet() {
    expect(TokenType::LeftBrace, "'{' to open selection set");
    while (!check(TokenType::RightBrace)) {
        const Token& first = expect(TokenType::Identifier, "field name");
        Projection projection;
        if (match(TokenType::Colon)) {
            projection.alias = first.value;
            projection.field = expect(TokenType::Identifier, "field name after alias").value;
        } else {
            projection.field = first.value;
        }
        plan_.projections.push_back(std::move(projection));
        match(TokenType::Comma);
    }
    expect(TokenType::RightBrace, "'}' to close selection set");
}

nlohmann::json GraphQLQueryParser::parseValue() {
    const Token& token = current();
    switch (token.type) {
        case TokenType::String: {
            advance();
            return token.value;
        }
        case TokenType::Number: {
            nlohmann::json value;
            try {
                value = numberLiteral(token.value);
            } catch (const std::out_of_range&) {
                throwError("Number out of range");
            }
            advance();
            return value;
        }
        case TokenType::Identifier: {
            advance();
            if (token.value == "true")
                return true;
            if (token.value == "false")
                return false;
            if (token.value == "null")
                return nullptr;
            return token.value; // enum value
        }
        case TokenType::LeftBracket: {
            advance();
            auto list = nlohmann::json::array();
            while (!check(TokenType::RightBracket)) {
                list.push_back(parseValue());
                match(TokenType::Comma);
            }
            expect(TokenType::RightBracket, "']' to close list");
            return list;
        }
        case TokenType::LeftBrace: {
            advance();
            auto object = nlohmann::json::object();
            while (!check(TokenType::RightBrace)) {
                if (!check(TokenType::Identifier) && !check(TokenType::String))
                    throwError("Expected object key");
                std::string key = current().value;
                advance();
                expect(TokenType::Colon, "':' after object key");
                object[key] = parseValue();
                match(TokenType::Comma);
            }
            expect(TokenType::RightBrace, "'}' to close object");
            return object;
        }
        default:
            throwError("Expected a value");
    }
}

// ---------------------------------------------------------------------------
// NaturalLanguageParser
// ---------------------------------------------------------------------------

namespace {

struct RelationPhrase {
    const char* phrase;
    const char* edgeType;
    EdgeDirection direction;
    TraversalMode mode;
};

// The relation target: a quoted string or a bare address token.
constexpr const char* kTarget = R"re((?:'([^']*)'|"([^"]*)"|([^\s'"]+)))re";

const std::vector<RelationPhrase>& relationPhrases() {
    static const std::vector<RelationPhrase> phrases = {
        {R"(\bcalled\s+by\s+)", "calls", EdgeDirection::Out, TraversalMode::Direct},
        {R"(\b(?:that|which)\s+calls?\s+)", "calls", EdgeDirection::In, TraversalMode::Direct},
        {R"(\bimported\s+by\s+)", "imports", EdgeDirection::Out, TraversalMode::Direct},
        {R"(\b(?:that|which)\s+imports?\s+)", "imports", EdgeDirection::In,
         TraversalMode::Direct},
        {R"(\b(?:that|which)\s+extends?\s+)", "extends", EdgeDirection::In,
         TraversalMode::Direct},
        {R"(\bsubclasses\s+of\s+)", "extends", EdgeDirection::In, TraversalMode::Transitive},
        {R"(\bancestors\s+of\s+)", "extends", EdgeDirection::Out, TraversalMode::Transitive},
        {R"(\bdependencies\s+of\s+)", "depends_on", EdgeDirection::Out,
         TraversalMode::Transitive},
        {R"(\bdependents\s+of\s+)", "depends_on", EdgeDirection::In, TraversalMode::Transitive},
        {R"(\bused\s+by\s+)", "uses", EdgeDirection::Out, TraversalMode::Direct},
        {R"(\b(?:that|which)\s+uses?\s+)", "uses", EdgeDirection::In, TraversalMode::Direct},
    };
    return phrases;
}

std::string capturedTarget(const std::smatch& m, size_t first) {
    for (size_t i = first; i < first + 3; ++i) {
        if (m[i].matched)
            return m[i].str();
    }
    return {};
}

// Blanks out a consumed span so later passes do not see it.
void blank(std::string& text, size_t pos, size_t len) {
    std::fill(text.begin() + static_cast<std::ptrdiff_t>(pos),
              text.begin() + static_cast<std::ptrdiff_t>(pos + len), ' ');
}

} // namespace

Result<QueryPlan> NaturalLanguageParser::parse(const std::string& text) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos)
        return Error{ErrorCode::QuerySyntaxError, "Empty query string"};

    QueryPlan plan;
    plan.dialect = QueryDialect::NaturalLanguage;
    std::string rest = text;

    try {
        // Earliest relation phrase wins.
        std::optional<std::pair<size_t, size_t>> span;
        for (const auto& relation : relationPhrases()) {
            std::regex pattern(std::string(relation.phrase) + kTarget, std::regex::icase);
            std::smatch m;
            if (!std::regex_search(rest, m, pattern))
                continue;
            auto pos = static_cast<size_t>(m.position(0));
            if (span && span->first <= pos)
                continue;
            auto target = capturedTarget(m, 1);
            if (!AddressCodec::validate(target).isValid) {
                return Error{ErrorCode::QuerySyntaxError,
                             "Relation target '" + target + "' is not a node address"};
            }
            Traversal traversal;
            traversal.from = target;
            traversal.edgeType = relation.edgeType;
            traversal.direction = relation.direction;
            traversal.mode = relation.mode;
            plan.traversal = std::move(traversal);
            span = std::make_pair(pos, static_cast<size_t>(m.length(0)));
        }
        if (span)
            blank(rest, span->first, span->second);

        static const std::regex depthPattern(R"(\b(?:within\s+)?depth\s+(\d+)\b)",
                                             std::regex::icase);
        std::smatch depthMatch;
        if (std::regex_search(rest, depthMatch, depthPattern)) {
            int depth = 0;
            try {
                depth = std::stoi(depthMatch[1].str());
            } catch (const std::out_of_range&) {
                return Error{ErrorCode::QuerySyntaxError,
                             "Depth '" + depthMatch[1].str() + "' is out of range"};
            }
            if (depth < 1)
                return Error{ErrorCode::QuerySyntaxError, "Depth must be >= 1"};
            if (plan.traversal)
                plan.traversal->depth = depth;
            blank(rest, static_cast<size_t>(depthMatch.position(0)),
                  static_cast<size_t>(depthMatch.length(0)));
        }

        static const std::regex filePattern(std::string(R"(\bin\s+file\s+)") + kTarget,
                                            std::regex::icase);
        std::smatch fileMatch;
        if (std::regex_search(rest, fileMatch, filePattern)) {
            Condition condition;
            condition.field = "filePath";
            condition.op = ConditionOp::Equal;
            condition.value = AddressCodec::normalizePath(capturedTarget(fileMatch, 1));
            plan.conditions.push_back(ConditionGroup{std::move(condition)});
            blank(rest, static_cast<size_t>(fileMatch.position(0)),
                  static_cast<size_t>(fileMatch.length(0)));
        }

        static const std::regex wordPattern(R"([A-Za-z][A-Za-z_-]*)");
        for (auto it = std::sregex_iterator(rest.begin(), rest.end(), wordPattern);
             it != std::sregex_iterator(); ++it) {
            auto word = it->str();
            // "of type X" names a type; the connector word itself is not one.
            if (toLower(word) == "type")
                continue;
            auto type = resolveNodeTypeWord(word);
            if (!type)
                continue;
            auto kind = graph::nodeTypeFromString(*type);
            if (!kind || isRelationalKind(*kind))
                continue;
            if (std::find(plan.nodeTypes.begin(), plan.nodeTypes.end(), *type) ==
                plan.nodeTypes.end())
                plan.nodeTypes.push_back(*type);
        }
    } catch (const std::regex_error& e) {
        return Error{ErrorCode::InternalError, std::string("Regex failure: ") + e.what()};
    }

    if (plan.nodeTypes.empty() && !plan.traversal) {
        return Error{ErrorCode::QuerySyntaxError,
                     "Could not recognize a node type or relation in '" + text + "'"};
    }
    spdlog::debug("[NaturalLanguageParser] '{}' -> {}", text, plan.cacheKey());
    return plan;
}

Result<QueryPlan> parseQuery(QueryDialect dialect, const std::string& text) {
    switch (dialect) {
        case QueryDialect::SQL:
            return SqlQueryParser{}.parse(text);
        case QueryDialect::GraphQL:
            return GraphQLQueryParser{}.parse(text);
        case QueryDialect::NaturalLanguage:
            return NaturalLanguageParser{}.parse(text);
    }
    return Error{ErrorCode::UnsupportedDialect, "Unsupported query dialect"};
}

} // namespace deplink::query
