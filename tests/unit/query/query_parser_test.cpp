#include <gtest/gtest.h>

#include <deplink/query/query_parser.h>

using namespace deplink;
using namespace deplink::query;

namespace {

const std::string kMain = "proj/src/app.ts#Function:main";

} // namespace

class SqlQueryParserTest : public ::testing::Test {
protected:
    Result<QueryPlan> parse(const std::string& text) { return parser_.parse(text); }

    SqlQueryParser parser_;
};

TEST_F(SqlQueryParserTest, SelectWithProjectionAndTypes) {
    auto r = parse("SELECT address, symbolName AS name FROM functions, classes");
    ASSERT_TRUE(r) << r.error().message;
    const auto& plan = r.value();
    EXPECT_EQ(plan.dialect, QueryDialect::SQL);
    EXPECT_EQ(plan.nodeTypes, (std::vector<std::string>{"Function", "Class"}));
    ASSERT_EQ(plan.projections.size(), 2u);
    EXPECT_EQ(plan.projections[1].field, "symbolName");
    EXPECT_EQ(plan.projections[1].outputName(), "name");
}

TEST_F(SqlQueryParserTest, MatchStarHasNoFilters) {
    auto r = parse("MATCH *");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().nodeTypes.empty());
    EXPECT_TRUE(r.value().projections.empty());
    EXPECT_FALSE(r.value().traversal.has_value());
}

TEST_F(SqlQueryParserTest, WhereBuildsOrOfAndGroups) {
    auto r = parse("SELECT * FROM nodes WHERE filePath = 'a.ts' AND line > 3 OR symbolName LIKE 'get%'");
    ASSERT_TRUE(r);
    const auto& groups = r.value().conditions;
    ASSERT_EQ(groups.size(), 2u);
    ASSERT_EQ(groups[0].size(), 2u);
    EXPECT_EQ(groups[0][1].op, ConditionOp::Greater);
    EXPECT_EQ(groups[0][1].value, 3);
    ASSERT_EQ(groups[1].size(), 1u);
    EXPECT_EQ(groups[1][0].op, ConditionOp::Like);
}

TEST_F(SqlQueryParserTest, ConditionForms) {
    auto r = parse("MATCH nodes WHERE EXISTS metadata.doc AND NOT EXISTS metadata.deprecated "
                   "AND nodeType IN ('Class', 'Interface') AND symbolName NOT IN ('x') "
                   "AND exported = TRUE AND parent = NULL");
    ASSERT_TRUE(r) << r.error().message;
    const auto& group = r.value().conditions.at(0);
    ASSERT_EQ(group.size(), 6u);
    EXPECT_EQ(group[0].op, ConditionOp::Exists);
    EXPECT_EQ(group[1].op, ConditionOp::NotExists);
    EXPECT_EQ(group[2].op, ConditionOp::In);
    EXPECT_EQ(group[2].value.size(), 2u);
    EXPECT_EQ(group[3].op, ConditionOp::NotIn);
    EXPECT_EQ(group[4].value, true);
    EXPECT_TRUE(group[5].value.is_null());
}

TEST_F(SqlQueryParserTest, TraverseClause) {
    auto r = parse("SELECT * FROM functions TRAVERSE TRANSITIVE calls IN FROM '" + kMain +
                   "' DEPTH 3");
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_TRUE(r.value().traversal.has_value());
    const auto& t = *r.value().traversal;
    EXPECT_EQ(t.mode, TraversalMode::Transitive);
    EXPECT_EQ(t.edgeType, "calls");
    EXPECT_EQ(t.direction, graph::EdgeDirection::In);
    EXPECT_EQ(t.from, kMain);
    EXPECT_EQ(t.depth, 3);
}

TEST_F(SqlQueryParserTest, ClausesInAnyOrder) {
    auto r = parse("MATCH classes LIMIT 5 OFFSET 2 ORDER BY symbolName DESC WHERE line < 100");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().limit, 5u);
    EXPECT_EQ(r.value().offset, 2u);
    ASSERT_TRUE(r.value().orderBy.has_value());
    EXPECT_TRUE(r.value().orderBy->descending);
    EXPECT_EQ(r.value().conditions.size(), 1u);
}

TEST_F(SqlQueryParserTest, SyntaxErrorsCarryPosition) {
    auto r = parse("SELECT * FROM gadgets");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::QuerySyntaxError);
    EXPECT_NE(r.error().message.find("position 14"), std::string::npos);
    EXPECT_NE(r.error().message.find("gadgets"), std::string::npos);
}

TEST_F(SqlQueryParserTest, RejectsMalformedQueries) {
    EXPECT_FALSE(parse(""));
    EXPECT_FALSE(parse("DELETE FROM nodes"));
    EXPECT_FALSE(parse("SELECT * FROM nodes WHERE"));
    EXPECT_FALSE(parse("SELECT * FROM nodes LIMIT 1 LIMIT 2"));
    EXPECT_FALSE(parse("SELECT * FROM nodes LIMIT -1"));
    EXPECT_FALSE(parse("SELECT * FROM nodes TRAVERSE calls FROM 'not-an-address'"));
    EXPECT_FALSE(parse("SELECT * FROM nodes TRAVERSE calls FROM '" + kMain + "' DEPTH 0"));
    EXPECT_FALSE(parse("SELECT * FROM nodes WHERE name LIKE 3"));
    EXPECT_FALSE(parse("SELECT * FROM nodes WHERE name = 'unterminated"));
}

TEST_F(SqlQueryParserTest, OversizedNumbersAreSyntaxErrors) {
    auto r = parse("SELECT * FROM nodes WHERE line = 99999999999999999999");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::QuerySyntaxError);
    EXPECT_NE(r.error().message.find("out of range"), std::string::npos);

    auto decimal = parse("SELECT * FROM nodes WHERE weight > 1" + std::string(400, '0') + ".5");
    ASSERT_FALSE(decimal);
    EXPECT_EQ(decimal.error().code, ErrorCode::QuerySyntaxError);

    auto limit = parse("SELECT * FROM nodes LIMIT 99999999999999999999");
    ASSERT_FALSE(limit);
    EXPECT_EQ(limit.error().code, ErrorCode::QuerySyntaxError);
}

class GraphQLQueryParserTest : public ::testing::Test {
protected:
    Result<QueryPlan> parse(const std::string& text) { return parser_.parse(text); }

    GraphQLQueryParser parser_;
};

TEST_F(GraphQLQueryParserTest, FullQuery) {
    auto r = parse(R"(query Callers {
        nodes(type: ["Function", "methods"], from: ")" + kMain + R"(", edge: "calls",
              direction: "in", depth: 2, mode: "transitive",
              where: { filePath: "src/app.ts", nodeType: ["Function", "Method"] },
              limit: 10, offset: 1, orderBy: "symbolName", order: "desc") {
            address
            name: symbolName
        }
    })");
    ASSERT_TRUE(r) << r.error().message;
    const auto& plan = r.value();
    EXPECT_EQ(plan.dialect, QueryDialect::GraphQL);
    EXPECT_EQ(plan.nodeTypes, (std::vector<std::string>{"Function", "Method"}));
    ASSERT_TRUE(plan.traversal.has_value());
    EXPECT_EQ(plan.traversal->direction, graph::EdgeDirection::In);
    EXPECT_EQ(plan.traversal->depth, 2);
    EXPECT_EQ(plan.traversal->mode, TraversalMode::Transitive);
    ASSERT_EQ(plan.conditions.size(), 1u);
    EXPECT_EQ(plan.conditions[0].size(), 2u);
    EXPECT_EQ(plan.limit, 10u);
    EXPECT_EQ(plan.offset, 1u);
    ASSERT_TRUE(plan.orderBy.has_value());
    EXPECT_TRUE(plan.orderBy->descending);
    ASSERT_EQ(plan.projections.size(), 2u);
    EXPECT_EQ(plan.projections[1].outputName(), "name");
}

TEST_F(GraphQLQueryParserTest, BareNodesQuery) {
    auto r = parse("{ nodes }");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().nodeTypes.empty());
    EXPECT_FALSE(r.value().traversal.has_value());
}

TEST_F(GraphQLQueryParserTest, ListFilterBecomesIn) {
    auto r = parse(R"({ nodes(where: { symbolName: ["a", "b"] }) })");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().conditions.at(0).at(0).op, ConditionOp::In);
}

TEST_F(GraphQLQueryParserTest, RejectsInvalidArguments) {
    EXPECT_FALSE(parse("{ edges }"));
    EXPECT_FALSE(parse("{ nodes(color: \"red\") }"));
    EXPECT_FALSE(parse("{ nodes(limit: 1, limit: 2) }"));
    EXPECT_FALSE(parse("{ nodes(edge: \"calls\") }"));
    EXPECT_FALSE(parse("{ nodes(depth: 2) }"));
    EXPECT_FALSE(parse("{ nodes(order: \"asc\") }"));
    EXPECT_FALSE(parse("{ nodes(from: \"bad\", edge: \"calls\") }"));
    EXPECT_FALSE(parse("{ nodes(type: \"gadget\") }"));
    EXPECT_FALSE(parse("{ nodes(limit: \"ten\") }"));
    EXPECT_FALSE(parse("{ nodes { address }"));
    EXPECT_FALSE(parse("{ nodes } extra"));

    auto r = parse("{ nodes(direction: \"sideways\", from: \"" + kMain + "\", edge: \"calls\") }");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::QuerySyntaxError);
    EXPECT_EQ(r.error().message.rfind("GraphQL syntax error at position", 0), 0u);
}

TEST_F(GraphQLQueryParserTest, OversizedNumbersAreSyntaxErrors) {
    for (const std::string text : {"{ nodes(limit: 99999999999999999999) }",
                                   "{ nodes(where: { line: 99999999999999999999 }) }"}) {
        auto r = parse(text);
        ASSERT_FALSE(r) << text;
        EXPECT_EQ(r.error().code, ErrorCode::QuerySyntaxError) << text;
    }
}

class NaturalLanguageParserTest : public ::testing::Test {
protected:
    Result<QueryPlan> parse(const std::string& text) { return parser_.parse(text); }

    NaturalLanguageParser parser_;
};

TEST_F(NaturalLanguageParserTest, TypeWordsOnly) {
    auto r = parse("show me all classes and interfaces");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().nodeTypes, (std::vector<std::string>{"Class", "Interface"}));
    EXPECT_FALSE(r.value().traversal.has_value());
}

TEST_F(NaturalLanguageParserTest, CalledByRelation) {
    auto r = parse("functions called by " + kMain + " within depth 3");
    ASSERT_TRUE(r) << r.error().message;
    const auto& plan = r.value();
    EXPECT_EQ(plan.nodeTypes, (std::vector<std::string>{"Function"}));
    ASSERT_TRUE(plan.traversal.has_value());
    EXPECT_EQ(plan.traversal->edgeType, "calls");
    EXPECT_EQ(plan.traversal->direction, graph::EdgeDirection::Out);
    EXPECT_EQ(plan.traversal->depth, 3);
    EXPECT_EQ(plan.traversal->from, kMain);
}

TEST_F(NaturalLanguageParserTest, RelationTable) {
    struct Case {
        std::string phrase;
        std::string edge;
        graph::EdgeDirection direction;
        TraversalMode mode;
    };
    using graph::EdgeDirection;
    std::vector<Case> cases{
        {"functions that call", "calls", EdgeDirection::In, TraversalMode::Direct},
        {"files imported by", "imports", EdgeDirection::Out, TraversalMode::Direct},
        {"modules that import", "imports", EdgeDirection::In, TraversalMode::Direct},
        {"classes which extend", "extends", EdgeDirection::In, TraversalMode::Direct},
        {"subclasses of", "extends", EdgeDirection::In, TraversalMode::Transitive},
        {"ancestors of", "extends", EdgeDirection::Out, TraversalMode::Transitive},
        {"dependencies of", "depends_on", EdgeDirection::Out, TraversalMode::Transitive},
        {"dependents of", "depends_on", EdgeDirection::In, TraversalMode::Transitive},
        {"symbols used by", "uses", EdgeDirection::Out, TraversalMode::Direct},
        {"code that uses", "uses", EdgeDirection::In, TraversalMode::Direct},
    };
    for (const auto& c : cases) {
        auto r = parse(c.phrase + " '" + kMain + "'");
        ASSERT_TRUE(r) << c.phrase << ": " << r.error().message;
        ASSERT_TRUE(r.value().traversal.has_value()) << c.phrase;
        EXPECT_EQ(r.value().traversal->edgeType, c.edge) << c.phrase;
        EXPECT_EQ(r.value().traversal->direction, c.direction) << c.phrase;
        EXPECT_EQ(r.value().traversal->mode, c.mode) << c.phrase;
    }
}

TEST_F(NaturalLanguageParserTest, EarliestRelationWins) {
    const std::string other = "proj/src/b.ts#Function:helper";
    auto r = parse("dependents of " + kMain + " called by " + other);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().traversal->edgeType, "depends_on");
    EXPECT_EQ(r.value().traversal->from, kMain);
}

TEST_F(NaturalLanguageParserTest, InFileAddsCondition) {
    auto r = parse("methods in file src\\app.ts");
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r.value().conditions.size(), 1u);
    EXPECT_EQ(r.value().conditions[0][0].field, "filePath");
    EXPECT_EQ(r.value().conditions[0][0].value, "src/app.ts");
    EXPECT_EQ(r.value().nodeTypes, (std::vector<std::string>{"Method"}));
}

TEST_F(NaturalLanguageParserTest, UnrecognizedQuestionFails) {
    auto r = parse("what is the meaning of life");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::QuerySyntaxError);
    EXPECT_FALSE(parse("functions called by nowhere"));
    EXPECT_FALSE(parse("   "));
}

TEST_F(NaturalLanguageParserTest, OversizedDepthIsSyntaxError) {
    auto r = parse("functions called by " + kMain + " within depth 99999999999");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::QuerySyntaxError);
    EXPECT_NE(r.error().message.find("out of range"), std::string::npos);
}

TEST_F(NaturalLanguageParserTest, QuotedTargetMayContainParenthesis) {
    const std::string target = "proj/src/app.ts#Function:f)";
    auto r = parse("functions called by '" + target + "'");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().traversal->from, target);
}

TEST(QueryDialectTest, Detection) {
    EXPECT_EQ(detectDialect("  SELECT * FROM nodes"), QueryDialect::SQL);
    EXPECT_EQ(detectDialect("match classes"), QueryDialect::SQL);
    EXPECT_EQ(detectDialect("{ nodes }"), QueryDialect::GraphQL);
    EXPECT_EQ(detectDialect("query Q { nodes }"), QueryDialect::GraphQL);
    EXPECT_EQ(detectDialect("query for all classes"), QueryDialect::NaturalLanguage);
    EXPECT_EQ(detectDialect("all functions"), QueryDialect::NaturalLanguage);
}

TEST(QueryDialectTest, NamesRoundTrip) {
    for (auto dialect : {QueryDialect::SQL, QueryDialect::GraphQL, QueryDialect::NaturalLanguage}) {
        auto parsed = dialectFromString(dialectToString(dialect));
        ASSERT_TRUE(parsed);
        EXPECT_EQ(parsed.value(), dialect);
    }
    EXPECT_EQ(dialectFromString("cypher").error().code, ErrorCode::UnsupportedDialect);
}

TEST(NodeTypeWordTest, Plurals) {
    EXPECT_EQ(resolveNodeTypeWord("Functions"), "Function");
    EXPECT_EQ(resolveNodeTypeWord("classes"), "Class");
    EXPECT_EQ(resolveNodeTypeWord("properties"), "Property");
    EXPECT_EQ(resolveNodeTypeWord("tags"), "tag");
    EXPECT_FALSE(resolveNodeTypeWord("gadgets").has_value());
}
