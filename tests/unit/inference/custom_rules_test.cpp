#include <gtest/gtest.h>

#include <stdexcept>
#include <deplink/inference/custom_rules.h>

#include "../../common/graph_fixtures.h"

using namespace deplink;
using namespace deplink::inference;
using deplink::test::fn;

namespace {

// Turns every "calls" edge into an edge of the given type.
CustomRule callsTo(const std::string& id, const std::string& type) {
    CustomRule rule;
    rule.id = id;
    rule.predicate = [](const graph::GraphNode&, const graph::GraphEdge& e) {
        return e.edgeType == "calls";
    };
    rule.transform = [type](const graph::GraphNode&, const graph::GraphEdge& e) {
        return test::edge(e.from, e.to, type);
    };
    return rule;
}

} // namespace

class CustomRuleEngineTest : public ::testing::Test {
protected:
    void SetUp() override { graph_.chain({fn("a"), fn("b"), fn("c")}); }

    test::GraphBuilder graph_;
    CustomRuleEngine rules_;
};

TEST_F(CustomRuleEngineTest, RegisterValidates) {
    EXPECT_TRUE(rules_.registerRule(callsTo("r1", "depends_on")));
    EXPECT_FALSE(rules_.registerRule(callsTo("r1", "uses")));
    EXPECT_FALSE(rules_.registerRule(CustomRule{"", "", {}, {}}));
    EXPECT_FALSE(rules_.registerRule(CustomRule{"r2", "", {}, {}}));
    EXPECT_EQ(rules_.ruleIds(), (std::vector<std::string>{"r1"}));
    EXPECT_TRUE(rules_.hasRule("r1"));

    EXPECT_TRUE(rules_.unregisterRule("r1"));
    EXPECT_FALSE(rules_.hasRule("r1"));
    EXPECT_EQ(rules_.unregisterRule("r1").error().code, ErrorCode::NotFound);
}

TEST_F(CustomRuleEngineTest, StampsProvenance) {
    ASSERT_TRUE(rules_.registerRule(callsTo("calls-imply-deps", "depends_on")));
    auto report = rules_.execute(*graph_.store());
    ASSERT_TRUE(report);
    ASSERT_EQ(report.value().edges.size(), 2u);
    for (const auto& e : report.value().edges) {
        ASSERT_TRUE(e.isInferred());
        EXPECT_EQ(e.provenance->derivedBy, "calls-imply-deps");
        EXPECT_EQ(e.provenance->depth, 1);
    }
    EXPECT_EQ(report.value().rulesFired, 1u);
}

TEST_F(CustomRuleEngineTest, FirstRegisteredRuleWins) {
    ASSERT_TRUE(rules_.registerRule(callsTo("first", "depends_on")));
    ASSERT_TRUE(rules_.registerRule(callsTo("second", "depends_on")));

    auto report = rules_.execute(*graph_.store());
    ASSERT_TRUE(report);
    ASSERT_EQ(report.value().edges.size(), 2u);
    EXPECT_EQ(report.value().edges[0].provenance->derivedBy, "first");
    EXPECT_EQ(report.value().duplicatesDiscarded, 2u);
}

TEST_F(CustomRuleEngineTest, AllowListAndScope) {
    ASSERT_TRUE(rules_.registerRule(callsTo("deps", "depends_on")));
    ASSERT_TRUE(rules_.registerRule(callsTo("uses", "uses")));

    RuleExecutionOptions options;
    options.ruleIds = {"uses"};
    options.scopeRoot = fn("b");
    auto report = rules_.execute(*graph_.store(), options);
    ASSERT_TRUE(report);
    ASSERT_EQ(report.value().edges.size(), 1u);
    EXPECT_EQ(report.value().edges[0].from, fn("b"));
    EXPECT_EQ(report.value().edges[0].edgeType, "uses");
    EXPECT_EQ(report.value().rulesEvaluated, 1u);

    options.scopeRoot = fn("missing");
    EXPECT_EQ(rules_.execute(*graph_.store(), options).error().code, ErrorCode::NodeNotFound);
}

TEST_F(CustomRuleEngineTest, ThrowingRuleIsReported) {
    CustomRule bad = callsTo("bad", "uses");
    bad.transform = [](const graph::GraphNode&, const graph::GraphEdge&) -> graph::GraphEdge {
        throw std::runtime_error("nope");
    };
    ASSERT_TRUE(rules_.registerRule(bad));
    ASSERT_TRUE(rules_.registerRule(callsTo("good", "uses")));

    auto report = rules_.execute(*graph_.store());
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().failures.size(), 2u);
    EXPECT_EQ(report.value().edges.size(), 2u);
}
