#include <gtest/gtest.h>

#include <vector>
#include <deplink/inference/realtime_inference.h>

#include "../../common/graph_fixtures.h"

using namespace deplink;
using namespace deplink::inference;
using deplink::test::fn;

class RealtimeInferenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        graph_.chain({fn("a"), fn("b")});
        engine_ = std::make_shared<InferenceEngine>(graph_.store());
        rules_ = std::make_shared<CustomRuleEngine>();
        realtime_ = std::make_unique<RealtimeInference>(engine_, rules_);
        realtime_->updates().subscribe([this](const InferenceUpdate& u) { updates_.push_back(u); });
        realtime_->attachTo(graph_.writer().changes());
    }

    void TearDown() override { realtime_->detach(); }

    test::GraphBuilder graph_;
    std::shared_ptr<InferenceEngine> engine_;
    std::shared_ptr<CustomRuleEngine> rules_;
    std::unique_ptr<RealtimeInference> realtime_;
    std::vector<InferenceUpdate> updates_;
};

TEST_F(RealtimeInferenceTest, WatchRecomputesOnChange) {
    InferenceWatch watch;
    watch.rootId = fn("a");
    watch.edgeType = "calls";
    auto id = realtime_->watch(watch);

    graph_.node(fn("c")).link(fn("b"), fn("c"), "calls");

    ASSERT_FALSE(updates_.empty());
    const auto& last = updates_.back();
    EXPECT_EQ(last.watchId, id);
    ASSERT_TRUE(last.result.has_value());
    EXPECT_EQ(last.result->nodes.size(), 2u);
    EXPECT_EQ(last.trigger.table, "edges");
    EXPECT_EQ(realtime_->stats().watches, 1u);
}

TEST_F(RealtimeInferenceTest, DisabledAutoInferenceSkipsWatches) {
    InferenceWatch watch;
    watch.rootId = fn("a");
    watch.edgeType = "calls";
    realtime_->watch(watch);
    EXPECT_TRUE(realtime_->autoInference());
    realtime_->setAutoInference(false);

    graph_.node(fn("c"));
    EXPECT_TRUE(updates_.empty());
    EXPECT_EQ(realtime_->stats().changesProcessed, 1u);
}

TEST_F(RealtimeInferenceTest, FailingWatchReportsError) {
    InferenceWatch watch;
    watch.rootId = fn("missing");
    watch.edgeType = "calls";
    realtime_->watch(watch);

    graph_.node(fn("c"));
    ASSERT_EQ(updates_.size(), 1u);
    ASSERT_TRUE(updates_[0].error.has_value());
    EXPECT_EQ(updates_[0].error->code, ErrorCode::NodeNotFound);
    EXPECT_EQ(realtime_->stats().failures, 1u);
}

TEST_F(RealtimeInferenceTest, RulesRunForChangedNode) {
    CustomRule rule;
    rule.id = "calls-imply-deps";
    rule.predicate = [](const graph::GraphNode&, const graph::GraphEdge& e) {
        return e.edgeType == "calls";
    };
    rule.transform = [](const graph::GraphNode&, const graph::GraphEdge& e) {
        return test::edge(e.from, e.to, "depends_on");
    };
    ASSERT_TRUE(rules_->registerRule(rule));

    graph_.node(fn("c")).link(fn("b"), fn("c"), "calls");
    ASSERT_FALSE(updates_.empty());
    const auto& last = updates_.back();
    EXPECT_TRUE(last.watchId.empty());
    ASSERT_EQ(last.ruleEdges.size(), 1u);
    EXPECT_EQ(last.ruleEdges[0].from, fn("b"));

    auto direct = realtime_->executeInference(fn("a"));
    ASSERT_TRUE(direct);
    EXPECT_EQ(direct.value().edges.size(), 1u);
}

TEST_F(RealtimeInferenceTest, UnwatchUnknownIsNotFound) {
    EXPECT_EQ(realtime_->unwatch("watch-0").error().code, ErrorCode::NotFound);
}

TEST(RealtimeInferenceNoRulesTest, ExecuteInferenceNeedsRuleEngine) {
    test::GraphBuilder graph;
    RealtimeInference realtime(std::make_shared<InferenceEngine>(graph.store()));
    EXPECT_EQ(realtime.executeInference(fn("a")).error().code, ErrorCode::NotInitialized);
}
