#include <gtest/gtest.h>

#include <algorithm>
#include <deplink/inference/inference_engine.h>

#include "../../common/graph_fixtures.h"

using namespace deplink;
using namespace deplink::inference;
using deplink::test::cls;
using deplink::test::fn;

class InferenceEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        // a -> b -> c -> d
        graph_.chain({fn("a"), fn("b"), fn("c"), fn("d")});
        engine_ = std::make_unique<InferenceEngine>(graph_.store());
    }

    test::GraphBuilder graph_;
    std::unique_ptr<InferenceEngine> engine_;
};

TEST_F(InferenceEngineTest, HierarchicalRespectsDepthBound) {
    HierarchicalOptions options;
    options.maxDepth = 2;
    auto r = engine_->queryHierarchical(fn("a"), "calls", options);
    ASSERT_TRUE(r);
    const auto& result = r.value();
    EXPECT_TRUE(result.completed());
    EXPECT_FALSE(result.partial);

    auto addresses = result.addresses();
    EXPECT_EQ(addresses, (std::vector<std::string>{fn("b"), fn("c")}));
    ASSERT_EQ(result.edges.size(), 2u);
    EXPECT_EQ(result.edges[1].from, fn("a"));
    EXPECT_EQ(result.edges[1].to, fn("c"));
    ASSERT_TRUE(result.edges[1].provenance.has_value());
    EXPECT_EQ(result.edges[1].provenance->derivedBy, "hierarchical");
    EXPECT_EQ(result.edges[1].provenance->depth, 2);
}

TEST_F(InferenceEngineTest, DepthZeroYieldsNothing) {
    HierarchicalOptions options;
    options.maxDepth = 0;
    auto r = engine_->queryHierarchical(fn("a"), "calls", options);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().nodes.empty());
}

TEST_F(InferenceEngineTest, IncomingDirectionWalksCallers) {
    HierarchicalOptions options;
    options.direction = graph::EdgeDirection::In;
    auto r = engine_->queryHierarchical(fn("c"), "calls", options);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().addresses(), (std::vector<std::string>{fn("b"), fn("a")}));
    EXPECT_EQ(r.value().edges[0].to, fn("c"));
}

TEST_F(InferenceEngineTest, CyclesTerminateAndAreCounted) {
    graph_.link(fn("d"), fn("a"), "calls");
    auto r = engine_->queryHierarchical(fn("a"), "calls");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().completed());
    EXPECT_EQ(r.value().nodes.size(), 3u);
    EXPECT_GE(r.value().cyclesDetected, 1u);
}

TEST_F(InferenceEngineTest, IncludeChildrenFollowsRegisteredSubtypes) {
    graph_.node(fn("lib")).link(fn("a"), fn("lib"), "imports");

    HierarchicalOptions withChildren;
    withChildren.maxDepth = 1;
    auto all = engine_->queryHierarchical(fn("a"), "depends_on", withChildren);
    ASSERT_TRUE(all);
    auto addresses = all.value().addresses();
    EXPECT_NE(std::find(addresses.begin(), addresses.end(), fn("b")), addresses.end());
    EXPECT_NE(std::find(addresses.begin(), addresses.end(), fn("lib")), addresses.end());

    HierarchicalOptions exact = withChildren;
    exact.includeChildren = false;
    auto none = engine_->queryHierarchical(fn("a"), "depends_on", exact);
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().nodes.empty());
}

TEST_F(InferenceEngineTest, TransitiveKeepsShortestPath) {
    graph_.link(fn("a"), fn("c"), "calls");
    auto r = engine_->queryTransitive(fn("a"), "calls");
    ASSERT_TRUE(r);
    const auto& result = r.value();
    ASSERT_EQ(result.nodes.size(), 3u);

    auto d = std::find_if(result.edges.begin(), result.edges.end(),
                          [](const graph::GraphEdge& e) { return e.to == fn("d"); });
    ASSERT_NE(d, result.edges.end());
    EXPECT_EQ(d->provenance->depth, 2);
    EXPECT_EQ(d->metadata["path"], (std::vector<std::string>{fn("a"), fn("c"), fn("d")}));
}

TEST_F(InferenceEngineTest, TransitiveWithoutIntermediatesKeepsLeaves) {
    TransitiveOptions options;
    options.includeIntermediate = false;
    auto r = engine_->queryTransitive(fn("a"), "calls", options);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().addresses(), (std::vector<std::string>{fn("d")}));
}

TEST_F(InferenceEngineTest, DanglingEdgesAreSkipped) {
    graph_.link(fn("a"), fn("ghost"), "calls");
    auto r = engine_->queryHierarchical(fn("a"), "calls");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().danglingEdges, 1u);
    EXPECT_EQ(r.value().nodes.size(), 3u);
}

TEST_F(InferenceEngineTest, InheritableCollectsNearestAncestorFirst) {
    graph_.node(cls("Base")).node(cls("Mid")).node(cls("Leaf")).node(cls("Logger"));
    graph_.link(cls("Leaf"), cls("Mid"), "extends");
    graph_.link(cls("Mid"), cls("Base"), "extends");
    graph_.link(cls("Base"), cls("Logger"), "uses");
    graph_.link(cls("Mid"), cls("Logger"), "uses");

    auto r = engine_->queryInheritable(cls("Leaf"), "uses");
    ASSERT_TRUE(r);
    const auto& edges = r.value().edges;
    ASSERT_EQ(edges.size(), 1u);
    EXPECT_EQ(edges[0].from, cls("Leaf"));
    EXPECT_EQ(edges[0].to, cls("Logger"));
    EXPECT_EQ(edges[0].metadata["source"], cls("Mid"));
    EXPECT_EQ(edges[0].provenance->derivedBy, "inheritance");
    EXPECT_EQ(edges[0].provenance->depth, 1);
}

TEST_F(InferenceEngineTest, InheritableWithoutInheritanceReturnsOwnEdges) {
    graph_.node(cls("Leaf")).node(cls("Base")).node(cls("Logger"));
    graph_.link(cls("Leaf"), cls("Base"), "extends");
    graph_.link(cls("Base"), cls("Logger"), "uses");

    InheritableOptions options;
    options.includeInherited = false;
    auto r = engine_->queryInheritable(cls("Leaf"), "uses", options);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().edges.empty());
}

TEST_F(InferenceEngineTest, UnknownRootIsNodeNotFound) {
    auto r = engine_->queryHierarchical(fn("missing"), "calls");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NodeNotFound);
    EXPECT_EQ(engine_->queryTransitive(fn("missing"), "calls").error().code,
              ErrorCode::NodeNotFound);
}

TEST_F(InferenceEngineTest, NegativeDepthIsInvalid) {
    HierarchicalOptions options;
    options.maxDepth = -1;
    EXPECT_EQ(engine_->queryHierarchical(fn("a"), "calls", options).error().code,
              ErrorCode::InvalidArgument);
}

TEST_F(InferenceEngineTest, ExpiredDeadlineYieldsPartialResult) {
    HierarchicalOptions options;
    options.deadline = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
    auto r = engine_->queryHierarchical(fn("a"), "calls", options);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().partial);
    EXPECT_EQ(r.value().state, InferenceState::TimedOut);
}

TEST_F(InferenceEngineTest, InferAllSkipsUnknownTypes) {
    auto r = engine_->inferAll(fn("a"), {"calls", "no_such_type", "depends_on"});
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().skippedTypes, (std::vector<std::string>{"no_such_type"}));
    EXPECT_EQ(r.value().statistics.hierarchical, 6u);
    // depends_on is transitive but only calls edges exist
    EXPECT_EQ(r.value().statistics.transitive, 0u);
}

TEST_F(InferenceEngineTest, ValidateFindsTransitiveCycles) {
    auto clean = engine_->validate();
    ASSERT_TRUE(clean);
    EXPECT_TRUE(clean.value().valid);

    graph_.link(fn("a"), fn("b"), "depends_on").link(fn("b"), fn("a"), "depends_on");
    auto dirty = engine_->validate();
    ASSERT_TRUE(dirty);
    EXPECT_FALSE(dirty.value().valid);
    EXPECT_FALSE(dirty.value().warnings.empty());
}
