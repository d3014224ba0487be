#pragma once

#include <deplink/core/types.h>
#include <deplink/graph/graph_store.h>

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace deplink::inference {

/**
 * A user-defined inference rule. predicate selects (node, outgoing edge)
 * pairs; transform turns a selected pair into the inferred edge. The engine
 * stamps provenance on whatever transform returns.
 */
struct CustomRule {
    std::string id;
    std::string description;
    std::function<bool(const graph::GraphNode&, const graph::GraphEdge&)> predicate;
    std::function<graph::GraphEdge(const graph::GraphNode&, const graph::GraphEdge&)> transform;
};

struct RuleExecutionReport {
    std::vector<graph::GraphEdge> edges;
    std::size_t rulesEvaluated = 0;
    std::size_t rulesFired = 0;
    std::size_t duplicatesDiscarded = 0;
    std::vector<std::string> failures;
};

struct RuleExecutionOptions {
    std::vector<std::string> ruleIds;       ///< allow-list; empty runs every rule
    std::optional<std::string> scopeRoot;   ///< only this node's outgoing edges
};

/**
 * Ordered rule set. Rules run in registration order; when two rules infer the
 * same (from, to, edgeType) the earlier one wins.
 */
class CustomRuleEngine {
public:
    Result<void> registerRule(CustomRule rule);
    Result<void> unregisterRule(const std::string& ruleId);

    std::vector<std::string> ruleIds() const;
    bool hasRule(const std::string& ruleId) const;

    Result<RuleExecutionReport> execute(graph::GraphStore& store,
                                        const RuleExecutionOptions& options = {}) const;

private:
    mutable std::mutex mutex_;
    std::vector<CustomRule> rules_;
};

} // namespace deplink::inference
