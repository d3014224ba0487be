#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>
#include <deplink/inference/custom_rules.h>

namespace deplink::inference {

Result<void> CustomRuleEngine::registerRule(CustomRule rule) {
    if (rule.id.empty())
        return Error{ErrorCode::InvalidArgument, "Rule id must not be empty"};
    if (!rule.predicate || !rule.transform)
        return Error{ErrorCode::InvalidArgument, "Rule " + rule.id + " needs predicate and transform"};

    std::lock_guard lock(mutex_);
    for (const auto& existing : rules_) {
        if (existing.id == rule.id)
            return Error{ErrorCode::InvalidArgument, "Rule already registered: " + rule.id};
    }
    spdlog::debug("[CustomRuleEngine] registered rule {}", rule.id);
    rules_.push_back(std::move(rule));
    return {};
}

Result<void> CustomRuleEngine::unregisterRule(const std::string& ruleId) {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [&](const CustomRule& r) { return r.id == ruleId; });
    if (it == rules_.end())
        return Error{ErrorCode::NotFound, "Rule not found: " + ruleId};
    rules_.erase(it);
    return {};
}

std::vector<std::string> CustomRuleEngine::ruleIds() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& rule : rules_)
        ids.push_back(rule.id);
    return ids;
}

bool CustomRuleEngine::hasRule(const std::string& ruleId) const {
    std::lock_guard lock(mutex_);
    return std::any_of(rules_.begin(), rules_.end(),
                       [&](const CustomRule& r) { return r.id == ruleId; });
}

Result<RuleExecutionReport> CustomRuleEngine::execute(graph::GraphStore& store,
                                                      const RuleExecutionOptions& options) const {
    std::vector<CustomRule> rules;
    {
        std::lock_guard lock(mutex_);
        for (const auto& rule : rules_) {
            if (options.ruleIds.empty() ||
                std::find(options.ruleIds.begin(), options.ruleIds.end(), rule.id) !=
                    options.ruleIds.end()) {
                rules.push_back(rule);
            }
        }
    }

    std::vector<graph::GraphNode> scope;
    if (options.scopeRoot) {
        auto node = store.getNode(*options.scopeRoot);
        if (!node)
            return node.error();
        if (!node.value())
            return Error{ErrorCode::NodeNotFound, "Node not found: " + *options.scopeRoot};
        scope.push_back(*node.value());
    } else {
        auto nodes = store.allNodes();
        if (!nodes)
            return nodes.error();
        scope = std::move(nodes).value();
    }

    RuleExecutionReport report;
    std::unordered_set<std::string> produced;
    for (const auto& rule : rules) {
        ++report.rulesEvaluated;
        bool fired = false;
        for (const auto& node : scope) {
            auto edges = store.getEdges(node.address, std::nullopt, graph::EdgeDirection::Out);
            if (!edges)
                return edges.error();
            for (const auto& edge : edges.value()) {
                graph::GraphEdge inferred;
                try {
                    if (!rule.predicate(node, edge))
                        continue;
                    inferred = rule.transform(node, edge);
                } catch (const std::exception& e) {
                    spdlog::warn("[CustomRuleEngine] rule {} failed on {}: {}", rule.id,
                                 node.address, e.what());
                    report.failures.push_back(rule.id + ": " + e.what());
                    continue;
                }
                if (inferred.from.empty() || inferred.to.empty() || inferred.edgeType.empty()) {
                    report.failures.push_back(rule.id + ": transform produced an incomplete edge");
                    continue;
                }
                int depth = 1;
                if (inferred.provenance && inferred.provenance->depth > 1)
                    depth = inferred.provenance->depth;
                inferred.provenance = graph::EdgeProvenance{rule.id, depth};
                if (inferred.metadata.is_object())
                    inferred.metadata.erase("derivedBy");
                else
                    inferred.metadata = nlohmann::json::object();
                fired = true;
                if (!produced.insert(inferred.key()).second) {
                    ++report.duplicatesDiscarded;
                    continue;
                }
                report.edges.push_back(std::move(inferred));
            }
        }
        if (fired)
            ++report.rulesFired;
    }
    return report;
}

} // namespace deplink::inference
