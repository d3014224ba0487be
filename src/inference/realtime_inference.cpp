#include <spdlog/spdlog.h>

#include <deplink/core/uuid.h>
#include <deplink/inference/optimized_inference_engine.h>
#include <deplink/inference/realtime_inference.h>

namespace deplink::inference {

RealtimeInference::RealtimeInference(std::shared_ptr<InferenceEngine> engine,
                                     std::shared_ptr<CustomRuleEngine> rules,
                                     RealtimeInferenceConfig config)
    : engine_(std::move(engine)), rules_(std::move(rules)), config_(std::move(config)),
      autoInference_(config_.enableAutoInference) {}

RealtimeInference::~RealtimeInference() {
    detach();
    updates_.close();
}

std::string RealtimeInference::watch(InferenceWatch watch) {
    auto id = core::generateId("watch");
    std::lock_guard lock(mutex_);
    watches_.emplace(id, std::move(watch));
    return id;
}

Result<void> RealtimeInference::unwatch(const std::string& watchId) {
    std::lock_guard lock(mutex_);
    if (watches_.erase(watchId) == 0)
        return Error{ErrorCode::NotFound, "Watch not found: " + watchId};
    return {};
}

Result<InferenceResult> RealtimeInference::compute(const InferenceWatch& watch) {
    switch (watch.kind) {
        case InferenceKind::Hierarchical:
            return engine_->queryHierarchical(watch.rootId, watch.edgeType, watch.hierarchical);
        case InferenceKind::Transitive:
            return engine_->queryTransitive(watch.rootId, watch.edgeType, watch.transitive);
        case InferenceKind::Inheritable:
            return engine_->queryInheritable(watch.rootId, watch.edgeType, watch.inheritable);
    }
    return Error{ErrorCode::InvalidArgument, "Unknown inference kind"};
}

std::optional<std::string> RealtimeInference::changedNode(const graph::DataChangeEvent& event) const {
    if (!event.record.is_object())
        return std::nullopt;
    if (event.table == "nodes" && event.record.contains("address"))
        return event.record.value("address", "");
    if (event.table == "edges" && event.record.contains("from"))
        return event.record.value("from", "");
    return std::nullopt;
}

void RealtimeInference::processChange(const graph::DataChangeEvent& event) {
    changesProcessed_.fetch_add(1, std::memory_order_relaxed);

    // Keep memoized results honest even when automatic inference is off.
    if (auto* optimized = dynamic_cast<OptimizedInferenceEngine*>(engine_.get()))
        optimized->onDataChange(event);

    if (!autoInference_.load())
        return;

    std::map<std::string, InferenceWatch> watches;
    {
        std::lock_guard lock(mutex_);
        watches = watches_;
    }

    for (const auto& [id, watch] : watches) {
        InferenceUpdate update;
        update.watchId = id;
        update.trigger = event;
        recomputations_.fetch_add(1, std::memory_order_relaxed);
        auto result = compute(watch);
        if (result) {
            update.result = std::move(result).value();
        } else {
            failures_.fetch_add(1, std::memory_order_relaxed);
            update.error = result.error();
            spdlog::warn("[RealtimeInference] watch {} failed: {}", id, result.error().message);
        }
        updates_.emit(update);
    }

    if (!rules_ || event.type == graph::ChangeType::Delete)
        return;
    auto node = changedNode(event);
    if (!node || node->empty())
        return;
    auto report = rules_->execute(*engine_->store(), {config_.ruleIds, *node});
    if (!report) {
        // The node may already be gone again; that is not worth an update.
        if (report.error().code != ErrorCode::NodeNotFound) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("[RealtimeInference] rules on {} failed: {}", *node,
                         report.error().message);
        }
        return;
    }
    if (report.value().edges.empty())
        return;
    InferenceUpdate update;
    update.trigger = event;
    update.ruleEdges = report.value().edges;
    updates_.emit(update);
}

Result<RuleExecutionReport> RealtimeInference::executeInference(
    const std::string& nodeId, const std::vector<std::string>& ruleIds) {
    if (!rules_)
        return Error{ErrorCode::NotInitialized, "No custom rule engine configured"};
    RuleExecutionOptions options;
    options.ruleIds = ruleIds.empty() ? config_.ruleIds : ruleIds;
    options.scopeRoot = nodeId;
    return rules_->execute(*engine_->store(), options);
}

void RealtimeInference::attachTo(core::EventChannel<graph::DataChangeEvent>& changes) {
    detach();
    attached_ = &changes;
    listenerId_ =
        changes.subscribe([this](const graph::DataChangeEvent& event) { processChange(event); });
}

void RealtimeInference::detach() {
    if (attached_) {
        attached_->unsubscribe(listenerId_);
        attached_ = nullptr;
    }
}

RealtimeInferenceStats RealtimeInference::stats() const {
    RealtimeInferenceStats s;
    s.changesProcessed = changesProcessed_.load();
    s.recomputations = recomputations_.load();
    s.failures = failures_.load();
    std::lock_guard lock(mutex_);
    s.watches = watches_.size();
    return s;
}

} // namespace deplink::inference
