#pragma once

#include <deplink/core/event_channel.h>
#include <deplink/core/types.h>
#include <deplink/inference/custom_rules.h>
#include <deplink/inference/inference_engine.h>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace deplink::inference {

struct RealtimeInferenceConfig {
    bool enableAutoInference = true;
    std::vector<std::string> ruleIds; ///< allow-list for custom rules; empty allows all
};

/**
 * A standing inference request recomputed whenever the graph changes.
 */
struct InferenceWatch {
    InferenceKind kind = InferenceKind::Hierarchical;
    std::string rootId;
    std::string edgeType;
    HierarchicalOptions hierarchical;
    TransitiveOptions transitive;
    InheritableOptions inheritable;
};

struct InferenceUpdate {
    std::string watchId; ///< empty for rule-only updates
    std::optional<InferenceResult> result;
    std::optional<Error> error;
    std::vector<graph::GraphEdge> ruleEdges;
    graph::DataChangeEvent trigger;
};

struct RealtimeInferenceStats {
    std::uint64_t changesProcessed = 0;
    std::uint64_t recomputations = 0;
    std::uint64_t failures = 0;
    std::size_t watches = 0;
};

/**
 * Runs inference in response to change notifications instead of one-shot
 * calls. Inferred edges are published on updates(); nothing is written back
 * to the store.
 */
class RealtimeInference {
public:
    RealtimeInference(std::shared_ptr<InferenceEngine> engine,
                      std::shared_ptr<CustomRuleEngine> rules = nullptr,
                      RealtimeInferenceConfig config = {});
    ~RealtimeInference();

    RealtimeInference(const RealtimeInference&) = delete;
    RealtimeInference& operator=(const RealtimeInference&) = delete;

    std::string watch(InferenceWatch watch);
    Result<void> unwatch(const std::string& watchId);

    void processChange(const graph::DataChangeEvent& event);

    /// One-shot run of the allowed rules scoped to nodeId.
    Result<RuleExecutionReport> executeInference(const std::string& nodeId,
                                                 const std::vector<std::string>& ruleIds = {});

    core::EventChannel<InferenceUpdate>& updates() noexcept { return updates_; }

    /// Subscribes to a change channel (a GraphWriter's or a RealtimeQuerySystem's).
    /// The channel must outlive this object or detach() must be called first.
    void attachTo(core::EventChannel<graph::DataChangeEvent>& changes);
    void detach();

    void setAutoInference(bool enabled) noexcept { autoInference_.store(enabled); }
    bool autoInference() const noexcept { return autoInference_.load(); }

    RealtimeInferenceStats stats() const;

private:
    Result<InferenceResult> compute(const InferenceWatch& watch);
    std::optional<std::string> changedNode(const graph::DataChangeEvent& event) const;

    std::shared_ptr<InferenceEngine> engine_;
    std::shared_ptr<CustomRuleEngine> rules_;
    RealtimeInferenceConfig config_;
    std::atomic<bool> autoInference_;

    mutable std::mutex mutex_;
    std::map<std::string, InferenceWatch> watches_;

    core::EventChannel<InferenceUpdate> updates_{"inference-updates"};
    core::EventChannel<graph::DataChangeEvent>* attached_ = nullptr;
    core::EventChannel<graph::DataChangeEvent>::ListenerId listenerId_ = 0;

    std::atomic<std::uint64_t> changesProcessed_{0};
    std::atomic<std::uint64_t> recomputations_{0};
    std::atomic<std::uint64_t> failures_{0};
};

} // namespace deplink::inference
