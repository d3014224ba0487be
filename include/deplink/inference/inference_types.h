#pragma once

#include <deplink/core/types.h>
#include <deplink/graph/graph_types.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace deplink::inference {

enum class InferenceKind { Hierarchical, Transitive, Inheritable };

// Pending -> Traversing -> {Completed | TimedOut | Failed}
enum class InferenceState { Pending, Traversing, Completed, TimedOut, Failed };

const char* inferenceKindToString(InferenceKind kind) noexcept;
const char* inferenceStateToString(InferenceState state) noexcept;

struct HierarchicalOptions {
    bool includeChildren = true; ///< Also follow registered child edge types
    int maxDepth = 10;           ///< Inclusive; depth 0 is the root
    graph::EdgeDirection direction = graph::EdgeDirection::Out;
    std::optional<SteadyTimePoint> deadline;
};

struct TransitiveOptions {
    int maxPathLength = 10;
    bool includeIntermediate = true;
    std::optional<SteadyTimePoint> deadline;
};

struct InheritableOptions {
    bool includeInherited = true;
    int maxInheritanceDepth = 5;
    std::optional<SteadyTimePoint> deadline;
};

struct InferredNode {
    std::string address;
    int depth = 0;
    std::vector<std::string> path; ///< root .. address, inclusive
};

struct InferenceResult {
    InferenceKind kind = InferenceKind::Hierarchical;
    InferenceState state = InferenceState::Pending;
    std::string rootId;
    std::string edgeType;
    std::vector<InferredNode> nodes;
    std::vector<graph::GraphEdge> edges;
    std::vector<std::string> visited; ///< Every node the traversal reached, filtered or not
    bool partial = false;
    std::size_t cyclesDetected = 0;
    std::size_t edgesTraversed = 0;
    std::size_t danglingEdges = 0;
    std::chrono::milliseconds elapsed{0};

    bool completed() const noexcept { return state == InferenceState::Completed; }

    std::vector<std::string> addresses() const;

    nlohmann::json toJson() const;
};

struct InferenceStatistics {
    std::size_t hierarchical = 0;
    std::size_t transitive = 0;
    std::size_t inheritable = 0;
};

struct InferAllResult {
    std::vector<graph::GraphEdge> edges;
    InferenceStatistics statistics;
    std::vector<std::string> skippedTypes;
    std::chrono::milliseconds elapsed{0};
};

struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::size_t validatedCount = 0;
};

struct InferenceEngineConfig {
    int defaultMaxDepth = 10;
    int maxCycleSearchDepth = 50;
    std::size_t maxReportedCycles = 100;
    bool enableCycleDetection = true;

    // Used by OptimizedInferenceEngine
    bool enableCache = true;
    std::size_t cacheCapacity = 2000;
    bool enableParallel = false;
    std::size_t maxConcurrency = 4;
};

} // namespace deplink::inference
