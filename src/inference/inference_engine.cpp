#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <map>
#include <set>
#include <deplink/inference/inference_engine.h>

namespace deplink::inference {

using graph::EdgeDirection;
using graph::EdgeProvenance;
using graph::GraphEdge;

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

void finish(InferenceResult& result, bool timedOut, Clock::time_point start) {
    result.state = timedOut ? InferenceState::TimedOut : InferenceState::Completed;
    result.partial = timedOut;
    result.elapsed = since(start);
}

} // namespace

// ---------------------------------------------------------------------------
// TraversalState

InferenceEngine::TraversalState::TraversalState(const std::string& root) {
    visited_.emplace(root, Visit{0, {root}});
}

bool InferenceEngine::TraversalState::isVisited(const std::string& address) const {
    std::lock_guard lock(mutex_);
    return visited_.contains(address);
}

bool InferenceEngine::TraversalState::claim(const std::string& address, int depth,
                                            const std::vector<std::string>& parentPath) {
    std::lock_guard lock(mutex_);
    auto it = visited_.find(address);
    if (it == visited_.end()) {
        auto path = parentPath;
        path.push_back(address);
        visited_.emplace(address, Visit{depth, std::move(path)});
        claimOrder_.push_back(address);
        return true;
    }
    auto& visit = it->second;
    if (visit.depth == depth && visit.path.size() >= 2 &&
        parentPath.back() < visit.path[visit.path.size() - 2]) {
        visit.path = parentPath;
        visit.path.push_back(address);
    }
    return false;
}

std::vector<InferenceEngine::FrontierEntry>
InferenceEngine::TraversalState::takeLevel(int depth) {
    std::lock_guard lock(mutex_);
    std::vector<FrontierEntry> level;
    for (const auto& address : claimOrder_) {
        const auto& visit = visited_.at(address);
        if (visit.depth == depth)
            level.push_back(FrontierEntry{address, visit.path});
    }
    std::sort(level.begin(), level.end(),
              [](const FrontierEntry& a, const FrontierEntry& b) { return a.address < b.address; });
    return level;
}

std::vector<InferredNode> InferenceEngine::TraversalState::collected() const {
    std::lock_guard lock(mutex_);
    std::vector<InferredNode> nodes;
    nodes.reserve(claimOrder_.size());
    for (const auto& address : claimOrder_) {
        const auto& visit = visited_.at(address);
        nodes.push_back(InferredNode{address, visit.depth, visit.path});
    }
    std::sort(nodes.begin(), nodes.end(), [](const InferredNode& a, const InferredNode& b) {
        return a.depth != b.depth ? a.depth < b.depth : a.address < b.address;
    });
    return nodes;
}

// ---------------------------------------------------------------------------
// InferenceEngine

InferenceEngine::InferenceEngine(std::shared_ptr<graph::GraphStore> store,
                                 InferenceEngineConfig config, EdgeTypeRegistry registry)
    : store_(std::move(store)), config_(config), registry_(std::move(registry)) {}

bool InferenceEngine::expired(const std::optional<SteadyTimePoint>& deadline) {
    return deadline && Clock::now() >= *deadline;
}

Result<void> InferenceEngine::requireNode(const std::string& address) {
    auto node = store_->getNode(address);
    if (!node)
        return node.error();
    if (!node.value())
        return Error{ErrorCode::NodeNotFound, "Node not found: " + address};
    return {};
}

Result<void> InferenceEngine::expandEntry(const FrontierEntry& entry, int depth,
                                          const TraversalSpec& spec, TraversalState& state) {
    if (expired(spec.deadline)) {
        state.timedOut.store(true);
        return {};
    }

    std::optional<std::string_view> typeFilter;
    if (spec.edgeTypes.size() == 1)
        typeFilter = spec.edgeTypes.front();
    auto edges = store_->getEdges(entry.address, typeFilter, spec.direction);
    if (!edges)
        return edges.error();

    std::vector<std::string> neighbors;
    for (const auto& edge : edges.value()) {
        if (spec.edgeTypes.size() > 1 &&
            std::find(spec.edgeTypes.begin(), spec.edgeTypes.end(), edge.edgeType) ==
                spec.edgeTypes.end()) {
            continue;
        }
        state.edgesTraversed.fetch_add(1, std::memory_order_relaxed);
        neighbors.push_back(spec.direction == EdgeDirection::Out ? edge.to : edge.from);
    }
    std::sort(neighbors.begin(), neighbors.end());
    neighbors.erase(std::unique(neighbors.begin(), neighbors.end()), neighbors.end());

    for (const auto& neighbor : neighbors) {
        if (std::find(entry.path.begin(), entry.path.end(), neighbor) != entry.path.end()) {
            state.cycles.fetch_add(1, std::memory_order_relaxed);
            if (config_.enableCycleDetection) {
                spdlog::debug("[InferenceEngine] cycle via {} -> {} (root {})", entry.address,
                              neighbor, spec.rootId);
            }
            continue;
        }
        if (state.isVisited(neighbor)) {
            state.claim(neighbor, depth, entry.path);
            continue;
        }
        auto node = store_->getNode(neighbor);
        if (!node)
            return node.error();
        if (!node.value()) {
            state.dangling.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        state.claim(neighbor, depth, entry.path);
    }
    return {};
}

Result<void> InferenceEngine::expandLevel(const std::vector<FrontierEntry>& frontier, int depth,
                                          const TraversalSpec& spec, TraversalState& state) {
    for (const auto& entry : frontier) {
        if (state.timedOut.load())
            break;
        if (auto r = expandEntry(entry, depth, spec, state); !r)
            return r;
    }
    return {};
}

Result<InferenceEngine::TraversalOutcome> InferenceEngine::traverse(const TraversalSpec& spec) {
    TraversalState state(spec.rootId);
    std::vector<FrontierEntry> frontier{FrontierEntry{spec.rootId, {spec.rootId}}};

    for (int depth = 1; depth <= spec.maxDepth && !frontier.empty(); ++depth) {
        if (expired(spec.deadline)) {
            state.timedOut.store(true);
            break;
        }
        if (auto r = expandLevel(frontier, depth, spec, state); !r)
            return r.error();
        if (state.timedOut.load())
            break;
        frontier = state.takeLevel(depth);
    }

    TraversalOutcome outcome;
    outcome.nodes = state.collected();
    outcome.cyclesDetected = state.cycles.load();
    outcome.edgesTraversed = state.edgesTraversed.load();
    outcome.danglingEdges = state.dangling.load();
    outcome.timedOut = state.timedOut.load();
    return outcome;
}

Result<InferenceResult> InferenceEngine::queryHierarchical(const std::string& rootId,
                                                           const std::string& edgeType,
                                                           const HierarchicalOptions& options) {
    const auto start = Clock::now();
    if (options.maxDepth < 0)
        return Error{ErrorCode::InvalidArgument, "maxDepth must be >= 0"};

    InferenceResult result;
    result.kind = InferenceKind::Hierarchical;
    result.rootId = rootId;
    result.edgeType = edgeType;
    if (auto r = requireNode(rootId); !r)
        return r.error();
    result.state = InferenceState::Traversing;

    TraversalSpec spec;
    spec.rootId = rootId;
    spec.edgeTypes = options.includeChildren ? registry_.expandWithDescendants(edgeType)
                                             : std::vector<std::string>{edgeType};
    spec.direction = options.direction;
    spec.maxDepth = options.maxDepth;
    spec.deadline = options.deadline;

    auto outcome = traverse(spec);
    if (!outcome) {
        spdlog::error("[InferenceEngine] hierarchical {} from {} failed: {}", edgeType, rootId,
                      outcome.error().message);
        return outcome.error();
    }

    auto& traversal = outcome.value();
    result.nodes = traversal.nodes;
    for (const auto& node : traversal.nodes)
        result.visited.push_back(node.address);
    for (const auto& node : result.nodes) {
        GraphEdge edge;
        edge.from = options.direction == EdgeDirection::Out ? rootId : node.address;
        edge.to = options.direction == EdgeDirection::Out ? node.address : rootId;
        edge.edgeType = edgeType;
        edge.provenance = EdgeProvenance{"hierarchical", node.depth};
        result.edges.push_back(std::move(edge));
    }
    result.cyclesDetected = traversal.cyclesDetected;
    result.edgesTraversed = traversal.edgesTraversed;
    result.danglingEdges = traversal.danglingEdges;
    finish(result, traversal.timedOut, start);
    spdlog::debug("[InferenceEngine] hierarchical {} from {}: {} nodes ({})", edgeType, rootId,
                  result.nodes.size(), inferenceStateToString(result.state));
    return result;
}

Result<InferenceResult> InferenceEngine::queryTransitive(const std::string& rootId,
                                                         const std::string& edgeType,
                                                         const TransitiveOptions& options) {
    const auto start = Clock::now();
    if (options.maxPathLength < 0)
        return Error{ErrorCode::InvalidArgument, "maxPathLength must be >= 0"};

    InferenceResult result;
    result.kind = InferenceKind::Transitive;
    result.rootId = rootId;
    result.edgeType = edgeType;
    if (auto r = requireNode(rootId); !r)
        return r.error();
    result.state = InferenceState::Traversing;

    TraversalSpec spec;
    spec.rootId = rootId;
    spec.edgeTypes = {edgeType};
    spec.direction = EdgeDirection::Out;
    spec.maxDepth = options.maxPathLength;
    spec.deadline = options.deadline;

    auto outcome = traverse(spec);
    if (!outcome) {
        spdlog::error("[InferenceEngine] transitive {} from {} failed: {}", edgeType, rootId,
                      outcome.error().message);
        return outcome.error();
    }
    auto& traversal = outcome.value();

    for (auto& node : traversal.nodes) {
        result.visited.push_back(node.address);
        if (!options.includeIntermediate) {
            auto next = store_->getEdges(node.address, std::string_view(edgeType), EdgeDirection::Out);
            if (!next)
                return next.error();
            if (!next.value().empty())
                continue;
        }
        GraphEdge edge;
        edge.from = rootId;
        edge.to = node.address;
        edge.edgeType = edgeType;
        edge.metadata["path"] = node.path;
        edge.provenance = EdgeProvenance{"transitive", node.depth};
        result.edges.push_back(std::move(edge));
        result.nodes.push_back(std::move(node));
    }
    result.cyclesDetected = traversal.cyclesDetected;
    result.edgesTraversed = traversal.edgesTraversed;
    result.danglingEdges = traversal.danglingEdges;
    finish(result, traversal.timedOut, start);
    return result;
}

Result<InferenceResult> InferenceEngine::queryInheritable(const std::string& rootId,
                                                          const std::string& edgeType,
                                                          const InheritableOptions& options) {
    const auto start = Clock::now();
    if (options.maxInheritanceDepth < 0)
        return Error{ErrorCode::InvalidArgument, "maxInheritanceDepth must be >= 0"};

    InferenceResult result;
    result.kind = InferenceKind::Inheritable;
    result.rootId = rootId;
    result.edgeType = edgeType;
    if (auto r = requireNode(rootId); !r)
        return r.error();
    result.state = InferenceState::Traversing;

    auto own = store_->getEdges(rootId, std::string_view(edgeType), EdgeDirection::Out);
    if (!own)
        return own.error();

    std::set<std::string> reached{rootId};
    for (const auto& edge : own.value()) {
        reached.insert(edge.to);
        result.edges.push_back(edge);
    }

    bool timedOut = false;
    if (options.includeInherited && options.maxInheritanceDepth > 0) {
        TraversalSpec spec;
        spec.rootId = rootId;
        spec.edgeTypes = {"extends", "implements"};
        spec.direction = EdgeDirection::Out;
        spec.maxDepth = options.maxInheritanceDepth;
        spec.deadline = options.deadline;

        auto chain = traverse(spec);
        if (!chain)
            return chain.error();
        auto& traversal = chain.value();
        timedOut = traversal.timedOut;
        result.cyclesDetected = traversal.cyclesDetected;
        result.edgesTraversed = traversal.edgesTraversed;
        result.danglingEdges = traversal.danglingEdges;

        for (const auto& ancestor : traversal.nodes)
            result.visited.push_back(ancestor.address);

        // Nearest ancestor first: collected() is ordered by depth, then address.
        for (const auto& ancestor : traversal.nodes) {
            if (expired(options.deadline)) {
                timedOut = true;
                break;
            }
            auto inherited =
                store_->getEdges(ancestor.address, std::string_view(edgeType), EdgeDirection::Out);
            if (!inherited)
                return inherited.error();
            for (const auto& source : inherited.value()) {
                if (!reached.insert(source.to).second)
                    continue;
                GraphEdge edge;
                edge.from = rootId;
                edge.to = source.to;
                edge.edgeType = edgeType;
                edge.metadata["source"] = ancestor.address;
                edge.metadata["inheritanceDepth"] = ancestor.depth;
                edge.provenance = EdgeProvenance{"inheritance", ancestor.depth};
                result.edges.push_back(std::move(edge));
            }
            result.nodes.push_back(ancestor);
        }
    }

    finish(result, timedOut, start);
    return result;
}

Result<InferAllResult> InferenceEngine::inferAll(const std::string& rootId,
                                                 const std::vector<std::string>& edgeTypes) {
    const auto start = Clock::now();
    if (auto r = requireNode(rootId); !r)
        return r.error();

    std::vector<std::string> types = edgeTypes;
    if (types.empty()) {
        for (const auto& definition : registry_.all())
            types.push_back(definition.type);
    }

    InferAllResult all;
    for (const auto& type : types) {
        auto definition = registry_.get(type);
        if (!definition) {
            all.skippedTypes.push_back(type);
            continue;
        }

        HierarchicalOptions hierarchical;
        hierarchical.maxDepth = config_.defaultMaxDepth;
        auto h = queryHierarchical(rootId, type, hierarchical);
        if (!h) {
            spdlog::warn("[InferenceEngine] inference failed for type '{}': {}", type,
                         h.error().message);
            all.skippedTypes.push_back(type);
            continue;
        }
        all.statistics.hierarchical += h.value().edges.size();
        all.edges.insert(all.edges.end(), h.value().edges.begin(), h.value().edges.end());

        if (definition->isTransitive) {
            TransitiveOptions transitive;
            transitive.maxPathLength = config_.defaultMaxDepth;
            auto t = queryTransitive(rootId, type, transitive);
            if (!t) {
                spdlog::warn("[InferenceEngine] transitive inference failed for '{}': {}", type,
                             t.error().message);
                all.skippedTypes.push_back(type);
                continue;
            }
            all.statistics.transitive += t.value().edges.size();
            all.edges.insert(all.edges.end(), t.value().edges.begin(), t.value().edges.end());
        }
    }
    all.elapsed = since(start);
    return all;
}

Result<ValidationResult> InferenceEngine::validate() {
    ValidationResult validation;
    auto hierarchy = registry_.validateHierarchy();
    validation.errors = hierarchy.errors;

    auto edges = store_->allEdges();
    if (!edges)
        return edges.error();

    for (const auto& definition : registry_.all()) {
        if (!definition.isTransitive)
            continue;
        ++validation.validatedCount;

        std::map<std::string, std::vector<std::string>> adjacency;
        for (const auto& edge : edges.value()) {
            if (edge.edgeType == definition.type)
                adjacency[edge.from].push_back(edge.to);
        }
        for (auto& [from, targets] : adjacency)
            std::sort(targets.begin(), targets.end());

        std::vector<std::vector<std::string>> cycles;
        std::vector<std::string> path;
        std::set<std::string> onPath;
        std::function<void(const std::string&, const std::string&)> search =
            [&](const std::string& origin, const std::string& current) {
                if (cycles.size() >= config_.maxReportedCycles ||
                    static_cast<int>(path.size()) > config_.maxCycleSearchDepth) {
                    return;
                }
                auto it = adjacency.find(current);
                if (it == adjacency.end())
                    return;
                for (const auto& next : it->second) {
                    if (next == origin) {
                        auto cycle = path;
                        cycle.push_back(origin);
                        cycles.push_back(std::move(cycle));
                        if (cycles.size() >= config_.maxReportedCycles)
                            return;
                        continue;
                    }
                    if (onPath.contains(next))
                        continue;
                    path.push_back(next);
                    onPath.insert(next);
                    search(origin, next);
                    onPath.erase(next);
                    path.pop_back();
                }
            };

        for (const auto& [origin, targets] : adjacency) {
            path = {origin};
            onPath = {origin};
            search(origin, origin);
            if (cycles.size() >= config_.maxReportedCycles)
                break;
        }

        if (!cycles.empty()) {
            validation.errors.push_back("Circular reference detected in '" + definition.type +
                                        "': " + std::to_string(cycles.size()) + " cycles found");
            for (std::size_t i = 0; i < cycles.size() && i < 5; ++i) {
                std::string line = "  Cycle: ";
                for (std::size_t j = 0; j < cycles[i].size(); ++j) {
                    if (j > 0)
                        line += " -> ";
                    line += cycles[i][j];
                }
                validation.warnings.push_back(std::move(line));
            }
            if (cycles.size() > 5) {
                validation.warnings.push_back("  ... and " + std::to_string(cycles.size() - 5) +
                                              " more cycles");
            }
        }
    }

    validation.valid = validation.errors.empty();
    return validation;
}

} // namespace deplink::inference
