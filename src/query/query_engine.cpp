#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <deplink/graph/address.h>
#include <deplink/query/query_engine.h>
#include <deplink/query/query_parser.h>

namespace deplink::query {

using graph::EdgeDirection;
using graph::GraphNode;
using graph::GraphStore;

namespace {

using Clock = std::chrono::steady_clock;

bool expired(const QueryOptions& options) {
    return options.deadline && Clock::now() >= *options.deadline;
}

std::string storeKey(const std::shared_ptr<GraphStore>& store) {
    return std::to_string(store->instanceId());
}

} // namespace

nlohmann::json QueryResult::toJson() const {
    return {{"dialect", dialectToString(dialect)},
            {"rows", rows},
            {"totalMatched", totalMatched},
            {"partial", partial},
            {"fromCache", fromCache},
            {"executionTimeMs", executionTime.count()}};
}

const char* cacheActionToString(CacheAction action) noexcept {
    switch (action) {
        case CacheAction::Clear:
            return "clear";
        case CacheAction::Stats:
            return "stats";
        case CacheAction::Optimize:
            return "optimize";
    }
    return "stats";
}

Result<CacheAction> cacheActionFromString(std::string_view action) {
    std::string lower(action);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "clear")
        return CacheAction::Clear;
    if (lower == "stats")
        return CacheAction::Stats;
    if (lower == "optimize")
        return CacheAction::Optimize;
    return Error{ErrorCode::InvalidArgument,
                 "Unknown cache action '" + std::string(action) +
                     "' (expected clear, stats or optimize)"};
}

nlohmann::json CacheReport::toJson() const {
    return {{"action", action},   {"entries", entries}, {"hits", hits},
            {"misses", misses},   {"hitRate", hitRate}, {"evicted", evicted},
            {"expired", expired}};
}

QueryEngine::QueryEngine(QueryEngineConfig config,
                         std::shared_ptr<inference::InferenceEngine> inference)
    : config_(std::move(config)), cache_(config_.cache), inference_(std::move(inference)) {}

QueryEngine::~QueryEngine() {
    detach();
}

Result<QueryResult> QueryEngine::executeSQLQuery(const std::string& text,
                                                 const std::shared_ptr<GraphStore>& dataSource,
                                                 const QueryOptions& options) {
    return execute(QueryDialect::SQL, text, dataSource, options);
}

Result<QueryResult>
QueryEngine::executeGraphQLQuery(const std::string& text,
                                 const std::shared_ptr<GraphStore>& dataSource,
                                 const QueryOptions& options) {
    return execute(QueryDialect::GraphQL, text, dataSource, options);
}

Result<QueryResult>
QueryEngine::executeNaturalLanguageQuery(const std::string& text,
                                         const std::shared_ptr<GraphStore>& dataSource,
                                         const QueryOptions& options) {
    return execute(QueryDialect::NaturalLanguage, text, dataSource, options);
}

Result<QueryResult> QueryEngine::executeQuery(const std::string& text,
                                              const std::shared_ptr<GraphStore>& dataSource,
                                              const QueryOptions& options) {
    return execute(detectDialect(text), text, dataSource, options);
}

Result<QueryResult> QueryEngine::execute(QueryDialect dialect, const std::string& text,
                                         const std::shared_ptr<GraphStore>& dataSource,
                                         const QueryOptions& options) {
    auto plan = parseQuery(dialect, text);
    if (!plan) {
        spdlog::debug("[QueryEngine] {} parse failed: {}", dialectToString(dialect),
                      plan.error().message);
        return plan.error();
    }
    return executePlan(plan.value(), dataSource, options);
}

Result<QueryResult> QueryEngine::executePlan(const QueryPlan& plan,
                                             const std::shared_ptr<GraphStore>& dataSource,
                                             const QueryOptions& options) {
    const auto start = Clock::now();
    if (!dataSource)
        return Error{ErrorCode::InvalidArgument, "No data source for query"};

    QueryResult result;
    result.dialect = plan.dialect;

    const auto key = storeKey(dataSource) + "|" + plan.cacheKey();
    if (options.useCache) {
        if (auto hit = cache_.get(key)) {
            result.rows = std::move(hit->rows);
            result.totalMatched = hit->totalMatched;
            result.fromCache = true;
            result.executionTime =
                std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
            return result;
        }
    }

    std::vector<graph::NodeType> types;
    for (const auto& name : plan.nodeTypes) {
        if (auto type = graph::nodeTypeFromString(name))
            types.push_back(*type);
    }
    auto typeAllowed = [&](const GraphNode& node) {
        return types.empty() || std::find(types.begin(), types.end(), node.type) != types.end();
    };

    std::vector<nlohmann::json> rows;
    bool partial = expired(options);
    if (!partial && plan.traversal) {
        auto candidates = traverse(*plan.traversal, dataSource, options, partial);
        if (!candidates)
            return candidates.error();
        for (const auto& candidate : candidates.value()) {
            if (expired(options)) {
                partial = true;
                break;
            }
            auto node = dataSource->getNode(candidate.address);
            if (!node)
                return node.error();
            // Edges may point at nodes that were never extracted.
            if (!node.value() || !typeAllowed(*node.value()))
                continue;
            auto row = buildRow(*node.value(), candidate.depth);
            if (plan.matches(row))
                rows.push_back(std::move(row));
        }
    } else if (!partial) {
        graph::NodeFilter filter;
        filter.nodeTypes = types;
        auto nodes = dataSource->allNodes(filter);
        if (!nodes)
            return nodes.error();
        for (const auto& node : nodes.value()) {
            if (expired(options)) {
                partial = true;
                break;
            }
            auto row = buildRow(node, std::nullopt);
            if (plan.matches(row))
                rows.push_back(std::move(row));
        }
    }

    std::sort(rows.begin(), rows.end(), [](const nlohmann::json& a, const nlohmann::json& b) {
        return a["address"].get_ref<const std::string&>() <
               b["address"].get_ref<const std::string&>();
    });
    if (plan.orderBy) {
        const auto& order = *plan.orderBy;
        std::stable_sort(rows.begin(), rows.end(),
                         [&order](const nlohmann::json& a, const nlohmann::json& b) {
                             int c = compareValues(resolveField(a, order.field),
                                                   resolveField(b, order.field));
                             return order.descending ? c > 0 : c < 0;
                         });
    }

    result.totalMatched = rows.size();
    const size_t begin = std::min(plan.offset, rows.size());
    size_t end = rows.size();
    if (plan.limit)
        end = std::min(end, begin + *plan.limit);

    for (size_t i = begin; i < end; ++i) {
        if (plan.projections.empty()) {
            result.rows.push_back(std::move(rows[i]));
            continue;
        }
        nlohmann::json projected = nlohmann::json::object();
        for (const auto& projection : plan.projections)
            projected[projection.outputName()] = resolveField(rows[i], projection.field);
        result.rows.push_back(std::move(projected));
    }

    result.partial = partial;
    if (!partial && options.useCache)
        cache_.put(key, CachedQuery{result.rows, result.totalMatched});

    result.executionTime =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    spdlog::debug("[QueryEngine] {} query matched {} rows ({} returned){} in {}ms",
                  dialectToString(plan.dialect), result.totalMatched, result.rows.size(),
                  partial ? " [partial]" : "", result.executionTime.count());
    return result;
}

std::shared_ptr<inference::InferenceEngine>
QueryEngine::engineFor(const std::shared_ptr<GraphStore>& store) const {
    if (inference_ && inference_->store() == store)
        return inference_;
    inference::InferenceEngineConfig config;
    if (inference_)
        config = inference_->config();
    return std::make_shared<inference::InferenceEngine>(store, config);
}

Result<std::vector<QueryEngine::Candidate>>
QueryEngine::traverse(const Traversal& traversal, const std::shared_ptr<GraphStore>& store,
                      const QueryOptions& options, bool& partial) {
    auto engine = engineFor(store);
    std::vector<Candidate> candidates;

    auto collect = [&](Result<inference::InferenceResult> inferred) -> Result<void> {
        if (!inferred)
            return inferred.error();
        const auto& value = inferred.value();
        partial = partial || value.partial;
        for (const auto& node : value.nodes)
            candidates.push_back(Candidate{node.address, node.depth});
        return Result<void>{};
    };

    switch (traversal.mode) {
        case TraversalMode::Direct: {
            inference::HierarchicalOptions opts;
            opts.includeChildren = false;
            opts.maxDepth = traversal.depth.value_or(config_.defaultDirectDepth);
            opts.direction = traversal.direction;
            opts.deadline = options.deadline;
            if (auto r = collect(engine->queryHierarchical(traversal.from, traversal.edgeType, opts));
                !r)
                return r.error();
            break;
        }
        case TraversalMode::Transitive: {
            const int depth = traversal.depth.value_or(config_.defaultTransitiveDepth);
            if (traversal.direction == EdgeDirection::Out) {
                inference::TransitiveOptions opts;
                opts.maxPathLength = depth;
                opts.includeIntermediate = true;
                opts.deadline = options.deadline;
                if (auto r =
                        collect(engine->queryTransitive(traversal.from, traversal.edgeType, opts));
                    !r)
                    return r.error();
            } else {
                // Reverse closure: the same breadth-first walk over incoming edges.
                inference::HierarchicalOptions opts;
                opts.includeChildren = false;
                opts.maxDepth = depth;
                opts.direction = EdgeDirection::In;
                opts.deadline = options.deadline;
                if (auto r = collect(
                        engine->queryHierarchical(traversal.from, traversal.edgeType, opts));
                    !r)
                    return r.error();
            }
            break;
        }
        case TraversalMode::Inherited: {
            inference::InheritableOptions opts;
            opts.includeInherited = true;
            opts.maxInheritanceDepth = traversal.depth.value_or(config_.defaultInheritanceDepth);
            opts.deadline = options.deadline;
            auto inferred = engine->queryInheritable(traversal.from, traversal.edgeType, opts);
            if (!inferred)
                return inferred.error();
            const auto& value = inferred.value();
            partial = partial || value.partial;
            for (const auto& edge : value.edges) {
                int depth = edge.provenance ? edge.provenance->depth + 1 : 1;
                candidates.push_back(Candidate{edge.to, depth});
            }
            break;
        }
    }
    return candidates;
}

nlohmann::json QueryEngine::buildRow(const GraphNode& node, std::optional<int> depth) {
    auto parsed = graph::AddressCodec::parse(node.address);
    nlohmann::json row;
    row["address"] = node.address;
    row["project"] = parsed.projectName;
    row["filePath"] = parsed.filePath;
    row["nodeType"] = graph::nodeTypeToString(node.type);
    row["symbolName"] = parsed.symbolName;
    if (depth)
        row["depth"] = *depth;
    row["metadata"] = node.metadata;
    return row;
}

Result<CacheReport> QueryEngine::manageCache(CacheAction action) {
    CacheReport report;
    report.action = cacheActionToString(action);
    switch (action) {
        case CacheAction::Clear:
            report.evicted = cache_.clear();
            spdlog::info("[QueryEngine] cache cleared ({} entries)", report.evicted);
            break;
        case CacheAction::Stats:
            break;
        case CacheAction::Optimize: {
            auto optimized = cache_.optimize();
            report.evicted = optimized.evicted;
            report.expired = optimized.expired;
            spdlog::info("[QueryEngine] cache optimized: {} expired, {} evicted", report.expired,
                         report.evicted);
            break;
        }
    }
    auto stats = cache_.getStats();
    report.entries = cache_.size();
    report.hits = stats.hits.load();
    report.misses = stats.misses.load();
    report.hitRate = stats.hitRate();
    return report;
}

Result<CacheReport> QueryEngine::manageCache(std::string_view action) {
    auto parsed = cacheActionFromString(action);
    if (!parsed)
        return parsed.error();
    return manageCache(parsed.value());
}

void QueryEngine::invalidateCache() {
    cache_.clear();
}

void QueryEngine::attachTo(graph::GraphWriter& writer) {
    detach();
    std::lock_guard<std::mutex> lock(attachMutex_);
    attached_ = &writer.changes();
    listenerId_ = attached_->subscribe([this](const graph::DataChangeEvent&) { cache_.clear(); });
}

void QueryEngine::detach() {
    std::lock_guard<std::mutex> lock(attachMutex_);
    if (attached_) {
        attached_->unsubscribe(listenerId_);
        attached_ = nullptr;
    }
}

} // namespace deplink::query
