#pragma once

#include <deplink/core/event_channel.h>
#include <deplink/core/types.h>
#include <deplink/graph/graph_store.h>
#include <deplink/graph/graph_writer.h>
#include <deplink/inference/inference_engine.h>
#include <deplink/query/query_cache.h>
#include <deplink/query/query_plan.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace deplink::query {

struct QueryOptions {
    std::optional<SteadyTimePoint> deadline;
    bool useCache = true;
};

struct QueryResult {
    QueryDialect dialect = QueryDialect::SQL;
    nlohmann::json rows = nlohmann::json::array();
    size_t totalMatched = 0; ///< Rows matching before offset / limit
    bool partial = false;    ///< Deadline expired before evaluation finished
    bool fromCache = false;
    std::chrono::milliseconds executionTime{0};

    nlohmann::json toJson() const;
};

enum class CacheAction { Clear, Stats, Optimize };

const char* cacheActionToString(CacheAction action) noexcept;
Result<CacheAction> cacheActionFromString(std::string_view action);

struct CacheReport {
    std::string action;
    size_t entries = 0; ///< Entries remaining after the action
    uint64_t hits = 0;
    uint64_t misses = 0;
    double hitRate = 0.0;
    size_t evicted = 0;
    size_t expired = 0;

    nlohmann::json toJson() const;
};

struct QueryEngineConfig {
    QueryCacheConfig cache;
    int defaultDirectDepth = 1;
    int defaultTransitiveDepth = 10;
    int defaultInheritanceDepth = 5;
};

/**
 * Compiles SQL-like, GraphQL-like and natural-language queries into one
 * QueryPlan and evaluates it read-only against a GraphStore.
 *
 * Rows come back sorted by address unless the plan orders them otherwise, so
 * repeated execution against the same graph yields identical output.
 * Complete results are cached by (data source, plan); partial ones never are.
 */
class QueryEngine {
public:
    /// When an inference engine is supplied and bound to the queried store,
    /// traversals go through it (and its memo cache); otherwise a plain engine
    /// is created for the call.
    explicit QueryEngine(QueryEngineConfig config = {},
                         std::shared_ptr<inference::InferenceEngine> inference = nullptr);
    ~QueryEngine();

    QueryEngine(const QueryEngine&) = delete;
    QueryEngine& operator=(const QueryEngine&) = delete;

    Result<QueryResult> executeSQLQuery(const std::string& text,
                                        const std::shared_ptr<graph::GraphStore>& dataSource,
                                        const QueryOptions& options = {});

    Result<QueryResult> executeGraphQLQuery(const std::string& text,
                                            const std::shared_ptr<graph::GraphStore>& dataSource,
                                            const QueryOptions& options = {});

    Result<QueryResult>
    executeNaturalLanguageQuery(const std::string& text,
                                const std::shared_ptr<graph::GraphStore>& dataSource,
                                const QueryOptions& options = {});

    /// Detects the dialect from the text, then executes.
    Result<QueryResult> executeQuery(const std::string& text,
                                     const std::shared_ptr<graph::GraphStore>& dataSource,
                                     const QueryOptions& options = {});

    Result<QueryResult> execute(QueryDialect dialect, const std::string& text,
                                const std::shared_ptr<graph::GraphStore>& dataSource,
                                const QueryOptions& options = {});

    Result<QueryResult> executePlan(const QueryPlan& plan,
                                    const std::shared_ptr<graph::GraphStore>& dataSource,
                                    const QueryOptions& options = {});

    Result<CacheReport> manageCache(CacheAction action);
    Result<CacheReport> manageCache(std::string_view action);

    void invalidateCache();

    /// Drops cached results on every write. The writer must outlive this
    /// engine or detach() must be called first.
    void attachTo(graph::GraphWriter& writer);
    void detach();

    CacheStats cacheStats() const { return cache_.getStats(); }

private:
    struct Candidate {
        std::string address;
        std::optional<int> depth;
    };

    Result<std::vector<Candidate>> traverse(const Traversal& traversal,
                                            const std::shared_ptr<graph::GraphStore>& store,
                                            const QueryOptions& options, bool& partial);

    std::shared_ptr<inference::InferenceEngine>
    engineFor(const std::shared_ptr<graph::GraphStore>& store) const;

    static nlohmann::json buildRow(const graph::GraphNode& node, std::optional<int> depth);

    QueryEngineConfig config_;
    QueryCache cache_;
    std::shared_ptr<inference::InferenceEngine> inference_;

    std::mutex attachMutex_;
    core::EventChannel<graph::DataChangeEvent>* attached_ = nullptr;
    core::EventChannel<graph::DataChangeEvent>::ListenerId listenerId_ = 0;
};

} // namespace deplink::query
