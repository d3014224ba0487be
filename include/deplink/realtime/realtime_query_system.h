#pragma once

#include <deplink/core/event_channel.h>
#include <deplink/core/types.h>
#include <deplink/graph/graph_store.h>
#include <deplink/graph/graph_writer.h>
#include <deplink/query/query_engine.h>
#include <deplink/realtime/client_channel.h>
#include <deplink/realtime/polling_scheduler.h>

#include <boost/asio/thread_pool.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace deplink::realtime {

struct RealtimeQueryConfig {
    bool enablePolling = true;
    std::chrono::milliseconds pollingInterval{5000};
    size_t maxConnections = 100;
    std::chrono::milliseconds queryTimeout{300000}; ///< measured from registration; 0 disables
    size_t maxConcurrency = 1;                      ///< > 1 re-executes on a worker pool
};

enum class SubscriptionEvent { Data, Error, Complete };

const char* subscriptionEventToString(SubscriptionEvent event) noexcept;
Result<SubscriptionEvent> subscriptionEventFromString(std::string_view name);

struct RealtimeQuery {
    std::string id;
    std::string text;
    query::QueryDialect dialect = query::QueryDialect::SQL;
    std::string clientId;
    std::string dataSource; ///< empty selects the default store
    bool isActive = true;
    SteadyTimePoint createdAt{};
    SteadyTimePoint lastExecuted{};
    std::uint64_t executionCount = 0;
    std::optional<query::QueryResult> lastResult;
    std::optional<Error> error;
};

/**
 * Payload handed to subscription callbacks. data carries the rows for Data,
 * {code, message} for Error and {reason} for Complete.
 */
struct QueryUpdate {
    std::string queryId;
    SubscriptionEvent eventType = SubscriptionEvent::Data;
    nlohmann::json data;
};

using SubscriptionCallback = std::function<void(const QueryUpdate&)>;

struct Subscription {
    std::string id;
    std::string queryId;
    std::string clientId;
    SubscriptionEvent eventType = SubscriptionEvent::Data;
    SubscriptionCallback callback;
    std::uint64_t sequence = 0; ///< delivery order within one event type
};

struct QueryRegisteredEvent {
    std::string queryId;
    std::string clientId;
    query::QueryDialect dialect = query::QueryDialect::SQL;
};

struct QueryErrorEvent {
    std::string queryId;
    Error error;
};

struct QueryDeactivatedEvent {
    std::string queryId;
    std::string reason; // "requested", "disconnect" or "timeout"
};

struct QueryTimeoutEvent {
    std::string queryId;
    Error error;
};

struct SubscriptionLifecycleEvent {
    std::string subscriptionId;
    std::string queryId;
    std::string clientId;
};

struct ClientEvent {
    std::string clientId;
};

struct RealtimeStats {
    size_t activeQueries = 0;
    size_t activeSubscriptions = 0;
    size_t activeConnections = 0;
    std::map<std::string, size_t> queriesByType;

    nlohmann::json toJson() const;
};

/**
 * Keeps registered queries live: re-executes them on data changes and on a
 * polling tick, and pushes fresh results to subscribers.
 *
 * Each instance owns its queries, subscriptions and connections. Query
 * execution never happens under the state lock; callbacks and channel sends
 * run after the lock is released. Failures reaching a client are turned into
 * error envelopes, never thrown across the transport.
 */
class RealtimeQuerySystem {
public:
    RealtimeQuerySystem(RealtimeQueryConfig config, std::shared_ptr<query::QueryEngine> engine,
                        std::shared_ptr<graph::GraphStore> defaultStore);
    ~RealtimeQuerySystem();

    RealtimeQuerySystem(const RealtimeQuerySystem&) = delete;
    RealtimeQuerySystem& operator=(const RealtimeQuerySystem&) = delete;

    Result<void> registerDataSource(const std::string& name,
                                    std::shared_ptr<graph::GraphStore> store);

    /// Executes once immediately. A failing execution still stores the query,
    /// inactive with its error set, and returns that error.
    Result<std::string> registerQuery(const std::string& text, query::QueryDialect dialect,
                                      const std::string& clientId,
                                      const std::optional<std::string>& dataSource = std::nullopt);

    Result<std::string> subscribeToQuery(const std::string& queryId, const std::string& clientId,
                                         SubscriptionEvent eventType,
                                         SubscriptionCallback callback);

    Result<void> unsubscribeFromQuery(const std::string& subscriptionId);

    Result<void> deactivateQuery(const std::string& queryId);

    /// Re-executes every active query; returns how many were re-executed.
    size_t notifyDataChange(const graph::DataChangeEvent& event);

    /// Starts the recurring tick. Returns an inert handle when polling is
    /// disabled.
    PollingHandle startPolling();

    /// One polling pass: expires timed-out queries, re-executes stale ones.
    void tick();

    Result<void> connect(const std::string& clientId, std::shared_ptr<ClientChannel> channel);

    /// Deactivates the client's queries and drops its subscriptions.
    bool disconnect(const std::string& clientId);

    /// Answers one request envelope. The response is returned and, when the
    /// client is connected, also sent on its channel.
    nlohmann::json handleMessage(const std::string& clientId, const std::string& text);

    /// Forwards every write to notifyDataChange. The writer must outlive this
    /// system or detach() must be called first.
    void attachTo(graph::GraphWriter& writer);
    void detach();

    std::optional<RealtimeQuery> getQuery(const std::string& queryId) const;
    RealtimeStats getStats() const;

    /// Removes every listener, cancels polling, closes client channels and
    /// clears all state.
    void close();

    core::EventChannel<QueryRegisteredEvent>& queryRegistered() noexcept { return queryRegistered_; }
    core::EventChannel<QueryErrorEvent>& queryError() noexcept { return queryError_; }
    core::EventChannel<QueryDeactivatedEvent>& queryDeactivated() noexcept {
        return queryDeactivated_;
    }
    core::EventChannel<QueryTimeoutEvent>& queryTimeout() noexcept { return queryTimeout_; }
    core::EventChannel<SubscriptionLifecycleEvent>& subscriptionCreated() noexcept {
        return subscriptionCreated_;
    }
    core::EventChannel<SubscriptionLifecycleEvent>& subscriptionCancelled() noexcept {
        return subscriptionCancelled_;
    }
    core::EventChannel<ClientEvent>& clientConnected() noexcept { return clientConnected_; }
    core::EventChannel<ClientEvent>& clientDisconnected() noexcept { return clientDisconnected_; }
    core::EventChannel<graph::DataChangeEvent>& dataChanges() noexcept { return dataChange_; }

    const RealtimeQueryConfig& config() const noexcept { return config_; }

private:
    enum class RefreshMode { Always, OnChange };

    Result<std::shared_ptr<graph::GraphStore>> resolveDataSource(const std::string& name) const;
    Result<query::QueryResult> run(const std::string& text, query::QueryDialect dialect,
                                   const std::string& dataSource);
    void refresh(const std::string& queryId, RefreshMode mode);
    void deactivate(const std::string& queryId, const std::string& reason);
    void deliver(const std::vector<Subscription>& subscriptions, const QueryUpdate& update);
    void reply(const std::string& clientId, const nlohmann::json& message);

    static nlohmann::json dataPayload(const query::QueryResult& result);
    static nlohmann::json errorPayload(const Error& error);

    RealtimeQueryConfig config_;
    std::shared_ptr<query::QueryEngine> engine_;

    mutable std::mutex mutex_;
    std::shared_ptr<graph::GraphStore> defaultStore_;
    std::unordered_map<std::string, std::shared_ptr<graph::GraphStore>> dataSources_;
    std::unordered_map<std::string, RealtimeQuery> queries_;
    std::vector<std::string> queryOrder_; ///< registration order
    std::map<std::string, Subscription> subscriptions_;
    std::uint64_t nextSequence_ = 0;
    std::unordered_map<std::string, std::shared_ptr<ClientChannel>> connections_;

    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::unique_ptr<PollingScheduler> scheduler_;
    PollingHandle pollingHandle_;

    core::EventChannel<graph::DataChangeEvent>* attached_ = nullptr;
    core::EventChannel<graph::DataChangeEvent>::ListenerId listenerId_ = 0;

    core::EventChannel<QueryRegisteredEvent> queryRegistered_{"queryRegistered"};
    core::EventChannel<QueryErrorEvent> queryError_{"queryError"};
    core::EventChannel<QueryDeactivatedEvent> queryDeactivated_{"queryDeactivated"};
    core::EventChannel<QueryTimeoutEvent> queryTimeout_{"queryTimeout"};
    core::EventChannel<SubscriptionLifecycleEvent> subscriptionCreated_{"subscriptionCreated"};
    core::EventChannel<SubscriptionLifecycleEvent> subscriptionCancelled_{"subscriptionCancelled"};
    core::EventChannel<ClientEvent> clientConnected_{"clientConnected"};
    core::EventChannel<ClientEvent> clientDisconnected_{"clientDisconnected"};
    core::EventChannel<graph::DataChangeEvent> dataChange_{"dataChange"};
};

} // namespace deplink::realtime
