#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>

#include <algorithm>
#include <cctype>
#include <future>
#include <set>
#include <deplink/core/uuid.h>
#include <deplink/realtime/realtime_query_system.h>

namespace deplink::realtime {

using query::QueryDialect;
using Clock = std::chrono::steady_clock;

namespace {

struct Targets {
    std::vector<Subscription> data;
    std::vector<Subscription> error;
    std::vector<Subscription> complete;
};

void sortBySequence(std::vector<Subscription>& subscriptions) {
    std::sort(subscriptions.begin(), subscriptions.end(),
              [](const Subscription& a, const Subscription& b) { return a.sequence < b.sequence; });
}

Targets targetsFor(const std::map<std::string, Subscription>& subscriptions,
                   const std::string& queryId) {
    Targets targets;
    for (const auto& [id, subscription] : subscriptions) {
        if (subscription.queryId != queryId)
            continue;
        switch (subscription.eventType) {
            case SubscriptionEvent::Data:
                targets.data.push_back(subscription);
                break;
            case SubscriptionEvent::Error:
                targets.error.push_back(subscription);
                break;
            case SubscriptionEvent::Complete:
                targets.complete.push_back(subscription);
                break;
        }
    }
    sortBySequence(targets.data);
    sortBySequence(targets.error);
    sortBySequence(targets.complete);
    return targets;
}

// Every active query is treated as affected by every change.
// TODO: compare the change's node type and edge type against the query plan
// so unrelated writes stop re-executing every query.
bool isAffectedByChange(const RealtimeQuery& entry, const graph::DataChangeEvent&) {
    return entry.isActive;
}

nlohmann::json errorEnvelope(const std::string& message) {
    return {{"type", "error"}, {"message", message}};
}

} // namespace

const char* subscriptionEventToString(SubscriptionEvent event) noexcept {
    switch (event) {
        case SubscriptionEvent::Data:
            return "data";
        case SubscriptionEvent::Error:
            return "error";
        case SubscriptionEvent::Complete:
            return "complete";
    }
    return "data";
}

Result<SubscriptionEvent> subscriptionEventFromString(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "data")
        return SubscriptionEvent::Data;
    if (lower == "error")
        return SubscriptionEvent::Error;
    if (lower == "complete")
        return SubscriptionEvent::Complete;
    return Error{ErrorCode::InvalidArgument, "Unknown event type '" + std::string(name) + "'"};
}

nlohmann::json RealtimeStats::toJson() const {
    return {{"activeQueries", activeQueries},
            {"activeSubscriptions", activeSubscriptions},
            {"activeConnections", activeConnections},
            {"queriesByType", queriesByType}};
}

RealtimeQuerySystem::RealtimeQuerySystem(RealtimeQueryConfig config,
                                         std::shared_ptr<query::QueryEngine> engine,
                                         std::shared_ptr<graph::GraphStore> defaultStore)
    : config_(config), engine_(std::move(engine)), defaultStore_(std::move(defaultStore)) {
    if (config_.maxConcurrency > 1) {
        pool_ = std::make_unique<boost::asio::thread_pool>(config_.maxConcurrency);
    }
    spdlog::debug("[RealtimeQuerySystem] created (maxConnections={}, polling={}, interval={}ms)",
                  config_.maxConnections, config_.enablePolling, config_.pollingInterval.count());
}

RealtimeQuerySystem::~RealtimeQuerySystem() {
    close();
    if (pool_) {
        pool_->join();
    }
}

Result<void> RealtimeQuerySystem::registerDataSource(const std::string& name,
                                                     std::shared_ptr<graph::GraphStore> store) {
    if (name.empty())
        return Error{ErrorCode::InvalidArgument, "Data source name must not be empty"};
    if (!store)
        return Error{ErrorCode::InvalidArgument, "Data source '" + name + "' has no store"};
    std::lock_guard<std::mutex> lock(mutex_);
    dataSources_[name] = std::move(store);
    return Result<void>{};
}

Result<std::shared_ptr<graph::GraphStore>>
RealtimeQuerySystem::resolveDataSource(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (name.empty()) {
        if (!defaultStore_)
            return Error{ErrorCode::InvalidState, "No default data source configured"};
        return defaultStore_;
    }
    auto it = dataSources_.find(name);
    if (it == dataSources_.end())
        return Error{ErrorCode::NotFound, "Unknown data source '" + name + "'"};
    return it->second;
}

Result<query::QueryResult> RealtimeQuerySystem::run(const std::string& text, QueryDialect dialect,
                                                    const std::string& dataSource) {
    if (!engine_)
        return Error{ErrorCode::NotInitialized, "No query engine"};
    auto store = resolveDataSource(dataSource);
    if (!store)
        return store.error();
    query::QueryOptions options;
    options.useCache = false;
    return engine_->execute(dialect, text, store.value(), options);
}

Result<std::string>
RealtimeQuerySystem::registerQuery(const std::string& text, QueryDialect dialect,
                                   const std::string& clientId,
                                   const std::optional<std::string>& dataSource) {
    RealtimeQuery entry;
    entry.id = core::generateId("query");
    entry.text = text;
    entry.dialect = dialect;
    entry.clientId = clientId;
    entry.dataSource = dataSource.value_or("");
    entry.createdAt = Clock::now();

    auto result = run(text, dialect, entry.dataSource);
    entry.lastExecuted = Clock::now();
    entry.executionCount = 1;
    if (result) {
        entry.lastResult = result.value();
    } else {
        entry.isActive = false;
        entry.error = result.error();
    }

    const std::string id = entry.id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queries_.emplace(id, std::move(entry));
        queryOrder_.push_back(id);
    }

    if (!result) {
        spdlog::warn("[RealtimeQuerySystem] query {} from {} failed on registration: {}", id,
                     clientId, result.error().message);
        queryError_.emit(QueryErrorEvent{id, result.error()});
        return result.error();
    }

    spdlog::debug("[RealtimeQuerySystem] registered {} query {} for {}",
                  query::dialectToString(dialect), id, clientId);
    queryRegistered_.emit(QueryRegisteredEvent{id, clientId, dialect});
    return id;
}

Result<std::string> RealtimeQuerySystem::subscribeToQuery(const std::string& queryId,
                                                          const std::string& clientId,
                                                          SubscriptionEvent eventType,
                                                          SubscriptionCallback callback) {
    if (!callback)
        return Error{ErrorCode::InvalidArgument, "Subscription callback must be set"};

    Subscription subscription;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = queries_.find(queryId);
        if (it == queries_.end())
            return Error{ErrorCode::NotFound, "Query not found: " + queryId};
        if (!it->second.isActive)
            return Error{ErrorCode::InvalidState, "Query is not active: " + queryId};

        subscription.id = core::generateId("sub");
        subscription.queryId = queryId;
        subscription.clientId = clientId;
        subscription.eventType = eventType;
        subscription.callback = std::move(callback);
        subscription.sequence = nextSequence_++;
        subscriptions_.emplace(subscription.id, subscription);
    }

    subscriptionCreated_.emit(SubscriptionLifecycleEvent{subscription.id, queryId, clientId});
    return subscription.id;
}

Result<void> RealtimeQuerySystem::unsubscribeFromQuery(const std::string& subscriptionId) {
    Subscription removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(subscriptionId);
        if (it == subscriptions_.end())
            return Error{ErrorCode::SubscriptionNotFound,
                         "Subscription not found: " + subscriptionId};
        removed = std::move(it->second);
        subscriptions_.erase(it);
    }
    subscriptionCancelled_.emit(
        SubscriptionLifecycleEvent{removed.id, removed.queryId, removed.clientId});
    return Result<void>{};
}

Result<void> RealtimeQuerySystem::deactivateQuery(const std::string& queryId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queries_.find(queryId) == queries_.end())
            return Error{ErrorCode::NotFound, "Query not found: " + queryId};
    }
    deactivate(queryId, "requested");
    return Result<void>{};
}

void RealtimeQuerySystem::deactivate(const std::string& queryId, const std::string& reason) {
    std::vector<Subscription> removed;
    std::vector<Subscription> complete;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = queries_.find(queryId);
        if (it == queries_.end())
            return;
        it->second.isActive = false;
        for (auto sub = subscriptions_.begin(); sub != subscriptions_.end();) {
            if (sub->second.queryId == queryId) {
                if (sub->second.eventType == SubscriptionEvent::Complete)
                    complete.push_back(sub->second);
                removed.push_back(std::move(sub->second));
                sub = subscriptions_.erase(sub);
            } else {
                ++sub;
            }
        }
    }
    sortBySequence(complete);

    deliver(complete, QueryUpdate{queryId, SubscriptionEvent::Complete, {{"reason", reason}}});
    for (const auto& subscription : removed) {
        subscriptionCancelled_.emit(SubscriptionLifecycleEvent{
            subscription.id, subscription.queryId, subscription.clientId});
    }
    queryDeactivated_.emit(QueryDeactivatedEvent{queryId, reason});
    spdlog::debug("[RealtimeQuerySystem] query {} deactivated ({})", queryId, reason);
}

void RealtimeQuerySystem::deliver(const std::vector<Subscription>& subscriptions,
                                  const QueryUpdate& update) {
    for (const auto& subscription : subscriptions) {
        try {
            subscription.callback(update);
        } catch (const std::exception& e) {
            spdlog::warn("[RealtimeQuerySystem] subscriber {} threw on {} update: {}",
                         subscription.id, subscriptionEventToString(update.eventType), e.what());
        }
    }
}

nlohmann::json RealtimeQuerySystem::dataPayload(const query::QueryResult& result) {
    return {{"rows", result.rows},
            {"totalMatched", result.totalMatched},
            {"partial", result.partial}};
}

nlohmann::json RealtimeQuerySystem::errorPayload(const Error& error) {
    return {{"code", errorToString(error.code)}, {"message", error.message}};
}

void RealtimeQuerySystem::refresh(const std::string& queryId, RefreshMode mode) {
    std::string text;
    std::string dataSource;
    QueryDialect dialect = QueryDialect::SQL;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = queries_.find(queryId);
        if (it == queries_.end() || !it->second.isActive)
            return;
        text = it->second.text;
        dataSource = it->second.dataSource;
        dialect = it->second.dialect;
    }

    auto result = run(text, dialect, dataSource);

    Targets targets;
    bool notify = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = queries_.find(queryId);
        // Deactivated while executing: drop the outcome.
        if (it == queries_.end() || !it->second.isActive)
            return;
        auto& entry = it->second;
        entry.lastExecuted = Clock::now();
        entry.executionCount++;
        if (result) {
            bool changed = !entry.lastResult || entry.lastResult->rows != result.value().rows;
            entry.lastResult = result.value();
            entry.error.reset();
            notify = mode == RefreshMode::Always || changed;
        } else {
            // The query stays active; the next cycle may succeed.
            entry.error = result.error();
            notify = true;
        }
        if (notify)
            targets = targetsFor(subscriptions_, queryId);
    }
    if (!notify)
        return;

    if (result) {
        deliver(targets.data,
                QueryUpdate{queryId, SubscriptionEvent::Data, dataPayload(result.value())});
    } else {
        spdlog::warn("[RealtimeQuerySystem] re-execution of {} failed: {}", queryId,
                     result.error().message);
        queryError_.emit(QueryErrorEvent{queryId, result.error()});
        deliver(targets.error,
                QueryUpdate{queryId, SubscriptionEvent::Error, errorPayload(result.error())});
    }
    deliver(targets.complete,
            QueryUpdate{queryId, SubscriptionEvent::Complete, {{"reason", "refreshed"}}});
}

size_t RealtimeQuerySystem::notifyDataChange(const graph::DataChangeEvent& event) {
    dataChange_.emit(event);

    std::vector<std::string> affected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : queryOrder_) {
            auto it = queries_.find(id);
            if (it != queries_.end() && isAffectedByChange(it->second, event))
                affected.push_back(id);
        }
    }

    for (const auto& id : affected)
        refresh(id, RefreshMode::Always);

    spdlog::debug("[RealtimeQuerySystem] {} on {} refreshed {} queries",
                  graph::changeTypeToString(event.type), event.table, affected.size());
    return affected.size();
}

PollingHandle RealtimeQuerySystem::startPolling() {
    if (!config_.enablePolling) {
        spdlog::debug("[RealtimeQuerySystem] polling disabled");
        return PollingHandle{};
    }
    if (!scheduler_)
        scheduler_ = std::make_unique<PollingScheduler>();

    pollingHandle_.cancel();
    auto interval = std::max(config_.pollingInterval, std::chrono::milliseconds{1});
    pollingHandle_ = scheduler_->schedule(interval, [this]() { tick(); });
    spdlog::info("[RealtimeQuerySystem] polling every {}ms", interval.count());
    return pollingHandle_;
}

void RealtimeQuerySystem::tick() {
    const auto now = Clock::now();
    std::vector<std::string> timedOut;
    std::vector<std::string> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : queryOrder_) {
            auto it = queries_.find(id);
            if (it == queries_.end() || !it->second.isActive)
                continue;
            const auto& entry = it->second;
            if (config_.queryTimeout.count() > 0 && now - entry.createdAt >= config_.queryTimeout) {
                timedOut.push_back(id);
            } else if (now - entry.lastExecuted >= config_.pollingInterval) {
                due.push_back(id);
            }
        }
    }

    for (const auto& id : timedOut) {
        Error error{ErrorCode::QueryTimeout, "Query exceeded timeout of " +
                                                 std::to_string(config_.queryTimeout.count()) +
                                                 "ms"};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (auto it = queries_.find(id); it != queries_.end())
                it->second.error = error;
        }
        deactivate(id, "timeout");
        queryTimeout_.emit(QueryTimeoutEvent{id, error});
    }

    if (!pool_ || due.size() < 2) {
        for (const auto& id : due)
            refresh(id, RefreshMode::OnChange);
        return;
    }

    std::vector<std::future<void>> futures;
    futures.reserve(due.size());
    for (const auto& id : due) {
        futures.push_back(boost::asio::post(
            *pool_, boost::asio::use_future([this, id]() { refresh(id, RefreshMode::OnChange); })));
    }
    // The tick ends only after every re-execution has finished.
    for (auto& future : futures) {
        try {
            future.get();
        } catch (const std::exception& e) {
            spdlog::error("[RealtimeQuerySystem] polling re-execution failed: {}", e.what());
        }
    }
}

Result<void> RealtimeQuerySystem::connect(const std::string& clientId,
                                          std::shared_ptr<ClientChannel> channel) {
    if (clientId.empty())
        return Error{ErrorCode::InvalidArgument, "Client id must not be empty"};
    size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connections_.count(clientId) > 0)
            return Error{ErrorCode::InvalidState, "Client already connected: " + clientId};
        if (connections_.size() >= config_.maxConnections) {
            spdlog::warn("[RealtimeQuerySystem] rejecting {}: connection limit {} reached",
                         clientId, config_.maxConnections);
            return Error{ErrorCode::ConnectionLimitExceeded,
                         "Connection limit of " + std::to_string(config_.maxConnections) +
                             " reached"};
        }
        connections_.emplace(clientId, std::move(channel));
        active = connections_.size();
    }
    spdlog::info("[RealtimeQuerySystem] client {} connected ({} active)", clientId, active);
    clientConnected_.emit(ClientEvent{clientId});
    return Result<void>{};
}

bool RealtimeQuerySystem::disconnect(const std::string& clientId) {
    std::vector<std::string> deactivated;
    std::vector<Subscription> removed;
    std::vector<Subscription> complete;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto connection = connections_.find(clientId);
        if (connection == connections_.end())
            return false;
        connections_.erase(connection);

        for (const auto& id : queryOrder_) {
            auto it = queries_.find(id);
            if (it != queries_.end() && it->second.clientId == clientId && it->second.isActive) {
                it->second.isActive = false;
                deactivated.push_back(id);
            }
        }
        std::set<std::string> closing(deactivated.begin(), deactivated.end());
        for (auto sub = subscriptions_.begin(); sub != subscriptions_.end();) {
            const bool ownQuery = closing.count(sub->second.queryId) > 0;
            if (sub->second.clientId == clientId || ownQuery) {
                if (ownQuery && sub->second.clientId != clientId &&
                    sub->second.eventType == SubscriptionEvent::Complete)
                    complete.push_back(sub->second);
                removed.push_back(std::move(sub->second));
                sub = subscriptions_.erase(sub);
            } else {
                ++sub;
            }
        }
    }
    sortBySequence(complete);

    // Other clients watching the departed client's queries learn they ended.
    for (const auto& subscription : complete) {
        deliver({subscription}, QueryUpdate{subscription.queryId, SubscriptionEvent::Complete,
                                            {{"reason", "disconnect"}}});
    }
    for (const auto& subscription : removed) {
        subscriptionCancelled_.emit(SubscriptionLifecycleEvent{
            subscription.id, subscription.queryId, subscription.clientId});
    }
    for (const auto& id : deactivated)
        queryDeactivated_.emit(QueryDeactivatedEvent{id, "disconnect"});

    spdlog::info("[RealtimeQuerySystem] client {} disconnected ({} queries, {} subscriptions)",
                 clientId, deactivated.size(), removed.size());
    clientDisconnected_.emit(ClientEvent{clientId});
    return true;
}

void RealtimeQuerySystem::reply(const std::string& clientId, const nlohmann::json& message) {
    std::shared_ptr<ClientChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(clientId);
        if (it == connections_.end())
            return;
        channel = it->second;
    }
    if (!channel)
        return;
    try {
        channel->send(message);
    } catch (const std::exception& e) {
        spdlog::warn("[RealtimeQuerySystem] send to {} failed: {}", clientId, e.what());
    }
}

nlohmann::json RealtimeQuerySystem::handleMessage(const std::string& clientId,
                                                  const std::string& text) {
    auto respond = [&](nlohmann::json response) {
        reply(clientId, response);
        return response;
    };

    auto message = nlohmann::json::parse(text, nullptr, false);
    if (message.is_discarded() || !message.is_object())
        return respond(errorEnvelope("Invalid JSON"));

    auto stringField = [&message](const char* key) -> std::optional<std::string> {
        auto it = message.find(key);
        if (it == message.end() || !it->is_string())
            return std::nullopt;
        return it->get<std::string>();
    };

    const auto type = stringField("type").value_or("");
    if (type == "registerQuery") {
        auto queryText = stringField("query");
        if (!queryText)
            return respond(errorEnvelope("Missing 'query'"));
        QueryDialect dialect = query::detectDialect(*queryText);
        if (auto queryType = stringField("queryType")) {
            auto parsed = query::dialectFromString(*queryType);
            if (!parsed)
                return respond(errorEnvelope(parsed.error().message));
            dialect = parsed.value();
        }
        auto registered = registerQuery(*queryText, dialect, clientId, stringField("dataSource"));
        if (!registered)
            return respond(errorEnvelope(registered.error().message));
        return respond({{"type", "queryRegistered"}, {"queryId", registered.value()}});
    }

    if (type == "subscribe") {
        auto queryId = stringField("queryId");
        if (!queryId)
            return respond(errorEnvelope("Missing 'queryId'"));
        auto eventType = subscriptionEventFromString(stringField("eventType").value_or("data"));
        if (!eventType)
            return respond(errorEnvelope(eventType.error().message));

        std::weak_ptr<ClientChannel> weak;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (auto it = connections_.find(clientId); it != connections_.end())
                weak = it->second;
        }
        auto subscribed = subscribeToQuery(
            *queryId, clientId, eventType.value(), [weak](const QueryUpdate& update) {
                if (auto channel = weak.lock()) {
                    channel->send({{"type", "queryUpdate"},
                                   {"queryId", update.queryId},
                                   {"eventType", subscriptionEventToString(update.eventType)},
                                   {"data", update.data}});
                }
            });
        if (!subscribed)
            return respond(errorEnvelope(subscribed.error().message));
        return respond({{"type", "subscribed"}, {"subscriptionId", subscribed.value()}});
    }

    if (type == "unsubscribe") {
        auto subscriptionId = stringField("subscriptionId");
        if (!subscriptionId)
            return respond(errorEnvelope("Missing 'subscriptionId'"));
        if (auto r = unsubscribeFromQuery(*subscriptionId); !r)
            return respond(errorEnvelope(r.error().message));
        return respond({{"type", "unsubscribed"}});
    }

    if (type == "deactivateQuery") {
        auto queryId = stringField("queryId");
        if (!queryId)
            return respond(errorEnvelope("Missing 'queryId'"));
        if (auto r = deactivateQuery(*queryId); !r)
            return respond(errorEnvelope(r.error().message));
        return respond({{"type", "queryDeactivated"}});
    }

    return respond(errorEnvelope("Unknown message type"));
}

void RealtimeQuerySystem::attachTo(graph::GraphWriter& writer) {
    detach();
    attached_ = &writer.changes();
    listenerId_ = attached_->subscribe(
        [this](const graph::DataChangeEvent& event) { notifyDataChange(event); });
}

void RealtimeQuerySystem::detach() {
    if (attached_) {
        attached_->unsubscribe(listenerId_);
        attached_ = nullptr;
    }
}

std::optional<RealtimeQuery> RealtimeQuerySystem::getQuery(const std::string& queryId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queries_.find(queryId);
    if (it == queries_.end())
        return std::nullopt;
    return it->second;
}

RealtimeStats RealtimeQuerySystem::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RealtimeStats stats;
    for (const auto& [id, entry] : queries_) {
        if (!entry.isActive)
            continue;
        stats.activeQueries++;
        stats.queriesByType[query::dialectToString(entry.dialect)]++;
    }
    stats.activeSubscriptions = subscriptions_.size();
    stats.activeConnections = connections_.size();
    return stats;
}

void RealtimeQuerySystem::close() {
    pollingHandle_.cancel();
    if (scheduler_)
        scheduler_->stop();
    detach();

    std::unordered_map<std::string, std::shared_ptr<ClientChannel>> connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections.swap(connections_);
        queries_.clear();
        queryOrder_.clear();
        subscriptions_.clear();
    }
    for (auto& [clientId, channel] : connections) {
        if (!channel)
            continue;
        try {
            channel->close(1001, "Server shutting down");
        } catch (const std::exception& e) {
            spdlog::warn("[RealtimeQuerySystem] closing {} failed: {}", clientId, e.what());
        }
    }

    queryRegistered_.close();
    queryError_.close();
    queryDeactivated_.close();
    queryTimeout_.close();
    subscriptionCreated_.close();
    subscriptionCancelled_.close();
    clientConnected_.close();
    clientDisconnected_.close();
    dataChange_.close();
}

} // namespace deplink::realtime
