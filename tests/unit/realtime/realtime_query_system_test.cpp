#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <thread>
#include <deplink/inference/realtime_inference.h>
#include <deplink/realtime/realtime_query_system.h>

#include "../../common/graph_fixtures.h"

using namespace deplink;
using namespace deplink::realtime;
using deplink::query::QueryDialect;
using deplink::test::fn;
using namespace std::chrono_literals;

namespace {

class RecordingChannel : public ClientChannel {
public:
    void send(const nlohmann::json& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back(message);
    }

    void close(int code, const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        closeCode_ = code;
        closeReason_ = reason;
    }

    std::vector<nlohmann::json> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    int closeCode() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closeCode_;
    }

    std::string closeReason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closeReason_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<nlohmann::json> sent_;
    int closeCode_ = 0;
    std::string closeReason_;
};

template <typename Pred> bool waitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

const std::string kFunctions = "SELECT symbolName FROM functions";

} // namespace

class RealtimeQuerySystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        graph_.chain({fn("a"), fn("b")});
        engine_ = std::make_shared<query::QueryEngine>();
        config_.enablePolling = false;
        makeSystem();
    }

    void makeSystem() {
        system_ = std::make_unique<RealtimeQuerySystem>(config_, engine_, graph_.store());
    }

    std::string registerOk(const std::string& text = kFunctions,
                           const std::string& client = "client-1") {
        auto id = system_->registerQuery(text, QueryDialect::SQL, client);
        EXPECT_TRUE(id) << (id ? "" : id.error().message);
        return id ? id.value() : std::string{};
    }

    test::GraphBuilder graph_;
    std::shared_ptr<query::QueryEngine> engine_;
    RealtimeQueryConfig config_;
    std::unique_ptr<RealtimeQuerySystem> system_;
};

TEST_F(RealtimeQuerySystemTest, RegisterExecutesImmediately) {
    std::vector<QueryRegisteredEvent> registered;
    system_->queryRegistered().subscribe(
        [&](const QueryRegisteredEvent& e) { registered.push_back(e); });

    auto id = registerOk();
    EXPECT_EQ(id.rfind("query-", 0), 0u);
    auto entry = system_->getQuery(id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->isActive);
    EXPECT_EQ(entry->executionCount, 1u);
    ASSERT_TRUE(entry->lastResult.has_value());
    EXPECT_EQ(entry->lastResult->rows.size(), 2u);
    ASSERT_EQ(registered.size(), 1u);
    EXPECT_EQ(registered[0].clientId, "client-1");
}

TEST_F(RealtimeQuerySystemTest, FailedRegistrationKeepsInactiveQuery) {
    std::vector<QueryErrorEvent> errors;
    system_->queryError().subscribe([&](const QueryErrorEvent& e) { errors.push_back(e); });

    auto r = system_->registerQuery("SELECT * FROM", QueryDialect::SQL, "client-1");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::QuerySyntaxError);
    ASSERT_EQ(errors.size(), 1u);

    auto entry = system_->getQuery(errors[0].queryId);
    ASSERT_TRUE(entry.has_value());
    EXPECT_FALSE(entry->isActive);
    ASSERT_TRUE(entry->error.has_value());

    auto sub = system_->subscribeToQuery(errors[0].queryId, "client-1", SubscriptionEvent::Data,
                                         [](const QueryUpdate&) {});
    EXPECT_EQ(sub.error().code, ErrorCode::InvalidState);
}

TEST_F(RealtimeQuerySystemTest, NamedDataSources) {
    test::GraphBuilder other;
    other.node(fn("x")).node(fn("y")).node(fn("z"));
    ASSERT_TRUE(system_->registerDataSource("other", other.store()));
    EXPECT_FALSE(system_->registerDataSource("", other.store()));

    auto id = system_->registerQuery(kFunctions, QueryDialect::SQL, "c", std::string("other"));
    ASSERT_TRUE(id);
    EXPECT_EQ(system_->getQuery(id.value())->lastResult->rows.size(), 3u);

    auto missing = system_->registerQuery(kFunctions, QueryDialect::SQL, "c", std::string("nope"));
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(RealtimeQuerySystemTest, DataBeforeCompleteInSubscriptionOrder) {
    auto id = registerOk();
    std::vector<std::string> order;
    auto subscribe = [&](SubscriptionEvent type, const std::string& tag) {
        auto s = system_->subscribeToQuery(id, "client-1", type, [&order, tag](const QueryUpdate& u) {
            order.push_back(tag + ":" + subscriptionEventToString(u.eventType));
        });
        ASSERT_TRUE(s);
    };
    subscribe(SubscriptionEvent::Complete, "c1");
    subscribe(SubscriptionEvent::Data, "d1");
    subscribe(SubscriptionEvent::Error, "e1");
    subscribe(SubscriptionEvent::Data, "d2");

    graph::DataChangeEvent change;
    change.table = "nodes";
    EXPECT_EQ(system_->notifyDataChange(change), 1u);
    EXPECT_EQ(order, (std::vector<std::string>{"d1:data", "d2:data", "c1:complete"}));
}

TEST_F(RealtimeQuerySystemTest, WriterChangesRefreshQueries) {
    system_->attachTo(graph_.writer());
    auto id = registerOk();
    nlohmann::json lastRows;
    ASSERT_TRUE(system_->subscribeToQuery(id, "client-1", SubscriptionEvent::Data,
                                          [&](const QueryUpdate& u) { lastRows = u.data["rows"]; }));

    graph_.node(fn("c"));
    EXPECT_EQ(lastRows.size(), 3u);
    EXPECT_EQ(system_->getQuery(id)->executionCount, 2u);
    system_->detach();
}

TEST_F(RealtimeQuerySystemTest, UnsubscribeAndDeactivate) {
    auto id = registerOk();
    auto sub = system_->subscribeToQuery(id, "client-1", SubscriptionEvent::Complete,
                                         [](const QueryUpdate&) {});
    ASSERT_TRUE(sub);
    EXPECT_TRUE(system_->unsubscribeFromQuery(sub.value()));
    EXPECT_EQ(system_->unsubscribeFromQuery(sub.value()).error().code,
              ErrorCode::SubscriptionNotFound);

    std::string reason;
    ASSERT_TRUE(system_->subscribeToQuery(id, "client-1", SubscriptionEvent::Complete,
                                          [&](const QueryUpdate& u) {
                                              reason = u.data["reason"].get<std::string>();
                                          }));
    std::vector<QueryDeactivatedEvent> deactivated;
    system_->queryDeactivated().subscribe(
        [&](const QueryDeactivatedEvent& e) { deactivated.push_back(e); });

    EXPECT_TRUE(system_->deactivateQuery(id));
    EXPECT_EQ(reason, "requested");
    ASSERT_EQ(deactivated.size(), 1u);
    EXPECT_EQ(deactivated[0].reason, "requested");
    EXPECT_FALSE(system_->getQuery(id)->isActive);
    EXPECT_EQ(system_->getStats().activeSubscriptions, 0u);

    graph::DataChangeEvent change;
    EXPECT_EQ(system_->notifyDataChange(change), 0u);
    EXPECT_EQ(system_->deactivateQuery("query-missing").error().code, ErrorCode::NotFound);
}

TEST_F(RealtimeQuerySystemTest, LifecycleChannels) {
    std::vector<std::string> events;
    system_->clientConnected().subscribe(
        [&](const ClientEvent& e) { events.push_back("connected:" + e.clientId); });
    system_->subscriptionCreated().subscribe(
        [&](const SubscriptionLifecycleEvent&) { events.push_back("created"); });
    system_->subscriptionCancelled().subscribe(
        [&](const SubscriptionLifecycleEvent&) { events.push_back("cancelled"); });
    system_->dataChanges().subscribe(
        [&](const graph::DataChangeEvent& e) { events.push_back("change:" + e.table); });

    ASSERT_TRUE(system_->connect("client-1", std::make_shared<RecordingChannel>()));
    auto id = registerOk();
    ASSERT_TRUE(system_->subscribeToQuery(id, "client-1", SubscriptionEvent::Data,
                                          [](const QueryUpdate&) {}));
    graph::DataChangeEvent change;
    change.table = "edges";
    system_->notifyDataChange(change);
    ASSERT_TRUE(system_->deactivateQuery(id));

    EXPECT_EQ(events, (std::vector<std::string>{"connected:client-1", "created", "change:edges",
                                                "cancelled"}));
}

TEST_F(RealtimeQuerySystemTest, DrivesRealtimeInference) {
    auto inferenceEngine = std::make_shared<inference::InferenceEngine>(graph_.store());
    inference::RealtimeInference inference(inferenceEngine);
    std::vector<inference::InferenceUpdate> updates;
    inference.updates().subscribe(
        [&](const inference::InferenceUpdate& u) { updates.push_back(u); });
    inference.attachTo(system_->dataChanges());

    inference::InferenceWatch watch;
    watch.rootId = fn("a");
    watch.edgeType = "calls";
    EXPECT_FALSE(inference.watch(watch).empty());

    graph::DataChangeEvent change;
    change.table = "nodes";
    system_->notifyDataChange(change);
    ASSERT_EQ(updates.size(), 1u);
    ASSERT_TRUE(updates[0].result.has_value());
    EXPECT_EQ(updates[0].result->nodes.size(), 1u);
    inference.detach();
}

TEST_F(RealtimeQuerySystemTest, ConnectionLimit) {
    config_.maxConnections = 2;
    makeSystem();
    EXPECT_TRUE(system_->connect("a", std::make_shared<RecordingChannel>()));
    EXPECT_TRUE(system_->connect("b", std::make_shared<RecordingChannel>()));
    EXPECT_EQ(system_->connect("a", std::make_shared<RecordingChannel>()).error().code,
              ErrorCode::InvalidState);
    EXPECT_EQ(system_->connect("c", std::make_shared<RecordingChannel>()).error().code,
              ErrorCode::ConnectionLimitExceeded);
    EXPECT_EQ(system_->connect("", std::make_shared<RecordingChannel>()).error().code,
              ErrorCode::InvalidArgument);

    EXPECT_TRUE(system_->disconnect("a"));
    EXPECT_FALSE(system_->disconnect("a"));
    EXPECT_TRUE(system_->connect("c", std::make_shared<RecordingChannel>()));
    EXPECT_EQ(system_->getStats().activeConnections, 2u);
}

TEST_F(RealtimeQuerySystemTest, DisconnectCleansUpClientState) {
    ASSERT_TRUE(system_->connect("owner", std::make_shared<RecordingChannel>()));
    ASSERT_TRUE(system_->connect("watcher", std::make_shared<RecordingChannel>()));
    auto owned = registerOk(kFunctions, "owner");
    auto foreign = registerOk(kFunctions, "watcher");

    ASSERT_TRUE(system_->subscribeToQuery(foreign, "owner", SubscriptionEvent::Data,
                                          [](const QueryUpdate&) {}));
    std::string watcherSaw;
    ASSERT_TRUE(system_->subscribeToQuery(owned, "watcher", SubscriptionEvent::Complete,
                                          [&](const QueryUpdate& u) {
                                              watcherSaw = u.data["reason"].get<std::string>();
                                          }));

    std::vector<std::string> left;
    system_->clientDisconnected().subscribe([&](const ClientEvent& e) { left.push_back(e.clientId); });

    ASSERT_TRUE(system_->disconnect("owner"));
    EXPECT_FALSE(system_->getQuery(owned)->isActive);
    EXPECT_TRUE(system_->getQuery(foreign)->isActive);
    EXPECT_EQ(watcherSaw, "disconnect");
    EXPECT_EQ(system_->getStats().activeSubscriptions, 0u);
    EXPECT_EQ(system_->getStats().activeQueries, 1u);
    EXPECT_EQ(left, (std::vector<std::string>{"owner"}));
}

TEST_F(RealtimeQuerySystemTest, TickExpiresTimedOutQueries) {
    config_.queryTimeout = 1ms;
    makeSystem();
    auto id = registerOk();
    std::vector<QueryTimeoutEvent> timeouts;
    system_->queryTimeout().subscribe([&](const QueryTimeoutEvent& e) { timeouts.push_back(e); });

    std::this_thread::sleep_for(5ms);
    system_->tick();

    auto entry = system_->getQuery(id);
    EXPECT_FALSE(entry->isActive);
    ASSERT_TRUE(entry->error.has_value());
    EXPECT_EQ(entry->error->code, ErrorCode::QueryTimeout);
    ASSERT_EQ(timeouts.size(), 1u);
    EXPECT_EQ(timeouts[0].queryId, id);
}

TEST_F(RealtimeQuerySystemTest, ZeroTimeoutNeverExpires) {
    config_.queryTimeout = 0ms;
    config_.pollingInterval = 1h;
    makeSystem();
    auto id = registerOk();
    std::this_thread::sleep_for(2ms);
    system_->tick();
    EXPECT_TRUE(system_->getQuery(id)->isActive);
    EXPECT_EQ(system_->getQuery(id)->executionCount, 1u);
}

TEST_F(RealtimeQuerySystemTest, TickNotifiesOnlyWhenRowsChange) {
    config_.pollingInterval = 0ms;
    makeSystem();
    auto id = registerOk();
    int updates = 0;
    ASSERT_TRUE(system_->subscribeToQuery(id, "client-1", SubscriptionEvent::Data,
                                          [&](const QueryUpdate&) { ++updates; }));

    system_->tick();
    EXPECT_EQ(updates, 0);
    EXPECT_EQ(system_->getQuery(id)->executionCount, 2u);

    // Direct store write: no change notification, only polling can see it.
    ASSERT_TRUE(graph_.store()->putNode(graph::GraphNode::fromAddress(fn("c")).value()));
    system_->tick();
    EXPECT_EQ(updates, 1);
}

TEST_F(RealtimeQuerySystemTest, ParallelTickRefreshesEveryQuery) {
    config_.pollingInterval = 0ms;
    config_.maxConcurrency = 3;
    makeSystem();
    std::vector<std::string> ids;
    for (int i = 0; i < 4; ++i)
        ids.push_back(registerOk());

    system_->tick();
    for (const auto& id : ids)
        EXPECT_EQ(system_->getQuery(id)->executionCount, 2u);
}

TEST_F(RealtimeQuerySystemTest, PollingPicksUpDirectWrites) {
    config_.enablePolling = true;
    config_.pollingInterval = 5ms;
    makeSystem();
    auto id = registerOk();
    std::atomic<size_t> lastCount{0};
    ASSERT_TRUE(system_->subscribeToQuery(id, "client-1", SubscriptionEvent::Data,
                                          [&](const QueryUpdate& u) {
                                              lastCount.store(u.data["rows"].size());
                                          }));
    auto handle = system_->startPolling();
    EXPECT_TRUE(handle.active());

    ASSERT_TRUE(graph_.store()->putNode(graph::GraphNode::fromAddress(fn("c")).value()));
    EXPECT_TRUE(waitFor([&] { return lastCount.load() == 3; }));
    handle.cancel();
}

TEST_F(RealtimeQuerySystemTest, DisabledPollingReturnsInertHandle) {
    auto handle = system_->startPolling();
    EXPECT_FALSE(handle.active());
}

TEST_F(RealtimeQuerySystemTest, HandleMessageEnvelopes) {
    auto channel = std::make_shared<RecordingChannel>();
    ASSERT_TRUE(system_->connect("web", channel));

    auto registered = system_->handleMessage(
        "web", R"({"type":"registerQuery","query":"SELECT symbolName FROM functions"})");
    ASSERT_EQ(registered["type"], "queryRegistered");
    const auto queryId = registered["queryId"].get<std::string>();

    auto subscribed = system_->handleMessage(
        "web", nlohmann::json{{"type", "subscribe"}, {"queryId", queryId}}.dump());
    ASSERT_EQ(subscribed["type"], "subscribed");

    graph::DataChangeEvent change;
    system_->notifyDataChange(change);
    auto sent = channel->sent();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[2]["type"], "queryUpdate");
    EXPECT_EQ(sent[2]["eventType"], "data");
    EXPECT_EQ(sent[2]["data"]["rows"].size(), 2u);

    auto unsubscribed = system_->handleMessage(
        "web", nlohmann::json{{"type", "unsubscribe"},
                              {"subscriptionId", subscribed["subscriptionId"]}}
                   .dump());
    EXPECT_EQ(unsubscribed["type"], "unsubscribed");

    auto deactivated = system_->handleMessage(
        "web", nlohmann::json{{"type", "deactivateQuery"}, {"queryId", queryId}}.dump());
    EXPECT_EQ(deactivated["type"], "queryDeactivated");
}

TEST_F(RealtimeQuerySystemTest, HandleMessageErrors) {
    auto bad = system_->handleMessage("web", "{not json");
    EXPECT_EQ(bad["type"], "error");
    EXPECT_EQ(bad["message"], "Invalid JSON");

    EXPECT_EQ(system_->handleMessage("web", R"({"type":"launch"})")["message"],
              "Unknown message type");
    EXPECT_EQ(system_->handleMessage("web", R"({"type":"registerQuery"})")["message"],
              "Missing 'query'");
    EXPECT_EQ(system_->handleMessage("web", R"({"type":"subscribe"})")["message"],
              "Missing 'queryId'");
    EXPECT_EQ(system_->handleMessage("web", R"({"type":"subscribe","queryId":"q","eventType":"x"})")
                  ["type"],
              "error");
    EXPECT_EQ(system_->handleMessage(
                  "web", R"({"type":"registerQuery","query":"MATCH *","queryType":"cypher"})")
                  ["type"],
              "error");
}

TEST_F(RealtimeQuerySystemTest, OversizedLiteralYieldsErrorEnvelope) {
    auto reply = system_->handleMessage(
        "web",
        R"({"type":"registerQuery","query":"SELECT * FROM functions WHERE line = 99999999999999999999"})");
    EXPECT_EQ(reply["type"], "error");
    EXPECT_NE(reply["message"].get<std::string>().find("out of range"), std::string::npos);

    auto nl = system_->handleMessage(
        "web", R"({"type":"registerQuery","query":"functions within depth 99999999999"})");
    EXPECT_EQ(nl["type"], "error");
}

TEST_F(RealtimeQuerySystemTest, CloseShutsEverythingDown) {
    auto channel = std::make_shared<RecordingChannel>();
    ASSERT_TRUE(system_->connect("web", channel));
    registerOk();
    int late = 0;
    system_->queryRegistered().subscribe([&](const QueryRegisteredEvent&) { ++late; });

    system_->close();
    EXPECT_EQ(channel->closeCode(), 1001);
    EXPECT_EQ(channel->closeReason(), "Server shutting down");
    auto stats = system_->getStats();
    EXPECT_EQ(stats.activeQueries, 0u);
    EXPECT_EQ(stats.activeConnections, 0u);
    EXPECT_EQ(system_->queryRegistered().size(), 0u);
    EXPECT_EQ(late, 0);
}

TEST(SubscriptionEventTest, Names) {
    EXPECT_EQ(subscriptionEventFromString("COMPLETE").value(), SubscriptionEvent::Complete);
    EXPECT_STREQ(subscriptionEventToString(SubscriptionEvent::Error), "error");
    EXPECT_EQ(subscriptionEventFromString("other").error().code, ErrorCode::InvalidArgument);
}
