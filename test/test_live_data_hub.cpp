#include "LiveDataHub.h"
#include "FakeProtocol.h"

#include <gtest/gtest.h>
#include <condition_variable>
#include <nlohmann/json.hpp>

namespace {

class FakeNodeManager : public INodeManager {
public:
    FakeNodeManager() : source_(std::make_shared<BroadcastChannel>(64)) {}

    bool addWatch(const std::string& nodeId, std::string&) override {
        std::lock_guard<std::mutex> lk(mx_);
        watched.push_back(nodeId);
        return true;
    }

    bool readNodeAttributes(const std::string& nodeId, NodeAttributes& out, std::string& err) override {
        out = NodeAttributes{};
        out.nodeId = nodeId;
        out.name = nodeId;
        out.dataType = "Int32";
        out.value = "snap";
        if (nodeId.find("Missing") != std::string::npos) { err = "BadNodeIdUnknown"; return false; }
        return true;
    }

    std::vector<BroadcastMessage> watchList() const override { return {}; }

    std::shared_ptr<BroadcastChannel> broadcastSource() const override {
        std::lock_guard<std::mutex> lk(mx_);
        return source_;
    }

    // wie Controller::disconnect: neuen Kanal setzen, alten schließen
    void replaceSource() {
        std::shared_ptr<BroadcastChannel> old;
        {
            std::lock_guard<std::mutex> lk(mx_);
            old = source_;
            source_ = std::make_shared<BroadcastChannel>(64);
        }
        old->close();
    }

    bool publish(const std::string& nodeId, const std::string& value) {
        BroadcastMessage m;
        m.nodeId = nodeId;
        m.name = nodeId;
        m.value = value;
        m.severity = "Good";
        return broadcastSource()->tryPush(m);
    }

    std::vector<std::string> watchedIds() const {
        std::lock_guard<std::mutex> lk(mx_);
        return watched;
    }

private:
    mutable std::mutex mx_;
    std::shared_ptr<BroadcastChannel> source_;
    std::vector<std::string> watched;
};

class RecordingTransport : public IHubTransport {
public:
    explicit RecordingTransport(std::string name = "test") : name_(std::move(name)) {}

    bool send(const std::string& text, std::string& err) override {
        std::unique_lock<std::mutex> lk(mx_);
        cv_.wait(lk, [&] { return !blocked_; });
        if (failSends_) { err = "broken pipe"; return false; }
        messages_.push_back(nlohmann::json::parse(text));
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lk(mx_);
        closed_ = true;
    }

    std::string remoteAddress() const override { return name_; }

    void block() { std::lock_guard<std::mutex> lk(mx_); blocked_ = true; }
    void unblock() {
        { std::lock_guard<std::mutex> lk(mx_); blocked_ = false; }
        cv_.notify_all();
    }
    void failSends() { std::lock_guard<std::mutex> lk(mx_); failSends_ = true; }

    std::vector<nlohmann::json> messages() const {
        std::lock_guard<std::mutex> lk(mx_);
        return messages_;
    }
    size_t count() const {
        std::lock_guard<std::mutex> lk(mx_);
        return messages_.size();
    }
    bool closed() const {
        std::lock_guard<std::mutex> lk(mx_);
        return closed_;
    }

private:
    std::string name_;
    mutable std::mutex mx_;
    std::condition_variable cv_;
    std::vector<nlohmann::json> messages_;
    bool blocked_ = false;
    bool failSends_ = false;
    bool closed_ = false;
};

class LiveDataHubTest : public ::testing::Test {
protected:
    LiveDataHubTest() : hub(nodes, hubOptions()) {}

    static LiveDataHub::Options hubOptions() {
        LiveDataHub::Options o;
        o.clientQueueCapacity = 4;
        o.idleWait = std::chrono::milliseconds(10);
        return o;
    }

    void SetUp() override { ASSERT_TRUE(hub.start()); }
    void TearDown() override { hub.stop(); }

    std::shared_ptr<RecordingTransport> addClient(const std::string& control) {
        auto t = std::make_shared<RecordingTransport>();
        const uint64_t id = hub.registerClient(t);
        EXPECT_NE(id, 0u);
        if (!control.empty()) hub.onClientMessage(id, control);
        return t;
    }

    bool clientHas(const std::function<bool(const HubClientInfo&)>& pred) {
        return waitFor([&] {
            for (const auto& c : hub.clients())
                if (pred(c)) return true;
            return false;
        });
    }

    FakeNodeManager nodes;
    LiveDataHub hub;
};

} // namespace

TEST_F(LiveDataHubTest, RegisterRejectsNullTransport) {
    EXPECT_EQ(hub.registerClient(nullptr), 0u);
}

TEST_F(LiveDataHubTest, FilteredClientOnlyReceivesItsNodes) {
    auto a = addClient(R"({"action":"subscribe","node_ids":["ns=1;s=A"]})");
    ASSERT_TRUE(clientHas([](const HubClientInfo& c) { return c.nodeIds.size() == 1; }));
    // Snapshot des aktuellen Werts kommt zuerst
    ASSERT_TRUE(waitFor([&] { return a->count() == 1; }));
    EXPECT_EQ(a->messages()[0]["value"], "snap");

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(nodes.publish("ns=1;s=B", "b" + std::to_string(i)));
        ASSERT_TRUE(nodes.publish("ns=1;s=A", "a" + std::to_string(i)));
    }
    ASSERT_TRUE(waitFor([&] { return a->count() == 4; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const auto msgs = a->messages();
    ASSERT_EQ(msgs.size(), 4u);
    for (const auto& m : msgs) EXPECT_EQ(m["node_id"], "ns=1;s=A");
    EXPECT_EQ(msgs[1]["value"], "a0");
    EXPECT_EQ(msgs[3]["value"], "a2");

    const auto watched = nodes.watchedIds();
    ASSERT_EQ(watched.size(), 1u);
    EXPECT_EQ(watched[0], "ns=1;s=A");
}

TEST_F(LiveDataHubTest, SubscribeAllReceivesEverything) {
    auto all = addClient(R"({"action":"subscribe_all"})");
    ASSERT_TRUE(clientHas([](const HubClientInfo& c) { return c.subscribeAll; }));

    ASSERT_TRUE(nodes.publish("ns=1;s=A", "1"));
    ASSERT_TRUE(nodes.publish("ns=1;s=B", "2"));
    ASSERT_TRUE(waitFor([&] { return all->count() == 2; }));

    const auto msgs = all->messages();
    EXPECT_EQ(msgs[0]["node_id"], "ns=1;s=A");
    EXPECT_EQ(msgs[1]["node_id"], "ns=1;s=B");
    EXPECT_EQ(msgs[1]["severity"], "Good");
}

TEST_F(LiveDataHubTest, UnsubscribeStopsDelivery) {
    auto all = addClient(R"({"action":"subscribe_all"})");
    ASSERT_TRUE(clientHas([](const HubClientInfo& c) { return c.subscribeAll; }));
    hub.onClientMessage(1, R"({"action":"unsubscribe_all"})");
    ASSERT_TRUE(clientHas([](const HubClientInfo& c) { return !c.subscribeAll; }));

    ASSERT_TRUE(nodes.publish("ns=1;s=A", "1"));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(all->count(), 0u);
}

TEST_F(LiveDataHubTest, SlowClientIsDroppedOthersKeepReceiving) {
    auto slow = addClient(R"({"action":"subscribe_all"})");
    auto fast = addClient(R"({"action":"subscribe_all"})");
    ASSERT_TRUE(waitFor([&] {
        const auto cs = hub.clients();
        return cs.size() == 2 && cs[0].subscribeAll && cs[1].subscribeAll;
    }));
    slow->block();

    constexpr int kMessages = 12;
    for (int i = 0; i < kMessages; ++i) {
        ASSERT_TRUE(nodes.publish("ns=1;s=A", std::to_string(i)));
        ASSERT_TRUE(waitFor([&] { return fast->count() == static_cast<size_t>(i + 1); })) << i;
    }

    ASSERT_TRUE(waitFor([&] { return hub.clientCount() == 1; }));
    slow->unblock();
    EXPECT_TRUE(waitFor([&] { return slow->closed(); }));
    EXPECT_LT(slow->count(), static_cast<size_t>(kMessages));
    EXPECT_EQ(fast->count(), static_cast<size_t>(kMessages));
    EXPECT_FALSE(fast->closed());
}

TEST_F(LiveDataHubTest, MalformedControlIsIgnored) {
    auto t = addClient("");
    ASSERT_TRUE(waitFor([&] { return hub.clientCount() == 1; }));

    hub.onClientMessage(1, "not json");
    hub.onClientMessage(1, R"({"node_ids":["x"]})");
    hub.onClientMessage(1, R"({"action":"explode"})");
    hub.onClientMessage(1, R"({"action":"subscribe"})");

    hub.onClientMessage(1, R"({"action":"subscribe_all"})");
    ASSERT_TRUE(clientHas([](const HubClientInfo& c) { return c.subscribeAll; }));
    EXPECT_EQ(hub.clientCount(), 1u);
    EXPECT_FALSE(t->closed());
}

TEST_F(LiveDataHubTest, SnapshotSkipsUnreadableNodes) {
    auto a = addClient(R"({"action":"subscribe","node_ids":["ns=1;s=Missing","ns=1;s=A"]})");
    ASSERT_TRUE(waitFor([&] { return a->count() == 1; }));
    EXPECT_EQ(a->messages()[0]["node_id"], "ns=1;s=A");
    EXPECT_EQ(nodes.watchedIds().size(), 2u);
}

TEST_F(LiveDataHubTest, FailedSendRemovesClient) {
    auto t = addClient(R"({"action":"subscribe_all"})");
    ASSERT_TRUE(clientHas([](const HubClientInfo& c) { return c.subscribeAll; }));
    t->failSends();

    ASSERT_TRUE(nodes.publish("ns=1;s=A", "1"));
    EXPECT_TRUE(waitFor([&] { return hub.clientCount() == 0; }));
    EXPECT_TRUE(waitFor([&] { return t->closed(); }));
}

TEST_F(LiveDataHubTest, UnregisterClosesTransport) {
    auto t = addClient("");
    ASSERT_TRUE(waitFor([&] { return hub.clientCount() == 1; }));
    hub.unregisterClient(1);
    EXPECT_TRUE(waitFor([&] { return hub.clientCount() == 0 && t->closed(); }));
}

TEST_F(LiveDataHubTest, ClosedSourceDropsClientsAndRebinds) {
    auto before = addClient(R"({"action":"subscribe_all"})");
    ASSERT_TRUE(clientHas([](const HubClientInfo& c) { return c.subscribeAll; }));

    nodes.replaceSource();
    ASSERT_TRUE(waitFor([&] { return hub.rebinds() == 1; }));
    EXPECT_TRUE(waitFor([&] { return before->closed(); }));
    EXPECT_EQ(hub.clientCount(), 0u);
    EXPECT_TRUE(hub.running());

    auto after = addClient(R"({"action":"subscribe_all"})");
    ASSERT_TRUE(clientHas([](const HubClientInfo& c) { return c.subscribeAll; }));
    ASSERT_TRUE(nodes.publish("ns=1;s=A", "fresh"));
    ASSERT_TRUE(waitFor([&] { return after->count() == 1; }));
    EXPECT_EQ(after->messages()[0]["value"], "fresh");
}

TEST_F(LiveDataHubTest, StopClosesAllClients) {
    auto t = addClient("");
    ASSERT_TRUE(waitFor([&] { return hub.clientCount() == 1; }));
    hub.stop();
    EXPECT_FALSE(hub.running());
    EXPECT_TRUE(t->closed());
    EXPECT_EQ(hub.clientCount(), 0u);
}
