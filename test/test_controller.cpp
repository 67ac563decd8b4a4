#include "Controller.h"
#include "FakeProtocol.h"

#include <gtest/gtest.h>
#include <algorithm>
#include <future>
#include <set>

namespace {

TransportOptions fakeEndpoint() {
    TransportOptions o;
    o.endpointUrl = "opc.tcp://fake:4840";
    return o;
}

Controller::Options fastOptions() {
    Controller::Options o;
    o.pumpInterval = std::chrono::milliseconds(5);
    o.collectDeadline = std::chrono::seconds(5);
    return o;
}

class ControllerTest : public ::testing::Test {
protected:
    ControllerTest()
        : space(makeDemoSpace()), connector(space), ctl(connector, bus, fastOptions()) {}

    bool connect(int attempts = 1) {
        std::string err;
        const bool ok = ctl.connect(fakeEndpoint(), attempts, std::chrono::milliseconds(10), err);
        lastError = err;
        return ok;
    }

    std::shared_ptr<FakeAddressSpace> space;
    FakeConnector connector;
    EventBus bus;
    Controller ctl;
    std::string lastError;
};

} // namespace

TEST_F(ControllerTest, ConnectAndDisconnectTransitionsState) {
    EXPECT_EQ(ctl.state(), Controller::State::Idle);
    ASSERT_TRUE(connect()) << lastError;
    EXPECT_EQ(ctl.state(), Controller::State::Connected);
    EXPECT_EQ(ctl.endpoint(), "opc.tcp://fake:4840");

    // Root-Ordner wird nach dem Verbinden im Hintergrund gebrowst
    EXPECT_TRUE(waitFor([&] { return ctl.hasBrowseBeenPerformed("i=84"); }));

    ctl.disconnect();
    EXPECT_EQ(ctl.state(), Controller::State::Idle);
    EXPECT_TRUE(connector.last()->isClosed());
    EXPECT_FALSE(ctl.hasBrowseBeenPerformed("i=84"));

    // idempotent
    ctl.disconnect();
    EXPECT_EQ(connector.last()->closeCalls, 1);
}

TEST_F(ControllerTest, SecondConnectWhileConnectedIsNoOp) {
    ASSERT_TRUE(connect());
    ASSERT_TRUE(connect());
    EXPECT_EQ(connector.opens(), 1);
}

TEST_F(ControllerTest, RepeatedCyclesLeaveNoBackgroundTasks) {
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(connect()) << lastError;
        std::string err;
        ASSERT_TRUE(ctl.addWatch("ns=1;s=Demo.Int32", err)) << err;
        ctl.disconnect();
        EXPECT_EQ(ctl.activeTaskCount(), 0) << "cycle " << i;
    }
    EXPECT_EQ(ctl.generation(), 20u);
}

TEST_F(ControllerTest, RetriesUntilSessionOpens) {
    connector.failuresLeft = 2;
    ASSERT_TRUE(connect(3)) << lastError;
    EXPECT_EQ(connector.opens(), 3);
}

TEST_F(ControllerTest, FailedConnectRollsBackToIdle) {
    connector.failuresLeft = 5;
    connector.failStatus = UaStatus::BadTimeout;

    auto seen = std::make_shared<std::vector<ConnectionStatePayload>>();
    auto obs = std::make_shared<CallbackObserver>([seen](const Event& ev) {
        if (auto p = std::any_cast<ConnectionStatePayload>(&ev.payload)) seen->push_back(*p);
    });
    auto sub = bus.subscribe_scoped(EventType::evConnectionStateChanged, obs);

    EXPECT_FALSE(connect(2));
    EXPECT_EQ(lastError.rfind("connect failed after 2 attempt(s): ", 0), 0u) << lastError;
    EXPECT_NE(lastError.find("BadTimeout"), std::string::npos);
    EXPECT_EQ(ctl.state(), Controller::State::Idle);
    EXPECT_EQ(ctl.activeTaskCount(), 0);

    bus.process();
    ASSERT_EQ(seen->size(), 1u);
    EXPECT_FALSE(seen->front().connected);
    EXPECT_EQ(seen->front().error, lastError);
}

TEST_F(ControllerTest, InvalidConfigIsRejectedBeforeConnecting) {
    ClientConfig cfg;
    cfg.securityMode = "Sign";
    cfg.securityPolicy = "None";
    std::string err;
    EXPECT_FALSE(ctl.connect(cfg, err));
    EXPECT_EQ(err, "security mode Sign requires a security policy other than None");
    EXPECT_EQ(connector.opens(), 0);
}

TEST_F(ControllerTest, OperationsWithoutSessionReportNotConnected) {
    std::string err;
    NodeAttributes a;
    EXPECT_FALSE(ctl.readNodeAttributes("ns=1;s=Demo.Int32", a, err));
    EXPECT_EQ(err, "not connected");

    EXPECT_FALSE(ctl.addWatch("ns=1;s=Demo.Int32", err));
    EXPECT_EQ(err, "not connected");

    std::vector<TagExportRecord> recs;
    EXPECT_FALSE(ctl.collectVariableNodes("ns=1;s=Demo", true, recs, err));
    EXPECT_EQ(err, "not connected");

    EXPECT_FALSE(ctl.writeValue("ns=1;s=Demo.Int32", "Int32", "1"));
    EXPECT_FALSE(ctl.browse("i=84"));
}

TEST_F(ControllerTest, InvalidNodeIdIsRejected) {
    ASSERT_TRUE(connect());
    std::string err;
    NodeAttributes a;
    EXPECT_FALSE(ctl.readNodeAttributes("bogus", a, err));
    EXPECT_EQ(err, "invalid node id 'bogus'");
    EXPECT_FALSE(ctl.addWatch("ns=x;s=1", err));
    EXPECT_EQ(err, "invalid node id 'ns=x;s=1'");
}

TEST_F(ControllerTest, ReadNodeAttributesFormatsAndPublishes) {
    ASSERT_TRUE(connect());

    auto got = std::make_shared<std::vector<NodeAttributes>>();
    auto obs = std::make_shared<CallbackObserver>([got](const Event& ev) {
        if (auto p = std::any_cast<NodeAttributes>(&ev.payload)) got->push_back(*p);
    });
    auto sub = bus.subscribe_scoped(EventType::evNodeAttributesUpdated, obs);

    NodeAttributes a;
    std::string err;
    ASSERT_TRUE(ctl.readNodeAttributes("ns=1;s=Demo.Int32", a, err)) << err;
    EXPECT_EQ(a.name, "Int32");
    EXPECT_EQ(a.nodeClass, "Variable");
    EXPECT_EQ(a.dataType, "Int32");
    EXPECT_EQ(a.value, "42");
    EXPECT_EQ(a.accessLevel, "Read, Write");
    EXPECT_EQ(a.valueRank, -1);

    bus.process();
    ASSERT_EQ(got->size(), 1u);
    EXPECT_EQ(got->front().nodeId, "ns=1;s=Demo.Int32");
}

TEST_F(ControllerTest, WriteRunsInBackgroundAndReportsOutcome) {
    ASSERT_TRUE(connect());
    std::promise<WriteOutcome> done;
    auto fut = done.get_future();
    ASSERT_TRUE(ctl.writeValue("ns=1;s=Demo.Int32", "Int32", "123",
                               [&](const WriteOutcome& o) { done.set_value(o); }));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    const WriteOutcome o = fut.get();
    EXPECT_TRUE(o.success) << o.error;
    EXPECT_EQ(o.readBackValue, "123");
}

TEST_F(ControllerTest, CollectVariableNodesHandlesCycles) {
    space->folder("ns=1;s=Loop", "Loop", "ns=1;s=Demo");
    space->link("ns=1;s=Loop", "ns=1;s=Demo");   // Zyklus zurück zum Startknoten
    space->variable("ns=1;s=Loop.X", "X", BuiltinType::Double, UAScalar{ 0.5 }, "ns=1;s=Loop")
        .description = "inner";
    ASSERT_TRUE(connect());

    std::vector<TagExportRecord> recs;
    std::string err;
    ASSERT_TRUE(ctl.collectVariableNodes("ns=1;s=Demo", true, recs, err)) << err;

    std::set<std::string> ids;
    for (const auto& r : recs) EXPECT_TRUE(ids.insert(r.nodeId).second) << r.nodeId;
    EXPECT_EQ(ids, (std::set<std::string>{ "ns=1;s=Demo.Float", "ns=1;s=Demo.Int32",
                                           "ns=1;s=Demo.String", "ns=1;s=Loop.X" }));

    const auto it = std::find_if(recs.begin(), recs.end(),
                                 [](const TagExportRecord& r) { return r.nodeId == "ns=1;s=Loop.X"; });
    ASSERT_NE(it, recs.end());
    EXPECT_EQ(it->path, "Loop/X");
    EXPECT_EQ(it->dataType, "Double");
    EXPECT_EQ(it->description, "inner");
}

TEST_F(ControllerTest, CollectNonRecursiveStaysAtFirstLevel) {
    space->folder("ns=1;s=Sub", "Sub", "ns=1;s=Demo");
    space->variable("ns=1;s=Sub.Y", "Y", BuiltinType::Int32, UAScalar{ int32_t(1) }, "ns=1;s=Sub");
    ASSERT_TRUE(connect());

    std::vector<TagExportRecord> recs;
    std::string err;
    ASSERT_TRUE(ctl.collectVariableNodes("ns=1;s=Demo", false, recs, err)) << err;
    EXPECT_EQ(recs.size(), 3u);
}

TEST_F(ControllerTest, CollectFromVariableReturnsTheVariableItself) {
    ASSERT_TRUE(connect());

    std::vector<TagExportRecord> recs;
    std::string err;
    ASSERT_TRUE(ctl.collectVariableNodes("ns=1;s=Demo.Int32", true, recs, err)) << err;
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].nodeId, "ns=1;s=Demo.Int32");
    EXPECT_EQ(recs[0].name, "Int32");
    EXPECT_EQ(recs[0].path, "Int32");
    EXPECT_EQ(recs[0].dataType, "Int32");
}

TEST_F(ControllerTest, DataChangesFromOldGenerationAreDropped) {
    ASSERT_TRUE(connect());
    auto first = connector.last();
    ctl.disconnect();

    ASSERT_TRUE(connect());
    std::string err;
    ASSERT_TRUE(ctl.addWatch("ns=1;s=Demo.Int32", err)) << err;

    first->emit("ns=1;s=Demo.Int32", UAScalar{ int32_t(-1) });
    EXPECT_EQ(ctl.watchList().at(0).value, "42");

    connector.last()->emit("ns=1;s=Demo.Int32", UAScalar{ int32_t(9) });
    EXPECT_EQ(ctl.watchList().at(0).value, "9");
}

TEST_F(ControllerTest, DisconnectReplacesBroadcastSource) {
    ASSERT_TRUE(connect());
    auto before = ctl.broadcastSource();
    ctl.disconnect();
    auto after = ctl.broadcastSource();

    EXPECT_TRUE(before->closed());
    EXPECT_NE(before, after);
    EXPECT_FALSE(after->closed());
}

TEST_F(ControllerTest, DisconnectReleasesWatches) {
    ASSERT_TRUE(connect());
    std::string err;
    ASSERT_TRUE(ctl.addWatch("ns=1;s=Demo.Int32", err));
    auto session = connector.last();
    ctl.disconnect();

    EXPECT_TRUE(ctl.watchList().empty());
    EXPECT_EQ(session->releaseCount("ns=1;s=Demo.Int32"), 1);
}

TEST_F(ControllerTest, ListenerFollowsConfigAndStopsOnShutdown) {
    int starts = 0, stops = 0;
    ctl.setListenerHooks([&] { ++starts; return true; }, [&] { ++stops; });

    ClientConfig cfg;
    cfg.apiEnabled = true;
    ctl.updateListenerState(cfg);
    ctl.updateListenerState(cfg);
    EXPECT_TRUE(ctl.listenerRunning());
    EXPECT_EQ(starts, 1);

    ctl.shutdown();
    EXPECT_FALSE(ctl.listenerRunning());
    EXPECT_EQ(stops, 1);
}
