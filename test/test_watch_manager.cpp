#include "WatchManager.h"
#include "BoundedQueue.h"
#include "FakeProtocol.h"

#include <gtest/gtest.h>
#include <mutex>

namespace {

struct Recorder {
    std::mutex mx;
    std::vector<std::vector<BroadcastMessage>> snapshots;

    WatchManager::SnapshotFn fn() {
        return [this](std::vector<BroadcastMessage> s) {
            std::lock_guard<std::mutex> lk(mx);
            snapshots.push_back(std::move(s));
        };
    }
    std::vector<BroadcastMessage> last() {
        std::lock_guard<std::mutex> lk(mx);
        return snapshots.empty() ? std::vector<BroadcastMessage>{} : snapshots.back();
    }
};

class WatchManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        space = makeDemoSpace();
        session = std::make_shared<FakeSession>(space, [this](const DataChangeNotification& n) {
            watches->handleDataChange(n);
        });
        channel = std::make_shared<BoundedQueue<BroadcastMessage>>(4);
        watches = std::make_unique<WatchManager>(
            rec.fn(), [this](const BroadcastMessage& m) { return channel->tryPush(m); });
    }

    std::shared_ptr<FakeAddressSpace> space;
    std::shared_ptr<FakeSession> session;
    std::shared_ptr<BoundedQueue<BroadcastMessage>> channel;
    Recorder rec;
    std::unique_ptr<WatchManager> watches;
};

} // namespace

TEST_F(WatchManagerTest, AddWatchReadsInitialValueAndMonitors) {
    std::string err;
    ASSERT_TRUE(watches->addWatch(*session, "ns=1;s=Demo.Int32", err)) << err;

    const auto snap = watches->snapshot();
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap[0].name, "Int32");
    EXPECT_EQ(snap[0].dataType, "Int32");
    EXPECT_EQ(snap[0].value, "42");
    EXPECT_EQ(snap[0].severity, "Good");
    EXPECT_TRUE(watches->isMonitored("ns=1;s=Demo.Int32"));

    BroadcastMessage m;
    ASSERT_TRUE(channel->tryPop(m));
    EXPECT_EQ(m.nodeId, "ns=1;s=Demo.Int32");
}

TEST_F(WatchManagerTest, AddWatchIsIdempotent) {
    std::string err;
    ASSERT_TRUE(watches->addWatch(*session, "ns=1;s=Demo.Int32", err));
    ASSERT_TRUE(watches->addWatch(*session, "ns=1;s=Demo.Int32", err));

    EXPECT_EQ(watches->size(), 1u);
    EXPECT_EQ(session->monitorCount("ns=1;s=Demo.Int32"), 1);
}

TEST_F(WatchManagerTest, MonitoringFailureKeepsInitialValue) {
    session->failMonitoring = true;
    std::string err;
    ASSERT_TRUE(watches->addWatch(*session, "ns=1;s=Demo.Float", err));

    EXPECT_TRUE(watches->contains("ns=1;s=Demo.Float"));
    EXPECT_FALSE(watches->isMonitored("ns=1;s=Demo.Float"));
    EXPECT_EQ(watches->snapshot()[0].value, "1.5");
}

TEST_F(WatchManagerTest, RemoveReleasesHandleExactlyOnce) {
    std::string err;
    ASSERT_TRUE(watches->addWatch(*session, "ns=1;s=Demo.Int32", err));

    EXPECT_TRUE(watches->removeWatch("ns=1;s=Demo.Int32"));
    EXPECT_FALSE(watches->removeWatch("ns=1;s=Demo.Int32"));
    EXPECT_EQ(session->releaseCount("ns=1;s=Demo.Int32"), 1);
    EXPECT_EQ(watches->size(), 0u);
}

TEST_F(WatchManagerTest, RemoveAllReleasesEveryHandle) {
    std::string err;
    ASSERT_TRUE(watches->addWatch(*session, "ns=1;s=Demo.Int32", err));
    ASSERT_TRUE(watches->addWatch(*session, "ns=1;s=Demo.Float", err));

    watches->removeAll();
    EXPECT_EQ(watches->size(), 0u);
    EXPECT_EQ(session->releaseCount("ns=1;s=Demo.Int32"), 1);
    EXPECT_EQ(session->releaseCount("ns=1;s=Demo.Float"), 1);
    EXPECT_TRUE(rec.last().empty());
}

TEST_F(WatchManagerTest, SnapshotIsSortedByNodeId) {
    std::string err;
    ASSERT_TRUE(watches->addWatch(*session, "ns=1;s=Demo.String", err));
    ASSERT_TRUE(watches->addWatch(*session, "ns=1;s=Demo.Float", err));
    ASSERT_TRUE(watches->addWatch(*session, "ns=1;s=Demo.Int32", err));

    const auto snap = rec.last();
    ASSERT_EQ(snap.size(), 3u);
    EXPECT_EQ(snap[0].nodeId, "ns=1;s=Demo.Float");
    EXPECT_EQ(snap[1].nodeId, "ns=1;s=Demo.Int32");
    EXPECT_EQ(snap[2].nodeId, "ns=1;s=Demo.String");
}

TEST_F(WatchManagerTest, DataChangeUpdatesValueAndStatus) {
    std::string err;
    ASSERT_TRUE(watches->addWatch(*session, "ns=1;s=Demo.Int32", err));

    session->emit("ns=1;s=Demo.Int32", UAScalar{ int32_t(7) }, UaStatus::UncertainLastUsableValue);

    const auto snap = rec.last();
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap[0].value, "7");
    EXPECT_EQ(snap[0].severity, "Uncertain");
    EXPECT_EQ(snap[0].symbolicName, "UncertainLastUsableValue");
    EXPECT_EQ(snap[0].rawStatus, "0x40900000");
}

TEST_F(WatchManagerTest, DataChangeForUnknownNodeIsIgnored) {
    session->emit("ns=1;s=Demo.Int32", UAScalar{ int32_t(7) });
    EXPECT_TRUE(rec.last().empty());
    EXPECT_EQ(channel->size(), 0u);
}

TEST_F(WatchManagerTest, FullChannelDropsBroadcastWithoutBlocking) {
    std::string err;
    ASSERT_TRUE(watches->addWatch(*session, "ns=1;s=Demo.Int32", err));
    for (int i = 0; i < 10; ++i)
        session->emit("ns=1;s=Demo.Int32", UAScalar{ int32_t(i) });

    EXPECT_EQ(channel->size(), channel->capacity());
    EXPECT_EQ(watches->droppedBroadcasts(), 11u - channel->capacity());
    // die Watch-Liste sieht trotzdem den letzten Wert
    EXPECT_EQ(watches->snapshot()[0].value, "9");
}

TEST_F(WatchManagerTest, AddWatchWithStaleEpochIsRejected) {
    std::string err;
    ASSERT_TRUE(watches->addWatch(*session, "ns=1;s=Demo.Int32", err));

    // Session wurde vor dem Reset geholt, Reservierung kommt erst danach an
    const uint64_t before = watches->epoch();
    watches->removeAll();
    EXPECT_EQ(watches->epoch(), before + 1);
    session->close();
    const int reads = session->readCalls;

    EXPECT_FALSE(watches->addWatch(*session, "ns=1;s=Demo.Float", before, err));
    EXPECT_EQ(err, "watch list was reset");
    EXPECT_EQ(watches->size(), 0u);
    EXPECT_FALSE(watches->contains("ns=1;s=Demo.Float"));
    EXPECT_EQ(session->readCalls, reads);
    EXPECT_EQ(session->monitorCount("ns=1;s=Demo.Float"), 0);
}
