#include "ClientConfig.h"
#include "JsonCodec.h"

#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>

using nlohmann::json;

TEST(HubControl, ParsesAllActions) {
    HubControl c;
    std::string err;
    ASSERT_TRUE(parseHubControl(R"({"action":"subscribe","node_ids":["ns=1;s=A","i=85"]})", c, err)) << err;
    EXPECT_EQ(c.action, HubAction::Subscribe);
    EXPECT_EQ(c.nodeIds, (std::vector<std::string>{ "ns=1;s=A", "i=85" }));

    ASSERT_TRUE(parseHubControl(R"({"action":"subscribe_all"})", c, err));
    EXPECT_EQ(c.action, HubAction::SubscribeAll);
    EXPECT_TRUE(c.nodeIds.empty());

    ASSERT_TRUE(parseHubControl(R"({"action":"unsubscribe_all"})", c, err));
    EXPECT_EQ(c.action, HubAction::UnsubscribeAll);
}

TEST(HubControl, RejectsMalformedMessages) {
    HubControl c;
    std::string err;
    EXPECT_FALSE(parseHubControl("{", c, err));
    EXPECT_EQ(err.rfind("invalid JSON", 0), 0u);

    EXPECT_FALSE(parseHubControl(R"(["subscribe"])", c, err));
    EXPECT_EQ(err, "missing 'action'");

    EXPECT_FALSE(parseHubControl(R"({"action":"explode"})", c, err));
    EXPECT_EQ(err, "unknown action 'explode'");

    EXPECT_FALSE(parseHubControl(R"({"action":"unsubscribe"})", c, err));
    EXPECT_EQ(err, "'unsubscribe' without node ids");

    EXPECT_FALSE(parseHubControl(R"({"action":"subscribe","node_ids":"A"})", c, err));
    EXPECT_EQ(err, "'node_ids' must be an array");

    EXPECT_FALSE(parseHubControl(R"({"action":"subscribe","node_ids":[1]})", c, err));
    EXPECT_EQ(err, "'node_ids' must contain strings");
}

TEST(JsonCodec, BroadcastFields) {
    BroadcastMessage m;
    m.nodeId = "ns=1;s=A";
    m.name = "A";
    m.dataType = "Int32";
    m.value = "7";
    m.timestamp = "12:00:00.000";
    m.severity = "Bad";
    m.symbolicName = "BadTypeMismatch";
    m.subCode = 0x74;
    m.structureChanged = true;
    m.rawStatus = "0x80748000";

    const json j = broadcastToJson(m);
    EXPECT_EQ(j["node_id"], "ns=1;s=A");
    EXPECT_EQ(j["status_code"], "0x80748000");
    EXPECT_EQ(j["status_name"], "BadTypeMismatch");
    EXPECT_EQ(j["sub_code"], 0x74);
    EXPECT_EQ(j["structure_changed"], true);
    EXPECT_EQ(j["semantics_changed"], false);
    EXPECT_EQ(j.size(), 12u);
}

TEST(JsonCodec, TypedValuesAndRecords) {
    EXPECT_TRUE(uaValueToJson(UAValue{}).is_null());
    EXPECT_EQ(uaValueToJson(UAScalar{ int32_t(5) }), 5);
    EXPECT_EQ(uaValueToJson(UAScalar{ ByteString{ { 0xAB, 0x01 } } }), "ab01");
    EXPECT_EQ(uaValueToJson(UAArray{ UAScalar{ true }, UAScalar{ false } }), json::array({ true, false }));
    EXPECT_EQ(uaValueToJson(UAScalar{ LocalizedText{ "en", "x" } })["text"], "x");

    TagExportRecord t{ "ns=1;s=A", "A", "Double", "", "Demo/A" };
    const json j = tagRecordToJson(t);
    EXPECT_EQ(j["path"], "Demo/A");
    EXPECT_FALSE(j.contains("description"));

    NodeAttributes a;
    a.nodeId = "ns=1;s=Arr";
    a.arrayDimensions = { 3 };
    EXPECT_EQ(nodeAttributesToJson(a)["array_dimensions"], json::array({ 3 }));
    EXPECT_FALSE(nodeAttributesToJson(NodeAttributes{}).contains("array_dimensions"));
}

TEST(ClientConfig, DefaultsForMissingKeys) {
    ClientConfig c;
    std::string err;
    ASSERT_TRUE(parseConfigJson(R"({"endpoint_url":"opc.tcp://plc:4840","retry_attempts":5})", c, err)) << err;
    EXPECT_EQ(c.endpointUrl, "opc.tcp://plc:4840");
    EXPECT_EQ(c.retryAttempts, 5);
    EXPECT_EQ(c.securityMode, "None");
    EXPECT_EQ(c.authMode, "Anonymous");
    EXPECT_DOUBLE_EQ(c.connectTimeoutSec, 10.0);
    EXPECT_FALSE(c.autoGenerateCert);
}

TEST(ClientConfig, RoundTripThroughJson) {
    ClientConfig c;
    c.securityPolicy = "Basic256Sha256";
    c.securityMode = "SignAndEncrypt";
    c.authMode = "Username";
    c.username = "op";
    c.apiEnabled = true;
    c.apiPort = 9000;

    const json j = c;
    const ClientConfig back = j.get<ClientConfig>();
    EXPECT_EQ(back.securityPolicy, "Basic256Sha256");
    EXPECT_EQ(back.username, "op");
    EXPECT_TRUE(back.apiEnabled);
    EXPECT_EQ(back.apiPort, 9000);
}

TEST(ClientConfig, RejectsBadDocuments) {
    ClientConfig c;
    std::string err;
    EXPECT_FALSE(parseConfigJson("[1,2]", c, err));
    EXPECT_EQ(err, "config root must be a JSON object");

    EXPECT_FALSE(parseConfigJson("{ nope", c, err));
    EXPECT_EQ(err.rfind("invalid config JSON", 0), 0u);

    EXPECT_FALSE(parseConfigJson(R"({"retry_attempts":"many"})", c, err));
}

TEST(ClientConfig, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "uabridge_cfg_test.json";
    {
        std::ofstream f(path);
        f << R"({"endpoint_url":"opc.tcp://file:4840","disable_log":true})";
    }
    ClientConfig c;
    std::string err;
    ASSERT_TRUE(loadConfigFile(path.string(), c, err)) << err;
    EXPECT_EQ(c.endpointUrl, "opc.tcp://file:4840");
    EXPECT_TRUE(c.disableLog);
    std::filesystem::remove(path);

    EXPECT_FALSE(loadConfigFile(path.string(), c, err));
    EXPECT_EQ(err.rfind("cannot open config file", 0), 0u);
}
