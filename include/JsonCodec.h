// JsonCodec – JSON-Abbildung der Daten, die den Prozess verlassen oder betreten
//
//  - broadcastToJson      : Live-Wert an Hub-Clients
//                           {node_id, name, data_type, value, timestamp, severity,
//                            status_code, status_name, sub_code, structure_changed,
//                            semantics_changed, info_bits}
//  - nodeAttributesToJson : Antwort auf Read(nodeId) eines Hosts
//  - tagRecordToJson      : Eintrag von CollectVariableNodes
//  - uaValueToJson        : typisierter Wert (Skalar, Array, null)
//  - parseHubControl      : {"action": "...", "node_ids": [...]} von Hub-Clients
#pragma once
#include "NodeTypes.h"
#include "common_types.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class HubAction { Subscribe, Unsubscribe, SubscribeAll, UnsubscribeAll };

struct HubControl {
    HubAction action = HubAction::Subscribe;
    std::vector<std::string> nodeIds;
};

nlohmann::json uaValueToJson(const UAValue& v);
nlohmann::json broadcastToJson(const BroadcastMessage& m);
nlohmann::json nodeAttributesToJson(const NodeAttributes& a);
nlohmann::json tagRecordToJson(const TagExportRecord& t);

bool parseHubControl(const std::string& text, HubControl& out, std::string& err);
const char* hubActionName(HubAction a);
