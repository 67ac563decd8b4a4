// NodeTypes.h – Datenmodell des Clients
//
// AddressSpaceNode : ein beim Browsen entdeckter Knoten (id, Anzeigename, Klasse, hasChildren).
// BroadcastMessage : öffentliche Felder eines WatchItems; wird immer kopiert (nie geteilt),
//                    damit Hub-Verteilung und spätere Updates nicht kollidieren.
// NodeAttributes   : Ergebnis von Controller::readNodeAttributes.
// TagExportRecord  : Ergebnis von Controller::collectVariableNodes.
#pragma once
#include "IProtocolSession.h"
#include <cstdint>
#include <string>

struct AddressSpaceNode {
    std::string id;
    std::string displayName;
    NodeClass   nodeClass = NodeClass::Unspecified;
    bool        hasChildren = false;
};

struct BroadcastMessage {
    std::string nodeId;
    std::string name;
    std::string dataType;
    std::string value;
    std::string timestamp;          // HH:MM:SS.mmm
    std::string severity;           // Good | Uncertain | Bad | Unknown
    std::string symbolicName;
    uint16_t    subCode = 0;
    bool        structureChanged = false;
    bool        semanticsChanged = false;
    uint16_t    infoBits = 0;
    std::string rawStatus;          // 0x%08X
};

struct NodeAttributes {
    std::string nodeId;
    std::string name;
    std::string description;
    std::string nodeClass;
    std::string dataType;
    std::string accessLevel;
    std::string value;
    int32_t     valueRank = -1;
    std::vector<uint32_t> arrayDimensions;
};

struct TagExportRecord {
    std::string nodeId;
    std::string name;
    std::string dataType;
    std::string description;
    std::string path;               // Anzeigenamen ab Startknoten, "/"-getrennt
};
