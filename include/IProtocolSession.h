// IProtocolSession – Abstraktion der OPC-UA-Protokollschicht
//
// Die Kernlogik (Controller, AddressSpaceCache, WatchManager, WriteEngine) kennt nur
// diese Schnittstellen. Die produktive Implementierung liegt in OpcUaSession
// (open62541); Unit-Tests verwenden einen In-Memory-Fake.
//
//  - IProtocolConnector::openSession : Session öffnen (inkl. Secure Channel).
//  - IProtocolSession                : browse / readAttributes / writeValue /
//                                      beginMonitoring / close.
//  - IMonitoredItem                  : exklusiver Besitz eines überwachten Items;
//                                      release() gibt es serverseitig wieder frei.
//  - DataChangeSink                  : asynchroner Strom (nodeId, value, status).
//
// Alle Operationen liefern einen OPC-UA-Statuscode (UaStatus::Good bei Erfolg).
// Nach close() schlagen weitere Aufrufe mit BadServerNotConnected fehl.
#pragma once
#include "common_types.h"
#include "StatusCodes.h"
#include "TransportOptions.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

enum class NodeClass : int32_t {
    Unspecified = 0, Object = 1, Variable = 2, Method = 4, ObjectType = 8,
    VariableType = 16, ReferenceType = 32, DataType = 64, View = 128
};

inline const char* nodeClassName(NodeClass c) {
    switch (c) {
        case NodeClass::Object:        return "Object";
        case NodeClass::Variable:      return "Variable";
        case NodeClass::Method:        return "Method";
        case NodeClass::ObjectType:    return "ObjectType";
        case NodeClass::VariableType:  return "VariableType";
        case NodeClass::ReferenceType: return "ReferenceType";
        case NodeClass::DataType:      return "DataType";
        case NodeClass::View:          return "View";
        default:                       return "Unspecified";
    }
}

enum class AttributeId : uint32_t {
    NodeId = 1, NodeClass = 2, BrowseName = 3, DisplayName = 4, Description = 5,
    Value = 13, DataType = 14, ValueRank = 15, ArrayDimensions = 16,
    AccessLevel = 17, UserAccessLevel = 18
};

struct BrowseReference {
    std::string nodeId;          // leer, wenn der Server keine lokale NodeId liefert
    std::string expandedNodeId;  // Fallback (z. B. "svr=1;ns=2;s=X")
    std::string displayName;
    NodeClass   nodeClass = NodeClass::Unspecified;
};

struct AttributeResult {
    uint32_t status = UaStatus::Good;
    UAValue  value;
};

struct DataChangeNotification {
    std::string nodeId;
    UAValue     value;
    uint32_t    status = UaStatus::Good;
    int64_t     sourceTimestampMs = 0;   // 0 = vom Server nicht geliefert
};

using DataChangeSink = std::function<void(const DataChangeNotification&)>;

struct IMonitoredItem {
    virtual ~IMonitoredItem() = default;
    // Gibt das Item frei; ein zweiter Aufruf ist ein No-op und liefert true.
    virtual bool release(std::string& err) = 0;
};

struct IProtocolSession {
    virtual ~IProtocolSession() = default;

    virtual void close() = 0;

    virtual uint32_t browse(const std::string& nodeId,
                            std::chrono::milliseconds timeout,
                            std::vector<BrowseReference>& out) = 0;

    // out hat danach genau attrs.size() Einträge (gleiche Reihenfolge)
    virtual uint32_t readAttributes(const std::string& nodeId,
                                    const std::vector<AttributeId>& attrs,
                                    std::chrono::milliseconds timeout,
                                    std::vector<AttributeResult>& out) = 0;

    virtual uint32_t writeValue(const std::string& nodeId,
                                const UAValue& value,
                                std::chrono::milliseconds timeout) = 0;

    virtual std::unique_ptr<IMonitoredItem> beginMonitoring(const std::string& nodeId,
                                                            std::string& err) = 0;
};

struct IProtocolConnector {
    virtual ~IProtocolConnector() = default;

    // status == BadTimeout kennzeichnet eine Zeitüberschreitung (Diagnose im Controller)
    virtual std::shared_ptr<IProtocolSession> openSession(const TransportOptions& opts,
                                                          DataChangeSink sink,
                                                          uint32_t& status,
                                                          std::string& err) = 0;
};
