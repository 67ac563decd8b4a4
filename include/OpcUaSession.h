// OpcUaSession – IProtocolSession auf Basis von open62541
//
// Ein UA_Client je Session. Alle UA_Client-Aufrufe laufen unter einem Mutex; ein
// eigener Iterate-Thread treibt UA_Client_run_iterate (Publish-Antworten, Keepalive).
//
// Data-Change-Callbacks kommen aus open62541 heraus, während der Mutex gehalten wird.
// Sie werden nur in pending_ gesammelt und nach dem Freigeben des Mutex an die Senke
// weitergereicht, damit die Senke wieder Session-Methoden aufrufen darf.
//
// Die Subscription wird beim ersten beginMonitoring angelegt. Jedes überwachte Item
// hält nur einen weak_ptr auf die Session; release() nach close() ist ein No-op.
#pragma once
#include "IProtocolSession.h"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <open62541/client.h>
#include <open62541/client_config_default.h>
#include <open62541/client_highlevel.h>
#include <open62541/client_subscriptions.h>
#include <open62541/plugin/log_stdout.h>
#include <open62541/util.h>

class OpcUaSession : public IProtocolSession,
                     public std::enable_shared_from_this<OpcUaSession> {
public:
    OpcUaSession(UA_Client* client, DataChangeSink sink);
    ~OpcUaSession() override;

    OpcUaSession(const OpcUaSession&) = delete;
    OpcUaSession& operator=(const OpcUaSession&) = delete;

    // Startet den Iterate-Thread; erst nach Aktivierung der Session aufrufen
    void startIterate();

    void close() override;

    uint32_t browse(const std::string& nodeId,
                    std::chrono::milliseconds timeout,
                    std::vector<BrowseReference>& out) override;

    uint32_t readAttributes(const std::string& nodeId,
                            const std::vector<AttributeId>& attrs,
                            std::chrono::milliseconds timeout,
                            std::vector<AttributeResult>& out) override;

    uint32_t writeValue(const std::string& nodeId,
                        const UAValue& value,
                        std::chrono::milliseconds timeout) override;

    std::unique_ptr<IMonitoredItem> beginMonitoring(const std::string& nodeId,
                                                    std::string& err) override;

    // von OpcUaMonitoredItem::release
    uint32_t deleteMonitoredItem(uint32_t monId);

private:
    struct MonContext {
        OpcUaSession* self = nullptr;
        std::string   nodeId;
    };

    static void dataChangeHandler(UA_Client* client, UA_UInt32 subId, void* subCtx,
                                  UA_UInt32 monId, void* monCtx, UA_DataValue* value);

    // Nur mit gehaltenem mx_ aufrufen
    uint32_t resolveNodeIdLocked(const std::string& text, UA_NodeId& out);
    void     setTimeoutLocked(std::chrono::milliseconds timeout);
    uint32_t ensureSubscriptionLocked();

    void iterateLoop(std::stop_token st);
    void dispatchPending();

    std::mutex  mx_;
    UA_Client*  client_ = nullptr;
    DataChangeSink sink_;
    UA_UInt32   subId_ = 0;
    std::map<UA_UInt32, std::unique_ptr<MonContext>> monitored_;
    std::vector<DataChangeNotification> pending_;
    std::jthread iterate_;
};

class OpcUaConnector : public IProtocolConnector {
public:
    std::shared_ptr<IProtocolSession> openSession(const TransportOptions& opts,
                                                  DataChangeSink sink,
                                                  uint32_t& status,
                                                  std::string& err) override;
};

// UA_Variant <-> UAValue (Transportgrenze)
UAValue       uaVariantToValue(const UA_Variant& v);
UA_StatusCode uaValueToVariant(const UAValue& v, UA_Variant& out);
