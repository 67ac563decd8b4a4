// WriteEngine – typisierte Schreibzugriffe (NodeId + Typ-Hinweis + Literal)
//
// Ablauf von execute():
//   1) AccessLevel/UserAccessLevel, DataType, ValueRank lesen; nicht schreibbar -> Abbruch
//   2) Server-DataType hat Vorrang vor dem Hinweis des Aufrufers (wird geloggt)
//   3) ValueRank >= 0  -> Literal als Array des Server-Elementtyps parsen
//      sonst          -> aktuellen Wert lesen (Probe) und dessen konkreten Typ bevorzugen
//   4) schreiben, danach Value + DataType zurücklesen und loggen
//
// Bei BadTypeMismatch wird der Reihe nach probiert:
//   Server-Skalartyp -> Ein-Element-Array -> Double->Float -> feste Kandidatenliste
//   (je Kandidat erst Skalar, dann Ein-Element-Array); erster Erfolg gewinnt.
//
// execute() wirft nie; das Ergebnis steht im WriteOutcome und im Log.
#pragma once
#include "IProtocolSession.h"
#include <chrono>
#include <stop_token>
#include <string>
#include <vector>

struct WriteRequest {
    std::string nodeId;
    std::string typeHint;
    std::string literal;
};

struct WriteAttempt {
    std::string representation;     // "int32 123"
    uint32_t    status = UaStatus::Good;
};

struct WriteOutcome {
    bool        success = false;
    std::string error;
    std::string writtenAs;          // Darstellung des erfolgreichen Versuchs
    std::vector<WriteAttempt> attempts;
    std::string readBackValue;
    std::string readBackType;
};

class WriteEngine {
public:
    struct Options {
        std::chrono::milliseconds readTimeout{5000};
        std::chrono::milliseconds probeTimeout{2000};
        std::chrono::milliseconds writeTimeout{5000};
    };

    WriteEngine() = default;
    explicit WriteEngine(Options o) : opt_(o) {}

    WriteOutcome execute(IProtocolSession& session, const WriteRequest& req,
                         std::stop_token st = {}) const;

private:
    WriteOutcome run(IProtocolSession& session, const WriteRequest& req, std::stop_token st) const;
    bool attempt(IProtocolSession& session, const std::string& nodeId, const UAValue& v,
                 WriteOutcome& out, std::vector<std::string>& tried, uint32_t& status) const;
    void readBack(IProtocolSession& session, const std::string& nodeId, WriteOutcome& out) const;

    Options opt_;
};
