// NodeIdUtils.h – Zerlegung von OPC-UA-NodeIds in Textform
//
// parseNodeId(...):
//   - akzeptiert die Standard-Notation "[ns=<n>;]<t>=<id>" mit t in {i, s, g, b}
//       Beispiel: "ns=4;s=OPCUA.DiagnoseFinished" -> ns=4, type='s', id="OPCUA.DiagnoseFinished"
//                 "i=84"                          -> ns=0, type='i', id="84"
//   - akzeptiert "nsu=<uri>;<t>=<id>" (Namespace per URI, ns bleibt 0, nsUri gesetzt)
//   - Rückgabe: true bei gültigem Format (numerische Ids müssen in uint32 passen).
//
// Verwendung:
//   - Controller: Plausibilitätsprüfung vor Read/Write/Watch.
//   - OpcUaSession: Aufbau des UA_NodeId aus den Einzelteilen.
#pragma once
#include <string>
#include <cstdint>
#include <cctype>

struct NodeIdParts {
    uint16_t    ns = 0;
    std::string nsUri;   // nur bei "nsu="
    char        type = '?';
    std::string id;
};

inline bool parseNodeId(const std::string& full, NodeIdParts& out) {
    out = NodeIdParts{};
    std::string rest = full;

    if (rest.rfind("ns=", 0) == 0) {
        const size_t semi = rest.find(';');
        if (semi == std::string::npos || semi == 3) return false;
        unsigned long ns = 0;
        for (size_t i = 3; i < semi; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(rest[i]))) return false;
            ns = ns * 10 + static_cast<unsigned long>(rest[i] - '0');
            if (ns > 0xFFFF) return false;
        }
        out.ns = static_cast<uint16_t>(ns);
        rest = rest.substr(semi + 1);
    } else if (rest.rfind("nsu=", 0) == 0) {
        const size_t semi = rest.find(';');
        if (semi == std::string::npos || semi == 4) return false;
        out.nsUri = rest.substr(4, semi - 4);
        rest = rest.substr(semi + 1);
    }

    if (rest.size() < 3 || rest[1] != '=') return false;
    out.type = rest[0];
    out.id   = rest.substr(2);
    switch (out.type) {
        case 'i': {
            if (out.id.empty() || out.id.size() > 10) return false;
            unsigned long long v = 0;
            for (char c : out.id) {
                if (!std::isdigit(static_cast<unsigned char>(c))) return false;
                v = v * 10 + static_cast<unsigned long long>(c - '0');
            }
            return v <= 0xFFFFFFFFull;
        }
        case 's': case 'g': case 'b':
            return true;
        default:
            return false;
    }
}

inline bool isValidNodeId(const std::string& full) {
    NodeIdParts p;
    return parseNodeId(full, p);
}
