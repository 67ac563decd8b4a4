// Event.h – Zentrale Event-Definition für den EventBus
//
// EventType : Zustandsänderungen, die der Controller an Beobachter (UI, Logger, Host)
//             meldet. Der Hub bekommt Live-Werte NICHT über den Bus, sondern über den
//             eigenen BroadcastChannel.
// Event     : Typ, Zeitstempel, Payload (std::any) – eine der Payload-Strukturen unten.
#pragma once
#include "NodeTypes.h"
#include <any>
#include <chrono>
#include <string>
#include <vector>

enum class EventType {
    evConnectionStateChanged,   // ConnectionStatePayload
    evWatchListUpdated,         // WatchListPayload (nach nodeId sortiert)
    evNodeAttributesUpdated,    // NodeAttributes
    evAddressSpaceReset,        // keine Payload
    evAddressSpaceUpdated       // AddressSpaceUpdatePayload
};

struct Event {
    EventType type{};
    std::chrono::steady_clock::time_point ts{ std::chrono::steady_clock::now() };
    std::any payload;
};

struct ConnectionStatePayload {
    bool        connected = false;
    std::string endpoint;
    std::string error;          // letzter Fehler bei fehlgeschlagenem Connect
};

struct WatchListPayload {
    std::vector<BroadcastMessage> items;
};

struct AddressSpaceUpdatePayload {
    std::string parentId;
};
