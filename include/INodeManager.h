// INodeManager – was der LiveDataHub vom Controller braucht
//
// broadcastSource() liefert den aktuellen Broadcast-Kanal. Beim Disconnect wird er
// geschlossen und durch einen neuen ersetzt; der Hub bindet sich dann neu.
#pragma once
#include "BoundedQueue.h"
#include "NodeTypes.h"
#include <memory>
#include <string>
#include <vector>

using BroadcastChannel = BoundedQueue<BroadcastMessage>;

struct INodeManager {
    virtual ~INodeManager() = default;

    virtual bool addWatch(const std::string& nodeId, std::string& err) = 0;
    virtual bool readNodeAttributes(const std::string& nodeId, NodeAttributes& out, std::string& err) = 0;
    virtual std::vector<BroadcastMessage> watchList() const = 0;
    virtual std::shared_ptr<BroadcastChannel> broadcastSource() const = 0;
};
