// uabridge_demo – Konsolen-Host für Controller + LiveDataHub
//
//   uabridge_demo [config.json]
//
// Befehle (eine Zeile je Befehl):
//   connect | disconnect | state
//   browse <nodeId>            Kinder laden und ausgeben
//   read <nodeId>              Attribute lesen
//   watch <nodeId> | unwatch <nodeId> | unwatchall | list
//   write <nodeId> <typ> <literal>
//   export <nodeId> [-r]       Variablen (rekursiv) als JSON
//   hub                        stdout als Hub-Client anmelden (subscribe_all)
//   quit
#include "ClientConfig.h"
#include "Controller.h"
#include "EventBus.h"
#include "JsonCodec.h"
#include "LiveDataHub.h"
#include "Logger.h"
#include "OpcUaSession.h"
#include "TaskGroup.h"
#include "ValueFormat.h"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

// Hub-Client, der die Nachrichten einfach auf stdout schreibt
class StdoutTransport : public IHubTransport {
public:
    bool send(const std::string& text, std::string&) override {
        std::lock_guard<std::mutex> lk(mx_);
        std::cout << "[hub] " << text << "\n";
        return true;
    }
    void close() override {
        std::lock_guard<std::mutex> lk(mx_);
        std::cout << "[hub] closed\n";
    }
    std::string remoteAddress() const override { return "stdout"; }
private:
    std::mutex mx_;
};

void printChildren(const Controller& ctl, const std::string& parent) {
    for (const auto& n : ctl.addressSpaceChildren(parent)) {
        std::cout << "  " << nodeClassName(n.nodeClass) << " | " << n.id << " | " << n.displayName
                  << (n.hasChildren ? " (+)" : "") << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    ClientConfig cfg;
    if (argc > 1) {
        std::string err;
        if (!loadConfigFile(argv[1], cfg, err)) {
            std::cerr << "[Demo] config: " << err << "\n";
            return 1;
        }
    }
    Logger::setDisabled(cfg.disableLog);

    EventBus bus;
    OpcUaConnector connector;
    Controller ctl(connector, bus);
    LiveDataHub hub(ctl);
    hub.start();

    // Beobachter: Verbindung, Watch-Liste
    auto connObs = std::make_shared<CallbackObserver>([](const Event& ev) {
        const auto* p = std::any_cast<ConnectionStatePayload>(&ev.payload);
        if (!p) return;
        if (p->connected) std::cout << "[Demo] connected to " << p->endpoint << "\n";
        else if (!p->error.empty()) std::cout << "[Demo] connection failed: " << p->error << "\n";
        else std::cout << "[Demo] disconnected\n";
    });
    auto watchObs = std::make_shared<CallbackObserver>([](const Event& ev) {
        const auto* p = std::any_cast<WatchListPayload>(&ev.payload);
        if (!p) return;
        for (const auto& w : p->items)
            std::cout << "  [watch] " << w.nodeId << " = " << w.value
                      << " (" << w.dataType << ", " << w.symbolicName << ", " << w.timestamp << ")\n";
    });
    auto subConn  = bus.subscribe_scoped(EventType::evConnectionStateChanged, connObs);
    auto subWatch = bus.subscribe_scoped(EventType::evWatchListUpdated, watchObs);

    // Konsole in eigenem Thread lesen, damit der Haupt-Thread den Bus pumpen kann
    auto lines = std::make_shared<BoundedQueue<std::string>>(16);
    TaskGroup input;
    input.spawn("console", [lines](std::stop_token) {
        std::string line;
        while (std::getline(std::cin, line)) {
            while (!lines->tryPush(line)) std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        lines->close();
    });

    if (cfg.autoConnect) {
        std::string err;
        if (!ctl.connect(cfg, err)) std::cerr << "[Demo] connect failed: " << err << "\n";
    }

    TaskGroup loop;
    bool quit = false;
    while (!quit) {
        bus.process();

        std::string line;
        const auto r = lines->popWait(line, loop.token(), std::chrono::milliseconds(33));
        if (r == BoundedQueue<std::string>::PopResult::Closed) break;
        if (r != BoundedQueue<std::string>::PopResult::Item) continue;

        std::istringstream is(line);
        std::string cmd, arg;
        is >> cmd >> arg;
        std::string err;

        if (cmd == "quit" || cmd == "exit") {
            quit = true;
        } else if (cmd == "connect") {
            if (!ctl.connect(cfg, err)) std::cout << "[Demo] connect failed: " << err << "\n";
        } else if (cmd == "disconnect") {
            ctl.disconnect();
        } else if (cmd == "state") {
            std::cout << "[Demo] " << Controller::stateName(ctl.state())
                      << " gen=" << ctl.generation() << " tasks=" << ctl.activeTaskCount()
                      << " hubClients=" << hub.clientCount() << "\n";
        } else if (cmd == "browse") {
            if (arg.empty()) arg = "i=84";
            if (!ctl.browse(arg)) std::cout << "[Demo] browse " << arg << " failed\n";
            printChildren(ctl, arg);
        } else if (cmd == "read") {
            NodeAttributes a;
            if (!ctl.readNodeAttributes(arg, a, err)) std::cout << "[Demo] read failed: " << err << "\n";
            else std::cout << nodeAttributesToJson(a).dump(2) << "\n";
        } else if (cmd == "watch") {
            if (!ctl.addWatch(arg, err)) std::cout << "[Demo] watch failed: " << err << "\n";
        } else if (cmd == "unwatch") {
            ctl.removeWatch(arg);
        } else if (cmd == "unwatchall") {
            ctl.removeAllWatches();
        } else if (cmd == "list") {
            for (const auto& w : ctl.watchList())
                std::cout << "  " << w.nodeId << " = " << w.value << " (" << w.symbolicName << ")\n";
        } else if (cmd == "write") {
            std::string type, literal;
            is >> type;
            std::getline(is >> std::ws, literal);
            ctl.writeValue(arg, type, literal, [](const WriteOutcome& o) {
                if (o.success) std::cout << "[Demo] written as " << o.writtenAs
                                         << ", read back " << o.readBackValue << "\n";
                else std::cout << "[Demo] write failed: " << o.error << "\n";
            });
        } else if (cmd == "export") {
            std::string flag;
            is >> flag;
            std::vector<TagExportRecord> recs;
            if (!ctl.collectVariableNodes(arg, flag == "-r", recs, err)) {
                std::cout << "[Demo] export failed: " << err << "\n";
            } else {
                nlohmann::json arr = nlohmann::json::array();
                for (const auto& t : recs) arr.push_back(tagRecordToJson(t));
                std::cout << arr.dump(2) << "\n";
            }
        } else if (cmd == "hub") {
            const uint64_t id = hub.registerClient(std::make_shared<StdoutTransport>());
            hub.onClientMessage(id, R"({"action":"subscribe_all"})");
        } else if (!cmd.empty()) {
            std::cout << "[Demo] unknown command: " << cmd << "\n";
        }
    }

    hub.stop();
    ctl.shutdown();
    bus.process();
    // Konsolen-Thread hängt ggf. in getline; Prozessende beendet ihn
    input.requestStop();
    std::cout << "[Demo] bye\n";
    std::_Exit(0);
}
