// Logger – zeilenweises Logging für alle Komponenten
//
//  logLine(LogLevel::Info, "Ctl") << "connected to " << url;
//
// Die Zeile wird im LogLine-Objekt gesammelt und erst im Destruktor als Ganzes
// ausgegeben ("[Ctl][INF] connected to ..."), damit parallele Threads sich nicht
// mitten in einer Zeile überschreiben. Level-Schwelle und optionale Senke (z. B. ein
// Log-Fenster des Hosts) sind prozessweit.
#pragma once
#include <atomic>
#include <functional>
#include <sstream>
#include <string>

enum class LogLevel { Error=0, Warn=1, Info=2, Debug=3, Trace=4 };

class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string& line)>;

    static void setLevel(LogLevel lvl) { level_.store(static_cast<int>(lvl), std::memory_order_relaxed); }
    static LogLevel level() { return static_cast<LogLevel>(level_.load(std::memory_order_relaxed)); }

    // disable_log aus der Konfiguration: nur noch Fehler durchlassen
    static void setDisabled(bool off) { disabled_.store(off, std::memory_order_relaxed); }
    static bool disabled() { return disabled_.load(std::memory_order_relaxed); }

    static bool isEnabled(LogLevel lvl) {
        if (disabled() && lvl != LogLevel::Error) return false;
        return static_cast<int>(lvl) <= level_.load(std::memory_order_relaxed);
    }

    // Zusätzliche Senke; leeres Function-Objekt entfernt sie wieder
    static void setSink(Sink s);

    static const char* toCStr(LogLevel lvl);
    static void write(LogLevel lvl, const std::string& line);

private:
    static std::atomic<int>  level_;
    static std::atomic<bool> disabled_;
};

class LogLine {
public:
    LogLine(LogLevel lvl, const char* tag) : lvl_(lvl), on_(Logger::isEnabled(lvl)) {
        if (on_) os_ << "[" << tag << "][" << Logger::toCStr(lvl) << "] ";
    }
    ~LogLine() { if (on_) Logger::write(lvl_, os_.str()); }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template<class T>
    LogLine& operator<<(const T& v) { if (on_) os_ << v; return *this; }

private:
    LogLevel lvl_;
    bool on_;
    std::ostringstream os_;
};

inline LogLine logLine(LogLevel lvl, const char* tag) { return LogLine(lvl, tag); }
