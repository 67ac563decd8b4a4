#include "Logger.h"
#include <iostream>
#include <mutex>

std::atomic<int>  Logger::level_{static_cast<int>(LogLevel::Info)};
std::atomic<bool> Logger::disabled_{false};

namespace {
    std::mutex& out_mutex() { static std::mutex m; return m; }
    Logger::Sink& sink() { static Logger::Sink s; return s; }
}

void Logger::setSink(Sink s) {
    std::lock_guard<std::mutex> lk(out_mutex());
    sink() = std::move(s);
}

const char* Logger::toCStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Error: return "ERR";
        case LogLevel::Warn:  return "WRN";
        case LogLevel::Info:  return "INF";
        case LogLevel::Debug: return "DBG";
        case LogLevel::Trace: return "TRC";
    }
    return "?";
}

void Logger::write(LogLevel lvl, const std::string& line) {
    Sink s;
    {
        std::lock_guard<std::mutex> lk(out_mutex());
        std::cout << line << "\n";
        s = sink();
    }
    // Senke außerhalb des Locks aufrufen (darf selbst loggen)
    if (s) s(lvl, line);
}
