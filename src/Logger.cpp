#include "Logger.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace {
    std::atomic<int> g_level{ static_cast<int>(LogLevel::Info) };
    std::mutex g_writeMutex;

    const char* prefix(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "[debug] ";
            case LogLevel::Info:  return "[info] ";
            case LogLevel::Warn:  return "[warn] ";
            case LogLevel::Error: return "[error] ";
        }
        return "";
    }
}

void Logger::setLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel Logger::level() {
    return static_cast<LogLevel>(g_level.load());
}

void Logger::configureFromEnv() {
    const char* env = std::getenv("M41NK3Y_LOG_LEVEL");
    if (!env) return;

    const std::string value(env);
    if (value == "debug")      setLevel(LogLevel::Debug);
    else if (value == "info")  setLevel(LogLevel::Info);
    else if (value == "warn")  setLevel(LogLevel::Warn);
    else if (value == "error") setLevel(LogLevel::Error);
}

void Logger::write(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) < g_level.load()) return;

    std::lock_guard<std::mutex> lock(g_writeMutex);
    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::clog;
    out << prefix(level) << message << "\n";
}
