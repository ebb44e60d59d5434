#pragma once
#include <string>

enum class LogLevel { Debug = 0, Info, Warn, Error };

// Minimal line logger. Debug/Info go to std::clog, Warn/Error to std::cerr.
// Writes are serialized, so worker threads may log.
class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel level();

    // Reads M41NK3Y_LOG_LEVEL (debug|info|warn|error); unknown values are ignored.
    static void configureFromEnv();

    static void debug(const std::string& message) { write(LogLevel::Debug, message); }
    static void info(const std::string& message)  { write(LogLevel::Info, message); }
    static void warn(const std::string& message)  { write(LogLevel::Warn, message); }
    static void error(const std::string& message) { write(LogLevel::Error, message); }

private:
    static void write(LogLevel level, const std::string& message);
};
