#include "logger.h"
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <stdexcept>

namespace {
    std::ofstream logFile;
    std::mutex logMutex;
    std::string logPath = "log.txt";
    LogLevel minLevel = LogLevel::Info;
    bool initialized = false;

    std::string levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::Debug:   return "DEBUG";
        }
        return "UNKNOWN";
    }

    std::string currentTimeString() {
        using namespace std::chrono;
        auto now = system_clock::now();
        std::time_t t = system_clock::to_time_t(now);
        std::tm tm{};
    #if defined(_WIN32) || defined(_WIN64)
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return std::string(buf);
    }

    // вызывается под logMutex
    void ensureInitialized() {
        if (!initialized) {
            if (!logPath.empty()) {
                logFile.open(logPath, std::ios::out | std::ios::app);
            }
            initialized = true;
        }
    }
}

void setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) logFile.close();
    logPath = path;
    initialized = false;
}

void setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(logMutex);
    minLevel = level;
}

LogLevel parseLogLevel(const std::string& s) {
    if (s == "debug") return LogLevel::Debug;
    if (s == "info")  return LogLevel::Info;
    if (s == "warn" || s == "warning") return LogLevel::Warning;
    if (s == "error") return LogLevel::Error;
    throw std::runtime_error("Unknown log level: " + s);
}

void logMessage(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (static_cast<int>(level) < static_cast<int>(minLevel)) return;
    ensureInitialized();

    std::string timeStr  = currentTimeString();
    std::string levelStr = levelToString(level);

    std::string full = "[" + timeStr + "][" + levelStr + "] " + msg + "\n";

    if (logFile.is_open()) {
        logFile << full;
        logFile.flush();
    }

    // в консоль только через stderr, stdout занят JSON-ответом CLI
    std::cerr << full;
}

void logInfo(const std::string& msg)    { logMessage(LogLevel::Info, msg); }
void logWarning(const std::string& msg) { logMessage(LogLevel::Warning, msg); }
void logError(const std::string& msg)   { logMessage(LogLevel::Error, msg); }
void logDebug(const std::string& msg)   { logMessage(LogLevel::Debug, msg); }
