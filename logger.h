#include <string>

#pragma once

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Путь к файлу лога; пустая строка - писать только в stderr
void setLogFile(const std::string& path);

// Сообщения ниже этого уровня отбрасываются
void setLogLevel(LogLevel level);

// "debug" / "info" / "warn" / "error"; бросает std::runtime_error на другое
LogLevel parseLogLevel(const std::string& s);

void logMessage(LogLevel level, const std::string& msg);

void logInfo(const std::string& msg);
void logWarning(const std::string& msg);
void logError(const std::string& msg);
void logDebug(const std::string& msg);
