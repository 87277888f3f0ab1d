#pragma once

#include <string>

#include "logger.h"

// --- Конфиг сервиса из переменных окружения ---
struct AppConfig {
    std::string host;
    int         port;
    std::string certFile;
    std::string keyFile;
    std::string logFile;     // пустая строка - лог только в stderr
    LogLevel    logLevel;
    int         alternatives;

    static AppConfig fromEnv();
};

// Применяет настройки логгера из конфига
void applyLogging(const AppConfig& cfg);
