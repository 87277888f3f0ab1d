#include "config.h"

#include <cstdlib>
#include <stdexcept>

static std::string getEnvOr(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    return std::string(val);
}

static int getIntEnvOr(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;

    try {
        size_t pos = 0;
        int v = std::stoi(val, &pos);
        if (pos != std::string(val).size()) throw std::invalid_argument(val);
        return v;
    } catch (const std::exception&) {
        std::string msg = "Environment variable ";
        msg += name;
        msg += " must be an integer, got '";
        msg += val;
        msg += "'";
        throw std::runtime_error(msg);
    }
}

AppConfig AppConfig::fromEnv() {
    AppConfig cfg;
    cfg.host         = getEnvOr("TIMETABLE_HOST", "127.0.0.1");
    cfg.port         = getIntEnvOr("TIMETABLE_PORT", 8443);
    cfg.certFile     = getEnvOr("TIMETABLE_CERT", "server-cert.pem");
    cfg.keyFile      = getEnvOr("TIMETABLE_KEY", "server-key.pem");
    cfg.logFile      = getEnvOr("TIMETABLE_LOG_FILE", "log.txt");
    cfg.logLevel     = parseLogLevel(getEnvOr("TIMETABLE_LOG_LEVEL", "info"));
    cfg.alternatives = getIntEnvOr("TIMETABLE_ALTERNATIVES", 2);

    if (cfg.port <= 0 || cfg.port > 65535) {
        throw std::runtime_error("Environment variable TIMETABLE_PORT is out of range");
    }
    if (cfg.alternatives < 1 || cfg.alternatives > 2) {
        throw std::runtime_error("Environment variable TIMETABLE_ALTERNATIVES must be 1 or 2");
    }

    return cfg;
}

void applyLogging(const AppConfig& cfg) {
    setLogFile(cfg.logFile);
    setLogLevel(cfg.logLevel);
}
