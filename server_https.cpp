// server_https.cpp
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "api_json.h"
#include "config.h"
#include "errors.h"
#include "logger.h"
#include "optimizer.h"

using nlohmann::json;

static void setCorsHeaders(httplib::Response& res, const char* methods) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", methods);
    res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
}

// --------- хелпер: оптимизация по телу запроса ---------

static std::string handleOptimize(const std::string& body, int defaultAlternatives) {
    json j = json::parse(body);
    OptimizeRequest req = parseOptimizeRequest(j, defaultAlternatives);

    logInfo("POST /api/schedule/optimize studentId=" + req.studentId +
            " courses=" + std::to_string(req.courses.size()) +
            " alternatives=" + std::to_string(req.options.alternatives));

    ScheduleOptimization result = optimizeSchedule(
        req.studentId,
        req.courses,
        req.constraints,
        req.options
    );

    return optimizationToJson(result).dump();
}

int main() {
    try {
        AppConfig cfg = AppConfig::fromEnv();
        applyLogging(cfg);

        logInfo("=== Запуск HTTPS сервера на " + cfg.host + ":" + std::to_string(cfg.port) + " ===");

        httplib::SSLServer svr(cfg.certFile.c_str(), cfg.keyFile.c_str());

        if (!svr.is_valid()) {
            logError("SSLServer невалиден. Проверь " + cfg.certFile + " и " + cfg.keyFile);
            return 1;
        }

        // --- корень ---
        svr.Get("/", [](const httplib::Request& req, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_content(
                "HTTPS timetable optimizer is running.\n"
                "POST /api/schedule/optimize   (courses + constraints -> schedule)\n"
                "GET  /api/health              (liveness check)\n",
                "text/plain; charset=utf-8"
            );
        });

        // --- GET /api/health ---
        svr.Get("/api/health", [](const httplib::Request& req, httplib::Response& res) {
            setCorsHeaders(res, "GET, OPTIONS");
            res.status = 200;
            res.set_content(R"({"ok":true})", "application/json; charset=utf-8");
        });

        // --- POST /api/schedule/optimize ---
        svr.Post("/api/schedule/optimize", [&](const httplib::Request& req, httplib::Response& res) {
            setCorsHeaders(res, "POST, OPTIONS");

            try {
                std::string jsonResp = handleOptimize(req.body, cfg.alternatives);
                res.status = 200;
                res.set_content(jsonResp, "application/json; charset=utf-8");
            } catch (const json::parse_error& ex) {
                logInfo(std::string("Optimize rejected (bad json): ") + ex.what());
                res.status = 400;
                res.set_content(
                    R"({"error":"invalid json"})",
                    "application/json; charset=utf-8"
                );
            } catch (const InvalidInputError& ex) {
                logInfo(std::string("Optimize rejected: ") + ex.what());
                json resp = {
                    {"error", "invalid_input"},
                    {"message", ex.what()},
                    {"details", ex.details()}
                };
                res.status = 400;
                res.set_content(resp.dump(), "application/json; charset=utf-8");
            } catch (const std::exception& ex) {
                logError(std::string("Error in POST /api/schedule/optimize: ") + ex.what());
                res.status = 500;
                res.set_content(
                    R"({"error":"internal server error"})",
                    "application/json; charset=utf-8"
                );
            }
        });

        svr.Options("/api/schedule/optimize", [](const httplib::Request& req, httplib::Response& res) {
            setCorsHeaders(res, "POST, OPTIONS");
            res.status = 204;
        });

        svr.Options("/api/health", [](const httplib::Request& req, httplib::Response& res) {
            setCorsHeaders(res, "GET, OPTIONS");
            res.status = 204;
        });

        bool ok = svr.listen(cfg.host.c_str(), cfg.port);
        if (!ok) {
            logError("Не удалось запустить HTTPS сервер на порту " + std::to_string(cfg.port));
            return 1;
        }

    } catch (const std::exception& ex) {
        logError(std::string("Fatal error on startup: ") + ex.what());
        return 1;
    }

    return 0;
}
