#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "api_json.h"
#include "config.h"
#include "errors.h"
#include "logger.h"
#include "optimizer.h"

// timetable_cli [request.json]
// Без аргумента читает запрос из stdin. Результат печатается в stdout как JSON.
int main(int argc, char** argv) {
    std::string body;

    try {
        AppConfig cfg = AppConfig::fromEnv();
        applyLogging(cfg);

        if (argc >= 2) {
            std::ifstream in(argv[1]);
            if (!in) {
                logError(std::string("Не удалось открыть файл запроса: ") + argv[1]);
                return 1;
            }
            std::stringstream ss;
            ss << in.rdbuf();
            body = ss.str();
        } else {
            std::stringstream ss;
            ss << std::cin.rdbuf();
            body = ss.str();
        }

        OptimizeRequest req = parseOptimizeRequest(body, cfg.alternatives);

        ScheduleOptimization result = optimizeSchedule(
            req.studentId,
            req.courses,
            req.constraints,
            req.options
        );

        std::cout << optimizationToJson(result).dump(2) << std::endl;
    } catch (const InvalidInputError& ex) {
        logError(std::string("Некорректный запрос: ") + ex.what());
        for (const std::string& d : ex.details()) {
            std::cerr << "  - " << d << "\n";
        }
        return 2;
    } catch (const std::exception& ex) {
        logError(std::string("Fatal error: ") + ex.what());
        return 1;
    }

    return 0;
}
