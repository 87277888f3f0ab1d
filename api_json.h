#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

#include "model.h"
#include "optimizer.h"

struct OptimizeRequest {
    std::string studentId;
    std::vector<Course> courses;
    std::optional<Constraints> constraints;
    OptimizerOptions options;
};

// Разбор тела запроса. Ошибки формы JSON превращаются в InvalidInputError.
// defaultAlternatives действует, если клиент не указал options.alternatives.
OptimizeRequest parseOptimizeRequest(const nlohmann::json& j, int defaultAlternatives = 2);
OptimizeRequest parseOptimizeRequest(const std::string& body, int defaultAlternatives = 2);

Course courseFromJson(const nlohmann::json& j);
Constraints constraintsFromJson(const nlohmann::json& j);

nlohmann::json scheduleToJson(const OptimizedSchedule& s);
nlohmann::json optimizationToJson(const ScheduleOptimization& result);
