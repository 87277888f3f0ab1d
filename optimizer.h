#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "model.h"

// Порядок, в котором жадный алгоритм раздаёт слоты курсам.
// true, если a должен идти раньше b.
using CoursePriority = std::function<bool(const Course& a, const Course& b)>;

// от лёгких к сложным
bool byDifficultyAscending(const Course& a, const Course& b);

// сначала курсы с меньшим числом секций, затем по сложности
bool byScarcity(const Course& a, const Course& b);

struct OptimizerOptions {
    int alternatives = 2;               // 1 или 2
    bool strictSlotCollisions = false;  // true -> курс без свободной секции выбрасывается
    CoursePriority priority = byDifficultyAscending;
};

// Окна для альтернативных вариантов
constexpr const char* kMorningWindow   = "09:00-12:00";
constexpr const char* kAfternoonWindow = "13:00-17:00";

// Один проход: выбор секций + конфликты + свободное время + нагрузка + оценка.
// Вход должен быть уже проверен.
OptimizedSchedule buildSchedule(
    const std::string& scheduleId,
    const std::string& label,
    const std::vector<Course>& courses,
    const Constraints& constraints,
    const OptimizerOptions& options
);

// Повторные независимые прогоны с утренним и (если просили два) дневным окном.
// Результат отсортирован по balanceScore по убыванию.
std::vector<OptimizedSchedule> generateAlternatives(
    const std::string& studentId,
    const std::vector<Course>& courses,
    const Constraints& constraints,
    const OptimizerOptions& options
);

// Точка входа. Бросает InvalidInputError, если каталог или ограничения некорректны.
ScheduleOptimization optimizeSchedule(
    const std::string& studentId,
    const std::vector<Course>& courses,
    const std::optional<Constraints>& constraints,
    const OptimizerOptions& options = OptimizerOptions()
);
