#pragma once

#include <string>
#include <vector>

#include "model.h"

// Порог "тяжёлого" дня, часов
constexpr double kHeavyDayHours = 8.0;

// Порог difficultyBalance, ниже которого советуем лёгкие курсы
constexpr double kLowDifficultyBalance = 60.0;

// Правила проверяются по порядку, каждое добавляет не больше одной строки.
// Если ни одно не сработало, возвращается одна положительная строка.
std::vector<std::string> writeRecommendations(
    const OptimizedSchedule& primary,
    const std::vector<OptimizedSchedule>& alternatives,
    const Constraints& constraints
);
