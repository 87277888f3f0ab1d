#pragma once

#include <string>
#include <vector>

#include "model.h"

// Часы нагрузки делятся на 7 всегда, независимо от числа учебных дней курса
constexpr double kWorkloadAmortizationDays = 7.0;

// Порог перекоса: день тяжелее 1.5 * средней по будням
constexpr double kImbalanceFactor = 1.5;

double difficultyMultiplier(Difficulty d);

// credits * 3 * множитель сложности, часов в неделю
double estimateWeeklyWorkload(int credits, Difficulty d);

WorkloadDistribution distributeWorkload(const std::vector<ScheduledCourse>& courses);

// Часы конкретного будня ("Monday".."Friday"), 0 для остальных строк
double hoursForDay(const WorkloadDistribution& w, const std::string& day);
