#pragma once

#include <vector>

#include "model.h"

// Границы учебного дня для свободного времени
constexpr int kDayStartMinutes = 8 * 60;
constexpr int kDayEndMinutes   = 18 * 60;

// Минимальное "окно", которое считаем свободным временем
constexpr int kMinFreeBlockMinutes = 30;

// Свободные окна по будням: целый день 08:00-18:00, если пар нет,
// иначе только промежутки между парами (до первой и после последней не считаем).
std::vector<FreeTimeBlock> calculateFreeTime(const std::vector<ScheduledCourse>& courses);
