#pragma once

#include <vector>

#include "model.h"

// Полный попарный перебор слотов всех выбранных курсов.
// Это итоговый список конфликтов, который уходит вызывающему.
std::vector<Conflict> detectConflicts(const std::vector<ScheduledCourse>& courses);
