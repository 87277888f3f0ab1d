#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "model.h"

// Занятые интервалы за один прогон: день -> список (start, end) в минутах.
// Живёт только внутри одного прогона оптимизатора.
using UsedSlots = std::map<std::string, std::vector<std::pair<int, int>>>;

struct SectionChoice {
    const Section* section = nullptr;  // nullptr -> курс не попал в расписание
    double score = 0.0;
    bool slotCollision = false;        // выбрана секция, совпадающая с занятым слотом
};

// Оценка секции: база 50, места, формат, утренние пары, предпочтительные окна
double scoreSection(const Section& section, const Constraints& constraints);

// Точное совпадение (day, start, end) с уже занятым слотом
bool collidesWithUsed(const Section& section, const UsedSlots& used);

// Выбирает лучшую секцию курса и сразу занимает её слоты в used.
// strictSlotCollisions = true -> секции с совпадающими слотами не берём вообще.
SectionChoice selectSection(
    const Course& course,
    UsedSlots& used,
    const Constraints& constraints,
    bool strictSlotCollisions
);

void commitSection(const Section& section, UsedSlots& used);
