#pragma once

#include <string>
#include <vector>
#include <optional>

#include "model.h"

enum class OverlapKind {
    None,
    Direct,
    BackToBack
};

// Порог "пара впритык", минут
constexpr int kBackToBackGapMinutes = 15;

struct TimeWindow {
    int startMinutes;
    int endMinutes;
};

// "HH:MM" -> минуты от полуночи. Бросает InvalidInputError на мусор.
int toMinutes(const std::string& time);

// минуты от полуночи -> "HH:MM"
std::string formatTime(int minutesFromMidnight);

// "HH:MM-HH:MM" -> окно; конец должен быть позже начала
TimeWindow parseTimeWindow(const std::string& window);

OverlapKind overlapKind(const TimeSlot& a, const TimeSlot& b);

// --- дни недели ---

// Рабочие дни в порядке недели
const std::vector<std::string>& workdays();

// "monday" / "MONDAY" -> "Monday"; nullopt, если это не день недели
std::optional<std::string> normalizeWeekday(const std::string& day);

bool isWeekend(const std::string& day);
