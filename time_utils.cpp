#include "time_utils.h"
#include "errors.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>

static bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

int toMinutes(const std::string& time) {
    // допускаем "9:00" и "09:00"
    size_t colon = time.find(':');
    if (colon == std::string::npos) {
        throw InvalidInputError("malformed time '" + time + "', expected HH:MM");
    }

    std::string hh = time.substr(0, colon);
    std::string mm = time.substr(colon + 1);

    if (!allDigits(hh) || !allDigits(mm) || hh.size() > 2 || mm.size() != 2) {
        throw InvalidInputError("malformed time '" + time + "', expected HH:MM");
    }

    int h = std::atoi(hh.c_str());
    int m = std::atoi(mm.c_str());
    if (h > 23 || m > 59) {
        throw InvalidInputError("time out of range '" + time + "'");
    }

    return h * 60 + m;
}

std::string formatTime(int minutesFromMidnight) {
    int h = minutesFromMidnight / 60;
    int m = minutesFromMidnight % 60;
    char buf[6];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", h, m);
    return std::string(buf);
}

TimeWindow parseTimeWindow(const std::string& window) {
    size_t dash = window.find('-');
    if (dash == std::string::npos) {
        throw InvalidInputError("malformed time window '" + window + "', expected HH:MM-HH:MM");
    }

    TimeWindow w;
    w.startMinutes = toMinutes(window.substr(0, dash));
    w.endMinutes   = toMinutes(window.substr(dash + 1));

    if (w.endMinutes <= w.startMinutes) {
        throw InvalidInputError("time window '" + window + "' ends before it starts");
    }
    return w;
}

OverlapKind overlapKind(const TimeSlot& a, const TimeSlot& b) {
    if (a.day != b.day) return OverlapKind::None;

    int startA = toMinutes(a.startTime);
    int endA   = toMinutes(a.endTime);
    int startB = toMinutes(b.startTime);
    int endB   = toMinutes(b.endTime);

    if (startA < endB && endA > startB) {
        return OverlapKind::Direct;
    }

    if (std::abs(endA - startB) <= kBackToBackGapMinutes ||
        std::abs(endB - startA) <= kBackToBackGapMinutes) {
        return OverlapKind::BackToBack;
    }

    return OverlapKind::None;
}

// --- дни недели ---

static const std::vector<std::string>& allWeekdays() {
    static const std::vector<std::string> days = {
        "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
    };
    return days;
}

const std::vector<std::string>& workdays() {
    static const std::vector<std::string> days = {
        "Monday", "Tuesday", "Wednesday", "Thursday", "Friday"
    };
    return days;
}

std::optional<std::string> normalizeWeekday(const std::string& day) {
    std::string lower;
    lower.reserve(day.size());
    for (char c : day) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    for (const std::string& d : allWeekdays()) {
        std::string candidate;
        for (char c : d) candidate += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (candidate == lower) return d;
    }
    return std::nullopt;
}

bool isWeekend(const std::string& day) {
    return day == "Saturday" || day == "Sunday";
}
