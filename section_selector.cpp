#include "section_selector.h"

#include "time_utils.h"
#include "logger.h"

#include <algorithm>

namespace {

constexpr double kBaseScore          = 50.0;
constexpr double kMaxSeatsBonus      = 20.0;
constexpr double kHybridBonus        = 15.0;
constexpr double kOnlineBonus        = 10.0;
constexpr double kMorningBonus       = 10.0;
constexpr double kPreferredTimeBonus = 10.0;

constexpr int kMorningStart = 9 * 60;
constexpr int kMorningEnd   = 12 * 60;

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

bool meetsOnPreferredDay(const Section& section, const Constraints& constraints) {
    if (constraints.preferredDays.empty()) return true;

    for (const TimeSlot& ts : section.timeSlots) {
        if (contains(constraints.preferredDays, ts.day)) return true;
    }
    return false;
}

bool hasMorningSlot(const Section& section) {
    for (const TimeSlot& ts : section.timeSlots) {
        int start = toMinutes(ts.startTime);
        if (start >= kMorningStart && start < kMorningEnd) return true;
    }
    return false;
}

bool fitsPreferredWindow(const Section& section, const Constraints& constraints) {
    if (constraints.preferredTimeSlots.empty()) return false;

    std::vector<TimeWindow> windows;
    for (const std::string& w : constraints.preferredTimeSlots) {
        windows.push_back(parseTimeWindow(w));
    }

    for (const TimeSlot& ts : section.timeSlots) {
        int start = toMinutes(ts.startTime);
        int end   = toMinutes(ts.endTime);
        for (const TimeWindow& w : windows) {
            if (start >= w.startMinutes && end <= w.endMinutes) return true;
        }
    }
    return false;
}

} // namespace

double scoreSection(const Section& section, const Constraints& constraints) {
    double score = kBaseScore;

    score += std::min(section.seatsAvailable / 5.0, kMaxSeatsBonus);

    if (section.format == DeliveryFormat::Hybrid) {
        score += kHybridBonus;
    } else if (section.format == DeliveryFormat::Online) {
        score += kOnlineBonus;
    }

    if (hasMorningSlot(section)) score += kMorningBonus;
    if (fitsPreferredWindow(section, constraints)) score += kPreferredTimeBonus;

    return score;
}

bool collidesWithUsed(const Section& section, const UsedSlots& used) {
    for (const TimeSlot& ts : section.timeSlots) {
        auto it = used.find(ts.day);
        if (it == used.end()) continue;

        int start = toMinutes(ts.startTime);
        int end   = toMinutes(ts.endTime);
        for (const std::pair<int, int>& u : it->second) {
            if (u.first == start && u.second == end) return true;
        }
    }
    return false;
}

void commitSection(const Section& section, UsedSlots& used) {
    for (const TimeSlot& ts : section.timeSlots) {
        used[ts.day].push_back({toMinutes(ts.startTime), toMinutes(ts.endTime)});
    }
}

SectionChoice selectSection(
    const Course& course,
    UsedSlots& used,
    const Constraints& constraints,
    bool strictSlotCollisions
) {
    SectionChoice best;
    SectionChoice fallback;  // лучшая из секций, отсеянных только по занятому слоту

    for (const Section& section : course.sections) {
        if (contains(constraints.avoidProfessors, section.professor)) {
            logDebug("Курс " + course.id + ": секция " + section.id +
                     " отклонена (преподаватель " + section.professor + " в списке избегаемых)");
            continue;
        }
        if (!meetsOnPreferredDay(section, constraints)) {
            logDebug("Курс " + course.id + ": секция " + section.id +
                     " отклонена (нет занятий в предпочтительные дни)");
            continue;
        }

        double score = scoreSection(section, constraints);

        if (collidesWithUsed(section, used)) {
            logDebug("Курс " + course.id + ": секция " + section.id +
                     " совпадает с уже занятым слотом");
            if (fallback.section == nullptr || score > fallback.score) {
                fallback.section = &section;
                fallback.score = score;
                fallback.slotCollision = true;
            }
            continue;
        }

        // при равенстве остаётся первая найденная
        if (best.section == nullptr || score > best.score) {
            best.section = &section;
            best.score = score;
        }
    }

    if (best.section == nullptr && !strictSlotCollisions && fallback.section != nullptr) {
        logWarning("Курс " + course.id + ": свободной секции нет, берём секцию " +
                   fallback.section->id + " с пересечением по времени");
        best = fallback;
    }

    if (best.section != nullptr) {
        commitSection(*best.section, used);
        logDebug("Курс " + course.id + " -> секция " + best.section->id +
                 " (score=" + std::to_string(best.score) + ")");
    }

    return best;
}
