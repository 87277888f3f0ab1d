#include "recommendations.h"

#include "scorer.h"
#include "time_utils.h"
#include "workload.h"

#include <cstdio>

static std::string formatHours(double hours) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", hours);
    return std::string(buf);
}

static std::string joinList(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

std::vector<std::string> writeRecommendations(
    const OptimizedSchedule& primary,
    const std::vector<OptimizedSchedule>& alternatives,
    const Constraints& constraints
) {
    std::vector<std::string> out;

    // пустая неделя формально "идеальна" (оценка 100), об этом надо сказать прямо
    if (primary.courses.empty()) {
        out.push_back("No course could be placed in the schedule, so its balance score of " +
                      std::to_string(primary.balanceScore) +
                      " describes an empty week. Relax your constraints and try again.");
    }

    if (!primary.conflicts.empty()) {
        std::vector<std::string> pairs;
        for (const Conflict& c : primary.conflicts) {
            pairs.push_back(c.course1 + " / " + c.course2 + " (" + c.day + ")");
        }
        out.push_back("Resolve " + std::to_string(primary.conflicts.size()) +
                      " scheduling conflict(s) by picking other sections: " + joinList(pairs) + ".");
    }

    if (!primary.workload.balanced) {
        out.push_back("Workload is unevenly spread across the week; consider moving a course "
                      "to a lighter day to redistribute study hours.");
    }

    if (primary.totalCredits > kMaxRecommendedCredits) {
        out.push_back("Total load of " + std::to_string(primary.totalCredits) +
                      " credits exceeds " + std::to_string(kMaxRecommendedCredits) +
                      "; consider dropping a course to reduce your load.");
    }

    if (primary.difficultyBalance < kLowDifficultyBalance) {
        out.push_back("Course difficulty is unevenly mixed (balance " +
                      std::to_string((int)primary.difficultyBalance) +
                      "/100); consider swapping in an easier elective.");
    }

    std::vector<std::string> heavyDays;
    for (const std::string& day : workdays()) {
        if (hoursForDay(primary.workload, day) > kHeavyDayHours) heavyDays.push_back(day);
    }
    if (!heavyDays.empty()) {
        out.push_back("More than " + formatHours(kHeavyDayHours) + " study hours on " +
                      joinList(heavyDays) + "; spread work onto other days.");
    }

    if (!primary.droppedCourses.empty()) {
        std::vector<std::string> titles;
        for (const DroppedCourse& d : primary.droppedCourses) titles.push_back(d.title);
        out.push_back("Could not schedule " + joinList(titles) +
                      ": no section satisfied your constraints. Relax preferred days or "
                      "professor restrictions to include them.");
    }

    if (constraints.availableTime.has_value() &&
        primary.workload.total > *constraints.availableTime) {
        out.push_back("Estimated weekly workload of " + formatHours(primary.workload.total) +
                      " hours exceeds your available " + formatHours(*constraints.availableTime) +
                      " hours per week.");
    }

    for (const OptimizedSchedule& alt : alternatives) {
        if (alt.balanceScore > primary.balanceScore) {
            out.push_back("The " + alt.label + " alternative scores higher (" +
                          std::to_string(alt.balanceScore) + " vs " +
                          std::to_string(primary.balanceScore) + "); consider switching to it.");
            break;
        }
    }

    if (out.empty()) {
        out.push_back("Schedule looks well balanced: no conflicts, even workload and a "
                      "manageable credit load.");
    }

    return out;
}
