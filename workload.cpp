#include "workload.h"

#include "time_utils.h"

#include <set>

double difficultyMultiplier(Difficulty d) {
    switch (d) {
        case Difficulty::Beginner:     return 0.8;
        case Difficulty::Intermediate: return 1.0;
        case Difficulty::Advanced:     return 1.3;
        case Difficulty::Expert:       return 1.5;
    }
    return 1.0;
}

double estimateWeeklyWorkload(int credits, Difficulty d) {
    return credits * 3.0 * difficultyMultiplier(d);
}

static double* bucketForDay(WorkloadDistribution& w, const std::string& day) {
    if (day == "Monday")    return &w.monday;
    if (day == "Tuesday")   return &w.tuesday;
    if (day == "Wednesday") return &w.wednesday;
    if (day == "Thursday")  return &w.thursday;
    if (day == "Friday")    return &w.friday;
    if (isWeekend(day))     return &w.weekend;
    return nullptr;
}

double hoursForDay(const WorkloadDistribution& w, const std::string& day) {
    if (day == "Monday")    return w.monday;
    if (day == "Tuesday")   return w.tuesday;
    if (day == "Wednesday") return w.wednesday;
    if (day == "Thursday")  return w.thursday;
    if (day == "Friday")    return w.friday;
    return 0.0;
}

WorkloadDistribution distributeWorkload(const std::vector<ScheduledCourse>& courses) {
    WorkloadDistribution w;

    for (const ScheduledCourse& sc : courses) {
        double perDay = sc.workloadHours / kWorkloadAmortizationDays;

        // каждый день курса учитываем один раз, даже если в нём две пары
        std::set<std::string> days;
        for (const TimeSlot& ts : sc.timeSlots) days.insert(ts.day);

        for (const std::string& day : days) {
            double* bucket = bucketForDay(w, day);
            if (bucket) *bucket += perDay;
        }
    }

    double weekdaySum = w.monday + w.tuesday + w.wednesday + w.thursday + w.friday;
    w.total = weekdaySum + w.weekend;

    double average = weekdaySum / 5.0;
    w.balanced = true;
    for (const std::string& day : workdays()) {
        if (hoursForDay(w, day) > kImbalanceFactor * average) {
            w.balanced = false;
            break;
        }
    }

    return w;
}
