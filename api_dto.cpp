#include "api_dto.h"
#include "model.h"
#include "time_utils.h"

#include <algorithm>

static int dayOrder(const std::string& day) {
    static const char* order[] = {
        "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
    };
    for (int i = 0; i < 7; ++i) {
        if (day == order[i]) return i;
    }
    return 7;
}

std::vector<ClassView> buildClassViews(const OptimizedSchedule& schedule) {
    std::vector<ClassView> result;

    for (const ScheduledCourse& sc : schedule.courses) {
        for (const TimeSlot& ts : sc.timeSlots) {
            ClassView v;
            v.day         = ts.day;
            v.startTime   = formatTime(toMinutes(ts.startTime));
            v.endTime     = formatTime(toMinutes(ts.endTime));
            v.courseId    = sc.courseId;
            v.courseTitle = sc.title;
            v.sectionId   = sc.section.id;
            v.professor   = sc.section.professor;
            v.format      = formatToString(sc.section.format);
            result.push_back(v);
        }
    }

    std::stable_sort(result.begin(), result.end(),
        [](const ClassView& a, const ClassView& b) {
            int da = dayOrder(a.day);
            int db = dayOrder(b.day);
            if (da != db) return da < db;
            return a.startTime < b.startTime;
        }
    );

    return result;
}
