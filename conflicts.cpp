#include "conflicts.h"

#include "time_utils.h"
#include "logger.h"

static std::string describeSlot(const TimeSlot& ts) {
    return ts.startTime + "-" + ts.endTime;
}

static Conflict makeConflict(
    const ScheduledCourse& a,
    const ScheduledCourse& b,
    const TimeSlot& slotA,
    const TimeSlot& slotB,
    OverlapKind kind
) {
    Conflict c;
    c.course1 = a.title;
    c.course2 = b.title;
    c.day     = slotA.day;

    if (kind == OverlapKind::Direct) {
        c.type     = ConflictType::Direct;
        c.severity = ConflictSeverity::High;
        c.description = a.title + " (" + describeSlot(slotA) + ") overlaps " +
                        b.title + " (" + describeSlot(slotB) + ") on " + slotA.day;
    } else {
        c.type     = ConflictType::BackToBack;
        c.severity = ConflictSeverity::Medium;
        c.description = a.title + " (" + describeSlot(slotA) + ") and " +
                        b.title + " (" + describeSlot(slotB) + ") on " + slotA.day +
                        " leave " + std::to_string(kBackToBackGapMinutes) +
                        " minutes or less between them";
    }
    return c;
}

std::vector<Conflict> detectConflicts(const std::vector<ScheduledCourse>& courses) {
    std::vector<Conflict> result;
    int n = (int)courses.size();

    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            for (const TimeSlot& slotA : courses[i].timeSlots) {
                for (const TimeSlot& slotB : courses[j].timeSlots) {
                    OverlapKind kind = overlapKind(slotA, slotB);
                    if (kind == OverlapKind::None) continue;

                    Conflict c = makeConflict(courses[i], courses[j], slotA, slotB, kind);
                    logDebug(std::string(kind == OverlapKind::Direct ? "[DirectConflict] " : "[BackToBack] ") +
                             c.description);
                    result.push_back(c);
                }
            }
        }
    }

    return result;
}
