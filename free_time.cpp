#include "free_time.h"

#include "time_utils.h"

#include <algorithm>
#include <utility>

std::vector<FreeTimeBlock> calculateFreeTime(const std::vector<ScheduledCourse>& courses) {
    std::vector<FreeTimeBlock> blocks;

    for (const std::string& day : workdays()) {
        // (start, end) всех пар этого дня
        std::vector<std::pair<int, int>> daySlots;
        for (const ScheduledCourse& sc : courses) {
            for (const TimeSlot& ts : sc.timeSlots) {
                if (ts.day != day) continue;
                daySlots.push_back({toMinutes(ts.startTime), toMinutes(ts.endTime)});
            }
        }

        if (daySlots.empty()) {
            blocks.push_back(FreeTimeBlock{
                day,
                formatTime(kDayStartMinutes),
                formatTime(kDayEndMinutes),
                kDayEndMinutes - kDayStartMinutes
            });
            continue;
        }

        std::stable_sort(daySlots.begin(), daySlots.end(),
            [](const std::pair<int, int>& a, const std::pair<int, int>& b) {
                return a.first < b.first;
            }
        );

        // busyUntil - максимум концов уже просмотренных пар, чтобы окно
        // не залезало на длинную пару, перекрывающую короткую
        int busyUntil = daySlots[0].second;
        for (size_t i = 1; i < daySlots.size(); ++i) {
            int gapStart = std::max(busyUntil, kDayStartMinutes);
            int gapEnd   = std::min(daySlots[i].first, kDayEndMinutes);

            if (gapEnd - gapStart >= kMinFreeBlockMinutes) {
                blocks.push_back(FreeTimeBlock{
                    day,
                    formatTime(gapStart),
                    formatTime(gapEnd),
                    gapEnd - gapStart
                });
            }
            busyUntil = std::max(busyUntil, daySlots[i].second);
        }
    }

    return blocks;
}
