#pragma once

#include <string>
#include <vector>

struct OptimizedSchedule;

// Одна строка недельной сетки для фронта
struct ClassView {
    std::string day;        // "Monday"
    std::string startTime;  // "09:00"
    std::string endTime;    // "10:30"
    std::string courseId;
    std::string courseTitle;
    std::string sectionId;
    std::string professor;
    std::string format;     // "in-person" / "hybrid" / "online"
};

// Разворачивает расписание в плоский список пар, упорядоченный по дню и времени
std::vector<ClassView> buildClassViews(const OptimizedSchedule& schedule);
