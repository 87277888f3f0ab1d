// optimizer.cpp
#include "optimizer.h"

#include "conflicts.h"
#include "free_time.h"
#include "logger.h"
#include "recommendations.h"
#include "scorer.h"
#include "section_selector.h"
#include "time_utils.h"
#include "validator.h"
#include "workload.h"

#include <algorithm>

// --- маленькие хелперы ---

static std::string makeScheduleId(const std::string& studentId, const std::string& label) {
    if (studentId.empty()) return "schedule-" + label;
    return "schedule-" + studentId + "-" + label;
}

// Приводим дни недели к каноническому виду ("monday" -> "Monday"),
// дальше по конвейеру сравниваем строки напрямую
static std::vector<Course> normalizeCourses(const std::vector<Course>& courses) {
    std::vector<Course> result = courses;
    for (Course& c : result) {
        for (Section& s : c.sections) {
            for (TimeSlot& ts : s.timeSlots) {
                std::optional<std::string> day = normalizeWeekday(ts.day);
                if (day) ts.day = *day;
            }
        }
    }
    return result;
}

static Constraints normalizeConstraints(const Constraints& constraints) {
    Constraints result = constraints;
    for (std::string& d : result.preferredDays) {
        std::optional<std::string> day = normalizeWeekday(d);
        if (day) d = *day;
    }
    return result;
}

static ScheduledCourse makeScheduledCourse(const Course& course, const Section& section) {
    ScheduledCourse sc;
    sc.courseId      = course.id;
    sc.title         = course.title;
    sc.credits       = course.credits;
    sc.difficulty    = course.difficulty;
    sc.section       = section;
    sc.timeSlots     = section.timeSlots;
    sc.workloadHours = estimateWeeklyWorkload(course.credits, course.difficulty);
    return sc;
}

// --- приоритеты ---

bool byDifficultyAscending(const Course& a, const Course& b) {
    return difficultyLevel(a.difficulty) < difficultyLevel(b.difficulty);
}

bool byScarcity(const Course& a, const Course& b) {
    if (a.sections.size() != b.sections.size()) {
        return a.sections.size() < b.sections.size();
    }
    return byDifficultyAscending(a, b);
}

// ============================================================================
//                              ЖАДНЫЙ ПРОХОД
// ============================================================================

OptimizedSchedule buildSchedule(
    const std::string& scheduleId,
    const std::string& label,
    const std::vector<Course>& courses,
    const Constraints& constraints,
    const OptimizerOptions& options
) {
    OptimizedSchedule schedule;
    schedule.id    = scheduleId;
    schedule.label = label;

    // 1) Порядок курсов (stable_sort, чтобы равные шли в исходном порядке)
    std::vector<const Course*> order;
    for (const Course& c : courses) order.push_back(&c);

    CoursePriority priority = options.priority ? options.priority : byDifficultyAscending;
    std::stable_sort(order.begin(), order.end(),
        [&](const Course* a, const Course* b) {
            return priority(*a, *b);
        }
    );

    // 2) Выбор секций, занятые слоты живут только в этом прогоне
    UsedSlots used;
    for (const Course* course : order) {
        SectionChoice choice = selectSection(*course, used, constraints,
                                             options.strictSlotCollisions);
        if (choice.section == nullptr) {
            logWarning("[" + label + "] Курс " + course->id + " (" + course->title +
                       ") не попал в расписание: нет подходящей секции");
            schedule.droppedCourses.push_back(DroppedCourse{course->id, course->title, course->credits});
            continue;
        }

        schedule.courses.push_back(makeScheduledCourse(*course, *choice.section));
        schedule.totalCredits += course->credits;
    }

    // 3) Анализ результата
    schedule.conflicts         = detectConflicts(schedule.courses);
    schedule.freeTime          = calculateFreeTime(schedule.courses);
    schedule.workload          = distributeWorkload(schedule.courses);
    schedule.difficultyBalance = difficultyBalance(schedule.courses);

    // 4) Итоговая оценка
    schedule.balanceScore = balanceScore(
        (int)schedule.conflicts.size(),
        schedule.workload.balanced,
        schedule.difficultyBalance,
        schedule.totalCredits
    );

    logInfo("[" + label + "] курсов=" + std::to_string(schedule.courses.size()) +
            ", выброшено=" + std::to_string(schedule.droppedCourses.size()) +
            ", кредитов=" + std::to_string(schedule.totalCredits) +
            ", конфликтов=" + std::to_string(schedule.conflicts.size()) +
            ", оценка=" + std::to_string(schedule.balanceScore));

    return schedule;
}

std::vector<OptimizedSchedule> generateAlternatives(
    const std::string& studentId,
    const std::vector<Course>& courses,
    const Constraints& constraints,
    const OptimizerOptions& options
) {
    struct Variant {
        const char* label;
        const char* window;
    };
    const Variant variants[] = {
        {"morning",   kMorningWindow},
        {"afternoon", kAfternoonWindow},
    };

    int count = std::min(std::max(options.alternatives, 1), 2);

    std::vector<OptimizedSchedule> result;
    for (int i = 0; i < count; ++i) {
        Constraints variant = constraints;
        variant.preferredTimeSlots = std::vector<std::string>{variants[i].window};

        result.push_back(buildSchedule(
            makeScheduleId(studentId, variants[i].label),
            variants[i].label,
            courses,
            variant,
            options
        ));
    }

    std::stable_sort(result.begin(), result.end(),
        [](const OptimizedSchedule& a, const OptimizedSchedule& b) {
            return a.balanceScore > b.balanceScore;
        }
    );

    return result;
}

ScheduleOptimization optimizeSchedule(
    const std::string& studentId,
    const std::vector<Course>& courses,
    const std::optional<Constraints>& constraints,
    const OptimizerOptions& options
) {
    logInfo("=== Оптимизация расписания для студента " + studentId + " ===");
    logInfo("Курсов-кандидатов: " + std::to_string(courses.size()));

    Constraints raw = constraints.value_or(Constraints{});
    requireValidInput(courses, raw);

    if (options.alternatives < 1 || options.alternatives > 2) {
        logWarning("Запрошено альтернатив: " + std::to_string(options.alternatives) +
                   ", будет построено " +
                   std::to_string(std::min(std::max(options.alternatives, 1), 2)));
    }

    std::vector<Course> normalized = normalizeCourses(courses);
    Constraints cons = normalizeConstraints(raw);

    ScheduleOptimization result;
    result.studentId    = studentId;
    result.primary      = buildSchedule(makeScheduleId(studentId, "primary"), "primary",
                                        normalized, cons, options);
    result.alternatives = generateAlternatives(studentId, normalized, cons, options);
    result.balanceScore = result.primary.balanceScore;
    result.recommendations = writeRecommendations(result.primary, result.alternatives, cons);

    logInfo("=== Оптимизация завершена, оценка " + std::to_string(result.balanceScore) + " ===");
    return result;
}
