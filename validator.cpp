#include "validator.h"
#include "errors.h"
#include "logger.h"
#include "time_utils.h"

#include <set>

static std::string courseLabel(const Course& course) {
    if (!course.title.empty()) return "course '" + course.title + "'";
    if (!course.id.empty()) return "course '" + course.id + "'";
    return "course <unnamed>";
}

void InputValidator::checkCourseList(
    const std::vector<Course>& courses,
    ValidationResult& result
) {
    if (courses.empty()) {
        result.ok = false;
        result.errors.push_back("course list is empty");
        return;
    }

    std::set<std::string> seenIds;
    for (const Course& course : courses) {
        if (course.id.empty()) {
            result.ok = false;
            result.errors.push_back(courseLabel(course) + ": missing id");
        } else if (!seenIds.insert(course.id).second) {
            result.warnings.push_back("duplicate course id '" + course.id + "'");
        }

        if (course.title.empty()) {
            result.ok = false;
            result.errors.push_back(courseLabel(course) + ": missing title");
        }

        if (course.credits < 0) {
            result.ok = false;
            result.errors.push_back(courseLabel(course) + ": credits must not be negative");
        } else if (course.credits > kMaxCourseCredits) {
            result.ok = false;
            result.errors.push_back(courseLabel(course) + ": credits must not exceed " +
                                    std::to_string(kMaxCourseCredits));
        }

        if (course.sections.empty()) {
            // курс без секций просто не попадёт в расписание
            result.warnings.push_back(courseLabel(course) + " has no sections");
        }

        checkSections(course, result);
    }
}

void InputValidator::checkSections(
    const Course& course,
    ValidationResult& result
) {
    for (const Section& section : course.sections) {
        if (section.seatsAvailable < 0) {
            result.ok = false;
            result.errors.push_back(courseLabel(course) + ", section '" + section.id +
                                    "': seatsAvailable must not be negative");
        }

        if (section.timeSlots.empty()) {
            result.warnings.push_back(courseLabel(course) + ", section '" + section.id +
                                      "' has no time slots");
        }

        for (const TimeSlot& slot : section.timeSlots) {
            checkTimeSlot(course, section, slot, result);
        }
    }
}

void InputValidator::checkTimeSlot(
    const Course& course,
    const Section& section,
    const TimeSlot& slot,
    ValidationResult& result
) {
    std::string where = courseLabel(course) + ", section '" + section.id + "'";

    if (!normalizeWeekday(slot.day).has_value()) {
        result.ok = false;
        result.errors.push_back(where + ": unknown weekday '" + slot.day + "'");
    }

    try {
        int start = toMinutes(slot.startTime);
        int end   = toMinutes(slot.endTime);
        if (end <= start) {
            result.ok = false;
            result.errors.push_back(where + ": slot " + slot.startTime + "-" + slot.endTime +
                                    " must end after it starts");
        }
    } catch (const InvalidInputError& ex) {
        result.ok = false;
        result.errors.push_back(where + ": " + ex.what());
    }
}

void InputValidator::checkConstraints(
    const Constraints& constraints,
    ValidationResult& result
) {
    for (const std::string& day : constraints.preferredDays) {
        if (!normalizeWeekday(day).has_value()) {
            result.ok = false;
            result.errors.push_back("constraints: unknown preferred day '" + day + "'");
        }
    }

    for (const std::string& window : constraints.preferredTimeSlots) {
        try {
            parseTimeWindow(window);
        } catch (const InvalidInputError& ex) {
            result.ok = false;
            result.errors.push_back(std::string("constraints: ") + ex.what());
        }
    }

    if (constraints.availableTime.has_value() && *constraints.availableTime < 0) {
        result.ok = false;
        result.errors.push_back("constraints: availableTime must not be negative");
    }

    if (constraints.budget.has_value() && *constraints.budget < 0) {
        result.ok = false;
        result.errors.push_back("constraints: budget must not be negative");
    }
}

ValidationResult InputValidator::checkAll(
    const std::vector<Course>& courses,
    const Constraints& constraints
) {
    ValidationResult result;
    result.ok = true;

    checkCourseList(courses, result);
    checkConstraints(constraints, result);

    for (const std::string& w : result.warnings) {
        logWarning("[Validation] " + w);
    }
    for (const std::string& e : result.errors) {
        logError("[Validation] " + e);
    }

    return result;
}

void requireValidInput(const std::vector<Course>& courses, const Constraints& constraints) {
    InputValidator validator;
    ValidationResult vr = validator.checkAll(courses, constraints);
    if (!vr.ok) {
        throw InvalidInputError(
            "invalid optimizer input: " + std::to_string(vr.errors.size()) + " error(s)",
            vr.errors
        );
    }
}
