#include "api_json.h"
#include "api_dto.h"
#include "errors.h"

#include <climits>
#include <cmath>
#include <cstdint>

using nlohmann::json;

// округляем до сотых, чтобы фронт не получал 1.0285714285714285
static double round2(double h) {
    return std::round(h * 100.0) / 100.0;
}

static std::vector<std::string> stringList(const json& j, const char* key) {
    std::vector<std::string> out;
    if (j.contains(key) && j[key].is_array()) {
        for (auto& item : j[key]) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

// Целое поле без молчаливого усечения: 3.9 и 1e300 отклоняются
static int intField(const json& j, const char* key, int defaultValue) {
    if (!j.contains(key)) return defaultValue;

    const json& v = j[key];
    if (!v.is_number_integer()) {
        throw InvalidInputError(std::string("'") + key + "' must be an integer, got " + v.dump());
    }

    bool inRange = v.is_number_unsigned()
        ? v.get<std::uint64_t>() <= static_cast<std::uint64_t>(INT_MAX)
        : v.get<std::int64_t>() >= INT_MIN && v.get<std::int64_t>() <= INT_MAX;
    if (!inRange) {
        throw InvalidInputError(std::string("'") + key + "' is out of range: " + v.dump());
    }
    return v.get<int>();
}

// --- разбор входа ---

static TimeSlot timeSlotFromJson(const json& jt) {
    TimeSlot ts;
    ts.day       = jt.value("day", std::string());
    ts.startTime = jt.value("startTime", std::string());
    ts.endTime   = jt.value("endTime", std::string());
    return ts;
}

static Section sectionFromJson(const json& js) {
    Section s;
    s.id             = js.value("id", std::string());
    s.professor      = js.value("professor", std::string());
    s.format         = parseDeliveryFormat(js.value("format", std::string("in-person")));
    s.seatsAvailable = intField(js, "seatsAvailable", 0);

    if (js.contains("timeSlots") && js["timeSlots"].is_array()) {
        for (auto& jt : js["timeSlots"]) {
            s.timeSlots.push_back(timeSlotFromJson(jt));
        }
    }
    return s;
}

Course courseFromJson(const json& j) {
    Course c;
    c.id         = j.value("id", std::string());
    c.title      = j.value("title", std::string());
    c.credits    = intField(j, "credits", 0);
    c.difficulty = parseDifficulty(j.value("difficulty", std::string("intermediate")));

    if (j.contains("sections") && j["sections"].is_array()) {
        for (auto& js : j["sections"]) {
            c.sections.push_back(sectionFromJson(js));
        }
    }
    return c;
}

Constraints constraintsFromJson(const json& j) {
    Constraints c;
    c.preferredDays      = stringList(j, "preferredDays");
    c.avoidProfessors    = stringList(j, "avoidProfessors");
    c.preferredTimeSlots = stringList(j, "preferredTimeSlots");

    if (j.contains("budget") && j["budget"].is_number()) {
        c.budget = j["budget"].get<double>();
    }
    if (j.contains("availableTime") && j["availableTime"].is_number()) {
        c.availableTime = j["availableTime"].get<double>();
    }
    return c;
}

static OptimizerOptions optionsFromJson(const json& j, int defaultAlternatives) {
    OptimizerOptions o;
    o.alternatives         = intField(j, "alternatives", defaultAlternatives);
    o.strictSlotCollisions = j.value("strictSlotCollisions", false);

    std::string priority = j.value("priority", std::string("difficulty"));
    if (priority == "difficulty") {
        o.priority = byDifficultyAscending;
    } else if (priority == "scarcity") {
        o.priority = byScarcity;
    } else {
        throw InvalidInputError("unknown priority '" + priority + "', expected difficulty or scarcity");
    }
    return o;
}

OptimizeRequest parseOptimizeRequest(const json& j, int defaultAlternatives) {
    try {
        if (!j.is_object()) {
            throw InvalidInputError("request body must be a JSON object");
        }
        if (!j.contains("courses") || !j["courses"].is_array()) {
            throw InvalidInputError("request must contain a 'courses' array");
        }

        OptimizeRequest req;
        req.options.alternatives = defaultAlternatives;
        req.studentId = j.value("studentId", std::string());

        for (auto& jc : j["courses"]) {
            req.courses.push_back(courseFromJson(jc));
        }

        if (j.contains("constraints") && j["constraints"].is_object()) {
            req.constraints = constraintsFromJson(j["constraints"]);
        }

        if (j.contains("options") && j["options"].is_object()) {
            req.options = optionsFromJson(j["options"], defaultAlternatives);
        }

        return req;
    } catch (const json::exception& ex) {
        throw InvalidInputError(std::string("malformed request: ") + ex.what());
    }
}

OptimizeRequest parseOptimizeRequest(const std::string& body, int defaultAlternatives) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& ex) {
        throw InvalidInputError(std::string("invalid json: ") + ex.what());
    }
    return parseOptimizeRequest(j, defaultAlternatives);
}

// --- сериализация результата ---

static json timeSlotToJson(const TimeSlot& ts) {
    return json{
        {"day", ts.day},
        {"startTime", ts.startTime},
        {"endTime", ts.endTime}
    };
}

static json scheduledCourseToJson(const ScheduledCourse& sc) {
    json slots = json::array();
    for (const TimeSlot& ts : sc.timeSlots) slots.push_back(timeSlotToJson(ts));

    return json{
        {"courseId", sc.courseId},
        {"title", sc.title},
        {"credits", sc.credits},
        {"difficulty", difficultyToString(sc.difficulty)},
        {"section", {
            {"id", sc.section.id},
            {"professor", sc.section.professor},
            {"format", formatToString(sc.section.format)},
            {"seatsAvailable", sc.section.seatsAvailable}
        }},
        {"timeSlots", slots},
        {"workloadHours", round2(sc.workloadHours)}
    };
}

json scheduleToJson(const OptimizedSchedule& s) {
    json courses = json::array();
    for (const ScheduledCourse& sc : s.courses) courses.push_back(scheduledCourseToJson(sc));

    json dropped = json::array();
    for (const DroppedCourse& d : s.droppedCourses) {
        dropped.push_back({{"courseId", d.courseId}, {"title", d.title}, {"credits", d.credits}});
    }

    json conflicts = json::array();
    for (const Conflict& c : s.conflicts) {
        conflicts.push_back({
            {"course1", c.course1},
            {"course2", c.course2},
            {"day", c.day},
            {"type", conflictTypeToString(c.type)},
            {"severity", severityToString(c.severity)},
            {"description", c.description}
        });
    }

    json freeTime = json::array();
    for (const FreeTimeBlock& b : s.freeTime) {
        freeTime.push_back({
            {"day", b.day},
            {"startTime", b.startTime},
            {"endTime", b.endTime},
            {"durationMinutes", b.durationMinutes}
        });
    }

    json timetable = json::array();
    for (const ClassView& v : buildClassViews(s)) {
        timetable.push_back({
            {"day", v.day},
            {"startTime", v.startTime},
            {"endTime", v.endTime},
            {"courseId", v.courseId},
            {"courseTitle", v.courseTitle},
            {"sectionId", v.sectionId},
            {"professor", v.professor},
            {"format", v.format}
        });
    }

    const WorkloadDistribution& w = s.workload;

    return json{
        {"id", s.id},
        {"label", s.label},
        {"courses", courses},
        {"droppedCourses", dropped},
        {"totalCredits", s.totalCredits},
        {"difficultyBalance", round2(s.difficultyBalance)},
        {"balanceScore", s.balanceScore},
        {"conflicts", conflicts},
        {"freeTime", freeTime},
        {"workload", {
            {"monday", round2(w.monday)},
            {"tuesday", round2(w.tuesday)},
            {"wednesday", round2(w.wednesday)},
            {"thursday", round2(w.thursday)},
            {"friday", round2(w.friday)},
            {"weekend", round2(w.weekend)},
            {"total", round2(w.total)},
            {"balanced", w.balanced}
        }},
        {"timetable", timetable}
    };
}

json optimizationToJson(const ScheduleOptimization& result) {
    json alternatives = json::array();
    for (const OptimizedSchedule& s : result.alternatives) {
        alternatives.push_back(scheduleToJson(s));
    }

    return json{
        {"studentId", result.studentId},
        {"primary", scheduleToJson(result.primary)},
        {"alternatives", alternatives},
        {"balanceScore", result.balanceScore},
        {"recommendations", result.recommendations}
    };
}
