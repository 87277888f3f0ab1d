#pragma once

#include <string>
#include <vector>
#include <optional>

// --- входные данные (каталог курсов от вызывающего сервиса) ---

enum class Difficulty {
    Beginner,
    Intermediate,
    Advanced,
    Expert
};

enum class DeliveryFormat {
    InPerson,
    Hybrid,
    Online
};

struct TimeSlot {
    std::string day;        // "Monday" .. "Sunday"
    std::string startTime;  // "09:00"
    std::string endTime;    // "10:30"
};

struct Section {
    std::string id;
    std::string professor;
    DeliveryFormat format;
    int seatsAvailable;
    std::vector<TimeSlot> timeSlots;
};

struct Course {
    std::string id;
    std::string title;
    int credits;
    Difficulty difficulty;
    std::vector<Section> sections;
};

struct Constraints {
    std::vector<std::string> preferredDays;
    std::vector<std::string> avoidProfessors;
    std::vector<std::string> preferredTimeSlots;  // "HH:MM-HH:MM"
    std::optional<double> budget;                 // передаётся насквозь
    std::optional<double> availableTime;          // часов в неделю
};

// --- результат оптимизации ---

struct ScheduledCourse {
    std::string courseId;
    std::string title;
    int credits;
    Difficulty difficulty;
    Section section;
    std::vector<TimeSlot> timeSlots;
    double workloadHours;   // оценка часов в неделю
};

enum class ConflictType {
    Direct,
    BackToBack
};

enum class ConflictSeverity {
    High,
    Medium
};

struct Conflict {
    std::string course1;
    std::string course2;
    std::string day;
    ConflictType type;
    ConflictSeverity severity;
    std::string description;
};

struct FreeTimeBlock {
    std::string day;
    std::string startTime;
    std::string endTime;
    int durationMinutes;
};

struct WorkloadDistribution {
    double monday = 0.0;
    double tuesday = 0.0;
    double wednesday = 0.0;
    double thursday = 0.0;
    double friday = 0.0;
    double weekend = 0.0;
    double total = 0.0;
    bool balanced = true;
};

struct DroppedCourse {
    std::string courseId;
    std::string title;
    int credits;
};

struct OptimizedSchedule {
    std::string id;
    std::string label;      // "primary" / "morning" / "afternoon"
    std::vector<ScheduledCourse> courses;
    std::vector<DroppedCourse> droppedCourses;
    int totalCredits = 0;
    double difficultyBalance = 100.0;
    int balanceScore = 0;
    std::vector<Conflict> conflicts;
    std::vector<FreeTimeBlock> freeTime;
    WorkloadDistribution workload;
};

struct ScheduleOptimization {
    std::string studentId;
    OptimizedSchedule primary;
    std::vector<OptimizedSchedule> alternatives;
    int balanceScore = 0;
    std::vector<std::string> recommendations;
};

// --- вспомогательные преобразования enum <-> строка ---

std::string difficultyToString(Difficulty d);
std::string formatToString(DeliveryFormat f);
std::string conflictTypeToString(ConflictType t);
std::string severityToString(ConflictSeverity s);

// Бросают InvalidInputError для неизвестных значений
Difficulty parseDifficulty(const std::string& s);
DeliveryFormat parseDeliveryFormat(const std::string& s);
