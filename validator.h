#include "model.h"

#pragma once

// Больше кредитов у одного курса не бывает; заодно защищает суммы от переполнения
constexpr int kMaxCourseCredits = 40;

struct ValidationResult {
    bool ok;                             // true, если ошибок нет
    std::vector<std::string> errors;     // причины отказа
    std::vector<std::string> warnings;   // замечания, расчёт не блокируют
};

// Проверка входа оптимизатора до запуска жадного алгоритма.
class InputValidator {
    public:
        ValidationResult checkAll(
            const std::vector<Course>& courses,
            const Constraints& constraints
        );

    private:
        void checkCourseList(
            const std::vector<Course>& courses,
            ValidationResult& result
        );

        void checkSections(
            const Course& course,
            ValidationResult& result
        );

        void checkTimeSlot(
            const Course& course,
            const Section& section,
            const TimeSlot& slot,
            ValidationResult& result
        );

        void checkConstraints(
            const Constraints& constraints,
            ValidationResult& result
        );
    };

// Бросает InvalidInputError со всеми ошибками, если вход некорректен
void requireValidInput(const std::vector<Course>& courses, const Constraints& constraints);
