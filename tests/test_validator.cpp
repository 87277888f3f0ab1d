#include <gtest/gtest.h>

#include "errors.h"
#include "test_helpers.h"
#include "validator.h"

static std::vector<Course> validCourses() {
    return {
        course("c1", Difficulty::Beginner, {section("a", {slot("Monday", "09:00", "10:30")})})
    };
}

TEST(ValidatorTest, AcceptsWellFormedInput) {
    InputValidator validator;
    ValidationResult vr = validator.checkAll(validCourses(), Constraints{});
    EXPECT_TRUE(vr.ok);
    EXPECT_TRUE(vr.errors.empty());
    EXPECT_NO_THROW(requireValidInput(validCourses(), Constraints{}));
}

TEST(ValidatorTest, RejectsEmptyCourseList) {
    InputValidator validator;
    ValidationResult vr = validator.checkAll({}, Constraints{});
    EXPECT_FALSE(vr.ok);
    ASSERT_EQ(vr.errors.size(), 1u);
    EXPECT_EQ(vr.errors[0], "course list is empty");

    EXPECT_THROW(requireValidInput({}, Constraints{}), InvalidInputError);
}

TEST(ValidatorTest, RejectsMalformedAndInvertedSlots) {
    std::vector<Course> courses = {
        course("c1", Difficulty::Beginner, {
            section("a", {slot("Monday", "9h00", "10:30")}),
            section("b", {slot("Tuesday", "11:00", "10:00")}),
            section("c", {slot("Funday", "09:00", "10:00")})
        })
    };

    InputValidator validator;
    ValidationResult vr = validator.checkAll(courses, Constraints{});
    EXPECT_FALSE(vr.ok);
    EXPECT_EQ(vr.errors.size(), 3u);

    try {
        requireValidInput(courses, Constraints{});
        FAIL() << "expected InvalidInputError";
    } catch (const InvalidInputError& ex) {
        EXPECT_EQ(ex.details().size(), 3u);
    }
}

TEST(ValidatorTest, RejectsZeroLengthSlot) {
    std::vector<Course> courses = {
        course("c1", Difficulty::Beginner, {section("a", {slot("Monday", "10:00", "10:00")})})
    };
    EXPECT_THROW(requireValidInput(courses, Constraints{}), InvalidInputError);
}

TEST(ValidatorTest, RejectsBadConstraints) {
    Constraints cons;
    cons.preferredDays = {"Someday"};
    cons.preferredTimeSlots = {"morning"};
    cons.availableTime = -1.0;

    InputValidator validator;
    ValidationResult vr = validator.checkAll(validCourses(), cons);
    EXPECT_FALSE(vr.ok);
    EXPECT_EQ(vr.errors.size(), 3u);
}

TEST(ValidatorTest, RejectsMissingIdentityAndNegativeNumbers) {
    Course c = course("", Difficulty::Beginner, {section("a", {slot("Monday", "09:00", "10:00")}, "P",
                                                          DeliveryFormat::InPerson, -5)}, -1);
    c.title = "";

    InputValidator validator;
    ValidationResult vr = validator.checkAll({c}, Constraints{});
    EXPECT_FALSE(vr.ok);
    EXPECT_EQ(vr.errors.size(), 4u);
}

TEST(ValidatorTest, RejectsOversizedCreditCount) {
    std::vector<Course> courses = validCourses();
    courses[0].credits = kMaxCourseCredits;

    InputValidator validator;
    EXPECT_TRUE(validator.checkAll(courses, Constraints{}).ok);

    courses[0].credits = kMaxCourseCredits + 1;
    ValidationResult vr = validator.checkAll(courses, Constraints{});
    EXPECT_FALSE(vr.ok);
    ASSERT_EQ(vr.errors.size(), 1u);
    EXPECT_EQ(vr.errors[0], "course 'Course c1': credits must not exceed 40");

    // два курса по 2e9 кредитов раньше переполняли сумму
    courses[0].credits = 2000000000;
    courses.push_back(course("c2", Difficulty::Expert,
                             {section("b", {slot("Tuesday", "09:00", "10:00")})}, 2000000000));
    EXPECT_THROW(requireValidInput(courses, Constraints{}), InvalidInputError);
}

TEST(ValidatorTest, SectionlessAndDuplicateCoursesOnlyWarn) {
    std::vector<Course> courses = validCourses();
    courses.push_back(course("c1", Difficulty::Advanced, {section("b", {slot("Friday", "09:00", "10:00")})}));
    courses.push_back(course("c2", Difficulty::Advanced, {}));

    InputValidator validator;
    ValidationResult vr = validator.checkAll(courses, Constraints{});
    EXPECT_TRUE(vr.ok);
    EXPECT_EQ(vr.warnings.size(), 2u);
}
