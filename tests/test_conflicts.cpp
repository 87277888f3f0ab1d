#include <gtest/gtest.h>

#include "conflicts.h"
#include "test_helpers.h"

TEST(ConflictsTest, IdenticalSlotsAreOneDirectConflict) {
    std::vector<ScheduledCourse> courses = {
        scheduled("X", {slot("Monday", "09:00", "10:30")}),
        scheduled("Y", {slot("Monday", "09:00", "10:30")})
    };

    std::vector<Conflict> conflicts = detectConflicts(courses);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].course1, "X");
    EXPECT_EQ(conflicts[0].course2, "Y");
    EXPECT_EQ(conflicts[0].day, "Monday");
    EXPECT_EQ(conflicts[0].type, ConflictType::Direct);
    EXPECT_EQ(conflicts[0].severity, ConflictSeverity::High);
}

TEST(ConflictsTest, ShortBreakIsMediumBackToBack) {
    std::vector<ScheduledCourse> courses = {
        scheduled("X", {slot("Monday", "09:00", "10:00")}),
        scheduled("Y", {slot("Monday", "10:10", "11:00")})
    };

    std::vector<Conflict> conflicts = detectConflicts(courses);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].type, ConflictType::BackToBack);
    EXPECT_EQ(conflicts[0].severity, ConflictSeverity::Medium);
}

TEST(ConflictsTest, EverySlotPairIsReported) {
    std::vector<ScheduledCourse> courses = {
        scheduled("X", {slot("Monday", "09:00", "10:00"), slot("Wednesday", "09:00", "10:00")}),
        scheduled("Y", {slot("Monday", "09:30", "10:30"), slot("Wednesday", "09:30", "10:30")})
    };

    EXPECT_EQ(detectConflicts(courses).size(), 2u);
}

TEST(ConflictsTest, ChecksEveryCoursePair) {
    std::vector<ScheduledCourse> courses = {
        scheduled("A", {slot("Tuesday", "09:00", "11:00")}),
        scheduled("B", {slot("Tuesday", "10:00", "12:00")}),
        scheduled("C", {slot("Tuesday", "11:30", "13:00")}),
        scheduled("D", {slot("Friday", "09:00", "10:00")})
    };

    // A-B и B-C пересекаются, A-C разделены получасом, D в другой день
    std::vector<Conflict> conflicts = detectConflicts(courses);
    ASSERT_EQ(conflicts.size(), 2u);
    EXPECT_EQ(conflicts[0].course1, "A");
    EXPECT_EQ(conflicts[0].course2, "B");
    EXPECT_EQ(conflicts[1].course1, "B");
    EXPECT_EQ(conflicts[1].course2, "C");
}

TEST(ConflictsTest, SeparatedCoursesHaveNoConflicts) {
    std::vector<ScheduledCourse> courses = {
        scheduled("X", {slot("Monday", "09:00", "10:00")}),
        scheduled("Y", {slot("Monday", "10:30", "11:30")}),
        scheduled("Z", {slot("Tuesday", "09:00", "10:00")})
    };

    EXPECT_TRUE(detectConflicts(courses).empty());
    EXPECT_TRUE(detectConflicts({}).empty());
}
