#include <gtest/gtest.h>

#include "errors.h"
#include "time_utils.h"

TEST(TimeUtilsTest, ConvertsWallClockToMinutes) {
    EXPECT_EQ(toMinutes("00:00"), 0);
    EXPECT_EQ(toMinutes("09:30"), 570);
    EXPECT_EQ(toMinutes("9:05"), 545);
    EXPECT_EQ(toMinutes("23:59"), 1439);
}

TEST(TimeUtilsTest, RejectsMalformedTimes) {
    EXPECT_THROW(toMinutes(""), InvalidInputError);
    EXPECT_THROW(toMinutes("0930"), InvalidInputError);
    EXPECT_THROW(toMinutes("09-30"), InvalidInputError);
    EXPECT_THROW(toMinutes("ab:cd"), InvalidInputError);
    EXPECT_THROW(toMinutes("09:3"), InvalidInputError);
    EXPECT_THROW(toMinutes("24:00"), InvalidInputError);
    EXPECT_THROW(toMinutes("10:60"), InvalidInputError);
}

TEST(TimeUtilsTest, FormatsMinutesAsWallClock) {
    EXPECT_EQ(formatTime(545), "09:05");
    EXPECT_EQ(formatTime(18 * 60), "18:00");
}

TEST(TimeUtilsTest, ParsesTimeWindows) {
    TimeWindow w = parseTimeWindow("09:00-12:00");
    EXPECT_EQ(w.startMinutes, 540);
    EXPECT_EQ(w.endMinutes, 720);

    EXPECT_THROW(parseTimeWindow("12:00-09:00"), InvalidInputError);
    EXPECT_THROW(parseTimeWindow("09:00"), InvalidInputError);
}

TEST(TimeUtilsTest, OverlappingSlotsAreDirect) {
    TimeSlot a{"Monday", "09:00", "10:30"};
    TimeSlot b{"Monday", "10:00", "11:00"};
    EXPECT_EQ(overlapKind(a, b), OverlapKind::Direct);
    EXPECT_EQ(overlapKind(b, a), OverlapKind::Direct);

    TimeSlot same{"Monday", "09:00", "10:30"};
    EXPECT_EQ(overlapKind(a, same), OverlapKind::Direct);
}

TEST(TimeUtilsTest, ShortGapsAreBackToBack) {
    TimeSlot a{"Monday", "09:00", "10:00"};

    EXPECT_EQ(overlapKind(a, TimeSlot{"Monday", "10:00", "11:00"}), OverlapKind::BackToBack);
    EXPECT_EQ(overlapKind(a, TimeSlot{"Monday", "10:10", "11:00"}), OverlapKind::BackToBack);
    EXPECT_EQ(overlapKind(a, TimeSlot{"Monday", "10:15", "11:00"}), OverlapKind::BackToBack);
    EXPECT_EQ(overlapKind(a, TimeSlot{"Monday", "07:00", "08:50"}), OverlapKind::BackToBack);
    EXPECT_EQ(overlapKind(a, TimeSlot{"Monday", "10:16", "11:00"}), OverlapKind::None);
}

TEST(TimeUtilsTest, DifferentDaysNeverClash) {
    TimeSlot a{"Monday", "09:00", "10:00"};
    TimeSlot b{"Tuesday", "09:00", "10:00"};
    EXPECT_EQ(overlapKind(a, b), OverlapKind::None);
}

TEST(TimeUtilsTest, NormalizesWeekdayNames) {
    EXPECT_EQ(normalizeWeekday("monday").value(), "Monday");
    EXPECT_EQ(normalizeWeekday("FRIDAY").value(), "Friday");
    EXPECT_EQ(normalizeWeekday("Sunday").value(), "Sunday");
    EXPECT_FALSE(normalizeWeekday("Funday").has_value());
    EXPECT_FALSE(normalizeWeekday("").has_value());

    EXPECT_TRUE(isWeekend("Saturday"));
    EXPECT_FALSE(isWeekend("Friday"));
    EXPECT_EQ(workdays().size(), 5u);
}
