#include <gtest/gtest.h>

#include "recommendations.h"
#include "test_helpers.h"

static OptimizedSchedule healthySchedule() {
    OptimizedSchedule s;
    s.id = "schedule-s1-primary";
    s.label = "primary";
    s.courses = {scheduled("Algebra", {slot("Monday", "09:00", "10:30")})};
    s.totalCredits = 15;
    s.difficultyBalance = 100.0;
    s.balanceScore = 100;
    s.workload.monday = 2.0;
    s.workload.tuesday = 2.0;
    s.workload.wednesday = 2.0;
    s.workload.thursday = 2.0;
    s.workload.friday = 2.0;
    s.workload.total = 10.0;
    s.workload.balanced = true;
    return s;
}

static Conflict conflict(const std::string& a, const std::string& b) {
    return Conflict{a, b, "Monday", ConflictType::Direct, ConflictSeverity::High, a + " overlaps " + b};
}

static bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

TEST(RecommendationsTest, HealthyScheduleGetsSingleConfirmation) {
    std::vector<std::string> recs = writeRecommendations(healthySchedule(), {}, Constraints{});
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_TRUE(contains(recs[0], "well balanced"));
}

TEST(RecommendationsTest, CountsConflicts) {
    OptimizedSchedule s = healthySchedule();
    s.conflicts = {conflict("Algebra", "Physics"), conflict("Physics", "Biology")};

    std::vector<std::string> recs = writeRecommendations(s, {}, Constraints{});
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_TRUE(contains(recs[0], "Resolve 2 scheduling conflict(s)"));
    EXPECT_TRUE(contains(recs[0], "Algebra / Physics"));
}

TEST(RecommendationsTest, RulesFireInFixedOrder) {
    OptimizedSchedule s = healthySchedule();
    s.conflicts = {conflict("Algebra", "Physics")};
    s.workload.balanced = false;
    s.workload.monday = 9.0;
    s.totalCredits = 21;
    s.difficultyBalance = 32.5;

    std::vector<std::string> recs = writeRecommendations(s, {}, Constraints{});
    ASSERT_EQ(recs.size(), 5u);
    EXPECT_TRUE(contains(recs[0], "Resolve 1 scheduling conflict(s)"));
    EXPECT_TRUE(contains(recs[1], "unevenly spread"));
    EXPECT_TRUE(contains(recs[2], "21 credits"));
    EXPECT_TRUE(contains(recs[3], "difficulty"));
    EXPECT_TRUE(contains(recs[4], "Monday"));
    EXPECT_FALSE(contains(recs[4], "Tuesday"));
}

TEST(RecommendationsTest, NamesDroppedCourses) {
    OptimizedSchedule s = healthySchedule();
    s.droppedCourses = {DroppedCourse{"c9", "Organic Chemistry", 4}};

    std::vector<std::string> recs = writeRecommendations(s, {}, Constraints{});
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_TRUE(contains(recs[0], "Organic Chemistry"));
}

TEST(RecommendationsTest, WarnsWhenWorkloadExceedsAvailableTime) {
    OptimizedSchedule s = healthySchedule();

    Constraints roomy;
    roomy.availableTime = 20.0;
    EXPECT_EQ(writeRecommendations(s, {}, roomy).size(), 1u);

    Constraints tight;
    tight.availableTime = 6.0;
    std::vector<std::string> recs = writeRecommendations(s, {}, tight);
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_TRUE(contains(recs[0], "10.0 hours exceeds your available 6.0 hours"));
}

TEST(RecommendationsTest, PointsToBetterAlternative) {
    OptimizedSchedule primary = healthySchedule();
    primary.balanceScore = 80;
    primary.conflicts = {conflict("Algebra", "Physics")};

    OptimizedSchedule morning = healthySchedule();
    morning.label = "morning";
    morning.balanceScore = 100;

    std::vector<std::string> recs = writeRecommendations(primary, {morning}, Constraints{});
    ASSERT_EQ(recs.size(), 2u);
    EXPECT_TRUE(contains(recs[1], "morning"));
    EXPECT_TRUE(contains(recs[1], "100 vs 80"));
}

TEST(RecommendationsTest, EmptyScheduleIsNotReportedAsBalanced) {
    OptimizedSchedule s = healthySchedule();
    s.courses.clear();
    s.totalCredits = 0;
    s.droppedCourses = {DroppedCourse{"c1", "Algebra", 3}};

    std::vector<std::string> recs = writeRecommendations(s, {}, Constraints{});
    ASSERT_EQ(recs.size(), 2u);
    EXPECT_TRUE(contains(recs[0], "No course could be placed"));
    EXPECT_TRUE(contains(recs[0], "empty week"));
    EXPECT_TRUE(contains(recs[1], "Could not schedule Algebra"));
    for (const std::string& rec : recs) {
        EXPECT_FALSE(contains(rec, "well balanced"));
    }
}
