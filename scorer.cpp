#include "scorer.h"

#include <algorithm>
#include <cmath>

namespace {

constexpr double kVarianceWeight     = 30.0;
constexpr double kConflictPenalty    = 20.0;
constexpr double kBalancedBonus      = 10.0;
constexpr double kDifficultyWeight   = 0.2;
constexpr double kExtraCreditPenalty = 5.0;

} // namespace

int difficultyLevel(Difficulty d) {
    switch (d) {
        case Difficulty::Beginner:     return 1;
        case Difficulty::Intermediate: return 2;
        case Difficulty::Advanced:     return 3;
        case Difficulty::Expert:       return 4;
    }
    return 1;
}

double difficultyBalance(const std::vector<ScheduledCourse>& courses) {
    if (courses.empty()) return 100.0;

    double mean = 0.0;
    for (const ScheduledCourse& sc : courses) mean += difficultyLevel(sc.difficulty);
    mean /= courses.size();

    // дисперсия генеральной совокупности
    double variance = 0.0;
    for (const ScheduledCourse& sc : courses) {
        double d = difficultyLevel(sc.difficulty) - mean;
        variance += d * d;
    }
    variance /= courses.size();

    return std::max(100.0 - variance * kVarianceWeight, 0.0);
}

double rawBalanceScore(
    int conflictCount,
    bool workloadBalanced,
    double difficultyBalanceValue,
    int totalCredits
) {
    double score = 100.0;
    score -= kConflictPenalty * conflictCount;
    if (workloadBalanced) score += kBalancedBonus;
    score += difficultyBalanceValue * kDifficultyWeight;
    if (totalCredits > kMaxRecommendedCredits) {
        score -= kExtraCreditPenalty * (totalCredits - kMaxRecommendedCredits);
    }
    return score;
}

int balanceScore(
    int conflictCount,
    bool workloadBalanced,
    double difficultyBalanceValue,
    int totalCredits
) {
    double score = rawBalanceScore(conflictCount, workloadBalanced,
                                   difficultyBalanceValue, totalCredits);
    score = std::min(std::max(score, 0.0), 100.0);
    return (int)std::lround(score);
}
