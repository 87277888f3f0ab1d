#pragma once

#include <vector>

#include "model.h"

constexpr int kMaxRecommendedCredits = 18;

// beginner=1 .. expert=4
int difficultyLevel(Difficulty d);

// max(100 - дисперсия*30, 0); для пустого расписания 100
double difficultyBalance(const std::vector<ScheduledCourse>& courses);

// Итоговая оценка 0..100 (до округления и обрезки)
double rawBalanceScore(
    int conflictCount,
    bool workloadBalanced,
    double difficultyBalanceValue,
    int totalCredits
);

// Обрезанная в [0, 100] и округлённая оценка
int balanceScore(
    int conflictCount,
    bool workloadBalanced,
    double difficultyBalanceValue,
    int totalCredits
);
