#pragma once
/*
================================================================================
Fragment 3.1 — Plan: Energy Budget (BMR -> TDEE -> daily goal)
FILE: cpp/engine/plan/energy_budget.hpp

Model:
  - BMR from the selected registry formula.
  - TDEE = BMR * activity multiplier (1.2 / 1.375 / 1.55 / 1.725).
  - Goal adjustment: lose = TDEE * 0.8, gain = TDEE + 500, maintain = TDEE.
  - daily_calorie_goal rounded to the nearest 10 kcal.

Hardening:
  - std::nullopt (Unready) when the profile is incomplete, the formula lacks
    an input it needs, or any stage is not finite and positive. No NaN ever
    escapes, and nothing throws for missing data.
  - Body-fat driven formulas use the measured body fat when present, else
    the selected body-fat estimator on the profile's circumferences.
================================================================================
*/

#include <optional>

#include "engine/core/profile.hpp"
#include "engine/core/settings.hpp"

namespace fuel {

struct EnergyBudget {
  double bmr_kcal = 0.0;                 // unrounded
  double tdee_kcal = 0.0;                // unrounded
  double daily_calorie_goal_kcal = 0.0;  // multiple of 10
};

inline constexpr double kLoseFactor = 0.8;
inline constexpr double kGainSurplusKcal = 500.0;
inline constexpr double kGoalRoundingKcal = 10.0;

// Body fat a BMR formula should consume: measured value, else the estimator.
std::optional<double> effective_body_fat(const Profile& p, BodyFatAlgorithm estimator);

std::optional<double> compute_bmr(const Profile& p, const AlgorithmSelection& sel);

double apply_goal_adjustment(double tdee_kcal, PrimaryGoal goal) noexcept;

std::optional<EnergyBudget> compute_energy_budget(const Profile& p,
                                                  const AlgorithmSelection& sel,
                                                  PrimaryGoal goal);

std::optional<EnergyBudget> compute_energy_budget(const ProfileInput& in,
                                                  const CivilDate& today,
                                                  const AlgorithmSelection& sel,
                                                  PrimaryGoal goal);

// Resting + lifestyle burn the day view shows: round(bmr * multiplier).
double compute_tdee_baseline(double bmr_kcal, ActivityLevel activity) noexcept;

}  // namespace fuel
