#pragma once
/*
================================================================================
Fragment 4.2 — Daily: Day Summary
FILE: cpp/engine/daily/daily_summary.hpp

Purpose:
  - The numbers a day view shows around the adjustment policy: eaten,
    burned, net, remaining, exercise calories credited, goal progress.

Model:
  steps kcal     = round(steps * 0.04 * weight_kg / 70)   (weight <= 0 -> 70 kg)
  activity kcal  = active calories when > 0, else steps kcal
  burned         = other exercise + activity kcal (+ BMR when include_bmr_in_net)
  net            = eaten - burned
  credited       = max(0, remaining - (goal - eaten))
  progress %     = max(0, (goal - remaining) / goal * 100), 0 when goal <= 0
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/daily/calorie_adjustment.hpp"

namespace fuel {

inline constexpr double kStepKcalAt70Kg = 0.04;
inline constexpr double kStepReferenceWeightKg = 70.0;

double steps_to_calories(double steps, double weight_kg) noexcept;
double resolve_active_or_steps(double active_kcal, double steps_kcal) noexcept;
double exercise_credited(double remaining_kcal, double goal_kcal, double eaten_kcal) noexcept;
double calorie_progress_pct(double goal_kcal, double remaining_kcal) noexcept;

struct DayActivityInput {
  double eaten_kcal = 0.0;
  double other_exercise_kcal = 0.0;  // logged workouts
  double active_kcal = 0.0;          // device "active calories" entry
  double steps = 0.0;
  double weight_kg = 0.0;

  // Device-projection only.
  double partial_burn_kcal = 0.0;
  double elapsed_fraction = 0.0;
};

struct DailySummary {
  double eaten_kcal = 0.0;
  double exercise_kcal = 0.0;   // other + active-or-steps
  double burned_kcal = 0.0;     // exercise (+ BMR when counted)
  double net_kcal = 0.0;
  double remaining_kcal = 0.0;
  double credited_kcal = 0.0;
  double progress_pct = 0.0;
  bool projection_used = false;
  double projected_burn_kcal = 0.0;
};

DailySummary summarize_day(const CalorieAdjustmentConfig& cfg,
                           const DayActivityInput& day,
                           double goal_kcal,
                           double bmr_kcal,
                           double tdee_kcal) noexcept;

}  // namespace fuel
