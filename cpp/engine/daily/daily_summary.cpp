#include "engine/daily/daily_summary.hpp"

#include <algorithm>

#include "engine/core/numeric.hpp"

namespace fuel {

double steps_to_calories(double steps, double weight_kg) noexcept {
  const double s = nonneg_or(steps, 0.0);
  const double w = positive_or(weight_kg, kStepReferenceWeightKg);
  return round_half_up(s * kStepKcalAt70Kg * (w / kStepReferenceWeightKg));
}

double resolve_active_or_steps(double active_kcal, double steps_kcal) noexcept {
  if (is_positive(active_kcal)) return active_kcal;
  return nonneg_or(steps_kcal, 0.0);
}

double exercise_credited(double remaining_kcal, double goal_kcal, double eaten_kcal) noexcept {
  return std::max(0.0, remaining_kcal - (goal_kcal - eaten_kcal));
}

double calorie_progress_pct(double goal_kcal, double remaining_kcal) noexcept {
  if (!is_positive(goal_kcal)) return 0.0;
  return std::max(0.0, (goal_kcal - remaining_kcal) / goal_kcal * 100.0);
}

DailySummary summarize_day(const CalorieAdjustmentConfig& cfg,
                           const DayActivityInput& day,
                           double goal_kcal,
                           double bmr_kcal,
                           double tdee_kcal) noexcept {
  const double bmr_counted = cfg.include_bmr_in_net ? nonneg_or(bmr_kcal, 0.0) : 0.0;

  DailySummary s;
  s.eaten_kcal = day.eaten_kcal;
  s.exercise_kcal = nonneg_or(day.other_exercise_kcal, 0.0) +
                    resolve_active_or_steps(day.active_kcal,
                                            steps_to_calories(day.steps, day.weight_kg));
  s.burned_kcal = s.exercise_kcal + bmr_counted;
  s.net_kcal = s.eaten_kcal - s.burned_kcal;

  ActivityEnergyRecord rec;
  rec.eaten_kcal = day.eaten_kcal;
  rec.burned_kcal = s.exercise_kcal;
  rec.bmr_credit_kcal = bmr_counted;
  rec.partial_burn_kcal = day.partial_burn_kcal;
  rec.elapsed_fraction = day.elapsed_fraction;

  const AdjustmentBreakdown adj = compute_adjustment(cfg, rec, goal_kcal, tdee_kcal);
  s.remaining_kcal = adj.remaining_kcal;
  s.projection_used = adj.projection_used;
  s.projected_burn_kcal = adj.projected_burn_kcal;
  s.credited_kcal = exercise_credited(s.remaining_kcal, goal_kcal, s.eaten_kcal);
  s.progress_pct = calorie_progress_pct(goal_kcal, s.remaining_kcal);
  return s;
}

}  // namespace fuel
