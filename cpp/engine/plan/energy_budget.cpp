#include "engine/plan/energy_budget.hpp"

#include "engine/algorithms/registry.hpp"
#include "engine/core/numeric.hpp"

namespace fuel {

std::optional<double> effective_body_fat(const Profile& p, BodyFatAlgorithm estimator) {
  if (p.body_fat_pct && is_positive(*p.body_fat_pct) && *p.body_fat_pct < 100.0) {
    return p.body_fat_pct;
  }

  BodyFatInput in;
  in.sex = p.sex;
  in.age_years = static_cast<double>(p.age_years);
  in.weight_kg = p.weight_kg;
  in.height_cm = p.height_cm;
  in.waist_cm = p.waist_cm;
  in.neck_cm = p.neck_cm;
  in.hips_cm = p.hips_cm;
  return registry::estimate_body_fat(estimator, in);
}

std::optional<double> compute_bmr(const Profile& p, const AlgorithmSelection& sel) {
  if (!p.complete()) return std::nullopt;

  BmrInput in;
  in.sex = p.sex;
  in.weight_kg = p.weight_kg;
  in.height_cm = p.height_cm;
  in.age_years = static_cast<double>(p.age_years);
  if (bmr_uses_body_fat(sel.bmr)) {
    in.body_fat_pct = effective_body_fat(p, sel.body_fat);
  }

  const auto bmr = registry::evaluate_bmr(sel.bmr, in);
  if (!bmr || !is_positive(*bmr)) return std::nullopt;
  return bmr;
}

double apply_goal_adjustment(double tdee_kcal, PrimaryGoal goal) noexcept {
  switch (goal) {
    case PrimaryGoal::Lose:     return tdee_kcal * kLoseFactor;
    case PrimaryGoal::Gain:     return tdee_kcal + kGainSurplusKcal;
    case PrimaryGoal::Maintain: return tdee_kcal;
  }
  return tdee_kcal;
}

std::optional<EnergyBudget> compute_energy_budget(const Profile& p,
                                                  const AlgorithmSelection& sel,
                                                  PrimaryGoal goal) {
  const auto bmr = compute_bmr(p, sel);
  if (!bmr) return std::nullopt;

  EnergyBudget b;
  b.bmr_kcal = *bmr;
  b.tdee_kcal = b.bmr_kcal * activity_multiplier(p.activity);
  b.daily_calorie_goal_kcal =
      round_to_nearest(apply_goal_adjustment(b.tdee_kcal, goal), kGoalRoundingKcal);

  if (!is_positive(b.tdee_kcal) || !is_positive(b.daily_calorie_goal_kcal)) {
    return std::nullopt;
  }
  return b;
}

std::optional<EnergyBudget> compute_energy_budget(const ProfileInput& in,
                                                  const CivilDate& today,
                                                  const AlgorithmSelection& sel,
                                                  PrimaryGoal goal) {
  const auto p = resolve_profile(in, today);
  if (!p) return std::nullopt;
  return compute_energy_budget(*p, sel, goal);
}

double compute_tdee_baseline(double bmr_kcal, ActivityLevel activity) noexcept {
  if (!is_positive(bmr_kcal)) return 0.0;
  return round_half_up(bmr_kcal * activity_multiplier(activity));
}

}  // namespace fuel
