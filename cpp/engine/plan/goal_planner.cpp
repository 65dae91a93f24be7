#include "engine/plan/goal_planner.hpp"

namespace fuel {
namespace {

void fill_energy(GoalPatch& p, double calories, const MacroSplit& split, const MacroTargets& m) {
  p.calories_kcal = calories;
  p.protein_g = m.protein_g;
  p.carbs_g = m.carbs_g;
  p.fat_g = m.fat_g;
  p.fiber_g = m.fiber_g;
  p.protein_pct = split.protein_pct;
  p.carbs_pct = split.carbs_pct;
  p.fat_pct = split.fat_pct;
}

void fill_nutrients(GoalPatch& p, const AdvancedNutrients& n) {
  p.saturated_fat_g = n.fat.saturated_g;
  p.trans_fat_g = n.fat.trans_g;
  p.polyunsaturated_fat_g = n.fat.polyunsaturated_g;
  p.monounsaturated_fat_g = n.fat.monounsaturated_g;

  p.cholesterol_mg = n.minerals.cholesterol_mg;
  p.sodium_mg = n.minerals.sodium_mg;
  p.potassium_mg = n.minerals.potassium_mg;
  p.calcium_mg = n.minerals.calcium_mg;
  p.iron_mg = n.minerals.iron_mg;

  p.vitamin_a_mcg = n.vitamins.vitamin_a_mcg;
  p.vitamin_c_mg = n.vitamins.vitamin_c_mg;

  p.sugars_g = n.sugars_g;
}

void fill_static(GoalPatch& p, const EngineSettings& s) {
  p.water_goal_ml = s.goals.water_goal_ml;
  p.exercise_duration_min = s.goals.exercise_duration_min;
  p.exercise_calories_kcal = s.goals.exercise_calories_kcal;
  p.breakfast_pct = s.meals.breakfast_pct;
  p.lunch_pct = s.meals.lunch_pct;
  p.dinner_pct = s.meals.dinner_pct;
  p.snacks_pct = s.meals.snacks_pct;
}

NutrientInputs nutrient_inputs(const Profile& p, double calories, const MacroTargets& m) {
  NutrientInputs n;
  n.sex = p.sex;
  n.age_years = p.age_years;
  n.weight_kg = p.weight_kg;
  n.activity = p.activity;
  n.calories_kcal = calories;
  n.total_fat_g = m.fat_g;
  n.carbs_g = m.carbs_g;
  return n;
}

// Only the nutrient categories in `cats` are evaluated, so an unrelated
// strategy is never run for a narrow recompute.
AdvancedNutrients nutrients_for(const NutrientInputs& n, const AlgorithmSelection& sel,
                                CategorySet cats) {
  AdvancedNutrients out;
  if (cats.has(GoalCategory::FatBreakdown)) out.fat = compute_fat_breakdown(n, sel.fat_breakdown);
  if (cats.has(GoalCategory::Minerals)) out.minerals = compute_minerals(n, sel.mineral);
  if (cats.has(GoalCategory::Vitamins)) out.vitamins = compute_vitamins(n, sel.vitamin);
  if (cats.has(GoalCategory::Sugar)) out.sugars_g = compute_sugar_limit(n, sel.sugar);
  return out;
}

}  // namespace

std::optional<GoalPlan> plan_goals(const PlanInputs& in) {
  const auto profile = resolve_profile(in.profile, in.today);
  if (!profile) return std::nullopt;

  const EngineSettings& s = in.settings;
  const auto budget = compute_energy_budget(*profile, s.algorithms, s.primary_goal);
  if (!budget) return std::nullopt;

  GoalPlan plan;
  plan.profile = *profile;
  plan.budget = *budget;
  plan.split = resolve_split(s.macros);

  const double calories = budget->daily_calorie_goal_kcal;
  plan.macros = allocate_macros(calories, plan.split);
  plan.nutrients = compute_advanced_nutrients(nutrient_inputs(*profile, calories, plan.macros),
                                              s.algorithms);
  plan.meals = meal_targets(calories, s.meals);

  fill_energy(plan.patch, calories, plan.split, plan.macros);
  fill_nutrients(plan.patch, plan.nutrients);
  fill_static(plan.patch, s);
  return plan;
}

std::optional<GoalPatch> build_goal_patch(const PlanInputs& in, CategorySet categories) {
  GoalPatch full;
  fill_static(full, in.settings);

  if (categories.needs_energy()) {
    const auto profile = resolve_profile(in.profile, in.today);
    if (!profile) return std::nullopt;

    const EngineSettings& s = in.settings;
    const auto budget = compute_energy_budget(*profile, s.algorithms, s.primary_goal);
    if (!budget) return std::nullopt;

    const double calories = budget->daily_calorie_goal_kcal;
    const MacroSplit split = resolve_split(s.macros);
    const MacroTargets macros = allocate_macros(calories, split);

    fill_energy(full, calories, split, macros);
    fill_nutrients(full, nutrients_for(nutrient_inputs(*profile, calories, macros),
                                       s.algorithms, categories));
  }

  return restrict_patch(full, categories);
}

std::optional<GoalPatch> recompute_for_selection_change(const PlanInputs& in,
                                                        const AlgorithmSelection& new_selection) {
  const CategorySet affected = categories_affected_by(in.settings.algorithms, new_selection);
  if (affected.empty()) return GoalPatch{};

  PlanInputs next = in;
  next.settings.algorithms = new_selection;
  return build_goal_patch(next, affected);
}

}  // namespace fuel
