/*
  Fragment 3.7 — Plan Selftest

  Objective
  ---------
  Validate the goal pipeline end to end on the reference profile
  (male, 30 y, 80 kg, 180 cm, moderate activity, losing weight):
      BMR 1780 -> TDEE 2759 -> goal 2210 kcal -> 221 / 166 / 74 g, fiber 31
  plus the slider rebalancer, patches / overrides, and the narrow
  recompute after an algorithm selection change.

  Expected use
  ------------
      ./plan_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <limits>
#include <string>

#include "engine/core/selftest_harness.hpp"
#include "engine/plan/advanced_nutrients.hpp"
#include "engine/plan/energy_budget.hpp"
#include "engine/plan/goal_planner.hpp"
#include "engine/plan/goal_snapshot.hpp"
#include "engine/plan/macro_allocator.hpp"
#include "engine/plan/macro_rebalancer.hpp"

namespace fuel {
namespace {

using namespace fuel::selftest;

PlanInputs reference_inputs() {
  PlanInputs in;
  in.profile.sex = Sex::Male;
  in.profile.birth_date = CivilDate{1994, 6, 15};
  in.profile.weight_kg = 80.0;
  in.profile.height_cm = 180.0;
  in.profile.activity = ActivityLevel::Moderate;
  in.today = CivilDate{2024, 6, 15};
  in.settings.primary_goal = PrimaryGoal::Lose;
  return in;
}

void test_energy_budget() {
  const PlanInputs in = reference_inputs();
  const auto b = compute_energy_budget(in.profile, in.today, in.settings.algorithms,
                                       in.settings.primary_goal);
  expect_true(b.has_value(), "reference profile is ready");
  if (!b) return;

  expect_near(b->bmr_kcal, 1780.0, 1e-9, "BMR = 1780");
  expect_near(b->tdee_kcal, 2759.0, 1e-9, "TDEE = 1780 * 1.55 = 2759");
  expect_eq(b->daily_calorie_goal_kcal, 2210.0, "lose: 2759 * 0.8 -> 2210");

  const auto maintain = compute_energy_budget(in.profile, in.today, in.settings.algorithms,
                                              PrimaryGoal::Maintain);
  if (maintain) expect_eq(maintain->daily_calorie_goal_kcal, 2760.0, "maintain: 2759 -> 2760");
  else fail("maintain ready");

  const auto gain = compute_energy_budget(in.profile, in.today, in.settings.algorithms,
                                          PrimaryGoal::Gain);
  if (gain) expect_eq(gain->daily_calorie_goal_kcal, 3260.0, "gain: 2759 + 500 -> 3260");
  else fail("gain ready");

  expect_eq(compute_tdee_baseline(1780.0, ActivityLevel::Moderate), 2759.0, "TDEE baseline rounds");
  expect_eq(compute_tdee_baseline(0.0, ActivityLevel::Heavy), 0.0, "no BMR -> zero baseline");
}

void test_unready() {
  PlanInputs in = reference_inputs();
  in.profile.weight_kg.reset();
  expect_empty(plan_goals(in), "missing weight -> Unready plan");
  expect_empty(build_goal_patch(in, CategorySet(GoalCategory::Energy)), "energy patch Unready");

  const auto hydration = build_goal_patch(in, CategorySet(GoalCategory::Hydration));
  expect_true(hydration.has_value(), "hydration does not need a profile");
  if (hydration) {
    expect_eq(static_cast<double>(hydration->size()), 1.0, "hydration patch has one field");
    expect_eq(hydration->water_goal_ml.value_or(-1.0), 1920.0, "water goal from defaults");
  }

  PlanInputs nan_height = reference_inputs();
  nan_height.profile.height_cm = std::numeric_limits<double>::quiet_NaN();
  expect_empty(plan_goals(nan_height), "NaN height -> Unready plan");

  PlanInputs katch = reference_inputs();
  katch.settings.algorithms.bmr = BmrAlgorithm::KatchMcArdle;
  expect_empty(plan_goals(katch), "Katch-McArdle without body fat or circumferences -> Unready");

  katch.profile.waist_cm = 90.0;
  katch.profile.neck_cm = 40.0;
  const auto estimated = plan_goals(katch);
  expect_true(estimated.has_value(), "Katch-McArdle falls back to the U.S. Navy estimate");

  katch.profile.body_fat_pct = 20.0;
  const auto measured = plan_goals(katch);
  if (measured) expect_near(measured->budget.bmr_kcal, 1752.4, 1e-9, "measured body fat wins");
  else fail("Katch-McArdle ready with measured body fat");
}

void test_macros() {
  const MacroTargets m = allocate_macros(2210.0, MacroSplit{40.0, 30.0, 30.0});
  expect_eq(m.carbs_g, 221.0, "carbs 221 g");
  expect_eq(m.protein_g, 166.0, "protein 166 g");
  expect_eq(m.fat_g, 74.0, "fat 74 g");
  expect_eq(m.fiber_g, 31.0, "fiber 31 g");
  expect_true(m.balanced, "40/30/30 is balanced");

  const MacroTargets off = allocate_macros(2000.0, MacroSplit{50.0, 30.0, 30.0});
  expect_true(!off.balanced, "50/30/30 is reported unbalanced");
  expect_eq(off.split_sum_pct, 110.0, "unbalanced sum reported");
  expect_eq(off.carbs_g, 250.0, "unbalanced split still allocates");

  expect_error(ErrorCode::kInvariantViolation, [] { require_balanced(MacroSplit{50.0, 30.0, 30.0}); },
               "require_balanced rejects 110 %");
  expect_no_throw([] { require_balanced(MacroSplit{40.0, 30.0, 30.0}); }, "require_balanced accepts 100 %");

  const MacroSplit back = split_from_grams(2210.0, 166.0, 221.0, 74.0);
  expect_eq(back.carbs_pct, 40.0, "grams -> carbs 40 %");
  expect_eq(back.protein_pct, 30.0, "grams -> protein 30 %");
  expect_eq(back.fat_pct, 30.0, "grams -> fat 30 %");
  const MacroSplit none = split_from_grams(0.0, 100.0, 100.0, 100.0);
  expect_eq(none.sum(), 0.0, "zero calories -> 0/0/0");

  MacroSplitSelection custom;
  custom.template_id = "custom";
  custom.custom = MacroSplit{50.0, 25.0, 25.0};
  expect_true(resolve_split(custom) == custom.custom, "custom template uses the custom split");
  expect_error(ErrorCode::kInvalidArgument, [] { (void)template_split("carnivore"); },
               "unknown diet template -> InvalidArgument");

  const MealTargets meals = meal_targets(2000.0, MealSplit{});
  expect_eq(meals.breakfast_kcal, 500.0, "25 % of 2000 kcal for breakfast");
}

void test_rebalancer() {
  const MacroSplit start{40.0, 30.0, 30.0};

  const MacroSplit r = rebalance(start, Macro::Carbs, 50.0);
  expect_eq(r.carbs_pct, 50.0, "carbs moved to 50");
  expect_eq(r.protein_pct, 25.0, "protein keeps its share");
  expect_eq(r.fat_pct, 25.0, "fat takes the complement");

  const MacroSplit uneven = rebalance(MacroSplit{50.0, 30.0, 20.0}, Macro::Fat, 40.0);
  expect_eq(uneven.carbs_pct, 38.0, "carbs = round(60 * 50/80) = 38");
  expect_eq(uneven.protein_pct, 22.0, "protein = 60 - 38");

  const MacroSplit zeros = rebalance(MacroSplit{100.0, 0.0, 0.0}, Macro::Carbs, 60.0);
  expect_eq(zeros.protein_pct, 20.0, "both peers at zero split evenly");
  expect_eq(zeros.fat_pct, 20.0, "both peers at zero split evenly (fat)");

  const MacroSplit over = rebalance(start, Macro::Protein, 140.0);
  expect_eq(over.protein_pct, 100.0, "slider clamped to 100");
  expect_eq(over.carbs_pct + over.fat_pct, 0.0, "peers drop to zero");

  bool exact = true;
  bool non_negative = true;
  const Macro all[] = {Macro::Carbs, Macro::Protein, Macro::Fat};
  const MacroSplit seeds[] = {start, MacroSplit{33.0, 33.0, 34.0}, MacroSplit{70.0, 5.0, 25.0}};
  for (const auto& seed : seeds) {
    for (Macro m : all) {
      for (int v = 0; v <= 100; ++v) {
        const MacroSplit s = rebalance(seed, m, static_cast<double>(v));
        if (s.sum() != 100.0) exact = false;
        if (s.carbs_pct < 0.0 || s.protein_pct < 0.0 || s.fat_pct < 0.0) non_negative = false;
      }
    }
  }
  expect_true(exact, "every whole-percent move sums to exactly 100");
  expect_true(non_negative, "no percentage ever goes negative");

  MacroLocks fat_locked;
  fat_locked.fat = true;
  const MacroSplit l1 = rebalance(start, Macro::Carbs, 50.0, fat_locked);
  expect_eq(l1.fat_pct, 30.0, "locked fat keeps its value");
  expect_eq(l1.protein_pct, 20.0, "free peer absorbs the move");

  const MacroSplit l2 = rebalance(start, Macro::Carbs, 90.0, fat_locked);
  expect_eq(l2.carbs_pct, 70.0, "move limited to 100 - locked");
  expect_eq(l2.protein_pct, 0.0, "free peer drained");

  MacroLocks both;
  both.protein = true;
  both.fat = true;
  expect_true(rebalance(start, Macro::Carbs, 60.0, both) == start, "both peers locked -> unchanged");

  MacroLocks self;
  self.carbs = true;
  expect_true(rebalance(start, Macro::Carbs, 60.0, self) == start, "moved macro locked -> unchanged");

  expect_true(rebalance(start, Macro::Carbs, 50.0, MacroLocks{}) == r, "no locks -> plain rebalance");
}

void test_advanced_nutrients() {
  NutrientInputs n;
  n.sex = Sex::Female;
  n.age_years = 35;
  n.weight_kg = 62.0;

  bool fat_bounded = true;
  bool sugar_bounded = true;
  for (double cal = 1200.0; cal <= 4000.0; cal += 100.0) {
    const MacroTargets m = allocate_macros(cal, MacroSplit{40.0, 30.0, 30.0});
    n.calories_kcal = cal;
    n.total_fat_g = m.fat_g;
    n.carbs_g = m.carbs_g;
    const AdvancedNutrients a = compute_advanced_nutrients(n, AlgorithmSelection{});
    if (a.fat.total() > m.fat_g + 1e-9) fat_bounded = false;
    if (a.sugars_g < 0.0 || a.sugars_g > m.carbs_g) sugar_bounded = false;
  }
  expect_true(fat_bounded, "fat sub-fractions never exceed total fat");
  expect_true(sugar_bounded, "sugar ceiling stays within [0, carbs]");

  n.calories_kcal = 2000.0;
  n.total_fat_g = 0.0;
  n.carbs_g = 0.0;
  const AdvancedNutrients empty = compute_advanced_nutrients(n, AlgorithmSelection{});
  expect_eq(empty.fat.total(), 0.0, "zero fat -> zero sub-fractions");
  expect_eq(empty.sugars_g, 0.0, "zero carbs -> zero sugar");

  expect_error(ErrorCode::kUnknownAlgorithm,
               [&] { (void)compute_minerals(n, static_cast<MineralAlgorithm>(9)); },
               "unregistered mineral tag propagates");
}

void test_nutrient_bound_checks() {
  FatBreakdown exact;
  exact.saturated_g = 10.0;
  exact.polyunsaturated_g = 20.0;
  exact.monounsaturated_g = 30.0;
  expect_no_throw([&] { check_fat_breakdown(exact, 60.0, "test_fat"); },
                  "fat parts equal to total fat pass");

  FatBreakdown over = exact;
  over.trans_g = 0.5;
  expect_error(ErrorCode::kInvariantViolation,
               [&] { check_fat_breakdown(over, 60.0, "test_fat"); },
               "fat parts over total fat -> InvariantViolation");

  FatBreakdown negative = exact;
  negative.saturated_g = -1.0;
  expect_error(ErrorCode::kInvariantViolation,
               [&] { check_fat_breakdown(negative, 60.0, "test_fat"); },
               "negative fat part -> InvariantViolation");

  expect_no_throw([] { check_sugar_ceiling(221.0, 221.0, "test_sugar"); },
                  "sugar equal to carbs passes");
  expect_error(ErrorCode::kInvariantViolation,
               [] { check_sugar_ceiling(221.5, 221.0, "test_sugar"); },
               "sugar over carbs -> InvariantViolation");
  expect_error(ErrorCode::kInvariantViolation,
               [] { check_sugar_ceiling(std::numeric_limits<double>::quiet_NaN(), 221.0, "test_sugar"); },
               "NaN sugar -> InvariantViolation");
}

void test_plan() {
  const auto plan = plan_goals(reference_inputs());
  expect_true(plan.has_value(), "reference plan ready");
  if (!plan) return;

  const GoalSnapshot s = make_snapshot(plan->patch, GoalSnapshot::application_defaults());
  expect_eq(s.calories_kcal, 2210.0, "snapshot calories");
  expect_eq(s.carbs_g, 221.0, "snapshot carbs");
  expect_eq(s.protein_g, 166.0, "snapshot protein");
  expect_eq(s.fat_g, 74.0, "snapshot fat");
  expect_eq(s.fiber_g, 31.0, "snapshot fiber");
  expect_eq(s.carbs_pct, 40.0, "snapshot carbs pct");
  expect_near(s.sugars_g, 55.25, 1e-9, "WHO sugar ceiling at 2210 kcal");
  expect_near(s.saturated_fat_g, 2210.0 * 0.06 / 9.0, 1e-9, "saturated fat at 2210 kcal");
  expect_eq(s.sodium_mg, 2300.0, "RDA sodium");
  expect_eq(s.vitamin_c_mg, 90.0, "RDA vitamin C male");
  expect_eq(s.water_goal_ml, 1920.0, "water goal");
  expect_eq(s.breakfast_pct, 25.0, "meal split");
  expect_eq(static_cast<double>(plan->patch.size()), static_cast<double>(kGoalFieldCount),
            "full plan fills every field");
  expect_near(plan->meals.dinner_kcal, 552.5, 1e-9, "dinner calories");
}

void test_patches() {
  GoalPatch p;
  p.calories_kcal = 1800.0;
  p.protein_g = 140.0;
  p.sodium_mg = 1500.0;
  expect_eq(static_cast<double>(p.size()), 3.0, "patch size counts present fields");
  expect_true(p.categories() == (CategorySet(GoalCategory::Energy) | GoalCategory::Minerals),
              "patch categories");

  const GoalSnapshot defaults = GoalSnapshot::application_defaults();
  FieldOverrides ov;
  ov.mark("protein");
  expect_true(ov.overridden("protein"), "override recorded");
  expect_error(ErrorCode::kInvalidArgument, [&] { ov.mark("unobtainium"); }, "unknown field key rejected");

  const GoalSnapshot merged = merge_patch(defaults, p, ov);
  expect_eq(merged.calories_kcal, 1800.0, "patched field replaced");
  expect_eq(merged.protein_g, defaults.protein_g, "overridden field kept");
  expect_eq(merged.sodium_mg, 1500.0, "patched mineral replaced");
  expect_eq(merged.iron_mg, defaults.iron_mg, "absent field kept");

  ov.clear("protein");
  expect_eq(merge_patch(defaults, p, ov).protein_g, 140.0, "cleared override no longer protects");

  const GoalPatch minerals_only = restrict_patch(p, CategorySet(GoalCategory::Minerals));
  expect_eq(static_cast<double>(minerals_only.size()), 1.0, "restrict keeps one category");
  expect_true(!minerals_only.calories_kcal.has_value(), "restrict drops energy fields");

  const GoalField* f = find_goal_field("vitamin_a");
  expect_true(f != nullptr && std::string(f->unit) == "mcg", "vitamin_a field in mcg");
  expect_true(find_goal_field("nope") == nullptr, "unknown field lookup is null");

  expect_eq_str(describe(CategorySet(GoalCategory::Energy) | GoalCategory::Minerals), "energy,minerals",
                "describe lists categories");
  expect_eq_str(describe(CategorySet::none()), "none", "describe empty set");
}

void test_selection_changes() {
  const AlgorithmSelection base;

  AlgorithmSelection sugar = base;
  sugar.sugar = SugarAlgorithm::AhaAddedSugar;
  expect_true(categories_affected_by(base, sugar) == CategorySet(GoalCategory::Sugar),
              "sugar change affects only sugar");

  AlgorithmSelection bmr = base;
  bmr.bmr = BmrAlgorithm::RevisedHarrisBenedict;
  expect_true(categories_affected_by(base, bmr) == CategorySet::energy_and_derived(),
              "BMR change affects energy and derived");

  AlgorithmSelection fat_est = base;
  fat_est.body_fat = BodyFatAlgorithm::Bmi;
  expect_true(categories_affected_by(base, fat_est).empty(),
              "body-fat change is inert for Mifflin-St Jeor");

  AlgorithmSelection katch = base;
  katch.bmr = BmrAlgorithm::KatchMcArdle;
  AlgorithmSelection katch_bmi = katch;
  katch_bmi.body_fat = BodyFatAlgorithm::Bmi;
  expect_true(categories_affected_by(katch, katch_bmi) == CategorySet::energy_and_derived(),
              "body-fat change matters for Katch-McArdle");

  const PlanInputs in = reference_inputs();
  const auto sugar_patch = recompute_for_selection_change(in, sugar);
  expect_true(sugar_patch.has_value(), "sugar recompute ready");
  if (sugar_patch) {
    expect_eq(static_cast<double>(sugar_patch->size()), 1.0, "sugar recompute touches one field");
    expect_eq(sugar_patch->sugars_g.value_or(-1.0), 36.0, "AHA added sugar male = 36 g");
  }

  const auto nothing = recompute_for_selection_change(in, base);
  expect_true(nothing.has_value() && nothing->empty(), "no change -> present, empty patch");

  const auto bmr_patch = recompute_for_selection_change(in, bmr);
  if (bmr_patch) {
    expect_true(bmr_patch->calories_kcal.has_value(), "BMR recompute refreshes calories");
    expect_true(!bmr_patch->water_goal_ml.has_value(), "BMR recompute leaves hydration alone");
  } else {
    fail("BMR recompute ready");
  }

  PlanInputs unready = reference_inputs();
  unready.profile.birth_date.reset();
  expect_empty(recompute_for_selection_change(unready, bmr), "BMR recompute on Unready profile");
  const auto sugar_unready = recompute_for_selection_change(unready, sugar);
  expect_empty(sugar_unready, "sugar depends on calories, so Unready too");
}

}  // namespace
}  // namespace fuel

int main() {
  fuel::test_energy_budget();
  fuel::test_unready();
  fuel::test_macros();
  fuel::test_rebalancer();
  fuel::test_advanced_nutrients();
  fuel::test_nutrient_bound_checks();
  fuel::test_plan();
  fuel::test_patches();
  fuel::test_selection_changes();
  return fuel::selftest::finish();
}
