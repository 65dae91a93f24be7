/*
  Fragment 4.3 — Daily Selftest

  Objective
  ---------
  Validate the five calorie adjustment modes and the day summary helpers:
    - dynamic / fixed / percentage / smart arithmetic,
    - device projection: clamp, negative opt-in, no-projection fallback,
    - steps -> kcal, active-vs-steps, credited, progress.

  Expected use
  ------------
      ./daily_selftest
  Non-zero return code indicates failure.
*/

#include <limits>

#include "engine/core/selftest_harness.hpp"
#include "engine/daily/calorie_adjustment.hpp"
#include "engine/daily/daily_summary.hpp"

namespace fuel {
namespace {

using namespace fuel::selftest;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

CalorieAdjustmentConfig mode(AdjustmentMode m) {
  CalorieAdjustmentConfig c;
  c.mode = m;
  return c;
}

ActivityEnergyRecord workout_day() {
  ActivityEnergyRecord r;
  r.eaten_kcal = 1500.0;
  r.burned_kcal = 400.0;
  return r;
}

void test_simple_modes() {
  const ActivityEnergyRecord r = workout_day();

  expect_eq(compute_remaining(mode(AdjustmentMode::Dynamic), r, 2000.0, 2500.0), 900.0,
            "dynamic: 2000 + 400 - 1500");
  expect_eq(compute_remaining(mode(AdjustmentMode::Fixed), r, 2000.0, 2500.0), 500.0,
            "fixed: 2000 - 1500");

  CalorieAdjustmentConfig pct = mode(AdjustmentMode::Percentage);
  pct.earn_back_pct = 50.0;
  expect_eq(compute_remaining(pct, r, 2000.0, 2500.0), 700.0, "percentage 50: 2000 + 200 - 1500");
  pct.earn_back_pct = 150.0;
  expect_eq(compute_remaining(pct, r, 2000.0, 2500.0), 900.0, "percentage above 100 counts as 100");
  pct.earn_back_pct = kNaN;
  expect_eq(compute_remaining(pct, r, 2000.0, 2500.0), 500.0, "percentage NaN counts as 0");

  CalorieAdjustmentConfig smart = mode(AdjustmentMode::Smart);
  smart.exercise_calorie_goal_kcal = 300.0;
  expect_eq(compute_remaining(smart, r, 2000.0, 2500.0), 600.0, "smart: only the 100 kcal surplus");
  smart.exercise_calorie_goal_kcal = 500.0;
  expect_eq(compute_remaining(smart, r, 2000.0, 2500.0), 500.0, "smart: under the goal earns nothing");

  EngineSettings settings;
  settings.adjustment.mode = AdjustmentMode::Smart;
  settings.goals.exercise_calories_kcal = 300.0;
  expect_eq(compute_remaining(resolved_adjustment(settings), r, 2000.0, 2500.0), 600.0,
            "smart: unset exercise goal follows the goal's exercise target");
  settings.adjustment.exercise_calorie_goal_kcal = 500.0;
  expect_eq(compute_remaining(resolved_adjustment(settings), r, 2000.0, 2500.0), 500.0,
            "smart: explicit exercise goal wins over the target");

  ActivityEnergyRecord over = r;
  over.eaten_kcal = 2600.0;
  expect_eq(compute_remaining(mode(AdjustmentMode::Fixed), over, 2000.0, 2500.0), -600.0,
            "remaining may go negative");

  ActivityEnergyRecord with_bmr = r;
  with_bmr.bmr_credit_kcal = 1700.0;
  expect_eq(compute_remaining(mode(AdjustmentMode::Dynamic), with_bmr, 2000.0, 2500.0), 2600.0,
            "dynamic adds BMR credit");
  expect_eq(compute_remaining(mode(AdjustmentMode::Fixed), with_bmr, 2000.0, 2500.0), 500.0,
            "fixed ignores BMR credit");
}

void test_device_projection() {
  ActivityEnergyRecord r;
  r.eaten_kcal = 1800.0;
  r.partial_burn_kcal = 300.0;
  r.elapsed_fraction = 0.5;

  CalorieAdjustmentConfig dev = mode(AdjustmentMode::DeviceProjection);
  const AdjustmentBreakdown clamped = compute_adjustment(dev, r, 2200.0, 2700.0);
  expect_true(clamped.projection_used, "projection used at half a day");
  expect_eq(clamped.projected_burn_kcal, 600.0, "projected burn 300 / 0.5");
  expect_eq(clamped.adjustment_kcal, 0.0, "negative adjustment clamped to 0");
  expect_eq(clamped.remaining_kcal, 400.0, "remaining 2200 - 1800 + 0");

  dev.allow_negative_adjustment = true;
  expect_eq(compute_remaining(dev, r, 2200.0, 2700.0), -1700.0, "remaining 2200 - 1800 - 2100");

  ActivityEnergyRecord active = r;
  active.partial_burn_kcal = 1500.0;
  expect_eq(compute_remaining(dev, active, 2200.0, 2700.0), 700.0, "surplus over TDEE is credited");

  ActivityEnergyRecord midnight = r;
  midnight.elapsed_fraction = 0.0;
  const AdjustmentBreakdown none = compute_adjustment(dev, midnight, 2200.0, 2700.0);
  expect_true(!none.projection_used, "elapsed 0 -> no projection");
  expect_eq(none.remaining_kcal, 400.0, "elapsed 0 -> fixed-mode result");

  ActivityEnergyRecord nan_elapsed = r;
  nan_elapsed.elapsed_fraction = kNaN;
  expect_eq(compute_remaining(dev, nan_elapsed, 2200.0, 2700.0), 400.0, "NaN elapsed -> fixed-mode result");

  ActivityEnergyRecord negative = r;
  negative.elapsed_fraction = -0.25;
  expect_eq(compute_remaining(dev, negative, 2200.0, 2700.0), 400.0, "negative elapsed -> fixed-mode result");

  CalorieAdjustmentConfig early = dev;
  early.min_projection_fraction = 0.6;
  expect_true(!compute_adjustment(early, r, 2200.0, 2700.0).projection_used,
              "below the minimum fraction -> no projection");

  ActivityEnergyRecord dawn = r;
  dawn.partial_burn_kcal = 50.0;
  dawn.elapsed_fraction = 0.01;
  const CalorieAdjustmentConfig defaults = mode(AdjustmentMode::DeviceProjection);
  expect_eq(defaults.min_projection_fraction, 0.05, "early-day threshold defaults to 5 %");
  const AdjustmentBreakdown raw = compute_adjustment(defaults, dawn, 2200.0, 2700.0);
  expect_true(!raw.projection_used, "elapsed 0.01 is not extrapolated");
  expect_eq(raw.projected_burn_kcal, 50.0, "elapsed 0.01 keeps the raw burn");
  expect_eq(raw.remaining_kcal, 400.0, "elapsed 0.01: raw burn under TDEE clamps to 0");
  expect_eq(compute_remaining(dev, dawn, 2200.0, 2700.0), -2250.0,
            "elapsed 0.01 with negatives: 400 + (50 - 2700)");

  ActivityEnergyRecord dawn_spike = dawn;
  dawn_spike.partial_burn_kcal = 2900.0;
  expect_eq(compute_remaining(defaults, dawn_spike, 2200.0, 2700.0), 600.0,
            "elapsed 0.01: raw 2900 credits only the 200 over TDEE");

  ActivityEnergyRecord tiny = r;
  tiny.elapsed_fraction = 1e-320;
  CalorieAdjustmentConfig no_threshold = dev;
  no_threshold.min_projection_fraction = 0.0;
  const AdjustmentBreakdown overflow = compute_adjustment(no_threshold, tiny, 2200.0, 2700.0);
  expect_true(!overflow.projection_used, "overflowing projection is discarded");
  expect_eq(overflow.remaining_kcal, 400.0, "overflowing projection -> fixed-mode result");

  ActivityEnergyRecord late = r;
  late.partial_burn_kcal = 2900.0;
  late.elapsed_fraction = 1.3;
  const AdjustmentBreakdown full = compute_adjustment(dev, late, 2200.0, 2700.0);
  expect_eq(full.projected_burn_kcal, 2900.0, "elapsed above 1 counts as a full day");
  expect_eq(full.remaining_kcal, 600.0, "full day: 400 + (2900 - 2700)");
}

void test_summary_helpers() {
  expect_eq(steps_to_calories(10000.0, 70.0), 400.0, "10000 steps at 70 kg = 400 kcal");
  expect_eq(steps_to_calories(10000.0, 87.5), 500.0, "steps scale with weight");
  expect_eq(steps_to_calories(10000.0, 0.0), 400.0, "unknown weight uses 70 kg");
  expect_eq(steps_to_calories(-50.0, 70.0), 0.0, "negative steps count as none");

  expect_eq(resolve_active_or_steps(350.0, 400.0), 350.0, "active calories win when present");
  expect_eq(resolve_active_or_steps(0.0, 400.0), 400.0, "steps used without active calories");

  expect_eq(exercise_credited(900.0, 2000.0, 1500.0), 400.0, "credited = remaining - (goal - eaten)");
  expect_eq(exercise_credited(400.0, 2200.0, 1800.0), 0.0, "nothing credited");

  expect_eq(calorie_progress_pct(2000.0, 500.0), 75.0, "progress 75 %");
  expect_eq(calorie_progress_pct(2000.0, 2600.0), 0.0, "progress floored at 0");
  expect_eq(calorie_progress_pct(0.0, 100.0), 0.0, "no goal -> 0 %");
}

void test_summarize_day() {
  DayActivityInput day;
  day.eaten_kcal = 1500.0;
  day.other_exercise_kcal = 200.0;
  day.steps = 5000.0;
  day.weight_kg = 70.0;

  const DailySummary s = summarize_day(mode(AdjustmentMode::Dynamic), day, 2000.0, 1700.0, 2500.0);
  expect_eq(s.exercise_kcal, 400.0, "exercise = 200 logged + 200 from steps");
  expect_eq(s.burned_kcal, 400.0, "BMR not counted by default");
  expect_eq(s.net_kcal, 1100.0, "net = eaten - burned");
  expect_eq(s.remaining_kcal, 900.0, "dynamic remaining");
  expect_eq(s.credited_kcal, 400.0, "credited exercise");
  expect_near(s.progress_pct, 55.0, 1e-9, "progress (2000 - 900) / 2000");

  CalorieAdjustmentConfig with_bmr = mode(AdjustmentMode::Dynamic);
  with_bmr.include_bmr_in_net = true;
  const DailySummary b = summarize_day(with_bmr, day, 2000.0, 1700.0, 2500.0);
  expect_eq(b.burned_kcal, 2100.0, "BMR counted as burned");
  expect_eq(b.net_kcal, -600.0, "net with BMR");
  expect_eq(b.remaining_kcal, 2600.0, "BMR credited in dynamic mode");

  DayActivityInput device = day;
  device.eaten_kcal = 1800.0;
  device.partial_burn_kcal = 300.0;
  device.elapsed_fraction = 0.5;
  const DailySummary d = summarize_day(mode(AdjustmentMode::DeviceProjection), device, 2200.0, 1700.0, 2700.0);
  expect_true(d.projection_used, "summary reports projection");
  expect_eq(d.remaining_kcal, 400.0, "summary device remaining");
}

}  // namespace
}  // namespace fuel

int main() {
  fuel::test_simple_modes();
  fuel::test_device_projection();
  fuel::test_summary_helpers();
  fuel::test_summarize_day();
  return fuel::selftest::finish();
}
