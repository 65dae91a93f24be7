/*
  Fragment 1.12 — Core Selftest

  Objective
  ---------
  Framework-free checks for the core layer:
    1) Unit conversions: fixed factors, identity, round trips, NaN pass-through.
    2) Profile resolution: whole-year age, Unready on missing / non-finite data.
    3) Settings: strict validation vs sanitize() clamping.
    4) Plan fingerprints: deterministic, sensitive to inputs, -0.0 == +0.0.

  Expected use
  ------------
      ./core_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <limits>
#include <string>

#include "engine/core/numeric.hpp"
#include "engine/core/plan_key.hpp"
#include "engine/core/profile.hpp"
#include "engine/core/selftest_harness.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/types.hpp"
#include "engine/core/units.hpp"

namespace fuel {
namespace {

using namespace fuel::selftest;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

ProfileInput reference_input() {
  ProfileInput in;
  in.sex = Sex::Male;
  in.birth_date = CivilDate{1994, 6, 15};
  in.weight_kg = 80.0;
  in.height_cm = 180.0;
  in.activity = ActivityLevel::Moderate;
  return in;
}

const CivilDate kToday{2024, 6, 15};

void test_units() {
  using namespace fuel::units;

  const double lb = convert_weight(100.0, WeightUnit::Kg, WeightUnit::Lb);
  expect_near(lb, 220.462, 1e-9, "100 kg -> 220.462 lb");
  expect_near(convert_weight(lb, WeightUnit::Lb, WeightUnit::Kg), 100.0, 0.1, "100 kg -> lb -> kg within 0.1");

  const double kj = convert_energy(2000.0, EnergyUnit::Kcal, EnergyUnit::KJ);
  expect_near(kj, 8368.0, 1e-9, "2000 kcal -> 8368 kJ");
  expect_near(convert_energy(kj, EnergyUnit::KJ, EnergyUnit::Kcal), 2000.0, 1.0, "2000 kcal -> kJ -> kcal within 1");

  expect_near(convert_length(10.0, LengthUnit::In, LengthUnit::Cm), 25.4, 1e-12, "10 in -> 25.4 cm");
  expect_near(convert_volume(1.0, VolumeUnit::Oz, VolumeUnit::Ml), 29.5735, 1e-12, "1 oz -> 29.5735 ml");
  expect_near(convert_volume(2.0, VolumeUnit::Liter, VolumeUnit::Ml), 2000.0, 1e-12, "2 L -> 2000 ml");
  expect_near(convert_volume(1.0, VolumeUnit::Liter, VolumeUnit::Oz), 1000.0 / 29.5735, 1e-9, "1 L -> oz via ml");
  expect_eq(convert_weight(72.5, WeightUnit::Kg, WeightUnit::Kg), 72.5, "same-unit conversion is identity");
  expect_true(std::isnan(convert_weight(kNaN, WeightUnit::Kg, WeightUnit::Lb)), "NaN passes through unchanged");

  expect_true(parse_weight_unit("LBS") == WeightUnit::Lb, "parse 'LBS'");
  expect_true(parse_volume_unit("l") == VolumeUnit::Liter, "parse 'l'");
  expect_true(parse_energy_unit("kJ") == EnergyUnit::KJ, "parse 'kJ'");
  expect_error(ErrorCode::kInvalidArgument, [] { (void)parse_length_unit("furlong"); },
               "unknown length unit -> InvalidArgument");
}

void test_numeric() {
  expect_eq(round_half_up(2.5), 3.0, "round_half_up(2.5) == 3");
  expect_eq(round_half_up(-2.5), -2.0, "round_half_up(-2.5) == -2");
  expect_eq(round_to_nearest(2207.2, 10.0), 2210.0, "round_to_nearest(2207.2, 10) == 2210");
  expect_eq(safe_div(1.0, 0.0, -1.0), -1.0, "safe_div falls back on zero denominator");
}

void test_types() {
  expect_eq(activity_multiplier(ActivityLevel::Sedentary), 1.2, "sedentary multiplier");
  expect_eq(activity_multiplier(ActivityLevel::Light), 1.375, "light multiplier");
  expect_eq(activity_multiplier(ActivityLevel::Moderate), 1.55, "moderate multiplier");
  expect_eq(activity_multiplier(ActivityLevel::Heavy), 1.725, "heavy multiplier");

  expect_true(parse_activity_level("not_much") == ActivityLevel::Sedentary, "'not_much' is sedentary");
  expect_true(parse_primary_goal("lose_weight") == PrimaryGoal::Lose, "'lose_weight' parses");
  expect_true(parse_adjustment_mode("tdee") == AdjustmentMode::DeviceProjection, "'tdee' is device projection");
  expect_error(ErrorCode::kInvalidArgument, [] { (void)parse_sex("other"); }, "unknown sex -> InvalidArgument");
}

void test_dates_and_age() {
  const auto d = parse_civil_date("1990-02-28");
  expect_true(d.has_value() && d->year == 1990 && d->month == 2 && d->day == 28, "parse YYYY-MM-DD");
  expect_empty(parse_civil_date("1990-02-30"), "Feb 30 rejected");
  expect_empty(parse_civil_date("1990-2-3"), "short form rejected");
  expect_true(parse_civil_date("2000-02-29").has_value(), "leap day accepted");

  const CivilDate birth{1994, 6, 15};
  expect_eq(age_on(birth, CivilDate{2024, 6, 15}), 30, "age on the birthday");
  expect_eq(age_on(birth, CivilDate{2024, 6, 14}), 29, "age the day before the birthday");
  expect_eq(age_on(birth, CivilDate{2024, 12, 31}), 30, "age after the birthday");
}

void test_resolve_profile() {
  const auto p = resolve_profile(reference_input(), kToday);
  expect_true(p.has_value(), "complete profile resolves");
  if (p) {
    expect_eq(p->age_years, 30, "resolved age 30");
    expect_eq(p->weight_kg, 80.0, "resolved weight");
  }

  ProfileInput missing = reference_input();
  missing.height_cm.reset();
  expect_empty(resolve_profile(missing, kToday), "missing height -> Unready");

  ProfileInput no_sex = reference_input();
  no_sex.sex.reset();
  expect_empty(resolve_profile(no_sex, kToday), "missing sex -> Unready");

  ProfileInput nan_weight = reference_input();
  nan_weight.weight_kg = kNaN;
  expect_empty(resolve_profile(nan_weight, kToday), "NaN weight -> Unready");

  ProfileInput inf_height = reference_input();
  inf_height.height_cm = std::numeric_limits<double>::infinity();
  expect_empty(resolve_profile(inf_height, kToday), "Inf height -> Unready");

  ProfileInput negative = reference_input();
  negative.weight_kg = -3.0;
  expect_empty(resolve_profile(negative, kToday), "negative weight -> Unready");

  ProfileInput unborn = reference_input();
  unborn.birth_date = CivilDate{2030, 1, 1};
  expect_empty(resolve_profile(unborn, kToday), "birth date after today -> Unready");

  ProfileInput odd_fat = reference_input();
  odd_fat.body_fat_pct = 140.0;
  const auto pf = resolve_profile(odd_fat, kToday);
  expect_true(pf.has_value() && !pf->body_fat_pct.has_value(), "implausible body fat dropped, profile still ready");
}

void test_settings() {
  EngineSettings s = EngineSettings::defaults();
  expect_no_throw([&] { s.validate_or_throw(); }, "defaults validate");
  expect_eq(s.goals.water_goal_ml, 1920.0, "default water goal 1920 ml");
  expect_eq(s.meals.breakfast_pct, 25.0, "default meal split 25 %");

  s.adjustment.earn_back_pct = 140.0;
  expect_error(ErrorCode::kConfigOutOfRange, [&] { s.validate_or_throw(); },
               "earn_back_pct 140 -> ConfigOutOfRange");

  s.adjustment.exercise_calorie_goal_kcal = -50.0;
  s.goals.water_goal_ml = kNaN;
  const auto issues = s.sanitize();
  expect_eq(static_cast<double>(issues.size()), 3.0, "sanitize reports three issues");
  expect_eq(s.adjustment.earn_back_pct, 100.0, "earn_back_pct clamped to 100");
  expect_eq(s.adjustment.exercise_calorie_goal_kcal, 0.0, "negative exercise goal -> 0");
  expect_eq(s.goals.water_goal_ml, 1920.0, "NaN water goal -> default");
  expect_no_throw([&] { s.validate_or_throw(); }, "sanitized settings validate");

  EngineSettings bad_tag;
  bad_tag.algorithms.bmr = static_cast<BmrAlgorithm>(42);
  expect_error(ErrorCode::kUnknownAlgorithm, [&] { bad_tag.validate_or_throw(); },
               "out-of-range algorithm tag -> UnknownAlgorithm");
}

void test_plan_key() {
  const EngineSettings s;
  const auto k1 = make_plan_key(reference_input(), s, kToday);
  const auto k2 = make_plan_key(reference_input(), s, kToday);
  expect_true(k1 == k2, "plan key is deterministic");
  expect_eq(static_cast<double>(k1.combined_hex().size()), 16.0, "hex key has 16 chars");
  expect_true(k1.plan_id().rfind("p_", 0) == 0, "plan id starts with p_");

  ProfileInput heavier = reference_input();
  heavier.weight_kg = 81.0;
  expect_true(!(make_plan_key(heavier, s, kToday) == k1), "weight change changes the key");

  EngineSettings other = s;
  other.algorithms.sugar = SugarAlgorithm::AhaAddedSugar;
  expect_true(!(make_plan_key(reference_input(), other, kToday) == k1), "selection change changes the key");

  EngineSettings display = s;
  display.units.energy = units::EnergyUnit::KJ;
  expect_true(make_plan_key(reference_input(), display, kToday) == k1, "display units do not change the key");

  expect_true(!(make_plan_key(reference_input(), s, CivilDate{2024, 6, 16}) == k1),
              "evaluation date changes the key");

  EngineSettings neg_zero = s;
  neg_zero.goals.exercise_calories_kcal = -0.0;
  expect_true(hash_settings(neg_zero) == hash_settings(s), "-0.0 hashes like +0.0");
}

}  // namespace
}  // namespace fuel

int main() {
  using namespace fuel;

  test_units();
  test_numeric();
  test_types();
  test_dates_and_age();
  test_resolve_profile();
  test_settings();
  test_plan_key();

  return selftest::finish();
}
