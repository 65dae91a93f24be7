/*
  Fragment 2.7 — Algorithms Selftest

  Objective
  ---------
  Pin every registered strategy to a hand-checked reference value and make
  sure the registry rejects tags that were never registered.

  Reference profile: male, 30 y, 80 kg, 180 cm.

  Expected use
  ------------
      ./algorithms_selftest
  Non-zero return code indicates failure.
*/

#include "engine/algorithms/algorithm_ids.hpp"
#include "engine/algorithms/bmr_formulas.hpp"
#include "engine/algorithms/body_fat_formulas.hpp"
#include "engine/algorithms/nutrient_formulas.hpp"
#include "engine/algorithms/registry.hpp"
#include "engine/core/selftest_harness.hpp"

namespace fuel {
namespace {

using namespace fuel::selftest;

BmrInput reference_bmr() {
  BmrInput in;
  in.sex = Sex::Male;
  in.weight_kg = 80.0;
  in.height_cm = 180.0;
  in.age_years = 30.0;
  return in;
}

NutrientProfileInput adult(Sex sex, int age) {
  NutrientProfileInput in;
  in.sex = sex;
  in.age_years = age;
  in.weight_kg = 70.0;
  in.calories_kcal = 2000.0;
  return in;
}

void test_bmr() {
  const BmrInput in = reference_bmr();

  const auto msj = bmr::mifflin_st_jeor(in);
  expect_true(msj.has_value(), "Mifflin-St Jeor ready");
  if (msj) expect_near(*msj, 1780.0, 1e-9, "Mifflin-St Jeor male = 1780");

  BmrInput female = in;
  female.sex = Sex::Female;
  const auto msj_f = bmr::mifflin_st_jeor(female);
  if (msj_f) expect_near(*msj_f, 1614.0, 1e-9, "Mifflin-St Jeor female = 1614");
  else fail("Mifflin-St Jeor female ready");

  const auto rhb = bmr::revised_harris_benedict(in);
  if (rhb) expect_near(*rhb, 1853.632, 1e-6, "Revised Harris-Benedict male");
  else fail("Revised Harris-Benedict ready");

  BmrInput rhb_f;
  rhb_f.sex = Sex::Female;
  rhb_f.weight_kg = 60.0;
  rhb_f.height_cm = 165.0;
  rhb_f.age_years = 30.0;
  const auto rhb_fv = bmr::revised_harris_benedict(rhb_f);
  if (rhb_fv) expect_near(*rhb_fv, 1383.683, 1e-6, "Revised Harris-Benedict female");
  else fail("Revised Harris-Benedict female ready");

  expect_empty(bmr::katch_mcardle(in), "Katch-McArdle without body fat -> Unready");
  BmrInput lean = in;
  lean.body_fat_pct = 20.0;
  const auto km = bmr::katch_mcardle(lean);
  if (km) expect_near(*km, 1752.4, 1e-9, "Katch-McArdle at 20 % body fat");
  else fail("Katch-McArdle ready with body fat");

  BmrInput zero = in;
  zero.weight_kg = 0.0;
  expect_empty(bmr::mifflin_st_jeor(zero), "zero weight -> Unready");
}

void test_body_fat() {
  BodyFatInput m;
  m.sex = Sex::Male;
  m.age_years = 30.0;
  m.weight_kg = 80.0;
  m.height_cm = 180.0;

  expect_empty(body_fat::us_navy(m), "U.S. Navy without circumferences -> Unready");

  m.waist_cm = 90.0;
  m.neck_cm = 40.0;
  const auto navy = body_fat::us_navy(m);
  if (navy) expect_near(*navy, 18.3675, 1e-3, "U.S. Navy male");
  else fail("U.S. Navy male ready");

  BodyFatInput f = m;
  f.sex = Sex::Female;
  f.height_cm = 165.0;
  f.waist_cm = 80.0;
  f.neck_cm = 34.0;
  expect_empty(body_fat::us_navy(f), "U.S. Navy female needs hips");
  f.hips_cm = 100.0;
  const auto navy_f = body_fat::us_navy(f);
  if (navy_f) expect_near(*navy_f, 31.4033, 1e-3, "U.S. Navy female");
  else fail("U.S. Navy female ready");

  BodyFatInput inverted = m;
  inverted.waist_cm = 35.0;
  expect_empty(body_fat::us_navy(inverted), "waist below neck -> Unready");

  const auto bmi = body_fat::bmi_method(m);
  if (bmi) expect_near(*bmi, 20.32963, 1e-4, "BMI method male");
  else fail("BMI method ready");
}

void test_fat_breakdown() {
  FatBreakdownInput in;
  in.calories_kcal = 2000.0;
  in.total_fat_g = 74.0;
  const FatBreakdown f = nutrients::aha_fat_breakdown(in);
  expect_near(f.saturated_g, 2000.0 * 0.06 / 9.0, 1e-9, "AHA saturated = 6 % of energy");
  expect_eq(f.trans_g, 0.0, "AHA trans = 0");
  expect_near(f.polyunsaturated_g, 2000.0 * 0.10 / 9.0, 1e-9, "AHA polyunsaturated = 10 % of energy");
  expect_near(f.total(), 74.0, 1e-9, "AHA parts sum to total fat");

  in.total_fat_g = 10.0;
  const FatBreakdown tight = nutrients::aha_fat_breakdown(in);
  expect_near(tight.saturated_g, 10.0, 1e-12, "saturated capped by a small total");
  expect_eq(tight.polyunsaturated_g, 0.0, "no room left for polyunsaturated");
  expect_eq(tight.monounsaturated_g, 0.0, "no room left for monounsaturated");
}

void test_minerals_and_vitamins() {
  const MineralTargets m = nutrients::rda_minerals(adult(Sex::Male, 30));
  expect_eq(m.cholesterol_mg, 300.0, "RDA cholesterol");
  expect_eq(m.sodium_mg, 2300.0, "RDA sodium");
  expect_eq(m.potassium_mg, 3400.0, "RDA potassium male");
  expect_eq(m.calcium_mg, 1000.0, "RDA calcium adult");
  expect_eq(m.iron_mg, 8.0, "RDA iron male");

  const MineralTargets f = nutrients::rda_minerals(adult(Sex::Female, 30));
  expect_eq(f.potassium_mg, 2600.0, "RDA potassium female");
  expect_eq(f.iron_mg, 18.0, "RDA iron female 19-50");

  const MineralTargets older = nutrients::rda_minerals(adult(Sex::Female, 60));
  expect_eq(older.calcium_mg, 1200.0, "RDA calcium female 51+");
  expect_eq(older.iron_mg, 8.0, "RDA iron female 51+");

  const MineralTargets dash = nutrients::dash_minerals(adult(Sex::Male, 30));
  expect_eq(dash.sodium_mg, 1500.0, "DASH sodium");
  expect_eq(dash.potassium_mg, 4700.0, "DASH potassium");

  const VitaminTargets v = nutrients::rda_vitamins(adult(Sex::Female, 30));
  expect_eq(v.vitamin_a_mcg, 700.0, "RDA vitamin A female");
  expect_eq(v.vitamin_c_mg, 75.0, "RDA vitamin C female");

  const VitaminTargets e = nutrients::efsa_vitamins(adult(Sex::Male, 30));
  expect_eq(e.vitamin_c_mg, 110.0, "EFSA vitamin C male");
}

void test_sugar() {
  SugarInput in;
  in.sex = Sex::Male;
  in.calories_kcal = 2000.0;
  in.carbs_g = 221.0;
  expect_near(nutrients::who_sugar_limit(in), 50.0, 1e-9, "WHO 10 % of 2000 kcal = 50 g");
  expect_near(nutrients::who_conditional_sugar_limit(in), 25.0, 1e-9, "WHO 5 % of 2000 kcal = 25 g");
  expect_eq(nutrients::aha_added_sugar_limit(in), 36.0, "AHA added sugar male");

  in.sex = Sex::Female;
  expect_eq(nutrients::aha_added_sugar_limit(in), 25.0, "AHA added sugar female");

  in.carbs_g = 20.0;
  expect_eq(nutrients::who_sugar_limit(in), 20.0, "sugar ceiling never exceeds carbs");
  in.carbs_g = 0.0;
  expect_eq(nutrients::aha_added_sugar_limit(in), 0.0, "zero carbs -> zero sugar");
}

void test_registry() {
  const BmrInput in = reference_bmr();
  const auto r = registry::evaluate_bmr(BmrAlgorithm::MifflinStJeor, in);
  if (r) expect_near(*r, 1780.0, 1e-9, "registry routes Mifflin-St Jeor");
  else fail("registry Mifflin-St Jeor ready");

  expect_empty(registry::evaluate_bmr(BmrAlgorithm::KatchMcArdle, in),
               "registry Katch-McArdle without body fat -> Unready");

  SugarInput s;
  s.calories_kcal = 2000.0;
  s.carbs_g = 250.0;
  expect_near(registry::sugar_limit(SugarAlgorithm::WhoConditional, s), 25.0, 1e-9,
              "registry routes WHO conditional");

  expect_error(ErrorCode::kUnknownAlgorithm,
               [&] { (void)registry::evaluate_bmr(static_cast<BmrAlgorithm>(99), in); },
               "unregistered BMR tag -> UnknownAlgorithm");
  expect_error(ErrorCode::kUnknownAlgorithm,
               [&] { (void)registry::sugar_limit(static_cast<SugarAlgorithm>(7), s); },
               "unregistered sugar tag -> UnknownAlgorithm");
  expect_error(ErrorCode::kUnknownAlgorithm,
               [] { (void)registry::split_fat(static_cast<FatBreakdownAlgorithm>(3), FatBreakdownInput{}); },
               "unregistered fat-breakdown tag -> UnknownAlgorithm");
}

void test_names() {
  expect_true(parse_bmr_algorithm("Mifflin-St Jeor") == BmrAlgorithm::MifflinStJeor, "parse BMR display label");
  expect_true(parse_bmr_algorithm("katch_mcardle") == BmrAlgorithm::KatchMcArdle, "parse BMR key");
  expect_true(parse_body_fat_algorithm("U.S. Navy") == BodyFatAlgorithm::UsNavy, "parse body-fat label");
  expect_true(parse_sugar_algorithm("WHO Conditional (5%)") == SugarAlgorithm::WhoConditional,
              "parse sugar label with punctuation");
  expect_true(parse_mineral_algorithm("DASH Diet") == MineralAlgorithm::DashDiet, "parse mineral label");
  expect_error(ErrorCode::kUnknownAlgorithm, [] { (void)parse_vitamin_algorithm("megadose"); },
               "unregistered vitamin name -> UnknownAlgorithm");
  expect_eq_str(to_string(static_cast<MineralAlgorithm>(5)), "unknown", "unregistered tag prints 'unknown'");
  expect_true(bmr_uses_body_fat(BmrAlgorithm::KatchMcArdle), "Katch-McArdle uses body fat");
  expect_true(!bmr_uses_body_fat(BmrAlgorithm::MifflinStJeor), "Mifflin-St Jeor ignores body fat");
}

}  // namespace
}  // namespace fuel

int main() {
  fuel::test_bmr();
  fuel::test_body_fat();
  fuel::test_fat_breakdown();
  fuel::test_minerals_and_vitamins();
  fuel::test_sugar();
  fuel::test_registry();
  fuel::test_names();
  return fuel::selftest::finish();
}
