#include "engine/algorithms/nutrient_formulas.hpp"

#include <algorithm>

#include "engine/core/numeric.hpp"

namespace fuel::nutrients {
namespace {

constexpr double kKcalPerGramFat = 9.0;
constexpr double kKcalPerGramSugar = 4.0;

bool is_male(Sex s) noexcept { return s == Sex::Male; }

// Share of energy expressed as grams, never negative.
double energy_share_g(double calories, double fraction, double kcal_per_g) noexcept {
  return std::max(0.0, nonneg_or(calories, 0.0) * fraction / kcal_per_g);
}

double sugar_ceiling(double grams, double carbs_g) noexcept {
  return std::min(std::max(0.0, grams), nonneg_or(carbs_g, 0.0));
}

double rda_iron(const NutrientProfileInput& in) noexcept {
  const int a = in.age_years;
  if (a >= 9 && a <= 13) return 8.0;
  if (a >= 14 && a <= 18) return is_male(in.sex) ? 11.0 : 15.0;
  if (is_male(in.sex)) return 8.0;
  return a <= 50 ? 18.0 : 8.0;
}

}  // namespace

FatBreakdown aha_fat_breakdown(const FatBreakdownInput& in) noexcept {
  const double total = nonneg_or(in.total_fat_g, 0.0);

  FatBreakdown out;
  out.saturated_g = std::min(total, energy_share_g(in.calories_kcal, 0.06, kKcalPerGramFat));
  out.trans_g = 0.0;
  const double left = total - out.saturated_g;
  out.polyunsaturated_g = std::min(left, energy_share_g(in.calories_kcal, 0.10, kKcalPerGramFat));
  out.monounsaturated_g = left - out.polyunsaturated_g;
  return out;
}

MineralTargets rda_minerals(const NutrientProfileInput& in) noexcept {
  const int a = in.age_years;
  const bool teen = a >= 14 && a <= 18;
  const bool male = is_male(in.sex);

  MineralTargets t;
  t.cholesterol_mg = 300.0;
  t.sodium_mg = 2300.0;
  if (teen) {
    t.potassium_mg = male ? 3000.0 : 2300.0;
  } else {
    t.potassium_mg = male ? 3400.0 : 2600.0;
  }

  if (a >= 9 && a <= 18) {
    t.calcium_mg = 1300.0;
  } else if (a >= 71 || (!male && a >= 51)) {
    t.calcium_mg = 1200.0;
  } else {
    t.calcium_mg = 1000.0;
  }

  t.iron_mg = rda_iron(in);
  return t;
}

MineralTargets dash_minerals(const NutrientProfileInput& in) noexcept {
  MineralTargets t;
  t.cholesterol_mg = 150.0;
  t.sodium_mg = 1500.0;
  t.potassium_mg = 4700.0;
  t.calcium_mg = 1250.0;
  t.iron_mg = rda_iron(in);
  return t;
}

VitaminTargets rda_vitamins(const NutrientProfileInput& in) noexcept {
  const int a = in.age_years;
  const bool male = is_male(in.sex);

  VitaminTargets t;
  if (a >= 9 && a <= 13) {
    t.vitamin_a_mcg = 600.0;
    t.vitamin_c_mg = 45.0;
  } else if (a >= 14 && a <= 18) {
    t.vitamin_a_mcg = male ? 900.0 : 700.0;
    t.vitamin_c_mg = male ? 75.0 : 65.0;
  } else {
    t.vitamin_a_mcg = male ? 900.0 : 700.0;
    t.vitamin_c_mg = male ? 90.0 : 75.0;
  }
  return t;
}

VitaminTargets efsa_vitamins(const NutrientProfileInput& in) noexcept {
  const bool male = is_male(in.sex);
  VitaminTargets t;
  t.vitamin_a_mcg = male ? 750.0 : 650.0;
  t.vitamin_c_mg = male ? 110.0 : 95.0;
  return t;
}

double who_sugar_limit(const SugarInput& in) noexcept {
  return sugar_ceiling(energy_share_g(in.calories_kcal, 0.10, kKcalPerGramSugar), in.carbs_g);
}

double who_conditional_sugar_limit(const SugarInput& in) noexcept {
  return sugar_ceiling(energy_share_g(in.calories_kcal, 0.05, kKcalPerGramSugar), in.carbs_g);
}

double aha_added_sugar_limit(const SugarInput& in) noexcept {
  return sugar_ceiling(is_male(in.sex) ? 36.0 : 25.0, in.carbs_g);
}

}  // namespace fuel::nutrients
