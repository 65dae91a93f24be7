#include "engine/plan/advanced_nutrients.hpp"

#include <sstream>
#include <string>

#include "engine/algorithms/registry.hpp"
#include "engine/core/error.hpp"
#include "engine/core/numeric.hpp"

namespace fuel {
namespace {

constexpr double kBoundTol = 1e-9;

NutrientProfileInput profile_input(const NutrientInputs& in) noexcept {
  NutrientProfileInput p;
  p.sex = in.sex;
  p.age_years = in.age_years;
  p.weight_kg = in.weight_kg;
  p.activity = in.activity;
  p.calories_kcal = in.calories_kcal;
  return p;
}

void require_amount(double v, const char* algorithm, const char* field) {
  if (!is_finite(v) || v < 0.0) {
    std::ostringstream oss;
    oss << algorithm << " produced " << field << " = " << v << ", expected a finite value >= 0";
    FUEL_THROW(ErrorCode::kInvariantViolation, oss.str());
  }
}

}  // namespace

void check_fat_breakdown(const FatBreakdown& f, double total_fat_g, const char* algorithm) {
  require_amount(f.saturated_g, algorithm, "saturated_g");
  require_amount(f.trans_g, algorithm, "trans_g");
  require_amount(f.polyunsaturated_g, algorithm, "polyunsaturated_g");
  require_amount(f.monounsaturated_g, algorithm, "monounsaturated_g");

  const double total = nonneg_or(total_fat_g, 0.0);
  if (f.total() > total + kBoundTol) {
    std::ostringstream oss;
    oss << algorithm << " fat sub-fractions sum to " << f.total()
        << " g, over the total fat of " << total << " g";
    FUEL_THROW(ErrorCode::kInvariantViolation, oss.str());
  }
}

void check_sugar_ceiling(double sugars_g, double carbs_g, const char* algorithm) {
  require_amount(sugars_g, algorithm, "sugars_g");

  const double carbs = nonneg_or(carbs_g, 0.0);
  if (sugars_g > carbs + kBoundTol) {
    std::ostringstream oss;
    oss << algorithm << " sugar ceiling " << sugars_g << " g exceeds the carbohydrate budget of "
        << carbs << " g";
    FUEL_THROW(ErrorCode::kInvariantViolation, oss.str());
  }
}

FatBreakdown compute_fat_breakdown(const NutrientInputs& in, FatBreakdownAlgorithm id) {
  FatBreakdownInput fin;
  fin.calories_kcal = in.calories_kcal;
  fin.total_fat_g = in.total_fat_g;

  const FatBreakdown f = registry::split_fat(id, fin);
  check_fat_breakdown(f, in.total_fat_g, to_string(id));
  return f;
}

MineralTargets compute_minerals(const NutrientInputs& in, MineralAlgorithm id) {
  const MineralTargets m = registry::mineral_targets(id, profile_input(in));
  const char* name = to_string(id);
  require_amount(m.cholesterol_mg, name, "cholesterol_mg");
  require_amount(m.sodium_mg, name, "sodium_mg");
  require_amount(m.potassium_mg, name, "potassium_mg");
  require_amount(m.calcium_mg, name, "calcium_mg");
  require_amount(m.iron_mg, name, "iron_mg");
  return m;
}

VitaminTargets compute_vitamins(const NutrientInputs& in, VitaminAlgorithm id) {
  const VitaminTargets v = registry::vitamin_targets(id, profile_input(in));
  const char* name = to_string(id);
  require_amount(v.vitamin_a_mcg, name, "vitamin_a_mcg");
  require_amount(v.vitamin_c_mg, name, "vitamin_c_mg");
  return v;
}

double compute_sugar_limit(const NutrientInputs& in, SugarAlgorithm id) {
  SugarInput sin;
  sin.sex = in.sex;
  sin.calories_kcal = in.calories_kcal;
  sin.carbs_g = in.carbs_g;

  const double sugars = registry::sugar_limit(id, sin);
  check_sugar_ceiling(sugars, in.carbs_g, to_string(id));
  return sugars;
}

AdvancedNutrients compute_advanced_nutrients(const NutrientInputs& in, const AlgorithmSelection& sel) {
  AdvancedNutrients out;
  out.fat = compute_fat_breakdown(in, sel.fat_breakdown);
  out.minerals = compute_minerals(in, sel.mineral);
  out.vitamins = compute_vitamins(in, sel.vitamin);
  out.sugars_g = compute_sugar_limit(in, sel.sugar);
  return out;
}

}  // namespace fuel
