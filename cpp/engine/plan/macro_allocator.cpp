#include "engine/plan/macro_allocator.hpp"

#include <cmath>
#include <sstream>
#include <string>

#include "engine/core/error.hpp"
#include "engine/core/numeric.hpp"

namespace fuel {
namespace {

constexpr double kBalanceTol = 1e-9;

double grams_for(double calories, double pct, double kcal_per_g) noexcept {
  return round_half_up(calories * pct / 100.0 / kcal_per_g);
}

}  // namespace

double kcal_per_gram(Macro m) noexcept {
  switch (m) {
    case Macro::Carbs:   return kKcalPerGramCarbs;
    case Macro::Protein: return kKcalPerGramProtein;
    case Macro::Fat:     return kKcalPerGramFat;
  }
  return kKcalPerGramCarbs;
}

MacroTargets allocate_macros(double calories_kcal, const MacroSplit& split) {
  MacroTargets t;
  t.split_sum_pct = split.sum();
  t.balanced = std::fabs(t.split_sum_pct - 100.0) <= kBalanceTol;

  const double cal = nonneg_or(calories_kcal, 0.0);
  t.carbs_g = grams_for(cal, split.carbs_pct, kKcalPerGramCarbs);
  t.protein_g = grams_for(cal, split.protein_pct, kKcalPerGramProtein);
  t.fat_g = grams_for(cal, split.fat_pct, kKcalPerGramFat);
  t.fiber_g = round_half_up(cal / 1000.0 * kFiberGramsPer1000Kcal);
  return t;
}

void require_balanced(const MacroSplit& split) {
  const double sum = split.sum();
  if (!is_finite(sum) || std::fabs(sum - 100.0) > kBalanceTol) {
    std::ostringstream oss;
    oss << "macro split " << split.carbs_pct << "/" << split.protein_pct << "/"
        << split.fat_pct << " sums to " << sum << ", expected 100";
    FUEL_THROW(ErrorCode::kInvariantViolation, oss.str());
  }
}

MacroSplit template_split(std::string_view template_id) {
  if (template_id == "balanced") return MacroSplit{40.0, 30.0, 30.0};
  FUEL_THROW(ErrorCode::kInvalidArgument,
             "unknown diet template '" + std::string(template_id) + "'");
}

MacroSplit resolve_split(const MacroSplitSelection& sel) {
  if (sel.template_id == "custom") return sel.custom;
  return template_split(sel.template_id);
}

MacroSplit split_from_grams(double calories_kcal, double protein_g, double carbs_g, double fat_g) {
  MacroSplit s{0.0, 0.0, 0.0};
  if (!is_positive(calories_kcal)) return s;
  auto pct = [calories_kcal](double g, double kpg) {
    return round_half_up(nonneg_or(g, 0.0) * kpg / calories_kcal * 100.0);
  };
  s.carbs_pct = pct(carbs_g, kKcalPerGramCarbs);
  s.protein_pct = pct(protein_g, kKcalPerGramProtein);
  s.fat_pct = pct(fat_g, kKcalPerGramFat);
  return s;
}

MealTargets meal_targets(double calories_kcal, const MealSplit& meals) noexcept {
  const double cal = nonneg_or(calories_kcal, 0.0);
  MealTargets m;
  m.breakfast_kcal = cal * meals.breakfast_pct / 100.0;
  m.lunch_kcal = cal * meals.lunch_pct / 100.0;
  m.dinner_kcal = cal * meals.dinner_pct / 100.0;
  m.snacks_kcal = cal * meals.snacks_pct / 100.0;
  return m;
}

}  // namespace fuel
