#pragma once
/*
================================================================================
Fragment 3.2 — Plan: Macro Allocation
FILE: cpp/engine/plan/macro_allocator.hpp

Model:
  grams = round(calories * pct/100 / kcal_per_gram)
    carbs 4, protein 4, fat 9 kcal/g
  fiber = round(calories/1000 * 14)   (not part of the split)

Notes:
  - Allocation never throws on an unbalanced split. It computes
    arithmetically and reports split_sum_pct / balanced so the caller can
    surface the imbalance. require_balanced() is the strict check.
  - Diet templates: "balanced" (40/30/30) and "custom".
================================================================================
*/

#include <string_view>

#include "engine/core/settings.hpp"
#include "engine/core/types.hpp"

namespace fuel {

inline constexpr double kKcalPerGramCarbs = 4.0;
inline constexpr double kKcalPerGramProtein = 4.0;
inline constexpr double kKcalPerGramFat = 9.0;
inline constexpr double kFiberGramsPer1000Kcal = 14.0;

double kcal_per_gram(Macro m) noexcept;

struct MacroTargets {
  double carbs_g = 0.0;
  double protein_g = 0.0;
  double fat_g = 0.0;
  double fiber_g = 0.0;

  double split_sum_pct = 0.0;
  bool balanced = false;
};

MacroTargets allocate_macros(double calories_kcal, const MacroSplit& split);

// Throws Error{kInvariantViolation} unless the split sums to 100.
void require_balanced(const MacroSplit& split);

// Named template -> split. "custom" returns sel.custom. Unknown -> kInvalidArgument.
MacroSplit template_split(std::string_view template_id);
MacroSplit resolve_split(const MacroSplitSelection& sel);

// Percentages persisted after the user edits grams directly.
// round(g * kcal_per_gram / calories * 100); calories <= 0 -> 0/0/0.
MacroSplit split_from_grams(double calories_kcal, double protein_g, double carbs_g, double fat_g);

struct MealTargets {
  double breakfast_kcal = 0.0;
  double lunch_kcal = 0.0;
  double dinner_kcal = 0.0;
  double snacks_kcal = 0.0;
};

MealTargets meal_targets(double calories_kcal, const MealSplit& meals) noexcept;

}  // namespace fuel
