#pragma once
/*
================================================================================
Fragment 3.4 — Plan: Advanced Nutrient Targets
FILE: cpp/engine/plan/advanced_nutrients.hpp

Purpose:
  - Fat sub-fractions, minerals, vitamins and the sugar ceiling, each
    dispatched through the registry with its own selection.
  - One entry point per category so a selection change recomputes only the
    category it owns (goal_snapshot.hpp relies on that).

Hardening:
  - Strategies are trusted to be bounded, and then checked:
      * every fat sub-fraction >= 0, their sum <= total fat (+1e-9)
      * 0 <= sugars <= carbohydrate grams
      * every mineral / vitamin value finite and >= 0
    A breach throws Error{kInvariantViolation} naming the algorithm.
    Values are never clipped here.
================================================================================
*/

#include "engine/algorithms/strategy_types.hpp"
#include "engine/core/settings.hpp"

namespace fuel {

struct NutrientInputs {
  Sex sex = Sex::Male;
  int age_years = 0;
  double weight_kg = 0.0;
  ActivityLevel activity = ActivityLevel::Sedentary;
  double calories_kcal = 0.0;
  double total_fat_g = 0.0;
  double carbs_g = 0.0;
};

struct AdvancedNutrients {
  FatBreakdown fat;
  MineralTargets minerals;
  VitaminTargets vitamins;
  double sugars_g = 0.0;
};

// Post-condition checks applied to every strategy result. Throw
// Error{kInvariantViolation} naming `algorithm`; the boundary (sum == total,
// sugars == carbs) passes.
void check_fat_breakdown(const FatBreakdown& f, double total_fat_g, const char* algorithm);
void check_sugar_ceiling(double sugars_g, double carbs_g, const char* algorithm);

FatBreakdown compute_fat_breakdown(const NutrientInputs& in, FatBreakdownAlgorithm id);
MineralTargets compute_minerals(const NutrientInputs& in, MineralAlgorithm id);
VitaminTargets compute_vitamins(const NutrientInputs& in, VitaminAlgorithm id);
double compute_sugar_limit(const NutrientInputs& in, SugarAlgorithm id);

AdvancedNutrients compute_advanced_nutrients(const NutrientInputs& in, const AlgorithmSelection& sel);

}  // namespace fuel
