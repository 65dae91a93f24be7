#pragma once
/*
================================================================================
Fragment 2.5 — Algorithms: Nutrient Target Tables
FILE: cpp/engine/algorithms/nutrient_formulas.hpp

Fat breakdown:
  - AHA: saturated <= 6 % of energy, polyunsaturated up to 10 % of energy,
    trans 0, monounsaturated gets the remainder of total fat.

Minerals (mg/day):
  - RDA standard (US DRI tables, adults unless noted):
        cholesterol 300, sodium 2300,
        potassium 3400 M / 2600 F (14-18: 3000 M / 2300 F),
        calcium 1000 (9-18: 1300; F 51+ and everyone 71+: 1200),
        iron 8 M / 18 F 19-50 / 8 F 51+ (14-18: 11 M / 15 F, 9-13: 8).
  - DASH (NHLBI, 2000 kcal plan): sodium 1500, potassium 4700,
    calcium 1250, cholesterol 150. Iron follows the RDA table.

Vitamins:
  - RDA standard: vitamin A 900 M / 700 F mcg RAE (9-13: 600),
    vitamin C 90 M / 75 F mg (14-18: 75 M / 65 F, 9-13: 45).
  - EFSA population reference intakes: vitamin A 750 M / 650 F mcg RE,
    vitamin C 110 M / 95 F mg.

Sugar ceiling (grams, never above the carbohydrate budget):
  - WHO: free sugars < 10 % of energy.
  - WHO conditional: < 5 % of energy.
  - AHA added sugar: 36 g M / 25 g F.
================================================================================
*/

#include "engine/algorithms/strategy_types.hpp"

namespace fuel::nutrients {

FatBreakdown aha_fat_breakdown(const FatBreakdownInput& in) noexcept;

MineralTargets rda_minerals(const NutrientProfileInput& in) noexcept;
MineralTargets dash_minerals(const NutrientProfileInput& in) noexcept;

VitaminTargets rda_vitamins(const NutrientProfileInput& in) noexcept;
VitaminTargets efsa_vitamins(const NutrientProfileInput& in) noexcept;

double who_sugar_limit(const SugarInput& in) noexcept;
double who_conditional_sugar_limit(const SugarInput& in) noexcept;
double aha_added_sugar_limit(const SugarInput& in) noexcept;

}  // namespace fuel::nutrients
