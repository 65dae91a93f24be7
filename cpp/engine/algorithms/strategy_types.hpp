#pragma once
/*
================================================================================
Fragment 2.2 — Algorithms: Category Signatures
FILE: cpp/engine/algorithms/strategy_types.hpp

Every algorithm in a category takes the same input struct and returns the
same output struct. Units: kg, cm, years, kcal, grams, mg, mcg.

Bounds every strategy must respect (checked by the nutrient calculator):
  - FatBreakdown: each field >= 0, sum <= FatBreakdownInput::total_fat_g
  - sugar ceiling: 0 <= sugars_g <= SugarInput::carbs_g
================================================================================
*/

#include <optional>

#include "engine/core/types.hpp"

namespace fuel {

// ----------------------------- BMR -------------------------------------------
struct BmrInput {
  Sex sex = Sex::Male;
  double weight_kg = 0.0;
  double height_cm = 0.0;
  double age_years = 0.0;
  std::optional<double> body_fat_pct;
};

// ----------------------------- Body fat --------------------------------------
struct BodyFatInput {
  Sex sex = Sex::Male;
  double age_years = 0.0;
  double weight_kg = 0.0;
  double height_cm = 0.0;
  std::optional<double> waist_cm;
  std::optional<double> neck_cm;
  std::optional<double> hips_cm;
};

// ----------------------------- Fat breakdown ---------------------------------
struct FatBreakdownInput {
  double calories_kcal = 0.0;
  double total_fat_g = 0.0;
};

struct FatBreakdown {
  double saturated_g = 0.0;
  double trans_g = 0.0;
  double polyunsaturated_g = 0.0;
  double monounsaturated_g = 0.0;

  double total() const noexcept {
    return saturated_g + trans_g + polyunsaturated_g + monounsaturated_g;
  }
};

// ----------------------------- Minerals / vitamins ---------------------------
struct NutrientProfileInput {
  Sex sex = Sex::Male;
  int age_years = 0;
  double weight_kg = 0.0;
  ActivityLevel activity = ActivityLevel::Sedentary;
  double calories_kcal = 0.0;
};

struct MineralTargets {
  double cholesterol_mg = 0.0;
  double sodium_mg = 0.0;
  double potassium_mg = 0.0;
  double calcium_mg = 0.0;
  double iron_mg = 0.0;
};

struct VitaminTargets {
  double vitamin_a_mcg = 0.0;  // retinol activity equivalents
  double vitamin_c_mg = 0.0;
};

// ----------------------------- Sugar -----------------------------------------
struct SugarInput {
  Sex sex = Sex::Male;
  double calories_kcal = 0.0;
  double carbs_g = 0.0;
};

}  // namespace fuel
