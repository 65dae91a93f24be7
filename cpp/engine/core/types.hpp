#pragma once
/*
================================================================================
Fragment 1.5 — Core: Domain Enums + Small Value Types
FILE: cpp/engine/core/types.hpp

Purpose:
  - Shared vocabulary for every module: sex, activity level, primary goal,
    the three-way macro split, meal split, calorie adjustment mode.
  - Plain data. No hidden state, no ownership.

Notes:
  - Activity multipliers are fixed: 1.2 / 1.375 / 1.55 / 1.725.
  - Parsing accepts the snake_case key and, for activity, the legacy
    "not_much" key for sedentary. Unknown names throw kInvalidArgument.
================================================================================
*/

#include <string_view>

namespace fuel {

enum class Sex : int { Male = 0, Female = 1 };

enum class ActivityLevel : int {
  Sedentary = 0,
  Light = 1,
  Moderate = 2,
  Heavy = 3
};

enum class PrimaryGoal : int { Lose = 0, Maintain = 1, Gain = 2 };

double activity_multiplier(ActivityLevel a) noexcept;

const char* to_string(Sex s) noexcept;
const char* to_string(ActivityLevel a) noexcept;
const char* to_string(PrimaryGoal g) noexcept;

Sex parse_sex(std::string_view s);
ActivityLevel parse_activity_level(std::string_view s);
PrimaryGoal parse_primary_goal(std::string_view s);

// ----------------------------- Macros ----------------------------------------
enum class Macro : int { Carbs = 0, Protein = 1, Fat = 2 };

const char* to_string(Macro m) noexcept;
Macro parse_macro(std::string_view s);

// Percent of daily energy per macro. Should sum to 100; the rebalancer keeps
// it that way, the allocator only reports when it does not.
struct MacroSplit {
  double carbs_pct = 40.0;
  double protein_pct = 30.0;
  double fat_pct = 30.0;

  double sum() const noexcept { return carbs_pct + protein_pct + fat_pct; }

  double get(Macro m) const noexcept;
  void set(Macro m, double v) noexcept;

  bool operator==(const MacroSplit&) const = default;
};

struct MacroLocks {
  bool carbs = false;
  bool protein = false;
  bool fat = false;

  bool locked(Macro m) const noexcept;
};

// ----------------------------- Meals -----------------------------------------
struct MealSplit {
  double breakfast_pct = 25.0;
  double lunch_pct = 25.0;
  double dinner_pct = 25.0;
  double snacks_pct = 25.0;

  double sum() const noexcept { return breakfast_pct + lunch_pct + dinner_pct + snacks_pct; }
};

// ----------------------------- Daily adjustment ------------------------------
enum class AdjustmentMode : int {
  Dynamic = 0,          // full credit for burned calories
  Fixed = 1,            // activity never changes the budget
  Percentage = 2,       // earn back a configured share
  Smart = 3,            // credit only the surplus over the exercise goal
  DeviceProjection = 4  // extrapolate today's partial device burn
};

const char* to_string(AdjustmentMode m) noexcept;

// Also accepts "tdee" for DeviceProjection (stored preference value).
AdjustmentMode parse_adjustment_mode(std::string_view s);

}  // namespace fuel
