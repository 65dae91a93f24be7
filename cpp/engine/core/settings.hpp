#pragma once
/*
================================================================================
Fragment 1.7 — Core: Engine Settings (Hardened)
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every preference a computation depends on (algorithm choices,
    macro split, meal split, daily adjustment policy, display units, goal
    defaults) into one explicit object passed to each entry point.
  - No ambient or global preference state anywhere in the engine.
  - ANY change here should change the plan fingerprint (plan_key).

Hardening:
  - validate_or_throw() is strict: out-of-range values throw
    Error{kConfigOutOfRange}, unregistered algorithm tags throw
    Error{kUnknownAlgorithm}.
  - sanitize() is the recoverable variant used at the preference boundary:
    clamps/defaults offending values and reports each change as a
    ConfigIssue. After sanitize(), validate_or_throw() passes.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/algorithms/algorithm_ids.hpp"
#include "engine/core/types.hpp"
#include "engine/core/units.hpp"

namespace fuel {

// One clamped or defaulted value.
struct ConfigIssue {
  std::string field;
  double original = 0.0;
  double applied = 0.0;
  std::string reason;

  std::string to_string() const;
};

// ----------------------------- Algorithms ------------------------------------
// Six independent choices; changing one never affects another.
struct AlgorithmSelection {
  BmrAlgorithm bmr = BmrAlgorithm::MifflinStJeor;
  BodyFatAlgorithm body_fat = BodyFatAlgorithm::UsNavy;
  FatBreakdownAlgorithm fat_breakdown = FatBreakdownAlgorithm::AhaGuidelines;
  MineralAlgorithm mineral = MineralAlgorithm::RdaStandard;
  VitaminAlgorithm vitamin = VitaminAlgorithm::RdaStandard;
  SugarAlgorithm sugar = SugarAlgorithm::WhoGuidelines;

  bool operator==(const AlgorithmSelection&) const = default;

  void validate_or_throw() const;
};

// ----------------------------- Macro split -----------------------------------
// Either a named diet template or "custom" backed by `custom`.
struct MacroSplitSelection {
  std::string template_id = "balanced";
  MacroSplit custom;

  // Each custom percentage finite and in [0, 100]. The sum-to-100 invariant
  // is checked by the allocator's require_balanced(), not here.
  void validate_or_throw() const;
  std::vector<ConfigIssue> sanitize();
};

// Meal percentages in [0, 100] each.
void validate_meal_split_or_throw(const MealSplit& m);
std::vector<ConfigIssue> sanitize_meal_split(MealSplit& m);

// ----------------------------- Daily adjustment ------------------------------
struct CalorieAdjustmentConfig {
  AdjustmentMode mode = AdjustmentMode::Dynamic;

  // Percentage mode: share of burned calories credited back, [0, 100].
  double earn_back_pct = 100.0;

  // Smart mode: burned calories up to this goal are not credited (kcal, >= 0).
  // 0 means "use the goal's exercise-calorie target", see resolved_adjustment().
  double exercise_calorie_goal_kcal = 0.0;

  // Device-projection mode: allow a negative projected adjustment.
  bool allow_negative_adjustment = false;

  // Device-projection mode: below this elapsed fraction the partial burn is
  // used as-is instead of being extrapolated to a full day, [0, 1].
  double min_projection_fraction = 0.05;

  // Dynamic / percentage modes: count BMR as burned energy in the net.
  bool include_bmr_in_net = false;

  void validate_or_throw() const;
  std::vector<ConfigIssue> sanitize();
};

// ----------------------------- Display units ---------------------------------
struct DisplayUnits {
  units::WeightUnit weight = units::WeightUnit::Kg;
  units::LengthUnit length = units::LengthUnit::Cm;
  units::EnergyUnit energy = units::EnergyUnit::Kcal;
  units::VolumeUnit water = units::VolumeUnit::Ml;
};

// ----------------------------- Goal defaults ---------------------------------
// Fields the engine does not compute but every snapshot carries.
struct GoalDefaults {
  double water_goal_ml = 1920.0;
  double exercise_duration_min = 0.0;
  double exercise_calories_kcal = 0.0;

  void validate_or_throw() const;
  std::vector<ConfigIssue> sanitize();
};

// ----------------------------- EngineSettings --------------------------------
struct EngineSettings {
  PrimaryGoal primary_goal = PrimaryGoal::Maintain;

  AlgorithmSelection algorithms;
  MacroSplitSelection macros;
  MealSplit meals;
  CalorieAdjustmentConfig adjustment;
  DisplayUnits units;
  GoalDefaults goals;

  void validate_or_throw() const {
    algorithms.validate_or_throw();
    macros.validate_or_throw();
    validate_meal_split_or_throw(meals);
    adjustment.validate_or_throw();
    goals.validate_or_throw();
  }

  std::vector<ConfigIssue> sanitize();

  static EngineSettings defaults() {
    EngineSettings s;
    return s;
  }
};

// Adjustment config as evaluated: an unset smart-mode exercise goal (0) takes
// GoalDefaults::exercise_calories_kcal, the snapshot's exercise target.
CalorieAdjustmentConfig resolved_adjustment(const EngineSettings& s);

}  // namespace fuel
