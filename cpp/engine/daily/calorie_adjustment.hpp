#pragma once
/*
================================================================================
Fragment 4.1 — Daily: Calorie Adjustment Policy
FILE: cpp/engine/daily/calorie_adjustment.hpp

Remaining budget per mode:
  dynamic           goal + burned - eaten
  fixed             goal - eaten
  percentage        goal + burned * pct/100 - eaten        pct clamped [0,100]
  smart             goal + max(0, burned - exercise_goal) - eaten
  device-projection goal - eaten + (partial_burn / elapsed - TDEE)
                    adjustment clamped >= 0 unless negatives are allowed

Edge cases:
  - device-projection with elapsed <= 0 or non-finite, or a projection
    that overflows: no projection yet, fixed-mode result.
  - elapsed below min_projection_fraction (default 0.05, about 72 minutes)
    or a partial burn <= 0: the partial burn is used un-extrapolated and
    projection_used stays false.
  - elapsed > 1 is treated as a full day.
  - pct NaN counts as 0. Range validation of the config belongs to the
    boundary (CalorieAdjustmentConfig::sanitize).
  - bmr_credit_kcal is added unscaled in dynamic and percentage modes only
    (BMR counted as burned energy). It is 0 unless the caller opts in.

Pure: no state between evaluations, never throws.
================================================================================
*/

#include "engine/core/settings.hpp"

namespace fuel {

struct ActivityEnergyRecord {
  double eaten_kcal = 0.0;
  double burned_kcal = 0.0;        // logged exercise
  double bmr_credit_kcal = 0.0;

  // Device-projection only.
  double partial_burn_kcal = 0.0;
  double elapsed_fraction = 0.0;   // (0, 1]
};

struct AdjustmentBreakdown {
  double remaining_kcal = 0.0;
  double adjustment_kcal = 0.0;    // credited on top of goal - eaten
  bool projection_used = false;    // partial burn was extrapolated
  double projected_burn_kcal = 0.0;  // full-day burn fed to the adjustment
};

AdjustmentBreakdown compute_adjustment(const CalorieAdjustmentConfig& cfg,
                                       const ActivityEnergyRecord& rec,
                                       double goal_kcal,
                                       double tdee_kcal) noexcept;

double compute_remaining(const CalorieAdjustmentConfig& cfg,
                         const ActivityEnergyRecord& rec,
                         double goal_kcal,
                         double tdee_kcal) noexcept;

}  // namespace fuel
