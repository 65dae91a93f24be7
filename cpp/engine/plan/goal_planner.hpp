#pragma once
/*
================================================================================
Fragment 3.6 — Plan: Goal Planner (profile + settings -> patch)
FILE: cpp/engine/plan/goal_planner.hpp

Purpose:
  - Runs the whole pipeline for one evaluation:
        resolve_profile -> energy budget -> macro split -> macro grams
        -> advanced nutrients -> meal / hydration / exercise targets
  - Emits a GoalPatch limited to the requested categories. The caller merges
    it over its previous snapshot (merge_patch) with its own overrides.

Hardening:
  - Unready is std::nullopt when an energy-dependent category is requested
    and the profile cannot be evaluated. Categories that do not depend on the
    profile (hydration, exercise, meals) are produced regardless.
  - UnknownAlgorithm / InvariantViolation propagate as fuel::Error.
================================================================================
*/

#include <optional>

#include "engine/core/profile.hpp"
#include "engine/core/settings.hpp"
#include "engine/plan/advanced_nutrients.hpp"
#include "engine/plan/energy_budget.hpp"
#include "engine/plan/goal_snapshot.hpp"
#include "engine/plan/macro_allocator.hpp"

namespace fuel {

struct PlanInputs {
  ProfileInput profile;
  CivilDate today;
  EngineSettings settings;
};

// Everything computed for a full plan, for callers that display more than the
// snapshot (BMR, TDEE, the resolved split and its balance, meal calories).
struct GoalPlan {
  Profile profile;
  EnergyBudget budget;
  MacroSplit split;
  MacroTargets macros;
  AdvancedNutrients nutrients;
  MealTargets meals;
  GoalPatch patch;  // every category
};

std::optional<GoalPlan> plan_goals(const PlanInputs& in);

std::optional<GoalPatch> build_goal_patch(const PlanInputs& in, CategorySet categories);

// Patch for the categories a selection change affects, computed with
// `new_selection`. Present-but-empty when nothing is affected.
std::optional<GoalPatch> recompute_for_selection_change(const PlanInputs& in,
                                                        const AlgorithmSelection& new_selection);

}  // namespace fuel
