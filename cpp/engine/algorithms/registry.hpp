#pragma once
/*
================================================================================
Fragment 2.6 — Algorithms: Registry (single dispatch site per category)
FILE: cpp/engine/algorithms/registry.hpp

Purpose:
  - Maps an algorithm identifier to its strategy. Callers never branch on an
    identifier themselves; they go through these six functions.

Hardening:
  - Each dispatch is an exhaustive switch with no default. A tag outside the
    enumerators (cast from an integer, corrupt preference) throws
    Error{kUnknownAlgorithm}.
  - BMR / body fat return std::nullopt when the chosen formula lacks an
    input. That is Unready, not a failure.
================================================================================
*/

#include <optional>

#include "engine/algorithms/algorithm_ids.hpp"
#include "engine/algorithms/strategy_types.hpp"

namespace fuel::registry {

std::optional<double> evaluate_bmr(BmrAlgorithm id, const BmrInput& in);
std::optional<double> estimate_body_fat(BodyFatAlgorithm id, const BodyFatInput& in);
FatBreakdown split_fat(FatBreakdownAlgorithm id, const FatBreakdownInput& in);
MineralTargets mineral_targets(MineralAlgorithm id, const NutrientProfileInput& in);
VitaminTargets vitamin_targets(VitaminAlgorithm id, const NutrientProfileInput& in);
double sugar_limit(SugarAlgorithm id, const SugarInput& in);

}  // namespace fuel::registry
