#pragma once
/*
================================================================================
Fragment 2.3 — Algorithms: BMR Formulas (kcal/day)
FILE: cpp/engine/algorithms/bmr_formulas.hpp

Model:
  - Mifflin-St Jeor (reference, 1990):
        10 w + 6.25 h - 5 a + (5 male | -161 female)
  - Revised Harris-Benedict (Roza & Shizgal, 1984):
        male   88.362 + 13.397 w + 4.799 h - 5.677 a
        female 447.593 + 9.247 w + 3.098 h - 4.330 a
  - Katch-McArdle:
        370 + 21.6 * LBM,  LBM = w * (1 - bf/100)

Notes:
  - Formulas are total: they never throw. std::nullopt when an input the
    formula needs is missing (Katch-McArdle without body fat) or the result
    is not a finite positive number.
================================================================================
*/

#include <optional>

#include "engine/algorithms/strategy_types.hpp"

namespace fuel::bmr {

std::optional<double> mifflin_st_jeor(const BmrInput& in) noexcept;
std::optional<double> revised_harris_benedict(const BmrInput& in) noexcept;
std::optional<double> katch_mcardle(const BmrInput& in) noexcept;

}  // namespace fuel::bmr
