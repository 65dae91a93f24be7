#pragma once
/*
================================================================================
Fragment 2.4 — Algorithms: Body-Fat Estimators (percent)
FILE: cpp/engine/algorithms/body_fat_formulas.hpp

Model:
  - U.S. Navy circumference method (Hodgdon & Beckett, metric form, cm):
        male   495 / (1.0324  - 0.19077 log10(waist - neck)       + 0.15456 log10(height)) - 450
        female 495 / (1.29579 - 0.35004 log10(waist + hips - neck) + 0.22100 log10(height)) - 450
  - BMI method (Deurenberg, 1991):
        1.20 BMI + 0.23 age - 10.8 (male = 1, female = 0) - 5.4

Notes:
  - std::nullopt when required circumferences are missing, the log argument
    is not positive, or the estimate falls outside (0, 100).
================================================================================
*/

#include <optional>

#include "engine/algorithms/strategy_types.hpp"

namespace fuel::body_fat {

std::optional<double> us_navy(const BodyFatInput& in) noexcept;
std::optional<double> bmi_method(const BodyFatInput& in) noexcept;

}  // namespace fuel::body_fat
