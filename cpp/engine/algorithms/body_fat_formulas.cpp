#include "engine/algorithms/body_fat_formulas.hpp"

#include <cmath>

#include "engine/core/numeric.hpp"

namespace fuel::body_fat {
namespace {

std::optional<double> plausible(double pct) noexcept {
  if (!is_finite(pct) || pct <= 0.0 || pct >= 100.0) return std::nullopt;
  return pct;
}

}  // namespace

std::optional<double> us_navy(const BodyFatInput& in) noexcept {
  if (!is_positive(in.height_cm) || !in.waist_cm || !in.neck_cm) return std::nullopt;

  const double waist = *in.waist_cm;
  const double neck = *in.neck_cm;
  const double log_h = std::log10(in.height_cm);

  if (in.sex == Sex::Male) {
    const double span = waist - neck;
    if (!is_positive(span)) return std::nullopt;
    const double density = 1.0324 - 0.19077 * std::log10(span) + 0.15456 * log_h;
    return plausible(495.0 / density - 450.0);
  }

  if (!in.hips_cm) return std::nullopt;
  const double span = waist + *in.hips_cm - neck;
  if (!is_positive(span)) return std::nullopt;
  const double density = 1.29579 - 0.35004 * std::log10(span) + 0.22100 * log_h;
  return plausible(495.0 / density - 450.0);
}

std::optional<double> bmi_method(const BodyFatInput& in) noexcept {
  if (!is_positive(in.weight_kg) || !is_positive(in.height_cm) || !is_positive(in.age_years)) {
    return std::nullopt;
  }
  const double height_m = in.height_cm / 100.0;
  const double bmi = in.weight_kg / (height_m * height_m);
  const double sex_term = in.sex == Sex::Male ? 10.8 : 0.0;
  return plausible(1.20 * bmi + 0.23 * in.age_years - sex_term - 5.4);
}

}  // namespace fuel::body_fat
