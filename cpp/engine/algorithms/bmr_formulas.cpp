#include "engine/algorithms/bmr_formulas.hpp"

#include "engine/core/numeric.hpp"

namespace fuel::bmr {
namespace {

bool inputs_ok(const BmrInput& in) noexcept {
  return is_positive(in.weight_kg) && is_positive(in.height_cm) && is_positive(in.age_years);
}

std::optional<double> finite_positive(double kcal) noexcept {
  if (!is_positive(kcal)) return std::nullopt;
  return kcal;
}

}  // namespace

std::optional<double> mifflin_st_jeor(const BmrInput& in) noexcept {
  if (!inputs_ok(in)) return std::nullopt;
  const double base = 10.0 * in.weight_kg + 6.25 * in.height_cm - 5.0 * in.age_years;
  return finite_positive(base + (in.sex == Sex::Male ? 5.0 : -161.0));
}

std::optional<double> revised_harris_benedict(const BmrInput& in) noexcept {
  if (!inputs_ok(in)) return std::nullopt;
  const double w = in.weight_kg;
  const double h = in.height_cm;
  const double a = in.age_years;
  if (in.sex == Sex::Male) {
    return finite_positive(88.362 + 13.397 * w + 4.799 * h - 5.677 * a);
  }
  return finite_positive(447.593 + 9.247 * w + 3.098 * h - 4.330 * a);
}

std::optional<double> katch_mcardle(const BmrInput& in) noexcept {
  if (!is_positive(in.weight_kg) || !in.body_fat_pct) return std::nullopt;
  const double bf = *in.body_fat_pct;
  if (!is_finite(bf) || bf <= 0.0 || bf >= 100.0) return std::nullopt;

  const double lean_mass_kg = in.weight_kg * (1.0 - bf / 100.0);
  return finite_positive(370.0 + 21.6 * lean_mass_kg);
}

}  // namespace fuel::bmr
