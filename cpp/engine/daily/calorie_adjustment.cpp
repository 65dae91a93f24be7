#include "engine/daily/calorie_adjustment.hpp"

#include <algorithm>
#include <limits>

#include "engine/core/numeric.hpp"

namespace fuel {
namespace {

constexpr double kNoProjection = std::numeric_limits<double>::quiet_NaN();

double earn_back_fraction(double pct) noexcept {
  if (!is_finite(pct)) return 0.0;
  return clamp(pct, 0.0, 100.0) / 100.0;
}

bool sample_available(const ActivityEnergyRecord& rec) noexcept {
  const double ef = rec.elapsed_fraction;
  if (!is_finite(ef) || ef <= 0.0) return false;
  return is_finite(rec.partial_burn_kcal);
}

bool early_in_day(const CalorieAdjustmentConfig& cfg, double ef) noexcept {
  return is_finite(cfg.min_projection_fraction) && ef < cfg.min_projection_fraction;
}

}  // namespace

AdjustmentBreakdown compute_adjustment(const CalorieAdjustmentConfig& cfg,
                                       const ActivityEnergyRecord& rec,
                                       double goal_kcal,
                                       double tdee_kcal) noexcept {
  const double base = goal_kcal - rec.eaten_kcal;

  AdjustmentBreakdown out;
  switch (cfg.mode) {
    case AdjustmentMode::Dynamic:
      out.adjustment_kcal = rec.burned_kcal + rec.bmr_credit_kcal;
      break;

    case AdjustmentMode::Fixed:
      out.adjustment_kcal = 0.0;
      break;

    case AdjustmentMode::Percentage:
      out.adjustment_kcal =
          rec.burned_kcal * earn_back_fraction(cfg.earn_back_pct) + rec.bmr_credit_kcal;
      break;

    case AdjustmentMode::Smart:
      out.adjustment_kcal =
          std::max(0.0, rec.burned_kcal - nonneg_or(cfg.exercise_calorie_goal_kcal, 0.0));
      break;

    case AdjustmentMode::DeviceProjection:
      if (sample_available(rec)) {
        const double ef = std::min(rec.elapsed_fraction, 1.0);
        double burn = rec.partial_burn_kcal;
        if (!early_in_day(cfg, ef) && burn > 0.0) {
          const double full_day = safe_div(burn, ef, kNoProjection);
          if (!is_finite(full_day)) break;  // overflow: fixed-mode result
          burn = full_day;
          out.projection_used = true;
        }
        out.projected_burn_kcal = burn;
        double adj = burn - tdee_kcal;
        if (!cfg.allow_negative_adjustment) adj = std::max(0.0, adj);
        out.adjustment_kcal = adj;
      }
      break;
  }

  out.remaining_kcal = base + out.adjustment_kcal;
  return out;
}

double compute_remaining(const CalorieAdjustmentConfig& cfg,
                         const ActivityEnergyRecord& rec,
                         double goal_kcal,
                         double tdee_kcal) noexcept {
  return compute_adjustment(cfg, rec, goal_kcal, tdee_kcal).remaining_kcal;
}

}  // namespace fuel
