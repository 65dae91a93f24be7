#include "engine/plan/macro_rebalancer.hpp"

#include <utility>

#include "engine/core/numeric.hpp"

namespace fuel {
namespace {

// The two macros other than `moved`, in carbs -> protein -> fat order.
std::pair<Macro, Macro> peers_of(Macro moved) noexcept {
  switch (moved) {
    case Macro::Carbs:   return {Macro::Protein, Macro::Fat};
    case Macro::Protein: return {Macro::Carbs, Macro::Fat};
    case Macro::Fat:     return {Macro::Carbs, Macro::Protein};
  }
  return {Macro::Protein, Macro::Fat};
}

double slider_value(double v) noexcept {
  if (!is_finite(v)) return 0.0;
  return clamp(v, 0.0, 100.0);
}

}  // namespace

MacroSplit rebalance(const MacroSplit& current, Macro moved, double v) {
  const double value = slider_value(v);
  const double remaining = 100.0 - value;
  const auto [pa, pb] = peers_of(moved);

  const double a = nonneg_or(current.get(pa), 0.0);
  const double b = nonneg_or(current.get(pb), 0.0);
  const double ratio = (a + b > 0.0) ? a / (a + b) : 0.5;

  const double new_a = round_half_up(remaining * ratio);

  MacroSplit out = current;
  out.set(moved, value);
  out.set(pa, new_a);
  out.set(pb, remaining - new_a);
  return out;
}

MacroSplit rebalance(const MacroSplit& current, Macro moved, double v, const MacroLocks& locks) {
  const auto [pa, pb] = peers_of(moved);
  const bool lock_a = locks.locked(pa);
  const bool lock_b = locks.locked(pb);

  if (locks.locked(moved) || (lock_a && lock_b)) return current;
  if (!lock_a && !lock_b) return rebalance(current, moved, v);

  const Macro fixed = lock_a ? pa : pb;
  const Macro open = lock_a ? pb : pa;
  const double locked_value = clamp(nonneg_or(current.get(fixed), 0.0), 0.0, 100.0);

  const double value = clamp(slider_value(v), 0.0, 100.0 - locked_value);

  MacroSplit out = current;
  out.set(moved, value);
  out.set(fixed, locked_value);
  out.set(open, 100.0 - value - locked_value);
  return out;
}

}  // namespace fuel
