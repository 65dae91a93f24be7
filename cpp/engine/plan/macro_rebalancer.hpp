#pragma once
/*
================================================================================
Fragment 3.3 — Plan: Macro Slider Rebalancing
FILE: cpp/engine/plan/macro_rebalancer.hpp

Model (one slider moved to v):
  v clamped to [0, 100]
  remaining = 100 - v
  peers in fixed order carbs -> protein -> fat; "a" is the first untouched
  ratio = a / (a + b), 0.5 when a + b == 0
  a' = round(remaining * ratio)
  b' = remaining - a'            (complement, never rounded independently)

Invariant:
  - a' + b' + v == 100 exactly whenever v is a whole percentage.

Locks:
  - One peer locked: it keeps its value, v is limited to 100 - locked, the
    free peer takes 100 - v - locked.
  - Both peers locked, or the moved macro itself locked: the move is
    rejected and the current split is returned unchanged.
================================================================================
*/

#include "engine/core/types.hpp"

namespace fuel {

MacroSplit rebalance(const MacroSplit& current, Macro moved, double v);

MacroSplit rebalance(const MacroSplit& current, Macro moved, double v, const MacroLocks& locks);

}  // namespace fuel
