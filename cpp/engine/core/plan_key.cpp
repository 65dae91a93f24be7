/*
================================================================================
Fragment 1.10 — Core: Plan Fingerprints (Implementation)
FILE: cpp/engine/core/plan_key.cpp

Hardening:
  - Enums hashed as underlying integers.
  - Floating values hashed via canonical bit patterns.
================================================================================
*/

#include "engine/core/plan_key.hpp"

#include <optional>
#include <string_view>

namespace fuel {
namespace {

inline void add_tag(Fnv1a64& h, std::string_view tag) {
  h.update_string(tag);
  h.update_u8(0x1F);
}

void add_opt(Fnv1a64& h, const std::optional<double>& v) {
  h.update_opt_f64(v ? &*v : nullptr);
}

template <class E>
void add_opt_enum(Fnv1a64& h, const std::optional<E>& v) {
  h.update_bool(v.has_value());
  if (v) h.update_enum(*v);
}

void add_date(Fnv1a64& h, const CivilDate& d) {
  h.update_i32(d.year);
  h.update_i32(d.month);
  h.update_i32(d.day);
}

}  // namespace

Hash64 hash_profile(const ProfileInput& p) {
  Fnv1a64 h;
  add_tag(h, "ProfileInput/v1");

  add_opt_enum(h, p.sex);
  h.update_bool(p.birth_date.has_value());
  if (p.birth_date) add_date(h, *p.birth_date);
  add_opt(h, p.weight_kg);
  add_opt(h, p.height_cm);
  add_opt_enum(h, p.activity);

  add_tag(h, "Composition");
  add_opt(h, p.body_fat_pct);
  add_opt(h, p.waist_cm);
  add_opt(h, p.neck_cm);
  add_opt(h, p.hips_cm);

  return Hash64{h.value()};
}

Hash64 hash_settings(const EngineSettings& s) {
  s.validate_or_throw();

  Fnv1a64 h;
  add_tag(h, "EngineSettings/v1");
  h.update_enum(s.primary_goal);

  add_tag(h, "Algorithms");
  h.update_enum(s.algorithms.bmr);
  h.update_enum(s.algorithms.body_fat);
  h.update_enum(s.algorithms.fat_breakdown);
  h.update_enum(s.algorithms.mineral);
  h.update_enum(s.algorithms.vitamin);
  h.update_enum(s.algorithms.sugar);

  add_tag(h, "MacroSplit");
  h.update_string(s.macros.template_id);
  h.update_f64(s.macros.custom.carbs_pct);
  h.update_f64(s.macros.custom.protein_pct);
  h.update_f64(s.macros.custom.fat_pct);

  add_tag(h, "Meals");
  h.update_f64(s.meals.breakfast_pct);
  h.update_f64(s.meals.lunch_pct);
  h.update_f64(s.meals.dinner_pct);
  h.update_f64(s.meals.snacks_pct);

  add_tag(h, "Adjustment");
  h.update_enum(s.adjustment.mode);
  h.update_f64(s.adjustment.earn_back_pct);
  h.update_f64(s.adjustment.exercise_calorie_goal_kcal);
  h.update_bool(s.adjustment.allow_negative_adjustment);
  h.update_f64(s.adjustment.min_projection_fraction);
  h.update_bool(s.adjustment.include_bmr_in_net);

  add_tag(h, "GoalDefaults");
  h.update_f64(s.goals.water_goal_ml);
  h.update_f64(s.goals.exercise_duration_min);
  h.update_f64(s.goals.exercise_calories_kcal);

  return Hash64{h.value()};
}

std::string PlanKey::plan_id() const {
  return std::string("p_") + profile_hex() +
         "__s_" + settings_hex() +
         "__k_" + combined_hex();
}

PlanKey make_plan_key(const ProfileInput& p, const EngineSettings& s, const CivilDate& today) {
  PlanKey k;
  k.profile_h = hash_profile(p);
  k.settings_h = hash_settings(s);

  Fnv1a64 d;
  add_tag(d, "EvaluationDate");
  add_date(d, today);

  k.combined_h = hash_combine(hash_combine(k.profile_h, k.settings_h), Hash64{d.value()});
  return k;
}

}  // namespace fuel
