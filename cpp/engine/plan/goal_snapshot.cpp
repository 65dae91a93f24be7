#include "engine/plan/goal_snapshot.hpp"

#include "engine/core/error.hpp"

namespace fuel {
namespace {

using C = GoalCategory;

constexpr std::array<GoalField, kGoalFieldCount> kFields = {{
    {"calories", "kcal", C::Energy, &GoalSnapshot::calories_kcal, &GoalPatch::calories_kcal},
    {"protein", "g", C::Energy, &GoalSnapshot::protein_g, &GoalPatch::protein_g},
    {"carbs", "g", C::Energy, &GoalSnapshot::carbs_g, &GoalPatch::carbs_g},
    {"fat", "g", C::Energy, &GoalSnapshot::fat_g, &GoalPatch::fat_g},
    {"dietary_fiber", "g", C::Energy, &GoalSnapshot::fiber_g, &GoalPatch::fiber_g},
    {"protein_percentage", "%", C::Energy, &GoalSnapshot::protein_pct, &GoalPatch::protein_pct},
    {"carbs_percentage", "%", C::Energy, &GoalSnapshot::carbs_pct, &GoalPatch::carbs_pct},
    {"fat_percentage", "%", C::Energy, &GoalSnapshot::fat_pct, &GoalPatch::fat_pct},

    {"saturated_fat", "g", C::FatBreakdown, &GoalSnapshot::saturated_fat_g, &GoalPatch::saturated_fat_g},
    {"trans_fat", "g", C::FatBreakdown, &GoalSnapshot::trans_fat_g, &GoalPatch::trans_fat_g},
    {"polyunsaturated_fat", "g", C::FatBreakdown, &GoalSnapshot::polyunsaturated_fat_g,
     &GoalPatch::polyunsaturated_fat_g},
    {"monounsaturated_fat", "g", C::FatBreakdown, &GoalSnapshot::monounsaturated_fat_g,
     &GoalPatch::monounsaturated_fat_g},

    {"cholesterol", "mg", C::Minerals, &GoalSnapshot::cholesterol_mg, &GoalPatch::cholesterol_mg},
    {"sodium", "mg", C::Minerals, &GoalSnapshot::sodium_mg, &GoalPatch::sodium_mg},
    {"potassium", "mg", C::Minerals, &GoalSnapshot::potassium_mg, &GoalPatch::potassium_mg},
    {"calcium", "mg", C::Minerals, &GoalSnapshot::calcium_mg, &GoalPatch::calcium_mg},
    {"iron", "mg", C::Minerals, &GoalSnapshot::iron_mg, &GoalPatch::iron_mg},

    {"vitamin_a", "mcg", C::Vitamins, &GoalSnapshot::vitamin_a_mcg, &GoalPatch::vitamin_a_mcg},
    {"vitamin_c", "mg", C::Vitamins, &GoalSnapshot::vitamin_c_mg, &GoalPatch::vitamin_c_mg},

    {"sugars", "g", C::Sugar, &GoalSnapshot::sugars_g, &GoalPatch::sugars_g},
    {"water_goal", "ml", C::Hydration, &GoalSnapshot::water_goal_ml, &GoalPatch::water_goal_ml},

    {"target_exercise_duration", "min", C::Exercise, &GoalSnapshot::exercise_duration_min,
     &GoalPatch::exercise_duration_min},
    {"target_exercise_calories_burned", "kcal", C::Exercise, &GoalSnapshot::exercise_calories_kcal,
     &GoalPatch::exercise_calories_kcal},

    {"breakfast_percentage", "%", C::Meals, &GoalSnapshot::breakfast_pct, &GoalPatch::breakfast_pct},
    {"lunch_percentage", "%", C::Meals, &GoalSnapshot::lunch_pct, &GoalPatch::lunch_pct},
    {"dinner_percentage", "%", C::Meals, &GoalSnapshot::dinner_pct, &GoalPatch::dinner_pct},
    {"snacks_percentage", "%", C::Meals, &GoalSnapshot::snacks_pct, &GoalPatch::snacks_pct},
}};

constexpr GoalCategory kAllCategories[] = {
    C::Energy, C::FatBreakdown, C::Minerals, C::Vitamins,
    C::Sugar,  C::Hydration,    C::Exercise, C::Meals,
};

}  // namespace

const char* to_string(GoalCategory c) noexcept {
  switch (c) {
    case C::Energy:       return "energy";
    case C::FatBreakdown: return "fat_breakdown";
    case C::Minerals:     return "minerals";
    case C::Vitamins:     return "vitamins";
    case C::Sugar:        return "sugar";
    case C::Hydration:    return "hydration";
    case C::Exercise:     return "exercise";
    case C::Meals:        return "meals";
  }
  return "unknown";
}

CategorySet CategorySet::all() noexcept {
  CategorySet s;
  for (auto c : kAllCategories) s |= c;
  return s;
}

CategorySet CategorySet::energy_and_derived() noexcept {
  return CategorySet(C::Energy) | C::FatBreakdown | C::Minerals | C::Vitamins | C::Sugar;
}

bool CategorySet::needs_energy() const noexcept {
  return (bits_ & energy_and_derived().bits_) != 0;
}

std::string describe(CategorySet s) {
  std::string out;
  for (auto c : kAllCategories) {
    if (!s.has(c)) continue;
    if (!out.empty()) out += ",";
    out += to_string(c);
  }
  return out.empty() ? std::string("none") : out;
}

GoalSnapshot GoalSnapshot::application_defaults() {
  GoalSnapshot s;
  s.calories_kcal = 2000.0;
  s.protein_g = 150.0;
  s.carbs_g = 250.0;
  s.fat_g = 67.0;
  s.fiber_g = 25.0;
  s.protein_pct = 30.0;
  s.carbs_pct = 40.0;
  s.fat_pct = 30.0;

  s.saturated_fat_g = 20.0;
  s.trans_fat_g = 0.0;
  s.polyunsaturated_fat_g = 10.0;
  s.monounsaturated_fat_g = 25.0;

  s.cholesterol_mg = 300.0;
  s.sodium_mg = 2300.0;
  s.potassium_mg = 3500.0;
  s.calcium_mg = 1000.0;
  s.iron_mg = 18.0;

  s.vitamin_a_mcg = 900.0;
  s.vitamin_c_mg = 90.0;

  s.sugars_g = 50.0;
  s.water_goal_ml = 1920.0;

  s.exercise_duration_min = 0.0;
  s.exercise_calories_kcal = 0.0;

  s.breakfast_pct = 25.0;
  s.lunch_pct = 25.0;
  s.dinner_pct = 25.0;
  s.snacks_pct = 25.0;
  return s;
}

std::size_t GoalPatch::size() const noexcept {
  std::size_t n = 0;
  for (const auto& f : kFields) {
    if ((this->*f.patch).has_value()) ++n;
  }
  return n;
}

CategorySet GoalPatch::categories() const noexcept {
  CategorySet s;
  for (const auto& f : kFields) {
    if ((this->*f.patch).has_value()) s |= f.category;
  }
  return s;
}

const std::array<GoalField, kGoalFieldCount>& goal_fields() noexcept {
  return kFields;
}

const GoalField* find_goal_field(std::string_view key) noexcept {
  for (const auto& f : kFields) {
    if (key == f.key) return &f;
  }
  return nullptr;
}

void FieldOverrides::mark(std::string_view key) {
  if (!find_goal_field(key)) {
    FUEL_THROW(ErrorCode::kInvalidArgument,
               "'" + std::string(key) + "' is not a goal field");
  }
  keys_.emplace(key);
}

void FieldOverrides::clear(std::string_view key) {
  const auto it = keys_.find(key);
  if (it != keys_.end()) keys_.erase(it);
}

bool FieldOverrides::overridden(std::string_view key) const {
  return keys_.find(key) != keys_.end();
}

GoalSnapshot merge_patch(const GoalSnapshot& previous,
                         const GoalPatch& patch,
                         const FieldOverrides& overrides) {
  GoalSnapshot out = previous;
  for (const auto& f : kFields) {
    const auto& v = patch.*f.patch;
    if (!v || overrides.overridden(f.key)) continue;
    out.*f.value = *v;
  }
  return out;
}

GoalSnapshot make_snapshot(const GoalPatch& patch, const GoalSnapshot& defaults) {
  return merge_patch(defaults, patch, FieldOverrides{});
}

GoalPatch restrict_patch(const GoalPatch& patch, CategorySet keep) {
  GoalPatch out;
  for (const auto& f : kFields) {
    if (keep.has(f.category)) out.*f.patch = patch.*f.patch;
  }
  return out;
}

CategorySet categories_affected_by(const AlgorithmSelection& before,
                                   const AlgorithmSelection& after) noexcept {
  CategorySet s;
  if (before.bmr != after.bmr) s |= CategorySet::energy_and_derived();

  if (before.body_fat != after.body_fat &&
      (bmr_uses_body_fat(before.bmr) || bmr_uses_body_fat(after.bmr))) {
    s |= CategorySet::energy_and_derived();
  }

  if (before.fat_breakdown != after.fat_breakdown) s |= C::FatBreakdown;
  if (before.mineral != after.mineral) s |= C::Minerals;
  if (before.vitamin != after.vitamin) s |= C::Vitamins;
  if (before.sugar != after.sugar) s |= C::Sugar;
  return s;
}

}  // namespace fuel
