#pragma once
/*
================================================================================
Fragment 3.5 — Plan: Goal Snapshot, Patches, Category Sets
FILE: cpp/engine/plan/goal_snapshot.hpp

Purpose:
  - GoalSnapshot is the complete record of daily targets (kcal / g / mg /
    mcg / ml / min / %). A computation never mutates one; it returns a
    GoalPatch with only the fields it recomputed.
  - The merge policy belongs to the caller: FieldOverrides names the fields
    the user edited by hand, which a merge keeps.

Field table:
  - goal_fields() lists every field once: key, category, unit, and member
    pointers into GoalSnapshot and GoalPatch. Merge, category filtering and
    the CSV exporter all walk this table, so a new field is one row.

Categories:
  Energy        calories, protein/carbs/fat/fiber grams, macro percentages
  FatBreakdown  saturated / trans / poly / mono grams
  Minerals      cholesterol / sodium / potassium / calcium / iron
  Vitamins      vitamin A / C
  Sugar         sugar ceiling
  Hydration     water goal
  Exercise      exercise duration / calories
  Meals         meal percentages
================================================================================
*/

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "engine/core/settings.hpp"

namespace fuel {

// ----------------------------- Categories ------------------------------------
enum class GoalCategory : uint32_t {
  Energy       = 1u << 0,
  FatBreakdown = 1u << 1,
  Minerals     = 1u << 2,
  Vitamins     = 1u << 3,
  Sugar        = 1u << 4,
  Hydration    = 1u << 5,
  Exercise     = 1u << 6,
  Meals        = 1u << 7,
};

const char* to_string(GoalCategory c) noexcept;

class CategorySet {
 public:
  constexpr CategorySet() = default;
  constexpr CategorySet(GoalCategory c) : bits_(static_cast<uint32_t>(c)) {}  // NOLINT implicit

  static constexpr CategorySet none() { return CategorySet{}; }
  static CategorySet all() noexcept;
  // Energy plus every category computed from the calorie goal.
  static CategorySet energy_and_derived() noexcept;

  constexpr bool has(GoalCategory c) const noexcept {
    return (bits_ & static_cast<uint32_t>(c)) != 0;
  }
  constexpr bool empty() const noexcept { return bits_ == 0; }
  constexpr uint32_t bits() const noexcept { return bits_; }

  // True when any category needs the energy budget.
  bool needs_energy() const noexcept;

  constexpr CategorySet& operator|=(CategorySet o) noexcept {
    bits_ |= o.bits_;
    return *this;
  }
  friend constexpr CategorySet operator|(CategorySet a, CategorySet b) noexcept {
    a |= b;
    return a;
  }
  friend constexpr bool operator==(CategorySet a, CategorySet b) noexcept {
    return a.bits_ == b.bits_;
  }

 private:
  uint32_t bits_ = 0;
};

// "energy,minerals" style list for logs and the CLI.
std::string describe(CategorySet s);

// ----------------------------- Snapshot / patch ------------------------------
struct GoalSnapshot {
  // Energy
  double calories_kcal = 0.0;
  double protein_g = 0.0;
  double carbs_g = 0.0;
  double fat_g = 0.0;
  double fiber_g = 0.0;
  double protein_pct = 0.0;
  double carbs_pct = 0.0;
  double fat_pct = 0.0;

  // Fat breakdown
  double saturated_fat_g = 0.0;
  double trans_fat_g = 0.0;
  double polyunsaturated_fat_g = 0.0;
  double monounsaturated_fat_g = 0.0;

  // Minerals
  double cholesterol_mg = 0.0;
  double sodium_mg = 0.0;
  double potassium_mg = 0.0;
  double calcium_mg = 0.0;
  double iron_mg = 0.0;

  // Vitamins
  double vitamin_a_mcg = 0.0;
  double vitamin_c_mg = 0.0;

  double sugars_g = 0.0;
  double water_goal_ml = 0.0;

  double exercise_duration_min = 0.0;
  double exercise_calories_kcal = 0.0;

  double breakfast_pct = 0.0;
  double lunch_pct = 0.0;
  double dinner_pct = 0.0;
  double snacks_pct = 0.0;

  // Targets a user starts with before any plan is computed.
  static GoalSnapshot application_defaults();

  bool operator==(const GoalSnapshot&) const = default;
};

struct GoalPatch {
  std::optional<double> calories_kcal;
  std::optional<double> protein_g;
  std::optional<double> carbs_g;
  std::optional<double> fat_g;
  std::optional<double> fiber_g;
  std::optional<double> protein_pct;
  std::optional<double> carbs_pct;
  std::optional<double> fat_pct;

  std::optional<double> saturated_fat_g;
  std::optional<double> trans_fat_g;
  std::optional<double> polyunsaturated_fat_g;
  std::optional<double> monounsaturated_fat_g;

  std::optional<double> cholesterol_mg;
  std::optional<double> sodium_mg;
  std::optional<double> potassium_mg;
  std::optional<double> calcium_mg;
  std::optional<double> iron_mg;

  std::optional<double> vitamin_a_mcg;
  std::optional<double> vitamin_c_mg;

  std::optional<double> sugars_g;
  std::optional<double> water_goal_ml;

  std::optional<double> exercise_duration_min;
  std::optional<double> exercise_calories_kcal;

  std::optional<double> breakfast_pct;
  std::optional<double> lunch_pct;
  std::optional<double> dinner_pct;
  std::optional<double> snacks_pct;

  // Number of present fields.
  std::size_t size() const noexcept;
  bool empty() const noexcept { return size() == 0; }

  // Categories with at least one present field.
  CategorySet categories() const noexcept;
};

// ----------------------------- Field table -----------------------------------
struct GoalField {
  const char* key;   // stable snake_case name (CSV header, overrides)
  const char* unit;  // "kcal", "g", "mg", "mcg", "ml", "min", "%"
  GoalCategory category;
  double GoalSnapshot::*value;
  std::optional<double> GoalPatch::*patch;
};

inline constexpr std::size_t kGoalFieldCount = 27;

const std::array<GoalField, kGoalFieldCount>& goal_fields() noexcept;

// Nullptr when `key` is not a snapshot field.
const GoalField* find_goal_field(std::string_view key) noexcept;

// ----------------------------- Merge -----------------------------------------
// Fields the user edited by hand. Keys are GoalField::key values.
class FieldOverrides {
 public:
  // Throws Error{kInvalidArgument} for a key that is not a snapshot field.
  void mark(std::string_view key);
  void clear(std::string_view key);

  bool overridden(std::string_view key) const;
  std::size_t size() const noexcept { return keys_.size(); }

 private:
  std::set<std::string, std::less<>> keys_;
};

// Present patch fields replace `previous` unless overridden; absent fields
// keep `previous`. Returns a new snapshot.
GoalSnapshot merge_patch(const GoalSnapshot& previous,
                         const GoalPatch& patch,
                         const FieldOverrides& overrides);

// First computation: present patch fields over `defaults`.
GoalSnapshot make_snapshot(const GoalPatch& patch, const GoalSnapshot& defaults);

// Drop every field whose category is not in `keep`.
GoalPatch restrict_patch(const GoalPatch& patch, CategorySet keep);

// ----------------------------- Selection changes -----------------------------
// BMR change         -> Energy + derived categories.
// Body-fat change    -> same, only when either BMR formula consumes body fat.
// Nutrient algorithm -> only its own category.
CategorySet categories_affected_by(const AlgorithmSelection& before,
                                   const AlgorithmSelection& after) noexcept;

}  // namespace fuel
