#include "engine/core/settings.hpp"

#include <sstream>
#include <string_view>
#include <utility>

#include "engine/core/error.hpp"
#include "engine/core/numeric.hpp"

namespace fuel {
namespace {

bool in_range(double v, double lo, double hi) noexcept {
  return is_finite(v) && v >= lo && v <= hi;
}

void require_range(double v, double lo, double hi, const char* what) {
  if (!in_range(v, lo, hi)) {
    std::ostringstream oss;
    oss << what << " = " << v << " outside [" << lo << ", " << hi << "]";
    FUEL_THROW(ErrorCode::kConfigOutOfRange, oss.str());
  }
}

// Clamp finite values into [lo, hi]; non-finite -> fallback.
void clamp_field(double& v, double lo, double hi, double fallback,
                 const char* field, std::vector<ConfigIssue>& issues) {
  if (in_range(v, lo, hi)) return;
  ConfigIssue issue;
  issue.field = field;
  issue.original = v;
  if (!is_finite(v)) {
    v = fallback;
    issue.reason = "not a finite number, default applied";
  } else {
    v = clamp(v, lo, hi);
    issue.reason = "clamped to range";
  }
  issue.applied = v;
  issues.push_back(std::move(issue));
}

template <class E>
void require_registered(E id, const char* category) {
  if (std::string_view(to_string(id)) == "unknown") {
    FUEL_THROW(ErrorCode::kUnknownAlgorithm,
               std::string(category) + " algorithm tag " +
                   std::to_string(static_cast<int>(id)) + " is not registered");
  }
}

}  // namespace

std::string ConfigIssue::to_string() const {
  std::ostringstream oss;
  oss << field << ": " << original << " -> " << applied << " (" << reason << ")";
  return oss.str();
}

void AlgorithmSelection::validate_or_throw() const {
  require_registered(bmr, "BMR");
  require_registered(body_fat, "body-fat");
  require_registered(fat_breakdown, "fat-breakdown");
  require_registered(mineral, "mineral");
  require_registered(vitamin, "vitamin");
  require_registered(sugar, "sugar");
}

void MacroSplitSelection::validate_or_throw() const {
  if (template_id.empty()) {
    FUEL_THROW(ErrorCode::kConfigOutOfRange, "MacroSplitSelection: empty template id");
  }
  require_range(custom.carbs_pct, 0.0, 100.0, "MacroSplitSelection: carbs_pct");
  require_range(custom.protein_pct, 0.0, 100.0, "MacroSplitSelection: protein_pct");
  require_range(custom.fat_pct, 0.0, 100.0, "MacroSplitSelection: fat_pct");
}

std::vector<ConfigIssue> MacroSplitSelection::sanitize() {
  std::vector<ConfigIssue> issues;
  const MacroSplit d;
  clamp_field(custom.carbs_pct, 0.0, 100.0, d.carbs_pct, "carbs_pct", issues);
  clamp_field(custom.protein_pct, 0.0, 100.0, d.protein_pct, "protein_pct", issues);
  clamp_field(custom.fat_pct, 0.0, 100.0, d.fat_pct, "fat_pct", issues);
  if (template_id.empty()) template_id = "balanced";
  return issues;
}

void validate_meal_split_or_throw(const MealSplit& m) {
  require_range(m.breakfast_pct, 0.0, 100.0, "MealSplit: breakfast_pct");
  require_range(m.lunch_pct, 0.0, 100.0, "MealSplit: lunch_pct");
  require_range(m.dinner_pct, 0.0, 100.0, "MealSplit: dinner_pct");
  require_range(m.snacks_pct, 0.0, 100.0, "MealSplit: snacks_pct");
}

std::vector<ConfigIssue> sanitize_meal_split(MealSplit& m) {
  std::vector<ConfigIssue> issues;
  clamp_field(m.breakfast_pct, 0.0, 100.0, 25.0, "breakfast_pct", issues);
  clamp_field(m.lunch_pct, 0.0, 100.0, 25.0, "lunch_pct", issues);
  clamp_field(m.dinner_pct, 0.0, 100.0, 25.0, "dinner_pct", issues);
  clamp_field(m.snacks_pct, 0.0, 100.0, 25.0, "snacks_pct", issues);
  return issues;
}

void CalorieAdjustmentConfig::validate_or_throw() const {
  require_range(earn_back_pct, 0.0, 100.0, "CalorieAdjustmentConfig: earn_back_pct");
  if (!is_finite(exercise_calorie_goal_kcal) || exercise_calorie_goal_kcal < 0.0) {
    FUEL_THROW(ErrorCode::kConfigOutOfRange,
               "CalorieAdjustmentConfig: exercise_calorie_goal_kcal must be >= 0");
  }
  require_range(min_projection_fraction, 0.0, 1.0,
                "CalorieAdjustmentConfig: min_projection_fraction");
}

std::vector<ConfigIssue> CalorieAdjustmentConfig::sanitize() {
  std::vector<ConfigIssue> issues;
  clamp_field(earn_back_pct, 0.0, 100.0, 100.0, "earn_back_pct", issues);

  if (!is_finite(exercise_calorie_goal_kcal) || exercise_calorie_goal_kcal < 0.0) {
    ConfigIssue issue;
    issue.field = "exercise_calorie_goal";
    issue.original = exercise_calorie_goal_kcal;
    issue.applied = 0.0;
    issue.reason = "must be >= 0";
    exercise_calorie_goal_kcal = 0.0;
    issues.push_back(std::move(issue));
  }

  clamp_field(min_projection_fraction, 0.0, 1.0, 0.05, "min_projection_fraction", issues);
  return issues;
}

void GoalDefaults::validate_or_throw() const {
  require_range(water_goal_ml, 0.0, 20000.0, "GoalDefaults: water_goal_ml");
  require_range(exercise_duration_min, 0.0, 1440.0, "GoalDefaults: exercise_duration_min");
  require_range(exercise_calories_kcal, 0.0, 20000.0, "GoalDefaults: exercise_calories_kcal");
}

std::vector<ConfigIssue> GoalDefaults::sanitize() {
  std::vector<ConfigIssue> issues;
  clamp_field(water_goal_ml, 0.0, 20000.0, 1920.0, "water_goal_ml", issues);
  clamp_field(exercise_duration_min, 0.0, 1440.0, 0.0, "exercise_duration_min", issues);
  clamp_field(exercise_calories_kcal, 0.0, 20000.0, 0.0, "exercise_calories", issues);
  return issues;
}

std::vector<ConfigIssue> EngineSettings::sanitize() {
  std::vector<ConfigIssue> all;
  auto append = [&all](std::vector<ConfigIssue> part) {
    for (auto& i : part) all.push_back(std::move(i));
  };
  append(macros.sanitize());
  append(sanitize_meal_split(meals));
  append(adjustment.sanitize());
  append(goals.sanitize());
  return all;
}

CalorieAdjustmentConfig resolved_adjustment(const EngineSettings& s) {
  CalorieAdjustmentConfig cfg = s.adjustment;
  if (!(cfg.exercise_calorie_goal_kcal > 0.0) && is_finite(s.goals.exercise_calories_kcal) &&
      s.goals.exercise_calories_kcal > 0.0) {
    cfg.exercise_calorie_goal_kcal = s.goals.exercise_calories_kcal;
  }
  return cfg;
}

}  // namespace fuel
