#include "engine/core/types.hpp"

#include <cctype>
#include <string>

#include "engine/core/error.hpp"

namespace fuel {
namespace {

std::string key_of(std::string_view s) {
  std::string k;
  k.reserve(s.size());
  for (char c : s) {
    const auto u = static_cast<unsigned char>(c);
    if (c == '-' || c == ' ') k.push_back('_');
    else k.push_back(static_cast<char>(std::tolower(u)));
  }
  return k;
}

[[noreturn]] void unknown(const char* what, std::string_view s) {
  FUEL_THROW(ErrorCode::kInvalidArgument, std::string("unknown ") + what + " '" + std::string(s) + "'");
}

}  // namespace

double activity_multiplier(ActivityLevel a) noexcept {
  switch (a) {
    case ActivityLevel::Sedentary: return 1.2;
    case ActivityLevel::Light:     return 1.375;
    case ActivityLevel::Moderate:  return 1.55;
    case ActivityLevel::Heavy:     return 1.725;
  }
  return 1.2;
}

const char* to_string(Sex s) noexcept {
  return s == Sex::Female ? "female" : "male";
}

const char* to_string(ActivityLevel a) noexcept {
  switch (a) {
    case ActivityLevel::Sedentary: return "sedentary";
    case ActivityLevel::Light:     return "light";
    case ActivityLevel::Moderate:  return "moderate";
    case ActivityLevel::Heavy:     return "heavy";
  }
  return "sedentary";
}

const char* to_string(PrimaryGoal g) noexcept {
  switch (g) {
    case PrimaryGoal::Lose:     return "lose";
    case PrimaryGoal::Maintain: return "maintain";
    case PrimaryGoal::Gain:     return "gain";
  }
  return "maintain";
}

Sex parse_sex(std::string_view s) {
  const std::string k = key_of(s);
  if (k == "male" || k == "m") return Sex::Male;
  if (k == "female" || k == "f") return Sex::Female;
  unknown("sex", s);
}

ActivityLevel parse_activity_level(std::string_view s) {
  const std::string k = key_of(s);
  if (k == "sedentary" || k == "not_much") return ActivityLevel::Sedentary;
  if (k == "light") return ActivityLevel::Light;
  if (k == "moderate") return ActivityLevel::Moderate;
  if (k == "heavy") return ActivityLevel::Heavy;
  unknown("activity level", s);
}

PrimaryGoal parse_primary_goal(std::string_view s) {
  const std::string k = key_of(s);
  if (k == "lose" || k == "lose_weight") return PrimaryGoal::Lose;
  if (k == "maintain" || k == "maintain_weight") return PrimaryGoal::Maintain;
  if (k == "gain" || k == "gain_weight") return PrimaryGoal::Gain;
  unknown("primary goal", s);
}

const char* to_string(Macro m) noexcept {
  switch (m) {
    case Macro::Carbs:   return "carbs";
    case Macro::Protein: return "protein";
    case Macro::Fat:     return "fat";
  }
  return "carbs";
}

Macro parse_macro(std::string_view s) {
  const std::string k = key_of(s);
  if (k == "carbs" || k == "carbohydrate") return Macro::Carbs;
  if (k == "protein") return Macro::Protein;
  if (k == "fat") return Macro::Fat;
  unknown("macro", s);
}

double MacroSplit::get(Macro m) const noexcept {
  switch (m) {
    case Macro::Carbs:   return carbs_pct;
    case Macro::Protein: return protein_pct;
    case Macro::Fat:     return fat_pct;
  }
  return 0.0;
}

void MacroSplit::set(Macro m, double v) noexcept {
  switch (m) {
    case Macro::Carbs:   carbs_pct = v; break;
    case Macro::Protein: protein_pct = v; break;
    case Macro::Fat:     fat_pct = v; break;
  }
}

bool MacroLocks::locked(Macro m) const noexcept {
  switch (m) {
    case Macro::Carbs:   return carbs;
    case Macro::Protein: return protein;
    case Macro::Fat:     return fat;
  }
  return false;
}

const char* to_string(AdjustmentMode m) noexcept {
  switch (m) {
    case AdjustmentMode::Dynamic:          return "dynamic";
    case AdjustmentMode::Fixed:            return "fixed";
    case AdjustmentMode::Percentage:       return "percentage";
    case AdjustmentMode::Smart:            return "smart";
    case AdjustmentMode::DeviceProjection: return "device_projection";
  }
  return "dynamic";
}

AdjustmentMode parse_adjustment_mode(std::string_view s) {
  const std::string k = key_of(s);
  if (k == "dynamic") return AdjustmentMode::Dynamic;
  if (k == "fixed") return AdjustmentMode::Fixed;
  if (k == "percentage") return AdjustmentMode::Percentage;
  if (k == "smart") return AdjustmentMode::Smart;
  if (k == "device_projection" || k == "tdee") return AdjustmentMode::DeviceProjection;
  unknown("calorie adjustment mode", s);
}

}  // namespace fuel
