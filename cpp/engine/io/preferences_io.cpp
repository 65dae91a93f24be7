/*
================================================================================
Fragment 5.2 — IO: Preferences / Profile Loader (Implementation)
FILE: cpp/engine/io/preferences_io.cpp

Notes:
  - Keys follow the stored preference names; a few short aliases are
    accepted (mineral_algorithm for mineral_calculation_algorithm, ...).
  - Measurements are collected raw and converted after the whole file is
    read, so "weight_unit" may appear after "weight".
================================================================================
*/

#include "engine/io/preferences_io.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include "engine/algorithms/algorithm_ids.hpp"
#include "engine/core/error.hpp"
#include "engine/core/numeric.hpp"
#include "engine/core/units.hpp"

namespace fuel {
namespace {

constexpr std::string_view kComponent = "prefs";

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

double parse_number(std::string_view v) {
  const std::string s(v);
  char* end = nullptr;
  const double d = std::strtod(s.c_str(), &end);
  if (s.empty() || end == s.c_str() || *end != '\0' || !is_finite(d)) {
    FUEL_THROW(ErrorCode::kParseError, "expected a finite number, got '" + s + "'");
  }
  return d;
}

bool parse_flag(std::string_view v) {
  const std::string s = lower(v);
  if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
  if (s == "0" || s == "false" || s == "no" || s == "off") return false;
  FUEL_THROW(ErrorCode::kParseError, "expected true|false, got '" + std::string(v) + "'");
}

CivilDate parse_date(std::string_view v) {
  const std::string s(v);
  const auto d = parse_civil_date(s.c_str());
  if (!d) FUEL_THROW(ErrorCode::kParseError, "expected YYYY-MM-DD, got '" + s + "'");
  return *d;
}

// Raw measurements in their display units until the file is complete.
struct RawMeasurements {
  std::optional<double> weight;
  std::optional<double> height;
  std::optional<double> waist;
  std::optional<double> neck;
  std::optional<double> hips;
};

struct LoadContext {
  PreferencesDocument doc;
  RawMeasurements raw;
};

using Handler = void (*)(LoadContext&, std::string_view);

struct KeyRow {
  const char* key;
  Handler apply;
};

const KeyRow kKeys[] = {
    // Profile
    {"sex", [](LoadContext& c, std::string_view v) { c.doc.profile.sex = parse_sex(v); }},
    {"gender", [](LoadContext& c, std::string_view v) { c.doc.profile.sex = parse_sex(v); }},
    {"birth_date", [](LoadContext& c, std::string_view v) { c.doc.profile.birth_date = parse_date(v); }},
    {"date_of_birth", [](LoadContext& c, std::string_view v) { c.doc.profile.birth_date = parse_date(v); }},
    {"weight", [](LoadContext& c, std::string_view v) { c.raw.weight = parse_number(v); }},
    {"height", [](LoadContext& c, std::string_view v) { c.raw.height = parse_number(v); }},
    {"waist", [](LoadContext& c, std::string_view v) { c.raw.waist = parse_number(v); }},
    {"neck", [](LoadContext& c, std::string_view v) { c.raw.neck = parse_number(v); }},
    {"hips", [](LoadContext& c, std::string_view v) { c.raw.hips = parse_number(v); }},
    {"body_fat_pct", [](LoadContext& c, std::string_view v) { c.doc.profile.body_fat_pct = parse_number(v); }},
    {"activity_level", [](LoadContext& c, std::string_view v) { c.doc.profile.activity = parse_activity_level(v); }},
    {"primary_goal", [](LoadContext& c, std::string_view v) { c.doc.settings.primary_goal = parse_primary_goal(v); }},
    {"evaluation_date", [](LoadContext& c, std::string_view v) { c.doc.evaluation_date = parse_date(v); }},

    // Algorithms
    {"bmr_algorithm", [](LoadContext& c, std::string_view v) { c.doc.settings.algorithms.bmr = parse_bmr_algorithm(v); }},
    {"body_fat_algorithm", [](LoadContext& c, std::string_view v) { c.doc.settings.algorithms.body_fat = parse_body_fat_algorithm(v); }},
    {"fat_breakdown_algorithm", [](LoadContext& c, std::string_view v) { c.doc.settings.algorithms.fat_breakdown = parse_fat_breakdown_algorithm(v); }},
    {"mineral_calculation_algorithm", [](LoadContext& c, std::string_view v) { c.doc.settings.algorithms.mineral = parse_mineral_algorithm(v); }},
    {"mineral_algorithm", [](LoadContext& c, std::string_view v) { c.doc.settings.algorithms.mineral = parse_mineral_algorithm(v); }},
    {"vitamin_calculation_algorithm", [](LoadContext& c, std::string_view v) { c.doc.settings.algorithms.vitamin = parse_vitamin_algorithm(v); }},
    {"vitamin_algorithm", [](LoadContext& c, std::string_view v) { c.doc.settings.algorithms.vitamin = parse_vitamin_algorithm(v); }},
    {"sugar_calculation_algorithm", [](LoadContext& c, std::string_view v) { c.doc.settings.algorithms.sugar = parse_sugar_algorithm(v); }},
    {"sugar_algorithm", [](LoadContext& c, std::string_view v) { c.doc.settings.algorithms.sugar = parse_sugar_algorithm(v); }},

    // Macro split
    {"diet", [](LoadContext& c, std::string_view v) { c.doc.settings.macros.template_id = lower(v); }},
    {"carbs_pct", [](LoadContext& c, std::string_view v) { c.doc.settings.macros.custom.carbs_pct = parse_number(v); }},
    {"protein_pct", [](LoadContext& c, std::string_view v) { c.doc.settings.macros.custom.protein_pct = parse_number(v); }},
    {"fat_pct", [](LoadContext& c, std::string_view v) { c.doc.settings.macros.custom.fat_pct = parse_number(v); }},

    // Meals
    {"breakfast_pct", [](LoadContext& c, std::string_view v) { c.doc.settings.meals.breakfast_pct = parse_number(v); }},
    {"lunch_pct", [](LoadContext& c, std::string_view v) { c.doc.settings.meals.lunch_pct = parse_number(v); }},
    {"dinner_pct", [](LoadContext& c, std::string_view v) { c.doc.settings.meals.dinner_pct = parse_number(v); }},
    {"snacks_pct", [](LoadContext& c, std::string_view v) { c.doc.settings.meals.snacks_pct = parse_number(v); }},

    // Daily adjustment
    {"calorie_goal_adjustment_mode", [](LoadContext& c, std::string_view v) { c.doc.settings.adjustment.mode = parse_adjustment_mode(v); }},
    {"adjustment_mode", [](LoadContext& c, std::string_view v) { c.doc.settings.adjustment.mode = parse_adjustment_mode(v); }},
    {"exercise_calorie_percentage", [](LoadContext& c, std::string_view v) { c.doc.settings.adjustment.earn_back_pct = parse_number(v); }},
    {"earn_back_pct", [](LoadContext& c, std::string_view v) { c.doc.settings.adjustment.earn_back_pct = parse_number(v); }},
    {"exercise_calorie_goal", [](LoadContext& c, std::string_view v) { c.doc.settings.adjustment.exercise_calorie_goal_kcal = parse_number(v); }},
    {"allow_negative_adjustment", [](LoadContext& c, std::string_view v) { c.doc.settings.adjustment.allow_negative_adjustment = parse_flag(v); }},
    {"min_projection_fraction", [](LoadContext& c, std::string_view v) { c.doc.settings.adjustment.min_projection_fraction = parse_number(v); }},
    {"include_bmr_in_net_calories", [](LoadContext& c, std::string_view v) { c.doc.settings.adjustment.include_bmr_in_net = parse_flag(v); }},
    {"include_bmr_in_net", [](LoadContext& c, std::string_view v) { c.doc.settings.adjustment.include_bmr_in_net = parse_flag(v); }},

    // Display units
    {"weight_unit", [](LoadContext& c, std::string_view v) { c.doc.settings.units.weight = units::parse_weight_unit(v); }},
    {"length_unit", [](LoadContext& c, std::string_view v) { c.doc.settings.units.length = units::parse_length_unit(v); }},
    {"height_unit", [](LoadContext& c, std::string_view v) { c.doc.settings.units.length = units::parse_length_unit(v); }},
    {"energy_unit", [](LoadContext& c, std::string_view v) { c.doc.settings.units.energy = units::parse_energy_unit(v); }},
    {"water_unit", [](LoadContext& c, std::string_view v) { c.doc.settings.units.water = units::parse_volume_unit(v); }},
    {"water_display_unit", [](LoadContext& c, std::string_view v) { c.doc.settings.units.water = units::parse_volume_unit(v); }},

    // Goal defaults
    {"water_goal_ml", [](LoadContext& c, std::string_view v) { c.doc.settings.goals.water_goal_ml = parse_number(v); }},
    {"target_exercise_duration", [](LoadContext& c, std::string_view v) { c.doc.settings.goals.exercise_duration_min = parse_number(v); }},
    {"target_exercise_calories_burned", [](LoadContext& c, std::string_view v) { c.doc.settings.goals.exercise_calories_kcal = parse_number(v); }},

    // Ambient
    {"log_level", [](LoadContext& c, std::string_view v) {
       const auto lvl = parse_log_level(v);
       if (!lvl) FUEL_THROW(ErrorCode::kParseError, "expected debug|info|warn|error, got '" + std::string(v) + "'");
       c.doc.log_level = *lvl;
     }},
};

const KeyRow* find_key(std::string_view key) {
  for (const auto& row : kKeys) {
    if (key == row.key) return &row;
  }
  return nullptr;
}

std::string location(std::string_view source, int line) {
  std::ostringstream oss;
  oss << source << ":" << line << ": ";
  return oss.str();
}

// Invalid enum names from the core parsers are malformed values here.
ErrorCode boundary_code(ErrorCode c) noexcept {
  return c == ErrorCode::kInvalidArgument ? ErrorCode::kParseError : c;
}

void finish_measurements(LoadContext& c) {
  const auto wu = c.doc.settings.units.weight;
  const auto lu = c.doc.settings.units.length;
  auto to_cm = [lu](const std::optional<double>& v) -> std::optional<double> {
    if (!v) return std::nullopt;
    return units::convert_length(*v, lu, units::LengthUnit::Cm);
  };

  if (c.raw.weight) {
    c.doc.profile.weight_kg = units::convert_weight(*c.raw.weight, wu, units::WeightUnit::Kg);
  }
  c.doc.profile.height_cm = to_cm(c.raw.height);
  c.doc.profile.waist_cm = to_cm(c.raw.waist);
  c.doc.profile.neck_cm = to_cm(c.raw.neck);
  c.doc.profile.hips_cm = to_cm(c.raw.hips);
}

}  // namespace

PreferencesDocument parse_preferences(std::string_view text, std::string_view source_name) {
  LoadContext ctx;

  int line_no = 0;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    const std::size_t nl = text.find('\n', pos);
    std::string_view line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    pos = (nl == std::string_view::npos) ? text.size() + 1 : nl + 1;
    ++line_no;

    const std::size_t hash = line.find('#');
    if (hash != std::string_view::npos) line = line.substr(0, hash);
    line = trim(line);
    if (line.empty()) continue;

    const std::size_t eq = line.find('=');
    if (eq == std::string_view::npos) {
      FUEL_THROW(ErrorCode::kParseError,
                 location(source_name, line_no) + "expected 'key = value', got '" + std::string(line) + "'");
    }

    const std::string key = lower(trim(line.substr(0, eq)));
    const std::string_view value = trim(line.substr(eq + 1));
    if (key.empty()) {
      FUEL_THROW(ErrorCode::kParseError, location(source_name, line_no) + "empty key");
    }

    const KeyRow* row = find_key(key);
    if (!row) {
      log(LogLevel::WARN, kComponent,
          location(source_name, line_no) + "unknown key '" + key + "' ignored");
      ctx.doc.unknown_keys.push_back(key);
      continue;
    }

    try {
      row->apply(ctx, value);
    } catch (const Error& e) {
      FUEL_THROW(boundary_code(e.code()),
                 location(source_name, line_no) + key + ": " + e.message());
    }
  }

  finish_measurements(ctx);

  ctx.doc.issues = ctx.doc.settings.sanitize();
  for (const auto& issue : ctx.doc.issues) {
    log(LogLevel::WARN, kComponent,
        std::string(source_name) + ": " + std::string(to_string(ErrorCode::kConfigOutOfRange)) +
            " " + issue.to_string());
  }

  log(LogLevel::DEBUG, kComponent,
      std::string(source_name) + ": loaded " + std::to_string(line_no) + " lines");
  return std::move(ctx.doc);
}

PreferencesDocument load_preferences_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f.good()) {
    FUEL_THROW(ErrorCode::kIoError, "cannot open preferences file '" + path + "'");
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad()) {
    FUEL_THROW(ErrorCode::kIoError, "failed reading preferences file '" + path + "'");
  }
  return parse_preferences(ss.str(), path);
}

}  // namespace fuel
