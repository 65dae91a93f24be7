/*
  Fragment 5.5 — IO Selftest

  Objective
  ---------
  Validate the boundary layers:
    1) Preference files: keys, aliases, display-unit conversion, comments,
       unknown keys, located ParseError / UnknownAlgorithm, sanitize issues.
    2) Goal CSV: stable header, unit conversion, label escaping, empty
       cell for non-finite values, file write.

  Expected use
  ------------
      ./io_selftest
  Non-zero return code indicates failure.
*/

#include <cstdio>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest_harness.hpp"
#include "engine/io/goal_report_csv.hpp"
#include "engine/io/preferences_io.hpp"

namespace fuel {
namespace {

using namespace fuel::selftest;

bool contains(const std::string& hay, const std::string& needle) {
  return hay.find(needle) != std::string::npos;
}

// Expects fuel::Error with `code` whose message contains `fragment`.
template <class Fn>
void expect_error_at(ErrorCode code, const std::string& fragment, Fn&& fn, const char* msg) {
  try {
    fn();
  } catch (const Error& e) {
    if (e.code() == code && contains(e.message(), fragment)) {
      pass(msg);
    } else {
      fail(msg);
      std::cerr << "  got " << to_string(e.code()) << ": " << e.message() << "\n";
    }
    return;
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  got std::exception: " << e.what() << "\n";
    return;
  }
  fail(msg);
  std::cerr << "  nothing thrown\n";
}

const char* kImperialPrefs =
    "# exported preferences\n"
    "gender = Male\n"
    "date_of_birth = 1994-06-15\n"
    "weight_unit = lb\n"
    "weight = 176.37   # unit line comes first\n"
    "height = 70.8661\n"
    "height_unit = in\n"
    "activity_level = moderate\n"
    "primary_goal = lose\n"
    "\n"
    "bmr_algorithm = Mifflin-St Jeor\n"
    "sugar_calculation_algorithm = AHA Added Sugar\n"
    "diet = Custom\n"
    "carbs_pct = 50\n"
    "protein_pct = 25\n"
    "fat_pct = 25\n"
    "calorie_goal_adjustment_mode = tdee\n"
    "allow_negative_adjustment = yes\n"
    "water_display_unit = oz\n"
    "evaluation_date = 2024-06-15\n"
    "log_level = warn\n";

void test_parse_preferences() {
  const PreferencesDocument d = parse_preferences(kImperialPrefs, "imperial.prefs");

  expect_true(d.profile.sex == Sex::Male, "gender alias parsed");
  expect_true(d.profile.birth_date.has_value() && d.profile.birth_date->year == 1994, "birth date parsed");
  expect_near(d.profile.weight_kg.value_or(0.0), 80.0, 1e-3, "176.37 lb -> 80 kg");
  expect_near(d.profile.height_cm.value_or(0.0), 180.0, 1e-3, "70.8661 in -> 180 cm");
  expect_true(d.profile.activity == ActivityLevel::Moderate, "activity parsed");
  expect_true(d.settings.primary_goal == PrimaryGoal::Lose, "primary goal parsed");
  expect_true(d.settings.algorithms.sugar == SugarAlgorithm::AhaAddedSugar, "sugar label parsed");
  expect_eq_str(d.settings.macros.template_id, "custom", "diet lowercased");
  expect_eq(d.settings.macros.custom.carbs_pct, 50.0, "custom carbs pct");
  expect_true(d.settings.adjustment.mode == AdjustmentMode::DeviceProjection, "'tdee' mode parsed");
  expect_true(d.settings.adjustment.allow_negative_adjustment, "flag parsed");
  expect_true(d.settings.units.water == units::VolumeUnit::Oz, "water display unit parsed");
  expect_true(d.evaluation_date.has_value() && d.evaluation_date->day == 15, "evaluation date parsed");
  expect_true(d.log_level.has_value() && *d.log_level == LogLevel::WARN, "log level parsed");
  expect_true(d.issues.empty(), "clean file has no issues");
  expect_true(d.unknown_keys.empty(), "clean file has no unknown keys");
}

void test_unknown_and_issues() {
  const PreferencesDocument d = parse_preferences(
      "sex = female\n"
      "favourite_colour = teal\n"
      "exercise_calorie_percentage = 135\n"
      "breakfast_pct = -5\n",
      "odd.prefs");

  expect_eq(static_cast<double>(d.unknown_keys.size()), 1.0, "one unknown key");
  if (!d.unknown_keys.empty()) expect_eq_str(d.unknown_keys.front(), "favourite_colour", "unknown key recorded");

  expect_eq(static_cast<double>(d.issues.size()), 2.0, "two clamped settings");
  expect_eq(d.settings.adjustment.earn_back_pct, 100.0, "earn-back clamped to 100");
  expect_eq(d.settings.meals.breakfast_pct, 0.0, "breakfast clamped to 0");
  expect_true(!d.profile.weight_kg.has_value(), "absent weight stays absent");
}

void test_parse_errors() {
  expect_error_at(ErrorCode::kParseError, "bad.prefs:2:",
                  [] { (void)parse_preferences("sex = male\nweight = heavy\n", "bad.prefs"); },
                  "non-numeric weight -> ParseError with line");
  expect_error_at(ErrorCode::kParseError, "bad.prefs:1:",
                  [] { (void)parse_preferences("sex = robot\n", "bad.prefs"); },
                  "unknown sex -> ParseError");
  expect_error_at(ErrorCode::kParseError, "bad.prefs:3:",
                  [] { (void)parse_preferences("# header\n\njust some words\n", "bad.prefs"); },
                  "line without '=' -> ParseError");
  expect_error_at(ErrorCode::kParseError, "birth_date",
                  [] { (void)parse_preferences("birth_date = 1990-13-01\n", "bad.prefs"); },
                  "impossible date -> ParseError");
  expect_error_at(ErrorCode::kUnknownAlgorithm, "bad.prefs:1:",
                  [] { (void)parse_preferences("bmr_algorithm = Cunningham\n", "bad.prefs"); },
                  "unregistered BMR formula -> UnknownAlgorithm with line");
  expect_error(ErrorCode::kIoError,
               [] { (void)load_preferences_file("/nonexistent/dir/fuelplan.prefs"); },
               "missing file -> IoError");
}

void test_load_file() {
  const std::string path = "io_selftest_prefs.tmp";
  {
    std::ofstream f(path);
    f << "sex = male\nbirth_date = 1994-06-15\nweight = 80\nheight = 180\n";
  }
  const PreferencesDocument d = load_preferences_file(path);
  expect_near(d.profile.weight_kg.value_or(0.0), 80.0, 1e-12, "file weight in kg");
  expect_near(d.profile.height_cm.value_or(0.0), 180.0, 1e-12, "file height in cm");
  std::remove(path.c_str());
}

void test_csv() {
  const std::string header = goal_csv_header();
  expect_true(header.rfind("label,calories_kcal,protein_g,carbs_g,fat_g,dietary_fiber_g,", 0) == 0,
              "header starts with the energy columns");
  expect_true(contains(header, ",protein_percentage_pct,"), "percent columns named pct");
  expect_true(contains(header, ",vitamin_a_mcg,"), "vitamin A column in mcg");
  expect_true(contains(header, ",water_goal_ml,"), "water column in ml");

  GoalCsvOptions kj;
  kj.energy = units::EnergyUnit::KJ;
  kj.water = units::VolumeUnit::Liter;
  const std::string kj_header = goal_csv_header(kj);
  expect_true(contains(kj_header, "calories_kJ"), "energy column renamed for kJ");
  expect_true(contains(kj_header, "water_goal_liter"), "water column renamed for liters");

  GoalReportRow row;
  row.label = "plan, \"lean\"";
  row.snapshot = GoalSnapshot::application_defaults();
  const std::string line = goal_snapshot_to_csv_row(row);
  expect_true(line.rfind("\"plan, \"\"lean\"\"\",2000.0,150.0,", 0) == 0, "label escaped, values fixed precision");

  const std::string kj_line = goal_snapshot_to_csv_row(row, kj);
  expect_true(contains(kj_line, ",8368.0,"), "2000 kcal written as 8368.0 kJ");
  expect_true(contains(kj_line, ",1.9,"), "1920 ml written as 1.9 L");

  GoalReportRow broken = row;
  broken.label = "broken";
  broken.snapshot.sodium_mg = std::numeric_limits<double>::quiet_NaN();
  expect_true(contains(goal_snapshot_to_csv_row(broken), ",,"), "NaN exported as an empty cell");

  const std::string doc = goal_report_to_csv({row, broken});
  std::size_t lines = 0;
  for (char c : doc) lines += (c == '\n') ? 1 : 0;
  expect_eq(static_cast<double>(lines), 3.0, "header plus two rows");

  GoalCsvOptions bare;
  bare.include_header = false;
  expect_true(goal_report_to_csv({row}, bare).rfind("\"plan", 0) == 0, "header can be omitted");

  const std::string path = "io_selftest_goals.tmp.csv";
  expect_true(write_goal_csv_file({row}, path), "CSV file written");
  std::ifstream in(path);
  std::string first;
  std::getline(in, first);
  expect_eq_str(first, header, "file starts with the header");
  in.close();
  std::remove(path.c_str());

  expect_true(!write_goal_csv_file({row}, "/nonexistent/dir/goals.csv"), "unwritable path -> false");
}

}  // namespace
}  // namespace fuel

int main() {
  // Unknown keys and clamps log at WARN.
  fuel::set_log_level(fuel::LogLevel::ERROR);

  fuel::test_parse_preferences();
  fuel::test_unknown_and_issues();
  fuel::test_parse_errors();
  fuel::test_load_file();
  fuel::test_csv();
  return fuel::selftest::finish();
}
