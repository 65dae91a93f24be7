/*
================================================================================
Fragment 6.1 — CLI: Main Entry Point (fuelplan)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line front end over the goal engine:
    * plan       profile + preferences -> daily targets (optionally CSV)
    * remaining  today's remaining calories under the configured mode
    * rebalance  move one macro slider, print the new split
    * convert    display-unit conversion
    * help

Usage:
  fuelplan plan --prefs <path> [--today YYYY-MM-DD] [--csv <path|->] [--label <text>]
  fuelplan remaining --prefs <path> --eaten <kcal> [--burned <kcal>] [--active <kcal>]
                     [--steps <n>] [--partial-burn <kcal> --elapsed <0..1>]
  fuelplan rebalance --split <c/p/f> --macro carbs|protein|fat --value <pct>
                     [--lock carbs|protein|fat]...
  fuelplan convert --kind weight|length|energy|volume --value <x> --from <unit> --to <unit>

  Common: --log-level debug|info|warn|error (overrides the preference file)

Exit codes:
  0 - Success
  1 - Invalid arguments / malformed preferences
  2 - Engine error (unknown algorithm, invariant violation, config out of range)
  3 - Profile not ready (missing or invalid measurements)
  4 - I/O error
================================================================================
*/

#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/algorithms/algorithm_ids.hpp"
#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"
#include "engine/core/plan_key.hpp"
#include "engine/core/units.hpp"
#include "engine/daily/daily_summary.hpp"
#include "engine/io/goal_report_csv.hpp"
#include "engine/io/preferences_io.hpp"
#include "engine/plan/goal_planner.hpp"
#include "engine/plan/macro_rebalancer.hpp"

namespace fuel {
namespace {

enum class ExitCode : int {
  kSuccess = 0,
  kInvalidArgs = 1,
  kEngineError = 2,
  kUnready = 3,
  kIoError = 4,
};

constexpr std::string_view kComponent = "cli";

int code(ExitCode c) { return static_cast<int>(c); }

int exit_for(const Error& e) {
  switch (e.code()) {
    case ErrorCode::kInvalidArgument:
    case ErrorCode::kParseError:
      return code(ExitCode::kInvalidArgs);
    case ErrorCode::kIoError:
      return code(ExitCode::kIoError);
    case ErrorCode::kUnknownAlgorithm:
    case ErrorCode::kInvariantViolation:
    case ErrorCode::kConfigOutOfRange:
    case ErrorCode::kInternal:
      return code(ExitCode::kEngineError);
  }
  return code(ExitCode::kEngineError);
}

struct Args {
  std::string command;

  std::string prefs_path;
  std::optional<CivilDate> today;
  std::string csv_path;
  std::string label;
  std::optional<LogLevel> log_level;

  // remaining
  double eaten_kcal = 0.0;
  bool eaten_set = false;
  double burned_kcal = 0.0;
  double active_kcal = 0.0;
  double steps = 0.0;
  double partial_burn_kcal = 0.0;
  double elapsed_fraction = 0.0;

  // rebalance
  std::optional<MacroSplit> split;
  std::optional<Macro> macro;
  MacroLocks locks;

  // rebalance / convert
  std::optional<double> value;

  // convert
  std::string kind;
  std::string from_unit;
  std::string to_unit;
};

void print_usage(std::ostream& os) {
  os <<
    "fuelplan - daily nutrition and energy goal engine\n"
    "\n"
    "Usage:\n"
    "  fuelplan plan --prefs <path> [--today YYYY-MM-DD] [--csv <path|->] [--label <text>]\n"
    "  fuelplan remaining --prefs <path> --eaten <kcal> [--burned <kcal>] [--active <kcal>]\n"
    "                     [--steps <n>] [--partial-burn <kcal> --elapsed <0..1>]\n"
    "  fuelplan rebalance --split <c/p/f> --macro carbs|protein|fat --value <pct>\n"
    "                     [--lock carbs|protein|fat]...\n"
    "  fuelplan convert --kind weight|length|energy|volume --value <x> --from <unit> --to <unit>\n"
    "  fuelplan help\n"
    "\n"
    "Common options:\n"
    "  --log-level debug|info|warn|error\n"
    "\n"
    "Exit codes:\n"
    "  0 - Success\n"
    "  1 - Invalid arguments / malformed preferences\n"
    "  2 - Engine error\n"
    "  3 - Profile not ready\n"
    "  4 - I/O error\n";
}

bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!is_finite(v)) return false;
  *out = v;
  return true;
}

// "40/30/30" -> carbs / protein / fat
bool parse_split(const char* s, MacroSplit* out) {
  if (!s || !out) return false;
  const std::string text(s);
  const std::size_t a = text.find('/');
  const std::size_t b = (a == std::string::npos) ? std::string::npos : text.find('/', a + 1);
  if (b == std::string::npos) return false;

  MacroSplit m;
  if (!parse_double(text.substr(0, a).c_str(), &m.carbs_pct)) return false;
  if (!parse_double(text.substr(a + 1, b - a - 1).c_str(), &m.protein_pct)) return false;
  if (!parse_double(text.substr(b + 1).c_str(), &m.fat_pct)) return false;
  *out = m;
  return true;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  if (argc < 2) {
    a->command = "help";
    return true;
  }
  a->command = argv[1];

  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    auto need_value = [&]() -> bool {
      if (get_next(i, argc, argv, &v)) return true;
      *err = std::string(k) + " requires a value";
      return false;
    };
    auto need_number = [&](double* out) -> bool {
      if (!need_value()) return false;
      if (parse_double(v, out)) return true;
      *err = std::string(k) + ": expected a finite number, got '" + v + "'";
      return false;
    };

    if (std::strcmp(k, "--help") == 0 || std::strcmp(k, "-h") == 0) {
      a->command = "help";
      return true;
    }

    if (std::strcmp(k, "--prefs") == 0) {
      if (!need_value()) return false;
      a->prefs_path = v;
    } else if (std::strcmp(k, "--today") == 0) {
      if (!need_value()) return false;
      a->today = parse_civil_date(v);
      if (!a->today) { *err = "--today: expected YYYY-MM-DD, got '" + std::string(v) + "'"; return false; }
    } else if (std::strcmp(k, "--csv") == 0) {
      if (!need_value()) return false;
      a->csv_path = v;
    } else if (std::strcmp(k, "--label") == 0) {
      if (!need_value()) return false;
      a->label = v;
    } else if (std::strcmp(k, "--log-level") == 0) {
      if (!need_value()) return false;
      a->log_level = parse_log_level(v);
      if (!a->log_level) { *err = "--log-level: expected debug|info|warn|error"; return false; }
    } else if (std::strcmp(k, "--eaten") == 0) {
      if (!need_number(&a->eaten_kcal)) return false;
      a->eaten_set = true;
    } else if (std::strcmp(k, "--burned") == 0) {
      if (!need_number(&a->burned_kcal)) return false;
    } else if (std::strcmp(k, "--active") == 0) {
      if (!need_number(&a->active_kcal)) return false;
    } else if (std::strcmp(k, "--steps") == 0) {
      if (!need_number(&a->steps)) return false;
    } else if (std::strcmp(k, "--partial-burn") == 0) {
      if (!need_number(&a->partial_burn_kcal)) return false;
    } else if (std::strcmp(k, "--elapsed") == 0) {
      if (!need_number(&a->elapsed_fraction)) return false;
    } else if (std::strcmp(k, "--split") == 0) {
      if (!need_value()) return false;
      MacroSplit m;
      if (!parse_split(v, &m)) { *err = "--split: expected <carbs>/<protein>/<fat>"; return false; }
      a->split = m;
    } else if (std::strcmp(k, "--macro") == 0) {
      if (!need_value()) return false;
      a->macro = parse_macro(v);
    } else if (std::strcmp(k, "--lock") == 0) {
      if (!need_value()) return false;
      switch (parse_macro(v)) {
        case Macro::Carbs:   a->locks.carbs = true; break;
        case Macro::Protein: a->locks.protein = true; break;
        case Macro::Fat:     a->locks.fat = true; break;
      }
    } else if (std::strcmp(k, "--value") == 0) {
      double d = 0.0;
      if (!need_number(&d)) return false;
      a->value = d;
    } else if (std::strcmp(k, "--kind") == 0) {
      if (!need_value()) return false;
      a->kind = v;
    } else if (std::strcmp(k, "--from") == 0) {
      if (!need_value()) return false;
      a->from_unit = v;
    } else if (std::strcmp(k, "--to") == 0) {
      if (!need_value()) return false;
      a->to_unit = v;
    } else {
      *err = std::string("unknown option: ") + k;
      return false;
    }
  }
  return true;
}

CivilDate local_today() {
  const std::time_t now = std::time(nullptr);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &now);
#else
  localtime_r(&now, &tm);
#endif
  return CivilDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

std::string date_string(const CivilDate& d) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << d.year << "-" << std::setw(2) << d.month << "-"
      << std::setw(2) << d.day;
  return oss.str();
}

// Loads preferences and settles the evaluation date and log level.
PlanInputs load_inputs(const Args& a) {
  if (a.prefs_path.empty()) {
    FUEL_THROW(ErrorCode::kInvalidArgument, "--prefs <path> is required");
  }
  const PreferencesDocument doc = load_preferences_file(a.prefs_path);
  if (a.log_level) set_log_level(*a.log_level);
  else if (doc.log_level) set_log_level(*doc.log_level);

  PlanInputs in;
  in.profile = doc.profile;
  in.settings = doc.settings;
  if (a.today) in.today = *a.today;
  else if (doc.evaluation_date) in.today = *doc.evaluation_date;
  else in.today = local_today();

  log(LogLevel::DEBUG, kComponent, "evaluation date " + date_string(in.today));
  return in;
}

int report_unready() {
  std::cerr << "Profile not ready: sex, birth date, weight, height and activity level are required\n"
               "(and body fat or circumferences for body-fat based BMR formulas).\n";
  return code(ExitCode::kUnready);
}

void print_energy(std::ostream& os, const char* label, double kcal, units::EnergyUnit u) {
  os << "  " << std::left << std::setw(22) << label << std::right << std::setw(10)
     << std::fixed << std::setprecision(0) << units::convert_energy(kcal, units::EnergyUnit::Kcal, u)
     << " " << units::to_string(u) << "\n";
}

void print_amount(std::ostream& os, const char* label, double v, const char* unit, int precision = 0) {
  os << "  " << std::left << std::setw(22) << label << std::right << std::setw(10)
     << std::fixed << std::setprecision(precision) << v << " " << unit << "\n";
}

int cmd_plan(const Args& a) {
  const PlanInputs in = load_inputs(a);
  const auto plan = plan_goals(in);
  if (!plan) return report_unready();

  const PlanKey key = make_plan_key(in.profile, in.settings, in.today);
  const GoalSnapshot snap = make_snapshot(plan->patch, GoalSnapshot::application_defaults());
  const auto eu = in.settings.units.energy;
  const auto wu = in.settings.units.water;

  std::cout << "=== Daily Goal Plan ===\n";
  std::cout << "Plan id: " << key.plan_id() << "\n";
  std::cout << "Date:    " << date_string(in.today) << " (age " << plan->profile.age_years << ")\n";
  std::cout << "BMR formula: " << display_label(in.settings.algorithms.bmr) << "\n\n";

  std::cout << "Energy\n";
  print_energy(std::cout, "BMR", plan->budget.bmr_kcal, eu);
  print_energy(std::cout, "TDEE", plan->budget.tdee_kcal, eu);
  print_energy(std::cout, "Daily goal", snap.calories_kcal, eu);

  std::cout << "\nMacros (" << snap.carbs_pct << "/" << snap.protein_pct << "/" << snap.fat_pct << ")\n";
  if (!plan->macros.balanced) {
    std::cout << "  warning: split sums to " << plan->macros.split_sum_pct << " %, not 100 %\n";
  }
  print_amount(std::cout, "Carbohydrates", snap.carbs_g, "g");
  print_amount(std::cout, "Protein", snap.protein_g, "g");
  print_amount(std::cout, "Fat", snap.fat_g, "g");
  print_amount(std::cout, "Fiber", snap.fiber_g, "g");

  std::cout << "\nFat breakdown (" << to_string(in.settings.algorithms.fat_breakdown) << ")\n";
  print_amount(std::cout, "Saturated", snap.saturated_fat_g, "g", 1);
  print_amount(std::cout, "Trans", snap.trans_fat_g, "g", 1);
  print_amount(std::cout, "Polyunsaturated", snap.polyunsaturated_fat_g, "g", 1);
  print_amount(std::cout, "Monounsaturated", snap.monounsaturated_fat_g, "g", 1);

  std::cout << "\nMinerals (" << to_string(in.settings.algorithms.mineral) << ")\n";
  print_amount(std::cout, "Cholesterol", snap.cholesterol_mg, "mg");
  print_amount(std::cout, "Sodium", snap.sodium_mg, "mg");
  print_amount(std::cout, "Potassium", snap.potassium_mg, "mg");
  print_amount(std::cout, "Calcium", snap.calcium_mg, "mg");
  print_amount(std::cout, "Iron", snap.iron_mg, "mg");

  std::cout << "\nVitamins (" << to_string(in.settings.algorithms.vitamin) << ")\n";
  print_amount(std::cout, "Vitamin A", snap.vitamin_a_mcg, "mcg");
  print_amount(std::cout, "Vitamin C", snap.vitamin_c_mg, "mg");

  std::cout << "\nSugar (" << to_string(in.settings.algorithms.sugar) << ")\n";
  print_amount(std::cout, "Sugar ceiling", snap.sugars_g, "g", 1);

  std::cout << "\nMeals\n";
  print_energy(std::cout, "Breakfast", plan->meals.breakfast_kcal, eu);
  print_energy(std::cout, "Lunch", plan->meals.lunch_kcal, eu);
  print_energy(std::cout, "Dinner", plan->meals.dinner_kcal, eu);
  print_energy(std::cout, "Snacks", plan->meals.snacks_kcal, eu);

  std::cout << "\nOther goals\n";
  print_amount(std::cout, "Water", units::convert_volume(snap.water_goal_ml, units::VolumeUnit::Ml, wu),
               units::to_string(wu), wu == units::VolumeUnit::Liter ? 2 : 0);
  print_amount(std::cout, "Exercise duration", snap.exercise_duration_min, "min");
  print_energy(std::cout, "Exercise calories", snap.exercise_calories_kcal, eu);

  if (a.csv_path.empty()) return code(ExitCode::kSuccess);

  GoalCsvOptions opt;
  opt.energy = eu;
  opt.water = wu;
  const std::vector<GoalReportRow> rows{GoalReportRow{a.label.empty() ? date_string(in.today) : a.label, snap}};
  if (a.csv_path == "-") {
    std::cout << "\n" << goal_report_to_csv(rows, opt);
    return code(ExitCode::kSuccess);
  }
  return write_goal_csv_file(rows, a.csv_path, opt) ? code(ExitCode::kSuccess) : code(ExitCode::kIoError);
}

int cmd_remaining(const Args& a) {
  if (!a.eaten_set) {
    std::cerr << "remaining: --eaten <kcal> is required\n";
    return code(ExitCode::kInvalidArgs);
  }

  const PlanInputs in = load_inputs(a);
  const auto plan = plan_goals(in);
  if (!plan) return report_unready();

  DayActivityInput day;
  day.eaten_kcal = a.eaten_kcal;
  day.other_exercise_kcal = a.burned_kcal;
  day.active_kcal = a.active_kcal;
  day.steps = a.steps;
  day.weight_kg = plan->profile.weight_kg;
  day.partial_burn_kcal = a.partial_burn_kcal;
  day.elapsed_fraction = a.elapsed_fraction;

  const CalorieAdjustmentConfig cfg = resolved_adjustment(in.settings);
  const double goal = plan->budget.daily_calorie_goal_kcal;
  const double tdee = compute_tdee_baseline(plan->budget.bmr_kcal, plan->profile.activity);
  const DailySummary s = summarize_day(cfg, day, goal, plan->budget.bmr_kcal, tdee);
  const auto eu = in.settings.units.energy;

  std::cout << "=== Remaining Calories (" << to_string(cfg.mode) << ") ===\n";
  print_energy(std::cout, "Goal", goal, eu);
  print_energy(std::cout, "Eaten", s.eaten_kcal, eu);
  print_energy(std::cout, "Exercise", s.exercise_kcal, eu);
  print_energy(std::cout, "Burned", s.burned_kcal, eu);
  print_energy(std::cout, "Net", s.net_kcal, eu);
  print_energy(std::cout, "Exercise credited", s.credited_kcal, eu);
  if (cfg.mode == AdjustmentMode::DeviceProjection) {
    print_energy(std::cout, "TDEE baseline", tdee, eu);
    print_energy(std::cout, s.projection_used ? "Projected burn" : "Device burn (raw)",
                 s.projected_burn_kcal, eu);
    if (!s.projection_used) {
      std::cout << "  not extrapolated (elapsed fraction " << a.elapsed_fraction << ")\n";
    }
  }
  print_energy(std::cout, "Remaining", s.remaining_kcal, eu);
  print_amount(std::cout, "Progress", s.progress_pct, "%");
  return code(ExitCode::kSuccess);
}

int cmd_rebalance(const Args& a) {
  if (!a.split || !a.macro || !a.value) {
    std::cerr << "rebalance: --split, --macro and --value are required\n";
    return code(ExitCode::kInvalidArgs);
  }

  const MacroSplit out = rebalance(*a.split, *a.macro, *a.value, a.locks);
  if (out == *a.split && a.split->get(*a.macro) != *a.value) {
    log(LogLevel::WARN, kComponent, "move rejected by locks; split unchanged");
  }
  std::cout << std::fixed << std::setprecision(0) << out.carbs_pct << "/" << out.protein_pct << "/"
            << out.fat_pct << "\n";
  return code(ExitCode::kSuccess);
}

int cmd_convert(const Args& a) {
  if (a.kind.empty() || !a.value || a.from_unit.empty() || a.to_unit.empty()) {
    std::cerr << "convert: --kind, --value, --from and --to are required\n";
    return code(ExitCode::kInvalidArgs);
  }

  const double v = *a.value;
  double out = 0.0;
  if (a.kind == "weight") {
    out = units::convert_weight(v, units::parse_weight_unit(a.from_unit), units::parse_weight_unit(a.to_unit));
  } else if (a.kind == "length") {
    out = units::convert_length(v, units::parse_length_unit(a.from_unit), units::parse_length_unit(a.to_unit));
  } else if (a.kind == "energy") {
    out = units::convert_energy(v, units::parse_energy_unit(a.from_unit), units::parse_energy_unit(a.to_unit));
  } else if (a.kind == "volume") {
    out = units::convert_volume(v, units::parse_volume_unit(a.from_unit), units::parse_volume_unit(a.to_unit));
  } else {
    std::cerr << "convert: unknown kind '" << a.kind << "'\n";
    return code(ExitCode::kInvalidArgs);
  }

  std::cout << std::setprecision(6) << out << "\n";
  return code(ExitCode::kSuccess);
}

}  // namespace
}  // namespace fuel

int main(int argc, char** argv) {
  using namespace fuel;

  Args args;
  std::string err;
  try {
    if (!parse_args(argc, argv, &args, &err)) {
      std::cerr << "Error: " << err << "\n";
      print_usage(std::cerr);
      return code(ExitCode::kInvalidArgs);
    }
    if (args.log_level) set_log_level(*args.log_level);

    if (args.command == "help" || args.command == "--help" || args.command == "-h") {
      print_usage(std::cout);
      return code(ExitCode::kSuccess);
    }
    if (args.command == "plan") return cmd_plan(args);
    if (args.command == "remaining") return cmd_remaining(args);
    if (args.command == "rebalance") return cmd_rebalance(args);
    if (args.command == "convert") return cmd_convert(args);

    std::cerr << "Unknown command: " << args.command << "\n";
    std::cerr << "Run 'fuelplan help' for usage information.\n";
    return code(ExitCode::kInvalidArgs);

  } catch (const Error& e) {
    log(LogLevel::ERROR, kComponent, std::string(to_string(e.code())) + ": " + e.message());
    return exit_for(e);
  } catch (const std::exception& e) {
    log(LogLevel::ERROR, kComponent, e.what());
    return code(ExitCode::kEngineError);
  }
}
