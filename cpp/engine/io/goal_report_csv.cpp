/*
================================================================================
Fragment 5.4 — IO: Goal Report CSV Exporter Implementation
FILE: cpp/engine/io/goal_report_csv.cpp
================================================================================
*/

#include "engine/io/goal_report_csv.hpp"

#include <cmath>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "engine/core/logging.hpp"

namespace fuel {

// Quote if the cell contains the delimiter, a quote or a newline.
static std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }

  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

static std::string csv_double(double x, int precision) {
  if (!std::isfinite(x)) return "";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

static bool is_energy(const GoalField& f) { return std::strcmp(f.unit, "kcal") == 0; }
static bool is_water(const GoalField& f) { return std::strcmp(f.unit, "ml") == 0; }

static std::string column_unit(const GoalField& f, const GoalCsvOptions& opt) {
  if (is_energy(f)) return units::to_string(opt.energy);
  if (is_water(f)) return units::to_string(opt.water);
  if (std::strcmp(f.unit, "%") == 0) return "pct";
  return f.unit;
}

static double column_value(const GoalField& f, const GoalSnapshot& s, const GoalCsvOptions& opt) {
  const double v = s.*f.value;
  if (is_energy(f)) return units::convert_energy(v, units::EnergyUnit::Kcal, opt.energy);
  if (is_water(f)) return units::convert_volume(v, units::VolumeUnit::Ml, opt.water);
  return v;
}

std::string goal_csv_header(const GoalCsvOptions& opt) {
  std::ostringstream h;
  const char d = opt.delimiter;

  h << "label";
  for (const auto& f : goal_fields()) {
    h << d << f.key << "_" << column_unit(f, opt);
  }
  return h.str();
}

std::string goal_snapshot_to_csv_row(const GoalReportRow& row, const GoalCsvOptions& opt) {
  std::ostringstream out;
  const char d = opt.delimiter;

  out << csv_escape(row.label, d);
  for (const auto& f : goal_fields()) {
    out << d << csv_double(column_value(f, row.snapshot, opt), opt.precision);
  }
  return out.str();
}

std::string goal_report_to_csv(const std::vector<GoalReportRow>& rows, const GoalCsvOptions& opt) {
  std::ostringstream out;
  if (opt.include_header) out << goal_csv_header(opt) << "\n";
  for (const auto& r : rows) out << goal_snapshot_to_csv_row(r, opt) << "\n";
  return out.str();
}

bool write_goal_csv_file(const std::vector<GoalReportRow>& rows,
                         const std::string& file_path,
                         const GoalCsvOptions& opt) {
  std::ofstream ofs(file_path);
  if (!ofs.is_open()) {
    log(LogLevel::ERROR, "csv", "cannot open '" + file_path + "' for writing");
    return false;
  }

  ofs << goal_report_to_csv(rows, opt);
  if (!ofs.good()) {
    log(LogLevel::ERROR, "csv", "write to '" + file_path + "' failed");
    return false;
  }

  log(LogLevel::INFO, "csv", "wrote " + std::to_string(rows.size()) + " goal rows to " + file_path);
  return true;
}

}  // namespace fuel
