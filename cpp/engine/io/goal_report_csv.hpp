#pragma once
/*
================================================================================
Fragment 5.3 — IO: Goal Report CSV Exporter
FILE: cpp/engine/io/goal_report_csv.hpp

Purpose:
  - Export one or more GoalSnapshots (one row each, e.g. per day or per
    candidate plan) for spreadsheets and diffing.

Hardening:
  - Column order is the goal field table order; stable across runs.
  - Labels are CSV-escaped (delimiter, quote, newline).
  - NaN / Inf export as an empty cell, never "nan".
  - Snapshots are stored in kcal / ml. Energy and water columns are
    converted to the requested display unit here and nowhere else; the
    header names the unit actually written.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/core/units.hpp"
#include "engine/plan/goal_snapshot.hpp"

namespace fuel {

struct GoalCsvOptions {
  bool include_header = true;
  char delimiter = ',';
  int precision = 1;
  units::EnergyUnit energy = units::EnergyUnit::Kcal;
  units::VolumeUnit water = units::VolumeUnit::Ml;
};

struct GoalReportRow {
  std::string label;  // date, plan name, ...
  GoalSnapshot snapshot;
};

std::string goal_csv_header(const GoalCsvOptions& opt = GoalCsvOptions());

// Row without trailing newline.
std::string goal_snapshot_to_csv_row(const GoalReportRow& row,
                                     const GoalCsvOptions& opt = GoalCsvOptions());

// Header (optional) + rows, newline-terminated.
std::string goal_report_to_csv(const std::vector<GoalReportRow>& rows,
                               const GoalCsvOptions& opt = GoalCsvOptions());

// Returns false on I/O error (logged at ERROR).
bool write_goal_csv_file(const std::vector<GoalReportRow>& rows,
                         const std::string& file_path,
                         const GoalCsvOptions& opt = GoalCsvOptions());

}  // namespace fuel
