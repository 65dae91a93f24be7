#pragma once
/*
================================================================================
Fragment 1.6 — Core: Profile Schema
FILE: cpp/engine/core/profile.hpp

Purpose:
  - ProfileInput is what the external profile/measurement source hands us:
    every field may be missing. Weight/height/circumferences are already
    metric (kg, cm); callers holding display units convert with units.hpp.
  - Profile is the resolved, complete form a single computation consumes.
    It is immutable input and never owned by the engine.

Hardening:
  - resolve_profile() is the single place that turns "maybe" into "ready".
    Anything missing, non-finite or non-positive -> std::nullopt (Unready).
  - Age is whole years at the evaluation date, decremented when the birthday
    has not happened yet this year.
================================================================================
*/

#include <optional>

#include "engine/core/types.hpp"

namespace fuel {

struct CivilDate {
  int year = 1970;
  int month = 1;  // 1..12
  int day = 1;    // 1..31

  bool valid() const noexcept;
};

// "YYYY-MM-DD". Empty on malformed or impossible dates.
std::optional<CivilDate> parse_civil_date(const char* s) noexcept;

// Whole years between birth and `on`. Negative when birth is after `on`.
int age_on(const CivilDate& birth, const CivilDate& on) noexcept;

struct ProfileInput {
  std::optional<Sex> sex;
  std::optional<CivilDate> birth_date;
  std::optional<double> weight_kg;
  std::optional<double> height_cm;
  std::optional<ActivityLevel> activity;

  // Used only by body-fat driven BMR formulas and body-fat estimators.
  std::optional<double> body_fat_pct;
  std::optional<double> waist_cm;
  std::optional<double> neck_cm;
  std::optional<double> hips_cm;
};

struct Profile {
  Sex sex = Sex::Male;
  int age_years = 0;
  double weight_kg = 0.0;
  double height_cm = 0.0;
  ActivityLevel activity = ActivityLevel::Sedentary;

  std::optional<double> body_fat_pct;
  std::optional<double> waist_cm;
  std::optional<double> neck_cm;
  std::optional<double> hips_cm;

  // True when age/weight/height are finite and positive.
  bool complete() const noexcept;
};

std::optional<Profile> resolve_profile(const ProfileInput& in, const CivilDate& today);

}  // namespace fuel
