#pragma once
/*
================================================================================
Fragment 5.1 — IO: Preferences / Profile Loader
FILE: cpp/engine/io/preferences_io.hpp

Purpose:
  - Load the flat preference file the external preference store exports:
        # comment
        sex = female
        birth_date = 1990-04-12
        weight = 154
        weight_unit = lb
        bmr_algorithm = Mifflin-St Jeor
  - Produces a ProfileInput (metric) and an EngineSettings. Measurements
    are converted from their display unit here, at the boundary.

Hardening:
  - Malformed values throw Error{kParseError} with "<source>:<line>:".
  - Unregistered algorithm identifiers throw Error{kUnknownAlgorithm}, also
    with the location.
  - Unknown keys are logged at WARN and ignored.
  - Out-of-range settings are clamped (EngineSettings::sanitize), logged at
    WARN and reported in PreferencesDocument::issues. Never fatal.
  - Profile fields are not range-checked here; resolve_profile() decides
    readiness.
================================================================================
*/

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/core/profile.hpp"
#include "engine/core/settings.hpp"

namespace fuel {

struct PreferencesDocument {
  ProfileInput profile;
  EngineSettings settings;

  // Optional overrides for the caller.
  std::optional<CivilDate> evaluation_date;
  std::optional<LogLevel> log_level;

  std::vector<ConfigIssue> issues;
  std::vector<std::string> unknown_keys;
};

PreferencesDocument parse_preferences(std::string_view text, std::string_view source_name = "<memory>");

// Throws Error{kIoError} when the file cannot be read.
PreferencesDocument load_preferences_file(const std::string& path);

}  // namespace fuel
