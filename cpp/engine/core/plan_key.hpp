#pragma once
/*
================================================================================
Fragment 1.9 — Core: Plan Fingerprints
FILE: cpp/engine/core/plan_key.hpp

Purpose:
  - Reproducible key over everything a goal plan depends on:
      * profile inputs (sex, birth date, measurements, activity)
      * EngineSettings (algorithms, split, meals, adjustment, goal defaults)
      * the evaluation date (age changes on birthdays)
  - The engine never memoizes. Callers debounce slider drags and profile
    edits by comparing keys before recomputing.

Hardening:
  - Fields hashed in a fixed order behind versioned tags.
  - Optional fields hashed with a presence byte.
  - Display units are deliberately excluded: they never change a result.
================================================================================
*/

#include <string>

#include "engine/core/hashing.hpp"
#include "engine/core/profile.hpp"
#include "engine/core/settings.hpp"

namespace fuel {

struct PlanKey {
  Hash64 profile_h{};
  Hash64 settings_h{};
  Hash64 combined_h{};

  std::string profile_hex() const { return hash_to_hex(profile_h); }
  std::string settings_hex() const { return hash_to_hex(settings_h); }
  std::string combined_hex() const { return hash_to_hex(combined_h); }

  // Format: p_<16>__s_<16>__k_<16>
  std::string plan_id() const;

  bool operator==(const PlanKey& o) const noexcept { return combined_h == o.combined_h; }
};

Hash64 hash_profile(const ProfileInput& p);
Hash64 hash_settings(const EngineSettings& s);

PlanKey make_plan_key(const ProfileInput& p, const EngineSettings& s, const CivilDate& today);

}  // namespace fuel
