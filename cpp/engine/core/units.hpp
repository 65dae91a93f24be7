#pragma once
/*
================================================================================
Fragment 1.4 — Core: Units + Conversions
FILE: cpp/engine/core/units.hpp

Purpose:
  - The engine computes in kg / cm / kcal / ml only. Everything else is a
    display unit, converted at the boundary with the fixed factors below.
  - Bidirectional, stateless, no dependencies.

Hardening:
  - Factors are constexpr constants; no magic numbers in callers.
  - Non-finite input passes through unchanged (NaN in, NaN out). The caller
    checks finiteness before feeding the engine.
================================================================================
*/

#include <string_view>

namespace fuel::units {

// Mass
inline constexpr double kg_to_lb = 2.20462;
inline constexpr double lb_to_kg = 1.0 / kg_to_lb;

// Length
inline constexpr double in_to_cm = 2.54;
inline constexpr double cm_to_in = 1.0 / in_to_cm;

// Energy
inline constexpr double kcal_to_kJ = 4.184;
inline constexpr double kJ_to_kcal = 1.0 / kcal_to_kJ;

// Volume
inline constexpr double oz_to_ml = 29.5735;
inline constexpr double liter_to_ml = 1000.0;

enum class WeightUnit : int { Kg = 0, Lb = 1 };
enum class LengthUnit : int { Cm = 0, In = 1 };
enum class EnergyUnit : int { Kcal = 0, KJ = 1 };
enum class VolumeUnit : int { Ml = 0, Oz = 1, Liter = 2 };

double convert_weight(double v, WeightUnit from, WeightUnit to) noexcept;
double convert_length(double v, LengthUnit from, LengthUnit to) noexcept;
double convert_energy(double v, EnergyUnit from, EnergyUnit to) noexcept;
double convert_volume(double v, VolumeUnit from, VolumeUnit to) noexcept;

// Name parsing for config files and the CLI. Throws fuel::Error{kInvalidArgument}.
//   weight: kg | lb | lbs
//   length: cm | in | inches
//   energy: kcal | kj
//   volume: ml | oz | liter | l
WeightUnit parse_weight_unit(std::string_view s);
LengthUnit parse_length_unit(std::string_view s);
EnergyUnit parse_energy_unit(std::string_view s);
VolumeUnit parse_volume_unit(std::string_view s);

const char* to_string(WeightUnit u) noexcept;
const char* to_string(LengthUnit u) noexcept;
const char* to_string(EnergyUnit u) noexcept;
const char* to_string(VolumeUnit u) noexcept;

} // namespace fuel::units
