#include "engine/core/units.hpp"

#include <cctype>
#include <cmath>
#include <string>

#include "engine/core/error.hpp"

namespace fuel::units {
namespace {

std::string lower(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  return out;
}

double volume_to_ml(double v, VolumeUnit u) noexcept {
  switch (u) {
    case VolumeUnit::Oz:    return v * oz_to_ml;
    case VolumeUnit::Liter: return v * liter_to_ml;
    case VolumeUnit::Ml:    break;
  }
  return v;
}

double ml_to_volume(double ml, VolumeUnit u) noexcept {
  switch (u) {
    case VolumeUnit::Oz:    return ml / oz_to_ml;
    case VolumeUnit::Liter: return ml / liter_to_ml;
    case VolumeUnit::Ml:    break;
  }
  return ml;
}

}  // namespace

double convert_weight(double v, WeightUnit from, WeightUnit to) noexcept {
  if (!std::isfinite(v) || from == to) return v;
  return from == WeightUnit::Kg ? v * kg_to_lb : v / kg_to_lb;
}

double convert_length(double v, LengthUnit from, LengthUnit to) noexcept {
  if (!std::isfinite(v) || from == to) return v;
  return from == LengthUnit::Cm ? v / in_to_cm : v * in_to_cm;
}

double convert_energy(double v, EnergyUnit from, EnergyUnit to) noexcept {
  if (!std::isfinite(v) || from == to) return v;
  return from == EnergyUnit::Kcal ? v * kcal_to_kJ : v / kcal_to_kJ;
}

double convert_volume(double v, VolumeUnit from, VolumeUnit to) noexcept {
  if (!std::isfinite(v) || from == to) return v;
  // Everything goes through ml so oz <-> liter needs no extra factor.
  return ml_to_volume(volume_to_ml(v, from), to);
}

WeightUnit parse_weight_unit(std::string_view s) {
  const std::string k = lower(s);
  if (k == "kg") return WeightUnit::Kg;
  if (k == "lb" || k == "lbs") return WeightUnit::Lb;
  FUEL_THROW(ErrorCode::kInvalidArgument, "unknown weight unit '" + std::string(s) + "'");
}

LengthUnit parse_length_unit(std::string_view s) {
  const std::string k = lower(s);
  if (k == "cm") return LengthUnit::Cm;
  if (k == "in" || k == "inches") return LengthUnit::In;
  FUEL_THROW(ErrorCode::kInvalidArgument, "unknown length unit '" + std::string(s) + "'");
}

EnergyUnit parse_energy_unit(std::string_view s) {
  const std::string k = lower(s);
  if (k == "kcal") return EnergyUnit::Kcal;
  if (k == "kj") return EnergyUnit::KJ;
  FUEL_THROW(ErrorCode::kInvalidArgument, "unknown energy unit '" + std::string(s) + "'");
}

VolumeUnit parse_volume_unit(std::string_view s) {
  const std::string k = lower(s);
  if (k == "ml") return VolumeUnit::Ml;
  if (k == "oz") return VolumeUnit::Oz;
  if (k == "liter" || k == "l") return VolumeUnit::Liter;
  FUEL_THROW(ErrorCode::kInvalidArgument, "unknown volume unit '" + std::string(s) + "'");
}

const char* to_string(WeightUnit u) noexcept {
  return u == WeightUnit::Lb ? "lb" : "kg";
}

const char* to_string(LengthUnit u) noexcept {
  return u == LengthUnit::In ? "in" : "cm";
}

const char* to_string(EnergyUnit u) noexcept {
  return u == EnergyUnit::KJ ? "kJ" : "kcal";
}

const char* to_string(VolumeUnit u) noexcept {
  switch (u) {
    case VolumeUnit::Oz:    return "oz";
    case VolumeUnit::Liter: return "liter";
    case VolumeUnit::Ml:    break;
  }
  return "ml";
}

} // namespace fuel::units
