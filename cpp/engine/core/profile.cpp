#include "engine/core/profile.hpp"

#include <cstdio>
#include <cstring>

#include "engine/core/numeric.hpp"

namespace fuel {
namespace {

bool is_leap(int y) noexcept {
  return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

int days_in_month(int y, int m) noexcept {
  static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m < 1 || m > 12) return 0;
  return (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
}

// Optional measurements only count when they are usable numbers.
std::optional<double> positive_only(const std::optional<double>& v) {
  if (v && is_positive(*v)) return v;
  return std::nullopt;
}

}  // namespace

bool CivilDate::valid() const noexcept {
  if (year < 1 || month < 1 || month > 12) return false;
  return day >= 1 && day <= days_in_month(year, month);
}

std::optional<CivilDate> parse_civil_date(const char* s) noexcept {
  if (!s || std::strlen(s) != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
  CivilDate d;
  char tail = '\0';
  if (std::sscanf(s, "%4d-%2d-%2d%c", &d.year, &d.month, &d.day, &tail) != 3) return std::nullopt;
  if (!d.valid()) return std::nullopt;
  return d;
}

int age_on(const CivilDate& birth, const CivilDate& on) noexcept {
  int age = on.year - birth.year;
  if (on.month < birth.month || (on.month == birth.month && on.day < birth.day)) {
    --age;
  }
  return age;
}

bool Profile::complete() const noexcept {
  return age_years > 0 && is_positive(weight_kg) && is_positive(height_cm);
}

std::optional<Profile> resolve_profile(const ProfileInput& in, const CivilDate& today) {
  if (!in.sex || !in.birth_date || !in.weight_kg || !in.height_cm || !in.activity) {
    return std::nullopt;
  }
  if (!in.birth_date->valid() || !today.valid()) return std::nullopt;

  Profile p;
  p.sex = *in.sex;
  p.age_years = age_on(*in.birth_date, today);
  p.weight_kg = *in.weight_kg;
  p.height_cm = *in.height_cm;
  p.activity = *in.activity;

  if (!p.complete()) return std::nullopt;

  p.body_fat_pct = in.body_fat_pct && is_finite(*in.body_fat_pct) && *in.body_fat_pct > 0.0 &&
                           *in.body_fat_pct < 100.0
                       ? in.body_fat_pct
                       : std::nullopt;
  p.waist_cm = positive_only(in.waist_cm);
  p.neck_cm = positive_only(in.neck_cm);
  p.hips_cm = positive_only(in.hips_cm);
  return p;
}

}  // namespace fuel
