#pragma once
/*
================================================================================
Fragment 1.11 — Core: Selftest Harness
FILE: cpp/engine/core/selftest_harness.hpp

Purpose:
  - Framework-free checks shared by the *_selftest executables.
  - "[ OK ] msg" / "[FAIL] msg" on stderr; finish() returns the exit code.

Usage:
    using namespace fuel::selftest;
    expect_near(bmr, 1780.0, 1e-9, "BMR reference profile");
    return finish();
================================================================================
*/

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "engine/core/error.hpp"

namespace fuel::selftest {

inline int g_fail_count = 0;

inline void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

// Relative-or-absolute closeness.
inline bool near(double a, double b, double rel = 1e-9, double abs = 1e-12) noexcept {
  const double da = std::fabs(a - b);
  if (da <= abs) return true;
  const double sc = std::max({std::fabs(a), std::fabs(b), abs});
  return da / sc <= rel;
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

inline void expect_eq(double got, double exp, std::string_view msg) {
  if (got != exp) {
    fail(msg);
    std::cerr << "  expected " << exp << ", got " << got << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_near(double got, double exp, double tol, std::string_view msg) {
  if (!(std::fabs(got - exp) <= tol)) {
    fail(msg);
    std::cerr << "  expected " << exp << " +/- " << tol << ", got " << got << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

template <class T>
void expect_empty(const std::optional<T>& v, std::string_view msg) {
  expect_true(!v.has_value(), msg);
}

// Runs fn and expects fuel::Error with `code`.
template <class Fn>
void expect_error(ErrorCode code, Fn&& fn, std::string_view msg) {
  try {
    fn();
  } catch (const Error& e) {
    if (e.code() == code) {
      pass(msg);
    } else {
      fail(msg);
      std::cerr << "  expected " << to_string(code) << ", got " << to_string(e.code()) << ": "
                << e.what() << "\n";
    }
    return;
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  expected fuel::Error, got std::exception: " << e.what() << "\n";
    return;
  }
  fail(msg);
  std::cerr << "  expected " << to_string(code) << ", nothing thrown\n";
}

template <class Fn>
void expect_no_throw(Fn&& fn, std::string_view msg) {
  try {
    fn();
    pass(msg);
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  threw: " << e.what() << "\n";
  }
}

inline int finish() {
  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}

}  // namespace fuel::selftest
