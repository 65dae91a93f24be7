/*
===========================================================
Fragment 1.1 — Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace fuel {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_log_mu;

static const char* level_tag(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

std::optional<LogLevel> parse_log_level(std::string_view s) noexcept {
  std::string k;
  k.reserve(s.size());
  for (char c : s) k.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (k == "debug") return LogLevel::DEBUG;
  if (k == "info") return LogLevel::INFO;
  if (k == "warn" || k == "warning") return LogLevel::WARN;
  if (k == "error") return LogLevel::ERROR;
  return std::nullopt;
}

static std::string utc_timestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  std::time_t tt = clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

static void write_line(LogLevel lvl, std::string_view component, const std::string& msg) {
  const int cur = g_level.load(std::memory_order_relaxed);
  if (static_cast<int>(lvl) < cur) return;

  std::lock_guard<std::mutex> lk(g_log_mu);

  std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
  out << "[" << utc_timestamp() << "]"
      << "[" << level_tag(lvl) << "] ";
  if (!component.empty()) out << "[" << component << "] ";
  out << msg << "\n";
  out.flush();
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  try {
    write_line(lvl, std::string_view{}, msg);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[fuel::log] dropped message: %s\n", e.what());
  }
}

void log(LogLevel lvl, std::string_view component, const std::string& msg) noexcept {
  try {
    write_line(lvl, component, msg);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[fuel::log] dropped message: %s\n", e.what());
  }
}

} // namespace fuel
