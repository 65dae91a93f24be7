#pragma once
/*
===========================================================
Fragment 1.1 — Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging for the boundary layers
    (preference loading, CSV export, CLI).
  - The computation modules (algorithms/, plan/, daily/) never log.
    They return values or throw fuel::Error; the caller decides
    what the user sees.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - WARN/ERROR go to stderr, DEBUG/INFO to stdout.
===========================================================
*/

#include <optional>
#include <string>
#include <string_view>

namespace fuel {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

LogLevel get_log_level() noexcept;

// "debug" | "info" | "warn" | "error" (case-insensitive). Empty on anything else.
std::optional<LogLevel> parse_log_level(std::string_view s) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

// Same, with a component tag: "[prefs] unknown key 'foo'".
void log(LogLevel lvl, std::string_view component, const std::string& msg) noexcept;

} // namespace fuel
