#pragma once
/*
================================================================================
Fragment 1.2 — Core: Error Type (ErrorCode + Error + Throw/Ensure Macros)
FILE: cpp/engine/core/error.hpp

Purpose:
  - One exception type for every failure the engine surfaces to callers.
  - Stable codes so the CLI and UI can map failures without string matching.

Taxonomy:
  - "Unready" is NOT here. Insufficient input is an empty std::optional at the
    call site, never an exception.
  - kUnknownAlgorithm   : identifier not present in the algorithm registry.
  - kInvariantViolation : a plugged-in strategy produced an out-of-bounds value
                          (sub-fraction over its parent total, sugar ceiling over
                          the carbohydrate budget) or a split was required to be
                          balanced and was not. Surfaced, never corrected.
  - kConfigOutOfRange   : strict validation of configuration. The boundary
                          normally clamps via sanitize() instead.
  - kInvalidArgument / kParseError / kIoError : boundary layers (config, CLI).
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace fuel {

enum class ErrorCode : int {
  kUnknownAlgorithm   = 1,
  kInvariantViolation = 2,
  kConfigOutOfRange   = 3,
  kInvalidArgument    = 4,
  kParseError         = 5,
  kIoError            = 6,
  kInternal           = 7,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kUnknownAlgorithm:   return "UnknownAlgorithm";
    case ErrorCode::kInvariantViolation: return "InvariantViolation";
    case ErrorCode::kConfigOutOfRange:   return "ConfigOutOfRange";
    case ErrorCode::kInvalidArgument:    return "InvalidArgument";
    case ErrorCode::kParseError:         return "ParseError";
    case ErrorCode::kIoError:            return "IoError";
    case ErrorCode::kInternal:           return "Internal";
    default:                             return "Unknown";
  }
}

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code,
        std::string message,
        const char* file,
        int line,
        const char* function)
      : std::runtime_error(build_what(code, message, file, line, function)),
        code_(code),
        message_(std::move(message)),
        file_(file ? file : ""),
        function_(function ? function : ""),
        line_(line) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const std::string& file() const noexcept { return file_; }
  const std::string& function() const noexcept { return function_; }
  int line() const noexcept { return line_; }

 private:
  static std::string build_what(ErrorCode code,
                                const std::string& msg,
                                const char* file,
                                int line,
                                const char* func) {
    std::ostringstream oss;
    oss << "[fuel::Error " << to_string(code) << "] " << msg;
    if (file && *file) {
      oss << " @ " << file << ":" << line;
      if (func && *func) oss << " (" << func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  std::string file_;
  std::string function_;
  int line_;
};

[[noreturn]] inline void throw_error(ErrorCode code,
                                     std::string message,
                                     const char* file,
                                     int line,
                                     const char* function) {
  throw Error(code, std::move(message), file, line, function);
}

inline void ensure(bool ok,
                   ErrorCode code,
                   std::string message,
                   const char* file,
                   int line,
                   const char* function) {
  if (!ok) {
    throw_error(code, std::move(message), file, line, function);
  }
}

}  // namespace fuel

#define FUEL_THROW(CODE, MSG) ::fuel::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)
#define FUEL_ENSURE(EXPR, CODE, MSG) ::fuel::ensure((EXPR), (CODE), (MSG), __FILE__, __LINE__, __func__)
