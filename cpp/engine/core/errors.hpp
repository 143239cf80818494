#pragma once
/*
================================================================================
Core: Error Types
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Uniform exception types for the sizing engine and its boundary helpers.
  - Every error carries a stable ErrorCode plus the throw site so a failed
    calculation can be traced from a log line back to the table lookup.

Taxonomy:
  - LookupError      missing table row (size / material / insulation rating /
                     ambient temperature / conductor count for the standard).
                     The only error the engine computation raises. Always
                     recoverable by the caller.
  - ValidationError  input outside the validator's ranges, or a Length whose
                     unit does not match the active standard.
  - IOError          CLI output failures.

Non-compliance ("no standard size satisfies both constraints") is NOT an
error. It is a successful CableSizingResult with isFullyCompliant=false.
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace cable {

// Stable values; they appear in CLI output and in SelectionOutcome.
enum class ErrorCode : int {
  kOk              = 0,
  kLookup          = 1,
  kInvalidArgument = 2,
  kUnitMismatch    = 3,
  kIoError         = 4,
  kInternal        = 5,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kOk:              return "Ok";
    case ErrorCode::kLookup:          return "Lookup";
    case ErrorCode::kInvalidArgument: return "InvalidArgument";
    case ErrorCode::kUnitMismatch:    return "UnitMismatch";
    case ErrorCode::kIoError:         return "IoError";
    case ErrorCode::kInternal:        return "Internal";
  }
  return "Unknown";
}

struct ErrorSite {
  const char* file = "";
  const char* function = "";
  int line = 0;
};

// Base error for the engine.
class CableError : public std::runtime_error {
 public:
  CableError(ErrorCode code, std::string message, ErrorSite site = {})
      : std::runtime_error(build_what(code, message, site)),
        code_(code),
        message_(std::move(message)),
        site_(site) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const ErrorSite& where() const noexcept { return site_; }

 private:
  static std::string build_what(ErrorCode code, const std::string& msg, const ErrorSite& site) {
    std::ostringstream oss;
    oss << "[cable::Error code=" << to_string(code) << "(" << static_cast<int>(code) << ")] "
        << msg;
    if (site.file && *site.file) {
      oss << " @ " << site.file << ":" << site.line;
      if (site.function && *site.function) oss << " (" << site.function << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  ErrorSite site_;
};

// No table row for the requested combination.
class LookupError final : public CableError {
 public:
  explicit LookupError(std::string msg, ErrorSite site = {})
      : CableError(ErrorCode::kLookup, std::move(msg), site) {}
};

// Input or contract violation caught at the boundary.
class ValidationError final : public CableError {
 public:
  explicit ValidationError(std::string msg,
                           ErrorCode code = ErrorCode::kInvalidArgument,
                           ErrorSite site = {})
      : CableError(code, std::move(msg), site) {}
};

class IOError final : public CableError {
 public:
  explicit IOError(std::string msg, ErrorSite site = {})
      : CableError(ErrorCode::kIoError, std::move(msg), site) {}
};

[[noreturn]] inline void throw_lookup(std::string message, ErrorSite site) {
  throw LookupError(std::move(message), site);
}

inline void require(bool ok, ErrorCode code, std::string message, ErrorSite site) {
  if (!ok) {
    throw ValidationError(std::move(message), code, site);
  }
}

}  // namespace cable

#define CABLE_SITE ::cable::ErrorSite{__FILE__, __func__, __LINE__}
#define CABLE_THROW_LOOKUP(MSG) ::cable::throw_lookup((MSG), CABLE_SITE)
#define CABLE_REQUIRE(EXPR, CODE, MSG) ::cable::require((EXPR), (CODE), (MSG), CABLE_SITE)
