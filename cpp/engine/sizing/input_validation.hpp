#pragma once
/*
================================================================================
Sizing: Input Validation (boundary)
FILE: cpp/engine/sizing/input_validation.hpp

Guarantees the ranges the engine assumes before a request reaches
select_conductor(). The engine itself only checks table membership.

Hard limits (errors):
  current            0.1 .. 10000 A
  length             0.1 .. 10000 (native unit)
  system voltage     1 .. 50000 V
  conductor count    1 .. 50
  ambient            inside the standard's temperature table
  length unit        native unit of the standard
  voltage drop limit (0, 25] % when given

Advisories (warnings, never block the calculation) use INPUT.* codes.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/sizing/sizing_types.hpp"

namespace cable {

struct ValidationIssue {
  std::string field;
  std::string message;
  ErrorCode code = ErrorCode::kInvalidArgument;
};

struct InputValidationReport {
  std::vector<ValidationIssue> errors;
  std::vector<Warning> warnings;

  bool ok() const noexcept { return errors.empty(); }
};

InputValidationReport validate_input(const CableSizingInput& input);

// Throws ValidationError listing every error. The code is kUnitMismatch when
// the only errors are unit mismatches, kInvalidArgument otherwise.
void validate_input_or_throw(const CableSizingInput& input);

// Converts a length into the standard's native unit.
Length normalize_length(const Length& length, Standard standard) noexcept;

} // namespace cable
