#pragma once
/*
================================================================================
Sizing: Voltage Drop Calculator
FILE: cpp/engine/sizing/voltage_drop.hpp

  volts   = multiplier * current * length * resistance / 1000
  percent = 100 * volts / system_voltage     (only when a voltage is given)

  multiplier: 2 (single-phase / DC round trip), sqrt(3) (three-phase).
  resistance: mV/A/m with length in m (IEC), ohm/1000 ft with length in ft
              (NEC). Both reduce to the same /1000 form.

Rules:
  - The length unit must be the standard's native unit. A mismatch throws
    ValidationError(kUnitMismatch); the calculator never converts.
  - A limit is violated only when percent > limit (equal is compliant).
================================================================================
*/

#include <optional>

#include "engine/core/units.hpp"
#include "engine/sizing/sizing_types.hpp"

namespace cable {

double circuit_multiplier(CircuitType circuit) noexcept;

// Throws ValidationError(kUnitMismatch) when length.unit is not native.
void require_native_length(Standard standard, const Length& length);

VoltageDrop compute_voltage_drop_with_resistance(double current_a,
                                                 const Length& length,
                                                 double resistance,
                                                 CircuitType circuit,
                                                 Standard standard,
                                                 std::optional<double> system_voltage_v = std::nullopt);

// Resolves resistance from StandardTables (LookupError on a missing row).
VoltageDrop compute_voltage_drop(double current_a,
                                 const Length& length,
                                 ConductorSize size,
                                 ConductorMaterial material,
                                 CircuitType circuit,
                                 Standard standard,
                                 std::optional<double> system_voltage_v = std::nullopt);

inline bool exceeds_voltage_drop_limit(double percent, double limit_percent) noexcept {
  return percent > limit_percent;
}

} // namespace cable
