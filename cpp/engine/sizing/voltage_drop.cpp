#include "engine/sizing/voltage_drop.hpp"

#include <string>

#include "engine/core/errors.hpp"
#include "engine/sizing/ampacity_resolver.hpp"

namespace cable {

double circuit_multiplier(CircuitType circuit) noexcept {
  switch (circuit) {
    case CircuitType::SinglePhase: return 2.0;
    case CircuitType::ThreePhase:  return units::sqrt3;
  }
  return 2.0;
}

void require_native_length(Standard standard, const Length& length) {
  const LengthUnit native = native_length_unit(standard);
  CABLE_REQUIRE(length.unit == native, ErrorCode::kUnitMismatch,
                std::string(to_string(standard)) + " requires length in " + to_string(native) +
                    ", got " + to_string(length.unit));
}

VoltageDrop compute_voltage_drop_with_resistance(double current_a,
                                                 const Length& length,
                                                 double resistance,
                                                 CircuitType circuit,
                                                 Standard standard,
                                                 std::optional<double> system_voltage_v) {
  require_native_length(standard, length);

  VoltageDrop vd;
  vd.volts = circuit_multiplier(circuit) * current_a * length.value * resistance / 1000.0;
  if (system_voltage_v) {
    CABLE_REQUIRE(*system_voltage_v > 0.0, ErrorCode::kInvalidArgument,
                  "system voltage must be > 0 to express voltage drop as a percentage");
    vd.percent = 100.0 * vd.volts / *system_voltage_v;
  }
  return vd;
}

VoltageDrop compute_voltage_drop(double current_a,
                                 const Length& length,
                                 ConductorSize size,
                                 ConductorMaterial material,
                                 CircuitType circuit,
                                 Standard standard,
                                 std::optional<double> system_voltage_v) {
  const double r = resolve_resistance(standard, material, size);
  return compute_voltage_drop_with_resistance(current_a, length, r, circuit, standard, system_voltage_v);
}

} // namespace cable
