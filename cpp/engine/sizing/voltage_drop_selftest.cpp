/*
  Voltage Drop + Ampacity Resolver Selftest

  Reference values:
    IEC single-phase  30 A, 50 m, 6 mm² Cu (3.08 mV/A/m)      => 9.24 V
    IEC three-phase   50 A, 100 m, 16 mm² Cu (1.15 mV/A/m)    => 9.96 V
    NEC single-phase  30 A, 100 ft, 10 AWG Cu (1.24 ohm/kft)  => 7.44 V
*/

#include <string>

#include "engine/core/errors.hpp"
#include "engine/core/selftest.hpp"
#include "engine/sizing/ampacity_resolver.hpp"
#include "engine/sizing/voltage_drop.hpp"

namespace cable {
namespace {

using namespace selftest;

constexpr ConductorSize kIec6{Standard::International, 3};
constexpr ConductorSize kIec16{Standard::International, 5};
constexpr ConductorSize kNec10{Standard::NorthAmerican, 2};
constexpr ConductorSize kNec14{Standard::NorthAmerican, 0};

void test_resolver() {
  const ResolvedConductor c = resolve_ampacity(Standard::NorthAmerican, ConductorMaterial::Copper,
                                               InsulationRating::C60, kNec14);
  expect_near(c.base_ampacity_a, 15.0, 0.0, "14 AWG Cu 60 C base ampacity is 15 A");
  expect_near(c.resistance, 3.14, 0.0, "14 AWG Cu resistance is 3.14 ohm/kft");

  const ResolvedConductor i = resolve_ampacity(Standard::International, ConductorMaterial::Copper,
                                               InsulationRating::C70, kIec6);
  expect_near(i.base_ampacity_a, 40.0, 0.0, "6 mm² Cu 70 C is 40 A");

  expect_throws<LookupError>(
      [] { (void)resolve_ampacity(Standard::NorthAmerican, ConductorMaterial::Aluminum,
                                  InsulationRating::C75, kNec14); },
      "14 AWG aluminum has no row");
  expect_throws<LookupError>(
      [] { (void)resolve_ampacity(Standard::International, ConductorMaterial::Copper,
                                  InsulationRating::C75, kIec6); },
      "IEC has no 75 C rating");
  expect_throws<LookupError>(
      [] { (void)resolve_ampacity(Standard::NorthAmerican, ConductorMaterial::Copper,
                                  InsulationRating::C75, kIec6); },
      "IEC size under NEC is a LookupError");
  expect_throws<LookupError>(
      [] { (void)resolve_ampacity(Standard::International, ConductorMaterial::Copper,
                                  InsulationRating::C90, ConductorSize{Standard::International, 40}); },
      "size index beyond the list is a LookupError");
}

void test_reference_drops() {
  const VoltageDrop a = compute_voltage_drop_with_resistance(30.0, Length::meters(50.0), 3.08,
                                                             CircuitType::SinglePhase,
                                                             Standard::International, 230.0);
  expect_near(a.volts, 9.24, 1e-9, "IEC single-phase 30 A 50 m 6 mm²");
  expect_true(a.percent.has_value(), "percent present when voltage given");
  expect_near(*a.percent, 100.0 * 9.24 / 230.0, 1e-9, "percent is 100 * volts / V");

  const VoltageDrop a2 = compute_voltage_drop(30.0, Length::meters(50.0), kIec6, ConductorMaterial::Copper,
                                              CircuitType::SinglePhase, Standard::International);
  expect_near(a2.volts, 9.24, 1e-9, "table-resolved resistance gives the same drop");
  expect_true(!a2.percent.has_value(), "percent omitted without a system voltage");

  const VoltageDrop b = compute_voltage_drop(50.0, Length::meters(100.0), kIec16, ConductorMaterial::Copper,
                                             CircuitType::ThreePhase, Standard::International, 400.0);
  expect_near(b.volts, 9.96, 0.01, "IEC three-phase 50 A 100 m 16 mm²");

  const VoltageDrop n = compute_voltage_drop(30.0, Length::feet(100.0), kNec10, ConductorMaterial::Copper,
                                             CircuitType::SinglePhase, Standard::NorthAmerican, 120.0);
  expect_near(n.volts, 7.44, 1e-9, "NEC 30 A 100 ft 10 AWG");
  expect_near(*n.percent, 6.2, 1e-9, "NEC 10 AWG drop is 6.2%");
}

void test_limits_and_units() {
  const VoltageDrop edge = compute_voltage_drop_with_resistance(10.0, Length::feet(100.0), 1.5,
                                                                CircuitType::SinglePhase,
                                                                Standard::NorthAmerican, 100.0);
  expect_near(*edge.percent, 3.0, 1e-12, "boundary case is exactly 3%");
  expect_true(!exceeds_voltage_drop_limit(*edge.percent, 3.0), "3.0% at a 3.0% limit is compliant");
  expect_true(exceeds_voltage_drop_limit(3.0001, 3.0), "above the limit is a violation");

  expect_near(circuit_multiplier(CircuitType::SinglePhase), 2.0, 0.0, "single-phase multiplier");
  expect_near(circuit_multiplier(CircuitType::ThreePhase), 1.7320508075688772, 1e-15, "three-phase multiplier");

  try {
    (void)compute_voltage_drop(30.0, Length::feet(50.0), kIec6, ConductorMaterial::Copper,
                               CircuitType::SinglePhase, Standard::International, 230.0);
    fail("feet under IEC must throw");
  } catch (const ValidationError& e) {
    expect_true(e.code() == ErrorCode::kUnitMismatch, "feet under IEC is a unit mismatch");
  }
  expect_throws<ValidationError>(
      [] { (void)compute_voltage_drop(30.0, Length::meters(30.0), kNec10, ConductorMaterial::Copper,
                                      CircuitType::SinglePhase, Standard::NorthAmerican, 120.0); },
      "meters under NEC is rejected");
  expect_throws<ValidationError>(
      [] { (void)compute_voltage_drop_with_resistance(10.0, Length::meters(10.0), 1.0,
                                                      CircuitType::SinglePhase, Standard::International, 0.0); },
      "zero system voltage is rejected");
  expect_throws<LookupError>(
      [] { (void)compute_voltage_drop(10.0, Length::feet(10.0), kNec14, ConductorMaterial::Aluminum,
                                      CircuitType::SinglePhase, Standard::NorthAmerican, 120.0); },
      "missing aluminum row propagates LookupError");
}

void test_linearity() {
  auto drop = [](double i, double len, double v) {
    return compute_voltage_drop(i, Length::meters(len), kIec16, ConductorMaterial::Copper,
                                CircuitType::ThreePhase, Standard::International, v);
  };
  const VoltageDrop base = drop(40.0, 80.0, 400.0);
  const VoltageDrop dv = drop(40.0, 80.0, 800.0);
  expect_near(*dv.percent, *base.percent / 2.0, 1e-12, "doubling voltage halves percent");
  expect_near(dv.volts, base.volts, 1e-12, "volts independent of system voltage");
  expect_near(drop(80.0, 80.0, 400.0).volts, 2.0 * base.volts, 1e-9, "volts linear in current");
  expect_near(drop(40.0, 160.0, 400.0).volts, 2.0 * base.volts, 1e-9, "volts linear in length");
}

} // namespace
} // namespace cable

int main() {
  cable::test_resolver();
  cable::test_reference_drops();
  cable::test_limits_and_units();
  cable::test_linearity();
  return cable::selftest::exit_code();
}
