/*
  Boundary Selftest

  Input validation, earth conductor sizing, the calculation cache and the
  JSON record. Non-zero return code indicates failure.
*/

#include <cmath>
#include <limits>
#include <string>

#include "engine/core/errors.hpp"
#include "engine/core/selftest.hpp"
#include "engine/sizing/conductor_selector.hpp"
#include "engine/sizing/earth_conductor.hpp"
#include "engine/sizing/input_validation.hpp"
#include "engine/sizing/result_json.hpp"
#include "engine/sizing/sizing_cache.hpp"

namespace cable {
namespace {

using namespace selftest;

CableSizingInput nec_base() {
  CableSizingInput in;
  in.current_a = 30.0;
  in.length = Length::feet(100.0);
  in.system_voltage_v = 120.0;
  in.standard = Standard::NorthAmerican;
  return in;
}

bool has_issue(const InputValidationReport& r, const std::string& field) {
  for (const auto& e : r.errors) {
    if (e.field == field) return true;
  }
  return false;
}

bool has_advisory(const InputValidationReport& r, const std::string& code) {
  for (const auto& w : r.warnings) {
    if (w.code == code) return true;
  }
  return false;
}

bool contains(const std::string& hay, const std::string& needle) {
  return hay.find(needle) != std::string::npos;
}

void test_validation() {
  const InputValidationReport ok = validate_input(nec_base());
  expect_true(ok.ok() && ok.warnings.empty(), "NEC base validates without advisories");

  CableSizingInput bad = nec_base();
  bad.current_a = 0.0;
  bad.system_voltage_v = std::numeric_limits<double>::quiet_NaN();
  bad.conductor_count = 51;
  bad.max_voltage_drop_percent = 30.0;
  const InputValidationReport r = validate_input(bad);
  expect_true(!r.ok(), "bad input fails validation");
  expect_true(has_issue(r, "current"), "zero current rejected");
  expect_true(has_issue(r, "systemVoltage"), "NaN voltage rejected");
  expect_true(has_issue(r, "conductorCount"), "51 conductors rejected");
  expect_true(has_issue(r, "maxVoltageDropPercent"), "30 % limit rejected");

  try {
    validate_input_or_throw(bad);
    fail("validate_input_or_throw must throw");
  } catch (const ValidationError& e) {
    expect_true(e.code() == ErrorCode::kInvalidArgument, "range errors are kInvalidArgument");
    expect_true(contains(e.message(), "[conductorCount]"), "message lists each field");
  }

  CableSizingInput iec_ft;
  iec_ft.current_a = 20.0;
  iec_ft.length = Length::feet(50.0);
  iec_ft.system_voltage_v = 230.0;
  iec_ft.insulation_rating = InsulationRating::C70;
  iec_ft.standard = Standard::International;
  try {
    validate_input_or_throw(iec_ft);
    fail("feet under IEC must throw");
  } catch (const ValidationError& e) {
    expect_true(e.code() == ErrorCode::kUnitMismatch, "unit-only errors are kUnitMismatch");
  }
  const Length m = normalize_length(iec_ft.length, Standard::International);
  expect_true(m.unit == LengthUnit::Meters, "normalized to meters");
  expect_near(m.value, 15.24, 1e-9, "50 ft is 15.24 m");
  iec_ft.length = m;
  expect_true(validate_input(iec_ft).ok(), "normalized IEC input validates");

  CableSizingInput cold = nec_base();
  cold.standard = Standard::International;
  cold.length = Length::meters(30.0);
  cold.insulation_rating = InsulationRating::C75;
  cold.ambient_temperature_c = 5.0;
  const InputValidationReport c = validate_input(cold);
  expect_true(has_issue(c, "ambientTemperature"), "5 C below the IEC table");
  expect_true(has_issue(c, "insulationRating"), "IEC has no 75 C column");

  CableSizingInput wrong = nec_base();
  wrong.explicit_size = ConductorSize{Standard::International, 3};
  expect_true(has_issue(validate_input(wrong), "explicitSize"), "explicit size from another standard");

  CableSizingInput odd = nec_base();
  odd.ambient_temperature_c = 75.0;
  odd.conductor_count = 25;
  odd.current_a = 600.0;
  odd.system_voltage_v = 24.0;
  odd.length = Length::feet(2000.0);
  odd.installation_method = InstallationMethod::DirectBuried;
  const InputValidationReport a = validate_input(odd);
  expect_true(a.ok(), "advisories never block");
  expect_true(has_advisory(a, "INPUT.HIGH_AMBIENT"), "high ambient");
  expect_true(has_advisory(a, "INPUT.EXTREME_AMBIENT"), "extreme ambient");
  expect_true(has_advisory(a, "INPUT.MANY_CONDUCTORS"), "many conductors");
  expect_true(has_advisory(a, "INPUT.HIGH_CURRENT"), "high current");
  expect_true(has_advisory(a, "INPUT.LOW_VOLTAGE"), "low voltage");
  expect_true(has_advisory(a, "INPUT.VERY_LONG_RUN"), "2000 ft is over 500 m");
  expect_true(!has_advisory(a, "INPUT.LONG_RUN"), "LONG_RUN is an IEC advisory");
  expect_true(has_advisory(a, "INPUT.DIRECT_BURIAL"), "direct burial");

  CableSizingInput al = nec_base();
  al.material = ConductorMaterial::Aluminum;
  al.current_a = 10.0;
  expect_true(has_advisory(validate_input(al), "INPUT.SMALL_ALUMINUM"), "small aluminum circuit");
}

void test_earth_conductor() {
  expect_near(nec_ocpd_rating(30.0), 38.0, 0.0, "1.25 * 30 rounds up to 38");
  expect_near(nec_ocpd_rating(16.0), 20.0, 0.0, "1.25 * 16 is exactly 20");

  expect_eq_str(size_earth_conductor_nec(10.0, ConductorMaterial::Copper).designation, "14 AWG", "10 A copper");
  expect_eq_str(size_earth_conductor_nec(30.0, ConductorMaterial::Aluminum).designation, "8 AWG", "30 A aluminum");
  expect_eq_str(size_earth_conductor_nec(500.0, ConductorMaterial::Copper).designation, "1/0 AWG", "625 A OCPD");

  const EarthConductor big = size_earth_conductor_nec(5000.0, ConductorMaterial::Copper);
  expect_true(big.exceeds_table, "6250 A OCPD exceeds the table");
  expect_eq_str(big.designation, "800 kcmil", "last row is reported");
  expect_true(!big.size.has_value(), "800 kcmil is not an ampacity-table size");
  expect_eq_str(big.standard_reference, "NEC Table 250.122", "NEC earth citation");

  // 15 A -> 19 A OCPD -> 12 AWG by the table, but never above a 14 AWG phase.
  const ConductorSize awg14{Standard::NorthAmerican, 0};
  expect_eq_str(size_earth_conductor_nec(15.0, ConductorMaterial::Copper).designation, "12 AWG",
                "15 A without a phase conductor uses the table row");
  const EarthConductor capped = size_earth_conductor_nec(15.0, ConductorMaterial::Copper, awg14);
  expect_eq_str(capped.designation, "14 AWG", "earth capped at a 14 AWG phase conductor");
  expect_true(capped.size && capped.size->index == 0 && capped.limited_to_phase, "capped size and flag");
  expect_near(capped.area_mm2, 2.08, 0.0, "capped area is the phase area");
  expect_near(capped.ocpd_rating_a, 19.0, 0.0, "OCPD still reported");

  const EarthConductor not_capped =
      size_earth_conductor_nec(30.0, ConductorMaterial::Copper, ConductorSize{Standard::NorthAmerican, 4});
  expect_eq_str(not_capped.designation, "10 AWG", "smaller than the phase conductor: table row");
  expect_true(!not_capped.limited_to_phase, "table row is not flagged as capped");

  const EarthConductor big_capped =
      size_earth_conductor_nec(5000.0, ConductorMaterial::Copper, ConductorSize{Standard::NorthAmerican, 19});
  expect_eq_str(big_capped.designation, "750 kcmil", "800 kcmil earth capped at a 750 kcmil phase");
  expect_true(big_capped.exceeds_table && big_capped.size.has_value(), "cap keeps the exceeds-table flag");
  expect_throws<LookupError>(
      [] {
        (void)size_earth_conductor_nec(15.0, ConductorMaterial::Copper, ConductorSize{Standard::International, 0});
      },
      "IEC size cannot cap an NEC earth conductor");

  CableSizingInput small = nec_base();
  small.current_a = 15.0;
  small.length = Length::feet(10.0);
  small.system_voltage_v = 240.0;
  const CableSizingResult sr = select_conductor(small);
  expect_true(sr.recommended_size.index == 0, "15 A selects 14 AWG");
  expect_true(sr.earth_conductor && sr.earth_conductor->size &&
                  sr.earth_conductor->size->index <= sr.recommended_size.index,
              "earth conductor not larger than the phase conductor");
  expect_eq_str(sr.earth_conductor ? sr.earth_conductor->designation : std::string(), "14 AWG",
                "15 A circuit earth conductor");

  auto iec = [](int index, bool protected_) {
    return size_earth_conductor_iec(ConductorSize{Standard::International, index}, protected_).designation;
  };
  expect_eq_str(iec(5, true), "16 mm²", "S <= 16: same size");
  expect_eq_str(iec(9, true), "35 mm²", "70 mm²: S/2");
  expect_eq_str(iec(7, true), "16 mm²", "35 mm²: 16");
  expect_eq_str(iec(0, true), "2.5 mm²", "protected minimum 2.5 mm²");
  expect_eq_str(iec(0, false), "4 mm²", "unprotected minimum 4 mm²");
  expect_eq_str(iec(10, true), "50 mm²", "95 mm²: 47.5 rounds up to 50");
  expect_eq_str(iec(18, true), "400 mm²", "630 mm²: 315 rounds up to 400");
  expect_throws<LookupError>(
      [] { (void)size_earth_conductor_iec(ConductorSize{Standard::NorthAmerican, 3}, true); },
      "NEC size has no IEC earth conductor");

  CableSizingInput huge = nec_base();
  huge.current_a = 5000.0;
  huge.explicit_size = ConductorSize{Standard::NorthAmerican, 20};
  const CableSizingResult r = select_conductor(huge);
  expect_true(r.has_warning("EARTH.EXCEEDS_TABLE"), "result flags an off-table earth conductor");
}

void test_cache() {
  const EngineSettings s = EngineSettings::defaults();
  CableSizingInput a = nec_base();
  CableSizingInput b = nec_base();
  b.current_a = 40.0;
  CableSizingInput c = nec_base();
  c.max_voltage_drop_percent = 3.0;

  expect_true(make_sizing_key(a, s) == make_sizing_key(nec_base(), s), "key is deterministic");
  expect_true(!(make_sizing_key(a, s) == make_sizing_key(c, s)),
              "explicit limit equal to the default still changes the key");

  CableSizingInput a_iec = a;
  a_iec.standard = Standard::International;
  expect_true(!(hash_input(a) == hash_input(a_iec)), "standards never share a key");

  EngineSettings ext = s;
  ext.derating.nec_extended_grouping = true;
  expect_true(!(make_sizing_key(a, s) == make_sizing_key(a, ext)), "settings are part of the key");

  SizingCache cache(2);
  const CableSizingResult ra = cache.get_or_compute(a, s);
  const CableSizingResult ra2 = cache.get_or_compute(a, s);
  (void)cache.get_or_compute(b, s);
  (void)cache.get_or_compute(c, s);

  const CacheStats st = cache.stats();
  expect_true(st.hits == 1, "one hit");
  expect_true(st.misses == 3, "three misses");
  expect_true(st.inserts == 3, "three inserts");
  expect_true(st.evictions == 1, "one eviction");
  expect_true(cache.size() == 2, "bounded at two entries");
  expect_eq_str(result_to_json(ra), result_to_json(ra2), "cached result equals computed result");
  expect_true(!cache.get(make_sizing_key(a, s)).has_value(), "least recently used entry was evicted");

  CableSizingInput broken = nec_base();
  broken.conductor_count = 45;
  expect_throws<LookupError>([&] { (void)cache.get_or_compute(broken, s); }, "engine errors propagate");
  expect_true(cache.size() == 2, "failures are not cached");

  cache.set_max_entries(1);
  expect_true(cache.size() == 1 && cache.max_entries() == 1, "shrinking evicts");
  cache.clear();
  expect_true(cache.size() == 0 && cache.stats().hits == 0, "clear resets entries and stats");
}

void test_json() {
  const CableSizingResult r = select_conductor(nec_base());
  const std::string js = result_to_json(r);
  expect_true(contains(js, "\"standard\": \"NEC\""), "standard token");
  expect_true(contains(js, "\"designation\": \"6 AWG\""), "designation");
  expect_true(contains(js, "\"volts\": 2.946000"), "fixed six-decimal numbers");
  expect_true(contains(js, "\"isFullyCompliant\": true"), "compliance flag");
  expect_true(contains(js, "\"resistanceUnit\": \"ohm/1000ft\""), "resistance unit");
  expect_true(contains(js, "\"NEC Table 250.122\""), "references serialized");
  expect_true(js.back() == '\n', "trailing newline");
  expect_true(js.rfind("{\n  \"standard\": \"NEC\",\n  \"material\": ", 0) == 0, "two-space layout");
  expect_true(contains(js, "\"voltageDrop\": {\n    \"volts\""), "nested objects indent one level");
  expect_true(contains(js, "\"limitedToPhaseConductor\": false"), "earth cap flag serialized");
  expect_true(contains(js, "\n  ]\n}\n"), "closing brackets on their own lines");
  expect_true(contains(result_to_json(r, 0), "\n\"standard\": \"NEC\",\n"), "indent 0");

  CableSizingResult odd = r;
  odd.resistance = std::numeric_limits<double>::quiet_NaN();
  odd.earth_conductor.reset();
  odd.warnings.push_back(Warning{WarningSeverity::Danger, "X.QUOTE", "say \"hi\"\n"});
  odd.warnings.push_back(Warning{WarningSeverity::Info, "X.CTRL", std::string("bell\x07") + "\x1f"});
  const std::string jo = result_to_json(odd);
  expect_true(contains(jo, "\"resistance\": null"), "NaN is written as null");
  expect_true(contains(jo, "\"earthConductor\": null"), "missing earth conductor is null");
  expect_true(contains(jo, "say \\\"hi\\\"\\n"), "strings are escaped");
  expect_true(contains(jo, "bell\\u0007\\u001f"), "control characters use \\u escapes");
  expect_true(contains(jo, "}\n  ],\n  \"standardReferences\""), "array elements separated, last without comma");
  expect_true(!contains(jo, ": nan") && !contains(jo, ": -nan"), "no bare nan");

  expect_true(!write_result_json_file(r, "/nonexistent-dir/result.json"), "unwritable path reports false");
}

} // namespace
} // namespace cable

int main() {
  cable::test_validation();
  cable::test_earth_conductor();
  cable::test_cache();
  cable::test_json();
  return cable::selftest::exit_code();
}
