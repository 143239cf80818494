/*
  Conductor Selector Selftest

  Scenarios (NEC unless noted):
    base        30 A, 100 ft, 120 V single-phase, Cu, 75 C  => 6 AWG, 2.455 %
    iec 3ph     50 A, 100 m, 400 V, Cu, 70 C                => 16 mm² (10 mm² is 3.96 %)
    exhaustion  2000 A, 100 ft, 480 V three-phase           => 1000 kcmil, ampacity fails
    long run    40 A, 5000 ft, 120 V                        => 1000 kcmil, voltage drop 4.3 %
    iec Al      900 A, 100 m, 400 V three-phase             => 500 mm², no 630 mm² Al row
    explicit    10 AWG on the base case                     => voltage drop 6.2 %, flagged

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <string>

#include "engine/core/errors.hpp"
#include "engine/core/selftest.hpp"
#include "engine/sizing/conductor_selector.hpp"
#include "engine/sizing/result_json.hpp"
#include "engine/standards/standard_tables.hpp"

namespace cable {
namespace {

using namespace selftest;

CableSizingInput nec_base() {
  CableSizingInput in;
  in.current_a = 30.0;
  in.length = Length::feet(100.0);
  in.system_voltage_v = 120.0;
  in.material = ConductorMaterial::Copper;
  in.circuit_type = CircuitType::SinglePhase;
  in.insulation_rating = InsulationRating::C75;
  in.standard = Standard::NorthAmerican;
  return in;
}

CableSizingInput iec_three_phase() {
  CableSizingInput in;
  in.current_a = 50.0;
  in.length = Length::meters(100.0);
  in.system_voltage_v = 400.0;
  in.material = ConductorMaterial::Copper;
  in.circuit_type = CircuitType::ThreePhase;
  in.insulation_rating = InsulationRating::C70;
  in.standard = Standard::International;
  return in;
}

bool contains(const std::string& hay, const std::string& needle) {
  return hay.find(needle) != std::string::npos;
}

std::string warning_message(const CableSizingResult& r, const std::string& code) {
  for (const auto& w : r.warnings) {
    if (w.code == code) return w.message;
  }
  return std::string();
}

void check_invariants(const CableSizingResult& r, const CableSizingInput& in, const std::string& tag) {
  expect_true(r.derating.total_factor > 0.0 && r.derating.total_factor <= 1.0, tag + ": 0 < total <= 1");
  expect_near(r.ampacity.derated_a, r.ampacity.base_a * r.derating.total_factor, 1e-9,
              tag + ": derated = base * total");
  expect_near(r.voltage_drop.percent, 100.0 * r.voltage_drop.volts / in.system_voltage_v, 1e-9,
              tag + ": percent = 100 * volts / V");
  expect_true(r.compliance.fully == (r.compliance.ampacity_ok && r.compliance.voltage_drop_ok),
              tag + ": fully = ampacity && voltage drop");
  expect_true(r.recommended_size.standard == in.standard, tag + ": size belongs to the input standard");
}

void test_nec_base() {
  const CableSizingInput in = nec_base();
  const CableSizingResult r = select_conductor(in);
  check_invariants(r, in, "nec base");

  expect_true(r.recommended_size.index == 4, "NEC base selects 6 AWG");
  expect_eq_str(r.designation, "6 AWG", "designation");
  expect_near(r.voltage_drop.volts, 2.946, 1e-9, "6 AWG drop volts");
  expect_near(r.voltage_drop.percent, 2.455, 1e-9, "6 AWG drop percent");
  expect_near(r.ampacity.base_a, 65.0, 0.0, "6 AWG 75 C is 65 A");
  expect_near(r.ampacity_margin_a, 35.0, 1e-9, "ampacity margin");
  expect_near(r.voltage_drop_margin_percent, 0.545, 1e-9, "voltage drop margin");
  expect_true(r.compliance.fully, "NEC base is compliant");
  expect_true(!r.search_exhausted && !r.explicit_size_checked, "normal search");
  expect_true(r.warnings.empty(), "no warnings for a comfortable copper run");

  expect_true(r.alternatives.size() == 3, "three alternatives by default");
  if (r.alternatives.size() == 3) {
    expect_eq_str(r.alternatives[0].designation, "4 AWG", "first alternative");
    expect_eq_str(r.alternatives[2].designation, "2 AWG", "last alternative");
    expect_true(r.alternatives[0].size.index > r.recommended_size.index, "alternatives are larger");
  }

  expect_true(r.earth_conductor.has_value(), "earth conductor attached");
  if (r.earth_conductor) {
    expect_eq_str(r.earth_conductor->designation, "10 AWG", "30 A load -> 38 A OCPD -> 10 AWG");
    expect_near(r.earth_conductor->ocpd_rating_a, 38.0, 0.0, "OCPD is ceil(1.25 * I)");
  }
  expect_true(r.standard_references.size() == 6, "NEC base cites six tables");
  expect_true(r.standard_references.front() == "NEC Table 310.15(B)(16)", "ampacity table first");

  // 8 AWG would carry the load but fails voltage drop.
  const DeratingFactor unity{};
  const CandidateEvaluation e8 =
      evaluate_candidate(in, unity, ConductorSize{Standard::NorthAmerican, 3}, EngineSettings::defaults());
  expect_true(e8.ampacity_ok && !e8.voltage_ok, "8 AWG: ampacity ok, voltage drop fails");
}

void test_iec_three_phase() {
  const CableSizingInput in = iec_three_phase();
  const CableSizingResult r = select_conductor(in);
  check_invariants(r, in, "iec 3ph");
  expect_eq_str(r.designation, "16 mm²", "IEC three-phase selects 16 mm²");
  expect_near(r.voltage_drop.volts, 1.15 * std::sqrt(3.0) * 50.0 * 100.0 / 1000.0, 1e-9, "16 mm² drop");

  const CandidateEvaluation e10 = evaluate_candidate(in, r.derating, ConductorSize{Standard::International, 4},
                                                     EngineSettings::defaults());
  expect_near(e10.voltage_drop.percent, 3.96, 0.01, "10 mm² drop is 3.96 %");
  expect_true(!e10.voltage_ok, "10 mm² fails the 3 % limit");

  expect_true(r.earth_conductor && r.earth_conductor->designation == "16 mm²", "IEC earth for 16 mm² is 16 mm²");
  expect_true(r.earth_conductor && r.earth_conductor->ocpd_rating_a == 0.0, "IEC earth has no OCPD");

  CableSizingInput relaxed = in;
  relaxed.max_voltage_drop_percent = 5.0;
  const CableSizingResult rr = select_conductor(relaxed);
  expect_true(rr.recommended_size.index <= r.recommended_size.index, "a looser limit never needs a larger size");
  expect_near(rr.voltage_drop.limit_percent, 5.0, 0.0, "explicit limit is reported");
}

void test_warnings() {
  CableSizingInput hot = nec_base();
  hot.current_a = 60.0;
  hot.length = Length::feet(10.0);
  hot.system_voltage_v = 240.0;
  const CableSizingResult h = select_conductor(hot);
  expect_eq_str(h.designation, "6 AWG", "60 A needs 6 AWG");
  expect_near(h.ampacity.utilization_percent, 100.0 * 60.0 / 65.0, 1e-9, "utilization");
  expect_true(h.has_warning("AMPACITY.HIGH_UTILIZATION"), "92 % utilization is flagged");

  CableSizingInput al;
  al.current_a = 10.0;
  al.length = Length::meters(10.0);
  al.system_voltage_v = 230.0;
  al.material = ConductorMaterial::Aluminum;
  al.insulation_rating = InsulationRating::C70;
  al.standard = Standard::International;
  const CableSizingResult a = select_conductor(al);
  expect_true(a.recommended_size.index == 1, "aluminum starts at 2.5 mm²");
  expect_true(a.has_warning("MATERIAL.ALUMINUM_COMPOUND"), "aluminum compound advisory");
  expect_true(a.compliance.fully, "small aluminum circuit is compliant");

  CableSizingInput crowded = nec_base();
  crowded.ambient_temperature_c = 60.0;
  crowded.insulation_rating = InsulationRating::C90;
  crowded.conductor_count = 45;
  EngineSettings ext = EngineSettings::defaults();
  ext.derating.nec_extended_grouping = true;
  const CableSizingResult c = select_conductor(crowded, ext);
  expect_near(c.derating.total_factor, 0.71 * 0.35, 1e-12, "extended grouping total");
  expect_true(c.has_warning("DERATING.SEVERE_GROUPING"), "0.35 grouping is severe");
  expect_true(c.has_warning("DERATING.VERY_LOW_TOTAL"), "0.2485 total is very low");
  expect_true(!c.has_warning("DERATING.SEVERE_TEMPERATURE"), "0.71 temperature is not severe");
}

void test_exhaustion() {
  CableSizingInput in = nec_base();
  in.current_a = 2000.0;
  in.system_voltage_v = 480.0;
  in.circuit_type = CircuitType::ThreePhase;
  const CableSizingResult r = select_conductor(in);
  check_invariants(r, in, "exhaustion");

  expect_true(r.search_exhausted, "search exhausted");
  expect_true(r.recommended_size.index == size_count(Standard::NorthAmerican) - 1, "largest size reported");
  expect_true(!r.compliance.ampacity_ok && r.compliance.voltage_drop_ok, "ampacity is the failing constraint");
  expect_true(!r.compliance.fully, "not compliant");
  expect_true(r.has_warning("SEARCH.EXHAUSTED"), "exhaustion warning");
  expect_true(r.alternatives.empty(), "no alternatives when nothing complies");
  expect_true(r.earth_conductor && r.earth_conductor->designation == "350 kcmil", "2500 A OCPD -> 350 kcmil");
  expect_true(r.ampacity_margin_a < 0.0, "negative ampacity margin");
  expect_true(contains(warning_message(r, "SEARCH.EXHAUSTED"), "ampacity"), "message names ampacity");

  // IEC aluminum stops at 500 mm²: the 630 mm² candidate has no row and is skipped.
  CableSizingInput al = iec_three_phase();
  al.material = ConductorMaterial::Aluminum;
  al.current_a = 900.0;
  const CableSizingResult ra = select_conductor(al);
  check_invariants(ra, al, "aluminum exhaustion");
  expect_true(ra.search_exhausted, "aluminum search exhausted");
  expect_true(ra.recommended_size.index == 17, "largest resolved aluminum size is reported");
  expect_eq_str(ra.designation, "500 mm²", "500 mm² aluminum");
  expect_near(ra.ampacity.base_a, 382.0, 0.0, "500 mm² aluminum 70 C");
  expect_near(ra.voltage_drop.percent, 100.0 * std::sqrt(3.0) * 900.0 * 100.0 * 0.0600 / 1000.0 / 400.0, 1e-9,
              "aluminum 500 mm² drop");
  expect_true(!ra.compliance.ampacity_ok && ra.compliance.voltage_drop_ok, "aluminum fails on ampacity only");
  expect_true(contains(warning_message(ra, "SEARCH.EXHAUSTED"), "500 mm²"), "message names the largest size");

  // Voltage drop alone: 1000 kcmil carries 40 A but drops 4.30 % over 5000 ft.
  CableSizingInput run = nec_base();
  run.current_a = 40.0;
  run.length = Length::feet(5000.0);
  const CableSizingResult rv = select_conductor(run);
  check_invariants(rv, run, "voltage drop exhaustion");
  expect_true(rv.search_exhausted, "long run exhausts the search");
  expect_true(rv.recommended_size.index == size_count(Standard::NorthAmerican) - 1, "long run reports 1000 kcmil");
  expect_near(rv.voltage_drop.percent, 4.3, 1e-9, "1000 kcmil 40 A 5000 ft drop");
  expect_true(rv.compliance.ampacity_ok && !rv.compliance.voltage_drop_ok, "voltage drop is the failing constraint");
  const std::string msg = warning_message(rv, "SEARCH.EXHAUSTED");
  expect_true(contains(msg, "voltage drop 4.30% > 3.00% limit"), "message names the voltage drop constraint");
  expect_true(!contains(msg, "ampacity"), "message does not blame ampacity");

  // No rating column for the standard: no candidate can resolve.
  CableSizingInput none = iec_three_phase();
  none.insulation_rating = InsulationRating::C75;
  expect_throws<LookupError>([&] { (void)select_conductor(none); }, "no resolvable size is a LookupError");
  const SelectionOutcome o = try_select_conductor(none);
  expect_true(!o.ok() && o.code == ErrorCode::kLookup, "no resolvable size reports kLookup");
}

void test_explicit_size() {
  CableSizingInput in = nec_base();
  in.explicit_size = ConductorSize{Standard::NorthAmerican, 2};
  const CableSizingResult r = select_conductor(in);
  expect_true(r.explicit_size_checked && !r.search_exhausted, "explicit mode");
  expect_eq_str(r.designation, "10 AWG", "explicit size is reported as given");
  expect_near(r.voltage_drop.percent, 6.2, 1e-9, "10 AWG drop");
  expect_true(r.has_warning("CHECK.VOLTAGE_DROP_EXCEEDED"), "explicit size flagged for voltage drop");
  expect_true(!r.has_warning("CHECK.AMPACITY_INSUFFICIENT"), "10 AWG carries 30 A");
  expect_true(r.alternatives.empty(), "explicit mode lists no alternatives");

  in.explicit_size = ConductorSize{Standard::NorthAmerican, 4};
  const CableSizingResult ok = select_conductor(in);
  expect_true(ok.compliance.fully && ok.warnings.empty(), "explicit 6 AWG passes cleanly");

  CableSizingInput dim = nec_base();
  dim.current_a = 15.0;
  dim.length = Length::feet(200.0);
  dim.explicit_size = ConductorSize{Standard::NorthAmerican, 0};
  const CableSizingResult d = select_conductor(dim);
  expect_near(d.voltage_drop.percent, 15.7, 1e-9, "14 AWG 15 A 200 ft drop");
  expect_true(d.voltage_drop.is_dangerous && d.has_warning("VDROP.DANGEROUS"), "drop above 10 % is dangerous");

  CableSizingInput al = nec_base();
  al.material = ConductorMaterial::Aluminum;
  al.explicit_size = ConductorSize{Standard::NorthAmerican, 0};
  expect_throws<LookupError>([&] { (void)select_conductor(al); }, "14 AWG aluminum is not tabulated");

  CableSizingInput small = nec_base();
  small.current_a = 40.0;
  small.explicit_size = ConductorSize{Standard::NorthAmerican, 0};
  const CableSizingResult s = select_conductor(small);
  expect_true(s.has_warning("CHECK.AMPACITY_INSUFFICIENT"), "14 AWG cannot carry 40 A");
  expect_true(!s.has_warning("AMPACITY.HIGH_UTILIZATION"), "no utilization advisory when undersized");
}

void test_errors() {
  CableSizingInput many = nec_base();
  many.conductor_count = 45;
  expect_throws<LookupError>([&] { (void)select_conductor(many); }, "45 conductors without extended grouping");
  const SelectionOutcome o = try_select_conductor(many);
  expect_true(!o.ok() && o.code == ErrorCode::kLookup, "outcome carries kLookup");
  expect_true(!o.message.empty(), "outcome carries the message");

  CableSizingInput ft = iec_three_phase();
  ft.length = Length::feet(100.0);
  const SelectionOutcome u = try_select_conductor(ft);
  expect_true(!u.ok() && u.code == ErrorCode::kUnitMismatch, "feet under IEC is a unit mismatch");

  EngineSettings bad = EngineSettings::defaults();
  bad.vdrop.default_max_percent = -1.0;
  const SelectionOutcome b = try_select_conductor(nec_base(), bad);
  expect_true(!b.ok() && b.code == ErrorCode::kInvalidArgument, "invalid settings are rejected");

  CableSizingInput hot = iec_three_phase();
  hot.ambient_temperature_c = 75.0;
  const SelectionOutcome t = try_select_conductor(hot);
  expect_true(!t.ok() && t.code == ErrorCode::kLookup, "70 C insulation at 75 C ambient");
}

void test_monotonic_and_idempotent() {
  CableSizingInput in = nec_base();
  int prev = -1;
  bool monotone = true;
  bool compliant = true;
  for (int amps = 1; amps <= 200; ++amps) {
    in.current_a = static_cast<double>(amps);
    const CableSizingResult r = select_conductor(in);
    if (r.recommended_size.index < prev) monotone = false;
    if (!r.compliance.fully) compliant = false;
    prev = r.recommended_size.index;
  }
  expect_true(monotone, "recommended size never shrinks as current grows");
  expect_true(compliant, "1..200 A on 100 ft are all satisfiable");

  const CableSizingInput base = nec_base();
  expect_eq_str(result_to_json(select_conductor(base)), result_to_json(select_conductor(base)),
                "identical inputs give identical results");
}

void test_report_settings() {
  EngineSettings s = EngineSettings::defaults();
  s.report.max_alternatives = 0;
  s.report.include_earth_conductor = false;
  const CableSizingResult r = select_conductor(nec_base(), s);
  expect_true(r.alternatives.empty(), "max_alternatives = 0 lists none");
  expect_true(!r.earth_conductor.has_value(), "earth conductor can be disabled");
  expect_true(r.standard_references.size() == 5, "no earth citation without an earth conductor");
  expect_true(r.recommended_size.index == 4, "report settings never change the selection");

  EngineSettings one = EngineSettings::defaults();
  one.report.max_alternatives = 1;
  expect_true(select_conductor(nec_base(), one).alternatives.size() == 1, "max_alternatives = 1");
}

} // namespace
} // namespace cable

int main() {
  cable::test_nec_base();
  cable::test_iec_three_phase();
  cable::test_warnings();
  cable::test_exhaustion();
  cable::test_explicit_size();
  cable::test_errors();
  cable::test_monotonic_and_idempotent();
  cable::test_report_settings();
  return cable::selftest::exit_code();
}
