/*
  Derating Composer Selftest

  NEC: ambient 40 C, 75 C insulation, 6 conductors
       => temperature 0.88, grouping 0.80, total 0.704
*/

#include <optional>
#include <string>

#include "engine/core/errors.hpp"
#include "engine/core/selftest.hpp"
#include "engine/sizing/derating_composer.hpp"
#include "engine/standards/standard_tables.hpp"

namespace cable {
namespace {

using namespace selftest;

constexpr Standard kNec = Standard::NorthAmerican;
constexpr Standard kIec = Standard::International;

void test_nec() {
  const DeratingFactor d = compose_derating(kNec, 40.0, InsulationRating::C75, 6, std::nullopt);
  expect_near(d.temperature_factor, 0.88, 1e-12, "NEC 40 C / 75 C temperature factor");
  expect_near(d.grouping_factor, 0.80, 0.0, "NEC 6 conductors grouping factor");
  expect_near(d.total_factor, 0.704, 1e-12, "NEC total factor");
  expect_true(d.standard_reference.find("NEC 310.15(B)(2)(a)") != std::string::npos,
              "NEC derating cites the temperature table");

  expect_near(grouping_factor(kNec, 3, InstallationMethod::SingleConduit), 1.0, 0.0, "3 conductors: 1.0");
  expect_near(grouping_factor(kNec, 9, InstallationMethod::SingleConduit), 0.70, 0.0, "9 conductors: 0.70");
  expect_near(grouping_factor(kNec, 20, InstallationMethod::SingleConduit), 0.50, 0.0, "20 conductors: 0.50");
  expect_near(grouping_factor(kNec, 40, InstallationMethod::SingleConduit), 0.40, 0.0, "40 conductors: 0.40");
  expect_throws<LookupError>([] { (void)grouping_factor(kNec, 41, InstallationMethod::SingleConduit); },
                             "41 conductors without the extended table");

  DeratingSettings ext;
  ext.nec_extended_grouping = true;
  expect_near(grouping_factor(kNec, 45, InstallationMethod::SingleConduit, ext), 0.35, 0.0,
              "extended table: 45 conductors 0.35");

  expect_near(temperature_factor(kNec, -40.0, InsulationRating::C60), 1.0, 0.0, "cold ambient is 1.0");
  expect_near(temperature_factor(kNec, 31.0, InsulationRating::C90), 0.96, 0.0, "31 C falls in the 35 C step");
  expect_throws<LookupError>([] { (void)temperature_factor(kNec, 60.0, InsulationRating::C60); },
                             "60 C insulation not permitted at 60 C ambient");
  expect_throws<LookupError>([] { (void)temperature_factor(kNec, 95.0, InsulationRating::C90); },
                             "ambient above the NEC table");
  expect_throws<LookupError>([] { (void)temperature_factor(kNec, 30.0, InsulationRating::C70); },
                             "NEC has no 70 C column");
}

void test_iec() {
  expect_near(temperature_factor(kIec, 40.0, InsulationRating::C70), 0.87, 0.0, "IEC 40 C / 70 C");
  expect_near(temperature_factor(kIec, 20.0, InsulationRating::C90), 1.0, 0.0,
              "IEC factors above 1.0 are clamped");
  expect_throws<LookupError>([] { (void)temperature_factor(kIec, 5.0, InsulationRating::C70); },
                             "ambient below the IEC table");
  expect_throws<LookupError>([] { (void)temperature_factor(kIec, 72.0, InsulationRating::C70); },
                             "70 C insulation not permitted above 70 C");

  expect_true(iec_circuit_count(1) == 1 && iec_circuit_count(3) == 1, "1..3 conductors is one circuit");
  expect_true(iec_circuit_count(4) == 2 && iec_circuit_count(7) == 3, "circuits round up");

  expect_near(grouping_factor(kIec, 6, InstallationMethod::SingleConduit), 0.80, 0.0,
              "IEC 6 conductors in conduit (2 circuits, method A)");
  expect_near(grouping_factor(kIec, 30, InstallationMethod::MultiConduit), 0.65, 0.0,
              "10 circuits use the 12-circuit row");
  expect_near(grouping_factor(kIec, 60, InstallationMethod::SingleConduit), 0.38, 0.0, "20 circuits, method A");
  expect_near(grouping_factor(kIec, 4, InstallationMethod::FreeAir), 0.88, 0.0, "2 circuits, method E");
  expect_throws<LookupError>([] { (void)grouping_factor(kIec, 61, InstallationMethod::SingleConduit); },
                             "21 circuits exceeds the IEC table");
  expect_throws<LookupError>([] { (void)grouping_factor(kIec, 0, InstallationMethod::SingleConduit); },
                             "zero conductors has no row");

  DeratingSettings tray;
  tray.default_iec_method = InstallationMethod::Tray;
  const DeratingFactor d = compose_derating(kIec, 30.0, InsulationRating::C70, 9, std::nullopt, tray);
  expect_near(d.grouping_factor, 0.79, 0.0, "unset method falls back to the configured default");
  expect_true(d.standard_reference.find("Reference Method C") != std::string::npos,
              "IEC reference names the method column");
}

void test_bounds() {
  expect_near(compose_derating(kNec, 30.0, InsulationRating::C90, 1, std::nullopt).total_factor, 1.0, 0.0,
              "reference conditions give exactly 1.0 (NEC)");
  expect_near(compose_derating(kIec, 30.0, InsulationRating::C70, 3, std::nullopt).total_factor, 1.0, 0.0,
              "reference conditions give exactly 1.0 (IEC)");

  bool bounded = true;
  int evaluated = 0;
  for (Standard s : {kIec, kNec}) {
    const TemperatureDomain dom = temperature_domain(s);
    for (InsulationRating r : {InsulationRating::C60, InsulationRating::C70, InsulationRating::C75,
                               InsulationRating::C90}) {
      for (double t = dom.min_c; t <= dom.max_c; t += 2.5) {
        for (int n = 1; n <= 60; ++n) {
          try {
            const DeratingFactor d = compose_derating(s, t, r, n, InstallationMethod::FreeAir);
            ++evaluated;
            if (!(d.total_factor > 0.0 && d.total_factor <= 1.0)) bounded = false;
            if (!(d.temperature_factor > 0.0 && d.temperature_factor <= 1.0)) bounded = false;
          } catch (const LookupError&) {
            // combination not tabulated
          }
        }
      }
    }
  }
  expect_true(evaluated > 1000, "bound sweep covers many combinations");
  expect_true(bounded, "0 < total <= 1 for every tabulated combination");
}

} // namespace
} // namespace cable

int main() {
  cable::test_nec();
  cable::test_iec();
  cable::test_bounds();
  return cable::selftest::exit_code();
}
