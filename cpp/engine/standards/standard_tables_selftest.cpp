/*
  Standard Tables Selftest

  Checks table membership, size ordering, designations and citations.
  Non-zero return code indicates failure.
*/

#include <algorithm>
#include <string>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/selftest.hpp"
#include "engine/standards/references.hpp"
#include "engine/standards/standard_tables.hpp"

namespace cable {
namespace {

using namespace selftest;

bool contains(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

void test_sizes() {
  expect_true(size_count(Standard::NorthAmerican) == 21, "NEC lists 21 sizes (14 AWG .. 1000 kcmil)");
  expect_true(size_count(Standard::International) == 19, "IEC lists 19 sizes (1.5 .. 630 mm²)");

  for (Standard s : {Standard::International, Standard::NorthAmerican}) {
    const auto sizes = size_list(s);
    bool ascending = true;
    for (size_t i = 1; i < sizes.size(); ++i) {
      if (!(sizes[i].area_mm2 > sizes[i - 1].area_mm2)) ascending = false;
    }
    expect_true(ascending, std::string(to_string(s)) + " size list ascends by area");
  }

  expect_eq_str(size_designation(ConductorSize{Standard::International, 3}), "6 mm²", "IEC designation");
  expect_eq_str(size_designation(ConductorSize{Standard::NorthAmerican, 2}), "10 AWG", "AWG designation");
  expect_eq_str(size_designation(ConductorSize{Standard::NorthAmerican, 9}), "1/0 AWG", "aught designation");
  expect_eq_str(size_designation(ConductorSize{Standard::NorthAmerican, 13}), "250 kcmil", "kcmil designation");
  expect_throws<LookupError>([] { (void)size_designation(ConductorSize{Standard::NorthAmerican, 21}); },
                             "designation outside the list is a LookupError");
}

void test_find_size() {
  auto idx = [](Standard s, const char* label) {
    const auto f = find_size(s, label);
    return f ? f->index : -1;
  };
  expect_true(idx(Standard::NorthAmerican, "1/0") == 9, "find 1/0");
  expect_true(idx(Standard::NorthAmerican, "250 kcmil") == 13, "find 250 kcmil");
  expect_true(idx(Standard::NorthAmerican, "10 AWG") == 2, "find 10 AWG");
  expect_true(idx(Standard::NorthAmerican, "350MCM") == 15, "find 350MCM");
  expect_true(idx(Standard::International, "6mm2") == 3, "find 6mm2");
  expect_true(idx(Standard::International, "6 mm²") == 3, "find 6 mm²");
  expect_true(idx(Standard::International, "2.50") == 1, "find 2.50 numerically");
  expect_true(idx(Standard::NorthAmerican, "7") == -1, "7 AWG is not tabulated");
  expect_true(idx(Standard::International, "") == -1, "empty label");
  expect_true(idx(Standard::International, "abc") == -1, "garbage label");
}

void test_ampacity_rows() {
  const auto col60 = rating_column(Standard::NorthAmerican, InsulationRating::C60);
  const AmpacityRow* r14 = find_ampacity_row(Standard::NorthAmerican, ConductorMaterial::Copper, 0);
  expect_true(col60.has_value() && r14 != nullptr && r14->amps[*col60] == 15.0,
              "14 AWG copper at 60 C is 15 A");

  expect_true(find_ampacity_row(Standard::NorthAmerican, ConductorMaterial::Aluminum, 0) == nullptr,
              "no 14 AWG aluminum row");
  expect_true(find_ampacity_row(Standard::International, ConductorMaterial::Aluminum, 0) == nullptr,
              "no 1.5 mm² aluminum row");
  expect_true(find_ampacity_row(Standard::International, ConductorMaterial::Aluminum, 18) == nullptr,
              "no 630 mm² aluminum row");

  const AmpacityRow* r6 = find_ampacity_row(Standard::International, ConductorMaterial::Copper, 3);
  expect_true(r6 != nullptr && r6->resistance == 3.08, "6 mm² copper is 3.08 mV/A/m");

  expect_true(!rating_column(Standard::International, InsulationRating::C75), "IEC has no 75 C column");
  expect_true(!rating_column(Standard::NorthAmerican, InsulationRating::C70), "NEC has no 70 C column");
  expect_true(rating_column(Standard::International, InsulationRating::C90) == 2, "IEC 90 C is column 2");

  for (Standard s : {Standard::International, Standard::NorthAmerican}) {
    for (ConductorMaterial m : {ConductorMaterial::Copper, ConductorMaterial::Aluminum}) {
      const auto rows = ampacity_table(s, m);
      bool ordered = true;
      for (size_t i = 1; i < rows.size(); ++i) {
        if (rows[i].size_index <= rows[i - 1].size_index) ordered = false;
        if (rows[i].resistance >= rows[i - 1].resistance) ordered = false;
        for (int c = 0; c < 3; ++c) {
          if (rows[i].amps[c] < rows[i - 1].amps[c]) ordered = false;
        }
      }
      expect_true(ordered && !rows.empty(),
                  std::string(to_string(s)) + " " + to_string(m) + " rows ascend in size and ampacity");
    }
  }
}

void test_temperature_and_grouping() {
  for (Standard s : {Standard::International, Standard::NorthAmerican}) {
    bool ref_is_one = false;
    for (const TemperatureStep& step : temperature_table(s)) {
      if (step.upper_c == 30.0) {
        ref_is_one = step.factor[0] == 1.0 && step.factor[1] == 1.0 && step.factor[2] == 1.0;
      }
    }
    expect_true(ref_is_one, std::string(to_string(s)) + " 30 C row is exactly 1.0");
    const auto dom = temperature_domain(s);
    expect_true(temperature_table(s).back().upper_c == dom.max_c, "last step closes the domain");
  }

  expect_true(nec_grouping_table().back().max_conductors == 40, "NEC buckets stop at 40");
  expect_true(iec_grouping_table().back().circuits == 20, "IEC rows stop at 20 circuits");

  expect_true(iec_reference_method(InstallationMethod::SingleConduit) == IecReferenceMethod::A, "conduit -> A");
  expect_true(iec_reference_method(InstallationMethod::MultiConduit) == IecReferenceMethod::B, "multi -> B");
  expect_true(iec_reference_method(InstallationMethod::Tray) == IecReferenceMethod::C, "tray -> C");
  expect_true(iec_reference_method(InstallationMethod::DirectBuried) == IecReferenceMethod::C, "buried -> C");
  expect_true(iec_reference_method(InstallationMethod::FreeAir) == IecReferenceMethod::E, "free air -> E");
}

void test_references() {
  const auto nec = standard_references(Standard::NorthAmerican, InstallationMethod::DirectBuried, true);
  expect_true(nec.front() == "NEC Table 310.15(B)(16)", "NEC ampacity table cited first");
  expect_true(contains(nec, "NEC Chapter 9 Table 8"), "NEC resistance table cited");
  expect_true(contains(nec, "NEC Table 300.5"), "direct burial cites 300.5");
  expect_true(contains(nec, "NEC Table 250.122"), "earth conductor cites 250.122");

  const auto iec = standard_references(Standard::International, InstallationMethod::FreeAir, false);
  expect_true(iec.front() == "IEC 60364-5-52 Table B.52.4", "IEC ampacity table cited first");
  expect_true(contains(iec, "IEC 60364-5-52 Table B.52.17 (Reference Method E)"), "IEC grouping names method");
  expect_true(contains(iec, "IEC 60364-5-52 Clause 525"), "IEC voltage drop clause cited");
  expect_true(!contains(iec, "IEC 60364-5-54"), "no earth citation without an earth conductor");
}

} // namespace
} // namespace cable

int main() {
  cable::test_sizes();
  cable::test_find_size();
  cable::test_ampacity_rows();
  cable::test_temperature_and_grouping();
  cable::test_references();
  return cable::selftest::exit_code();
}
