#pragma once
/*
================================================================================
Sizing: Compliance Reporter
FILE: cpp/engine/sizing/compliance_reporter.hpp

Pure assembly of CableSizingResult from what the selector decided. No table
lookups and no constraint evaluation happen here.

Warning codes:
  MATERIAL.ALUMINUM_COMPOUND   info     always for aluminum
  AMPACITY.HIGH_UTILIZATION    info     utilization above the report threshold
  SEARCH.EXHAUSTED             danger   no size satisfies both constraints
  CHECK.AMPACITY_INSUFFICIENT  danger   explicit size fails ampacity
  CHECK.VOLTAGE_DROP_EXCEEDED  warning  explicit size fails voltage drop
  VDROP.DANGEROUS              danger   drop above the danger threshold
  DERATING.SEVERE_TEMPERATURE  warning  temperature factor below severe_factor
  DERATING.SEVERE_GROUPING     warning  grouping factor below severe_factor
  DERATING.VERY_LOW_TOTAL      warning  total factor below very_low_total_factor
  EARTH.EXCEEDS_TABLE          warning  OCPD above NEC Table 250.122
================================================================================
*/

#include <optional>
#include <vector>

#include "engine/core/settings.hpp"
#include "engine/sizing/sizing_types.hpp"

namespace cable {

struct SelectionTrace {
  DeratingFactor derating{};
  InstallationMethod installation_method = InstallationMethod::SingleConduit;
  CandidateEvaluation chosen{};
  bool search_exhausted = false;
  bool explicit_size_checked = false;
  std::vector<CandidateEvaluation> alternatives;
  std::optional<EarthConductor> earth_conductor{};
};

CableSizingResult assemble_result(const CableSizingInput& input,
                                  const SelectionTrace& trace,
                                  const EngineSettings& settings);

std::vector<Warning> derating_advisories(const DeratingFactor& d, const DeratingSettings& settings);

} // namespace cable
