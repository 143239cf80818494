#pragma once
/*
================================================================================
Sizing: Request / Result Types
FILE: cpp/engine/sizing/sizing_types.hpp

Purpose:
  - CableSizingInput: one validated sizing request.
  - CableSizingResult: everything the engine reports for it.

Invariants (held by the engine, checked by the selftests):
  - 0 < derating.total_factor <= 1
  - ampacity.derated == ampacity.base * derating.total_factor
  - voltage_drop.percent == 100 * voltage_drop.volts / system_voltage_v
  - compliance.fully == compliance.ampacity_ok && compliance.voltage_drop_ok

Notes:
  - All quantities are in the active standard's native units: length in m
    (IEC) or ft (NEC), resistance in mV/A/m or ohm/1000 ft.
================================================================================
*/

#include <optional>
#include <string>
#include <vector>

#include "engine/core/units.hpp"
#include "engine/standards/standard_types.hpp"

namespace cable {

struct CableSizingInput {
  double current_a = 0.0;
  Length length{};
  double system_voltage_v = 0.0;
  ConductorMaterial material = ConductorMaterial::Copper;

  // IEC grouping column selector. Unset: EngineSettings default method.
  std::optional<InstallationMethod> installation_method{};

  CircuitType circuit_type = CircuitType::SinglePhase;
  double ambient_temperature_c = 30.0;
  int conductor_count = 3;
  InsulationRating insulation_rating = InsulationRating::C75;
  Standard standard = Standard::NorthAmerican;

  // Unset: EngineSettings::vdrop.default_max_percent.
  std::optional<double> max_voltage_drop_percent{};

  // Set: verify this size only instead of searching.
  std::optional<ConductorSize> explicit_size{};
};

struct DeratingFactor {
  double temperature_factor = 1.0;
  double grouping_factor = 1.0;
  double total_factor = 1.0;
  std::string standard_reference;
};

// Raw calculator output; percent is absent when no system voltage is given.
struct VoltageDrop {
  double volts = 0.0;
  std::optional<double> percent{};
};

struct VoltageDropAssessment {
  double volts = 0.0;
  double percent = 0.0;
  double limit_percent = 0.0;
  bool is_violation = false;
  bool is_dangerous = false;
};

struct AmpacityAssessment {
  double base_a = 0.0;
  double derated_a = 0.0;
  double utilization_percent = 0.0;
};

struct ComplianceFlags {
  bool voltage_drop_ok = false;
  bool ampacity_ok = false;
  bool fully = false;
};

enum class WarningSeverity : int { Info = 0, Warning = 1, Danger = 2 };

inline const char* to_string(WarningSeverity s) noexcept {
  switch (s) {
    case WarningSeverity::Info:    return "info";
    case WarningSeverity::Warning: return "warning";
    case WarningSeverity::Danger:  return "danger";
  }
  return "?";
}

// Stable dotted codes ("AMPACITY.HIGH_UTILIZATION") plus a human message.
struct Warning {
  WarningSeverity severity = WarningSeverity::Info;
  std::string code;
  std::string message;
};

// One size evaluated against both constraints.
struct CandidateEvaluation {
  ConductorSize size{};
  double resistance = 0.0;
  AmpacityAssessment ampacity{};
  VoltageDropAssessment voltage_drop{};
  bool ampacity_ok = false;
  bool voltage_ok = false;

  bool fully_compliant() const noexcept { return ampacity_ok && voltage_ok; }
};

struct AlternativeSize {
  ConductorSize size{};
  std::string designation;
  double derated_ampacity_a = 0.0;
  double voltage_drop_percent = 0.0;
};

struct EarthConductor {
  // Unset when the table names a size outside the ampacity size list
  // (700, 800 and 1200 kcmil in NEC Table 250.122).
  std::optional<ConductorSize> size{};
  std::string designation;
  double area_mm2 = 0.0;
  double ocpd_rating_a = 0.0;   // NEC only; 0 for IEC
  bool exceeds_table = false;   // NEC: OCPD above the last Table 250.122 row
  bool limited_to_phase = false;  // NEC: capped at the phase conductor
  std::string standard_reference;
};

struct CableSizingResult {
  Standard standard = Standard::NorthAmerican;
  ConductorMaterial material = ConductorMaterial::Copper;
  InstallationMethod installation_method = InstallationMethod::SingleConduit;

  ConductorSize recommended_size{};
  std::string designation;
  double resistance = 0.0;

  VoltageDropAssessment voltage_drop{};
  AmpacityAssessment ampacity{};
  DeratingFactor derating{};
  ComplianceFlags compliance{};

  double ampacity_margin_a = 0.0;
  double voltage_drop_margin_percent = 0.0;

  bool search_exhausted = false;
  bool explicit_size_checked = false;

  std::vector<AlternativeSize> alternatives;
  std::optional<EarthConductor> earth_conductor{};

  std::vector<Warning> warnings;
  std::vector<std::string> standard_references;

  bool has_warning(const std::string& code) const {
    for (const auto& w : warnings) {
      if (w.code == code) return true;
    }
    return false;
  }
};

} // namespace cable
