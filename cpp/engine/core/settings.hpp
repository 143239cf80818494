#pragma once
/*
================================================================================
Core: Engine Settings
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every process-wide knob of the sizing engine into a single
    validated object.
  - Settings are hashed into the calculation cache key (cache_key.cpp), so
    ANY change here must change the fingerprint.

Rules:
  - validate_or_throw() rejects nonsensical values with ValidationError.
  - Settings are immutable for the duration of a calculation.
================================================================================
*/

#include <cstddef>

#include "engine/core/errors.hpp"
#include "engine/standards/standard_types.hpp"

namespace cable {

// ----------------------------- Voltage drop ----------------------------------
struct VoltageDropSettings {
  // Limit (%) used when the request leaves max_voltage_drop_percent unset.
  // 3% branch circuit: NEC 210.19(A) informational note, IEC 60364-5-52 G.52.1.
  double default_max_percent = 3.0;

  // Drops above this are flagged dangerous in the result.
  double danger_percent = 10.0;

  void validate_or_throw() const {
    if (!(default_max_percent > 0.0 && default_max_percent <= 25.0)) {
      throw ValidationError("VoltageDropSettings: default_max_percent must be (0,25]");
    }
    if (!(danger_percent >= default_max_percent && danger_percent <= 100.0)) {
      throw ValidationError("VoltageDropSettings: danger_percent must be in [default_max_percent,100]");
    }
  }
};

// ----------------------------- Derating --------------------------------------
struct DeratingSettings {
  // Enables the NEC bucket for 41+ current-carrying conductors (0.35).
  // Off: more than 40 conductors is a LookupError.
  bool nec_extended_grouping = false;

  // IEC grouping column used when the request names no installation method.
  InstallationMethod default_iec_method = InstallationMethod::SingleConduit;

  // Advisory thresholds (warnings only, never change the numbers).
  double severe_factor = 0.5;
  double very_low_total_factor = 0.4;

  void validate_or_throw() const {
    if (!(severe_factor > 0.0 && severe_factor <= 1.0)) {
      throw ValidationError("DeratingSettings: severe_factor must be (0,1]");
    }
    if (!(very_low_total_factor > 0.0 && very_low_total_factor <= 1.0)) {
      throw ValidationError("DeratingSettings: very_low_total_factor must be (0,1]");
    }
  }
};

// ----------------------------- Reporting -------------------------------------
struct ReportSettings {
  double high_utilization_percent = 80.0;

  // Compliant sizes above the recommendation listed as alternatives.
  std::size_t max_alternatives = 3;

  bool include_earth_conductor = true;

  // IEC 60364-5-54 minimum PE size differs for unprotected conductors.
  bool earth_mechanically_protected = true;

  void validate_or_throw() const {
    if (!(high_utilization_percent > 0.0 && high_utilization_percent <= 100.0)) {
      throw ValidationError("ReportSettings: high_utilization_percent must be (0,100]");
    }
    if (max_alternatives > 10) {
      throw ValidationError("ReportSettings: max_alternatives must be <= 10");
    }
  }
};

// ----------------------------- Engine ----------------------------------------
struct EngineSettings {
  VoltageDropSettings vdrop{};
  DeratingSettings derating{};
  ReportSettings report{};

  void validate_or_throw() const {
    vdrop.validate_or_throw();
    derating.validate_or_throw();
    report.validate_or_throw();
  }

  static EngineSettings defaults() { return EngineSettings{}; }
};

} // namespace cable
