#pragma once
/*
================================================================================
Standards: Closed Enumerations
FILE: cpp/engine/standards/standard_types.hpp

Purpose:
  - The closed vocabulary every table lookup and derating branch switches on.
  - Every switch over these enums is exhaustive (no default:), so adding a
    third standard is flagged by -Wswitch at each unhandled site.

Conventions:
  - to_string() returns the stable token used by the CLI and JSON output.
  - parse_*() accepts the same token and returns false on anything else.
================================================================================
*/

#include <string_view>

#include "engine/core/units.hpp"

namespace cable {

// International = IEC 60364-5-52, NorthAmerican = NEC (NFPA 70).
enum class Standard : int { International = 0, NorthAmerican = 1 };

enum class ConductorMaterial : int { Copper = 0, Aluminum = 1 };

// Only the International grouping tables read this; NEC groups by raw count.
enum class InstallationMethod : int {
  SingleConduit = 0,
  MultiConduit  = 1,
  Tray          = 2,
  DirectBuried  = 3,
  FreeAir       = 4,
};

// DC circuits are modeled as SinglePhase (two-wire round trip).
enum class CircuitType : int { SinglePhase = 0, ThreePhase = 1 };

// Conductor insulation temperature rating in degrees C.
enum class InsulationRating : int { C60 = 60, C70 = 70, C75 = 75, C90 = 90 };

// A size is an index into its standard's ordered size list (ascending
// capacity). Indices from different standards are not comparable.
struct ConductorSize {
  Standard standard = Standard::International;
  int index = 0;

  constexpr bool operator==(const ConductorSize& o) const noexcept {
    return standard == o.standard && index == o.index;
  }
};

inline const char* to_string(Standard s) noexcept {
  switch (s) {
    case Standard::International: return "IEC";
    case Standard::NorthAmerican: return "NEC";
  }
  return "?";
}

inline const char* to_string(ConductorMaterial m) noexcept {
  switch (m) {
    case ConductorMaterial::Copper:   return "copper";
    case ConductorMaterial::Aluminum: return "aluminum";
  }
  return "?";
}

inline const char* to_string(InstallationMethod m) noexcept {
  switch (m) {
    case InstallationMethod::SingleConduit: return "single-conduit";
    case InstallationMethod::MultiConduit:  return "multi-conduit";
    case InstallationMethod::Tray:          return "tray";
    case InstallationMethod::DirectBuried:  return "direct-buried";
    case InstallationMethod::FreeAir:       return "free-air";
  }
  return "?";
}

inline const char* to_string(CircuitType c) noexcept {
  switch (c) {
    case CircuitType::SinglePhase: return "single-phase";
    case CircuitType::ThreePhase:  return "three-phase";
  }
  return "?";
}

inline int rating_celsius(InsulationRating r) noexcept { return static_cast<int>(r); }

inline bool parse_standard(std::string_view s, Standard* out) noexcept {
  if (!out) return false;
  if (s == "IEC" || s == "iec") { *out = Standard::International; return true; }
  if (s == "NEC" || s == "nec") { *out = Standard::NorthAmerican; return true; }
  return false;
}

inline bool parse_material(std::string_view s, ConductorMaterial* out) noexcept {
  if (!out) return false;
  if (s == "copper" || s == "cu")   { *out = ConductorMaterial::Copper;   return true; }
  if (s == "aluminum" || s == "al") { *out = ConductorMaterial::Aluminum; return true; }
  return false;
}

inline bool parse_installation_method(std::string_view s, InstallationMethod* out) noexcept {
  if (!out) return false;
  if (s == "single-conduit") { *out = InstallationMethod::SingleConduit; return true; }
  if (s == "multi-conduit")  { *out = InstallationMethod::MultiConduit;  return true; }
  if (s == "tray")           { *out = InstallationMethod::Tray;          return true; }
  if (s == "direct-buried")  { *out = InstallationMethod::DirectBuried;  return true; }
  if (s == "free-air")       { *out = InstallationMethod::FreeAir;       return true; }
  return false;
}

inline bool parse_circuit_type(std::string_view s, CircuitType* out) noexcept {
  if (!out) return false;
  if (s == "single-phase" || s == "1ph" || s == "dc") { *out = CircuitType::SinglePhase; return true; }
  if (s == "three-phase" || s == "3ph")               { *out = CircuitType::ThreePhase;  return true; }
  return false;
}

inline bool parse_insulation_rating(int celsius, InsulationRating* out) noexcept {
  if (!out) return false;
  switch (celsius) {
    case 60: *out = InsulationRating::C60; return true;
    case 70: *out = InsulationRating::C70; return true;
    case 75: *out = InsulationRating::C75; return true;
    case 90: *out = InsulationRating::C90; return true;
    default: return false;
  }
}

// IEC tables are per meter, NEC tables per 1000 ft.
inline LengthUnit native_length_unit(Standard s) noexcept {
  switch (s) {
    case Standard::International: return LengthUnit::Meters;
    case Standard::NorthAmerican: return LengthUnit::Feet;
  }
  return LengthUnit::Meters;
}

} // namespace cable
