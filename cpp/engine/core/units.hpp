#pragma once
/*
================================================================================
Core: Units + Tagged Lengths
FILE: cpp/engine/core/units.hpp

Purpose:
  - Explicit length units so a run length measured in meters can never reach a
    feet-based table (and vice versa) without an explicit conversion.
  - Central constants used by the voltage-drop formula.

Rules:
  - The engine never converts a Length on its own. Conversion is only done by
    the boundary helpers (normalize_length) or the CLI.
================================================================================
*/

#include <cmath>

namespace cable {

enum class LengthUnit : int { Meters = 0, Feet = 1 };

inline const char* to_string(LengthUnit u) noexcept {
  switch (u) {
    case LengthUnit::Meters: return "m";
    case LengthUnit::Feet:   return "ft";
  }
  return "?";
}

struct Length {
  double value = 0.0;
  LengthUnit unit = LengthUnit::Meters;

  static constexpr Length meters(double v) { return Length{v, LengthUnit::Meters}; }
  static constexpr Length feet(double v) { return Length{v, LengthUnit::Feet}; }

  constexpr bool operator==(const Length& o) const noexcept {
    return value == o.value && unit == o.unit;
  }
};

namespace units {

inline constexpr double ft_to_m = 0.3048;
inline constexpr double m_to_ft = 1.0 / ft_to_m;

// Three-phase line-to-line multiplier.
inline constexpr double sqrt3 = 1.7320508075688772;

inline double convert(double v, LengthUnit from, LengthUnit to) noexcept {
  if (from == to) return v;
  return (from == LengthUnit::Feet) ? v * ft_to_m : v * m_to_ft;
}

inline Length to_unit(const Length& l, LengthUnit to) noexcept {
  return Length{convert(l.value, l.unit, to), to};
}

} // namespace units
} // namespace cable
