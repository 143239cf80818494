#pragma once
/*
================================================================================
Sizing: Earth / Equipment Grounding Conductor
FILE: cpp/engine/sizing/earth_conductor.hpp

  NEC  Table 250.122, indexed by the overcurrent device rating. The OCPD is
       taken as ceil(1.25 * load current) (continuous-load rule). Ratings
       above the last row return that row with exceeds_table = true.
       When the phase conductor is given the result is capped at it
       (250.122(A)) and limited_to_phase is set.
  IEC  60364-5-54 Table 54.2 (same material as the line conductor):
         S <= 16        -> S
         16 < S <= 35   -> 16
         S > 35         -> S / 2
       then at least 2.5 mm² (mechanically protected) or 4 mm²
       (unprotected), rounded up to a standard size.
================================================================================
*/

#include <optional>

#include "engine/core/settings.hpp"
#include "engine/sizing/sizing_types.hpp"

namespace cable {

// ceil(1.25 * current).
double nec_ocpd_rating(double current_a) noexcept;

// Throws LookupError if phase_size is set but is not an NEC size.
EarthConductor size_earth_conductor_nec(double current_a,
                                        ConductorMaterial material,
                                        std::optional<ConductorSize> phase_size = std::nullopt);

// Throws LookupError if phase_size is not an IEC size.
EarthConductor size_earth_conductor_iec(ConductorSize phase_size, bool mechanically_protected);

// Dispatches on input.standard.
EarthConductor size_earth_conductor(const CableSizingInput& input,
                                    ConductorSize phase_size,
                                    const ReportSettings& settings);

} // namespace cable
