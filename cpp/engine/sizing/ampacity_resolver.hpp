#pragma once
/*
================================================================================
Sizing: Ampacity Resolver
FILE: cpp/engine/sizing/ampacity_resolver.hpp

Resolves base ampacity and per-unit-length resistance for one
(standard, material, insulation rating, size) tuple.

Rules:
  - Exact table membership only. No interpolation between ratings or sizes.
  - Any missing row throws LookupError.
  - Pure read of StandardTables; safe from any thread.
================================================================================
*/

#include "engine/standards/standard_types.hpp"

namespace cable {

struct ResolvedConductor {
  double base_ampacity_a = 0.0;
  double resistance = 0.0;  // mV/A/m (IEC) or ohm/1000 ft (NEC)
};

ResolvedConductor resolve_ampacity(Standard standard,
                                   ConductorMaterial material,
                                   InsulationRating rating,
                                   ConductorSize size);

// Resistance does not depend on the insulation rating.
double resolve_resistance(Standard standard, ConductorMaterial material, ConductorSize size);

} // namespace cable
