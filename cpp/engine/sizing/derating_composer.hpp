#pragma once
/*
================================================================================
Sizing: Derating Composer
FILE: cpp/engine/sizing/derating_composer.hpp

Combines the ambient temperature factor and the grouping factor into one
multiplier on base ampacity.

  temperature  step table keyed by (ambient bucket, insulation rating).
               Ambient 30 C (reference) is exactly 1.0 in both standards.
               IEC factors above 1.0 (ambient < 30 C) are clamped to 1.0.
  grouping     NEC: bucketed by current-carrying conductor count.
               IEC: circuits = ceil(count / 3), looked up in the column of
               the installation method's reference method.
  total        temperature * grouping, never above 1.0.

Errors:
  - LookupError for ambient outside the tabulated domain, a rating that is not
    permitted at that ambient (published factor 0), or a conductor count
    beyond the grouping table. Nothing is clamped into range.
================================================================================
*/

#include <optional>

#include "engine/core/settings.hpp"
#include "engine/sizing/sizing_types.hpp"

namespace cable {

DeratingFactor compose_derating(Standard standard,
                                double ambient_c,
                                InsulationRating rating,
                                int conductor_count,
                                std::optional<InstallationMethod> method,
                                const DeratingSettings& settings = {});

double temperature_factor(Standard standard, double ambient_c, InsulationRating rating);

double grouping_factor(Standard standard,
                       int conductor_count,
                       InstallationMethod method,
                       const DeratingSettings& settings = {});

// ceil(count / 3) for count >= 1.
int iec_circuit_count(int conductor_count) noexcept;

} // namespace cable
