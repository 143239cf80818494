#include "engine/sizing/derating_composer.hpp"

#include <algorithm>
#include <sstream>
#include <string>

#include "engine/core/errors.hpp"
#include "engine/standards/references.hpp"
#include "engine/standards/standard_tables.hpp"

namespace cable {

int iec_circuit_count(int conductor_count) noexcept {
  if (conductor_count <= 0) return 0;
  return (conductor_count + 2) / 3;
}

double temperature_factor(Standard standard, double ambient_c, InsulationRating rating) {
  const std::optional<int> col = rating_column(standard, rating);
  if (!col) {
    CABLE_THROW_LOOKUP(std::string(to_string(standard)) + " temperature table has no " +
                       std::to_string(rating_celsius(rating)) + " C column");
  }

  const TemperatureDomain dom = temperature_domain(standard);
  if (!(ambient_c >= dom.min_c && ambient_c <= dom.max_c)) {
    std::ostringstream oss;
    oss << "ambient " << ambient_c << " C outside the " << to_string(standard)
        << " temperature table [" << dom.min_c << ", " << dom.max_c << "]";
    CABLE_THROW_LOOKUP(oss.str());
  }

  for (const TemperatureStep& step : temperature_table(standard)) {
    if (ambient_c <= step.upper_c) {
      const double f = step.factor[*col];
      if (f <= 0.0) {
        std::ostringstream oss;
        oss << rating_celsius(rating) << " C insulation is not permitted at ambient "
            << ambient_c << " C (" << temperature_reference(standard) << ")";
        CABLE_THROW_LOOKUP(oss.str());
      }
      return std::min(1.0, f);
    }
  }
  // Unreachable while the domain max equals the last step's upper bound.
  CABLE_THROW_LOOKUP("no temperature step for ambient " + std::to_string(ambient_c));
}

double grouping_factor(Standard standard,
                       int conductor_count,
                       InstallationMethod method,
                       const DeratingSettings& settings) {
  if (conductor_count < 1) {
    CABLE_THROW_LOOKUP("conductor count " + std::to_string(conductor_count) + " has no grouping row");
  }

  switch (standard) {
    case Standard::NorthAmerican: {
      for (const CountBucket& b : nec_grouping_table()) {
        if (conductor_count <= b.max_conductors) return b.factor;
      }
      if (settings.nec_extended_grouping) return kNecExtendedGroupingFactor;
      CABLE_THROW_LOOKUP(std::to_string(conductor_count) +
                         " current-carrying conductors exceeds NEC 310.15(C)(1) (max 40);"
                         " enable extended grouping to use the 41+ bucket");
    }
    case Standard::International: {
      const int circuits = iec_circuit_count(conductor_count);
      const int col = static_cast<int>(iec_reference_method(method));
      for (const CircuitRow& row : iec_grouping_table()) {
        if (circuits <= row.circuits) return row.factor[col];
      }
      CABLE_THROW_LOOKUP(std::to_string(circuits) + " circuits (" + std::to_string(conductor_count) +
                         " conductors) exceeds IEC 60364-5-52 Table B.52.17 (max 20 circuits)");
    }
  }
  CABLE_THROW_LOOKUP("unknown standard");
}

DeratingFactor compose_derating(Standard standard,
                                double ambient_c,
                                InsulationRating rating,
                                int conductor_count,
                                std::optional<InstallationMethod> method,
                                const DeratingSettings& settings) {
  const InstallationMethod m = method.value_or(settings.default_iec_method);

  DeratingFactor d;
  d.temperature_factor = temperature_factor(standard, ambient_c, rating);
  d.grouping_factor = grouping_factor(standard, conductor_count, m, settings);
  d.total_factor = std::min(1.0, d.temperature_factor * d.grouping_factor);
  d.standard_reference = std::string(temperature_reference(standard)) + "; " +
                         grouping_reference(standard, m);
  return d;
}

} // namespace cable
