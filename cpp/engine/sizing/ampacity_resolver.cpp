#include "engine/sizing/ampacity_resolver.hpp"

#include <string>

#include "engine/core/errors.hpp"
#include "engine/standards/standard_tables.hpp"

namespace cable {
namespace {

const AmpacityRow& require_row(Standard standard, ConductorMaterial material, ConductorSize size) {
  if (size.standard != standard) {
    CABLE_THROW_LOOKUP(std::string("size belongs to ") + to_string(size.standard) +
                       " but the calculation uses " + to_string(standard));
  }
  if (size.index < 0 || size.index >= size_count(standard)) {
    CABLE_THROW_LOOKUP(std::string("size index ") + std::to_string(size.index) +
                       " is not in the " + to_string(standard) + " size list");
  }
  const AmpacityRow* row = find_ampacity_row(standard, material, size.index);
  if (!row) {
    CABLE_THROW_LOOKUP(std::string("no ") + to_string(standard) + " " + to_string(material) +
                       " row for " + size_designation(size));
  }
  return *row;
}

} // namespace

ResolvedConductor resolve_ampacity(Standard standard,
                                   ConductorMaterial material,
                                   InsulationRating rating,
                                   ConductorSize size) {
  const std::optional<int> col = rating_column(standard, rating);
  if (!col) {
    CABLE_THROW_LOOKUP(std::string(to_string(standard)) + " tables have no " +
                       std::to_string(rating_celsius(rating)) + " C insulation column");
  }
  const AmpacityRow& row = require_row(standard, material, size);
  return ResolvedConductor{row.amps[*col], row.resistance};
}

double resolve_resistance(Standard standard, ConductorMaterial material, ConductorSize size) {
  return require_row(standard, material, size).resistance;
}

} // namespace cable
