#include "engine/sizing/earth_conductor.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <optional>
#include <string>

#include "engine/core/errors.hpp"
#include "engine/standards/references.hpp"
#include "engine/standards/standard_tables.hpp"

namespace cable {
namespace {

struct GroundingRow {
  double ocpd_a;
  const char* cu_label;
  SizeScheme cu_scheme;
  double cu_mm2;
  const char* al_label;
  SizeScheme al_scheme;
  double al_mm2;
};

constexpr SizeScheme kAwg = SizeScheme::Awg;
constexpr SizeScheme kKcmil = SizeScheme::Kcmil;

// NEC Table 250.122.
constexpr GroundingRow kNecGrounding[] = {
    {15.0,   "14",   kAwg,   2.08, "12",   kAwg,   3.31},
    {20.0,   "12",   kAwg,   3.31, "10",   kAwg,   5.26},
    {60.0,   "10",   kAwg,   5.26, "8",    kAwg,   8.37},
    {100.0,  "8",    kAwg,   8.37, "6",    kAwg,   13.3},
    {200.0,  "6",    kAwg,   13.3, "4",    kAwg,   21.2},
    {300.0,  "4",    kAwg,   21.2, "2",    kAwg,   33.6},
    {400.0,  "3",    kAwg,   26.7, "1",    kAwg,   42.4},
    {500.0,  "2",    kAwg,   33.6, "1/0",  kAwg,   53.5},
    {600.0,  "1",    kAwg,   42.4, "2/0",  kAwg,   67.4},
    {800.0,  "1/0",  kAwg,   53.5, "3/0",  kAwg,   85.0},
    {1000.0, "2/0",  kAwg,   67.4, "4/0",  kAwg,   107.0},
    {1200.0, "3/0",  kAwg,   85.0, "250",  kKcmil, 127.0},
    {1600.0, "4/0",  kAwg,   107.0, "350", kKcmil, 177.0},
    {2000.0, "250",  kKcmil, 127.0, "400", kKcmil, 203.0},
    {2500.0, "350",  kKcmil, 177.0, "600", kKcmil, 304.0},
    {3000.0, "400",  kKcmil, 203.0, "600", kKcmil, 304.0},
    {4000.0, "500",  kKcmil, 253.0, "750", kKcmil, 380.0},
    {5000.0, "700",  kKcmil, 355.0, "1200", kKcmil, 608.0},
    {6000.0, "800",  kKcmil, 405.0, "1200", kKcmil, 608.0},
};

std::string nec_label(const char* label, SizeScheme scheme) {
  return std::string(label) + (scheme == SizeScheme::Kcmil ? " kcmil" : " AWG");
}

} // namespace

double nec_ocpd_rating(double current_a) noexcept {
  return std::ceil(1.25 * current_a);
}

EarthConductor size_earth_conductor_nec(double current_a,
                                        ConductorMaterial material,
                                        std::optional<ConductorSize> phase_size) {
  const double ocpd = nec_ocpd_rating(current_a);

  const GroundingRow* row = nullptr;
  for (const GroundingRow& r : kNecGrounding) {
    if (ocpd <= r.ocpd_a) {
      row = &r;
      break;
    }
  }

  EarthConductor ec;
  ec.ocpd_rating_a = ocpd;
  if (!row) {
    row = &kNecGrounding[std::size(kNecGrounding) - 1];
    ec.exceeds_table = true;
  }

  const bool cu = (material == ConductorMaterial::Copper);
  const char* label = cu ? row->cu_label : row->al_label;
  const SizeScheme scheme = cu ? row->cu_scheme : row->al_scheme;

  ec.size = find_size(Standard::NorthAmerican, label);
  ec.designation = nec_label(label, scheme);
  ec.area_mm2 = cu ? row->cu_mm2 : row->al_mm2;
  ec.standard_reference = earth_conductor_reference(Standard::NorthAmerican);

  // 250.122(A): never larger than the circuit conductors.
  if (phase_size) {
    const auto sizes = size_list(Standard::NorthAmerican);
    if (phase_size->standard != Standard::NorthAmerican || phase_size->index < 0 ||
        phase_size->index >= static_cast<int>(sizes.size())) {
      CABLE_THROW_LOOKUP("earth conductor cap needs an NEC phase conductor size");
    }
    const double phase_mm2 = sizes[static_cast<size_t>(phase_size->index)].area_mm2;
    if (phase_mm2 < ec.area_mm2) {
      ec.size = *phase_size;
      ec.designation = size_designation(*phase_size);
      ec.area_mm2 = phase_mm2;
      ec.limited_to_phase = true;
    }
  }
  return ec;
}

EarthConductor size_earth_conductor_iec(ConductorSize phase_size, bool mechanically_protected) {
  const auto sizes = size_list(Standard::International);
  if (phase_size.standard != Standard::International || phase_size.index < 0 ||
      phase_size.index >= static_cast<int>(sizes.size())) {
    CABLE_THROW_LOOKUP("earth conductor sizing needs an IEC phase conductor size");
  }

  const double s = sizes[static_cast<size_t>(phase_size.index)].area_mm2;
  double required = 0.0;
  if (s <= 16.0) {
    required = s;
  } else if (s <= 35.0) {
    required = 16.0;
  } else {
    required = s / 2.0;
  }
  required = std::max(required, mechanically_protected ? 2.5 : 4.0);

  for (size_t i = 0; i < sizes.size(); ++i) {
    if (sizes[i].area_mm2 >= required) {
      EarthConductor ec;
      ec.size = ConductorSize{Standard::International, static_cast<int>(i)};
      ec.designation = size_designation(*ec.size);
      ec.area_mm2 = sizes[i].area_mm2;
      ec.standard_reference = earth_conductor_reference(Standard::International);
      return ec;
    }
  }
  // S/2 of the largest tabulated size is always tabulated.
  CABLE_THROW_LOOKUP("no IEC size >= " + std::to_string(required) + " mm² for the earth conductor");
}

EarthConductor size_earth_conductor(const CableSizingInput& input,
                                    ConductorSize phase_size,
                                    const ReportSettings& settings) {
  switch (input.standard) {
    case Standard::NorthAmerican:
      return size_earth_conductor_nec(input.current_a, input.material, phase_size);
    case Standard::International:
      return size_earth_conductor_iec(phase_size, settings.earth_mechanically_protected);
  }
  CABLE_THROW_LOOKUP("unknown standard");
}

} // namespace cable
