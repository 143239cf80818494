#pragma once
/*
================================================================================
Standards: Lookup Tables
FILE: cpp/engine/standards/standard_tables.hpp

Purpose:
  - Immutable, process-wide lookup data for both standards:
      * ordered conductor size list (ascending capacity)
      * ampacity + resistance rows per (standard, material)
      * ambient temperature correction step tables
      * grouping / bundling factor buckets
  - Data lives in constexpr arrays of structs. Nothing here allocates and
    nothing is ever mutated, so concurrent reads need no locking.

Table sources:
  - NorthAmerican: NEC Table 310.15(B)(16) (ampacity), NEC Chapter 9 Table 8
    (DC resistance, ohm per 1000 ft), NEC 310.15(B)(2)(a) (temperature),
    NEC 310.15(C)(1) (more than three current-carrying conductors).
  - International: IEC 60364-5-52 Table B.52.4 (ampacity), Clause 525 /
    Annex G (voltage drop in mV/A/m), Table B.52.14 (temperature),
    Table B.52.17 (grouping).

Conventions:
  - Ampacity rows carry three rating columns. IEC columns are 60/70/90 C,
    NEC columns 60/75/90 C (rating_column()).
  - Temperature steps are keyed by the bucket's upper bound in C; the first
    step with ambient <= upper_c applies. A factor of 0 means the rating is
    not permitted at that ambient.
================================================================================
*/

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "engine/standards/standard_types.hpp"

namespace cable {

enum class SizeScheme : int { SquareMillimeters = 0, Awg = 1, Kcmil = 2 };

struct SizeDesignation {
  const char* label;   // "2.5", "14", "1/0", "250"
  SizeScheme scheme;
  double area_mm2;
};

struct AmpacityRow {
  int size_index;      // into size_list(standard)
  double resistance;   // mV/A/m (IEC) or ohm/1000 ft (NEC)
  double amps[3];      // rating columns, see rating_column()
};

struct TemperatureStep {
  double upper_c;
  double factor[3];
};

struct TemperatureDomain {
  double min_c;
  double max_c;
};

// NEC 310.15(C)(1) bucket: applies up to and including max_conductors.
struct CountBucket {
  int max_conductors;
  double factor;
};

inline constexpr double kNecExtendedGroupingFactor = 0.35;

// IEC 60364-5-52 reference installation methods with a grouping column.
enum class IecReferenceMethod : int { A = 0, B = 1, C = 2, E = 3 };

struct CircuitRow {
  int circuits;
  double factor[4];    // indexed by IecReferenceMethod
};

// ---- sizes ----
std::span<const SizeDesignation> size_list(Standard s) noexcept;
int size_count(Standard s) noexcept;

// "6 mm²", "10 AWG", "1/0 AWG", "250 kcmil". Throws LookupError for an
// index outside the standard's size list.
std::string size_designation(ConductorSize size);

// Parses a size label back into a ConductorSize. Accepts the bare label
// ("1/0", "2.5") or the label with its unit ("250 kcmil", "6mm2", "6 mm²",
// "10 AWG"). Returns nullopt when the size is not tabulated.
std::optional<ConductorSize> find_size(Standard s, std::string_view label);

// ---- ampacity / resistance ----
std::span<const AmpacityRow> ampacity_table(Standard s, ConductorMaterial m) noexcept;

// nullptr when the material has no row for this size (e.g. 14 AWG aluminum).
const AmpacityRow* find_ampacity_row(Standard s, ConductorMaterial m, int size_index) noexcept;

// Column index into AmpacityRow::amps / TemperatureStep::factor, or nullopt
// when the standard does not tabulate this rating.
std::optional<int> rating_column(Standard s, InsulationRating r) noexcept;

const char* resistance_unit(Standard s) noexcept;

// ---- temperature ----
std::span<const TemperatureStep> temperature_table(Standard s) noexcept;
TemperatureDomain temperature_domain(Standard s) noexcept;

// ---- grouping ----
std::span<const CountBucket> nec_grouping_table() noexcept;
std::span<const CircuitRow> iec_grouping_table() noexcept;

IecReferenceMethod iec_reference_method(InstallationMethod m) noexcept;
const char* to_string(IecReferenceMethod m) noexcept;

} // namespace cable
