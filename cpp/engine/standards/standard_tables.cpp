#include "engine/standards/standard_tables.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>

#include "engine/core/errors.hpp"

namespace cable {
namespace {

// ---------------------------------------------------------------------------
// Size lists (ascending capacity). Area for AWG/kcmil is the nominal mm².
// ---------------------------------------------------------------------------
constexpr SizeDesignation kIecSizes[] = {
    {"1.5", SizeScheme::SquareMillimeters, 1.5},
    {"2.5", SizeScheme::SquareMillimeters, 2.5},
    {"4",   SizeScheme::SquareMillimeters, 4.0},
    {"6",   SizeScheme::SquareMillimeters, 6.0},
    {"10",  SizeScheme::SquareMillimeters, 10.0},
    {"16",  SizeScheme::SquareMillimeters, 16.0},
    {"25",  SizeScheme::SquareMillimeters, 25.0},
    {"35",  SizeScheme::SquareMillimeters, 35.0},
    {"50",  SizeScheme::SquareMillimeters, 50.0},
    {"70",  SizeScheme::SquareMillimeters, 70.0},
    {"95",  SizeScheme::SquareMillimeters, 95.0},
    {"120", SizeScheme::SquareMillimeters, 120.0},
    {"150", SizeScheme::SquareMillimeters, 150.0},
    {"185", SizeScheme::SquareMillimeters, 185.0},
    {"240", SizeScheme::SquareMillimeters, 240.0},
    {"300", SizeScheme::SquareMillimeters, 300.0},
    {"400", SizeScheme::SquareMillimeters, 400.0},
    {"500", SizeScheme::SquareMillimeters, 500.0},
    {"630", SizeScheme::SquareMillimeters, 630.0},
};

constexpr SizeDesignation kNecSizes[] = {
    {"14",   SizeScheme::Awg,   2.08},
    {"12",   SizeScheme::Awg,   3.31},
    {"10",   SizeScheme::Awg,   5.26},
    {"8",    SizeScheme::Awg,   8.37},
    {"6",    SizeScheme::Awg,   13.3},
    {"4",    SizeScheme::Awg,   21.2},
    {"3",    SizeScheme::Awg,   26.7},
    {"2",    SizeScheme::Awg,   33.6},
    {"1",    SizeScheme::Awg,   42.4},
    {"1/0",  SizeScheme::Awg,   53.5},
    {"2/0",  SizeScheme::Awg,   67.4},
    {"3/0",  SizeScheme::Awg,   85.0},
    {"4/0",  SizeScheme::Awg,   107.0},
    {"250",  SizeScheme::Kcmil, 127.0},
    {"300",  SizeScheme::Kcmil, 152.0},
    {"350",  SizeScheme::Kcmil, 177.0},
    {"400",  SizeScheme::Kcmil, 203.0},
    {"500",  SizeScheme::Kcmil, 253.0},
    {"600",  SizeScheme::Kcmil, 304.0},
    {"750",  SizeScheme::Kcmil, 380.0},
    {"1000", SizeScheme::Kcmil, 507.0},
};

// ---------------------------------------------------------------------------
// IEC 60364-5-52 Table B.52.4, columns 60/70/90 C; resistance mV/A/m.
// ---------------------------------------------------------------------------
constexpr AmpacityRow kIecCopper[] = {
    {0,  12.1,   {14.0, 17.5, 22.0}},
    {1,  7.41,   {19.0, 23.0, 30.0}},
    {2,  4.61,   {25.0, 31.0, 40.0}},
    {3,  3.08,   {32.0, 40.0, 51.0}},
    {4,  1.83,   {44.0, 54.0, 70.0}},
    {5,  1.15,   {59.0, 68.0, 94.0}},
    {6,  0.727,  {77.0, 89.0, 119.0}},
    {7,  0.524,  {96.0, 110.0, 148.0}},
    {8,  0.387,  {117.0, 133.0, 180.0}},
    {9,  0.268,  {149.0, 168.0, 232.0}},
    {10, 0.193,  {180.0, 201.0, 282.0}},
    {11, 0.153,  {208.0, 232.0, 328.0}},
    {12, 0.124,  {236.0, 258.0, 374.0}},
    {13, 0.0991, {268.0, 289.0, 424.0}},
    {14, 0.0754, {315.0, 341.0, 500.0}},
    {15, 0.0601, {360.0, 384.0, 561.0}},
    {16, 0.0470, {410.0, 430.0, 656.0}},
    {17, 0.0366, {470.0, 490.0, 749.0}},
    {18, 0.0283, {540.0, 560.0, 855.0}},
};

// No 1.5 mm² or 630 mm² aluminum rows.
constexpr AmpacityRow kIecAluminum[] = {
    {1,  12.1,   {14.5, 18.0, 23.0}},
    {2,  7.54,   {19.5, 24.0, 31.0}},
    {3,  5.03,   {25.0, 31.0, 40.0}},
    {4,  3.00,   {34.0, 42.0, 54.0}},
    {5,  1.88,   {46.0, 53.0, 73.0}},
    {6,  1.19,   {60.0, 69.0, 92.0}},
    {7,  0.858,  {75.0, 86.0, 115.0}},
    {8,  0.633,  {92.0, 104.0, 140.0}},
    {9,  0.439,  {116.0, 131.0, 180.0}},
    {10, 0.316,  {140.0, 157.0, 219.0}},
    {11, 0.250,  {162.0, 181.0, 254.0}},
    {12, 0.203,  {184.0, 201.0, 290.0}},
    {13, 0.162,  {209.0, 225.0, 329.0}},
    {14, 0.123,  {246.0, 266.0, 388.0}},
    {15, 0.0986, {281.0, 300.0, 435.0}},
    {16, 0.0770, {322.0, 335.0, 510.0}},
    {17, 0.0600, {368.0, 382.0, 582.0}},
};

// ---------------------------------------------------------------------------
// NEC Table 310.15(B)(16), columns 60/75/90 C; NEC Chapter 9 Table 8
// resistance in ohm per 1000 ft.
// ---------------------------------------------------------------------------
constexpr AmpacityRow kNecCopper[] = {
    {0,  3.14,   {15.0, 15.0, 15.0}},
    {1,  1.98,   {20.0, 25.0, 30.0}},
    {2,  1.24,   {30.0, 35.0, 40.0}},
    {3,  0.778,  {40.0, 50.0, 55.0}},
    {4,  0.491,  {55.0, 65.0, 75.0}},
    {5,  0.308,  {70.0, 85.0, 95.0}},
    {6,  0.245,  {85.0, 100.0, 115.0}},
    {7,  0.194,  {95.0, 115.0, 130.0}},
    {8,  0.154,  {110.0, 130.0, 145.0}},
    {9,  0.122,  {125.0, 150.0, 170.0}},
    {10, 0.0967, {145.0, 175.0, 195.0}},
    {11, 0.0766, {165.0, 200.0, 225.0}},
    {12, 0.0608, {195.0, 230.0, 260.0}},
    {13, 0.0515, {215.0, 255.0, 290.0}},
    {14, 0.0429, {240.0, 285.0, 320.0}},
    {15, 0.0367, {260.0, 310.0, 350.0}},
    {16, 0.0321, {280.0, 335.0, 380.0}},
    {17, 0.0258, {320.0, 380.0, 430.0}},
    {18, 0.0214, {350.0, 420.0, 475.0}},
    {19, 0.0171, {385.0, 475.0, 535.0}},
    {20, 0.0129, {445.0, 545.0, 615.0}},
};

// No 14 AWG aluminum row.
constexpr AmpacityRow kNecAluminum[] = {
    {1,  3.25,   {15.0, 20.0, 25.0}},
    {2,  2.04,   {25.0, 30.0, 35.0}},
    {3,  1.28,   {35.0, 40.0, 45.0}},
    {4,  0.808,  {40.0, 50.0, 55.0}},
    {5,  0.508,  {55.0, 65.0, 75.0}},
    {6,  0.403,  {65.0, 75.0, 85.0}},
    {7,  0.319,  {75.0, 90.0, 100.0}},
    {8,  0.253,  {85.0, 100.0, 115.0}},
    {9,  0.201,  {100.0, 120.0, 135.0}},
    {10, 0.159,  {115.0, 135.0, 150.0}},
    {11, 0.126,  {130.0, 155.0, 175.0}},
    {12, 0.100,  {150.0, 180.0, 205.0}},
    {13, 0.0847, {170.0, 205.0, 230.0}},
    {14, 0.0707, {190.0, 230.0, 255.0}},
    {15, 0.0605, {210.0, 250.0, 280.0}},
    {16, 0.0529, {225.0, 270.0, 305.0}},
    {17, 0.0424, {260.0, 310.0, 350.0}},
    {18, 0.0353, {285.0, 340.0, 385.0}},
    {19, 0.0282, {315.0, 385.0, 435.0}},
    {20, 0.0212, {375.0, 445.0, 500.0}},
};

// ---------------------------------------------------------------------------
// Ambient temperature correction.
// ---------------------------------------------------------------------------
// NEC 310.15(B)(2)(a), columns 60/75/90 C.
constexpr TemperatureStep kNecTemperature[] = {
    {30.0, {1.00, 1.00, 1.00}},
    {35.0, {0.91, 0.94, 0.96}},
    {40.0, {0.82, 0.88, 0.91}},
    {45.0, {0.71, 0.82, 0.87}},
    {50.0, {0.58, 0.75, 0.82}},
    {55.0, {0.41, 0.67, 0.76}},
    {60.0, {0.00, 0.58, 0.71}},
    {65.0, {0.00, 0.47, 0.65}},
    {70.0, {0.00, 0.33, 0.58}},
    {75.0, {0.00, 0.00, 0.50}},
    {80.0, {0.00, 0.00, 0.41}},
    {85.0, {0.00, 0.00, 0.29}},
    {90.0, {0.00, 0.00, 0.00}},
};

// IEC 60364-5-52 Table B.52.14, columns 60/70/90 C (PVC 70 C, XLPE 90 C).
constexpr TemperatureStep kIecTemperature[] = {
    {10.0, {1.22, 1.22, 1.15}},
    {15.0, {1.17, 1.17, 1.12}},
    {20.0, {1.12, 1.12, 1.08}},
    {25.0, {1.06, 1.06, 1.04}},
    {30.0, {1.00, 1.00, 1.00}},
    {35.0, {0.94, 0.94, 0.96}},
    {40.0, {0.87, 0.87, 0.91}},
    {45.0, {0.79, 0.79, 0.87}},
    {50.0, {0.71, 0.71, 0.82}},
    {55.0, {0.61, 0.61, 0.76}},
    {60.0, {0.50, 0.50, 0.71}},
    {65.0, {0.35, 0.35, 0.65}},
    {70.0, {0.00, 0.00, 0.58}},
    {75.0, {0.00, 0.00, 0.50}},
    {80.0, {0.00, 0.00, 0.41}},
};

// ---------------------------------------------------------------------------
// Grouping.
// ---------------------------------------------------------------------------
constexpr CountBucket kNecGrouping[] = {
    {3,  1.00},
    {6,  0.80},
    {9,  0.70},
    {20, 0.50},
    {30, 0.45},
    {40, 0.40},
};

// IEC 60364-5-52 Table B.52.17, columns A / B / C / E.
constexpr CircuitRow kIecGrouping[] = {
    {1,  {1.00, 1.00, 1.00, 1.00}},
    {2,  {0.80, 0.85, 0.85, 0.88}},
    {3,  {0.70, 0.79, 0.79, 0.82}},
    {4,  {0.65, 0.75, 0.75, 0.77}},
    {5,  {0.60, 0.73, 0.73, 0.75}},
    {6,  {0.57, 0.72, 0.72, 0.73}},
    {7,  {0.54, 0.70, 0.70, 0.73}},
    {8,  {0.52, 0.70, 0.70, 0.72}},
    {9,  {0.50, 0.70, 0.70, 0.72}},
    {12, {0.45, 0.65, 0.65, 0.70}},
    {16, {0.41, 0.60, 0.60, 0.68}},
    {20, {0.38, 0.57, 0.57, 0.66}},
};

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool ends_with_nocase(std::string_view s, std::string_view suffix) {
  if (s.size() < suffix.size()) return false;
  const std::string_view tail = s.substr(s.size() - suffix.size());
  for (size_t i = 0; i < suffix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(tail[i])) !=
        std::tolower(static_cast<unsigned char>(suffix[i]))) {
      return false;
    }
  }
  return true;
}

// Strips the first matching unit suffix; returns the bare label.
std::string_view strip_unit(std::string_view s) {
  static constexpr std::string_view kSuffixes[] = {
      "mm²", "mm2", "mm^2", "sqmm", "awg", "kcmil", "mcm",
  };
  s = trim(s);
  for (std::string_view suf : kSuffixes) {
    if (ends_with_nocase(s, suf)) {
      return trim(s.substr(0, s.size() - suf.size()));
    }
  }
  return s;
}

} // namespace

std::span<const SizeDesignation> size_list(Standard s) noexcept {
  switch (s) {
    case Standard::International: return kIecSizes;
    case Standard::NorthAmerican: return kNecSizes;
  }
  return {};
}

int size_count(Standard s) noexcept {
  return static_cast<int>(size_list(s).size());
}

std::string size_designation(ConductorSize size) {
  const auto sizes = size_list(size.standard);
  if (size.index < 0 || size.index >= static_cast<int>(sizes.size())) {
    CABLE_THROW_LOOKUP(std::string("size index ") + std::to_string(size.index) +
                       " is not in the " + to_string(size.standard) + " size list");
  }
  const SizeDesignation& d = sizes[static_cast<size_t>(size.index)];
  switch (d.scheme) {
    case SizeScheme::SquareMillimeters: return std::string(d.label) + " mm²";
    case SizeScheme::Awg:               return std::string(d.label) + " AWG";
    case SizeScheme::Kcmil:             return std::string(d.label) + " kcmil";
  }
  return d.label;
}

std::optional<ConductorSize> find_size(Standard s, std::string_view label) {
  const std::string_view bare = strip_unit(label);
  if (bare.empty()) return std::nullopt;

  const auto sizes = size_list(s);
  for (size_t i = 0; i < sizes.size(); ++i) {
    if (bare == sizes[i].label) return ConductorSize{s, static_cast<int>(i)};
  }

  // "2.50" / "6.0" style metric labels.
  if (s == Standard::International) {
    const std::string tmp(bare);
    char* end = nullptr;
    const double v = std::strtod(tmp.c_str(), &end);
    if (end != tmp.c_str() && *end == '\0' && std::isfinite(v)) {
      for (size_t i = 0; i < sizes.size(); ++i) {
        if (std::fabs(sizes[i].area_mm2 - v) < 1e-9) return ConductorSize{s, static_cast<int>(i)};
      }
    }
  }
  return std::nullopt;
}

std::span<const AmpacityRow> ampacity_table(Standard s, ConductorMaterial m) noexcept {
  switch (s) {
    case Standard::International:
      switch (m) {
        case ConductorMaterial::Copper:   return kIecCopper;
        case ConductorMaterial::Aluminum: return kIecAluminum;
      }
      break;
    case Standard::NorthAmerican:
      switch (m) {
        case ConductorMaterial::Copper:   return kNecCopper;
        case ConductorMaterial::Aluminum: return kNecAluminum;
      }
      break;
  }
  return {};
}

const AmpacityRow* find_ampacity_row(Standard s, ConductorMaterial m, int size_index) noexcept {
  for (const AmpacityRow& row : ampacity_table(s, m)) {
    if (row.size_index == size_index) return &row;
  }
  return nullptr;
}

std::optional<int> rating_column(Standard s, InsulationRating r) noexcept {
  switch (s) {
    case Standard::International:
      switch (r) {
        case InsulationRating::C60: return 0;
        case InsulationRating::C70: return 1;
        case InsulationRating::C75: return std::nullopt;
        case InsulationRating::C90: return 2;
      }
      break;
    case Standard::NorthAmerican:
      switch (r) {
        case InsulationRating::C60: return 0;
        case InsulationRating::C70: return std::nullopt;
        case InsulationRating::C75: return 1;
        case InsulationRating::C90: return 2;
      }
      break;
  }
  return std::nullopt;
}

const char* resistance_unit(Standard s) noexcept {
  switch (s) {
    case Standard::International: return "mV/A/m";
    case Standard::NorthAmerican: return "ohm/1000ft";
  }
  return "?";
}

std::span<const TemperatureStep> temperature_table(Standard s) noexcept {
  switch (s) {
    case Standard::International: return kIecTemperature;
    case Standard::NorthAmerican: return kNecTemperature;
  }
  return {};
}

TemperatureDomain temperature_domain(Standard s) noexcept {
  switch (s) {
    case Standard::International: return {10.0, 80.0};
    case Standard::NorthAmerican: return {-40.0, 90.0};
  }
  return {0.0, 0.0};
}

std::span<const CountBucket> nec_grouping_table() noexcept { return kNecGrouping; }

std::span<const CircuitRow> iec_grouping_table() noexcept { return kIecGrouping; }

IecReferenceMethod iec_reference_method(InstallationMethod m) noexcept {
  switch (m) {
    case InstallationMethod::SingleConduit: return IecReferenceMethod::A;
    case InstallationMethod::MultiConduit:  return IecReferenceMethod::B;
    case InstallationMethod::Tray:          return IecReferenceMethod::C;
    case InstallationMethod::DirectBuried:  return IecReferenceMethod::C;
    case InstallationMethod::FreeAir:       return IecReferenceMethod::E;
  }
  return IecReferenceMethod::A;
}

const char* to_string(IecReferenceMethod m) noexcept {
  switch (m) {
    case IecReferenceMethod::A: return "A";
    case IecReferenceMethod::B: return "B";
    case IecReferenceMethod::C: return "C";
    case IecReferenceMethod::E: return "E";
  }
  return "?";
}

} // namespace cable
