#include "engine/sizing/input_validation.hpp"

#include <cmath>
#include <sstream>

#include "engine/standards/references.hpp"
#include "engine/standards/standard_tables.hpp"

namespace cable {
namespace {

bool in_range(double v, double lo, double hi) {
  return std::isfinite(v) && v >= lo && v <= hi;
}

std::string num(double v) {
  std::ostringstream oss;
  oss << v;
  return oss.str();
}

void warn(InputValidationReport& r, WarningSeverity sev, const char* code, std::string msg) {
  r.warnings.push_back(Warning{sev, code, std::move(msg)});
}

} // namespace

Length normalize_length(const Length& length, Standard standard) noexcept {
  return units::to_unit(length, native_length_unit(standard));
}

InputValidationReport validate_input(const CableSizingInput& in) {
  InputValidationReport r;
  auto error = [&r](const char* field, std::string msg, ErrorCode code = ErrorCode::kInvalidArgument) {
    r.errors.push_back(ValidationIssue{field, std::move(msg), code});
  };

  if (!in_range(in.current_a, 0.1, 10000.0)) {
    error("current", "current must be 0.1..10000 A, got " + num(in.current_a));
  }
  if (!in_range(in.length.value, 0.1, 10000.0)) {
    error("length", "length must be 0.1..10000, got " + num(in.length.value));
  }
  const LengthUnit native = native_length_unit(in.standard);
  if (in.length.unit != native) {
    error("length",
          std::string(to_string(in.standard)) + " requires length in " + to_string(native) +
              ", got " + to_string(in.length.unit),
          ErrorCode::kUnitMismatch);
  }
  if (!in_range(in.system_voltage_v, 1.0, 50000.0)) {
    error("systemVoltage", "system voltage must be 1..50000 V, got " + num(in.system_voltage_v));
  }
  if (in.conductor_count < 1 || in.conductor_count > 50) {
    error("conductorCount", "conductor count must be 1..50, got " + std::to_string(in.conductor_count));
  }
  const TemperatureDomain dom = temperature_domain(in.standard);
  if (!in_range(in.ambient_temperature_c, dom.min_c, dom.max_c)) {
    error("ambientTemperature", std::string(to_string(in.standard)) + " ambient must be " +
                                    num(dom.min_c) + ".." + num(dom.max_c) + " C, got " +
                                    num(in.ambient_temperature_c));
  }
  if (!rating_column(in.standard, in.insulation_rating)) {
    error("insulationRating", std::string(to_string(in.standard)) + " tables have no " +
                                  std::to_string(rating_celsius(in.insulation_rating)) + " C column");
  }
  if (in.max_voltage_drop_percent && !in_range(*in.max_voltage_drop_percent, 1e-9, 25.0)) {
    error("maxVoltageDropPercent",
          "voltage drop limit must be (0, 25] %, got " + num(*in.max_voltage_drop_percent));
  }
  if (in.explicit_size && in.explicit_size->standard != in.standard) {
    error("explicitSize", "explicit size belongs to " + std::string(to_string(in.explicit_size->standard)));
  }

  // ---- advisories ----
  const bool nec = (in.standard == Standard::NorthAmerican);
  const double length_m = units::convert(in.length.value, in.length.unit, LengthUnit::Meters);

  if (in.ambient_temperature_c > 50.0) {
    warn(r, WarningSeverity::Warning, "INPUT.HIGH_AMBIENT",
         "High ambient temperature (" + num(in.ambient_temperature_c) +
             " C) will significantly reduce cable ampacity (" + temperature_reference(in.standard) + ")");
  }
  if (in.ambient_temperature_c > 70.0) {
    warn(r, WarningSeverity::Danger, "INPUT.EXTREME_AMBIENT",
         "Extreme ambient temperature (" + num(in.ambient_temperature_c) +
             " C) - verify insulation rating is adequate");
  }
  if (in.conductor_count > 20) {
    warn(r, WarningSeverity::Warning, "INPUT.MANY_CONDUCTORS",
         "Large number of conductors (" + std::to_string(in.conductor_count) +
             ") results in significant derating");
  }
  if (!nec && in.length.value > 200.0) {
    warn(r, WarningSeverity::Info, "INPUT.LONG_RUN", "Long cable run - verify voltage drop is acceptable");
  }
  if (length_m > 500.0) {
    warn(r, WarningSeverity::Warning, "INPUT.VERY_LONG_RUN",
         "Very long cable run - consider intermediate substations or voltage step-up");
  }
  if (in.current_a > 500.0) {
    warn(r, WarningSeverity::Info, "INPUT.HIGH_CURRENT",
         std::string("High current load - consider parallel conductors (") +
             (nec ? "NEC 310.10(H)" : "IEC 60364-5-52") + ")");
  }
  if (in.system_voltage_v <= 48.0) {
    warn(r, WarningSeverity::Info, "INPUT.LOW_VOLTAGE",
         "Low voltage system - voltage drop tolerance may be critical");
  }
  if (in.system_voltage_v >= 2400.0) {
    warn(r, WarningSeverity::Info, "INPUT.MEDIUM_VOLTAGE",
         "Medium voltage system - ensure proper insulation and terminations");
  }
  if (in.material == ConductorMaterial::Aluminum && in.current_a < 15.0) {
    warn(r, WarningSeverity::Info, "INPUT.SMALL_ALUMINUM",
         "Aluminum conductors are not typically used for small currents - consider copper");
  }
  if (in.installation_method == InstallationMethod::DirectBuried) {
    warn(r, WarningSeverity::Info, "INPUT.DIRECT_BURIAL",
         std::string("Direct burial - ensure proper depth and protection (") +
             (nec ? "NEC Table 300.5" : "IEC 60364-5-52") + ")");
  }
  return r;
}

void validate_input_or_throw(const CableSizingInput& input) {
  const InputValidationReport r = validate_input(input);
  if (r.ok()) return;

  bool only_units = true;
  std::ostringstream oss;
  oss << "invalid sizing input:";
  for (const ValidationIssue& e : r.errors) {
    oss << " [" << e.field << "] " << e.message << ";";
    if (e.code != ErrorCode::kUnitMismatch) only_units = false;
  }
  throw ValidationError(oss.str(), only_units ? ErrorCode::kUnitMismatch : ErrorCode::kInvalidArgument,
                        CABLE_SITE);
}

} // namespace cable
