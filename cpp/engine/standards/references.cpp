#include "engine/standards/references.hpp"

#include "engine/standards/standard_tables.hpp"

namespace cable {

const char* ampacity_reference(Standard s) noexcept {
  switch (s) {
    case Standard::International: return "IEC 60364-5-52 Table B.52.4";
    case Standard::NorthAmerican: return "NEC Table 310.15(B)(16)";
  }
  return "";
}

const char* temperature_reference(Standard s) noexcept {
  switch (s) {
    case Standard::International: return "IEC 60364-5-52 Table B.52.14";
    case Standard::NorthAmerican: return "NEC 310.15(B)(2)(a)";
  }
  return "";
}

std::string grouping_reference(Standard s, InstallationMethod method) {
  switch (s) {
    case Standard::International:
      return std::string("IEC 60364-5-52 Table B.52.17 (Reference Method ") +
             to_string(iec_reference_method(method)) + ")";
    case Standard::NorthAmerican:
      return "NEC 310.15(C)(1)";
  }
  return "";
}

const char* voltage_drop_reference(Standard s) noexcept {
  switch (s) {
    case Standard::International: return "IEC 60364-5-52 Clause 525";
    case Standard::NorthAmerican: return "NEC 210.19(A) Informational Note No. 4";
  }
  return "";
}

const char* earth_conductor_reference(Standard s) noexcept {
  switch (s) {
    case Standard::International: return "IEC 60364-5-54";
    case Standard::NorthAmerican: return "NEC Table 250.122";
  }
  return "";
}

std::vector<std::string> standard_references(Standard s,
                                             InstallationMethod method,
                                             bool include_earth_conductor) {
  std::vector<std::string> out;
  out.emplace_back(ampacity_reference(s));
  if (s == Standard::NorthAmerican) {
    out.emplace_back("NEC Chapter 9 Table 8");
  }
  out.emplace_back(temperature_reference(s));
  out.push_back(grouping_reference(s, method));
  out.emplace_back(voltage_drop_reference(s));
  if (s == Standard::NorthAmerican && method == InstallationMethod::DirectBuried) {
    out.emplace_back("NEC Table 300.5");
  }
  if (include_earth_conductor) {
    out.emplace_back(earth_conductor_reference(s));
  }
  return out;
}

} // namespace cable
