#pragma once
/*
================================================================================
Standards: Citation Strings
FILE: cpp/engine/standards/references.hpp

Literal clause citations attached to every sizing result. Selection depends
only on the standard, the (resolved) installation method and whether an
earth conductor was sized. No dynamic lookup of citation text.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/standards/standard_types.hpp"

namespace cable {

// Base ampacity table for the standard.
const char* ampacity_reference(Standard s) noexcept;

// Temperature correction table.
const char* temperature_reference(Standard s) noexcept;

// Grouping table; the IEC citation names the reference method column.
std::string grouping_reference(Standard s, InstallationMethod method);

const char* voltage_drop_reference(Standard s) noexcept;

const char* earth_conductor_reference(Standard s) noexcept;

// Ordered list for CableSizingResult::standard_references.
std::vector<std::string> standard_references(Standard s,
                                             InstallationMethod method,
                                             bool include_earth_conductor);

} // namespace cable
