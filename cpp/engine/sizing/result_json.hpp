#pragma once
/*
================================================================================
Sizing: Result JSON Serializer
FILE: cpp/engine/sizing/result_json.hpp

Persistence record for CableSizingResult.
  - Fixed key order (byte-identical output for identical results).
  - Numbers in fixed notation with 6 decimals.
  - Non-finite numbers are written as null, never NaN/Inf.
================================================================================
*/

#include <string>

#include "engine/sizing/sizing_types.hpp"

namespace cable {

std::string result_to_json(const CableSizingResult& r, int indent_spaces = 2);

// false if the file cannot be opened or written.
bool write_result_json_file(const CableSizingResult& r,
                            const std::string& file_path,
                            int indent_spaces = 2);

} // namespace cable
