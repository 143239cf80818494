#pragma once
/*
================================================================================
CLI: Argument Parsing
FILE: cpp/cli/cli_args.hpp

  cable_cli <command> [options]. Parsing never throws; a false return
  leaves a one-line reason in *err. Lengths are converted to the native
  unit of the chosen standard before the request is returned.
================================================================================
*/

#include <iosfwd>
#include <optional>
#include <string>

#include "engine/core/settings.hpp"
#include "engine/core/units.hpp"
#include "engine/sizing/sizing_types.hpp"

namespace cable {

enum class Command { Size, Check, VDrop, Derate, Tables, Help };

struct Args {
  Command cmd = Command::Help;

  CableSizingInput input{};
  std::optional<LengthUnit> length_unit;
  std::string size_label;

  EngineSettings settings = EngineSettings::defaults();

  bool json = false;
  std::string out_path;  // JSON file; empty = stdout
};

void print_usage(std::ostream& os);

// --size is required for check and vdrop and rejected for size.
bool parse_args(int argc, char** argv, Args* a, std::string* err);

} // namespace cable
