/*
  Cable Sizing CLI

  Usage
  -----
  cable_cli <command> [options]

  Commands
  --------
    size     search the smallest size satisfying ampacity and voltage drop
    check    verify one explicit size (--size required)
    vdrop    voltage drop for one size (--size required)
    derate   temperature / grouping factors
    tables   print the ampacity table for a standard + material + rating
    help     this text

  Exit codes
  ----------
    0  => fully compliant (size/check), or command succeeded
    2  => result produced but not fully compliant
    1  => tool error (invalid args / lookup error / validation error / io error)
*/

#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "cli/cli_args.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/sizing/conductor_selector.hpp"
#include "engine/sizing/derating_composer.hpp"
#include "engine/sizing/input_validation.hpp"
#include "engine/sizing/result_json.hpp"
#include "engine/sizing/voltage_drop.hpp"
#include "engine/standards/standard_tables.hpp"

namespace cable {
namespace {

enum class ExitCode : int {
  kOk = 0,
  kError = 1,
  kNonCompliant = 2,
};

static constexpr int kExitErrorInt = static_cast<int>(ExitCode::kError);

static std::string fixed(double v, int digits) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(digits) << v;
  return oss.str();
}

static void print_result_text(std::ostream& os, const CableSizingResult& r) {
  os << (r.explicit_size_checked ? "Checked size:     " : "Recommended size: ") << r.designation
     << " (" << to_string(r.material) << ", " << to_string(r.standard) << ")\n";
  os << "Ampacity:         base " << fixed(r.ampacity.base_a, 1) << " A, derated "
     << fixed(r.ampacity.derated_a, 1) << " A, utilization " << fixed(r.ampacity.utilization_percent, 1)
     << "%\n";
  os << "Derating:         temperature " << fixed(r.derating.temperature_factor, 2) << " x grouping "
     << fixed(r.derating.grouping_factor, 2) << " = " << fixed(r.derating.total_factor, 3) << "\n";
  os << "Voltage drop:     " << fixed(r.voltage_drop.volts, 2) << " V (" << fixed(r.voltage_drop.percent, 2)
     << "%, limit " << fixed(r.voltage_drop.limit_percent, 2) << "%)\n";
  os << "Compliance:       ampacity " << (r.compliance.ampacity_ok ? "OK" : "FAIL")
     << ", voltage drop " << (r.compliance.voltage_drop_ok ? "OK" : "FAIL")
     << " => " << (r.compliance.fully ? "COMPLIANT" : "NOT COMPLIANT") << "\n";
  if (!r.alternatives.empty()) {
    os << "Alternatives:    ";
    for (const auto& a : r.alternatives) os << " " << a.designation;
    os << "\n";
  }
  if (r.earth_conductor) {
    os << "Earth conductor:  " << r.earth_conductor->designation << " ("
       << r.earth_conductor->standard_reference << ")\n";
  }
  for (const auto& w : r.warnings) {
    os << "[" << to_string(w.severity) << "] " << w.code << ": " << w.message << "\n";
  }
  os << "References:\n";
  for (const auto& ref : r.standard_references) os << "  - " << ref << "\n";
}

static int run_sizing(const Args& a) {
  const InputValidationReport vr = validate_input(a.input);
  if (!vr.ok()) {
    for (const auto& e : vr.errors) {
      log(LogLevel::ERROR, "input " + e.field + ": " + e.message);
    }
    return kExitErrorInt;
  }

  const SelectionOutcome out = try_select_conductor(a.input, a.settings);
  if (!out.ok()) {
    log(LogLevel::ERROR, std::string("sizing failed (") + to_string(out.code) + "): " + out.message);
    return kExitErrorInt;
  }

  CableSizingResult r = *out.result;
  for (const auto& w : vr.warnings) r.warnings.push_back(w);

  if (!a.out_path.empty()) {
    if (!write_result_json_file(r, a.out_path)) {
      log(LogLevel::ERROR, "failed to write " + a.out_path);
      return kExitErrorInt;
    }
  }
  if (a.json) {
    std::cout << result_to_json(r);
  } else {
    print_result_text(std::cout, r);
  }
  if (!std::cout.good()) {
    log(LogLevel::ERROR, "failed to write stdout");
    return kExitErrorInt;
  }
  return static_cast<int>(r.compliance.fully ? ExitCode::kOk : ExitCode::kNonCompliant);
}

static int run_vdrop(const Args& a) {
  const std::optional<double> v =
      a.input.system_voltage_v > 0.0 ? std::optional<double>(a.input.system_voltage_v) : std::nullopt;
  const VoltageDrop vd = compute_voltage_drop(a.input.current_a, a.input.length, *a.input.explicit_size,
                                              a.input.material, a.input.circuit_type, a.input.standard, v);
  std::cout << size_designation(*a.input.explicit_size) << ": " << fixed(vd.volts, 3) << " V";
  if (vd.percent) std::cout << " (" << fixed(*vd.percent, 3) << "%)";
  std::cout << "\n";
  return static_cast<int>(ExitCode::kOk);
}

static int run_derate(const Args& a) {
  const DeratingFactor d = compose_derating(a.input.standard, a.input.ambient_temperature_c,
                                            a.input.insulation_rating, a.input.conductor_count,
                                            a.input.installation_method, a.settings.derating);
  std::cout << "temperature " << fixed(d.temperature_factor, 3) << "\n"
            << "grouping    " << fixed(d.grouping_factor, 3) << "\n"
            << "total       " << fixed(d.total_factor, 3) << "\n"
            << "reference   " << d.standard_reference << "\n";
  return static_cast<int>(ExitCode::kOk);
}

static int run_tables(const Args& a) {
  const std::optional<int> col = rating_column(a.input.standard, a.input.insulation_rating);
  if (!col) {
    log(LogLevel::ERROR, std::string(to_string(a.input.standard)) + " has no " +
                             std::to_string(rating_celsius(a.input.insulation_rating)) + " C column");
    return kExitErrorInt;
  }
  std::cout << to_string(a.input.standard) << " " << to_string(a.input.material) << " "
            << rating_celsius(a.input.insulation_rating) << " C (" << resistance_unit(a.input.standard)
            << ")\n";
  for (const AmpacityRow& row : ampacity_table(a.input.standard, a.input.material)) {
    std::cout << "  " << std::left << std::setw(12)
              << size_designation(ConductorSize{a.input.standard, row.size_index}) << std::right
              << std::setw(8) << fixed(row.amps[*col], 1) << " A  " << std::setw(8)
              << row.resistance << "\n";
  }
  return static_cast<int>(ExitCode::kOk);
}

}  // namespace
}  // namespace cable

int main(int argc, char** argv) {
  using namespace cable;

  Args a{};
  std::string arg_err;
  if (!parse_args(argc, argv, &a, &arg_err)) {
    std::cerr << "Argument error: " << arg_err << "\n\n";
    print_usage(std::cerr);
    return kExitErrorInt;
  }

  try {
    switch (a.cmd) {
      case Command::Help:
        print_usage(std::cout);
        return static_cast<int>(ExitCode::kOk);
      case Command::Size:
      case Command::Check:
        return run_sizing(a);
      case Command::VDrop:
        return run_vdrop(a);
      case Command::Derate:
        return run_derate(a);
      case Command::Tables:
        return run_tables(a);
    }
  } catch (const CableError& e) {
    log(LogLevel::ERROR, e.what());
    return kExitErrorInt;
  }
  return kExitErrorInt;
}
