#include "cli/cli_args.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <ostream>

#include "engine/core/logging.hpp"
#include "engine/sizing/input_validation.hpp"
#include "engine/standards/standard_tables.hpp"

namespace cable {
namespace {

bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

bool parse_int(const char* s, int* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (end == s || *end != '\0') return false;
  if (v < -1000000 || v > 1000000) return false;
  *out = static_cast<int>(v);
  return true;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

bool parse_command(const char* s, Command* out) {
  if (std::strcmp(s, "size") == 0)   { *out = Command::Size;   return true; }
  if (std::strcmp(s, "check") == 0)  { *out = Command::Check;  return true; }
  if (std::strcmp(s, "vdrop") == 0)  { *out = Command::VDrop;  return true; }
  if (std::strcmp(s, "derate") == 0) { *out = Command::Derate; return true; }
  if (std::strcmp(s, "tables") == 0) { *out = Command::Tables; return true; }
  if (std::strcmp(s, "help") == 0 || std::strcmp(s, "--help") == 0 || std::strcmp(s, "-h") == 0) {
    *out = Command::Help;
    return true;
  }
  return false;
}

} // namespace

void print_usage(std::ostream& os) {
  os <<
    "cable_cli <size|check|vdrop|derate|tables|help> [options]\n"
    "\n"
    "Request:\n"
    "  --standard IEC|NEC          (default NEC)\n"
    "  --current <A>\n"
    "  --length <value>            native unit: m (IEC), ft (NEC)\n"
    "  --length-unit m|ft          converted to the native unit if different\n"
    "  --voltage <V>\n"
    "  --material copper|aluminum  (default copper)\n"
    "  --method single-conduit|multi-conduit|tray|direct-buried|free-air\n"
    "  --circuit single-phase|three-phase|dc   (default single-phase)\n"
    "  --ambient <C>               (default 30)\n"
    "  --conductors <n>            (default 3)\n"
    "  --rating 60|70|75|90        (default 75 NEC, 70 IEC)\n"
    "  --max-vdrop <percent>       (default 3.0)\n"
    "  --size <label>              check/vdrop only; e.g. 10, 1/0, \"250 kcmil\", 6mm2\n"
    "\n"
    "Engine:\n"
    "  --nec-extended-grouping     allow more than 40 NEC conductors (0.35)\n"
    "  --no-earth                  skip the earth conductor\n"
    "  --unprotected-earth         IEC PE minimum 4 mm²\n"
    "  --alternatives <n>          (default 3)\n"
    "\n"
    "Output:\n"
    "  --json                      JSON result on stdout\n"
    "  --out <path>                JSON result to a file\n"
    "  --log-level debug|info|warn|error\n";
}

bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  if (!a) return false;
  if (argc < 2) { *err = "missing command"; return false; }
  if (!parse_command(argv[1], &a->cmd)) { *err = std::string("unknown command: ") + argv[1]; return false; }

  bool rating_given = false;
  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    auto need = [&](const char* name) -> bool {
      if (!get_next(i, argc, argv, &v)) { *err = std::string(name) + " requires a value"; return false; }
      return true;
    };
    auto bad = [&](const char* name) -> bool {
      *err = std::string("invalid value for ") + name + ": " + v;
      return false;
    };

    if (std::strcmp(k, "--standard") == 0) {
      if (!need(k)) return false;
      if (!parse_standard(v, &a->input.standard)) return bad(k);
    } else if (std::strcmp(k, "--current") == 0) {
      if (!need(k)) return false;
      if (!parse_double(v, &a->input.current_a)) return bad(k);
    } else if (std::strcmp(k, "--length") == 0) {
      if (!need(k)) return false;
      if (!parse_double(v, &a->input.length.value)) return bad(k);
    } else if (std::strcmp(k, "--length-unit") == 0) {
      if (!need(k)) return false;
      if (std::strcmp(v, "m") == 0) a->length_unit = LengthUnit::Meters;
      else if (std::strcmp(v, "ft") == 0) a->length_unit = LengthUnit::Feet;
      else return bad(k);
    } else if (std::strcmp(k, "--voltage") == 0) {
      if (!need(k)) return false;
      if (!parse_double(v, &a->input.system_voltage_v)) return bad(k);
    } else if (std::strcmp(k, "--material") == 0) {
      if (!need(k)) return false;
      if (!parse_material(v, &a->input.material)) return bad(k);
    } else if (std::strcmp(k, "--method") == 0) {
      if (!need(k)) return false;
      InstallationMethod m{};
      if (!parse_installation_method(v, &m)) return bad(k);
      a->input.installation_method = m;
    } else if (std::strcmp(k, "--circuit") == 0) {
      if (!need(k)) return false;
      if (!parse_circuit_type(v, &a->input.circuit_type)) return bad(k);
    } else if (std::strcmp(k, "--ambient") == 0) {
      if (!need(k)) return false;
      if (!parse_double(v, &a->input.ambient_temperature_c)) return bad(k);
    } else if (std::strcmp(k, "--conductors") == 0) {
      if (!need(k)) return false;
      if (!parse_int(v, &a->input.conductor_count)) return bad(k);
    } else if (std::strcmp(k, "--rating") == 0) {
      if (!need(k)) return false;
      int c = 0;
      if (!parse_int(v, &c) || !parse_insulation_rating(c, &a->input.insulation_rating)) return bad(k);
      rating_given = true;
    } else if (std::strcmp(k, "--max-vdrop") == 0) {
      if (!need(k)) return false;
      double p = 0.0;
      if (!parse_double(v, &p)) return bad(k);
      a->input.max_voltage_drop_percent = p;
    } else if (std::strcmp(k, "--size") == 0) {
      if (!need(k)) return false;
      a->size_label = v;
    } else if (std::strcmp(k, "--nec-extended-grouping") == 0) {
      a->settings.derating.nec_extended_grouping = true;
    } else if (std::strcmp(k, "--no-earth") == 0) {
      a->settings.report.include_earth_conductor = false;
    } else if (std::strcmp(k, "--unprotected-earth") == 0) {
      a->settings.report.earth_mechanically_protected = false;
    } else if (std::strcmp(k, "--alternatives") == 0) {
      if (!need(k)) return false;
      int n = 0;
      if (!parse_int(v, &n) || n < 0) return bad(k);
      a->settings.report.max_alternatives = static_cast<std::size_t>(n);
    } else if (std::strcmp(k, "--json") == 0) {
      a->json = true;
    } else if (std::strcmp(k, "--out") == 0) {
      if (!need(k)) return false;
      a->out_path = v;
    } else if (std::strcmp(k, "--log-level") == 0) {
      if (!need(k)) return false;
      LogLevel lvl{};
      if (!parse_log_level(v, &lvl)) return bad(k);
      set_log_level(lvl);
    } else {
      *err = std::string("unknown option: ") + k;
      return false;
    }
  }

  if (!rating_given && a->input.standard == Standard::International) {
    a->input.insulation_rating = InsulationRating::C70;
  }

  const LengthUnit native = native_length_unit(a->input.standard);
  a->input.length.unit = a->length_unit.value_or(native);
  if (a->input.length.unit != native) {
    log(LogLevel::INFO, "converting length " + std::to_string(a->input.length.value) + " " +
                            to_string(a->input.length.unit) + " to " + to_string(native));
    a->input.length = normalize_length(a->input.length, a->input.standard);
  }

  if (a->cmd == Command::Size && !a->size_label.empty()) {
    *err = "--size names one size; use check or vdrop";
    return false;
  }
  if (!a->size_label.empty()) {
    a->input.explicit_size = find_size(a->input.standard, a->size_label);
    if (!a->input.explicit_size) {
      *err = "size " + a->size_label + " is not a " + to_string(a->input.standard) + " size";
      return false;
    }
  }
  if ((a->cmd == Command::Check || a->cmd == Command::VDrop) && !a->input.explicit_size) {
    *err = "--size is required for this command";
    return false;
  }
  return true;
}

} // namespace cable
