#include "engine/sizing/conductor_selector.hpp"

#include <utility>

#include "engine/core/logging.hpp"
#include "engine/sizing/ampacity_resolver.hpp"
#include "engine/sizing/compliance_reporter.hpp"
#include "engine/sizing/derating_composer.hpp"
#include "engine/sizing/earth_conductor.hpp"
#include "engine/sizing/voltage_drop.hpp"
#include "engine/standards/standard_tables.hpp"

namespace cable {
namespace {

double voltage_limit(const CableSizingInput& input, const EngineSettings& settings) {
  return input.max_voltage_drop_percent.value_or(settings.vdrop.default_max_percent);
}

void attach_earth_conductor(const CableSizingInput& input,
                            const EngineSettings& settings,
                            SelectionTrace& trace) {
  if (settings.report.include_earth_conductor) {
    trace.earth_conductor = size_earth_conductor(input, trace.chosen.size, settings.report);
  }
}

} // namespace

CandidateEvaluation evaluate_candidate(const CableSizingInput& input,
                                       const DeratingFactor& derating,
                                       ConductorSize size,
                                       const EngineSettings& settings) {
  const ResolvedConductor rc =
      resolve_ampacity(input.standard, input.material, input.insulation_rating, size);

  CandidateEvaluation ev;
  ev.size = size;
  ev.resistance = rc.resistance;

  ev.ampacity.base_a = rc.base_ampacity_a;
  ev.ampacity.derated_a = rc.base_ampacity_a * derating.total_factor;
  ev.ampacity.utilization_percent = 100.0 * input.current_a / ev.ampacity.derated_a;
  ev.ampacity_ok = ev.ampacity.derated_a >= input.current_a;

  const VoltageDrop vd = compute_voltage_drop_with_resistance(
      input.current_a, input.length, rc.resistance, input.circuit_type, input.standard,
      input.system_voltage_v);

  ev.voltage_drop.volts = vd.volts;
  ev.voltage_drop.percent = vd.percent.value_or(0.0);
  ev.voltage_drop.limit_percent = voltage_limit(input, settings);
  ev.voltage_drop.is_violation =
      exceeds_voltage_drop_limit(ev.voltage_drop.percent, ev.voltage_drop.limit_percent);
  ev.voltage_drop.is_dangerous = ev.voltage_drop.percent > settings.vdrop.danger_percent;
  ev.voltage_ok = !ev.voltage_drop.is_violation;
  return ev;
}

CableSizingResult select_conductor(const CableSizingInput& input, const EngineSettings& settings) {
  settings.validate_or_throw();
  require_native_length(input.standard, input.length);

  SelectionTrace trace;
  trace.installation_method = input.installation_method.value_or(settings.derating.default_iec_method);
  trace.derating = compose_derating(input.standard, input.ambient_temperature_c,
                                    input.insulation_rating, input.conductor_count,
                                    input.installation_method, settings.derating);

  if (input.explicit_size) {
    trace.chosen = evaluate_candidate(input, trace.derating, *input.explicit_size, settings);
    trace.explicit_size_checked = true;
    attach_earth_conductor(input, settings, trace);
    return assemble_result(input, trace, settings);
  }

  std::optional<CandidateEvaluation> found;
  std::optional<CandidateEvaluation> last_resolved;

  const int n = size_count(input.standard);
  for (int i = 0; i < n; ++i) {
    const ConductorSize size{input.standard, i};
    CandidateEvaluation ev;
    try {
      ev = evaluate_candidate(input, trace.derating, size, settings);
    } catch (const LookupError& e) {
      if (log_enabled(LogLevel::DEBUG)) {
        log(LogLevel::DEBUG, "selector: skipping " + size_designation(size) + ": " + e.message());
      }
      continue;
    }
    last_resolved = ev;

    if (!found) {
      if (ev.fully_compliant()) found = ev;
      continue;
    }
    if (trace.alternatives.size() >= settings.report.max_alternatives) break;
    if (ev.fully_compliant()) trace.alternatives.push_back(ev);
  }

  if (found) {
    trace.chosen = *found;
  } else {
    if (!last_resolved) {
      CABLE_THROW_LOOKUP(std::string("no ") + to_string(input.standard) + " " +
                         to_string(input.material) + " size resolves at " +
                         std::to_string(rating_celsius(input.insulation_rating)) + " C insulation");
    }
    trace.chosen = *last_resolved;
    trace.search_exhausted = true;
    log(LogLevel::INFO, "selector: no " + std::string(to_string(input.standard)) +
                            " size satisfies both constraints; reporting " +
                            size_designation(trace.chosen.size) + " as non-compliant");
  }

  attach_earth_conductor(input, settings, trace);
  return assemble_result(input, trace, settings);
}

SelectionOutcome try_select_conductor(const CableSizingInput& input, const EngineSettings& settings) {
  SelectionOutcome out;
  try {
    out.result = select_conductor(input, settings);
  } catch (const LookupError& e) {
    out.code = e.code();
    out.message = e.message();
  } catch (const ValidationError& e) {
    out.code = e.code();
    out.message = e.message();
  }
  return out;
}

} // namespace cable
