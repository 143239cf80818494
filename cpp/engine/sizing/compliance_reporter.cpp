#include "engine/sizing/compliance_reporter.hpp"

#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

#include "engine/standards/references.hpp"
#include "engine/standards/standard_tables.hpp"

namespace cable {
namespace {

std::string fmt(double v, int digits) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(digits) << v;
  return oss.str();
}

void add(std::vector<Warning>& out, WarningSeverity sev, const char* code, std::string msg) {
  out.push_back(Warning{sev, code, std::move(msg)});
}

std::string ampacity_shortfall(const CableSizingInput& in, const CandidateEvaluation& c) {
  return "ampacity " + fmt(c.ampacity.derated_a, 1) + " A derated < " + fmt(in.current_a, 1) + " A load";
}

std::string vdrop_excess(const CandidateEvaluation& c) {
  return "voltage drop " + fmt(c.voltage_drop.percent, 2) + "% > " +
         fmt(c.voltage_drop.limit_percent, 2) + "% limit";
}

std::string failing_constraints(const CableSizingInput& in, const CandidateEvaluation& c) {
  std::string s;
  if (!c.ampacity_ok) s += ampacity_shortfall(in, c);
  if (!c.voltage_ok) {
    if (!s.empty()) s += "; ";
    s += vdrop_excess(c);
  }
  return s;
}

} // namespace

std::vector<Warning> derating_advisories(const DeratingFactor& d, const DeratingSettings& settings) {
  std::vector<Warning> out;
  if (d.temperature_factor < settings.severe_factor) {
    add(out, WarningSeverity::Warning, "DERATING.SEVERE_TEMPERATURE",
        "Temperature correction factor " + fmt(d.temperature_factor, 2) +
            " severely reduces ampacity; consider a higher insulation rating or a cooler route");
  }
  if (d.grouping_factor < settings.severe_factor) {
    add(out, WarningSeverity::Warning, "DERATING.SEVERE_GROUPING",
        "Grouping factor " + fmt(d.grouping_factor, 2) +
            " severely reduces ampacity; consider separating circuits");
  }
  if (d.total_factor < settings.very_low_total_factor) {
    add(out, WarningSeverity::Warning, "DERATING.VERY_LOW_TOTAL",
        "Combined derating factor " + fmt(d.total_factor, 3) + " is very low");
  }
  return out;
}

CableSizingResult assemble_result(const CableSizingInput& input,
                                  const SelectionTrace& trace,
                                  const EngineSettings& settings) {
  const CandidateEvaluation& c = trace.chosen;

  CableSizingResult r;
  r.standard = input.standard;
  r.material = input.material;
  r.installation_method = trace.installation_method;

  r.recommended_size = c.size;
  r.designation = size_designation(c.size);
  r.resistance = c.resistance;

  r.voltage_drop = c.voltage_drop;
  r.ampacity = c.ampacity;
  r.derating = trace.derating;

  r.compliance.ampacity_ok = c.ampacity_ok;
  r.compliance.voltage_drop_ok = c.voltage_ok;
  r.compliance.fully = c.fully_compliant();

  r.ampacity_margin_a = c.ampacity.derated_a - input.current_a;
  r.voltage_drop_margin_percent = c.voltage_drop.limit_percent - c.voltage_drop.percent;

  r.search_exhausted = trace.search_exhausted;
  r.explicit_size_checked = trace.explicit_size_checked;

  for (const CandidateEvaluation& alt : trace.alternatives) {
    r.alternatives.push_back(AlternativeSize{alt.size, size_designation(alt.size),
                                             alt.ampacity.derated_a, alt.voltage_drop.percent});
  }
  r.earth_conductor = trace.earth_conductor;

  // ---- warnings ----
  auto& w = r.warnings;
  if (input.material == ConductorMaterial::Aluminum) {
    add(w, WarningSeverity::Info, "MATERIAL.ALUMINUM_COMPOUND",
        "Aluminum conductors require anti-oxidant compound and terminations rated for aluminum (AL/CU)");
  }

  if (trace.search_exhausted) {
    add(w, WarningSeverity::Danger, "SEARCH.EXHAUSTED",
        "Exceeds maximum conductor size for standard table; largest available size " + r.designation +
            " fails: " + failing_constraints(input, c) + ". Consider splitting circuit or parallel runs");
  }

  if (trace.explicit_size_checked) {
    if (!c.ampacity_ok) {
      add(w, WarningSeverity::Danger, "CHECK.AMPACITY_INSUFFICIENT",
          r.designation + " is undersized: " + ampacity_shortfall(input, c));
    }
    if (!c.voltage_ok) {
      add(w, WarningSeverity::Warning, "CHECK.VOLTAGE_DROP_EXCEEDED",
          r.designation + " exceeds the voltage drop limit: " + vdrop_excess(c));
    }
  }

  if (c.ampacity_ok && c.ampacity.utilization_percent > settings.report.high_utilization_percent) {
    add(w, WarningSeverity::Info, "AMPACITY.HIGH_UTILIZATION",
        "High utilization (" + fmt(c.ampacity.utilization_percent, 1) +
            "%) - consider the next size up for future load growth");
  }

  if (c.voltage_drop.is_dangerous) {
    add(w, WarningSeverity::Danger, "VDROP.DANGEROUS",
        "Voltage drop " + fmt(c.voltage_drop.percent, 2) +
            "% may cause equipment malfunction; increase the conductor size or shorten the run");
  }

  for (Warning& adv : derating_advisories(trace.derating, settings.derating)) {
    w.push_back(std::move(adv));
  }

  if (trace.earth_conductor && trace.earth_conductor->exceeds_table) {
    add(w, WarningSeverity::Warning, "EARTH.EXCEEDS_TABLE",
        "Overcurrent device rating " + fmt(trace.earth_conductor->ocpd_rating_a, 0) +
            " A exceeds NEC Table 250.122; the largest tabulated grounding conductor is shown");
  }

  r.standard_references = standard_references(input.standard, trace.installation_method,
                                              trace.earth_conductor.has_value());
  return r;
}

} // namespace cable
