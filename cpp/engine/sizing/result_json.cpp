#include "engine/sizing/result_json.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string_view>
#include <vector>

#include "engine/standards/standard_tables.hpp"

namespace cable {
namespace {

// Two-character escape for c, or nullptr.
const char* short_escape(char c) noexcept {
  switch (c) {
    case '"':  return "\\\"";
    case '\\': return "\\\\";
    case '\b': return "\\b";
    case '\f': return "\\f";
    case '\n': return "\\n";
    case '\r': return "\\r";
    case '\t': return "\\t";
    default:   return nullptr;
  }
}

void write_quoted(std::ostream& os, std::string_view s) {
  constexpr char kHex[] = "0123456789abcdef";
  os << '"';
  for (char c : s) {
    const auto u = static_cast<unsigned char>(c);
    if (const char* esc = short_escape(c)) {
      os << esc;
    } else if (u < 0x20) {
      os << "\\u00" << kHex[u >> 4] << kHex[u & 0xF];
    } else {
      os << c;
    }
  }
  os << '"';
}

// Pretty-printing writer. Each container remembers whether it has written an
// element yet, so callers never place separators themselves.
class JsonWriter {
 public:
  explicit JsonWriter(int indent) : indent_(std::max(0, indent)) {
    out_.setf(std::ios::fixed);
    out_.precision(6);
  }

  void begin_object() { open('{'); }
  void begin_array() { open('['); }

  void end() {
    const char close = closers_.back();
    closers_.pop_back();
    first_.pop_back();
    newline();
    out_ << close;
  }

  JsonWriter& key(std::string_view k) {
    element();
    write_quoted(out_, k);
    out_ << ": ";
    after_key_ = true;
    return *this;
  }

  void text(std::string_view v) { element(); write_quoted(out_, v); }
  void flag(bool v) { element(); out_ << (v ? "true" : "false"); }
  void integer(int v) { element(); out_ << v; }
  void number(double v) {
    element();
    if (std::isfinite(v)) out_ << v;
    else out_ << "null";
  }
  void null() { element(); out_ << "null"; }

  std::string finish() {
    out_ << '\n';
    return out_.str();
  }

 private:
  void open(char c) {
    element();
    out_ << c;
    closers_.push_back(c == '{' ? '}' : ']');
    first_.push_back(true);
  }

  // Separator and indentation before an element, unless it follows a key.
  void element() {
    if (after_key_) {
      after_key_ = false;
      return;
    }
    if (first_.empty()) return;
    if (!first_.back()) out_ << ',';
    first_.back() = false;
    newline();
  }

  void newline() {
    out_ << '\n' << std::string(first_.size() * static_cast<size_t>(indent_), ' ');
  }

  std::ostringstream out_;
  int indent_;
  std::vector<char> closers_;
  std::vector<bool> first_;
  bool after_key_ = false;
};

void write_size(JsonWriter& w, ConductorSize size, const std::string& designation) {
  w.begin_object();
  w.key("designation").text(designation);
  w.key("index").integer(size.index);
  w.end();
}

void write_earth(JsonWriter& w, const EarthConductor& ec) {
  w.begin_object();
  w.key("designation").text(ec.designation);
  if (ec.size) w.key("index").integer(ec.size->index);
  else w.key("index").null();
  w.key("areaMm2").number(ec.area_mm2);
  w.key("ocpdRatingAmps").number(ec.ocpd_rating_a);
  w.key("exceedsTable").flag(ec.exceeds_table);
  w.key("limitedToPhaseConductor").flag(ec.limited_to_phase);
  w.key("standardReference").text(ec.standard_reference);
  w.end();
}

} // namespace

std::string result_to_json(const CableSizingResult& r, int indent_spaces) {
  JsonWriter w(indent_spaces);
  w.begin_object();

  w.key("standard").text(to_string(r.standard));
  w.key("material").text(to_string(r.material));
  w.key("installationMethod").text(to_string(r.installation_method));

  w.key("recommendedSize");
  write_size(w, r.recommended_size, r.designation);
  w.key("resistance").number(r.resistance);
  w.key("resistanceUnit").text(resistance_unit(r.standard));

  w.key("voltageDrop").begin_object();
  w.key("volts").number(r.voltage_drop.volts);
  w.key("percent").number(r.voltage_drop.percent);
  w.key("limitPercent").number(r.voltage_drop.limit_percent);
  w.key("isViolation").flag(r.voltage_drop.is_violation);
  w.key("isDangerous").flag(r.voltage_drop.is_dangerous);
  w.end();

  w.key("ampacity").begin_object();
  w.key("base").number(r.ampacity.base_a);
  w.key("derated").number(r.ampacity.derated_a);
  w.key("utilizationPercent").number(r.ampacity.utilization_percent);
  w.end();

  w.key("deratingFactors").begin_object();
  w.key("temperatureFactor").number(r.derating.temperature_factor);
  w.key("groupingFactor").number(r.derating.grouping_factor);
  w.key("totalFactor").number(r.derating.total_factor);
  w.key("standardReference").text(r.derating.standard_reference);
  w.end();

  w.key("compliance").begin_object();
  w.key("isVoltageDropCompliant").flag(r.compliance.voltage_drop_ok);
  w.key("isAmpacityCompliant").flag(r.compliance.ampacity_ok);
  w.key("isFullyCompliant").flag(r.compliance.fully);
  w.end();

  w.key("margins").begin_object();
  w.key("ampacityAmps").number(r.ampacity_margin_a);
  w.key("voltageDropPercent").number(r.voltage_drop_margin_percent);
  w.end();

  w.key("searchExhausted").flag(r.search_exhausted);
  w.key("explicitSizeChecked").flag(r.explicit_size_checked);

  w.key("alternatives").begin_array();
  for (const AlternativeSize& a : r.alternatives) {
    w.begin_object();
    w.key("designation").text(a.designation);
    w.key("index").integer(a.size.index);
    w.key("deratedAmpacity").number(a.derated_ampacity_a);
    w.key("voltageDropPercent").number(a.voltage_drop_percent);
    w.end();
  }
  w.end();

  w.key("earthConductor");
  if (r.earth_conductor) write_earth(w, *r.earth_conductor);
  else w.null();

  w.key("warnings").begin_array();
  for (const Warning& warn : r.warnings) {
    w.begin_object();
    w.key("severity").text(to_string(warn.severity));
    w.key("code").text(warn.code);
    w.key("message").text(warn.message);
    w.end();
  }
  w.end();

  w.key("standardReferences").begin_array();
  for (const std::string& ref : r.standard_references) w.text(ref);
  w.end();

  w.end();
  return w.finish();
}

bool write_result_json_file(const CableSizingResult& r,
                            const std::string& file_path,
                            int indent_spaces) {
  std::ofstream f(file_path, std::ios::out | std::ios::trunc);
  if (!f.is_open()) return false;
  f << result_to_json(r, indent_spaces);
  f.close();
  return !f.fail();
}

} // namespace cable
