#include "engine/core/cache_key.hpp"

namespace cable {

Hash64 hash_settings(const EngineSettings& s) {
  s.validate_or_throw();

  Fnv1a64 h;
  h.add_tag("EngineSettings/v1");

  h.add_tag("VoltageDrop");
  h.update_f64(s.vdrop.default_max_percent);
  h.update_f64(s.vdrop.danger_percent);

  h.add_tag("Derating");
  h.update_bool(s.derating.nec_extended_grouping);
  h.update_enum(s.derating.default_iec_method);
  h.update_f64(s.derating.severe_factor);
  h.update_f64(s.derating.very_low_total_factor);

  h.add_tag("Report");
  h.update_f64(s.report.high_utilization_percent);
  h.update_u64(static_cast<uint64_t>(s.report.max_alternatives));
  h.update_bool(s.report.include_earth_conductor);
  h.update_bool(s.report.earth_mechanically_protected);

  return Hash64{h.value()};
}

std::string CacheKey::calc_id() const {
  return std::string("i_") + input_hex() +
         "__s_" + settings_hex() +
         "__c_" + combined_hex();
}

CacheKey make_cache_key(Hash64 input_h, const EngineSettings& s) {
  CacheKey k;
  k.input_h = input_h;
  k.settings_h = hash_settings(s);
  k.combined_h = hash_combine(k.input_h, k.settings_h);
  return k;
}

}  // namespace cable
