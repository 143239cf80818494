#include "engine/sizing/sizing_cache.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "engine/core/logging.hpp"
#include "engine/sizing/conductor_selector.hpp"

namespace cable {

Hash64 hash_input(const CableSizingInput& in) {
  Fnv1a64 h;
  h.add_tag("CableSizingInput/v1");

  h.update_enum(in.standard);
  h.update_f64(in.current_a);
  h.update_f64(in.length.value);
  h.update_enum(in.length.unit);
  h.update_f64(in.system_voltage_v);
  h.update_enum(in.material);

  h.update_bool(in.installation_method.has_value());
  if (in.installation_method) h.update_enum(*in.installation_method);

  h.update_enum(in.circuit_type);
  h.update_f64(in.ambient_temperature_c);
  h.update_i32(in.conductor_count);
  h.update_enum(in.insulation_rating);

  h.update_optional_f64(in.max_voltage_drop_percent);

  h.update_bool(in.explicit_size.has_value());
  if (in.explicit_size) {
    h.update_enum(in.explicit_size->standard);
    h.update_i32(in.explicit_size->index);
  }
  return Hash64{h.value()};
}

CacheKey make_sizing_key(const CableSizingInput& input, const EngineSettings& settings) {
  return make_cache_key(hash_input(input), settings);
}

SizingCache::SizingCache(std::size_t max_entries) : max_entries_(std::max<std::size_t>(1, max_entries)) {}

void SizingCache::set_max_entries(std::size_t n) {
  std::lock_guard<std::mutex> lk(mtx_);
  max_entries_ = std::max<std::size_t>(1, n);
  while (lru_.size() > max_entries_) {
    map_.erase(lru_.back().key);
    lru_.pop_back();
    ++stats_.evictions;
  }
}

std::size_t SizingCache::max_entries() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return max_entries_;
}

std::size_t SizingCache::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return lru_.size();
}

void SizingCache::clear() {
  std::lock_guard<std::mutex> lk(mtx_);
  lru_.clear();
  map_.clear();
  stats_ = CacheStats{};
}

CacheStats SizingCache::stats() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return stats_;
}

std::optional<CableSizingResult> SizingCache::get(const CacheKey& key) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = map_.find(key);
  if (it == map_.end()) {
    ++stats_.misses;
    return std::nullopt;
  }
  lru_.splice(lru_.begin(), lru_, it->second);
  ++stats_.hits;
  return it->second->value;
}

void SizingCache::put(const CacheKey& key, CableSizingResult value) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = map_.find(key);
  if (it != map_.end()) {
    it->second->value = std::move(value);
    lru_.splice(lru_.begin(), lru_, it->second);
    return;
  }

  lru_.push_front(Node{key, std::move(value)});
  map_[key] = lru_.begin();
  ++stats_.inserts;

  while (lru_.size() > max_entries_) {
    auto last_it = std::prev(lru_.end());
    map_.erase(last_it->key);
    lru_.pop_back();
    ++stats_.evictions;
  }
}

CableSizingResult SizingCache::get_or_compute(const CableSizingInput& input, const EngineSettings& settings) {
  const CacheKey key = make_sizing_key(input, settings);
  if (auto hit = get(key)) return std::move(*hit);

  CableSizingResult r = select_conductor(input, settings);
  if (log_enabled(LogLevel::DEBUG)) {
    log(LogLevel::DEBUG, "sizing_cache: stored " + key.calc_id());
  }
  put(key, r);
  return r;
}

} // namespace cable
