#pragma once
/*
================================================================================
Sizing: Calculation Cache
FILE: cpp/engine/sizing/sizing_cache.hpp

Caller-side memoization of select_conductor().
  - Key: FNV-1a fingerprint of EVERY CableSizingInput field (standard and
    optional-field presence included) combined with the EngineSettings
    fingerprint. Two standards never share a key.
  - Bounded memory via LRU eviction.
  - One mutex around the list/map; the engine call on a miss runs unlocked.
  - Only successful results are cached. A LookupError / ValidationError
    from the engine propagates and nothing is stored.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "engine/core/cache_key.hpp"
#include "engine/core/settings.hpp"
#include "engine/sizing/sizing_types.hpp"

namespace cable {

Hash64 hash_input(const CableSizingInput& input);

CacheKey make_sizing_key(const CableSizingInput& input, const EngineSettings& settings);

struct CacheStats final {
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
  std::uint64_t inserts = 0;
  std::uint64_t evictions = 0;
};

class SizingCache final {
 public:
  explicit SizingCache(std::size_t max_entries = 1024);

  void set_max_entries(std::size_t n);
  std::size_t max_entries() const;
  std::size_t size() const;

  void clear();
  CacheStats stats() const;

  std::optional<CableSizingResult> get(const CacheKey& key);
  void put(const CacheKey& key, CableSizingResult value);

  // Returns the cached result or runs select_conductor() and stores it.
  CableSizingResult get_or_compute(const CableSizingInput& input, const EngineSettings& settings);

 private:
  struct KeyHash final {
    std::size_t operator()(const CacheKey& k) const noexcept {
      return static_cast<std::size_t>(k.combined_h.value);
    }
  };

  struct Node final {
    CacheKey key{};
    CableSizingResult value{};
  };

  using List = std::list<Node>;

  mutable std::mutex mtx_;
  std::size_t max_entries_ = 1024;
  CacheStats stats_{};

  List lru_;
  std::unordered_map<CacheKey, List::iterator, KeyHash> map_;
};

} // namespace cable
