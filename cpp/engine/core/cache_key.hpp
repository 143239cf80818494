#pragma once
/*
================================================================================
Core: Deterministic Cache Keys
FILE: cpp/engine/core/cache_key.hpp

Purpose:
  - Reproducible keys for the calculation cache: a request fingerprint
    (computed by the sizing layer from every CableSizingInput field) combined
    with the EngineSettings fingerprint.
  - Stable string ids for logs and persisted records.

Hardening:
  - All fields hashed in a fixed order behind schema tags.
  - Floats via canonical bit patterns (Fnv1a64::update_f64).
================================================================================
*/

#include <string>

#include "engine/core/hashing.hpp"
#include "engine/core/settings.hpp"

namespace cable {

struct CacheKey {
  Hash64 input_h{};
  Hash64 settings_h{};
  Hash64 combined_h{};

  std::string input_hex() const { return hash_to_hex(input_h); }
  std::string settings_hex() const { return hash_to_hex(settings_h); }
  std::string combined_hex() const { return hash_to_hex(combined_h); }

  // Format: i_<16>__s_<16>__c_<16>
  std::string calc_id() const;

  bool operator==(const CacheKey& o) const noexcept {
    return input_h == o.input_h && settings_h == o.settings_h && combined_h == o.combined_h;
  }
};

// Validates first so nonsensical settings never enter a cache.
Hash64 hash_settings(const EngineSettings& s);

CacheKey make_cache_key(Hash64 input_h, const EngineSettings& s);

}  // namespace cable
