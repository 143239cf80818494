#pragma once
/*
================================================================================
Core: Request Fingerprints
FILE: cpp/engine/core/hashing.hpp

Stable 64-bit fingerprints for the sizing cache. A request hashed in one
process must produce the same key in every other process, so:
  - std::hash is never used.
  - integers are fed as explicit little-endian bytes;
  - doubles are canonicalized first (-0.0 == +0.0, every NaN alike);
  - strings and optionals carry a length / presence marker so adjacent
    fields cannot alias.

Not cryptographic.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace cable {

struct Hash64 {
  uint64_t value = 0;

  constexpr bool operator==(const Hash64& o) const noexcept { return value == o.value; }
  constexpr bool operator!=(const Hash64& o) const noexcept { return value != o.value; }
};

class Fnv1a64 {
 public:
  static constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
  static constexpr uint64_t kPrime       = 1099511628211ull;

  uint64_t value() const noexcept { return h_; }

  void update_u64(uint64_t v);
  void update_i32(int32_t v) { update_u64(static_cast<uint64_t>(static_cast<uint32_t>(v))); }
  void update_bool(bool b) { mix(b ? 1u : 0u); }
  void update_f64(double x);
  void update_string(std::string_view s);

  // Enum fields hash by their underlying value.
  template <class E>
  void update_enum(E e) {
    static_assert(std::is_enum_v<E>, "update_enum needs an enum");
    update_u64(static_cast<uint64_t>(static_cast<std::underlying_type_t<E>>(e)));
  }

  // Presence byte, then the value when set.
  void update_optional_f64(const std::optional<double>& x) {
    update_bool(x.has_value());
    if (x) update_f64(*x);
  }

  // Record layout tag. Change the tag whenever the hashed field list changes.
  void add_tag(std::string_view tag);

 private:
  void mix(uint8_t byte) noexcept {
    h_ ^= static_cast<uint64_t>(byte);
    h_ *= kPrime;
  }

  uint64_t h_ = kOffsetBasis;
};

// Order sensitive: hash_combine(a, b) != hash_combine(b, a).
Hash64 hash_combine(Hash64 a, Hash64 b);

// 16 lowercase hex digits, most significant first.
std::string hash_to_hex(Hash64 h);

} // namespace cable
