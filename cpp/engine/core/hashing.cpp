#include "engine/core/hashing.hpp"

#include <bit>
#include <cmath>

namespace cable {
namespace {

constexpr uint64_t kQuietNaNBits = 0x7ff8000000000000ull;
constexpr uint8_t kTagSeparator = 0x1F;

uint64_t canonical_bits(double v) {
  if (std::isnan(v)) return kQuietNaNBits;
  if (v == 0.0) return 0;
  return std::bit_cast<uint64_t>(v);
}

} // namespace

void Fnv1a64::update_u64(uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    mix(static_cast<uint8_t>(v >> (8 * i)));
  }
}

void Fnv1a64::update_f64(double x) {
  update_u64(canonical_bits(x));
}

void Fnv1a64::update_string(std::string_view s) {
  update_u64(static_cast<uint64_t>(s.size()));
  for (char c : s) mix(static_cast<uint8_t>(c));
}

void Fnv1a64::add_tag(std::string_view tag) {
  update_string(tag);
  mix(kTagSeparator);
}

Hash64 hash_combine(Hash64 a, Hash64 b) {
  uint64_t x = a.value ^ (b.value + 0x9e3779b97f4a7c15ull + (a.value << 6) + (a.value >> 2));
  // splitmix64 finalizer
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
  return Hash64{x ^ (x >> 31)};
}

std::string hash_to_hex(Hash64 h) {
  constexpr char kDigits[] = "0123456789abcdef";
  std::string out(16, '0');
  uint64_t v = h.value;
  for (int i = 15; i >= 0; --i, v >>= 4) {
    out[static_cast<size_t>(i)] = kDigits[v & 0xF];
  }
  return out;
}

} // namespace cable
