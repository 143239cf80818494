/*
  Core Selftest

  Framework-free checks for the ambient layer:
    1) Error types carry code + throw site; what() format is stable.
    2) Hashing is deterministic and canonicalizes -0.0 / NaN.
    3) Settings validation rejects nonsense; settings changes change the key.
    4) Length conversion and log level parsing.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <limits>
#include <string>

#include "engine/core/cache_key.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/units.hpp"

namespace cable {
namespace {

using namespace selftest;

void test_errors() {
  const LookupError e("no row", ErrorSite{"tables.cpp", "lookup", 12});
  expect_eq_str(e.what(), "[cable::Error code=Lookup(1)] no row @ tables.cpp:12 (lookup)",
                "LookupError what() carries code and site");
  expect_true(e.code() == ErrorCode::kLookup, "LookupError code is kLookup");
  expect_eq_str(e.message(), "no row", "message() is the bare message");

  const ValidationError bare("bad input");
  expect_eq_str(bare.what(), "[cable::Error code=InvalidArgument(2)] bad input",
                "error without a site omits the location");

  expect_throws<ValidationError>([] { CABLE_REQUIRE(false, ErrorCode::kUnitMismatch, "ft vs m"); },
                                 "CABLE_REQUIRE throws ValidationError");
  try {
    CABLE_REQUIRE(1 > 2, ErrorCode::kUnitMismatch, "ft vs m");
  } catch (const ValidationError& ve) {
    expect_true(ve.code() == ErrorCode::kUnitMismatch, "CABLE_REQUIRE keeps the given code");
    expect_true(ve.where().line > 0, "CABLE_REQUIRE records the line");
  }
  expect_no_throw([] { CABLE_REQUIRE(true, ErrorCode::kInvalidArgument, "unused"); },
                  "CABLE_REQUIRE passes when the expression holds");
  expect_throws<LookupError>([] { CABLE_THROW_LOOKUP("missing"); }, "CABLE_THROW_LOOKUP throws LookupError");
  expect_throws<CableError>([] { throw IOError("disk"); }, "IOError is a CableError");
}

void test_hashing() {
  Fnv1a64 empty;
  expect_true(empty.value() == Fnv1a64::kOffsetBasis, "empty FNV state is the offset basis");

  Fnv1a64 a, b;
  a.update_f64(0.0);
  b.update_f64(-0.0);
  expect_true(a.value() == b.value(), "-0.0 hashes like +0.0");

  Fnv1a64 n1, n2;
  n1.update_f64(std::numeric_limits<double>::quiet_NaN());
  n2.update_f64(-std::numeric_limits<double>::quiet_NaN());
  expect_true(n1.value() == n2.value(), "all NaNs hash alike");

  Fnv1a64 s1, s2;
  s1.update_string("ab");
  s1.update_string("c");
  s2.update_string("a");
  s2.update_string("bc");
  expect_true(s1.value() != s2.value(), "strings are length-delimited");

  expect_eq_str(hash_to_hex(Hash64{0x1}), "0000000000000001", "hex is zero padded");
  expect_eq_str(hash_to_hex(Hash64{0xfedcba9876543210ull}), "fedcba9876543210", "hex is msb first");

  const Hash64 c1 = hash_combine(Hash64{1}, Hash64{2});
  const Hash64 c2 = hash_combine(Hash64{2}, Hash64{1});
  expect_true(c1 != c2, "hash_combine is order sensitive");
  expect_true(c1 == hash_combine(Hash64{1}, Hash64{2}), "hash_combine is deterministic");
}

void test_settings() {
  const EngineSettings d = EngineSettings::defaults();
  expect_no_throw([&] { d.validate_or_throw(); }, "default settings validate");
  expect_near(d.vdrop.default_max_percent, 3.0, 0.0, "default voltage drop limit is 3%");
  expect_near(d.report.high_utilization_percent, 80.0, 0.0, "default utilization threshold is 80%");
  expect_true(!d.derating.nec_extended_grouping, "extended NEC grouping is off by default");

  EngineSettings bad = d;
  bad.vdrop.danger_percent = 1.0;
  expect_throws<ValidationError>([&] { bad.validate_or_throw(); }, "danger below limit is rejected");

  bad = d;
  bad.report.high_utilization_percent = 0.0;
  expect_throws<ValidationError>([&] { bad.validate_or_throw(); }, "zero utilization threshold is rejected");

  bad = d;
  bad.derating.severe_factor = 1.5;
  expect_throws<ValidationError>([&] { bad.validate_or_throw(); }, "severe_factor above 1 is rejected");

  EngineSettings changed = d;
  changed.derating.nec_extended_grouping = true;
  expect_true(hash_settings(d) != hash_settings(changed), "settings change alters the fingerprint");
  expect_true(hash_settings(d) == hash_settings(EngineSettings::defaults()), "settings fingerprint is stable");

  const CacheKey k = make_cache_key(Hash64{42}, d);
  expect_true(k.calc_id().rfind("i_000000000000002a__s_", 0) == 0, "calc_id starts with the input hash");
  expect_true(k.calc_id().size() == 2 + 16 + 4 + 16 + 4 + 16, "calc_id has fixed width");
}

void test_units_and_logging() {
  expect_near(units::convert(100.0, LengthUnit::Feet, LengthUnit::Meters), 30.48, 1e-12, "100 ft is 30.48 m");
  expect_near(units::convert(30.48, LengthUnit::Meters, LengthUnit::Feet), 100.0, 1e-9, "30.48 m is 100 ft");
  expect_true(units::to_unit(Length::meters(5.0), LengthUnit::Meters) == Length::meters(5.0),
              "same-unit conversion is identity");
  expect_near(units::sqrt3 * units::sqrt3, 3.0, 1e-12, "sqrt3 squared is 3");

  LogLevel lvl = LogLevel::INFO;
  expect_true(parse_log_level("debug", &lvl) && lvl == LogLevel::DEBUG, "parse debug");
  expect_true(!parse_log_level("verbose", &lvl), "unknown level rejected");

  const LogLevel prev = get_log_level();
  set_log_level(LogLevel::WARN);
  expect_true(!log_enabled(LogLevel::INFO) && log_enabled(LogLevel::ERROR), "level filter applies");
  set_log_level(prev);
}

} // namespace
} // namespace cable

int main() {
  cable::test_errors();
  cable::test_hashing();
  cable::test_settings();
  cable::test_units_and_logging();
  return cable::selftest::exit_code();
}
