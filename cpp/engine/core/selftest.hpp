#pragma once
/*
================================================================================
Core: Selftest Helpers
FILE: cpp/engine/core/selftest.hpp

Framework-free expectations shared by the *_selftest executables.
  - Each expectation prints "[ OK ] msg" or "[FAIL] msg" to stderr.
  - main() returns selftest::exit_code(): non-zero if anything failed.
================================================================================
*/

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

namespace cable::selftest {

inline int& fail_count() {
  static int g_fail_count = 0;
  return g_fail_count;
}

inline void fail(std::string_view msg) {
  ++fail_count();
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

inline bool near(double a, double b, double rel = 1e-9, double abs = 1e-12) noexcept {
  const double da = std::fabs(a - b);
  if (da <= abs) return true;
  const double sc = std::max({std::fabs(a), std::fabs(b), abs});
  return da / sc <= rel;
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

inline void expect_near(double got, double exp, double tol, std::string_view msg) {
  if (!(std::fabs(got - exp) <= tol)) {
    fail(msg);
    std::cerr << "  got: " << got << "  expected: " << exp << "  tol: " << tol << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

// Passes only if fn throws exactly an E (or subclass).
template <class E, class Fn>
void expect_throws(Fn&& fn, std::string_view msg) {
  try {
    fn();
  } catch (const E&) {
    pass(msg);
    return;
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  unexpected exception: " << e.what() << "\n";
    return;
  }
  fail(msg);
  std::cerr << "  no exception thrown\n";
}

template <class Fn>
void expect_no_throw(Fn&& fn, std::string_view msg) {
  try {
    fn();
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  exception: " << e.what() << "\n";
    return;
  }
  pass(msg);
}

inline int exit_code() {
  if (fail_count() != 0) {
    std::cerr << "\n" << fail_count() << " check(s) failed\n";
    return 1;
  }
  std::cerr << "\nall checks passed\n";
  return 0;
}

} // namespace cable::selftest
