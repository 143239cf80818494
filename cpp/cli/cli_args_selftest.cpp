/*
  CLI Argument Selftest

  Command dispatch and the --size rules:
    size  --size X   => rejected (the search never narrows to one size)
    check --size X   => explicit size set
    check            => rejected (--size required)

  Non-zero return code indicates failure.
*/

#include <string>
#include <vector>

#include "cli/cli_args.hpp"
#include "engine/core/selftest.hpp"

namespace cable {
namespace {

using namespace selftest;

// argv[0] is supplied here.
bool parse(std::vector<std::string> words, Args* a, std::string* err) {
  words.insert(words.begin(), "cable_cli");
  std::vector<char*> argv;
  for (std::string& w : words) argv.push_back(w.data());
  argv.push_back(nullptr);
  return parse_args(static_cast<int>(words.size()), argv.data(), a, err);
}

const std::vector<std::string> kRequest = {"--current", "30", "--length", "100", "--voltage", "120"};

std::vector<std::string> with_request(std::vector<std::string> head, const std::vector<std::string>& tail) {
  head.insert(head.end(), kRequest.begin(), kRequest.end());
  head.insert(head.end(), tail.begin(), tail.end());
  return head;
}

void test_size_option() {
  {
    Args a;
    std::string err;
    expect_true(parse(with_request({"size"}, {}), &a, &err), "size without --size parses");
    expect_true(a.cmd == Command::Size && !a.input.explicit_size, "size searches");
  }
  {
    Args a;
    std::string err;
    expect_true(!parse(with_request({"size"}, {"--size", "10"}), &a, &err), "size rejects --size");
    expect_true(err.find("--size") != std::string::npos, "error names the option");
  }
  {
    Args a;
    std::string err;
    expect_true(parse(with_request({"check"}, {"--size", "10"}), &a, &err), "check with --size parses");
    expect_true(a.input.explicit_size && a.input.explicit_size->index == 2, "10 AWG is index 2");
  }
  {
    Args a;
    std::string err;
    expect_true(parse(with_request({"vdrop"}, {"--size", "1/0"}), &a, &err), "vdrop with --size parses");
    expect_true(a.cmd == Command::VDrop && a.input.explicit_size, "vdrop carries the size");
  }
  {
    Args a;
    std::string err;
    expect_true(!parse(with_request({"check"}, {}), &a, &err), "check without --size is rejected");
    expect_eq_str(err, "--size is required for this command", "missing size message");
  }
  {
    Args a;
    std::string err;
    expect_true(!parse(with_request({"check"}, {"--size", "6mm2"}), &a, &err), "IEC label under NEC");
  }
}

void test_request() {
  Args a;
  std::string err;
  const bool ok = parse({"size", "--standard", "IEC", "--current", "50", "--length", "328.084", "--length-unit",
                         "ft", "--voltage", "400", "--circuit", "three-phase"},
                        &a, &err);
  expect_true(ok, "IEC request parses");
  expect_true(a.input.standard == Standard::International, "standard");
  expect_true(a.input.insulation_rating == InsulationRating::C70, "IEC default rating is 70 C");
  expect_true(a.input.length.unit == LengthUnit::Meters, "length converted to meters");
  expect_near(a.input.length.value, 100.0, 1e-3, "328.084 ft is 100 m");

  Args b;
  expect_true(!parse({"size", "--current"}, &b, &err), "missing value");
  expect_eq_str(err, "--current requires a value", "missing value message");
  expect_true(!parse({"size", "--bogus"}, &b, &err), "unknown option");
  expect_true(!parse({"resize"}, &b, &err), "unknown command");

  Args h;
  expect_true(parse({"help"}, &h, &err) && h.cmd == Command::Help, "help");
}

} // namespace
} // namespace cable

int main() {
  cable::test_size_option();
  cable::test_request();
  return cable::selftest::exit_code();
}
