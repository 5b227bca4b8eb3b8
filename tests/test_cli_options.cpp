#include "cli_options.h"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace gup;

namespace {

bool parse(std::vector<std::string> args, CliOptions& opt, std::string& err) {
  std::vector<char*> argv;
  static std::string prog = "guardupload";
  argv.push_back(&prog[0]);
  for (auto& a : args) argv.push_back(&a[0]);
  return parseArgs((int)argv.size(), argv.data(), opt, err);
}

void TestScanFlags() {
  CliOptions opt;
  std::string err;
  assert(parse({"scan", "a.pdf", "dir", "--policy", "p.yaml", "--policy-override", "o.yaml",
                "--json", "out.ndjson", "--fail-on", "warn", "--timeout", "2500", "--jobs", "3",
                "--log-level", "debug"}, opt, err));
  assert(opt.command == "scan");
  assert((opt.paths == std::vector<std::string>{"a.pdf", "dir"}));
  assert(opt.policyPath == "p.yaml" && opt.overridePath == "o.yaml");
  assert(opt.jsonPath == "out.ndjson");
  assert(opt.failOn && *opt.failOn == FailOn::Warn);
  assert(opt.timeoutMs && *opt.timeoutMs == 2500);
  assert(opt.jobs == 3);
  assert(opt.logLevel == LogLevel::Debug);
}

void TestDefaultsAndErrors() {
  CliOptions opt;
  std::string err;
  assert(parse({"scan", "x"}, opt, err));
  assert(opt.jobs >= 1 && "jobs default to the hardware");

  CliOptions a;
  assert(!parse({"scan"}, a, err) && err.find("no paths") != std::string::npos);
  CliOptions b;
  assert(!parse({"scan", "x", "--fail-on", "sometimes"}, b, err));
  CliOptions c;
  assert(!parse({"scan", "x", "--timeout", "0"}, c, err));
  CliOptions d;
  assert(!parse({"scan", "x", "--bogus"}, d, err) && err.find("--bogus") != std::string::npos);
  CliOptions e;
  assert(!parse({"frobnicate"}, e, err));
  CliOptions f;
  assert(!parse({"check-policy"}, f, err));
  CliOptions g;
  assert(!parse({"scan", "x", "--policy"}, g, err) && err.find("needs a value") != std::string::npos);

  CliOptions h;
  assert(parse({"--version"}, h, err) && h.version);
  CliOptions none;
  assert(parse({"scan", "x", "--fail-on", "none"}, none, err) && *none.failOn == FailOn::Error);
}

void TestTimeoutReachesArchives() {
  CliOptions opt;
  std::string err;
  assert(parse({"scan", "x", "--timeout", "1234", "--fail-on", "warn"}, opt, err));

  EffectivePolicy loaded;
  loaded.limits.timeoutFileMs = 5000;
  loaded.limits.timeoutArchiveMs = 20000;
  PolicyPtr p = applyCliOverrides(loaded, opt);
  assert(p->limits.timeoutFileMs == 1234);
  assert(p->limits.timeoutArchiveMs == 1234 && "archives get the command-line deadline too");
  assert(p->defaults.failOn == FailOn::Warn);
  assert(loaded.limits.timeoutArchiveMs == 20000 && "the loaded policy is left untouched");

  CliOptions plain;
  assert(parse({"scan", "x"}, plain, err));
  PolicyPtr q = applyCliOverrides(loaded, plain);
  assert(q->limits.timeoutFileMs == 5000 && q->limits.timeoutArchiveMs == 20000);
}

} // namespace

int main() {
  TestScanFlags();
  TestDefaultsAndErrors();
  TestTimeoutReachesArchives();
  std::cout << "cli option tests ok\n";
  return 0;
}
