#include "cli_options.h"
#include <cstdlib>
#include <memory>
#include <thread>

namespace gup {

static std::string env(const char* key, const char* def = "") {
  const char* v = std::getenv(key);
  return (v && *v) ? std::string(v) : std::string(def);
}

static bool parseUnsigned(const std::string& s, uint64_t maxValue, uint64_t& out) {
  if (s.empty() || s.size() > 19 || s.find_first_not_of("0123456789") != std::string::npos) return false;
  out = std::stoull(s);
  return out <= maxValue;
}

CliOptions loadOptionsFromEnv() {
  CliOptions c;
  c.policyPath   = env("GUARDUPLOAD_POLICY");
  c.overridePath = env("GUARDUPLOAD_POLICY_OVERRIDE");

  uint64_t jobs = 0;
  std::string j = env("GUARDUPLOAD_JOBS");
  if (!j.empty()) {
    if (parseUnsigned(j, 1024, jobs)) c.jobs = (unsigned)jobs;
    else LOGW("ignoring GUARDUPLOAD_JOBS='" + j + "'");
  }

  std::string lvl = env("GUARDUPLOAD_LOG_LEVEL");
  if (!lvl.empty() && !parseLogLevel(lvl, c.logLevel))
    LOGW("ignoring GUARDUPLOAD_LOG_LEVEL='" + lvl + "'");
  return c;
}

bool parseArgs(int argc, char** argv, CliOptions& opt, std::string& err) {
  auto value = [&](int& i, const std::string& flag, std::string& out) {
    if (i + 1 >= argc) { err = flag + " needs a value"; return false; }
    out = argv[++i];
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    std::string v;
    if (a == "-h" || a == "--help") { opt.help = true; continue; }
    if (a == "--version") { opt.version = true; continue; }

    if (a == "--policy") { if (!value(i, a, opt.policyPath)) return false; continue; }
    if (a == "--policy-override") { if (!value(i, a, opt.overridePath)) return false; continue; }
    if (a == "--json") { if (!value(i, a, opt.jsonPath)) return false; continue; }
    if (a == "--summary") { if (!value(i, a, opt.summaryPath)) return false; continue; }
    if (a == "--fail-on") {
      if (!value(i, a, v)) return false;
      FailOn f;
      if (!parseFailOn(v, f)) { err = "--fail-on: expected warn|deny|error, got '" + v + "'"; return false; }
      opt.failOn = f;
      continue;
    }
    if (a == "--timeout") {
      if (!value(i, a, v)) return false;
      uint64_t ms = 0;
      if (!parseUnsigned(v, UINT32_MAX, ms) || ms == 0) { err = "--timeout: expected milliseconds > 0"; return false; }
      opt.timeoutMs = (uint32_t)ms;
      continue;
    }
    if (a == "--jobs") {
      if (!value(i, a, v)) return false;
      uint64_t n = 0;
      if (!parseUnsigned(v, 1024, n) || n == 0) { err = "--jobs: expected 1..1024"; return false; }
      opt.jobs = (unsigned)n;
      continue;
    }
    if (a == "--log-level") {
      if (!value(i, a, v)) return false;
      if (!parseLogLevel(v, opt.logLevel)) { err = "--log-level: expected trace|debug|info|warn|error"; return false; }
      continue;
    }
    if (a.rfind("--", 0) == 0) { err = "unknown option " + a; return false; }

    if (opt.command.empty()) opt.command = a;
    else opt.paths.push_back(a);
  }

  if (opt.help || opt.version) return true;
  if (opt.command.empty()) { err = "missing command"; return false; }
  if (opt.command == "scan") {
    if (opt.paths.empty()) { err = "scan: no paths given"; return false; }
  } else if (opt.command == "check-policy") {
    if (opt.paths.size() != 1) { err = "check-policy: expected exactly one policy file"; return false; }
  } else {
    err = "unknown command '" + opt.command + "'";
    return false;
  }
  if (opt.jobs == 0) {
    unsigned hc = std::thread::hardware_concurrency();
    opt.jobs = hc ? hc : 1;
  }
  return true;
}

PolicyPtr applyCliOverrides(const EffectivePolicy& loaded, const CliOptions& opt){
  auto p = std::make_shared<EffectivePolicy>(loaded);
  if (opt.timeoutMs) {
    p->limits.timeoutFileMs = *opt.timeoutMs;
    p->limits.timeoutArchiveMs = *opt.timeoutMs;
  }
  if (opt.failOn) p->defaults.failOn = *opt.failOn;
  return p;
}

const char* usageText() {
  return
    "usage:\n"
    "  guardupload scan <paths...> [--policy f] [--policy-override f] [--json f]\n"
    "                   [--summary f] [--fail-on warn|deny|error] [--timeout ms]\n"
    "                   [--jobs n] [--log-level trace|debug|info|warn|error]\n"
    "  guardupload check-policy <file> [--policy-override f]\n"
    "  guardupload --help | --version\n"
    "\n"
    "exit status: 0 ok, 1 deny, 2 operational error or bad usage, 3 warn (--fail-on warn),\n"
    "             4 invalid policy\n";
}

} // namespace gup
