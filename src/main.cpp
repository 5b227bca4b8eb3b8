#include "cli_options.h"
#include "core/config.hpp"
#include "core/pipeline.hpp"
#include "core/report.hpp"
#include "log.h"

#include <fstream>
#include <iostream>
#include <memory>

using namespace std;
using namespace gup;

static constexpr int kExitUsage = 2;
static constexpr int kExitPolicy = 4;

static int checkPolicy(const CliOptions& opt) {
  PolicyPtr policy;
  string err;
  if (!loadEffectivePolicy(opt.paths[0], opt.overridePath, policy, err)) {
    LOGE("policy: " + err);
    return kExitPolicy;
  }
  cout << dumpPolicyYaml(*policy) << "\n";
  LOGI("policy ok: " + to_string(policy->rules.size()) + " rule(s)");
  return 0;
}

static bool writeSummary(const SummaryReport& s, const string& path) {
  if (path.empty()) {
    cerr << toJson(s) << "\n";
    return true;
  }
  ofstream f(path, ios::binary | ios::trunc);
  f << toJson(s, true) << "\n";
  if (!f) { LOGE("summary: cannot write " + path); return false; }
  return true;
}

static int scan(const CliOptions& opt) {
  PolicyPtr loaded;
  string err;
  if (!loadEffectivePolicy(opt.policyPath, opt.overridePath, loaded, err)) {
    LOGE("policy: " + err);
    return kExitPolicy;
  }

  PolicyPtr effective = applyCliOverrides(*loaded, opt);
  const FailOn failOn = effective->defaults.failOn;
  LOGI("policy: " + (effective->sources.empty() ? string("built-in") : effective->sources.back()) +
       ", fail-on=" + toString(failOn) + ", rules=" + to_string(effective->rules.size()));

  ofstream jsonFile;
  ostream* out = &cout;
  if (!opt.jsonPath.empty()) {
    jsonFile.open(opt.jsonPath, ios::binary | ios::trunc);
    if (!jsonFile) { LOGE("cannot open " + opt.jsonPath); return kExitUsage; }
    out = &jsonFile;
  }
  NdjsonSink sink(*out);

  ScanRunner runner(effective, opt.jobs);
  SummaryReport summary;
  bool ok = runner.run(collectInputs(opt.paths), sink, failOn, summary, err);
  if (!writeSummary(summary, opt.summaryPath)) ok = false;
  if (!ok) return 2;
  return summary.exitStatus;
}

int main(int argc, char** argv) {
  CliOptions opt = loadOptionsFromEnv();
  string err;
  if (!parseArgs(argc, argv, opt, err)) {
    cerr << "guardupload: " << err << "\n\n" << usageText();
    return kExitUsage;
  }
  if (opt.help) { cout << usageText(); return 0; }
  if (opt.version) { cout << "guardupload " << toolVersion() << "\n"; return 0; }
  setLogLevel(opt.logLevel);

  if (opt.command == "check-policy") return checkPolicy(opt);
  return scan(opt);
}
